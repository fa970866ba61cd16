#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <type_traits>

#include "core/errors.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace sandgrade::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

bool ParseBool(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

long long ParseInteger(const std::string& name, const std::string& value) {
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stoll(value, &consumed);
        if (consumed != value.size()) {
            throw core::ConfigError(name + ": trailing characters in '" + value + "'");
        }
        return parsed;
    } catch (const std::invalid_argument&) {
        throw core::ConfigError(name + ": not an integer: '" + value + "'");
    } catch (const std::out_of_range&) {
        throw core::ConfigError(name + ": out of range: '" + value + "'");
    }
}

std::size_t ParseSize(const std::string& name, const std::string& value) {
    const auto parsed = ParseInteger(name, value);
    if (parsed < 0) {
        throw core::ConfigError(name + ": must not be negative: '" + value + "'");
    }
    return static_cast<std::size_t>(parsed);
}

int ParseInt(const std::string& name, const std::string& value) {
    const auto parsed = ParseInteger(name, value);
    if (parsed < std::numeric_limits<int>::min() || parsed > std::numeric_limits<int>::max()) {
        throw core::ConfigError(name + ": out of range: '" + value + "'");
    }
    return static_cast<int>(parsed);
}

double ParseDouble(const std::string& name, const std::string& value) {
    try {
        return std::stod(value);
    } catch (const std::invalid_argument&) {
        throw core::ConfigError(name + ": not a number: '" + value + "'");
    } catch (const std::out_of_range&) {
        throw core::ConfigError(name + ": out of range: '" + value + "'");
    }
}

std::vector<std::string> SplitCommand(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream stream(value);
    std::string item;
    while (stream >> item) {
        items.push_back(item);
    }
    return items;
}

// Rejects values the target type cannot hold. Negative input never reaches an
// unsigned field, where it would wrap into an effectively unlimited cap.
template <typename T>
void ReadInteger(const nlohmann::json& section, const char* key, T& target) {
    if (!section.contains(key)) {
        return;
    }
    const auto& value = section[key];
    if (!value.is_number_integer()) {
        throw core::ConfigError(std::string("config field '") + key + "' must be an integer");
    }
    if (value.is_number_unsigned()) {
        const auto parsed = value.get<std::uint64_t>();
        if (parsed > static_cast<std::uint64_t>(std::numeric_limits<T>::max())) {
            throw core::ConfigError(std::string("config field '") + key + "' is out of range");
        }
        target = static_cast<T>(parsed);
        return;
    }
    const auto parsed = value.get<std::int64_t>();
    if constexpr (std::is_unsigned_v<T>) {
        if (parsed < 0) {
            throw core::ConfigError(std::string("config field '") + key + "' must not be negative");
        }
        if (static_cast<std::uint64_t>(parsed) > static_cast<std::uint64_t>(std::numeric_limits<T>::max())) {
            throw core::ConfigError(std::string("config field '") + key + "' is out of range");
        }
    } else {
        if (parsed < static_cast<std::int64_t>(std::numeric_limits<T>::min()) ||
            parsed > static_cast<std::int64_t>(std::numeric_limits<T>::max())) {
            throw core::ConfigError(std::string("config field '") + key + "' is out of range");
        }
    }
    target = static_cast<T>(parsed);
}

void ReadString(const nlohmann::json& section, const char* key, std::string& target) {
    if (!section.contains(key)) {
        return;
    }
    if (!section[key].is_string()) {
        throw core::ConfigError(std::string("config field '") + key + "' must be a string");
    }
    target = section[key].get<std::string>();
}

void ReadBool(const nlohmann::json& section, const char* key, bool& target) {
    if (!section.contains(key)) {
        return;
    }
    if (!section[key].is_boolean()) {
        throw core::ConfigError(std::string("config field '") + key + "' must be a boolean");
    }
    target = section[key].get<bool>();
}

void ReadMillis(const nlohmann::json& section, const char* key, std::chrono::milliseconds& target) {
    long long value = target.count();
    ReadInteger(section, key, value);
    target = std::chrono::milliseconds(value);
}

void ApplyImageConfig(ImageConfig& target, const nlohmann::json& source) {
    if (!source.is_object()) {
        throw core::ConfigError("image entries must be objects");
    }
    ReadString(source, "image", target.image);
    if (source.contains("command")) {
        if (!source["command"].is_array()) {
            throw core::ConfigError("image command must be an array of strings");
        }
        target.command.clear();
        for (const auto& item : source["command"]) {
            if (!item.is_string()) {
                throw core::ConfigError("image command must be an array of strings");
            }
            target.command.push_back(item.get<std::string>());
        }
    }
}

}  // namespace

std::filesystem::path DefaultConfigPath() {
    const auto explicit_path = GetEnv("SANDGRADE_CONFIG");
    if (!explicit_path.empty()) {
        return explicit_path;
    }
    return GetHomePath() / ".sandgrade" / "config.json";
}

void ApplyConfigFromJson(EngineConfig& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        throw core::ConfigError("config root must be a JSON object");
    }

    if (data.contains("policy") && data["policy"].is_object()) {
        const auto& policy = data["policy"];
        ReadInteger(policy, "memoryBytes", config.policy.memory_bytes);
        if (policy.contains("cpus")) {
            if (!policy["cpus"].is_number()) {
                throw core::ConfigError("config field 'cpus' must be a number");
            }
            config.policy.cpus = policy["cpus"].get<double>();
        }
        ReadMillis(policy, "timeoutMs", config.policy.wall_clock_timeout);
        ReadInteger(policy, "pidsLimit", config.policy.pids_limit);
        ReadString(policy, "user", config.policy.user);
        ReadBool(policy, "networkDisabled", config.policy.network_disabled);
        ReadBool(policy, "readOnlyRoot", config.policy.read_only_root);
        ReadInteger(policy, "scratchBytes", config.policy.scratch_bytes);
        ReadInteger(policy, "maxLogBytes", config.policy.max_log_bytes);
        ReadInteger(policy, "maxReportBytes", config.policy.max_report_bytes);
        ReadMillis(policy, "killGraceMs", config.policy.kill_grace);
    }

    if (data.contains("capacity") && data["capacity"].is_object()) {
        const auto& capacity = data["capacity"];
        ReadInteger(capacity, "maxConcurrent", config.capacity.max_concurrent);
        ReadInteger(capacity, "admissionTimeoutMs", config.capacity.admission_timeout_ms);
    }

    if (data.contains("limits") && data["limits"].is_object()) {
        ReadInteger(data["limits"], "maxSourceBytes", config.limits.max_source_bytes);
    }

    if (data.contains("images") && data["images"].is_object()) {
        const auto& images = data["images"];
        if (images.contains("render-script")) {
            ApplyImageConfig(config.images.render_script, images["render-script"]);
        }
        if (images.contains("data-analysis")) {
            ApplyImageConfig(config.images.data_analysis, images["data-analysis"]);
        }
        if (images.contains("infra-cli")) {
            ApplyImageConfig(config.images.infra_cli, images["infra-cli"]);
        }
    }

    if (data.contains("runtime") && data["runtime"].is_object()) {
        const auto& runtime = data["runtime"];
        ReadString(runtime, "dockerBinary", config.runtime.docker_binary);
        ReadString(runtime, "stagingRoot", config.runtime.staging_root);
        ReadString(runtime, "datasetsDir", config.runtime.datasets_dir);
        ReadInteger(runtime, "createRetryBackoffMs", config.runtime.create_retry_backoff_ms);
        ReadInteger(runtime, "pollIntervalMs", config.runtime.poll_interval_ms);
    }

    if (data.contains("gateway") && data["gateway"].is_object()) {
        const auto& gateway = data["gateway"];
        ReadString(gateway, "host", config.gateway.host);
        ReadInteger(gateway, "port", config.gateway.port);
    }

    if (data.contains("logging") && data["logging"].is_object()) {
        ReadString(data["logging"], "level", config.logging.level);
    }
}

void ApplyConfigFromEnv(EngineConfig& config) {
    const auto memory = GetEnvFallback("SANDGRADE_POLICY__MEMORY_BYTES", "SANDGRADE_MEMORY_BYTES");
    if (!memory.empty()) {
        config.policy.memory_bytes = ParseInteger("SANDGRADE_MEMORY_BYTES", memory);
    }

    const auto cpus = GetEnvFallback("SANDGRADE_POLICY__CPUS", "SANDGRADE_CPUS");
    if (!cpus.empty()) {
        config.policy.cpus = ParseDouble("SANDGRADE_CPUS", cpus);
    }

    const auto timeout = GetEnvFallback("SANDGRADE_POLICY__TIMEOUT_MS", "SANDGRADE_TIMEOUT_MS");
    if (!timeout.empty()) {
        config.policy.wall_clock_timeout =
            std::chrono::milliseconds(ParseInteger("SANDGRADE_TIMEOUT_MS", timeout));
    }

    const auto user = GetEnvFallback("SANDGRADE_POLICY__USER", "SANDGRADE_SANDBOX_USER");
    if (!user.empty()) {
        config.policy.user = user;
    }

    const auto max_concurrent = GetEnvFallback(
        "SANDGRADE_CAPACITY__MAX_CONCURRENT",
        "SANDGRADE_MAX_CONCURRENT");
    if (!max_concurrent.empty()) {
        config.capacity.max_concurrent =
            ParseInt("SANDGRADE_MAX_CONCURRENT", max_concurrent);
    }

    const auto admission = GetEnvFallback(
        "SANDGRADE_CAPACITY__ADMISSION_TIMEOUT_MS",
        "SANDGRADE_ADMISSION_TIMEOUT_MS");
    if (!admission.empty()) {
        config.capacity.admission_timeout_ms =
            ParseInt("SANDGRADE_ADMISSION_TIMEOUT_MS", admission);
    }

    const auto max_source = GetEnvFallback(
        "SANDGRADE_LIMITS__MAX_SOURCE_BYTES",
        "SANDGRADE_MAX_SOURCE_BYTES");
    if (!max_source.empty()) {
        config.limits.max_source_bytes =
            ParseSize("SANDGRADE_MAX_SOURCE_BYTES", max_source);
    }

    const auto render_image = GetEnvFallback(
        "SANDGRADE_IMAGES__RENDER_SCRIPT__IMAGE",
        "SANDGRADE_RENDER_SCRIPT_IMAGE");
    if (!render_image.empty()) {
        config.images.render_script.image = render_image;
    }

    const auto data_image = GetEnvFallback(
        "SANDGRADE_IMAGES__DATA_ANALYSIS__IMAGE",
        "SANDGRADE_DATA_ANALYSIS_IMAGE");
    if (!data_image.empty()) {
        config.images.data_analysis.image = data_image;
    }

    const auto infra_image = GetEnvFallback(
        "SANDGRADE_IMAGES__INFRA_CLI__IMAGE",
        "SANDGRADE_INFRA_CLI_IMAGE");
    if (!infra_image.empty()) {
        config.images.infra_cli.image = infra_image;
    }

    const auto render_command = GetEnv("SANDGRADE_IMAGES__RENDER_SCRIPT__COMMAND");
    if (!render_command.empty()) {
        config.images.render_script.command = SplitCommand(render_command);
    }

    const auto data_command = GetEnv("SANDGRADE_IMAGES__DATA_ANALYSIS__COMMAND");
    if (!data_command.empty()) {
        config.images.data_analysis.command = SplitCommand(data_command);
    }

    const auto infra_command = GetEnv("SANDGRADE_IMAGES__INFRA_CLI__COMMAND");
    if (!infra_command.empty()) {
        config.images.infra_cli.command = SplitCommand(infra_command);
    }

    const auto docker_binary = GetEnvFallback(
        "SANDGRADE_RUNTIME__DOCKER_BINARY",
        "SANDGRADE_DOCKER_BINARY");
    if (!docker_binary.empty()) {
        config.runtime.docker_binary = docker_binary;
    }

    const auto staging_root = GetEnvFallback(
        "SANDGRADE_RUNTIME__STAGING_ROOT",
        "SANDGRADE_STAGING_ROOT");
    if (!staging_root.empty()) {
        config.runtime.staging_root = staging_root;
    }

    const auto datasets_dir = GetEnvFallback(
        "SANDGRADE_RUNTIME__DATASETS_DIR",
        "SANDGRADE_DATASETS_DIR");
    if (!datasets_dir.empty()) {
        config.runtime.datasets_dir = datasets_dir;
    }

    const auto host = GetEnvFallback("SANDGRADE_GATEWAY__HOST", "SANDGRADE_HOST");
    if (!host.empty()) {
        config.gateway.host = host;
    }

    const auto port = GetEnvFallback("SANDGRADE_GATEWAY__PORT", "SANDGRADE_PORT");
    if (!port.empty()) {
        config.gateway.port = ParseInt("SANDGRADE_PORT", port);
    }

    const auto log_level = GetEnvFallback("SANDGRADE_LOGGING__LEVEL", "SANDGRADE_LOG_LEVEL");
    if (!log_level.empty()) {
        config.logging.level = log_level;
    }

    const auto verbose = GetEnv("SANDGRADE_VERBOSE");
    if (!verbose.empty() && ParseBool(verbose)) {
        config.logging.level = "debug";
    }
}

void ValidateConfig(const EngineConfig& config) {
    auto problems = config.policy.Validate();
    if (config.capacity.max_concurrent <= 0) {
        problems.push_back("capacity.maxConcurrent must be positive");
    }
    if (config.capacity.admission_timeout_ms < 0) {
        problems.push_back("capacity.admissionTimeoutMs must not be negative");
    }
    if (config.limits.max_source_bytes == 0) {
        problems.push_back("limits.maxSourceBytes must be positive");
    }
    if (config.runtime.create_retry_backoff_ms < 0 || config.runtime.poll_interval_ms <= 0) {
        problems.push_back("runtime backoff and poll interval must be positive");
    }
    if (config.gateway.port <= 0 || config.gateway.port > 65535) {
        problems.push_back("gateway.port out of range");
    }
    utils::LogLevel level{};
    if (!utils::ParseLogLevel(config.logging.level, level)) {
        problems.push_back("logging.level '" + config.logging.level + "' is unknown");
    }
    if (!problems.empty()) {
        throw core::ConfigError("invalid configuration: " + utils::Join(problems, "; "));
    }
}

EngineConfig LoadConfig() {
    return LoadConfig(DefaultConfigPath());
}

EngineConfig LoadConfig(const std::filesystem::path& path) {
    EngineConfig config{};

    if (!path.empty() && std::filesystem::exists(path)) {
        std::ifstream input(path);
        if (!input.is_open()) {
            throw core::ConfigError("cannot open config file " + path.string());
        }
        nlohmann::json data;
        try {
            input >> data;
        } catch (const nlohmann::json::parse_error& ex) {
            throw core::ConfigError("cannot parse " + path.string() + ": " + ex.what());
        }
        ApplyConfigFromJson(config, data);
        utils::LogDebug("config", "loaded config file", {{"path", path.string()}});
    }

    ApplyConfigFromEnv(config);
    ValidateConfig(config);
    return config;
}

}  // namespace sandgrade::config
