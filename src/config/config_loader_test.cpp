#include "config/config_loader.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "core/errors.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "utils/common.hpp"

namespace {

using namespace sandgrade::config;  // NOLINT
using sandgrade::core::ConfigError;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        ::setenv(name, value, 1);
    }
    ~ScopedEnv() {
        ::unsetenv(name_);
    }

private:
    const char* name_;
};

TEST(ConfigLoaderTest, JsonSectionsOverrideDefaults) {
    EngineConfig config{};
    ApplyConfigFromJson(config, nlohmann::json::parse(R"({
        "policy": {"memoryBytes": 268435456, "cpus": 1.5, "timeoutMs": 5000, "user": "1000:1000"},
        "capacity": {"maxConcurrent": 2, "admissionTimeoutMs": 100},
        "limits": {"maxSourceBytes": 2048},
        "images": {"infra-cli": {"image": "registry.local/infra:2", "command": ["sh", "/run.sh", "{source}"]}},
        "runtime": {"dockerBinary": "/usr/local/bin/docker", "datasetsDir": "/srv/datasets"},
        "gateway": {"port": 9000},
        "logging": {"level": "debug"}
    })"));
    EXPECT_EQ(config.policy.memory_bytes, 268435456);
    EXPECT_DOUBLE_EQ(config.policy.cpus, 1.5);
    EXPECT_EQ(config.policy.wall_clock_timeout.count(), 5000);
    EXPECT_EQ(config.policy.user, "1000:1000");
    EXPECT_EQ(config.capacity.max_concurrent, 2);
    EXPECT_EQ(config.limits.max_source_bytes, 2048u);
    EXPECT_EQ(config.images.infra_cli.image, "registry.local/infra:2");
    EXPECT_THAT(config.images.infra_cli.command, ElementsAre("sh", "/run.sh", "{source}"));
    EXPECT_TRUE(config.images.render_script.image.empty());
    EXPECT_EQ(config.runtime.docker_binary, "/usr/local/bin/docker");
    EXPECT_EQ(config.gateway.port, 9000);
    EXPECT_EQ(config.gateway.host, "127.0.0.1");
    EXPECT_EQ(config.logging.level, "debug");
    EXPECT_NO_THROW(ValidateConfig(config));
}

TEST(ConfigLoaderTest, WrongTypesAreConfigErrors) {
    EngineConfig config{};
    EXPECT_THROW(ApplyConfigFromJson(config, nlohmann::json::parse(R"({"policy": {"timeoutMs": "30s"}})")),
                 ConfigError);
    EXPECT_THROW(ApplyConfigFromJson(config, nlohmann::json::parse(R"({"images": {"render-script": "img"}})")),
                 ConfigError);
    EXPECT_THROW(ApplyConfigFromJson(config, nlohmann::json::array()), ConfigError);
}

TEST(ConfigLoaderTest, EnvironmentOverridesBothSpellings) {
    EngineConfig config{};
    {
        ScopedEnv primary("SANDGRADE_CAPACITY__MAX_CONCURRENT", "7");
        ScopedEnv secondary("SANDGRADE_TIMEOUT_MS", "1500");
        ScopedEnv level("SANDGRADE_LOG_LEVEL", "warn");
        ApplyConfigFromEnv(config);
    }
    EXPECT_EQ(config.capacity.max_concurrent, 7);
    EXPECT_EQ(config.policy.wall_clock_timeout.count(), 1500);
    EXPECT_EQ(config.logging.level, "warn");
}

TEST(ConfigLoaderTest, MalformedEnvironmentValueIsConfigError) {
    EngineConfig config{};
    ScopedEnv bad("SANDGRADE_MAX_CONCURRENT", "four");
    EXPECT_THROW(ApplyConfigFromEnv(config), ConfigError);
}

TEST(ConfigLoaderTest, ValidationRejectsUnsafePolicy) {
    EngineConfig config{};
    config.policy.user = "root";
    config.capacity.max_concurrent = 0;
    try {
        ValidateConfig(config);
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& ex) {
        EXPECT_THAT(ex.what(), HasSubstr("non-root"));
        EXPECT_THAT(ex.what(), HasSubstr("maxConcurrent"));
    }
}

TEST(ConfigLoaderTest, NegativeSizeCapsAreRejected) {
    EngineConfig config{};
    EXPECT_THROW(ApplyConfigFromJson(config, nlohmann::json::parse(R"({"policy": {"maxLogBytes": -1}})")),
                 ConfigError);
    EXPECT_THROW(ApplyConfigFromJson(config, nlohmann::json::parse(R"({"policy": {"maxReportBytes": -1}})")),
                 ConfigError);
    EXPECT_THROW(ApplyConfigFromJson(config, nlohmann::json::parse(R"({"limits": {"maxSourceBytes": -1}})")),
                 ConfigError);
    EXPECT_EQ(config.policy.max_log_bytes, 1024u * 1024);
    EXPECT_EQ(config.limits.max_source_bytes, 100u * 1024);

    ScopedEnv env("SANDGRADE_MAX_SOURCE_BYTES", "-1");
    EXPECT_THROW(ApplyConfigFromEnv(config), ConfigError);
    EXPECT_EQ(config.limits.max_source_bytes, 100u * 1024);
}

TEST(ConfigLoaderTest, OutOfRangeIntegersAreRejected) {
    EngineConfig config{};
    EXPECT_THROW(ApplyConfigFromJson(config, nlohmann::json::parse(R"({"capacity": {"maxConcurrent": 4294967297}})")),
                 ConfigError);
    ScopedEnv env("SANDGRADE_PORT", "4294967377");
    EXPECT_THROW(ApplyConfigFromEnv(config), ConfigError);
    EXPECT_EQ(config.capacity.max_concurrent, 4);
}

TEST(ConfigLoaderTest, CommandOverridesForEveryTrack) {
    EngineConfig config{};
    ScopedEnv render("SANDGRADE_IMAGES__RENDER_SCRIPT__COMMAND", "node /r.js {source}");
    ScopedEnv data("SANDGRADE_IMAGES__DATA_ANALYSIS__COMMAND", "python3 /d.py {source}");
    ScopedEnv infra("SANDGRADE_IMAGES__INFRA_CLI__COMMAND", "python3 /i.py {source}");
    ApplyConfigFromEnv(config);
    EXPECT_THAT(config.images.render_script.command, ElementsAre("node", "/r.js", "{source}"));
    EXPECT_THAT(config.images.data_analysis.command, ElementsAre("python3", "/d.py", "{source}"));
    EXPECT_THAT(config.images.infra_cli.command, ElementsAre("python3", "/i.py", "{source}"));
}

TEST(ConfigLoaderTest, LoadConfigReadsFile) {
    const auto path = std::filesystem::temp_directory_path() /
                      ("sandgrade-config-" + sandgrade::utils::RandomHex() + ".json");
    {
        std::ofstream out(path);
        out << R"({"gateway": {"host": "0.0.0.0", "port": 8181}})";
    }
    const auto config = LoadConfig(path);
    std::filesystem::remove(path);
    EXPECT_EQ(config.gateway.host, "0.0.0.0");
    EXPECT_EQ(config.gateway.port, 8181);
}

TEST(ConfigLoaderTest, LoadConfigRejectsBrokenFile) {
    const auto path = std::filesystem::temp_directory_path() /
                      ("sandgrade-config-" + sandgrade::utils::RandomHex() + ".json");
    {
        std::ofstream out(path);
        out << "{ not json";
    }
    EXPECT_THROW(LoadConfig(path), ConfigError);
    std::filesystem::remove(path);
}

TEST(ConfigLoaderTest, MissingFileYieldsDefaults) {
    const auto config = LoadConfig("/nonexistent/sandgrade/config.json");
    EXPECT_EQ(config.capacity.max_concurrent, 4);
    EXPECT_EQ(config.limits.max_source_bytes, 100u * 1024);
}

}  // namespace
