#include <atomic>
#include <chrono>
#include <csignal>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <unistd.h>

#include "config/config_loader.hpp"
#include "core/errors.hpp"
#include "dispatcher/execution_dispatcher.hpp"
#include "images/image_registry.hpp"
#include "sandbox/cancellation_watch.hpp"
#include "sandbox/docker_cli_runtime.hpp"
#include "utils/logging.hpp"
#include "httplib.h"
#include "nlohmann/json.hpp"

namespace {

volatile std::sig_atomic_t g_signal = 0;

// Everything one command needs, wired from a loaded config.
struct Engine {
    explicit Engine(sandgrade::config::EngineConfig loaded)
        : config(std::move(loaded))
        , registry(sandgrade::images::ImageRegistry::FromConfig(config))
        , runtime(config.runtime.docker_binary)
        , dispatcher(config, registry, runtime) {}

    sandgrade::config::EngineConfig config;
    sandgrade::images::ImageRegistry registry;
    sandgrade::sandbox::DockerCliRuntime runtime;
    sandgrade::dispatcher::ExecutionDispatcher dispatcher;
};

std::filesystem::path GetPidFilePath() {
    return sandgrade::config::DefaultConfigPath().parent_path() / "gateway.pid";
}

bool IsProcessRunning(pid_t pid) {
    if (pid <= 0) {
        return false;
    }
    if (::kill(pid, 0) == 0) {
        return true;
    }
    return errno == EPERM;
}

std::optional<pid_t> ReadPidFile() {
    std::ifstream input(GetPidFilePath());
    if (!input.is_open()) {
        return std::nullopt;
    }
    pid_t pid = 0;
    input >> pid;
    if (pid <= 0) {
        return std::nullopt;
    }
    return pid;
}

bool WritePidFile(pid_t pid) {
    const auto path = GetPidFilePath();
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    std::ofstream output(path, std::ios::trunc);
    if (!output.is_open()) {
        return false;
    }
    output << pid;
    return true;
}

void RemovePidFile() {
    std::error_code ec;
    std::filesystem::remove(GetPidFilePath(), ec);
}

void HandleSignal(int signal) {
    g_signal = signal;
}

void ApplyLogging(const sandgrade::config::EngineConfig& config) {
    sandgrade::utils::LogConfig log_config{};
    if (!sandgrade::utils::ParseLogLevel(config.logging.level, log_config.min_level)) {
        log_config.min_level = sandgrade::utils::LogLevel::kInfo;
    }
    sandgrade::utils::SetLogConfig(log_config);
}

std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        throw sandgrade::core::ValidationError("cannot read " + path.string());
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

// Captured logs may hold arbitrary bytes; invalid UTF-8 is replaced.
std::string Render(const nlohmann::json& json) {
    return json.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

nlohmann::json ErrorBody(const sandgrade::core::EngineError& error) {
    return {{"error", sandgrade::core::ToString(error.Kind())}, {"message", error.what()}};
}

void Reply(httplib::Response& res, int status, const nlohmann::json& body) {
    res.status = status;
    res.set_content(Render(body), "application/json");
}

void HandleExecute(sandgrade::dispatcher::ExecutionDispatcher& dispatcher,
                   const sandgrade::sandbox::CancellationToken& shutdown,
                   const httplib::Request& req,
                   httplib::Response& res) {
    const auto body = nlohmann::json::parse(req.body, nullptr, false);
    if (body.is_discarded()) {
        Reply(res, 400, {{"error", "validation_error"}, {"message", "request body is not valid JSON"}});
        return;
    }
    try {
        const auto request = sandgrade::core::ParseExecutionRequest(body);
        // A caller that hangs up gets its container killed like a shutdown would.
        sandgrade::sandbox::CancellationWatch watch(shutdown, [&req]() {
            return req.is_connection_closed && req.is_connection_closed();
        });
        const auto result = dispatcher.Execute(request, watch.Token());
        if (watch.Disconnected()) {
            sandgrade::utils::LogWarn("gateway", "caller disconnected, execution cancelled",
                                      {{"challenge", request.challenge_id}});
        }
        Reply(res, 200, result);
    } catch (const sandgrade::core::ValidationError& ex) {
        Reply(res, 400, ErrorBody(ex));
    } catch (const sandgrade::core::CapacityExceededError& ex) {
        Reply(res, 429, ErrorBody(ex));
    } catch (const sandgrade::core::ImageNotFoundError& ex) {
        Reply(res, 500, ErrorBody(ex));
    } catch (const sandgrade::core::RunnerInternalFault& ex) {
        auto json = ErrorBody(ex);
        json["infrastructure"] = true;
        json["result"] = ex.Result();
        Reply(res, 502, json);
    }
}

int RunGateway() {
    Engine engine(sandgrade::config::LoadConfig());
    ApplyLogging(engine.config);

    const auto existing_pid = ReadPidFile();
    if (existing_pid && IsProcessRunning(*existing_pid)) {
        std::cout << "sandgrade gateway already running (pid=" << *existing_pid << ")" << std::endl;
        return 1;
    }
    RemovePidFile();
    if (!WritePidFile(::getpid())) {
        std::cout << "Failed to write gateway pid file." << std::endl;
        return 1;
    }

    if (!engine.runtime.Ping()) {
        sandgrade::utils::LogWarn("gateway", "container runtime unreachable at startup",
                                  {{"binary", engine.runtime.Binary()}});
    } else {
        engine.dispatcher.ReapOrphans();
    }

    sandgrade::sandbox::CancellationToken shutdown;
    auto& dispatcher = engine.dispatcher;

    httplib::Server http_server;
    http_server.Post("/execute", [&dispatcher, &shutdown](const httplib::Request& req, httplib::Response& res) {
        HandleExecute(dispatcher, shutdown, req, res);
    });
    http_server.Get("/status", [&dispatcher](const httplib::Request&, httplib::Response& res) {
        Reply(res, 200, dispatcher.Status());
    });
    http_server.Get("/health", [&dispatcher](const httplib::Request&, httplib::Response& res) {
        const auto status = dispatcher.Status();
        const bool healthy = status.runtime_reachable;
        Reply(res, healthy ? 200 : 503,
              {{"status", healthy ? "ok" : "degraded"},
               {"runtime", status.runtime_reachable},
               {"available", status.available}});
    });

    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    const std::string host = engine.config.gateway.host;
    const int port = engine.config.gateway.port;
    std::atomic<bool> listen_failed{false};
    std::thread http_thread([&http_server, &listen_failed, host, port]() {
        if (!http_server.listen(host, port)) {
            sandgrade::utils::LogError("gateway", "http server failed to listen",
                                       {{"host", host}, {"port", std::to_string(port)}});
            listen_failed.store(true);
        }
    });

    sandgrade::utils::LogInfo("gateway", "listening", {{"host", host}, {"port", std::to_string(port)}});
    std::cout << "sandgrade gateway started. Press Ctrl+C to stop." << std::endl;
    while (g_signal == 0 && !listen_failed.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    sandgrade::utils::LogInfo("gateway", "shutting down",
                              {{"in_flight", std::to_string(dispatcher.Capacity().InUse())}});
    // In-flight executions kill their containers and answer before stop() returns.
    shutdown.Cancel();
    http_server.stop();
    if (http_thread.joinable()) {
        http_thread.join();
    }
    RemovePidFile();
    return listen_failed.load() ? 1 : 0;
}

int RunOnce(const std::string& track,
            const std::filesystem::path& source_path,
            const std::filesystem::path& spec_path,
            const std::string& challenge_id) {
    Engine engine(sandgrade::config::LoadConfig());
    ApplyLogging(engine.config);

    sandgrade::core::ExecutionRequest request{};
    request.track = track;
    request.submitted_source = ReadFile(source_path);
    request.challenge_id = challenge_id.empty() ? source_path.stem().string() : challenge_id;
    const auto spec_json = nlohmann::json::parse(ReadFile(spec_path), nullptr, false);
    if (spec_json.is_discarded()) {
        throw sandgrade::core::ValidationError(spec_path.string() + " is not valid JSON");
    }
    request.test_spec = spec_json.get<sandgrade::core::TestSpec>();

    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
    sandgrade::sandbox::CancellationWatch watch(
        sandgrade::sandbox::CancellationToken{}, []() { return g_signal != 0; },
        std::chrono::milliseconds(100));

    int code = 0;
    try {
        const auto result = engine.dispatcher.Execute(request, watch.Token());
        std::cout << Render(result) << std::endl;
        code = result.success ? 0 : 2;
    } catch (const sandgrade::core::RunnerInternalFault& ex) {
        std::cout << Render(ex.Result()) << std::endl;
        std::cerr << "runner fault: " << ex.what() << std::endl;
        code = 1;
    } catch (const sandgrade::core::EngineError& ex) {
        std::cerr << sandgrade::core::ToString(ex.Kind()) << ": " << ex.what() << std::endl;
        code = 1;
    }
    return code;
}

int PrintStatus() {
    Engine engine(sandgrade::config::LoadConfig());
    ApplyLogging(engine.config);
    std::cout << Render(engine.dispatcher.Status()) << std::endl;
    return 0;
}

int Reap() {
    Engine engine(sandgrade::config::LoadConfig());
    ApplyLogging(engine.config);
    const auto pid = ReadPidFile();
    if (pid && IsProcessRunning(*pid)) {
        std::cout << "sandgrade gateway is running (pid=" << *pid << "); not reaping." << std::endl;
        return 1;
    }
    std::cout << "removed " << engine.dispatcher.ReapOrphans() << " container(s)" << std::endl;
    return 0;
}

void PrintUsage() {
    std::cout << "Usage: sandgrade_cli serve\n"
              << "       sandgrade_cli run <track> <source-file> <spec-file> [challenge-id]\n"
              << "       sandgrade_cli status\n"
              << "       sandgrade_cli reap" << std::endl;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return 1;
    }
    const std::string command = argv[1];
    try {
        if (command == "serve") {
            return RunGateway();
        }
        if (command == "run" && (argc == 5 || argc == 6)) {
            return RunOnce(argv[2], argv[3], argv[4], argc == 6 ? argv[5] : "");
        }
        if (command == "status") {
            return PrintStatus();
        }
        if (command == "reap") {
            return Reap();
        }
    } catch (const sandgrade::core::EngineError& ex) {
        std::cerr << sandgrade::core::ToString(ex.Kind()) << ": " << ex.what() << std::endl;
        return 1;
    } catch (const nlohmann::json::exception& ex) {
        std::cerr << "invalid JSON input: " << ex.what() << std::endl;
        return 1;
    }
    PrintUsage();
    return 1;
}
