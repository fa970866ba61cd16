#pragma once

#include <string>
#include <vector>

#include "policy/resource_policy.hpp"

namespace sandgrade::config {

struct ImageConfig {
    std::string image;
    std::vector<std::string> command;
};

struct ImagesConfig {
    ImageConfig render_script;
    ImageConfig data_analysis;
    ImageConfig infra_cli;
};

struct CapacityConfig {
    int max_concurrent = 4;
    int admission_timeout_ms = 2000;
};

struct LimitsConfig {
    std::size_t max_source_bytes = 100 * 1024;
};

struct RuntimeConfig {
    std::string docker_binary = "docker";
    std::string staging_root;
    std::string datasets_dir;
    int create_retry_backoff_ms = 250;
    int poll_interval_ms = 50;
};

struct GatewayConfig {
    std::string host = "127.0.0.1";
    int port = 8090;
};

struct LoggingConfig {
    std::string level = "info";
};

// Built once at startup and passed by reference into the engine.
struct EngineConfig {
    policy::ResourcePolicy policy;
    CapacityConfig capacity;
    LimitsConfig limits;
    ImagesConfig images;
    RuntimeConfig runtime;
    GatewayConfig gateway;
    LoggingConfig logging;
};

}  // namespace sandgrade::config
