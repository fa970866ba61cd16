#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "core/types.hpp"
#include "dispatcher/capacity_controller.hpp"
#include "images/image_registry.hpp"
#include "normalizer/result_normalizer.hpp"
#include "sandbox/cancellation.hpp"
#include "sandbox/container_runtime.hpp"
#include "sandbox/sandbox_runner.hpp"

namespace sandgrade::dispatcher {

struct ImageStatus {
    std::string track;
    std::string image;
    bool available = false;
};

struct EngineStatus {
    std::string runtime;
    bool runtime_reachable = false;
    std::size_t capacity = 0;
    std::size_t in_use = 0;
    std::size_t available = 0;
    std::size_t live_sandboxes = 0;
    std::vector<ImageStatus> images;
    std::uint64_t executions = 0;
    std::uint64_t succeeded = 0;
    std::uint64_t failed = 0;
    std::uint64_t timeouts = 0;
    std::uint64_t validation_errors = 0;
    std::uint64_t capacity_rejections = 0;
    std::uint64_t missing_images = 0;
    std::uint64_t runner_faults = 0;
};

void to_json(nlohmann::json& json, const EngineStatus& status);

// Single entry point for callers. Validates, admits, runs and normalizes one
// submission per call; safe to call from many threads at once.
class ExecutionDispatcher {
public:
    ExecutionDispatcher(const config::EngineConfig& config,
                        const images::ImageRegistry& registry,
                        sandbox::ContainerRuntime& runtime);

    // Returns the normalized result for anything the submitted code did.
    // Throws ValidationError, ImageNotFoundError, CapacityExceededError or
    // RunnerInternalFault; nothing else escapes.
    core::ExecutionResult Execute(const core::ExecutionRequest& request,
                                  const sandbox::CancellationToken& cancel = sandbox::CancellationToken());

    EngineStatus Status();
    std::size_t ReapOrphans();

    const CapacityController& Capacity() const { return capacity_; }

private:
    const images::ExecutionImage& Admit(const core::ExecutionRequest& request, core::Track& track);
    void Validate(const core::ExecutionRequest& request, const images::ExecutionImage& image) const;
    core::ExecutionResult FaultResult(const core::ExecutionRequest& request,
                                      core::Track track,
                                      const std::string& message,
                                      std::chrono::steady_clock::time_point started) const;

    const config::EngineConfig& config_;
    const images::ImageRegistry& registry_;
    sandbox::ContainerRuntime& runtime_;
    CapacityController capacity_;
    sandbox::SandboxRunner runner_;
    normalizer::ResultNormalizer normalizer_;

    std::atomic<std::uint64_t> executions_{0};
    std::atomic<std::uint64_t> succeeded_{0};
    std::atomic<std::uint64_t> failed_{0};
    std::atomic<std::uint64_t> timeouts_{0};
    std::atomic<std::uint64_t> validation_errors_{0};
    std::atomic<std::uint64_t> capacity_rejections_{0};
    std::atomic<std::uint64_t> missing_images_{0};
    std::atomic<std::uint64_t> runner_faults_{0};
};

}  // namespace sandgrade::dispatcher
