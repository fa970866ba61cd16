#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

#include "core/types.hpp"
#include "images/execution_image.hpp"
#include "policy/resource_policy.hpp"
#include "sandbox/cancellation.hpp"
#include "sandbox/container_runtime.hpp"

namespace sandgrade::sandbox {

struct RunnerOptions {
    std::filesystem::path staging_root;
    std::chrono::milliseconds create_retry_backoff{250};
    std::chrono::milliseconds poll_interval{50};
    std::size_t log_channel_capacity = 64;
};

// One live container. Scoped to the Run call that created it: the
// destructor kills and removes the container on every exit path.
class SandboxHandle {
public:
    SandboxHandle(ContainerRuntime& runtime,
                  std::string id,
                  const policy::ResourcePolicy& policy,
                  std::chrono::steady_clock::time_point deadline,
                  std::atomic<std::size_t>& live);
    ~SandboxHandle();

    SandboxHandle(const SandboxHandle&) = delete;
    SandboxHandle& operator=(const SandboxHandle&) = delete;

    const std::string& Id() const { return id_; }
    const policy::ResourcePolicy& Policy() const { return policy_; }
    std::chrono::steady_clock::time_point StartedAt() const { return started_at_; }
    std::chrono::steady_clock::time_point Deadline() const { return deadline_; }

    // Hard kill. Returns false when the daemon refused; removal still follows.
    bool Kill();

private:
    ContainerRuntime& runtime_;
    std::string id_;
    policy::ResourcePolicy policy_;
    std::chrono::steady_clock::time_point started_at_;
    std::chrono::steady_clock::time_point deadline_;
    std::atomic<std::size_t>& live_;
};

class SandboxRunner {
public:
    SandboxRunner(ContainerRuntime& runtime, RunnerOptions options);

    // Runs one submission to completion, deadline or cancellation. Failures
    // of the submitted code are reported in the returned output; daemon
    // failures throw core::RunnerInternalFault.
    core::RawExecutionOutput Run(const images::ExecutionImage& image,
                                 const std::string& source,
                                 const core::TestSpec& spec,
                                 const policy::ResourcePolicy& policy,
                                 std::chrono::steady_clock::time_point deadline,
                                 const CancellationToken& cancel,
                                 const std::string& challenge_id = {});

    std::size_t LiveSandboxes() const { return live_.load(); }

    // Removes every engine-labelled container left behind by an earlier
    // process. Only meaningful while no execution is in flight.
    std::size_t ReapOrphans();

private:
    std::string CreateWithRetry(const ContainerSpec& spec);

    ContainerRuntime& runtime_;
    RunnerOptions options_;
    std::atomic<std::size_t> live_{0};
};

}  // namespace sandgrade::sandbox
