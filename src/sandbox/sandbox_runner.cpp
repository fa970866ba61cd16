#include "sandbox/sandbox_runner.hpp"

#include <thread>

#include "core/errors.hpp"
#include "sandbox/log_channel.hpp"
#include "sandbox/staging_area.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace sandgrade::sandbox {
namespace {

constexpr int kCreateAttempts = 2;
// Exit status reported when a killed container never confirmed its exit.
constexpr int kKilledExitCode = 137;

class LogCapture {
public:
    explicit LogCapture(std::size_t cap) : cap_(cap) {}

    void Append(const LogChunk& chunk) {
        const bool is_stdout = chunk.stream == LogStream::kStdout;
        auto& target = is_stdout ? stdout_ : stderr_;
        auto& truncated = is_stdout ? stdout_truncated_ : stderr_truncated_;
        const auto remaining = cap_ > target.size() ? cap_ - target.size() : 0;
        if (chunk.data.size() > remaining) {
            target.append(chunk.data, 0, remaining);
            truncated = true;
        } else {
            target.append(chunk.data);
        }
    }

    void MoveInto(core::RawExecutionOutput& raw) {
        raw.stdout_text = std::move(stdout_);
        raw.stderr_text = std::move(stderr_);
        raw.stdout_truncated = stdout_truncated_;
        raw.stderr_truncated = stderr_truncated_;
    }

private:
    std::size_t cap_;
    std::string stdout_;
    std::string stderr_;
    bool stdout_truncated_ = false;
    bool stderr_truncated_ = false;
};

void DrainAvailable(LogChannel& logs, LogCapture& capture) {
    LogChunk chunk{};
    while (logs.TryPop(chunk)) {
        capture.Append(chunk);
    }
}

void DrainUntilClosed(LogChannel& logs, LogCapture& capture, std::chrono::milliseconds grace) {
    const auto deadline = std::chrono::steady_clock::now() + grace;
    LogChunk chunk{};
    while (!logs.IsDrained() && std::chrono::steady_clock::now() < deadline) {
        if (logs.Pop(chunk, std::chrono::milliseconds(20))) {
            capture.Append(chunk);
        }
    }
    DrainAvailable(logs, capture);
}

}  // namespace

SandboxHandle::SandboxHandle(ContainerRuntime& runtime,
                             std::string id,
                             const policy::ResourcePolicy& policy,
                             std::chrono::steady_clock::time_point deadline,
                             std::atomic<std::size_t>& live)
    : runtime_(runtime)
    , id_(std::move(id))
    , policy_(policy)
    , started_at_(std::chrono::steady_clock::now())
    , deadline_(deadline)
    , live_(live) {
    ++live_;
}

SandboxHandle::~SandboxHandle() {
    bool removed = false;
    try {
        removed = runtime_.Remove(id_);
    } catch (const std::exception& ex) {
        utils::LogError("runner", "container removal threw", {{"id", id_}, {"error", ex.what()}});
    }
    if (!removed) {
        // Left for ReapOrphans; the label identifies it.
        utils::LogError("runner", "container leaked", {{"id", id_}});
    }
    --live_;
}

bool SandboxHandle::Kill() {
    try {
        runtime_.Kill(id_);
        return true;
    } catch (const core::RuntimeFault& ex) {
        utils::LogError("runner", "kill failed", {{"id", id_}, {"error", ex.what()}});
        return false;
    }
}

SandboxRunner::SandboxRunner(ContainerRuntime& runtime, RunnerOptions options)
    : runtime_(runtime)
    , options_(std::move(options)) {}

std::string SandboxRunner::CreateWithRetry(const ContainerSpec& spec) {
    auto backoff = options_.create_retry_backoff;
    for (int attempt = 1;; ++attempt) {
        try {
            return runtime_.Create(spec);
        } catch (const core::RuntimeFault& ex) {
            utils::LogWarn("runner", "container create failed",
                           {{"name", spec.name},
                            {"attempt", std::to_string(attempt)},
                            {"error", ex.what()}});
            // The daemon may have created it before the client gave up.
            try {
                runtime_.Remove(spec.name);
            } catch (const core::RuntimeFault& cleanup) {
                utils::LogWarn("runner", "cleanup after failed create failed",
                               {{"name", spec.name}, {"error", cleanup.what()}});
            }
            if (attempt >= kCreateAttempts) {
                throw core::RunnerInternalFault(std::string("container create failed: ") + ex.what());
            }
        }
        std::this_thread::sleep_for(backoff);
        backoff *= 2;
    }
}

core::RawExecutionOutput SandboxRunner::Run(const images::ExecutionImage& image,
                                            const std::string& source,
                                            const core::TestSpec& spec,
                                            const policy::ResourcePolicy& policy,
                                            std::chrono::steady_clock::time_point deadline,
                                            const CancellationToken& cancel,
                                            const std::string& challenge_id) {
    const auto started = std::chrono::steady_clock::now();
    core::RawExecutionOutput raw{};
    LogCapture capture(policy.max_log_bytes);

    try {
        StagingArea staging(options_.staging_root);
        auto prepared = image.Prepare(staging, source, spec);
        staging.Seal();

        ContainerSpec container{};
        container.name = "sandgrade-" + utils::RandomHex(16);
        container.image = image.ImageRef();
        container.command = std::move(prepared.command);
        container.mounts = std::move(prepared.mounts);
        container.env = std::move(prepared.env);
        container.working_dir = images::kInputDir;
        container.policy = policy;
        container.labels[kManagedLabel] = "true";
        container.labels[kTrackLabel] = core::ToString(image.GetTrack());
        if (!challenge_id.empty()) {
            container.labels[kChallengeLabel] = challenge_id;
        }

        SandboxHandle handle(runtime_, CreateWithRetry(container), policy, deadline, live_);
        utils::LogInfo("runner", "container created",
                       {{"id", handle.Id().substr(0, 12)},
                        {"track", core::ToString(image.GetTrack())},
                        {"challenge", challenge_id}});

        LogChannel logs(options_.log_channel_capacity);
        if (cancel.IsCancelled()) {
            raw.cancelled = true;
            raw.duration = std::chrono::milliseconds(0);
            return raw;
        }
        runtime_.Start(handle.Id());
        auto watch = runtime_.Watch(handle.Id(), logs);

        std::optional<ContainerExit> exit;
        while (true) {
            DrainAvailable(logs, capture);
            exit = watch->WaitFor(options_.poll_interval);
            if (exit) {
                break;
            }
            if (cancel.IsCancelled()) {
                raw.cancelled = true;
                break;
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                raw.timed_out = true;
                break;
            }
        }

        if (!exit) {
            utils::LogWarn("runner", raw.timed_out ? "deadline reached, killing" : "cancelled, killing",
                           {{"id", handle.Id().substr(0, 12)}});
            handle.Kill();
            exit = watch->WaitFor(policy.kill_grace);
        }
        DrainUntilClosed(logs, capture, policy.kill_grace);

        raw.exit_code = exit ? exit->exit_code : kKilledExitCode;
        raw.oom_killed = exit && exit->oom_killed;
        if (exit && !raw.timed_out && !raw.cancelled) {
            raw.report = staging.ReadOutput(images::kResultFileName, policy.max_report_bytes);
        }
        raw.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        utils::LogInfo("runner", "container finished",
                       {{"id", handle.Id().substr(0, 12)},
                        {"exit", std::to_string(raw.exit_code)},
                        {"timed_out", raw.timed_out ? "true" : "false"},
                        {"report", raw.report ? "present" : "absent"},
                        {"ms", std::to_string(raw.duration.count())}});
    } catch (const core::RuntimeFault& ex) {
        throw core::RunnerInternalFault(std::string("container runtime failure: ") + ex.what());
    }

    capture.MoveInto(raw);
    return raw;
}

std::size_t SandboxRunner::ReapOrphans() {
    std::size_t removed = 0;
    for (const auto& id : runtime_.ListManaged()) {
        if (runtime_.Remove(id)) {
            ++removed;
        }
    }
    if (removed > 0) {
        utils::LogWarn("runner", "reaped orphaned containers", {{"count", std::to_string(removed)}});
    }
    return removed;
}

}  // namespace sandgrade::sandbox
