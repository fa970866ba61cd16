#include "dispatcher/execution_dispatcher.hpp"

#include <algorithm>
#include <set>

#include "core/errors.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace sandgrade::dispatcher {
namespace {

sandbox::RunnerOptions MakeRunnerOptions(const config::EngineConfig& config) {
    sandbox::RunnerOptions options{};
    options.staging_root = config.runtime.staging_root;
    options.create_retry_backoff = std::chrono::milliseconds(config.runtime.create_retry_backoff_ms);
    options.poll_interval = std::chrono::milliseconds(config.runtime.poll_interval_ms);
    return options;
}

}  // namespace

void to_json(nlohmann::json& json, const EngineStatus& status) {
    auto images = nlohmann::json::array();
    for (const auto& image : status.images) {
        images.push_back({{"track", image.track}, {"image", image.image}, {"available", image.available}});
    }
    json = nlohmann::json{
        {"runtime", {{"name", status.runtime}, {"reachable", status.runtime_reachable}}},
        {"capacity", {{"total", status.capacity},
                      {"inUse", status.in_use},
                      {"available", status.available},
                      {"liveSandboxes", status.live_sandboxes}}},
        {"images", images},
        {"counters", {{"executions", status.executions},
                      {"succeeded", status.succeeded},
                      {"failed", status.failed},
                      {"timeouts", status.timeouts},
                      {"validationErrors", status.validation_errors},
                      {"capacityRejections", status.capacity_rejections},
                      {"missingImages", status.missing_images},
                      {"runnerFaults", status.runner_faults}}}
    };
}

ExecutionDispatcher::ExecutionDispatcher(const config::EngineConfig& config,
                                         const images::ImageRegistry& registry,
                                         sandbox::ContainerRuntime& runtime)
    : config_(config)
    , registry_(registry)
    , runtime_(runtime)
    , capacity_(static_cast<std::size_t>(std::max(config.capacity.max_concurrent, 1)))
    , runner_(runtime, MakeRunnerOptions(config)) {}

void ExecutionDispatcher::Validate(const core::ExecutionRequest& request,
                                   const images::ExecutionImage& image) const {
    std::vector<std::string> problems;
    if (request.submitted_source.empty()) {
        problems.push_back("submitted source is empty");
    } else if (request.submitted_source.size() > config_.limits.max_source_bytes) {
        problems.push_back("submitted source is " + std::to_string(request.submitted_source.size()) +
                           " bytes, limit is " + std::to_string(config_.limits.max_source_bytes));
    }
    const auto& spec = request.test_spec;
    if (spec.checks.empty()) {
        problems.push_back("test spec declares no checks");
    }
    std::set<std::string> names;
    for (const auto& check : spec.checks) {
        if (check.name.empty()) {
            problems.push_back("check without a name");
        } else if (!names.insert(check.name).second) {
            problems.push_back("duplicate check name '" + check.name + "'");
        }
        if (check.points < 0) {
            problems.push_back("check '" + check.name + "' has negative points");
        } else if (check.points > core::kMaxCheckPoints) {
            problems.push_back("check '" + check.name + "' exceeds " + std::to_string(core::kMaxCheckPoints) +
                               " points");
        }
    }
    if (spec.TotalPoints() > core::kMaxTotalPoints) {
        problems.push_back("test spec declares more than " + std::to_string(core::kMaxTotalPoints) + " points");
    }
    auto image_problems = image.ValidateSpec(spec);
    problems.insert(problems.end(), image_problems.begin(), image_problems.end());
    if (!problems.empty()) {
        throw core::ValidationError(utils::Join(problems, "; "));
    }
}

const images::ExecutionImage& ExecutionDispatcher::Admit(const core::ExecutionRequest& request,
                                                         core::Track& track) {
    const auto parsed = core::ParseTrack(request.track);
    if (!parsed) {
        ++validation_errors_;
        throw core::ValidationError("unknown track '" + request.track + "'");
    }
    track = *parsed;
    const auto* image = registry_.Get(track);
    if (image == nullptr) {
        ++missing_images_;
        throw core::ImageNotFoundError(std::string("no image registered for track ") + core::ToString(track));
    }
    try {
        Validate(request, *image);
    } catch (const core::ValidationError&) {
        ++validation_errors_;
        throw;
    }

    bool exists = false;
    try {
        exists = runtime_.ImageExists(image->ImageRef());
    } catch (const core::RuntimeFault& ex) {
        ++runner_faults_;
        throw core::RunnerInternalFault(std::string("cannot query image: ") + ex.what());
    }
    if (!exists) {
        ++missing_images_;
        throw core::ImageNotFoundError("image " + image->ImageRef() + " for track " +
                                       core::ToString(track) + " is not available");
    }
    return *image;
}

core::ExecutionResult ExecutionDispatcher::FaultResult(const core::ExecutionRequest& request,
                                                       core::Track track,
                                                       const std::string& message,
                                                       std::chrono::steady_clock::time_point started) const {
    core::ExecutionResult result{};
    result.challenge_id = request.challenge_id;
    result.track = core::ToString(track);
    result.max_score = request.test_spec.MaxScore();
    for (const auto& check : request.test_spec.checks) {
        result.check_results.push_back({check.name, false, 0, std::string(normalizer::kExecutionIncomplete)});
    }
    result.errors.push_back({"runner_internal_fault", message});
    result.execution_time_ms = utils::ToMillis(std::chrono::steady_clock::now() - started);
    return result;
}

core::ExecutionResult ExecutionDispatcher::Execute(const core::ExecutionRequest& request,
                                                   const sandbox::CancellationToken& cancel) {
    const auto started = std::chrono::steady_clock::now();
    ++executions_;

    core::Track track{};
    const auto& image = [&]() -> const images::ExecutionImage& {
        try {
            return Admit(request, track);
        } catch (const core::RunnerInternalFault& ex) {
            utils::LogError("dispatch", "runtime unavailable", {{"error", ex.what()}});
            throw core::RunnerInternalFault(ex.what(), FaultResult(request, track, ex.what(), started));
        }
    }();

    core::RawExecutionOutput raw{};
    {
        auto slot = capacity_.Acquire(std::chrono::milliseconds(config_.capacity.admission_timeout_ms), cancel);
        if (!slot) {
            ++capacity_rejections_;
            throw core::CapacityExceededError(
                cancel.IsCancelled()
                    ? std::string("cancelled while waiting for sandbox capacity")
                    : "no sandbox capacity within " + std::to_string(config_.capacity.admission_timeout_ms) + " ms");
        }
        utils::LogInfo("dispatch", "execution admitted",
                       {{"challenge", request.challenge_id},
                        {"track", core::ToString(track)},
                        {"in_use", std::to_string(capacity_.InUse())}});

        const auto deadline = std::chrono::steady_clock::now() + config_.policy.wall_clock_timeout;
        try {
            raw = runner_.Run(image, request.submitted_source, request.test_spec,
                              config_.policy, deadline, cancel, request.challenge_id);
        } catch (const core::RunnerInternalFault& ex) {
            ++runner_faults_;
            utils::LogError("dispatch", "runner fault", {{"challenge", request.challenge_id}, {"error", ex.what()}});
            throw core::RunnerInternalFault(ex.what(), FaultResult(request, track, ex.what(), started));
        } catch (const std::exception& ex) {
            ++runner_faults_;
            utils::LogError("dispatch", "unexpected runner failure",
                            {{"challenge", request.challenge_id}, {"error", ex.what()}});
            throw core::RunnerInternalFault(ex.what(), FaultResult(request, track, ex.what(), started));
        }
    }

    auto result = normalizer_.Normalize(track, raw, request.test_spec);
    result.challenge_id = request.challenge_id;
    if (raw.timed_out) {
        ++timeouts_;
    }
    if (result.success) {
        ++succeeded_;
    } else {
        ++failed_;
    }
    utils::LogInfo("dispatch", "execution finished",
                   {{"challenge", request.challenge_id},
                    {"track", result.track},
                    {"success", result.success ? "true" : "false"},
                    {"score", std::to_string(result.score) + "/" + std::to_string(result.max_score)},
                    {"ms", std::to_string(utils::ToMillis(std::chrono::steady_clock::now() - started))}});
    return result;
}

EngineStatus ExecutionDispatcher::Status() {
    EngineStatus status{};
    status.runtime = runtime_.Name();
    status.runtime_reachable = runtime_.Ping();
    status.capacity = capacity_.Capacity();
    status.in_use = capacity_.InUse();
    status.available = capacity_.Available();
    status.live_sandboxes = runner_.LiveSandboxes();
    for (const auto* image : registry_.List()) {
        ImageStatus entry{core::ToString(image->GetTrack()), image->ImageRef(), false};
        if (status.runtime_reachable) {
            try {
                entry.available = runtime_.ImageExists(image->ImageRef());
            } catch (const core::RuntimeFault& ex) {
                utils::LogWarn("dispatch", "image query failed", {{"image", image->ImageRef()}, {"error", ex.what()}});
            }
        }
        status.images.push_back(std::move(entry));
    }
    status.executions = executions_.load();
    status.succeeded = succeeded_.load();
    status.failed = failed_.load();
    status.timeouts = timeouts_.load();
    status.validation_errors = validation_errors_.load();
    status.capacity_rejections = capacity_rejections_.load();
    status.missing_images = missing_images_.load();
    status.runner_faults = runner_faults_.load();
    return status;
}

std::size_t ExecutionDispatcher::ReapOrphans() {
    try {
        return runner_.ReapOrphans();
    } catch (const core::RuntimeFault& ex) {
        utils::LogWarn("dispatch", "orphan reaping failed", {{"error", ex.what()}});
        return 0;
    }
}

}  // namespace sandgrade::dispatcher
