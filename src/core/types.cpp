#include "core/types.hpp"

#include <algorithm>
#include <limits>

#include "core/errors.hpp"

namespace sandgrade::core {

const char* ToString(Track track) {
    switch (track) {
        case Track::kRenderScript: return "render-script";
        case Track::kDataAnalysis: return "data-analysis";
        case Track::kInfraCli: return "infra-cli";
    }
    return "unknown";
}

std::optional<Track> ParseTrack(const std::string& value) {
    for (const auto track : AllTracks()) {
        if (value == ToString(track)) {
            return track;
        }
    }
    return std::nullopt;
}

const std::vector<Track>& AllTracks() {
    static const std::vector<Track> kTracks = {
        Track::kRenderScript,
        Track::kDataAnalysis,
        Track::kInfraCli
    };
    return kTracks;
}

const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kValidation: return "validation_error";
        case ErrorKind::kImageNotFound: return "image_not_found";
        case ErrorKind::kCapacityExceeded: return "capacity_exceeded";
        case ErrorKind::kRunnerInternalFault: return "runner_internal_fault";
        case ErrorKind::kConfig: return "config_error";
    }
    return "unknown";
}

std::int64_t TestSpec::TotalPoints() const {
    std::int64_t total = 0;
    for (const auto& check : checks) {
        total += std::max(check.points, 0);
    }
    return total;
}

int TestSpec::MaxScore() const {
    return static_cast<int>(std::min<std::int64_t>(TotalPoints(), std::numeric_limits<int>::max()));
}

const CheckSpec* TestSpec::Find(const std::string& name) const {
    auto it = std::find_if(checks.begin(), checks.end(), [&name](const CheckSpec& check) {
        return check.name == name;
    });
    return it == checks.end() ? nullptr : &*it;
}

bool ExecutionResult::HasError(const std::string& type) const {
    return std::any_of(errors.begin(), errors.end(), [&type](const ErrorEntry& error) {
        return error.type == type;
    });
}

void to_json(nlohmann::json& json, const CheckSpec& check) {
    json = {
        {"name", check.name},
        {"points", check.points},
        {"kind", check.kind},
        {"params", check.params}
    };
}

void from_json(const nlohmann::json& json, CheckSpec& check) {
    if (!json.is_object()) {
        throw ValidationError("check must be an object");
    }
    if (!json.contains("name") || !json["name"].is_string()) {
        throw ValidationError("check is missing a string 'name'");
    }
    check.name = json["name"].get<std::string>();
    check.points = 1;
    if (json.contains("points")) {
        if (!json["points"].is_number_integer()) {
            throw ValidationError("check '" + check.name + "' has non-integer points");
        }
        const auto points = json["points"].get<std::int64_t>();
        if (points < std::numeric_limits<int>::min() || points > std::numeric_limits<int>::max()) {
            throw ValidationError("check '" + check.name + "' points out of range");
        }
        check.points = static_cast<int>(points);
    }
    check.kind.clear();
    if (json.contains("kind")) {
        if (!json["kind"].is_string()) {
            throw ValidationError("check '" + check.name + "' has non-string kind");
        }
        check.kind = json["kind"].get<std::string>();
    }
    check.params = nlohmann::json::object();
    if (json.contains("params")) {
        if (!json["params"].is_object()) {
            throw ValidationError("check '" + check.name + "' params must be an object");
        }
        check.params = json["params"];
    }
}

void to_json(nlohmann::json& json, const TestSpec& spec) {
    json = {
        {"checks", spec.checks},
        {"options", spec.options}
    };
}

void from_json(const nlohmann::json& json, TestSpec& spec) {
    if (!json.is_object()) {
        throw ValidationError("testSpec must be an object");
    }
    spec.checks.clear();
    if (json.contains("checks")) {
        if (!json["checks"].is_array()) {
            throw ValidationError("testSpec.checks must be an array");
        }
        for (const auto& item : json["checks"]) {
            spec.checks.push_back(item.get<CheckSpec>());
        }
    }
    spec.options = nlohmann::json::object();
    if (json.contains("options")) {
        if (!json["options"].is_object()) {
            throw ValidationError("testSpec.options must be an object");
        }
        spec.options = json["options"];
    }
}

void to_json(nlohmann::json& json, const CheckResult& check) {
    json = {
        {"name", check.name},
        {"passed", check.passed},
        {"points", check.points}
    };
    if (check.error) {
        json["error"] = *check.error;
    }
}

void to_json(nlohmann::json& json, const ErrorEntry& error) {
    json = {
        {"type", error.type},
        {"message", error.message}
    };
}

void to_json(nlohmann::json& json, const ExecutionResult& result) {
    json = {
        {"challengeId", result.challenge_id},
        {"track", result.track},
        {"success", result.success},
        {"score", result.score},
        {"maxScore", result.max_score},
        {"perCheckResults", result.check_results},
        {"errors", result.errors},
        {"metrics", result.metrics},
        {"executionTimeMs", result.execution_time_ms},
        {"logs", result.logs}
    };
}

ExecutionRequest ParseExecutionRequest(const nlohmann::json& body) {
    if (!body.is_object()) {
        throw ValidationError("request body must be a JSON object");
    }
    ExecutionRequest request{};
    if (body.contains("track") && body["track"].is_string()) {
        request.track = body["track"].get<std::string>();
    }
    if (body.contains("submittedSource") && body["submittedSource"].is_string()) {
        request.submitted_source = body["submittedSource"].get<std::string>();
    }
    if (body.contains("challengeId") && body["challengeId"].is_string()) {
        request.challenge_id = body["challengeId"].get<std::string>();
    }
    if (body.contains("testSpec")) {
        request.test_spec = body["testSpec"].get<TestSpec>();
    }
    return request;
}

}  // namespace sandgrade::core
