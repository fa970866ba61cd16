#include "normalizer/result_normalizer.hpp"

#include <algorithm>
#include <cstdint>
#include <map>

#include "utils/logging.hpp"

namespace sandgrade::normalizer {
namespace {

using nlohmann::json;

bool ParseCheck(const json& item, ParsedReport::Check& check, std::string& error) {
    if (!item.is_object()) {
        error = "check entry is not an object";
        return false;
    }
    if (!item.contains("name") || !item["name"].is_string() || item["name"].get<std::string>().empty()) {
        error = "check entry without a name";
        return false;
    }
    check.name = item["name"].get<std::string>();
    if (!item.contains("passed") || !item["passed"].is_boolean()) {
        error = "check '" + check.name + "' has no boolean 'passed'";
        return false;
    }
    check.passed = item["passed"].get<bool>();
    if (!item.contains("points") || !item["points"].is_number_integer()) {
        error = "check '" + check.name + "' has no integer 'points'";
        return false;
    }
    check.points = item["points"].get<int>();
    return true;
}

bool ParseErrorEntry(const json& item, core::ErrorEntry& entry, std::string& error) {
    if (!item.is_object() ||
        !item.contains("type") || !item["type"].is_string() ||
        !item.contains("message") || !item["message"].is_string()) {
        error = "error entry must carry string 'type' and 'message'";
        return false;
    }
    entry.type = item["type"].get<std::string>();
    entry.message = item["message"].get<std::string>();
    return true;
}

std::string CombineLogs(const core::RawExecutionOutput& raw) {
    std::string logs = raw.stdout_text;
    if (!raw.stderr_text.empty()) {
        if (!logs.empty() && logs.back() != '\n') {
            logs.push_back('\n');
        }
        logs += raw.stderr_text;
    }
    return logs;
}

void AddEngineErrors(const core::RawExecutionOutput& raw, std::vector<core::ErrorEntry>& errors) {
    if (raw.timed_out) {
        errors.push_back({"timeout", "execution exceeded its wall-clock limit after " +
                                         std::to_string(raw.duration.count()) + " ms"});
    }
    if (raw.cancelled) {
        errors.push_back({"cancelled", "execution was cancelled"});
    }
    if (raw.oom_killed) {
        errors.push_back({"oom_killed", "process was killed after exceeding its memory limit"});
    }
    if (!raw.timed_out && !raw.cancelled && !raw.oom_killed && raw.exit_code != 0) {
        errors.push_back({"non_zero_exit", "process exited with code " + std::to_string(raw.exit_code)});
    }
}

}  // namespace

std::optional<ParsedReport> ResultNormalizer::ParseReport(const std::string& text, std::string& error) {
    const auto doc = json::parse(text, nullptr, false);
    if (doc.is_discarded()) {
        error = "result is not valid JSON";
        return std::nullopt;
    }
    if (!doc.is_object()) {
        error = "result is not a JSON object";
        return std::nullopt;
    }
    if (!doc.contains("checks") || !doc["checks"].is_array()) {
        error = "result has no 'checks' array";
        return std::nullopt;
    }

    ParsedReport report{};
    for (const auto& item : doc["checks"]) {
        ParsedReport::Check check{};
        if (!ParseCheck(item, check, error)) {
            return std::nullopt;
        }
        report.checks.push_back(std::move(check));
    }

    if (doc.contains("metrics")) {
        if (!doc["metrics"].is_object()) {
            error = "'metrics' is not an object";
            return std::nullopt;
        }
        report.metrics = doc["metrics"];
    }

    if (doc.contains("errors")) {
        if (!doc["errors"].is_array()) {
            error = "'errors' is not an array";
            return std::nullopt;
        }
        for (const auto& item : doc["errors"]) {
            core::ErrorEntry entry{};
            if (!ParseErrorEntry(item, entry, error)) {
                return std::nullopt;
            }
            report.errors.push_back(std::move(entry));
        }
    }

    for (auto it = doc.begin(); it != doc.end(); ++it) {
        if (it.key() != "checks" && it.key() != "metrics" && it.key() != "errors") {
            report.extra[it.key()] = it.value();
        }
    }
    return report;
}

core::ExecutionResult ResultNormalizer::Normalize(core::Track track,
                                                  const core::RawExecutionOutput& raw,
                                                  const core::TestSpec& spec) const {
    core::ExecutionResult result{};
    result.track = core::ToString(track);
    result.max_score = spec.MaxScore();
    result.execution_time_ms = raw.duration.count();
    result.logs = CombineLogs(raw);

    std::optional<ParsedReport> report;
    std::string parse_error;
    if (raw.report) {
        report = ParseReport(*raw.report, parse_error);
    } else {
        parse_error = "reporter wrote no result";
    }

    if (!report) {
        // Degraded: nothing the reporter said can be trusted.
        for (const auto& check : spec.checks) {
            result.check_results.push_back({check.name, false, 0, std::string(kExecutionIncomplete)});
        }
        result.errors.push_back({"no_structured_result", parse_error});
        utils::LogWarn("normalize", "no structured result",
                       {{"track", result.track}, {"reason", parse_error}});
    } else {
        std::map<std::string, const ParsedReport::Check*> reported;
        for (const auto& check : report->checks) {
            // First report of a name wins.
            reported.emplace(check.name, &check);
        }

        bool all_passed = true;
        std::int64_t awarded = 0;
        for (const auto& check : spec.checks) {
            core::CheckResult entry{check.name, false, 0, std::nullopt};
            const auto it = reported.find(check.name);
            if (it == reported.end()) {
                entry.error = std::string(kCheckNotReported);
            } else if (it->second->passed) {
                entry.passed = true;
                entry.points = std::max(check.points, 0);
                awarded += entry.points;
            }
            all_passed = all_passed && entry.passed;
            result.check_results.push_back(std::move(entry));
        }

        result.score = static_cast<int>(std::min<std::int64_t>(awarded, result.max_score));

        result.metrics = report->metrics;
        for (auto it = report->extra.begin(); it != report->extra.end(); ++it) {
            const auto key = result.metrics.contains(it.key()) ? "reporter." + it.key() : it.key();
            result.metrics[key] = it.value();
        }

        auto undeclared = nlohmann::json::array();
        for (const auto& check : report->checks) {
            if (spec.Find(check.name) == nullptr) {
                undeclared.push_back(check.name);
            }
        }
        if (!undeclared.empty()) {
            result.metrics["undeclaredChecks"] = undeclared;
        }

        result.errors = report->errors;
        // An OOM kill fails the run even after a passing report; a non-zero
        // exit alone does not.
        result.success = all_passed && !raw.timed_out && !raw.cancelled && !raw.oom_killed;
    }

    AddEngineErrors(raw, result.errors);
    result.metrics["exitCode"] = raw.exit_code;
    result.metrics["stdoutTruncated"] = raw.stdout_truncated;
    result.metrics["stderrTruncated"] = raw.stderr_truncated;
    return result;
}

}  // namespace sandgrade::normalizer
