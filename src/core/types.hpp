#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace sandgrade::core {

enum class Track {
    kRenderScript,
    kDataAnalysis,
    kInfraCli
};

const char* ToString(Track track);
std::optional<Track> ParseTrack(const std::string& value);
const std::vector<Track>& AllTracks();

// Upper bounds on declared points; admission rejects anything above them so
// scores always fit in an int.
constexpr int kMaxCheckPoints = 1000000;
constexpr std::int64_t kMaxTotalPoints = 100000000;

struct CheckSpec {
    std::string name;
    int points = 1;
    std::string kind;
    nlohmann::json params = nlohmann::json::object();
};

struct TestSpec {
    std::vector<CheckSpec> checks;
    nlohmann::json options = nlohmann::json::object();

    std::int64_t TotalPoints() const;
    int MaxScore() const;
    const CheckSpec* Find(const std::string& name) const;
};

// Immutable once built: the dispatcher only ever reads it.
struct ExecutionRequest {
    std::string track;
    std::string submitted_source;
    std::string challenge_id;
    TestSpec test_spec;
};

struct RawExecutionOutput {
    std::string stdout_text;
    std::string stderr_text;
    bool stdout_truncated = false;
    bool stderr_truncated = false;
    // Absent when the reporter never wrote a result: crash, kill, timeout.
    std::optional<std::string> report;
    int exit_code = -1;
    bool timed_out = false;
    bool cancelled = false;
    bool oom_killed = false;
    std::chrono::milliseconds duration{0};
};

struct CheckResult {
    std::string name;
    bool passed = false;
    int points = 0;
    std::optional<std::string> error;
};

struct ErrorEntry {
    std::string type;
    std::string message;
};

struct ExecutionResult {
    std::string challenge_id;
    std::string track;
    bool success = false;
    int score = 0;
    int max_score = 0;
    std::vector<CheckResult> check_results;
    std::vector<ErrorEntry> errors;
    nlohmann::json metrics = nlohmann::json::object();
    long long execution_time_ms = 0;
    std::string logs;

    bool HasError(const std::string& type) const;
};

void to_json(nlohmann::json& json, const CheckSpec& check);
void from_json(const nlohmann::json& json, CheckSpec& check);
void to_json(nlohmann::json& json, const TestSpec& spec);
void from_json(const nlohmann::json& json, TestSpec& spec);
void to_json(nlohmann::json& json, const CheckResult& check);
void to_json(nlohmann::json& json, const ErrorEntry& error);
void to_json(nlohmann::json& json, const ExecutionResult& result);

// Builds a request from the inbound JSON body used by the gateway and CLI.
ExecutionRequest ParseExecutionRequest(const nlohmann::json& body);

}  // namespace sandgrade::core
