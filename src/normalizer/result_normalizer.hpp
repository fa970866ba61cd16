#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/types.hpp"

namespace sandgrade::normalizer {

constexpr const char* kCheckNotReported = "check not reported";
constexpr const char* kExecutionIncomplete = "execution did not complete";

// Reporter output after strict validation of the wire schema.
struct ParsedReport {
    struct Check {
        std::string name;
        bool passed = false;
        int points = 0;
    };

    std::vector<Check> checks;
    nlohmann::json metrics = nlohmann::json::object();
    std::vector<core::ErrorEntry> errors;
    // Top-level fields outside checks/metrics/errors.
    nlohmann::json extra = nlohmann::json::object();
};

class ResultNormalizer {
public:
    // Turns raw container output into the uniform result. Never throws for
    // anything the submitted code or its reporter produced.
    core::ExecutionResult Normalize(core::Track track,
                                    const core::RawExecutionOutput& raw,
                                    const core::TestSpec& spec) const;

    // Returns nullopt and fills error when the text does not match
    // {"checks":[{"name","passed","points"}],"metrics":{},"errors":[{"type","message"}]}.
    static std::optional<ParsedReport> ParseReport(const std::string& text, std::string& error);
};

}  // namespace sandgrade::normalizer
