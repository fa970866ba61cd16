#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace sandgrade::sandbox {

struct CommandResult {
    int exit_code = -1;
    bool timed_out = false;
    bool launched = false;
    std::string output;
    std::string error;
};

// Runs a short-lived host program (the docker client) to completion.
class CommandRunner {
public:
    // Output beyond this is dropped; docker client replies are small.
    static constexpr std::size_t kMaxCapturedBytes = 4 * 1024 * 1024;

    static CommandResult Run(const std::string& program,
                             const std::vector<std::string>& args,
                             std::chrono::milliseconds timeout);
};

}  // namespace sandgrade::sandbox
