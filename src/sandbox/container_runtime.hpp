#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "policy/resource_policy.hpp"
#include "sandbox/log_channel.hpp"

namespace sandgrade::sandbox {

constexpr const char* kManagedLabel = "sandgrade.managed";
constexpr const char* kChallengeLabel = "sandgrade.challenge";
constexpr const char* kTrackLabel = "sandgrade.track";

struct Mount {
    std::string host_path;
    std::string container_path;
    bool read_only = true;
};

struct ContainerSpec {
    std::string name;
    std::string image;
    std::vector<std::string> command;
    std::vector<Mount> mounts;
    std::map<std::string, std::string> labels;
    std::map<std::string, std::string> env;
    std::string working_dir;
    std::string scratch_path = "/tmp";
    policy::ResourcePolicy policy;
};

struct ContainerExit {
    int exit_code = -1;
    bool oom_killed = false;
};

// Follows one started container: its log streams feed a LogChannel that is
// closed once both streams end, and WaitFor reports the exit.
class ContainerWatch {
public:
    virtual ~ContainerWatch() = default;
    virtual std::optional<ContainerExit> WaitFor(std::chrono::milliseconds timeout) = 0;
};

// Container daemon operations. Implementations throw core::RuntimeFault
// when the daemon cannot be reached or refuses a request.
class ContainerRuntime {
public:
    virtual ~ContainerRuntime() = default;
    virtual std::string Name() const = 0;
    virtual bool Ping() = 0;
    virtual bool ImageExists(const std::string& image) = 0;
    virtual std::string Create(const ContainerSpec& spec) = 0;
    virtual void Start(const std::string& id) = 0;
    virtual std::unique_ptr<ContainerWatch> Watch(const std::string& id, LogChannel& logs) = 0;
    virtual void Kill(const std::string& id) = 0;
    // Forced removal; returns false when the container could not be removed.
    virtual bool Remove(const std::string& id) = 0;
    virtual std::vector<std::string> ListManaged() = 0;
};

}  // namespace sandgrade::sandbox
