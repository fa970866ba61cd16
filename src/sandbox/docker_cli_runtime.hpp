#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "sandbox/command_runner.hpp"
#include "sandbox/container_runtime.hpp"

namespace sandgrade::sandbox {

// ContainerRuntime backed by the docker command-line client.
class DockerCliRuntime : public ContainerRuntime {
public:
    explicit DockerCliRuntime(std::string docker_binary = "docker",
                              std::chrono::milliseconds command_timeout = std::chrono::seconds(30));

    std::string Name() const override { return "docker"; }
    bool Ping() override;
    bool ImageExists(const std::string& image) override;
    std::string Create(const ContainerSpec& spec) override;
    void Start(const std::string& id) override;
    std::unique_ptr<ContainerWatch> Watch(const std::string& id, LogChannel& logs) override;
    void Kill(const std::string& id) override;
    bool Remove(const std::string& id) override;
    std::vector<std::string> ListManaged() override;

    // Arguments for `docker create`, with every resource limit of the
    // spec's policy translated into flags.
    static std::vector<std::string> BuildCreateArgs(const ContainerSpec& spec);

    const std::string& Binary() const { return docker_binary_; }

private:
    CommandResult Docker(const std::vector<std::string>& args) const;
    CommandResult DockerChecked(const std::vector<std::string>& args, const char* what) const;

    std::string docker_binary_;
    std::chrono::milliseconds command_timeout_;
};

}  // namespace sandgrade::sandbox
