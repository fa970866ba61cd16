#pragma once

#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "sandbox/container_runtime.hpp"

namespace sandgrade::testing {

// What every container created by the fake does once started.
struct FakeBehaviour {
    int exit_code = 0;
    std::chrono::milliseconds run_time{0};
    std::string stdout_text;
    std::string stderr_text;
    // Written to <output mount>/result.json when the container starts.
    std::optional<std::string> report;
    bool oom_killed = false;
    int create_failures = 0;
    bool start_fails = false;
    bool reachable = true;
};

// In-memory ContainerRuntime with scripted containers.
class FakeContainerRuntime : public sandbox::ContainerRuntime {
public:
    explicit FakeContainerRuntime(FakeBehaviour behaviour = {});

    void SetBehaviour(FakeBehaviour behaviour);
    void SetImageMissing(const std::string& image);
    // Registers a container that outlived an earlier engine process.
    void AddLeftover(const std::string& id, std::map<std::string, std::string> labels);

    std::string Name() const override { return "fake"; }
    bool Ping() override;
    bool ImageExists(const std::string& image) override;
    std::string Create(const sandbox::ContainerSpec& spec) override;
    void Start(const std::string& id) override;
    std::unique_ptr<sandbox::ContainerWatch> Watch(const std::string& id, sandbox::LogChannel& logs) override;
    void Kill(const std::string& id) override;
    bool Remove(const std::string& id) override;
    std::vector<std::string> ListManaged() override;

    std::size_t CreateAttempts() const;
    std::size_t CreatedCount() const;
    std::size_t LiveCount() const;
    std::size_t PeakLive() const;
    std::size_t KillCount() const;
    std::size_t RemovedCount() const;
    std::vector<sandbox::ContainerSpec> CreatedSpecs() const;

    // Shared with watches; guarded by its own mutex.
    struct Container {
        sandbox::ContainerSpec spec;
        FakeBehaviour behaviour;
        std::mutex mutex;
        std::condition_variable cv;
        bool started = false;
        bool killed = false;
        std::chrono::steady_clock::time_point started_at{};
    };

private:
    std::shared_ptr<Container> Find(const std::string& id) const;

    mutable std::mutex mutex_;
    FakeBehaviour behaviour_;
    std::set<std::string> missing_images_;
    std::map<std::string, std::shared_ptr<Container>> containers_;
    std::vector<sandbox::ContainerSpec> created_specs_;
    std::size_t next_id_ = 1;
    std::size_t create_attempts_ = 0;
    std::size_t created_ = 0;
    std::size_t peak_live_ = 0;
    std::size_t kills_ = 0;
    std::size_t removed_ = 0;
};

}  // namespace sandgrade::testing
