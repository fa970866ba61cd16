#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace sandgrade::sandbox {

// Per-execution host directory. "input" is mounted read-only into the
// container, "output" is where the reporter writes its result. The whole
// tree is removed when the object is destroyed.
class StagingArea {
public:
    explicit StagingArea(const std::filesystem::path& root);
    ~StagingArea();

    StagingArea(const StagingArea&) = delete;
    StagingArea& operator=(const StagingArea&) = delete;

    const std::filesystem::path& Root() const { return root_; }
    std::filesystem::path InputDir() const { return root_ / "input"; }
    std::filesystem::path OutputDir() const { return root_ / "output"; }

    void WriteInput(const std::string& name, const std::string& content);
    // Drops write permission on the input tree and opens the output
    // directory to the unprivileged container user.
    void Seal();
    // nullopt when the file is missing or larger than max_bytes.
    std::optional<std::string> ReadOutput(const std::string& name, std::size_t max_bytes) const;

    static std::filesystem::path DefaultRoot();

private:
    std::filesystem::path root_;
};

}  // namespace sandgrade::sandbox
