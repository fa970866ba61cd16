#pragma once

#include <map>
#include <string>
#include <vector>

#include "core/types.hpp"
#include "sandbox/container_runtime.hpp"
#include "sandbox/staging_area.hpp"

namespace sandgrade::images {

constexpr const char* kInputDir = "/sandbox/input";
constexpr const char* kOutputDir = "/sandbox/output";
constexpr const char* kSpecFileName = "spec.json";
constexpr const char* kResultFileName = "result.json";
constexpr const char* kSourcePlaceholder = "{source}";

// Where the track's reporter writes its result.
struct ReportSchema {
    std::string result_path;
};

struct PreparedExecution {
    std::vector<std::string> command;
    std::vector<sandbox::Mount> mounts;
    std::map<std::string, std::string> env;
};

// One pre-built execution environment per track.
class ExecutionImage {
public:
    virtual ~ExecutionImage() = default;

    virtual core::Track GetTrack() const = 0;
    virtual const std::string& ImageRef() const = 0;
    virtual const ReportSchema& Schema() const = 0;
    // Problems with the declared checks/options; empty when acceptable.
    virtual std::vector<std::string> ValidateSpec(const core::TestSpec& spec) const = 0;
    // Writes the staged inputs and returns the in-container invocation.
    virtual PreparedExecution Prepare(sandbox::StagingArea& staging,
                                      const std::string& source,
                                      const core::TestSpec& spec) const = 0;
};

// Shared behaviour of the built-in track images: stage the source and
// spec.json, substitute the source path into the command, validate every
// declared check by kind.
class TrackImage : public ExecutionImage {
public:
    TrackImage(core::Track track,
               std::string image_ref,
               std::vector<std::string> command);

    core::Track GetTrack() const override { return track_; }
    const std::string& ImageRef() const override { return image_ref_; }
    const ReportSchema& Schema() const override { return schema_; }
    const std::vector<std::string>& Command() const { return command_; }

    std::vector<std::string> ValidateSpec(const core::TestSpec& spec) const override;
    PreparedExecution Prepare(sandbox::StagingArea& staging,
                              const std::string& source,
                              const core::TestSpec& spec) const override;

protected:
    virtual std::string SourceFileName(const core::TestSpec& spec) const = 0;
    // Returns an error message for an unacceptable check, empty otherwise.
    virtual std::string ValidateCheck(const core::CheckSpec& check, const core::TestSpec& spec) const = 0;
    virtual std::vector<std::string> ValidateOptions(const core::TestSpec& spec) const;
    virtual void AddMounts(const core::TestSpec& spec, PreparedExecution& prepared) const;

    static bool HasString(const nlohmann::json& params, const char* key);
    static bool HasNumber(const nlohmann::json& params, const char* key);
    static bool HasInteger(const nlohmann::json& params, const char* key);
    static bool IsPlainFileName(const std::string& name);
    // Reads options.mode, falling back when absent.
    static std::string ModeOr(const core::TestSpec& spec, const char* fallback);

private:
    core::Track track_;
    std::string image_ref_;
    std::vector<std::string> command_;
    ReportSchema schema_;
};

}  // namespace sandgrade::images
