#pragma once

#include <filesystem>

#include "images/execution_image.hpp"

namespace sandgrade::images {

// Data submissions in one of three modes: a Python analysis script judged by
// the variables it leaves behind, a SQL query judged by its result set, or a
// notebook judged by its executed cells. Named datasets and databases come
// from the configured datasets directory and are mounted read-only.
class DataAnalysisImage : public TrackImage {
public:
    static constexpr const char* kDefaultImage = "sandgrade/data-analysis:1";
    static constexpr const char* kDatasetMountDir = "/datasets";

    explicit DataAnalysisImage(std::filesystem::path datasets_dir = {},
                               std::string image_ref = kDefaultImage,
                               std::vector<std::string> command = DefaultCommand());

    static std::vector<std::string> DefaultCommand();

protected:
    std::string SourceFileName(const core::TestSpec& spec) const override;
    std::string ValidateCheck(const core::CheckSpec& check, const core::TestSpec& spec) const override;
    std::vector<std::string> ValidateOptions(const core::TestSpec& spec) const override;
    void AddMounts(const core::TestSpec& spec, PreparedExecution& prepared) const override;

private:
    std::string ValidatePythonCheck(const core::CheckSpec& check) const;
    std::string ValidateSqlCheck(const core::CheckSpec& check) const;
    std::string ValidateNotebookCheck(const core::CheckSpec& check) const;
    std::string ValidateDatasetFile(const core::TestSpec& spec, const char* key) const;
    void MountDatasetFile(const core::TestSpec& spec, const char* key, const char* env,
                          PreparedExecution& prepared) const;

    std::filesystem::path datasets_dir_;
};

}  // namespace sandgrade::images
