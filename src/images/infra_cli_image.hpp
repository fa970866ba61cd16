#pragma once

#include "images/execution_image.hpp"

namespace sandgrade::images {

// Infrastructure-as-code and cloud CLI scripts. Terraform sources are planned
// offline and checks assert on the planned resources; aws-cli scripts are
// checked for the services and resources they address.
class InfraCliImage : public TrackImage {
public:
    static constexpr const char* kDefaultImage = "sandgrade/infra-cli:1";

    explicit InfraCliImage(std::string image_ref = kDefaultImage,
                           std::vector<std::string> command = DefaultCommand());

    static std::vector<std::string> DefaultCommand();

protected:
    std::string SourceFileName(const core::TestSpec& spec) const override;
    std::string ValidateCheck(const core::CheckSpec& check, const core::TestSpec& spec) const override;
    std::vector<std::string> ValidateOptions(const core::TestSpec& spec) const override;
    void AddMounts(const core::TestSpec& spec, PreparedExecution& prepared) const override;

private:
    static std::string ValidateAwsResourceCheck(const nlohmann::json& params);
};

}  // namespace sandgrade::images
