#include "images/infra_cli_image.hpp"

#include <map>

namespace sandgrade::images {
namespace {

constexpr const char* kTerraformMode = "terraform";
constexpr const char* kAwsCliMode = "aws-cli";

// Supported services and the key naming the resource inside 'check'.
const std::map<std::string, std::string>& AwsResourceKeys() {
    static const std::map<std::string, std::string> kKeys = {
        {"s3", "bucket_name"},
        {"lambda", "function_name"},
        {"dynamodb", "table_name"},
    };
    return kKeys;
}

}  // namespace

InfraCliImage::InfraCliImage(std::string image_ref, std::vector<std::string> command)
    : TrackImage(core::Track::kInfraCli, std::move(image_ref), std::move(command)) {}

std::vector<std::string> InfraCliImage::DefaultCommand() {
    return {"python3", "/opt/reporter/infra_reporter.py", kSourcePlaceholder};
}

std::string InfraCliImage::SourceFileName(const core::TestSpec& spec) const {
    return ModeOr(spec, kTerraformMode) == kAwsCliMode ? "commands.sh" : "main.tf";
}

std::string InfraCliImage::ValidateAwsResourceCheck(const nlohmann::json& params) {
    if (!HasString(params, "service") || !params.contains("check") || !params["check"].is_object()) {
        return "aws_resource_exists requires 'service' and a 'check' object";
    }
    const auto service = params["service"].get<std::string>();
    const auto it = AwsResourceKeys().find(service);
    if (it == AwsResourceKeys().end()) {
        return "aws_resource_exists does not support service '" + service + "'";
    }
    if (!HasString(params["check"], it->second.c_str())) {
        return "aws_resource_exists for " + service + " requires check." + it->second;
    }
    return {};
}

std::string InfraCliImage::ValidateCheck(const core::CheckSpec& check, const core::TestSpec& spec) const {
    const auto& params = check.params;
    const auto mode = ModeOr(spec, kTerraformMode);
    if (check.kind == "aws_resource_exists") {
        return ValidateAwsResourceCheck(params);
    }
    if (check.kind == "resource_exists") {
        if (mode != kTerraformMode) {
            return "resource_exists applies to terraform mode only";
        }
        if (!HasString(params, "resource_type")) {
            return "resource_exists requires 'resource_type'";
        }
        if (params.contains("resource_name") && !params["resource_name"].is_string()) {
            return "resource_name must be a string";
        }
        return {};
    }
    if (check.kind == "service_available") {
        if (mode != kAwsCliMode) {
            return "service_available applies to aws-cli mode only";
        }
        return HasString(params, "service") ? std::string() : "service_available requires 'service'";
    }
    return "unknown infra-cli check kind '" + check.kind + "'";
}

std::vector<std::string> InfraCliImage::ValidateOptions(const core::TestSpec& spec) const {
    if (spec.options.contains("mode") && !spec.options["mode"].is_string()) {
        return {"options.mode must be a string"};
    }
    const auto mode = ModeOr(spec, kTerraformMode);
    if (mode != kTerraformMode && mode != kAwsCliMode) {
        return {"options.mode must be 'terraform' or 'aws-cli'"};
    }
    return {};
}

void InfraCliImage::AddMounts(const core::TestSpec& spec, PreparedExecution& prepared) const {
    prepared.env["SANDGRADE_MODE"] = ModeOr(spec, kTerraformMode);
}

}  // namespace sandgrade::images
