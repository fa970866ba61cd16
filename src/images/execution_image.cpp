#include "images/execution_image.hpp"

namespace sandgrade::images {

TrackImage::TrackImage(core::Track track,
                       std::string image_ref,
                       std::vector<std::string> command)
    : track_(track)
    , image_ref_(std::move(image_ref))
    , command_(std::move(command)) {
    schema_.result_path = std::string(kOutputDir) + "/" + kResultFileName;
}

std::vector<std::string> TrackImage::ValidateSpec(const core::TestSpec& spec) const {
    std::vector<std::string> problems;
    for (const auto& check : spec.checks) {
        auto problem = ValidateCheck(check, spec);
        if (!problem.empty()) {
            problems.push_back("check '" + check.name + "': " + problem);
        }
    }
    auto option_problems = ValidateOptions(spec);
    problems.insert(problems.end(), option_problems.begin(), option_problems.end());
    return problems;
}

PreparedExecution TrackImage::Prepare(sandbox::StagingArea& staging,
                                      const std::string& source,
                                      const core::TestSpec& spec) const {
    const auto source_name = SourceFileName(spec);
    staging.WriteInput(source_name, source);
    staging.WriteInput(kSpecFileName, nlohmann::json(spec).dump());

    PreparedExecution prepared{};
    const auto source_path = std::string(kInputDir) + "/" + source_name;
    for (const auto& arg : command_) {
        prepared.command.push_back(arg == kSourcePlaceholder ? source_path : arg);
    }
    prepared.mounts.push_back({staging.InputDir().string(), kInputDir, true});
    prepared.mounts.push_back({staging.OutputDir().string(), kOutputDir, false});
    prepared.env["SANDGRADE_TRACK"] = core::ToString(track_);
    prepared.env["SANDGRADE_SOURCE"] = source_path;
    prepared.env["SANDGRADE_SPEC"] = std::string(kInputDir) + "/" + kSpecFileName;
    prepared.env["SANDGRADE_RESULT"] = schema_.result_path;
    AddMounts(spec, prepared);
    return prepared;
}

std::vector<std::string> TrackImage::ValidateOptions(const core::TestSpec&) const {
    return {};
}

void TrackImage::AddMounts(const core::TestSpec&, PreparedExecution&) const {}

bool TrackImage::HasString(const nlohmann::json& params, const char* key) {
    return params.contains(key) && params[key].is_string() && !params[key].get<std::string>().empty();
}

bool TrackImage::HasNumber(const nlohmann::json& params, const char* key) {
    return params.contains(key) && params[key].is_number();
}

bool TrackImage::HasInteger(const nlohmann::json& params, const char* key) {
    return params.contains(key) && params[key].is_number_integer();
}

bool TrackImage::IsPlainFileName(const std::string& name) {
    return !name.empty() && name != "." && name != ".." &&
           name.find('/') == std::string::npos && name.find('\\') == std::string::npos;
}

std::string TrackImage::ModeOr(const core::TestSpec& spec, const char* fallback) {
    if (spec.options.contains("mode") && spec.options["mode"].is_string()) {
        return spec.options["mode"].get<std::string>();
    }
    return fallback;
}

}  // namespace sandgrade::images
