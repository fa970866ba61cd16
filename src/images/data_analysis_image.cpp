#include "images/data_analysis_image.hpp"

#include <algorithm>
#include <cstdint>

namespace sandgrade::images {
namespace {

constexpr const char* kPythonMode = "python";
constexpr const char* kSqlMode = "sql";
constexpr const char* kNotebookMode = "jupyter";

}  // namespace

DataAnalysisImage::DataAnalysisImage(std::filesystem::path datasets_dir,
                                     std::string image_ref,
                                     std::vector<std::string> command)
    : TrackImage(core::Track::kDataAnalysis, std::move(image_ref), std::move(command))
    , datasets_dir_(std::move(datasets_dir)) {}

std::vector<std::string> DataAnalysisImage::DefaultCommand() {
    return {"python3", "/opt/reporter/data_reporter.py", kSourcePlaceholder};
}

std::string DataAnalysisImage::SourceFileName(const core::TestSpec& spec) const {
    const auto mode = ModeOr(spec, kPythonMode);
    if (mode == kSqlMode) {
        return "query.sql";
    }
    if (mode == kNotebookMode) {
        return "notebook.ipynb";
    }
    return "analysis.py";
}

std::string DataAnalysisImage::ValidateCheck(const core::CheckSpec& check, const core::TestSpec& spec) const {
    const auto mode = ModeOr(spec, kPythonMode);
    if (mode == kSqlMode) {
        return ValidateSqlCheck(check);
    }
    if (mode == kNotebookMode) {
        return ValidateNotebookCheck(check);
    }
    return ValidatePythonCheck(check);
}

std::string DataAnalysisImage::ValidatePythonCheck(const core::CheckSpec& check) const {
    const auto& params = check.params;
    if (check.kind == "variable_exists") {
        return HasString(params, "variable") ? std::string() : "variable_exists requires 'variable'";
    }
    if (check.kind == "value_check") {
        if (!HasString(params, "variable") || !params.contains("expected") || params["expected"].is_null()) {
            return "value_check requires 'variable' and 'expected'";
        }
        if (params.contains("tolerance") &&
            (!params["tolerance"].is_number() || params["tolerance"].get<double>() < 0.0)) {
            return "tolerance must be a non-negative number";
        }
        return {};
    }
    if (check.kind == "dataframe_shape") {
        if (params.contains("dataframe") && !HasString(params, "dataframe")) {
            return "dataframe must be a variable name";
        }
        const auto& shape = params.contains("shape") ? params["shape"] : nlohmann::json();
        if (!shape.is_array() || shape.size() != 2 || !shape[0].is_number_integer() ||
            !shape[1].is_number_integer()) {
            return "dataframe_shape requires 'shape' as [rows, columns]";
        }
        return {};
    }
    if (check.kind == "custom_check") {
        return HasString(params, "check") ? std::string() : "custom_check requires 'check'";
    }
    return "unknown python check kind '" + check.kind + "'";
}

std::string DataAnalysisImage::ValidateSqlCheck(const core::CheckSpec& check) const {
    const auto& params = check.params;
    if (check.kind == "row_count") {
        if (!HasInteger(params, "expected") || params["expected"].get<std::int64_t>() < 0) {
            return "row_count requires a non-negative integer 'expected'";
        }
        return {};
    }
    if (check.kind == "column_exists") {
        return HasString(params, "column") ? std::string() : "column_exists requires 'column'";
    }
    if (check.kind == "value_in_result") {
        if (!params.contains("value") || params["value"].is_null()) {
            return "value_in_result requires 'value'";
        }
        if (params.contains("column") && !HasString(params, "column")) {
            return "column must be a column name";
        }
        return {};
    }
    return "unknown sql check kind '" + check.kind + "'";
}

std::string DataAnalysisImage::ValidateNotebookCheck(const core::CheckSpec& check) const {
    const auto& params = check.params;
    if (check.kind == "cell_executed") {
        if (!HasInteger(params, "cell") || params["cell"].get<std::int64_t>() < 0) {
            return "cell_executed requires a non-negative integer 'cell'";
        }
        return {};
    }
    if (check.kind == "output_contains") {
        return HasString(params, "text") ? std::string() : "output_contains requires 'text'";
    }
    return "unknown jupyter check kind '" + check.kind + "'";
}

std::string DataAnalysisImage::ValidateDatasetFile(const core::TestSpec& spec, const char* key) const {
    if (!spec.options.contains(key)) {
        return {};
    }
    const auto& value = spec.options[key];
    if (!value.is_string() || !IsPlainFileName(value.get<std::string>())) {
        return std::string("options.") + key + " must be a plain file name";
    }
    if (datasets_dir_.empty()) {
        return std::string("options.") + key + " given but no datasets directory is configured";
    }
    std::error_code ec;
    if (!std::filesystem::is_regular_file(datasets_dir_ / value.get<std::string>(), ec)) {
        return std::string(key) + " '" + value.get<std::string>() + "' not found";
    }
    return {};
}

std::vector<std::string> DataAnalysisImage::ValidateOptions(const core::TestSpec& spec) const {
    std::vector<std::string> problems;
    if (spec.options.contains("mode") && !spec.options["mode"].is_string()) {
        return {"options.mode must be a string"};
    }
    const auto mode = ModeOr(spec, kPythonMode);
    if (mode != kPythonMode && mode != kSqlMode && mode != kNotebookMode) {
        return {"options.mode must be 'python', 'sql' or 'jupyter'"};
    }
    auto problem = ValidateDatasetFile(spec, "dataset");
    if (!problem.empty()) {
        problems.push_back(std::move(problem));
    }
    if (mode == kSqlMode) {
        problem = ValidateDatasetFile(spec, "database");
        if (!problem.empty()) {
            problems.push_back(std::move(problem));
        }
        if (spec.options.contains("setupSql") && !spec.options["setupSql"].is_string()) {
            problems.push_back("options.setupSql must be a string");
        }
    } else if (spec.options.contains("database") || spec.options.contains("setupSql")) {
        problems.push_back("options.database and options.setupSql apply to sql mode only");
    }
    return problems;
}

void DataAnalysisImage::MountDatasetFile(const core::TestSpec& spec, const char* key, const char* env,
                                         PreparedExecution& prepared) const {
    if (!spec.options.contains(key) || !spec.options[key].is_string()) {
        return;
    }
    const auto name = spec.options[key].get<std::string>();
    const auto target = std::string(kDatasetMountDir) + "/" + name;
    const auto mounted = std::any_of(prepared.mounts.begin(), prepared.mounts.end(),
                                     [&target](const sandbox::Mount& mount) {
                                         return mount.container_path == target;
                                     });
    if (!mounted) {
        prepared.mounts.push_back({(datasets_dir_ / name).string(), target, true});
    }
    prepared.env[env] = target;
}

void DataAnalysisImage::AddMounts(const core::TestSpec& spec, PreparedExecution& prepared) const {
    prepared.env["SANDGRADE_MODE"] = ModeOr(spec, kPythonMode);
    MountDatasetFile(spec, "dataset", "SANDGRADE_DATASET", prepared);
    MountDatasetFile(spec, "database", "SANDGRADE_DATABASE", prepared);
}

}  // namespace sandgrade::images
