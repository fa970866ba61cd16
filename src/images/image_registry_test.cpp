#include "images/image_registry.hpp"

#include <filesystem>
#include <fstream>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "images/data_analysis_image.hpp"
#include "images/infra_cli_image.hpp"
#include "images/render_script_image.hpp"
#include "sandbox/staging_area.hpp"
#include "utils/common.hpp"

namespace {

namespace fs = std::filesystem;
using namespace sandgrade::images;  // NOLINT
using sandgrade::core::CheckSpec;
using sandgrade::core::TestSpec;
using sandgrade::core::Track;
using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::SizeIs;

TestSpec SpecWith(CheckSpec check) {
    TestSpec spec{};
    spec.checks.push_back(std::move(check));
    return spec;
}

fs::path TestRoot() {
    return fs::temp_directory_path() / ("sandgrade-images-test-" + sandgrade::utils::RandomHex());
}

TEST(ImageRegistryTest, DefaultsCoverEveryTrack) {
    const auto registry = ImageRegistry::FromConfig({});
    for (const auto track : sandgrade::core::AllTracks()) {
        ASSERT_TRUE(registry.Has(track));
        EXPECT_EQ(registry.Get(track)->GetTrack(), track);
    }
    EXPECT_THAT(registry.List(), SizeIs(3));
    EXPECT_EQ(registry.Get(Track::kRenderScript)->ImageRef(), RenderScriptImage::kDefaultImage);
    EXPECT_EQ(registry.Get(Track::kRenderScript)->Schema().result_path, "/sandbox/output/result.json");
}

TEST(ImageRegistryTest, ConfigOverridesImageAndCommand) {
    sandgrade::config::EngineConfig config{};
    config.images.data_analysis.image = "registry.local/data:9";
    config.images.data_analysis.command = {"python3", "/srv/run.py", "{source}"};
    const auto registry = ImageRegistry::FromConfig(config);
    const auto* image = dynamic_cast<const TrackImage*>(registry.Get(Track::kDataAnalysis));
    ASSERT_NE(image, nullptr);
    EXPECT_EQ(image->ImageRef(), "registry.local/data:9");
    EXPECT_THAT(image->Command(), ElementsAre("python3", "/srv/run.py", "{source}"));
}

TEST(ImageRegistryTest, EmptyRegistryHasNoImages) {
    ImageRegistry registry;
    EXPECT_FALSE(registry.Has(Track::kInfraCli));
    EXPECT_EQ(registry.Get(Track::kInfraCli), nullptr);
}

TEST(RenderScriptImageTest, ValidatesSelectorChecks) {
    RenderScriptImage image;
    EXPECT_THAT(image.ValidateSpec(SpecWith({"h1", 1, "element_exists", {{"selector", "h1"}}})), IsEmpty());
    EXPECT_THAT(image.ValidateSpec(SpecWith({"runs", 1, "script_runs", nlohmann::json::object()})), IsEmpty());
    EXPECT_THAT(image.ValidateSpec(SpecWith({"items", 1, "selector_count", {{"selector", "li"}, {"min", 3}}})),
                IsEmpty());
    EXPECT_THAT(image.ValidateSpec(SpecWith({"h1", 1, "element_exists", nlohmann::json::object()})),
                ElementsAre(HasSubstr("selector")));
    EXPECT_THAT(image.ValidateSpec(SpecWith({"t", 1, "text_contains", {{"selector", "p"}}})),
                ElementsAre(HasSubstr("'text'")));
    EXPECT_THAT(image.ValidateSpec(SpecWith({"x", 1, "pixel_match", {{"selector", "p"}}})),
                ElementsAre(HasSubstr("unknown render-script check kind")));
}

TEST(DataAnalysisImageTest, ValidatesPythonChecks) {
    DataAnalysisImage image;
    EXPECT_THAT(image.ValidateSpec(SpecWith({"mean", 2, "value_check", {{"variable", "mean"}, {"expected", 4.5}}})),
                IsEmpty());
    EXPECT_THAT(image.ValidateSpec(SpecWith({"df", 1, "dataframe_shape", {{"dataframe", "df"}, {"shape", {10, 3}}}})),
                IsEmpty());
    EXPECT_THAT(image.ValidateSpec(SpecWith({"default df", 1, "dataframe_shape", {{"shape", {10, 3}}}})), IsEmpty());
    EXPECT_THAT(image.ValidateSpec(SpecWith({"positive", 1, "custom_check", {{"check", "df['a'].min() > 0"}}})),
                IsEmpty());
    EXPECT_THAT(image.ValidateSpec(SpecWith({"mean", 1, "value_check", {{"variable", "mean"}}})),
                ElementsAre(HasSubstr("expected")));
    EXPECT_THAT(image.ValidateSpec(SpecWith({"mean", 1, "value_check",
                                             {{"variable", "mean"}, {"expected", 1}, {"tolerance", -1}}})),
                ElementsAre(HasSubstr("tolerance")));
    EXPECT_THAT(image.ValidateSpec(SpecWith({"df", 1, "dataframe_shape", {{"shape", {10}}}})),
                ElementsAre(HasSubstr("[rows, columns]")));
    EXPECT_THAT(image.ValidateSpec(SpecWith({"rows", 1, "row_count", {{"expected", 3}}})),
                ElementsAre(HasSubstr("unknown python check kind")));
}

TEST(DataAnalysisImageTest, SqlModeUsesResultSetChecks) {
    DataAnalysisImage image;
    TestSpec spec{};
    spec.options["mode"] = "sql";
    spec.options["setupSql"] = "CREATE TABLE t(a INT); INSERT INTO t VALUES (1), (2);";
    spec.checks.push_back({"rows", 1, "row_count", {{"expected", 2}}});
    spec.checks.push_back({"column", 1, "column_exists", {{"column", "a"}}});
    spec.checks.push_back({"value", 1, "value_in_result", {{"value", 2}, {"column", "a"}}});
    spec.checks.push_back({"anywhere", 1, "value_in_result", {{"value", "x"}}});
    EXPECT_THAT(image.ValidateSpec(spec), IsEmpty());

    spec.checks.push_back({"var", 1, "variable_exists", {{"variable", "x"}}});
    spec.checks.push_back({"negative", 1, "row_count", {{"expected", -1}}});
    EXPECT_THAT(image.ValidateSpec(spec),
                ElementsAre(HasSubstr("unknown sql check kind"), HasSubstr("non-negative")));

    TestSpec python{};
    python.checks.push_back({"var", 1, "variable_exists", {{"variable", "x"}}});
    python.options["setupSql"] = "SELECT 1";
    EXPECT_THAT(image.ValidateSpec(python), ElementsAre(HasSubstr("sql mode only")));
    python.options = {{"mode", "spark"}};
    EXPECT_THAT(image.ValidateSpec(python), Contains(HasSubstr("options.mode")));
}

TEST(DataAnalysisImageTest, NotebookModeUsesCellChecks) {
    DataAnalysisImage image;
    TestSpec spec{};
    spec.options["mode"] = "jupyter";
    spec.checks.push_back({"first", 1, "cell_executed", {{"cell", 0}}});
    spec.checks.push_back({"plot", 1, "output_contains", {{"text", "Figure"}}});
    EXPECT_THAT(image.ValidateSpec(spec), IsEmpty());
    spec.checks.push_back({"bad", 1, "cell_executed", {{"cell", "0"}}});
    EXPECT_THAT(image.ValidateSpec(spec), ElementsAre(HasSubstr("'cell'")));
}

TEST(DataAnalysisImageTest, SqlDatabaseIsMountedFromDatasets) {
    const auto root = TestRoot();
    fs::create_directories(root / "datasets");
    { std::ofstream(root / "datasets" / "shop.db") << "sqlite"; }
    DataAnalysisImage image(root / "datasets");
    auto spec = SpecWith({"rows", 1, "row_count", {{"expected", 5}}});
    spec.options["mode"] = "sql";
    spec.options["database"] = "shop.db";
    EXPECT_THAT(image.ValidateSpec(spec), IsEmpty());
    {
        sandgrade::sandbox::StagingArea staging(root / "staging");
        const auto prepared = image.Prepare(staging, "SELECT * FROM orders", spec);
        EXPECT_EQ(prepared.command.back(), "/sandbox/input/query.sql");
        EXPECT_EQ(prepared.env.at("SANDGRADE_MODE"), "sql");
        EXPECT_EQ(prepared.env.at("SANDGRADE_DATABASE"), "/datasets/shop.db");
        ASSERT_THAT(prepared.mounts, SizeIs(3));
        EXPECT_TRUE(prepared.mounts[2].read_only);
    }
    spec.options["database"] = "../shop.db";
    EXPECT_THAT(image.ValidateSpec(spec), ElementsAre(HasSubstr("plain file name")));
    fs::remove_all(root);
}

TEST(DataAnalysisImageTest, DatasetMustBeKnownPlainName) {
    const auto root = TestRoot();
    fs::create_directories(root);
    { std::ofstream(root / "sales.csv") << "a,b\n1,2\n"; }
    DataAnalysisImage image(root);

    auto spec = SpecWith({"df", 1, "variable_exists", {{"variable", "df"}}});
    spec.options["dataset"] = "sales.csv";
    EXPECT_THAT(image.ValidateSpec(spec), IsEmpty());
    spec.options["dataset"] = "../etc/passwd";
    EXPECT_THAT(image.ValidateSpec(spec), ElementsAre(HasSubstr("plain file name")));
    spec.options["dataset"] = "missing.csv";
    EXPECT_THAT(image.ValidateSpec(spec), ElementsAre(HasSubstr("not found")));

    DataAnalysisImage unconfigured;
    spec.options["dataset"] = "sales.csv";
    EXPECT_THAT(unconfigured.ValidateSpec(spec), ElementsAre(HasSubstr("no datasets directory")));
    fs::remove_all(root);
}

TEST(DataAnalysisImageTest, PrepareMountsDatasetReadOnly) {
    const auto root = TestRoot();
    fs::create_directories(root / "datasets");
    { std::ofstream(root / "datasets" / "sales.csv") << "a\n1\n"; }
    DataAnalysisImage image(root / "datasets");
    auto spec = SpecWith({"df", 1, "variable_exists", {{"variable", "df"}}});
    spec.options["dataset"] = "sales.csv";
    {
        sandgrade::sandbox::StagingArea staging(root / "staging");
        const auto prepared = image.Prepare(staging, "import pandas", spec);
        EXPECT_THAT(prepared.command, ElementsAre("python3", "/opt/reporter/data_reporter.py",
                                                  "/sandbox/input/analysis.py"));
        ASSERT_THAT(prepared.mounts, SizeIs(3));
        EXPECT_EQ(prepared.mounts[2].container_path, "/datasets/sales.csv");
        EXPECT_TRUE(prepared.mounts[2].read_only);
        EXPECT_EQ(prepared.env.at("SANDGRADE_DATASET"), "/datasets/sales.csv");
    }
    fs::remove_all(root);
}

TEST(InfraCliImageTest, ModeSelectsSourceFile) {
    const auto root = TestRoot();
    InfraCliImage image;
    auto spec = SpecWith({"bucket", 1, "resource_exists", {{"resource_type", "aws_s3_bucket"}}});
    {
        sandgrade::sandbox::StagingArea staging(root);
        auto prepared = image.Prepare(staging, "resource \"aws_s3_bucket\" \"site\" {}", spec);
        EXPECT_EQ(prepared.command.back(), "/sandbox/input/main.tf");
        EXPECT_EQ(prepared.env.at("SANDGRADE_MODE"), "terraform");
        EXPECT_TRUE(fs::exists(staging.InputDir() / "main.tf"));
        EXPECT_TRUE(fs::exists(staging.InputDir() / "spec.json"));

        spec.options["mode"] = "aws-cli";
        prepared = image.Prepare(staging, "aws s3 mb s3://site", spec);
        EXPECT_EQ(prepared.command.back(), "/sandbox/input/commands.sh");
        EXPECT_EQ(prepared.env.at("SANDGRADE_SOURCE"), "/sandbox/input/commands.sh");
    }
    spec.options["mode"] = "pulumi";
    EXPECT_THAT(image.ValidateSpec(spec), Contains(HasSubstr("options.mode")));
    fs::remove_all(root);
}

TEST(InfraCliImageTest, TerraformChecksUseResourceTypeAndName) {
    InfraCliImage image;
    EXPECT_THAT(image.ValidateSpec(SpecWith({"bucket", 1, "resource_exists", {{"resource_type", "aws_s3_bucket"}}})),
                IsEmpty());
    EXPECT_THAT(image.ValidateSpec(SpecWith({"named", 1, "resource_exists",
                                             {{"resource_type", "aws_s3_bucket"}, {"resource_name", "site"}}})),
                IsEmpty());
    EXPECT_THAT(image.ValidateSpec(SpecWith({"table", 1, "aws_resource_exists",
                                             {{"service", "dynamodb"}, {"check", {{"table_name", "orders"}}}}})),
                IsEmpty());
    EXPECT_THAT(image.ValidateSpec(SpecWith({"old", 1, "resource_exists", {{"resource", "aws_s3_bucket.site"}}})),
                ElementsAre(HasSubstr("resource_type")));
    EXPECT_THAT(image.ValidateSpec(SpecWith({"svc", 1, "service_available", {{"service", "s3"}}})),
                ElementsAre(HasSubstr("aws-cli mode only")));
}

TEST(InfraCliImageTest, AwsCliChecksNameServiceAndResource) {
    InfraCliImage image;
    TestSpec spec{};
    spec.options["mode"] = "aws-cli";
    spec.checks.push_back({"s3 up", 1, "service_available", {{"service", "s3"}}});
    spec.checks.push_back({"bucket", 2, "aws_resource_exists",
                           {{"service", "s3"}, {"check", {{"bucket_name", "site-assets"}}}}});
    spec.checks.push_back({"fn", 2, "aws_resource_exists",
                           {{"service", "lambda"}, {"check", {{"function_name", "resize"}}}}});
    EXPECT_THAT(image.ValidateSpec(spec), IsEmpty());

    spec.checks.push_back({"queue", 1, "aws_resource_exists", {{"service", "sqs"}, {"check", {{"queue", "q"}}}}});
    spec.checks.push_back({"table", 1, "aws_resource_exists", {{"service", "dynamodb"}, {"check", {{"name", "t"}}}}});
    spec.checks.push_back({"tf", 1, "resource_exists", {{"resource_type", "aws_s3_bucket"}}});
    EXPECT_THAT(image.ValidateSpec(spec),
                ElementsAre(HasSubstr("service 'sqs'"), HasSubstr("check.table_name"), HasSubstr("terraform mode only")));
}

TEST(InfraCliImageTest, PrepareMountsOutputWritable) {
    const auto root = TestRoot();
    InfraCliImage image;
    {
        sandgrade::sandbox::StagingArea staging(root);
        const auto prepared = image.Prepare(
            staging, "x", SpecWith({"n", 1, "resource_exists", {{"resource_type", "aws_instance"}}}));
        ASSERT_THAT(prepared.mounts, SizeIs(2));
        EXPECT_EQ(prepared.mounts[0].container_path, kInputDir);
        EXPECT_TRUE(prepared.mounts[0].read_only);
        EXPECT_EQ(prepared.mounts[1].container_path, kOutputDir);
        EXPECT_FALSE(prepared.mounts[1].read_only);
    }
    fs::remove_all(root);
}

}  // namespace
