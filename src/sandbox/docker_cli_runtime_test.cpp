#include "sandbox/docker_cli_runtime.hpp"

#include <algorithm>
#include <cstdlib>
#include <string>

#include "config/config_schema.hpp"
#include "core/errors.hpp"
#include "dispatcher/execution_dispatcher.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "images/image_registry.hpp"

namespace {

using namespace sandgrade::sandbox;  // NOLINT
using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::Not;

// Value following flag, or empty when the flag is absent.
std::string FlagValue(const std::vector<std::string>& args, const std::string& flag) {
    auto it = std::find(args.begin(), args.end(), flag);
    if (it == args.end() || ++it == args.end()) {
        return {};
    }
    return *it;
}

ContainerSpec SampleSpec() {
    ContainerSpec spec{};
    spec.name = "sandgrade-abc";
    spec.image = "sandgrade/render-script:1";
    spec.command = {"node", "/opt/reporter/render-reporter.js", "/sandbox/input/index.html"};
    spec.mounts.push_back({"/tmp/stage/input", "/sandbox/input", true});
    spec.mounts.push_back({"/tmp/stage/output", "/sandbox/output", false});
    spec.labels[kManagedLabel] = "true";
    spec.working_dir = "/sandbox/input";
    spec.policy.memory_bytes = 256LL * 1024 * 1024;
    spec.policy.cpus = 0.25;
    return spec;
}

TEST(DockerCliRuntimeTest, CreateArgsCarryEveryLimit) {
    const auto args = DockerCliRuntime::BuildCreateArgs(SampleSpec());
    ASSERT_FALSE(args.empty());
    EXPECT_EQ(args.front(), "create");
    EXPECT_EQ(FlagValue(args, "--pull"), "never");
    EXPECT_EQ(FlagValue(args, "--memory"), "268435456");
    EXPECT_EQ(FlagValue(args, "--memory-swap"), "268435456");
    EXPECT_EQ(FlagValue(args, "--cpu-period"), "100000");
    EXPECT_EQ(FlagValue(args, "--cpu-quota"), "25000");
    EXPECT_EQ(FlagValue(args, "--pids-limit"), "128");
    EXPECT_EQ(FlagValue(args, "--user"), "sandbox:sandbox");
    EXPECT_EQ(FlagValue(args, "--network"), "none");
    EXPECT_EQ(FlagValue(args, "--cap-drop"), "ALL");
    EXPECT_EQ(FlagValue(args, "--security-opt"), "no-new-privileges:true");
    EXPECT_THAT(args, Contains("--read-only"));
    EXPECT_THAT(FlagValue(args, "--tmpfs"), HasSubstr("/tmp:rw,noexec"));
    EXPECT_EQ(FlagValue(args, "--label"), "sandgrade.managed=true");
    EXPECT_EQ(FlagValue(args, "--workdir"), "/sandbox/input");
}

TEST(DockerCliRuntimeTest, CreateArgsMountInputReadOnly) {
    const auto args = DockerCliRuntime::BuildCreateArgs(SampleSpec());
    EXPECT_THAT(args, Contains("type=bind,source=/tmp/stage/input,target=/sandbox/input,readonly"));
    EXPECT_THAT(args, Contains("type=bind,source=/tmp/stage/output,target=/sandbox/output"));
}

TEST(DockerCliRuntimeTest, CreateArgsEndWithImageAndCommand) {
    const auto args = DockerCliRuntime::BuildCreateArgs(SampleSpec());
    ASSERT_GE(args.size(), 4u);
    const std::vector<std::string> tail(args.end() - 4, args.end());
    EXPECT_THAT(tail, ElementsAre("sandgrade/render-script:1", "node",
                                  "/opt/reporter/render-reporter.js", "/sandbox/input/index.html"));
}

TEST(DockerCliRuntimeTest, MissingBinaryIsRuntimeFault) {
    DockerCliRuntime runtime("/nonexistent/docker", std::chrono::seconds(2));
    EXPECT_FALSE(runtime.Ping());
    EXPECT_THROW(runtime.ImageExists("alpine"), sandgrade::core::RuntimeFault);
    EXPECT_THROW(runtime.Create(SampleSpec()), sandgrade::core::RuntimeFault);
}

// Runs real containers; needs a daemon and the track images.
class DockerIsolationTest : public ::testing::Test {
protected:
    void SetUp() override {
        const char* enabled = std::getenv("SANDGRADE_DOCKER_TESTS");
        if (enabled == nullptr || std::string(enabled) != "1") {
            GTEST_SKIP() << "set SANDGRADE_DOCKER_TESTS=1 to run against a docker daemon";
        }
        if (!runtime_.Ping()) {
            GTEST_SKIP() << "docker daemon unreachable";
        }
    }

    DockerCliRuntime runtime_;
};

TEST_F(DockerIsolationTest, ContainerHasNoNetworkAndReadOnlyRoot) {
    const char* image = std::getenv("SANDGRADE_TEST_IMAGE");
    const std::string test_image = image ? image : "alpine:3";
    if (!runtime_.ImageExists(test_image)) {
        GTEST_SKIP() << test_image << " not present locally";
    }
    ContainerSpec spec{};
    spec.image = test_image;
    spec.command = {"sh", "-c",
                    "touch /rootfs-check 2>/dev/null && echo rootfs-writable; "
                    "wget -q -T 2 -O- http://1.1.1.1 >/dev/null 2>&1 && echo network-open; "
                    "id -u"};
    spec.policy.user = "65534:65534";
    spec.labels[kManagedLabel] = "true";

    const auto id = runtime_.Create(spec);
    LogChannel logs;
    runtime_.Start(id);
    auto watch = runtime_.Watch(id, logs);
    const auto exit = watch->WaitFor(std::chrono::seconds(30));
    std::string out;
    LogChunk chunk{};
    while (logs.Pop(chunk, std::chrono::milliseconds(500))) {
        out += chunk.data;
    }
    watch.reset();
    EXPECT_TRUE(runtime_.Remove(id));

    ASSERT_TRUE(exit.has_value());
    EXPECT_THAT(out, Not(HasSubstr("rootfs-writable")));
    EXPECT_THAT(out, Not(HasSubstr("network-open")));
    EXPECT_THAT(out, HasSubstr("65534"));
}

TEST_F(DockerIsolationTest, NoManagedContainersAfterTimeout) {
    sandgrade::config::EngineConfig config{};
    config.policy.wall_clock_timeout = std::chrono::milliseconds(1000);
    const auto registry = sandgrade::images::ImageRegistry::FromConfig(config);
    const auto* image = registry.Get(sandgrade::core::Track::kDataAnalysis);
    ASSERT_NE(image, nullptr);
    if (!runtime_.ImageExists(image->ImageRef())) {
        GTEST_SKIP() << image->ImageRef() << " not present locally";
    }
    sandgrade::dispatcher::ExecutionDispatcher dispatcher(config, registry, runtime_);
    const auto before = runtime_.ListManaged().size();

    sandgrade::core::ExecutionRequest request{};
    request.track = "data-analysis";
    request.challenge_id = "docker-timeout";
    request.submitted_source = "while True:\n    pass\n";
    request.test_spec.checks.push_back({"x", 1, "variable_exists", {{"variable", "x"}}});
    const auto result = dispatcher.Execute(request);

    EXPECT_FALSE(result.success);
    EXPECT_TRUE(result.HasError("timeout"));
    EXPECT_EQ(runtime_.ListManaged().size(), before);
}

// Needs the images from docker/build-images.sh.
TEST_F(DockerIsolationTest, RenderScriptImageScoresMarkup) {
    sandgrade::config::EngineConfig config{};
    const auto registry = sandgrade::images::ImageRegistry::FromConfig(config);
    const auto* image = registry.Get(sandgrade::core::Track::kRenderScript);
    ASSERT_NE(image, nullptr);
    if (!runtime_.ImageExists(image->ImageRef())) {
        GTEST_SKIP() << image->ImageRef() << " not present locally";
    }
    sandgrade::dispatcher::ExecutionDispatcher dispatcher(config, registry, runtime_);

    sandgrade::core::ExecutionRequest request{};
    request.track = "render-script";
    request.challenge_id = "docker-render";
    request.submitted_source =
        "<!DOCTYPE html><html><body><main><a href=\"/a\">a</a><a href=\"/b\">b</a></main>"
        "<script>document.querySelector('main').insertAdjacentHTML('beforeend', '<a href=\"/c\">c</a>');"
        "</script></body></html>";
    request.test_spec.checks.push_back({"landmark", 2, "element_exists", {{"selector", "main"}}});
    request.test_spec.checks.push_back({"links", 3, "selector_count", {{"selector", "a"}, {"count", 3}}});
    request.test_spec.checks.push_back({"footer", 1, "element_exists", {{"selector", "footer"}}});
    const auto result = dispatcher.Execute(request);

    EXPECT_FALSE(result.HasError("no_structured_result")) << result.logs;
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.score, 5);
    EXPECT_EQ(result.max_score, 6);
}

TEST_F(DockerIsolationTest, DataAnalysisImageScoresScript) {
    sandgrade::config::EngineConfig config{};
    const auto registry = sandgrade::images::ImageRegistry::FromConfig(config);
    const auto* image = registry.Get(sandgrade::core::Track::kDataAnalysis);
    ASSERT_NE(image, nullptr);
    if (!runtime_.ImageExists(image->ImageRef())) {
        GTEST_SKIP() << image->ImageRef() << " not present locally";
    }
    sandgrade::dispatcher::ExecutionDispatcher dispatcher(config, registry, runtime_);

    sandgrade::core::ExecutionRequest request{};
    request.track = "data-analysis";
    request.challenge_id = "docker-data";
    request.submitted_source = "df = pd.DataFrame({'a': [1, 2, 3]})\nmean = df['a'].mean()\n";
    request.test_spec.checks.push_back({"mean", 2, "value_check", {{"variable", "mean"}, {"expected", 2.0}}});
    request.test_spec.checks.push_back({"shape", 1, "dataframe_shape", {{"shape", {3, 1}}}});
    const auto result = dispatcher.Execute(request);

    EXPECT_TRUE(result.success) << result.logs;
    EXPECT_EQ(result.score, 3);
}

}  // namespace
