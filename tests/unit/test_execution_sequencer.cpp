#include <filesystem>
#include <string>
#include <gtest/gtest.h>
#include "core/config/environment.hpp"
#include "core/errors/popper_errors.hpp"
#include "fakes.hpp"
#include "runtime/execution_sequencer.hpp"

namespace {

using popper::core::config::EnvironmentConfig;
using popper::core::errors::get_error;
using popper::core::errors::get_value;
using popper::core::errors::is_error;
using popper::fakes::FakeLocator;
using popper::fakes::RecordingEngine;
using popper::protocol::RunConfig;
using popper::protocol::RunOutcome;
using popper::runtime::EngineRequest;
using popper::runtime::ExecutionSequencer;

RunConfig make_config() {
    RunConfig config;
    config.workspace = "/workspace";
    return config;
}

// Fails every request whose action (or workflow, for full runs) matches `target`.
auto fail_on(const std::string& target, int status) {
    return [target, status](const EngineRequest& request) {
        const std::string name = request.action.has_value() ? request.action.value()
                                                             : request.workflow.string();
        if (name == target) {
            return RunOutcome::failure(status, name);
        }
        return RunOutcome::success();
    };
}

TEST(ExecutionSequencerTest, RunsDefaultWorkflow) {
    RecordingEngine engine;
    FakeLocator locator;
    EnvironmentConfig environment;
    ExecutionSequencer sequencer(engine, locator, environment);

    auto result = sequencer.run(make_config());
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).succeeded());
    ASSERT_EQ(engine.calls.size(), 1u);
    EXPECT_EQ(engine.calls[0].workflow, std::filesystem::path("/workspace/main.workflow"));
    EXPECT_FALSE(engine.calls[0].action.has_value());
}

TEST(ExecutionSequencerTest, ForwardsActionAndFlags) {
    RecordingEngine engine;
    FakeLocator locator;
    EnvironmentConfig environment;
    ExecutionSequencer sequencer(engine, locator, environment);

    RunConfig config = make_config();
    config.wfile = "ci/build.workflow";
    config.action = "compile";
    config.with_dependencies = true;
    config.parallel = true;
    config.skip_pull = true;

    auto result = sequencer.run(config);
    ASSERT_FALSE(is_error(result));
    ASSERT_EQ(engine.calls.size(), 1u);
    const auto& request = engine.calls[0];
    EXPECT_EQ(request.workflow, std::filesystem::path("ci/build.workflow"));
    EXPECT_EQ(request.action.value(), "compile");
    EXPECT_TRUE(request.with_dependencies);
    EXPECT_TRUE(request.parallel);
    EXPECT_TRUE(request.skip_pull);
    EXPECT_EQ(request.workspace, std::filesystem::path("/workspace"));
}

TEST(ExecutionSequencerTest, MissingWorkflowIsFatalBeforeExecution) {
    RecordingEngine engine;
    FakeLocator locator;
    locator.default_exists = false;
    EnvironmentConfig environment;
    environment.pre_workflow = "/ci/pre.workflow";
    ExecutionSequencer sequencer(engine, locator, environment);

    auto result = sequencer.run(make_config());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "workflow_not_found");
    EXPECT_TRUE(engine.calls.empty());
}

TEST(ExecutionSequencerTest, MissingPreWorkflowIsFatalBeforeExecution) {
    RecordingEngine engine;
    FakeLocator locator;
    locator.missing = {"/ci/pre.workflow"};
    EnvironmentConfig environment;
    environment.pre_workflow = "/ci/pre.workflow";
    ExecutionSequencer sequencer(engine, locator, environment);

    auto result = sequencer.run(make_config());
    ASSERT_TRUE(is_error(result));
    EXPECT_TRUE(engine.calls.empty());
}

TEST(ExecutionSequencerTest, PreAndPostRunInFullAroundMain) {
    RecordingEngine engine;
    FakeLocator locator;
    EnvironmentConfig environment;
    environment.pre_workflow = "/ci/pre.workflow";
    environment.post_workflow = "/ci/post.workflow";
    ExecutionSequencer sequencer(engine, locator, environment);

    RunConfig config = make_config();
    config.action = "build";
    config.with_dependencies = true;
    config.reuse = true;

    auto result = sequencer.run(config);
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).succeeded());
    ASSERT_EQ(engine.calls.size(), 3u);

    EXPECT_EQ(engine.calls[0].workflow, std::filesystem::path("/ci/pre.workflow"));
    EXPECT_FALSE(engine.calls[0].action.has_value());
    EXPECT_FALSE(engine.calls[0].with_dependencies);
    EXPECT_TRUE(engine.calls[0].reuse);

    EXPECT_EQ(engine.calls[1].action.value(), "build");
    EXPECT_TRUE(engine.calls[1].with_dependencies);

    EXPECT_EQ(engine.calls[2].workflow, std::filesystem::path("/ci/post.workflow"));
    EXPECT_FALSE(engine.calls[2].action.has_value());
}

TEST(ExecutionSequencerTest, PreFailureSkipsMainAndPost) {
    RecordingEngine engine;
    engine.respond = fail_on("/ci/pre.workflow", 4);
    FakeLocator locator;
    EnvironmentConfig environment;
    environment.pre_workflow = "/ci/pre.workflow";
    environment.post_workflow = "/ci/post.workflow";
    ExecutionSequencer sequencer(engine, locator, environment);

    auto result = sequencer.run(make_config());
    ASSERT_FALSE(is_error(result));
    const auto& outcome = get_value(result);
    EXPECT_FALSE(outcome.succeeded());
    EXPECT_EQ(outcome.exit_status, 4);
    EXPECT_EQ(outcome.failed_target, "/ci/pre.workflow");
    EXPECT_EQ(engine.calls.size(), 1u);
}

TEST(ExecutionSequencerTest, PostSkippedWhenMainFails) {
    RecordingEngine engine;
    engine.respond = fail_on("/workspace/main.workflow", 1);
    FakeLocator locator;
    EnvironmentConfig environment;
    environment.post_workflow = "/ci/post.workflow";
    ExecutionSequencer sequencer(engine, locator, environment);

    auto result = sequencer.run(make_config());
    ASSERT_FALSE(is_error(result));
    EXPECT_FALSE(get_value(result).succeeded());
    ASSERT_EQ(engine.calls.size(), 1u);
    EXPECT_EQ(engine.calls[0].workflow, std::filesystem::path("/workspace/main.workflow"));
}

TEST(ExecutionSequencerTest, FailureWithoutFallbackPropagatesStatus) {
    RecordingEngine engine;
    engine.respond = fail_on("build", 7);
    FakeLocator locator;
    EnvironmentConfig environment;
    ExecutionSequencer sequencer(engine, locator, environment);

    RunConfig config = make_config();
    config.action = "build";
    auto result = sequencer.run(config);
    ASSERT_FALSE(is_error(result));
    const auto& outcome = get_value(result);
    EXPECT_FALSE(outcome.succeeded());
    EXPECT_EQ(outcome.exit_status, 7);
    EXPECT_EQ(outcome.failed_target, "build");
    EXPECT_FALSE(outcome.from_fallback);
    EXPECT_EQ(engine.calls.size(), 1u);
}

TEST(ExecutionSequencerTest, FallbackSuccessReplacesFailure) {
    RecordingEngine engine;
    engine.respond = fail_on("/workspace/main.workflow", 2);
    FakeLocator locator;
    EnvironmentConfig environment;
    ExecutionSequencer sequencer(engine, locator, environment);

    RunConfig config = make_config();
    config.skip = {"lint"};
    config.on_failure = "cleanup";

    auto result = sequencer.run(config);
    ASSERT_FALSE(is_error(result));
    const auto& outcome = get_value(result);
    EXPECT_TRUE(outcome.succeeded());
    EXPECT_TRUE(outcome.from_fallback);
    ASSERT_EQ(engine.calls.size(), 2u);
    EXPECT_EQ(engine.calls[1].workflow, std::filesystem::path("/workspace/main.workflow"));
    EXPECT_EQ(engine.calls[1].action.value(), "cleanup");
    EXPECT_TRUE(engine.calls[1].skip.empty());
}

TEST(ExecutionSequencerTest, FallbackStatusWinsOverOriginalFailure) {
    RecordingEngine engine;
    engine.respond = [](const EngineRequest& request) {
        if (request.action == std::optional<std::string>("cleanup")) {
            return RunOutcome::failure(9, "cleanup");
        }
        return RunOutcome::failure(3, request.workflow.string());
    };
    FakeLocator locator;
    EnvironmentConfig environment;
    ExecutionSequencer sequencer(engine, locator, environment);

    RunConfig config = make_config();
    config.on_failure = "cleanup";

    auto result = sequencer.run(config);
    ASSERT_FALSE(is_error(result));
    const auto& outcome = get_value(result);
    EXPECT_FALSE(outcome.succeeded());
    EXPECT_EQ(outcome.exit_status, 9);
    EXPECT_EQ(outcome.failed_target, "cleanup");
    EXPECT_EQ(engine.calls.size(), 2u);
}

TEST(ExecutionSequencerTest, PostFailureTriggersFallbackOnMainWorkflow) {
    RecordingEngine engine;
    engine.respond = fail_on("/ci/post.workflow", 5);
    FakeLocator locator;
    EnvironmentConfig environment;
    environment.post_workflow = "/ci/post.workflow";
    ExecutionSequencer sequencer(engine, locator, environment);

    RunConfig config = make_config();
    config.on_failure = "cleanup";

    auto result = sequencer.run(config);
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).succeeded());
    ASSERT_EQ(engine.calls.size(), 3u);
    EXPECT_EQ(engine.calls[2].workflow, std::filesystem::path("/workspace/main.workflow"));
    EXPECT_EQ(engine.calls[2].action.value(), "cleanup");
}

TEST(ExecutionSequencerTest, DryRunNeverCallsEngine) {
    RecordingEngine engine;
    FakeLocator locator;
    EnvironmentConfig environment;
    environment.pre_workflow = "/ci/pre.workflow";
    environment.post_workflow = "/ci/post.workflow";
    ExecutionSequencer sequencer(engine, locator, environment);

    RunConfig config = make_config();
    config.dry_run = true;
    config.on_failure = "cleanup";

    auto result = sequencer.run(config);
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).succeeded());
    EXPECT_TRUE(engine.calls.empty());
}

}  // namespace
