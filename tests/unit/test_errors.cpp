#include <gtest/gtest.h>
#include "core/errors/popper_errors.hpp"

using namespace popper::core::errors;

// A dummy function to simulate a lookup failing
Result<std::string> simulate_resolve_workflow(bool should_fail) {
    if (should_fail) {
        return PopperError{ErrorCategory::Input, "File main.workflow not found.", "workflow_not_found"};
    }
    return std::string("main.workflow");
}

TEST(ErrorModelTest, HandlesSuccess) {
    auto result = simulate_resolve_workflow(false);

    EXPECT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "main.workflow");
}

TEST(ErrorModelTest, HandlesFailure) {
    auto result = simulate_resolve_workflow(true);

    EXPECT_TRUE(is_error(result));

    auto error = get_error(result);
    EXPECT_EQ(error.category, ErrorCategory::Input);
    EXPECT_EQ(error.code, "workflow_not_found");
    EXPECT_TRUE(error.hint.empty());
}

TEST(ErrorModelTest, ExitCodeFollowsCategory) {
    EXPECT_EQ(exit_code_for(PopperError{ErrorCategory::Input, "bad flags"}), kExitInputError);
    EXPECT_EQ(exit_code_for(PopperError{ErrorCategory::Scm, "no git"}), kExitInputError);
    EXPECT_EQ(exit_code_for(PopperError{ErrorCategory::Internal, "fork"}), kExitInternalError);
}
