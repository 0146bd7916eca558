#include <gtest/gtest.h>
#include "runplan/common/plan_errors.hpp"
#include "runplan/common/step_factory.hpp"

using namespace runplan;

// =============================================================================
// Helpers
// =============================================================================

namespace
{

StepDescriptor descriptor(std::initializer_list<std::pair<const std::string, std::optional<std::string>>> fields)
{
    StepDescriptor result;
    result.fields = fields;
    return result;
}

PlanErrorCode error_code_of(const StepDescriptor& desc)
{
    try
    {
        make_step(desc);
    }
    catch (const PlanError& e)
    {
        return e.code();
    }
    ADD_FAILURE() << "Expected PlanError";
    return PlanErrorCode::LoadFailure;
}

} // namespace

// =============================================================================
// Kind inference
// =============================================================================

TEST(StepFactoryTests, BlankData)
{
    EXPECT_EQ(error_code_of(StepDescriptor{}), PlanErrorCode::MissingStepName);
}

TEST(StepFactoryTests, NullName)
{
    EXPECT_EQ(error_code_of(descriptor({{"name", std::nullopt}, {"command", "true"}})),
              PlanErrorCode::MissingStepName);
}

TEST(StepFactoryTests, Command)
{
    Step step = make_step(descriptor({{"name", "name"}, {"command", "/bin/false"}}));
    EXPECT_EQ(step.kind(), StepKind::Command);
    EXPECT_EQ(step.id(), "name");
    const auto& payload = std::get<CommandPayload>(step.payload());
    EXPECT_EQ(payload.command, std::optional<std::string>("/bin/false"));
}

TEST(StepFactoryTests, CommandAndSet)
{
    EXPECT_EQ(error_code_of(descriptor({{"name", "test"}, {"command", "/bin/false"}, {"variable", "testvar"}})),
              PlanErrorCode::AmbiguousStepKind);
}

TEST(StepFactoryTests, Set)
{
    Step step = make_step(descriptor({{"name", "name"}, {"variable", "/bin/false"}, {"default", "12"}}));
    EXPECT_EQ(step.kind(), StepKind::Assignment);
    EXPECT_EQ(step.id(), "name");
    const auto& payload = std::get<AssignmentPayload>(step.payload());
    EXPECT_EQ(payload.variable, std::optional<std::string>("/bin/false"));
    EXPECT_EQ(payload.default_value, "12");
}

TEST(StepFactoryTests, SetWithDefaultOnly)
{
    Step step = make_step(descriptor({{"name", "name"}, {"default", "12"}}));
    EXPECT_EQ(step.kind(), StepKind::Assignment);
    EXPECT_FALSE(std::get<AssignmentPayload>(step.payload()).variable.has_value());
}

TEST(StepFactoryTests, Prompt)
{
    Step step = make_step(descriptor({{"name", "name"}, {"text", "/bin/false"}, {"prompt", "12"}}));
    EXPECT_EQ(step.kind(), StepKind::Confirmation);
    EXPECT_EQ(step.id(), "name");
    const auto& payload = std::get<ConfirmationPayload>(step.payload());
    EXPECT_EQ(payload.text, std::optional<std::string>("/bin/false"));
    EXPECT_EQ(payload.prompt, "12");
}

TEST(StepFactoryTests, EmptyPrompt)
{
    Step step = make_step(descriptor({{"name", "name"}, {"text", "/bin/false"}}));
    EXPECT_EQ(step.kind(), StepKind::Confirmation);
    EXPECT_EQ(std::get<ConfirmationPayload>(step.payload()).prompt, "Done?");
}

TEST(StepFactoryTests, NullPromptKeepsDefault)
{
    Step step = make_step(descriptor({{"name", "name"}, {"prompt", std::nullopt}}));
    EXPECT_EQ(step.kind(), StepKind::Confirmation);
    EXPECT_EQ(std::get<ConfirmationPayload>(step.payload()).prompt, "Done?");
}

TEST(StepFactoryTests, Unknown)
{
    EXPECT_EQ(error_code_of(descriptor({{"name", "test"}})), PlanErrorCode::UnknownStepKind);
}

TEST(StepFactoryTests, PromptAndSet)
{
    EXPECT_EQ(error_code_of(descriptor({{"name", "test"}, {"text", "/bin/false"}, {"variable", "testvar"}})),
              PlanErrorCode::AmbiguousStepKind);
}

TEST(StepFactoryTests, UnknownKey)
{
    EXPECT_EQ(error_code_of(descriptor({{"name", "test"}, {"command", "true"}, {"comand", "typo"}})),
              PlanErrorCode::UnknownStepKey);
}

TEST(StepFactoryTests, PresenceNotValueDecidesKind)
{
    Step step = make_step(descriptor({{"name", "test"}, {"command", std::nullopt}}));
    EXPECT_EQ(step.kind(), StepKind::Command);
    EXPECT_FALSE(std::get<CommandPayload>(step.payload()).command.has_value());
}

TEST(StepFactoryTests, AfterBecomesPredecessors)
{
    StepDescriptor desc = descriptor({{"name", "deploy"}, {"command", "true"}});
    desc.after = {"build", "test", "build"};
    Step step = make_step(desc);
    std::vector<std::string> expected{"build", "test"};
    EXPECT_EQ(step.predecessors(), expected);
    EXPECT_EQ(step.state(), StepState::Pending);
}
