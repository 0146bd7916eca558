#include <gtest/gtest.h>
#include "runplan/common/plan_errors.hpp"
#include "runplan/common/variable_store.hpp"

using namespace runplan;

// =============================================================================
// Declaration and assignment
// =============================================================================

TEST(VariableStoreTests, AddAndReadBack)
{
    VariableStore vars;
    vars.add_variable("test");
    vars.set_value("test", "value");
    EXPECT_TRUE(vars.contains("test"));
    EXPECT_EQ(vars.value("test"), "value");
    EXPECT_EQ(vars.size(), 1u);
}

TEST(VariableStoreTests, SetUndeclaredThrows)
{
    VariableStore vars;
    try
    {
        vars.set_value("test", "value");
        FAIL() << "Expected PlanError";
    }
    catch (const PlanError& e)
    {
        EXPECT_EQ(e.code(), PlanErrorCode::UnknownVariable);
    }
    EXPECT_FALSE(vars.contains("test"));
}

TEST(VariableStoreTests, DuplicateDeclarationThrows)
{
    VariableStore vars;
    vars.add_variable("host", "a");
    try
    {
        vars.add_variable("host", "b");
        FAIL() << "Expected PlanError";
    }
    catch (const PlanError& e)
    {
        EXPECT_EQ(e.code(), PlanErrorCode::DuplicateVariable);
    }
    EXPECT_EQ(vars.value("host"), "a");
}

TEST(VariableStoreTests, NamesKeepDeclarationOrder)
{
    VariableStore vars;
    vars.add_variable("zeta");
    vars.add_variable("alpha");
    vars.add_variable("mid");
    std::vector<std::string> expected{"zeta", "alpha", "mid"};
    EXPECT_EQ(vars.names(), expected);
}

TEST(VariableStoreTests, UnknownValueIsEmpty)
{
    VariableStore vars;
    EXPECT_EQ(vars.value("nothing"), "");
}

// =============================================================================
// Expansion
// =============================================================================

TEST(VariableStoreTests, Expand_NoPlaceholder)
{
    VariableStore vars;
    vars.add_variable("foo", "bar");
    EXPECT_EQ(vars.expand("foo"), "foo");
}

TEST(VariableStoreTests, Expand_One)
{
    VariableStore vars;
    vars.add_variable("foo", "bar");
    EXPECT_EQ(vars.expand("${foo}"), "bar");
}

TEST(VariableStoreTests, Expand_SeveralInText)
{
    VariableStore vars;
    vars.add_variable("user", "deploy");
    vars.add_variable("host", "example.org");
    EXPECT_EQ(vars.expand("ssh ${user}@${host} uptime"), "ssh deploy@example.org uptime");
}

TEST(VariableStoreTests, Expand_UndefinedBecomesEmpty)
{
    VariableStore vars;
    EXPECT_EQ(vars.expand("a${missing}b"), "ab");
}

TEST(VariableStoreTests, Expand_UnterminatedLeftAlone)
{
    VariableStore vars;
    vars.add_variable("foo", "bar");
    EXPECT_EQ(vars.expand("${foo"), "${foo");
    EXPECT_EQ(vars.expand("${foo} and ${foo"), "bar and ${foo");
}

TEST(VariableStoreTests, Expand_ValueIsExpandedAgain)
{
    VariableStore vars;
    vars.add_variable("inner", "x");
    vars.add_variable("outer", "<${inner}>");
    EXPECT_EQ(vars.expand("${outer}"), "<x>");
}

TEST(VariableStoreTests, Expand_AbsentTextIsEmpty)
{
    VariableStore vars;
    EXPECT_EQ(vars.expand(std::optional<std::string>{}), "");
    EXPECT_EQ(vars.expand(std::optional<std::string>{"plain"}), "plain");
}

TEST(VariableStoreTests, Expand_SelfReferenceStops)
{
    VariableStore vars;
    vars.add_variable("loop", "${loop}");
    try
    {
        vars.expand("${loop}");
        FAIL() << "Expected PlanError";
    }
    catch (const PlanError& e)
    {
        EXPECT_EQ(e.code(), PlanErrorCode::SubstitutionDepthExceeded);
    }
}

TEST(VariableStoreTests, Expand_GrowingSelfReferenceStops)
{
    VariableStore vars;
    vars.add_variable("grow", "a${grow}");
    EXPECT_THROW(vars.expand("${grow}"), PlanError);
}
