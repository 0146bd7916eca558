#include <gtest/gtest.h>
#include "runplan/io/graph_export.hpp"
#include "runplan/io/plan_loader.hpp"
#include "runplan/io/state_document.hpp"

#include <sstream>

using namespace runplan;

// =============================================================================
// Fixture plans
// =============================================================================

TEST(GraphExportTests, SimpleGraph)
{
    Plan plan = load_plan("testdata/plan_small1.yaml");
    std::ostringstream sink;
    export_graph(plan, sink);
    EXPECT_EQ(sink.str(),
              "digraph {\n"
              "  \"start\" [ shape=circle fillcolor=gray ]\n"
              "  \"end\" [ shape=octagon fillcolor=gray ]\n"
              "  \"test\" [ shape=component fillcolor=gray ]\n"
              "  \"start\" -> \"test\"\n"
              "  \"test\" -> \"end\"\n"
              "}\n");
}

TEST(GraphExportTests, RestoredGraph)
{
    Plan plan = load_any("testdata/restore_graph.yaml");
    EXPECT_EQ(graph_to_dot(plan),
              "digraph {\n"
              "  \"start\" [ shape=circle fillcolor=gray ]\n"
              "  \"end\" [ shape=octagon fillcolor=gray ]\n"
              "  \"prompter\" [ shape=note fillcolor=green ]\n"
              "  \"runner\" [ shape=component fillcolor=red ]\n"
              "  \"setvar\" [ shape=polygon fillcolor=gray ]\n"
              "  \"prompter\" -> \"runner\"\n"
              "  \"prompter\" -> \"setvar\"\n"
              "  \"start\" -> \"prompter\"\n"
              "  \"runner\" -> \"end\"\n"
              "  \"setvar\" -> \"end\"\n"
              "}\n");
}

// =============================================================================
// Hand-built plans
// =============================================================================

TEST(GraphExportTests, EmptyPlan)
{
    Plan plan;
    EXPECT_EQ(graph_to_dot(plan),
              "digraph {\n"
              "  \"start\" [ shape=circle fillcolor=gray ]\n"
              "  \"end\" [ shape=octagon fillcolor=gray ]\n"
              "}\n");
}

TEST(GraphExportTests, NodesSortedById)
{
    Plan plan;
    plan.add_step(Step("zulu", CommandPayload{std::string("true")}, {"alpha"}));
    plan.add_step(Step("alpha", ConfirmationPayload{}));
    plan.step("alpha").mark_done();

    EXPECT_EQ(graph_to_dot(plan),
              "digraph {\n"
              "  \"start\" [ shape=circle fillcolor=gray ]\n"
              "  \"end\" [ shape=octagon fillcolor=gray ]\n"
              "  \"alpha\" [ shape=note fillcolor=green ]\n"
              "  \"zulu\" [ shape=component fillcolor=gray ]\n"
              "  \"alpha\" -> \"zulu\"\n"
              "  \"start\" -> \"alpha\"\n"
              "  \"zulu\" -> \"end\"\n"
              "}\n");
}
