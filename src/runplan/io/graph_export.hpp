/**
 * @file graph_export.hpp
 * @brief Rendering a plan as a Graphviz digraph.
 */
#pragma once
#include "runplan/common/common.hpp"
#include "runplan/common/plan.hpp"

namespace runplan
{

/**
 * @brief Write the plan's dependency graph in Graphviz dot syntax.
 *
 * @details
 * Two synthetic nodes, "start" and "end", frame the graph: every step
 * without predecessors hangs off "start", and every step that is nobody's
 * predecessor leads to "end". Steps are listed in id order.
 *
 * Node shape follows the step kind (confirmation `note`, assignment
 * `polygon`, command `component`); fill color follows the state (pending
 * `gray`, done `green`, failed `red`), which makes a graph of a state file a
 * progress report.
 */
void export_graph(const Plan& plan, std::ostream& out);

/**
 * @brief Same as `export_graph()`, into a string.
 */
std::string graph_to_dot(const Plan& plan);

} // namespace runplan
