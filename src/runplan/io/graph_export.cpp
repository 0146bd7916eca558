/**
 * @file graph_export.cpp
 */
#include "runplan/io/graph_export.hpp"

#include <algorithm>
#include <set>
#include <sstream>

namespace runplan
{

namespace
{

const char* shape_for(StepKind kind) noexcept
{
    switch (kind)
    {
    case StepKind::Confirmation:
        return "note";
    case StepKind::Assignment:
        return "polygon";
    case StepKind::Command:
        return "component";
    }
    return "note";
}

const char* color_for(StepState state) noexcept
{
    switch (state)
    {
    case StepState::Done:
        return "green";
    case StepState::Failed:
        return "red";
    case StepState::Pending:
        return "gray";
    }
    return "gray";
}

} // namespace

void export_graph(const Plan& plan, std::ostream& out)
{
    std::vector<const Step*> sorted;
    sorted.reserve(plan.step_count());
    std::set<std::string> is_predecessor;
    for (const auto& step : plan.steps())
    {
        sorted.push_back(&step);
        is_predecessor.insert(step.predecessors().begin(), step.predecessors().end());
    }
    std::sort(sorted.begin(), sorted.end(),
              [](const Step* a, const Step* b) { return a->id() < b->id(); });

    out << "digraph {\n";
    out << "  \"start\" [ shape=circle fillcolor=gray ]\n";
    out << "  \"end\" [ shape=octagon fillcolor=gray ]\n";

    for (const Step* step : sorted)
    {
        out << "  \"" << step->id() << "\" [ shape=" << shape_for(step->kind())
            << " fillcolor=" << color_for(step->state()) << " ]\n";
    }

    for (const Step* step : sorted)
    {
        for (const auto& pred : step->predecessors())
        {
            out << "  \"" << pred << "\" -> \"" << step->id() << "\"\n";
        }
    }

    for (const Step* step : sorted)
    {
        if (step->predecessors().empty())
        {
            out << "  \"start\" -> \"" << step->id() << "\"\n";
        }
        if (is_predecessor.count(step->id()) == 0)
        {
            out << "  \"" << step->id() << "\" -> \"end\"\n";
        }
    }

    out << "}\n";
}

std::string graph_to_dot(const Plan& plan)
{
    std::ostringstream oss;
    export_graph(plan, oss);
    return oss.str();
}

} // namespace runplan
