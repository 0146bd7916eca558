/**
 * @file plan_validator.cpp
 */
#include "runplan/common/plan_validator.hpp"

#include <algorithm>
#include <set>

namespace runplan
{

namespace
{

std::string join(const std::vector<std::string>& names, const char* separator)
{
    std::string result;
    for (const auto& name : names)
    {
        if (!result.empty())
        {
            result += separator;
        }
        result += name;
    }
    return result;
}

/// Walk the predecessor chain of `start`. Returns the steps of the first cycle
/// through `start`, beginning with `start`, or an empty vector if there is none.
std::vector<StepIdx> find_cycle_through(const Plan& plan, StepIdx start)
{
    std::vector<bool> visited(plan.step_count(), false);
    std::vector<StepIdx> discovered_by(plan.step_count(), start);
    std::vector<StepIdx> stack;
    stack.push_back(start);

    while (!stack.empty())
    {
        StepIdx current = stack.back();
        stack.pop_back();

        for (const auto& pred_id : plan.step(current).predecessors())
        {
            auto pred = plan.find_step(pred_id);
            if (!pred.has_value())
            {
                continue; // dangling, reported separately
            }
            if (*pred == start)
            {
                std::vector<StepIdx> cycle;
                for (StepIdx s = current; s != start; s = discovered_by[s])
                {
                    cycle.push_back(s);
                }
                cycle.push_back(start);
                std::reverse(cycle.begin(), cycle.end());
                return cycle;
            }
            if (!visited[*pred])
            {
                visited[*pred] = true;
                discovered_by[*pred] = current;
                stack.push_back(*pred);
            }
        }
    }

    return {};
}

} // namespace

PlanDiagnostics diagnose(const Plan& plan)
{
    PlanDiagnostics diagnostics;

    // Phase 1: dangling predecessor references
    for (const auto& step : plan.steps())
    {
        for (const auto& pred_id : step.predecessors())
        {
            if (!plan.find_step(pred_id).has_value())
            {
                DiagnosticItem item;
                item.category = DiagnosticCategory::DanglingPredecessor;
                item.message = "Step " + step.id() + " comes after unknown step " + pred_id;
                item.involved_steps.push_back(step.id());
                item.involved_steps.push_back(pred_id);
                diagnostics.add(std::move(item));
            }
        }
    }

    // Phase 2: cycles, each reported once regardless of where it was entered
    std::set<std::set<StepIdx>> reported;
    for (StepIdx sidx = 0; sidx < plan.step_count(); ++sidx)
    {
        std::vector<StepIdx> cycle = find_cycle_through(plan, sidx);
        if (cycle.empty())
        {
            continue;
        }
        if (!reported.insert(std::set<StepIdx>(cycle.begin(), cycle.end())).second)
        {
            continue;
        }

        DiagnosticItem item;
        item.category = DiagnosticCategory::Cycle;
        for (StepIdx s : cycle)
        {
            item.involved_steps.push_back(plan.step(s).id());
        }
        item.message = "Steps depend on each other in a cycle: " +
                       join(item.involved_steps, " -> ") + " -> " + item.involved_steps.front();
        diagnostics.add(std::move(item));
    }

    return diagnostics;
}

bool well_formed(const Plan& plan)
{
    return diagnose(plan).is_valid();
}

} // namespace runplan
