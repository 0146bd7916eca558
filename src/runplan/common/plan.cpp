/**
 * @file plan.cpp
 */
#include "runplan/common/plan.hpp"
#include "runplan/common/plan_errors.hpp"

namespace runplan
{

Plan::Plan(std::string source_reference)
    : m_source_reference(std::move(source_reference))
{
}

void Plan::add_step(Step step)
{
    if (m_step_index.count(step.id()) != 0)
    {
        throw PlanError(
            PlanErrorCode::DuplicateStep,
            "Action " + step.id() + " is defined more than once");
    }
    m_step_index.emplace(step.id(), m_steps.size());
    m_steps.push_back(std::move(step));
}

void Plan::add_variable(const std::string& name, std::string value)
{
    m_variables.add_variable(name, std::move(value));
}

Step& Plan::step(const std::string& id)
{
    auto sidx = find_step(id);
    if (!sidx.has_value())
    {
        throw PlanError(PlanErrorCode::UnknownStep, "Unknown action " + id);
    }
    return m_steps[*sidx];
}

const Step& Plan::step(const std::string& id) const
{
    auto sidx = find_step(id);
    if (!sidx.has_value())
    {
        throw PlanError(PlanErrorCode::UnknownStep, "Unknown action " + id);
    }
    return m_steps[*sidx];
}

std::optional<StepIdx> Plan::find_step(const std::string& id) const noexcept
{
    auto it = m_step_index.find(id);
    if (it == m_step_index.end())
    {
        return std::nullopt;
    }
    return it->second;
}

bool Plan::any_failed() const noexcept
{
    for (const auto& step : m_steps)
    {
        if (step.state() == StepState::Failed)
        {
            return true;
        }
    }
    return false;
}

void Plan::reset_failed() noexcept
{
    for (auto& step : m_steps)
    {
        if (step.state() == StepState::Failed)
        {
            step.reset();
        }
    }
}

} // namespace runplan
