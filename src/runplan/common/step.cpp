/**
 * @file step.cpp
 */
#include "runplan/common/step.hpp"
#include "runplan/common/plan_errors.hpp"
#include "runplan/execution/run_context.hpp"

#include <spdlog/spdlog.h>

namespace runplan
{

Step::Step(std::string id, StepPayload payload, std::vector<std::string> predecessors)
    : m_id{std::move(id)}
    , m_payload{std::move(payload)}
{
    std::unordered_set<std::string> seen;
    for (auto& name : predecessors)
    {
        if (seen.insert(name).second)
        {
            m_predecessors.push_back(std::move(name));
        }
    }
}

StepKind Step::kind() const noexcept
{
    if (std::holds_alternative<AssignmentPayload>(m_payload))
    {
        return StepKind::Assignment;
    }
    if (std::holds_alternative<CommandPayload>(m_payload))
    {
        return StepKind::Command;
    }
    return StepKind::Confirmation;
}

void Step::run(RunContext& context)
{
    if (!is_pending())
    {
        throw PlanError(
            PlanErrorCode::DoubleExecution,
            "Step " + m_id + " executed twice (state " + to_string(m_state) + ")");
    }

    std::visit([&](const auto& payload) { run_payload(payload, context); }, m_payload);
}

void Step::run_payload(const ConfirmationPayload& payload, RunContext& context)
{
    context.console.show_header(m_id, "");
    context.console.show_text(context.variables.expand(payload.text));
    if (context.console.confirm(payload.prompt))
    {
        mark_done();
    }
    else
    {
        mark_failed();
    }
}

void Step::run_payload(const AssignmentPayload& payload, RunContext& context)
{
    const std::string variable = payload.variable.value_or("");
    context.console.show_header(m_id, "\tSetting the value of variable " + variable);

    const std::string proposed = context.variables.expand(payload.default_value);
    std::string answer = context.console.ask_value(variable, proposed);

    if (!payload.variable.has_value() || !context.variables.contains(variable))
    {
        spdlog::warn("step {}: variable '{}' is not declared by the plan", m_id, variable);
        mark_failed();
        return;
    }
    context.variables.set_value(variable, std::move(answer));
    mark_done();
}

void Step::run_payload(const CommandPayload& payload, RunContext& context)
{
    const std::string command = context.variables.expand(payload.command);
    context.console.show_header(m_id, "\tRunning the following command:\n\t\t" + command);

    if (context.mode == ExecutionMode::DryRun)
    {
        context.console.show_notice("\t\tAction not done, because this is a dry-run");
        spdlog::info("step {}: dry run, not running '{}'", m_id, command);
        mark_done();
        return;
    }

    std::optional<int> status = context.commands.run(split_command(command));
    if (!status.has_value())
    {
        spdlog::warn("step {}: could not start '{}'", m_id, command);
        mark_failed();
    }
    else if (*status != 0)
    {
        spdlog::warn("step {}: '{}' exited with status {}", m_id, command, *status);
        mark_failed();
    }
    else
    {
        mark_done();
    }
}

} // namespace runplan
