/**
 * @file executor.cpp
 */
#include "runplan/execution/executor.hpp"
#include "runplan/common/plan_errors.hpp"
#include "runplan/common/plan_validator.hpp"
#include "runplan/execution/run_context.hpp"

#include <sstream>

#include <spdlog/spdlog.h>

namespace runplan
{

namespace
{

IndexPicker picker_for(const ExecutorConfig& config)
{
    if (config.picker)
    {
        return config.picker;
    }
    if (config.seed.has_value())
    {
        return make_uniform_picker(*config.seed);
    }
    return make_uniform_picker();
}

} // namespace

Executor::Executor(ExecutorConfig config, IConsole& console, ICommandRunner& commands)
    : m_config{std::move(config)}
    , m_console{console}
    , m_commands{commands}
    , m_scheduler{picker_for(m_config)}
{}

void Executor::request_stop() noexcept
{
    m_stop_requested.store(true, std::memory_order_release);
}

bool Executor::stop_requested() const noexcept
{
    return m_stop_requested.load(std::memory_order_acquire);
}

ExecutionResult Executor::run(Plan& plan)
{
    ExecutionResult result;
    auto start_time = std::chrono::steady_clock::now();

    // Step 1: Structural validation, before anything has side effects
    PlanDiagnostics diagnostics = diagnose(plan);
    if (diagnostics.has_errors())
    {
        std::ostringstream oss;
        oss << "The plan is inconsistent (" << diagnostics.errors().size() << " error(s)):\n";
        for (const auto& err : diagnostics.errors())
        {
            oss << "  - " << err.message << "\n";
        }
        throw PlanValidationError(oss.str(), std::move(diagnostics));
    }

    // Step 2: Give previously failed steps another chance
    plan.reset_failed();

    spdlog::info("running plan {} ({} step(s){})",
                 plan.source_reference().empty() ? "<memory>" : plan.source_reference(),
                 plan.step_count(),
                 m_config.mode == ExecutionMode::DryRun ? ", dry run" : "");

    // Step 3: One step at a time until nothing is eligible
    RunContext context{plan.variables(), m_console, m_commands, m_config.mode};
    while (!stop_requested())
    {
        std::optional<StepIdx> next = m_scheduler.select_next(plan);
        if (!next.has_value())
        {
            break;
        }

        Step& step = plan.step(*next);
        try
        {
            step.run(context);
        }
        catch (const PlanError& e)
        {
            if (e.code() != PlanErrorCode::Interrupted)
            {
                throw;
            }
            spdlog::warn("step {} interrupted: {}", step.id(), e.what());
            request_stop();
            break;
        }

        result.execution_order.push_back(step.id());
        spdlog::debug("step {} -> {}", step.id(), to_string(step.state()));
    }

    // Step 4: Build result
    for (const auto& step : plan.steps())
    {
        switch (step.state())
        {
        case StepState::Done:
            result.completed_steps.push_back(step.id());
            break;
        case StepState::Failed:
            result.failed_steps.push_back(step.id());
            break;
        case StepState::Pending:
            result.pending_steps.push_back(step.id());
            break;
        }
    }
    // A stop that arrives after the last step has run changes nothing.
    result.stopped = stop_requested() && !result.pending_steps.empty();
    result.success = result.failed_steps.empty() && !result.stopped;

    auto end_time = std::chrono::steady_clock::now();
    result.total_duration = std::chrono::duration_cast<std::chrono::nanoseconds>(
        end_time - start_time);

    if (result.success)
    {
        spdlog::info("{}", result.summary());
    }
    else
    {
        spdlog::warn("{}", result.summary());
    }
    return result;
}

} // namespace runplan
