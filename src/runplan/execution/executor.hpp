/**
 * @file executor.hpp
 * @brief Executor and ExecutorConfig.
 */
#pragma once
#include "runplan/common/common.hpp"
#include "runplan/common/plan.hpp"
#include "runplan/execution/command_runner.hpp"
#include "runplan/execution/console.hpp"
#include "runplan/execution/execution_result.hpp"
#include "runplan/execution/scheduler.hpp"

namespace runplan
{

/**
 * @brief Configuration for executor behavior.
 */
struct ExecutorConfig
{
    /**
     * @brief Whether command steps really run their commands.
     */
    ExecutionMode mode{ExecutionMode::Normal};

    /**
     * @brief Seed for the step selection order.
     * @details Unset means a fresh random seed per executor. Ignored when
     *          `picker` is set.
     */
    std::optional<std::uint64_t> seed;

    /**
     * @brief Custom random source for step selection.
     */
    IndexPicker picker;
};

/**
 * @brief Runs a plan one step at a time until no step is eligible.
 *
 * @details
 * `run()` performs:
 * 1. Structural validation; a malformed plan throws before any step runs.
 * 2. Reset of every `Failed` step to `Pending`, so that a resumed plan retries
 *    what failed last time.
 * 3. The loop: select a random eligible step, run it, repeat.
 *
 * A step failure never throws. It blocks the failed step's dependents while
 * independent steps carry on, and the run reports failure at the end.
 *
 * @par Thread Safety
 * - run() is not thread-safe; call from one thread only.
 * - request_stop() can be called from any thread, including a signal handler
 *   through `stop_flag()`.
 */
class Executor
{
public:
    /**
     * @brief Construct an executor.
     * @param config Configuration options.
     * @param console Console handed to steps; must outlive the executor.
     * @param commands Command runner handed to steps; must outlive the executor.
     */
    Executor(ExecutorConfig config, IConsole& console, ICommandRunner& commands);

    /**
     * @brief Run a plan.
     * @param plan The plan; its step states and variables are updated in place.
     * @return ExecutionResult with outcome details.
     * @throw PlanValidationError if the plan has a cycle or a dangling
     *        predecessor id.
     * @throw PlanError with `DoubleExecution` if a step is run twice, which
     *        signals a bug rather than a problem with the plan.
     */
    ExecutionResult run(Plan& plan);

    /**
     * @brief Request a graceful stop.
     *
     * @details
     * Checked between steps. A step already running completes normally.
     */
    void request_stop() noexcept;

    bool stop_requested() const noexcept;

    /**
     * @brief The flag behind `request_stop()`, for async-signal-safe use.
     */
    std::atomic<bool>& stop_flag() noexcept
    {
        return m_stop_requested;
    }

    const ExecutorConfig& config() const noexcept
    {
        return m_config;
    }

private:
    ExecutorConfig m_config;
    IConsole& m_console;
    ICommandRunner& m_commands;
    Scheduler m_scheduler;
    std::atomic<bool> m_stop_requested{false};
};

} // namespace runplan
