/**
 * @file execution_result.hpp
 * @brief Definition of ExecutionResult returned by Executor::run().
 */
#pragma once
#include "runplan/common/common.hpp"

namespace runplan
{

/**
 * @brief Result of running a plan.
 *
 * @details
 * ExecutionResult captures the outcome of one `Executor::run()`:
 * - Success/failure status
 * - Final state of every step, by id
 * - The order in which steps ran
 * - Whether the run was stopped early
 */
struct ExecutionResult
{
    /**
     * @brief Overall success status.
     * @details True iff no step is `Failed` and the run was not stopped.
     *          Every step is then `Done`.
     */
    bool success{true};

    /**
     * @brief True if the run ended because a stop was requested or a step
     *        was interrupted.
     */
    bool stopped{false};

    /**
     * @brief Ids of steps that are `Done` after the run.
     */
    std::vector<std::string> completed_steps;

    /**
     * @brief Ids of steps that are `Failed` after the run.
     */
    std::vector<std::string> failed_steps;

    /**
     * @brief Ids of steps still `Pending`, blocked by a failure or a stop.
     */
    std::vector<std::string> pending_steps;

    /**
     * @brief Ids of the steps run by this call, in order.
     */
    std::vector<std::string> execution_order;

    /**
     * @brief Total execution duration (wall-clock time).
     */
    std::chrono::nanoseconds total_duration{0};

    /**
     * @brief Get a summary string for logging.
     */
    std::string summary() const
    {
        std::string result;
        if (success)
        {
            result = "Execution succeeded";
        }
        else if (stopped)
        {
            result = "Execution stopped by request";
        }
        else
        {
            result = "Execution failed";
        }
        result += " (done=" + std::to_string(completed_steps.size());
        result += ", failed=" + std::to_string(failed_steps.size());
        result += ", pending=" + std::to_string(pending_steps.size()) + ")";
        return result;
    }
};

} // namespace runplan
