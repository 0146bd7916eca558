/**
 * @file run_context.hpp
 * @brief RunContext: everything a step may touch while it runs.
 */
#pragma once
#include "runplan/common/common.hpp"
#include "runplan/common/plan_enums.hpp"
#include "runplan/common/variable_store.hpp"
#include "runplan/execution/command_runner.hpp"
#include "runplan/execution/console.hpp"

namespace runplan
{

/**
 * @brief The context passed into `Step::run()`.
 *
 * @par Ownership
 * - Holds references only. The executor builds one per run from the plan's
 *   variables and its own collaborators, and it must not outlive them.
 */
struct RunContext
{
    VariableStore& variables;
    IConsole& console;
    ICommandRunner& commands;
    ExecutionMode mode{ExecutionMode::Normal};
};

} // namespace runplan
