/**
 * @file plan_enums.hpp
 */
#pragma once
#include "runplan/common/common.hpp"

namespace runplan
{

// ============================================================================
// Index type aliases
// ============================================================================

/**
 * @brief Type alias for step indices.
 *
 * @details
 * `StepIdx` is the position of a step in its plan's declaration order. It is
 * only meaningful for the plan instance that produced it; step ids (names)
 * are the stable identity used in plan files and state documents.
 */
using StepIdx = size_t;

// ============================================================================
// Enumerations
// ============================================================================

/**
 * @brief Lifecycle state of a step.
 *
 * @details
 * Every step starts out `Pending`. Running a step moves it to exactly one of
 * `Done` or `Failed`. The executor moves `Failed` steps back to `Pending` at
 * the start of each run, and a state document may move a freshly loaded step
 * to `Done` or `Failed`. No other transitions exist.
 */
enum class StepState
{
    Pending,
    Done,
    Failed
};

/**
 * @brief The closed set of step kinds.
 *
 * @details
 * The kind is inferred from the keys of a step descriptor at construction
 * time (see `make_step()`), and selects the node shape in graph exports.
 */
enum class StepKind
{
    Confirmation,
    Assignment,
    Command
};

/**
 * @brief Whether steps perform their external effects.
 *
 * @details
 * In `DryRun` mode, command steps announce their command and complete as
 * `Done` without invoking anything. Other kinds behave as in `Normal` mode.
 */
enum class ExecutionMode
{
    Normal,
    DryRun
};

/**
 * @brief Canonical upper-case spelling of a state, as used in state documents.
 */
inline const char* to_string(StepState state) noexcept
{
    switch (state)
    {
    case StepState::Pending:
        return "PENDING";
    case StepState::Done:
        return "DONE";
    case StepState::Failed:
        return "FAILED";
    }
    return "PENDING";
}

inline const char* to_string(StepKind kind) noexcept
{
    switch (kind)
    {
    case StepKind::Confirmation:
        return "confirmation";
    case StepKind::Assignment:
        return "assignment";
    case StepKind::Command:
        return "command";
    }
    return "confirmation";
}

/**
 * @brief Parse a state spelling produced by `to_string(StepState)`.
 * @return The state, or `std::nullopt` if the text is not an exact match.
 */
inline std::optional<StepState> parse_step_state(const std::string& text)
{
    if (text == "PENDING")
    {
        return StepState::Pending;
    }
    if (text == "DONE")
    {
        return StepState::Done;
    }
    if (text == "FAILED")
    {
        return StepState::Failed;
    }
    return std::nullopt;
}

} // namespace runplan
