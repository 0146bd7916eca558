/**
 * @file step.hpp
 * @brief Step: one executable unit of a plan, and its kind-specific payloads.
 */
#pragma once
#include "runplan/common/common.hpp"
#include "runplan/common/plan_enums.hpp"

namespace runplan
{

struct RunContext;

/**
 * @brief Payload of a step that shows text and asks for a yes/no answer.
 */
struct ConfirmationPayload
{
    /// Text shown before the question, expanded at run time. Absent text
    /// shows as an empty line.
    std::optional<std::string> text;

    /// The question itself.
    std::string prompt{"Done?"};
};

/**
 * @brief Payload of a step that assigns a value to a declared variable.
 */
struct AssignmentPayload
{
    /// Name of the variable to assign. A step without one always fails.
    std::optional<std::string> variable;

    /// Proposed value, expanded at run time and offered as the default answer.
    std::string default_value;
};

/**
 * @brief Payload of a step that runs an external command.
 */
struct CommandPayload
{
    /// Command line, expanded at run time and split on whitespace.
    std::optional<std::string> command;
};

using StepPayload = std::variant<ConfirmationPayload, AssignmentPayload, CommandPayload>;

/**
 * @brief A unit of work with identity, state and predecessor ids.
 *
 * @details
 * A step is identified by its id, which is also the only way other steps
 * refer to it. It becomes eligible to run once every predecessor is `Done`
 * (see `Scheduler`). Running performs the payload's effect and moves the step
 * to `Done` or `Failed`; a step that did not succeed is recorded, not thrown.
 *
 * @par At-most-once execution
 * `run()` on a step that is not `Pending` throws `PlanError` with
 * `DoubleExecution`. The only way back to `Pending` is `reset()`, which the
 * executor applies to `Failed` steps before a run.
 *
 * @par Ownership
 * - Steps are owned by value by their `Plan`.
 * - A step holds no reference to its plan; everything `run()` needs is passed
 *   in through `RunContext`.
 */
class Step
{
public:
    /**
     * @brief Construct a pending step.
     * @param id Unique id within the plan.
     * @param payload Kind-specific payload.
     * @param predecessors Ids that must be `Done` first. Duplicates are
     *        dropped; the first occurrence keeps its position.
     */
    Step(std::string id, StepPayload payload, std::vector<std::string> predecessors = {});

    const std::string& id() const noexcept
    {
        return m_id;
    }

    StepState state() const noexcept
    {
        return m_state;
    }

    bool is_pending() const noexcept
    {
        return m_state == StepState::Pending;
    }

    StepKind kind() const noexcept;

    const std::vector<std::string>& predecessors() const noexcept
    {
        return m_predecessors;
    }

    const StepPayload& payload() const noexcept
    {
        return m_payload;
    }

    /**
     * @brief Perform the step's effect and record the outcome.
     *
     * @details
     * - Confirmation: shows the expanded text, `Done` iff the answer is yes.
     * - Assignment: offers the expanded default, `Done` iff the variable is
     *   declared (it is then set to the answer).
     * - Command: runs the expanded command, `Done` iff it exits with status 0.
     *   In `ExecutionMode::DryRun` nothing is run and the step is `Done`.
     *
     * @throw PlanError with `DoubleExecution` if the step is not `Pending`.
     * @throw PlanError with `Interrupted` if a collaborator was interrupted;
     *        the step then stays `Pending`.
     */
    void run(RunContext& context);

    void mark_done() noexcept
    {
        m_state = StepState::Done;
    }

    void mark_failed() noexcept
    {
        m_state = StepState::Failed;
    }

    /**
     * @brief Move the step back to `Pending`.
     */
    void reset() noexcept
    {
        m_state = StepState::Pending;
    }

private:
    void run_payload(const ConfirmationPayload& payload, RunContext& context);
    void run_payload(const AssignmentPayload& payload, RunContext& context);
    void run_payload(const CommandPayload& payload, RunContext& context);

    std::string m_id;
    StepPayload m_payload;
    std::vector<std::string> m_predecessors;
    StepState m_state{StepState::Pending};
};

} // namespace runplan
