/**
 * @file plan.hpp
 */
#pragma once
#include "runplan/common/common.hpp"
#include "runplan/common/plan_enums.hpp"
#include "runplan/common/step.hpp"
#include "runplan/common/variable_store.hpp"

namespace runplan
{

/**
 * @brief The full collection of steps and variables of one plan.
 *
 * @details
 * `Plan` is the central container. It owns its steps and its variables, and
 * remembers the source reference (the plan file) it was built from so that a
 * state document can later rebuild it.
 *
 * @par Construction workflow
 * 1. Create a `Plan` with its source reference.
 * 2. Declare variables via `add_variable()`.
 * 3. Add steps via `add_step()`. Predecessor ids are not checked here; a
 *    dangling id is reported by `diagnose()` before the plan runs.
 * 4. Run it with an `Executor`.
 *
 * @par Index requirements
 * Steps are stored in declaration order. `StepIdx` values returned by
 * `find_step()` and the scheduler are positions in that order and stay valid
 * for the lifetime of the plan, since steps are never removed.
 *
 * @par Thread safety
 * - No internal synchronization. Only one step runs at a time.
 */
class Plan
{
public:
    explicit Plan(std::string source_reference = {});

    /**
     * @brief Where the plan's static definition came from.
     */
    const std::string& source_reference() const noexcept
    {
        return m_source_reference;
    }

    /**
     * @brief Add a step to the plan.
     * @throw PlanError with `DuplicateStep` if a step with the same id exists.
     */
    void add_step(Step step);

    /**
     * @brief Declare a variable.
     * @throw PlanError with `DuplicateVariable` if the name is already declared.
     */
    void add_variable(const std::string& name, std::string value = {});

    size_t step_count() const noexcept
    {
        return m_steps.size();
    }

    const std::vector<Step>& steps() const noexcept
    {
        return m_steps;
    }

    Step& step(StepIdx sidx)
    {
        return m_steps.at(sidx);
    }

    const Step& step(StepIdx sidx) const
    {
        return m_steps.at(sidx);
    }

    /**
     * @brief Look up a step by id.
     * @throw PlanError with `UnknownStep` if there is no such step.
     */
    Step& step(const std::string& id);
    const Step& step(const std::string& id) const;

    std::optional<StepIdx> find_step(const std::string& id) const noexcept;

    VariableStore& variables() noexcept
    {
        return m_variables;
    }

    const VariableStore& variables() const noexcept
    {
        return m_variables;
    }

    /**
     * @brief Check whether any step is `Failed`.
     */
    bool any_failed() const noexcept;

    /**
     * @brief Move every `Failed` step back to `Pending`.
     */
    void reset_failed() noexcept;

private:
    std::string m_source_reference;
    std::vector<Step> m_steps;
    std::unordered_map<std::string, StepIdx> m_step_index;
    VariableStore m_variables;
};

} // namespace runplan
