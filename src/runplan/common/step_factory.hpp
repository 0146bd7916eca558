/**
 * @file step_factory.hpp
 * @brief Building steps from unordered key sets.
 */
#pragma once
#include "runplan/common/common.hpp"
#include "runplan/common/step.hpp"

namespace runplan
{

/**
 * @brief The raw description of one step, as found in a plan definition.
 *
 * @details
 * `fields` maps each key present in the definition to its text. A key that
 * is present with no value (a YAML null) maps to `std::nullopt`; presence is
 * what decides the step kind, not the value.
 */
struct StepDescriptor
{
    std::map<std::string, std::optional<std::string>> fields;
    std::vector<std::string> after;

    bool has(const std::string& key) const
    {
        return fields.count(key) != 0;
    }
};

/**
 * @brief Build a step, inferring its kind from the descriptor's keys.
 *
 * @details
 * - `command` selects a command step.
 * - `variable` or `default` selects an assignment step.
 * - `text` or `prompt` selects a confirmation step.
 *
 * `name` is required. `after` is accepted as a key too, its list travels in
 * `StepDescriptor::after`.
 *
 * @throw PlanError with `MissingStepName` if there is no non-null `name`,
 *        `AmbiguousStepKind` if keys of more than one kind are present,
 *        `UnknownStepKind` if no kind key is present, or `UnknownStepKey` for
 *        any key outside the set above.
 */
Step make_step(const StepDescriptor& descriptor);

} // namespace runplan
