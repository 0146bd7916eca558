/**
 * @file state_document.hpp
 * @brief Checkpoint (snapshot) and resumption (restore) of plan state.
 */
#pragma once
#include "runplan/common/common.hpp"
#include "runplan/common/plan.hpp"

#include <yaml-cpp/yaml.h>

namespace runplan
{

/**
 * @brief Recorded state of one step.
 */
struct StepStateEntry
{
    std::string name;
    StepState state{StepState::Pending};
};

/**
 * @brief Point-in-time capture of a plan's mutable state.
 *
 * @details
 * Pairs the plan's source reference with the state of every step and the
 * value of every variable. The static parts of the plan (kinds, payloads,
 * edges) are not recorded; restoring reloads them from `plan`.
 *
 * On disk:
 * @code{.yaml}
 * actions:
 *   - name: fetch
 *     state: DONE
 * plan: plans/deploy.yaml
 * variables:
 *   host: example.org
 * @endcode
 */
struct StateDocument
{
    std::string plan;
    std::vector<StepStateEntry> actions;
    std::vector<std::pair<std::string, std::string>> variables;
};

/**
 * @brief Capture the state of every step and variable, in declaration order.
 */
StateDocument snapshot(const Plan& plan);

/**
 * @brief Overlay a state document on a freshly loaded plan.
 *
 * @details
 * `Done` and `Failed` entries set the step's state; `Pending` entries leave
 * the step as loaded. Every listed variable is overwritten. Nothing is applied
 * unless every name in the document exists in the plan.
 *
 * @throw PlanError with `RestoreMismatch` if the document names a step or
 *        variable the plan does not have.
 */
void apply_state(Plan& plan, const StateDocument& state);

/**
 * @brief Reload the plan named by `state.plan` and apply `state` to it.
 */
Plan restore(const StateDocument& state);

/**
 * @brief Render a state document as YAML.
 */
std::string emit_state(const StateDocument& state);

/**
 * @brief Read a state document from a parsed YAML node.
 * @param origin Name used in error messages.
 * @throw PlanError with `LoadFailure` on schema errors, or with
 *        `RestoreMismatch` on a state spelling other than PENDING/DONE/FAILED.
 */
StateDocument parse_state(const YAML::Node& root, const std::string& origin);

/**
 * @brief A document with a top-level `plan` key is a state document.
 */
bool is_state_document(const YAML::Node& root);

/**
 * @brief Load a state file and restore the plan it refers to.
 */
Plan restore_file(const std::string& path);

/**
 * @brief Load either a plan definition or a state file, whichever `path` is.
 */
Plan load_any(const std::string& path);

/**
 * @brief Write a state document to a new file in `directory`.
 * @return Path of the created file, named `runplan-XXXXXX.yaml`.
 * @throw std::runtime_error if the file cannot be created or written.
 */
std::string save_state_to_new_file(const StateDocument& state, const std::string& directory);

} // namespace runplan
