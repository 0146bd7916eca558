/**
 * @file plan_validator.hpp
 * @brief Structural checks run before a plan executes.
 */
#pragma once
#include "runplan/common/common.hpp"
#include "runplan/common/plan.hpp"
#include "runplan/common/plan_diagnostics.hpp"

namespace runplan
{

/**
 * @brief Collect the structural problems of a plan.
 *
 * @details
 * For every step, the predecessor chain is walked depth-first. A walk that
 * comes back to its starting step is a cycle; each distinct cycle is reported
 * once, with all of its steps. Every predecessor id that names no step of the
 * plan is reported as a dangling reference.
 *
 * Steps without predecessors and disconnected groups of steps are fine. The
 * plan is not modified.
 */
PlanDiagnostics diagnose(const Plan& plan);

/**
 * @brief Check that a plan has no cycles and no dangling predecessor ids.
 */
bool well_formed(const Plan& plan);

} // namespace runplan
