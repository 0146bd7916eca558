/**
 * @file plan_loader.hpp
 * @brief Building plans from YAML plan definitions.
 */
#pragma once
#include "runplan/common/common.hpp"
#include "runplan/common/plan.hpp"
#include "runplan/common/step_factory.hpp"

#include <yaml-cpp/yaml.h>

namespace runplan
{

/**
 * @brief Load a plan definition file.
 *
 * @details
 * Schema:
 * @code{.yaml}
 * variables:              # optional
 *   - name: host
 *     value: example.org  # optional, default ""
 * actions:                # optional
 *   - name: fetch
 *     command: curl ${host}
 *     after: [other]      # optional
 * @endcode
 *
 * The path becomes the plan's source reference, exactly as given.
 *
 * @throw PlanError with `LoadFailure` if the file cannot be read or parsed or
 *        does not follow the schema, or any construction error of
 *        `make_step()` and `Plan`.
 */
Plan load_plan(const std::string& path);

/**
 * @brief Absolute, lexically normalized form of `path`.
 *
 * @details
 * Use it for the path given to `load_plan()` when the source reference will
 * be saved, so that a state file can be resumed from any working directory.
 */
std::string absolute_source(const std::string& path);

/**
 * @brief Build a plan from an already parsed definition document.
 * @param root The document's root node.
 * @param source_reference Recorded as the plan's source reference.
 */
Plan parse_plan(const YAML::Node& root, const std::string& source_reference);

/**
 * @brief Turn one entry of `actions` into a step descriptor.
 * @throw PlanError with `LoadFailure` if the entry is not a map of scalars
 *        (plus an `after` list).
 */
StepDescriptor parse_step_descriptor(const YAML::Node& node);

/**
 * @brief Parse a YAML file, mapping every yaml-cpp error to `PlanError`.
 */
YAML::Node load_yaml_file(const std::string& path);

} // namespace runplan
