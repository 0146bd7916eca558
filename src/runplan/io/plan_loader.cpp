/**
 * @file plan_loader.cpp
 */
#include "runplan/io/plan_loader.hpp"
#include "runplan/common/plan_errors.hpp"

#include <filesystem>

#include <spdlog/spdlog.h>

namespace runplan
{

namespace
{

std::optional<std::string> scalar_or_null(const YAML::Node& node, const std::string& what)
{
    if (!node || node.IsNull())
    {
        return std::nullopt;
    }
    if (!node.IsScalar())
    {
        throw PlanError(PlanErrorCode::LoadFailure, what + " must be a single value");
    }
    return node.as<std::string>();
}

std::vector<std::string> parse_after(const YAML::Node& node, const std::string& step_name)
{
    std::vector<std::string> after;
    if (!node || node.IsNull())
    {
        return after;
    }
    if (node.IsScalar())
    {
        after.push_back(node.as<std::string>());
        return after;
    }
    if (!node.IsSequence())
    {
        throw PlanError(
            PlanErrorCode::LoadFailure,
            "'after' of action " + step_name + " must be a list of action names");
    }
    for (const auto& item : node)
    {
        auto name = scalar_or_null(item, "An entry of 'after' of action " + step_name);
        if (!name.has_value())
        {
            throw PlanError(
                PlanErrorCode::LoadFailure,
                "'after' of action " + step_name + " contains an empty entry");
        }
        after.push_back(*name);
    }
    return after;
}

void require_list(const YAML::Node& node, const std::string& source_reference, const char* key)
{
    if (!node.IsNull() && !node.IsSequence())
    {
        throw PlanError(
            PlanErrorCode::LoadFailure,
            source_reference + ": '" + key + "' must be a list");
    }
}

} // namespace

YAML::Node load_yaml_file(const std::string& path)
{
    try
    {
        return YAML::LoadFile(path);
    }
    catch (const YAML::Exception& e)
    {
        throw PlanError(PlanErrorCode::LoadFailure, path + ": " + e.what());
    }
}

StepDescriptor parse_step_descriptor(const YAML::Node& node)
{
    if (!node.IsMap())
    {
        throw PlanError(PlanErrorCode::LoadFailure, "Every action must be a map of keys");
    }

    StepDescriptor descriptor;
    std::string step_name = "<unnamed>";
    if (node["name"] && node["name"].IsScalar())
    {
        step_name = node["name"].as<std::string>();
    }

    for (const auto& entry : node)
    {
        const std::string key = entry.first.as<std::string>();
        if (key == "after")
        {
            descriptor.after = parse_after(entry.second, step_name);
            continue;
        }
        descriptor.fields[key] = scalar_or_null(entry.second, "Key '" + key + "' of action " + step_name);
    }
    return descriptor;
}

Plan parse_plan(const YAML::Node& root, const std::string& source_reference)
{
    if (!root.IsMap())
    {
        throw PlanError(
            PlanErrorCode::LoadFailure,
            source_reference + ": a plan must be a map with 'variables' and 'actions'");
    }

    Plan plan(source_reference);

    try
    {
        if (auto variables = root["variables"])
        {
            require_list(variables, source_reference, "variables");
            for (const auto& var : variables)
            {
                auto name = scalar_or_null(var["name"], "Variable name");
                if (!name.has_value())
                {
                    throw PlanError(PlanErrorCode::LoadFailure, "Every variable needs a name");
                }
                plan.add_variable(*name, scalar_or_null(var["value"], "Value of " + *name).value_or(""));
            }
        }

        if (auto actions = root["actions"])
        {
            require_list(actions, source_reference, "actions");
            for (const auto& act : actions)
            {
                plan.add_step(make_step(parse_step_descriptor(act)));
            }
        }
    }
    catch (const YAML::Exception& e)
    {
        throw PlanError(PlanErrorCode::LoadFailure, source_reference + ": " + e.what());
    }

    spdlog::debug("loaded {}: {} variable(s), {} action(s)",
                  source_reference, plan.variables().size(), plan.step_count());
    return plan;
}

Plan load_plan(const std::string& path)
{
    return parse_plan(load_yaml_file(path), path);
}

std::string absolute_source(const std::string& path)
{
    std::error_code ec;
    std::filesystem::path absolute = std::filesystem::absolute(path, ec);
    if (ec)
    {
        throw PlanError(PlanErrorCode::LoadFailure, path + ": " + ec.message());
    }
    return absolute.lexically_normal().string();
}

} // namespace runplan
