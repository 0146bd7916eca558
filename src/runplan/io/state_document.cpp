/**
 * @file state_document.cpp
 */
#include "runplan/io/state_document.hpp"
#include "runplan/common/plan_errors.hpp"
#include "runplan/io/plan_loader.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>

#include <unistd.h>

#include <spdlog/spdlog.h>

namespace runplan
{

StateDocument snapshot(const Plan& plan)
{
    StateDocument state;
    state.plan = plan.source_reference();

    state.actions.reserve(plan.step_count());
    for (const auto& step : plan.steps())
    {
        state.actions.push_back(StepStateEntry{step.id(), step.state()});
    }

    const VariableStore& variables = plan.variables();
    state.variables.reserve(variables.size());
    for (const auto& name : variables.names())
    {
        state.variables.emplace_back(name, variables.value(name));
    }
    return state;
}

void apply_state(Plan& plan, const StateDocument& state)
{
    // Check every name first so that a mismatch leaves the plan untouched
    for (const auto& entry : state.actions)
    {
        if (!plan.find_step(entry.name).has_value())
        {
            throw PlanError(
                PlanErrorCode::RestoreMismatch,
                "Saved state names action " + entry.name + " which " +
                    state.plan + " does not define");
        }
    }
    for (const auto& [name, value] : state.variables)
    {
        if (!plan.variables().contains(name))
        {
            throw PlanError(
                PlanErrorCode::RestoreMismatch,
                "Saved state names variable " + name + " which " +
                    state.plan + " does not declare");
        }
    }

    for (const auto& entry : state.actions)
    {
        Step& step = plan.step(entry.name);
        if (entry.state == StepState::Done)
        {
            step.mark_done();
        }
        else if (entry.state == StepState::Failed)
        {
            step.mark_failed();
        }
    }
    for (const auto& [name, value] : state.variables)
    {
        plan.variables().set_value(name, value);
    }
}

Plan restore(const StateDocument& state)
{
    Plan plan = load_plan(state.plan);
    apply_state(plan, state);
    return plan;
}

std::string emit_state(const StateDocument& state)
{
    YAML::Emitter out;
    out << YAML::BeginMap;

    out << YAML::Key << "actions" << YAML::Value << YAML::BeginSeq;
    for (const auto& entry : state.actions)
    {
        out << YAML::BeginMap;
        out << YAML::Key << "name" << YAML::Value << entry.name;
        out << YAML::Key << "state" << YAML::Value << to_string(entry.state);
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "plan" << YAML::Value << state.plan;

    out << YAML::Key << "variables" << YAML::Value << YAML::BeginMap;
    for (const auto& [name, value] : state.variables)
    {
        out << YAML::Key << name << YAML::Value << value;
    }
    out << YAML::EndMap;

    out << YAML::EndMap;

    if (!out.good())
    {
        throw std::runtime_error("Cannot render state document: " + out.GetLastError());
    }
    return std::string(out.c_str()) + "\n";
}

StateDocument parse_state(const YAML::Node& root, const std::string& origin)
{
    if (!is_state_document(root))
    {
        throw PlanError(PlanErrorCode::LoadFailure, origin + ": not a saved state (no 'plan' key)");
    }

    StateDocument state;
    try
    {
        state.plan = root["plan"].as<std::string>();

        if (auto actions = root["actions"])
        {
            for (const auto& act : actions)
            {
                StepStateEntry entry;
                entry.name = act["name"].as<std::string>();
                const std::string spelling = act["state"] ? act["state"].as<std::string>() : "PENDING";
                auto parsed = parse_step_state(spelling);
                if (!parsed.has_value())
                {
                    throw PlanError(
                        PlanErrorCode::RestoreMismatch,
                        origin + ": action " + entry.name + " has unknown state " + spelling);
                }
                entry.state = *parsed;
                state.actions.push_back(std::move(entry));
            }
        }

        if (auto variables = root["variables"])
        {
            for (const auto& var : variables)
            {
                std::string value;
                if (!var.second.IsNull())
                {
                    value = var.second.as<std::string>();
                }
                state.variables.emplace_back(var.first.as<std::string>(), std::move(value));
            }
        }
    }
    catch (const YAML::Exception& e)
    {
        throw PlanError(PlanErrorCode::LoadFailure, origin + ": " + e.what());
    }
    return state;
}

bool is_state_document(const YAML::Node& root)
{
    return root.IsMap() && root["plan"];
}

Plan restore_file(const std::string& path)
{
    StateDocument state = parse_state(load_yaml_file(path), path);
    spdlog::debug("restoring {} from {}", state.plan, path);
    return restore(state);
}

Plan load_any(const std::string& path)
{
    YAML::Node root = load_yaml_file(path);
    if (is_state_document(root))
    {
        return restore(parse_state(root, path));
    }
    return parse_plan(root, path);
}

std::string save_state_to_new_file(const StateDocument& state, const std::string& directory)
{
    std::string pattern = directory + "/runplan-XXXXXX.yaml";
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    int fd = mkstemps(buffer.data(), 5);
    if (fd < 0)
    {
        throw std::runtime_error(
            "Cannot create a state file in " + directory + ": " + std::strerror(errno));
    }
    close(fd);

    std::string path(buffer.data());
    std::ofstream out(path, std::ios::trunc);
    out << emit_state(state);
    out.close();
    if (!out)
    {
        throw std::runtime_error("Cannot write state file " + path);
    }
    return path;
}

} // namespace runplan
