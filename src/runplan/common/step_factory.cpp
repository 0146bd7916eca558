/**
 * @file step_factory.cpp
 */
#include "runplan/common/step_factory.hpp"
#include "runplan/common/plan_errors.hpp"

namespace runplan
{

namespace
{

const std::unordered_set<std::string>& known_keys()
{
    static const std::unordered_set<std::string> keys{
        "name", "after", "command", "variable", "default", "text", "prompt"};
    return keys;
}

std::string key_list(const StepDescriptor& descriptor)
{
    std::string result;
    for (const auto& [key, value] : descriptor.fields)
    {
        if (!result.empty())
        {
            result += ", ";
        }
        result += key;
    }
    return "[" + result + "]";
}

} // namespace

Step make_step(const StepDescriptor& descriptor)
{
    auto name_it = descriptor.fields.find("name");
    if (name_it == descriptor.fields.end() || !name_it->second.has_value())
    {
        throw PlanError(PlanErrorCode::MissingStepName, "No name for action");
    }
    const std::string& name = *name_it->second;

    for (const auto& [key, value] : descriptor.fields)
    {
        if (known_keys().count(key) == 0)
        {
            throw PlanError(
                PlanErrorCode::UnknownStepKey,
                "Action " + name + " has unknown key '" + key + "'");
        }
    }

    std::optional<StepKind> kind;

    if (descriptor.has("command"))
    {
        kind = StepKind::Command;
    }

    if (descriptor.has("variable") || descriptor.has("default"))
    {
        if (kind.has_value())
        {
            throw PlanError(
                PlanErrorCode::AmbiguousStepKind,
                "Action " + name + " seems to be a mix of Command and Set");
        }
        kind = StepKind::Assignment;
    }

    if (descriptor.has("text") || descriptor.has("prompt"))
    {
        if (kind.has_value())
        {
            throw PlanError(
                PlanErrorCode::AmbiguousStepKind,
                "Action " + name +
                    " seems to be a mix of Prompt, and one or more of Command or Set");
        }
        kind = StepKind::Confirmation;
    }

    if (!kind.has_value())
    {
        throw PlanError(
            PlanErrorCode::UnknownStepKind,
            "Unknown action " + name + ", keys are " + key_list(descriptor));
    }

    auto field = [&](const std::string& key) -> std::optional<std::string>
    {
        auto it = descriptor.fields.find(key);
        if (it == descriptor.fields.end())
        {
            return std::nullopt;
        }
        return it->second;
    };

    switch (*kind)
    {
    case StepKind::Command:
        return Step(name, CommandPayload{field("command")}, descriptor.after);

    case StepKind::Assignment:
        return Step(
            name,
            AssignmentPayload{field("variable"), field("default").value_or("")},
            descriptor.after);

    case StepKind::Confirmation:
        break;
    }

    ConfirmationPayload payload;
    payload.text = field("text");
    if (auto prompt = field("prompt"))
    {
        payload.prompt = *prompt;
    }
    return Step(name, std::move(payload), descriptor.after);
}

} // namespace runplan
