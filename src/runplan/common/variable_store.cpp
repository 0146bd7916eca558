/**
 * @file variable_store.cpp
 */
#include "runplan/common/variable_store.hpp"
#include "runplan/common/plan_errors.hpp"

#include <spdlog/spdlog.h>

namespace runplan
{

void VariableStore::add_variable(const std::string& name, std::string value)
{
    if (m_values.count(name) != 0)
    {
        throw PlanError(
            PlanErrorCode::DuplicateVariable,
            "Variable " + name + " is declared more than once");
    }
    m_names.push_back(name);
    m_values.emplace(name, std::move(value));
}

void VariableStore::set_value(const std::string& name, std::string value)
{
    auto it = m_values.find(name);
    if (it == m_values.end())
    {
        throw PlanError(
            PlanErrorCode::UnknownVariable,
            "Unknown variable " + name);
    }
    it->second = std::move(value);
}

bool VariableStore::contains(const std::string& name) const noexcept
{
    return m_values.count(name) != 0;
}

std::string VariableStore::value(const std::string& name) const
{
    auto it = m_values.find(name);
    if (it == m_values.end())
    {
        return {};
    }
    return it->second;
}

std::string VariableStore::expand(const std::string& text) const
{
    std::string result = text;
    for (size_t substitutions = 0;; ++substitutions)
    {
        const size_t start = result.find("${");
        if (start == std::string::npos)
        {
            return result;
        }
        const size_t end = result.find('}', start);
        if (end == std::string::npos)
        {
            return result;
        }
        if (substitutions == kMaxSubstitutions)
        {
            throw PlanError(
                PlanErrorCode::SubstitutionDepthExceeded,
                "Variable expansion of \"" + text + "\" did not terminate after " +
                    std::to_string(kMaxSubstitutions) + " substitutions");
        }

        const std::string name = result.substr(start + 2, end - start - 2);
        if (!contains(name))
        {
            spdlog::debug("expanding undefined variable {} to an empty string", name);
        }
        result = result.substr(0, start) + value(name) + result.substr(end + 1);
    }
}

std::string VariableStore::expand(const std::optional<std::string>& text) const
{
    if (!text.has_value())
    {
        return {};
    }
    return expand(*text);
}

} // namespace runplan
