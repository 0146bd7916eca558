/**
 * @file variable_store.hpp
 * @brief Named substitution values and `${name}` expansion.
 */
#pragma once
#include "runplan/common/common.hpp"

namespace runplan
{

/**
 * @brief The variables of a plan, in declaration order.
 *
 * @details
 * Variables are declared up front by the plan definition. Steps may read and
 * overwrite existing variables but never create new ones: `set_value()` on an
 * unknown name throws instead of adding it.
 *
 * @par Thread safety
 * - No internal synchronization.
 */
class VariableStore
{
public:
    /// Upper bound on placeholder replacements performed by one `expand()`.
    static constexpr size_t kMaxSubstitutions = 1000;

    /**
     * @brief Declare a variable.
     * @throw PlanError with `DuplicateVariable` if the name is already declared.
     */
    void add_variable(const std::string& name, std::string value = {});

    /**
     * @brief Overwrite the value of a declared variable.
     * @throw PlanError with `UnknownVariable` if the name is not declared.
     */
    void set_value(const std::string& name, std::string value);

    bool contains(const std::string& name) const noexcept;

    /**
     * @brief Get the value of a variable.
     * @return The value, or an empty string if the name is not declared.
     */
    std::string value(const std::string& name) const;

    /**
     * @brief Variable names in declaration order.
     */
    const std::vector<std::string>& names() const noexcept
    {
        return m_names;
    }

    size_t size() const noexcept
    {
        return m_names.size();
    }

    /**
     * @brief Replace every `${name}` placeholder in `text`.
     *
     * @details
     * The first placeholder is replaced by the variable's value (empty if it is
     * not declared) and the result is scanned again from the start, so values
     * that themselves contain placeholders are expanded too. An opening `${`
     * without a closing `}` ends expansion and leaves the rest of the text as
     * it is.
     *
     * @throw PlanError with `SubstitutionDepthExceeded` after
     *        `kMaxSubstitutions` replacements, which only happens when values
     *        keep reintroducing placeholders.
     */
    std::string expand(const std::string& text) const;

    /**
     * @brief Same as `expand(const std::string&)`; disambiguates string literals.
     */
    std::string expand(const char* text) const
    {
        return expand(std::string(text));
    }

    /**
     * @brief Expand optional text; absent text expands to an empty string.
     */
    std::string expand(const std::optional<std::string>& text) const;

private:
    std::vector<std::string> m_names;
    std::unordered_map<std::string, std::string> m_values;
};

} // namespace runplan
