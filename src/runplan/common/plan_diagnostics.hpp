/**
 * @file plan_diagnostics.hpp
 */
#pragma once
#include "runplan/common/common.hpp"

namespace runplan
{

/**
 * @brief Category of structural problem found in a plan.
 */
enum class DiagnosticCategory
{
    Cycle,               ///< A step is its own (transitive) predecessor.
    DanglingPredecessor  ///< A step names a predecessor that is not in the plan.
};

/**
 * @brief A single structural problem.
 */
struct DiagnosticItem
{
    DiagnosticCategory category;
    std::string message;

    /// Ids of the steps involved, starting with the step whose predecessor
    /// chain exposed the problem.
    std::vector<std::string> involved_steps;
};

// ============================================================================
// PlanDiagnostics
// ============================================================================

/**
 * @brief Structural problems collected from a plan by `diagnose()`.
 *
 * @details
 * Every item is blocking: a plan with any item is not well-formed and is
 * rejected before any step runs.
 */
class PlanDiagnostics
{
public:
    /**
     * @brief Check if the plan is free of structural problems.
     */
    bool is_valid() const noexcept
    {
        return m_errors.empty();
    }

    bool has_errors() const noexcept
    {
        return !m_errors.empty();
    }

    const std::vector<DiagnosticItem>& errors() const noexcept
    {
        return m_errors;
    }

    /**
     * @brief Count the items of one category.
     */
    size_t count(DiagnosticCategory category) const noexcept
    {
        size_t n = 0;
        for (const auto& item : m_errors)
        {
            if (item.category == category)
            {
                ++n;
            }
        }
        return n;
    }

    void add(DiagnosticItem item)
    {
        m_errors.push_back(std::move(item));
    }

private:
    std::vector<DiagnosticItem> m_errors;
};

} // namespace runplan
