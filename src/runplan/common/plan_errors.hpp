/**
 * @file plan_errors.hpp
 */
#pragma once
#include "runplan/common/common.hpp"
#include "runplan/common/plan_diagnostics.hpp"

namespace runplan
{

/**
 * @brief Error codes for plan construction, execution and restoration.
 */
enum class PlanErrorCode
{
    MissingStepName,
    UnknownStepKind,
    AmbiguousStepKind,
    UnknownStepKey,
    DuplicateStep,
    DuplicateVariable,
    UnknownStep,
    UnknownVariable,
    DoubleExecution,
    RestoreMismatch,
    SubstitutionDepthExceeded,
    Interrupted,
    LoadFailure
};

/**
 * @brief Exception class for plan errors.
 *
 * @details
 * `PlanError` is thrown when a step descriptor cannot be turned into a step,
 * when a name lookup that must succeed does not, when a step is run twice,
 * when a state document does not match its plan, or when a plan or state file
 * cannot be read. Each exception carries an error code and a descriptive
 * message.
 *
 * A step whose own effect does not succeed is *not* an error: it is recorded
 * as `StepState::Failed`.
 *
 * @par Thread safety
 * - The exception object itself follows standard exception semantics.
 * - Safe to copy and rethrow across threads.
 */
class PlanError : public std::exception
{
public:
    /**
     * @brief Construct a PlanError.
     * @param code The error code indicating the type of error.
     * @param message A descriptive message explaining the error.
     */
    PlanError(PlanErrorCode code, std::string message)
        : m_code(code)
        , m_message(std::move(message))
    {
    }

    /**
     * @brief Get the error code.
     */
    PlanErrorCode code() const noexcept
    {
        return m_code;
    }

    const char* what() const noexcept override
    {
        return m_message.c_str();
    }

private:
    PlanErrorCode m_code;
    std::string m_message;
};

/**
 * @brief Exception thrown when a plan fails structural validation before a run.
 *
 * @details
 * Carries the diagnostics that describe every cycle and dangling predecessor
 * reference that was found.
 */
class PlanValidationError : public std::runtime_error
{
public:
    explicit PlanValidationError(const std::string& msg, PlanDiagnostics diagnostics)
        : std::runtime_error(msg)
        , m_diagnostics(std::move(diagnostics))
    {}

    /**
     * @brief Get the diagnostics that caused the validation failure.
     */
    const PlanDiagnostics& diagnostics() const noexcept
    {
        return m_diagnostics;
    }

private:
    PlanDiagnostics m_diagnostics;
};

} // namespace runplan
