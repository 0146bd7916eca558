/**
 * @file console.hpp
 * @brief IConsole interface and the stream-backed console.
 */
#pragma once
#include "runplan/common/common.hpp"

namespace runplan
{

/**
 * @brief Interface for the human side of a run.
 *
 * @details
 * Confirmation and assignment steps talk to the operator through this
 * interface; command steps use it to announce what they are about to run.
 *
 * Implementations that lose their input (end of stream, interrupted read)
 * throw `PlanError` with `Interrupted` so that the step asking stays
 * `Pending`.
 */
class IConsole
{
public:
    virtual ~IConsole() = default;

    /**
     * @brief Announce the step that is about to run.
     * @param step_id Id of the step.
     * @param detail Extra lines shown under the banner; may be empty.
     */
    virtual void show_header(const std::string& step_id, const std::string& detail) = 0;

    /**
     * @brief Show explanatory text, wrapped for an 80-column display.
     */
    virtual void show_text(const std::string& text) = 0;

    /**
     * @brief Show a one-off notice line.
     */
    virtual void show_notice(const std::string& text) = 0;

    /**
     * @brief Ask a yes/no question.
     * @return True iff the answer is affirmative (see `parse_response()`).
     */
    virtual bool confirm(const std::string& prompt) = 0;

    /**
     * @brief Ask for a variable's new value.
     * @return The answer, or `default_value` if the answer is empty.
     */
    virtual std::string ask_value(const std::string& variable, const std::string& default_value) = 0;
};

/**
 * @brief Console reading answers from one stream and writing to another.
 *
 * @details
 * The command-line tool uses `std::cin`/`std::cout`; tests use string streams.
 */
class StreamConsole : public IConsole
{
public:
    StreamConsole(std::istream& in, std::ostream& out);

    void show_header(const std::string& step_id, const std::string& detail) override;
    void show_text(const std::string& text) override;
    void show_notice(const std::string& text) override;
    bool confirm(const std::string& prompt) override;
    std::string ask_value(const std::string& variable, const std::string& default_value) override;

private:
    std::string read_line(const std::string& prompt);

    std::istream& m_in;
    std::ostream& m_out;
};

/**
 * @brief Interpret an operator's answer. Only a positive answer counts.
 * @return True for `y`, `yes`, `t` and `true` in any letter case.
 */
bool parse_response(const std::string& answer);

/**
 * @brief Indent text by one tab and wrap it before column 72.
 *
 * @details
 * Tabs count as 8 columns. Lines break at the last space seen on the current
 * line, or mid-word when the line has no space. Existing newlines are kept
 * and the following line is indented too. Trailing whitespace is removed.
 */
std::string wrap_text(const std::string& text);

} // namespace runplan
