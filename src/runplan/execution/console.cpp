/**
 * @file console.cpp
 */
#include "runplan/execution/console.hpp"
#include "runplan/common/plan_errors.hpp"

#include <cctype>

namespace runplan
{

namespace
{

constexpr size_t kIndentColumns = 8;
constexpr size_t kWrapColumn = 72;

} // namespace

StreamConsole::StreamConsole(std::istream& in, std::ostream& out)
    : m_in{in}
    , m_out{out}
{}

void StreamConsole::show_header(const std::string& step_id, const std::string& detail)
{
    m_out << "---[ " << step_id << " ] ---------------------\n";
    if (!detail.empty())
    {
        m_out << detail << "\n";
    }
    m_out << std::flush;
}

void StreamConsole::show_text(const std::string& text)
{
    m_out << wrap_text(text) << "\n" << std::flush;
}

void StreamConsole::show_notice(const std::string& text)
{
    m_out << text << "\n" << std::flush;
}

bool StreamConsole::confirm(const std::string& prompt)
{
    return parse_response(read_line(prompt + " "));
}

std::string StreamConsole::ask_value(const std::string& variable, const std::string& default_value)
{
    std::string answer = read_line(
        "Provide a value for " + variable + "\n (just pressing enter defaults it to " +
        default_value + ") ");
    if (answer.empty())
    {
        return default_value;
    }
    return answer;
}

std::string StreamConsole::read_line(const std::string& prompt)
{
    m_out << prompt << std::flush;
    std::string line;
    if (!std::getline(m_in, line))
    {
        m_out << "\n" << std::flush;
        throw PlanError(PlanErrorCode::Interrupted, "No answer could be read from the console");
    }
    return line;
}

bool parse_response(const std::string& answer)
{
    std::string lowered;
    lowered.reserve(answer.size());
    for (char c : answer)
    {
        lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return lowered == "y" || lowered == "yes" || lowered == "t" || lowered == "true";
}

std::string wrap_text(const std::string& text)
{
    // Pieces rather than one string so that a remembered space can later be
    // swapped for a line break.
    std::vector<std::string> pieces{"\t"};
    size_t column = kIndentColumns;
    std::optional<size_t> last_space;

    for (char c : text)
    {
        pieces.emplace_back(1, c);
        ++column;
        if (c == '\n')
        {
            pieces.emplace_back("\t");
            column = kIndentColumns;
            last_space.reset();
        }
        if (c == ' ')
        {
            last_space = pieces.size() - 1;
        }

        if (column >= kWrapColumn)
        {
            if (last_space.has_value())
            {
                pieces[*last_space] = "\n\t";
                column = kIndentColumns;
                last_space.reset();
            }
            else
            {
                pieces.emplace_back("\n\t");
                column = kIndentColumns;
            }
        }
    }

    std::string result;
    for (const auto& piece : pieces)
    {
        result += piece;
    }
    size_t end = result.find_last_not_of(" \t\n\r");
    if (end == std::string::npos)
    {
        return {};
    }
    result.erase(end + 1);
    return result;
}

} // namespace runplan
