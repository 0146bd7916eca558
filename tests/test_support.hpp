/**
 * @file test_support.hpp
 * @brief Scripted collaborators shared by the step and executor tests.
 */
#pragma once
#include "runplan/common/plan_errors.hpp"
#include "runplan/execution/command_runner.hpp"
#include "runplan/execution/console.hpp"

#include <deque>
#include <fstream>

#include <sys/stat.h>

#include <gtest/gtest.h>

namespace runplan
{
namespace testing_support
{

/**
 * @brief Console that answers from prepared queues and records what it was shown.
 *
 * @details
 * Running out of answers behaves like a closed terminal: the read throws
 * `PlanError` with `Interrupted`.
 */
class ScriptedConsole : public IConsole
{
public:
    void show_header(const std::string& step_id, const std::string& detail) override
    {
        headers.push_back(step_id);
        details.push_back(detail);
    }

    void show_text(const std::string& text) override
    {
        texts.push_back(text);
    }

    void show_notice(const std::string& text) override
    {
        notices.push_back(text);
    }

    bool confirm(const std::string& prompt) override
    {
        prompts.push_back(prompt);
        if (confirmations.empty())
        {
            throw PlanError(PlanErrorCode::Interrupted, "no scripted confirmation left");
        }
        bool answer = confirmations.front();
        confirmations.pop_front();
        return answer;
    }

    std::string ask_value(const std::string& variable, const std::string& default_value) override
    {
        asked.emplace_back(variable, default_value);
        if (values.empty())
        {
            return default_value;
        }
        std::string answer = values.front();
        values.pop_front();
        return answer.empty() ? default_value : answer;
    }

    std::deque<bool> confirmations;
    std::deque<std::string> values;

    std::vector<std::string> headers;
    std::vector<std::string> details;
    std::vector<std::string> texts;
    std::vector<std::string> notices;
    std::vector<std::string> prompts;
    std::vector<std::pair<std::string, std::string>> asked;
};

/**
 * @brief Command runner that records each argv and returns a status by program name.
 *
 * @details
 * `true` exits 0, `false` exits 1, and anything listed in `statuses` returns
 * the listed value (`std::nullopt` meaning not found). Unlisted programs are
 * not found.
 */
class RecordingCommandRunner : public ICommandRunner
{
public:
    RecordingCommandRunner()
    {
        statuses["true"] = 0;
        statuses["false"] = 1;
    }

    std::optional<int> run(const std::vector<std::string>& argv) override
    {
        invocations.push_back(argv);
        if (argv.empty())
        {
            return std::nullopt;
        }
        if (argv.front() == "interrupt")
        {
            throw PlanError(PlanErrorCode::Interrupted, "child interrupted");
        }
        auto it = statuses.find(argv.front());
        if (it == statuses.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    std::map<std::string, std::optional<int>> statuses;
    std::vector<std::vector<std::string>> invocations;
};

/**
 * @brief Write an executable file with no shebang, which the kernel refuses
 *        to exec (ENOEXEC).
 * @return Path of the file, under the GoogleTest temporary directory.
 */
inline std::string write_headerless_script(const std::string& name)
{
    std::string path = ::testing::TempDir();
    if (!path.empty() && path.back() != '/')
    {
        path += '/';
    }
    path += name;
    {
        std::ofstream out(path, std::ios::trunc);
        out << "echo hi\n";
    }
    chmod(path.c_str(), 0755);
    return path;
}

} // namespace testing_support
} // namespace runplan
