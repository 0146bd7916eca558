/**
 * @file command_runner.cpp
 */
#include "runplan/execution/command_runner.hpp"
#include "runplan/common/plan_errors.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <sstream>

#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>

#include <spdlog/spdlog.h>

extern char** environ;

namespace runplan
{

std::optional<int> ProcessCommandRunner::run(const std::vector<std::string>& argv)
{
    if (argv.empty())
    {
        return std::nullopt;
    }

    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv)
    {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    pid_t pid = 0;
    int rc = posix_spawnp(&pid, c_argv[0], nullptr, nullptr, c_argv.data(), environ);
    if (rc != 0)
    {
        // Missing, not executable, bad format: all mean the command did not run.
        if (rc == ENOENT || rc == EACCES || rc == ENOTDIR)
        {
            spdlog::debug("posix_spawnp({}) failed: {}", argv[0], std::strerror(rc));
        }
        else
        {
            spdlog::warn("cannot start {}: {}", argv[0], std::strerror(rc));
        }
        return std::nullopt;
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0)
    {
        if (errno != EINTR)
        {
            throw std::runtime_error(
                "Cannot wait for " + argv[0] + ": " + std::strerror(errno));
        }
    }

    if (WIFEXITED(status))
    {
        int code = WEXITSTATUS(status);
        // posix_spawnp may report a missing program through the child instead.
        if (code == 127)
        {
            return std::nullopt;
        }
        return code;
    }
    if (WIFSIGNALED(status))
    {
        int sig = WTERMSIG(status);
        if (sig == SIGINT)
        {
            throw PlanError(PlanErrorCode::Interrupted, argv[0] + " was interrupted");
        }
        return 128 + sig;
    }
    return -1;
}

std::vector<std::string> split_command(const std::string& command)
{
    std::vector<std::string> argv;
    std::istringstream stream(command);
    std::string word;
    while (stream >> word)
    {
        argv.push_back(word);
    }
    return argv;
}

} // namespace runplan
