/**
 * @file command_runner.hpp
 * @brief ICommandRunner interface and the process-spawning runner.
 */
#pragma once
#include "runplan/common/common.hpp"

namespace runplan
{

/**
 * @brief Interface for invoking external commands.
 */
class ICommandRunner
{
public:
    virtual ~ICommandRunner() = default;

    /**
     * @brief Run a command and wait for it.
     * @param argv Program name (looked up in `PATH`) followed by its arguments.
     * @return The exit status, or `std::nullopt` if the program could not be
     *         started (not found, not executable, unknown format) or `argv`
     *         is empty.
     * @throw PlanError with `Interrupted` if the command was stopped by an
     *        interrupt signal.
     * @throw std::runtime_error if the child could not be waited for.
     */
    virtual std::optional<int> run(const std::vector<std::string>& argv) = 0;
};

/**
 * @brief Runs commands as child processes with `posix_spawnp()`.
 *
 * @details
 * The child inherits the environment and the standard streams. No shell is
 * involved, so quoting and redirection in a command line are not interpreted.
 * A child killed by a signal other than SIGINT reports status `128 + signal`.
 */
class ProcessCommandRunner : public ICommandRunner
{
public:
    std::optional<int> run(const std::vector<std::string>& argv) override;
};

/**
 * @brief Split a command line on runs of whitespace.
 */
std::vector<std::string> split_command(const std::string& command);

} // namespace runplan
