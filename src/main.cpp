#include "runplan/execution/executor.hpp"
#include "runplan/execution/interrupt_guard.hpp"
#include "runplan/io/graph_export.hpp"
#include "runplan/io/plan_loader.hpp"
#include "runplan/io/state_document.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>

#include <spdlog/spdlog.h>
#include <spdlog/cfg/helpers.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace
{

constexpr int kExitStepFailed = 1;
constexpr int kExitUsage = 2;
constexpr int kExitInterrupted = 130;

struct Options
{
    std::string command;
    std::string file;
    bool dry_run{false};
    bool verbose{false};
    std::optional<std::uint64_t> seed;
};

void print_usage(std::ostream& out)
{
    out << "usage: runplan [-v] run [--dryrun] [--seed N] <plan.yaml>\n"
        << "       runplan [-v] resume [--seed N] <state.yaml>\n"
        << "       runplan [-v] graph <plan-or-state.yaml>\n";
}

Options parse_options(int argc, char** argv)
{
    Options options;
    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        if (arg == "-v" || arg == "--verbose")
        {
            options.verbose = true;
        }
        else if (arg == "--dryrun")
        {
            options.dry_run = true;
        }
        else if (arg == "--seed")
        {
            if (i + 1 >= argc)
            {
                throw std::invalid_argument("--seed needs a value");
            }
            options.seed = std::stoull(argv[++i]);
        }
        else if (!arg.empty() && arg[0] == '-')
        {
            throw std::invalid_argument("unknown option " + arg);
        }
        else if (options.command.empty())
        {
            options.command = arg;
        }
        else if (options.file.empty())
        {
            options.file = arg;
        }
        else
        {
            throw std::invalid_argument("unexpected argument " + arg);
        }
    }

    if (options.command != "run" && options.command != "resume" && options.command != "graph")
    {
        throw std::invalid_argument(
            options.command.empty() ? "missing command" : "unknown command " + options.command);
    }
    if (options.file.empty())
    {
        throw std::invalid_argument(options.command + " needs a file");
    }
    if (options.dry_run && options.command != "run")
    {
        throw std::invalid_argument("--dryrun only applies to run");
    }
    return options;
}

void setup_logging(bool verbose)
{
    auto logger = spdlog::stderr_color_mt("runplan");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
    if (const char* levels = std::getenv("RUNPLAN_LOG_LEVEL"))
    {
        spdlog::cfg::helpers::load_levels(levels);
    }
}

int execute(runplan::Plan plan, const Options& options)
{
    runplan::ExecutorConfig config;
    config.mode = options.dry_run ? runplan::ExecutionMode::DryRun : runplan::ExecutionMode::Normal;
    config.seed = options.seed;

    runplan::StreamConsole console(std::cin, std::cout);
    runplan::ProcessCommandRunner commands;
    runplan::Executor executor(config, console, commands);

    runplan::ExecutionResult result;
    {
        runplan::InterruptGuard guard(executor.stop_flag());
        result = executor.run(plan);
    }
    if (result.success)
    {
        return EXIT_SUCCESS;
    }
    if (result.stopped)
    {
        spdlog::warn("interrupted, no state was saved");
        return kExitInterrupted;
    }

    const std::string path = runplan::save_state_to_new_file(
        runplan::snapshot(plan), std::filesystem::temp_directory_path().string());
    spdlog::info("state saved to {}", path);
    std::cout << "\n\nExecution failed, you can resume by running\n\trunplan resume "
              << path << "\n" << std::flush;
    return kExitStepFailed;
}

} // namespace

int main(int argc, char** argv)
{
    Options options;
    try
    {
        options = parse_options(argc, argv);
    }
    catch (const std::exception& e)
    {
        std::cerr << "runplan: " << e.what() << "\n";
        print_usage(std::cerr);
        return kExitUsage;
    }

    setup_logging(options.verbose);

    try
    {
        if (options.command == "graph")
        {
            runplan::export_graph(runplan::load_any(options.file), std::cout);
            return EXIT_SUCCESS;
        }
        if (options.command == "resume")
        {
            return execute(runplan::restore_file(options.file), options);
        }
        return execute(runplan::load_plan(runplan::absolute_source(options.file)), options);
    }
    catch (const std::exception& e)
    {
        spdlog::error("{}", e.what());
        return kExitUsage;
    }
}
