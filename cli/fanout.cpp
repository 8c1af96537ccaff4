/*
 * fanout - Parallel Command Multiplexer
 * Copyright (c) 2025 The fanout Authors
 * SPDX-License-Identifier: MIT
 */

#include "fanout/commands.hpp"
#include "fanout/logger.hpp"
#include "fanout/multiplexer.hpp"
#include "fanout/options.hpp"
#include "fanout/renderer.hpp"
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

using namespace fanout;

constexpr const char* VERSION = "0.1.0";

// Async-signal-safe: only set flag, no complex operations
static volatile sig_atomic_t g_interrupt_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_interrupt_requested = 1;
}

void installSignalHandlers() {
    struct sigaction action {};
    action.sa_handler = signalHandler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    // A closed stdout must not kill us while printing the result
    std::signal(SIGPIPE, SIG_IGN);
}

void printUsage(const char* progName) {
    std::cout << "fanout - command multiplexer v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " [options] -c <command> [-c <command> ...] [-f <file> ...]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --command <cmd>      Command to execute (repeatable)\n";
    std::cout << "  -f, --file <path>        Commands file (repeatable), format by extension: ";
    bool first = true;
    for (const auto& ext : CommandFileLoader().extensions()) {
        std::cout << (first ? "" : ", ") << ext;
        first = false;
    }
    std::cout << "\n";
    std::cout << "      --program <prefix>   Program used to execute the commands (default: \"" << kDefaultProgram << "\")\n";
    std::cout << "      --stderr <n>         Number of stderr lines shown per command (default: " << kDefaultStderrLines << ")\n";
    std::cout << "  -p, --parallelism <n>    Maximum number of processes running at once (experimental)\n";
    std::cout << "      --stdout <format>    Print captured stdout as a structured result: json, yaml (experimental)\n";
    std::cout << "  -e, --experimental       Enable experimental options\n";
    std::cout << "  -h, --help               Show this help message\n";
    std::cout << "  -v, --version            Show version\n\n";
    std::cout << "Command file (JSON):\n";
    std::cout << "  {\"commands\": [{\"command\": \"make test\"}, {\"command\": \"make lint\"}]}\n\n";
    std::cout << "Command file (YAML):\n";
    std::cout << "  commands:\n";
    std::cout << "    - command: make test\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  " << Logger::kEnvVar << "   Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " -c \"sleep 1\" -c \"echo done\"\n";
    std::cout << "  " << progName << " -e -p 4 -f jobs.json --stdout=json > result.json\n";
}

int main(int argc, char* argv[]) {
    Logger::initFromEnv();
    setThreadName("Main");

    std::vector<std::string> args(argv + 1, argv + argc);
    auto parsed = parseOptions(args);
    if (!parsed) {
        std::cerr << "Error: " << parsed.message << "\n";
        return 1;
    }
    const Options& options = parsed.options;

    if (options.showHelp) {
        printUsage(argv[0]);
        return 0;
    }
    if (options.showVersion) {
        std::cout << VERSION << "\n";
        return 0;
    }

    try {
        CommandFileLoader loader;
        auto commands = resolveCommands(options.commands, options.files, loader);

        installSignalHandlers();

        Multiplexer multiplexer(options.toConfig(), std::move(commands));
        TerminalDashboard dashboard(std::cerr);
        auto outcome = multiplexer.run(dashboard, [] { return g_interrupt_requested != 0; });

        if (!outcome) {
            std::cerr << "Error: " << outcome.message << std::endl;
            return 1;
        }

        if (options.stdoutFormat) {
            std::cout << serializeResult(outcome.result, *options.stdoutFormat) << std::endl;
        }
    } catch (const CommandFileError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR("Run failed: " + std::string(e.what()));
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
