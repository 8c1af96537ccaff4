/*
 * fanout - Parallel Command Multiplexer
 * Copyright (c) 2025 The fanout Authors
 * SPDX-License-Identifier: MIT
 */

#include "fanout/options.hpp"
#include <charconv>
#include <sstream>

namespace fanout {

namespace {

std::optional<std::size_t> parseCount(const std::string& value) {
    std::size_t parsed = 0;
    const char* begin = value.data();
    const char* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(begin, end, parsed);
    if (value.empty() || ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return parsed;
}

OptionsResult failure(std::string message) {
    OptionsResult result;
    result.ok = false;
    result.message = std::move(message);
    return result;
}

}

MultiplexerConfig Options::toConfig() const {
    MultiplexerConfig config;
    config.program = program;
    config.stderrLines = stderrLines;
    config.parallelism = parallelism;
    return config;
}

std::vector<std::string> splitProgram(const std::string& program) {
    std::vector<std::string> parts;
    std::istringstream in(program);
    std::string part;
    while (in >> part) {
        parts.push_back(part);
    }
    return parts;
}

OptionsResult parseOptions(const std::vector<std::string>& args) {
    Options options;
    std::string program = kDefaultProgram;
    std::optional<std::string> stdoutName;
    std::optional<std::string> parallelismValue;

    for (std::size_t i = 0; i < args.size(); ++i) {
        std::string arg = args[i];
        std::optional<std::string> inlineValue;

        // --name=value
        if (arg.rfind("--", 0) == 0) {
            auto eq = arg.find('=');
            if (eq != std::string::npos) {
                inlineValue = arg.substr(eq + 1);
                arg = arg.substr(0, eq);
            }
        }

        auto takeValue = [&](std::string& out) -> bool {
            if (inlineValue) {
                out = *inlineValue;
                return true;
            }
            if (i + 1 >= args.size()) {
                return false;
            }
            out = args[++i];
            return true;
        };

        std::string value;
        if (arg == "-h" || arg == "--help") {
            options.showHelp = true;
        } else if (arg == "-v" || arg == "--version") {
            options.showVersion = true;
        } else if (arg == "-e" || arg == "--experimental") {
            options.experimental = true;
        } else if (arg == "-c" || arg == "--command") {
            if (!takeValue(value)) return failure(arg + " requires a command");
            options.commands.push_back(value);
        } else if (arg == "-f" || arg == "--file") {
            if (!takeValue(value)) return failure(arg + " requires a path");
            options.files.push_back(value);
        } else if (arg == "--program") {
            if (!takeValue(value)) return failure("--program requires a value");
            program = value;
        } else if (arg == "--stderr") {
            if (!takeValue(value)) return failure("--stderr requires a number");
            auto parsed = parseCount(value);
            if (!parsed) return failure("invalid --stderr value: " + value);
            options.stderrLines = *parsed;
        } else if (arg == "--stdout") {
            if (!takeValue(value)) return failure("--stdout requires a format");
            stdoutName = value;
        } else if (arg == "-p" || arg == "--parallelism") {
            if (!takeValue(value)) return failure(arg + " requires a number");
            parallelismValue = value;
        } else {
            return failure("unknown argument: " + arg);
        }
    }

    if (options.showHelp || options.showVersion) {
        OptionsResult result;
        result.ok = true;
        result.options = std::move(options);
        return result;
    }

    options.program = splitProgram(program);
    if (options.program.empty()) {
        return failure("--program must name an executable");
    }

    if (stdoutName) {
        auto format = parseOutputFormat(*stdoutName);
        if (!format) return failure("unknown stdout format: " + *stdoutName);
        options.stdoutFormat = format;
    }

    if (parallelismValue) {
        auto parsed = parseCount(*parallelismValue);
        if (!parsed || *parsed == 0) {
            return failure("invalid --parallelism value: " + *parallelismValue);
        }
        options.parallelism = parsed;
    }

    // Experimental gate
    if (!options.experimental) {
        if (options.stdoutFormat) return failure("experimental flag (stdout)");
        if (options.parallelism) return failure("experimental flag (parallelism)");
    }

    OptionsResult result;
    result.ok = true;
    result.options = std::move(options);
    return result;
}

}
