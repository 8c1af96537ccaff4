/*
 * fanout - Parallel Command Multiplexer
 * Copyright (c) 2025 The fanout Authors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace fanout {

class CommandFileError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Turns the raw text of a command file into its list of commands.
using CommandCodec = std::function<std::vector<std::string>(const std::string& content)>;

// {"commands": [{"command": "..."}, ...]}
[[nodiscard]] std::vector<std::string> parseJsonCommands(const std::string& content);

// commands:
//   - command: "..."
[[nodiscard]] std::vector<std::string> parseYamlCommands(const std::string& content);

// Loads command files with the codec registered for their extension.
class CommandFileLoader {
public:
    // Registers the built-in codecs.
    CommandFileLoader();

    // `extension` includes the dot, e.g. ".json". Replaces an existing codec.
    void registerCodec(const std::string& extension, CommandCodec codec);
    [[nodiscard]] bool supports(const std::filesystem::path& file) const;
    [[nodiscard]] std::vector<std::string> extensions() const;

    // Throws CommandFileError when the file cannot be read or parsed.
    [[nodiscard]] std::vector<std::string> load(const std::filesystem::path& file) const;

private:
    const CommandCodec* find(const std::filesystem::path& file) const;

    std::map<std::string, CommandCodec> codecs_;
};

// Inline commands first, then each file's commands in file order.
[[nodiscard]] std::vector<std::string> resolveCommands(const std::vector<std::string>& inlineCommands,
                                                       const std::vector<std::string>& files,
                                                       const CommandFileLoader& loader);

}
