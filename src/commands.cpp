/*
 * fanout - Parallel Command Multiplexer
 * Copyright (c) 2025 The fanout Authors
 * SPDX-License-Identifier: MIT
 */

#include "fanout/commands.hpp"
#include "fanout/logger.hpp"
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>

namespace fanout {

namespace {

std::string lowerExtension(const std::filesystem::path& file) {
    std::string ext = file.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return ext;
}

}

std::vector<std::string> parseJsonCommands(const std::string& content) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        throw CommandFileError(std::string("invalid JSON: ") + e.what());
    }

    if (!root.is_object() || !root.contains("commands") || !root["commands"].is_array()) {
        throw CommandFileError("expected an object with a \"commands\" array");
    }

    std::vector<std::string> commands;
    std::size_t index = 0;
    for (const auto& entry : root["commands"]) {
        if (!entry.is_object() || !entry.contains("command") || !entry["command"].is_string()) {
            throw CommandFileError("commands[" + std::to_string(index) + "] has no \"command\" string");
        }
        commands.push_back(entry["command"].get<std::string>());
        ++index;
    }
    return commands;
}

std::vector<std::string> parseYamlCommands(const std::string& content) {
    YAML::Node loaded;
    try {
        loaded = YAML::Load(content);
    } catch (const YAML::Exception& e) {
        throw CommandFileError(std::string("invalid YAML: ") + e.what());
    }

    const YAML::Node& root = loaded;
    const YAML::Node list = root.IsMap() ? root["commands"] : YAML::Node();
    if (!list || !list.IsSequence()) {
        throw CommandFileError("expected a map with a \"commands\" sequence");
    }

    std::vector<std::string> commands;
    for (std::size_t index = 0; index < list.size(); ++index) {
        const YAML::Node entry = list[index];
        if (!entry.IsMap() || !entry["command"] || !entry["command"].IsScalar()) {
            throw CommandFileError("commands[" + std::to_string(index) + "] has no \"command\" string");
        }
        commands.push_back(entry["command"].as<std::string>());
    }
    return commands;
}

CommandFileLoader::CommandFileLoader() {
    registerCodec(".json", parseJsonCommands);
    registerCodec(".yaml", parseYamlCommands);
    registerCodec(".yml", parseYamlCommands);
}

void CommandFileLoader::registerCodec(const std::string& extension, CommandCodec codec) {
    std::string key = extension;
    std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    codecs_[key] = std::move(codec);
}

const CommandCodec* CommandFileLoader::find(const std::filesystem::path& file) const {
    auto it = codecs_.find(lowerExtension(file));
    return it == codecs_.end() ? nullptr : &it->second;
}

bool CommandFileLoader::supports(const std::filesystem::path& file) const {
    return find(file) != nullptr;
}

std::vector<std::string> CommandFileLoader::extensions() const {
    std::vector<std::string> result;
    for (const auto& entry : codecs_) {
        result.push_back(entry.first);
    }
    return result;
}

std::vector<std::string> CommandFileLoader::load(const std::filesystem::path& file) const {
    const CommandCodec* codec = find(file);
    if (!codec) {
        throw CommandFileError(file.string() + ": unsupported command file format '" +
                               file.extension().string() + "'");
    }

    std::ifstream in(file, std::ios::binary);
    if (!in) {
        throw CommandFileError(file.string() + ": cannot open file");
    }
    std::string content((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw CommandFileError(file.string() + ": read error");
    }

    try {
        auto commands = (*codec)(content);
        LOG_DEBUG("Loaded " + std::to_string(commands.size()) + " command(s) from " + file.string());
        return commands;
    } catch (const CommandFileError& e) {
        throw CommandFileError(file.string() + ": " + e.what());
    }
}

std::vector<std::string> resolveCommands(const std::vector<std::string>& inlineCommands,
                                         const std::vector<std::string>& files,
                                         const CommandFileLoader& loader) {
    std::vector<std::string> commands(inlineCommands);
    for (const auto& file : files) {
        auto loaded = loader.load(file);
        commands.insert(commands.end(), std::make_move_iterator(loaded.begin()),
                        std::make_move_iterator(loaded.end()));
    }
    return commands;
}

}
