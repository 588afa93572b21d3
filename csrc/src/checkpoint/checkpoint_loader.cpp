// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "checkpoint/checkpoint_loader.h"

#include <filesystem>
#include <fstream>
#include <map>

#include <fmt/core.h>

#include "converters/version_dispatch.h"
#include "utilities/errors.h"
#include "utilities/safetensors.h"

namespace nmtspec {

namespace {

constexpr std::string_view kSafeTensorsExtension = ".safetensors";
constexpr std::string_view kIndexExtension = ".safetensors.index.json";

bool has_suffix(const std::string& value, std::string_view suffix) {
    return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

//! Extracts the quoted value of `model_checkpoint_path: "..."`.
std::string parse_state_line(const std::string& line) {
    auto first = line.find('"');
    auto last = line.rfind('"');
    if (first == std::string::npos || last == first) {
        return {};
    }
    return line.substr(first + 1, last - first - 1);
}

} // namespace

std::string latest_checkpoint(const std::string& directory) {
    const std::filesystem::path state_file = std::filesystem::path(directory) / "checkpoint";
    std::ifstream file(state_file);
    if (!file.is_open()) {
        throw UnsupportedFormatError(fmt::format("No checkpoint state file found in {}", directory));
    }

    std::string line;
    while (std::getline(file, line)) {
        if (line.rfind("model_checkpoint_path:", 0) != 0) continue;
        std::string prefix = parse_state_line(line);
        if (prefix.empty()) break;
        std::filesystem::path prefix_path(prefix);
        if (prefix_path.is_relative()) {
            prefix_path = std::filesystem::path(directory) / prefix_path;
        }
        return prefix_path.string();
    }
    throw UnsupportedFormatError(fmt::format("Checkpoint state file {} has no model_checkpoint_path",
                                             state_file.string()));
}

/**
 * @brief Read every variable of the checkpoint at @p path.
 *
 * @throws UnsupportedFormatError for serialized-program directories or
 *         unreadable checkpoint locations.
 */
LoadedCheckpoint SafeTensorsCheckpointLoader::load(const std::string& path) const {
    std::filesystem::path location(path);
    std::string file_name;

    if (std::filesystem::is_directory(location)) {
        if (std::filesystem::exists(location / "saved_model.pb") ||
            std::filesystem::exists(location / "saved_model.pbtxt")) {
            throw UnsupportedFormatError(fmt::format(
                "{} is a SavedModel; convert it from a training checkpoint instead", path));
        }
        file_name = std::string(latest_checkpoint(path)) + std::string(kSafeTensorsExtension);
    } else if (has_suffix(path, kSafeTensorsExtension) || has_suffix(path, kIndexExtension)) {
        file_name = path;
    } else {
        file_name = path + std::string(kSafeTensorsExtension);
    }

    if (!std::filesystem::exists(file_name)) {
        throw UnsupportedFormatError(fmt::format("Checkpoint file {} does not exist", file_name));
    }

    SafeTensorsReader reader(file_name);
    std::map<std::string, Tensor> variables;
    for (const auto& entry : reader.entries()) {
        variables.emplace(entry.name(), entry.read_tensor());
    }

    LoadedCheckpoint loaded;
    loaded.Path = file_name;
    VariableStore store(std::move(variables));
    loaded.Generation = converters::detect_generation(store, std::filesystem::path(file_name).filename().string());
    loaded.Variables = converters::normalize_variable_names(store);
    return loaded;
}

} // namespace nmtspec
