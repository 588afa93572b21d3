// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "logging.h"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <type_traits>

#include <fmt/core.h>
#include <fmt/chrono.h>
#include <nlohmann/json.hpp>

#include "specs/transformer_spec.h"

namespace nmtspec {

namespace {

//! JSON string literal (quoted and escaped) for embedding in a log line.
std::string quoted(std::string_view value) {
    return nlohmann::json(std::string(value)).dump();
}

std::string format_parameter_count(long count) {
    if (count < 1'000'000) {
        return fmt::format("{:.1f}k", static_cast<double>(count) / 1e3);
    } else if (count < 1'000'000'000) {
        return fmt::format("{:.1f}M", static_cast<double>(count) / 1e6);
    }
    return fmt::format("{:.2f}B", static_cast<double>(count) / 1e9);
}

} // namespace

/**
 * @brief Create a logger that writes a JSON array to @p file_name.
 *
 * An empty file name disables the JSON log; console output is still
 * controlled by @p verbosity.
 */
ConversionLogger::ConversionLogger(const std::string& file_name, EVerbosity verbosity) :
    mFileName(file_name), mVerbosity(verbosity)
{
    if (mFileName.empty()) return;

    auto log_path = std::filesystem::path(mFileName).parent_path();
    if (!log_path.empty()) {
        std::filesystem::create_directories(log_path);
    }
    mLogFile.open(mFileName, std::fstream::out);
    if (!mLogFile.is_open()) {
        throw std::runtime_error(fmt::format("Could not open log file {}", mFileName));
    }
    mLogFile << "[\n";
    mLogFile << "\n]\n";
}

ConversionLogger::~ConversionLogger()
{
    if(mLogFile.is_open()) mLogFile.close();
}

void ConversionLogger::set_callback(std::function<void(std::string_view)> cb) {
    mCallback = std::move(cb);
}

/**
 * @brief Log the command line used to start the conversion.
 */
void ConversionLogger::log_cmd(int argc, const char** argv)
{
    std::string cmd = fmt::format(R"(  {{"log": "cmd", "time": "{}", "cmd": [)", std::chrono::system_clock::now());
    for (int i = 0; i < argc; i++)
    {
        if (i != 0) cmd += ", ";
        cmd += nmtspec::quoted(argv[i]);
    }
    cmd += "]}";
    log_line(cmd);
}

/**
 * @brief Log the effective conversion options.
 *
 * Each option is written as a JSON log line; with VERBOSE they are also
 * printed as an aligned table.
 */
void ConversionLogger::log_options(const std::vector<std::pair<std::string_view, OptionValue>>& options) {
    int option_length = 0;
    for (auto& [name, value] : options) {
        auto log = [&](auto&& v) {
            if constexpr (std::is_same_v<std::remove_cvref_t<decltype(v)>, std::string>) {
                log_line(fmt::format(R"(  {{"log": "option", "time": "{}", "name": {}, "value": {}}})",
                                     std::chrono::system_clock::now(), nmtspec::quoted(name), nmtspec::quoted(v)));
            } else {
                log_line(fmt::format(R"(  {{"log": "option", "time": "{}", "name": {}, "value": {}}})",
                                     std::chrono::system_clock::now(), nmtspec::quoted(name), v));
            }
        };
        option_length = std::max(option_length, static_cast<int>(name.size()));
        std::visit(log, value);
    }

    if (mVerbosity >= 1) {
        printf("[Options]\n");
        for (auto& [name, value] : options) {
            std::string formatted = std::visit([](auto&& v) { return fmt::format("{}", v); }, value);
            printf("  %-*.*s : %s\n", option_length, static_cast<int>(name.size()), name.data(), formatted.c_str());
        }
        printf("\n");
    }
}

void ConversionLogger::log_checkpoint(const std::string& path, int generation, std::size_t num_variables) {
    log_line(fmt::format(R"(  {{"log": "checkpoint", "time": "{}", "path": {}, "generation": {}, "variables": {}}})",
                         std::chrono::system_clock::now(), nmtspec::quoted(path), generation, num_variables));
    if (mVerbosity >= 0) {
        printf("[Checkpoint]\n");
        printf("  path:       %s\n", path.c_str());
        printf("  generation: V%d\n", generation);
        printf("  variables:  %zu\n\n", num_variables);
    }
}

/**
 * @brief Record that a lookup fell back to an alternative variable.
 *
 * @param role What was being resolved (e.g. "target embeddings").
 * @param missing The preferred name that was not found.
 * @param used The name that supplied the value instead.
 */
void ConversionLogger::log_fallback(std::string_view role, std::string_view missing, std::string_view used) {
    log_line(fmt::format(R"(  {{"log": "fallback", "time": "{}", "role": {}, "missing": {}, "used": {}}})",
                         std::chrono::system_clock::now(), nmtspec::quoted(role), nmtspec::quoted(missing), nmtspec::quoted(used)));
    if (mVerbosity >= 1) {
        printf("  %.*s: %.*s not found, using %.*s\n",
               static_cast<int>(role.size()), role.data(),
               static_cast<int>(missing.size()), missing.data(),
               static_cast<int>(used.size()), used.data());
    }
}

/**
 * @brief Summarize a populated ModelSpec.
 *
 * With VERBOSE every variable is listed with its dtype and shape.
 */
void ConversionLogger::log_spec(const specs::ModelSpec& spec) {
    long num_parameters = 0;
    std::size_t num_variables = 0;
    spec.visit([&](const std::string&, const Tensor& value) {
        num_parameters += value.nelem();
        ++num_variables;
    });

    log_line(fmt::format(R"(  {{"log": "spec", "time": "{}", "architecture": {}, "num_heads": {}, "relative_position": {}, "shared_embeddings": {}, "encoder_layers": {}, "decoder_layers": {}, "variables": {}, "parameters": {}, "tied_projection": {}}})",
                         std::chrono::system_clock::now(), nmtspec::quoted(spec.Architecture), spec.NumHeads,
                         spec.WithRelativePosition, spec.SharedEmbeddings, spec.Encoder.Layers.size(), spec.Decoder.Layers.size(),
                         num_variables, num_parameters, spec.Decoder.projection_is_tied()));

    if (mVerbosity >= 0) {
        printf("[Model]\n");
        printf("  architecture:      %s\n", spec.Architecture.c_str());
        printf("  heads:             %d\n", spec.NumHeads);
        printf("  relative position: %s\n", spec.WithRelativePosition ? "yes" : "no");
        printf("  shared embeddings: %s\n", spec.SharedEmbeddings ? "yes" : "no");
        printf("  layers:            %zu encoder, %zu decoder\n", spec.Encoder.Layers.size(), spec.Decoder.Layers.size());
        printf("  projection:        %s\n", spec.Decoder.projection_is_tied() ? "tied to target embeddings" : spec.Decoder.ProjectionSource.c_str());
        printf("  parameters:        %s in %zu variables\n", format_parameter_count(num_parameters).c_str(), num_variables);
        for (const auto& [name, tokens] : spec.Vocabularies) {
            printf("  %s vocabulary: %zu tokens\n", name.c_str(), tokens.size());
        }
        printf("\n");
    }
    if (mVerbosity >= 1) {
        spec.visit([](const std::string& name, const Tensor& value) {
            printf("  %-60s %-5s %s\n", name.c_str(), dtype_to_str(value.DType), shape_to_string(value).c_str());
        });
        printf("\n");
    }
}

void ConversionLogger::log_message(const std::string& msg) {
    if(mVerbosity >= 0) {
        fprintf(stdout, "%s\n", msg.c_str());
    }
    log_line(fmt::format(R"(  {{"log": "info", "time": "{}", "message": {}}})",
                         std::chrono::system_clock::now(), nmtspec::quoted(msg)));
}

void ConversionLogger::log_warning(const std::string& msg) {
    if(mVerbosity >= -1) {
        fprintf(stderr, "WARNING: %s\n", msg.c_str());
    }
    log_line(fmt::format(R"(  {{"log": "warning", "time": "{}", "message": {}}})",
                         std::chrono::system_clock::now(), nmtspec::quoted(msg)));
}

/**
 * @brief Begin a timed logging section.
 *
 * Returns an RAII handle that calls log_section_end() on destruction.
 */
ConversionLogger::RAII_Section ConversionLogger::log_section_start(const std::string& info) {
    mSectionInfo = info;
    mSectionStart = std::chrono::steady_clock::now();
    if(mVerbosity >= 0) {
        printf("%s ...\n", info.data());
    }
    return RAII_Section{this};
}

void ConversionLogger::log_section_end() {
    auto duration = std::chrono::steady_clock::now() - mSectionStart;
    long milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
    log_line(fmt::format(R"(  {{"log": "info", "time": "{}", "message": {}, "duration_ms": {}}})",
                         std::chrono::system_clock::now(), nmtspec::quoted(mSectionInfo), milliseconds));

    if(mVerbosity >= 0) {
        if(milliseconds < 2000) {
            printf("  done in %ld ms\n\n", milliseconds);
        } else {
            printf("  done in %ld s\n\n", milliseconds / 1000);
        }
    }
}

void ConversionLogger::log_line(std::string_view line) {
    if(mCallback)
        mCallback(line);

    if (!mLogFile.is_open()) return;

    mLogFile.seekp(-3, std::ios::end);  // overwrite the array closing part
    if (!mFirst)
    {
        mLogFile << ",\n";
    }
    mLogFile << line << "\n]" << std::endl;
    mFirst = false;
}

} // namespace nmtspec
