// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "config/conversion_config.h"

#include <cmath>
#include <cstdint>
#include <fstream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "converters/model_package.h"
#include "specs/model_catalog.h"
#include "utilities/errors.h"
#include "utilities/utils.h"

namespace nmtspec {

namespace {

std::optional<int> as_int(const nlohmann::json& value) {
    if (value.is_number_unsigned()) {
        const std::uint64_t v = value.get<std::uint64_t>();
        if (v > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) return std::nullopt;
        return static_cast<int>(v);
    }
    if (value.is_number_integer()) {
        const std::int64_t v = value.get<std::int64_t>();
        if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) return std::nullopt;
        return static_cast<int>(v);
    }
    if (value.is_number_float()) {
        // only integral values inside the int range
        const double v = value.get<double>();
        if (!std::isfinite(v) || std::trunc(v) != v) return std::nullopt;
        if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) return std::nullopt;
        return static_cast<int>(v);
    }
    if (value.is_string()) {
        try {
            return std::stoi(value.get<std::string>());
        } catch (const std::logic_error&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

std::optional<bool> as_bool(const nlohmann::json& value) {
    if (value.is_boolean()) return value.get<bool>();
    if (value.is_number_integer()) return value.get<std::int64_t>() != 0;
    if (value.is_string()) {
        const std::string v = value.get<std::string>();
        if (iequals(v, "true") || v == "1") return true;
        if (iequals(v, "false") || v == "0") return false;
    }
    return std::nullopt;
}

//! Accepts the level names as well as their numeric values.
std::optional<int> as_verbosity(const nlohmann::json& value) {
    if (value.is_string()) {
        const std::string v = value.get<std::string>();
        if (iequals(v, "silent")) return -2;
        if (iequals(v, "quiet")) return -1;
        if (iequals(v, "default")) return 0;
        if (iequals(v, "verbose")) return 1;
    }
    return as_int(value);
}

template<typename T>
std::optional<T> get_opt(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end()) return std::nullopt;
    if constexpr (std::is_same_v<T, int>) {
        return as_int(*it);
    } else if constexpr (std::is_same_v<T, bool>) {
        return as_bool(*it);
    } else if constexpr (std::is_same_v<T, std::string>) {
        if (it->is_string()) return it->get<std::string>();
    }
    return std::nullopt;
}

}  // namespace

void ConversionConfig::validate() const {
    if (ModelPath.empty()) {
        throw ConfigurationError("model_path is required");
    }
    if (ModelType.empty()) {
        throw ConfigurationError("model_type is required");
    }
    (void)specs::model_template_from_name(ModelType);
    if (SourceVocabulary.empty()) {
        throw ConfigurationError("src_vocab is required");
    }
    if (TargetVocabulary.empty()) {
        throw ConfigurationError("tgt_vocab is required");
    }
    if (OutputDir.empty()) {
        throw ConfigurationError("output_dir is required");
    }
    (void)converters::quantization_dtype(Quantization);
    if (UnknownToken.empty()) {
        throw ConfigurationError("unk_token must not be empty");
    }
    if (Verbosity < -2 || Verbosity > 1) {
        throw ConfigurationError(fmt::format("verbosity must be between -2 and 1, got {}", Verbosity));
    }
}

ConversionConfig load_conversion_config(const char* file_name) {
    std::ifstream file(file_name);
    if (!file.is_open()) {
        throw ConfigurationError(fmt::format("could not open config file {}", file_name));
    }

    nlohmann::json config_json;
    try {
        config_json = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigurationError(fmt::format("invalid config file {}: {}", file_name, e.what()));
    }
    if (!config_json.is_object()) {
        throw ConfigurationError(fmt::format("config file {} does not contain a JSON object", file_name));
    }

    ConversionConfig cfg;
    if (auto v = get_opt<std::string>(config_json, "model_path")) cfg.ModelPath = *v;
    if (auto v = get_opt<std::string>(config_json, "model_type")) cfg.ModelType = *v;
    if (auto v = get_opt<std::string>(config_json, "src_vocab")) cfg.SourceVocabulary = *v;
    if (auto v = get_opt<std::string>(config_json, "tgt_vocab")) cfg.TargetVocabulary = *v;
    if (auto v = get_opt<std::string>(config_json, "output_dir")) cfg.OutputDir = *v;
    if (auto v = get_opt<std::string>(config_json, "quantization")) cfg.Quantization = *v;
    if (auto v = get_opt<bool>(config_json, "force")) cfg.Force = *v;
    if (auto v = get_opt<std::string>(config_json, "unk_token")) cfg.UnknownToken = *v;
    if (auto v = get_opt<std::string>(config_json, "log_file")) cfg.LogFile = *v;
    if (auto it = config_json.find("verbosity"); it != config_json.end()) {
        auto level = as_verbosity(*it);
        if (!level) {
            throw ConfigurationError(fmt::format("invalid verbosity in {}: {}", file_name, it->dump()));
        }
        cfg.Verbosity = *level;
    }
    return cfg;
}

void save_conversion_config(const ConversionConfig& config, const char* file_name) {
    std::ofstream file(file_name);
    if (!file.is_open()) {
        throw std::runtime_error(fmt::format("could not open file for writing {}", file_name));
    }

    nlohmann::json config_json;
    config_json["model_path"] = config.ModelPath;
    config_json["model_type"] = config.ModelType;
    config_json["src_vocab"] = config.SourceVocabulary;
    config_json["tgt_vocab"] = config.TargetVocabulary;
    config_json["output_dir"] = config.OutputDir;
    config_json["quantization"] = config.Quantization;
    config_json["force"] = config.Force;
    config_json["unk_token"] = config.UnknownToken;
    if (!config.LogFile.empty()) {
        config_json["log_file"] = config.LogFile;
    }
    config_json["verbosity"] = config.Verbosity;

    file << config_json.dump(2) << '\n';
}

} // namespace nmtspec
