// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "converters/model_package.h"

#include <filesystem>
#include <fstream>
#include <vector>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "checkpoint/vocabulary.h"
#include "utilities/errors.h"
#include "utilities/logging.h"
#include "utilities/safetensors.h"
#include "utilities/utils.h"

namespace nmtspec::converters {

ETensorDType quantization_dtype(std::string_view quantization) {
    if (iequals(quantization, "float32")) return ETensorDType::FP32;
    if (iequals(quantization, "float16")) return ETensorDType::FP16;
    if (iequals(quantization, "bfloat16")) return ETensorDType::BF16;
    throw ConfigurationError(fmt::format(
        "Unsupported quantization '{}'. Supported values: float32, float16, bfloat16", quantization));
}

namespace {

void prepare_output_directory(const std::filesystem::path& dir, bool force) {
    if (std::filesystem::exists(dir)) {
        if (!std::filesystem::is_directory(dir)) {
            throw ConfigurationError(fmt::format("Output path {} exists and is not a directory", dir.string()));
        }
        if (!std::filesystem::is_empty(dir) && !force) {
            throw ConfigurationError(fmt::format(
                "Output directory {} is not empty; use --force to overwrite", dir.string()));
        }
    }
    std::filesystem::create_directories(dir);
}

void write_config(const specs::ModelSpec& spec, const PackageOptions& options, const PackageSummary& summary,
                  const std::filesystem::path& file_name) {
    nlohmann::json config;
    config["architecture"] = spec.Architecture;
    config["num_heads"] = spec.NumHeads;
    config["with_relative_position"] = spec.WithRelativePosition;
    config["shared_embeddings"] = spec.SharedEmbeddings;
    config["num_encoder_layers"] = spec.Encoder.Layers.size();
    config["num_decoder_layers"] = spec.Decoder.Layers.size();
    config["scale_embeddings"] = spec.Encoder.Embeddings.ScaleBySqrtDepth;
    config["projection_source"] = spec.Decoder.ProjectionSource;
    config["unk_token"] = options.UnknownToken;
    config["quantization"] = options.Quantization;
    config["aliases"] = summary.Aliases;

    nlohmann::json vocabularies = nlohmann::json::object();
    for (const auto& [name, tokens] : spec.Vocabularies) {
        vocabularies[name] = fmt::format("{}_vocabulary.txt", name);
    }
    config["vocabularies"] = vocabularies;

    std::ofstream file(file_name);
    if (!file.is_open()) {
        throw std::runtime_error(fmt::format("could not open file for writing {}", file_name.string()));
    }
    file << config.dump(2) << '\n';
    if (!file) {
        throw std::runtime_error(fmt::format("Error writing {}", file_name.string()));
    }
}

} // namespace

PackageSummary write_model_package(const specs::ModelSpec& spec, const std::string& output_dir,
                                   const PackageOptions& options, ConversionLogger* logger) {
    const ETensorDType target_dtype = quantization_dtype(options.Quantization);
    const std::filesystem::path dir(output_dir);
    prepare_output_directory(dir, options.Force);

    PackageSummary summary;
    SafeTensorWriter writer((dir / kWeightsFileName).string());

    // first name under which each storage block was written
    std::vector<std::pair<const Tensor*, std::string>> written;
    spec.visit([&](const std::string& name, const Tensor& value) {
        for (const auto& [tensor, stored_name] : written) {
            if (value.shares_storage_with(*tensor) && value.shape() == tensor->shape()) {
                summary.Aliases.emplace(name, stored_name);
                return;
            }
        }
        if (is_floating_point(value.DType)) {
            writer.register_tensor(name, convert_dtype(value, target_dtype));
        } else {
            writer.register_tensor(name, value);
        }
        written.emplace_back(&value, name);
        ++summary.NumTensors;
    });
    writer.set_metadata("architecture", spec.Architecture);
    writer.finalize();

    write_config(spec, options, summary, dir / kConfigFileName);
    for (const auto& [name, tokens] : spec.Vocabularies) {
        save_vocabulary(tokens, (dir / fmt::format("{}_vocabulary.txt", name)).string());
    }

    if (logger) {
        logger->log_message(fmt::format("Wrote {} tensors ({} aliases) to {}", summary.NumTensors,
                                        summary.Aliases.size(), dir.string()));
    }
    return summary;
}

} // namespace nmtspec::converters
