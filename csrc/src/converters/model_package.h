// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// On-disk layout of a converted model:
//
//   <dir>/model.safetensors        weights under their spec names
//   <dir>/config.json              hyper-parameters and tensor aliases
//   <dir>/<name>_vocabulary.txt    one per registered vocabulary

#ifndef NMTSPEC_SRC_CONVERTERS_MODEL_PACKAGE_H
#define NMTSPEC_SRC_CONVERTERS_MODEL_PACKAGE_H

#include <cstddef>
#include <map>
#include <string>
#include <string_view>

#include "specs/transformer_spec.h"
#include "utilities/dtype.h"

namespace nmtspec {
class ConversionLogger;
}

namespace nmtspec::converters {

inline constexpr const char* kWeightsFileName = "model.safetensors";
inline constexpr const char* kConfigFileName = "config.json";

struct PackageOptions {
    //! "float32", "float16" or "bfloat16"; applies to floating-point variables.
    std::string Quantization = "float32";
    //! Allow writing into a non-empty directory.
    bool Force = false;
    std::string UnknownToken = "<unk>";
};

struct PackageSummary {
    std::size_t NumTensors = 0;
    //! alias name -> name of the stored tensor
    std::map<std::string, std::string> Aliases;
};

//! @throws ConfigurationError for an unknown quantization name.
ETensorDType quantization_dtype(std::string_view quantization);

/**
 * @brief Serialize a validated spec into @p output_dir.
 *
 * Variables that share storage with an already written variable are stored
 * once and recorded as aliases in the config.
 *
 * @throws ConfigurationError if @p output_dir exists, is not empty and
 *         options.Force is not set.
 */
PackageSummary write_model_package(const specs::ModelSpec& spec, const std::string& output_dir,
                                   const PackageOptions& options, ConversionLogger* logger = nullptr);

} // namespace nmtspec::converters

#endif //NMTSPEC_SRC_CONVERTERS_MODEL_PACKAGE_H
