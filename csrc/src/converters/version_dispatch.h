// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef NMTSPEC_SRC_CONVERTERS_VERSION_DISPATCH_H
#define NMTSPEC_SRC_CONVERTERS_VERSION_DISPATCH_H

#include <string_view>

#include "checkpoint/variable_store.h"
#include "specs/transformer_spec.h"

namespace nmtspec {
class ConversionLogger;
}

namespace nmtspec::converters {

struct NamingConvention;

inline constexpr int kGeneration1 = 1;
inline constexpr int kGeneration2 = 2;

/**
 * @brief Detect the naming generation of a checkpoint.
 *
 * Generation 2 if @p file_name starts with "ckpt" or any variable carries the
 * attribute-value suffix, generation 1 otherwise.
 */
int detect_generation(const VariableStore& variables, std::string_view file_name);

//! Removes the attribute-value suffix from every variable name.
VariableStore normalize_variable_names(const VariableStore& variables);

//! @throws UnsupportedFormatError for an unknown generation.
const NamingConvention& naming_convention(int generation);

/**
 * @brief Populate @p spec from @p variables with the setters of @p generation.
 *
 * @throws UnsupportedFormatError for an unknown generation.
 */
void set_transformer_spec(specs::ModelSpec& spec, const VariableStore& variables, int generation,
                          ConversionLogger* logger = nullptr);

} // namespace nmtspec::converters

#endif //NMTSPEC_SRC_CONVERTERS_VERSION_DISPATCH_H
