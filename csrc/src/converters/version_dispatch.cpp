// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "converters/version_dispatch.h"

#include <fmt/core.h>

#include "converters/scope_resolver.h"
#include "converters/transformer_setters.h"
#include "utilities/errors.h"

namespace nmtspec::converters {

int detect_generation(const VariableStore& variables, std::string_view file_name) {
    if (file_name.starts_with("ckpt") || variables.any_name_ends_with(kVariableValueSuffix)) {
        return kGeneration2;
    }
    return kGeneration1;
}

VariableStore normalize_variable_names(const VariableStore& variables) {
    return variables.strip_suffix(kVariableValueSuffix);
}

const NamingConvention& naming_convention(int generation) {
    switch (generation) {
        case kGeneration1: return generation1_names();
        case kGeneration2: return generation2_names();
        default:
            throw UnsupportedFormatError(fmt::format("Unsupported checkpoint generation {}", generation));
    }
}

void set_transformer_spec(specs::ModelSpec& spec, const VariableStore& variables, int generation,
                          ConversionLogger* logger) {
    ScopeResolver resolver(variables, logger);
    switch (generation) {
        case kGeneration1:
            v1::set_transformer_spec(spec, resolver);
            break;
        case kGeneration2:
            v2::set_transformer_spec(spec, resolver);
            break;
        default:
            throw UnsupportedFormatError(fmt::format("Unsupported checkpoint generation {}", generation));
    }
}

} // namespace nmtspec::converters
