// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "specs/common_spec.h"

#include <fmt/core.h>

namespace nmtspec::specs {

std::string join_scope(const std::string& scope, const std::string& name) {
    if (scope.empty()) return name;
    return scope + "/" + name;
}

void EmbeddingsSpec::visit(const std::string& scope, const VariableVisitor& visitor) const {
    visitor(join_scope(scope, "weight"), Weight);
}

void EmbeddingsSpec::validate(const std::string& scope, ValidationErrors& errors) const {
    const std::string name = join_scope(scope, "weight");
    if (Weight.is_null()) {
        errors.push_back(fmt::format("{} is not set", name));
    } else if (Weight.Rank != 2) {
        errors.push_back(fmt::format("{} should be 2D, got shape {}", name, shape_to_string(Weight)));
    }
}

void LinearSpec::visit(const std::string& scope, const VariableVisitor& visitor) const {
    visitor(join_scope(scope, "weight"), Weight);
    if (has_bias()) {
        visitor(join_scope(scope, "bias"), Bias);
    }
}

/**
 * @brief Check the weight is a 2D [out, in] matrix and the optional bias is [out].
 */
void LinearSpec::validate(const std::string& scope, ValidationErrors& errors) const {
    const std::string name = join_scope(scope, "weight");
    if (Weight.is_null()) {
        errors.push_back(fmt::format("{} is not set", name));
        return;
    }
    if (Weight.Rank != 2) {
        errors.push_back(fmt::format("{} should be 2D, got shape {}", name, shape_to_string(Weight)));
        return;
    }
    if (has_bias() && (Bias.Rank != 1 || Bias.Sizes[0] != Weight.Sizes[0])) {
        errors.push_back(fmt::format("{} has shape {} but the weight has {} output rows",
                                     join_scope(scope, "bias"), shape_to_string(Bias), Weight.Sizes[0]));
    }
}

void LayerNormSpec::visit(const std::string& scope, const VariableVisitor& visitor) const {
    visitor(join_scope(scope, "gamma"), Gamma);
    visitor(join_scope(scope, "beta"), Beta);
}

void LayerNormSpec::validate(const std::string& scope, ValidationErrors& errors) const {
    if (Gamma.is_null()) errors.push_back(fmt::format("{} is not set", join_scope(scope, "gamma")));
    if (Beta.is_null()) errors.push_back(fmt::format("{} is not set", join_scope(scope, "beta")));
    if (Gamma.has_value() && Beta.has_value() && Gamma.shape() != Beta.shape()) {
        errors.push_back(fmt::format("{}: gamma {} and beta {} differ in shape", scope,
                                     shape_to_string(Gamma), shape_to_string(Beta)));
    }
}

} // namespace nmtspec::specs
