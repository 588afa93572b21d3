// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Leaf nodes of the model specification tree.

#ifndef NMTSPEC_SRC_SPECS_COMMON_SPEC_H
#define NMTSPEC_SRC_SPECS_COMMON_SPEC_H

#include <functional>
#include <string>
#include <vector>

#include "utilities/tensor.h"

namespace nmtspec::specs {

//! Callback used to walk the variables of a spec subtree. The name is the
//! fully-qualified variable name (scope joined with '/').
using VariableVisitor = std::function<void(const std::string& name, const Tensor& value)>;

//! Collects violations found while validating a spec subtree.
using ValidationErrors = std::vector<std::string>;

std::string join_scope(const std::string& scope, const std::string& name);

struct EmbeddingsSpec {
    Tensor Weight;                   ///< [vocab_size, depth]
    bool ScaleBySqrtDepth = false;   ///< the engine multiplies lookups by sqrt(depth)

    void visit(const std::string& scope, const VariableVisitor& visitor) const;
    void validate(const std::string& scope, ValidationErrors& errors) const;
};

struct LinearSpec {
    Tensor Weight;   ///< [output_dim, input_dim]
    Tensor Bias;     ///< [output_dim], unset for bias-free projections

    [[nodiscard]] bool has_bias() const { return Bias.has_value(); }
    [[nodiscard]] long output_dim() const { return Weight.Rank == 2 ? Weight.Sizes[0] : 0; }
    [[nodiscard]] long input_dim() const { return Weight.Rank == 2 ? Weight.Sizes[1] : 0; }

    void visit(const std::string& scope, const VariableVisitor& visitor) const;
    void validate(const std::string& scope, ValidationErrors& errors) const;
};

struct LayerNormSpec {
    Tensor Gamma;
    Tensor Beta;

    void visit(const std::string& scope, const VariableVisitor& visitor) const;
    void validate(const std::string& scope, ValidationErrors& errors) const;
};

} // namespace nmtspec::specs

#endif //NMTSPEC_SRC_SPECS_COMMON_SPEC_H
