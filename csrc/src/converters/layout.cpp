// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "converters/layout.h"

namespace nmtspec::converters {

Tensor normalize_linear_weight(const Tensor& stored, bool transpose) {
    Tensor squeezed = squeeze(stored);
    if (transpose && squeezed.Rank == 2) {
        return nmtspec::transpose(squeezed);
    }
    return clone(squeezed);
}

void set_linear(specs::LinearSpec& spec, const Tensor& weight, const Tensor* bias, bool transpose) {
    spec.Weight = normalize_linear_weight(weight, transpose);
    spec.Bias = bias ? clone(squeeze(*bias)) : Tensor{};
}

void set_layer_norm(specs::LayerNormSpec& spec, const Tensor& gamma, const Tensor& beta) {
    spec.Gamma = clone(gamma);
    spec.Beta = clone(beta);
}

void set_embeddings(specs::EmbeddingsSpec& spec, const Tensor& weight) {
    spec.Weight = clone(weight);
    spec.ScaleBySqrtDepth = true;
}

} // namespace nmtspec::converters
