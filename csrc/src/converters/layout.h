// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Normalization of stored tensor layouts into the layout of the spec tree.
// Every function here copies: the spec tree never aliases checkpoint storage.

#ifndef NMTSPEC_SRC_CONVERTERS_LAYOUT_H
#define NMTSPEC_SRC_CONVERTERS_LAYOUT_H

#include "specs/common_spec.h"

namespace nmtspec::converters {

//! Squeezes singleton dimensions and, if @p transpose, turns [in, out] into [out, in].
Tensor normalize_linear_weight(const Tensor& stored, bool transpose = true);

/**
 * @brief Fill a linear layer from its stored kernel and optional bias.
 *
 * @param bias May be null; the spec then stays bias-free.
 */
void set_linear(specs::LinearSpec& spec, const Tensor& weight, const Tensor* bias, bool transpose = true);

void set_layer_norm(specs::LayerNormSpec& spec, const Tensor& gamma, const Tensor& beta);

//! Copies the 2D table as-is and requests sqrt(depth) scaling.
void set_embeddings(specs::EmbeddingsSpec& spec, const Tensor& weight);

} // namespace nmtspec::converters

#endif //NMTSPEC_SRC_CONVERTERS_LAYOUT_H
