// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Fusion of separately stored projections into one linear layer.
//
// Fused layout: weight [sum(out_i), in], rows in the order of the parts. For
// self-attention the parts are [Q, K, V], for cross-attention memory [K, V].

#ifndef NMTSPEC_SRC_CONVERTERS_LINEAR_FUSION_H
#define NMTSPEC_SRC_CONVERTERS_LINEAR_FUSION_H

#include <vector>

#include "specs/common_spec.h"

namespace nmtspec::converters {

/**
 * @brief Concatenate the weights (and biases) of @p parts into @p target.
 *
 * The fused bias is only set if every part has one; otherwise @p target ends
 * up bias-free.
 *
 * @throws std::logic_error if @p parts is empty or the parts disagree on
 *         input dimension or dtype.
 */
void fuse_linear(specs::LinearSpec& target, const std::vector<specs::LinearSpec>& parts);

} // namespace nmtspec::converters

#endif //NMTSPEC_SRC_CONVERTERS_LINEAR_FUSION_H
