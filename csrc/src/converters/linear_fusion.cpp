// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "converters/linear_fusion.h"

#include <algorithm>
#include <stdexcept>

#include <fmt/core.h>

namespace nmtspec::converters {

void fuse_linear(specs::LinearSpec& target, const std::vector<specs::LinearSpec>& parts) {
    if (parts.empty()) {
        throw std::logic_error("fuse_linear: no projections to fuse");
    }

    std::vector<const Tensor*> weights;
    weights.reserve(parts.size());
    for (const auto& part : parts) {
        if (part.Weight.is_null()) {
            throw std::logic_error("fuse_linear: projection weight is not set");
        }
        if (part.Weight.Rank != 2 || part.Weight.Sizes[1] != parts.front().Weight.Sizes[1]) {
            throw std::logic_error(fmt::format("fuse_linear: input dimension mismatch, {} vs {}",
                                               shape_to_string(part.Weight), shape_to_string(parts.front().Weight)));
        }
        weights.push_back(&part.Weight);
    }
    target.Weight = concat_rows(weights);

    bool all_biased = std::all_of(parts.begin(), parts.end(), [](const specs::LinearSpec& p) { return p.has_bias(); });
    if (!all_biased) {
        target.Bias = Tensor{};
        return;
    }

    std::vector<const Tensor*> biases;
    biases.reserve(parts.size());
    for (const auto& part : parts) {
        biases.push_back(&part.Bias);
    }
    target.Bias = concat_rows(biases);
}

} // namespace nmtspec::converters
