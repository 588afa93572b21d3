// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "converters/scope_resolver.h"

#include <stdexcept>

#include <fmt/core.h>

#include "specs/common_spec.h"
#include "utilities/errors.h"
#include "utilities/logging.h"

namespace nmtspec::converters {

using specs::join_scope;

std::string NamingConvention::layer_scope(EModelSide side, int index) const {
    return join_scope(stack_scope(side), fmt::format("{}{}", LayerPrefix, index));
}

std::string NamingConvention::layer_probe(EModelSide side, int index) const {
    return join_scope(join_scope(join_scope(layer_scope(side, index), self_attention(side)), AttentionLayerNorm),
                      "gamma");
}

std::vector<std::string> NamingConvention::embedding_candidates(EModelSide side) const {
    if (Generation == 1) {
        return {
            join_scope(stack_scope(side), EmbeddingTensor),
            join_scope("transformer/shared_embeddings", EmbeddingTensor),
        };
    }
    const std::string features = join_scope("model/examples_inputter/features_inputter", EmbeddingTensor);
    if (side == EModelSide::Encoder) {
        return {features};
    }
    return {join_scope("model/examples_inputter/labels_inputter", EmbeddingTensor), features};
}

const NamingConvention& generation1_names() {
    static const NamingConvention kNames = {
        .Generation = 1,
        .EncoderScope = "transformer/encoder",
        .DecoderScope = "transformer/decoder",
        .LayerPrefix = "layer_",
        .StackLayerNorm = "LayerNorm",
        .EncoderSelfAttention = "multi_head",
        .DecoderSelfAttention = "masked_multi_head",
        .CrossAttention = "multi_head",
        .AttentionLayerNorm = "LayerNorm",
        .SelfAttentionLinears = {"conv1d", "conv1d_1"},
        .CrossAttentionLinears = {"conv1d", "conv1d_1", "conv1d_2"},
        .RelativePositionKeys = {},
        .RelativePositionValues = {},
        .FfnLayerNorm = "ffn/LayerNorm",
        .FfnInner = "ffn/conv1d",
        .FfnOuter = "ffn/conv1d_1",
        .EmbeddingTensor = "w_embs",
        .OutputProjectionScope = "transformer/decoder/dense",
        .TiedProjectionBiasName = "transformer/bias",
    };
    return kNames;
}

const NamingConvention& generation2_names() {
    static const NamingConvention kNames = {
        .Generation = 2,
        .EncoderScope = "model/encoder",
        .DecoderScope = "model/decoder",
        .LayerPrefix = "layers/",
        .StackLayerNorm = "layer_norm",
        .EncoderSelfAttention = "self_attention",
        .DecoderSelfAttention = "self_attention",
        .CrossAttention = "attention/0",
        .AttentionLayerNorm = "input_layer_norm",
        .SelfAttentionLinears = {"layer/linear_queries", "layer/linear_keys", "layer/linear_values",
                                 "layer/linear_output"},
        .CrossAttentionLinears = {"layer/linear_queries", "layer/linear_keys", "layer/linear_values",
                                  "layer/linear_output"},
        .RelativePositionKeys = "layer/relative_position_keys",
        .RelativePositionValues = "layer/relative_position_values",
        .FfnLayerNorm = "ffn/input_layer_norm",
        .FfnInner = "ffn/layer/inner",
        .FfnOuter = "ffn/layer/outer",
        .EmbeddingTensor = "embedding",
        .OutputProjectionScope = "model/decoder/output_layer",
        .TiedProjectionBiasName = "model/decoder/output_layer/bias",
    };
    return kNames;
}

ScopeResolver::ScopeResolver(const VariableStore& variables, ConversionLogger* logger) :
    mVariables(variables), mLogger(logger)
{
}

Lookup ScopeResolver::find(const std::string& name) const {
    return Lookup{mVariables.find(name), name};
}

Lookup ScopeResolver::first_of(const std::vector<std::string>& candidates, std::string_view role) const {
    if (candidates.empty()) {
        throw std::logic_error("first_of: empty candidate list");
    }
    for (std::size_t i = 0; i < candidates.size(); ++i) {
        Lookup lookup = find(candidates[i]);
        if (!lookup) continue;
        if (i > 0 && mLogger) {
            mLogger->log_fallback(role.empty() ? std::string_view(candidates.front()) : role,
                                  candidates.front(), lookup.Name);
        }
        return lookup;
    }
    return Lookup{nullptr, candidates.back()};
}

const Tensor& ScopeResolver::require(const std::string& name) const {
    const Tensor* value = mVariables.find(name);
    if (!value) {
        throw MissingVariableError(name);
    }
    return *value;
}

Lookup ScopeResolver::require_first_of(const std::vector<std::string>& candidates, std::string_view role) const {
    Lookup lookup = first_of(candidates, role);
    if (!lookup) {
        throw MissingVariableError(lookup.Name);
    }
    return lookup;
}

int ScopeResolver::count_layers(const NamingConvention& names, EModelSide side) const {
    int count = 0;
    while (mVariables.contains(names.layer_probe(side, count))) {
        ++count;
    }
    return count;
}

} // namespace nmtspec::converters
