// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "converters/transformer_setters.h"

#include <initializer_list>
#include <vector>

#include <fmt/core.h>

#include "converters/layout.h"
#include "converters/linear_fusion.h"
#include "utilities/errors.h"
#include "utilities/logging.h"

namespace nmtspec::converters {

using specs::join_scope;

void set_linear(specs::LinearSpec& spec, const ScopeResolver& resolver, const std::string& scope, bool transpose) {
    const Tensor& kernel = resolver.require(join_scope(scope, "kernel"));
    Lookup bias = resolver.find(join_scope(scope, "bias"));
    set_linear(spec, kernel, bias.Value, transpose);
}

void set_layer_norm(specs::LayerNormSpec& spec, const ScopeResolver& resolver, const std::string& scope) {
    const Tensor& gamma = resolver.require(join_scope(scope, "gamma"));
    const Tensor& beta = resolver.require(join_scope(scope, "beta"));
    set_layer_norm(spec, gamma, beta);
}

std::string set_embeddings(specs::EmbeddingsSpec& spec, const ScopeResolver& resolver,
                           const NamingConvention& names, EModelSide side) {
    const char* role = side == EModelSide::Encoder ? "source embeddings" : "target embeddings";
    Lookup lookup = resolver.require_first_of(names.embedding_candidates(side), role);
    set_embeddings(spec, *lookup.Value);
    return lookup.Name;
}

void tie_projection(specs::DecoderSpec& spec, const ScopeResolver& resolver, const std::string& embedding_name,
                    const std::string& bias_name) {
    spec.Projection.Weight = squeeze(spec.Embeddings.Weight);
    Lookup bias = resolver.find(bias_name);
    spec.Projection.Bias = bias ? clone(squeeze(*bias.Value)) : Tensor{};
    spec.ProjectionSource = embedding_name;
}

namespace v1 {

namespace {

const NamingConvention& names() {
    return generation1_names();
}

} // namespace

void set_transformer_spec(specs::ModelSpec& spec, const ScopeResolver& resolver) {
    if (spec.WithRelativePosition) {
        throw UnsupportedFormatError(
            "Relative position representations are not supported for generation 1 checkpoints");
    }
    set_encoder(spec.Encoder, resolver);
    set_decoder(spec.Decoder, resolver);
}

void set_encoder(specs::EncoderSpec& spec, const ScopeResolver& resolver) {
    const std::string& scope = names().EncoderScope;
    set_layer_norm(spec.LayerNorm, resolver, join_scope(scope, names().StackLayerNorm));
    set_embeddings(spec.Embeddings, resolver, names(), EModelSide::Encoder);

    spec.Layers.resize(resolver.count_layers(names(), EModelSide::Encoder));
    for (int i = 0; i < static_cast<int>(spec.Layers.size()); ++i) {
        set_encoder_layer(spec.Layers[i], resolver, names().layer_scope(EModelSide::Encoder, i));
    }
}

void set_decoder(specs::DecoderSpec& spec, const ScopeResolver& resolver) {
    const std::string& scope = names().DecoderScope;
    std::string embedding_name = set_embeddings(spec.Embeddings, resolver, names(), EModelSide::Decoder);

    const std::string& dense = names().OutputProjectionScope;
    if (resolver.find(join_scope(dense, "kernel"))) {
        set_linear(spec.Projection, resolver, dense);
        spec.ProjectionSource = join_scope(dense, "kernel");
    } else {
        if (resolver.logger()) {
            resolver.logger()->log_fallback("output projection", join_scope(dense, "kernel"), embedding_name);
        }
        tie_projection(spec, resolver, embedding_name, names().TiedProjectionBiasName);
    }

    set_layer_norm(spec.LayerNorm, resolver, join_scope(scope, names().StackLayerNorm));

    spec.Layers.resize(resolver.count_layers(names(), EModelSide::Decoder));
    for (int i = 0; i < static_cast<int>(spec.Layers.size()); ++i) {
        set_decoder_layer(spec.Layers[i], resolver, names().layer_scope(EModelSide::Decoder, i));
    }
}

void set_encoder_layer(specs::EncoderLayerSpec& spec, const ScopeResolver& resolver, const std::string& scope) {
    set_ffn(spec.Ffn, resolver, scope);
    set_multi_head_attention(spec.SelfAttention, resolver, join_scope(scope, names().EncoderSelfAttention));
}

void set_decoder_layer(specs::DecoderLayerSpec& spec, const ScopeResolver& resolver, const std::string& scope) {
    set_ffn(spec.Ffn, resolver, scope);
    set_multi_head_attention(spec.SelfAttention, resolver, join_scope(scope, names().DecoderSelfAttention));
    set_multi_head_attention(spec.CrossAttention, resolver, join_scope(scope, names().CrossAttention));
}

void set_ffn(specs::FeedForwardSpec& spec, const ScopeResolver& resolver, const std::string& scope) {
    set_layer_norm(spec.LayerNorm, resolver, join_scope(scope, names().FfnLayerNorm));
    set_linear(spec.LinearIn, resolver, join_scope(scope, names().FfnInner));
    set_linear(spec.LinearOut, resolver, join_scope(scope, names().FfnOuter));
}

void set_multi_head_attention(specs::AttentionSpec& spec, const ScopeResolver& resolver, const std::string& scope) {
    set_layer_norm(spec.LayerNorm, resolver, join_scope(scope, names().AttentionLayerNorm));
    const auto& linears = spec.is_self_attention() ? names().SelfAttentionLinears : names().CrossAttentionLinears;
    for (std::size_t i = 0; i < spec.Linear.size(); ++i) {
        set_linear(spec.Linear[i], resolver, join_scope(scope, linears[i]));
    }
}

} // namespace v1

namespace v2 {

namespace {

const NamingConvention& names() {
    return generation2_names();
}

// indices into NamingConvention::SelfAttentionLinears / CrossAttentionLinears
constexpr int kQueries = 0;
constexpr int kKeys = 1;
constexpr int kValues = 2;
constexpr int kOutput = 3;

std::vector<specs::LinearSpec> read_linears(const ScopeResolver& resolver, const std::string& scope,
                                            const std::vector<std::string>& linears, std::initializer_list<int> which) {
    std::vector<specs::LinearSpec> parts;
    parts.reserve(which.size());
    for (int index : which) {
        set_linear(parts.emplace_back(), resolver, join_scope(scope, linears[index]));
    }
    return parts;
}

} // namespace

void set_transformer_spec(specs::ModelSpec& spec, const ScopeResolver& resolver) {
    set_embeddings(spec.Encoder.Embeddings, resolver, names(), EModelSide::Encoder);
    std::string target_embedding_name = set_embeddings(spec.Decoder.Embeddings, resolver, names(), EModelSide::Decoder);
    set_encoder(spec.Encoder, resolver, spec.WithRelativePosition);
    set_decoder(spec.Decoder, resolver, target_embedding_name, spec.WithRelativePosition);
}

void set_encoder(specs::EncoderSpec& spec, const ScopeResolver& resolver, bool relative) {
    set_layer_norm(spec.LayerNorm, resolver, join_scope(names().EncoderScope, names().StackLayerNorm));

    spec.Layers.resize(resolver.count_layers(names(), EModelSide::Encoder));
    for (int i = 0; i < static_cast<int>(spec.Layers.size()); ++i) {
        set_encoder_layer(spec.Layers[i], resolver, names().layer_scope(EModelSide::Encoder, i), relative);
    }
}

/**
 * @brief Fill the decoder stack and its output projection.
 *
 * An explicit output layer is read untransposed: if it is bit-for-bit the
 * target embedding table the projection is tied to it, otherwise it is a
 * regular [in, out] kernel and gets transposed. Without an output layer the
 * projection reuses @p target_embedding_name.
 */
void set_decoder(specs::DecoderSpec& spec, const ScopeResolver& resolver, const std::string& target_embedding_name,
                 bool relative) {
    const std::string& output_layer = names().OutputProjectionScope;
    const std::string kernel_name = join_scope(output_layer, "kernel");
    if (resolver.find(kernel_name)) {
        set_linear(spec.Projection, resolver, output_layer, false);
        if (bitwise_equal(spec.Projection.Weight, spec.Embeddings.Weight)) {
            spec.Projection.Weight = spec.Embeddings.Weight;
        } else {
            spec.Projection.Weight = transpose(spec.Projection.Weight);
        }
        spec.ProjectionSource = kernel_name;
    } else {
        if (resolver.logger()) {
            resolver.logger()->log_fallback("output projection", kernel_name, target_embedding_name);
        }
        tie_projection(spec, resolver, target_embedding_name, names().TiedProjectionBiasName);
    }

    set_layer_norm(spec.LayerNorm, resolver, join_scope(names().DecoderScope, names().StackLayerNorm));

    spec.Layers.resize(resolver.count_layers(names(), EModelSide::Decoder));
    for (int i = 0; i < static_cast<int>(spec.Layers.size()); ++i) {
        set_decoder_layer(spec.Layers[i], resolver, names().layer_scope(EModelSide::Decoder, i), relative);
    }
}

void set_encoder_layer(specs::EncoderLayerSpec& spec, const ScopeResolver& resolver, const std::string& scope,
                       bool relative) {
    set_ffn(spec.Ffn, resolver, scope);
    set_multi_head_attention(spec.SelfAttention, resolver, join_scope(scope, names().EncoderSelfAttention), relative);
}

void set_decoder_layer(specs::DecoderLayerSpec& spec, const ScopeResolver& resolver, const std::string& scope,
                       bool relative) {
    set_ffn(spec.Ffn, resolver, scope);
    set_multi_head_attention(spec.SelfAttention, resolver, join_scope(scope, names().DecoderSelfAttention), relative);
    set_multi_head_attention(spec.CrossAttention, resolver, join_scope(scope, names().CrossAttention), relative);
}

void set_ffn(specs::FeedForwardSpec& spec, const ScopeResolver& resolver, const std::string& scope) {
    set_layer_norm(spec.LayerNorm, resolver, join_scope(scope, names().FfnLayerNorm));
    set_linear(spec.LinearIn, resolver, join_scope(scope, names().FfnInner));
    set_linear(spec.LinearOut, resolver, join_scope(scope, names().FfnOuter));
}

void set_multi_head_attention(specs::AttentionSpec& spec, const ScopeResolver& resolver, const std::string& scope,
                              bool relative) {
    set_layer_norm(spec.LayerNorm, resolver, join_scope(scope, names().AttentionLayerNorm));

    if (spec.is_self_attention()) {
        const auto& linears = names().SelfAttentionLinears;
        fuse_linear(spec.Linear[0], read_linears(resolver, scope, linears, {kQueries, kKeys, kValues}));
        if (relative) {
            spec.RelativePositionKeys = clone(resolver.require(join_scope(scope, names().RelativePositionKeys)));
            spec.RelativePositionValues = clone(resolver.require(join_scope(scope, names().RelativePositionValues)));
        }
        set_linear(spec.Linear[1], resolver, join_scope(scope, linears[kOutput]));
    } else {
        const auto& linears = names().CrossAttentionLinears;
        set_linear(spec.Linear[0], resolver, join_scope(scope, linears[kQueries]));
        fuse_linear(spec.Linear[1], read_linears(resolver, scope, linears, {kKeys, kValues}));
        set_linear(spec.Linear[2], resolver, join_scope(scope, linears[kOutput]));
    }
}

} // namespace v2

} // namespace nmtspec::converters
