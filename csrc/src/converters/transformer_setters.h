// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Structural setters: one function per spec node, for each checkpoint
// generation. A parent setter resolves its own variables and then recurses
// into its children with an extended scope.

#ifndef NMTSPEC_SRC_CONVERTERS_TRANSFORMER_SETTERS_H
#define NMTSPEC_SRC_CONVERTERS_TRANSFORMER_SETTERS_H

#include <string>

#include "converters/scope_resolver.h"
#include "specs/transformer_spec.h"

namespace nmtspec::converters {

// Shared by both generations.

//! Reads `<scope>/kernel` and the optional `<scope>/bias`.
void set_linear(specs::LinearSpec& spec, const ScopeResolver& resolver, const std::string& scope,
                bool transpose = true);
//! Reads `<scope>/gamma` and `<scope>/beta`; both are required.
void set_layer_norm(specs::LayerNormSpec& spec, const ScopeResolver& resolver, const std::string& scope);

/**
 * @brief Fill embeddings from the first existing candidate name.
 *
 * @return The checkpoint name that supplied the table.
 */
std::string set_embeddings(specs::EmbeddingsSpec& spec, const ScopeResolver& resolver,
                           const NamingConvention& names, EModelSide side);

//! Ties the projection to the embedding table, reading the bias from @p bias_name if present.
void tie_projection(specs::DecoderSpec& spec, const ScopeResolver& resolver, const std::string& embedding_name,
                    const std::string& bias_name);

namespace v1 {

//! @throws UnsupportedFormatError if @p spec requests relative positions.
void set_transformer_spec(specs::ModelSpec& spec, const ScopeResolver& resolver);

void set_encoder(specs::EncoderSpec& spec, const ScopeResolver& resolver);
void set_decoder(specs::DecoderSpec& spec, const ScopeResolver& resolver);
void set_encoder_layer(specs::EncoderLayerSpec& spec, const ScopeResolver& resolver, const std::string& scope);
void set_decoder_layer(specs::DecoderLayerSpec& spec, const ScopeResolver& resolver, const std::string& scope);
void set_ffn(specs::FeedForwardSpec& spec, const ScopeResolver& resolver, const std::string& scope);

//! Generation 1 stores attention projections already fused: 2 for self, 3 for cross attention.
void set_multi_head_attention(specs::AttentionSpec& spec, const ScopeResolver& resolver, const std::string& scope);

} // namespace v1

namespace v2 {

void set_transformer_spec(specs::ModelSpec& spec, const ScopeResolver& resolver);

void set_encoder(specs::EncoderSpec& spec, const ScopeResolver& resolver, bool relative);
void set_decoder(specs::DecoderSpec& spec, const ScopeResolver& resolver, const std::string& target_embedding_name,
                 bool relative);
void set_encoder_layer(specs::EncoderLayerSpec& spec, const ScopeResolver& resolver, const std::string& scope,
                       bool relative);
void set_decoder_layer(specs::DecoderLayerSpec& spec, const ScopeResolver& resolver, const std::string& scope,
                       bool relative);
void set_ffn(specs::FeedForwardSpec& spec, const ScopeResolver& resolver, const std::string& scope);

/**
 * @brief Fill an attention block from separately stored projections.
 *
 * Self-attention fuses Q, K and V into one projection; cross-attention keeps
 * Q separate and fuses K and V. Relative position tables are read for
 * self-attention only, and only if @p relative.
 */
void set_multi_head_attention(specs::AttentionSpec& spec, const ScopeResolver& resolver, const std::string& scope,
                              bool relative);

} // namespace v2

} // namespace nmtspec::converters

#endif //NMTSPEC_SRC_CONVERTERS_TRANSFORMER_SETTERS_H
