// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Specification tree of a transformer encoder/decoder model, as expected by the
// inference engine. The tree is created empty, filled by the converter in one
// pass and then treated as read-only.
//
//   ModelSpec
//   ├── EncoderSpec: embeddings, layer_norm, layers[EncoderLayerSpec]
//   │                                         └── self_attention, ffn
//   └── DecoderSpec: embeddings, layer_norm, layers[DecoderLayerSpec], projection
//                                             └── self_attention, attention, ffn

#ifndef NMTSPEC_SRC_SPECS_TRANSFORMER_SPEC_H
#define NMTSPEC_SRC_SPECS_TRANSFORMER_SPEC_H

#include <map>
#include <string>
#include <vector>

#include "specs/common_spec.h"

namespace nmtspec::specs {

/**
 * @brief Multi-head attention block.
 *
 * Self-attention holds 2 projections: fused QKV, output.
 * Cross-attention holds 3 projections: query, fused KV, output.
 */
struct AttentionSpec {
    static constexpr int kSelfAttentionProjections = 2;
    static constexpr int kCrossAttentionProjections = 3;

    explicit AttentionSpec(int num_projections) : Linear(num_projections) {}

    LayerNormSpec LayerNorm;
    std::vector<LinearSpec> Linear;
    Tensor RelativePositionKeys;     ///< only set for relative position models
    Tensor RelativePositionValues;

    [[nodiscard]] bool is_self_attention() const {
        return Linear.size() == kSelfAttentionProjections;
    }

    void visit(const std::string& scope, const VariableVisitor& visitor) const;
    void validate(const std::string& scope, bool with_relative_position, ValidationErrors& errors) const;
};

struct FeedForwardSpec {
    LayerNormSpec LayerNorm;
    LinearSpec LinearIn;
    LinearSpec LinearOut;

    void visit(const std::string& scope, const VariableVisitor& visitor) const;
    void validate(const std::string& scope, ValidationErrors& errors) const;
};

struct EncoderLayerSpec {
    AttentionSpec SelfAttention{AttentionSpec::kSelfAttentionProjections};
    FeedForwardSpec Ffn;

    void visit(const std::string& scope, const VariableVisitor& visitor) const;
    void validate(const std::string& scope, bool with_relative_position, ValidationErrors& errors) const;
};

struct DecoderLayerSpec {
    AttentionSpec SelfAttention{AttentionSpec::kSelfAttentionProjections};
    AttentionSpec CrossAttention{AttentionSpec::kCrossAttentionProjections};
    FeedForwardSpec Ffn;

    void visit(const std::string& scope, const VariableVisitor& visitor) const;
    void validate(const std::string& scope, bool with_relative_position, ValidationErrors& errors) const;
};

struct EncoderSpec {
    EmbeddingsSpec Embeddings;
    LayerNormSpec LayerNorm;
    std::vector<EncoderLayerSpec> Layers;

    void visit(const std::string& scope, const VariableVisitor& visitor) const;
    void validate(const std::string& scope, bool with_relative_position, ValidationErrors& errors) const;
};

struct DecoderSpec {
    EmbeddingsSpec Embeddings;
    LayerNormSpec LayerNorm;
    std::vector<DecoderLayerSpec> Layers;
    LinearSpec Projection;

    //! Checkpoint variable that supplied Projection.Weight.
    std::string ProjectionSource;

    //! True if the output projection reuses the target embedding storage.
    [[nodiscard]] bool projection_is_tied() const {
        return Projection.Weight.shares_storage_with(Embeddings.Weight);
    }

    void visit(const std::string& scope, const VariableVisitor& visitor) const;
    void validate(const std::string& scope, bool with_relative_position, ValidationErrors& errors) const;
};

/**
 * @brief Root of the specification tree.
 *
 * Architecture, NumHeads, WithRelativePosition and SharedEmbeddings come from
 * the model template (see model_catalog.h); everything else is filled in by the
 * converter.
 */
struct ModelSpec {
    std::string Architecture;
    int NumHeads = 8;
    bool WithRelativePosition = false;
    //! Encoder and decoder must hold the same embedding table.
    bool SharedEmbeddings = false;

    EncoderSpec Encoder;
    DecoderSpec Decoder;

    std::map<std::string, std::vector<std::string>> Vocabularies;

    void register_vocabulary(const std::string& name, std::vector<std::string> tokens);

    //! Walks all set variables in a deterministic order.
    void visit(const VariableVisitor& visitor) const;

    //! Throws SpecValidationError listing every violation.
    void validate() const;

    //! An empty copy carrying only the template fields.
    [[nodiscard]] ModelSpec empty_like() const;
};

} // namespace nmtspec::specs

#endif //NMTSPEC_SRC_SPECS_TRANSFORMER_SPEC_H
