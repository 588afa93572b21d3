// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "specs/transformer_spec.h"

#include <fmt/core.h>
#include <fmt/ranges.h>

#include "utilities/errors.h"

namespace nmtspec::specs {

namespace {

std::string linear_scope(const std::string& scope, std::size_t index) {
    return join_scope(scope, fmt::format("linear_{}", index));
}

std::string layer_scope(const std::string& scope, std::size_t index) {
    return join_scope(scope, fmt::format("layer_{}", index));
}

} // namespace

void AttentionSpec::visit(const std::string& scope, const VariableVisitor& visitor) const {
    LayerNorm.visit(join_scope(scope, "layer_norm"), visitor);
    for (std::size_t i = 0; i < Linear.size(); ++i) {
        Linear[i].visit(linear_scope(scope, i), visitor);
    }
    if (RelativePositionKeys.has_value()) {
        visitor(join_scope(scope, "relative_position_keys"), RelativePositionKeys);
    }
    if (RelativePositionValues.has_value()) {
        visitor(join_scope(scope, "relative_position_values"), RelativePositionValues);
    }
}

/**
 * @brief Validate the projections, their arity and the relative position tables.
 *
 * Fused projections must agree on the input dimension of the output projection:
 * the QKV (or Q) output is split per head and the output projection consumes
 * one head-concatenated vector.
 */
void AttentionSpec::validate(const std::string& scope, bool with_relative_position, ValidationErrors& errors) const {
    LayerNorm.validate(join_scope(scope, "layer_norm"), errors);
    if (Linear.size() != kSelfAttentionProjections && Linear.size() != kCrossAttentionProjections) {
        errors.push_back(fmt::format("{} has {} projections, expected {} or {}", scope, Linear.size(),
                                     kSelfAttentionProjections, kCrossAttentionProjections));
        return;
    }
    for (std::size_t i = 0; i < Linear.size(); ++i) {
        Linear[i].validate(linear_scope(scope, i), errors);
    }

    if (is_self_attention()) {
        const LinearSpec& qkv = Linear[0];
        if (qkv.Weight.Rank == 2 && qkv.output_dim() % 3 != 0) {
            errors.push_back(fmt::format("{}: fused QKV output dimension {} is not divisible by 3",
                                         linear_scope(scope, 0), qkv.output_dim()));
        }
        if (with_relative_position) {
            if (RelativePositionKeys.is_null())
                errors.push_back(fmt::format("{} is not set", join_scope(scope, "relative_position_keys")));
            if (RelativePositionValues.is_null())
                errors.push_back(fmt::format("{} is not set", join_scope(scope, "relative_position_values")));
        }
    } else {
        const LinearSpec& kv = Linear[1];
        if (kv.Weight.Rank == 2 && kv.output_dim() % 2 != 0) {
            errors.push_back(fmt::format("{}: fused KV output dimension {} is not divisible by 2",
                                         linear_scope(scope, 1), kv.output_dim()));
        }
    }
}

void FeedForwardSpec::visit(const std::string& scope, const VariableVisitor& visitor) const {
    LayerNorm.visit(join_scope(scope, "layer_norm"), visitor);
    LinearIn.visit(linear_scope(scope, 0), visitor);
    LinearOut.visit(linear_scope(scope, 1), visitor);
}

void FeedForwardSpec::validate(const std::string& scope, ValidationErrors& errors) const {
    LayerNorm.validate(join_scope(scope, "layer_norm"), errors);
    LinearIn.validate(linear_scope(scope, 0), errors);
    LinearOut.validate(linear_scope(scope, 1), errors);
    if (LinearIn.Weight.Rank == 2 && LinearOut.Weight.Rank == 2 && LinearIn.output_dim() != LinearOut.input_dim()) {
        errors.push_back(fmt::format("{}: inner dimension mismatch ({} vs {})", scope,
                                     LinearIn.output_dim(), LinearOut.input_dim()));
    }
}

void EncoderLayerSpec::visit(const std::string& scope, const VariableVisitor& visitor) const {
    SelfAttention.visit(join_scope(scope, "self_attention"), visitor);
    Ffn.visit(join_scope(scope, "ffn"), visitor);
}

void EncoderLayerSpec::validate(const std::string& scope, bool with_relative_position, ValidationErrors& errors) const {
    SelfAttention.validate(join_scope(scope, "self_attention"), with_relative_position, errors);
    Ffn.validate(join_scope(scope, "ffn"), errors);
}

void DecoderLayerSpec::visit(const std::string& scope, const VariableVisitor& visitor) const {
    SelfAttention.visit(join_scope(scope, "self_attention"), visitor);
    CrossAttention.visit(join_scope(scope, "attention"), visitor);
    Ffn.visit(join_scope(scope, "ffn"), visitor);
}

void DecoderLayerSpec::validate(const std::string& scope, bool with_relative_position, ValidationErrors& errors) const {
    SelfAttention.validate(join_scope(scope, "self_attention"), with_relative_position, errors);
    // relative positions only apply to self-attention
    CrossAttention.validate(join_scope(scope, "attention"), false, errors);
    Ffn.validate(join_scope(scope, "ffn"), errors);
}

void EncoderSpec::visit(const std::string& scope, const VariableVisitor& visitor) const {
    Embeddings.visit(join_scope(scope, "embeddings"), visitor);
    LayerNorm.visit(join_scope(scope, "layer_norm"), visitor);
    for (std::size_t i = 0; i < Layers.size(); ++i) {
        Layers[i].visit(layer_scope(scope, i), visitor);
    }
}

void EncoderSpec::validate(const std::string& scope, bool with_relative_position, ValidationErrors& errors) const {
    Embeddings.validate(join_scope(scope, "embeddings"), errors);
    LayerNorm.validate(join_scope(scope, "layer_norm"), errors);
    if (Layers.empty()) {
        errors.push_back(fmt::format("{} has no layers", scope));
    }
    for (std::size_t i = 0; i < Layers.size(); ++i) {
        Layers[i].validate(layer_scope(scope, i), with_relative_position, errors);
    }
}

void DecoderSpec::visit(const std::string& scope, const VariableVisitor& visitor) const {
    Embeddings.visit(join_scope(scope, "embeddings"), visitor);
    LayerNorm.visit(join_scope(scope, "layer_norm"), visitor);
    for (std::size_t i = 0; i < Layers.size(); ++i) {
        Layers[i].visit(layer_scope(scope, i), visitor);
    }
    Projection.visit(join_scope(scope, "projection"), visitor);
}

void DecoderSpec::validate(const std::string& scope, bool with_relative_position, ValidationErrors& errors) const {
    Embeddings.validate(join_scope(scope, "embeddings"), errors);
    LayerNorm.validate(join_scope(scope, "layer_norm"), errors);
    if (Layers.empty()) {
        errors.push_back(fmt::format("{} has no layers", scope));
    }
    for (std::size_t i = 0; i < Layers.size(); ++i) {
        Layers[i].validate(layer_scope(scope, i), with_relative_position, errors);
    }
    Projection.validate(join_scope(scope, "projection"), errors);
    if (Projection.Weight.Rank == 2 && Embeddings.Weight.Rank == 2 &&
        Projection.input_dim() != Embeddings.Weight.Sizes[1]) {
        errors.push_back(fmt::format("{}: projection input dimension {} does not match the embedding depth {}",
                                     scope, Projection.input_dim(), Embeddings.Weight.Sizes[1]));
    }
}

void ModelSpec::register_vocabulary(const std::string& name, std::vector<std::string> tokens) {
    Vocabularies[name] = std::move(tokens);
}

void ModelSpec::visit(const VariableVisitor& visitor) const {
    Encoder.visit("encoder", visitor);
    Decoder.visit("decoder", visitor);
}

/**
 * @brief Validate the whole tree.
 *
 * @throws SpecValidationError with one line per violation.
 */
void ModelSpec::validate() const {
    ValidationErrors errors;
    Encoder.validate("encoder", WithRelativePosition, errors);
    Decoder.validate("decoder", WithRelativePosition, errors);
    if (SharedEmbeddings && Encoder.Embeddings.Weight.has_value() && Decoder.Embeddings.Weight.has_value() &&
        !bitwise_equal(Encoder.Embeddings.Weight, Decoder.Embeddings.Weight)) {
        errors.push_back(fmt::format("{} shares its embeddings, but encoder {} and decoder {} differ", Architecture,
                                     shape_to_string(Encoder.Embeddings.Weight),
                                     shape_to_string(Decoder.Embeddings.Weight)));
    }

    if (errors.empty()) return;
    throw SpecValidationError(fmt::format("Invalid model specification:\n  {}", fmt::join(errors, "\n  ")));
}

ModelSpec ModelSpec::empty_like() const {
    ModelSpec spec;
    spec.Architecture = Architecture;
    spec.NumHeads = NumHeads;
    spec.WithRelativePosition = WithRelativePosition;
    spec.SharedEmbeddings = SharedEmbeddings;
    return spec;
}

} // namespace nmtspec::specs
