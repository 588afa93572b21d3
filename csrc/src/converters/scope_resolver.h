// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Name resolution against a checkpoint. Names are composed from a scope and
// the naming table of the checkpoint generation, then looked up exactly.
// A fallback chain is a list of candidate names tried in order.

#ifndef NMTSPEC_SRC_CONVERTERS_SCOPE_RESOLVER_H
#define NMTSPEC_SRC_CONVERTERS_SCOPE_RESOLVER_H

#include <string>
#include <string_view>
#include <vector>

#include "checkpoint/variable_store.h"

namespace nmtspec {
class ConversionLogger;
}

namespace nmtspec::converters {

enum class EModelSide {
    Encoder,
    Decoder
};

/**
 * @brief Variable naming scheme of one checkpoint generation.
 *
 * All entries are relative path components except the *Scope and *Name
 * entries, which are fully qualified.
 */
struct NamingConvention {
    int Generation;

    std::string EncoderScope;
    std::string DecoderScope;
    std::string LayerPrefix;            ///< prepended to the layer index
    std::string StackLayerNorm;         ///< final layer norm of a stack

    std::string EncoderSelfAttention;
    std::string DecoderSelfAttention;
    std::string CrossAttention;
    std::string AttentionLayerNorm;
    std::vector<std::string> SelfAttentionLinears;   ///< stored projections, in order
    std::vector<std::string> CrossAttentionLinears;
    std::string RelativePositionKeys;
    std::string RelativePositionValues;

    std::string FfnLayerNorm;
    std::string FfnInner;
    std::string FfnOuter;

    std::string EmbeddingTensor;        ///< tensor name inside an embedding scope
    std::string OutputProjectionScope;
    std::string TiedProjectionBiasName; ///< bias used when the projection reuses the embeddings

    [[nodiscard]] const std::string& stack_scope(EModelSide side) const {
        return side == EModelSide::Encoder ? EncoderScope : DecoderScope;
    }
    [[nodiscard]] const std::string& self_attention(EModelSide side) const {
        return side == EModelSide::Encoder ? EncoderSelfAttention : DecoderSelfAttention;
    }

    [[nodiscard]] std::string layer_scope(EModelSide side, int index) const;

    //! Name whose presence marks layer @p index as existing.
    [[nodiscard]] std::string layer_probe(EModelSide side, int index) const;

    //! Embedding names for @p side, most specific first.
    [[nodiscard]] std::vector<std::string> embedding_candidates(EModelSide side) const;
};

//! Naming table of generation 1 (`transformer/...`).
const NamingConvention& generation1_names();
//! Naming table of generation 2 (`model/...`).
const NamingConvention& generation2_names();

//! Result of a lookup: the tensor if found, and the name that was tried last.
struct Lookup {
    const Tensor* Value = nullptr;
    std::string Name;

    [[nodiscard]] bool found() const { return Value != nullptr; }
    explicit operator bool() const { return found(); }
};

class ScopeResolver {
public:
    explicit ScopeResolver(const VariableStore& variables, ConversionLogger* logger = nullptr);

    [[nodiscard]] Lookup find(const std::string& name) const;

    /**
     * @brief Try @p candidates in order and return the first hit.
     *
     * On a miss the result carries the last candidate. A hit on any but the
     * first candidate is logged as a fallback for @p role.
     */
    [[nodiscard]] Lookup first_of(const std::vector<std::string>& candidates, std::string_view role = {}) const;

    //! @throws MissingVariableError naming @p name.
    [[nodiscard]] const Tensor& require(const std::string& name) const;

    //! @throws MissingVariableError naming the last candidate.
    [[nodiscard]] Lookup require_first_of(const std::vector<std::string>& candidates, std::string_view role = {}) const;

    //! Number of consecutive layers starting at index 0.
    [[nodiscard]] int count_layers(const NamingConvention& names, EModelSide side) const;

    [[nodiscard]] const VariableStore& variables() const { return mVariables; }
    [[nodiscard]] ConversionLogger* logger() const { return mLogger; }

private:
    const VariableStore& mVariables;
    ConversionLogger* mLogger;
};

} // namespace nmtspec::converters

#endif //NMTSPEC_SRC_CONVERTERS_SCOPE_RESOLVER_H
