// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef NMTSPEC_SRC_CONVERTERS_OPENNMT_TF_CONVERTER_H
#define NMTSPEC_SRC_CONVERTERS_OPENNMT_TF_CONVERTER_H

#include <map>
#include <memory>
#include <optional>
#include <string>

#include "checkpoint/checkpoint_loader.h"
#include "checkpoint/vocabulary.h"
#include "specs/transformer_spec.h"
#include "utilities/logging.h"

namespace nmtspec::converters {

//! Where the trained variables come from. Exactly one member must be set.
struct ConverterInputs {
    std::optional<std::string> ModelPath;
    //! In-memory variables, named with the generation 2 convention.
    std::optional<std::map<std::string, Tensor>> Variables;
};

/**
 * @brief Converts a trained OpenNMT-tf transformer into a ModelSpec.
 *
 * The template fixes the architecture hyper-parameters (see model_catalog.h);
 * the number of layers is discovered from the checkpoint.
 */
class OpenNMTTFConverter {
public:
    /**
     * @throws ConfigurationError if both or neither of the inputs are set.
     */
    OpenNMTTFConverter(specs::ModelSpec model_template,
                       VocabularySource source_vocabulary,
                       VocabularySource target_vocabulary,
                       ConverterInputs inputs,
                       std::shared_ptr<const ICheckpointLoader> checkpoint_loader = nullptr,
                       std::shared_ptr<const IVocabularyReader> vocabulary_reader = nullptr,
                       std::shared_ptr<ConversionLogger> logger = nullptr);

    void set_unknown_token(std::string token) { mUnknownToken = std::move(token); }

    /**
     * @brief Run the conversion.
     *
     * Each call starts from a fresh copy of the template, so repeated calls
     * produce identical trees. Nothing is returned on failure.
     */
    [[nodiscard]] specs::ModelSpec convert() const;

private:
    specs::ModelSpec mTemplate;
    VocabularySource mSourceVocabulary;
    VocabularySource mTargetVocabulary;
    ConverterInputs mInputs;
    std::shared_ptr<const ICheckpointLoader> mCheckpointLoader;
    std::shared_ptr<const IVocabularyReader> mVocabularyReader;
    std::shared_ptr<ConversionLogger> mLogger;
    std::string mUnknownToken = kDefaultUnknownToken;
};

} // namespace nmtspec::converters

#endif //NMTSPEC_SRC_CONVERTERS_OPENNMT_TF_CONVERTER_H
