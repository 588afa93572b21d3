// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "converters/opennmt_tf_converter.h"

#include <fmt/core.h>

#include "converters/version_dispatch.h"
#include "utilities/errors.h"

namespace nmtspec::converters {

OpenNMTTFConverter::OpenNMTTFConverter(specs::ModelSpec model_template,
                                       VocabularySource source_vocabulary,
                                       VocabularySource target_vocabulary,
                                       ConverterInputs inputs,
                                       std::shared_ptr<const ICheckpointLoader> checkpoint_loader,
                                       std::shared_ptr<const IVocabularyReader> vocabulary_reader,
                                       std::shared_ptr<ConversionLogger> logger) :
    mTemplate(std::move(model_template)),
    mSourceVocabulary(std::move(source_vocabulary)),
    mTargetVocabulary(std::move(target_vocabulary)),
    mInputs(std::move(inputs)),
    mCheckpointLoader(std::move(checkpoint_loader)),
    mVocabularyReader(std::move(vocabulary_reader)),
    mLogger(std::move(logger))
{
    if (mInputs.ModelPath.has_value() == mInputs.Variables.has_value()) {
        throw ConfigurationError("Exactly one of model_path and variables should be set");
    }
    if (!mCheckpointLoader) mCheckpointLoader = std::make_shared<SafeTensorsCheckpointLoader>();
    if (!mVocabularyReader) mVocabularyReader = std::make_shared<FileVocabularyReader>();
    if (!mLogger) mLogger = std::make_shared<ConversionLogger>("", ConversionLogger::SILENT);
}

specs::ModelSpec OpenNMTTFConverter::convert() const {
    std::vector<std::string> source_tokens = load_vocabulary(mSourceVocabulary, *mVocabularyReader, mUnknownToken);
    std::vector<std::string> target_tokens = load_vocabulary(mTargetVocabulary, *mVocabularyReader, mUnknownToken);

    int generation = kGeneration2;
    VariableStore variables;
    if (mInputs.ModelPath) {
        auto section = mLogger->log_section_start(fmt::format("Loading checkpoint {}", *mInputs.ModelPath));
        LoadedCheckpoint checkpoint = mCheckpointLoader->load(*mInputs.ModelPath);
        generation = checkpoint.Generation;
        variables = std::move(checkpoint.Variables);
        mLogger->log_checkpoint(checkpoint.Path, generation, variables.size());
    } else {
        variables = normalize_variable_names(VariableStore(*mInputs.Variables));
        mLogger->log_checkpoint("<memory>", generation, variables.size());
    }

    specs::ModelSpec spec = mTemplate.empty_like();
    {
        auto section = mLogger->log_section_start("Building model specification");
        set_transformer_spec(spec, variables, generation, mLogger.get());
        spec.register_vocabulary("source", std::move(source_tokens));
        spec.register_vocabulary("target", std::move(target_tokens));
        spec.validate();
    }
    mLogger->log_spec(spec);
    return spec;
}

} // namespace nmtspec::converters
