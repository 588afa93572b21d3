// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef NMTSPEC_SRC_CONFIG_CONVERSION_CONFIG_H
#define NMTSPEC_SRC_CONFIG_CONVERSION_CONFIG_H

#include <string>

namespace nmtspec {

/**
 * @brief Settings of one conversion run.
 *
 * Can be read from a JSON file; command-line flags override the values read.
 * JSON keys are the snake_case names of the fields (model_path, model_type,
 * src_vocab, tgt_vocab, output_dir, quantization, force, unk_token, log_file,
 * verbosity).
 */
struct ConversionConfig {
    std::string ModelPath;
    std::string ModelType;
    std::string SourceVocabulary;
    std::string TargetVocabulary;
    std::string OutputDir;
    std::string Quantization = "float32";
    bool Force = false;
    std::string UnknownToken = "<unk>";
    std::string LogFile;
    //! -2 silent, -1 quiet, 0 default, 1 verbose
    int Verbosity = 0;

    //! @throws ConfigurationError naming the first invalid or missing setting.
    void validate() const;
};

ConversionConfig load_conversion_config(const char* file_name);
void save_conversion_config(const ConversionConfig& config, const char* file_name);

} // namespace nmtspec

#endif //NMTSPEC_SRC_CONFIG_CONVERSION_CONFIG_H
