// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>
#include <fmt/core.h>

#include "checkpoint/checkpoint_loader.h"
#include "checkpoint/vocabulary.h"
#include "config/conversion_config.h"
#include "converters/model_package.h"
#include "converters/opennmt_tf_converter.h"
#include "specs/model_catalog.h"
#include "utilities/logging.h"

/**
 * @brief Command-line front end: option parsing, conversion and packaging.
 *
 * Options are read from an optional JSON config file first; flags given on
 * the command line override them.
 */
struct ConversionRunner {
    nmtspec::ConversionConfig Config;

    void load_conversion_config(int argc, const char** argv);
    void run(int argc, const char** argv);
};

void ConversionRunner::load_conversion_config(int argc, const char** argv) {
    CLI::App app{"Convert an OpenNMT-tf transformer checkpoint into an inference model package"};

    std::string config_file;
    nmtspec::ConversionConfig cli;
    bool verbose = false;
    bool quiet = false;

    app.add_option("--config", config_file, "JSON file with conversion settings")->check(CLI::ExistingFile);
    app.add_option("--model_path,--model-path", cli.ModelPath,
                   "Checkpoint file, checkpoint prefix or model directory");
    std::vector<std::string> model_types;
    for (auto name : nmtspec::specs::supported_model_types()) model_types.emplace_back(name);
    app.add_option("--model_type,--model-type", cli.ModelType, "Model type")->check(CLI::IsMember(model_types));
    app.add_option("--src_vocab,--src-vocab", cli.SourceVocabulary, "Source vocabulary file");
    app.add_option("--tgt_vocab,--tgt-vocab", cli.TargetVocabulary, "Target vocabulary file");
    app.add_option("--output_dir,--output-dir", cli.OutputDir, "Output model directory");
    app.add_option("--quantization", cli.Quantization, "Weight type of the converted model")
        ->check(CLI::IsMember({"float32", "float16", "bfloat16"}, CLI::ignore_case));
    app.add_flag("--force", cli.Force, "Overwrite the output directory if it is not empty");
    app.add_option("--unk_token,--unk-token", cli.UnknownToken, "Unknown token appended to the vocabularies");
    app.add_option("--log_file,--log-file", cli.LogFile, "Write a JSON log of the conversion to this file");
    auto verbose_opt = app.add_flag("-v,--verbose", verbose, "List every converted variable");
    app.add_flag("-q,--quiet", quiet, "Only print warnings and errors")->excludes(verbose_opt);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e));
    }

    if (!config_file.empty()) {
        Config = nmtspec::load_conversion_config(config_file.c_str());
    }

    if (app.count("--model_path")) Config.ModelPath = cli.ModelPath;
    if (app.count("--model_type")) Config.ModelType = cli.ModelType;
    if (app.count("--src_vocab")) Config.SourceVocabulary = cli.SourceVocabulary;
    if (app.count("--tgt_vocab")) Config.TargetVocabulary = cli.TargetVocabulary;
    if (app.count("--output_dir")) Config.OutputDir = cli.OutputDir;
    if (app.count("--quantization")) Config.Quantization = cli.Quantization;
    if (app.count("--force")) Config.Force = cli.Force;
    if (app.count("--unk_token")) Config.UnknownToken = cli.UnknownToken;
    if (app.count("--log_file")) Config.LogFile = cli.LogFile;
    if (verbose) Config.Verbosity = nmtspec::ConversionLogger::VERBOSE;
    if (quiet) Config.Verbosity = nmtspec::ConversionLogger::QUIET;

    Config.validate();
}

void ConversionRunner::run(int argc, const char** argv) {
    using namespace nmtspec;

    auto logger = std::make_shared<ConversionLogger>(Config.LogFile,
                                                     static_cast<ConversionLogger::EVerbosity>(Config.Verbosity));
    logger->log_cmd(argc, argv);
    logger->log_options({
        {"model_path", Config.ModelPath},
        {"model_type", Config.ModelType},
        {"src_vocab", Config.SourceVocabulary},
        {"tgt_vocab", Config.TargetVocabulary},
        {"output_dir", Config.OutputDir},
        {"quantization", Config.Quantization},
        {"force", Config.Force},
        {"unk_token", Config.UnknownToken},
        {"verbosity", static_cast<std::int64_t>(Config.Verbosity)},
    });

    converters::OpenNMTTFConverter converter(
        specs::create_model_spec(Config.ModelType),
        VocabularyPath{Config.SourceVocabulary},
        VocabularyPath{Config.TargetVocabulary},
        converters::ConverterInputs{.ModelPath = Config.ModelPath, .Variables = std::nullopt},
        std::make_shared<SafeTensorsCheckpointLoader>(),
        std::make_shared<FileVocabularyReader>(),
        logger);
    converter.set_unknown_token(Config.UnknownToken);
    specs::ModelSpec spec = converter.convert();

    converters::PackageOptions options;
    options.Quantization = Config.Quantization;
    options.Force = Config.Force;
    options.UnknownToken = Config.UnknownToken;
    {
        auto section = logger->log_section_start(fmt::format("Writing model to {}", Config.OutputDir));
        converters::write_model_package(spec, Config.OutputDir, options, logger.get());
    }
}

int main(int argc, const char** argv) {
    try {
        ConversionRunner runner;
        runner.load_conversion_config(argc, argv);
        runner.run(argc, argv);
        return 0;
    } catch (const std::exception& e) {
        ::fprintf(stderr, "ERROR: %s\n", e.what());
        fflush(stderr);
        return EXIT_FAILURE;
    }
}
