// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>

#include <map>
#include <string>
#include <vector>

#include "converters/scope_resolver.h"
#include "converters/version_dispatch.h"
#include "utilities/errors.h"
#include "utilities/logging.h"

using namespace nmtspec;
using namespace nmtspec::converters;

namespace {

VariableStore store_of(std::initializer_list<std::string> names) {
    std::map<std::string, Tensor> vars;
    for (const auto& name : names) {
        vars[name] = Tensor::from_vector<float>({1}, {1.f});
    }
    return VariableStore(std::move(vars));
}

} // namespace

TEST_CASE("first_of returns the first existing candidate", "[converters][resolver]") {
    VariableStore store = store_of({"b", "c"});
    ScopeResolver resolver(store);

    Lookup hit = resolver.first_of({"a", "b", "c"});
    REQUIRE(hit.found());
    REQUIRE(hit.Name == "b");
    REQUIRE(hit.Value == store.find("b"));

    Lookup miss = resolver.first_of({"x", "y"});
    REQUIRE_FALSE(miss);
    REQUIRE(miss.Name == "y");
}

TEST_CASE("require_first_of names the last candidate on exhaustion", "[converters][resolver]") {
    VariableStore store = store_of({"other"});
    ScopeResolver resolver(store);
    try {
        (void)resolver.require_first_of({"transformer/decoder/w_embs", "transformer/shared_embeddings/w_embs"});
        FAIL("expected MissingVariableError");
    } catch (const MissingVariableError& e) {
        REQUIRE(e.name() == "transformer/shared_embeddings/w_embs");
    }
}

TEST_CASE("fallback hits are reported to the logger", "[converters][resolver]") {
    VariableStore store = store_of({"model/examples_inputter/features_inputter/embedding"});
    ConversionLogger logger("", ConversionLogger::SILENT);
    std::vector<std::string> lines;
    logger.set_callback([&](std::string_view line) { lines.emplace_back(line); });

    ScopeResolver resolver(store, &logger);
    Lookup lookup = resolver.require_first_of(generation2_names().embedding_candidates(EModelSide::Decoder),
                                              "target embeddings");
    REQUIRE(lookup.Name == "model/examples_inputter/features_inputter/embedding");
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0].find("\"fallback\"") != std::string::npos);
    REQUIRE(lines[0].find("labels_inputter") != std::string::npos);
}

TEST_CASE("naming tables compose layer names", "[converters][resolver]") {
    REQUIRE(generation1_names().layer_probe(EModelSide::Encoder, 3) ==
            "transformer/encoder/layer_3/multi_head/LayerNorm/gamma");
    REQUIRE(generation1_names().layer_probe(EModelSide::Decoder, 0) ==
            "transformer/decoder/layer_0/masked_multi_head/LayerNorm/gamma");
    REQUIRE(generation2_names().layer_probe(EModelSide::Decoder, 1) ==
            "model/decoder/layers/1/self_attention/input_layer_norm/gamma");

    REQUIRE(generation1_names().embedding_candidates(EModelSide::Encoder) ==
            std::vector<std::string>{"transformer/encoder/w_embs", "transformer/shared_embeddings/w_embs"});
    REQUIRE(generation2_names().embedding_candidates(EModelSide::Encoder) ==
            std::vector<std::string>{"model/examples_inputter/features_inputter/embedding"});
}

TEST_CASE("layer discovery stops at the first gap", "[converters][resolver]") {
    const auto& names = generation2_names();
    VariableStore store = store_of({
        names.layer_probe(EModelSide::Encoder, 0),
        names.layer_probe(EModelSide::Encoder, 1),
        names.layer_probe(EModelSide::Encoder, 2),
        names.layer_probe(EModelSide::Encoder, 4),
    });
    ScopeResolver resolver(store);
    REQUIRE(resolver.count_layers(names, EModelSide::Encoder) == 3);
    REQUIRE(resolver.count_layers(names, EModelSide::Decoder) == 0);
}

TEST_CASE("generation detection", "[converters][dispatch]") {
    VariableStore plain = store_of({"transformer/encoder/w_embs"});
    VariableStore suffixed = store_of({"model/encoder/layer_norm/gamma/.ATTRIBUTES/VARIABLE_VALUE"});

    REQUIRE(detect_generation(plain, "model.ckpt-1000.safetensors") == kGeneration1);
    REQUIRE(detect_generation(plain, "ckpt-12.safetensors") == kGeneration2);
    REQUIRE(detect_generation(suffixed, "export.safetensors") == kGeneration2);

    VariableStore stripped = normalize_variable_names(suffixed);
    REQUIRE(stripped.contains("model/encoder/layer_norm/gamma"));
    REQUIRE(stripped.size() == 1);

    REQUIRE(&naming_convention(1) == &generation1_names());
    REQUIRE(&naming_convention(2) == &generation2_names());
    REQUIRE_THROWS_AS(naming_convention(3), UnsupportedFormatError);

    specs::ModelSpec spec;
    REQUIRE_THROWS_AS(set_transformer_spec(spec, plain, 0), UnsupportedFormatError);
}
