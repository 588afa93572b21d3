// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <vector>

#include "converters/linear_fusion.h"

using nmtspec::Tensor;
using nmtspec::specs::LinearSpec;
using nmtspec::converters::fuse_linear;

namespace {

LinearSpec make_linear(long out, long in, float base, bool with_bias) {
    std::vector<float> w(out * in);
    for (std::size_t i = 0; i < w.size(); ++i) w[i] = base + static_cast<float>(i);
    LinearSpec spec;
    spec.Weight = Tensor::from_vector<float>({out, in}, w);
    if (with_bias) {
        std::vector<float> b(out);
        for (std::size_t i = 0; i < b.size(); ++i) b[i] = -base - static_cast<float>(i);
        spec.Bias = Tensor::from_vector<float>({out}, b);
    }
    return spec;
}

} // namespace

TEST_CASE("fuse_linear concatenates weights row-wise in part order", "[converters][fusion]") {
    std::vector<LinearSpec> parts = {
        make_linear(2, 3, 100.f, true),
        make_linear(4, 3, 200.f, true),
        make_linear(1, 3, 300.f, true),
    };
    LinearSpec fused;
    fuse_linear(fused, parts);

    REQUIRE(fused.Weight.shape() == std::vector<long>{7, 3});
    REQUIRE(fused.Bias.shape() == std::vector<long>{7});

    auto w = fused.Weight.to_vector<float>();
    // first row of each part
    REQUIRE(w[0] == 100.f);
    REQUIRE(w[2 * 3] == 200.f);
    REQUIRE(w[6 * 3] == 300.f);
    REQUIRE(w.back() == 302.f);

    auto b = fused.Bias.to_vector<float>();
    REQUIRE(b[0] == -100.f);
    REQUIRE(b[2] == -200.f);
    REQUIRE(b[6] == -300.f);
}

TEST_CASE("fuse_linear drops the bias unless every part has one", "[converters][fusion]") {
    std::vector<LinearSpec> parts = {
        make_linear(2, 3, 1.f, true),
        make_linear(2, 3, 2.f, false),
        make_linear(2, 3, 3.f, true),
    };
    LinearSpec fused;
    fused.Bias = Tensor::from_vector<float>({1}, {42.f});
    fuse_linear(fused, parts);

    REQUIRE(fused.Weight.shape() == std::vector<long>{6, 3});
    REQUIRE_FALSE(fused.has_bias());
}

TEST_CASE("fuse_linear of one part copies it", "[converters][fusion]") {
    std::vector<LinearSpec> parts = {make_linear(3, 2, 5.f, true)};
    LinearSpec fused;
    fuse_linear(fused, parts);
    REQUIRE(nmtspec::bitwise_equal(fused.Weight, parts[0].Weight));
    REQUIRE(nmtspec::bitwise_equal(fused.Bias, parts[0].Bias));
    REQUIRE_FALSE(fused.Weight.shares_storage_with(parts[0].Weight));
}

TEST_CASE("fuse_linear rejects invalid part lists", "[converters][fusion]") {
    LinearSpec fused;

    SECTION("empty") {
        REQUIRE_THROWS_AS(fuse_linear(fused, {}), std::logic_error);
    }

    SECTION("input dimension mismatch") {
        std::vector<LinearSpec> parts = {make_linear(2, 3, 1.f, false), make_linear(2, 4, 1.f, false)};
        REQUIRE_THROWS_AS(fuse_linear(fused, parts), std::logic_error);
    }

    SECTION("dtype mismatch") {
        std::vector<LinearSpec> parts = {make_linear(2, 3, 1.f, false), make_linear(2, 3, 1.f, false)};
        parts[1].Weight = nmtspec::convert_dtype(parts[1].Weight, nmtspec::ETensorDType::FP16);
        REQUIRE_THROWS_AS(fuse_linear(fused, parts), std::logic_error);
    }
}
