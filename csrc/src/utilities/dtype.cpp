// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "utilities/dtype.h"

#include <cstring>
#include <stdexcept>
#include <string>

#include <fmt/core.h>

#include "utilities/errors.h"

namespace nmtspec {

std::size_t get_dtype_size(ETensorDType dtype) {
    switch (dtype) {
        case ETensorDType::FP64:
        case ETensorDType::INT64:
            return 8;
        case ETensorDType::FP32:
        case ETensorDType::INT32:
            return 4;
        case ETensorDType::FP16:
        case ETensorDType::BF16:
            return 2;
        case ETensorDType::INT8:
        case ETensorDType::BYTE:
        case ETensorDType::BOOL:
            return 1;
    }
    throw std::logic_error(fmt::format("get_dtype_size: invalid dtype {}", static_cast<int>(dtype)));
}

const char* dtype_to_str(ETensorDType dtype) {
    switch (dtype) {
        case ETensorDType::FP32: return "F32";
        case ETensorDType::FP64: return "F64";
        case ETensorDType::FP16: return "F16";
        case ETensorDType::BF16: return "BF16";
        case ETensorDType::INT64: return "I64";
        case ETensorDType::INT32: return "I32";
        case ETensorDType::INT8: return "I8";
        case ETensorDType::BYTE: return "U8";
        case ETensorDType::BOOL: return "BOOL";
    }
    throw std::logic_error(fmt::format("dtype_to_str: invalid dtype {}", static_cast<int>(dtype)));
}

ETensorDType dtype_from_str(std::string_view name) {
    if (name == "F32") return ETensorDType::FP32;
    if (name == "F64") return ETensorDType::FP64;
    if (name == "F16") return ETensorDType::FP16;
    if (name == "BF16") return ETensorDType::BF16;
    if (name == "I64") return ETensorDType::INT64;
    if (name == "I32") return ETensorDType::INT32;
    if (name == "I8") return ETensorDType::INT8;
    if (name == "U8") return ETensorDType::BYTE;
    if (name == "BOOL") return ETensorDType::BOOL;
    throw UnsupportedFormatError(fmt::format("Unsupported dtype '{}'", name));
}

bool is_floating_point(ETensorDType dtype) {
    return dtype == ETensorDType::FP32 || dtype == ETensorDType::FP64 ||
           dtype == ETensorDType::FP16 || dtype == ETensorDType::BF16;
}

/**
 * @brief Convert a float to IEEE half precision bits with round-to-nearest-even.
 *
 * Values beyond the half range saturate to infinity; NaN payloads are collapsed
 * to a quiet NaN.
 */
std::uint16_t float_to_fp16_bits(float f) {
    std::uint32_t x;
    std::memcpy(&x, &f, sizeof(x));
    const std::uint16_t sign = static_cast<std::uint16_t>((x >> 16) & 0x8000u);
    const std::uint32_t abs = x & 0x7FFFFFFFu;

    if (abs >= 0x7F800000u) {
        // inf or nan
        return sign | (abs > 0x7F800000u ? 0x7E00u : 0x7C00u);
    }
    if (abs >= 0x477FF000u) {
        // rounds to a value larger than the max half
        return sign | 0x7C00u;
    }
    if (abs < 0x38800000u) {
        // subnormal half (or zero)
        if (abs < 0x33000000u) return sign;
        const std::uint32_t exponent = abs >> 23;
        const std::uint32_t mantissa = (abs & 0x7FFFFFu) | 0x800000u;
        const std::uint32_t shift = 126u - exponent;
        std::uint32_t half = mantissa >> shift;
        const std::uint32_t remainder = mantissa & ((1u << shift) - 1u);
        const std::uint32_t halfway = 1u << (shift - 1u);
        if (remainder > halfway || (remainder == halfway && (half & 1u))) ++half;
        return sign | static_cast<std::uint16_t>(half);
    }

    std::uint32_t half = ((abs >> 13) - (112u << 10));
    const std::uint32_t remainder = abs & 0x1FFFu;
    if (remainder > 0x1000u || (remainder == 0x1000u && (half & 1u))) ++half;
    return sign | static_cast<std::uint16_t>(half);
}

float fp16_bits_to_float(std::uint16_t h) {
    const std::uint32_t sign = static_cast<std::uint32_t>(h & 0x8000u) << 16;
    std::uint32_t exponent = (h >> 10) & 0x1Fu;
    std::uint32_t mantissa = h & 0x3FFu;
    std::uint32_t bits;
    if (exponent == 0) {
        if (mantissa == 0) {
            bits = sign;
        } else {
            // normalize the subnormal
            exponent = 113;
            while ((mantissa & 0x400u) == 0) {
                mantissa <<= 1;
                --exponent;
            }
            mantissa &= 0x3FFu;
            bits = sign | (exponent << 23) | (mantissa << 13);
        }
    } else if (exponent == 0x1F) {
        bits = sign | 0x7F800000u | (mantissa << 13);
    } else {
        bits = sign | ((exponent + 112u) << 23) | (mantissa << 13);
    }
    float f;
    std::memcpy(&f, &bits, sizeof(f));
    return f;
}

std::uint16_t float_to_bf16_bits(float f) {
    std::uint32_t u;
    std::memcpy(&u, &f, sizeof(u));
    if ((u & 0x7FFFFFFFu) > 0x7F800000u) {
        return static_cast<std::uint16_t>((u >> 16) | 0x0040u);
    }
    // round to nearest even on the cut at 16 LSBs
    const std::uint32_t lsb = (u >> 16) & 1u;
    u += 0x7FFFu + lsb;
    return static_cast<std::uint16_t>(u >> 16);
}

float bf16_bits_to_float(std::uint16_t h) {
    std::uint32_t u = static_cast<std::uint32_t>(h) << 16;
    float f;
    std::memcpy(&f, &u, sizeof(f));
    return f;
}

} // namespace nmtspec
