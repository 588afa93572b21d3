// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef NMTSPEC_SRC_UTILITIES_DTYPE_H
#define NMTSPEC_SRC_UTILITIES_DTYPE_H

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace nmtspec {

enum class ETensorDType : int {
    FP32,
    FP64,
    FP16,
    BF16,
    INT64,
    INT32,
    INT8,
    BYTE,
    BOOL,
};

[[nodiscard]] std::size_t get_dtype_size(ETensorDType dtype);

//! SafeTensors spelling of the dtype ("F32", "BF16", "I64", ...)
[[nodiscard]] const char* dtype_to_str(ETensorDType dtype);

//! Parses the SafeTensors spelling. Throws UnsupportedFormatError on unknown names.
[[nodiscard]] ETensorDType dtype_from_str(std::string_view name);

[[nodiscard]] bool is_floating_point(ETensorDType dtype);

template<typename T>
inline constexpr ETensorDType dtype_from_type = ETensorDType::BYTE;

template<> inline constexpr ETensorDType dtype_from_type<float> = ETensorDType::FP32;
template<> inline constexpr ETensorDType dtype_from_type<double> = ETensorDType::FP64;
template<> inline constexpr ETensorDType dtype_from_type<std::int64_t> = ETensorDType::INT64;
template<> inline constexpr ETensorDType dtype_from_type<std::int32_t> = ETensorDType::INT32;
template<> inline constexpr ETensorDType dtype_from_type<std::int8_t> = ETensorDType::INT8;
template<> inline constexpr ETensorDType dtype_from_type<std::uint8_t> = ETensorDType::BYTE;
template<> inline constexpr ETensorDType dtype_from_type<bool> = ETensorDType::BOOL;

// Half precision conversion, emulated on the CPU.
std::uint16_t float_to_fp16_bits(float f);
float fp16_bits_to_float(std::uint16_t h);
std::uint16_t float_to_bf16_bits(float f);
float bf16_bits_to_float(std::uint16_t h);

} // namespace nmtspec

#endif //NMTSPEC_SRC_UTILITIES_DTYPE_H
