// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef NMTSPEC_SRC_UTILITIES_TENSOR_H
#define NMTSPEC_SRC_UTILITIES_TENSOR_H

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "utilities/dtype.h"
#include "utilities/utils.h"

namespace nmtspec {

constexpr int MAX_TENSOR_DIM = 5;

using TensorStorage = std::vector<std::byte>;

//! \brief The Tensor class represents a contiguous host array that is associated
//! with a specific data type and shape.
//!
//! Storage is immutable and reference counted: copying a Tensor shares its
//! storage, every transformation below allocates a new one. A Tensor without
//! storage is "unset".
struct Tensor {
    ETensorDType DType = ETensorDType::FP32;
    std::array<long, MAX_TENSOR_DIM> Sizes{1, 1, 1, 1, 1};
    int Rank = 0;
    std::shared_ptr<const TensorStorage> Storage;

    [[nodiscard]] std::size_t bytes() const {
        return nelem() * get_dtype_size(DType);
    }

    [[nodiscard]] std::size_t nelem() const {
        std::size_t sz = 1;
        for(int i = 0; i < Rank; ++i) {
            sz *= Sizes[i];
        }
        return sz;
    }

    [[nodiscard]] bool is_null() const { return Storage == nullptr; }
    [[nodiscard]] bool has_value() const { return Storage != nullptr; }

    [[nodiscard]] std::vector<long> shape() const {
        return std::vector<long>(Sizes.begin(), Sizes.begin() + Rank);
    }

    [[nodiscard]] const std::byte* data() const {
        return Storage ? Storage->data() : nullptr;
    }

    //! True if both tensors are backed by the very same storage.
    [[nodiscard]] bool shares_storage_with(const Tensor& other) const {
        return Storage != nullptr && Storage == other.Storage;
    }

    template<class TargetType>
    [[nodiscard]] const TargetType* get() const {
        if(dtype_from_type<TargetType> != DType) {
            throw std::logic_error(std::string("DType mismatch: expected ") +
                dtype_to_str(dtype_from_type<TargetType>) + ", got " + dtype_to_str(DType));
        }

        return reinterpret_cast<const TargetType*>(data());
    }

    template<class TargetType>
    [[nodiscard]] std::vector<TargetType> to_vector() const {
        const TargetType* ptr = get<TargetType>();
        return std::vector<TargetType>(ptr, ptr + nelem());
    }

    static Tensor from_bytes(ETensorDType dtype, const std::vector<long>& shape, TensorStorage bytes);

    template<typename T>
    static Tensor from_vector(const std::vector<long>& shape, const std::vector<T>& values) {
        TensorStorage bytes(values.size() * sizeof(T));
        if (!values.empty()) {
            std::memcpy(bytes.data(), values.data(), bytes.size());
        }
        return from_bytes(dtype_from_type<T>, shape, std::move(bytes));
    }
};

//! Drops every dimension of size 1. Shares the storage of @p src.
Tensor squeeze(const Tensor& src);

//! Swaps the two axes of a rank-2 tensor into new storage. Rank 0 and 1 tensors
//! are returned unchanged.
Tensor transpose(const Tensor& src);

//! Deep copy into new storage.
Tensor clone(const Tensor& src);

//! Concatenates tensors along the first dimension into new storage.
Tensor concat_rows(const std::vector<const Tensor*>& parts);

//! Converts a floating-point tensor to another floating-point dtype.
Tensor convert_dtype(const Tensor& src, ETensorDType dtype);

//! Exact comparison of dtype, shape and raw bytes.
bool bitwise_equal(const Tensor& lhs, const Tensor& rhs);

std::string shape_to_string(const Tensor& t);

} // namespace nmtspec

#endif //NMTSPEC_SRC_UTILITIES_TENSOR_H
