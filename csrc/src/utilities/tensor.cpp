// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "utilities/tensor.h"

#include <cstring>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace nmtspec {

/**
 * @brief Wrap an owned byte buffer into a tensor of the given dtype and shape.
 *
 * @throws std::runtime_error if the rank exceeds MAX_TENSOR_DIM or the buffer
 *         size does not match the shape.
 */
Tensor Tensor::from_bytes(ETensorDType dtype, const std::vector<long>& shape, TensorStorage bytes) {
    if (shape.size() > MAX_TENSOR_DIM) {
        throw std::runtime_error("Tensor rank too large");
    }

    Tensor t;
    t.DType = dtype;
    t.Rank = narrow<int>(shape.size());
    std::copy(shape.begin(), shape.end(), t.Sizes.begin());
    std::fill(t.Sizes.begin() + t.Rank, t.Sizes.end(), 1);

    if (bytes.size() != t.bytes()) {
        throw std::runtime_error(fmt::format("Tensor buffer size mismatch: shape [{}] of {} needs {} bytes, got {}",
                                             fmt::join(shape, ", "), dtype_to_str(dtype), t.bytes(), bytes.size()));
    }
    t.Storage = std::make_shared<const TensorStorage>(std::move(bytes));
    return t;
}

/**
 * @brief Drop all singleton dimensions (numpy `squeeze` semantics).
 *
 * Checkpoints written by 1x1 convolution layers store linear kernels as
 * [1, in, out]; squeezing brings them back to [in, out]. The result is a view
 * sharing @p src storage since the memory layout is unchanged.
 */
Tensor squeeze(const Tensor& src) {
    Tensor dst = src;
    int rank = 0;
    for (int i = 0; i < src.Rank; ++i) {
        if (src.Sizes[i] != 1) {
            dst.Sizes[rank++] = src.Sizes[i];
        }
    }
    std::fill(dst.Sizes.begin() + rank, dst.Sizes.end(), 1);
    dst.Rank = rank;
    return dst;
}

/**
 * @brief Transpose a rank-2 tensor into newly allocated storage.
 *
 * @throws std::logic_error for tensors of rank > 2 or without storage.
 */
Tensor transpose(const Tensor& src) {
    if (src.Rank < 2) {
        return src;
    }
    if (src.Rank > 2) {
        throw std::logic_error(fmt::format("transpose: only rank-2 tensors are supported, got shape {}",
                                           shape_to_string(src)));
    }
    if (src.is_null()) {
        throw std::logic_error("transpose: tensor has no storage");
    }

    const long rows = src.Sizes[0];
    const long cols = src.Sizes[1];
    const std::size_t elem = get_dtype_size(src.DType);
    TensorStorage out(src.bytes());
    const std::byte* in = src.data();
    for (long r = 0; r < rows; ++r) {
        for (long c = 0; c < cols; ++c) {
            std::memcpy(out.data() + (c * rows + r) * elem, in + (r * cols + c) * elem, elem);
        }
    }
    return Tensor::from_bytes(src.DType, {cols, rows}, std::move(out));
}

Tensor clone(const Tensor& src) {
    if (src.is_null()) {
        return src;
    }
    return Tensor::from_bytes(src.DType, src.shape(), TensorStorage(src.data(), src.data() + src.bytes()));
}

/**
 * @brief Concatenate tensors along dimension 0.
 *
 * All parts must share dtype, rank and every dimension but the first.
 *
 * @throws std::logic_error on an empty part list or mismatching parts.
 */
Tensor concat_rows(const std::vector<const Tensor*>& parts) {
    if (parts.empty()) {
        throw std::logic_error("concat_rows: no tensors to concatenate");
    }

    const Tensor& first = *parts.front();
    long rows = 0;
    std::size_t total_bytes = 0;
    for (const Tensor* part : parts) {
        if (part->is_null()) {
            throw std::logic_error("concat_rows: tensor has no storage");
        }
        if (part->DType != first.DType) {
            throw std::logic_error(fmt::format("concat_rows: dtype mismatch ({} vs {})",
                                               dtype_to_str(part->DType), dtype_to_str(first.DType)));
        }
        if (part->Rank != first.Rank || part->Rank == 0) {
            throw std::logic_error(fmt::format("concat_rows: rank mismatch ({} vs {})",
                                               shape_to_string(*part), shape_to_string(first)));
        }
        for (int i = 1; i < first.Rank; ++i) {
            if (part->Sizes[i] != first.Sizes[i]) {
                throw std::logic_error(fmt::format("concat_rows: shape mismatch ({} vs {})",
                                                   shape_to_string(*part), shape_to_string(first)));
            }
        }
        rows += part->Sizes[0];
        total_bytes += part->bytes();
    }

    TensorStorage out;
    out.reserve(total_bytes);
    for (const Tensor* part : parts) {
        out.insert(out.end(), part->data(), part->data() + part->bytes());
    }

    std::vector<long> shape = first.shape();
    shape[0] = rows;
    return Tensor::from_bytes(first.DType, shape, std::move(out));
}

namespace {

float load_as_float(const std::byte* ptr, ETensorDType dtype) {
    switch (dtype) {
        case ETensorDType::FP32: {
            float v;
            std::memcpy(&v, ptr, sizeof(v));
            return v;
        }
        case ETensorDType::FP64: {
            double v;
            std::memcpy(&v, ptr, sizeof(v));
            return static_cast<float>(v);
        }
        case ETensorDType::FP16: {
            std::uint16_t v;
            std::memcpy(&v, ptr, sizeof(v));
            return fp16_bits_to_float(v);
        }
        case ETensorDType::BF16: {
            std::uint16_t v;
            std::memcpy(&v, ptr, sizeof(v));
            return bf16_bits_to_float(v);
        }
        default:
            throw std::logic_error(fmt::format("load_as_float: {} is not a floating point type", dtype_to_str(dtype)));
    }
}

void store_from_float(std::byte* ptr, ETensorDType dtype, float value) {
    switch (dtype) {
        case ETensorDType::FP32:
            std::memcpy(ptr, &value, sizeof(value));
            return;
        case ETensorDType::FP64: {
            double v = value;
            std::memcpy(ptr, &v, sizeof(v));
            return;
        }
        case ETensorDType::FP16: {
            std::uint16_t v = float_to_fp16_bits(value);
            std::memcpy(ptr, &v, sizeof(v));
            return;
        }
        case ETensorDType::BF16: {
            std::uint16_t v = float_to_bf16_bits(value);
            std::memcpy(ptr, &v, sizeof(v));
            return;
        }
        default:
            throw std::logic_error(fmt::format("store_from_float: {} is not a floating point type", dtype_to_str(dtype)));
    }
}

} // namespace

/**
 * @brief Convert between floating point dtypes (via float).
 *
 * Converting to the same dtype returns @p src unchanged (shared storage).
 *
 * @throws std::logic_error if either dtype is not floating point.
 */
Tensor convert_dtype(const Tensor& src, ETensorDType dtype) {
    if (src.DType == dtype || src.is_null()) {
        return src;
    }
    if (!is_floating_point(src.DType) || !is_floating_point(dtype)) {
        throw std::logic_error(fmt::format("convert_dtype: cannot convert {} to {}",
                                           dtype_to_str(src.DType), dtype_to_str(dtype)));
    }

    const std::size_t n = src.nelem();
    const std::size_t in_size = get_dtype_size(src.DType);
    const std::size_t out_size = get_dtype_size(dtype);
    TensorStorage out(n * out_size);
    for (std::size_t i = 0; i < n; ++i) {
        store_from_float(out.data() + i * out_size, dtype, load_as_float(src.data() + i * in_size, src.DType));
    }
    return Tensor::from_bytes(dtype, src.shape(), std::move(out));
}

bool bitwise_equal(const Tensor& lhs, const Tensor& rhs) {
    if (lhs.DType != rhs.DType || lhs.Rank != rhs.Rank) {
        return false;
    }
    for (int i = 0; i < lhs.Rank; ++i) {
        if (lhs.Sizes[i] != rhs.Sizes[i]) {
            return false;
        }
    }
    if (lhs.is_null() || rhs.is_null()) {
        return lhs.is_null() && rhs.is_null();
    }
    if (lhs.shares_storage_with(rhs)) {
        return true;
    }
    return std::memcmp(lhs.data(), rhs.data(), lhs.bytes()) == 0;
}

std::string shape_to_string(const Tensor& t) {
    return fmt::format("[{}]", fmt::join(t.shape(), ", "));
}

} // namespace nmtspec
