// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "utilities/safetensors.h"

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <unordered_set>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

namespace nmtspec {

/**
 * @brief Parsed SafeTensors header data.
 *
 * The SafeTensors file starts with an 8-byte little-endian unsigned integer
 * indicating the JSON header size in bytes, followed by the JSON header.
 */
struct sSafeTensorsHeader {
    /** @brief Size of the JSON header (bytes), not including this 8-byte length field. */
    std::uint64_t HeaderSize;
    /** @brief Parsed JSON metadata for all tensor entries and optional "__metadata__". */
    nlohmann::json MetaData;
};

/**
 * @brief Read and parse the SafeTensors JSON header from a file.
 *
 * @throws std::runtime_error If the file cannot be read or the header is invalid.
 */
static sSafeTensorsHeader read_safetensors_header(const std::string& file_name) {
    std::uint64_t header_size = 0;
    std::ifstream file(file_name, std::ios_base::binary);
    file.read(reinterpret_cast<char*>(&header_size), sizeof(header_size));
    if (!file) {
        throw std::runtime_error("Error opening safetensors file '" + file_name + "'");
    }

    const auto file_size = std::filesystem::file_size(file_name);
    if (header_size > file_size - sizeof(header_size)) {
        throw std::runtime_error(fmt::format("Invalid safetensors header size {} in '{}'", header_size, file_name));
    }

    std::vector<char> header(header_size, '\0');
    file.read(header.data(), static_cast<std::streamsize>(header_size));
    if (!file) {
        throw std::runtime_error("Error reading safetensors header of '" + file_name + "'");
    }
    auto parsed = nlohmann::json::parse(header.begin(), header.end());
    return {header_size, std::move(parsed)};
}

// SafeTensorEntry implementation

SafeTensorEntry::SafeTensorEntry(std::string name, std::vector<long> shape, ETensorDType dtype,
                                 std::string file_name, std::ptrdiff_t data_begin, std::ptrdiff_t data_end)
    : mName(std::move(name)), mShape(std::move(shape)), mDType(dtype), mFileName(std::move(file_name)),
      mDataBegin(data_begin), mDataEnd(data_end) {
}

/**
 * @brief Read the full tensor for this entry into a newly allocated host tensor.
 *
 * @throws std::runtime_error if the byte range does not match shape and dtype,
 *         or on I/O failure.
 */
Tensor SafeTensorEntry::read_tensor() const {
    std::size_t nelem = 1;
    for (long d : mShape) nelem *= static_cast<std::size_t>(d);
    const std::size_t expected = nelem * get_dtype_size(mDType);
    if (static_cast<std::size_t>(mDataEnd - mDataBegin) != expected) {
        throw std::runtime_error(fmt::format("Size mismatch for tensor `{}`: header has {} bytes, shape needs {}",
                                             mName, mDataEnd - mDataBegin, expected));
    }

    std::ifstream file(mFileName, std::ios_base::binary);
    file.seekg(mDataBegin, std::ios_base::beg);
    TensorStorage bytes(expected);
    file.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(expected));
    if (!file) {
        throw std::runtime_error(fmt::format("Failed to read tensor `{}` from '{}'", mName, mFileName));
    }
    return Tensor::from_bytes(mDType, mShape, std::move(bytes));
}

// SafeTensorsReader implementation

/**
 * @brief Construct a reader for a SafeTensors file or an HF-style `.index.json`.
 *
 * @throws std::runtime_error / nlohmann::json exceptions on I/O or parse failures.
 */
SafeTensorsReader::SafeTensorsReader(const std::string& file_name) {
    if (file_name.ends_with(".index.json")) {
        parse_index_file(file_name);
    } else {
        parse_single_file(file_name);
    }
}

void SafeTensorsReader::parse_single_file(const std::string& file_path) {
    auto [HeaderSize, MetaData] = read_safetensors_header(file_path);
    std::ptrdiff_t offset = static_cast<std::ptrdiff_t>(HeaderSize + sizeof(HeaderSize));
    for (const auto& el : MetaData.items()) {
        const std::string& name = el.key();
        if (name == "__metadata__") {
            for (const auto& meta : el.value().items()) {
                if (meta.value().is_string()) {
                    mMetadata[meta.key()] = meta.value().get<std::string>();
                }
            }
            continue;
        }

        ETensorDType dtype = dtype_from_str(el.value()["dtype"].get<std::string_view>());
        auto shape = el.value()["shape"].get<std::vector<long>>();
        auto begin = el.value()["data_offsets"][0].get<std::ptrdiff_t>();
        auto end = el.value()["data_offsets"][1].get<std::ptrdiff_t>();

        mEntries.emplace_back(name, shape, dtype, file_path, begin + offset, end + offset);
    }
}

void SafeTensorsReader::parse_index_file(const std::string& index_file) {
    std::ifstream file(index_file);
    if (!file.is_open()) {
        throw std::runtime_error("Error opening safetensors index '" + index_file + "'");
    }
    auto parsed = nlohmann::json::parse(file);
    const auto& weight_map = parsed.at("weight_map");

    std::unordered_set<std::string> processed_files;
    std::filesystem::path index_path(index_file);

    for (const auto& el : weight_map.items()) {
        auto f_name = el.value().get<std::string>();
        if (processed_files.contains(f_name))
            continue;
        processed_files.insert(f_name);

        std::filesystem::path full_path = index_path.parent_path() / f_name;
        parse_single_file(full_path.string());
    }
}

/**
 * @brief Find an entry by tensor name.
 *
 * @throws std::out_of_range If no entry with this name exists.
 */
const SafeTensorEntry& SafeTensorsReader::find_entry(std::string_view name) const {
    for (auto& entry : mEntries)
        if (entry.name() == name)
            return entry;
    throw std::out_of_range(fmt::format("Entry not found: {}", name));
}

// SafeTensorWriter implementation

SafeTensorWriter::SafeTensorWriter(std::string file_name) : mFileName(std::move(file_name)) {
}

/**
 * @brief Remove a leftover temporary file if finalize() was never reached.
 */
SafeTensorWriter::~SafeTensorWriter() {
    if (!mFinalized) {
        std::error_code ec;
        std::filesystem::remove(mFileName + ".tmp", ec);
    }
}

/**
 * @brief Register a tensor for writing.
 *
 * @throws std::logic_error after finalize(), for unset tensors or duplicate names.
 */
void SafeTensorWriter::register_tensor(const std::string& name, const Tensor& tensor) {
    if (mFinalized)
        throw std::logic_error("Cannot register tensor after the file has been written");
    if (tensor.is_null())
        throw std::logic_error(fmt::format("Cannot register unset tensor `{}`", name));
    if (name == "__metadata__")
        throw std::logic_error("`__metadata__` is a reserved tensor name");
    if (!mRegisteredTensors.emplace(name, tensor).second)
        throw std::logic_error(fmt::format("Tensor `{}` registered twice", name));
}

void SafeTensorWriter::set_metadata(const std::string& key, const std::string& value) {
    mMetadata[key] = value;
}

/**
 * @brief Write header and tensor data, then atomically move the file in place.
 *
 * @throws std::runtime_error on I/O failure.
 */
void SafeTensorWriter::finalize() {
    if (mFinalized)
        throw std::logic_error("SafeTensorWriter::finalize called twice");

    nlohmann::json meta_data;
    nlohmann::json user_meta = nlohmann::json::object({{"format", "pt"}, {"writer", "nmtspec"}});
    for (const auto& [key, value] : mMetadata) {
        user_meta[key] = value;
    }
    meta_data["__metadata__"] = user_meta;

    long offset = 0;
    for (const auto& [name, tensor] : mRegisteredTensors) {
        const long size = static_cast<long>(tensor.bytes());
        meta_data[name]["dtype"] = dtype_to_str(tensor.DType);
        meta_data[name]["shape"] = tensor.shape();
        meta_data[name]["data_offsets"] = std::vector<long>{offset, offset + size};
        offset += size;
    }

    std::string header = meta_data.dump();
    // pad the header so tensor data starts 8-byte aligned
    while ((header.size() + sizeof(std::uint64_t)) % 8 != 0) {
        header.push_back(' ');
    }
    std::uint64_t header_size = header.size();

    const std::string temp_name = mFileName + ".tmp";
    {
        std::ofstream file(temp_name, std::ios_base::binary | std::ios_base::trunc);
        if (!file.is_open()) {
            throw std::runtime_error(fmt::format("could not open file for writing {}", temp_name));
        }
        file.write(reinterpret_cast<const char*>(&header_size), sizeof(header_size));
        file.write(header.data(), static_cast<std::streamsize>(header.size()));
        for (const auto& [name, tensor] : mRegisteredTensors) {
            file.write(reinterpret_cast<const char*>(tensor.data()), static_cast<std::streamsize>(tensor.bytes()));
        }
        if (!file) {
            throw std::runtime_error(fmt::format("Error writing safetensors file {}", temp_name));
        }
    }

    std::filesystem::rename(temp_name, mFileName);
    mFinalized = true;
}

} // namespace nmtspec
