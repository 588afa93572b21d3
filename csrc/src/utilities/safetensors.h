// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef NMTSPEC_SRC_UTILITIES_SAFETENSORS_H
#define NMTSPEC_SRC_UTILITIES_SAFETENSORS_H

#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "utilities/tensor.h"

namespace nmtspec {

class SafeTensorEntry {
public:
    SafeTensorEntry(std::string name, std::vector<long> shape, ETensorDType dtype, std::string file_name,
                    std::ptrdiff_t data_begin, std::ptrdiff_t data_end);

    [[nodiscard]] const std::string& name() const { return mName; }
    [[nodiscard]] const std::vector<long>& shape() const { return mShape; }
    [[nodiscard]] ETensorDType dtype() const { return mDType; }

    //! Reads the whole tensor from disk into a new host tensor.
    [[nodiscard]] Tensor read_tensor() const;

private:
    std::string mName;
    std::vector<long> mShape;
    ETensorDType mDType;
    std::string mFileName;
    std::ptrdiff_t mDataBegin;
    std::ptrdiff_t mDataEnd;
};

class SafeTensorsReader {
public:
    explicit SafeTensorsReader(const std::string& file_name);

    [[nodiscard]] const std::vector<SafeTensorEntry>& entries() const { return mEntries; }
    [[nodiscard]] const SafeTensorEntry& find_entry(std::string_view name) const;

    //! The free-form string map stored under "__metadata__".
    [[nodiscard]] const std::map<std::string, std::string>& metadata() const { return mMetadata; }

private:
    void parse_single_file(const std::string& file_path);
    void parse_index_file(const std::string& index_file);

    std::vector<SafeTensorEntry> mEntries;
    std::map<std::string, std::string> mMetadata;
};

/**
 * @brief Writes host tensors into a single SafeTensors file.
 *
 * Tensors are registered first, then written in one go by finalize(). The data
 * goes to `<file>.tmp` which is renamed on success, so an interrupted write never
 * leaves a truncated file under the final name.
 */
class SafeTensorWriter {
public:
    explicit SafeTensorWriter(std::string file_name);
    ~SafeTensorWriter();

    SafeTensorWriter(const SafeTensorWriter&) = delete;
    SafeTensorWriter& operator=(const SafeTensorWriter&) = delete;

    void register_tensor(const std::string& name, const Tensor& tensor);
    void set_metadata(const std::string& key, const std::string& value);
    void finalize();

private:
    std::string mFileName;
    std::map<std::string, Tensor> mRegisteredTensors;
    std::map<std::string, std::string> mMetadata;
    bool mFinalized = false;
};

} // namespace nmtspec

#endif //NMTSPEC_SRC_UTILITIES_SAFETENSORS_H
