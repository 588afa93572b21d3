// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef NMTSPEC_SRC_CHECKPOINT_VARIABLE_STORE_H
#define NMTSPEC_SRC_CHECKPOINT_VARIABLE_STORE_H

#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "utilities/tensor.h"

namespace nmtspec {

//! Suffix that object-based checkpoints append to every variable name.
inline constexpr std::string_view kVariableValueSuffix = "/.ATTRIBUTES/VARIABLE_VALUE";

/**
 * @brief Immutable mapping from checkpoint variable names to tensors.
 *
 * Lookups are exact; a miss is reported by a null pointer, never by an
 * exception.
 */
class VariableStore {
public:
    VariableStore() = default;
    explicit VariableStore(std::map<std::string, Tensor> variables);

    [[nodiscard]] const Tensor* find(const std::string& name) const;
    [[nodiscard]] bool contains(const std::string& name) const { return find(name) != nullptr; }

    [[nodiscard]] std::vector<std::string> names() const;
    [[nodiscard]] std::size_t size() const { return mVariables.size(); }
    [[nodiscard]] bool empty() const { return mVariables.empty(); }

    //! True if any variable name ends with @p suffix.
    [[nodiscard]] bool any_name_ends_with(std::string_view suffix) const;

    //! Copy of this store with @p suffix removed from every name that carries it.
    [[nodiscard]] VariableStore strip_suffix(std::string_view suffix) const;

    [[nodiscard]] auto begin() const { return mVariables.begin(); }
    [[nodiscard]] auto end() const { return mVariables.end(); }

private:
    std::map<std::string, Tensor> mVariables;
};

} // namespace nmtspec

#endif //NMTSPEC_SRC_CHECKPOINT_VARIABLE_STORE_H
