// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "checkpoint/variable_store.h"

#include <algorithm>
#include <stdexcept>

#include <fmt/core.h>

namespace nmtspec {

namespace {

bool ends_with(std::string_view value, std::string_view suffix) {
    return value.size() >= suffix.size() && value.substr(value.size() - suffix.size()) == suffix;
}

} // namespace

VariableStore::VariableStore(std::map<std::string, Tensor> variables) : mVariables(std::move(variables)) {
}

const Tensor* VariableStore::find(const std::string& name) const {
    auto found = mVariables.find(name);
    if (found == mVariables.end()) return nullptr;
    return &found->second;
}

std::vector<std::string> VariableStore::names() const {
    std::vector<std::string> result;
    result.reserve(mVariables.size());
    for (const auto& [name, value] : mVariables) {
        result.push_back(name);
    }
    return result;
}

bool VariableStore::any_name_ends_with(std::string_view suffix) const {
    return std::any_of(mVariables.begin(), mVariables.end(),
                       [&](const auto& kv) { return ends_with(kv.first, suffix); });
}

VariableStore VariableStore::strip_suffix(std::string_view suffix) const {
    std::map<std::string, Tensor> stripped;
    for (const auto& [name, value] : mVariables) {
        std::string key = ends_with(name, suffix) ? name.substr(0, name.size() - suffix.size()) : name;
        auto [it, inserted] = stripped.emplace(key, value);
        if (!inserted) {
            throw std::runtime_error(fmt::format("Variable name collision after stripping '{}': {}", suffix, key));
        }
    }
    return VariableStore(std::move(stripped));
}

} // namespace nmtspec
