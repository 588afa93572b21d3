// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "checkpoint/vocabulary.h"

#include <algorithm>
#include <fstream>
#include <type_traits>

#include <fmt/core.h>

#include "utilities/errors.h"
#include "utilities/utils.h"

namespace nmtspec {

Vocab::Vocab(const std::vector<std::string>& tokens) {
    for (const auto& token : tokens) {
        add(token);
    }
}

void Vocab::add(const std::string& token) {
    if (contains(token)) return;
    mIndex.emplace(token, mWords.size());
    mWords.push_back(token);
}

std::vector<std::string> FileVocabularyReader::read(const std::string& path) const {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error(fmt::format("Could not open vocabulary file {}", path));
    }

    std::vector<std::string> tokens;
    std::string line;
    while (std::getline(file, line)) {
        tokens.emplace_back(rstrip_newline(line));
    }
    if (file.bad()) {
        throw std::runtime_error(fmt::format("Error reading vocabulary file {}", path));
    }
    return tokens;
}

std::vector<std::string> load_vocabulary(const VocabularySource& source, const IVocabularyReader& reader,
                                         const std::string& unk_token) {
    if (source.valueless_by_exception()) {
        throw ConfigurationError("Vocabulary source holds no value");
    }

    std::vector<std::string> tokens = std::visit([&](const auto& value) -> std::vector<std::string> {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, VocabularyPath>) {
            if (value.Path.empty()) {
                throw ConfigurationError("Vocabulary path is empty");
            }
            return Vocab(reader.read(value.Path)).words();
        } else if constexpr (std::is_same_v<T, Vocab>) {
            return value.words();
        } else {
            return value;
        }
    }, source);

    if (std::find(tokens.begin(), tokens.end(), unk_token) == tokens.end()) {
        tokens.push_back(unk_token);
    }
    return tokens;
}

void save_vocabulary(const std::vector<std::string>& tokens, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error(fmt::format("Could not open {} for writing", path));
    }
    for (const auto& token : tokens) {
        file << token << '\n';
    }
    if (!file) {
        throw std::runtime_error(fmt::format("Error writing vocabulary file {}", path));
    }
}

} // namespace nmtspec
