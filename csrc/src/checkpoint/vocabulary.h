// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef NMTSPEC_SRC_CHECKPOINT_VOCABULARY_H
#define NMTSPEC_SRC_CHECKPOINT_VOCABULARY_H

#include <cstddef>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace nmtspec {

inline constexpr const char* kDefaultUnknownToken = "<unk>";

/**
 * @brief Ordered set of tokens; the position of a token is its id.
 */
class Vocab {
public:
    Vocab() = default;
    explicit Vocab(const std::vector<std::string>& tokens);

    //! Appends @p token unless it is already present.
    void add(const std::string& token);

    [[nodiscard]] bool contains(const std::string& token) const { return mIndex.contains(token); }
    [[nodiscard]] std::size_t size() const { return mWords.size(); }
    [[nodiscard]] const std::vector<std::string>& words() const { return mWords; }

private:
    std::vector<std::string> mWords;
    std::unordered_map<std::string, std::size_t> mIndex;
};

struct VocabularyPath {
    std::string Path;
};

//! A vocabulary given as a file, as an in-memory token list or as a Vocab.
using VocabularySource = std::variant<VocabularyPath, std::vector<std::string>, Vocab>;

class IVocabularyReader {
public:
    virtual ~IVocabularyReader() = default;

    //! Returns the tokens stored in @p path, in file order.
    [[nodiscard]] virtual std::vector<std::string> read(const std::string& path) const = 0;
};

//! Reads one token per line.
class FileVocabularyReader : public IVocabularyReader {
public:
    [[nodiscard]] std::vector<std::string> read(const std::string& path) const override;
};

/**
 * @brief Materialize @p source into an ordered token list.
 *
 * Files are read through @p reader and deduplicated. @p unk_token is appended
 * if the result does not contain it.
 *
 * @throws ConfigurationError for an empty path or a valueless source.
 */
std::vector<std::string> load_vocabulary(const VocabularySource& source, const IVocabularyReader& reader,
                                         const std::string& unk_token = kDefaultUnknownToken);

//! Writes one token per line.
void save_vocabulary(const std::vector<std::string>& tokens, const std::string& path);

} // namespace nmtspec

#endif //NMTSPEC_SRC_CHECKPOINT_VOCABULARY_H
