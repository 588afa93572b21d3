// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef NMTSPEC_SRC_CHECKPOINT_CHECKPOINT_LOADER_H
#define NMTSPEC_SRC_CHECKPOINT_CHECKPOINT_LOADER_H

#include <string>

#include "checkpoint/variable_store.h"

namespace nmtspec {

struct LoadedCheckpoint {
    //! Naming convention of the variables (1 or 2).
    int Generation = 1;
    //! Variables with the generation 2 attribute suffix already stripped.
    VariableStore Variables;
    //! File the variables were read from.
    std::string Path;
};

/**
 * @brief Reads a trained checkpoint into a VariableStore.
 */
class ICheckpointLoader {
public:
    virtual ~ICheckpointLoader() = default;

    [[nodiscard]] virtual LoadedCheckpoint load(const std::string& path) const = 0;
};

/**
 * @brief Loads checkpoints exported to SafeTensors.
 *
 * @p path may name
 *  - a `.safetensors` (or `.safetensors.index.json`) file,
 *  - a checkpoint prefix (`.safetensors` is appended),
 *  - a model directory, resolved through its `checkpoint` state file to the
 *    latest checkpoint prefix.
 *
 * Directories holding a serialized program (`saved_model.pb`) are refused.
 */
class SafeTensorsCheckpointLoader : public ICheckpointLoader {
public:
    [[nodiscard]] LoadedCheckpoint load(const std::string& path) const override;
};

//! Resolves a model directory to the prefix of its latest checkpoint.
std::string latest_checkpoint(const std::string& directory);

} // namespace nmtspec

#endif //NMTSPEC_SRC_CHECKPOINT_CHECKPOINT_LOADER_H
