// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Fatal conditions of a conversion. Nothing here is retried: every lookup is a
// deterministic function of the loaded checkpoint.

#ifndef NMTSPEC_SRC_UTILITIES_ERRORS_H
#define NMTSPEC_SRC_UTILITIES_ERRORS_H

#include <stdexcept>
#include <string>
#include <utility>

namespace nmtspec {

/// Base class of every error reported by a conversion.
class ConversionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Invalid combination of inputs, detected before any resolution work.
class ConfigurationError : public ConversionError {
public:
    using ConversionError::ConversionError;
};

/// The checkpoint (or the requested feature) cannot be handled in this format.
class UnsupportedFormatError : public ConversionError {
public:
    using ConversionError::ConversionError;
};

/// The requested architecture has no known specification.
class UnsupportedArchitectureError : public ConversionError {
public:
    using ConversionError::ConversionError;
};

/// A required variable is absent after its whole fallback chain was tried.
class MissingVariableError : public ConversionError {
public:
    explicit MissingVariableError(std::string name)
        : ConversionError("Missing variable '" + name + "' in checkpoint"), mName(std::move(name)) {}

    /// The last name that was looked up.
    [[nodiscard]] const std::string& name() const { return mName; }

private:
    std::string mName;
};

/// The populated specification is inconsistent.
class SpecValidationError : public ConversionError {
public:
    using ConversionError::ConversionError;
};

} // namespace nmtspec

#endif //NMTSPEC_SRC_UTILITIES_ERRORS_H
