// File: src/core/errors.hpp
//
// Error taxonomy for problem generation.
//
// All errors are fatal for the call that raised them and are surfaced
// synchronously. The generator never retries internally and never returns a
// partially generated batch.

#pragma once

#include <stdexcept>
#include <string>

namespace algoseq {

/// Invalid or missing configuration, raised at construction / Configure()
class ConfigError : public std::invalid_argument {
public:
    explicit ConfigError(const std::string& message)
        : std::invalid_argument(message) {}

    /// @param key Configuration key the error refers to
    ConfigError(const std::string& key, const std::string& message)
        : std::invalid_argument(key + ": " + message), key_(key) {}

    /// Offending key, empty when the error is not tied to one key
    const std::string& key() const { return key_; }

private:
    std::string key_;
};

/// Factory was given a name that is not in the registry
class UnknownProblemError : public std::invalid_argument {
public:
    explicit UnknownProblemError(const std::string& name)
        : std::invalid_argument("Unknown problem: " + name), name_(name) {}

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

/// Predictions do not have the shape of the batch targets
class ShapeMismatchError : public std::invalid_argument {
public:
    explicit ShapeMismatchError(const std::string& message)
        : std::invalid_argument(message) {}
};

} // namespace algoseq
