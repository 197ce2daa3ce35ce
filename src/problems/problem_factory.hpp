// File: src/problems/problem_factory.hpp
#pragma once

#include "problems/problem.hpp"
#include "problems/problem_config.hpp"
#include "problems/variant_strategy.hpp"
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace algoseq {

/// Lookup table: variant name -> variant constructor
///
/// Names are matched case-sensitively. A registry is filled once and then
/// only read; the factory holds it by reference.
class ProblemRegistry {
public:
    using VariantCreator = std::function<std::unique_ptr<VariantStrategy>()>;

    /// Register a variant
    /// @throws std::invalid_argument if the name is empty, already taken or
    ///         the creator is empty
    void Register(const std::string& name, VariantCreator creator);

    bool Contains(const std::string& name) const;

    /// Creator for a registered name
    /// @throws UnknownProblemError if the name is not registered
    const VariantCreator& Get(const std::string& name) const;

    /// Registered names in lexicographic order
    std::vector<std::string> GetNames() const;

    size_t Size() const { return creators_.size(); }

private:
    std::map<std::string, VariantCreator> creators_;
};

/// Registry holding every built-in variant
///
/// Populated on first use (thread-safe function-local static) and read-only
/// afterwards.
const ProblemRegistry& BuiltinRegistry();

/// Creates fully configured problems from a registry
///
/// Example:
///   ProblemFactory factory(BuiltinRegistry());
///   auto problem = factory.Create("SerialRecall", config);
class ProblemFactory {
public:
    explicit ProblemFactory(const ProblemRegistry& registry);

    /// Create and configure a problem
    /// @throws UnknownProblemError if name is not registered (nothing is
    ///         constructed in that case)
    /// @throws ConfigError if the configuration is invalid for the variant
    std::unique_ptr<Problem> Create(const std::string& name, const ProblemConfig& config) const;

    /// Create a problem selected by config.name
    std::unique_ptr<Problem> Create(const ProblemConfig& config) const;

    std::vector<std::string> GetRegisteredNames() const { return registry_.GetNames(); }

    const ProblemRegistry& GetRegistry() const { return registry_; }

private:
    const ProblemRegistry& registry_;
};

} // namespace algoseq
