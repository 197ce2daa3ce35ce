// File: include/config/config_loader.hpp
//
// YAML Experiment Configuration
// Loads experiment files (training / validation / testing sections) and
// hands the problem section of a phase to ProblemConfig::FromParams().

#ifndef ALGOSEQ_CONFIG_LOADER_HPP
#define ALGOSEQ_CONFIG_LOADER_HPP

#include "config/param_map.hpp"
#include <optional>
#include <string>
#include <vector>

namespace algoseq {

/// Flattened experiment configuration
///
/// Nested mappings become dotted keys ("training.problem.batch_size"),
/// sequence entries are indexed ("tags.0"). Anchors and aliases are
/// resolved while loading, including "<<" merge keys.
///
/// Example file:
///   training:
///     problem: &problem
///       name: SerialRecall
///       control_bits: 2
///       ...
///     curriculum_learning:
///       interval: 500
///     seed_numpy: 42
///   validation:
///     problem:
///       <<: *problem
///       batch_size: 64
struct ExperimentConfig {
    ParamMap values;

    /// Load configuration from YAML file
    /// @param filepath Path to YAML configuration file
    /// @return ExperimentConfig if successful, std::nullopt on error
    static std::optional<ExperimentConfig> LoadFromFile(const std::string& filepath);

    /// Load configuration from YAML string
    /// @param yaml_content YAML content as string
    /// @return ExperimentConfig if successful, std::nullopt on error
    static std::optional<ExperimentConfig> LoadFromString(const std::string& yaml_content);

    /// Problem parameters of one phase
    ///
    /// Returns the "<phase>.problem" keys, the phase's curriculum_learning
    /// entries (flag or section) and "<phase>.seed_numpy" as "seed" unless
    /// the problem section sets a seed itself.
    ParamMap LoadProblemParams(const std::string& phase) const;

    /// Top-level sections that contain a problem section, in key order
    std::vector<std::string> GetPhases() const;

    bool HasPhase(const std::string& phase) const;

    /// Validate configuration values
    /// @return true if configuration is valid, false otherwise
    bool Validate() const;

    /// Get validation errors (if any)
    std::vector<std::string> GetValidationErrors() const;
};

} // namespace algoseq

#endif // ALGOSEQ_CONFIG_LOADER_HPP
