// File: src/problems/problem_config.hpp
#pragma once

#include "config/param_map.hpp"
#include "problems/curriculum.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace algoseq {

/// Validated configuration of one problem instance
///
/// Built from the declarative ParamMap handed over by the configuration
/// layer. Immutable once a problem has been configured with it; the only
/// state that changes during a run is the curriculum's current maximum,
/// which lives in the Curriculum component.
struct ProblemConfig {
    // === Required keys ===
    std::string name;
    size_t batch_size{0};
    size_t control_bits{0};
    size_t data_bits{0};
    size_t min_sequence_length{0};
    size_t max_sequence_length{0};

    // === Optional keys ===
    double bias{0.5};          ///< Probability of a data bit being set
    uint64_t seed{0};          ///< Base seed of every random stream
    size_t size{10000};        ///< Epoch size in samples
    bool debug_logging{false};

    CurriculumConfig curriculum;

    /// Every key of the source map, for variant-specific parameters
    ParamMap params;

    /// Required keys, in the order they are checked
    static const std::vector<std::string>& RequiredKeys();

    /// Build from a ParamMap
    /// @throws ConfigError naming the first missing required key or the
    ///         first value that does not parse
    static ProblemConfig FromParams(const ParamMap& params);

    /// Convert back to a ParamMap (round-trips through FromParams)
    ParamMap ToParams() const;

    /// Validate configuration values
    bool Validate() const;

    /// Get validation errors (if any)
    std::vector<std::string> GetValidationErrors() const;

    /// Input frame width (control + data)
    size_t InputWidth() const { return control_bits + data_bits; }

    /// Output frame width (data only)
    size_t OutputWidth() const { return data_bits; }
};

} // namespace algoseq
