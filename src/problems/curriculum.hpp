// File: src/problems/curriculum.hpp
//
// Curriculum scheduling for algorithmic problems
//
// The curriculum owns the only mutable part of a problem's configuration:
// the largest sequence length currently allowed. Three policies exist:
//
//   FIXED             current_allowed_max = max_sequence_length, no transitions
//   EPISODE_INTERVAL  target = initial + (episode / interval) * step
//   LOSS_THRESHOLD    loss < loss_threshold  =>  current_allowed_max += step
//
// Under both progressive policies current_allowed_max is clamped to
// [min_sequence_length, max_sequence_length], never decreases, and reaching
// max_sequence_length is terminal.

#pragma once

#include "core/types.hpp"
#include "config/param_map.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace algoseq {

/// Curriculum policy selected by configuration
enum class CurriculumPolicy : uint8_t {
    FIXED = 0,
    EPISODE_INTERVAL = 1,
    LOSS_THRESHOLD = 2,
};

// Convert CurriculumPolicy to string ("fixed", "episode", "loss")
const char* ToString(CurriculumPolicy policy);

// Parse CurriculumPolicy from string
// @throws ConfigError for unknown names
CurriculumPolicy ParseCurriculumPolicy(const std::string& str);

/// Curriculum configuration ("curriculum_learning" section)
struct CurriculumConfig {
    CurriculumPolicy policy{CurriculumPolicy::FIXED};

    /// Starting maximum; 0 means "use min_sequence_length"
    size_t initial_max_sequence_length{0};

    /// Episodes per increment (EPISODE_INTERVAL)
    uint64_t interval{500};

    /// Increment applied per transition
    size_t step{1};

    /// Loss below which the curriculum advances (LOSS_THRESHOLD)
    double loss_threshold{0.1};

    /// Whether the trainer must finish the curriculum before it may converge.
    /// Read by the trainer only.
    bool must_finish{true};

    bool debug_logging{false};

    bool IsProgressive() const { return policy != CurriculumPolicy::FIXED; }

    /// Build from the "curriculum_learning" entries of a ParamMap
    ///
    /// Accepts either a scalar flag (curriculum_learning: true/false) or a
    /// section (curriculum_learning.policy, .interval, .step, ...). A section
    /// without a policy key selects EPISODE_INTERVAL.
    /// @throws ConfigError on unparsable values
    static CurriculumConfig FromParams(const ParamMap& params);

    bool Validate() const;
    std::vector<std::string> GetValidationErrors() const;
};

/// Snapshot of the curriculum
struct CurriculumState {
    size_t min_sequence_length{1};
    size_t max_sequence_length{1};
    size_t current_allowed_max{1};
    CurriculumPolicy policy{CurriculumPolicy::FIXED};
    uint64_t last_episode{0};        ///< Last episode signal seen
    double last_loss{0.0};           ///< Last loss signal seen
    uint64_t transitions{0};         ///< Number of times current_allowed_max grew

    /// Terminal state reached (always true for FIXED)
    bool IsDone() const { return current_allowed_max >= max_sequence_length; }

    std::string ToString() const;
};

/// Curriculum state machine
///
/// Mutated only through Advance() (progress signals from the trainer) and
/// Restore() (resuming from a checkpoint).
class Curriculum {
public:
    /// @throws ConfigError if min > max, min == 0 or the config is invalid
    Curriculum(size_t min_sequence_length, size_t max_sequence_length,
               const CurriculumConfig& config);

    /// Apply a progress signal
    ///
    /// No-op when the policy is FIXED, the curriculum is already at max, or
    /// the signal kind does not drive the active policy.
    /// @return true if current_allowed_max changed
    bool Advance(const ProgressSignal& signal);

    size_t GetCurrentMax() const { return state_.current_allowed_max; }
    bool IsDone() const { return state_.IsDone(); }

    const CurriculumState& GetState() const { return state_; }
    const CurriculumConfig& GetConfig() const { return config_; }

    /// Restore a previously saved state
    /// @throws ConfigError if the state's bounds or policy differ from this
    ///         curriculum or current_allowed_max is out of range
    void Restore(const CurriculumState& state);

private:
    CurriculumConfig config_;
    CurriculumState state_;

    size_t Clamp(size_t value) const;
    void LogDebug(const std::string& message) const;
};

} // namespace algoseq
