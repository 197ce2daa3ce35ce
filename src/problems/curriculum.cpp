// File: src/problems/curriculum.cpp
#include "problems/curriculum.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>

namespace algoseq {

const char* ToString(CurriculumPolicy policy) {
    switch (policy) {
        case CurriculumPolicy::FIXED: return "fixed";
        case CurriculumPolicy::EPISODE_INTERVAL: return "episode";
        case CurriculumPolicy::LOSS_THRESHOLD: return "loss";
        default: return "unknown";
    }
}

CurriculumPolicy ParseCurriculumPolicy(const std::string& str) {
    if (str == "fixed") return CurriculumPolicy::FIXED;
    if (str == "episode") return CurriculumPolicy::EPISODE_INTERVAL;
    if (str == "loss") return CurriculumPolicy::LOSS_THRESHOLD;
    throw ConfigError("curriculum_learning.policy",
                      "must be one of: fixed, episode, loss (got '" + str + "')");
}

// ============================================================================
// CurriculumConfig
// ============================================================================

CurriculumConfig CurriculumConfig::FromParams(const ParamMap& params) {
    CurriculumConfig config;

    if (params.Has("curriculum_learning")) {
        // Scalar form: curriculum_learning: true
        if (params.GetBool("curriculum_learning", false)) {
            config.policy = CurriculumPolicy::EPISODE_INTERVAL;
        }
    }

    ParamMap section = params.WithPrefix("curriculum_learning");
    if (!section.IsEmpty()) {
        config.policy = CurriculumPolicy::EPISODE_INTERVAL;
        if (!section.GetBool("enabled", true)) {
            config.policy = CurriculumPolicy::FIXED;
        } else if (section.Has("policy")) {
            config.policy = ParseCurriculumPolicy(section.GetString("policy", "episode"));
        }

        config.initial_max_sequence_length = section.GetSize(
            "initial_max_sequence_length", config.initial_max_sequence_length);
        config.interval = section.GetSize("interval", config.interval);
        config.step = section.GetSize("step", config.step);
        config.loss_threshold = section.GetDouble("loss_threshold", config.loss_threshold);
        config.must_finish = section.GetBool("must_finish", config.must_finish);
    }

    config.debug_logging = params.GetBool("debug_logging", false);
    return config;
}

bool CurriculumConfig::Validate() const {
    return GetValidationErrors().empty();
}

std::vector<std::string> CurriculumConfig::GetValidationErrors() const {
    std::vector<std::string> errors;

    if (policy == CurriculumPolicy::FIXED) {
        return errors;
    }

    if (step == 0) {
        errors.push_back("curriculum_learning.step must be greater than 0");
    }
    if (policy == CurriculumPolicy::EPISODE_INTERVAL && interval == 0) {
        errors.push_back("curriculum_learning.interval must be greater than 0");
    }
    if (policy == CurriculumPolicy::LOSS_THRESHOLD &&
        !(loss_threshold > 0.0 && std::isfinite(loss_threshold))) {
        errors.push_back("curriculum_learning.loss_threshold must be greater than 0");
    }

    return errors;
}

// ============================================================================
// CurriculumState
// ============================================================================

std::string CurriculumState::ToString() const {
    std::ostringstream oss;
    oss << "Curriculum(" << algoseq::ToString(policy)
        << ", range=[" << min_sequence_length << ", " << max_sequence_length << "]"
        << ", current_max=" << current_allowed_max
        << ", transitions=" << transitions
        << (IsDone() ? ", done" : "") << ")";
    return oss.str();
}

// ============================================================================
// Curriculum
// ============================================================================

Curriculum::Curriculum(size_t min_sequence_length, size_t max_sequence_length,
                       const CurriculumConfig& config)
    : config_(config) {

    if (min_sequence_length == 0) {
        throw ConfigError("min_sequence_length", "must be greater than 0");
    }
    if (min_sequence_length > max_sequence_length) {
        throw ConfigError("min_sequence_length", "must be <= max_sequence_length");
    }

    auto errors = config_.GetValidationErrors();
    if (!errors.empty()) {
        throw ConfigError(errors.front());
    }

    state_.min_sequence_length = min_sequence_length;
    state_.max_sequence_length = max_sequence_length;
    state_.policy = config_.policy;

    if (config_.IsProgressive()) {
        size_t initial = config_.initial_max_sequence_length == 0
            ? min_sequence_length
            : config_.initial_max_sequence_length;
        state_.current_allowed_max = Clamp(initial);
    } else {
        state_.current_allowed_max = max_sequence_length;
    }
}

bool Curriculum::Advance(const ProgressSignal& signal) {
    if (signal.IsEpisode()) {
        state_.last_episode = signal.episode();
    } else {
        state_.last_loss = signal.loss();
    }

    if (!config_.IsProgressive()) {
        return false;
    }

    if (IsDone()) {
        LogDebug("Curriculum exhausted, ignoring " + signal.ToString());
        return false;
    }

    size_t proposed = state_.current_allowed_max;

    switch (config_.policy) {
        case CurriculumPolicy::EPISODE_INTERVAL: {
            if (!signal.IsEpisode()) {
                return false;
            }
            size_t initial = config_.initial_max_sequence_length == 0
                ? state_.min_sequence_length
                : config_.initial_max_sequence_length;
            uint64_t increments = signal.episode() / config_.interval;
            uint64_t headroom = state_.max_sequence_length;
            // Saturate instead of overflowing on very large episode counts
            uint64_t growth = increments > headroom / config_.step
                ? headroom
                : increments * config_.step;
            proposed = Clamp(static_cast<size_t>(std::min<uint64_t>(initial + growth,
                                                                   state_.max_sequence_length)));
            break;
        }

        case CurriculumPolicy::LOSS_THRESHOLD: {
            if (!signal.IsLoss()) {
                return false;
            }
            if (signal.loss() < config_.loss_threshold) {
                proposed = Clamp(state_.current_allowed_max + config_.step);
            }
            break;
        }

        default:
            return false;
    }

    // Monotone: never move backwards
    if (proposed <= state_.current_allowed_max) {
        return false;
    }

    LogDebug("Max sequence length " + std::to_string(state_.current_allowed_max) +
             " -> " + std::to_string(proposed) + " after " + signal.ToString());

    state_.current_allowed_max = proposed;
    state_.transitions++;
    return true;
}

void Curriculum::Restore(const CurriculumState& state) {
    if (state.min_sequence_length != state_.min_sequence_length ||
        state.max_sequence_length != state_.max_sequence_length) {
        throw ConfigError("curriculum_learning",
                          "restored state has a different sequence length range");
    }
    if (state.policy != state_.policy) {
        throw ConfigError("curriculum_learning.policy",
                          "restored state uses a different policy");
    }
    if (state.current_allowed_max < state.min_sequence_length ||
        state.current_allowed_max > state.max_sequence_length) {
        throw ConfigError("curriculum_learning",
                          "restored current_allowed_max is out of range");
    }

    state_ = state;
    LogDebug("Restored " + state_.ToString());
}

size_t Curriculum::Clamp(size_t value) const {
    return std::clamp(value, state_.min_sequence_length, state_.max_sequence_length);
}

void Curriculum::LogDebug(const std::string& message) const {
    if (config_.debug_logging) {
        std::cout << "[Curriculum] " << message << std::endl;
    }
}

} // namespace algoseq
