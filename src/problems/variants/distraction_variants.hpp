// File: src/problems/variants/distraction_variants.hpp
//
// Distraction Variants
//
// The stored sequence X is split into k chunks. Every chunk is followed by
// a distractor chunk Y_j of the same length:
//
//   [STORE] X_1 [DISTRACT] Y_1 ... [STORE] X_k [DISTRACT] Y_k [RECALL] d..d
//
// IGNORE - the distractors are never asked for
// CARRY  - after each Y_j comes an ad-hoc [RECALL] with |Y_j| response
//          frames whose target is Y_j
// FORGET - as CARRY; in addition every stored item is flagged with the
//          FORGET marker with probability forget_probability, and the final
//          target carries the null (all-zero) symbol in its place

#pragma once

#include "problems/variant_strategy.hpp"

namespace algoseq {

enum class DistractionMode {
    IGNORE,
    CARRY,
    FORGET
};

const char* ToString(DistractionMode mode);

/// Keys: min_subsequences (default 1), max_subsequences (default 3),
///       forget_probability (default 0.3, FORGET only)
class DistractionVariant : public VariantStrategy {
public:
    explicit DistractionVariant(DistractionMode mode);

    std::string GetName() const override;

    /// FORGET needs the fourth marker
    size_t RequiredControlBits() const override;

    Sample Synthesize(size_t length, RandomEngine& rng) const override;

    DistractionMode GetMode() const { return mode_; }
    double GetForgetProbability() const { return forget_probability_; }

protected:
    void ConfigureVariant(const ProblemConfig& config) override;

private:
    DistractionMode mode_;
    size_t min_subsequences_{1};
    size_t max_subsequences_{3};
    double forget_probability_{0.3};
};

} // namespace algoseq
