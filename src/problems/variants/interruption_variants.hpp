// File: src/problems/variants/interruption_variants.hpp
//
// Interruption Variants
//
// Storing X is interrupted i times by a secondary task that must be answered
// immediately; storing then resumes and X is finally recalled in full:
//
//   [STORE] X_1 [DISTRACT] Y_1 [RECALL] r(Y_1) [STORE] X_2 ... [RECALL] X
//
// The interruption response r depends on the variant:
//   NOT            - bitwise NOT of every item of Y_j
//   REVERSE_RECALL - Y_j last to first
//   SWAP_RECALL    - Y_j with its halves swapped (rotated by floor(|Y_j| / 2))
//
// i ~ U[min_interruptions, max_interruptions], clamped to L - 1 so every
// chunk of X holds at least one item. Y_j has as many items as the chunk it
// interrupts.

#pragma once

#include "problems/variant_strategy.hpp"

namespace algoseq {

enum class InterruptionTask {
    NOT,
    REVERSE_RECALL,
    SWAP_RECALL
};

const char* ToString(InterruptionTask task);

/// Keys: min_interruptions (default 1), max_interruptions (default 2)
class InterruptionVariant : public VariantStrategy {
public:
    explicit InterruptionVariant(InterruptionTask task);

    std::string GetName() const override;
    size_t RequiredControlBits() const override { return 3; }
    Sample Synthesize(size_t length, RandomEngine& rng) const override;

    InterruptionTask GetTask() const { return task_; }

    /// Response expected for one interruption
    FrameSequence Respond(const FrameSequence& interruption) const;

protected:
    void ConfigureVariant(const ProblemConfig& config) override;

private:
    InterruptionTask task_;
    size_t min_interruptions_{1};
    size_t max_interruptions_{2};
};

} // namespace algoseq
