// File: src/problems/variants/recall_variants.hpp
//
// Recall Variants
//
// Tasks where the model stores a sequence and replays it (possibly
// transformed) after a single RECALL marker:
//
//   [STORE] x1 .. xL [RECALL] d1 .. dT      (d = dummy frames, T = |target|)
//
// The manipulation tasks in manipulation_variants.hpp share this layout.

#pragma once

#include "problems/variant_strategy.hpp"

namespace algoseq {

/// Common layout of single-phase store/recall tasks
///
/// Subclasses only decide the response: target = Transform(stored items).
class StoreRecallVariant : public VariantStrategy {
public:
    Sample Synthesize(size_t length, RandomEngine& rng) const override;

    /// Expected response for the stored items (never empty for non-empty input)
    virtual FrameSequence Transform(const FrameSequence& items) const = 0;
};

/// Replay the stored items in their original order
class SerialRecall : public StoreRecallVariant {
public:
    std::string GetName() const override { return "SerialRecall"; }
    FrameSequence Transform(const FrameSequence& items) const override;
};

/// Replay the stored items last to first
class ReverseRecall : public StoreRecallVariant {
public:
    std::string GetName() const override { return "ReverseRecall"; }
    FrameSequence Transform(const FrameSequence& items) const override;
};

/// Replay every skip_step-th stored item, starting at seq_start
///
/// Keys: seq_start (default 0, must be < min_sequence_length),
///       skip_step (default 2, must be >= 1)
class SkipRecall : public StoreRecallVariant {
public:
    std::string GetName() const override { return "SkipRecall"; }
    FrameSequence Transform(const FrameSequence& items) const override;

    size_t GetSeqStart() const { return seq_start_; }
    size_t GetSkipStep() const { return skip_step_; }

protected:
    void ConfigureVariant(const ProblemConfig& config) override;

private:
    size_t seq_start_{0};
    size_t skip_step_{2};
};

/// Replay the stored sequence r times
///
/// The repeat count r ~ U[min_repeats, max_repeats] is encoded with
/// EncodeSymbol() in the data channel of the RECALL marker frame. With
/// reverse == true each repetition is played last to first.
///
/// Keys: min_repeats (default 1), max_repeats (default 3, < 2^data_bits)
class RepeatRecall : public VariantStrategy {
public:
    explicit RepeatRecall(bool reverse);

    std::string GetName() const override;
    Sample Synthesize(size_t length, RandomEngine& rng) const override;

    bool IsReverse() const { return reverse_; }

protected:
    void ConfigureVariant(const ProblemConfig& config) override;

private:
    bool reverse_;
    size_t min_repeats_{1};
    size_t max_repeats_{3};
};

/// Store k chunks, each opened by its own STORE marker; recall the last one
///
/// k ~ U[min_subsequences, min(max_subsequences, L)].
/// Keys: min_subsequences (default 1), max_subsequences (default 3)
class ScratchPad : public VariantStrategy {
public:
    std::string GetName() const override { return "ScratchPad"; }
    Sample Synthesize(size_t length, RandomEngine& rng) const override;

protected:
    void ConfigureVariant(const ProblemConfig& config) override;

private:
    size_t min_subsequences_{1};
    size_t max_subsequences_{3};
};

} // namespace algoseq
