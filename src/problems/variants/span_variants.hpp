// File: src/problems/variants/span_variants.hpp
//
// Complex span tasks: every stored item is preceded by a processing task.

#pragma once

#include "problems/variant_strategy.hpp"

namespace algoseq {

/// Operation span
///
/// Per stored item x_i:
///   [DISTRACT] p_1 .. p_m [RECALL] d (target XOR(p_1..p_m)) [STORE] x_i
/// followed by a final [RECALL] with L response frames, target = x.
///
/// Key: operation_length m (default 2, >= 1)
class OperationSpan : public VariantStrategy {
public:
    std::string GetName() const override { return "OperationSpan"; }
    size_t RequiredControlBits() const override { return 3; }
    Sample Synthesize(size_t length, RandomEngine& rng) const override;

    size_t GetOperationLength() const { return operation_length_; }

protected:
    void ConfigureVariant(const ProblemConfig& config) override;

private:
    size_t operation_length_{2};
};

/// Reading span
///
/// Per stored item: [DISTRACT] s_1 .. s_n with n ~ U[1, sentence_length].
/// The last item of every sentence is the item to remember; the final
/// [RECALL] expects the L sentence endings in order.
///
/// Key: sentence_length (default 3, >= 1)
class ReadingSpan : public VariantStrategy {
public:
    std::string GetName() const override { return "ReadingSpan"; }
    size_t RequiredControlBits() const override { return 3; }
    Sample Synthesize(size_t length, RandomEngine& rng) const override;

    size_t GetSentenceLength() const { return sentence_length_; }

protected:
    void ConfigureVariant(const ProblemConfig& config) override;

private:
    size_t sentence_length_{3};
};

} // namespace algoseq
