// File: src/problems/variant_strategy.hpp
#pragma once

#include "core/encoding.hpp"
#include "core/sample.hpp"
#include "problems/problem_config.hpp"
#include "problems/sequence_builder.hpp"
#include <string>
#include <vector>

namespace algoseq {

/// Task variant capability
///
/// A variant defines how control markers delimit the phases of a sample and
/// the exact target and mask as a deterministic function of the generated
/// content. It holds no mutable state: Synthesize() draws everything from
/// the engine it is given.
///
/// Example:
///   SerialRecall variant;
///   variant.Configure(config);
///   RandomEngine rng = MakeEngine(42);
///   Sample sample = variant.Synthesize(5, rng);
class VariantStrategy {
public:
    virtual ~VariantStrategy() = default;

    /// Registered name of the variant
    virtual std::string GetName() const = 0;

    /// Control bits needed to encode every marker the variant emits
    virtual size_t RequiredControlBits() const { return 2; }

    /// Read frame layout and variant-specific keys
    /// @throws ConfigError if control_bits is too small or a variant key is
    ///         invalid; the variant keeps its previous configuration then
    void Configure(const ProblemConfig& config);

    /// Produce one sample whose content has `length` stored items
    /// @param length Sequence length drawn by the curriculum (>= 1)
    /// @param rng Engine to draw content from
    virtual Sample Synthesize(size_t length, RandomEngine& rng) const = 0;

    size_t GetControlBits() const { return control_bits_; }
    size_t GetDataBits() const { return data_bits_; }
    double GetBias() const { return bias_; }

protected:
    /// Hook for variant-specific keys; called after the frame layout has
    /// been validated. Must parse into locals and only assign members once
    /// everything has been validated.
    virtual void ConfigureVariant(const ProblemConfig& config);

    SequenceBuilder NewBuilder() const { return SequenceBuilder(control_bits_, data_bits_); }

    /// Random content items drawn with the configured bias
    FrameSequence RandomItems(size_t count, RandomEngine& rng) const;

    /// Metadata skeleton for a sample of the given length
    SampleMetadata MakeMetadata(size_t length, size_t num_subsequences = 1) const;

private:
    size_t control_bits_{0};
    size_t data_bits_{0};
    double bias_{0.5};
};

/// Ordered range [low, high] read from "min_<key>" / "max_<key>"
struct SizeRange {
    size_t low{1};
    size_t high{1};

    /// @throws ConfigError if low > high
    static SizeRange FromParams(const ParamMap& params, const std::string& key,
                                size_t default_low, size_t default_high);

    /// Clamp both bounds to at most limit (keeping low <= high)
    SizeRange ClampedTo(size_t limit) const;
};

/// Split items into consecutive chunks of the given sizes
/// @throws std::invalid_argument if the sizes add up to more than items.size()
std::vector<FrameSequence> SplitIntoChunks(const FrameSequence& items,
                                           const std::vector<size_t>& sizes);

} // namespace algoseq
