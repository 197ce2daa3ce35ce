// File: src/problems/variants/manipulation_variants.hpp
#pragma once

#include "problems/variants/recall_variants.hpp"

namespace algoseq {

/// Recall every stored item with all its bits inverted
class ManipulationSpatialNot : public StoreRecallVariant {
public:
    std::string GetName() const override { return "ManipulationSpatialNot"; }
    FrameSequence Transform(const FrameSequence& items) const override;
};

/// Recall every stored item cyclically rotated along the bit axis
///
/// Key: num_bits (default 0.5). Values with magnitude below 1 are a fraction
/// of data_bits, larger values an absolute number of bits; negative values
/// rotate the other way.
class ManipulationSpatialRotation : public StoreRecallVariant {
public:
    std::string GetName() const override { return "ManipulationSpatialRotation"; }
    FrameSequence Transform(const FrameSequence& items) const override;

    /// Resolved rotation in bits
    int64_t GetShift() const { return shift_; }

protected:
    void ConfigureVariant(const ProblemConfig& config) override;

private:
    int64_t shift_{0};
};

/// Recall the stored sequence rotated in time: x[n:] + x[:n]
///
/// Key: num_items (default 0.5), a fraction of the sampled length L when its
/// magnitude is below 1, an absolute number of items otherwise.
class ManipulationTemporalSwap : public StoreRecallVariant {
public:
    std::string GetName() const override { return "ManipulationTemporalSwap"; }
    FrameSequence Transform(const FrameSequence& items) const override;

    double GetNumItems() const { return num_items_; }

protected:
    void ConfigureVariant(const ProblemConfig& config) override;

private:
    double num_items_{0.5};
};

} // namespace algoseq
