// File: src/problems/variants/manipulation_variants.cpp
#include "problems/variants/manipulation_variants.hpp"

namespace algoseq {

FrameSequence ManipulationSpatialNot::Transform(const FrameSequence& items) const {
    FrameSequence result;
    result.reserve(items.size());
    for (const auto& item : items) {
        result.push_back(InvertBits(item));
    }
    return result;
}

// ============================================================================
// ManipulationSpatialRotation
// ============================================================================

void ManipulationSpatialRotation::ConfigureVariant(const ProblemConfig& config) {
    double num_bits = config.params.GetDouble("num_bits", 0.5);
    shift_ = ResolveShift(num_bits, config.data_bits);
}

FrameSequence ManipulationSpatialRotation::Transform(const FrameSequence& items) const {
    FrameSequence result;
    result.reserve(items.size());
    for (const auto& item : items) {
        result.push_back(RotateBits(item, shift_));
    }
    return result;
}

// ============================================================================
// ManipulationTemporalSwap
// ============================================================================

void ManipulationTemporalSwap::ConfigureVariant(const ProblemConfig& config) {
    num_items_ = config.params.GetDouble("num_items", 0.5);
}

FrameSequence ManipulationTemporalSwap::Transform(const FrameSequence& items) const {
    // Resolved per sample, the fraction refers to the sampled length
    return RotateSequence(items, ResolveShift(num_items_, items.size()));
}

} // namespace algoseq
