// File: src/problems/sequence_builder.hpp
#pragma once

#include "core/sample.hpp"
#include "core/types.hpp"

namespace algoseq {

/// Frame writer used by task variants
///
/// Appends input frames together with their target and mask so the three
/// sequences can never drift apart:
/// - marker and content frames get a zero target and mask == false
/// - recall frames are dummies (no control, zero data) whose target is the
///   expected output and whose mask is true
class SequenceBuilder {
public:
    SequenceBuilder(size_t control_bits, size_t data_bits);

    /// Single marker frame; payload (data channel) defaults to zeros
    void AddMarker(ControlMarker marker, const Frame& payload = {});

    /// Content frame carrying item in the data channel
    void AddItem(const Frame& item, ControlMarker marker = ControlMarker::NONE);

    /// Content frames, one per item
    void AddItems(const FrameSequence& items, ControlMarker marker = ControlMarker::NONE);

    /// Response frames: one masked dummy frame per expected output
    void AddRecall(const FrameSequence& expected);

    size_t NumFrames() const { return sample_.inputs.size(); }

    /// Finish the sample; the builder is left empty
    Sample Build(const SampleMetadata& metadata);

private:
    size_t control_bits_;
    size_t data_bits_;
    Sample sample_;

    void Append(const Frame& control, const Frame& data, const Frame& target, bool masked);
};

} // namespace algoseq
