// File: src/core/sample.hpp
#pragma once

#include "core/types.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace algoseq {

/// Per-sample generation metadata
struct SampleMetadata {
    size_t sequence_length{0};     ///< Number of stored items L drawn for this sample
    size_t num_frames{0};          ///< Frame count before padding
    size_t num_subsequences{1};    ///< Chunks / repetitions / interruptions used
    std::string variant;           ///< Registered variant name
    uint64_t seed{0};              ///< Seed of the per-sample random stream
};

/// One generated instance: input frames, target frames and loss mask
///
/// Input frames are control_bits + data_bits wide (control channel first),
/// target frames hold the data channel only. The three sequences always have
/// the same length.
struct Sample {
    FrameSequence inputs;
    FrameSequence targets;
    std::vector<bool> mask;
    SampleMetadata metadata;

    /// Number of frames (including padding)
    size_t Length() const { return inputs.size(); }

    /// Number of frames with mask == true
    size_t CountMasked() const;

    /// Check len(inputs) == len(targets) == len(mask)
    bool IsConsistent() const;

    /// Targets of the masked frames, in order
    FrameSequence MaskedTargets() const;

    /// Input frames whose control channel equals the given marker
    /// @param control_bits Width of the control channel
    std::vector<size_t> FindMarkers(ControlMarker marker, size_t control_bits) const;

    /// Right-pad to num_frames with padding frames (mask == false)
    /// No-op if the sample is already at least that long.
    void PadTo(size_t num_frames, size_t control_bits, size_t data_bits);

    /// True if frame index is a padding frame
    bool IsPadding(size_t index, size_t control_bits) const;
};

/// Batch of samples padded to a common frame count
struct SampleBatch {
    uint64_t batch_index{0};
    uint64_t seed{0};                   ///< Seed of the batch stream
    size_t max_sequence_length{0};      ///< Curriculum maximum when generated
    size_t control_bits{0};
    size_t data_bits{0};
    std::vector<Sample> samples;

    size_t Size() const { return samples.size(); }

    /// Common frame count (0 for an empty batch)
    size_t NumFrames() const;

    size_t InputWidth() const { return control_bits + data_bits; }
    size_t TargetWidth() const { return data_bits; }
};

/// Control channel with every bit set; the padding marker
Frame PaddingControl(size_t control_bits);

/// Control channel encoding a marker (all zero for NONE)
Frame MarkerControl(ControlMarker marker, size_t control_bits);

} // namespace algoseq
