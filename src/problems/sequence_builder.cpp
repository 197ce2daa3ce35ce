// File: src/problems/sequence_builder.cpp
#include "problems/sequence_builder.hpp"
#include "core/encoding.hpp"
#include <stdexcept>
#include <utility>

namespace algoseq {

SequenceBuilder::SequenceBuilder(size_t control_bits, size_t data_bits)
    : control_bits_(control_bits),
      data_bits_(data_bits) {
}

void SequenceBuilder::AddMarker(ControlMarker marker, const Frame& payload) {
    Frame data = payload.empty() ? ZeroFrame(data_bits_) : payload;
    Append(MarkerControl(marker, control_bits_), data, ZeroFrame(data_bits_), false);
}

void SequenceBuilder::AddItem(const Frame& item, ControlMarker marker) {
    Append(MarkerControl(marker, control_bits_), item, ZeroFrame(data_bits_), false);
}

void SequenceBuilder::AddItems(const FrameSequence& items, ControlMarker marker) {
    for (const auto& item : items) {
        AddItem(item, marker);
    }
}

void SequenceBuilder::AddRecall(const FrameSequence& expected) {
    Frame control = MarkerControl(ControlMarker::NONE, control_bits_);
    for (const auto& target : expected) {
        Append(control, ZeroFrame(data_bits_), target, true);
    }
}

Sample SequenceBuilder::Build(const SampleMetadata& metadata) {
    Sample result = std::move(sample_);
    sample_ = Sample{};
    result.metadata = metadata;
    result.metadata.num_frames = result.inputs.size();
    return result;
}

void SequenceBuilder::Append(const Frame& control, const Frame& data,
                             const Frame& target, bool masked) {
    if (data.size() != data_bits_ || target.size() != data_bits_) {
        throw std::invalid_argument("SequenceBuilder: frame width does not match data_bits");
    }

    Frame input;
    input.reserve(control_bits_ + data_bits_);
    input.insert(input.end(), control.begin(), control.end());
    input.insert(input.end(), data.begin(), data.end());

    sample_.inputs.push_back(std::move(input));
    sample_.targets.push_back(target);
    sample_.mask.push_back(masked);
}

} // namespace algoseq
