// File: src/core/sample.cpp
#include "core/sample.hpp"
#include "core/encoding.hpp"
#include <algorithm>
#include <stdexcept>

namespace algoseq {

size_t Sample::CountMasked() const {
    return static_cast<size_t>(std::count(mask.begin(), mask.end(), true));
}

bool Sample::IsConsistent() const {
    return inputs.size() == targets.size() && targets.size() == mask.size();
}

FrameSequence Sample::MaskedTargets() const {
    FrameSequence result;
    for (size_t i = 0; i < mask.size() && i < targets.size(); ++i) {
        if (mask[i]) {
            result.push_back(targets[i]);
        }
    }
    return result;
}

std::vector<size_t> Sample::FindMarkers(ControlMarker marker, size_t control_bits) const {
    Frame expected = MarkerControl(marker, control_bits);
    std::vector<size_t> positions;
    for (size_t i = 0; i < inputs.size(); ++i) {
        if (inputs[i].size() < control_bits) {
            continue;
        }
        if (std::equal(expected.begin(), expected.end(), inputs[i].begin())) {
            positions.push_back(i);
        }
    }
    return positions;
}

void Sample::PadTo(size_t num_frames, size_t control_bits, size_t data_bits) {
    if (inputs.size() >= num_frames) {
        return;
    }

    Frame padding_input = PaddingControl(control_bits);
    padding_input.resize(control_bits + data_bits, 0.0f);

    size_t missing = num_frames - inputs.size();
    inputs.insert(inputs.end(), missing, padding_input);
    targets.insert(targets.end(), missing, ZeroFrame(data_bits));
    mask.insert(mask.end(), missing, false);
}

bool Sample::IsPadding(size_t index, size_t control_bits) const {
    if (index >= inputs.size() || inputs[index].size() < control_bits) {
        return false;
    }
    for (size_t i = 0; i < control_bits; ++i) {
        if (inputs[index][i] != 1.0f) {
            return false;
        }
    }
    return true;
}

size_t SampleBatch::NumFrames() const {
    if (samples.empty()) {
        return 0;
    }
    return samples.front().Length();
}

Frame PaddingControl(size_t control_bits) {
    return Frame(control_bits, 1.0f);
}

Frame MarkerControl(ControlMarker marker, size_t control_bits) {
    if (marker == ControlMarker::NONE) {
        return ZeroFrame(control_bits);
    }
    if (RequiredControlBits(marker) > control_bits) {
        throw std::invalid_argument(std::string("Marker ") + ToString(marker) +
                                    " needs more control bits than available");
    }
    return EncodeOneHot(static_cast<size_t>(marker), control_bits);
}

} // namespace algoseq
