// File: src/core/types.hpp
#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace algoseq {

// Frame: one time step of a sequence. Cells hold 0.0/1.0 for generated data,
// arbitrary floats for model predictions.
using Frame = std::vector<float>;

// FrameSequence: ordered frames, all of the same width
using FrameSequence = std::vector<Frame>;

// ControlMarker: structural markers carried in the control channel.
// Markers are one-hot; the value is the bit index inside the control channel.
enum class ControlMarker : uint8_t {
    NONE = 0xFF,     // all-zero control channel (content and dummy frames)
    STORE = 0,       // start storing / memorization
    RECALL = 1,      // start recalling
    DISTRACT = 2,    // distractor, interruption or processing block
    FORGET = 3,      // stored item that must be forgotten
};

// Convert ControlMarker to string
const char* ToString(ControlMarker marker);

// Parse ControlMarker from string
ControlMarker ParseControlMarker(const std::string& str);

// Number of control bits a marker needs to be representable
size_t RequiredControlBits(ControlMarker marker);

// ProgressSignal: progress report supplied by the trainer to the curriculum.
// Either an episode count or a measured loss value.
class ProgressSignal {
public:
    enum class Kind : uint8_t {
        EPISODE = 0,
        LOSS = 1,
    };

    // Signal carrying the number of episodes seen so far
    static ProgressSignal Episode(uint64_t episode);

    // Signal carrying a measured (e.g. validation) loss
    static ProgressSignal Loss(double loss);

    Kind kind() const { return kind_; }
    uint64_t episode() const { return episode_; }
    double loss() const { return loss_; }

    bool IsEpisode() const { return kind_ == Kind::EPISODE; }
    bool IsLoss() const { return kind_ == Kind::LOSS; }

    // String conversion for debugging
    std::string ToString() const;

private:
    ProgressSignal(Kind kind, uint64_t episode, double loss)
        : kind_(kind), episode_(episode), loss_(loss) {}

    Kind kind_;
    uint64_t episode_;
    double loss_;
};

// Convert ProgressSignal::Kind to string
const char* ToString(ProgressSignal::Kind kind);

} // namespace algoseq
