// File: src/core/types.cpp
#include "core/types.hpp"
#include <sstream>
#include <stdexcept>

namespace algoseq {

// Enum implementations

const char* ToString(ControlMarker marker) {
    switch (marker) {
        case ControlMarker::NONE: return "NONE";
        case ControlMarker::STORE: return "STORE";
        case ControlMarker::RECALL: return "RECALL";
        case ControlMarker::DISTRACT: return "DISTRACT";
        case ControlMarker::FORGET: return "FORGET";
        default: return "UNKNOWN";
    }
}

ControlMarker ParseControlMarker(const std::string& str) {
    if (str == "NONE") return ControlMarker::NONE;
    if (str == "STORE") return ControlMarker::STORE;
    if (str == "RECALL") return ControlMarker::RECALL;
    if (str == "DISTRACT") return ControlMarker::DISTRACT;
    if (str == "FORGET") return ControlMarker::FORGET;
    throw std::invalid_argument("Unknown ControlMarker: " + str);
}

size_t RequiredControlBits(ControlMarker marker) {
    if (marker == ControlMarker::NONE) {
        return 0;
    }
    return static_cast<size_t>(marker) + 1;
}

const char* ToString(ProgressSignal::Kind kind) {
    switch (kind) {
        case ProgressSignal::Kind::EPISODE: return "EPISODE";
        case ProgressSignal::Kind::LOSS: return "LOSS";
        default: return "UNKNOWN";
    }
}

// ProgressSignal implementations

ProgressSignal ProgressSignal::Episode(uint64_t episode) {
    return ProgressSignal(Kind::EPISODE, episode, 0.0);
}

ProgressSignal ProgressSignal::Loss(double loss) {
    return ProgressSignal(Kind::LOSS, 0, loss);
}

std::string ProgressSignal::ToString() const {
    std::ostringstream oss;
    if (IsEpisode()) {
        oss << "ProgressSignal(episode=" << episode_ << ")";
    } else {
        oss << "ProgressSignal(loss=" << loss_ << ")";
    }
    return oss.str();
}

} // namespace algoseq
