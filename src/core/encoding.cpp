// File: src/core/encoding.cpp
#include "core/encoding.hpp"
#include <cmath>
#include <stdexcept>
#include <algorithm>

namespace algoseq {

namespace {
    // Wrap a possibly negative offset into [0, n)
    size_t WrapIndex(int64_t value, size_t n) {
        int64_t m = static_cast<int64_t>(n);
        int64_t r = value % m;
        if (r < 0) {
            r += m;
        }
        return static_cast<size_t>(r);
    }
}

// ============================================================================
// Random streams
// ============================================================================

RandomEngine MakeEngine(uint64_t seed) {
    return RandomEngine(seed);
}

uint64_t MixSeed(uint64_t seed, uint64_t stream) {
    // SplitMix64 finalizer over (seed, stream)
    uint64_t z = seed + 0x9e3779b97f4a7c15ULL * (stream + 1);
    z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
    z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
    return z ^ (z >> 31);
}

size_t UniformSize(size_t low, size_t high, RandomEngine& rng) {
    if (low > high) {
        throw std::invalid_argument("UniformSize: low > high");
    }
    if (low == high) {
        return low;
    }
    std::uniform_int_distribution<size_t> dist(low, high);
    return dist(rng);
}

bool Bernoulli(double probability, RandomEngine& rng) {
    if (probability <= 0.0) {
        return false;
    }
    if (probability >= 1.0) {
        return true;
    }
    std::bernoulli_distribution dist(probability);
    return dist(rng);
}

// ============================================================================
// Encoders
// ============================================================================

Frame EncodeSymbol(uint64_t value, size_t width) {
    if (width < 64 && (value >> width) != 0) {
        throw std::invalid_argument("EncodeSymbol: value " + std::to_string(value) +
                                    " does not fit into " + std::to_string(width) + " bits");
    }

    Frame frame(width, 0.0f);
    for (size_t i = 0; i < width && i < 64; ++i) {
        // Most significant bit first
        if ((value >> i) & 1ULL) {
            frame[width - 1 - i] = 1.0f;
        }
    }
    return frame;
}

uint64_t DecodeSymbol(const Frame& frame) {
    uint64_t value = 0;
    for (float cell : frame) {
        value = (value << 1) | (cell >= 0.5f ? 1ULL : 0ULL);
    }
    return value;
}

Frame EncodeOneHot(size_t index, size_t width) {
    if (index >= width) {
        throw std::invalid_argument("EncodeOneHot: index out of range");
    }
    Frame frame(width, 0.0f);
    frame[index] = 1.0f;
    return frame;
}

Frame ZeroFrame(size_t width) {
    return Frame(width, 0.0f);
}

// ============================================================================
// Samplers
// ============================================================================

Frame RandomBitPattern(size_t data_bits, double bias, RandomEngine& rng) {
    Frame frame(data_bits, 0.0f);
    for (auto& cell : frame) {
        cell = Bernoulli(bias, rng) ? 1.0f : 0.0f;
    }
    return frame;
}

FrameSequence RandomSequence(size_t length, size_t data_bits, RandomEngine& rng,
                             double bias) {
    FrameSequence sequence;
    sequence.reserve(length);
    for (size_t i = 0; i < length; ++i) {
        sequence.push_back(RandomBitPattern(data_bits, bias, rng));
    }
    return sequence;
}

std::vector<size_t> RandomPartition(size_t total, size_t count, RandomEngine& rng) {
    if (count == 0 || count > total) {
        throw std::invalid_argument("RandomPartition: count must be in [1, total]");
    }

    // Pick count-1 distinct cut points from [1, total-1] (partial Fisher-Yates)
    std::vector<size_t> candidates;
    candidates.reserve(total > 0 ? total - 1 : 0);
    for (size_t i = 1; i < total; ++i) {
        candidates.push_back(i);
    }

    std::vector<size_t> cuts;
    cuts.reserve(count - 1);
    for (size_t i = 0; i + 1 < count; ++i) {
        size_t j = UniformSize(i, candidates.size() - 1, rng);
        std::swap(candidates[i], candidates[j]);
        cuts.push_back(candidates[i]);
    }
    std::sort(cuts.begin(), cuts.end());

    std::vector<size_t> sizes;
    sizes.reserve(count);
    size_t previous = 0;
    for (size_t cut : cuts) {
        sizes.push_back(cut - previous);
        previous = cut;
    }
    sizes.push_back(total - previous);
    return sizes;
}

// ============================================================================
// Manipulations
// ============================================================================

Frame InvertBits(const Frame& frame) {
    Frame result(frame.size());
    for (size_t i = 0; i < frame.size(); ++i) {
        result[i] = frame[i] >= 0.5f ? 0.0f : 1.0f;
    }
    return result;
}

Frame RotateBits(const Frame& frame, int64_t shift) {
    if (frame.empty()) {
        return frame;
    }
    Frame result(frame.size());
    for (size_t j = 0; j < frame.size(); ++j) {
        result[WrapIndex(static_cast<int64_t>(j) + shift, frame.size())] = frame[j];
    }
    return result;
}

FrameSequence RotateSequence(const FrameSequence& sequence, int64_t shift) {
    if (sequence.empty()) {
        return sequence;
    }
    FrameSequence result;
    result.reserve(sequence.size());
    for (size_t i = 0; i < sequence.size(); ++i) {
        result.push_back(sequence[WrapIndex(static_cast<int64_t>(i) + shift, sequence.size())]);
    }
    return result;
}

Frame XorFrames(const Frame& a, const Frame& b) {
    if (a.size() != b.size()) {
        throw std::invalid_argument("XorFrames: width mismatch");
    }
    Frame result(a.size());
    for (size_t i = 0; i < a.size(); ++i) {
        bool bit_a = a[i] >= 0.5f;
        bool bit_b = b[i] >= 0.5f;
        result[i] = (bit_a != bit_b) ? 1.0f : 0.0f;
    }
    return result;
}

int64_t ResolveShift(double value, size_t extent) {
    if (!std::isfinite(value) || extent == 0) {
        return 0;
    }
    if (std::fabs(value) < 1.0) {
        return static_cast<int64_t>(std::floor(value * static_cast<double>(extent)));
    }
    // Absolute counts only matter modulo extent; reduce before the cast
    return static_cast<int64_t>(std::fmod(value, static_cast<double>(extent)));
}

} // namespace algoseq
