// File: src/core/encoding.hpp
//
// Encoding Utilities
//
// Bit-pattern / one-hot encoders, random samplers and the frame
// manipulations used by every task variant.
//
// Randomness is always threaded explicitly: every sampler takes the engine
// it draws from, so two calls with engines in the same state produce the
// same output. There is no hidden global random state anywhere.

#pragma once

#include "core/types.hpp"
#include <cstdint>
#include <random>

namespace algoseq {

/// Random engine used for all generation (64-bit Mersenne Twister).
/// Its output sequence is fully specified by the standard for a given seed.
using RandomEngine = std::mt19937_64;

/// Create an engine seeded with a single 64-bit seed
RandomEngine MakeEngine(uint64_t seed);

/// Derive an independent stream seed from a base seed and a stream index
///
/// Uses the SplitMix64 finalizer, so neighbouring indices give unrelated
/// seeds. MixSeed(seed, i) is a pure function.
uint64_t MixSeed(uint64_t seed, uint64_t stream);

/// Draw an integer uniformly from [low, high] (inclusive)
/// @throws std::invalid_argument if low > high
size_t UniformSize(size_t low, size_t high, RandomEngine& rng);

/// Draw true with the given probability
bool Bernoulli(double probability, RandomEngine& rng);

// ============================================================================
// Encoders
// ============================================================================

/// Encode a value as a big-endian binary pattern over width cells
/// @throws std::invalid_argument if value does not fit into width bits
Frame EncodeSymbol(uint64_t value, size_t width);

/// Inverse of EncodeSymbol; cells >= 0.5 count as set
uint64_t DecodeSymbol(const Frame& frame);

/// Encode index as a one-hot vector of the given width
/// @throws std::invalid_argument if index >= width
Frame EncodeOneHot(size_t index, size_t width);

/// All-zero frame of the given width
Frame ZeroFrame(size_t width);

// ============================================================================
// Samplers
// ============================================================================

/// Random bit pattern, each bit set with probability bias
Frame RandomBitPattern(size_t data_bits, double bias, RandomEngine& rng);

/// Random sequence of bit patterns; length == 0 yields an empty sequence
FrameSequence RandomSequence(size_t length, size_t data_bits, RandomEngine& rng,
                             double bias = 0.5);

/// Split total items into count positive chunk sizes at random cut points
/// @throws std::invalid_argument if count == 0 or count > total
std::vector<size_t> RandomPartition(size_t total, size_t count, RandomEngine& rng);

// ============================================================================
// Manipulations
// ============================================================================

/// Bitwise NOT of a binary frame
Frame InvertBits(const Frame& frame);

/// Cyclic rotation along the bit axis: out[(j + shift) mod n] = in[j]
Frame RotateBits(const Frame& frame, int64_t shift);

/// Cyclic rotation along time: out = seq[shift:] + seq[:shift]
FrameSequence RotateSequence(const FrameSequence& sequence, int64_t shift);

/// Cell-wise XOR of binary frames of equal width
Frame XorFrames(const Frame& a, const Frame& b);

/// Resolve a shift given either as an absolute count or, when its magnitude
/// is below 1, as a fraction of extent. Result is floor(value * extent)
/// for fractions and the truncated count reduced modulo extent otherwise
/// (sign kept). Non-finite values and extent == 0 resolve to 0.
int64_t ResolveShift(double value, size_t extent);

} // namespace algoseq
