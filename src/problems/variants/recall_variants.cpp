// File: src/problems/variants/recall_variants.cpp
#include "problems/variants/recall_variants.hpp"
#include "core/errors.hpp"

namespace algoseq {

// ============================================================================
// StoreRecallVariant
// ============================================================================

Sample StoreRecallVariant::Synthesize(size_t length, RandomEngine& rng) const {
    FrameSequence items = RandomItems(length, rng);

    SequenceBuilder builder = NewBuilder();
    builder.AddMarker(ControlMarker::STORE);
    builder.AddItems(items);
    builder.AddMarker(ControlMarker::RECALL);
    builder.AddRecall(Transform(items));

    return builder.Build(MakeMetadata(length));
}

// ============================================================================
// SerialRecall / ReverseRecall
// ============================================================================

FrameSequence SerialRecall::Transform(const FrameSequence& items) const {
    return items;
}

FrameSequence ReverseRecall::Transform(const FrameSequence& items) const {
    return FrameSequence(items.rbegin(), items.rend());
}

// ============================================================================
// SkipRecall
// ============================================================================

void SkipRecall::ConfigureVariant(const ProblemConfig& config) {
    size_t seq_start = config.params.GetSize("seq_start", 0);
    size_t skip_step = config.params.GetSize("skip_step", 2);

    if (skip_step == 0) {
        throw ConfigError("skip_step", "must be >= 1");
    }
    if (seq_start >= config.min_sequence_length) {
        throw ConfigError("seq_start", "must be < min_sequence_length (" +
                          std::to_string(config.min_sequence_length) + ")");
    }

    seq_start_ = seq_start;
    skip_step_ = skip_step;
}

FrameSequence SkipRecall::Transform(const FrameSequence& items) const {
    FrameSequence result;
    for (size_t i = seq_start_; i < items.size(); i += skip_step_) {
        result.push_back(items[i]);
    }
    return result;
}

// ============================================================================
// RepeatRecall
// ============================================================================

RepeatRecall::RepeatRecall(bool reverse)
    : reverse_(reverse) {
}

std::string RepeatRecall::GetName() const {
    return reverse_ ? "RepeatReverseRecall" : "RepeatSerialRecall";
}

void RepeatRecall::ConfigureVariant(const ProblemConfig& config) {
    size_t min_repeats = config.params.GetSize("min_repeats", 1);
    size_t max_repeats = config.params.GetSize("max_repeats", 3);

    if (min_repeats == 0) {
        throw ConfigError("min_repeats", "must be >= 1");
    }
    if (min_repeats > max_repeats) {
        throw ConfigError("min_repeats", "must be <= max_repeats");
    }
    // The count is written into the data channel of the RECALL frame
    if (config.data_bits < 64 && max_repeats >= (uint64_t{1} << config.data_bits)) {
        throw ConfigError("max_repeats", "does not fit into " +
                          std::to_string(config.data_bits) + " data bits");
    }

    min_repeats_ = min_repeats;
    max_repeats_ = max_repeats;
}

Sample RepeatRecall::Synthesize(size_t length, RandomEngine& rng) const {
    FrameSequence items = RandomItems(length, rng);
    size_t repeats = UniformSize(min_repeats_, max_repeats_, rng);

    FrameSequence pass = reverse_ ? FrameSequence(items.rbegin(), items.rend()) : items;
    FrameSequence expected;
    expected.reserve(pass.size() * repeats);
    for (size_t r = 0; r < repeats; ++r) {
        expected.insert(expected.end(), pass.begin(), pass.end());
    }

    SequenceBuilder builder = NewBuilder();
    builder.AddMarker(ControlMarker::STORE);
    builder.AddItems(items);
    builder.AddMarker(ControlMarker::RECALL, EncodeSymbol(repeats, GetDataBits()));
    builder.AddRecall(expected);

    return builder.Build(MakeMetadata(length, repeats));
}

// ============================================================================
// ScratchPad
// ============================================================================

void ScratchPad::ConfigureVariant(const ProblemConfig& config) {
    SizeRange range = SizeRange::FromParams(config.params, "subsequences", 1, 3);
    if (range.low == 0) {
        throw ConfigError("min_subsequences", "must be >= 1");
    }

    min_subsequences_ = range.low;
    max_subsequences_ = range.high;
}

Sample ScratchPad::Synthesize(size_t length, RandomEngine& rng) const {
    FrameSequence items = RandomItems(length, rng);

    SizeRange range = SizeRange{min_subsequences_, max_subsequences_}.ClampedTo(length);
    size_t count = UniformSize(range.low, range.high, rng);
    std::vector<FrameSequence> chunks = SplitIntoChunks(items, RandomPartition(length, count, rng));

    SequenceBuilder builder = NewBuilder();
    for (const auto& chunk : chunks) {
        builder.AddMarker(ControlMarker::STORE);
        builder.AddItems(chunk);
    }
    builder.AddMarker(ControlMarker::RECALL);
    builder.AddRecall(chunks.back());

    return builder.Build(MakeMetadata(length, count));
}

} // namespace algoseq
