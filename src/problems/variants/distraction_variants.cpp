// File: src/problems/variants/distraction_variants.cpp
#include "problems/variants/distraction_variants.hpp"
#include "core/errors.hpp"

namespace algoseq {

const char* ToString(DistractionMode mode) {
    switch (mode) {
        case DistractionMode::IGNORE: return "Ignore";
        case DistractionMode::CARRY: return "Carry";
        case DistractionMode::FORGET: return "Forget";
        default: return "Unknown";
    }
}

DistractionVariant::DistractionVariant(DistractionMode mode)
    : mode_(mode) {
}

std::string DistractionVariant::GetName() const {
    return std::string("Distraction") + ToString(mode_);
}

size_t DistractionVariant::RequiredControlBits() const {
    return mode_ == DistractionMode::FORGET ? 4 : 3;
}

void DistractionVariant::ConfigureVariant(const ProblemConfig& config) {
    SizeRange range = SizeRange::FromParams(config.params, "subsequences", 1, 3);
    if (range.low == 0) {
        throw ConfigError("min_subsequences", "must be >= 1");
    }

    double forget_probability = config.params.GetDouble("forget_probability", 0.3);
    if (!(forget_probability >= 0.0 && forget_probability <= 1.0)) {
        throw ConfigError("forget_probability", "must be in [0, 1]");
    }

    min_subsequences_ = range.low;
    max_subsequences_ = range.high;
    forget_probability_ = forget_probability;
}

Sample DistractionVariant::Synthesize(size_t length, RandomEngine& rng) const {
    FrameSequence items = RandomItems(length, rng);

    SizeRange range = SizeRange{min_subsequences_, max_subsequences_}.ClampedTo(length);
    size_t count = UniformSize(range.low, range.high, rng);
    std::vector<size_t> sizes = RandomPartition(length, count, rng);
    std::vector<FrameSequence> chunks = SplitIntoChunks(items, sizes);

    bool ad_hoc_recall = mode_ != DistractionMode::IGNORE;
    FrameSequence expected;
    expected.reserve(length);

    SequenceBuilder builder = NewBuilder();
    for (const auto& chunk : chunks) {
        builder.AddMarker(ControlMarker::STORE);
        for (const auto& item : chunk) {
            bool forget = mode_ == DistractionMode::FORGET && Bernoulli(forget_probability_, rng);
            builder.AddItem(item, forget ? ControlMarker::FORGET : ControlMarker::NONE);
            expected.push_back(forget ? ZeroFrame(GetDataBits()) : item);
        }

        FrameSequence distractors = RandomItems(chunk.size(), rng);
        builder.AddMarker(ControlMarker::DISTRACT);
        builder.AddItems(distractors);
        if (ad_hoc_recall) {
            builder.AddMarker(ControlMarker::RECALL);
            builder.AddRecall(distractors);
        }
    }

    builder.AddMarker(ControlMarker::RECALL);
    builder.AddRecall(expected);

    return builder.Build(MakeMetadata(length, count));
}

} // namespace algoseq
