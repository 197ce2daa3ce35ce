// File: src/problems/variants/span_variants.cpp
#include "problems/variants/span_variants.hpp"
#include "core/errors.hpp"

namespace algoseq {

// ============================================================================
// OperationSpan
// ============================================================================

void OperationSpan::ConfigureVariant(const ProblemConfig& config) {
    size_t operation_length = config.params.GetSize("operation_length", 2);
    if (operation_length == 0) {
        throw ConfigError("operation_length", "must be >= 1");
    }
    operation_length_ = operation_length;
}

Sample OperationSpan::Synthesize(size_t length, RandomEngine& rng) const {
    FrameSequence items = RandomItems(length, rng);

    SequenceBuilder builder = NewBuilder();
    for (const auto& item : items) {
        FrameSequence operands = RandomItems(operation_length_, rng);
        Frame result = operands.front();
        for (size_t k = 1; k < operands.size(); ++k) {
            result = XorFrames(result, operands[k]);
        }

        builder.AddMarker(ControlMarker::DISTRACT);
        builder.AddItems(operands);
        builder.AddMarker(ControlMarker::RECALL);
        builder.AddRecall(FrameSequence{result});
        builder.AddMarker(ControlMarker::STORE);
        builder.AddItem(item);
    }

    builder.AddMarker(ControlMarker::RECALL);
    builder.AddRecall(items);

    return builder.Build(MakeMetadata(length, length));
}

// ============================================================================
// ReadingSpan
// ============================================================================

void ReadingSpan::ConfigureVariant(const ProblemConfig& config) {
    size_t sentence_length = config.params.GetSize("sentence_length", 3);
    if (sentence_length == 0) {
        throw ConfigError("sentence_length", "must be >= 1");
    }
    sentence_length_ = sentence_length;
}

Sample ReadingSpan::Synthesize(size_t length, RandomEngine& rng) const {
    FrameSequence endings;
    endings.reserve(length);

    SequenceBuilder builder = NewBuilder();
    for (size_t i = 0; i < length; ++i) {
        size_t words = UniformSize(1, sentence_length_, rng);
        FrameSequence sentence = RandomItems(words, rng);

        builder.AddMarker(ControlMarker::DISTRACT);
        builder.AddItems(sentence);
        endings.push_back(sentence.back());
    }

    builder.AddMarker(ControlMarker::RECALL);
    builder.AddRecall(endings);

    return builder.Build(MakeMetadata(length, length));
}

} // namespace algoseq
