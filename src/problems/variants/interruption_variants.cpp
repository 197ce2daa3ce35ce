// File: src/problems/variants/interruption_variants.cpp
#include "problems/variants/interruption_variants.hpp"
#include "core/errors.hpp"

namespace algoseq {

const char* ToString(InterruptionTask task) {
    switch (task) {
        case InterruptionTask::NOT: return "Not";
        case InterruptionTask::REVERSE_RECALL: return "ReverseRecall";
        case InterruptionTask::SWAP_RECALL: return "SwapRecall";
        default: return "Unknown";
    }
}

InterruptionVariant::InterruptionVariant(InterruptionTask task)
    : task_(task) {
}

std::string InterruptionVariant::GetName() const {
    return std::string("Interruption") + ToString(task_);
}

void InterruptionVariant::ConfigureVariant(const ProblemConfig& config) {
    // Zero interruptions is allowed; it degenerates to serial recall
    SizeRange range = SizeRange::FromParams(config.params, "interruptions", 1, 2);

    min_interruptions_ = range.low;
    max_interruptions_ = range.high;
}

FrameSequence InterruptionVariant::Respond(const FrameSequence& interruption) const {
    switch (task_) {
        case InterruptionTask::NOT: {
            FrameSequence result;
            result.reserve(interruption.size());
            for (const auto& item : interruption) {
                result.push_back(InvertBits(item));
            }
            return result;
        }
        case InterruptionTask::REVERSE_RECALL:
            return FrameSequence(interruption.rbegin(), interruption.rend());
        case InterruptionTask::SWAP_RECALL:
            return RotateSequence(interruption, static_cast<int64_t>(interruption.size() / 2));
    }
    return interruption;
}

Sample InterruptionVariant::Synthesize(size_t length, RandomEngine& rng) const {
    FrameSequence items = RandomItems(length, rng);

    SizeRange range = SizeRange{min_interruptions_, max_interruptions_}.ClampedTo(length - 1);
    size_t interruptions = UniformSize(range.low, range.high, rng);
    std::vector<FrameSequence> chunks =
        SplitIntoChunks(items, RandomPartition(length, interruptions + 1, rng));

    SequenceBuilder builder = NewBuilder();
    for (size_t j = 0; j < chunks.size(); ++j) {
        if (j > 0) {
            FrameSequence interruption = RandomItems(chunks[j - 1].size(), rng);
            builder.AddMarker(ControlMarker::DISTRACT);
            builder.AddItems(interruption);
            builder.AddMarker(ControlMarker::RECALL);
            builder.AddRecall(Respond(interruption));
        }
        builder.AddMarker(ControlMarker::STORE);
        builder.AddItems(chunks[j]);
    }

    builder.AddMarker(ControlMarker::RECALL);
    builder.AddRecall(items);

    return builder.Build(MakeMetadata(length, interruptions));
}

} // namespace algoseq
