// File: src/problems/variant_strategy.cpp
#include "problems/variant_strategy.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <stdexcept>

namespace algoseq {

// ============================================================================
// VariantStrategy
// ============================================================================

void VariantStrategy::Configure(const ProblemConfig& config) {
    if (config.control_bits < RequiredControlBits()) {
        throw ConfigError("control_bits", GetName() + " requires at least " +
                          std::to_string(RequiredControlBits()) + " control bits (got " +
                          std::to_string(config.control_bits) + ")");
    }
    if (config.data_bits == 0) {
        throw ConfigError("data_bits", "must be greater than 0");
    }

    ConfigureVariant(config);

    control_bits_ = config.control_bits;
    data_bits_ = config.data_bits;
    bias_ = config.bias;
}

void VariantStrategy::ConfigureVariant(const ProblemConfig&) {
}

FrameSequence VariantStrategy::RandomItems(size_t count, RandomEngine& rng) const {
    return RandomSequence(count, data_bits_, rng, bias_);
}

SampleMetadata VariantStrategy::MakeMetadata(size_t length, size_t num_subsequences) const {
    SampleMetadata metadata;
    metadata.sequence_length = length;
    metadata.num_subsequences = num_subsequences;
    metadata.variant = GetName();
    return metadata;
}

// ============================================================================
// SizeRange
// ============================================================================

SizeRange SizeRange::FromParams(const ParamMap& params, const std::string& key,
                                size_t default_low, size_t default_high) {
    SizeRange range;
    range.low = params.GetSize("min_" + key, default_low);
    range.high = params.GetSize("max_" + key, default_high);
    if (range.low > range.high) {
        throw ConfigError("min_" + key, "must be <= max_" + key);
    }
    return range;
}

SizeRange SizeRange::ClampedTo(size_t limit) const {
    SizeRange range;
    range.high = std::min(high, limit);
    range.low = std::min(low, range.high);
    return range;
}

// ============================================================================
// Helpers
// ============================================================================

std::vector<FrameSequence> SplitIntoChunks(const FrameSequence& items,
                                           const std::vector<size_t>& sizes) {
    std::vector<FrameSequence> chunks;
    chunks.reserve(sizes.size());

    size_t offset = 0;
    for (size_t size : sizes) {
        if (offset + size > items.size()) {
            throw std::invalid_argument("SplitIntoChunks: chunk sizes exceed item count");
        }
        chunks.emplace_back(items.begin() + offset, items.begin() + offset + size);
        offset += size;
    }
    return chunks;
}

} // namespace algoseq
