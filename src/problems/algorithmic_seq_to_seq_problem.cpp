// File: src/problems/algorithmic_seq_to_seq_problem.cpp
#include "problems/algorithmic_seq_to_seq_problem.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace algoseq {

namespace {

constexpr double kProbabilityEpsilon = 1e-7;
constexpr float kDecisionThreshold = 0.5f;

bool IsSet(float value) {
    return value >= kDecisionThreshold;
}

} // anonymous namespace

AlgorithmicSeqToSeqProblem::AlgorithmicSeqToSeqProblem(
    std::unique_ptr<VariantStrategy> variant, const ProblemConfig& config)
    : variant_(std::move(variant)) {
    if (!variant_) {
        throw std::invalid_argument("AlgorithmicSeqToSeqProblem: variant must not be null");
    }
    Configure(config);
}

// ============================================================================
// Configuration
// ============================================================================

void AlgorithmicSeqToSeqProblem::Configure(const ProblemConfig& config) {
    auto errors = config.GetValidationErrors();
    if (!errors.empty()) {
        throw ConfigError(errors.front());
    }
    if (!config.name.empty() && config.name != variant_->GetName()) {
        throw ConfigError("name", "'" + config.name + "' does not match variant " +
                          variant_->GetName());
    }

    CurriculumConfig curriculum_config = config.curriculum;
    curriculum_config.debug_logging = curriculum_config.debug_logging || config.debug_logging;
    auto curriculum = std::make_unique<Curriculum>(
        config.min_sequence_length, config.max_sequence_length, curriculum_config);

    // Last step that can fail; commits the variant on success
    variant_->Configure(config);

    config_ = config;
    curriculum_ = std::move(curriculum);

    LogDebug("Configured: " + std::to_string(config_.control_bits) + " control bits, " +
             std::to_string(config_.data_bits) + " data bits, lengths [" +
             std::to_string(config_.min_sequence_length) + ", " +
             std::to_string(config_.max_sequence_length) + "], curriculum " +
             ToString(curriculum_config.policy));
}

// ============================================================================
// Generation
// ============================================================================

SampleBatch AlgorithmicSeqToSeqProblem::GenerateBatch(uint64_t batch_index) {
    SampleBatch batch;
    batch.batch_index = batch_index;
    batch.seed = MixSeed(config_.seed, batch_index);
    batch.max_sequence_length = curriculum_->GetCurrentMax();
    batch.control_bits = config_.control_bits;
    batch.data_bits = config_.data_bits;
    batch.samples.reserve(config_.batch_size);

    RandomEngine rng = MakeEngine(batch.seed);
    size_t longest = 0;

    for (size_t i = 0; i < config_.batch_size; ++i) {
        size_t length = UniformSize(config_.min_sequence_length, batch.max_sequence_length, rng);
        uint64_t sample_seed = rng();

        Sample sample = GenerateSample(length, sample_seed);
        longest = std::max(longest, sample.Length());
        batch.samples.push_back(std::move(sample));
    }

    for (auto& sample : batch.samples) {
        sample.PadTo(longest, config_.control_bits, config_.data_bits);
    }

    return batch;
}

Sample AlgorithmicSeqToSeqProblem::GenerateSample(size_t length, uint64_t sample_seed) const {
    if (length == 0) {
        throw std::invalid_argument("GenerateSample: length must be >= 1");
    }

    RandomEngine rng = MakeEngine(sample_seed);
    Sample sample = variant_->Synthesize(length, rng);
    sample.metadata.seed = sample_seed;

    if (!sample.IsConsistent()) {
        throw std::logic_error(variant_->GetName() + " produced inputs, targets and mask of different lengths");
    }
    return sample;
}

// ============================================================================
// Statistics
// ============================================================================

StatisticsRecord AlgorithmicSeqToSeqProblem::CollectStatistics(const Predictions& predictions,
                                                               const SampleBatch& batch) {
    ValidatePredictions(predictions, batch);

    StatisticsRecord record = ScoreBatch(predictions, batch);
    statistics_.Merge(record);

    LogDebug("Collected statistics for batch " + std::to_string(batch.batch_index));
    return statistics_;
}

void AlgorithmicSeqToSeqProblem::ValidatePredictions(const Predictions& predictions,
                                                     const SampleBatch& batch) const {
    if (predictions.size() != batch.Size()) {
        throw ShapeMismatchError("Expected predictions for " + std::to_string(batch.Size()) +
                                 " samples, got " + std::to_string(predictions.size()));
    }

    for (size_t i = 0; i < batch.Size(); ++i) {
        const Sample& sample = batch.samples[i];
        const FrameSequence& predicted = predictions[i];

        for (size_t t = 0; t < sample.Length(); ++t) {
            if (!sample.mask[t]) {
                continue;
            }
            if (t >= predicted.size()) {
                throw ShapeMismatchError("Sample " + std::to_string(i) +
                                         ": no prediction for masked frame " + std::to_string(t));
            }
            if (predicted[t].size() != sample.targets[t].size()) {
                throw ShapeMismatchError("Sample " + std::to_string(i) + ", frame " +
                                         std::to_string(t) + ": prediction width " +
                                         std::to_string(predicted[t].size()) +
                                         " != target width " +
                                         std::to_string(sample.targets[t].size()));
            }
        }
    }
}

StatisticsRecord AlgorithmicSeqToSeqProblem::ScoreBatch(const Predictions& predictions,
                                                        const SampleBatch& batch) const {
    const size_t width = batch.data_bits;

    double loss_sum = 0.0;
    size_t cells = 0;
    size_t correct_cells = 0;
    size_t frames = 0;
    size_t correct_frames = 0;
    std::vector<size_t> correct_per_bit(width, 0);
    double length_sum = 0.0;

    for (size_t i = 0; i < batch.Size(); ++i) {
        const Sample& sample = batch.samples[i];
        length_sum += static_cast<double>(sample.metadata.sequence_length);

        for (size_t t = 0; t < sample.Length(); ++t) {
            if (!sample.mask[t]) {
                continue;
            }

            const Frame& target = sample.targets[t];
            const Frame& predicted = predictions[i][t];
            bool frame_correct = true;

            for (size_t b = 0; b < width; ++b) {
                double p = std::clamp(static_cast<double>(predicted[b]),
                                      kProbabilityEpsilon, 1.0 - kProbabilityEpsilon);
                double y = IsSet(target[b]) ? 1.0 : 0.0;
                loss_sum -= y * std::log(p) + (1.0 - y) * std::log(1.0 - p);

                if (IsSet(predicted[b]) == IsSet(target[b])) {
                    ++correct_cells;
                    ++correct_per_bit[b];
                } else {
                    frame_correct = false;
                }
                ++cells;
            }

            ++frames;
            if (frame_correct) {
                ++correct_frames;
            }
        }
    }

    StatisticsRecord record;
    if (frames > 0) {
        record.Add("loss", loss_sum / static_cast<double>(cells));
        record.Add("acc", static_cast<double>(correct_cells) / static_cast<double>(cells));
        record.Add("frame_acc", static_cast<double>(correct_frames) / static_cast<double>(frames));
        for (size_t b = 0; b < width; ++b) {
            record.Add("bit_acc/" + std::to_string(b),
                       static_cast<double>(correct_per_bit[b]) / static_cast<double>(frames));
        }
    }
    if (batch.Size() > 0) {
        record.Add("seq_length", length_sum / static_cast<double>(batch.Size()));
    }
    record.Add("max_seq_length", static_cast<double>(batch.max_sequence_length));
    record.Add("batch_size", static_cast<double>(batch.Size()));
    return record;
}

// ============================================================================
// Curriculum
// ============================================================================

void AlgorithmicSeqToSeqProblem::AdvanceCurriculum(const ProgressSignal& signal) {
    curriculum_->Advance(signal);
}

void AlgorithmicSeqToSeqProblem::RestoreCurriculum(const CurriculumState& state) {
    curriculum_->Restore(state);
    LogDebug("Curriculum restored: " + state.ToString());
}

} // namespace algoseq
