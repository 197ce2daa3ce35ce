// File: examples/training_loop_example.cpp
//
// Training loop example using the algoseq task generators.
// Demonstrates:
// - Creating a problem through the factory
// - The model/problem handshake (GetDefaultValues)
// - Generating batches, scoring predictions and advancing the curriculum
// - Checkpointing the curriculum to a run store and resuming from it

#include "problems/problem_factory.hpp"
#include "storage/run_store.hpp"
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <random>

using namespace algoseq;

/// Stand-in for a model: echoes the targets with a given error rate
Predictions NoisyModel(const SampleBatch& batch, double error_rate, std::mt19937& gen) {
    std::bernoulli_distribution flip(error_rate);

    Predictions predictions;
    predictions.reserve(batch.Size());
    for (const auto& sample : batch.samples) {
        FrameSequence frames;
        frames.reserve(sample.Length());
        for (const auto& target : sample.targets) {
            Frame frame(target.size());
            for (size_t b = 0; b < target.size(); ++b) {
                bool bit = target[b] >= 0.5f;
                if (flip(gen)) {
                    bit = !bit;
                }
                frame[b] = bit ? 0.9f : 0.1f;
            }
            frames.push_back(frame);
        }
        predictions.push_back(frames);
    }
    return predictions;
}

int main() {
    std::cout << "=== algoseq Training Loop Example ===\n\n";

    // Step 1: Configure the problem
    std::cout << "Step 1: Creating a SerialRecall problem...\n";

    ParamMap params{
        {"name", "SerialRecall"},
        {"batch_size", "16"},
        {"control_bits", "2"},
        {"data_bits", "8"},
        {"min_sequence_length", "1"},
        {"max_sequence_length", "10"},
        {"seed", "42"},
        {"size", "160"},
        {"curriculum_learning.policy", "episode"},
        {"curriculum_learning.interval", "5"},
    };

    ProblemFactory factory(BuiltinRegistry());
    auto problem = factory.Create(ProblemConfig::FromParams(params));

    auto sizes = problem->GetDefaultValues();
    std::cout << "  Input item size: " << sizes.input_item_size << "\n";
    std::cout << "  Output item size: " << sizes.output_item_size << "\n";
    std::cout << "  Batches per epoch: " << problem->GetEpochSize() << "\n\n";

    // Step 2: Train for a few episodes
    std::cout << "Step 2: Running 30 episodes...\n";

    std::string db_path = (std::filesystem::temp_directory_path() / "algoseq_example.db").string();
    std::filesystem::remove(db_path);
    RunStore::Config store_config;
    store_config.db_path = db_path;
    RunStore store(store_config);

    std::mt19937 gen(7);
    problem->InitializeEpoch(0);
    for (uint64_t episode = 0; episode < 30; ++episode) {
        SampleBatch batch = problem->GenerateBatch(episode);
        StatisticsRecord stats = problem->CollectStatistics(NoisyModel(batch, 0.05, gen), batch);
        problem->AdvanceCurriculum(ProgressSignal::Episode(episode));

        if (episode % 10 == 9) {
            std::cout << "  Episode " << std::setw(3) << episode
                      << "  max_sequence_length " << problem->GetCurriculumState().current_allowed_max
                      << "  acc " << std::fixed << std::setprecision(4) << stats.Mean("acc") << "\n";
            store.SaveCheckpoint("example", "training", episode, problem->GetCurriculumState());
            store.SaveStatistics("example", "training", episode, problem->GetStatistics());
        }
    }
    problem->FinalizeEpoch(0);
    std::cout << "\n";

    // Step 3: Resume in a fresh problem
    std::cout << "Step 3: Resuming from the latest checkpoint...\n";

    auto resumed = factory.Create(ProblemConfig::FromParams(params));
    auto checkpoint = store.LoadLatestCheckpoint("example", "training");
    if (checkpoint) {
        resumed->RestoreCurriculum(checkpoint->state);
        std::cout << "  Restored at episode " << checkpoint->episode << ": "
                  << resumed->GetCurriculumState().ToString() << "\n\n";
    }

    // Step 4: Statistics
    std::cout << "Step 4: Statistics of the run:\n";
    std::cout << problem->GetStatistics().ToString() << "\n";

    std::filesystem::remove(db_path);
    std::cout << "=== Example completed successfully ===\n";

    return 0;
}
