// File: src/cli/algoseq_cli.cpp
//
// algoseq command line tool
//
// Features:
// - Listing of the registered task generators
// - Rendering of generated samples as bit grids
// - Dry runs of the episode-driven curriculum, optionally checkpointed to a
//   run store

#include "cli/algoseq_cli.hpp"
#include "config/config_loader.hpp"
#include "core/errors.hpp"
#include "storage/run_store.hpp"
#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace algoseq {

namespace {

const char* kDefaultPhase = "training";

std::string RenderBits(const Frame& frame, size_t begin, size_t end) {
    std::string bits;
    bits.reserve(end - begin);
    for (size_t i = begin; i < end && i < frame.size(); ++i) {
        bits.push_back(frame[i] >= 0.5f ? '1' : '.');
    }
    return bits;
}

} // anonymous namespace

AlgoseqCli::AlgoseqCli(std::ostream& out, std::ostream& err)
    : out_(out),
      err_(err),
      factory_(BuiltinRegistry()) {
}

int AlgoseqCli::Run(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return ProcessCommand(args);
}

int AlgoseqCli::ProcessCommand(const std::vector<std::string>& args) {
    if (args.empty()) {
        ShowHelp();
        return 1;
    }

    const std::string& command = args[0];
    std::vector<std::string> rest(args.begin() + 1, args.end());

    try {
        if (command == "list") {
            return ListProblems();
        } else if (command == "show") {
            return ShowSample(rest);
        } else if (command == "schedule") {
            return ShowSchedule(rest);
        } else if (command == "help" || command == "--help" || command == "-h") {
            ShowHelp();
            return 0;
        }
    } catch (const UnknownProblemError& e) {
        err_ << "Error: " << e.what() << "\n";
        err_ << "Run 'algoseq_cli list' for the available problems.\n";
        return 1;
    } catch (const ConfigError& e) {
        err_ << "Configuration error: " << e.what() << "\n";
        return 1;
    } catch (const RunStoreError& e) {
        err_ << "Run store error: " << e.what() << "\n";
        return 1;
    }

    err_ << "Unknown command: " << command << "\n";
    err_ << "Type 'algoseq_cli help' for available commands.\n";
    return 1;
}

// ============================================================================
// Commands
// ============================================================================

int AlgoseqCli::ListProblems() {
    for (const auto& name : factory_.GetRegisteredNames()) {
        out_ << name << "\n";
    }
    return 0;
}

int AlgoseqCli::ShowSample(const std::vector<std::string>& args) {
    if (args.empty()) {
        err_ << "Usage: show <config> [phase] [batch_index]\n";
        return 1;
    }

    std::string phase = args.size() > 1 ? args[1] : kDefaultPhase;
    uint64_t batch_index = 0;
    if (args.size() > 2) {
        auto parsed = ParseCount(args[2], "batch_index");
        if (!parsed) {
            return 1;
        }
        batch_index = *parsed;
    }

    auto problem = CreateProblem(args[0], phase);
    if (!problem) {
        return 1;
    }

    SampleBatch batch = problem->GenerateBatch(batch_index);
    if (batch.samples.empty()) {
        err_ << "Batch " << batch_index << " is empty\n";
        return 1;
    }

    const Sample& sample = batch.samples.front();
    out_ << problem->GetName() << " sample 0 of batch " << batch_index
         << " (L=" << sample.metadata.sequence_length
         << ", frames=" << sample.metadata.num_frames
         << ", padded=" << sample.Length()
         << ", max_sequence_length=" << batch.max_sequence_length << ")\n";
    out_ << RenderSample(sample, batch.control_bits, batch.data_bits);
    return 0;
}

int AlgoseqCli::ShowSchedule(const std::vector<std::string>& args) {
    std::vector<std::string> positional;
    std::string store_path;
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--store") {
            if (i + 1 >= args.size()) {
                err_ << "--store requires a database path\n";
                return 1;
            }
            store_path = args[++i];
        } else {
            positional.push_back(args[i]);
        }
    }

    if (positional.size() < 2) {
        err_ << "Usage: schedule <config> <episodes> [every] [--store <db>]\n";
        return 1;
    }

    auto episodes = ParseCount(positional[1], "episodes");
    if (!episodes) {
        return 1;
    }
    uint64_t every = 100;
    if (positional.size() > 2) {
        auto parsed = ParseCount(positional[2], "every");
        if (!parsed) {
            return 1;
        }
        every = *parsed;
    }
    if (every == 0) {
        err_ << "every must be greater than 0\n";
        return 1;
    }

    auto problem = CreateProblem(positional[0], kDefaultPhase);
    if (!problem) {
        return 1;
    }

    std::unique_ptr<RunStore> store;
    std::string run_id = std::filesystem::path(positional[0]).stem().string();
    if (!store_path.empty()) {
        RunStore::Config store_config;
        store_config.db_path = store_path;
        store = std::make_unique<RunStore>(store_config);
    }

    const CurriculumState initial = problem->GetCurriculumState();
    out_ << problem->GetName() << ": " << initial.ToString() << "\n";
    if (initial.policy == CurriculumPolicy::LOSS_THRESHOLD) {
        out_ << "Curriculum is driven by loss; episode signals do not advance it\n";
        return 0;
    }

    for (uint64_t episode = 0;; ++episode) {
        size_t before = problem->GetCurriculumState().current_allowed_max;
        problem->AdvanceCurriculum(ProgressSignal::Episode(episode));
        CurriculumState state = problem->GetCurriculumState();

        bool changed = state.current_allowed_max != before;
        bool report = episode % every == 0 || changed || episode == *episodes || state.IsDone();
        if (report) {
            out_ << "episode " << std::setw(8) << episode
                 << "  max_sequence_length " << state.current_allowed_max
                 << (changed ? "  (+)" : "") << "\n";
            if (store) {
                store->SaveCheckpoint(run_id, kDefaultPhase, episode, state);
            }
        }

        if (state.IsDone()) {
            out_ << "Curriculum done at episode " << episode << "\n";
            break;
        }
        // Checked here rather than in the loop condition so that
        // episodes == UINT64_MAX terminates instead of wrapping
        if (episode == *episodes) {
            break;
        }
    }

    return 0;
}

void AlgoseqCli::ShowHelp() {
    out_ << "Usage: algoseq_cli <command> [arguments]\n\n";
    out_ << "Commands:\n";
    out_ << "  list                                  List registered problems\n";
    out_ << "  show <config> [phase] [batch_index]   Render sample 0 of a batch\n";
    out_ << "  schedule <config> <episodes> [every] [--store <db>]\n";
    out_ << "                                        Dry run of the episode curriculum\n";
    out_ << "  help                                  Show this help\n";
}

// ============================================================================
// Helpers
// ============================================================================

std::unique_ptr<Problem> AlgoseqCli::CreateProblem(const std::string& config_path,
                                                   const std::string& phase) {
    auto experiment = ExperimentConfig::LoadFromFile(config_path);
    if (!experiment) {
        err_ << "Could not load " << config_path << "\n";
        return nullptr;
    }
    if (!experiment->HasPhase(phase)) {
        err_ << "No problem section for phase '" << phase << "' in " << config_path << "\n";
        return nullptr;
    }

    ProblemConfig config = ProblemConfig::FromParams(experiment->LoadProblemParams(phase));
    return factory_.Create(config);
}

std::optional<uint64_t> AlgoseqCli::ParseCount(const std::string& value, const std::string& what) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        err_ << "Invalid " << what << ": " << value << "\n";
        return std::nullopt;
    }
    try {
        return std::stoull(value);
    } catch (const std::out_of_range&) {
        err_ << what << " out of range: " << value << "\n";
        return std::nullopt;
    }
}

std::string AlgoseqCli::RenderSample(const Sample& sample, size_t control_bits, size_t data_bits) {
    std::ostringstream ss;
    size_t width = control_bits + data_bits;

    int control_column = static_cast<int>(std::max<size_t>(control_bits, 3));
    int data_column = static_cast<int>(std::max<size_t>(data_bits, 4));
    int target_column = static_cast<int>(std::max<size_t>(data_bits, 6));

    ss << std::setw(6) << "frame" << "  " << std::left
       << std::setw(control_column) << "ctl" << "  "
       << std::setw(data_column) << "data" << "  "
       << std::setw(target_column) << "target" << std::right << "  mask\n";

    for (size_t t = 0; t < sample.Length(); ++t) {
        const Frame& input = sample.inputs[t];
        ss << std::setw(6) << t << "  " << std::left
           << std::setw(control_column) << RenderBits(input, 0, control_bits) << "  "
           << std::setw(data_column) << RenderBits(input, control_bits, width) << "  "
           << std::setw(target_column) << RenderBits(sample.targets[t], 0, data_bits)
           << std::right << (sample.mask[t] ? "  *" : "") << "\n";
    }
    return ss.str();
}

} // namespace algoseq
