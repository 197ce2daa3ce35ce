// File: src/cli/algoseq_cli.hpp
//
// algoseq command line tool
// Extracted for testability

#ifndef ALGOSEQ_CLI_HPP
#define ALGOSEQ_CLI_HPP

#include "problems/problem.hpp"
#include "problems/problem_factory.hpp"
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace algoseq {

/// Inspection tool for the task generators
///
/// Commands:
///   list                                   registered problem names
///   show <config> [phase] [batch_index]    render sample 0 of a batch
///   schedule <config> <episodes> [every] [--store <db>]
///                                          dry run of the episode curriculum
///   help
class AlgoseqCli {
public:
    explicit AlgoseqCli(std::ostream& out = std::cout, std::ostream& err = std::cerr);

    /// Entry point used by main()
    /// @return Process exit code
    int Run(int argc, char** argv);

    /// Process a single command (for testing)
    /// @param args Command and its arguments (without the program name)
    /// @return 0 on success, 1 on error
    int ProcessCommand(const std::vector<std::string>& args);

    /// Render one sample as a bit grid
    static std::string RenderSample(const Sample& sample, size_t control_bits, size_t data_bits);

private:
    std::ostream& out_;
    std::ostream& err_;
    ProblemFactory factory_;

    // Commands
    int ListProblems();
    int ShowSample(const std::vector<std::string>& args);
    int ShowSchedule(const std::vector<std::string>& args);
    void ShowHelp();

    // Helpers
    std::unique_ptr<Problem> CreateProblem(const std::string& config_path, const std::string& phase);
    std::optional<uint64_t> ParseCount(const std::string& value, const std::string& what);
};

} // namespace algoseq

#endif // ALGOSEQ_CLI_HPP
