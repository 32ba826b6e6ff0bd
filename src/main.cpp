/**
 * @file main.cpp
 * @brief Main entry point for the Outreach Allocation Engine
 *
 * Command-line application that loads scored candidates, blends views,
 * optimizes an allocation, traces the frontier, simulates outcomes and
 * writes the combined report.
 */

#include "config/engine_config.hpp"
#include "data/data_loader.hpp"
#include "report/allocation_engine.hpp"
#include "simulation/transition_model.hpp"
#include <chrono>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace allocation;

/**
 * @brief Print usage information
 */
void print_usage(const char *program_name)
{
    std::cout << "Outreach Allocation Engine v1.0.0\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --candidates PATH     Scored candidates CSV (id,alpha,risk,features...) (required)\n"
              << "  --config PATH         Engine configuration JSON (default: built-in defaults)\n"
              << "  --views PATH          Subjective views JSON\n"
              << "  --outcomes PATH       Historical outcomes JSON used to calibrate transitions\n"
              << "  --output PATH         Path to output directory (default: results/)\n"
              << "  --frontier            Compute efficient frontier even if disabled in config\n"
              << "  --simulate            Run simulation even if disabled in config\n"
              << "  --seed N              Fix the simulation seed\n"
              << "  --verbose             Print the full report summary\n"
              << "  --help, -h            Show this help message\n"
              << "\nExample:\n"
              << "  " << program_name << " --candidates data/candidates.csv --verbose\n"
              << "  " << program_name << " --candidates data/candidates.csv --config data/config/engine.json --seed 42\n"
              << std::endl;
}

/**
 * @brief Print banner
 */
void print_banner()
{
    std::cout << "\n"
              << "================================================================\n"
              << "       Outreach Allocation Engine v1.0.0                       \n"
              << "       Risk-Aware Candidate Allocation and Simulation          \n"
              << "================================================================\n"
              << std::endl;
}

/**
 * @brief Parse command-line arguments
 */
struct CommandLineArgs
{
    std::string candidates_path;
    std::string config_path;
    std::string views_path;
    std::string outcomes_path;
    std::string output_dir = "results";
    bool force_frontier = false;
    bool force_simulation = false;
    bool has_seed = false;
    std::uint64_t seed = 0;
    bool verbose = false;
    bool show_help = false;
    bool parse_error = false;

    static CommandLineArgs parse(int argc, char *argv[])
    {
        CommandLineArgs args;

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h")
            {
                args.show_help = true;
            }
            else if (arg == "--candidates" && i + 1 < argc)
            {
                args.candidates_path = argv[++i];
            }
            else if (arg == "--config" && i + 1 < argc)
            {
                args.config_path = argv[++i];
            }
            else if (arg == "--views" && i + 1 < argc)
            {
                args.views_path = argv[++i];
            }
            else if (arg == "--outcomes" && i + 1 < argc)
            {
                args.outcomes_path = argv[++i];
            }
            else if (arg == "--output" && i + 1 < argc)
            {
                args.output_dir = argv[++i];
            }
            else if (arg == "--frontier")
            {
                args.force_frontier = true;
            }
            else if (arg == "--simulate")
            {
                args.force_simulation = true;
            }
            else if (arg == "--seed" && i + 1 < argc)
            {
                try
                {
                    args.seed = std::stoull(argv[++i]);
                    args.has_seed = true;
                }
                catch (const std::exception &)
                {
                    std::cerr << "Error: Invalid seed: " << argv[i] << std::endl;
                    args.parse_error = true;
                }
            }
            else if (arg == "--verbose")
            {
                args.verbose = true;
            }
            else
            {
                std::cerr << "Warning: Unknown argument: " << arg << std::endl;
            }
        }

        return args;
    }

    bool is_valid() const
    {
        return !show_help && !parse_error && !candidates_path.empty();
    }
};

/**
 * @brief Main execution function
 */
int run(const CommandLineArgs &args)
{
    auto start_time = std::chrono::high_resolution_clock::now();

    try
    {
        // ====================================================================
        // Inputs
        // ====================================================================
        std::cout << "Loading inputs..." << std::endl;

        EngineConfig config = args.config_path.empty()
                                  ? EngineConfig()
                                  : EngineConfig::load_from_file(args.config_path);

        if (args.force_frontier)
        {
            config.compute_frontier = true;
        }
        if (args.force_simulation)
        {
            config.run_simulation = true;
        }
        if (args.has_seed)
        {
            config.simulation.seed = args.seed;
        }

        auto candidates = DataLoader::load_candidates_csv(args.candidates_path);
        std::cout << "  - Loaded " << candidates.size() << " candidates" << std::endl;

        std::vector<View> user_views;
        if (!args.views_path.empty())
        {
            user_views = DataLoader::load_views(args.views_path);
            std::cout << "  - Loaded " << user_views.size() << " views" << std::endl;
        }

        if (!args.outcomes_path.empty())
        {
            auto outcomes = DataLoader::load_outcomes(args.outcomes_path);
            config.simulation.transitions =
                simulation::TransitionModel::calibrate(outcomes, config.simulation.transitions);
            std::cout << "  - Calibrated transitions from " << outcomes.size() << " outcomes" << std::endl;
        }

        if (args.verbose)
        {
            std::cout << "\n  Effective configuration:\n"
                      << config.to_json().dump(2) << "\n";
        }

        // ====================================================================
        // Pipeline
        // ====================================================================
        auto progress = [](int step, int total, const std::string &what)
        {
            std::cout << "[" << step << "/" << total << "] " << what << "..." << std::endl;
        };

        report::AllocationReport result =
            report::AllocationEngine::run(candidates, user_views, config, ScoringFunction(), progress);

        print_warnings(result.warnings, std::cerr);

        if (args.verbose)
        {
            result.print_summary();
        }
        else
        {
            result.optimization.print_summary();
        }

        // ====================================================================
        // Output
        // ====================================================================
        std::filesystem::create_directories(args.output_dir);

        const std::string report_file = args.output_dir + "/report.json";
        std::ofstream out(report_file);
        if (!out.is_open())
        {
            throw std::runtime_error("Cannot open file for writing: " + report_file);
        }
        out << result.to_json().dump(2) << "\n";
        std::cout << "\n  Report written to: " << report_file << "\n";

        if (result.frontier && result.frontier->success)
        {
            const std::string frontier_file = args.output_dir + "/efficient_frontier.csv";
            result.frontier->export_to_csv(frontier_file);
            std::cout << "  Frontier data exported to: " << frontier_file << "\n";
        }

        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                            end_time - start_time)
                            .count();

        std::cout << "\n================================================================\n";
        std::cout << (result.optimization.success ? "Allocation completed in " : "Allocation finished without a solution in ")
                  << duration << " ms\n";
        std::cout << "================================================================\n"
                  << std::endl;

        return result.optimization.success ? 0 : 2;
    }
    catch (const std::exception &e)
    {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }
}

/**
 * @brief Main function
 */
int main(int argc, char *argv[])
{
    auto args = CommandLineArgs::parse(argc, argv);

    if (args.show_help || !args.is_valid())
    {
        print_banner();
        print_usage(argv[0]);
        return args.show_help ? 0 : 1;
    }

    print_banner();

    return run(args);
}
