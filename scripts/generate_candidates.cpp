/**
 * @file generate_candidates.cpp
 * @brief Generate a synthetic scored-candidate CSV for the allocation engine
 */

#include "data/data_loader.hpp"
#include <algorithm>
#include <exception>
#include <iomanip>
#include <iostream>
#include <string>

using namespace allocation;

int main(int argc, char* argv[]) {
    std::cout << "\n=== Synthetic Candidate Generator ===\n" << std::endl;

    std::string output_file = "data/candidates.csv";
    size_t count = 50;
    size_t num_features = 4;
    unsigned int seed = 42;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--output" && i + 1 < argc) {
                output_file = argv[++i];
            } else if (arg == "--count" && i + 1 < argc) {
                count = std::stoul(argv[++i]);
            } else if (arg == "--features" && i + 1 < argc) {
                num_features = std::stoul(argv[++i]);
            } else if (arg == "--seed" && i + 1 < argc) {
                seed = static_cast<unsigned int>(std::stoul(argv[++i]));
            } else if (arg == "--help") {
                std::cout << "Usage: " << argv[0] << " [OPTIONS]\n"
                          << "Options:\n"
                          << "  --output FILE      Output CSV file (default: data/candidates.csv)\n"
                          << "  --count N          Number of candidates (default: 50)\n"
                          << "  --features N       Feature dimension (default: 4)\n"
                          << "  --seed N           Generator seed (default: 42)\n"
                          << "  --help             Show this help\n";
                return 0;
            }
        }

        std::cout << "Generating " << count << " candidates with "
                  << num_features << " features (seed " << seed << ")..." << std::endl;

        auto candidates = DataLoader::generate_synthetic_candidates(count, num_features, seed);

        std::cout << "Saving to " << output_file << "..." << std::endl;
        DataLoader::save_candidates_csv(candidates, output_file);

        // Preview the highest-alpha candidates
        std::sort(candidates.begin(), candidates.end(),
                  [](const Candidate& a, const Candidate& b) { return a.alpha > b.alpha; });

        std::cout << "\nTop Candidates by Alpha:\n";
        std::cout << std::string(40, '-') << "\n";
        std::cout << std::setw(10) << "Id"
                  << std::setw(15) << "Alpha"
                  << std::setw(15) << "Risk" << "\n";
        std::cout << std::string(40, '-') << "\n";

        for (size_t i = 0; i < std::min<size_t>(candidates.size(), 10); ++i) {
            std::cout << std::setw(10) << candidates[i].id
                      << std::setw(15) << std::fixed << std::setprecision(4) << candidates[i].alpha
                      << std::setw(15) << candidates[i].risk << "\n";
        }
        std::cout << std::string(40, '-') << "\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "\nCandidate generation complete.\n" << std::endl;
    std::cout << "You can now run:\n";
    std::cout << "  ./build/bin/allocation_engine --candidates " << output_file << " --verbose\n";
    std::cout << std::endl;

    return 0;
}
