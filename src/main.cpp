/**
 * phylomorph - animation frames and jumping taxa for tree sequences
 *
 * Reads a sequence of phylogenetic trees over one taxon set, inserts four
 * intermediate trees between every consecutive pair so that one tree can be
 * morphed into the next, and identifies the taxa whose movement explains
 * each change.
 */

#include "phylomorph/core/config.hpp"
#include "phylomorph/core/types.hpp"
#include "phylomorph/io/newick_writer.hpp"
#include "phylomorph/io/tree_reader.hpp"
#include "phylomorph/morph/pipeline.hpp"

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

namespace {

void print_usage(const char* program_name) {
    std::cerr << "phylomorph 1.0 - Tree sequence morphing and jumping taxa\n\n";
    std::cerr << "Usage: " << program_name << " [options]\n\n";
    std::cerr << "Required:\n";
    std::cerr << "  -f <file>    Input tree file (Newick, one tree per line, or NEXUS)\n\n";
    std::cerr << "Input options:\n";
    std::cerr << "  -l <file>    Preferred leaf order (one name per line)\n";
    std::cerr << "  -s <int>     First tree to use, 1-based (default: 1)\n";
    std::cerr << "  -n <int>     Use every n-th tree; the last is always used (default: 1)\n\n";
    std::cerr << "Output options:\n";
    std::cerr << "  -o <file>    Output frame sequence (Newick, one tree per line)\n";
    std::cerr << "  -j <file>    Output jumping taxa (one line per tree pair)\n";
    std::cerr << "  -d <file>    Output Robinson-Foulds distances (implies -D)\n\n";
    std::cerr << "Analysis options:\n";
    std::cerr << "  -r <int>     Maximum pruning rounds per pair (0 = leaves - 3, default: 0)\n";
    std::cerr << "  -J           Skip the jumping taxa search\n";
    std::cerr << "  -D           Compute Robinson-Foulds distances\n\n";
    std::cerr << "Other options:\n";
    std::cerr << "  -h           Show this help message\n";
    std::cerr << "  --version    Show version information\n";
}

void print_version() {
    std::cout << "phylomorph 1.0.0\n";
    std::cout << "Consensus frames and jumping taxa for phylogenetic tree sequences\n";
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    phylomorph::MorphConfig config;

    // Parse command-line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }
        if (arg == "--version") {
            print_version();
            return 0;
        }

        // Flags without a value
        if (arg == "-J") {
            config.compute_jumping_taxa = false;
            continue;
        }
        if (arg == "-D") {
            config.compute_distances = true;
            continue;
        }

        // Options that take a value
        if (i + 1 >= argc && arg[0] == '-' && arg.length() == 2) {
            std::cerr << "Error: Option " << arg << " requires an argument\n";
            return 1;
        }

        if (arg == "-f") {
            config.tree_file = argv[++i];
        } else if (arg == "-l") {
            config.leaf_order_file = argv[++i];
        } else if (arg == "-o") {
            config.frames_output_file = argv[++i];
        } else if (arg == "-j") {
            config.jumping_taxa_output_file = argv[++i];
        } else if (arg == "-d") {
            config.distances_output_file = argv[++i];
            config.compute_distances = true;
        } else if (arg == "-s" || arg == "-n" || arg == "-r") {
            const int value = std::atoi(argv[++i]);
            if (value < 0) {
                std::cerr << "Error: Option " << arg << " must not be negative\n";
                return 1;
            }
            if (arg == "-s") {
                config.start = static_cast<std::size_t>(value);
            } else if (arg == "-n") {
                config.step = static_cast<std::size_t>(value);
            } else {
                config.max_pruning_rounds = static_cast<std::size_t>(value);
            }
        } else {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    // Validate required arguments
    if (config.tree_file.empty()) {
        std::cerr << "Error: Tree file (-f) is required\n";
        print_usage(argv[0]);
        return 1;
    }

    // Validate configuration
    try {
        config.validate();
    } catch (const std::exception& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    }

    // Read trees
    phylomorph::ReadOptions read_options;
    read_options.start = config.start;
    read_options.step = config.step;
    const phylomorph::DecodeResult decoded =
        phylomorph::read_trees_file(config.tree_file, read_options);
    if (!decoded.ok()) {
        std::cerr << "Error reading trees: " << decoded.error << "\n";
        return 1;
    }
    std::cerr << "Loaded " << decoded.trees.size() << " trees ("
              << decoded.trees.front().count_leaves() << " leaves)\n";

    // Read leaf order
    std::vector<std::string> leaf_order;
    if (config.leaf_order_file) {
        try {
            leaf_order = phylomorph::read_leaf_order_file(*config.leaf_order_file);
            std::cerr << "Loaded leaf order of " << leaf_order.size() << " names\n";
        } catch (const std::exception& e) {
            std::cerr << "Error reading leaf order: " << e.what() << "\n";
            return 1;
        }
    }

    // Run
    phylomorph::MorphPipeline pipeline(config);
    pipeline.set_warning_callback([](const std::string& message) {
        std::cerr << "Warning: " << message << "\n";
    });

    phylomorph::MorphResult result;
    try {
        std::cerr << "Building frames...\n";
        result = pipeline.run(decoded.trees, leaf_order);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    std::cerr << "Built " << result.frames.size() << " frames\n";

    // Write output files
    try {
        if (config.frames_output_file) {
            phylomorph::write_frames_file(*config.frames_output_file, result.frames);
            std::cerr << "Wrote frames to: " << *config.frames_output_file << "\n";
        }
        if (config.jumping_taxa_output_file) {
            phylomorph::write_jumping_taxa_file(*config.jumping_taxa_output_file,
                                                result.jumping_taxa);
            std::cerr << "Wrote jumping taxa to: " << *config.jumping_taxa_output_file << "\n";
        }
        if (config.distances_output_file && result.distances) {
            phylomorph::write_distances_file(*config.distances_output_file, *result.distances);
            std::cerr << "Wrote distances to: " << *config.distances_output_file << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Error writing output: " << e.what() << "\n";
        return 1;
    }

    // Print results if no output files specified
    if (!config.frames_output_file) {
        phylomorph::write_frames(std::cout, result.frames);
    }
    if (config.compute_jumping_taxa && !config.jumping_taxa_output_file) {
        std::cerr << "Jumping taxa:\n";
        phylomorph::write_jumping_taxa(std::cerr, result.jumping_taxa);
    }
    if (result.distances && !config.distances_output_file) {
        std::cerr << "Distances:\n";
        phylomorph::write_distances(std::cerr, *result.distances);
    }

    std::cerr << "Done.\n";
    return 0;
}
