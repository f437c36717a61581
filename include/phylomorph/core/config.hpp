#ifndef PHYLOMORPH_CORE_CONFIG_HPP
#define PHYLOMORPH_CORE_CONFIG_HPP

/**
 * @file config.hpp
 * @brief Run configuration for phylomorph.
 *
 * This header defines the MorphConfig struct that holds every parameter of
 * one morphing run: input and output locations, tree sub-sampling and the
 * jump-taxon search limits.
 */

#include "phylomorph/core/types.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace phylomorph {

/**
 * @struct MorphConfig
 * @brief Complete configuration for a phylomorph run.
 */
struct MorphConfig {
    //==========================================================================
    // Input files
    //==========================================================================

    /** @brief Input tree file (Newick, one tree per line, or NEXUS). Required. */
    std::string tree_file;

    /** @brief Optional newline-separated preferred leaf order. */
    std::optional<std::string> leaf_order_file;

    //==========================================================================
    // Tree selection
    //==========================================================================

    /** @brief 1-based index of the first tree to keep. Default: 1. */
    std::size_t start = 1;

    /**
     * @brief Keep every step-th tree from start onward. Default: 1.
     *
     * The last tree of the input is always kept.
     */
    std::size_t step = 1;

    //==========================================================================
    // Jump-taxon search
    //==========================================================================

    /** @brief Run the jump-taxon search on every consecutive pair. */
    bool compute_jumping_taxa = true;

    /**
     * @brief Hard cap on pruning rounds per pair.
     *
     * 0 selects the derived cap of leaf_count - 3.
     */
    std::size_t max_pruning_rounds = 0;

    //==========================================================================
    // Distances
    //==========================================================================

    /** @brief Compute Robinson-Foulds series and the pairwise matrix. */
    bool compute_distances = false;

    //==========================================================================
    // Output options
    //==========================================================================

    /** @brief Output file for the frame sequence (Newick, one per line). */
    std::optional<std::string> frames_output_file;

    /** @brief Output file for per-pair jumping taxa. */
    std::optional<std::string> jumping_taxa_output_file;

    /** @brief Output file for the distance report. */
    std::optional<std::string> distances_output_file;

    //==========================================================================
    // Validation
    //==========================================================================

    /**
     * @brief Validate configuration parameters.
     * @throws std::invalid_argument if any parameter is invalid.
     */
    void validate() const;
};

} // namespace phylomorph

#endif // PHYLOMORPH_CORE_CONFIG_HPP
