#ifndef PHYLOMORPH_MORPH_PIPELINE_HPP
#define PHYLOMORPH_MORPH_PIPELINE_HPP

/**
 * @file pipeline.hpp
 * @brief End-to-end processing of a decoded tree sequence.
 *
 * The pipeline fixes the canonical leaf order, canonicalizes every tree,
 * interleaves the synthesized frames between consecutive trees and runs the
 * jump-taxon search and distance calculation when enabled.
 */

#include "phylomorph/core/config.hpp"
#include "phylomorph/core/types.hpp"
#include "phylomorph/distance/distance_calculator.hpp"
#include "phylomorph/jump/pruning.hpp"
#include "phylomorph/tree/phylo_tree.hpp"

#include <optional>
#include <string>
#include <vector>

namespace phylomorph {

/**
 * @struct MorphResult
 * @brief Everything produced for one tree sequence.
 */
struct MorphResult {
    /**
     * @brief Named trees in animation order.
     *
     * For n input trees: [T0, ramp-down, collapse-A, collapse-B, ramp-up, T1,
     * ...], 5(n-1)+1 trees in all.
     */
    std::vector<PhyloTree> frames;

    /** @brief Role of each entry of frames. */
    std::vector<FrameKind> frame_kinds;

    /** @brief One entry per consecutive pair, when enabled. */
    std::vector<JumpTaxaResult> jumping_taxa;

    /** @brief Canonical leaf order used for every tree. */
    std::vector<std::string> leaf_order;

    /** @brief Distances between the input trees, when enabled. */
    std::optional<DistanceReport> distances;

    /** @brief Recoverable conditions met during the run. */
    std::vector<std::string> warnings;

    [[nodiscard]] bool empty() const noexcept { return frames.empty(); }
};

/**
 * @class MorphPipeline
 * @brief Turns a tree sequence into frames, jumping taxa and distances.
 *
 * Usage:
 * @code
 * MorphPipeline pipeline(config);
 * pipeline.set_warning_callback([](const std::string& w) { std::cerr << w << '\n'; });
 * MorphResult result = pipeline.run(decoded.trees, leaf_order);
 * @endcode
 */
class MorphPipeline {
public:
    explicit MorphPipeline(MorphConfig config);

    /**
     * @brief Set a callback for recoverable conditions.
     *
     * Warnings are also collected in MorphResult::warnings.
     */
    void set_warning_callback(WarningCallback callback);

    /**
     * @brief Process named trees that share one leaf set.
     * @param trees Input trees in sequence order.
     * @param preferred_order Optional leaf order; ignored with a warning
     *        unless it names exactly the trees' leaves.
     * @return An empty result if trees is empty.
     * @throws std::invalid_argument if the trees do not share one leaf set.
     */
    [[nodiscard]] MorphResult run(const std::vector<PhyloTree>& trees,
                                  const std::vector<std::string>& preferred_order = {}) const;

    [[nodiscard]] const MorphConfig& config() const noexcept { return config_; }

private:
    MorphConfig config_;
    WarningCallback warning_callback_;
};

} // namespace phylomorph

#endif // PHYLOMORPH_MORPH_PIPELINE_HPP
