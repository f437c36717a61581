#ifndef PHYLOMORPH_MORPH_CONSENSUS_HPP
#define PHYLOMORPH_MORPH_CONSENSUS_HPP

/**
 * @file consensus.hpp
 * @brief Intermediate trees between two consecutive trees.
 *
 * Edges of the two trees are matched by split. Shared edges take the mean of
 * both lengths; edges unique to one tree are zeroed (ramp trees) or removed
 * (collapse trees). Both inputs must be index-encoded against the same
 * LeafIndex; the outputs are index-encoded too.
 */

#include "phylomorph/tree/phylo_tree.hpp"
#include "phylomorph/tree/split.hpp"

namespace phylomorph {

/**
 * @struct ConsensusFrames
 * @brief The four trees inserted between a pair, in animation order.
 */
struct ConsensusFrames {
    PhyloTree ramp_down;   ///< First topology, unique edges at length 0
    PhyloTree collapse_a;  ///< First topology, unique edges removed
    PhyloTree collapse_b;  ///< Second topology, unique edges removed
    PhyloTree ramp_up;     ///< Second topology, unique edges at length 0
};

/**
 * @class ConsensusSynthesizer
 * @brief Builds ramp and collapse trees for a pair of trees.
 *
 * Usage:
 * @code
 * ConsensusSynthesizer synthesizer;
 * ConsensusFrames frames = synthesizer.synthesize(first, second);
 * @endcode
 */
class ConsensusSynthesizer {
public:
    ConsensusSynthesizer() = default;

    /**
     * @brief Build all four intermediate trees.
     * @throws std::invalid_argument if either tree has unindexed leaves.
     */
    [[nodiscard]] ConsensusFrames synthesize(const PhyloTree& first,
                                             const PhyloTree& second) const;

    /**
     * @brief Source topology with every length replaced by the shared mean,
     *        or 0 where the split is absent from the other tree.
     */
    [[nodiscard]] static PhyloTree ramp(const PhyloTree& source,
                                        const SplitLengthMap& source_lengths,
                                        const SplitLengthMap& other_lengths);

    /**
     * @brief Ramp tree with every zero-length unique internal edge removed.
     *
     * The children of a removed node take its place in its parent's child
     * list, in order. The root is never removed.
     */
    [[nodiscard]] static PhyloTree collapse(const PhyloTree& ramped,
                                            const SplitLengthMap& other_lengths);
};

} // namespace phylomorph

#endif // PHYLOMORPH_MORPH_CONSENSUS_HPP
