#ifndef PHYLOMORPH_TREE_SPLIT_HPP
#define PHYLOMORPH_TREE_SPLIT_HPP

/**
 * @file split.hpp
 * @brief Leaf-set identities of edges in index-encoded trees.
 */

#include "phylomorph/core/types.hpp"
#include "phylomorph/tree/phylo_tree.hpp"

#include <map>
#include <set>
#include <vector>

namespace phylomorph {

/** @brief Edge length for every split of a tree, root and leaves included. */
using SplitLengthMap = std::map<Split, double>;

/**
 * @brief Split of every arena slot (empty for unreachable slots).
 * @throws std::invalid_argument if a reachable leaf is not indexed.
 */
[[nodiscard]] std::vector<Split> node_splits(const PhyloTree& tree);

/**
 * @brief Lengths keyed by split, covering every reachable node.
 */
[[nodiscard]] SplitLengthMap split_lengths(const PhyloTree& tree);

/**
 * @brief Splits of internal non-root nodes (the tree's bipartitions).
 */
[[nodiscard]] std::set<Split> internal_splits(const PhyloTree& tree);

} // namespace phylomorph

#endif // PHYLOMORPH_TREE_SPLIT_HPP
