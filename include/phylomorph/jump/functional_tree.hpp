#ifndef PHYLOMORPH_JUMP_FUNCTIONAL_TREE_HPP
#define PHYLOMORPH_JUMP_FUNCTIONAL_TREE_HPP

/**
 * @file functional_tree.hpp
 * @brief Edge classification and component sets for jump-taxon voting.
 *
 * A FunctionalTree summarizes one index-encoded tree for the voting engine:
 * the type of every edge, the edges that take part in voting (s-edges), the
 * arms below every s-edge and the owning edge of every component. Edges are
 * identified by split, so summaries of two trees over the same leaf set can
 * be queried with the same keys.
 */

#include "phylomorph/core/types.hpp"
#include "phylomorph/tree/phylo_tree.hpp"

#include <map>
#include <optional>
#include <vector>

namespace phylomorph {

/**
 * @brief Structural type of the edge above a node.
 */
[[nodiscard]] EdgeType classify_edge(const PhyloTree& tree, NodeId id);

/**
 * @class FunctionalTree
 * @brief Per-tree lookup tables used by the voting engine.
 */
class FunctionalTree {
public:
    FunctionalTree() = default;

    /**
     * @brief Summarize an index-encoded tree in one post-order pass.
     * @throws std::invalid_argument if a leaf is not indexed.
     */
    [[nodiscard]] static FunctionalTree build(const PhyloTree& tree);

    /**
     * @brief Take over every entry of other.
     *
     * Keys of two fragments of one tree never overlap.
     * @throws std::logic_error if they do.
     */
    FunctionalTree& merge(FunctionalTree&& other);

    /** @brief Full and partial edges, in lexicographic split order. */
    [[nodiscard]] const std::vector<Split>& s_edges() const noexcept { return s_edges_; }

    /** @brief Type of an edge, or nullopt if the tree has no such edge. */
    [[nodiscard]] std::optional<EdgeType> edge_type(const Split& edge) const;

    /**
     * @brief Arms below an edge, one per child, in child order.
     *
     * Leaves have no arms.
     * @return nullptr if the tree has no such edge.
     */
    [[nodiscard]] const std::vector<Arm>* arms(const Split& edge) const;

    /**
     * @brief Edge directly above the node a component identifies.
     * @return nullopt for the root or an unknown component.
     */
    [[nodiscard]] std::optional<Split> ancestor_edge(const Component& component) const;

private:
    std::vector<Split> s_edges_;
    std::map<Split, EdgeType> edge_types_;
    std::map<Split, std::vector<Arm>> arms_;
    std::map<Component, Split> ancestor_edges_;
};

} // namespace phylomorph

#endif // PHYLOMORPH_JUMP_FUNCTIONAL_TREE_HPP
