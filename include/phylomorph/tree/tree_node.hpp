#ifndef PHYLOMORPH_TREE_TREE_NODE_HPP
#define PHYLOMORPH_TREE_TREE_NODE_HPP

/**
 * @file tree_node.hpp
 * @brief Node records stored in a PhyloTree arena.
 *
 * A node is either a LeafNode or an InternalNode. Children are referenced by
 * NodeId into the owning tree's arena, so nodes hold no pointers and copying
 * a tree never aliases another tree's structure.
 */

#include "phylomorph/core/types.hpp"

#include <string>
#include <variant>
#include <vector>

namespace phylomorph {

/**
 * @struct LeafNode
 * @brief A terminal node (taxon).
 *
 * Parsed leaves carry their name. Once a tree is encoded against a LeafIndex
 * the name is cleared and the leaf is identified by index alone, until the
 * tree is reified again.
 */
struct LeafNode {
    /** @brief Taxon name (empty while the tree is index-encoded). */
    std::string name;

    /** @brief Length of the edge above this leaf. */
    double length = kDefaultBranchLength;

    /** @brief Canonical leaf index, or kUnindexedLeaf. */
    LeafId index = kUnindexedLeaf;
};

/**
 * @struct InternalNode
 * @brief A node with one or more children, in order.
 */
struct InternalNode {
    /** @brief Optional label from the input. */
    std::string name;

    /** @brief Length of the edge above this node. */
    double length = kDefaultBranchLength;

    /** @brief Ordered children (arena slots). */
    std::vector<NodeId> children;
};

/**
 * @brief Tagged node record: exactly one of leaf or internal.
 */
using TreeNode = std::variant<LeafNode, InternalNode>;

//==============================================================================
// Accessors shared by both alternatives
//==============================================================================

[[nodiscard]] inline bool is_leaf(const TreeNode& node) noexcept {
    return std::holds_alternative<LeafNode>(node);
}

[[nodiscard]] const std::string& node_name(const TreeNode& node) noexcept;

[[nodiscard]] double node_length(const TreeNode& node) noexcept;

void set_node_length(TreeNode& node, double length) noexcept;

/**
 * @brief Children of a node; empty for leaves.
 */
[[nodiscard]] const std::vector<NodeId>& node_children(const TreeNode& node) noexcept;

} // namespace phylomorph

#endif // PHYLOMORPH_TREE_TREE_NODE_HPP
