#ifndef PHYLOMORPH_TREE_PHYLO_TREE_HPP
#define PHYLOMORPH_TREE_PHYLO_TREE_HPP

/**
 * @file phylo_tree.hpp
 * @brief Rooted, ordered, multifurcating tree backed by a node arena.
 *
 * Nodes live in a shared arena and refer to their children by NodeId.
 * Copying a PhyloTree shares the arena; the first mutation through either
 * copy clones it (copy-on-write), so a copy can be edited without touching
 * the tree it came from. Instances are not safe to mutate concurrently.
 *
 * All traversals use explicit stacks, so tree depth is bounded only by
 * available memory.
 */

#include "phylomorph/core/types.hpp"
#include "phylomorph/tree/tree_node.hpp"

#include <cstddef>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace phylomorph {

/**
 * @class PhyloTree
 * @brief A phylogenetic tree with ordered children and edge lengths.
 */
class PhyloTree {
public:
    /** @brief Construct an empty tree. */
    PhyloTree();

    //==========================================================================
    // Construction
    //==========================================================================

    /**
     * @brief Append a leaf to the arena.
     * @return The new node's id.
     */
    NodeId add_leaf(std::string name, double length = kDefaultBranchLength,
                    LeafId index = kUnindexedLeaf);

    /**
     * @brief Append an internal node whose children already exist.
     * @throws std::invalid_argument if children is empty or names an unknown node.
     */
    NodeId add_internal(std::string name, double length, std::vector<NodeId> children);

    /**
     * @brief Make an existing node the root.
     * @throws std::out_of_range if id is not in the arena.
     */
    void set_root(NodeId id);

    //==========================================================================
    // Node access
    //==========================================================================

    [[nodiscard]] NodeId root() const noexcept { return root_; }
    [[nodiscard]] bool empty() const noexcept { return root_ == kNoNode; }

    /** @brief Number of arena slots, including detached ones. */
    [[nodiscard]] std::size_t arena_size() const noexcept { return nodes_->size(); }

    /**
     * @brief Read a node.
     * @throws std::out_of_range if id is not in the arena.
     */
    [[nodiscard]] const TreeNode& node(NodeId id) const;

    /**
     * @brief Writable access to a node; clones a shared arena first.
     * @throws std::out_of_range if id is not in the arena.
     */
    [[nodiscard]] TreeNode& mutable_node(NodeId id);

    [[nodiscard]] bool is_leaf(NodeId id) const { return phylomorph::is_leaf(node(id)); }
    [[nodiscard]] double length(NodeId id) const { return node_length(node(id)); }
    [[nodiscard]] const std::string& name(NodeId id) const { return node_name(node(id)); }
    [[nodiscard]] const std::vector<NodeId>& children(NodeId id) const {
        return node_children(node(id));
    }

    void set_length(NodeId id, double length) { set_node_length(mutable_node(id), length); }

    /** @brief True when both trees currently read from the same arena. */
    [[nodiscard]] bool shares_storage_with(const PhyloTree& other) const noexcept {
        return nodes_ == other.nodes_;
    }

    //==========================================================================
    // Traversal
    //==========================================================================

    /** @brief Reachable nodes, children before parents, children in order. */
    [[nodiscard]] std::vector<NodeId> post_order() const;

    /** @brief Reachable nodes, parents before children, children in order. */
    [[nodiscard]] std::vector<NodeId> pre_order() const;

    /** @brief Reachable leaves in document order. */
    [[nodiscard]] std::vector<NodeId> leaves() const;

    /** @brief Names of reachable leaves in document order. */
    [[nodiscard]] std::vector<std::string> leaf_names() const;

    [[nodiscard]] std::size_t count_leaves() const;
    [[nodiscard]] std::size_t count_nodes() const;

    //==========================================================================
    // Structural edits
    //==========================================================================

    /**
     * @brief Replace a root that has a single child by that child, repeatedly.
     */
    void collapse_root_wrappers();

    /**
     * @brief Order every node's children by the smallest leaf index below them.
     *
     * After this, two trees with the same topology and leaf indexing have the
     * same child order at every node.
     * @throws std::invalid_argument if a reachable leaf is not indexed.
     */
    void canonicalize();

    /**
     * @brief Copy of this tree with the named leaves deleted.
     *
     * Internal nodes left without children are removed. A node left with a
     * single child is replaced by that child, which keeps its own length; this
     * also applies to the root. The copy has a freshly compacted arena.
     */
    [[nodiscard]] PhyloTree without_leaves(const std::set<std::string>& names) const;

private:
    std::vector<TreeNode>& writable_nodes();
    void check_id(NodeId id) const;

    std::shared_ptr<std::vector<TreeNode>> nodes_;
    NodeId root_ = kNoNode;
};

} // namespace phylomorph

#endif // PHYLOMORPH_TREE_PHYLO_TREE_HPP
