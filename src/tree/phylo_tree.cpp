#include "phylomorph/tree/phylo_tree.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace phylomorph {

PhyloTree::PhyloTree()
    : nodes_(std::make_shared<std::vector<TreeNode>>()) {}

//==============================================================================
// Arena management
//==============================================================================

std::vector<TreeNode>& PhyloTree::writable_nodes() {
    if (nodes_.use_count() > 1) {
        nodes_ = std::make_shared<std::vector<TreeNode>>(*nodes_);
    }
    return *nodes_;
}

void PhyloTree::check_id(NodeId id) const {
    if (id >= nodes_->size()) {
        throw std::out_of_range("Node id " + std::to_string(id) +
                                " outside arena of size " +
                                std::to_string(nodes_->size()));
    }
}

NodeId PhyloTree::add_leaf(std::string name, double length, LeafId index) {
    auto& nodes = writable_nodes();
    const auto id = static_cast<NodeId>(nodes.size());
    nodes.emplace_back(LeafNode{std::move(name), length, index});
    return id;
}

NodeId PhyloTree::add_internal(std::string name, double length,
                               std::vector<NodeId> children) {
    if (children.empty()) {
        throw std::invalid_argument("Internal node requires at least one child");
    }
    for (NodeId child : children) {
        if (child >= nodes_->size()) {
            throw std::invalid_argument("Unknown child node id " +
                                        std::to_string(child));
        }
    }

    auto& nodes = writable_nodes();
    const auto id = static_cast<NodeId>(nodes.size());
    nodes.emplace_back(InternalNode{std::move(name), length, std::move(children)});
    return id;
}

void PhyloTree::set_root(NodeId id) {
    check_id(id);
    root_ = id;
}

const TreeNode& PhyloTree::node(NodeId id) const {
    check_id(id);
    return (*nodes_)[id];
}

TreeNode& PhyloTree::mutable_node(NodeId id) {
    check_id(id);
    return writable_nodes()[id];
}

//==============================================================================
// Traversal
//==============================================================================

std::vector<NodeId> PhyloTree::post_order() const {
    std::vector<NodeId> order;
    if (empty()) {
        return order;
    }
    order.reserve(nodes_->size());

    // Each frame holds a node and the index of the next child to visit
    std::vector<std::pair<NodeId, std::size_t>> stack;
    stack.emplace_back(root_, 0);
    while (!stack.empty()) {
        const NodeId id = stack.back().first;
        const auto& kids = children(id);
        const std::size_t next = stack.back().second;
        if (next < kids.size()) {
            ++stack.back().second;
            stack.emplace_back(kids[next], 0);
        } else {
            order.push_back(id);
            stack.pop_back();
        }
    }
    return order;
}

std::vector<NodeId> PhyloTree::pre_order() const {
    std::vector<NodeId> order;
    if (empty()) {
        return order;
    }
    order.reserve(nodes_->size());

    std::vector<NodeId> stack{root_};
    while (!stack.empty()) {
        const NodeId id = stack.back();
        stack.pop_back();
        order.push_back(id);
        const auto& kids = children(id);
        for (auto it = kids.rbegin(); it != kids.rend(); ++it) {
            stack.push_back(*it);
        }
    }
    return order;
}

std::vector<NodeId> PhyloTree::leaves() const {
    std::vector<NodeId> result;
    for (NodeId id : pre_order()) {
        if (is_leaf(id)) {
            result.push_back(id);
        }
    }
    return result;
}

std::vector<std::string> PhyloTree::leaf_names() const {
    std::vector<std::string> names;
    for (NodeId id : leaves()) {
        names.push_back(name(id));
    }
    return names;
}

std::size_t PhyloTree::count_leaves() const {
    return leaves().size();
}

std::size_t PhyloTree::count_nodes() const {
    return pre_order().size();
}

//==============================================================================
// Structural edits
//==============================================================================

void PhyloTree::collapse_root_wrappers() {
    while (!empty() && children(root_).size() == 1) {
        root_ = children(root_).front();
    }
}

void PhyloTree::canonicalize() {
    std::vector<LeafId> min_leaf(nodes_->size(), kUnindexedLeaf);

    for (NodeId id : post_order()) {
        if (const auto* leaf = std::get_if<LeafNode>(&node(id))) {
            if (leaf->index == kUnindexedLeaf) {
                throw std::invalid_argument("Cannot canonicalize: leaf '" +
                                            leaf->name + "' has no index");
            }
            min_leaf[id] = leaf->index;
            continue;
        }

        const auto by_min_leaf = [&min_leaf](NodeId a, NodeId b) {
            return min_leaf[a] < min_leaf[b];
        };
        const auto& kids = children(id);
        if (!std::is_sorted(kids.begin(), kids.end(), by_min_leaf)) {
            auto& internal = std::get<InternalNode>(mutable_node(id));
            std::stable_sort(internal.children.begin(), internal.children.end(),
                             by_min_leaf);
        }
        min_leaf[id] = min_leaf[children(id).front()];
    }
}

PhyloTree PhyloTree::without_leaves(const std::set<std::string>& names) const {
    PhyloTree result;
    std::vector<NodeId> replacement(nodes_->size(), kNoNode);

    for (NodeId id : post_order()) {
        const TreeNode& current = node(id);
        if (const auto* leaf = std::get_if<LeafNode>(&current)) {
            if (names.count(leaf->name) == 0) {
                replacement[id] = result.add_leaf(leaf->name, leaf->length, leaf->index);
            }
            continue;
        }

        const auto& internal = std::get<InternalNode>(current);
        std::vector<NodeId> kept;
        for (NodeId child : internal.children) {
            if (replacement[child] != kNoNode) {
                kept.push_back(replacement[child]);
            }
        }
        if (kept.empty()) {
            continue;
        }
        if (kept.size() == 1) {
            replacement[id] = kept.front();
            continue;
        }
        replacement[id] = result.add_internal(internal.name, internal.length,
                                              std::move(kept));
    }

    if (!empty() && replacement[root_] != kNoNode) {
        result.set_root(replacement[root_]);
    }
    return result;
}

} // namespace phylomorph
