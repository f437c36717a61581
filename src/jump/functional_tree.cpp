#include "phylomorph/jump/functional_tree.hpp"

#include "phylomorph/tree/split.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace phylomorph {

EdgeType classify_edge(const PhyloTree& tree, NodeId id) {
    const auto& kids = tree.children(id);
    if (kids.empty()) {
        return EdgeType::Leaf;
    }

    std::size_t zero_children = 0;
    for (NodeId child : kids) {
        if (tree.length(child) == 0.0) {
            ++zero_children;
        }
    }

    const bool lengthed = tree.length(id) > 0.0;
    if (lengthed && zero_children == kids.size()) {
        return EdgeType::Full;
    }
    if (lengthed && zero_children > 0) {
        return EdgeType::Partial;
    }
    if (tree.length(id) == 0.0 && zero_children == 0) {
        return EdgeType::Anti;
    }
    return EdgeType::None;
}

FunctionalTree FunctionalTree::build(const PhyloTree& tree) {
    if (tree.empty()) {
        return {};
    }
    const auto splits = node_splits(tree);

    // Components each node contributes to its parent's arm
    std::vector<Arm> arm_of(tree.arena_size());

    // Summary of every finished subtree, merged upward
    std::vector<FunctionalTree> fragments(tree.arena_size());

    for (NodeId id : tree.post_order()) {
        const Split& edge = splits[id];
        const auto& kids = tree.children(id);
        const EdgeType type = classify_edge(tree, id);

        FunctionalTree fragment;
        if (!kids.empty()) {
            // Grow the largest child summary so caterpillars stay near linear
            NodeId largest = kids.front();
            for (NodeId child : kids) {
                if (fragments[child].edge_types_.size() >
                    fragments[largest].edge_types_.size()) {
                    largest = child;
                }
            }
            fragment = std::move(fragments[largest]);
            for (NodeId child : kids) {
                if (child != largest) {
                    fragment.merge(std::move(fragments[child]));
                }
            }

            std::vector<Arm> arms;
            arms.reserve(kids.size());
            for (NodeId child : kids) {
                arms.push_back(arm_of[child]);
                fragment.ancestor_edges_.emplace(splits[child], edge);
            }
            fragment.arms_.emplace(edge, std::move(arms));
            if (is_s_edge(type)) {
                fragment.s_edges_.push_back(edge);
            }
        }
        fragment.edge_types_.emplace(edge, type);

        if (tree.length(id) > 0.0 || kids.empty()) {
            arm_of[id] = {edge};
        } else {
            Arm dissolved;
            for (NodeId child : kids) {
                dissolved.insert(dissolved.end(), arm_of[child].begin(),
                                 arm_of[child].end());
            }
            std::sort(dissolved.begin(), dissolved.end());
            arm_of[id] = std::move(dissolved);
        }

        fragments[id] = std::move(fragment);
    }

    FunctionalTree result = std::move(fragments[tree.root()]);
    std::sort(result.s_edges_.begin(), result.s_edges_.end());
    return result;
}

FunctionalTree& FunctionalTree::merge(FunctionalTree&& other) {
    edge_types_.merge(other.edge_types_);
    arms_.merge(other.arms_);
    ancestor_edges_.merge(other.ancestor_edges_);

    // std::map::merge leaves colliding entries behind in the source
    if (!other.edge_types_.empty() || !other.arms_.empty() ||
        !other.ancestor_edges_.empty()) {
        throw std::logic_error("FunctionalTree fragments share an edge");
    }

    s_edges_.insert(s_edges_.end(), other.s_edges_.begin(), other.s_edges_.end());
    other.s_edges_.clear();
    return *this;
}

std::optional<EdgeType> FunctionalTree::edge_type(const Split& edge) const {
    const auto it = edge_types_.find(edge);
    if (it == edge_types_.end()) {
        return std::nullopt;
    }
    return it->second;
}

const std::vector<Arm>* FunctionalTree::arms(const Split& edge) const {
    const auto it = arms_.find(edge);
    return it == arms_.end() ? nullptr : &it->second;
}

std::optional<Split> FunctionalTree::ancestor_edge(const Component& component) const {
    const auto it = ancestor_edges_.find(component);
    if (it == ancestor_edges_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace phylomorph
