#include "phylomorph/tree/split.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <variant>

namespace phylomorph {

std::vector<Split> node_splits(const PhyloTree& tree) {
    std::vector<Split> splits(tree.arena_size());

    for (NodeId id : tree.post_order()) {
        if (const auto* leaf = std::get_if<LeafNode>(&tree.node(id))) {
            if (leaf->index == kUnindexedLeaf) {
                throw std::invalid_argument("Leaf '" + leaf->name + "' has no index");
            }
            splits[id] = {leaf->index};
            continue;
        }

        Split merged;
        for (NodeId child : tree.children(id)) {
            Split next;
            next.reserve(merged.size() + splits[child].size());
            std::merge(merged.begin(), merged.end(),
                       splits[child].begin(), splits[child].end(),
                       std::back_inserter(next));
            merged = std::move(next);
        }
        splits[id] = std::move(merged);
    }
    return splits;
}

SplitLengthMap split_lengths(const PhyloTree& tree) {
    const auto splits = node_splits(tree);
    SplitLengthMap lengths;
    for (NodeId id : tree.post_order()) {
        lengths[splits[id]] = tree.length(id);
    }
    return lengths;
}

std::set<Split> internal_splits(const PhyloTree& tree) {
    const auto splits = node_splits(tree);
    std::set<Split> result;
    for (NodeId id : tree.post_order()) {
        if (id != tree.root() && !tree.is_leaf(id)) {
            result.insert(splits[id]);
        }
    }
    return result;
}

} // namespace phylomorph
