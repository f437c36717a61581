#include "phylomorph/morph/consensus.hpp"

#include <utility>
#include <variant>
#include <vector>

namespace phylomorph {

ConsensusFrames ConsensusSynthesizer::synthesize(const PhyloTree& first,
                                                 const PhyloTree& second) const {
    const SplitLengthMap first_lengths = split_lengths(first);
    const SplitLengthMap second_lengths = split_lengths(second);

    ConsensusFrames frames;
    frames.ramp_down = ramp(first, first_lengths, second_lengths);
    frames.ramp_up = ramp(second, second_lengths, first_lengths);
    frames.collapse_a = collapse(frames.ramp_down, second_lengths);
    frames.collapse_b = collapse(frames.ramp_up, first_lengths);
    return frames;
}

PhyloTree ConsensusSynthesizer::ramp(const PhyloTree& source,
                                     const SplitLengthMap& source_lengths,
                                     const SplitLengthMap& other_lengths) {
    PhyloTree result = source;  // shares the arena until the first edit
    const auto splits = node_splits(source);

    for (NodeId id : source.post_order()) {
        const Split& split = splits[id];
        const auto other = other_lengths.find(split);
        if (other == other_lengths.end()) {
            result.set_length(id, 0.0);
            continue;
        }
        const double own = source_lengths.at(split);
        result.set_length(id, (own + other->second) / 2.0);
    }

    // The root spans every leaf, so it is always shared
    return result;
}

PhyloTree ConsensusSynthesizer::collapse(const PhyloTree& ramped,
                                         const SplitLengthMap& other_lengths) {
    PhyloTree result;
    if (ramped.empty()) {
        return result;
    }
    const auto splits = node_splits(ramped);

    // For every source node, the nodes standing in for it in its parent's
    // child list: itself when kept, its spliced children when removed.
    std::vector<std::vector<NodeId>> stand_ins(ramped.arena_size());

    for (NodeId id : ramped.post_order()) {
        const TreeNode& current = ramped.node(id);
        if (const auto* leaf = std::get_if<LeafNode>(&current)) {
            stand_ins[id] = {result.add_leaf(leaf->name, leaf->length, leaf->index)};
            continue;
        }

        std::vector<NodeId> children;
        for (NodeId child : ramped.children(id)) {
            children.insert(children.end(), stand_ins[child].begin(),
                            stand_ins[child].end());
            stand_ins[child].clear();
        }

        const bool unique = other_lengths.count(splits[id]) == 0;
        if (unique && id != ramped.root()) {
            stand_ins[id] = std::move(children);
            continue;
        }

        const auto& internal = std::get<InternalNode>(current);
        stand_ins[id] = {result.add_internal(internal.name, internal.length,
                                             std::move(children))};
    }

    result.set_root(stand_ins[ramped.root()].front());
    return result;
}

} // namespace phylomorph
