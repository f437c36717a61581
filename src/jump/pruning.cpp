#include "phylomorph/jump/pruning.hpp"

#include "phylomorph/jump/voting.hpp"
#include "phylomorph/morph/consensus.hpp"
#include "phylomorph/tree/split.hpp"

#include <set>
#include <stdexcept>

namespace phylomorph {

ReconciliationContext ReconciliationContext::build(const PhyloTree& first,
                                                   const PhyloTree& second) {
    ReconciliationContext context;
    context.index = LeafIndex::from_tree(first);
    if (!context.index.matches(second)) {
        throw std::invalid_argument("Tree pair does not share one leaf set");
    }

    // Unary nodes are suppressed so that every split names exactly one node
    PhyloTree encoded_first = first.without_leaves({});
    PhyloTree encoded_second = second.without_leaves({});
    context.index.encode(encoded_first);
    context.index.encode(encoded_second);
    encoded_first.canonicalize();
    encoded_second.canonicalize();

    const SplitLengthMap first_lengths = split_lengths(encoded_first);
    const SplitLengthMap second_lengths = split_lengths(encoded_second);
    context.ramp_down = ConsensusSynthesizer::ramp(encoded_first, first_lengths,
                                                   second_lengths);
    context.ramp_up = ConsensusSynthesizer::ramp(encoded_second, second_lengths,
                                                 first_lengths);
    context.first = FunctionalTree::build(context.ramp_down);
    context.second = FunctionalTree::build(context.ramp_up);
    return context;
}

std::size_t PruningLoop::round_limit(std::size_t leaf_count) const noexcept {
    if (max_rounds_ > 0) {
        return max_rounds_;
    }
    return leaf_count > 3 ? leaf_count - 3 : 1;
}

JumpTaxaResult PruningLoop::run(const PhyloTree& first, const PhyloTree& second) const {
    const LeafIndex original = LeafIndex::from_tree(first);
    if (!original.matches(second)) {
        throw std::invalid_argument("Tree pair does not share one leaf set");
    }

    JumpTaxaResult result;
    const std::size_t limit = round_limit(original.size());
    std::set<std::string> found;
    PhyloTree current_first = first;
    PhyloTree current_second = second;

    while (true) {
        const ReconciliationContext context =
            ReconciliationContext::build(current_first, current_second);

        const std::vector<std::string> verdict = run_round(context, result);
        if (result.status == JumpTaxaStatus::AncestorLookupFailed) {
            return result;
        }

        std::set<std::string> fresh;
        for (const auto& name : verdict) {
            if (found.count(name) == 0) {
                fresh.insert(name);
            }
        }
        found.insert(fresh.begin(), fresh.end());

        const std::size_t leaf_count = context.index.size();
        if (fresh.empty() || leaf_count < verdict.size() + kMinimumLeafCount) {
            break;
        }
        if (result.rounds >= limit) {
            result.status = JumpTaxaStatus::RoundLimitReached;
            warn("Jump-taxon search stopped after " + std::to_string(result.rounds) +
                 " rounds with " + std::to_string(leaf_count - verdict.size()) +
                 " leaves left to check");
            break;
        }

        current_first = current_first.without_leaves(fresh);
        current_second = current_second.without_leaves(fresh);
    }

    for (const auto& name : original.names()) {
        if (found.count(name) != 0) {
            result.taxa.push_back(name);
        }
    }
    return result;
}

std::vector<std::string> PruningLoop::run_round(const ReconciliationContext& context,
                                                JumpTaxaResult& result) const {
    ++result.rounds;
    try {
        return context.index.names_of(VotingEngine(context.first, context.second).run());
    } catch (const AncestorLookupError& e) {
        result.status = JumpTaxaStatus::AncestorLookupFailed;
        result.taxa.clear();
        warn(std::string(e.what()) + " in round " + std::to_string(result.rounds));
    }
    return {};
}

void PruningLoop::warn(const std::string& message) const {
    if (warning_callback_) {
        warning_callback_(message);
    }
}

} // namespace phylomorph
