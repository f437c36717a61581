#include "phylomorph/jump/voting.hpp"

#include <algorithm>
#include <iterator>
#include <map>
#include <set>

namespace phylomorph {

namespace {

std::string describe(const Split& split) {
    std::string text = "{";
    for (std::size_t i = 0; i < split.size(); ++i) {
        if (i > 0) {
            text += ',';
        }
        text += std::to_string(split[i]);
    }
    return text + "}";
}

Arm intersection(const Arm& a, const Arm& b) {
    Arm result;
    std::set_intersection(a.begin(), a.end(), b.begin(), b.end(),
                          std::back_inserter(result));
    return result;
}

Arm symmetric_difference(const Arm& a, const Arm& b) {
    Arm result;
    std::set_symmetric_difference(a.begin(), a.end(), b.begin(), b.end(),
                                  std::back_inserter(result));
    return result;
}

/**
 * Intersections and symmetric differences of every arm pair.
 */
std::vector<Arm> cartesian_pool(const std::vector<Arm>& first_arms,
                                const std::vector<Arm>& second_arms) {
    std::vector<Arm> pool;
    pool.reserve(2 * first_arms.size() * second_arms.size());
    for (const Arm& a : first_arms) {
        for (const Arm& b : second_arms) {
            pool.push_back(intersection(a, b));
            pool.push_back(symmetric_difference(a, b));
        }
    }
    return pool;
}

} // anonymous namespace

//==============================================================================
// Candidate selection
//==============================================================================

std::vector<Arm> select_winners(const std::vector<Arm>& pool) {
    std::map<Arm, std::size_t> counts;
    for (const Arm& candidate : pool) {
        ++counts[candidate];
    }

    std::size_t best_count = 0;
    for (const auto& [candidate, count] : counts) {
        best_count = std::max(best_count, count);
    }

    std::vector<Arm> most_frequent;
    for (const auto& [candidate, count] : counts) {
        if (count == best_count) {
            most_frequent.push_back(candidate);
        }
    }
    return select_smallest(most_frequent);
}

std::vector<Arm> select_smallest(const std::vector<Arm>& candidates) {
    const std::set<Arm> distinct(candidates.begin(), candidates.end());
    if (distinct.empty()) {
        return {};
    }

    std::size_t smallest = distinct.begin()->size();
    for (const Arm& candidate : distinct) {
        smallest = std::min(smallest, candidate.size());
    }

    std::vector<Arm> winners;
    for (const Arm& candidate : distinct) {
        if (candidate.size() == smallest) {
            winners.push_back(candidate);
        }
    }
    return winners;
}

std::vector<Arm> drop_trailing_winner(std::vector<Arm> winners) {
    if (winners.size() > 1) {
        winners.pop_back();
    }
    return winners;
}

Arm unite(const std::vector<Arm>& sets) {
    std::set<Component> united;
    for (const Arm& set : sets) {
        united.insert(set.begin(), set.end());
    }
    return Arm(united.begin(), united.end());
}

//==============================================================================
// VotingEngine
//==============================================================================

VotingEngine::VotingEngine(const FunctionalTree& first, const FunctionalTree& second)
    : first_(first), second_(second) {}

std::vector<Split> VotingEngine::candidate_edges() const {
    std::vector<Split> edges;
    std::set_union(first_.s_edges().begin(), first_.s_edges().end(),
                   second_.s_edges().begin(), second_.s_edges().end(),
                   std::back_inserter(edges));
    return edges;
}

Arm VotingEngine::vote_edge(const Split& edge) const {
    const auto first_type = first_.edge_type(edge);
    const auto second_type = second_.edge_type(edge);
    const auto* first_arms = first_.arms(edge);
    const auto* second_arms = second_.arms(edge);
    if (!first_type || !second_type || !first_arms || !second_arms) {
        throw AncestorLookupError("edge " + describe(edge) +
                                  " is not an internal edge of both trees");
    }

    if (*first_type == EdgeType::Full || *second_type == EdgeType::Full) {
        return vote_full(*first_arms, *second_arms);
    }
    if (*first_type == EdgeType::Partial && *second_type == EdgeType::Partial) {
        return vote_partial_partial(*first_arms, *second_arms);
    }
    if (*first_type == EdgeType::Partial && *second_type == EdgeType::None) {
        return vote_partial_none(first_, *first_arms);
    }
    if (*first_type == EdgeType::None && *second_type == EdgeType::Partial) {
        return vote_partial_none(second_, *second_arms);
    }

    // Partial against anti or leaf does not occur between ramp trees
    return {};
}

std::vector<LeafId> VotingEngine::run() const {
    std::set<LeafId> leaves;
    for (const Split& edge : candidate_edges()) {
        for (const Component& component : vote_edge(edge)) {
            leaves.insert(component.begin(), component.end());
        }
    }
    return std::vector<LeafId>(leaves.begin(), leaves.end());
}

Arm VotingEngine::vote_full(const std::vector<Arm>& first_arms,
                            const std::vector<Arm>& second_arms) const {
    return unite(select_winners(cartesian_pool(first_arms, second_arms)));
}

Arm VotingEngine::vote_partial_partial(const std::vector<Arm>& first_arms,
                                       const std::vector<Arm>& second_arms) const {
    const auto first_moving = filter_moving(first_, second_, first_arms);
    const auto second_moving = filter_moving(second_, first_, second_arms);

    std::vector<Arm> pool = cartesian_pool(first_moving, second_moving);
    pool.erase(std::remove_if(pool.begin(), pool.end(),
                              [](const Arm& candidate) { return candidate.empty(); }),
               pool.end());

    return unite(drop_trailing_winner(select_winners(pool)));
}

Arm VotingEngine::vote_partial_none(const FunctionalTree& partial_side,
                                    const std::vector<Arm>& arms) const {
    std::set<Component> partial_owned;
    std::vector<Arm> candidates;

    for (const Arm& arm : arms) {
        Arm anti_owned;
        for (const Component& component : arm) {
            const EdgeType owner = owner_type(partial_side, component);
            if (owner == EdgeType::Partial) {
                partial_owned.insert(component);
            } else if (owner == EdgeType::Anti) {
                anti_owned.push_back(component);
            }
        }
        if (!anti_owned.empty()) {
            candidates.push_back(std::move(anti_owned));
        }
    }
    if (!partial_owned.empty()) {
        candidates.emplace_back(partial_owned.begin(), partial_owned.end());
    }

    return unite(drop_trailing_winner(select_smallest(candidates)));
}

std::vector<Arm> VotingEngine::filter_moving(const FunctionalTree& here,
                                             const FunctionalTree& there,
                                             const std::vector<Arm>& arms) const {
    std::vector<Arm> filtered;
    for (const Arm& arm : arms) {
        Arm kept;
        for (const Component& component : arm) {
            const EdgeType here_type = owner_type(here, component);
            const EdgeType there_type = owner_type(there, component);
            const bool leaves_here = here_type == EdgeType::Partial &&
                                     there_type == EdgeType::Anti;
            const bool leaves_there = here_type == EdgeType::Anti &&
                                      there_type == EdgeType::Partial;
            if (leaves_here || leaves_there) {
                kept.push_back(component);
            }
        }
        if (!kept.empty()) {
            filtered.push_back(std::move(kept));
        }
    }
    return filtered;
}

EdgeType VotingEngine::owner_type(const FunctionalTree& tree,
                                  const Component& component) const {
    const auto owner = tree.ancestor_edge(component);
    if (!owner) {
        throw AncestorLookupError("component " + describe(component) +
                                  " has no owning edge");
    }
    const auto type = tree.edge_type(*owner);
    if (!type) {
        throw AncestorLookupError("owning edge " + describe(*owner) +
                                  " is not classified");
    }
    return *type;
}

} // namespace phylomorph
