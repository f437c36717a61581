#ifndef PHYLOMORPH_JUMP_VOTING_HPP
#define PHYLOMORPH_JUMP_VOTING_HPP

/**
 * @file voting.hpp
 * @brief Per-edge set voting that isolates the taxa explaining a change.
 *
 * The candidate edges are the s-edges of either tree. Each candidate is
 * voted on according to its type in both trees:
 *
 * - full on either side: every pair of arms (one per tree) contributes its
 *   intersection and symmetric difference to a pool. The most frequent
 *   candidate sets win, ties go to the smallest, and the winners are united.
 * - partial on both sides: the same vote over components whose owning edge
 *   is partial in one tree and anti in the other, with empty candidates
 *   removed and the trailing winner dropped when several tie.
 * - partial on one side, none on the other: the partial side's
 *   partial-owned components form one candidate and each arm's anti-owned
 *   components form another; the smallest win, with the same drop.
 *
 * Every tie is resolved in lexicographic order of the candidate sets, so the
 * outcome does not depend on container iteration order.
 */

#include "phylomorph/core/types.hpp"
#include "phylomorph/jump/functional_tree.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace phylomorph {

/**
 * @class AncestorLookupError
 * @brief A component or edge has no counterpart where one must exist.
 *
 * This signals inconsistent input to the voting engine; the affected tree
 * pair cannot be given a meaningful verdict.
 */
class AncestorLookupError : public std::runtime_error {
public:
    explicit AncestorLookupError(const std::string& message)
        : std::runtime_error("Ancestor lookup failed: " + message) {}
};

/**
 * @brief Candidate sets with the highest count in the pool, then the
 *        smallest among those, in lexicographic order and without repeats.
 */
[[nodiscard]] std::vector<Arm> select_winners(const std::vector<Arm>& pool);

/**
 * @brief Smallest candidate sets, in lexicographic order and without repeats.
 */
[[nodiscard]] std::vector<Arm> select_smallest(const std::vector<Arm>& candidates);

/**
 * @brief Discard the last winner when more than one remains.
 *
 * This is a heuristic correction for over-broad votes, not a minimality
 * guarantee.
 */
[[nodiscard]] std::vector<Arm> drop_trailing_winner(std::vector<Arm> winners);

/**
 * @brief Sorted union of candidate sets.
 */
[[nodiscard]] Arm unite(const std::vector<Arm>& sets);

/**
 * @class VotingEngine
 * @brief Votes on every candidate edge of a pair of FunctionalTrees.
 *
 * The engine keeps references to both trees; they must outlive it.
 */
class VotingEngine {
public:
    VotingEngine(const FunctionalTree& first, const FunctionalTree& second);

    /** @brief Union of both trees' s-edges, in lexicographic order. */
    [[nodiscard]] std::vector<Split> candidate_edges() const;

    /**
     * @brief Components voted responsible for the change at one edge.
     * @throws AncestorLookupError if the edge or a component's owner is missing.
     */
    [[nodiscard]] Arm vote_edge(const Split& edge) const;

    /**
     * @brief Leaves of every edge's verdict, sorted and without repeats.
     * @throws AncestorLookupError as vote_edge.
     */
    [[nodiscard]] std::vector<LeafId> run() const;

private:
    [[nodiscard]] Arm vote_full(const std::vector<Arm>& first_arms,
                                const std::vector<Arm>& second_arms) const;

    [[nodiscard]] Arm vote_partial_partial(const std::vector<Arm>& first_arms,
                                           const std::vector<Arm>& second_arms) const;

    [[nodiscard]] Arm vote_partial_none(const FunctionalTree& partial_side,
                                        const std::vector<Arm>& arms) const;

    /** @brief Keep components owned by partial here and anti there, or the reverse. */
    [[nodiscard]] std::vector<Arm> filter_moving(const FunctionalTree& here,
                                                 const FunctionalTree& there,
                                                 const std::vector<Arm>& arms) const;

    [[nodiscard]] EdgeType owner_type(const FunctionalTree& tree,
                                      const Component& component) const;

    const FunctionalTree& first_;
    const FunctionalTree& second_;
};

} // namespace phylomorph

#endif // PHYLOMORPH_JUMP_VOTING_HPP
