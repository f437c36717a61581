#ifndef PHYLOMORPH_JUMP_PRUNING_HPP
#define PHYLOMORPH_JUMP_PRUNING_HPP

/**
 * @file pruning.hpp
 * @brief Iterative jump-taxon search for one pair of trees.
 *
 * Each round blends the pair into ramp-down and ramp-up trees, summarizes
 * them as FunctionalTrees and votes. Voted taxa are accumulated and deleted
 * from both trees, and the search repeats on the reduced pair while at least
 * kMinimumLeafCount leaves would remain.
 */

#include "phylomorph/core/types.hpp"
#include "phylomorph/jump/functional_tree.hpp"
#include "phylomorph/tree/leaf_index.hpp"
#include "phylomorph/tree/phylo_tree.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace phylomorph {

/**
 * @brief Outcome flag of a jump-taxon search.
 */
enum class JumpTaxaStatus : std::uint8_t {
    Ok = 0,                    ///< Search ran to its natural end
    AncestorLookupFailed = 1,  ///< Voting hit an inconsistency; no taxa reported
    RoundLimitReached = 2      ///< Stopped by the round cap; taxa are partial
};

/**
 * @brief Convert JumpTaxaStatus to string for display.
 */
[[nodiscard]] constexpr std::string_view to_string(JumpTaxaStatus status) {
    switch (status) {
        case JumpTaxaStatus::Ok: return "ok";
        case JumpTaxaStatus::AncestorLookupFailed: return "ancestor-lookup-failed";
        case JumpTaxaStatus::RoundLimitReached: return "round-limit-reached";
    }
    return "unknown";
}

/**
 * @struct JumpTaxaResult
 * @brief Taxa found for one tree pair.
 */
struct JumpTaxaResult {
    /** @brief Taxon names in the pair's canonical leaf order. */
    std::vector<std::string> taxa;

    JumpTaxaStatus status = JumpTaxaStatus::Ok;

    /** @brief Voting rounds performed. */
    std::size_t rounds = 0;
};

/**
 * @struct ReconciliationContext
 * @brief Everything one voting round works on, built fresh for each round.
 */
struct ReconciliationContext {
    LeafIndex index;            ///< Leaf order of the reduced first tree
    PhyloTree ramp_down;        ///< Encoded, first topology
    PhyloTree ramp_up;          ///< Encoded, second topology
    FunctionalTree first;       ///< Summary of ramp_down
    FunctionalTree second;      ///< Summary of ramp_up

    /**
     * @brief Build the context for a pair of named trees over one leaf set.
     * @throws std::invalid_argument if the leaf sets differ.
     */
    [[nodiscard]] static ReconciliationContext build(const PhyloTree& first,
                                                     const PhyloTree& second);
};

/**
 * @class PruningLoop
 * @brief Runs voting rounds on a tree pair until no new taxa are found.
 *
 * Usage:
 * @code
 * PruningLoop loop;
 * JumpTaxaResult result = loop.run(first, second);
 * @endcode
 */
class PruningLoop {
public:
    /**
     * @brief Construct a loop.
     * @param max_rounds Hard cap on rounds; 0 derives leaf_count - 3.
     */
    explicit PruningLoop(std::size_t max_rounds = 0) : max_rounds_(max_rounds) {}

    /**
     * @brief Set callback for conditions that end a search early.
     */
    void set_warning_callback(WarningCallback callback) {
        warning_callback_ = std::move(callback);
    }

    /**
     * @brief Search a pair of named trees with the same leaf set.
     *
     * Never throws for an inconsistent pair; the status says what happened.
     * @throws std::invalid_argument if the leaf sets differ.
     */
    [[nodiscard]] JumpTaxaResult run(const PhyloTree& first, const PhyloTree& second) const;

    /**
     * @brief One voting round on a prepared context.
     *
     * Counts the round in result. An inconsistent context sets
     * AncestorLookupFailed, clears the taxa and raises a warning.
     * @return Names voted for this round, empty on failure.
     */
    [[nodiscard]] std::vector<std::string> run_round(const ReconciliationContext& context,
                                                     JumpTaxaResult& result) const;

    /**
     * @brief Round cap applied to a pair with the given number of leaves.
     */
    [[nodiscard]] std::size_t round_limit(std::size_t leaf_count) const noexcept;

private:
    void warn(const std::string& message) const;

    std::size_t max_rounds_ = 0;
    WarningCallback warning_callback_;
};

} // namespace phylomorph

#endif // PHYLOMORPH_JUMP_PRUNING_HPP
