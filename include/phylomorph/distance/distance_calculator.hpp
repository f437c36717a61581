#ifndef PHYLOMORPH_DISTANCE_DISTANCE_CALCULATOR_HPP
#define PHYLOMORPH_DISTANCE_DISTANCE_CALCULATOR_HPP

/**
 * @file distance_calculator.hpp
 * @brief Split-based distances between trees of one sequence.
 *
 * Distances compare the internal non-root splits of index-encoded trees that
 * share one LeafIndex.
 */

#include "phylomorph/tree/phylo_tree.hpp"

#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

namespace phylomorph {

/**
 * @brief Available tree distances.
 */
enum class DistanceMetric : std::uint8_t {
    RobinsonFoulds = 0,         ///< Relative: |A xor B| / (|A| + |B|)
    WeightedRobinsonFoulds = 1  ///< Sum of length differences, absent splits at 0
};

/**
 * @class DistanceCalculator
 * @brief Abstract base class for pairwise tree distances.
 */
class DistanceCalculator {
public:
    virtual ~DistanceCalculator() = default;

    /**
     * @brief Get the name of this distance.
     */
    [[nodiscard]] virtual std::string_view name() const = 0;

    /**
     * @brief Distance between two index-encoded trees.
     * @throws std::invalid_argument if a tree has unindexed leaves.
     */
    [[nodiscard]] virtual double distance(const PhyloTree& a, const PhyloTree& b) const = 0;

    /**
     * @brief Distances between consecutive trees (size n - 1).
     */
    [[nodiscard]] std::vector<double> trajectory(const std::vector<PhyloTree>& trees) const;

    /**
     * @brief Symmetric n x n matrix of all pairwise distances.
     */
    [[nodiscard]] std::vector<std::vector<double>> matrix(
        const std::vector<PhyloTree>& trees) const;
};

class RobinsonFouldsCalculator final : public DistanceCalculator {
public:
    [[nodiscard]] std::string_view name() const override { return "Robinson-Foulds"; }

    /** @brief 0 when neither tree has an internal split. */
    [[nodiscard]] double distance(const PhyloTree& a, const PhyloTree& b) const override;
};

class WeightedRobinsonFouldsCalculator final : public DistanceCalculator {
public:
    [[nodiscard]] std::string_view name() const override {
        return "weighted Robinson-Foulds";
    }

    [[nodiscard]] double distance(const PhyloTree& a, const PhyloTree& b) const override;
};

/**
 * @brief Factory function to create a distance calculator.
 */
[[nodiscard]] std::unique_ptr<DistanceCalculator> create_distance_calculator(
    DistanceMetric metric);

/**
 * @struct DistanceReport
 * @brief Distances reported for a tree sequence.
 */
struct DistanceReport {
    std::vector<double> robinson_foulds;
    std::vector<double> weighted_robinson_foulds;

    /** @brief Pairwise relative Robinson-Foulds distances. */
    std::vector<std::vector<double>> matrix;
};

/**
 * @brief Both trajectories and the pairwise matrix.
 */
[[nodiscard]] DistanceReport compute_distance_report(const std::vector<PhyloTree>& trees);

} // namespace phylomorph

#endif // PHYLOMORPH_DISTANCE_DISTANCE_CALCULATOR_HPP
