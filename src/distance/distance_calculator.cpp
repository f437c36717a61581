#include "phylomorph/distance/distance_calculator.hpp"

#include "phylomorph/tree/split.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <set>
#include <stdexcept>

namespace phylomorph {

namespace {

/**
 * Lengths of internal non-root splits.
 */
SplitLengthMap internal_split_lengths(const PhyloTree& tree) {
    const auto splits = node_splits(tree);
    SplitLengthMap lengths;
    for (NodeId id : tree.post_order()) {
        if (id != tree.root() && !tree.is_leaf(id)) {
            lengths[splits[id]] = tree.length(id);
        }
    }
    return lengths;
}

} // anonymous namespace

//==============================================================================
// DistanceCalculator
//==============================================================================

std::vector<double> DistanceCalculator::trajectory(const std::vector<PhyloTree>& trees) const {
    std::vector<double> series;
    for (std::size_t i = 1; i < trees.size(); ++i) {
        series.push_back(distance(trees[i - 1], trees[i]));
    }
    return series;
}

std::vector<std::vector<double>> DistanceCalculator::matrix(
    const std::vector<PhyloTree>& trees) const {
    const std::size_t n = trees.size();
    std::vector<std::vector<double>> result(n, std::vector<double>(n, 0.0));
    for (std::size_t i = 0; i < n; ++i) {
        for (std::size_t j = i + 1; j < n; ++j) {
            result[i][j] = distance(trees[i], trees[j]);
            result[j][i] = result[i][j];
        }
    }
    return result;
}

//==============================================================================
// Robinson-Foulds
//==============================================================================

double RobinsonFouldsCalculator::distance(const PhyloTree& a, const PhyloTree& b) const {
    const std::set<Split> a_splits = internal_splits(a);
    const std::set<Split> b_splits = internal_splits(b);

    const std::size_t total = a_splits.size() + b_splits.size();
    if (total == 0) {
        return 0.0;
    }

    std::vector<Split> differing;
    std::set_symmetric_difference(a_splits.begin(), a_splits.end(),
                                  b_splits.begin(), b_splits.end(),
                                  std::back_inserter(differing));
    return static_cast<double>(differing.size()) / static_cast<double>(total);
}

double WeightedRobinsonFouldsCalculator::distance(const PhyloTree& a,
                                                  const PhyloTree& b) const {
    const SplitLengthMap a_lengths = internal_split_lengths(a);
    const SplitLengthMap b_lengths = internal_split_lengths(b);

    double total = 0.0;
    for (const auto& [split, length] : a_lengths) {
        const auto other = b_lengths.find(split);
        total += std::abs(length - (other == b_lengths.end() ? 0.0 : other->second));
    }
    for (const auto& [split, length] : b_lengths) {
        if (a_lengths.count(split) == 0) {
            total += std::abs(length);
        }
    }
    return total;
}

//==============================================================================
// Factory
//==============================================================================

std::unique_ptr<DistanceCalculator> create_distance_calculator(DistanceMetric metric) {
    switch (metric) {
        case DistanceMetric::RobinsonFoulds:
            return std::make_unique<RobinsonFouldsCalculator>();
        case DistanceMetric::WeightedRobinsonFoulds:
            return std::make_unique<WeightedRobinsonFouldsCalculator>();
    }
    throw std::invalid_argument("Unknown distance metric");
}

DistanceReport compute_distance_report(const std::vector<PhyloTree>& trees) {
    const auto rf = create_distance_calculator(DistanceMetric::RobinsonFoulds);
    const auto weighted = create_distance_calculator(DistanceMetric::WeightedRobinsonFoulds);

    DistanceReport report;
    report.robinson_foulds = rf->trajectory(trees);
    report.weighted_robinson_foulds = weighted->trajectory(trees);
    report.matrix = rf->matrix(trees);
    return report;
}

} // namespace phylomorph
