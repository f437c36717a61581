#include <catch2/catch.hpp>

#include "phylomorph/distance/distance_calculator.hpp"
#include "phylomorph/tree/leaf_index.hpp"
#include "phylomorph/tree/tree_parser.hpp"

#include <string>
#include <vector>

using namespace phylomorph;
using Catch::Detail::Approx;

namespace {

std::vector<PhyloTree> parse_encoded(const std::vector<std::string>& newicks) {
    NewickParser parser;
    std::vector<PhyloTree> trees;
    for (const auto& newick : newicks) {
        trees.push_back(parser.parse(newick));
    }
    const LeafIndex index = LeafIndex::from_tree(trees.front());
    for (auto& tree : trees) {
        index.encode(tree);
    }
    return trees;
}

} // anonymous namespace

TEST_CASE("Robinson-Foulds distance", "[distance]") {
    const RobinsonFouldsCalculator rf;

    SECTION("Identical trees") {
        const auto trees = parse_encoded({"((A,B),(C,D));", "((B,A),(D,C));"});
        REQUIRE(rf.distance(trees[0], trees[1]) == 0.0);
    }

    SECTION("Fully conflicting trees") {
        const auto trees = parse_encoded({"((A,B),(C,D));", "((A,C),(B,D));"});
        REQUIRE(rf.distance(trees[0], trees[1]) == Approx(1.0));
    }

    SECTION("Partly resolved trees") {
        const auto trees = parse_encoded({"((A,B),C,D,E);", "(((A,B),C),D,E);"});
        REQUIRE(rf.distance(trees[0], trees[1]) == Approx(1.0 / 3.0));
    }

    SECTION("Stars have no splits") {
        const auto trees = parse_encoded({"(A,B,C,D);", "(D,C,B,A);"});
        REQUIRE(rf.distance(trees[0], trees[1]) == 0.0);
    }

    SECTION("Unindexed trees are rejected") {
        NewickParser parser;
        const auto tree = parser.parse("((A,B),C,D);");
        REQUIRE_THROWS_AS(rf.distance(tree, tree), std::invalid_argument);
    }
}

TEST_CASE("Weighted Robinson-Foulds distance", "[distance]") {
    const WeightedRobinsonFouldsCalculator wrf;

    SECTION("Conflicting splits count their full length") {
        const auto trees = parse_encoded({"((A,B),(C,D));", "((A,C),(B,D));"});
        REQUIRE(wrf.distance(trees[0], trees[1]) == Approx(4.0));
    }

    SECTION("Shared splits count their length difference") {
        const auto trees = parse_encoded({"((A,B):3,C,D);", "((A,B):1.25,C,D);"});
        REQUIRE(wrf.distance(trees[0], trees[1]) == Approx(1.75));
    }

    SECTION("Leaf and root lengths are ignored") {
        const auto trees = parse_encoded({"((A:1,B:1):2,C:1,D:1):1;",
                                          "((A:5,B:1):2,C:3,D:1):7;"});
        REQUIRE(wrf.distance(trees[0], trees[1]) == 0.0);
    }
}

TEST_CASE("Distance series and matrix", "[distance]") {
    const auto trees = parse_encoded({"((A,B),(C,D));", "((A,C),(B,D));", "((A,B),(C,D));"});

    SECTION("Factory") {
        REQUIRE(create_distance_calculator(DistanceMetric::RobinsonFoulds)->name() ==
                "Robinson-Foulds");
        REQUIRE(create_distance_calculator(DistanceMetric::WeightedRobinsonFoulds)->name() ==
                "weighted Robinson-Foulds");
    }

    SECTION("Trajectory has one entry per consecutive pair") {
        const auto series = RobinsonFouldsCalculator{}.trajectory(trees);
        REQUIRE(series.size() == 2);
        REQUIRE(series[0] == Approx(1.0));
        REQUIRE(series[1] == Approx(1.0));
        REQUIRE(RobinsonFouldsCalculator{}.trajectory({trees.front()}).empty());
    }

    SECTION("Matrix is symmetric with a zero diagonal") {
        const auto matrix = RobinsonFouldsCalculator{}.matrix(trees);
        REQUIRE(matrix.size() == 3);
        for (std::size_t i = 0; i < 3; ++i) {
            REQUIRE(matrix[i].size() == 3);
            REQUIRE(matrix[i][i] == 0.0);
            for (std::size_t j = 0; j < 3; ++j) {
                REQUIRE(matrix[i][j] == matrix[j][i]);
            }
        }
        REQUIRE(matrix[0][2] == 0.0);
        REQUIRE(matrix[0][1] == Approx(1.0));
    }

    SECTION("Report combines both metrics") {
        const auto report = compute_distance_report(trees);
        REQUIRE(report.robinson_foulds.size() == 2);
        REQUIRE(report.weighted_robinson_foulds.size() == 2);
        REQUIRE(report.weighted_robinson_foulds[0] == Approx(4.0));
        REQUIRE(report.matrix.size() == 3);
    }
}
