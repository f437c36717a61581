#include <catch2/catch.hpp>

#include "phylomorph/jump/functional_tree.hpp"
#include "phylomorph/tree/leaf_index.hpp"
#include "phylomorph/tree/tree_parser.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace phylomorph;

namespace {

PhyloTree parse_encoded(const std::string& newick) {
    NewickParser parser;
    PhyloTree tree = parser.parse(newick);
    LeafIndex::from_tree(tree).encode(tree);
    tree.canonicalize();
    return tree;
}

} // anonymous namespace

TEST_CASE("Edge classification", "[functional_tree]") {
    SECTION("Leaves") {
        const auto tree = parse_encoded("(A,B,C);");
        for (NodeId id : tree.leaves()) {
            REQUIRE(classify_edge(tree, id) == EdgeType::Leaf);
        }
    }

    SECTION("Full when every child is zero-length") {
        const auto tree = parse_encoded("(A:0,B:0,C:0):1;");
        REQUIRE(classify_edge(tree, tree.root()) == EdgeType::Full);
    }

    SECTION("Partial when some children are zero-length") {
        const auto tree = parse_encoded("(A:0,B:1,C:1):1;");
        REQUIRE(classify_edge(tree, tree.root()) == EdgeType::Partial);
    }

    SECTION("Anti when the edge is zero-length over lengthed children") {
        const auto tree = parse_encoded("(A:1,B:1,C:1):0;");
        REQUIRE(classify_edge(tree, tree.root()) == EdgeType::Anti);
    }

    SECTION("None otherwise") {
        const auto lengthed = parse_encoded("(A:1,B:1,C:1):1;");
        REQUIRE(classify_edge(lengthed, lengthed.root()) == EdgeType::None);
        const auto mixed = parse_encoded("(A:0,B:1,C:1):0;");
        REQUIRE(classify_edge(mixed, mixed.root()) == EdgeType::None);
        const auto all_zero = parse_encoded("(A:0,B:0,C:0):0;");
        REQUIRE(classify_edge(all_zero, all_zero.root()) == EdgeType::None);
    }
}

TEST_CASE("Functional tree summary", "[functional_tree]") {
    const auto tree = parse_encoded("((A:0,B:0):2,(C:0,D:1):2,(E:1,F:1):0):1;");
    const auto functional = FunctionalTree::build(tree);

    const Split root = {0, 1, 2, 3, 4, 5};
    const Split ab = {0, 1};
    const Split cd = {2, 3};
    const Split ef = {4, 5};

    SECTION("Edge types") {
        REQUIRE(functional.edge_type(root) == EdgeType::Partial);
        REQUIRE(functional.edge_type(ab) == EdgeType::Full);
        REQUIRE(functional.edge_type(cd) == EdgeType::Partial);
        REQUIRE(functional.edge_type(ef) == EdgeType::Anti);
        REQUIRE(functional.edge_type(Split{3}) == EdgeType::Leaf);
        REQUIRE_FALSE(functional.edge_type(Split{0, 2}).has_value());
        REQUIRE_FALSE(functional.edge_type(Split{1, 2}).has_value());
    }

    SECTION("S-edges are full and partial edges in split order") {
        const std::vector<Split> expected = {ab, root, cd};
        REQUIRE(functional.s_edges() == expected);
    }

    SECTION("Zero-length children dissolve into their components") {
        const auto* arms = functional.arms(root);
        REQUIRE(arms != nullptr);
        const std::vector<Arm> expected = {
            {ab},
            {cd},
            {Split{4}, Split{5}},
        };
        REQUIRE(*arms == expected);
    }

    SECTION("Arms of a full edge over leaves") {
        const auto* arms = functional.arms(ab);
        REQUIRE(arms != nullptr);
        const std::vector<Arm> expected = {{Split{0}}, {Split{1}}};
        REQUIRE(*arms == expected);
    }

    SECTION("Leaves and unknown edges have no arms") {
        REQUIRE(functional.arms(Split{0}) == nullptr);
        REQUIRE(functional.arms(Split{0, 5}) == nullptr);
    }

    SECTION("Ancestors are direct parents") {
        REQUIRE(functional.ancestor_edge(Split{4}) == ef);
        REQUIRE(functional.ancestor_edge(Split{0}) == ab);
        REQUIRE(functional.ancestor_edge(ab) == root);
        REQUIRE(functional.ancestor_edge(ef) == root);
        REQUIRE_FALSE(functional.ancestor_edge(root).has_value());
        REQUIRE_FALSE(functional.ancestor_edge(Split{0, 1, 2}).has_value());
    }
}

TEST_CASE("Functional tree construction edge cases", "[functional_tree]") {
    SECTION("Empty tree") {
        const auto functional = FunctionalTree::build(PhyloTree{});
        REQUIRE(functional.s_edges().empty());
    }

    SECTION("Unindexed leaves are rejected") {
        NewickParser parser;
        REQUIRE_THROWS_AS(FunctionalTree::build(parser.parse("(A,B,C);")),
                          std::invalid_argument);
    }

    SECTION("Long caterpillar builds without recursion") {
        const std::size_t depth = 2000;
        PhyloTree tree;
        NodeId current = tree.add_leaf("L0", 1.0, 0);
        for (std::size_t i = 1; i < depth; ++i) {
            const NodeId leaf = tree.add_leaf("L" + std::to_string(i), 0.0,
                                              static_cast<LeafId>(i));
            current = tree.add_internal("", 1.0, {current, leaf});
        }
        tree.set_root(current);

        const auto functional = FunctionalTree::build(tree);
        REQUIRE(functional.s_edges().size() == depth - 1);
    }
}

TEST_CASE("Functional tree merge", "[functional_tree]") {
    const auto make_cherry = [](LeafId first) {
        PhyloTree tree;
        const NodeId a = tree.add_leaf("a", 0.0, first);
        const NodeId b = tree.add_leaf("b", 0.0, first + 1);
        tree.set_root(tree.add_internal("", 1.0, {a, b}));
        return FunctionalTree::build(tree);
    };

    SECTION("Disjoint fragments combine") {
        auto merged = make_cherry(0);
        merged.merge(make_cherry(2));
        REQUIRE(merged.edge_type(Split{0, 1}) == EdgeType::Full);
        REQUIRE(merged.edge_type(Split{2, 3}) == EdgeType::Full);
        REQUIRE(merged.s_edges().size() == 2);
    }

    SECTION("Overlapping fragments are rejected") {
        auto merged = make_cherry(0);
        REQUIRE_THROWS_AS(merged.merge(make_cherry(0)), std::logic_error);
    }
}
