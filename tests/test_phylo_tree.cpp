#include <catch2/catch.hpp>

#include "phylomorph/tree/leaf_index.hpp"
#include "phylomorph/tree/phylo_tree.hpp"
#include "phylomorph/tree/tree_parser.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace phylomorph;
using Catch::Detail::Approx;

TEST_CASE("PhyloTree construction", "[phylo_tree]") {
    PhyloTree tree;

    SECTION("New tree is empty") {
        REQUIRE(tree.empty());
        REQUIRE(tree.post_order().empty());
        REQUIRE(tree.count_leaves() == 0);
    }

    SECTION("Building bottom-up") {
        const NodeId a = tree.add_leaf("A", 0.5);
        const NodeId b = tree.add_leaf("B");
        const NodeId root = tree.add_internal("", 1.0, {a, b});
        tree.set_root(root);

        REQUIRE_FALSE(tree.empty());
        REQUIRE(tree.count_nodes() == 3);
        REQUIRE(tree.length(a) == Approx(0.5));
        REQUIRE(tree.length(b) == Approx(kDefaultBranchLength));
        REQUIRE(tree.children(root) == std::vector<NodeId>{a, b});
        REQUIRE(tree.children(a).empty());
    }

    SECTION("Invalid construction throws") {
        REQUIRE_THROWS_AS(tree.add_internal("", 1.0, {}), std::invalid_argument);
        REQUIRE_THROWS_AS(tree.add_internal("", 1.0, {7}), std::invalid_argument);
        REQUIRE_THROWS_AS(tree.set_root(0), std::out_of_range);
        REQUIRE_THROWS_AS(tree.node(3), std::out_of_range);
    }
}

TEST_CASE("PhyloTree traversal order", "[phylo_tree]") {
    NewickParser parser;
    auto tree = parser.parse("((A,B)X,C,(D,E)Y)R;");

    SECTION("Post-order visits children first, in order") {
        std::vector<std::string> names;
        for (NodeId id : tree.post_order()) {
            names.push_back(tree.name(id));
        }
        REQUIRE(names == std::vector<std::string>{"A", "B", "X", "C", "D", "E", "Y", "R"});
    }

    SECTION("Pre-order visits parents first, in order") {
        std::vector<std::string> names;
        for (NodeId id : tree.pre_order()) {
            names.push_back(tree.name(id));
        }
        REQUIRE(names == std::vector<std::string>{"R", "X", "A", "B", "C", "Y", "D", "E"});
    }

    SECTION("Leaves come in document order") {
        REQUIRE(tree.leaf_names() == std::vector<std::string>{"A", "B", "C", "D", "E"});
    }
}

TEST_CASE("PhyloTree copy-on-write", "[phylo_tree]") {
    NewickParser parser;
    const auto original = parser.parse("((A:1,B:2):3,C:4);");

    SECTION("Copies share storage until edited") {
        PhyloTree copy = original;
        REQUIRE(copy.shares_storage_with(original));

        copy.set_length(copy.root(), 9.0);
        REQUIRE_FALSE(copy.shares_storage_with(original));
        REQUIRE(copy.length(copy.root()) == Approx(9.0));
        REQUIRE(original.length(original.root()) == Approx(1.0));
    }

    SECTION("Edits to the source leave copies untouched") {
        PhyloTree source = original;
        const PhyloTree snapshot = source;
        source.set_length(source.children(source.root())[1], 0.0);
        REQUIRE(snapshot.length(snapshot.children(snapshot.root())[1]) == Approx(4.0));
    }

    SECTION("Reading does not copy") {
        PhyloTree copy = original;
        (void)copy.post_order();
        (void)copy.leaf_names();
        REQUIRE(copy.shares_storage_with(original));
    }
}

TEST_CASE("PhyloTree canonicalize", "[phylo_tree]") {
    NewickParser parser;
    const LeafIndex index({"A", "B", "C", "D"});

    SECTION("Children are ordered by their smallest leaf") {
        auto tree = parser.parse("((D,C),B,A);");
        index.encode(tree);
        tree.canonicalize();
        index.reify(tree);
        REQUIRE(tree.leaf_names() == std::vector<std::string>{"A", "B", "C", "D"});
    }

    SECTION("Rotations of one topology become identical") {
        auto first = parser.parse("(A:1,B:2,(C:3,D:4):5);");
        auto second = parser.parse("((D:4,C:3):5,B:2,A:1);");
        index.encode(first);
        index.encode(second);
        first.canonicalize();
        second.canonicalize();
        REQUIRE(first.post_order().size() == second.post_order().size());
        const auto first_order = first.post_order();
        const auto second_order = second.post_order();
        for (std::size_t i = 0; i < first_order.size(); ++i) {
            REQUIRE(first.length(first_order[i]) == second.length(second_order[i]));
        }
    }

    SECTION("Canonical tree is not copied again") {
        auto tree = parser.parse("(A,B,(C,D));");
        index.encode(tree);
        tree.canonicalize();
        const PhyloTree copy = tree;
        tree.canonicalize();
        REQUIRE(tree.shares_storage_with(copy));
    }

    SECTION("Unindexed leaves are rejected") {
        auto tree = parser.parse("(A,B);");
        REQUIRE_THROWS_AS(tree.canonicalize(), std::invalid_argument);
    }
}

TEST_CASE("PhyloTree leaf deletion", "[phylo_tree]") {
    NewickParser parser;

    SECTION("Removed leaf disappears, siblings stay") {
        auto tree = parser.parse("(A,B,C,D);");
        auto pruned = tree.without_leaves({"B"});
        REQUIRE(pruned.leaf_names() == std::vector<std::string>{"A", "C", "D"});
        REQUIRE(tree.count_leaves() == 4);
    }

    SECTION("Single-child parent is replaced by the child, which keeps its length") {
        auto tree = parser.parse("((A:1,B:2):3,C:4,D:5);");
        auto pruned = tree.without_leaves({"B"});
        const auto& kids = pruned.children(pruned.root());
        REQUIRE(kids.size() == 3);
        REQUIRE(pruned.is_leaf(kids[0]));
        REQUIRE(pruned.name(kids[0]) == "A");
        REQUIRE(pruned.length(kids[0]) == Approx(1.0));
    }

    SECTION("Emptied clade is removed") {
        auto tree = parser.parse("((A,B),C,D);");
        auto pruned = tree.without_leaves({"A", "B"});
        REQUIRE(pruned.children(pruned.root()).size() == 2);
    }

    SECTION("Root left with one child collapses") {
        auto tree = parser.parse("((A:1,B:1):2,C:3);");
        auto pruned = tree.without_leaves({"C"});
        REQUIRE(pruned.children(pruned.root()).size() == 2);
        REQUIRE(pruned.length(pruned.root()) == Approx(2.0));
    }

    SECTION("Removing everything leaves an empty tree") {
        auto tree = parser.parse("(A,B);");
        REQUIRE(tree.without_leaves({"A", "B"}).empty());
    }

    SECTION("Result has a compact arena") {
        auto tree = parser.parse("((A,B),(C,D),E);");
        auto pruned = tree.without_leaves({"E"});
        REQUIRE(pruned.arena_size() == pruned.count_nodes());
    }
}
