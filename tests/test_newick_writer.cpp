#include <catch2/catch.hpp>

#include "phylomorph/io/newick_writer.hpp"
#include "phylomorph/tree/leaf_index.hpp"
#include "phylomorph/tree/tree_parser.hpp"

#include <sstream>
#include <string>
#include <vector>

using namespace phylomorph;

TEST_CASE("Branch length formatting", "[newick_writer]") {
    REQUIRE(format_length(1.0) == "1");
    REQUIRE(format_length(0.0) == "0");
    REQUIRE(format_length(1.5) == "1.5");
    REQUIRE(format_length(0.1) == "0.1");
}

TEST_CASE("Label quoting", "[newick_writer]") {
    REQUIRE(quote_label("Homo_sapiens") == "Homo_sapiens");
    REQUIRE(quote_label("Homo sapiens") == "'Homo sapiens'");
    REQUIRE(quote_label("O'Brien") == "'O''Brien'");
    REQUIRE(quote_label("a,b") == "'a,b'");
    REQUIRE(quote_label("") == "");
}

TEST_CASE("Newick serialization", "[newick_writer]") {
    NewickParser parser;

    SECTION("Every node gets its length") {
        auto tree = parser.parse("((A:1,B:2.5):0,C:0.1);");
        REQUIRE(to_newick(tree) == "((A:1,B:2.5):0,C:0.1):1;");
    }

    SECTION("Internal labels are written") {
        auto tree = parser.parse("((A,B)AB,C)R;");
        REQUIRE(to_newick(tree) == "((A:1,B:1)AB:1,C:1)R:1;");
    }

    SECTION("Output parses back to the same text") {
        auto tree = parser.parse("(('Homo sapiens':0.25,B:1e-3):2,(C,D,E):0);");
        const std::string text = to_newick(tree);
        REQUIRE(to_newick(parser.parse(text)) == text);
    }

    SECTION("Encoded leaves are written as indices") {
        auto tree = parser.parse("(B,A);");
        LeafIndex({"A", "B"}).encode(tree);
        REQUIRE(to_newick(tree) == "(1:1,0:1):1;");
    }

    SECTION("Single leaf tree") {
        auto tree = parser.parse("A:2;");
        REQUIRE(to_newick(tree) == "A:2;");
    }

    SECTION("Empty tree") {
        REQUIRE(to_newick(PhyloTree{}) == ";");
    }
}

TEST_CASE("Result writers", "[newick_writer]") {
    NewickParser parser;

    SECTION("Frames one per line") {
        std::ostringstream out;
        write_frames(out, {parser.parse("(A,B);"), parser.parse("(B,A);")});
        REQUIRE(out.str() == "(A:1,B:1):1;\n(B:1,A:1):1;\n");
    }

    SECTION("Jumping taxa with pair number and status") {
        JumpTaxaResult found;
        found.taxa = {"B", "C"};
        JumpTaxaResult failed;
        failed.status = JumpTaxaStatus::AncestorLookupFailed;

        std::ostringstream out;
        write_jumping_taxa(out, {found, failed});
        REQUIRE(out.str() == "1\tB,C\tok\n2\t\tancestor-lookup-failed\n");
    }

    SECTION("Distances as series and matrix") {
        DistanceReport report;
        report.robinson_foulds = {0.5};
        report.weighted_robinson_foulds = {2.0};
        report.matrix = {{0.0, 0.5}, {0.5, 0.0}};

        std::ostringstream out;
        write_distances(out, report);
        REQUIRE(out.str() == "rf\t0.5\nwrf\t2\nmatrix\n0\t0.5\n0.5\t0\n");
    }

    SECTION("Unwritable file throws") {
        REQUIRE_THROWS_AS(write_frames_file("/nonexistent/dir/frames.nwk", {}),
                          std::runtime_error);
    }
}
