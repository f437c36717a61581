#include <catch2/catch.hpp>

#include "phylomorph/io/newick_writer.hpp"
#include "phylomorph/morph/pipeline.hpp"
#include "phylomorph/tree/tree_parser.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace phylomorph;
using Catch::Detail::Approx;

namespace {

std::vector<PhyloTree> parse_all(const std::vector<std::string>& newicks) {
    NewickParser parser;
    std::vector<PhyloTree> trees;
    for (const auto& newick : newicks) {
        trees.push_back(parser.parse(newick));
    }
    return trees;
}

MorphConfig default_config() {
    MorphConfig config;
    config.tree_file = "trees.nwk";
    return config;
}

} // anonymous namespace

TEST_CASE("Frame sequence", "[pipeline]") {
    const MorphPipeline pipeline(default_config());

    SECTION("Empty input gives an empty result") {
        const auto result = pipeline.run({});
        REQUIRE(result.empty());
        REQUIRE(result.jumping_taxa.empty());
    }

    SECTION("A single tree is its own sequence") {
        const auto result = pipeline.run(parse_all({"((A,B),C,D);"}));
        REQUIRE(result.frames.size() == 1);
        REQUIRE(result.frame_kinds == std::vector<FrameKind>{FrameKind::Original});
        REQUIRE(result.jumping_taxa.empty());
    }

    SECTION("Five frames per pair plus the last tree") {
        const auto trees = parse_all({"((A,B),(C,D));", "((A,C),(B,D));", "((A,D),(B,C));"});
        const auto result = pipeline.run(trees);

        REQUIRE(result.frames.size() == 11);
        REQUIRE(result.frame_kinds.size() == 11);
        for (std::size_t i = 0; i < result.frame_kinds.size(); ++i) {
            if (i % kFrameStride == 0) {
                REQUIRE(result.frame_kinds[i] == FrameKind::Original);
            } else {
                REQUIRE(result.frame_kinds[i] != FrameKind::Original);
            }
        }
        REQUIRE(result.frame_kinds[1] == FrameKind::RampDown);
        REQUIRE(result.frame_kinds[2] == FrameKind::CollapseA);
        REQUIRE(result.frame_kinds[3] == FrameKind::CollapseB);
        REQUIRE(result.frame_kinds[4] == FrameKind::RampUp);

        REQUIRE(to_newick(result.frames[0]) == "((A:1,B:1):1,(C:1,D:1):1):1;");
        REQUIRE(to_newick(result.frames[5]) == "((A:1,C:1):1,(B:1,D:1):1):1;");
        REQUIRE(to_newick(result.frames[10]) == "((A:1,D:1):1,(B:1,C:1):1):1;");
        REQUIRE(to_newick(result.frames[2]) == "(A:1,B:1,C:1,D:1):1;");
    }

    SECTION("Every frame is named") {
        const auto result = pipeline.run(parse_all({"((A,B),C,D);", "((A,C),B,D);"}));
        for (const auto& frame : result.frames) {
            REQUIRE(frame.leaf_names().size() == 4);
            for (const auto& name : frame.leaf_names()) {
                REQUIRE_FALSE(name.empty());
            }
        }
    }

    SECTION("Trees with different leaf sets are rejected") {
        REQUIRE_THROWS_AS(pipeline.run(parse_all({"(A,B,C,D);", "(A,B,C,E);"})),
                          std::invalid_argument);
    }
}

TEST_CASE("Leaf order", "[pipeline]") {
    const MorphPipeline pipeline(default_config());
    const auto trees = parse_all({"((A,B),(C,D));", "((A,C),(B,D));"});

    SECTION("Tree order by default") {
        const auto result = pipeline.run(trees);
        REQUIRE(result.leaf_order == std::vector<std::string>{"A", "B", "C", "D"});
        REQUIRE(result.warnings.empty());
    }

    SECTION("A matching preferred order is applied") {
        const auto result = pipeline.run(trees, {"D", "C", "B", "A"});
        REQUIRE(result.leaf_order == std::vector<std::string>{"D", "C", "B", "A"});
        REQUIRE(to_newick(result.frames[0]) == "((D:1,C:1):1,(B:1,A:1):1):1;");
    }

    SECTION("A mismatched preferred order falls back with a warning") {
        MorphPipeline reporting(default_config());
        std::vector<std::string> reported;
        reporting.set_warning_callback([&reported](const std::string& message) {
            reported.push_back(message);
        });

        const auto result = reporting.run(trees, {"A", "B", "X"});
        REQUIRE(result.leaf_order == std::vector<std::string>{"A", "B", "C", "D"});
        REQUIRE(result.warnings.size() == 1);
        REQUIRE(result.warnings.front().find("Leaf order does not match") != std::string::npos);
        REQUIRE(reported == result.warnings);
    }
}

TEST_CASE("Optional analyses", "[pipeline]") {
    const auto trees = parse_all({"((A,B,C),(D,E,F));", "((A,B),(C,D,E,F));",
                                  "((A,B),(C,D,E,F));"});

    SECTION("Jumping taxa per pair") {
        const auto result = MorphPipeline(default_config()).run(trees);
        REQUIRE(result.jumping_taxa.size() == 2);
        REQUIRE(result.jumping_taxa[0].taxa == std::vector<std::string>{"C"});
        REQUIRE(result.jumping_taxa[0].status == JumpTaxaStatus::Ok);
        REQUIRE(result.jumping_taxa[1].taxa.empty());
        REQUIRE_FALSE(result.distances.has_value());
    }

    SECTION("Round cap warnings name the pair") {
        MorphConfig config = default_config();
        config.max_pruning_rounds = 1;
        const auto result = MorphPipeline(config).run(trees);
        REQUIRE(result.jumping_taxa[0].status == JumpTaxaStatus::RoundLimitReached);
        REQUIRE(result.warnings.size() == 1);
        REQUIRE(result.warnings.front().rfind("Pair 1: ", 0) == 0);
    }

    SECTION("Jump search can be disabled") {
        MorphConfig config = default_config();
        config.compute_jumping_taxa = false;
        const auto result = MorphPipeline(config).run(trees);
        REQUIRE(result.jumping_taxa.empty());
        REQUIRE(result.frames.size() == 11);
    }

    SECTION("Distances on request") {
        MorphConfig config = default_config();
        config.compute_distances = true;
        const auto result = MorphPipeline(config).run(trees);
        REQUIRE(result.distances.has_value());
        REQUIRE(result.distances->robinson_foulds.size() == 2);
        REQUIRE(result.distances->robinson_foulds[1] == 0.0);
        REQUIRE(result.distances->robinson_foulds[0] == Approx(1.0));
        REQUIRE(result.distances->matrix.size() == 3);
    }
}
