#include "phylomorph/morph/pipeline.hpp"

#include "phylomorph/morph/consensus.hpp"
#include "phylomorph/tree/leaf_index.hpp"

#include <stdexcept>
#include <utility>

namespace phylomorph {

MorphPipeline::MorphPipeline(MorphConfig config)
    : config_(std::move(config)) {}

void MorphPipeline::set_warning_callback(WarningCallback callback) {
    warning_callback_ = std::move(callback);
}

MorphResult MorphPipeline::run(const std::vector<PhyloTree>& trees,
                               const std::vector<std::string>& preferred_order) const {
    MorphResult result;
    if (trees.empty()) {
        return result;
    }

    const WarningCallback report = [this, &result](const std::string& message) {
        result.warnings.push_back(message);
        if (warning_callback_) {
            warning_callback_(message);
        }
    };

    //==========================================================================
    // Canonical leaf order and encoding
    //==========================================================================

    const LeafIndex index =
        LeafIndex::with_preferred_order(trees.front(), preferred_order, report);
    result.leaf_order = index.names();

    std::vector<PhyloTree> encoded;
    encoded.reserve(trees.size());
    for (std::size_t i = 0; i < trees.size(); ++i) {
        if (!index.matches(trees[i])) {
            throw std::invalid_argument("Tree " + std::to_string(i + 1) +
                                        " does not have the same leaf set as tree 1");
        }
        PhyloTree tree = trees[i];
        index.encode(tree);
        tree.canonicalize();
        encoded.push_back(std::move(tree));
    }

    //==========================================================================
    // Frames
    //==========================================================================

    const ConsensusSynthesizer synthesizer;
    const std::size_t frame_count = (encoded.size() - 1) * kFrameStride + 1;
    result.frames.reserve(frame_count);
    result.frame_kinds.reserve(frame_count);
    const auto add_frame = [&](const PhyloTree& tree, FrameKind kind) {
        result.frames.push_back(index.reified(tree));
        result.frame_kinds.push_back(kind);
    };

    if (encoded.size() == 1) {
        add_frame(encoded.front(), FrameKind::Original);
    }
    for (std::size_t i = 0; i + 1 < encoded.size(); ++i) {
        // The second tree stays encoded until it is the last one
        add_frame(encoded[i], FrameKind::Original);

        const ConsensusFrames pair = synthesizer.synthesize(encoded[i], encoded[i + 1]);
        add_frame(pair.ramp_down, FrameKind::RampDown);
        add_frame(pair.collapse_a, FrameKind::CollapseA);
        add_frame(pair.collapse_b, FrameKind::CollapseB);
        add_frame(pair.ramp_up, FrameKind::RampUp);

        if (i + 2 == encoded.size()) {
            add_frame(encoded[i + 1], FrameKind::Original);
        }
    }

    //==========================================================================
    // Jumping taxa
    //==========================================================================

    if (config_.compute_jumping_taxa) {
        PruningLoop loop(config_.max_pruning_rounds);
        for (std::size_t i = 0; i + 1 < encoded.size(); ++i) {
            loop.set_warning_callback([&report, i](const std::string& message) {
                report("Pair " + std::to_string(i + 1) + ": " + message);
            });
            result.jumping_taxa.push_back(
                loop.run(index.reified(encoded[i]), index.reified(encoded[i + 1])));
        }
    }

    //==========================================================================
    // Distances
    //==========================================================================

    if (config_.compute_distances) {
        result.distances = compute_distance_report(encoded);
    }

    return result;
}

} // namespace phylomorph
