#include "phylomorph/core/config.hpp"

#include <stdexcept>
#include <string>

namespace phylomorph {

void MorphConfig::validate() const {
    // Tree file is required
    if (tree_file.empty()) {
        throw std::invalid_argument("tree_file is required");
    }

    // Sub-sampling
    if (start == 0) {
        throw std::invalid_argument(
            "start must be at least 1, got " + std::to_string(start));
    }
    if (step == 0) {
        throw std::invalid_argument(
            "step must be at least 1, got " + std::to_string(step));
    }

    // Outputs must not collide
    if (frames_output_file && jumping_taxa_output_file &&
        *frames_output_file == *jumping_taxa_output_file) {
        throw std::invalid_argument(
            "frames and jumping taxa outputs share the file " +
            *frames_output_file);
    }
    if (frames_output_file && distances_output_file &&
        *frames_output_file == *distances_output_file) {
        throw std::invalid_argument(
            "frames and distance outputs share the file " +
            *frames_output_file);
    }
    if (jumping_taxa_output_file && distances_output_file &&
        *jumping_taxa_output_file == *distances_output_file) {
        throw std::invalid_argument(
            "jumping taxa and distance outputs share the file " +
            *jumping_taxa_output_file);
    }

    if (distances_output_file && !compute_distances) {
        throw std::invalid_argument(
            "distances_output_file requires compute_distances");
    }
    if (jumping_taxa_output_file && !compute_jumping_taxa) {
        throw std::invalid_argument(
            "jumping_taxa_output_file requires compute_jumping_taxa");
    }
}

} // namespace phylomorph
