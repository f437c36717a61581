#ifndef PHYLOMORPH_IO_NEWICK_WRITER_HPP
#define PHYLOMORPH_IO_NEWICK_WRITER_HPP

/**
 * @file newick_writer.hpp
 * @brief Newick output for trees and plain-text output for run results.
 *
 * Trees are written one per line with every branch length, using the
 * shortest text that reads back as the same double. Labels that would not
 * survive re-parsing are single-quoted.
 */

#include "phylomorph/distance/distance_calculator.hpp"
#include "phylomorph/jump/pruning.hpp"
#include "phylomorph/tree/phylo_tree.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace phylomorph {

/**
 * @brief Shortest decimal text for a branch length.
 */
[[nodiscard]] std::string format_length(double length);

/**
 * @brief Label as it must appear in Newick text.
 */
[[nodiscard]] std::string quote_label(const std::string& label);

/**
 * @brief Serialize a tree, terminated by ';'.
 *
 * Encoded leaves without a name are written as their index.
 */
[[nodiscard]] std::string to_newick(const PhyloTree& tree);

/**
 * @brief Write one tree followed by a newline.
 */
void write_newick(std::ostream& os, const PhyloTree& tree);

/**
 * @brief Write a frame sequence, one tree per line.
 */
void write_frames(std::ostream& os, const std::vector<PhyloTree>& frames);

/**
 * @brief Write one line per tree pair: pair number, taxa and status.
 *
 * Fields are tab-separated; taxa are comma-separated.
 */
void write_jumping_taxa(std::ostream& os, const std::vector<JumpTaxaResult>& results);

/**
 * @brief Write both distance series and the matrix.
 */
void write_distances(std::ostream& os, const DistanceReport& report);

/**
 * @brief Write a frame sequence to a file.
 * @throws std::runtime_error if file cannot be opened.
 */
void write_frames_file(const std::string& filename, const std::vector<PhyloTree>& frames);

/**
 * @brief Write jumping taxa to a file.
 * @throws std::runtime_error if file cannot be opened.
 */
void write_jumping_taxa_file(const std::string& filename,
                             const std::vector<JumpTaxaResult>& results);

/**
 * @brief Write a distance report to a file.
 * @throws std::runtime_error if file cannot be opened.
 */
void write_distances_file(const std::string& filename, const DistanceReport& report);

} // namespace phylomorph

#endif // PHYLOMORPH_IO_NEWICK_WRITER_HPP
