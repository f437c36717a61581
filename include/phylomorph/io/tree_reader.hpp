#ifndef PHYLOMORPH_IO_TREE_READER_HPP
#define PHYLOMORPH_IO_TREE_READER_HPP

/**
 * @file tree_reader.hpp
 * @brief Decoder boundary for tree sequences.
 *
 * This header provides the functions that turn a tree file (Newick, one tree
 * per line, or NEXUS) into a validated sequence of trees. Parse failures do
 * not propagate past these functions: they are reported in the returned
 * DecodeResult, which then holds no trees.
 */

#include "phylomorph/tree/phylo_tree.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace phylomorph {

/**
 * @struct ReadOptions
 * @brief Tree sub-sampling.
 */
struct ReadOptions {
    /** @brief 1-based index of the first tree to keep. */
    std::size_t start = 1;

    /** @brief Keep every step-th tree from start; the last tree is always kept. */
    std::size_t step = 1;
};

/**
 * @struct DecodeResult
 * @brief Outcome of decoding a tree sequence.
 */
struct DecodeResult {
    /** @brief Selected trees, leaves named, all sharing one leaf set. */
    std::vector<PhyloTree> trees;

    /** @brief Reason for failure; empty on success. */
    std::string error;

    [[nodiscard]] bool ok() const noexcept { return error.empty() && !trees.empty(); }
};

/**
 * @brief 0-based positions kept out of count trees.
 *
 * A start past the end keeps only the last tree.
 */
[[nodiscard]] std::vector<std::size_t> select_tree_indices(std::size_t count,
                                                           const ReadOptions& options);

/**
 * @brief Decode trees from Newick or NEXUS text.
 */
[[nodiscard]] DecodeResult read_trees_string(std::string_view text,
                                             const ReadOptions& options = {});

/**
 * @brief Decode trees from a file.
 *
 * An unreadable file is reported like a parse failure.
 */
[[nodiscard]] DecodeResult read_trees_file(const std::string& filename,
                                           const ReadOptions& options = {});

/**
 * @brief Leaf names, one per non-blank line, surrounding whitespace trimmed.
 */
[[nodiscard]] std::vector<std::string> parse_leaf_order(std::string_view text);

/**
 * @brief Read a leaf-order file.
 * @throws std::runtime_error if the file cannot be read.
 */
[[nodiscard]] std::vector<std::string> read_leaf_order_file(const std::string& filename);

} // namespace phylomorph

#endif // PHYLOMORPH_IO_TREE_READER_HPP
