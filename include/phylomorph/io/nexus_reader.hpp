#ifndef PHYLOMORPH_IO_NEXUS_READER_HPP
#define PHYLOMORPH_IO_NEXUS_READER_HPP

/**
 * @file nexus_reader.hpp
 * @brief Reduction of NEXUS documents to Newick tree statements.
 *
 * Only the TREES block is read. Bracket comments are stripped, an optional
 * TRANSLATE table is collected, and every TREE statement yields its Newick
 * text. Other blocks are skipped.
 */

#include "phylomorph/tree/phylo_tree.hpp"
#include "phylomorph/tree/tree_parser.hpp"

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace phylomorph {

/**
 * @class NexusError
 * @brief Exception thrown when a NEXUS document is structurally invalid.
 */
class NexusError : public ParseError {
public:
    explicit NexusError(const std::string& message)
        : ParseError("NEXUS: " + message) {}
};

/**
 * @struct NexusTree
 * @brief One TREE statement.
 */
struct NexusTree {
    std::string name;
    std::string newick;  ///< Newick text including the final ';'
};

/**
 * @struct NexusDocument
 * @brief Contents of the TREES block.
 */
struct NexusDocument {
    std::vector<NexusTree> trees;

    /** @brief TRANSLATE table: token used in the trees -> taxon name. */
    std::map<std::string, std::string> translate;
};

/**
 * @brief Whether text starts with the #NEXUS marker (case-insensitive).
 */
[[nodiscard]] bool is_nexus(std::string_view text);

/**
 * @brief Remove [...] comments outside quoted labels.
 * @throws NexusError on an unterminated comment.
 */
[[nodiscard]] std::string strip_bracket_comments(std::string_view text);

/**
 * @brief Extract the TREES block of a NEXUS document.
 * @throws NexusError if there is no TREES block, it is not closed by END,
 *         it contains no trees, or a statement is malformed.
 */
[[nodiscard]] NexusDocument read_nexus(std::string_view text);

/**
 * @brief Rename leaves through a TRANSLATE table.
 *
 * Leaves whose name is not a table token keep their name.
 */
void apply_translation(PhyloTree& tree, const std::map<std::string, std::string>& table);

} // namespace phylomorph

#endif // PHYLOMORPH_IO_NEXUS_READER_HPP
