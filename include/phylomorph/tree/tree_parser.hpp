#ifndef PHYLOMORPH_TREE_TREE_PARSER_HPP
#define PHYLOMORPH_TREE_TREE_PARSER_HPP

/**
 * @file tree_parser.hpp
 * @brief Newick format tree parser.
 *
 * This header defines an iterative parser for Newick format phylogenetic
 * trees. Open parentheses are tracked on an explicit stack, so deeply nested
 * input cannot exhaust the call stack.
 *
 * Newick format: https://en.wikipedia.org/wiki/Newick_format
 * Example: ((A:0.1,B:0.2):0.3,(C:0.1,D:0.2,E:0.7):0.4);
 */

#include "phylomorph/tree/phylo_tree.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace phylomorph {

/**
 * @class ParseError
 * @brief Exception thrown when tree input cannot be parsed.
 */
class ParseError : public std::runtime_error {
public:
    explicit ParseError(const std::string& message)
        : std::runtime_error("Parse error: " + message) {}
};

/**
 * @class NewickParser
 * @brief Parser for one Newick tree terminated by ';'.
 *
 * Nodes may have any number of children. Missing branch lengths default to
 * kDefaultBranchLength, negative lengths are rejected, labels may be quoted
 * with '' as an escaped quote, and [...] comments are ignored. A root with a
 * single child is replaced by that child.
 *
 * Usage:
 * @code
 * NewickParser parser;
 * PhyloTree tree = parser.parse("((A:0.1,B:0.2):0.3,C:0.4,D);");
 * @endcode
 */
class NewickParser {
public:
    NewickParser() = default;

    /**
     * @brief Parse a Newick format string into a tree.
     * @param newick The Newick format string, including the final ';'.
     * @return The parsed tree, leaves named and unindexed.
     * @throws ParseError if the format is invalid.
     */
    [[nodiscard]] PhyloTree parse(std::string_view newick);

private:
    enum class TokenKind { End, Open, Close, Comma, Colon, Semicolon, Label };

    struct Token {
        TokenKind kind = TokenKind::End;
        std::string text;
    };

    /**
     * @brief Consume the next token; whitespace and comments must be skipped first.
     */
    Token get_next_token(std::string_view& input);

    /**
     * @brief Skip whitespace and [...] comments.
     * @throws ParseError on an unterminated comment.
     */
    void skip_whitespace(std::string_view& input);

    /**
     * @brief Read a quoted label, input positioned on the opening quote.
     */
    std::string read_quoted_label(std::string_view& input);

    [[nodiscard]] static bool is_delimiter(char c) {
        return c == '(' || c == ')' || c == ',' || c == ':' || c == ';' ||
               c == '[' || c == '\'';
    }

    [[nodiscard]] double parse_branch_length(const std::string& token) const;

    /** @brief Error carrying the current input offset. */
    [[nodiscard]] ParseError error_here(const std::string& message) const;

    std::size_t offset_ = 0;
};

} // namespace phylomorph

#endif // PHYLOMORPH_TREE_TREE_PARSER_HPP
