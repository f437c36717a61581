#include "phylomorph/tree/tree_parser.hpp"

#include <cctype>
#include <cmath>
#include <utility>
#include <variant>
#include <vector>

namespace phylomorph {

PhyloTree NewickParser::parse(std::string_view newick) {
    std::string_view input = newick;
    const auto track = [&]() { offset_ = newick.size() - input.size(); };

    offset_ = 0;
    skip_whitespace(input);
    if (input.empty()) {
        throw ParseError("Empty input");
    }

    PhyloTree tree;

    // Children collected so far for every '(' not yet closed
    std::vector<std::vector<NodeId>> open;

    // Most recently completed node, still accepting a label and a length
    NodeId current = kNoNode;
    bool current_labelled = false;
    bool current_has_length = false;
    bool expect_node = true;

    while (true) {
        skip_whitespace(input);
        track();
        Token token = get_next_token(input);

        switch (token.kind) {
            case TokenKind::End:
                throw error_here("Missing ';' at end of tree");

            case TokenKind::Open:
                if (!expect_node) {
                    throw error_here("Unexpected '('");
                }
                open.emplace_back();
                break;

            case TokenKind::Label:
                if (expect_node) {
                    current = tree.add_leaf(std::move(token.text));
                    current_labelled = true;
                    current_has_length = false;
                    expect_node = false;
                } else if (!current_labelled && !current_has_length) {
                    std::get<InternalNode>(tree.mutable_node(current)).name =
                        std::move(token.text);
                    current_labelled = true;
                } else {
                    throw error_here("Unexpected label '" + token.text + "'");
                }
                break;

            case TokenKind::Colon:
                if (expect_node) {
                    throw error_here("Branch length without a node");
                }
                if (current_has_length) {
                    throw error_here("Node has two branch lengths");
                }
                skip_whitespace(input);
                track();
                token = get_next_token(input);
                if (token.kind != TokenKind::Label) {
                    throw error_here("Expected branch length after ':'");
                }
                tree.set_length(current, parse_branch_length(token.text));
                current_has_length = true;
                break;

            case TokenKind::Comma:
                if (open.empty()) {
                    throw error_here("',' outside parentheses");
                }
                if (expect_node) {
                    throw error_here("Empty subtree");
                }
                open.back().push_back(current);
                expect_node = true;
                break;

            case TokenKind::Close: {
                if (open.empty()) {
                    throw error_here("Unmatched ')'");
                }
                if (expect_node) {
                    throw error_here("Empty subtree");
                }
                open.back().push_back(current);
                std::vector<NodeId> children = std::move(open.back());
                open.pop_back();
                current = tree.add_internal("", kDefaultBranchLength, std::move(children));
                current_labelled = false;
                current_has_length = false;
                break;
            }

            case TokenKind::Semicolon:
                if (!open.empty()) {
                    throw error_here("Unbalanced parentheses: " +
                                     std::to_string(open.size()) + " unclosed");
                }
                if (expect_node) {
                    throw error_here("Tree has no nodes");
                }
                skip_whitespace(input);
                if (!input.empty()) {
                    track();
                    throw error_here("Unexpected text after ';'");
                }
                tree.set_root(current);
                tree.collapse_root_wrappers();
                return tree;
        }
    }
}

NewickParser::Token NewickParser::get_next_token(std::string_view& input) {
    if (input.empty()) {
        return {TokenKind::End, ""};
    }

    const char c = input[0];
    switch (c) {
        case '(': input.remove_prefix(1); return {TokenKind::Open, "("};
        case ')': input.remove_prefix(1); return {TokenKind::Close, ")"};
        case ',': input.remove_prefix(1); return {TokenKind::Comma, ","};
        case ':': input.remove_prefix(1); return {TokenKind::Colon, ":"};
        case ';': input.remove_prefix(1); return {TokenKind::Semicolon, ";"};
        case '\'': return {TokenKind::Label, read_quoted_label(input)};
        default: break;
    }

    // Otherwise, read until we hit a delimiter
    std::size_t end = 0;
    while (end < input.size() && !is_delimiter(input[end]) &&
           !std::isspace(static_cast<unsigned char>(input[end]))) {
        ++end;
    }

    std::string token(input.substr(0, end));
    input.remove_prefix(end);
    return {TokenKind::Label, std::move(token)};
}

void NewickParser::skip_whitespace(std::string_view& input) {
    while (!input.empty()) {
        if (std::isspace(static_cast<unsigned char>(input[0]))) {
            input.remove_prefix(1);
        } else if (input[0] == '[') {
            const auto close = input.find(']');
            if (close == std::string_view::npos) {
                throw error_here("Unterminated comment");
            }
            input.remove_prefix(close + 1);
        } else {
            break;
        }
    }
}

std::string NewickParser::read_quoted_label(std::string_view& input) {
    std::string label;
    std::size_t pos = 1;  // past the opening quote

    while (pos < input.size()) {
        if (input[pos] == '\'') {
            if (pos + 1 < input.size() && input[pos + 1] == '\'') {
                label += '\'';
                pos += 2;
                continue;
            }
            input.remove_prefix(pos + 1);
            return label;
        }
        label += input[pos];
        ++pos;
    }
    throw error_here("Unterminated quoted label");
}

double NewickParser::parse_branch_length(const std::string& token) const {
    double length = 0.0;
    std::size_t consumed = 0;
    try {
        length = std::stod(token, &consumed);
    } catch (const std::exception&) {
        throw error_here("Invalid branch length: " + token);
    }
    if (consumed != token.size() || !std::isfinite(length)) {
        throw error_here("Invalid branch length: " + token);
    }
    if (length < 0.0) {
        throw error_here("Negative branch length: " + token);
    }
    return length;
}

ParseError NewickParser::error_here(const std::string& message) const {
    return ParseError(message + " (at offset " + std::to_string(offset_) + ")");
}

} // namespace phylomorph
