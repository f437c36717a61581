#include "phylomorph/io/nexus_reader.hpp"

#include <cctype>
#include <utility>
#include <variant>

namespace phylomorph {

namespace {

std::string to_lower(std::string_view text) {
    std::string lowered(text);
    for (char& c : lowered) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return lowered;
}

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

/**
 * Split on a separator that appears outside single quotes.
 */
std::vector<std::string_view> split_unquoted(std::string_view text, char separator) {
    std::vector<std::string_view> parts;
    bool quoted = false;
    std::size_t begin = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\'') {
            quoted = !quoted;
        } else if (text[i] == separator && !quoted) {
            parts.push_back(text.substr(begin, i - begin));
            begin = i + 1;
        }
    }
    parts.push_back(text.substr(begin));
    return parts;
}

/**
 * Whitespace-separated words; quoted words are unquoted ('' -> ').
 */
std::vector<std::string> split_words(std::string_view text) {
    std::vector<std::string> words;
    std::size_t i = 0;
    while (i < text.size()) {
        if (std::isspace(static_cast<unsigned char>(text[i]))) {
            ++i;
            continue;
        }
        std::string word;
        if (text[i] == '\'') {
            ++i;
            while (i < text.size()) {
                if (text[i] == '\'') {
                    if (i + 1 < text.size() && text[i + 1] == '\'') {
                        word += '\'';
                        i += 2;
                        continue;
                    }
                    ++i;
                    break;
                }
                word += text[i++];
            }
        } else {
            while (i < text.size() && !std::isspace(static_cast<unsigned char>(text[i]))) {
                word += text[i++];
            }
        }
        words.push_back(std::move(word));
    }
    return words;
}

std::string first_word_lower(std::string_view statement) {
    std::size_t end = 0;
    while (end < statement.size() &&
           !std::isspace(static_cast<unsigned char>(statement[end]))) {
        ++end;
    }
    return to_lower(statement.substr(0, end));
}

void read_translate(std::string_view body, NexusDocument& document) {
    for (std::string_view entry : split_unquoted(body, ',')) {
        entry = trim(entry);
        if (entry.empty()) {
            continue;
        }
        auto words = split_words(entry);
        if (words.size() != 2) {
            throw NexusError("Malformed TRANSLATE entry: " + std::string(entry));
        }
        document.translate[words[0]] = std::move(words[1]);
    }
}

NexusTree read_tree_statement(std::string_view statement) {
    const auto parts = split_unquoted(statement, '=');
    if (parts.size() < 2) {
        throw NexusError("TREE statement without '=': " + std::string(statement));
    }

    // Everything after the first '=' is the tree
    const std::size_t newick_begin = parts[0].size() + 1;
    std::string_view newick = trim(statement.substr(newick_begin));
    if (newick.empty()) {
        throw NexusError("TREE statement without a tree: " + std::string(statement));
    }

    auto words = split_words(parts[0]);
    NexusTree tree;
    if (words.size() >= 2) {
        tree.name = std::move(words[1]);
    }
    tree.newick = std::string(newick) + ";";
    return tree;
}

} // anonymous namespace

bool is_nexus(std::string_view text) {
    text = trim(text);
    return to_lower(text.substr(0, 6)) == "#nexus";
}

std::string strip_bracket_comments(std::string_view text) {
    std::string result;
    result.reserve(text.size());
    bool quoted = false;
    std::size_t depth = 0;

    for (char c : text) {
        if (depth > 0) {
            if (c == '[') {
                ++depth;
            } else if (c == ']') {
                --depth;
            }
            continue;
        }
        if (c == '\'') {
            quoted = !quoted;
        } else if (c == '[' && !quoted) {
            depth = 1;
            continue;
        }
        result += c;
    }

    if (depth > 0) {
        throw NexusError("Unterminated comment");
    }
    return result;
}

NexusDocument read_nexus(std::string_view text) {
    std::string stripped = strip_bracket_comments(text);

    // The #NEXUS marker is not terminated by ';'
    if (is_nexus(stripped)) {
        stripped.erase(0, stripped.find('#') + 6);
    }

    NexusDocument document;
    bool in_trees = false;
    bool found_trees = false;

    for (std::string_view statement : split_unquoted(stripped, ';')) {
        statement = trim(statement);
        if (statement.empty()) {
            continue;
        }
        const std::string keyword = first_word_lower(statement);

        if (!in_trees) {
            if (keyword == "begin") {
                const auto words = split_words(statement);
                if (words.size() >= 2 && to_lower(words[1]) == "trees") {
                    in_trees = true;
                    found_trees = true;
                }
            }
            continue;
        }

        if (keyword == "end" || keyword == "endblock") {
            in_trees = false;
            break;
        }
        if (keyword == "translate") {
            read_translate(statement.substr(keyword.size()), document);
        } else if (keyword == "tree" || keyword == "utree") {
            document.trees.push_back(read_tree_statement(statement));
        }
    }

    if (!found_trees) {
        throw NexusError("No TREES block found");
    }
    if (in_trees) {
        throw NexusError("TREES block is not closed by END");
    }
    if (document.trees.empty()) {
        throw NexusError("TREES block contains no trees");
    }
    return document;
}

void apply_translation(PhyloTree& tree, const std::map<std::string, std::string>& table) {
    if (table.empty()) {
        return;
    }
    for (NodeId id : tree.leaves()) {
        const auto it = table.find(tree.name(id));
        if (it != table.end()) {
            std::get<LeafNode>(tree.mutable_node(id)).name = it->second;
        }
    }
}

} // namespace phylomorph
