#include "phylomorph/io/tree_reader.hpp"

#include "phylomorph/io/nexus_reader.hpp"
#include "phylomorph/tree/leaf_index.hpp"
#include "phylomorph/tree/tree_parser.hpp"

#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace phylomorph {

namespace {

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

std::vector<std::string_view> non_blank_lines(std::string_view text) {
    std::vector<std::string_view> lines;
    while (!text.empty()) {
        const auto newline = text.find('\n');
        std::string_view line = trim(text.substr(0, newline));
        if (!line.empty()) {
            lines.push_back(line);
        }
        if (newline == std::string_view::npos) {
            break;
        }
        text.remove_prefix(newline + 1);
    }
    return lines;
}

std::string read_whole_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + filename);
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

DecodeResult failure(std::string message) {
    DecodeResult result;
    result.error = std::move(message);
    return result;
}

} // anonymous namespace

std::vector<std::size_t> select_tree_indices(std::size_t count, const ReadOptions& options) {
    std::vector<std::size_t> indices;
    if (count == 0) {
        return indices;
    }

    const std::size_t step = options.step == 0 ? 1 : options.step;
    const std::size_t first = options.start == 0 ? 0 : options.start - 1;
    for (std::size_t i = first; i < count; i += step) {
        indices.push_back(i);
    }
    if (indices.empty() || indices.back() != count - 1) {
        indices.push_back(count - 1);
    }
    return indices;
}

DecodeResult read_trees_string(std::string_view text, const ReadOptions& options) {
    DecodeResult result;
    NewickParser parser;

    try {
        if (is_nexus(text)) {
            const NexusDocument document = read_nexus(text);
            for (std::size_t i : select_tree_indices(document.trees.size(), options)) {
                PhyloTree tree = parser.parse(document.trees[i].newick);
                apply_translation(tree, document.translate);
                result.trees.push_back(std::move(tree));
            }
        } else {
            const auto lines = non_blank_lines(text);
            for (std::size_t i : select_tree_indices(lines.size(), options)) {
                try {
                    result.trees.push_back(parser.parse(lines[i]));
                } catch (const ParseError& e) {
                    return failure("Line " + std::to_string(i + 1) + ": " + e.what());
                }
            }
        }
    } catch (const ParseError& e) {
        return failure(e.what());
    }

    if (result.trees.empty()) {
        return failure("No trees found");
    }

    // Every tree must carry the first tree's leaf set, each leaf once
    LeafIndex index;
    try {
        index = LeafIndex::from_tree(result.trees.front());
    } catch (const std::invalid_argument& e) {
        return failure(std::string("Tree 1: ") + e.what());
    }
    for (std::size_t i = 1; i < result.trees.size(); ++i) {
        if (!index.matches(result.trees[i])) {
            return failure("Tree " + std::to_string(i + 1) +
                           " does not have the same leaf set as tree 1");
        }
    }
    return result;
}

DecodeResult read_trees_file(const std::string& filename, const ReadOptions& options) {
    std::string text;
    try {
        text = read_whole_file(filename);
    } catch (const std::runtime_error& e) {
        return failure(e.what());
    }
    return read_trees_string(text, options);
}

std::vector<std::string> parse_leaf_order(std::string_view text) {
    std::vector<std::string> names;
    for (std::string_view line : non_blank_lines(text)) {
        names.emplace_back(line);
    }
    return names;
}

std::vector<std::string> read_leaf_order_file(const std::string& filename) {
    return parse_leaf_order(read_whole_file(filename));
}

} // namespace phylomorph
