#include "phylomorph/io/newick_writer.hpp"

#include <charconv>
#include <fstream>
#include <stdexcept>
#include <utility>
#include <variant>

namespace phylomorph {

namespace {

std::ofstream open_for_writing(const std::string& filename) {
    std::ofstream file(filename);
    if (!file) {
        throw std::runtime_error("Cannot open file for writing: " + filename);
    }
    return file;
}

void write_series(std::ostream& os, const char* label, const std::vector<double>& series) {
    os << label;
    for (double value : series) {
        os << '\t' << format_length(value);
    }
    os << '\n';
}

} // anonymous namespace

std::string format_length(double length) {
    char buffer[32];
    const auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), length);
    if (ec != std::errc()) {
        throw std::runtime_error("Cannot format branch length");
    }
    return std::string(buffer, end);
}

std::string quote_label(const std::string& label) {
    bool needs_quotes = false;
    for (char c : label) {
        if (c == '(' || c == ')' || c == ',' || c == ':' || c == ';' ||
            c == '[' || c == ']' || c == '\'' || c == ' ' || c == '\t' ||
            c == '\n' || c == '\r') {
            needs_quotes = true;
            break;
        }
    }
    if (!needs_quotes) {
        return label;
    }

    std::string quoted = "'";
    for (char c : label) {
        if (c == '\'') {
            quoted += '\'';
        }
        quoted += c;
    }
    return quoted + "'";
}

std::string to_newick(const PhyloTree& tree) {
    if (tree.empty()) {
        return ";";
    }

    std::string out;

    // Each frame holds a node and the index of the next child to write
    std::vector<std::pair<NodeId, std::size_t>> stack;
    stack.emplace_back(tree.root(), 0);

    while (!stack.empty()) {
        const NodeId id = stack.back().first;
        const std::size_t next = stack.back().second;
        const auto& kids = tree.children(id);

        if (next < kids.size()) {
            out += next == 0 ? '(' : ',';
            ++stack.back().second;
            stack.emplace_back(kids[next], 0);
            continue;
        }

        if (!kids.empty()) {
            out += ')';
        }
        const TreeNode& node = tree.node(id);
        const auto* leaf = std::get_if<LeafNode>(&node);
        if (leaf && leaf->name.empty() && leaf->index != kUnindexedLeaf) {
            out += std::to_string(leaf->index);
        } else {
            out += quote_label(node_name(node));
        }
        out += ':';
        out += format_length(node_length(node));
        stack.pop_back();
    }

    out += ';';
    return out;
}

void write_newick(std::ostream& os, const PhyloTree& tree) {
    os << to_newick(tree) << '\n';
}

void write_frames(std::ostream& os, const std::vector<PhyloTree>& frames) {
    for (const auto& frame : frames) {
        write_newick(os, frame);
    }
}

void write_jumping_taxa(std::ostream& os, const std::vector<JumpTaxaResult>& results) {
    for (std::size_t i = 0; i < results.size(); ++i) {
        os << (i + 1) << '\t';
        const auto& taxa = results[i].taxa;
        for (std::size_t j = 0; j < taxa.size(); ++j) {
            if (j > 0) {
                os << ',';
            }
            os << taxa[j];
        }
        os << '\t' << to_string(results[i].status) << '\n';
    }
}

void write_distances(std::ostream& os, const DistanceReport& report) {
    write_series(os, "rf", report.robinson_foulds);
    write_series(os, "wrf", report.weighted_robinson_foulds);
    os << "matrix\n";
    for (const auto& row : report.matrix) {
        for (std::size_t j = 0; j < row.size(); ++j) {
            if (j > 0) {
                os << '\t';
            }
            os << format_length(row[j]);
        }
        os << '\n';
    }
}

void write_frames_file(const std::string& filename, const std::vector<PhyloTree>& frames) {
    auto file = open_for_writing(filename);
    write_frames(file, frames);
}

void write_jumping_taxa_file(const std::string& filename,
                             const std::vector<JumpTaxaResult>& results) {
    auto file = open_for_writing(filename);
    write_jumping_taxa(file, results);
}

void write_distances_file(const std::string& filename, const DistanceReport& report) {
    auto file = open_for_writing(filename);
    write_distances(file, report);
}

} // namespace phylomorph
