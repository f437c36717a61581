#include "phylomorph/tree/leaf_index.hpp"

#include <algorithm>
#include <iterator>
#include <set>
#include <stdexcept>
#include <utility>
#include <variant>

namespace phylomorph {

namespace {

std::string join_names(const std::vector<std::string>& names) {
    std::string joined;
    for (const auto& name : names) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += name;
    }
    return joined;
}

} // anonymous namespace

LeafIndex::LeafIndex(std::vector<std::string> names)
    : names_(std::move(names)) {
    for (std::size_t i = 0; i < names_.size(); ++i) {
        if (names_[i].empty()) {
            throw std::invalid_argument("Leaf at position " + std::to_string(i) +
                                        " has no name");
        }
        const auto [it, inserted] = ids_.emplace(names_[i], static_cast<LeafId>(i));
        if (!inserted) {
            throw std::invalid_argument("Duplicate leaf name: " + names_[i]);
        }
    }
}

LeafIndex LeafIndex::from_tree(const PhyloTree& tree) {
    return LeafIndex(tree.leaf_names());
}

LeafIndex LeafIndex::with_preferred_order(const PhyloTree& tree,
                                          const std::vector<std::string>& preferred,
                                          const WarningCallback& warn) {
    LeafIndex parsed = from_tree(tree);
    if (preferred.empty()) {
        return parsed;
    }

    const std::set<std::string> preferred_set(preferred.begin(), preferred.end());
    const std::set<std::string> parsed_set(parsed.names_.begin(), parsed.names_.end());

    if (preferred_set == parsed_set && preferred_set.size() == preferred.size()) {
        return LeafIndex(preferred);
    }

    if (warn) {
        std::vector<std::string> missing;
        std::vector<std::string> unknown;
        std::set_difference(parsed_set.begin(), parsed_set.end(),
                            preferred_set.begin(), preferred_set.end(),
                            std::back_inserter(missing));
        std::set_difference(preferred_set.begin(), preferred_set.end(),
                            parsed_set.begin(), parsed_set.end(),
                            std::back_inserter(unknown));

        std::string message = "Leaf order does not match the trees; using tree order.";
        if (!missing.empty()) {
            message += " Missing: " + join_names(missing) + ".";
        }
        if (!unknown.empty()) {
            message += " Unknown: " + join_names(unknown) + ".";
        }
        if (missing.empty() && unknown.empty()) {
            message += " Leaf order repeats a name.";
        }
        warn(message);
    }
    return parsed;
}

const std::string& LeafIndex::name(LeafId id) const {
    if (id >= names_.size()) {
        throw std::out_of_range("Unknown leaf id " + std::to_string(id));
    }
    return names_[id];
}

std::optional<LeafId> LeafIndex::find(const std::string& name) const {
    const auto it = ids_.find(name);
    if (it == ids_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> LeafIndex::names_of(const std::vector<LeafId>& ids) const {
    std::vector<std::string> result;
    result.reserve(ids.size());
    for (LeafId id : ids) {
        result.push_back(name(id));
    }
    return result;
}

bool LeafIndex::matches(const PhyloTree& tree) const {
    const auto leaf_names = tree.leaf_names();
    if (leaf_names.size() != names_.size()) {
        return false;
    }
    std::set<std::string> seen;
    for (const auto& leaf_name : leaf_names) {
        if (ids_.count(leaf_name) == 0 || !seen.insert(leaf_name).second) {
            return false;
        }
    }
    return true;
}

void LeafIndex::encode(PhyloTree& tree) const {
    std::vector<bool> seen(names_.size(), false);
    for (NodeId id : tree.leaves()) {
        auto& leaf = std::get<LeafNode>(tree.mutable_node(id));
        const auto found = find(leaf.name);
        if (!found) {
            throw std::invalid_argument("Leaf '" + leaf.name +
                                        "' is not in the leaf index");
        }
        if (seen[*found]) {
            throw std::invalid_argument("Leaf '" + leaf.name +
                                        "' appears twice in one tree");
        }
        seen[*found] = true;
        leaf.index = *found;
        leaf.name.clear();
    }
}

void LeafIndex::reify(PhyloTree& tree) const {
    for (NodeId id : tree.leaves()) {
        auto& leaf = std::get<LeafNode>(tree.mutable_node(id));
        if (leaf.index == kUnindexedLeaf) {
            throw std::invalid_argument("Cannot reify an unindexed leaf");
        }
        leaf.name = name(leaf.index);
    }
}

PhyloTree LeafIndex::reified(const PhyloTree& tree) const {
    PhyloTree copy = tree;
    reify(copy);
    return copy;
}

} // namespace phylomorph
