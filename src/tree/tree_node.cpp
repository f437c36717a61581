#include "phylomorph/tree/tree_node.hpp"

namespace phylomorph {

namespace {

const std::vector<NodeId> kNoChildren;

} // anonymous namespace

const std::string& node_name(const TreeNode& node) noexcept {
    return std::visit([](const auto& n) -> const std::string& { return n.name; }, node);
}

double node_length(const TreeNode& node) noexcept {
    return std::visit([](const auto& n) { return n.length; }, node);
}

void set_node_length(TreeNode& node, double length) noexcept {
    std::visit([length](auto& n) { n.length = length; }, node);
}

const std::vector<NodeId>& node_children(const TreeNode& node) noexcept {
    if (const auto* internal = std::get_if<InternalNode>(&node)) {
        return internal->children;
    }
    return kNoChildren;
}

} // namespace phylomorph
