#ifndef PHYLOMORPH_TREE_LEAF_INDEX_HPP
#define PHYLOMORPH_TREE_LEAF_INDEX_HPP

/**
 * @file leaf_index.hpp
 * @brief Canonical leaf order shared by every tree of a sequence.
 *
 * The LeafIndex assigns each taxon name a dense LeafId. Trees are encoded
 * against it (leaf names replaced by indices) for all structural work and
 * reified (names restored) only when they are handed back to the caller.
 */

#include "phylomorph/core/types.hpp"
#include "phylomorph/tree/phylo_tree.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace phylomorph {

/**
 * @class LeafIndex
 * @brief Bijection between taxon names and LeafIds.
 */
class LeafIndex {
public:
    LeafIndex() = default;

    /**
     * @brief Index names in the given order.
     * @throws std::invalid_argument on a duplicate or empty name.
     */
    explicit LeafIndex(std::vector<std::string> names);

    /**
     * @brief Index the leaves of a tree in document order.
     * @throws std::invalid_argument if the tree repeats a leaf name.
     */
    [[nodiscard]] static LeafIndex from_tree(const PhyloTree& tree);

    /**
     * @brief Index the leaves of a tree using a caller-preferred order.
     *
     * The preferred order is used only if it names exactly the tree's leaves.
     * Otherwise a warning naming the differences is reported and the tree's
     * document order is used.
     */
    [[nodiscard]] static LeafIndex with_preferred_order(
        const PhyloTree& tree, const std::vector<std::string>& preferred,
        const WarningCallback& warn);

    [[nodiscard]] std::size_t size() const noexcept { return names_.size(); }
    [[nodiscard]] bool empty() const noexcept { return names_.empty(); }
    [[nodiscard]] const std::vector<std::string>& names() const noexcept { return names_; }

    /**
     * @brief Name of a leaf id.
     * @throws std::out_of_range for an unknown id.
     */
    [[nodiscard]] const std::string& name(LeafId id) const;

    [[nodiscard]] std::optional<LeafId> find(const std::string& name) const;

    /**
     * @brief Names of the given ids, in the given order.
     */
    [[nodiscard]] std::vector<std::string> names_of(const std::vector<LeafId>& ids) const;

    /**
     * @brief Whether a named tree has exactly this leaf set, each leaf once.
     */
    [[nodiscard]] bool matches(const PhyloTree& tree) const;

    /**
     * @brief Replace every leaf name by its index.
     * @throws std::invalid_argument on an unknown or repeated leaf name.
     */
    void encode(PhyloTree& tree) const;

    /**
     * @brief Restore every leaf name from its index.
     * @throws std::invalid_argument on an unindexed leaf.
     */
    void reify(PhyloTree& tree) const;

    /** @brief Reified copy; the argument is left encoded. */
    [[nodiscard]] PhyloTree reified(const PhyloTree& tree) const;

private:
    std::vector<std::string> names_;
    std::map<std::string, LeafId> ids_;
};

} // namespace phylomorph

#endif // PHYLOMORPH_TREE_LEAF_INDEX_HPP
