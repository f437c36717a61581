#ifndef PHYLOMORPH_CORE_TYPES_HPP
#define PHYLOMORPH_CORE_TYPES_HPP

/**
 * @file types.hpp
 * @brief Core type definitions for phylomorph.
 *
 * This header defines the fundamental vocabulary shared by the tree model,
 * the consensus synthesizer and the jump-taxon engine: leaf and node
 * identifiers, splits, components and the structural edge types.
 */

#include <cstdint>
#include <functional>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

namespace phylomorph {

/**
 * @brief Position of a leaf in the canonical leaf order.
 */
using LeafId = std::uint32_t;

/**
 * @brief Slot of a node inside a tree's node arena.
 */
using NodeId = std::uint32_t;

/** @brief Sentinel for "no node". */
inline constexpr NodeId kNoNode = std::numeric_limits<NodeId>::max();

/** @brief Sentinel for a leaf that has not been assigned a canonical index. */
inline constexpr LeafId kUnindexedLeaf = std::numeric_limits<LeafId>::max();

/**
 * @brief Sorted leaf indices below one edge.
 *
 * A split identifies an edge (and the node beneath it) across trees that
 * share a leaf set. Leaves are identified by the singleton {index}.
 */
using Split = std::vector<LeafId>;

/**
 * @brief Identity of one point of the tree inside an arm.
 *
 * A lengthed node is its own component; zero-length internal nodes dissolve
 * into the components of their children.
 */
using Component = Split;

/**
 * @brief Sorted list of components hanging below one child of an edge.
 */
using Arm = std::vector<Component>;

/**
 * @brief Branch length assigned when the input gives none.
 */
inline constexpr double kDefaultBranchLength = 1.0;

/**
 * @brief Pruning never reduces a tree pair below this many leaves.
 */
inline constexpr std::size_t kMinimumLeafCount = 4;

/**
 * @brief Number of synthesized trees inserted between two input trees.
 */
inline constexpr std::size_t kSynthesizedFramesPerPair = 4;

/**
 * @brief Distance between consecutive input trees in the frame sequence.
 */
inline constexpr std::size_t kFrameStride = kSynthesizedFramesPerPair + 1;

/**
 * @brief Structural type of an edge, derived from its own length and the
 * lengths of its children.
 */
enum class EdgeType : std::uint8_t {
    Leaf = 0,     ///< No children
    Full = 1,     ///< Own length > 0, every child length == 0
    Partial = 2,  ///< Own length > 0, some but not all child lengths == 0
    Anti = 3,     ///< Own length == 0, every child length > 0
    None = 4      ///< Anything else
};

/**
 * @brief Convert EdgeType to string for display.
 */
[[nodiscard]] constexpr std::string_view to_string(EdgeType type) {
    switch (type) {
        case EdgeType::Leaf: return "leaf";
        case EdgeType::Full: return "full";
        case EdgeType::Partial: return "partial";
        case EdgeType::Anti: return "anti";
        case EdgeType::None: return "none";
    }
    return "unknown";
}

/**
 * @brief Whether edges of this type take part in jump-taxon voting.
 */
[[nodiscard]] constexpr bool is_s_edge(EdgeType type) noexcept {
    return type == EdgeType::Full || type == EdgeType::Partial;
}

/**
 * @brief Role of a tree inside the animation frame sequence.
 */
enum class FrameKind : std::uint8_t {
    Original = 0,   ///< An input tree
    RampDown = 1,   ///< First tree's topology, unique edges zeroed
    CollapseA = 2,  ///< First tree's topology, unique edges removed
    CollapseB = 3,  ///< Second tree's topology, unique edges removed
    RampUp = 4      ///< Second tree's topology, unique edges zeroed
};

/**
 * @brief Convert FrameKind to string for display.
 */
[[nodiscard]] constexpr std::string_view to_string(FrameKind kind) {
    switch (kind) {
        case FrameKind::Original: return "original";
        case FrameKind::RampDown: return "ramp-down";
        case FrameKind::CollapseA: return "collapse-a";
        case FrameKind::CollapseB: return "collapse-b";
        case FrameKind::RampUp: return "ramp-up";
    }
    return "unknown";
}

/**
 * @brief Receiver for recoverable conditions reported by the library.
 */
using WarningCallback = std::function<void(const std::string&)>;

} // namespace phylomorph

#endif // PHYLOMORPH_CORE_TYPES_HPP
