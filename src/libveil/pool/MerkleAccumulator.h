#pragma once

#include <libveil/basics/Types.h>

#include <cstddef>
#include <unordered_map>
#include <vector>

namespace veil {

/**
 * Append-only incremental Merkle tree of fixed depth.
 *
 * Nodes are kept in a flat (level, index) map: level 0 holds the leaves,
 * level depth holds the root. A position that was never written stands
 * for the empty subtree of its level, whose hash is precomputed once as
 * empty[0] = 0, empty[i] = hashPair(empty[i-1], empty[i-1]).
 *
 * append() rewrites exactly the depth ancestors of the new leaf, so the
 * stored nodes always equal those of a batch rebuild over the same
 * leaves (see computeRoot).
 */
class MerkleAccumulator
{
public:
    static constexpr std::size_t DEFAULT_DEPTH = 20;
    // Leaf counts and indices must fit in 32 bits.
    static constexpr std::size_t MAX_DEPTH = 31;

    explicit MerkleAccumulator(std::size_t depth = DEFAULT_DEPTH);

    /** Insert a leaf at the next free position and return that position.
        Throws std::overflow_error when the tree holds 2^depth leaves.
    */
    std::size_t
    append(uint256 const& leaf);

    uint256 const&
    root() const
    {
        return root_;
    }

    std::size_t
    size() const
    {
        return next_position_;
    }

    bool
    empty() const
    {
        return next_position_ == 0;
    }

    std::size_t
    depth() const
    {
        return depth_;
    }

    std::size_t
    capacity() const
    {
        return std::size_t{1} << depth_;
    }

    bool
    full() const
    {
        return next_position_ >= capacity();
    }

    /** Leaf at a filled position. Throws std::out_of_range otherwise. */
    uint256
    leaf(std::size_t position) const;

    /** Stored node, or the empty hash of its level if never written. */
    uint256
    node(std::size_t level, std::size_t index) const;

    uint256 const&
    emptyHash(std::size_t level) const
    {
        return empty_hashes_.at(level);
    }

    // Sibling hashes from the leaf level upwards, depth entries.
    std::vector<uint256>
    authPath(std::size_t position) const;

    static bool
    verify(
        uint256 const& leaf,
        std::vector<uint256> const& path,
        std::size_t position,
        uint256 const& expectedRoot);

    /** Root of a tree of the given depth built in one pass over leaves. */
    static uint256
    computeRoot(std::vector<uint256> const& leaves, std::size_t depth);

private:
    std::size_t depth_;
    std::size_t next_position_ = 0;

    // level -> index -> hash
    std::vector<std::unordered_map<std::size_t, uint256>> nodes_;
    std::vector<uint256> empty_hashes_;
    uint256 root_;

    static std::vector<uint256>
    makeEmptyHashes(std::size_t depth);
};

}  // namespace veil
