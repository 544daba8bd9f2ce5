#include <libveil/pool/MerkleAccumulator.h>

#include <libveil/crypto/Hash.h>

#include <xrpl/basics/contract.h>

#include <stdexcept>
#include <string>
#include <utility>

namespace veil {

MerkleAccumulator::MerkleAccumulator(std::size_t depth) : depth_(depth)
{
    if (depth == 0 || depth > MAX_DEPTH)
        ripple::Throw<std::invalid_argument>(
            "Merkle depth must be in [1, " + std::to_string(MAX_DEPTH) +
            "], got " + std::to_string(depth));

    nodes_.resize(depth_ + 1);
    empty_hashes_ = makeEmptyHashes(depth_);
    root_ = empty_hashes_[depth_];
}

std::vector<uint256>
MerkleAccumulator::makeEmptyHashes(std::size_t depth)
{
    std::vector<uint256> empty(depth + 1);

    // Level 0 (leaves): zero is the canonical empty leaf
    empty[0] = uint256{};
    for (std::size_t i = 1; i <= depth; ++i)
        empty[i] = hashPair(empty[i - 1], empty[i - 1]);

    return empty;
}

std::size_t
MerkleAccumulator::append(uint256 const& leaf)
{
    if (full())
        ripple::Throw<std::overflow_error>("Merkle tree is full");

    std::size_t const position = next_position_;

    uint256 current = leaf;
    std::size_t index = position;
    nodes_[0][index] = current;

    for (std::size_t level = 0; level < depth_; ++level)
    {
        if (index & 1)
            current = hashPair(node(level, index - 1), current);
        else
            current = hashPair(current, node(level, index + 1));

        index >>= 1;
        nodes_[level + 1][index] = current;
    }

    root_ = current;
    ++next_position_;
    return position;
}

uint256
MerkleAccumulator::leaf(std::size_t position) const
{
    if (position >= next_position_)
        ripple::Throw<std::out_of_range>("Position not in tree");
    return nodes_[0].at(position);
}

uint256
MerkleAccumulator::node(std::size_t level, std::size_t index) const
{
    if (level > depth_)
        ripple::Throw<std::out_of_range>("Level above root");

    auto const& row = nodes_[level];
    if (auto const it = row.find(index); it != row.end())
        return it->second;
    return empty_hashes_[level];
}

std::vector<uint256>
MerkleAccumulator::authPath(std::size_t position) const
{
    if (position >= next_position_)
        ripple::Throw<std::out_of_range>("Position not in tree");

    std::vector<uint256> path;
    path.reserve(depth_);

    std::size_t index = position;
    for (std::size_t level = 0; level < depth_; ++level)
    {
        path.push_back(node(level, index ^ 1));
        index >>= 1;
    }

    return path;
}

bool
MerkleAccumulator::verify(
    uint256 const& leaf,
    std::vector<uint256> const& path,
    std::size_t position,
    uint256 const& expectedRoot)
{
    uint256 current = leaf;
    std::size_t index = position;

    for (auto const& sibling : path)
    {
        if (index & 1)
            current = hashPair(sibling, current);
        else
            current = hashPair(current, sibling);
        index >>= 1;
    }

    // Position must fit within the path's depth
    return index == 0 && current == expectedRoot;
}

uint256
MerkleAccumulator::computeRoot(
    std::vector<uint256> const& leaves,
    std::size_t depth)
{
    if (depth == 0 || depth > MAX_DEPTH)
        ripple::Throw<std::invalid_argument>("Merkle depth out of range");
    if (leaves.size() > (std::size_t{1} << depth))
        ripple::Throw<std::invalid_argument>("Too many leaves for depth");

    auto const empty = makeEmptyHashes(depth);
    std::vector<uint256> level = leaves;

    for (std::size_t l = 0; l < depth; ++l)
    {
        if (level.empty())
            return empty[depth];

        std::vector<uint256> next;
        next.reserve((level.size() + 1) / 2);

        for (std::size_t i = 0; i < level.size(); i += 2)
        {
            uint256 const& right =
                (i + 1 < level.size()) ? level[i + 1] : empty[l];
            next.push_back(hashPair(level[i], right));
        }

        level = std::move(next);
    }

    return level.empty() ? empty[depth] : level[0];
}

}  // namespace veil
