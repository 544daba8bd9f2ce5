#pragma once

#include <libveil/basics/Code.h>
#include <libveil/basics/Types.h>

#include <cstddef>
#include <set>

namespace veil {

/** Set of spent nullifiers. Entries are never removed. */
class NullifierRegistry
{
public:
    bool
    contains(uint256 const& nullifier) const
    {
        return spent_.find(nullifier) != spent_.end();
    }

    /** Mark a nullifier spent; fails with nullifierUsed if it already is. */
    Expected<void> consume(uint256 const& nullifier);

    std::size_t
    size() const
    {
        return spent_.size();
    }

private:
    std::set<uint256> spent_;
};

}  // namespace veil
