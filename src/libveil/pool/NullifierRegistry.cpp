#include <libveil/pool/NullifierRegistry.h>

namespace veil {

Expected<void>
NullifierRegistry::consume(uint256 const& nullifier)
{
    if (!spent_.insert(nullifier).second)
        return Unexpected(Code::nullifierUsed);
    return {};
}

}  // namespace veil
