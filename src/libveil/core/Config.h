#pragma once

#include <libveil/pool/AnonymityPool.h>

#include <xrpl/basics/BasicConfig.h>
#include <xrpl/beast/utility/Journal.h>

#include <string>

namespace veil {

/**
 * INI configuration.
 *
 *   [pool]       tree_depth, tier_small, tier_medium, tier_large
 *   [verifier]   membership_key, claim_key   (verification key files)
 *   [logging]    severity   (trace, debug, info, warning, error, fatal)
 *
 * Lines starting with '#' are comments. Keys missing from a section take
 * their defaults.
 */
class Config : public ripple::BasicConfig
{
public:
    void
    loadFromString(std::string const& text);

    /** Throws std::runtime_error if the file cannot be read. */
    void
    loadFromFile(std::string const& path);
};

struct VerifierKeys
{
    std::string membershipKey;
    std::string claimKey;
};

PoolParams
setup_PoolParams(Config const& config);

VerifierKeys
setup_VerifierKeys(Config const& config);

beast::severities::Severity
setup_LogSeverity(Config const& config);

}  // namespace veil
