#include <libveil/core/Config.h>

#include <xrpl/basics/Log.h>
#include <xrpl/basics/contract.h>
#include <xrpl/beast/core/LexicalCast.h>

#include <boost/algorithm/string/trim.hpp>

#include <cstdint>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace veil {

namespace {

ripple::IniFileSections
parseIni(std::string const& text)
{
    ripple::IniFileSections sections;
    std::string section;

    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line))
    {
        boost::algorithm::trim(line);
        if (line.empty() || line[0] == '#')
            continue;

        if (line.front() == '[' && line.back() == ']')
        {
            section = line.substr(1, line.size() - 2);
            sections[section];
            continue;
        }

        sections[section].push_back(line);
    }

    return sections;
}

std::uint64_t
readNumber(
    ripple::Section const& section,
    std::string const& key,
    std::uint64_t fallback)
{
    std::string value;
    if (!ripple::set(value, key, section))
        return fallback;

    // A leading minus would wrap to a huge unsigned value.
    std::uint64_t n = 0;
    if (value.empty() || value.front() == '-' ||
        !beast::lexicalCastChecked(n, value))
        ripple::Throw<std::runtime_error>(
            "Invalid number for [" + section.name() + "] " + key + ": " +
            value);
    return n;
}

}  // namespace

void
Config::loadFromString(std::string const& text)
{
    build(parseIni(text));
}

void
Config::loadFromFile(std::string const& path)
{
    std::ifstream file(path);
    if (!file.good())
        ripple::Throw<std::runtime_error>("Cannot open config file: " + path);

    std::string const text(
        (std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    loadFromString(text);
}

PoolParams
setup_PoolParams(Config const& config)
{
    PoolParams params;
    auto const& section = config.section("pool");

    params.treeDepth = readNumber(section, "tree_depth", params.treeDepth);
    if (params.treeDepth == 0 ||
        params.treeDepth > MerkleAccumulator::MAX_DEPTH)
        ripple::Throw<std::runtime_error>(
            "[pool] tree_depth must be between 1 and " +
            std::to_string(MerkleAccumulator::MAX_DEPTH));

    char const* const keys[NUM_TIERS] = {
        "tier_small", "tier_medium", "tier_large"};
    for (std::size_t i = 0; i < NUM_TIERS; ++i)
    {
        params.tierAmounts[i] =
            readNumber(section, keys[i], params.tierAmounts[i]);
        if (params.tierAmounts[i] == 0)
            ripple::Throw<std::runtime_error>(
                std::string("[pool] ") + keys[i] + " must be positive");
        if (!stakesFit(params.tierAmounts[i], params.treeDepth))
            ripple::Throw<std::runtime_error>(
                std::string("[pool] ") + keys[i] +
                " is too large for tree_depth " +
                std::to_string(params.treeDepth));
        if (i > 0 && params.tierAmounts[i] <= params.tierAmounts[i - 1])
            ripple::Throw<std::runtime_error>(
                "[pool] tier amounts must increase from small to large");
    }

    return params;
}

VerifierKeys
setup_VerifierKeys(Config const& config)
{
    VerifierKeys keys;
    auto const& section = config.section("verifier");
    ripple::set(keys.membershipKey, "membership_key", section);
    ripple::set(keys.claimKey, "claim_key", section);
    return keys;
}

beast::severities::Severity
setup_LogSeverity(Config const& config)
{
    std::string name = "info";
    ripple::set(name, "severity", config.section("logging"));

    auto const severity = ripple::Logs::fromString(name);
    if (severity == ripple::lsINVALID)
        ripple::Throw<std::runtime_error>(
            "[logging] unknown severity: " + name);

    return ripple::Logs::toSeverity(severity);
}

}  // namespace veil
