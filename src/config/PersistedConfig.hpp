#pragma once

#include "../network/AddressRange.hpp"
#include "../network/DeviceInfo.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace config
{

/// A named set of address ranges scanned together.
struct ScanGroup
{
    std::string name;
    std::string ranges; // comma separated range specs as the user typed them
    bool enabled = true;
    network::DeviceFilter filter;

    bool parseRanges(std::vector<network::AddressRange>& out, network::ParseError& outError) const
    {
        return network::AddressRange::parseList(ranges, out, outError);
    }

    bool operator==(const ScanGroup& other) const = default;
};

/// What the last scan of a group found.
struct GroupResults
{
    std::vector<network::DiscoveredDevice> devices; // ascending IP, unique IPs
    std::optional<std::int64_t> last_scan;           // unix seconds; unset when never fully scanned
    bool partial = false;                            // last scan was cut short by cancellation

    bool operator==(const GroupResults& other) const = default;
};

/// Durable state written to btc_toolkit_config.json. Treated as a value:
/// the merger and the group editor produce new instances.
struct PersistedConfig
{
    static constexpr int kCurrentVersion = 1;

    int version = kCurrentVersion;
    std::vector<ScanGroup> groups;
    std::map<std::string, GroupResults> results; // keyed by group name

    const ScanGroup* findGroup(const std::string& name) const;
    const GroupResults* findResults(const std::string& name) const;

    std::vector<std::string> enabledGroupNames() const;

    // Single "Default" group covering 192.168.1.0/24
    static PersistedConfig makeDefault();

    bool operator==(const PersistedConfig& other) const = default;
};

} // namespace config
