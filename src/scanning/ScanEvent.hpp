#pragma once

#include "../network/IDeviceProber.hpp"

#include <cstdint>
#include <string>
#include <variant>

namespace scanning
{

struct AddressProbed
{
    std::string group;
    network::Ipv4Address address;
    network::ProbeResult outcome;
};

struct GroupProgress
{
    std::string group;
    std::uint64_t probed = 0;
    std::uint64_t total = 0;
};

struct GroupCompleted
{
    std::string group;
};

struct SessionCompleted
{
};

// Terminal event used instead of SessionCompleted once the scan was cancelled
struct SessionCancelled
{
};

using ScanEvent = std::variant<AddressProbed, GroupProgress, GroupCompleted, SessionCompleted, SessionCancelled>;

inline bool isTerminal(const ScanEvent& ev)
{
    return std::holds_alternative<SessionCompleted>(ev) || std::holds_alternative<SessionCancelled>(ev);
}

} // namespace scanning
