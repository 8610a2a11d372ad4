#pragma once

#include "IDeviceProber.hpp"

#include <string>

namespace network
{

/// Probes the AxeOS HTTP API served by Bitaxe-family boards
/// (GET http://<ip>/api/system/info).
class AxeOsProber : public IDeviceProber
{
public:
    const char* name() const override { return "axeos"; }
    ProbeResult probe(Ipv4Address address, const DeviceFilter& filter, std::chrono::milliseconds timeout) override;

    // Decode a /api/system/info body. Returns Found, NoDevice or Protocol.
    static ProbeResult parseSystemInfo(const std::string& body);
};

} // namespace network
