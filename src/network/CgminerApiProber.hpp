#pragma once

#include "IDeviceProber.hpp"

#include <string>

namespace network
{

/// Queries the CGMiner-compatible JSON API (TCP 4028) spoken by stock
/// Antminer/Whatsminer/Avalon firmware and by most aftermarket firmwares.
/// Sends {"command":"version+summary+stats"} and reads one reply.
class CgminerApiProber : public IDeviceProber
{
public:
    static constexpr int kDefaultPort = 4028;

    explicit CgminerApiProber(int port = kDefaultPort);

    const char* name() const override { return "cgminer"; }
    ProbeResult probe(Ipv4Address address, const DeviceFilter& filter, std::chrono::milliseconds timeout) override;

    // Decode a raw API reply into a snapshot. Returns Found, NoDevice or Protocol.
    static ProbeResult parseResponse(const std::string& payload);

private:
    int port_;
};

} // namespace network
