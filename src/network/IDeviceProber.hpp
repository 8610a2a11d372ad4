#pragma once

#include "DeviceInfo.hpp"
#include "Ipv4Address.hpp"

#include <chrono>
#include <memory>
#include <utility>
#include <string>
#include <vector>

struct ScannerSettings;

namespace network
{

enum class ProbeStatus
{
    Found,
    NoDevice,  // nothing answered, or the answer was not a miner
    Filtered,  // a miner answered but did not pass the DeviceFilter
    Timeout,
    Transport, // socket / HTTP level failure other than timeout
    Protocol   // a peer answered with something we could not decode
};

const char* probeStatusName(ProbeStatus status);

struct ProbeResult
{
    ProbeStatus status = ProbeStatus::NoDevice;
    DeviceSnapshot device; // valid when status == Found
    std::string error;     // human readable cause for every other status

    bool found() const { return status == ProbeStatus::Found; }

    static ProbeResult success(DeviceSnapshot snapshot)
    {
        ProbeResult r;
        r.status = ProbeStatus::Found;
        r.device = std::move(snapshot);
        return r;
    }

    static ProbeResult failure(ProbeStatus status, std::string message)
    {
        ProbeResult r;
        r.status = status;
        r.error = std::move(message);
        return r;
    }
};

/// Identifies and summarizes the device at one address.
///
/// Implementations are called concurrently from worker threads and must be
/// thread-safe. They must return within roughly `timeout`; the scan pool
/// relies on that to bound how long a dead host occupies a probe slot.
class IDeviceProber
{
public:
    virtual ~IDeviceProber() = default;
    virtual const char* name() const = 0;
    virtual ProbeResult probe(Ipv4Address address, const DeviceFilter& filter, std::chrono::milliseconds timeout) = 0;
};

// Build the prober chain named by settings.probers ("cgminer", "axeos").
// Unknown names are skipped with a warning; an empty list yields both.
std::shared_ptr<IDeviceProber> createProber(const ScannerSettings& settings);

} // namespace network
