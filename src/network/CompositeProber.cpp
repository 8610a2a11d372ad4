#include "CompositeProber.hpp"

#include <algorithm>

namespace network
{

namespace
{

// Which failure to surface when no prober found anything
int failureRank(ProbeStatus status)
{
    switch (status)
    {
    case ProbeStatus::Protocol:
        return 3;
    case ProbeStatus::Timeout:
        return 2;
    case ProbeStatus::Transport:
        return 1;
    default:
        return 0;
    }
}

} // namespace

CompositeProber::CompositeProber(std::vector<std::shared_ptr<IDeviceProber>> probers)
    : probers_(std::move(probers))
{
    probers_.erase(std::remove(probers_.begin(), probers_.end(), nullptr), probers_.end());
}

ProbeResult CompositeProber::probe(Ipv4Address address, const DeviceFilter& filter, std::chrono::milliseconds timeout)
{
    if (probers_.empty())
        return ProbeResult::failure(ProbeStatus::NoDevice, "no probers configured");

    auto slice = timeout / static_cast<long>(probers_.size());
    if (slice < std::chrono::milliseconds(1))
        slice = std::chrono::milliseconds(1);

    ProbeResult worst = ProbeResult::failure(ProbeStatus::NoDevice, "no miner API answered");
    for (const auto& prober : probers_)
    {
        ProbeResult r = prober->probe(address, filter, slice);
        if (r.status == ProbeStatus::Found || r.status == ProbeStatus::Filtered)
            return r;
        if (failureRank(r.status) > failureRank(worst.status))
            worst = std::move(r);
    }
    return worst;
}

} // namespace network
