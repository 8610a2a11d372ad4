#pragma once

#include "IDeviceProber.hpp"

#include <memory>
#include <vector>

namespace network
{

/// Runs a chain of probers against one address, stopping at the first that
/// recognizes a device. The timeout is split evenly across the chain so a
/// dead host costs no more than one probe budget.
class CompositeProber : public IDeviceProber
{
public:
    explicit CompositeProber(std::vector<std::shared_ptr<IDeviceProber>> probers);

    const char* name() const override { return "composite"; }
    ProbeResult probe(Ipv4Address address, const DeviceFilter& filter, std::chrono::milliseconds timeout) override;

    std::size_t size() const { return probers_.size(); }

private:
    std::vector<std::shared_ptr<IDeviceProber>> probers_;
};

} // namespace network
