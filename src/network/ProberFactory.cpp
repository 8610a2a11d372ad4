#include "IDeviceProber.hpp"
#include "AxeOsProber.hpp"
#include "CgminerApiProber.hpp"
#include "CompositeProber.hpp"

#include "../state/ScannerSettings.hpp"

#include <plog/Log.h>

namespace network
{

const char* probeStatusName(ProbeStatus status)
{
    switch (status)
    {
    case ProbeStatus::Found:
        return "found";
    case ProbeStatus::NoDevice:
        return "no device";
    case ProbeStatus::Filtered:
        return "filtered";
    case ProbeStatus::Timeout:
        return "timeout";
    case ProbeStatus::Transport:
        return "transport error";
    case ProbeStatus::Protocol:
        return "protocol error";
    }
    return "unknown";
}

std::shared_ptr<IDeviceProber> createProber(const ScannerSettings& settings)
{
    std::vector<std::shared_ptr<IDeviceProber>> chain;
    for (const auto& name : settings.probers)
    {
        if (name == "cgminer")
            chain.push_back(std::make_shared<CgminerApiProber>(settings.cgminer_port));
        else if (name == "axeos")
            chain.push_back(std::make_shared<AxeOsProber>());
        else
            PLOG_WARNING << "Unknown prober '" << name << "' in [scanner].probers, skipping";
    }
    if (chain.empty())
    {
        chain.push_back(std::make_shared<CgminerApiProber>(settings.cgminer_port));
        chain.push_back(std::make_shared<AxeOsProber>());
    }
    if (chain.size() == 1)
        return chain.front();
    return std::make_shared<CompositeProber>(std::move(chain));
}

} // namespace network
