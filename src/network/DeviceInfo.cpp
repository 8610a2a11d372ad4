#include "DeviceInfo.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace network
{

namespace
{

constexpr std::array<std::pair<MinerMake, const char*>, 5> kMakeNames{ {
    { MinerMake::AntMiner, "AntMiner" },
    { MinerMake::WhatsMiner, "WhatsMiner" },
    { MinerMake::AvalonMiner, "AvalonMiner" },
    { MinerMake::Bitaxe, "Bitaxe" },
    { MinerMake::Unknown, "Unknown" },
} };

constexpr std::array<std::pair<MinerFirmware, const char*>, 6> kFirmwareNames{ {
    { MinerFirmware::Stock, "Stock" },
    { MinerFirmware::BraiinsOS, "BraiinsOS" },
    { MinerFirmware::VNish, "VNish" },
    { MinerFirmware::LuxOS, "LuxOS" },
    { MinerFirmware::AxeOS, "AxeOS" },
    { MinerFirmware::Unknown, "Unknown" },
} };

bool iequals(const std::string& a, const char* b)
{
    std::size_t i = 0;
    for (; i < a.size() && b[i] != '\0'; ++i)
    {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return i == a.size() && b[i] == '\0';
}

} // namespace

const char* makeName(MinerMake make)
{
    for (const auto& [value, name] : kMakeNames)
    {
        if (value == make)
            return name;
    }
    return "Unknown";
}

const char* firmwareName(MinerFirmware firmware)
{
    for (const auto& [value, name] : kFirmwareNames)
    {
        if (value == firmware)
            return name;
    }
    return "Unknown";
}

MinerMake makeFromName(const std::string& name)
{
    for (const auto& [value, label] : kMakeNames)
    {
        if (iequals(name, label))
            return value;
    }
    return MinerMake::Unknown;
}

MinerFirmware firmwareFromName(const std::string& name)
{
    for (const auto& [value, label] : kFirmwareNames)
    {
        if (iequals(name, label))
            return value;
    }
    return MinerFirmware::Unknown;
}

std::optional<double> DeviceSnapshot::efficiencyWPerTh() const
{
    if (!power_w || !hashrate_ths || *hashrate_ths <= 0.0)
        return std::nullopt;
    return *power_w / *hashrate_ths;
}

bool DeviceFilter::matches(const DeviceSnapshot& snapshot) const
{
    if (!makes.empty() && std::find(makes.begin(), makes.end(), snapshot.make) == makes.end())
        return false;
    if (!firmwares.empty() && std::find(firmwares.begin(), firmwares.end(), snapshot.firmware) == firmwares.end())
        return false;
    return true;
}

} // namespace network
