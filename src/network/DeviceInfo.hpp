#pragma once

#include "Ipv4Address.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace network
{

enum class MinerMake
{
    AntMiner,
    WhatsMiner,
    AvalonMiner,
    Bitaxe,
    Unknown
};

enum class MinerFirmware
{
    Stock,
    BraiinsOS,
    VNish,
    LuxOS,
    AxeOS,
    Unknown
};

const char* makeName(MinerMake make);
const char* firmwareName(MinerFirmware firmware);

// Case-insensitive; unrecognized names map to Unknown
MinerMake makeFromName(const std::string& name);
MinerFirmware firmwareFromName(const std::string& name);

/// Status fields reported by a device at the time it was probed.
struct DeviceSnapshot
{
    MinerMake make = MinerMake::Unknown;
    MinerFirmware firmware = MinerFirmware::Unknown;
    std::string model;
    std::string firmware_version;
    std::string hostname;
    std::string mac;

    bool is_mining = false;
    std::optional<double> hashrate_ths;
    std::optional<double> expected_hashrate_ths;
    std::optional<double> temperature_c;
    std::vector<double> fan_rpms;
    std::optional<std::uint32_t> total_chips;
    std::optional<std::uint32_t> expected_chips;
    std::vector<std::uint32_t> board_chips; // working chips per hashboard, in chain order
    std::optional<double> power_w;
    std::vector<std::string> messages;

    // Watts per TH/s, when both power and a non-zero hashrate are known
    std::optional<double> efficiencyWPerTh() const;

    bool operator==(const DeviceSnapshot& other) const = default;
};

struct DiscoveredDevice
{
    Ipv4Address address;
    std::string device_id; // MAC when the device reports one, otherwise empty
    DeviceSnapshot snapshot;
    std::int64_t discovered_at = 0; // unix seconds

    bool operator==(const DiscoveredDevice& other) const = default;
};

/// Manufacturer / firmware allow-list. An empty list accepts anything.
struct DeviceFilter
{
    std::vector<MinerMake> makes;
    std::vector<MinerFirmware> firmwares;

    bool empty() const { return makes.empty() && firmwares.empty(); }
    bool matches(const DeviceSnapshot& snapshot) const;

    bool operator==(const DeviceFilter& other) const = default;
};

} // namespace network
