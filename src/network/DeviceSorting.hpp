#pragma once

#include "DeviceInfo.hpp"

#include <vector>

namespace network
{

enum class SortDirection
{
    Ascending,
    Descending
};

enum class SortColumn
{
    IpAddress,
    Model,
    Make,
    Firmware,
    FirmwareVersion,
    Health
};

inline SortDirection toggled(SortDirection direction)
{
    return direction == SortDirection::Ascending ? SortDirection::Descending : SortDirection::Ascending;
}

// Stable in-place sort; ties keep IP order from the input
void sortDevices(std::vector<DiscoveredDevice>& devices, SortColumn column, SortDirection direction);

} // namespace network
