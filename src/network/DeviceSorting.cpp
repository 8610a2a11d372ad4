#include "DeviceSorting.hpp"
#include "DeviceHealth.hpp"

#include <algorithm>
#include <string>

namespace network
{

namespace
{

template <typename Key>
void sortByKey(std::vector<DiscoveredDevice>& devices, SortDirection direction, Key key)
{
    std::stable_sort(devices.begin(), devices.end(),
                     [&](const DiscoveredDevice& a, const DiscoveredDevice& b)
                     {
                         if (direction == SortDirection::Ascending)
                             return key(a) < key(b);
                         return key(b) < key(a);
                     });
}

} // namespace

void sortDevices(std::vector<DiscoveredDevice>& devices, SortColumn column, SortDirection direction)
{
    switch (column)
    {
    case SortColumn::IpAddress:
        sortByKey(devices, direction, [](const DiscoveredDevice& d) { return d.address; });
        break;
    case SortColumn::Model:
        sortByKey(devices, direction, [](const DiscoveredDevice& d) { return d.snapshot.model; });
        break;
    case SortColumn::Make:
        sortByKey(devices, direction, [](const DiscoveredDevice& d) { return std::string(makeName(d.snapshot.make)); });
        break;
    case SortColumn::Firmware:
        sortByKey(devices, direction,
                  [](const DiscoveredDevice& d) { return std::string(firmwareName(d.snapshot.firmware)); });
        break;
    case SortColumn::FirmwareVersion:
        sortByKey(devices, direction, [](const DiscoveredDevice& d) { return d.snapshot.firmware_version; });
        break;
    case SortColumn::Health:
        sortByKey(devices, direction,
                  [](const DiscoveredDevice& d) { return healthSortPriority(assessHealth(d.snapshot)); });
        break;
    }
}

} // namespace network
