#include "ResultMerger.hpp"

#include <plog/Log.h>

#include <algorithm>

namespace scanning
{

namespace
{

void sortByAddress(std::vector<network::DiscoveredDevice>& devices)
{
    std::sort(devices.begin(), devices.end(),
              [](const network::DiscoveredDevice& a, const network::DiscoveredDevice& b) { return a.address < b.address; });
}

config::GroupResults mergeCompleted(const GroupScanState& scanned, const MergeOptions& options)
{
    config::GroupResults r;
    r.devices.reserve(scanned.devices.size());
    for (const auto& [addr, dev] : scanned.devices)
        r.devices.push_back(dev);
    r.last_scan = options.now;
    r.partial = false;
    return r;
}

config::GroupResults mergePartial(const config::GroupResults* previous, const GroupScanState& scanned,
                                  const MergeOptions& options)
{
    config::GroupResults r;
    if (previous)
    {
        for (const auto& dev : previous->devices)
        {
            if (scanned.probed_addresses.count(dev.address) == 0)
                r.devices.push_back(dev);
        }
    }
    for (const auto& [addr, dev] : scanned.devices)
        r.devices.push_back(dev);
    sortByAddress(r.devices);

    r.partial = true;
    if (options.cancelled_policy == ScannerSettings::CancelledScanPolicy::KeepTimestamp && previous)
        r.last_scan = previous->last_scan;
    return r;
}

} // namespace

config::PersistedConfig mergeResults(const config::PersistedConfig& old, const ScanSession& session,
                                     const MergeOptions& options)
{
    config::PersistedConfig merged = old;

    const SessionState state = session.state();
    if (state != SessionState::Completed && state != SessionState::Cancelled)
    {
        PLOG_WARNING << "Session " << session.id() << " is " << sessionStateName(state) << ", nothing merged";
        return merged;
    }

    for (const auto& group : session.groups())
    {
        const GroupScanState* scanned = session.group(group.name);
        if (!scanned)
            continue;
        if (!old.findGroup(group.name))
        {
            PLOG_INFO << "Group '" << group.name << "' was removed while it was being scanned, results dropped";
            continue;
        }

        if (scanned->completed)
        {
            merged.results[group.name] = mergeCompleted(*scanned, options);
        }
        else if (state == SessionState::Cancelled)
        {
            merged.results[group.name] = mergePartial(old.findResults(group.name), *scanned, options);
        }
    }
    return merged;
}

} // namespace scanning
