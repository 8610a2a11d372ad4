#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

// Scanner tuning loaded from the [scanner] table of config.toml
struct ScannerSettings
{
    // What happens to a group's last-scan timestamp when its scan was cut
    // short by cancellation.
    enum class CancelledScanPolicy
    {
        MarkPartial,  // timestamp cleared
        KeepTimestamp // previous timestamp retained
    };

    static constexpr std::size_t MinConcurrency = 1;
    static constexpr std::size_t MaxConcurrency = 1024;

    std::size_t concurrency_limit;
    std::chrono::milliseconds probe_timeout;
    std::size_t channel_capacity;
    CancelledScanPolicy cancelled_scan_policy;
    std::vector<std::string> probers;
    int cgminer_port;

    void applyDefaults()
    {
        concurrency_limit = 64;
        probe_timeout = std::chrono::milliseconds(3000);
        channel_capacity = 256;
        cancelled_scan_policy = CancelledScanPolicy::MarkPartial;
        probers = { "cgminer", "axeos" };
        cgminer_port = 4028;
    }
};
