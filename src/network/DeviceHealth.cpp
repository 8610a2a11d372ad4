#include "DeviceHealth.hpp"

#include <algorithm>
#include <cstdio>

namespace network
{

HealthStatus assessHealth(const DeviceSnapshot& snapshot)
{
    if (!snapshot.is_mining)
        return HealthStatus::Critical;

    // Answered but reported nothing to judge
    if (!snapshot.hashrate_ths && !snapshot.temperature_c && !snapshot.total_chips && snapshot.fan_rpms.empty() &&
        snapshot.board_chips.empty() && snapshot.messages.empty())
        return HealthStatus::Unknown;

    int critical = 0;
    int warning = 0;

    if (snapshot.total_chips && snapshot.expected_chips && *snapshot.expected_chips > 0)
    {
        const double ratio = static_cast<double>(*snapshot.total_chips) / *snapshot.expected_chips;
        if (ratio < 0.90)
            ++critical;
        else if (ratio < 0.95)
            ++warning;
    }

    if (snapshot.hashrate_ths && snapshot.expected_hashrate_ths && *snapshot.expected_hashrate_ths > 0.0)
    {
        const double ratio = *snapshot.hashrate_ths / *snapshot.expected_hashrate_ths;
        if (ratio < 0.50)
            ++critical;
        else if (ratio < 0.80)
            ++warning;
    }

    if (snapshot.temperature_c)
    {
        if (*snapshot.temperature_c > 85.0)
            ++critical;
        else if (*snapshot.temperature_c > 75.0)
            ++warning;
    }

    for (double rpm : snapshot.fan_rpms)
    {
        if (rpm == 0.0)
        {
            ++critical;
            break;
        }
    }

    if (std::find(snapshot.board_chips.begin(), snapshot.board_chips.end(), 0u) != snapshot.board_chips.end())
        ++critical;

    if (!snapshot.messages.empty())
        ++warning;

    if (critical > 0)
        return HealthStatus::Critical;
    if (warning > 0)
        return HealthStatus::Warning;
    return HealthStatus::Healthy;
}

const char* healthLabel(HealthStatus status)
{
    switch (status)
    {
    case HealthStatus::Healthy:
        return "Healthy";
    case HealthStatus::Warning:
        return "Warning";
    case HealthStatus::Critical:
        return "Critical";
    case HealthStatus::Unknown:
        return "Unknown";
    }
    return "Unknown";
}

int healthSortPriority(HealthStatus status)
{
    switch (status)
    {
    case HealthStatus::Critical:
        return 0;
    case HealthStatus::Warning:
        return 1;
    case HealthStatus::Healthy:
        return 2;
    case HealthStatus::Unknown:
        return 3;
    }
    return 3;
}

const char* issueCategoryName(IssueCategory category)
{
    switch (category)
    {
    case IssueCategory::Chips:
        return "chips";
    case IssueCategory::Hashrate:
        return "hashrate";
    case IssueCategory::Temperature:
        return "temperature";
    case IssueCategory::Fans:
        return "fans";
    case IssueCategory::Boards:
        return "boards";
    case IssueCategory::Power:
        return "power";
    case IssueCategory::Other:
        return "other";
    }
    return "other";
}

std::size_t HealthReport::count(HealthStatus severity) const
{
    return static_cast<std::size_t>(std::count_if(issues.begin(), issues.end(),
                                                   [&](const HealthIssue& i) { return i.severity == severity; }));
}

HealthReport buildHealthReport(const DeviceSnapshot& snapshot)
{
    HealthReport report;
    report.status = assessHealth(snapshot);

    auto add = [&](HealthStatus severity, IssueCategory category, std::string text)
    { report.issues.push_back({ severity, category, std::move(text) }); };
    char buf[96];

    if (!snapshot.is_mining)
        add(HealthStatus::Critical, IssueCategory::Other, "Miner is not actively mining");

    if (snapshot.total_chips && snapshot.expected_chips && *snapshot.total_chips < *snapshot.expected_chips)
    {
        const std::uint32_t total = *snapshot.total_chips;
        const std::uint32_t expected = *snapshot.expected_chips;
        const double ratio = static_cast<double>(total) / expected;
        std::snprintf(buf, sizeof(buf), "Missing %u chips (%u/%u)", expected - total, total, expected);
        add(ratio < 0.90 ? HealthStatus::Critical : HealthStatus::Warning, IssueCategory::Chips, buf);
    }

    if (snapshot.hashrate_ths && snapshot.expected_hashrate_ths && *snapshot.expected_hashrate_ths > 0.0)
    {
        const double ratio = *snapshot.hashrate_ths / *snapshot.expected_hashrate_ths;
        if (ratio < 0.80)
        {
            std::snprintf(buf, sizeof(buf), "Low hashrate (%d%% of expected)", static_cast<int>(ratio * 100.0));
            add(ratio < 0.50 ? HealthStatus::Critical : HealthStatus::Warning, IssueCategory::Hashrate, buf);
        }
    }

    if (snapshot.temperature_c && *snapshot.temperature_c > 75.0)
    {
        std::snprintf(buf, sizeof(buf), "High temperature (%.1f C)", *snapshot.temperature_c);
        add(*snapshot.temperature_c > 85.0 ? HealthStatus::Critical : HealthStatus::Warning,
            IssueCategory::Temperature, buf);
    }

    const auto dead_fans = std::count(snapshot.fan_rpms.begin(), snapshot.fan_rpms.end(), 0.0);
    if (dead_fans > 0)
        add(HealthStatus::Critical, IssueCategory::Fans, std::to_string(dead_fans) + " fan(s) not spinning");

    const auto dead_boards = std::count(snapshot.board_chips.begin(), snapshot.board_chips.end(), 0u);
    if (dead_boards > 0)
        add(HealthStatus::Critical, IssueCategory::Boards,
            std::to_string(dead_boards) + " board(s) with no working chips");

    // Anything above 50 W/TH is poor for current hardware
    if (auto efficiency = snapshot.efficiencyWPerTh(); efficiency && *efficiency > 50.0)
    {
        std::snprintf(buf, sizeof(buf), "Poor efficiency (%.1f W/TH)", *efficiency);
        add(HealthStatus::Warning, IssueCategory::Power, buf);
    }

    for (const auto& msg : snapshot.messages)
    {
        if (!msg.empty())
            add(HealthStatus::Warning, IssueCategory::Other, msg);
    }

    std::stable_sort(report.issues.begin(), report.issues.end(), [](const HealthIssue& a, const HealthIssue& b)
                     { return healthSortPriority(a.severity) < healthSortPriority(b.severity); });
    return report;
}

} // namespace network
