#pragma once

#include "DeviceInfo.hpp"

#include <string>
#include <vector>

namespace network
{

enum class HealthStatus
{
    Healthy,
    Warning,
    Critical,
    Unknown
};

/// Classify a snapshot. Thresholds:
///   not mining                      -> Critical
///   chips working/expected  < 0.90  -> Critical, < 0.95 -> Warning
///   hashrate actual/expected < 0.50 -> Critical, < 0.80 -> Warning
///   average temperature     > 85 C  -> Critical, > 75 C -> Warning
///   any fan at 0 RPM                -> Critical
///   any hashboard with 0 chips      -> Critical
///   any status message              -> Warning
/// A mining device that reports no metrics at all is Unknown.
HealthStatus assessHealth(const DeviceSnapshot& snapshot);

const char* healthLabel(HealthStatus status);

// Critical first, Unknown last
int healthSortPriority(HealthStatus status);

enum class IssueCategory
{
    Chips,
    Hashrate,
    Temperature,
    Fans,
    Boards,
    Power,
    Other
};

const char* issueCategoryName(IssueCategory category);

struct HealthIssue
{
    HealthStatus severity = HealthStatus::Warning; // Warning or Critical
    IssueCategory category = IssueCategory::Other;
    std::string description;
};

// Overall status plus the individual findings behind it, worst first.
struct HealthReport
{
    HealthStatus status = HealthStatus::Unknown;
    std::vector<HealthIssue> issues;

    std::size_t count(HealthStatus severity) const;
};

HealthReport buildHealthReport(const DeviceSnapshot& snapshot);

} // namespace network
