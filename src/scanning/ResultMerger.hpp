#pragma once

#include "ScanSession.hpp"
#include "../config/PersistedConfig.hpp"
#include "../state/ScannerSettings.hpp"

#include <cstdint>

namespace scanning
{

struct MergeOptions
{
    ScannerSettings::CancelledScanPolicy cancelled_policy = ScannerSettings::CancelledScanPolicy::MarkPartial;
    std::int64_t now = 0; // unix seconds written as last_scan
};

/// Fold a terminal session into a copy of `old`.
///
/// A group the session finished replaces its stored device list outright
/// (devices that did not answer are gone) and gets last_scan = options.now.
/// A group cut short by cancellation keeps stored devices at addresses the
/// session never reached, takes the session's answer for every address it
/// did reach, and is flagged partial; its last_scan follows the policy.
/// Groups outside the session, and groups deleted from `old` since the scan
/// started, are left as they are. Failed or unfinished sessions change nothing.
config::PersistedConfig mergeResults(const config::PersistedConfig& old, const ScanSession& session,
                                     const MergeOptions& options);

} // namespace scanning
