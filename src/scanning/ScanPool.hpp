#pragma once

#include "EventChannel.hpp"
#include "ScanEvent.hpp"
#include "../config/PersistedConfig.hpp"
#include "../network/IDeviceProber.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

struct ScannerSettings;

namespace scanning
{

using EventStream = EventChannel<ScanEvent>;

/// Stops a running scan from scheduling further probes. Copyable; every
/// copy refers to the same scan. Firing it more than once is harmless.
class CancelHandle
{
public:
    CancelHandle() = default;
    explicit CancelHandle(std::stop_source source)
        : source_(std::move(source))
    {
    }

    void cancel() const { source_.request_stop(); }

    bool cancelled() const { return source_.stop_requested(); }
    bool valid() const { return source_.stop_possible(); }

private:
    mutable std::stop_source source_{ std::nostopstate };
};

struct ScanOptions
{
    std::size_t concurrency_limit = 64;
    std::chrono::milliseconds probe_timeout{ 3000 };
    std::size_t channel_capacity = 256;

    static ScanOptions fromSettings(const ScannerSettings& settings);
};

/// One group's deduplicated work list.
struct ScanTarget
{
    std::string group;
    std::vector<network::AddressRange> blocks; // disjoint, ascending
    std::uint64_t total = 0;
    network::DeviceFilter filter;
};

struct PlanError
{
    std::string group;
    network::ParseError parse;
};

/// Runs device probes for a set of groups on a worker pool with at most
/// `concurrency_limit` probes unresolved at any time, across all groups.
///
/// Work is handed out round-robin between groups so one large group cannot
/// starve the others. Every address yields exactly one AddressProbed event;
/// a group's GroupCompleted follows all of its AddressProbed events; the last
/// event is SessionCompleted, or SessionCancelled when the scan was
/// cancelled, after which the stream is closed.
class ScanPool
{
public:
    ~ScanPool();

    ScanPool(const ScanPool&) = delete;
    ScanPool& operator=(const ScanPool&) = delete;

    /// Expand group ranges into deduplicated targets. A group filter that is
    /// not empty replaces `filter` for that group. Duplicate group names are
    /// scanned once.
    static bool plan(const std::vector<config::ScanGroup>& groups, const network::DeviceFilter& filter,
                     std::vector<ScanTarget>& out, PlanError& outError);

    /// Plan and launch. Returns nullptr (with outError filled) when any range
    /// fails to parse; nothing is probed in that case.
    static std::unique_ptr<ScanPool> start(const std::vector<config::ScanGroup>& groups,
                                           const network::DeviceFilter& filter,
                                           std::shared_ptr<network::IDeviceProber> prober, const ScanOptions& options,
                                           PlanError& outError);

    static std::unique_ptr<ScanPool> start(std::vector<ScanTarget> targets,
                                           std::shared_ptr<network::IDeviceProber> prober, const ScanOptions& options);

    std::shared_ptr<EventStream> events() const { return events_; }
    CancelHandle cancelHandle() const { return CancelHandle(stop_); }

    const std::vector<ScanTarget>& targets() const { return targets_; }

private:
    ScanPool(std::vector<ScanTarget> targets, std::shared_ptr<network::IDeviceProber> prober,
             const ScanOptions& options);

    void run(std::stop_token stoken);
    bool publish(ScanEvent event);

    std::vector<ScanTarget> targets_;
    std::shared_ptr<network::IDeviceProber> prober_;
    ScanOptions options_;
    std::shared_ptr<EventStream> events_;
    std::stop_source stop_;
    std::jthread dispatcher_;
};

} // namespace scanning
