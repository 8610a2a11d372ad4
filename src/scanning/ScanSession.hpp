#pragma once

#include "ScanEvent.hpp"
#include "ScanPool.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

namespace scanning
{

// Session state machine
enum class SessionState
{
    Idle,      // Created, no probes scheduled
    Running,   // Consuming events
    Completed, // Every group completed
    Cancelled, // Cancel handle fired; partial results kept
    Failed     // Engine fault; results discarded
};

const char* sessionStateName(SessionState state);

/// Per-group progress and accumulated discoveries.
struct GroupScanState
{
    std::string name;
    std::uint64_t probed = 0;
    std::uint64_t total = 0;
    std::uint64_t found = 0;
    bool completed = false;

    std::map<network::Ipv4Address, network::DiscoveredDevice> devices;
    std::unordered_set<network::Ipv4Address> probed_addresses;
};

/// One logical scan across one or more groups.
///
/// Owned by a single consumer thread. All mutable state lives here rather
/// than in the event stream, so the consumer can stop between any two
/// events and resume later with processNext().
class ScanSession
{
public:
    explicit ScanSession(std::vector<config::ScanGroup> groups, std::uint64_t id = 0);
    ~ScanSession();

    ScanSession(const ScanSession&) = delete;
    ScanSession& operator=(const ScanSession&) = delete;

    /// Idle -> Running. Launches a ScanPool over the session's groups. On a
    /// range parse error the session stays Idle and outError says why.
    /// Calling it on a session that is not Idle does nothing and returns
    /// false with outError reset to an empty PlanError.
    bool start(std::shared_ptr<network::IDeviceProber> prober, const network::DeviceFilter& filter,
               const ScanOptions& options, PlanError& outError);

    /// Idle -> Running on an event stream produced elsewhere.
    void attach(std::shared_ptr<EventStream> stream, CancelHandle cancel, const std::vector<ScanTarget>& targets);

    /// Consume at most one event, waiting up to `wait` for it to arrive.
    /// Returns true when an event was consumed.
    bool processNext(std::chrono::milliseconds wait = std::chrono::milliseconds(0));

    /// Consume up to `budget` events that are already queued.
    std::size_t processAvailable(std::size_t budget);

    /// Block until the stream is exhausted.
    void runToCompletion();

    /// Running -> Cancelled. Stops scheduling; late results are ignored.
    void cancel();

    std::uint64_t id() const { return id_; }
    SessionState state() const { return state_; }
    bool isTerminal() const;
    // Terminal and no further events will be read from the stream
    bool isSettled() const;

    const std::vector<config::ScanGroup>& groups() const { return groups_; }
    bool covers(const std::string& group) const;

    const GroupScanState* group(const std::string& name) const;
    std::uint64_t probedCount() const;
    std::uint64_t totalCount() const;
    std::size_t deviceCount() const;

    /// Discoveries for one group in ascending IP order.
    std::vector<network::DiscoveredDevice> devices(const std::string& group) const;

    // EngineFault description when state() == Failed
    const std::string& failure() const { return failure_; }

    // Events consumed so far, terminal event included
    std::uint64_t eventsProcessed() const { return events_processed_; }

private:
    void apply(ScanEvent&& event);
    void fail(const std::string& reason);
    GroupScanState* findGroup(const std::string& name);

    std::uint64_t id_;
    std::vector<config::ScanGroup> groups_;
    std::map<std::string, GroupScanState> progress_;

    SessionState state_ = SessionState::Idle;
    std::string failure_;
    bool stream_done_ = false;
    std::uint64_t events_processed_ = 0;

    std::unique_ptr<ScanPool> pool_;
    std::shared_ptr<EventStream> stream_;
    CancelHandle cancel_;
};

} // namespace scanning
