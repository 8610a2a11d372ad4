#pragma once

#include "ScanSession.hpp"
#include "../config/ConfigStore.hpp"
#include "../state/ScannerSettings.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace scanning
{

enum class StartKind
{
    Started,
    AlreadyScanning, // a requested group is part of a running session
    InvalidRange,    // a requested group has a range that does not parse
    UnknownGroup,
    NoGroups
};

struct StartResult
{
    StartKind kind = StartKind::Started;
    std::uint64_t session_id = 0;
    std::string group; // offending group for every failure kind that has one
    std::string message;

    bool ok() const { return kind == StartKind::Started; }
};

/// What happened to a session that reached a terminal state.
struct SessionOutcome
{
    std::uint64_t session_id = 0;
    SessionState state = SessionState::Idle;
    std::vector<std::string> groups;
    std::size_t devices = 0;
    std::string failure; // EngineFault text for Failed sessions
    bool merged = false;
    config::SaveResult save; // StoreError when !save.ok
};

/// Consumer-side owner of the committed configuration and every running
/// session. Not thread-safe: call everything from one thread.
///
/// A group can be part of at most one running session. When a session
/// settles its results are merged into the committed config and saved; a
/// failed save keeps the merged config in memory for retrySave().
class ScanCoordinator
{
public:
    ScanCoordinator(config::ConfigStore& store, config::PersistedConfig committed, ScannerSettings settings,
                    std::shared_ptr<network::IDeviceProber> prober);
    ~ScanCoordinator();

    ScanCoordinator(const ScanCoordinator&) = delete;
    ScanCoordinator& operator=(const ScanCoordinator&) = delete;

    /// Scan the named groups. Nothing changes unless the result is Started.
    StartResult startScan(const std::vector<std::string>& groupNames, const network::DeviceFilter& filter = {});

    /// Scan every enabled group.
    StartResult startEnabled(const network::DeviceFilter& filter = {});

    bool cancel(std::uint64_t sessionId);
    void cancelAll();

    /// Process up to `budget` events per session, waiting at most `wait` for
    /// the first one. Returns the sessions that settled during this call.
    std::vector<SessionOutcome> pump(std::size_t budget, std::chrono::milliseconds wait = std::chrono::milliseconds(0));

    bool isScanning(const std::string& group) const;
    bool hasActiveSessions() const { return !sessions_.empty(); }
    const ScanSession* session(std::uint64_t sessionId) const;
    std::vector<const ScanSession*> activeSessions() const;

    const config::PersistedConfig& config() const { return committed_; }
    const ScannerSettings& settings() const { return settings_; }

    /// Swap in an edited configuration (see config::GroupEditor). Running
    /// sessions keep scanning the group copies they started with.
    config::SaveResult replaceConfig(config::PersistedConfig cfg);

    /// Persist the committed config again after a failed save.
    config::SaveResult retrySave();
    bool hasUnsavedChanges() const { return unsaved_; }

private:
    SessionOutcome finish(ScanSession& session);
    config::SaveResult persist();

    config::ConfigStore& store_;
    config::PersistedConfig committed_;
    ScannerSettings settings_;
    std::shared_ptr<network::IDeviceProber> prober_;

    std::map<std::uint64_t, std::unique_ptr<ScanSession>> sessions_;
    std::uint64_t next_id_ = 1;
    bool unsaved_ = false;
};

} // namespace scanning
