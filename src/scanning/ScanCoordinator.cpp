#include "ScanCoordinator.hpp"
#include "ResultMerger.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <set>

namespace scanning
{

namespace
{

std::int64_t unixNow()
{
    return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
        .count();
}

StartResult rejected(StartKind kind, std::string group, std::string message)
{
    StartResult r;
    r.kind = kind;
    r.group = std::move(group);
    r.message = std::move(message);
    return r;
}

} // namespace

ScanCoordinator::ScanCoordinator(config::ConfigStore& store, config::PersistedConfig committed,
                                 ScannerSettings settings, std::shared_ptr<network::IDeviceProber> prober)
    : store_(store)
    , committed_(std::move(committed))
    , settings_(std::move(settings))
    , prober_(std::move(prober))
{
}

ScanCoordinator::~ScanCoordinator()
{
    for (auto& [id, session] : sessions_)
        session->cancel();
}

StartResult ScanCoordinator::startScan(const std::vector<std::string>& groupNames, const network::DeviceFilter& filter)
{
    if (groupNames.empty())
        return rejected(StartKind::NoGroups, {}, "No groups selected for scanning");

    std::vector<config::ScanGroup> groups;
    std::set<std::string> seen;
    for (const auto& name : groupNames)
    {
        if (!seen.insert(name).second)
            continue;

        const config::ScanGroup* g = committed_.findGroup(name);
        if (!g)
            return rejected(StartKind::UnknownGroup, name, "No group named '" + name + "'");
        if (isScanning(name))
        {
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Scan,
                                                "Group '" + name + "' is already being scanned");
            return rejected(StartKind::AlreadyScanning, name, "Group '" + name + "' is already being scanned");
        }
        groups.push_back(*g);
    }

    const std::uint64_t id = next_id_;
    auto session = std::make_unique<ScanSession>(std::move(groups), id);
    PlanError plan_error;
    if (!session->start(prober_, filter, ScanOptions::fromSettings(settings_), plan_error))
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::AddressRange,
                                          "Group '" + plan_error.group + "' has an invalid network range",
                                          plan_error.parse.message);
        return rejected(StartKind::InvalidRange, plan_error.group, plan_error.parse.message);
    }

    ++next_id_;
    sessions_.emplace(id, std::move(session));

    StartResult r;
    r.session_id = id;
    return r;
}

StartResult ScanCoordinator::startEnabled(const network::DeviceFilter& filter)
{
    auto names = committed_.enabledGroupNames();
    if (names.empty())
        return rejected(StartKind::NoGroups, {}, "No enabled groups to scan");
    return startScan(names, filter);
}

bool ScanCoordinator::cancel(std::uint64_t sessionId)
{
    auto it = sessions_.find(sessionId);
    if (it == sessions_.end())
        return false;
    it->second->cancel();
    return true;
}

void ScanCoordinator::cancelAll()
{
    for (auto& [id, session] : sessions_)
        session->cancel();
}

bool ScanCoordinator::isScanning(const std::string& group) const
{
    for (const auto& [id, session] : sessions_)
    {
        if (session->covers(group))
            return true;
    }
    return false;
}

const ScanSession* ScanCoordinator::session(std::uint64_t sessionId) const
{
    auto it = sessions_.find(sessionId);
    return it == sessions_.end() ? nullptr : it->second.get();
}

std::vector<const ScanSession*> ScanCoordinator::activeSessions() const
{
    std::vector<const ScanSession*> out;
    for (const auto& [id, session] : sessions_)
        out.push_back(session.get());
    return out;
}

std::vector<SessionOutcome> ScanCoordinator::pump(std::size_t budget, std::chrono::milliseconds wait)
{
    std::vector<SessionOutcome> outcomes;
    for (auto it = sessions_.begin(); it != sessions_.end();)
    {
        ScanSession& s = *it->second;
        if (budget > 0 && s.processNext(wait))
            s.processAvailable(budget - 1);
        // Only the first session may block
        wait = std::chrono::milliseconds(0);

        if (s.isSettled())
        {
            outcomes.push_back(finish(s));
            it = sessions_.erase(it);
        }
        else
        {
            ++it;
        }
    }
    return outcomes;
}

SessionOutcome ScanCoordinator::finish(ScanSession& session)
{
    SessionOutcome out;
    out.session_id = session.id();
    out.state = session.state();
    out.devices = session.deviceCount();
    out.failure = session.failure();
    for (const auto& g : session.groups())
        out.groups.push_back(g.name);

    if (session.state() == SessionState::Failed)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Scan, "Scan aborted, results discarded",
                                          session.failure());
        return out;
    }

    MergeOptions options;
    options.cancelled_policy = settings_.cancelled_scan_policy;
    options.now = unixNow();
    committed_ = mergeResults(committed_, session, options);
    out.merged = true;
    unsaved_ = true;

    out.save = persist();
    return out;
}

config::SaveResult ScanCoordinator::persist()
{
    config::SaveResult r = store_.save(committed_);
    if (r)
    {
        unsaved_ = false;
    }
    else
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Persistence,
                                          "Scan results could not be saved; they are kept in memory", r.error);
    }
    return r;
}

config::SaveResult ScanCoordinator::replaceConfig(config::PersistedConfig cfg)
{
    committed_ = std::move(cfg);
    unsaved_ = true;
    return persist();
}

config::SaveResult ScanCoordinator::retrySave()
{
    return persist();
}

} // namespace scanning
