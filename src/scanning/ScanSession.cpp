#include "ScanSession.hpp"

#include <plog/Log.h>

#include <type_traits>

namespace scanning
{

namespace
{

std::int64_t unixNow()
{
    return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
        .count();
}

} // namespace

const char* sessionStateName(SessionState state)
{
    switch (state)
    {
    case SessionState::Idle:
        return "idle";
    case SessionState::Running:
        return "running";
    case SessionState::Completed:
        return "completed";
    case SessionState::Cancelled:
        return "cancelled";
    case SessionState::Failed:
        return "failed";
    }
    return "unknown";
}

ScanSession::ScanSession(std::vector<config::ScanGroup> groups, std::uint64_t id)
    : id_(id)
    , groups_(std::move(groups))
{
}

ScanSession::~ScanSession()
{
    // Dropping a live session must not leave probes running
    if (state_ == SessionState::Running)
        cancel_.cancel();
}

bool ScanSession::start(std::shared_ptr<network::IDeviceProber> prober, const network::DeviceFilter& filter,
                        const ScanOptions& options, PlanError& outError)
{
    if (state_ != SessionState::Idle)
    {
        // Not a planning failure, so outError carries nothing
        outError = PlanError{};
        PLOG_WARNING << "Session " << id_ << " already started, ignoring start()";
        return false;
    }

    std::vector<ScanTarget> targets;
    if (!ScanPool::plan(groups_, filter, targets, outError))
    {
        PLOG_WARNING << "Session " << id_ << ": group '" << outError.group << "' has an invalid range: "
                     << outError.parse.message;
        return false;
    }

    pool_ = ScanPool::start(targets, std::move(prober), options);
    attach(pool_->events(), pool_->cancelHandle(), targets);
    return true;
}

void ScanSession::attach(std::shared_ptr<EventStream> stream, CancelHandle cancel,
                         const std::vector<ScanTarget>& targets)
{
    stream_ = std::move(stream);
    cancel_ = std::move(cancel);
    progress_.clear();
    for (const auto& t : targets)
    {
        GroupScanState g;
        g.name = t.group;
        g.total = t.total;
        progress_.emplace(t.group, std::move(g));
    }
    state_ = SessionState::Running;
    PLOG_INFO << "Session " << id_ << " running over " << targets.size() << " group(s)";
}

bool ScanSession::isTerminal() const
{
    return state_ == SessionState::Completed || state_ == SessionState::Cancelled || state_ == SessionState::Failed;
}

bool ScanSession::isSettled() const
{
    return isTerminal() && (stream_done_ || !stream_ || state_ == SessionState::Failed);
}

bool ScanSession::covers(const std::string& group) const
{
    return progress_.count(group) != 0;
}

const GroupScanState* ScanSession::group(const std::string& name) const
{
    auto it = progress_.find(name);
    return it == progress_.end() ? nullptr : &it->second;
}

GroupScanState* ScanSession::findGroup(const std::string& name)
{
    auto it = progress_.find(name);
    return it == progress_.end() ? nullptr : &it->second;
}

std::uint64_t ScanSession::probedCount() const
{
    std::uint64_t n = 0;
    for (const auto& [name, g] : progress_)
        n += g.probed;
    return n;
}

std::uint64_t ScanSession::totalCount() const
{
    std::uint64_t n = 0;
    for (const auto& [name, g] : progress_)
        n += g.total;
    return n;
}

std::size_t ScanSession::deviceCount() const
{
    std::size_t n = 0;
    for (const auto& [name, g] : progress_)
        n += g.devices.size();
    return n;
}

std::vector<network::DiscoveredDevice> ScanSession::devices(const std::string& group) const
{
    std::vector<network::DiscoveredDevice> out;
    if (const GroupScanState* g = this->group(group))
    {
        out.reserve(g->devices.size());
        for (const auto& [addr, dev] : g->devices)
            out.push_back(dev);
    }
    return out;
}

bool ScanSession::processNext(std::chrono::milliseconds wait)
{
    if (!stream_ || stream_done_ || state_ == SessionState::Idle || state_ == SessionState::Failed)
        return false;

    std::optional<ScanEvent> ev = wait.count() > 0 ? stream_->receive_for(wait) : stream_->try_receive();
    if (!ev)
    {
        if (stream_->finished())
        {
            stream_done_ = true;
            if (state_ == SessionState::Running)
                fail("event stream closed before the scan finished");
        }
        return false;
    }

    ++events_processed_;
    apply(std::move(*ev));
    return true;
}

std::size_t ScanSession::processAvailable(std::size_t budget)
{
    std::size_t n = 0;
    while (n < budget && processNext())
        ++n;
    return n;
}

void ScanSession::runToCompletion()
{
    while (!isSettled())
    {
        if (!stream_ || state_ == SessionState::Idle)
            return;
        processNext(std::chrono::milliseconds(100));
    }
}

void ScanSession::cancel()
{
    if (state_ != SessionState::Running)
        return;
    state_ = SessionState::Cancelled;
    cancel_.cancel();
    PLOG_INFO << "Session " << id_ << " cancelled after " << probedCount() << "/" << totalCount() << " probes";
}

void ScanSession::fail(const std::string& reason)
{
    failure_ = reason;
    state_ = SessionState::Failed;
    cancel_.cancel();
    if (stream_)
        stream_->close();
    PLOG_ERROR << "Session " << id_ << " failed: " << reason;
}

void ScanSession::apply(ScanEvent&& event)
{
    std::visit(
        [this](auto&& ev)
        {
            using T = std::decay_t<decltype(ev)>;

            if constexpr (std::is_same_v<T, SessionCompleted> || std::is_same_v<T, SessionCancelled>)
            {
                stream_done_ = true;
                if (state_ != SessionState::Running)
                    return;
                if constexpr (std::is_same_v<T, SessionCancelled>)
                {
                    state_ = SessionState::Cancelled;
                    PLOG_INFO << "Session " << id_ << " cancelled by its scan pool";
                }
                else
                {
                    for (const auto& [name, g] : progress_)
                    {
                        if (!g.completed)
                        {
                            fail("scan finished without completing group '" + name + "'");
                            return;
                        }
                    }
                    state_ = SessionState::Completed;
                    PLOG_INFO << "Session " << id_ << " completed: " << deviceCount() << " device(s) in "
                              << totalCount() << " address(es)";
                }
            }
            else
            {
                // Results that arrive after cancellation are not applied
                if (state_ != SessionState::Running)
                    return;

                GroupScanState* g = findGroup(ev.group);
                if (!g)
                {
                    fail("event for group '" + ev.group + "' which is not part of this scan");
                    return;
                }

                if constexpr (std::is_same_v<T, AddressProbed>)
                {
                    g->probed_addresses.insert(ev.address);
                    if (g->probed_addresses.size() > g->probed)
                        g->probed = g->probed_addresses.size();
                    if (ev.outcome.found())
                    {
                        network::DiscoveredDevice dev;
                        dev.address = ev.address;
                        dev.device_id = ev.outcome.device.mac;
                        dev.snapshot = std::move(ev.outcome.device);
                        dev.discovered_at = unixNow();
                        g->devices[ev.address] = std::move(dev);
                        g->found = g->devices.size();
                    }
                }
                else if constexpr (std::is_same_v<T, GroupProgress>)
                {
                    // Progress from concurrent workers can arrive out of order
                    if (ev.probed > g->probed)
                        g->probed = ev.probed;
                }
                else if constexpr (std::is_same_v<T, GroupCompleted>)
                {
                    if (g->probed_addresses.size() != g->total)
                    {
                        fail("group '" + g->name + "' completed after " + std::to_string(g->probed_addresses.size()) +
                             " of " + std::to_string(g->total) + " addresses");
                        return;
                    }
                    g->completed = true;
                    PLOG_INFO << "Session " << id_ << ": group '" << g->name << "' done, " << g->devices.size()
                              << " device(s)";
                }
            }
        },
        std::move(event));
}

} // namespace scanning
