#include "ScanPool.hpp"

#include "../state/ScannerSettings.hpp"

#include <BS_thread_pool.hpp>
#include <plog/Log.h>

#include <algorithm>
#include <atomic>
#include <exception>
#include <semaphore>
#include <set>

namespace scanning
{

namespace
{

constexpr auto kSlotPoll = std::chrono::milliseconds(50);

// Walks one target's blocks in order
struct Cursor
{
    const ScanTarget* target = nullptr;
    std::size_t block = 0;
    network::AddressRange::Iterator it;
    std::shared_ptr<std::atomic<std::uint64_t>> probed;

    bool exhausted() const { return block >= target->blocks.size(); }

    network::Ipv4Address next()
    {
        network::Ipv4Address addr = *it;
        ++it;
        if (it == target->blocks[block].end())
        {
            ++block;
            if (!exhausted())
                it = target->blocks[block].begin();
        }
        return addr;
    }
};

} // namespace

ScanOptions ScanOptions::fromSettings(const ScannerSettings& settings)
{
    ScanOptions o;
    o.concurrency_limit = std::clamp(settings.concurrency_limit, ScannerSettings::MinConcurrency,
                                     ScannerSettings::MaxConcurrency);
    o.probe_timeout = settings.probe_timeout;
    o.channel_capacity = settings.channel_capacity;
    return o;
}

bool ScanPool::plan(const std::vector<config::ScanGroup>& groups, const network::DeviceFilter& filter,
                    std::vector<ScanTarget>& out, PlanError& outError)
{
    std::vector<ScanTarget> planned;
    std::set<std::string> seen;
    for (const auto& group : groups)
    {
        if (!seen.insert(group.name).second)
            continue;

        std::vector<network::AddressRange> ranges;
        network::ParseError err;
        if (!group.parseRanges(ranges, err))
        {
            outError.group = group.name;
            outError.parse = std::move(err);
            return false;
        }

        ScanTarget t;
        t.group = group.name;
        t.blocks = network::AddressRange::coalesce(std::move(ranges));
        for (const auto& b : t.blocks)
            t.total += b.count();
        t.filter = group.filter.empty() ? filter : group.filter;
        planned.push_back(std::move(t));
    }
    out = std::move(planned);
    return true;
}

std::unique_ptr<ScanPool> ScanPool::start(const std::vector<config::ScanGroup>& groups,
                                          const network::DeviceFilter& filter,
                                          std::shared_ptr<network::IDeviceProber> prober, const ScanOptions& options,
                                          PlanError& outError)
{
    std::vector<ScanTarget> targets;
    if (!plan(groups, filter, targets, outError))
    {
        PLOG_WARNING << "Scan not started: group '" << outError.group << "': " << outError.parse.message;
        return nullptr;
    }
    return start(std::move(targets), std::move(prober), options);
}

std::unique_ptr<ScanPool> ScanPool::start(std::vector<ScanTarget> targets,
                                          std::shared_ptr<network::IDeviceProber> prober, const ScanOptions& options)
{
    return std::unique_ptr<ScanPool>(new ScanPool(std::move(targets), std::move(prober), options));
}

ScanPool::ScanPool(std::vector<ScanTarget> targets, std::shared_ptr<network::IDeviceProber> prober,
                   const ScanOptions& options)
    : targets_(std::move(targets))
    , prober_(std::move(prober))
    , options_(options)
    , events_(std::make_shared<EventStream>(options.channel_capacity))
{
    options_.concurrency_limit = std::max<std::size_t>(1, options_.concurrency_limit);
    dispatcher_ = std::jthread([this] { run(stop_.get_token()); });
}

ScanPool::~ScanPool()
{
    stop_.request_stop();
    // Unblocks workers stuck on a full stream nobody reads anymore
    events_->close();
    if (dispatcher_.joinable())
        dispatcher_.join();
}

bool ScanPool::publish(ScanEvent event)
{
    if (events_->send(std::move(event)))
        return true;
    PLOG_DEBUG << "Event stream closed by consumer, dropping event";
    return false;
}

void ScanPool::run(std::stop_token stoken)
{
    const std::size_t limit = options_.concurrency_limit;
    std::uint64_t total = 0;
    for (const auto& t : targets_)
        total += t.total;
    PLOG_INFO << "Scan started: " << targets_.size() << " group(s), " << total << " address(es), concurrency "
              << limit;

    std::counting_semaphore<> slots(static_cast<std::ptrdiff_t>(limit));
    BS::light_thread_pool workers(limit);

    std::vector<Cursor> cursors;
    for (const auto& t : targets_)
    {
        if (t.total == 0)
        {
            publish(GroupCompleted{ t.group });
            continue;
        }
        Cursor c;
        c.target = &t;
        c.it = t.blocks.front().begin();
        c.probed = std::make_shared<std::atomic<std::uint64_t>>(0);
        cursors.push_back(std::move(c));
    }

    auto dispatch = [&](Cursor& c)
    {
        const network::Ipv4Address addr = c.next();
        const ScanTarget* target = c.target;
        auto probed = c.probed;
        workers.detach_task(
            [this, &slots, target, probed, addr]
            {
                network::ProbeResult result;
                try
                {
                    result = prober_->probe(addr, target->filter, options_.probe_timeout);
                }
                catch (const std::exception& e)
                {
                    result = network::ProbeResult::failure(network::ProbeStatus::Transport, e.what());
                }

                if (result.found())
                    PLOG_DEBUG << target->group << " " << addr.toString() << ": " << result.device.model;
                else
                    PLOG_DEBUG << target->group << " " << addr.toString() << ": "
                               << network::probeStatusName(result.status);

                if (publish(AddressProbed{ target->group, addr, std::move(result) }))
                {
                    const std::uint64_t done = probed->fetch_add(1, std::memory_order_acq_rel) + 1;
                    if (publish(GroupProgress{ target->group, done, target->total }) && done == target->total)
                        publish(GroupCompleted{ target->group });
                }
                slots.release();
            });
    };

    bool remaining = !cursors.empty();
    while (remaining && !stoken.stop_requested())
    {
        remaining = false;
        for (auto& c : cursors)
        {
            if (c.exhausted())
                continue;

            bool acquired = false;
            while (!stoken.stop_requested())
            {
                if (!slots.try_acquire_for(kSlotPoll))
                    continue;
                // The slot may have been freed by a probe finishing after cancel
                if (stoken.stop_requested())
                {
                    slots.release();
                    break;
                }
                acquired = true;
                break;
            }
            if (!acquired)
                break;

            dispatch(c);
            remaining = remaining || !c.exhausted();
        }
    }

    // In-flight probes finish on their own timeout
    workers.wait();

    if (stoken.stop_requested())
    {
        PLOG_INFO << "Scan cancelled";
        publish(SessionCancelled{});
    }
    else
    {
        PLOG_INFO << "Scan finished";
        publish(SessionCompleted{});
    }
    events_->close();
}

} // namespace scanning
