#include <catch2/catch_test_macros.hpp>

#include "scanning/ScanPool.hpp"
#include "utils/fake_prober.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <stdexcept>
#include <vector>

using namespace scanning;
using test_utils::FakeProber;
using test_utils::ip;
using test_utils::makeSnapshot;

namespace
{

config::ScanGroup group(const std::string& name, const std::string& ranges)
{
    config::ScanGroup g;
    g.name = name;
    g.ranges = ranges;
    return g;
}

std::vector<ScanEvent> drain(ScanPool& pool)
{
    std::vector<ScanEvent> events;
    auto stream = pool.events();
    while (auto ev = stream->receive())
        events.push_back(std::move(*ev));
    return events;
}

ScanOptions options(std::size_t limit)
{
    ScanOptions o;
    o.concurrency_limit = limit;
    o.probe_timeout = std::chrono::milliseconds(100);
    o.channel_capacity = 8;
    return o;
}

} // namespace

TEST_CASE("ScanPool - Planning", "[scan_pool]")
{
    std::vector<ScanTarget> targets;
    PlanError err;

    SECTION("Overlapping ranges inside a group are probed once")
    {
        REQUIRE(ScanPool::plan({ group("A", "10.0.0.0/30, 10.0.0.2-5") }, {}, targets, err));
        REQUIRE(targets.size() == 1);
        REQUIRE(targets[0].total == 6);
    }

    SECTION("A bad range names its group")
    {
        REQUIRE_FALSE(ScanPool::plan({ group("A", "10.0.0.0/30"), group("B", "10.0.0.9-1") }, {}, targets, err));
        REQUIRE(err.group == "B");
        REQUIRE(err.parse.kind == network::ParseErrorKind::InvertedRange);
    }

    SECTION("Group filter overrides the scan filter")
    {
        auto g = group("A", "10.0.0.1/32");
        g.filter.makes = { network::MinerMake::Bitaxe };
        network::DeviceFilter scan_filter;
        scan_filter.makes = { network::MinerMake::AntMiner };

        REQUIRE(ScanPool::plan({ g, group("B", "10.0.0.2/32") }, scan_filter, targets, err));
        REQUIRE(targets[0].filter.makes == std::vector<network::MinerMake>{ network::MinerMake::Bitaxe });
        REQUIRE(targets[1].filter.makes == std::vector<network::MinerMake>{ network::MinerMake::AntMiner });
    }
}

TEST_CASE("ScanPool - Event ordering", "[scan_pool]")
{
    auto prober = std::make_shared<FakeProber>();
    prober->setDevice("10.0.0.1", makeSnapshot("S19"));
    prober->setDevice("10.0.1.7", makeSnapshot("S21"));
    prober->setFailure("10.0.1.3", network::ProbeStatus::Timeout);
    prober->setDelay(std::chrono::milliseconds(1));

    PlanError err;
    auto pool = ScanPool::start({ group("A", "10.0.0.0/28"), group("B", "10.0.1.0/29, 10.0.1.4-7") }, {}, prober,
                                options(3), err);
    REQUIRE(pool);
    auto events = drain(*pool);

    std::map<std::string, std::set<std::string>> probed;
    std::map<std::string, int> completed;
    int session_completed = 0;
    int found = 0;

    for (std::size_t i = 0; i < events.size(); ++i)
    {
        const auto& ev = events[i];
        if (auto* p = std::get_if<AddressProbed>(&ev))
        {
            REQUIRE(completed[p->group] == 0);
            REQUIRE(probed[p->group].insert(p->address.toString()).second);
            if (p->outcome.found())
                ++found;
        }
        else if (auto* c = std::get_if<GroupCompleted>(&ev))
        {
            ++completed[c->group];
            const std::size_t expected = c->group == "A" ? 16 : 8;
            REQUIRE(probed[c->group].size() == expected);
        }
        else if (std::holds_alternative<SessionCompleted>(ev))
        {
            ++session_completed;
            REQUIRE(i == events.size() - 1);
        }
        else
        {
            REQUIRE_FALSE(std::holds_alternative<SessionCancelled>(ev));
        }
    }

    REQUIRE(probed["A"].size() == 16);
    REQUIRE(probed["B"].size() == 8);
    REQUIRE(completed["A"] == 1);
    REQUIRE(completed["B"] == 1);
    REQUIRE(session_completed == 1);
    REQUIRE(found == 2);
    REQUIRE(prober->probeCount() == 24);
}

TEST_CASE("ScanPool - Concurrency limit holds across groups", "[scan_pool]")
{
    auto prober = std::make_shared<FakeProber>();
    prober->setDelay(std::chrono::milliseconds(5));

    PlanError err;
    auto pool = ScanPool::start({ group("A", "10.0.0.0/27"), group("B", "10.0.1.0/27"), group("C", "10.0.2.1/32") },
                                {}, prober, options(4), err);
    REQUIRE(pool);
    auto events = drain(*pool);

    REQUIRE(prober->probeCount() == 65);
    REQUIRE(prober->peakInFlight() <= 4);
    REQUIRE(prober->peakInFlight() >= 2);
}

TEST_CASE("ScanPool - Small group is not starved by a large one", "[scan_pool]")
{
    auto prober = std::make_shared<FakeProber>();
    PlanError err;
    auto pool = ScanPool::start({ group("Big", "10.0.0.0/24"), group("Small", "10.9.9.1/32") }, {}, prober,
                                options(1), err);
    REQUIRE(pool);
    drain(*pool);

    auto order = prober->probedAddresses();
    REQUIRE(order.size() == 257);
    auto pos = std::find(order.begin(), order.end(), ip("10.9.9.1"));
    REQUIRE(pos != order.end());
    REQUIRE(std::distance(order.begin(), pos) < 4);
}

TEST_CASE("ScanPool - Cancellation", "[scan_pool]")
{
    // A slot freed by a finishing probe races the cancel; repeat to hit it
    for (int run = 0; run < 25; ++run)
    {
        auto prober = std::make_shared<FakeProber>();
        prober->hold();

        PlanError err;
        auto pool = ScanPool::start({ group("A", "10.0.0.0/24") }, {}, prober, options(2), err);
        REQUIRE(pool);
        REQUIRE(prober->waitForInFlight(2, std::chrono::seconds(5)));

        CancelHandle cancel = pool->cancelHandle();
        cancel.cancel();
        cancel.cancel();
        REQUIRE(cancel.cancelled());
        prober->release();

        auto events = drain(*pool);

        int probed = 0;
        bool group_completed = false;
        for (const auto& ev : events)
        {
            if (std::holds_alternative<AddressProbed>(ev))
                ++probed;
            if (std::holds_alternative<GroupCompleted>(ev))
                group_completed = true;
            REQUIRE_FALSE(std::holds_alternative<SessionCompleted>(ev));
        }

        // Only the two probes running when cancel fired were ever started
        REQUIRE(prober->probedAddresses().size() == 2);
        REQUIRE(prober->probeCount() == 2);
        REQUIRE(probed == 2);
        REQUIRE_FALSE(group_completed);
        REQUIRE(std::holds_alternative<SessionCancelled>(events.back()));
        REQUIRE(pool->events()->finished());
    }
}

TEST_CASE("ScanPool - Prober exceptions become failed outcomes", "[scan_pool]")
{
    class ThrowingProber : public network::IDeviceProber
    {
    public:
        const char* name() const override { return "throwing"; }
        network::ProbeResult probe(network::Ipv4Address, const network::DeviceFilter&,
                                   std::chrono::milliseconds) override
        {
            throw std::runtime_error("socket exploded");
        }
    };

    PlanError err;
    auto pool = ScanPool::start({ group("A", "10.0.0.0/30") }, {}, std::make_shared<ThrowingProber>(), options(2), err);
    REQUIRE(pool);
    auto events = drain(*pool);

    int failures = 0;
    for (const auto& ev : events)
    {
        if (auto* p = std::get_if<AddressProbed>(&ev))
        {
            REQUIRE(p->outcome.status == network::ProbeStatus::Transport);
            REQUIRE(p->outcome.error == "socket exploded");
            ++failures;
        }
    }
    REQUIRE(failures == 4);
    REQUIRE(std::holds_alternative<SessionCompleted>(events.back()));
}
