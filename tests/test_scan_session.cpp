#include <catch2/catch_test_macros.hpp>

#include "scanning/ScanSession.hpp"
#include "utils/fake_prober.hpp"

#include <stop_token>

using namespace scanning;
using test_utils::FakeProber;
using test_utils::ip;
using test_utils::makeSnapshot;

namespace
{

ScanTarget target(const std::string& group, const std::string& range)
{
    network::AddressRange r;
    network::ParseError err;
    REQUIRE(network::AddressRange::parse(range, r, err));
    ScanTarget t;
    t.group = group;
    t.blocks = { r };
    t.total = r.count();
    return t;
}

AddressProbed probed(const std::string& group, const std::string& addr)
{
    return AddressProbed{ group, ip(addr), network::ProbeResult::failure(network::ProbeStatus::NoDevice, "none") };
}

AddressProbed found(const std::string& group, const std::string& addr, const std::string& model)
{
    auto snapshot = makeSnapshot(model);
    snapshot.mac = "aa:bb:cc:00:00:" + addr.substr(addr.rfind('.') + 1);
    return AddressProbed{ group, ip(addr), network::ProbeResult::success(snapshot) };
}

// Session fed by hand through an EventStream the test controls
struct ManualSession
{
    std::shared_ptr<EventStream> stream = std::make_shared<EventStream>(64);
    std::stop_source stop;
    ScanSession session;

    explicit ManualSession(std::vector<ScanTarget> targets)
        : session({}, 7)
    {
        session.attach(stream, CancelHandle(stop), targets);
    }

    void push(ScanEvent ev) { REQUIRE(stream->send(std::move(ev))); }
};

config::ScanGroup group(const std::string& name, const std::string& ranges)
{
    config::ScanGroup g;
    g.name = name;
    g.ranges = ranges;
    return g;
}

} // namespace

TEST_CASE("ScanSession - State transitions", "[scan_session]")
{
    SECTION("New session is idle and processes nothing")
    {
        ScanSession s({ group("A", "10.0.0.0/30") });
        REQUIRE(s.state() == SessionState::Idle);
        REQUIRE_FALSE(s.isTerminal());
        REQUIRE_FALSE(s.processNext());
    }

    SECTION("Full event sequence completes the session")
    {
        ManualSession m({ target("A", "10.0.0.0/31") });
        REQUIRE(m.session.state() == SessionState::Running);

        m.push(found("A", "10.0.0.0", "S19"));
        m.push(GroupProgress{ "A", 1, 2 });
        m.push(probed("A", "10.0.0.1"));
        m.push(GroupProgress{ "A", 2, 2 });
        m.push(GroupCompleted{ "A" });
        m.push(SessionCompleted{});
        m.stream->close();

        // One event at a time
        REQUIRE(m.session.processNext());
        REQUIRE(m.session.probedCount() == 1);
        REQUIRE(m.session.deviceCount() == 1);
        REQUIRE(m.session.state() == SessionState::Running);

        REQUIRE(m.session.processAvailable(10) == 5);
        REQUIRE(m.session.state() == SessionState::Completed);
        REQUIRE(m.session.isTerminal());
        REQUIRE(m.session.isSettled());
        REQUIRE(m.session.eventsProcessed() == 6);

        const GroupScanState* a = m.session.group("A");
        REQUIRE(a != nullptr);
        REQUIRE(a->completed);
        REQUIRE(a->probed == 2);
        REQUIRE(a->total == 2);
        REQUIRE(a->found == 1);

        auto devices = m.session.devices("A");
        REQUIRE(devices.size() == 1);
        REQUIRE(devices[0].address == ip("10.0.0.0"));
        REQUIRE(devices[0].device_id == "aa:bb:cc:00:00:0");
        REQUIRE(devices[0].discovered_at > 0);
    }

    SECTION("Empty group completes without probes")
    {
        ManualSession m({ target("A", "10.0.0.5/32"), ScanTarget{ "Empty", {}, 0, {} } });
        m.push(GroupCompleted{ "Empty" });
        m.push(probed("A", "10.0.0.5"));
        m.push(GroupCompleted{ "A" });
        m.push(SessionCompleted{});
        m.stream->close();

        m.session.runToCompletion();
        REQUIRE(m.session.state() == SessionState::Completed);
    }
}

TEST_CASE("ScanSession - Cancellation", "[scan_session]")
{
    ManualSession m({ target("A", "10.0.0.0/30") });
    m.push(found("A", "10.0.0.1", "S19"));
    REQUIRE(m.session.processNext());

    m.session.cancel();
    REQUIRE(m.session.state() == SessionState::Cancelled);
    REQUIRE(m.stop.stop_requested());
    REQUIRE(m.session.isTerminal());
    REQUIRE_FALSE(m.session.isSettled());

    SECTION("Results arriving after cancel are drained but not applied")
    {
        m.push(found("A", "10.0.0.2", "S21"));
        m.push(SessionCancelled{});
        m.stream->close();
        m.session.runToCompletion();

        REQUIRE(m.session.state() == SessionState::Cancelled);
        REQUIRE(m.session.isSettled());
        REQUIRE(m.session.deviceCount() == 1);
        REQUIRE(m.session.probedCount() == 1);
        REQUIRE_FALSE(m.session.group("A")->completed);
    }

    SECTION("Second cancel is a no-op")
    {
        m.session.cancel();
        REQUIRE(m.session.state() == SessionState::Cancelled);
    }
}

TEST_CASE("ScanSession - Duplicate address keeps the latest result", "[scan_session]")
{
    ManualSession m({ target("A", "10.0.0.0/31") });
    m.push(found("A", "10.0.0.1", "S19"));
    m.push(found("A", "10.0.0.1", "S21"));
    m.session.processAvailable(10);

    auto devices = m.session.devices("A");
    REQUIRE(devices.size() == 1);
    REQUIRE(devices[0].snapshot.model == "S21");
    REQUIRE(m.session.group("A")->probed == 1);
}

TEST_CASE("ScanSession - Engine faults", "[scan_session]")
{
    SECTION("Event for a group outside the scan")
    {
        ManualSession m({ target("A", "10.0.0.0/31") });
        m.push(probed("Ghost", "10.0.0.1"));
        m.session.processNext();

        REQUIRE(m.session.state() == SessionState::Failed);
        REQUIRE(m.session.isSettled());
        REQUIRE(m.session.failure().find("Ghost") != std::string::npos);
        REQUIRE(m.stop.stop_requested());
        REQUIRE(m.stream->closed());
    }

    SECTION("Group reported complete before all its addresses")
    {
        ManualSession m({ target("A", "10.0.0.0/30") });
        m.push(probed("A", "10.0.0.0"));
        m.push(GroupCompleted{ "A" });
        m.session.processAvailable(10);

        REQUIRE(m.session.state() == SessionState::Failed);
    }

    SECTION("Session completed with a group still open")
    {
        ManualSession m({ target("A", "10.0.0.0/31"), target("B", "10.0.1.0/31") });
        m.push(probed("A", "10.0.0.0"));
        m.push(probed("A", "10.0.0.1"));
        m.push(GroupCompleted{ "A" });
        m.push(SessionCompleted{});
        m.session.processAvailable(10);

        REQUIRE(m.session.state() == SessionState::Failed);
        REQUIRE(m.session.failure().find("'B'") != std::string::npos);
    }

    SECTION("Stream closed without a terminal event")
    {
        ManualSession m({ target("A", "10.0.0.0/31") });
        m.push(probed("A", "10.0.0.0"));
        m.stream->close();
        m.session.runToCompletion();

        REQUIRE(m.session.state() == SessionState::Failed);
        REQUIRE(m.session.isSettled());
    }

    SECTION("Failed session ignores further input")
    {
        ManualSession m({ target("A", "10.0.0.0/31") });
        m.push(probed("Ghost", "10.0.0.1"));
        m.session.processNext();
        REQUIRE_FALSE(m.session.processNext());
        REQUIRE(m.session.eventsProcessed() == 1);
    }
}

TEST_CASE("ScanSession - Driven by a real scan pool", "[scan_session]")
{
    auto prober = std::make_shared<FakeProber>();
    prober->setDevice("10.0.0.2", makeSnapshot("S19"));
    prober->setDevice("10.0.1.9", makeSnapshot("Gamma", network::MinerMake::Bitaxe, network::MinerFirmware::AxeOS));

    ScanOptions options;
    options.concurrency_limit = 4;
    options.channel_capacity = 4;

    SECTION("Scan runs to completion")
    {
        ScanSession s({ group("A", "10.0.0.0/29"), group("B", "10.0.1.0/28") }, 1);
        PlanError err;
        REQUIRE(s.start(prober, {}, options, err));
        s.runToCompletion();

        REQUIRE(s.state() == SessionState::Completed);
        REQUIRE(s.probedCount() == 24);
        REQUIRE(s.totalCount() == 24);
        REQUIRE(s.devices("A").size() == 1);
        REQUIRE(s.devices("B").size() == 1);
        REQUIRE(s.devices("B")[0].snapshot.make == network::MinerMake::Bitaxe);
    }

    SECTION("Invalid range leaves the session idle")
    {
        ScanSession s({ group("A", "10.0.0.0/33") });
        PlanError err;
        REQUIRE_FALSE(s.start(prober, {}, options, err));
        REQUIRE(s.state() == SessionState::Idle);
        REQUIRE(err.group == "A");
        REQUIRE(prober->probeCount() == 0);
    }

    SECTION("Starting twice is rejected")
    {
        ScanSession s({ group("A", "10.0.0.0/31") });
        PlanError err;
        REQUIRE(s.start(prober, {}, options, err));
        err.group = "stale";
        REQUIRE_FALSE(s.start(prober, {}, options, err));
        REQUIRE(err.group.empty());
        REQUIRE(err.parse.message.empty());
        REQUIRE(s.state() == SessionState::Running);
        s.runToCompletion();
        REQUIRE(s.state() == SessionState::Completed);
    }

    SECTION("Cancel mid-scan settles as cancelled")
    {
        prober->hold();
        ScanSession s({ group("A", "10.0.0.0/24") });
        PlanError err;
        REQUIRE(s.start(prober, {}, options, err));
        REQUIRE(prober->waitForInFlight(4, std::chrono::seconds(5)));

        s.cancel();
        prober->release();
        s.runToCompletion();

        REQUIRE(s.state() == SessionState::Cancelled);
        REQUIRE(s.isSettled());
        REQUIRE(s.probedCount() == 0);
        REQUIRE(prober->probedAddresses().size() == 4);
    }
}
