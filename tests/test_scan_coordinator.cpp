#include <catch2/catch_test_macros.hpp>
#include "scanning/ScanCoordinator.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/fake_prober.hpp"
#include <filesystem>

using namespace scanning;
using test_utils::FakeProber;
using test_utils::makeSnapshot;
namespace fs = std::filesystem;

// Config file path removed (with its side files) when the test ends
class TempStorePath
{
public:
    TempStorePath(const std::string& name)
        : path_(name)
    {
        cleanup();
    }

    ~TempStorePath() { cleanup(); }

    std::string getPath() const { return path_; }

private:
    void cleanup()
    {
        std::error_code ec;
        fs::remove(path_, ec);
        fs::remove(path_ + ".tmp", ec);
        fs::remove(path_ + ".bak", ec);
    }

    std::string path_;
};

namespace
{

config::PersistedConfig rackConfig()
{
    config::PersistedConfig cfg;
    cfg.groups.push_back({ "Rack1", "10.0.0.0/30", true, {} });
    cfg.groups.push_back({ "Rack2", "10.0.1.0/30", false, {} });
    cfg.groups.push_back({ "Broken", "10.0.2.9-3", false, {} });
    return cfg;
}

ScannerSettings testSettings()
{
    ScannerSettings s;
    s.applyDefaults();
    s.concurrency_limit = 2;
    s.probe_timeout = std::chrono::milliseconds(100);
    s.channel_capacity = 16;
    return s;
}

std::vector<SessionOutcome> pumpUntilSettled(ScanCoordinator& coordinator)
{
    std::vector<SessionOutcome> outcomes;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (coordinator.hasActiveSessions() && std::chrono::steady_clock::now() < deadline)
    {
        auto settled = coordinator.pump(64, std::chrono::milliseconds(20));
        outcomes.insert(outcomes.end(), settled.begin(), settled.end());
    }
    return outcomes;
}

} // namespace

TEST_CASE("ScanCoordinator - Scan merges and saves", "[coordinator]")
{
    TempStorePath temp("test_coordinator_config.json");
    config::ConfigStore store(temp.getPath());

    auto prober = std::make_shared<FakeProber>();
    prober->setDevice("10.0.0.1", makeSnapshot("Antminer S19"));
    prober->setDevice("10.0.0.2", makeSnapshot("Antminer S21"));
    prober->setFailure("10.0.0.0", network::ProbeStatus::Timeout);
    prober->setFailure("10.0.0.3", network::ProbeStatus::Timeout);

    ScanCoordinator coordinator(store, rackConfig(), testSettings(), prober);

    auto started = coordinator.startScan({ "Rack1" });
    REQUIRE(started.ok());
    REQUIRE(started.session_id == 1);
    REQUIRE(coordinator.isScanning("Rack1"));
    REQUIRE_FALSE(coordinator.isScanning("Rack2"));

    auto outcomes = pumpUntilSettled(coordinator);
    REQUIRE(outcomes.size() == 1);
    REQUIRE(outcomes[0].state == SessionState::Completed);
    REQUIRE(outcomes[0].merged);
    REQUIRE(outcomes[0].devices == 2);
    REQUIRE(outcomes[0].save.ok);
    REQUIRE(outcomes[0].groups == std::vector<std::string>{ "Rack1" });

    REQUIRE_FALSE(coordinator.isScanning("Rack1"));
    REQUIRE_FALSE(coordinator.hasUnsavedChanges());
    REQUIRE(prober->peakInFlight() <= 2);

    const auto* results = coordinator.config().findResults("Rack1");
    REQUIRE(results != nullptr);
    REQUIRE(results->devices.size() == 2);
    REQUIRE(results->last_scan.has_value());
    REQUIRE_FALSE(results->partial);

    // What was saved is what is committed
    config::ConfigStore reread(temp.getPath());
    REQUIRE(reread.load() == coordinator.config());
    REQUIRE(reread.lastLoadOutcome() == config::ConfigStore::LoadOutcome::Loaded);
}

TEST_CASE("ScanCoordinator - Start rejections", "[coordinator]")
{
    TempStorePath temp("test_coordinator_reject.json");
    config::ConfigStore store(temp.getPath());
    auto prober = std::make_shared<FakeProber>();
    utils::ErrorReporter::ClearErrors();

    ScanCoordinator coordinator(store, rackConfig(), testSettings(), prober);

    SECTION("Group already part of a running scan")
    {
        prober->hold();
        REQUIRE(coordinator.startScan({ "Rack1" }).ok());

        auto again = coordinator.startScan({ "Rack2", "Rack1" });
        REQUIRE(again.kind == StartKind::AlreadyScanning);
        REQUIRE(again.group == "Rack1");
        REQUIRE(coordinator.activeSessions().size() == 1);

        // A disjoint group may still run alongside
        auto other = coordinator.startScan({ "Rack2" });
        REQUIRE(other.ok());
        REQUIRE(other.session_id == 2);

        prober->release();
        auto outcomes = pumpUntilSettled(coordinator);
        REQUIRE(outcomes.size() == 2);
        REQUIRE(coordinator.startScan({ "Rack1" }).ok());
        coordinator.cancelAll();
        pumpUntilSettled(coordinator);
    }

    SECTION("Unknown group")
    {
        auto r = coordinator.startScan({ "Nowhere" });
        REQUIRE(r.kind == StartKind::UnknownGroup);
        REQUIRE(r.group == "Nowhere");
        REQUIRE_FALSE(coordinator.hasActiveSessions());
    }

    SECTION("Invalid range")
    {
        auto r = coordinator.startScan({ "Rack1", "Broken" });
        REQUIRE(r.kind == StartKind::InvalidRange);
        REQUIRE(r.group == "Broken");
        REQUIRE_FALSE(coordinator.hasActiveSessions());
        REQUIRE(prober->probeCount() == 0);
        REQUIRE(utils::ErrorReporter::HasPendingErrors());
    }

    SECTION("No groups")
    {
        REQUIRE(coordinator.startScan({}).kind == StartKind::NoGroups);
    }

    SECTION("Only enabled groups are scanned by default")
    {
        auto r = coordinator.startEnabled();
        REQUIRE(r.ok());
        REQUIRE(coordinator.isScanning("Rack1"));
        REQUIRE_FALSE(coordinator.isScanning("Rack2"));
        pumpUntilSettled(coordinator);
    }

    utils::ErrorReporter::GetPendingErrors();
}

TEST_CASE("ScanCoordinator - Cancel keeps partial results", "[coordinator]")
{
    TempStorePath temp("test_coordinator_cancel.json");
    config::ConfigStore store(temp.getPath());
    auto prober = std::make_shared<FakeProber>();
    prober->hold();

    auto cfg = rackConfig();
    cfg.groups[0].ranges = "10.0.0.0/24";
    ScanCoordinator coordinator(store, cfg, testSettings(), prober);

    auto r = coordinator.startScan({ "Rack1" });
    REQUIRE(r.ok());
    REQUIRE(prober->waitForInFlight(2, std::chrono::seconds(5)));

    REQUIRE(coordinator.cancel(r.session_id));
    REQUIRE_FALSE(coordinator.cancel(999));
    prober->release();

    auto outcomes = pumpUntilSettled(coordinator);
    REQUIRE(outcomes.size() == 1);
    REQUIRE(outcomes[0].state == SessionState::Cancelled);
    REQUIRE(outcomes[0].merged);

    const auto* results = coordinator.config().findResults("Rack1");
    REQUIRE(results != nullptr);
    REQUIRE(results->partial);
    REQUIRE_FALSE(results->last_scan.has_value());
}

TEST_CASE("ScanCoordinator - Save failure keeps results in memory", "[coordinator]")
{
    config::ConfigStore store("no_such_directory/nested/config.json");
    auto prober = std::make_shared<FakeProber>();
    prober->setDevice("10.0.0.1", makeSnapshot("Antminer S19"));

    ScanCoordinator coordinator(store, rackConfig(), testSettings(), prober);
    REQUIRE(coordinator.startScan({ "Rack1" }).ok());

    auto outcomes = pumpUntilSettled(coordinator);
    REQUIRE(outcomes.size() == 1);
    REQUIRE(outcomes[0].merged);
    REQUIRE_FALSE(outcomes[0].save.ok);
    REQUIRE_FALSE(outcomes[0].save.error.empty());

    REQUIRE(coordinator.hasUnsavedChanges());
    REQUIRE(coordinator.config().findResults("Rack1")->devices.size() == 1);
    REQUIRE_FALSE(coordinator.retrySave().ok);
    REQUIRE(coordinator.hasUnsavedChanges());

    auto errors = utils::ErrorReporter::GetPendingErrors();
    bool persistence = false;
    for (const auto& e : errors)
        persistence = persistence || e.category == utils::ErrorCategory::Persistence;
    REQUIRE(persistence);
}

TEST_CASE("ScanCoordinator - Replacing the config while scanning", "[coordinator]")
{
    TempStorePath temp("test_coordinator_replace.json");
    config::ConfigStore store(temp.getPath());
    auto prober = std::make_shared<FakeProber>();
    prober->setDevice("10.0.0.1", makeSnapshot("Antminer S19"));
    prober->hold();

    ScanCoordinator coordinator(store, rackConfig(), testSettings(), prober);
    REQUIRE(coordinator.startScan({ "Rack1" }).ok());

    auto edited = coordinator.config();
    edited.groups.erase(edited.groups.begin());
    REQUIRE(coordinator.replaceConfig(edited).ok);
    prober->release();

    auto outcomes = pumpUntilSettled(coordinator);
    REQUIRE(outcomes.size() == 1);
    REQUIRE(outcomes[0].state == SessionState::Completed);
    REQUIRE(coordinator.config().findGroup("Rack1") == nullptr);
    REQUIRE(coordinator.config().findResults("Rack1") == nullptr);
}
