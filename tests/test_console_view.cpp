#include <catch2/catch_test_macros.hpp>
#include "app/ConsoleView.hpp"
#include "utils/fake_prober.hpp"

#include <sstream>

using test_utils::ip;
using test_utils::makeSnapshot;

TEST_CASE("ConsoleView - Group results", "[console]")
{
    std::ostringstream out;
    app::ConsoleView view(out);

    SECTION("Never scanned group")
    {
        view.printGroupResults("Rack1", nullptr);
        REQUIRE(out.str() == "\n== Rack1 == (never scanned)\n");
    }

    SECTION("Health issues are listed under their device")
    {
        config::GroupResults results;
        results.partial = true;

        network::DiscoveredDevice ok;
        ok.address = ip("10.0.0.1");
        ok.snapshot = makeSnapshot("Antminer S19");
        results.devices.push_back(ok);

        network::DiscoveredDevice hurt;
        hurt.address = ip("10.0.0.2");
        hurt.snapshot = makeSnapshot("Antminer S19j Pro");
        hurt.snapshot.board_chips = { 126, 0, 126 };
        hurt.snapshot.messages = { "chain 2 open" };
        results.devices.push_back(hurt);

        view.printGroupResults("Rack1", &results);
        const std::string text = out.str();

        REQUIRE(text.find("no complete scan [partial]") != std::string::npos);
        REQUIRE(text.find("    X [boards] 1 board(s) with no working chips\n") != std::string::npos);
        REQUIRE(text.find("    ! [other] chain 2 open\n") != std::string::npos);
        // Issues follow the row of the device they belong to
        REQUIRE(text.find("10.0.0.2") < text.find("[boards]"));
        REQUIRE(text.find("10.0.0.1") < text.find("10.0.0.2"));
    }
}
