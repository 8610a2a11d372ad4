#pragma once

#include "network/IDeviceProber.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace test_utils {

// Scripted prober: answers from a table instead of the network and records
// how it was called.
class FakeProber : public network::IDeviceProber {
public:
    const char* name() const override { return "fake"; }
    network::ProbeResult probe(network::Ipv4Address address, const network::DeviceFilter& filter,
                               std::chrono::milliseconds timeout) override;

    void setDevice(const std::string& ip, network::DeviceSnapshot snapshot);
    void setFailure(const std::string& ip, network::ProbeStatus status);

    // Every probe sleeps this long before answering
    void setDelay(std::chrono::milliseconds delay) { delay_ = delay; }

    // While held, probes block until release()
    void hold();
    void release();

    // Block until at least n probes are running; false on timeout
    bool waitForInFlight(int n, std::chrono::milliseconds timeout);

    int peakInFlight() const { return peak_in_flight_.load(); }
    int probeCount() const { return probe_count_.load(); }
    std::vector<network::Ipv4Address> probedAddresses() const;

private:
    std::map<network::Ipv4Address, network::ProbeResult> responses_;
    std::chrono::milliseconds delay_{ 0 };

    mutable std::mutex m_;
    std::condition_variable cv_;
    bool held_ = false;
    int in_flight_ = 0;
    std::vector<network::Ipv4Address> probed_;

    std::atomic<int> peak_in_flight_{ 0 };
    std::atomic<int> probe_count_{ 0 };
};

// Snapshot of a healthy miner with the given model
network::DeviceSnapshot makeSnapshot(const std::string& model,
                                     network::MinerMake make = network::MinerMake::AntMiner,
                                     network::MinerFirmware firmware = network::MinerFirmware::Stock);

network::Ipv4Address ip(const std::string& text);

}  // namespace test_utils
