#include "fake_prober.hpp"

#include <stdexcept>
#include <thread>

namespace test_utils {

network::ProbeResult FakeProber::probe(network::Ipv4Address address, const network::DeviceFilter& filter,
                                       std::chrono::milliseconds) {
    {
        std::unique_lock<std::mutex> lock(m_);
        ++in_flight_;
        probed_.push_back(address);
        int peak = peak_in_flight_.load();
        while (in_flight_ > peak && !peak_in_flight_.compare_exchange_weak(peak, in_flight_)) {
        }
        cv_.notify_all();
        cv_.wait(lock, [&] { return !held_; });
    }
    probe_count_.fetch_add(1);

    if (delay_.count() > 0)
        std::this_thread::sleep_for(delay_);

    network::ProbeResult result = network::ProbeResult::failure(network::ProbeStatus::NoDevice, "nothing here");
    auto it = responses_.find(address);
    if (it != responses_.end())
        result = it->second;
    if (result.found() && !filter.matches(result.device))
        result = network::ProbeResult::failure(network::ProbeStatus::Filtered, "filtered");

    {
        std::lock_guard<std::mutex> lock(m_);
        --in_flight_;
    }
    return result;
}

void FakeProber::setDevice(const std::string& text, network::DeviceSnapshot snapshot) {
    responses_[ip(text)] = network::ProbeResult::success(std::move(snapshot));
}

void FakeProber::setFailure(const std::string& text, network::ProbeStatus status) {
    responses_[ip(text)] = network::ProbeResult::failure(status, network::probeStatusName(status));
}

void FakeProber::hold() {
    std::lock_guard<std::mutex> lock(m_);
    held_ = true;
}

void FakeProber::release() {
    {
        std::lock_guard<std::mutex> lock(m_);
        held_ = false;
    }
    cv_.notify_all();
}

bool FakeProber::waitForInFlight(int n, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_);
    return cv_.wait_for(lock, timeout, [&] { return in_flight_ >= n; });
}

std::vector<network::Ipv4Address> FakeProber::probedAddresses() const {
    std::lock_guard<std::mutex> lock(m_);
    return probed_;
}

network::DeviceSnapshot makeSnapshot(const std::string& model, network::MinerMake make,
                                     network::MinerFirmware firmware) {
    network::DeviceSnapshot s;
    s.make = make;
    s.firmware = firmware;
    s.model = model;
    s.firmware_version = "1.0";
    s.is_mining = true;
    s.hashrate_ths = 100.0;
    s.expected_hashrate_ths = 100.0;
    s.temperature_c = 60.0;
    s.fan_rpms = { 4000.0, 4000.0 };
    return s;
}

network::Ipv4Address ip(const std::string& text) {
    auto parsed = network::Ipv4Address::parse(text);
    if (!parsed)
        throw std::invalid_argument("bad test address " + text);
    return *parsed;
}

}  // namespace test_utils
