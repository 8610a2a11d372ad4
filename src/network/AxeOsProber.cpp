#include "AxeOsProber.hpp"

#include "../utils/HttpCommon.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>

using json = nlohmann::json;

namespace network
{

namespace
{

constexpr std::uint32_t kMaxAsics = 1024;

std::optional<double> number(const json& j, const char* key)
{
    if (j.contains(key) && j[key].is_number())
        return j[key].get<double>();
    return std::nullopt;
}

std::string text(const json& j, const char* key)
{
    if (j.contains(key) && j[key].is_string())
        return j[key].get<std::string>();
    return {};
}

} // namespace

ProbeResult AxeOsProber::parseSystemInfo(const std::string& body)
{
    json j;
    try
    {
        j = json::parse(body);
    }
    catch (const json::exception& e)
    {
        return ProbeResult::failure(ProbeStatus::Protocol, std::string("system info is not JSON: ") + e.what());
    }

    // Any web server can answer on port 80; AxeOS always reports these two
    if (!j.is_object() || !j.contains("ASICModel") || !j.contains("hashRate"))
        return ProbeResult::failure(ProbeStatus::NoDevice, "not an AxeOS system info document");

    DeviceSnapshot snap;
    snap.make = MinerMake::Bitaxe;
    snap.firmware = MinerFirmware::AxeOS;
    snap.hostname = text(j, "hostname");
    snap.mac = text(j, "macAddr");
    snap.firmware_version = text(j, "version");

    const std::string asic = text(j, "ASICModel");
    std::string model = text(j, "deviceModel");
    if (model.empty())
        model = "Bitaxe";
    snap.model = asic.empty() ? model : model + " (" + asic + ")";

    // hashRate and expectedHashrate are GH/s
    if (auto ghs = number(j, "hashRate"))
        snap.hashrate_ths = *ghs / 1000.0;
    if (auto expected = number(j, "expectedHashrate"))
        snap.expected_hashrate_ths = *expected / 1000.0;
    snap.temperature_c = number(j, "temp");
    if (auto rpm = number(j, "fanrpm"))
        snap.fan_rpms.push_back(*rpm);
    // Configured ASIC count; AxeOS has no per-chip health
    if (auto chips = number(j, "asicCount"); chips && *chips > 0.0)
        snap.total_chips = *chips >= kMaxAsics ? kMaxAsics : static_cast<std::uint32_t>(*chips);
    if (auto power = number(j, "power"); power && *power > 0.0)
        snap.power_w = *power;

    if (number(j, "overheat_mode").value_or(0.0) != 0.0)
        snap.messages.emplace_back("overheat mode active");

    snap.is_mining = snap.hashrate_ths.value_or(0.0) > 0.0;
    return ProbeResult::success(std::move(snap));
}

ProbeResult AxeOsProber::probe(Ipv4Address address, const DeviceFilter& filter, std::chrono::milliseconds timeout)
{
    utils::SessionConfig cfg;
    cfg.connect_timeout_ms = static_cast<int>(timeout.count());
    cfg.timeout_ms = static_cast<int>(timeout.count());

    const std::string url = "http://" + address.toString() + "/api/system/info";
    auto resp = utils::get(url, {}, cfg);
    if (!resp.error.empty())
    {
        if (resp.timed_out)
            return ProbeResult::failure(ProbeStatus::Timeout, resp.error);
        // Refused connections mean there is no web server, not a broken one
        if (resp.error.find("refused") != std::string::npos || resp.error.find("connect to") != std::string::npos)
            return ProbeResult::failure(ProbeStatus::NoDevice, resp.error);
        return ProbeResult::failure(ProbeStatus::Transport, resp.error);
    }
    if (!resp.ok())
        return ProbeResult::failure(ProbeStatus::NoDevice, "HTTP " + std::to_string(resp.status_code) + " from " + url);

    ProbeResult result = parseSystemInfo(resp.text);
    if (!result.found())
    {
        PLOG_DEBUG << "axeos probe " << address.toString() << ": " << result.error;
        return result;
    }
    if (!filter.matches(result.device))
        return ProbeResult::failure(ProbeStatus::Filtered, "Bitaxe / AxeOS excluded by filter");
    return result;
}

} // namespace network
