#include "ConfigStore.hpp"
#include "../utils/ErrorReporter.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>

#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace config
{

namespace
{

template <typename T>
json optionalToJson(const std::optional<T>& v)
{
    return v ? json(*v) : json(nullptr);
}

template <typename T>
std::optional<T> optionalFromJson(const json& obj, const char* key)
{
    if (obj.contains(key) && obj[key].is_number())
        return obj[key].get<T>();
    return std::nullopt;
}

json filterToJson(const network::DeviceFilter& filter)
{
    json makes = json::array();
    for (auto m : filter.makes)
        makes.push_back(network::makeName(m));
    json firmwares = json::array();
    for (auto f : filter.firmwares)
        firmwares.push_back(network::firmwareName(f));
    return json{ { "makes", makes }, { "firmwares", firmwares } };
}

network::DeviceFilter filterFromJson(const json& j)
{
    network::DeviceFilter filter;
    if (!j.is_object())
        return filter;
    if (j.contains("makes") && j["makes"].is_array())
    {
        for (const auto& m : j["makes"])
        {
            if (m.is_string())
                filter.makes.push_back(network::makeFromName(m.get<std::string>()));
        }
    }
    if (j.contains("firmwares") && j["firmwares"].is_array())
    {
        for (const auto& f : j["firmwares"])
        {
            if (f.is_string())
                filter.firmwares.push_back(network::firmwareFromName(f.get<std::string>()));
        }
    }
    return filter;
}

json deviceToJson(const network::DiscoveredDevice& d)
{
    const auto& s = d.snapshot;
    return json{
        { "ip", d.address.toString() },
        { "device_id", d.device_id },
        { "discovered_at", d.discovered_at },
        { "make", network::makeName(s.make) },
        { "firmware", network::firmwareName(s.firmware) },
        { "model", s.model },
        { "firmware_version", s.firmware_version },
        { "hostname", s.hostname },
        { "mac", s.mac },
        { "is_mining", s.is_mining },
        { "hashrate_ths", optionalToJson(s.hashrate_ths) },
        { "expected_hashrate_ths", optionalToJson(s.expected_hashrate_ths) },
        { "temperature_c", optionalToJson(s.temperature_c) },
        { "fan_rpms", s.fan_rpms },
        { "total_chips", optionalToJson(s.total_chips) },
        { "expected_chips", optionalToJson(s.expected_chips) },
        { "board_chips", s.board_chips },
        { "power_w", optionalToJson(s.power_w) },
        { "messages", s.messages },
    };
}

bool deviceFromJson(const json& j, network::DiscoveredDevice& out)
{
    if (!j.is_object())
        return false;
    auto addr = network::Ipv4Address::parse(j.value("ip", ""));
    if (!addr)
        return false;

    out.address = *addr;
    out.device_id = j.value("device_id", "");
    out.discovered_at = j.value("discovered_at", std::int64_t{ 0 });

    auto& s = out.snapshot;
    s.make = network::makeFromName(j.value("make", ""));
    s.firmware = network::firmwareFromName(j.value("firmware", ""));
    s.model = j.value("model", "");
    s.firmware_version = j.value("firmware_version", "");
    s.hostname = j.value("hostname", "");
    s.mac = j.value("mac", "");
    s.is_mining = j.value("is_mining", false);
    s.hashrate_ths = optionalFromJson<double>(j, "hashrate_ths");
    s.expected_hashrate_ths = optionalFromJson<double>(j, "expected_hashrate_ths");
    s.temperature_c = optionalFromJson<double>(j, "temperature_c");
    s.total_chips = optionalFromJson<std::uint32_t>(j, "total_chips");
    s.expected_chips = optionalFromJson<std::uint32_t>(j, "expected_chips");
    if (j.contains("fan_rpms") && j["fan_rpms"].is_array())
    {
        for (const auto& rpm : j["fan_rpms"])
        {
            if (rpm.is_number())
                s.fan_rpms.push_back(rpm.get<double>());
        }
    }
    s.power_w = optionalFromJson<double>(j, "power_w");
    if (j.contains("board_chips") && j["board_chips"].is_array())
    {
        for (const auto& chips : j["board_chips"])
        {
            if (chips.is_number_unsigned())
                s.board_chips.push_back(chips.get<std::uint32_t>());
        }
    }
    if (j.contains("messages") && j["messages"].is_array())
    {
        for (const auto& msg : j["messages"])
        {
            if (msg.is_string())
                s.messages.push_back(msg.get<std::string>());
        }
    }
    return true;
}

} // namespace

ConfigStore::ConfigStore(std::string path)
    : path_(std::move(path))
{
}

std::string ConfigStore::serialize(const PersistedConfig& cfg)
{
    json root;
    root["version"] = cfg.version;

    json groups = json::array();
    for (const auto& g : cfg.groups)
    {
        groups.push_back(json{ { "name", g.name },
                               { "network_range", g.ranges },
                               { "enabled", g.enabled },
                               { "filter", filterToJson(g.filter) } });
    }
    root["scan_groups"] = std::move(groups);

    json results = json::object();
    for (const auto& [name, r] : cfg.results)
    {
        json devices = json::array();
        for (const auto& d : r.devices)
            devices.push_back(deviceToJson(d));
        results[name] = json{ { "last_scan", optionalToJson(r.last_scan) },
                              { "partial", r.partial },
                              { "devices", std::move(devices) } };
    }
    root["last_scan_results"] = std::move(results);

    // Device-reported strings are not guaranteed to be UTF-8
    return root.dump(2, ' ', false, json::error_handler_t::replace);
}

bool ConfigStore::deserialize(const std::string& text, PersistedConfig& out, std::string& outError)
{
    try
    {
        json root = json::parse(text);
        if (!root.is_object())
        {
            outError = "top level is not a JSON object";
            return false;
        }

        PersistedConfig cfg;
        cfg.version = root.value("version", PersistedConfig::kCurrentVersion);
        if (cfg.version > PersistedConfig::kCurrentVersion)
            PLOG_WARNING << "Config version " << cfg.version << " is newer than supported version "
                         << PersistedConfig::kCurrentVersion << "; unknown fields are ignored";

        std::set<std::string> names;
        if (root.contains("scan_groups") && root["scan_groups"].is_array())
        {
            for (const auto& gj : root["scan_groups"])
            {
                ScanGroup g;
                g.name = gj.value("name", "");
                g.ranges = gj.value("network_range", "");
                g.enabled = gj.value("enabled", true);
                if (gj.contains("filter"))
                    g.filter = filterFromJson(gj["filter"]);

                if (g.name.empty() || !names.insert(g.name).second)
                {
                    PLOG_WARNING << "Skipping scan group with empty or duplicate name '" << g.name << "'";
                    continue;
                }
                cfg.groups.push_back(std::move(g));
            }
        }

        if (root.contains("last_scan_results") && root["last_scan_results"].is_object())
        {
            for (const auto& [name, rj] : root["last_scan_results"].items())
            {
                GroupResults r;
                r.last_scan = optionalFromJson<std::int64_t>(rj, "last_scan");
                r.partial = rj.value("partial", false);
                if (rj.contains("devices") && rj["devices"].is_array())
                {
                    for (const auto& dj : rj["devices"])
                    {
                        network::DiscoveredDevice d;
                        if (deviceFromJson(dj, d))
                            r.devices.push_back(std::move(d));
                        else
                            PLOG_WARNING << "Skipping stored device without a valid ip in group '" << name << "'";
                    }
                }
                cfg.results[name] = std::move(r);
            }
        }

        out = std::move(cfg);
        return true;
    }
    catch (const json::exception& e)
    {
        outError = std::string("JSON parse error: ") + e.what();
        return false;
    }
}

PersistedConfig ConfigStore::load()
{
    std::ifstream ifs(path_, std::ios::binary);
    if (!ifs)
    {
        PLOG_INFO << path_ << " not found, creating default configuration";
        last_outcome_ = LoadOutcome::CreatedDefault;
        PersistedConfig cfg = PersistedConfig::makeDefault();
        if (auto r = save(cfg); !r)
            PLOG_WARNING << "Could not write default configuration: " << r.error;
        return cfg;
    }

    std::stringstream buffer;
    buffer << ifs.rdbuf();
    ifs.close();

    PersistedConfig cfg;
    std::string error;
    if (deserialize(buffer.str(), cfg, error))
    {
        last_outcome_ = LoadOutcome::Loaded;
        PLOG_INFO << "Loaded " << cfg.groups.size() << " scan group(s) from " << path_;
        return cfg;
    }

    last_outcome_ = LoadOutcome::RecoveredFromCorrupt;
    const std::string backup = path_ + ".bak";
    std::error_code ec;
    fs::rename(path_, backup, ec);
    cfg = PersistedConfig::makeDefault();
    if (ec)
    {
        // Writing the default now would destroy the only copy
        last_outcome_ = LoadOutcome::CorruptLeftInPlace;
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Persistence,
                                          "Saved scan configuration could not be read or backed up; "
                                          "defaults are used but not written",
                                          error + "\nBackup to " + backup + " failed: " + ec.message());
        return cfg;
    }

    utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Persistence,
                                        "Saved scan configuration could not be read; starting from defaults",
                                        error + "\nOriginal kept as " + backup);

    if (auto r = save(cfg); !r)
        PLOG_WARNING << "Could not write default configuration: " << r.error;
    return cfg;
}

SaveResult ConfigStore::save(const PersistedConfig& cfg)
{
    SaveResult result;
    std::string text;
    try
    {
        text = serialize(cfg);
    }
    catch (const json::exception& e)
    {
        result.ok = false;
        result.error = std::string("could not encode configuration: ") + e.what();
        return result;
    }

    const std::string tmp = path_ + ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs)
        {
            result.ok = false;
            result.error = "could not open " + tmp + " for writing";
            return result;
        }
        ofs << text;
        ofs.flush();
        if (!ofs)
        {
            result.ok = false;
            result.error = "write to " + tmp + " failed";
            return result;
        }
    }

    std::error_code ec;
    fs::rename(tmp, path_, ec);
    if (ec)
    {
        result.ok = false;
        result.error = "could not replace " + path_ + ": " + ec.message();
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return result;
    }

    PLOG_DEBUG << "Saved scan configuration to " << path_;
    return result;
}

} // namespace config
