#include "StateSerializer.hpp"
#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <iterator>

namespace
{

constexpr const char* kScannerKeys[] = { "concurrency_limit", "probe_timeout_ms", "channel_capacity",
                                         "cancelled_scan_policy", "probers", "cgminer_port" };

void warnInvalid(const std::string& key, const std::string& detail)
{
    utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                        "Invalid [scanner] " + key + ", using the default", detail);
}

} // namespace

const char* StateSerializer::policyToString(ScannerSettings::CancelledScanPolicy policy)
{
    switch (policy)
    {
    case ScannerSettings::CancelledScanPolicy::MarkPartial:
        return "mark_partial";
    case ScannerSettings::CancelledScanPolicy::KeepTimestamp:
        return "keep_timestamp";
    }
    return "mark_partial";
}

bool StateSerializer::policyFromString(const std::string& text, ScannerSettings::CancelledScanPolicy& out)
{
    if (text == "mark_partial")
    {
        out = ScannerSettings::CancelledScanPolicy::MarkPartial;
        return true;
    }
    if (text == "keep_timestamp")
    {
        out = ScannerSettings::CancelledScanPolicy::KeepTimestamp;
        return true;
    }
    return false;
}

toml::table StateSerializer::serializeScanner(const ScannerSettings& settings)
{
    toml::table t;
    t.insert("concurrency_limit", static_cast<int64_t>(settings.concurrency_limit));
    t.insert("probe_timeout_ms", static_cast<int64_t>(settings.probe_timeout.count()));
    t.insert("channel_capacity", static_cast<int64_t>(settings.channel_capacity));
    t.insert("cancelled_scan_policy", policyToString(settings.cancelled_scan_policy));

    toml::array probers;
    for (const auto& p : settings.probers)
        probers.push_back(p);
    t.insert("probers", std::move(probers));

    t.insert("cgminer_port", static_cast<int64_t>(settings.cgminer_port));
    return t;
}

void StateSerializer::deserializeScanner(const toml::table& tbl, ScannerSettings& settings)
{
    settings.applyDefaults();

    if (auto v = tbl["concurrency_limit"].value<int64_t>())
    {
        const auto clamped = std::clamp<int64_t>(*v, static_cast<int64_t>(ScannerSettings::MinConcurrency),
                                                 static_cast<int64_t>(ScannerSettings::MaxConcurrency));
        if (clamped != *v)
            PLOG_WARNING << "[scanner] concurrency_limit " << *v << " clamped to " << clamped;
        settings.concurrency_limit = static_cast<std::size_t>(clamped);
    }

    if (auto v = tbl["probe_timeout_ms"].value<int64_t>())
    {
        if (*v > 0)
            settings.probe_timeout = std::chrono::milliseconds(*v);
        else
            warnInvalid("probe_timeout_ms", "must be positive, got " + std::to_string(*v));
    }

    if (auto v = tbl["channel_capacity"].value<int64_t>())
    {
        if (*v > 0)
            settings.channel_capacity = static_cast<std::size_t>(*v);
        else
            warnInvalid("channel_capacity", "must be positive, got " + std::to_string(*v));
    }

    if (auto v = tbl["cancelled_scan_policy"].value<std::string>())
    {
        if (!policyFromString(*v, settings.cancelled_scan_policy))
            warnInvalid("cancelled_scan_policy", "expected mark_partial or keep_timestamp, got '" + *v + "'");
    }

    if (auto arr = tbl["probers"].as_array())
    {
        std::vector<std::string> names;
        for (const auto& node : *arr)
        {
            if (auto name = node.value<std::string>())
                names.push_back(*name);
        }
        settings.probers = std::move(names);
    }

    if (auto v = tbl["cgminer_port"].value<int64_t>())
    {
        if (*v > 0 && *v <= 65535)
            settings.cgminer_port = static_cast<int>(*v);
        else
            warnInvalid("cgminer_port", "out of range: " + std::to_string(*v));
    }
}

bool StateSerializer::registerScanner(ConfigManager& config, ScannerSettings& settings)
{
    TableCallbacks cb;
    cb.load = [&settings](const toml::table& section) { deserializeScanner(section, settings); };
    cb.save = [&settings]() { return serializeScanner(settings); };
    return config.registerTable("scanner", std::move(cb),
                                std::vector<std::string>(std::begin(kScannerKeys), std::end(kScannerKeys)));
}
