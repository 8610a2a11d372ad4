#include "ConsoleView.hpp"

#include "../network/DeviceHealth.hpp"

#include <ctime>
#include <iomanip>
#include <ostream>
#include <sstream>

namespace app
{

namespace
{

std::string formatTime(std::int64_t unix_seconds)
{
    std::time_t t = static_cast<std::time_t>(unix_seconds);
    std::tm tm_buf{};
    localtime_r(&t, &tm_buf);
    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

std::string formatOptional(const std::optional<double>& v, int precision, const char* unit)
{
    if (!v)
        return "-";
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << *v << unit;
    return ss.str();
}

} // namespace

ConsoleView::ConsoleView(std::ostream& out)
    : out_(out)
{
}

void ConsoleView::setSort(network::SortColumn column, network::SortDirection direction)
{
    sort_column_ = column;
    sort_direction_ = direction;
}

bool ConsoleView::parseSortColumn(const std::string& name, network::SortColumn& out)
{
    using network::SortColumn;
    if (name == "ip")
        out = SortColumn::IpAddress;
    else if (name == "model")
        out = SortColumn::Model;
    else if (name == "make")
        out = SortColumn::Make;
    else if (name == "firmware")
        out = SortColumn::Firmware;
    else if (name == "version")
        out = SortColumn::FirmwareVersion;
    else if (name == "health")
        out = SortColumn::Health;
    else
        return false;
    return true;
}

void ConsoleView::printGroups(const config::PersistedConfig& cfg)
{
    out_ << "Scan groups:\n";
    for (const auto& g : cfg.groups)
    {
        out_ << "  " << std::left << std::setw(20) << g.name << std::setw(36) << g.ranges
             << (g.enabled ? "enabled" : "disabled");
        if (const auto* r = cfg.findResults(g.name))
            out_ << "  " << r->devices.size() << " device(s)";
        out_ << '\n';
    }
}

void ConsoleView::printProgress(const scanning::ScanSession& session)
{
    for (const auto& g : session.groups())
    {
        const scanning::GroupScanState* st = session.group(g.name);
        if (!st)
            continue;
        const double pct = st->total ? 100.0 * static_cast<double>(st->probed) / static_cast<double>(st->total) : 100.0;
        out_ << "[" << std::left << std::setw(16) << g.name << "] " << std::right << std::setw(6) << st->probed << "/"
             << std::left << std::setw(6) << st->total << " " << std::right << std::fixed << std::setprecision(1)
             << std::setw(5) << pct << "%  " << st->found << " miner(s)" << (st->completed ? "  done" : "") << '\n';
    }
}

void ConsoleView::printOutcome(const scanning::SessionOutcome& outcome)
{
    out_ << "Scan " << outcome.session_id << " " << scanning::sessionStateName(outcome.state) << ": "
         << outcome.devices << " device(s)";
    if (!outcome.failure.empty())
        out_ << " (" << outcome.failure << ")";
    if (outcome.merged && !outcome.save.ok)
        out_ << "\n  results NOT saved: " << outcome.save.error;
    out_ << '\n';
}

void ConsoleView::printGroupResults(const std::string& group, const config::GroupResults* results)
{
    out_ << "\n== " << group << " ==";
    if (!results)
    {
        out_ << " (never scanned)\n";
        return;
    }
    if (results->last_scan)
        out_ << " last scan " << formatTime(*results->last_scan);
    else
        out_ << " no complete scan";
    if (results->partial)
        out_ << " [partial]";
    out_ << '\n';

    auto devices = results->devices;
    network::sortDevices(devices, sort_column_, sort_direction_);

    out_ << std::left << std::setw(16) << "IP" << std::setw(12) << "Make" << std::setw(28) << "Model" << std::setw(11)
         << "Firmware" << std::setw(16) << "Version" << std::setw(10) << "TH/s" << std::setw(8) << "Temp"
         << "Health\n";
    for (const auto& d : devices)
    {
        const auto& s = d.snapshot;
        out_ << std::left << std::setw(16) << d.address.toString() << std::setw(12) << network::makeName(s.make)
             << std::setw(28) << s.model << std::setw(11) << network::firmwareName(s.firmware) << std::setw(16)
             << s.firmware_version << std::setw(10) << formatOptional(s.hashrate_ths, 2, "") << std::setw(8)
             << formatOptional(s.temperature_c, 0, "C");

        const auto report = network::buildHealthReport(s);
        out_ << network::healthLabel(report.status) << '\n';
        for (const auto& issue : report.issues)
        {
            out_ << "    " << (issue.severity == network::HealthStatus::Critical ? "X" : "!") << " ["
                 << network::issueCategoryName(issue.category) << "] " << issue.description << '\n';
        }
    }
}

} // namespace app
