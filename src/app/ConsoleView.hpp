#pragma once

#include "../config/PersistedConfig.hpp"
#include "../network/DeviceSorting.hpp"
#include "../scanning/ScanCoordinator.hpp"

#include <iosfwd>
#include <string>

namespace app
{

// Plain-text rendering of scan progress and stored results
class ConsoleView
{
public:
    explicit ConsoleView(std::ostream& out);

    void setSort(network::SortColumn column, network::SortDirection direction);

    void printGroups(const config::PersistedConfig& cfg);
    void printProgress(const scanning::ScanSession& session);
    void printOutcome(const scanning::SessionOutcome& outcome);
    void printGroupResults(const std::string& group, const config::GroupResults* results);

    // "ip", "model", "make", "firmware", "version", "health"
    static bool parseSortColumn(const std::string& name, network::SortColumn& out);

private:
    std::ostream& out_;
    network::SortColumn sort_column_ = network::SortColumn::IpAddress;
    network::SortDirection sort_direction_ = network::SortDirection::Ascending;
};

} // namespace app
