#pragma once

#include "../state/ScannerSettings.hpp"
#include "../network/DeviceSorting.hpp"

#include <memory>
#include <string>
#include <vector>

class ConfigManager;

namespace config
{
class ConfigStore;
}

namespace scanning
{
class ScanCoordinator;
}

namespace app
{
class ConsoleView;
}

class Application
{
public:
    Application(int argc, char** argv);
    ~Application();

    int run();

private:
    enum class Mode
    {
        Scan,
        List,
        Edit,
        Help
    };

    struct GroupEdit
    {
        enum class Kind
        {
            Add,
            Remove,
            Enable,
            Disable
        };
        Kind kind;
        std::string name;
        std::string ranges; // Add only
    };

    bool initialize();
    bool initializeLogging();
    bool parseCommandLineArgs();
    void initializeConfig();
    void printUsage() const;

    int listResults();
    int editGroups();
    int scanLoop();

    std::unique_ptr<ConfigManager> settings_config_;
    std::unique_ptr<config::ConfigStore> store_;
    std::unique_ptr<scanning::ScanCoordinator> coordinator_;
    std::unique_ptr<app::ConsoleView> view_;
    ScannerSettings settings_{};

    Mode mode_ = Mode::Scan;
    bool verbose_ = false;
    std::string settings_path_ = "config.toml";
    std::string config_path_;
    std::vector<std::string> groups_;
    std::vector<GroupEdit> edits_;
    network::SortColumn sort_column_ = network::SortColumn::IpAddress;
    network::SortDirection sort_direction_ = network::SortDirection::Ascending;

    int argc_ = 0;
    char** argv_ = nullptr;
};
