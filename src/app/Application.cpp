#include "Application.hpp"
#include "ConsoleView.hpp"
#include "Version.hpp"

#include "../config/ConfigManager.hpp"
#include "../config/ConfigStore.hpp"
#include "../config/GroupEditor.hpp"
#include "../config/StateSerializer.hpp"
#include "../scanning/ScanCoordinator.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/LogManager.hpp"

#include <plog/Log.h>

#include <atomic>
#include <csignal>
#include <cstring>
#include <iostream>

namespace
{

std::atomic<bool> g_interrupted{ false };

void onSigint(int)
{
    g_interrupted.store(true, std::memory_order_relaxed);
}

constexpr std::size_t kEventsPerPump = 256;
constexpr auto kPumpWait = std::chrono::milliseconds(100);
constexpr auto kProgressInterval = std::chrono::seconds(1);

} // namespace

Application::Application(int argc, char** argv)
    : config_path_(config::ConfigStore::kDefaultPath)
    , argc_(argc)
    , argv_(argv)
{
    settings_.applyDefaults();
}

Application::~Application()
{
    // pool threads may still log while the coordinator winds down
    coordinator_.reset();
    utils::LogManager::Stop();
}

bool Application::parseCommandLineArgs()
{
    for (int i = 1; i < argc_; ++i)
    {
        const char* arg = argv_[i];
        auto needValue = [&](const char* flag) -> const char*
        {
            if (i + 1 >= argc_)
            {
                std::cerr << flag << " requires a value\n";
                return nullptr;
            }
            return argv_[++i];
        };

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0)
        {
            mode_ = Mode::Help;
        }
        else if (std::strcmp(arg, "--verbose") == 0 || std::strcmp(arg, "-v") == 0)
        {
            verbose_ = true;
        }
        else if (std::strcmp(arg, "--list") == 0)
        {
            mode_ = Mode::List;
        }
        else if (std::strcmp(arg, "--config") == 0)
        {
            const char* v = needValue(arg);
            if (!v)
                return false;
            config_path_ = v;
        }
        else if (std::strcmp(arg, "--settings") == 0)
        {
            const char* v = needValue(arg);
            if (!v)
                return false;
            settings_path_ = v;
        }
        else if (std::strcmp(arg, "--group") == 0)
        {
            const char* v = needValue(arg);
            if (!v)
                return false;
            groups_.emplace_back(v);
        }
        else if (std::strcmp(arg, "--add-group") == 0)
        {
            const char* name = needValue(arg);
            const char* ranges = name ? needValue(arg) : nullptr;
            if (!ranges)
                return false;
            edits_.push_back({ GroupEdit::Kind::Add, name, ranges });
            mode_ = Mode::Edit;
        }
        else if (std::strcmp(arg, "--remove-group") == 0 || std::strcmp(arg, "--enable") == 0 ||
                 std::strcmp(arg, "--disable") == 0)
        {
            const char* name = needValue(arg);
            if (!name)
                return false;
            GroupEdit::Kind kind = GroupEdit::Kind::Remove;
            if (std::strcmp(arg, "--enable") == 0)
                kind = GroupEdit::Kind::Enable;
            else if (std::strcmp(arg, "--disable") == 0)
                kind = GroupEdit::Kind::Disable;
            edits_.push_back({ kind, name, {} });
            mode_ = Mode::Edit;
        }
        else if (std::strcmp(arg, "--sort") == 0)
        {
            const char* v = needValue(arg);
            if (!v)
                return false;
            if (!app::ConsoleView::parseSortColumn(v, sort_column_))
            {
                std::cerr << "Unknown sort column '" << v << "'\n";
                return false;
            }
        }
        else if (std::strcmp(arg, "--desc") == 0)
        {
            sort_direction_ = network::toggled(network::SortDirection::Ascending);
        }
        else
        {
            std::cerr << "Unknown argument '" << arg << "'\n";
            return false;
        }
    }
    return true;
}

void Application::printUsage() const
{
    std::cout << "btc_toolkit " << BTK_VERSION_STRING << "\n"
              << "Usage: btc_toolkit [options]\n"
              << "  --config <file>    scan groups and results (default " << config::ConfigStore::kDefaultPath << ")\n"
              << "  --settings <file>  scanner settings (default config.toml)\n"
              << "  --group <name>     scan only this group; repeatable (default: all enabled groups)\n"
              << "  --list             print stored results without scanning\n"
              << "  --add-group <name> <ranges>\n"
              << "                     add a scan group, e.g. --add-group Rack1 10.0.0.0/24,10.0.1.5-20\n"
              << "  --remove-group <name>, --enable <name>, --disable <name>\n"
              << "                     edit the stored scan groups\n"
              << "  --sort <column>    ip, model, make, firmware, version or health\n"
              << "  --desc             sort descending\n"
              << "  -v, --verbose      debug logging, echoed to stderr\n";
}

bool Application::initializeLogging()
{
    auto options = utils::LogManager::LoadOptions(settings_path_);
    if (verbose_)
    {
        options.level = plog::debug;
        options.console = true;
    }
    return utils::LogManager::Start(options);
}

void Application::initializeConfig()
{
    settings_config_ = std::make_unique<ConfigManager>(settings_path_);
    if (!StateSerializer::registerScanner(*settings_config_, settings_))
    {
        PLOG_WARNING << "Scanner settings binding failed: " << settings_config_->lastError();
    }
    if (!settings_config_->load())
    {
        PLOG_WARNING << "Using default scanner settings: " << settings_config_->lastError();
    }

    store_ = std::make_unique<config::ConfigStore>(config_path_);
    config::PersistedConfig cfg = store_->load();

    coordinator_ = std::make_unique<scanning::ScanCoordinator>(*store_, std::move(cfg), settings_,
                                                               network::createProber(settings_));
    view_ = std::make_unique<app::ConsoleView>(std::cout);
    view_->setSort(sort_column_, sort_direction_);
}

bool Application::initialize()
{
    if (!parseCommandLineArgs())
    {
        printUsage();
        return false;
    }
    if (mode_ == Mode::Help)
        return true;

    if (!initializeLogging())
        return false;

    PLOG_INFO << "btc_toolkit " << BTK_VERSION_STRING << " starting";
    initializeConfig();
    return true;
}

int Application::run()
{
    if (!initialize())
        return 2;

    switch (mode_)
    {
    case Mode::Help:
        printUsage();
        return 0;
    case Mode::List:
        return listResults();
    case Mode::Edit:
        return editGroups();
    case Mode::Scan:
        return scanLoop();
    }
    return 0;
}

int Application::listResults()
{
    const auto& cfg = coordinator_->config();
    view_->printGroups(cfg);

    std::vector<std::string> names = groups_;
    if (names.empty())
    {
        for (const auto& g : cfg.groups)
            names.push_back(g.name);
    }
    for (const auto& name : names)
    {
        if (!cfg.findGroup(name))
        {
            std::cerr << "No group named '" << name << "'\n";
            return 1;
        }
        view_->printGroupResults(name, cfg.findResults(name));
    }
    return 0;
}

int Application::editGroups()
{
    config::GroupEditor editor(coordinator_->config());
    for (const auto& edit : edits_)
    {
        config::EditResult r;
        switch (edit.kind)
        {
        case GroupEdit::Kind::Add:
        {
            config::ScanGroup group;
            group.name = edit.name;
            group.ranges = edit.ranges;
            r = editor.addGroup(std::move(group));
            break;
        }
        case GroupEdit::Kind::Remove:
            r = editor.removeGroup(edit.name);
            break;
        case GroupEdit::Kind::Enable:
            r = editor.setEnabled(edit.name, true);
            break;
        case GroupEdit::Kind::Disable:
            r = editor.setEnabled(edit.name, false);
            break;
        }
        if (!r.ok())
        {
            // Nothing is written when any edit is rejected
            std::cerr << r.message << '\n';
            return 1;
        }
    }

    if (!editor.dirty())
    {
        view_->printGroups(coordinator_->config());
        return 0;
    }

    auto saved = coordinator_->replaceConfig(editor.commit());
    view_->printGroups(coordinator_->config());
    if (!saved)
    {
        std::cerr << "Could not save " << store_->path() << ": " << saved.error << '\n';
        return 1;
    }
    return 0;
}

int Application::scanLoop()
{
    std::signal(SIGINT, onSigint);

    scanning::StartResult started =
        groups_.empty() ? coordinator_->startEnabled() : coordinator_->startScan(groups_);
    if (!started.ok())
    {
        std::cerr << started.message << '\n';
        return 1;
    }

    std::cout << "Scanning (Ctrl+C to cancel)...\n";
    bool cancel_sent = false;
    int exit_code = 0;
    auto last_print = std::chrono::steady_clock::now();
    std::vector<std::string> scanned;

    while (coordinator_->hasActiveSessions())
    {
        if (g_interrupted.load(std::memory_order_relaxed) && !cancel_sent)
        {
            std::cout << "\nCancelling, waiting for in-flight probes...\n";
            coordinator_->cancelAll();
            cancel_sent = true;
        }

        for (const auto& outcome : coordinator_->pump(kEventsPerPump, kPumpWait))
        {
            view_->printOutcome(outcome);
            if (outcome.state == scanning::SessionState::Failed || (outcome.merged && !outcome.save.ok))
                exit_code = 1;
            if (outcome.merged)
                scanned.insert(scanned.end(), outcome.groups.begin(), outcome.groups.end());
        }

        auto now = std::chrono::steady_clock::now();
        if (now - last_print >= kProgressInterval)
        {
            for (const auto* s : coordinator_->activeSessions())
                view_->printProgress(*s);
            last_print = now;
        }
    }

    for (const auto& name : scanned)
        view_->printGroupResults(name, coordinator_->config().findResults(name));

    for (const auto& err : utils::ErrorReporter::GetPendingErrors(utils::ErrorSeverity::Warning))
        std::cerr << utils::ErrorReporter::Format(err) << '\n';

    if (coordinator_->hasUnsavedChanges())
    {
        auto retry = coordinator_->retrySave();
        if (!retry)
        {
            std::cerr << "Could not save results: " << retry.error << '\n';
            exit_code = 1;
        }
    }

    return cancel_sent && exit_code == 0 ? 130 : exit_code;
}
