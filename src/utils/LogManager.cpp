#include "LogManager.hpp"
#include "ErrorReporter.hpp"

#include <filesystem>
#include <fstream>

#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>
#include <plog/Log.h>
#include <toml++/toml.h>

namespace utils
{

bool LogManager::s_started = false;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

LogManager::Options LogManager::LoadOptions(const std::string& settings_path)
{
    Options options;

    std::error_code ec;
    if (!std::filesystem::exists(settings_path, ec))
        return options;

    toml::table root;
    try
    {
        root = toml::parse_file(settings_path);
    }
    catch (const toml::parse_error& pe)
    {
        // plog has no sink yet; the settings loader logs this again later
        ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Ignoring [logging] in " + settings_path,
                                     std::string(pe.description()));
        return options;
    }

    auto* logging = root["logging"].as_table();
    if (!logging)
        return options;

    if (auto dir = (*logging)["directory"].value<std::string>(); dir && !dir->empty())
        options.directory = *dir;
    if (auto append = (*logging)["append"].value<bool>())
        options.append = *append;
    if (auto files = (*logging)["backup_count"].value<int64_t>(); files && *files >= 0)
        options.backup_count = static_cast<std::size_t>(*files);

    if (auto level = (*logging)["level"].value<std::string>())
    {
        plog::Severity parsed = plog::severityFromString(level->c_str());
        // severityFromString maps anything unrecognized to none
        if (parsed == plog::none && *level != "none")
        {
            ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Unknown [logging] level '" + *level + "'",
                                         "expected fatal, error, warning, info, debug or verbose");
        }
        else
        {
            options.level = parsed;
        }
    }

    return options;
}

bool LogManager::Start(const Options& options)
{
    if (s_started)
        return true;

    std::error_code ec;
    std::filesystem::create_directories(options.directory, ec);
    if (ec)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Cannot create log directory " + options.directory,
                                   ec.message());
        return false;
    }

    std::string path = (std::filesystem::path(options.directory) / options.file_name).string();
    try
    {
        if (!options.append)
            std::ofstream(path, std::ios::trunc).close();

        auto file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            path.c_str(), options.max_file_size, static_cast<int>(options.backup_count));
        auto& logger = plog::init(options.level, file_appender.get());
        s_appenders.push_back(std::move(file_appender));

        if (options.console)
        {
            auto console_appender = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>(plog::streamStdErr);
            logger.addAppender(console_appender.get());
            s_appenders.push_back(std::move(console_appender));
        }
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Failed to open log file " + path, ex.what());
        return false;
    }

    s_started = true;
    PLOG_INFO << "Logging to " << path << " at " << plog::severityToString(options.level);
    return true;
}

void LogManager::Stop()
{
    // plog keeps raw appender pointers, so silence the logger before freeing them
    if (auto* logger = plog::get())
        logger->setMaxSeverity(plog::none);
    s_appenders.clear();
}

} // namespace utils
