#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <plog/Severity.h>

namespace plog
{
class IAppender;
}

namespace utils
{

// Process-wide plog setup. Options come from the [logging] table of
// config.toml; the command line may raise the level and add a console sink.
class LogManager
{
public:
    struct Options
    {
        std::string directory = "logs";
        std::string file_name = "btc_toolkit.log";
        bool append = true;
        plog::Severity level = plog::info;
        std::size_t max_file_size = 10 * 1024 * 1024;
        std::size_t backup_count = 3;
        bool console = false;
    };

    // Missing file or table leaves the defaults; a bad level string is
    // reported and ignored.
    static Options LoadOptions(const std::string& settings_path);

    // Installs the file appender (and the console one if requested) on the
    // default plog instance. A second call is a no-op returning true.
    static bool Start(const Options& options);
    static void Stop();

private:
    LogManager() = default;

    static bool s_started;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace utils
