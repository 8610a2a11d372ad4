#pragma once

#include "PersistedConfig.hpp"

#include <string>

namespace config
{

struct SaveResult
{
    bool ok = true;
    std::string error; // set when ok == false

    explicit operator bool() const { return ok; }
};

/// Reads and writes btc_toolkit_config.json.
class ConfigStore
{
public:
    enum class LoadOutcome
    {
        Loaded,
        CreatedDefault,      // no file yet
        RecoveredFromCorrupt, // unreadable file moved aside, default written
        CorruptLeftInPlace    // unreadable file could not be moved; nothing written
    };

    static constexpr const char* kDefaultPath = "btc_toolkit_config.json";

    explicit ConfigStore(std::string path = kDefaultPath);

    /// Never fails: a missing or corrupt file yields PersistedConfig::makeDefault(),
    /// which is written back so the next start finds a valid file. A corrupt
    /// file is only replaced once it has been moved to "<path>.bak".
    PersistedConfig load();

    /// Atomic replace through "<path>.tmp".
    SaveResult save(const PersistedConfig& cfg);

    LoadOutcome lastLoadOutcome() const { return last_outcome_; }
    const std::string& path() const { return path_; }

    static std::string serialize(const PersistedConfig& cfg);
    static bool deserialize(const std::string& text, PersistedConfig& out, std::string& outError);

private:
    std::string path_;
    LoadOutcome last_outcome_ = LoadOutcome::Loaded;
};

} // namespace config
