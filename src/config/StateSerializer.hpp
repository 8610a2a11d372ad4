#pragma once

#include "../state/ScannerSettings.hpp"

#include <toml++/toml.h>

#include <string>

class ConfigManager;

// TOML serialization for the [scanner] table of config.toml
class StateSerializer
{
public:
    static toml::table serializeScanner(const ScannerSettings& settings);

    // Starts from defaults; out-of-range values are clamped or replaced by
    // their default with a warning.
    static void deserializeScanner(const toml::table& tbl, ScannerSettings& settings);

    // Wire `settings` to the [scanner] table of `config`
    static bool registerScanner(ConfigManager& config, ScannerSettings& settings);

    static const char* policyToString(ScannerSettings::CancelledScanPolicy policy);
    static bool policyFromString(const std::string& text, ScannerSettings::CancelledScanPolicy& out);
};
