#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <vector>

namespace fs = std::filesystem;

namespace
{

// Splits "a.b.c" into its segments; an empty segment makes the path invalid.
bool splitSectionPath(const std::string& path, std::vector<std::string>& segments)
{
    segments.clear();
    if (path.empty())
        return true;

    std::size_t begin = 0;
    while (true)
    {
        std::size_t dot = path.find('.', begin);
        std::string segment = path.substr(begin, dot == std::string::npos ? std::string::npos : dot - begin);
        if (segment.empty())
            return false;
        segments.push_back(std::move(segment));
        if (dot == std::string::npos)
            return true;
        begin = dot + 1;
    }
}

} // namespace

ConfigManager::ConfigManager(std::string path)
    : config_path_(std::move(path))
{
}

ConfigManager::~ConfigManager() = default;

bool ConfigManager::registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys)
{
    for (const auto& handler : handlers_)
    {
        if (handler.path != path)
            continue;
        for (const auto& key : ownedKeys)
        {
            if (std::find(handler.ownedKeys.begin(), handler.ownedKeys.end(), key) != handler.ownedKeys.end())
            {
                last_error_ = "Duplicate ownership: key '" + key + "' at path '" + path + "' already registered";
                PLOG_ERROR << last_error_;
                return false;
            }
        }
    }

    handlers_.push_back({ path, std::move(cb), std::move(ownedKeys) });
    return true;
}

void ConfigManager::dispatchLoad()
{
    static const toml::table empty;
    for (const auto& handler : handlers_)
    {
        const toml::table* section = sectionForRead(*root_, handler.path);
        handler.callbacks.load(section ? *section : empty);
    }
}

bool ConfigManager::load()
{
    last_error_.clear();
    std::ifstream ifs(config_path_, std::ios::binary);
    if (!ifs)
    {
        PLOG_INFO << config_path_ << " not found, using default settings";
        root_ = std::make_unique<toml::table>();
        dispatchLoad();
        return true;
    }

    try
    {
        root_ = std::make_unique<toml::table>(toml::parse(ifs, config_path_));
    }
    catch (const toml::parse_error& pe)
    {
        const auto& where = pe.source().begin;
        last_error_ = config_path_ + ":" + std::to_string(where.line) + ":" + std::to_string(where.column) + ": " +
                      std::string(pe.description());
        PLOG_WARNING << "Settings not loaded: " << last_error_;
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "Settings file has errors, scanner defaults in use", last_error_);
        root_ = std::make_unique<toml::table>();
        dispatchLoad();
        return false;
    }

    dispatchLoad();
    return true;
}

bool ConfigManager::save()
{
    last_error_.clear();
    if (!root_)
        root_ = std::make_unique<toml::table>();

    toml::table output = *root_;
    for (const auto& handler : handlers_)
    {
        toml::table produced = handler.callbacks.save();
        toml::table* target = sectionForWrite(output, handler.path);
        if (!target)
        {
            last_error_ = "cannot place section '" + handler.path + "'";
            return false;
        }

        for (const auto& [key, value] : produced)
        {
            const std::string k(key.str());
            if (std::find(handler.ownedKeys.begin(), handler.ownedKeys.end(), k) == handler.ownedKeys.end())
                PLOG_WARNING << "Handler at path '" << handler.path << "' returned unexpected key '" << k
                             << "' (not in ownedKeys); stripping it";
        }

        for (const auto& key : handler.ownedKeys)
        {
            if (produced.contains(key))
                target->insert_or_assign(key, produced[key]);
            else
                target->erase(key);
        }
    }

    const std::string tmp = config_path_ + ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs)
        {
            last_error_ = "Failed to open temp file for writing";
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to save settings",
                                              "Could not create temporary file for writing: " + tmp);
            return false;
        }
        ofs << output;
        ofs.flush();
        if (!ofs)
        {
            last_error_ = "Failed to write temp file";
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to save settings",
                                              "Write to " + tmp + " failed");
            return false;
        }
    }

    std::error_code ec;
    fs::rename(tmp, config_path_, ec);
    if (ec)
    {
        last_error_ = std::string("Failed to rename: ") + ec.message();
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to save settings",
                                          "Could not rename temporary file: " + ec.message());
        return false;
    }

    *root_ = std::move(output);
    PLOG_INFO << "Saved settings to " << config_path_;
    return true;
}

const toml::table& ConfigManager::root() const
{
    static const toml::table empty;
    return root_ ? *root_ : empty;
}

toml::table* ConfigManager::sectionForWrite(toml::table& root, const std::string& path)
{
    std::vector<std::string> segments;
    if (!splitSectionPath(path, segments))
    {
        PLOG_WARNING << "Malformed section path '" << path << "'";
        return nullptr;
    }

    toml::table* current = &root;
    for (const auto& segment : segments)
    {
        toml::node* child = current->get(segment);
        if (!child)
            child = &current->insert(segment, toml::table{}).first->second;

        current = child->as_table();
        if (!current)
        {
            PLOG_WARNING << "Section '" << path << "' is shadowed by a non-table value at '" << segment << "'";
            return nullptr;
        }
    }
    return current;
}

const toml::table* ConfigManager::sectionForRead(const toml::table& root, const std::string& path) const
{
    std::vector<std::string> segments;
    if (!splitSectionPath(path, segments))
        return nullptr;

    const toml::table* current = &root;
    for (const auto& segment : segments)
    {
        const toml::node* child = current->get(segment);
        if (!child)
            return nullptr;
        current = child->as_table();
        if (!current)
        {
            PLOG_WARNING << "Ignoring '" << segment << "' in " << config_path_ << ": expected a table";
            return nullptr;
        }
    }
    return current;
}
