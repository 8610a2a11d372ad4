#include "GroupEditor.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>

#include <algorithm>

namespace config
{

namespace
{

EditResult failure(EditError error, std::string message)
{
    EditResult r;
    r.error = error;
    r.message = std::move(message);
    return r;
}

std::string trimmed(const std::string& s)
{
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
        return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

// The config file is JSON, so a name must survive strict encoding
bool encodable(const std::string& s)
{
    try
    {
        (void)nlohmann::json(s).dump();
        return true;
    }
    catch (const nlohmann::json::type_error&)
    {
        return false;
    }
}

} // namespace

GroupEditor::GroupEditor(PersistedConfig committed)
    : draft_(std::move(committed))
{
}

EditResult GroupEditor::validate(const ScanGroup& group)
{
    if (trimmed(group.name).empty())
        return failure(EditError::EmptyName, "Group name cannot be empty");
    if (!encodable(group.name))
        return failure(EditError::InvalidName, "Group name is not valid UTF-8");

    std::vector<network::AddressRange> ranges;
    network::ParseError err;
    if (!group.parseRanges(ranges, err))
    {
        EditResult r = failure(EditError::InvalidRange, "Invalid network range for '" + group.name + "': " + err.message);
        r.parse = std::move(err);
        return r;
    }
    return {};
}

ScanGroup* GroupEditor::find(const std::string& name)
{
    auto it = std::find_if(draft_.groups.begin(), draft_.groups.end(),
                           [&](const ScanGroup& g) { return g.name == name; });
    return it == draft_.groups.end() ? nullptr : &*it;
}

EditResult GroupEditor::addGroup(ScanGroup group)
{
    group.name = trimmed(group.name);
    group.ranges = trimmed(group.ranges);
    if (auto r = validate(group); !r.ok())
        return r;
    if (find(group.name))
        return failure(EditError::DuplicateName, "A group named '" + group.name + "' already exists");

    PLOG_INFO << "Adding scan group '" << group.name << "' (" << group.ranges << ")";
    draft_.groups.push_back(std::move(group));
    dirty_ = true;
    return {};
}

EditResult GroupEditor::updateGroup(const std::string& originalName, ScanGroup updated)
{
    ScanGroup* existing = find(originalName);
    if (!existing)
        return failure(EditError::UnknownGroup, "No group named '" + originalName + "'");

    updated.name = trimmed(updated.name);
    updated.ranges = trimmed(updated.ranges);
    if (auto r = validate(updated); !r.ok())
        return r;

    if (updated.name != originalName)
    {
        if (find(updated.name))
            return failure(EditError::DuplicateName, "A group named '" + updated.name + "' already exists");

        auto node = draft_.results.extract(originalName);
        if (!node.empty())
        {
            node.key() = updated.name;
            draft_.results.insert(std::move(node));
        }
        PLOG_INFO << "Renamed scan group '" << originalName << "' to '" << updated.name << "'";
    }

    *existing = std::move(updated);
    dirty_ = true;
    return {};
}

EditResult GroupEditor::removeGroup(const std::string& name)
{
    auto it = std::find_if(draft_.groups.begin(), draft_.groups.end(),
                           [&](const ScanGroup& g) { return g.name == name; });
    if (it == draft_.groups.end())
        return failure(EditError::UnknownGroup, "No group named '" + name + "'");

    draft_.groups.erase(it);
    draft_.results.erase(name);
    dirty_ = true;
    PLOG_INFO << "Removed scan group '" << name << "'";
    return {};
}

EditResult GroupEditor::setEnabled(const std::string& name, bool enabled)
{
    ScanGroup* g = find(name);
    if (!g)
        return failure(EditError::UnknownGroup, "No group named '" + name + "'");
    if (g->enabled != enabled)
    {
        g->enabled = enabled;
        dirty_ = true;
    }
    return {};
}

EditResult GroupEditor::setFilter(const std::string& name, network::DeviceFilter filter)
{
    ScanGroup* g = find(name);
    if (!g)
        return failure(EditError::UnknownGroup, "No group named '" + name + "'");
    if (!(g->filter == filter))
    {
        g->filter = std::move(filter);
        dirty_ = true;
    }
    return {};
}

void GroupEditor::clearResults()
{
    if (!draft_.results.empty())
    {
        draft_.results.clear();
        dirty_ = true;
    }
}

PersistedConfig GroupEditor::commit()
{
    dirty_ = false;
    return draft_;
}

} // namespace config
