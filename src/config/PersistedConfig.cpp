#include "PersistedConfig.hpp"

#include <algorithm>

namespace config
{

const ScanGroup* PersistedConfig::findGroup(const std::string& name) const
{
    auto it = std::find_if(groups.begin(), groups.end(), [&](const ScanGroup& g) { return g.name == name; });
    return it == groups.end() ? nullptr : &*it;
}

const GroupResults* PersistedConfig::findResults(const std::string& name) const
{
    auto it = results.find(name);
    return it == results.end() ? nullptr : &it->second;
}

std::vector<std::string> PersistedConfig::enabledGroupNames() const
{
    std::vector<std::string> names;
    for (const auto& g : groups)
    {
        if (g.enabled)
            names.push_back(g.name);
    }
    return names;
}

PersistedConfig PersistedConfig::makeDefault()
{
    PersistedConfig cfg;
    ScanGroup group;
    group.name = "Default";
    group.ranges = "192.168.1.0/24";
    group.enabled = true;
    cfg.groups.push_back(std::move(group));
    return cfg;
}

} // namespace config
