#include "KindTable.h"
#include <algorithm>
#include <stdexcept>

KindTable KindTable::fromSettings(const std::vector<ArenaSettings::KindSettings> &kinds)
{
    if (kinds.size() < 2)
        throw std::invalid_argument("Invalid kinds: at least two kinds are required");

    // sort by name, the table order is the store/log order
    std::vector<ArenaSettings::KindSettings> sorted = kinds;
    std::sort(sorted.begin(), sorted.end(),
              [](const ArenaSettings::KindSettings &a, const ArenaSettings::KindSettings &b)
              { return a.name < b.name; });

    KindTable table;
    for (size_t i = 0; i < sorted.size(); ++i)
    {
        if (sorted[i].name.empty())
            throw std::invalid_argument("Invalid kinds: kind names must not be empty");
        if (i > 0 && sorted[i].name == sorted[i - 1].name)
            throw std::invalid_argument("Invalid kinds: duplicate kind '" + sorted[i].name + "'");
        table.names_.push_back(sorted[i].name);
        table.labels_.push_back(sorted[i].label.empty() ? sorted[i].name : sorted[i].label);
    }

    // then resolve the relation by name
    for (const auto &kind : sorted)
    {
        int beats = table.indexOf(kind.beats);
        int losesTo = table.indexOf(kind.losesTo);
        if (beats < 0)
            throw std::invalid_argument("Invalid kinds: '" + kind.name + "' beats unknown kind '" + kind.beats + "'");
        if (losesTo < 0)
            throw std::invalid_argument("Invalid kinds: '" + kind.name + "' loses to unknown kind '" + kind.losesTo + "'");
        if (kind.beats == kind.name || kind.losesTo == kind.name)
            throw std::invalid_argument("Invalid kinds: '" + kind.name + "' cannot beat or lose to itself");
        table.beats_.push_back(beats);
        table.losesTo_.push_back(losesTo);
    }

    return table;
}

int KindTable::indexOf(const std::string &name) const
{
    auto it = std::find(names_.begin(), names_.end(), name);
    if (it == names_.end())
        return -1;
    return static_cast<int>(it - names_.begin());
}
