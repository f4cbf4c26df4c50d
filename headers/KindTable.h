#pragma once
#include "ArenaSettings.h"
#include <string>
#include <vector>

// the cyclic "who converts whom" relation, kinds are indices into this table
// ordered by name so the log columns are stable across runs
class KindTable
{
public:
    // throws std::invalid_argument for unknown, duplicate or self referencing kinds
    static KindTable fromSettings(const std::vector<ArenaSettings::KindSettings> &kinds);

    size_t size() const { return names_.size(); }

    int beats(int kind) const { return beats_[kind]; }
    int losesTo(int kind) const { return losesTo_[kind]; }

    // true if either kind converts the other on contact
    bool inBeatsRelation(int a, int b) const { return beats_[a] == b || beats_[b] == a; }

    const std::string &name(int kind) const { return names_[kind]; }
    const std::string &label(int kind) const { return labels_[kind]; }
    const std::vector<std::string> &getNames() const { return names_; }
    const std::vector<std::string> &getLabels() const { return labels_; }

    // -1 if there is no such kind
    int indexOf(const std::string &name) const;

private:
    std::vector<std::string> names_;
    std::vector<std::string> labels_;
    std::vector<int> beats_;
    std::vector<int> losesTo_;
};
