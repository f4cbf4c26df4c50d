#pragma once
#include "Agent.h"
#include "KindTable.h"
#include <functional>
#include <vector>

// pairwise contact conversion
// pairs are scanned (i<j) in store order and converted immediately, so a
// conversion earlier in the scan is visible to later pairs of the same tick
class ContactResolver
{
public:
    ContactResolver(const KindTable &kinds, double contactRadius);

    // called with (agent index, new kind) for every conversion
    std::function<void(size_t, int)> onConverted;

    // returns true if any agent changed kind
    bool resolve(std::vector<Agent> &agents) const;

    double getContactRadius() const { return contactRadius_; }

private:
    const KindTable &kinds_;
    double contactRadius_;
};
