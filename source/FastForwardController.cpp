#include "FastForwardController.h"
#include <algorithm>

FastForwardController::FastForwardController(bool enabled, int baseDelayMs)
    : enabled_(enabled),
      baseDelayMs_(std::max(MIN_DELAY_MS, baseDelayMs)),
      delayMs_(std::max(MIN_DELAY_MS, baseDelayMs))
{
}

void FastForwardController::reset()
{
    active_ = false;
    delayMs_ = baseDelayMs_;
}

bool FastForwardController::update(const std::vector<Agent> &agents, const KindTable &kinds)
{
    if (!enabled_ || active_)
        return false;

    std::vector<int> counts = countKinds(agents, kinds.size());
    std::vector<int> present;
    for (size_t k = 0; k < counts.size(); ++k)
    {
        if (counts[k] > 0)
            present.push_back(static_cast<int>(k));
    }
    if (present.size() != 2)
        return false;

    if (!kinds.inBeatsRelation(present[0], present[1]))
        return false;

    delayMs_ = MIN_DELAY_MS;
    active_ = true;
    return true;
}
