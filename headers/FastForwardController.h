#pragma once
#include "Agent.h"
#include "KindTable.h"
#include <vector>

// collapses the tick delay once only two directly related kinds are left
// (the outcome is decided, no point in watching it at normal speed)
// one way latch per game, reset() is the only way back
class FastForwardController
{
public:
    static constexpr int MIN_DELAY_MS = 1;

    FastForwardController(bool enabled, int baseDelayMs);

    // start of a new game: base delay, latch cleared
    void reset();

    // inspect the kinds present after a tick, returns true on the tick it activates
    bool update(const std::vector<Agent> &agents, const KindTable &kinds);

    bool isActive() const { return active_; }
    int getDelayMs() const { return delayMs_; }
    int getBaseDelayMs() const { return baseDelayMs_; }

private:
    bool enabled_;
    bool active_ = false;
    int baseDelayMs_;
    int delayMs_;
};
