#pragma once
#include "Agent.h"
#include "Obstacle.h"
#include <exception>
#include <iostream>
#include <vector>

// read only hooks for whatever shows the arena (absent in batch mode)
// implementations must never touch simulation state
class SimulationObserver
{
public:
    virtual ~SimulationObserver() = default;

    // new game: obstacles are final, agents follow through onAgentCreated
    virtual void onGameReset(unsigned int seed, int gameNumber, const std::vector<Obstacle> &obstacles) {}
    virtual void onAgentCreated(size_t index, const Agent &agent) {}

    // after motion, every tick
    virtual void onAgentsMoved(const std::vector<Agent> &agents, long step) {}
    virtual void onKindChanged(size_t index, int newKind) {}

    // countdown value shown before a game (0 = go)
    virtual void onCountdown(int remaining) {}
    virtual void onGameEnded(int winningKind, long steps, double elapsedSeconds) {}
};

// observers are best effort, a failing one is reported and the tick goes on
template <typename Fn>
void notifyObserver(SimulationObserver *observer, Fn &&fn)
{
    if (observer == nullptr)
        return;
    try
    {
        fn(*observer);
    }
    catch (const std::exception &e)
    {
        std::cerr << "Warning: observer failed: " << e.what() << std::endl;
    }
}
