#pragma once
#include "ArenaSettings.h"
#include "Agent.h"
#include "KindTable.h"
#include "Obstacle.h"
#include "ObstacleSource.h"
#include "BehaviorPolicy.h"
#include "MotionResolver.h"
#include "ContactResolver.h"
#include "SimulationObserver.h"
#include <random>
#include <vector>

// one game's worth of state: agents, obstacles and the seeded rng
// a tick is behavior -> motion -> contact, fast forward and game end are the session's job
class ArenaSimulation
{
public:
    ArenaSimulation(const ArenaSettings &settings, const KindTable &kinds, const ObstacleSource &obstacleSource);
    ~ArenaSimulation() = default;

    // the resolvers keep references into this object
    ArenaSimulation(const ArenaSimulation &) = delete;
    ArenaSimulation &operator=(const ArenaSimulation &) = delete;

    // core simulation methods
    // reseed, rebuild obstacles, place agents; rng order: obstacles, shuffle, placement
    void reset(unsigned int seed, int gameNumber = 1);
    // one tick, returns true if any agent converted
    bool update();

    // rendering hooks (may be null)
    void setObserver(SimulationObserver *observer) { observer_ = observer; }

    // agent access
    const std::vector<Agent> &getAgents() const { return agents_; }
    int getAgentCount() const { return static_cast<int>(agents_.size()); }
    std::vector<int> getKindCounts() const { return countKinds(agents_, kinds_.size()); }
    int getDistinctKindCount() const { return distinctKindCount(agents_, kinds_.size()); }

    // exactly one kind left
    bool isResolved() const { return getDistinctKindCount() == 1; }
    // kind with the most units, lowest index on ties
    int getLeadingKind() const;

    const ObstacleField &getObstacles() const { return obstacles_; }
    const KindTable &getKinds() const { return kinds_; }
    const ObstacleSource &getObstacleSource() const { return obstacleSource_; }
    const ArenaSettings &getSettings() const { return settings_; }
    unsigned int getSeed() const { return seed_; }
    long getStepCount() const { return stepCount_; }

private:
    ArenaSettings settings_;
    KindTable kinds_;
    ObstacleSource obstacleSource_;

    ObstacleField obstacles_;
    std::vector<Agent> agents_;

    std::mt19937 rng_;
    unsigned int seed_ = 0;
    long stepCount_ = 0;

    BehaviorPolicy behavior_;
    MotionResolver motion_;
    ContactResolver contacts_;

    SimulationObserver *observer_ = nullptr;
};
