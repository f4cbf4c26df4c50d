#pragma once
#include "VectorMath.h"
#include "Agent.h"
#include "ArenaSettings.h"
#include "KindTable.h"
#include <random>
#include <vector>

// closest choice steering: chase the nearest prey or flee the nearest predator,
// whichever is closer, plus a short range push away from allies and some jitter
class BehaviorPolicy
{
public:
    BehaviorPolicy(const KindTable &kinds, const ArenaSettings::PhysicsTuning &tuning);

    // force on agents[self] from the current positions, draws x then y jitter
    Vec2 computeForce(size_t self, const std::vector<Agent> &agents, std::mt19937 &rng) const;

    // all forces are computed from one snapshot before any velocity changes,
    // then added to velocity and capped at base speed
    void applyForces(std::vector<Agent> &agents, std::mt19937 &rng) const;

private:
    const KindTable &kinds_;
    ArenaSettings::PhysicsTuning tuning_;
};
