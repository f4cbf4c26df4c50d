#pragma once
#include "Agent.h"
#include "ArenaSettings.h"
#include "Obstacle.h"
#include <random>

// integrates one step of velocity and bounces off the walls and obstacles
class MotionResolver
{
public:
    static constexpr int OBSTACLE_PASSES = 2;

    MotionResolver(const ArenaSettings::PhysicsTuning &tuning, int width, int height);

    // returns true if the agent bounced (wall or obstacle) this step
    // rng is only touched on a bounce: x jitter then y jitter
    bool move(Agent &agent, const ObstacleField &obstacles, std::mt19937 &rng) const;

private:
    ArenaSettings::PhysicsTuning tuning_;
    double width_;
    double height_;

    // fold a coordinate back inside [radius, extent - radius], true if it bounced
    bool reflectAxis(double &coord, double &velocity, double extent) const;
};
