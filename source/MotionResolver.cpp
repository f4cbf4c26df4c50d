#include "MotionResolver.h"
#include <algorithm>
#include <cmath>

MotionResolver::MotionResolver(const ArenaSettings::PhysicsTuning &tuning, int width, int height)
    : tuning_(tuning), width_(static_cast<double>(width)), height_(static_cast<double>(height))
{
}

bool MotionResolver::reflectAxis(double &coord, double &velocity, double extent) const
{
    const double r = tuning_.radius;
    if (coord < r)
    {
        coord = r + (r - coord);
        velocity = -velocity * tuning_.wallBounce;
        return true;
    }
    if (coord > extent - r)
    {
        coord = (extent - r) - (coord - (extent - r));
        velocity = -velocity * tuning_.wallBounce;
        return true;
    }
    return false;
}

bool MotionResolver::move(Agent &agent, const ObstacleField &obstacles, std::mt19937 &rng) const
{
    const double r = tuning_.radius;

    // proposed movement
    double nx = agent.position.x + agent.velocity.x;
    double ny = agent.position.y + agent.velocity.y;
    Vec2 vel = agent.velocity;

    // walls, each axis on its own
    bool bounced = reflectAxis(nx, vel.x, width_);
    bounced = reflectAxis(ny, vel.y, height_) || bounced;

    // keep the center out of every inflated rectangle
    for (int pass = 0; pass < OBSTACLE_PASSES; ++pass)
    {
        const Obstacle *obs = obstacles.firstColliding(nx, ny, r);
        if (obs == nullptr)
            break;

        double left = obs->x1 - r;
        double right = obs->x2 + r;
        double top = obs->y1 - r;
        double bottom = obs->y2 + r;

        double dxLeft = std::abs(nx - left);
        double dxRight = std::abs(nx - right);
        double dyTop = std::abs(ny - top);
        double dyBottom = std::abs(ny - bottom);

        // nearest face, ties go left, right, top, bottom
        double m = std::min({dxLeft, dxRight, dyTop, dyBottom});
        if (m == dxLeft)
        {
            nx = left;
            vel.x = -std::abs(vel.x) * tuning_.wallBounce;
        }
        else if (m == dxRight)
        {
            nx = right;
            vel.x = std::abs(vel.x) * tuning_.wallBounce;
        }
        else if (m == dyTop)
        {
            ny = top;
            vel.y = -std::abs(vel.y) * tuning_.wallBounce;
        }
        else
        {
            ny = bottom;
            vel.y = std::abs(vel.y) * tuning_.wallBounce;
        }
        bounced = true;
    }

    if (bounced)
    {
        std::uniform_real_distribution<double> jitterDist(-tuning_.bounceJitter, tuning_.bounceJitter);
        vel.x += jitterDist(rng);
        vel.y += jitterDist(rng);
        vel = capSpeed(vel, tuning_.baseSpeed);
    }

    agent.position = Vec2(nx, ny);
    agent.velocity = vel;
    return bounced;
}
