#include "BehaviorPolicy.h"
#include <algorithm>
#include <cmath>
#include <limits>

BehaviorPolicy::BehaviorPolicy(const KindTable &kinds, const ArenaSettings::PhysicsTuning &tuning)
    : kinds_(kinds), tuning_(tuning)
{
}

Vec2 BehaviorPolicy::computeForce(size_t self, const std::vector<Agent> &agents, std::mt19937 &rng) const
{
    const Agent &me = agents[self];
    const int preyKind = kinds_.beats(me.kind);
    const int predatorKind = kinds_.losesTo(me.kind);

    const Agent *closestPrey = nullptr;
    const Agent *closestPred = nullptr;
    double bestPreyD2 = std::numeric_limits<double>::infinity();
    double bestPredD2 = std::numeric_limits<double>::infinity();

    // strict < keeps the first one found on ties
    // with two kinds prey and predator are the same kind, a unit that is not a new
    // closest prey may still become the closest predator
    for (size_t i = 0; i < agents.size(); ++i)
    {
        if (i == self)
            continue;
        const Agent &other = agents[i];
        double d2 = distanceSquared(me.position, other.position);
        if (other.kind == preyKind && d2 < bestPreyD2)
        {
            bestPreyD2 = d2;
            closestPrey = &other;
        }
        else if (other.kind == predatorKind && d2 < bestPredD2)
        {
            bestPredD2 = d2;
            closestPred = &other;
        }
    }

    Vec2 force(0.0, 0.0);
    bool pursue = closestPrey != nullptr && (closestPred == nullptr || bestPreyD2 <= bestPredD2);
    if (pursue)
    {
        force += normalizeOrZero(closestPrey->position - me.position) * tuning_.attraction;
    }
    else if (closestPred != nullptr)
    {
        force += normalizeOrZero(me.position - closestPred->position) * tuning_.repulsion;
    }

    // mild ally repel within short range
    const double minSep = tuning_.minSeparation();
    const double minSepSq = minSep * minSep;
    for (size_t i = 0; i < agents.size(); ++i)
    {
        const Agent &ally = agents[i];
        if (i == self || ally.kind != me.kind)
            continue;
        double d2 = distanceSquared(me.position, ally.position);
        if (d2 < minSepSq)
        {
            double strength = tuning_.allyRepel * (minSep / std::max(std::sqrt(d2), 1.0));
            force += normalizeOrZero(me.position - ally.position) * strength;
        }
    }

    std::uniform_real_distribution<double> jitterDist(-tuning_.jitter, tuning_.jitter);
    force.x += jitterDist(rng);
    force.y += jitterDist(rng);
    return force;
}

void BehaviorPolicy::applyForces(std::vector<Agent> &agents, std::mt19937 &rng) const
{
    // read phase: nothing moves until every force is known
    std::vector<Vec2> forces;
    forces.reserve(agents.size());
    for (size_t i = 0; i < agents.size(); ++i)
    {
        forces.push_back(computeForce(i, agents, rng));
    }

    // write phase
    for (size_t i = 0; i < agents.size(); ++i)
    {
        agents[i].velocity = capSpeed(agents[i].velocity + forces[i], tuning_.baseSpeed);
    }
}
