#include "ArenaSimulation.h"
#include <algorithm>

ArenaSimulation::ArenaSimulation(const ArenaSettings &settings, const KindTable &kinds, const ObstacleSource &obstacleSource)
    : settings_(settings),
      kinds_(kinds),
      obstacleSource_(obstacleSource),
      behavior_(kinds_, settings_.physics),
      motion_(settings_.physics, settings_.width, settings_.height),
      contacts_(kinds_, settings_.physics.contactRadius())
{
    contacts_.onConverted = [this](size_t index, int newKind)
    {
        notifyObserver(observer_, [&](SimulationObserver &obs)
                       { obs.onKindChanged(index, newKind); });
    };
}

void ArenaSimulation::reset(unsigned int seed, int gameNumber)
{
    seed_ = seed;
    rng_.seed(seed);
    stepCount_ = 0;

    // blocks: regenerated in random mode, same rectangles every game otherwise
    obstacleSource_.apply(obstacles_, settings_.width, settings_.height, settings_.physics.radius, rng_);

    agents_ = AgentFactory::createAgents(settings_, kinds_, obstacles_, rng_);

    notifyObserver(observer_, [&](SimulationObserver &obs)
                   {
                       obs.onGameReset(seed_, gameNumber, obstacles_.getObstacles());
                       for (size_t i = 0; i < agents_.size(); ++i)
                           obs.onAgentCreated(i, agents_[i]);
                   });
}

bool ArenaSimulation::update()
{
    stepCount_++;

    // forces from one snapshot, then movement agent by agent
    behavior_.applyForces(agents_, rng_);
    for (auto &agent : agents_)
    {
        motion_.move(agent, obstacles_, rng_);
    }
    notifyObserver(observer_, [&](SimulationObserver &obs)
                   { obs.onAgentsMoved(agents_, stepCount_); });

    return contacts_.resolve(agents_);
}

int ArenaSimulation::getLeadingKind() const
{
    std::vector<int> counts = getKindCounts();
    if (counts.empty())
        return -1;
    return static_cast<int>(std::max_element(counts.begin(), counts.end()) - counts.begin());
}
