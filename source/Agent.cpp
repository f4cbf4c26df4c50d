#include "Agent.h"
#include <algorithm>
#include <cmath>

std::vector<int> countKinds(const std::vector<Agent> &agents, size_t kindCount)
{
    std::vector<int> counts(kindCount, 0);
    for (const auto &agent : agents)
    {
        counts[agent.kind]++;
    }
    return counts;
}

int distinctKindCount(const std::vector<Agent> &agents, size_t kindCount)
{
    std::vector<int> counts = countKinds(agents, kindCount);
    return static_cast<int>(std::count_if(counts.begin(), counts.end(),
                                          [](int c)
                                          { return c > 0; }));
}

std::vector<Agent> AgentFactory::createAgents(const ArenaSettings &settings, const KindTable &kinds,
                                              const ObstacleField &obstacles, std::mt19937 &rng)
{
    const double radius = settings.physics.radius;
    const double minSep = settings.physics.minSeparation();
    const double minSepSq = minSep * minSep;

    // exactly unitsPerKind of each kind, in table order before the shuffle
    std::vector<int> pending;
    pending.reserve(kinds.size() * settings.unitsPerKind);
    for (size_t k = 0; k < kinds.size(); ++k)
    {
        pending.insert(pending.end(), static_cast<size_t>(settings.unitsPerKind), static_cast<int>(k));
    }
    std::shuffle(pending.begin(), pending.end(), rng);

    std::vector<Agent> agents;
    agents.reserve(pending.size());

    // spawn area keeps the unit fully inside the walls
    std::uniform_real_distribution<double> xDist(radius + 2.0, settings.width - radius - 2.0);
    std::uniform_real_distribution<double> yDist(radius + 2.0, settings.height - radius - 2.0);

    // constrained phase: outside obstacles and at least minSep from every placed unit
    size_t placed = 0;
    size_t attempts = 0;
    const size_t maxAttempts = pending.size() * CONSTRAINED_ATTEMPTS_PER_AGENT;
    while (placed < pending.size() && attempts < maxAttempts)
    {
        attempts++;
        Vec2 pos = samplePosition(xDist, yDist, rng);

        if (obstacles.pointInAny(pos.x, pos.y, radius))
            continue;

        bool tooClose = std::any_of(agents.begin(), agents.end(),
                                    [&](const Agent &other)
                                    { return distanceSquared(pos, other.position) < minSepSq; });
        if (tooClose)
            continue;

        agents.emplace_back(pending[placed], pos, randomVelocity(settings.physics.baseSpeed, rng));
        placed++;
    }

    // fallback phase: ignore separation but still stay out of obstacles
    // if that fails too the last sample is used as is
    for (size_t i = placed; i < pending.size(); ++i)
    {
        Vec2 pos;
        for (int tries = 0; tries < FALLBACK_TRIES; ++tries)
        {
            pos = samplePosition(xDist, yDist, rng);
            if (!obstacles.pointInAny(pos.x, pos.y, radius))
                break;
        }
        agents.emplace_back(pending[i], pos, randomVelocity(settings.physics.baseSpeed, rng));
    }

    return agents;
}

Vec2 AgentFactory::samplePosition(std::uniform_real_distribution<double> &xDist,
                                  std::uniform_real_distribution<double> &yDist,
                                  std::mt19937 &rng)
{
    // x strictly before y
    double x = xDist(rng);
    double y = yDist(rng);
    return Vec2(x, y);
}

Vec2 AgentFactory::randomVelocity(double baseSpeed, std::mt19937 &rng)
{
    std::uniform_real_distribution<double> angleDist(0.0, 2.0 * M_PI);
    std::uniform_real_distribution<double> speedDist(0.0, baseSpeed);
    double angle = angleDist(rng);
    double speed = speedDist(rng);
    return Vec2(std::cos(angle) * speed, std::sin(angle) * speed);
}
