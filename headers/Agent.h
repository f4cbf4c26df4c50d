#pragma once
#include "VectorMath.h"
#include "ArenaSettings.h"
#include "KindTable.h"
#include "Obstacle.h"
#include <random>
#include <vector>

// one unit on the field, only its kind changes on conversion
struct Agent
{
    int kind;        // index into the KindTable
    Vec2 position;
    Vec2 velocity;

    Agent(int k, Vec2 pos, Vec2 vel) : kind(k), position(pos), velocity(vel) {}
};

// live count per kind index
std::vector<int> countKinds(const std::vector<Agent> &agents, size_t kindCount);

// number of distinct kinds still present
int distinctKindCount(const std::vector<Agent> &agents, size_t kindCount);

// initial placement for a new game
class AgentFactory
{
public:
    // exactly unitsPerKind of every kind, shuffled, placed outside obstacles with best effort separation
    // rng order: one shuffle, then per agent position draw(s), angle, speed
    static std::vector<Agent> createAgents(const ArenaSettings &settings, const KindTable &kinds,
                                           const ObstacleField &obstacles, std::mt19937 &rng);

    static constexpr int CONSTRAINED_ATTEMPTS_PER_AGENT = 500;
    static constexpr int FALLBACK_TRIES = 2000;

private:
    static Vec2 samplePosition(std::uniform_real_distribution<double> &xDist,
                               std::uniform_real_distribution<double> &yDist,
                               std::mt19937 &rng);
    static Vec2 randomVelocity(double baseSpeed, std::mt19937 &rng);
};
