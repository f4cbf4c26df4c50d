#include <doctest/doctest.h>

#include "Agent.h"
#include "TestSupport.h"

#include <cmath>

TEST_CASE("AgentFactory: exactly unitsPerKind of every kind")
{
    ArenaSettings settings;
    settings.unitsPerKind = 12;
    KindTable kinds = classicKinds();
    ObstacleField obstacles;
    std::mt19937 rng(3);

    std::vector<Agent> agents = AgentFactory::createAgents(settings, kinds, obstacles, rng);
    REQUIRE(agents.size() == 36);
    CHECK(countKinds(agents, kinds.size()) == std::vector<int>{12, 12, 12});
    CHECK(distinctKindCount(agents, kinds.size()) == 3);
}

TEST_CASE("AgentFactory: units start inside the walls below base speed")
{
    ArenaSettings settings;
    settings.unitsPerKind = 20;
    KindTable kinds = classicKinds();
    ObstacleField obstacles;
    std::mt19937 rng(17);

    const double r = settings.physics.radius;
    for (const auto &agent : AgentFactory::createAgents(settings, kinds, obstacles, rng))
    {
        CHECK(agent.position.x >= r + 2.0);
        CHECK(agent.position.x <= settings.width - r - 2.0);
        CHECK(agent.position.y >= r + 2.0);
        CHECK(agent.position.y <= settings.height - r - 2.0);
        CHECK(std::hypot(agent.velocity.x, agent.velocity.y) <= settings.physics.baseSpeed);
    }
}

TEST_CASE("AgentFactory: constrained placement keeps the minimum separation")
{
    ArenaSettings settings;
    settings.unitsPerKind = 5;
    KindTable kinds = classicKinds();
    ObstacleField obstacles;
    std::mt19937 rng(8);

    std::vector<Agent> agents = AgentFactory::createAgents(settings, kinds, obstacles, rng);
    const double minSep = settings.physics.minSeparation();
    for (size_t i = 0; i < agents.size(); ++i)
    {
        for (size_t j = i + 1; j < agents.size(); ++j)
        {
            CHECK(distanceSquared(agents[i].position, agents[j].position) >= minSep * minSep);
        }
    }
}

TEST_CASE("AgentFactory: a block spanning the full width is never entered")
{
    ArenaSettings settings;
    settings.unitsPerKind = 10;
    KindTable kinds = classicKinds();
    ObstacleField obstacles;
    obstacles.addObstacle({0.0, 300.0, 800.0, 500.0, std::nullopt});
    std::mt19937 rng(21);

    for (const auto &agent : AgentFactory::createAgents(settings, kinds, obstacles, rng))
    {
        CHECK_FALSE(obstacles.pointInAny(agent.position.x, agent.position.y, settings.physics.radius));
    }
}

TEST_CASE("AgentFactory: a block over the whole spawn area still places every unit")
{
    // every sample is rejected, each unit ends up on its last sampled point
    ArenaSettings settings;
    settings.unitsPerKind = 2;
    KindTable kinds = classicKinds();
    ObstacleField obstacles;
    obstacles.addObstacle({0.0, 0.0, 800.0, 800.0, std::nullopt});
    std::mt19937 rng(5);

    std::vector<Agent> agents = AgentFactory::createAgents(settings, kinds, obstacles, rng);
    REQUIRE(agents.size() == 6);
    CHECK(countKinds(agents, kinds.size()) == std::vector<int>{2, 2, 2});

    const double r = settings.physics.radius;
    for (const auto &agent : agents)
    {
        CHECK(agent.position.x >= r + 2.0);
        CHECK(agent.position.x <= settings.width - r - 2.0);
        CHECK(agent.position.y >= r + 2.0);
        CHECK(agent.position.y <= settings.height - r - 2.0);
        CHECK(obstacles.pointInAny(agent.position.x, agent.position.y, r));
    }
}

TEST_CASE("AgentFactory: crowded arena still places every unit")
{
    // far more units than fit at the minimum separation
    ArenaSettings settings;
    settings.width = 100;
    settings.height = 100;
    settings.unitsPerKind = 30;
    KindTable kinds = classicKinds();
    ObstacleField obstacles;
    std::mt19937 rng(2);

    std::vector<Agent> agents = AgentFactory::createAgents(settings, kinds, obstacles, rng);
    CHECK(agents.size() == 90);
    CHECK(countKinds(agents, kinds.size()) == std::vector<int>{30, 30, 30});
}

TEST_CASE("AgentFactory: same seed, same placement")
{
    ArenaSettings settings;
    settings.unitsPerKind = 8;
    KindTable kinds = classicKinds();
    ObstacleField obstacles;
    std::mt19937 rngA(123);
    std::mt19937 rngB(123);

    std::vector<Agent> a = AgentFactory::createAgents(settings, kinds, obstacles, rngA);
    std::vector<Agent> b = AgentFactory::createAgents(settings, kinds, obstacles, rngB);
    REQUIRE(a.size() == b.size());
    for (size_t i = 0; i < a.size(); ++i)
    {
        CHECK(a[i].kind == b[i].kind);
        CHECK(a[i].position == b[i].position);
        CHECK(a[i].velocity == b[i].velocity);
    }
}
