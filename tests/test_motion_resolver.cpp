#include <doctest/doctest.h>

#include "MotionResolver.h"
#include "TestSupport.h"

#include <cmath>

TEST_CASE("MotionResolver: free movement does not touch the rng")
{
    MotionResolver motion(ArenaSettings::PhysicsTuning(), 800, 800);
    ObstacleField obstacles;
    std::mt19937 rng(6);
    const std::mt19937 before = rng;

    Agent agent(ROCK, Vec2(400, 400), Vec2(1.5, -2.0));
    CHECK_FALSE(motion.move(agent, obstacles, rng));
    CHECK(agent.position.x == doctest::Approx(401.5));
    CHECK(agent.position.y == doctest::Approx(398.0));
    CHECK(agent.velocity.x == 1.5);
    CHECK(rng == before);
}

TEST_CASE("MotionResolver: walls fold the overshoot back and damp the velocity")
{
    MotionResolver motion(calmTuning(), 800, 800);
    ObstacleField obstacles;
    std::mt19937 rng(6);

    SUBCASE("left wall")
    {
        // 15 - 1.8 = 13.2 is 0.8 past the radius line at 14
        Agent agent(ROCK, Vec2(15, 400), Vec2(-1.8, 0.0));
        CHECK(motion.move(agent, obstacles, rng));
        CHECK(agent.position.x == doctest::Approx(14.8));
        CHECK(agent.velocity.x == doctest::Approx(1.62));
    }

    SUBCASE("bottom wall")
    {
        Agent agent(ROCK, Vec2(400, 785), Vec2(0.0, 2.0));
        CHECK(motion.move(agent, obstacles, rng));
        CHECK(agent.position.y == doctest::Approx(785.0));
        CHECK(agent.velocity.y == doctest::Approx(-1.8));
    }
}

TEST_CASE("MotionResolver: bounce jitter stays under the speed cap")
{
    ArenaSettings::PhysicsTuning tuning;
    MotionResolver motion(tuning, 800, 800);
    ObstacleField obstacles;
    std::mt19937 rng(6);

    Agent agent(ROCK, Vec2(15, 15), Vec2(-2.0, -1.0));
    CHECK(motion.move(agent, obstacles, rng));
    CHECK(std::hypot(agent.velocity.x, agent.velocity.y) <= tuning.baseSpeed + 1e-9);
}

TEST_CASE("MotionResolver: units are pushed out of blocks through the nearest face")
{
    MotionResolver motion(calmTuning(), 800, 800);
    ObstacleField obstacles;
    obstacles.addObstacle({200.0, 200.0, 300.0, 300.0, std::nullopt});
    std::mt19937 rng(6);

    SUBCASE("left face")
    {
        // inflated left face sits at 186, the unit lands on it and is pushed back twice
        Agent agent(ROCK, Vec2(185, 250), Vec2(2.0, 0.0));
        CHECK(motion.move(agent, obstacles, rng));
        CHECK(agent.position.x == doctest::Approx(186.0));
        CHECK(agent.position.y == doctest::Approx(250.0));
        CHECK(agent.velocity.x < 0.0);
    }

    SUBCASE("right face")
    {
        Agent agent(ROCK, Vec2(315, 250), Vec2(-2.0, 0.0));
        CHECK(motion.move(agent, obstacles, rng));
        CHECK(agent.position.x == doctest::Approx(314.0));
        CHECK(agent.position.y == doctest::Approx(250.0));
        CHECK(agent.velocity.x > 0.0);
    }

    SUBCASE("top face")
    {
        Agent agent(ROCK, Vec2(260, 185), Vec2(0.0, 2.0));
        CHECK(motion.move(agent, obstacles, rng));
        CHECK(agent.position.y == doctest::Approx(186.0));
        CHECK(agent.velocity.y < 0.0);
    }

    SUBCASE("bottom face")
    {
        Agent agent(ROCK, Vec2(240, 315), Vec2(0.0, -2.0));
        CHECK(motion.move(agent, obstacles, rng));
        CHECK(agent.position.y == doctest::Approx(314.0));
        CHECK(agent.velocity.y > 0.0);
    }
}

TEST_CASE("MotionResolver: equally near faces resolve left, right, top, bottom")
{
    MotionResolver motion(calmTuning(), 800, 800);
    ObstacleField obstacles;
    obstacles.addObstacle({200.0, 200.0, 300.0, 300.0, std::nullopt});
    std::mt19937 rng(6);

    SUBCASE("left beats top")
    {
        // lands on (187, 187): 1 from the inflated left face and 1 from the top face
        Agent agent(ROCK, Vec2(185, 185), Vec2(2.0, 2.0));
        CHECK(motion.move(agent, obstacles, rng));
        CHECK(agent.position.x == 186.0);
        CHECK(agent.position.y == 187.0);
        CHECK(agent.velocity.x < 0.0);
        CHECK(agent.velocity.y > 0.0);
    }

    SUBCASE("right beats bottom")
    {
        // lands on (313, 313): 1 from the inflated right face and 1 from the bottom face
        Agent agent(ROCK, Vec2(315, 315), Vec2(-2.0, -2.0));
        CHECK(motion.move(agent, obstacles, rng));
        CHECK(agent.position.x == 314.0);
        CHECK(agent.position.y == 313.0);
        CHECK(agent.velocity.x > 0.0);
        CHECK(agent.velocity.y < 0.0);
    }

    SUBCASE("top beats bottom in a thin block")
    {
        // 4 high block: the inflated top and bottom faces sit 16 either side of y = 252
        ObstacleField thin;
        thin.addObstacle({200.0, 250.0, 300.0, 254.0, std::nullopt});
        Agent agent(ROCK, Vec2(250, 250), Vec2(0.0, 2.0));
        CHECK(motion.move(agent, thin, rng));
        CHECK(agent.position.y == 236.0);
        CHECK(agent.velocity.y < 0.0);
    }
}
