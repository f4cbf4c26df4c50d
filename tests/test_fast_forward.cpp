#include <doctest/doctest.h>

#include "FastForwardController.h"
#include "TestSupport.h"

namespace
{
    std::vector<Agent> ofKinds(const std::vector<int> &kinds)
    {
        std::vector<Agent> agents;
        for (size_t i = 0; i < kinds.size(); ++i)
            agents.emplace_back(kinds[i], Vec2(10.0 * i, 0.0), Vec2(0.0, 0.0));
        return agents;
    }
}

TEST_CASE("FastForwardController: three kinds keep the base delay")
{
    KindTable kinds = classicKinds();
    FastForwardController ff(true, 30);
    CHECK_FALSE(ff.update(ofKinds({ROCK, PAPER, SCISSORS}), kinds));
    CHECK_FALSE(ff.isActive());
    CHECK(ff.getDelayMs() == 30);
}

TEST_CASE("FastForwardController: two adjacent kinds collapse the delay once")
{
    KindTable kinds = classicKinds();
    FastForwardController ff(true, 30);

    CHECK(ff.update(ofKinds({ROCK, SCISSORS, ROCK}), kinds));
    CHECK(ff.isActive());
    CHECK(ff.getDelayMs() == FastForwardController::MIN_DELAY_MS);

    // latched for the rest of the game
    CHECK_FALSE(ff.update(ofKinds({ROCK, SCISSORS, PAPER}), kinds));
    CHECK(ff.isActive());
    CHECK(ff.getDelayMs() == FastForwardController::MIN_DELAY_MS);

    ff.reset();
    CHECK_FALSE(ff.isActive());
    CHECK(ff.getDelayMs() == 30);
}

TEST_CASE("FastForwardController: unrelated survivors do not trigger it")
{
    KindTable kinds = KindTable::fromSettings(cycleOf({"a", "b", "c", "d"}));
    FastForwardController ff(true, 30);

    CHECK_FALSE(ff.update(ofKinds({kinds.indexOf("a"), kinds.indexOf("c")}), kinds));
    CHECK_FALSE(ff.isActive());

    CHECK(ff.update(ofKinds({kinds.indexOf("c"), kinds.indexOf("d")}), kinds));
}

TEST_CASE("FastForwardController: disabled or single kind")
{
    KindTable kinds = classicKinds();

    FastForwardController off(false, 30);
    CHECK_FALSE(off.update(ofKinds({ROCK, SCISSORS}), kinds));
    CHECK(off.getDelayMs() == 30);

    FastForwardController on(true, 30);
    CHECK_FALSE(on.update(ofKinds({ROCK, ROCK}), kinds));
}

TEST_CASE("FastForwardController: activation at the minimum delay still latches")
{
    KindTable kinds = classicKinds();
    FastForwardController ff(true, 0);
    CHECK(ff.getBaseDelayMs() == 1);
    CHECK(ff.update(ofKinds({PAPER, ROCK}), kinds));
    CHECK(ff.isActive());
}
