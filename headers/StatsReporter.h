#pragma once
#include <SFML/System.hpp>
#include "KindTable.h"
#include "SimulationObserver.h"

// console observer for paced runs: game notices and an optional once a second stats line
class StatsReporter : public SimulationObserver
{
public:
    StatsReporter(const KindTable &kinds, bool showStats, bool quiet);

    void onGameReset(unsigned int seed, int gameNumber, const std::vector<Obstacle> &obstacles) override;
    void onAgentsMoved(const std::vector<Agent> &agents, long step) override;
    void onCountdown(int remaining) override;
    void onGameEnded(int winningKind, long steps, double elapsedSeconds) override;

private:
    const KindTable &kinds_;
    bool showStats_;
    bool quiet_;

    sf::Clock gameClock_;
    sf::Clock statsClock_;

    static constexpr float STATS_INTERVAL_SECONDS = 1.0f;
};
