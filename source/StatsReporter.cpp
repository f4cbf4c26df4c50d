#include "StatsReporter.h"
#include <iomanip>
#include <iostream>
#include <sstream>

StatsReporter::StatsReporter(const KindTable &kinds, bool showStats, bool quiet)
    : kinds_(kinds), showStats_(showStats), quiet_(quiet)
{
}

void StatsReporter::onGameReset(unsigned int seed, int gameNumber, const std::vector<Obstacle> &obstacles)
{
    gameClock_.restart();
    statsClock_.restart();
    if (quiet_)
        return;
    std::cout << "Game " << gameNumber << " (seed " << seed << ", " << obstacles.size() << " blocks)" << std::endl;
}

void StatsReporter::onAgentsMoved(const std::vector<Agent> &agents, long step)
{
    if (!showStats_ || statsClock_.getElapsedTime().asSeconds() < STATS_INTERVAL_SECONDS)
        return;
    statsClock_.restart();

    std::vector<int> counts = countKinds(agents, kinds_.size());
    std::ostringstream line;
    line << "t=" << std::fixed << std::setprecision(1) << gameClock_.getElapsedTime().asSeconds()
         << "s step=" << step;
    for (size_t k = 0; k < counts.size(); ++k)
    {
        line << " " << kinds_.name(static_cast<int>(k)) << ":" << counts[k];
    }
    std::cout << line.str() << std::endl;
}

void StatsReporter::onCountdown(int remaining)
{
    if (quiet_)
        return;
    if (remaining > 0)
        std::cout << "Starting in " << remaining << "..." << std::endl;
    else
        std::cout << "Go!" << std::endl;
}

void StatsReporter::onGameEnded(int winningKind, long steps, double elapsedSeconds)
{
    if (quiet_ || winningKind < 0)
        return;
    std::cout << kinds_.label(winningKind) << " " << kinds_.name(winningKind) << " wins after " << steps
              << " steps (" << std::fixed << std::setprecision(3) << elapsedSeconds << "s)" << std::endl;
}
