#pragma once
#include <SFML/System.hpp>
#include "ArenaSettings.h"
#include "ArenaSimulation.h"
#include "FastForwardController.h"
#include "KindTable.h"
#include "ObstacleSource.h"
#include "SessionLogger.h"
#include "SimulationObserver.h"

// runs games back to back: seeding, countdown, ticking, end detection and reseeding
// the pending countdown / post game waits are plain state here, polled by the driver
// through advanceTime(), so starting a game is all it takes to cancel them
class GameSession
{
public:
    enum class Phase
    {
        Placing,   // building the next game
        Countdown, // physics paused before the start (paced mode only)
        Running,
        Ended,     // post game pause (paced mode only)
        Finished   // game limit reached
    };

    enum class Mode
    {
        Paced, // external timer, countdown and post game pauses, observer attached
        Batch  // tight loop, no pacing, no observer
    };

    static constexpr unsigned int MIN_RANDOM_SEED = 1;
    static constexpr unsigned int MAX_RANDOM_SEED = 1000000;

    GameSession(const ArenaSettings &settings, const KindTable &kinds, const ObstacleSource &obstacles,
                SessionLogger &logger, SimulationObserver *observer = nullptr);

    // session header lines, first seed, first game
    void start();

    // one scheduled tick: no physics unless running
    void tick();

    // external time for the countdown (1 s cadence) and the post game pause
    void advanceTime(sf::Time elapsed);

    // start() if needed, then drive until the game limit
    void run();
    void runBatch();
    void runPaced();

    Phase getPhase() const { return phase_; }
    Mode getMode() const { return mode_; }
    bool isFinished() const { return phase_ == Phase::Finished; }

    unsigned int getCurrentSeed() const { return currentSeed_; }
    int getGamesPlayed() const { return gamesPlayed_; }
    long getStepCount() const { return simulation_.getStepCount(); }
    int getCountdownRemaining() const { return countdownRemaining_; }

    // current tick delay, 1 once fast forward kicked in
    int getDelayMs() const { return fastForward_.getDelayMs(); }
    bool isFastForwardActive() const { return fastForward_.isActive(); }

    const ArenaSimulation &getSimulation() const { return simulation_; }

    // fresh seed in [MIN_RANDOM_SEED, MAX_RANDOM_SEED]
    static unsigned int drawRandomSeed();

private:
    ArenaSettings settings_;
    Mode mode_;
    SessionLogger &logger_;
    SimulationObserver *observer_;

    ArenaSimulation simulation_;
    FastForwardController fastForward_;

    Phase phase_ = Phase::Placing;
    bool started_ = false;
    unsigned int currentSeed_ = 0;
    int gamesPlayed_ = 0;

    // per game elapsed time origin
    sf::Clock gameClock_;

    int countdownRemaining_ = 0;
    sf::Time countdownElapsed_;
    sf::Time postgameRemaining_;

    void startGame();
    void runTick();
    bool checkEnd();
    void afterGame();
    void advanceSeed();
    void cancelPendingTimers();

    // logger failures must not stop the loop
    template <typename Fn>
    void bestEffortLog(Fn &&fn);
};
