#include "GameSession.h"
#include <exception>
#include <iostream>
#include <random>

GameSession::GameSession(const ArenaSettings &settings, const KindTable &kinds, const ObstacleSource &obstacles,
                         SessionLogger &logger, SimulationObserver *observer)
    : settings_(settings),
      mode_(settings.windowless ? Mode::Batch : Mode::Paced),
      logger_(logger),
      observer_(settings.windowless ? nullptr : observer),
      simulation_(settings, kinds, obstacles),
      fastForward_(settings.fastForward, settings.delayMs)
{
    simulation_.setObserver(observer_);
}

unsigned int GameSession::drawRandomSeed()
{
    static std::random_device rd;
    static std::mt19937 gen(rd());
    std::uniform_int_distribution<unsigned int> seedDist(MIN_RANDOM_SEED, MAX_RANDOM_SEED);
    return seedDist(gen);
}

template <typename Fn>
void GameSession::bestEffortLog(Fn &&fn)
{
    try
    {
        fn(logger_);
    }
    catch (const std::exception &e)
    {
        std::cerr << "Warning: session log failed: " << e.what() << std::endl;
    }
}

void GameSession::start()
{
    if (started_)
        return;
    started_ = true;

    currentSeed_ = settings_.seed ? *settings_.seed : drawRandomSeed();

    const KindTable &kinds = simulation_.getKinds();
    std::string summary = settings_.describe(FileSessionLogger::timestamp(), currentSeed_,
                                             kinds.getNames(), simulation_.getObstacleSource().describe());
    bestEffortLog([&](SessionLogger &log)
                  {
                      log.logSettings(summary);
                      log.logHeader(kinds.getLabels());
                  });

    startGame();
}

void GameSession::cancelPendingTimers()
{
    countdownRemaining_ = 0;
    countdownElapsed_ = sf::Time::Zero;
    postgameRemaining_ = sf::Time::Zero;
}

void GameSession::startGame()
{
    phase_ = Phase::Placing;
    cancelPendingTimers();

    fastForward_.reset();
    simulation_.reset(currentSeed_, gamesPlayed_ + 1);
    gameClock_.restart();

    if (mode_ == Mode::Paced && settings_.countdownSeconds > 0)
    {
        phase_ = Phase::Countdown;
        countdownRemaining_ = settings_.countdownSeconds;
        notifyObserver(observer_, [&](SimulationObserver &obs)
                       { obs.onCountdown(countdownRemaining_); });
        return;
    }
    phase_ = Phase::Running;
}

void GameSession::tick()
{
    // countdown and post game keep the timer going without physics
    if (phase_ != Phase::Running)
        return;
    runTick();
}

void GameSession::runTick()
{
    const KindTable &kinds = simulation_.getKinds();

    bool converted = simulation_.update();
    if (converted)
    {
        std::vector<int> counts = simulation_.getKindCounts();
        long step = simulation_.getStepCount();
        bestEffortLog([&](SessionLogger &log)
                      { log.logCounts(step, counts); });
    }

    if (fastForward_.update(simulation_.getAgents(), kinds) && !settings_.quiet)
    {
        std::cout << "Fast forward: delay " << fastForward_.getBaseDelayMs() << "ms -> "
                  << fastForward_.getDelayMs() << "ms" << std::endl;
    }

    checkEnd();
}

bool GameSession::checkEnd()
{
    if (!simulation_.isResolved())
        return false;

    double elapsed = gameClock_.getElapsedTime().asSeconds();
    long steps = simulation_.getStepCount();
    bestEffortLog([&](SessionLogger &log)
                  { log.logGameEnd(elapsed, steps); });
    notifyObserver(observer_, [&](SimulationObserver &obs)
                   { obs.onGameEnded(simulation_.getLeadingKind(), steps, elapsed); });
    gamesPlayed_++;

    if (mode_ == Mode::Batch || settings_.postgameDelayMs <= 0)
    {
        afterGame();
        return true;
    }

    phase_ = Phase::Ended;
    postgameRemaining_ = sf::milliseconds(settings_.postgameDelayMs);
    return true;
}

void GameSession::afterGame()
{
    // requested number of games reached
    if (settings_.numGames > 0 && gamesPlayed_ >= settings_.numGames)
    {
        cancelPendingTimers();
        phase_ = Phase::Finished;
        return;
    }

    advanceSeed();
    startGame();
}

void GameSession::advanceSeed()
{
    if (settings_.seed)
    {
        // deterministic sequence S, S+1, S+2, ...
        currentSeed_ += 1;
    }
    else
    {
        currentSeed_ = drawRandomSeed();
    }
}

void GameSession::advanceTime(sf::Time elapsed)
{
    if (phase_ == Phase::Countdown)
    {
        const sf::Time cadence = sf::seconds(1.0f);
        countdownElapsed_ += elapsed;
        while (phase_ == Phase::Countdown && countdownElapsed_ >= cadence)
        {
            countdownElapsed_ -= cadence;
            countdownRemaining_--;
            notifyObserver(observer_, [&](SimulationObserver &obs)
                           { obs.onCountdown(countdownRemaining_); });
            if (countdownRemaining_ <= 0)
            {
                cancelPendingTimers();
                phase_ = Phase::Running;
            }
        }
    }
    else if (phase_ == Phase::Ended)
    {
        postgameRemaining_ -= elapsed;
        if (postgameRemaining_ <= sf::Time::Zero)
            afterGame();
    }
}

void GameSession::run()
{
    if (mode_ == Mode::Batch)
        runBatch();
    else
        runPaced();
}

void GameSession::runBatch()
{
    start();
    while (phase_ != Phase::Finished)
    {
        tick();
    }
}

void GameSession::runPaced()
{
    start();
    sf::Clock frameClock;
    while (phase_ != Phase::Finished)
    {
        sf::sleep(sf::milliseconds(getDelayMs()));
        advanceTime(frameClock.restart());
        tick();
    }
}
