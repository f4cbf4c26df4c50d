/********************************************************
 *  author:         rps_arena maintainers
 *  date:           10/19/2026
 *  description:    rock / paper / scissors arena
 *  :               usage: ./rps_arena [settings.txt]
 *  build/run:      cmake -S . -B build && cmake --build build && ./build/rps_arena
 ***********************************************************/

#include <SFML/System.hpp>
#include <exception>
#include <iostream>
#include <memory>

#include "ArenaSettings.h"
#include "GameSession.h"
#include "KindTable.h"
#include "ObstacleSource.h"
#include "SessionLogger.h"
#include "StatsReporter.h"

int main(int argc, char *argv[])
{
    ArenaSettings settings;

    // optional key=value settings file, defaults otherwise
    if (argc > 1)
    {
        try
        {
            if (!settings.loadFromFile(argv[1]))
            {
                std::cerr << "Error: could not open settings file " << argv[1] << std::endl;
                return 1;
            }
        }
        catch (const std::exception &e)
        {
            std::cerr << "Error: " << e.what() << std::endl;
            return 1;
        }
    }
    settings.validateAndClamp();

    // a batch run needs an end
    if (settings.windowless && settings.numGames == 0)
    {
        settings.numGames = 1;
    }

    try
    {
        KindTable kinds = KindTable::fromSettings(settings.kinds);
        ObstacleSource obstacles = ObstacleSource::parse(settings.blocks);

        FileSessionLogger logger(settings.logFile, settings.quiet);

        std::unique_ptr<StatsReporter> reporter;
        if (!settings.windowless)
        {
            reporter = std::make_unique<StatsReporter>(kinds, settings.showStats, settings.quiet);
        }

        GameSession session(settings, kinds, obstacles, logger, reporter.get());
        session.run();

        if (!settings.quiet)
        {
            std::cout << "Finished " << session.getGamesPlayed() << " game(s), log written to "
                      << settings.logFile << std::endl;
        }
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
