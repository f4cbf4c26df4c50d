#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>

class ArenaSettings
{
public:
    // arena settings
    int width = 800;
    int height = 800;
    int unitsPerKind = 50; // per kind, 3 kinds => 150 units
    int delayMs = 30;      // tick delay in paced mode (0 coerced to 1)

    std::optional<unsigned int> seed; // fixed seed for the first game, next games use seed+1, seed+2...
    int numGames = 0;                 // 0 = unlimited
    bool fastForward = true;          // collapse delay once a two kind endgame is left
    int countdownSeconds = 0;         // paused physics before each game (paced mode only)
    int postgameDelayMs = 5000;       // pause after each game (paced mode only)

    // run mode
    bool windowless = false; // batch mode: tight loop, no pacing, no observer
    bool quiet = false;      // log lines only go to the log file
    bool showStats = false;  // periodic stats line on the console (paced mode)

    // "0" = none, "<int>" = random obstacles per game, otherwise a json file path
    std::string blocks = "0";
    std::string logFile = "rps_arena_log.txt";

    // movement and contact tuning
    struct PhysicsTuning
    {
        double radius = 14.0;     // approximate collision radius of a unit
        double baseSpeed = 2.2;   // movement cap per tick
        double attraction = 1.6;  // toward prey
        double repulsion = 1.8;   // away from predators
        double allyRepel = 1.3;   // mild repel from allies to avoid clumping
        double wallBounce = 0.9;  // bounce damping
        double jitter = 0.25;     // tiny noise to prevent stalemates
        double bounceJitter = 0.2;
        double contactScale = 1.1; // contact radius = contactScale * radius

        // minimum separation for initial placement and ally repel range
        double minSeparation() const { return radius * 2.0 + 6.0; }
        double contactRadius() const { return radius * contactScale; }
    };
    PhysicsTuning physics;

    // kind definitions, the relation must form a single cycle
    struct KindSettings
    {
        std::string name;
        std::string label; // emoji shown in the log header
        std::string beats;
        std::string losesTo;

        KindSettings() = default;
        KindSettings(std::string n, std::string l, std::string b, std::string lt)
            : name(std::move(n)), label(std::move(l)), beats(std::move(b)), losesTo(std::move(lt)) {}
    };
    std::vector<KindSettings> kinds;

    ArenaSettings()
    {
        // the classic game
        kinds.emplace_back("rock", "\xF0\x9F\xAA\xA8", "scissors", "paper");
        kinds.emplace_back("paper", "\xF0\x9F\x93\x84", "rock", "scissors");
        kinds.emplace_back("scissors", "\xE2\x9C\x82\xEF\xB8\x8F", "paper", "rock");
    }

    bool saveToFile(const std::string &filename) const;
    bool loadFromFile(const std::string &filename);

    void validateAndClamp();

    // the one line summary written at session start
    std::string describe(const std::string &timestamp, unsigned int currentSeed,
                         const std::vector<std::string> &kindNames, const std::string &blocksDesc) const;
};
