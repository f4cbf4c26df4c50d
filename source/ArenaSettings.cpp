#include "ArenaSettings.h"
#include <fstream>
#include <sstream>
#include <iostream>
#include <algorithm>
#include <stdexcept>

namespace
{
    // std::stoi/stod throw bare logic errors, rethrow with the offending key
    int parseInt(const std::string &key, const std::string &value)
    {
        try
        {
            size_t used = 0;
            int parsed = std::stoi(value, &used);
            if (used != value.size())
                throw std::invalid_argument(value);
            return parsed;
        }
        catch (const std::logic_error &)
        {
            throw std::invalid_argument("Invalid settings: '" + key + "' expects an integer, got '" + value + "'");
        }
    }

    double parseDouble(const std::string &key, const std::string &value)
    {
        try
        {
            size_t used = 0;
            double parsed = std::stod(value, &used);
            if (used != value.size())
                throw std::invalid_argument(value);
            return parsed;
        }
        catch (const std::logic_error &)
        {
            throw std::invalid_argument("Invalid settings: '" + key + "' expects a number, got '" + value + "'");
        }
    }

    bool parseBool(const std::string &key, const std::string &value)
    {
        if (value == "1" || value == "true" || value == "on")
            return true;
        if (value == "0" || value == "false" || value == "off")
            return false;
        throw std::invalid_argument("Invalid settings: '" + key + "' expects 0/1, got '" + value + "'");
    }

    std::string trim(const std::string &s)
    {
        size_t begin = s.find_first_not_of(" \t\r");
        if (begin == std::string::npos)
            return "";
        size_t end = s.find_last_not_of(" \t\r");
        return s.substr(begin, end - begin + 1);
    }
}

bool ArenaSettings::saveToFile(const std::string &filename) const
{
    std::ofstream file(filename);
    if (!file.is_open())
    {
        std::cerr << "Error: Could not open file for writing: " << filename << std::endl;
        return false;
    }

    file << "# RPS Arena Settings\n";
    file << "width=" << width << "\n";
    file << "height=" << height << "\n";
    file << "unitsPerKind=" << unitsPerKind << "\n";
    file << "delayMs=" << delayMs << "\n";
    file << "seed=" << (seed ? std::to_string(*seed) : std::string("random")) << "\n";
    file << "numGames=" << numGames << "\n";
    file << "fastForward=" << (fastForward ? 1 : 0) << "\n";
    file << "countdownSeconds=" << countdownSeconds << "\n";
    file << "postgameDelayMs=" << postgameDelayMs << "\n";
    file << "windowless=" << (windowless ? 1 : 0) << "\n";
    file << "quiet=" << (quiet ? 1 : 0) << "\n";
    file << "showStats=" << (showStats ? 1 : 0) << "\n";
    file << "blocks=" << blocks << "\n";
    file << "logFile=" << logFile << "\n";

    // full precision so a reload reproduces the same trajectories
    file.precision(17);
    file << "radius=" << physics.radius << "\n";
    file << "baseSpeed=" << physics.baseSpeed << "\n";
    file << "attraction=" << physics.attraction << "\n";
    file << "repulsion=" << physics.repulsion << "\n";
    file << "allyRepel=" << physics.allyRepel << "\n";
    file << "wallBounce=" << physics.wallBounce << "\n";
    file << "jitter=" << physics.jitter << "\n";
    file << "bounceJitter=" << physics.bounceJitter << "\n";
    file << "contactScale=" << physics.contactScale << "\n";

    // save kind table
    file << "kindCount=" << kinds.size() << "\n";
    for (size_t i = 0; i < kinds.size(); ++i)
    {
        const auto &kind = kinds[i];
        file << "kind" << i << "_name=" << kind.name << "\n";
        file << "kind" << i << "_label=" << kind.label << "\n";
        file << "kind" << i << "_beats=" << kind.beats << "\n";
        file << "kind" << i << "_losesTo=" << kind.losesTo << "\n";
    }

    return true;
}

bool ArenaSettings::loadFromFile(const std::string &filename)
{
    std::ifstream file(filename);
    if (!file.is_open())
    {
        std::cerr << "Error: Could not open file for reading: " << filename << std::endl;
        return false;
    }

    std::string line;
    while (std::getline(file, line))
    {
        line = trim(line);
        if (line.empty() || line[0] == '#')
            continue;

        size_t equalPos = line.find('=');
        if (equalPos == std::string::npos)
            continue;

        std::string key = trim(line.substr(0, equalPos));
        std::string value = trim(line.substr(equalPos + 1));

        // parse basic settings
        if (key == "width")
            width = parseInt(key, value);
        else if (key == "height")
            height = parseInt(key, value);
        else if (key == "unitsPerKind")
            unitsPerKind = parseInt(key, value);
        else if (key == "delayMs")
            delayMs = parseInt(key, value);
        else if (key == "seed")
        {
            if (value.empty() || value == "random")
                seed.reset();
            else
                seed = static_cast<unsigned int>(parseInt(key, value));
        }
        else if (key == "numGames")
            numGames = parseInt(key, value);
        else if (key == "fastForward")
            fastForward = parseBool(key, value);
        else if (key == "countdownSeconds")
            countdownSeconds = parseInt(key, value);
        else if (key == "postgameDelayMs")
            postgameDelayMs = parseInt(key, value);
        else if (key == "windowless")
            windowless = parseBool(key, value);
        else if (key == "quiet")
            quiet = parseBool(key, value);
        else if (key == "showStats")
            showStats = parseBool(key, value);
        else if (key == "blocks")
            blocks = value;
        else if (key == "logFile")
            logFile = value;
        // physics tuning
        else if (key == "radius")
            physics.radius = parseDouble(key, value);
        else if (key == "baseSpeed")
            physics.baseSpeed = parseDouble(key, value);
        else if (key == "attraction")
            physics.attraction = parseDouble(key, value);
        else if (key == "repulsion")
            physics.repulsion = parseDouble(key, value);
        else if (key == "allyRepel")
            physics.allyRepel = parseDouble(key, value);
        else if (key == "wallBounce")
            physics.wallBounce = parseDouble(key, value);
        else if (key == "jitter")
            physics.jitter = parseDouble(key, value);
        else if (key == "bounceJitter")
            physics.bounceJitter = parseDouble(key, value);
        else if (key == "contactScale")
            physics.contactScale = parseDouble(key, value);
        // parse kind table
        else if (key == "kindCount")
        {
            int count = parseInt(key, value);
            if (count < 0)
                throw std::invalid_argument("Invalid settings: 'kindCount' must not be negative");
            kinds.resize(static_cast<size_t>(count));
        }
        else if (key.find("kind") == 0)
        {
            size_t underscorePos = key.find('_');
            if (underscorePos == std::string::npos || underscorePos == 4)
            {
                std::cerr << "Warning: ignoring unknown settings key: " << key << std::endl;
                continue;
            }

            int index = parseInt(key, key.substr(4, underscorePos - 4)); // after "kind"
            std::string property = key.substr(underscorePos + 1);

            if (index < 0 || index >= static_cast<int>(kinds.size()))
                throw std::invalid_argument("Invalid settings: '" + key + "' is outside kindCount");

            auto &kind = kinds[index];
            if (property == "name")
                kind.name = value;
            else if (property == "label")
                kind.label = value;
            else if (property == "beats")
                kind.beats = value;
            else if (property == "losesTo")
                kind.losesTo = value;
            else
                std::cerr << "Warning: ignoring unknown settings key: " << key << std::endl;
        }
        else
        {
            std::cerr << "Warning: ignoring unknown settings key: " << key << std::endl;
        }
    }

    validateAndClamp();
    return true;
}

void ArenaSettings::validateAndClamp()
{
    width = std::clamp(width, 100, 4096);
    height = std::clamp(height, 100, 4096);
    unitsPerKind = std::max(1, unitsPerKind);
    if (delayMs <= 0)
        delayMs = 1;
    numGames = std::max(0, numGames);
    countdownSeconds = std::max(0, countdownSeconds);
    postgameDelayMs = std::max(0, postgameDelayMs);

    physics.radius = std::clamp(physics.radius, 1.0, 40.0);
    physics.baseSpeed = std::max(0.01, physics.baseSpeed);
    physics.attraction = std::max(0.0, physics.attraction);
    physics.repulsion = std::max(0.0, physics.repulsion);
    physics.allyRepel = std::max(0.0, physics.allyRepel);
    physics.wallBounce = std::clamp(physics.wallBounce, 0.0, 1.0);
    physics.jitter = std::max(0.0, physics.jitter);
    physics.bounceJitter = std::max(0.0, physics.bounceJitter);
    physics.contactScale = std::max(0.0, physics.contactScale);

    // kind names are the keys of the relation
    for (auto &kind : kinds)
    {
        if (kind.label.empty())
            kind.label = kind.name;
    }
}

std::string ArenaSettings::describe(const std::string &timestamp, unsigned int currentSeed,
                                    const std::vector<std::string> &kindNames, const std::string &blocksDesc) const
{
    std::ostringstream oss;
    oss << "start=" << timestamp
        << " | size=" << width << "x" << height
        << " | units_per_kind=" << unitsPerKind
        << " | total_units=" << unitsPerKind * static_cast<int>(kindNames.size())
        << " | delay_ms=" << delayMs
        << " | seed=" << (seed ? std::to_string(currentSeed) : std::string("random"))
        << " | kinds=";
    for (size_t i = 0; i < kindNames.size(); ++i)
    {
        if (i > 0)
            oss << ",";
        oss << kindNames[i];
    }
    oss << " | fast_forward=" << (fastForward ? "on" : "off")
        << " | num_games=" << numGames
        << " | blocks=" << blocksDesc;
    return oss.str();
}
