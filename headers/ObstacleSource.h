#pragma once
#include "Obstacle.h"
#include <random>
#include <string>
#include <vector>

// where each game's obstacles come from, parsed once from the "blocks" setting
class ObstacleSource
{
public:
    enum class Mode
    {
        None,   // "0"
        Random, // "<count>", regenerated every game
        Fixed   // json file, same rectangles every game
    };

    static constexpr const char *DEFAULT_COLOR = "white";
    static constexpr int MAX_RANDOM_COUNT = 1000;

    // "0"/"00" -> none, digits -> random count (up to MAX_RANDOM_COUNT), anything else is a json file path:
    // {"blocks":[{"top":int,"left":int,"width":int,"height":int,"color":"optional"}]}
    // throws std::invalid_argument with a descriptive message on any problem
    static ObstacleSource parse(const std::string &option);

    // json text variant, the path is only used in messages and the summary
    static ObstacleSource fromJsonText(const std::string &text, const std::string &path);

    static ObstacleSource none() { return ObstacleSource(); }
    static ObstacleSource random(int count);
    static ObstacleSource fixed(std::vector<Obstacle> obstacles, std::string path = "");

    // fills the field for a new game (consumes rng only in random mode)
    void apply(ObstacleField &field, int width, int height, double radius, std::mt19937 &rng) const;

    // "none", "random(5)" or "json:<path>" for the session summary
    std::string describe() const;

    Mode getMode() const { return mode_; }
    int getCount() const { return count_; }
    const std::vector<Obstacle> &getFixed() const { return fixed_; }

private:
    Mode mode_ = Mode::None;
    int count_ = 0;
    std::vector<Obstacle> fixed_;
    std::string path_;
};
