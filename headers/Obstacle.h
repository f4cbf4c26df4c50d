#pragma once
#include <optional>
#include <random>
#include <string>
#include <vector>

// axis aligned static block in world coordinates
struct Obstacle {
    double x1, y1;  // top left
    double x2, y2;  // bottom right
    std::optional<std::string> color;  // cosmetic only

    // point inside the rectangle grown by margin on every side
    bool contains(double x, double y, double margin) const {
        return (x1 - margin) <= x && x <= (x2 + margin) &&
               (y1 - margin) <= y && y <= (y2 + margin);
    }
};

// the per game obstacle set
// queries are a linear scan in insertion order, the first hit decides which face an agent bounces off
class ObstacleField {
public:
    static constexpr double MIN_SIZE_FRACTION = 0.08;
    static constexpr double MAX_SIZE_FRACTION = 0.40;
    static constexpr double MAX_AREA_FRACTION = 0.20;
    static constexpr int ATTEMPTS_PER_OBSTACLE = 30;
    static constexpr int MIN_EXTENT = 4;

    void clear() { obstacles_.clear(); }
    void addObstacle(const Obstacle& obs) { obstacles_.push_back(obs); }

    // random blocks, regenerated every game from the game rng
    // returns how many were placed (fewer than count is fine)
    int generateRandom(int count, int width, int height, double radius,
                       std::mt19937& rng, const std::string& color);

    // copy of the configured blocks, missing colors get the default
    void applyFixed(const std::vector<Obstacle>& fixed, const std::string& defaultColor);

    bool pointInAny(double x, double y, double margin) const;
    const Obstacle* firstColliding(double x, double y, double margin) const;

    const std::vector<Obstacle>& getObstacles() const { return obstacles_; }
    size_t size() const { return obstacles_.size(); }
    bool empty() const { return obstacles_.empty(); }

private:
    std::vector<Obstacle> obstacles_;
};
