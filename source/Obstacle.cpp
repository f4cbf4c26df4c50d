#include "Obstacle.h"
#include <algorithm>

int ObstacleField::generateRandom(int count, int width, int height, double radius,
                                  std::mt19937& rng, const std::string& color) {
    clear();
    if (count <= 0) {
        return 0;
    }

    const double maxArea = MAX_AREA_FRACTION * (static_cast<double>(width) * height);
    const int minW = static_cast<int>(MIN_SIZE_FRACTION * width);
    const int maxW = static_cast<int>(MAX_SIZE_FRACTION * width);
    const int minH = static_cast<int>(MIN_SIZE_FRACTION * height);
    const int maxH = static_cast<int>(MAX_SIZE_FRACTION * height);

    // keep every block one radius (+2) away from the walls
    const int edge = static_cast<int>(radius) + 2;

    std::uniform_int_distribution<int> widthDist(minW, maxW);
    std::uniform_int_distribution<int> heightDist(minH, maxH);

    const long long maxAttempts = static_cast<long long>(count) * ATTEMPTS_PER_OBSTACLE;
    long long attempts = 0;
    while (static_cast<int>(obstacles_.size()) < count && attempts < maxAttempts) {
        attempts++;
        int w = widthDist(rng);
        int h = heightDist(rng);

        // per block area cap: shrink the height, drop it if that goes below the minimum
        if (static_cast<double>(w) * h > maxArea) {
            h = static_cast<int>(maxArea / std::max(w, 1));
            if (h < minH) {
                continue;
            }
        }

        std::uniform_int_distribution<int> xDist(edge, std::max(edge, width - w - edge));
        std::uniform_int_distribution<int> yDist(edge, std::max(edge, height - h - edge));
        int x1 = xDist(rng);
        int y1 = yDist(rng);

        if (w >= MIN_EXTENT && h >= MIN_EXTENT) {
            obstacles_.push_back({static_cast<double>(x1), static_cast<double>(y1),
                                  static_cast<double>(x1 + w), static_cast<double>(y1 + h),
                                  color});
        }
    }
    return static_cast<int>(obstacles_.size());
}

void ObstacleField::applyFixed(const std::vector<Obstacle>& fixed, const std::string& defaultColor) {
    clear();
    obstacles_.reserve(fixed.size());
    for (const auto& obs : fixed) {
        Obstacle copy = obs;
        if (!copy.color) {
            copy.color = defaultColor;
        }
        obstacles_.push_back(copy);
    }
}

bool ObstacleField::pointInAny(double x, double y, double margin) const {
    return firstColliding(x, y, margin) != nullptr;
}

const Obstacle* ObstacleField::firstColliding(double x, double y, double margin) const {
    for (const auto& obs : obstacles_) {
        if (obs.contains(x, y, margin)) {
            return &obs;
        }
    }
    return nullptr;
}
