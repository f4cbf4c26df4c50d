#pragma once
#include <SFML/System/Vector2.hpp>
#include <cmath>

// all simulation state is double precision so seeded runs replay bit for bit
using Vec2 = sf::Vector2<double>;

// squared euclidean distance (no sqrt, used for every nearest/contact query)
inline double distanceSquared(const Vec2 &a, const Vec2 &b)
{
    double dx = a.x - b.x;
    double dy = a.y - b.y;
    return dx * dx + dy * dy;
}

// unit vector, or zero for a zero length input
inline Vec2 normalizeOrZero(const Vec2 &v)
{
    double mag = std::hypot(v.x, v.y);
    if (mag == 0.0)
        return Vec2(0.0, 0.0);
    return Vec2(v.x / mag, v.y / mag);
}

// scales down to the cap keeping direction, never scales up
inline Vec2 capSpeed(const Vec2 &v, double cap)
{
    double speed = std::hypot(v.x, v.y);
    if (speed > cap && speed > 0.0)
    {
        double scale = cap / speed;
        return Vec2(v.x * scale, v.y * scale);
    }
    return v;
}
