#pragma once

#include <algorithm>
#include <cmath>

namespace vb {

// Normalized court coordinates: x across the net (0-1), y from AWAY baseline (0) to HOME baseline (1)
struct Vec2 {
    double x = 0.0;
    double y = 0.0;

    Vec2 operator+(Vec2 o) const { return {x + o.x, y + o.y}; }
    Vec2 operator-(Vec2 o) const { return {x - o.x, y - o.y}; }
    Vec2 operator*(double k) const { return {x * k, y * k}; }

    double dot(Vec2 o) const { return x * o.x + y * o.y; }
    double length() const { return std::hypot(x, y); }
    double distanceTo(Vec2 o) const { return std::hypot(x - o.x, y - o.y); }

    // Zero vector stays zero
    Vec2 normalized() const {
        double len = length();
        if (len < 1e-9) return {0.0, 0.0};
        return {x / len, y / len};
    }

    bool operator==(Vec2 o) const { return x == o.x && y == o.y; }
    bool operator!=(Vec2 o) const { return !(*this == o); }
};

inline Vec2 clampVec(Vec2 p, Vec2 lo, Vec2 hi) {
    return {std::min(std::max(p.x, lo.x), hi.x), std::min(std::max(p.y, lo.y), hi.y)};
}

inline Vec2 lerp(Vec2 a, Vec2 b, double t) {
    return {a.x + (b.x - a.x) * t, a.y + (b.y - a.y) * t};
}

} // namespace vb
