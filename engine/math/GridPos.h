// Integer tile coordinate on the tactical grid.
#pragma once

#include <cstdlib>

namespace Neon {

struct GridPos {
    int x{0};
    int y{0};

    GridPos() = default;
    GridPos(int xIn, int yIn) : x(xIn), y(yIn) {}

    GridPos& operator+=(const GridPos& rhs) {
        x += rhs.x;
        y += rhs.y;
        return *this;
    }
};

inline GridPos operator+(const GridPos& a, const GridPos& b) { return GridPos{a.x + b.x, a.y + b.y}; }
inline GridPos operator-(const GridPos& a, const GridPos& b) { return GridPos{a.x - b.x, a.y - b.y}; }
inline bool operator==(const GridPos& a, const GridPos& b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(const GridPos& a, const GridPos& b) { return !(a == b); }

// Grid (Manhattan) distance; used for weapon range, movement range and AI target picks.
inline int gridDistance(const GridPos& a, const GridPos& b) { return std::abs(a.x - b.x) + std::abs(a.y - b.y); }

inline int signOf(int v) { return (v > 0) - (v < 0); }

}  // namespace Neon
