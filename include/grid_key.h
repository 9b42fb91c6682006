#pragma once

#include <cstddef>
#include <cstdint>

// Integer 3D key shared by the occupancy grid (cells) and the spatial index (chunks).
struct GridKey {
    int x = 0;
    int y = 0;
    int z = 0;

    bool operator==(const GridKey& o) const { return x == o.x && y == o.y && z == o.z; }
    bool operator!=(const GridKey& o) const { return !(*this == o); }
    bool operator<(const GridKey& o) const {
        if (x != o.x) return x < o.x;
        if (y != o.y) return y < o.y;
        return z < o.z;
    }
};

struct GridKeyHash {
    std::size_t operator()(const GridKey& k) const {
        std::uint64_t h = static_cast<std::uint32_t>(k.x);
        h = h * 0x9E3779B97F4A7C15ull + static_cast<std::uint32_t>(k.y);
        h = h * 0x9E3779B97F4A7C15ull + static_cast<std::uint32_t>(k.z);
        h ^= h >> 31;
        return static_cast<std::size_t>(h);
    }
};

// Floor division; negative coordinates round toward negative infinity.
inline int floorDiv(int v, int d) {
    int q = v / d;
    if ((v % d != 0) && ((v < 0) != (d < 0))) {
        --q;
    }
    return q;
}
