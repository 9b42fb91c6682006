#pragma once

#include <SFML/System/Vector3.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "grid_key.h"
#include "sim_status.h"
#include "structure.h"

struct CellIssue {
    sf::Vector3i cell;
    std::string reason;
};

struct RegionCheck {
    bool free = true;
    std::vector<CellIssue> issues;
};

// Integer-cell occupancy. The only authority on whether a volume can take a
// new structure; holds structure ids, never structure copies.
class GridIndex {
public:
    GridIndex(int gridSize, int gridHeight);

    SimStatus validateBounds(int x, int y, int z) const;
    SimStatus validateBounds(double x, double y, double z) const;
    RegionCheck isRegionFree(int x, int y, int z, int width, int height, int depth) const;

    // Marks the footprint occupied. Assigns the next id when structure.id is 0.
    SimStatus place(Structure& structure);
    SimStatus remove(int id);

    std::optional<int> occupantAt(int x, int y, int z) const;
    bool contains(int id) const { return m_cellsById.count(id) != 0; }
    std::size_t occupiedCellCount() const { return m_cellOwner.size(); }
    std::size_t cellsOwnedBy(int id) const;
    std::size_t structureCount() const { return m_cellsById.size(); }
    int peekNextId() const { return m_nextId; }

    int gridSize() const { return m_gridSize; }
    int gridHeight() const { return m_gridHeight; }

    void clear();
    std::string validateIntegrity() const;

private:
    bool inBounds(int x, int y, int z) const;

    int m_gridSize = 0;
    int m_gridHeight = 0;
    int m_nextId = 1;
    std::unordered_map<GridKey, int, GridKeyHash> m_cellOwner;
    std::unordered_map<int, std::vector<GridKey>> m_cellsById;
};
