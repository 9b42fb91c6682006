#include "grid_index.h"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace {

std::string cellLabel(int x, int y, int z) {
    std::ostringstream oss;
    oss << "(" << x << "," << y << "," << z << ")";
    return oss.str();
}

} // namespace

GridIndex::GridIndex(int gridSize, int gridHeight)
    : m_gridSize(std::max(1, gridSize)), m_gridHeight(std::max(1, gridHeight)) {}

bool GridIndex::inBounds(int x, int y, int z) const {
    return x >= 0 && x < m_gridSize &&
           y >= 0 && y < m_gridHeight &&
           z >= 0 && z < m_gridSize;
}

SimStatus GridIndex::validateBounds(int x, int y, int z) const {
    if (!inBounds(x, y, z)) {
        std::ostringstream oss;
        oss << "position " << cellLabel(x, y, z) << " outside world " << m_gridSize << "x" << m_gridHeight << "x"
            << m_gridSize;
        return SimStatus::failure(SimErrorCode::OutOfBounds, oss.str());
    }
    return SimStatus::success();
}

SimStatus GridIndex::validateBounds(double x, double y, double z) const {
    for (double v : {x, y, z}) {
        if (!std::isfinite(v) || std::floor(v) != v) {
            std::ostringstream oss;
            oss << "coordinates must be integers, got (" << x << "," << y << "," << z << ")";
            return SimStatus::failure(SimErrorCode::OutOfBounds, oss.str());
        }
        if (std::abs(v) > 1.0e9) {
            return SimStatus::failure(SimErrorCode::OutOfBounds, "coordinate magnitude out of range");
        }
    }
    return validateBounds(static_cast<int>(x), static_cast<int>(y), static_cast<int>(z));
}

RegionCheck GridIndex::isRegionFree(int x, int y, int z, int width, int height, int depth) const {
    RegionCheck out;
    if (width <= 0 || height <= 0 || depth <= 0) {
        out.free = false;
        out.issues.push_back({sf::Vector3i(x, y, z), "non-positive dimensions"});
        return out;
    }
    for (int dx = 0; dx < width; ++dx) {
        for (int dy = 0; dy < height; ++dy) {
            for (int dz = 0; dz < depth; ++dz) {
                const int cx = x + dx;
                const int cy = y + dy;
                const int cz = z + dz;
                if (!inBounds(cx, cy, cz)) {
                    out.free = false;
                    out.issues.push_back({sf::Vector3i(cx, cy, cz), "out of bounds"});
                    continue;
                }
                const auto it = m_cellOwner.find(GridKey{cx, cy, cz});
                if (it != m_cellOwner.end()) {
                    out.free = false;
                    out.issues.push_back({sf::Vector3i(cx, cy, cz), "occupied by " + std::to_string(it->second)});
                }
            }
        }
    }
    return out;
}

SimStatus GridIndex::place(Structure& structure) {
    const sf::Vector3i& p = structure.position;
    SimStatus bounds = validateBounds(p.x, p.y, p.z);
    if (!bounds.ok()) {
        return bounds;
    }
    if (structure.id != 0 && contains(structure.id)) {
        return SimStatus::failure(SimErrorCode::InvalidState,
                                  "structure id " + std::to_string(structure.id) + " already placed");
    }
    if (structure.id < 0) {
        return SimStatus::failure(SimErrorCode::InvalidState, "structure ids must be positive");
    }

    const Dimensions& d = structure.dimensions;
    const RegionCheck region = isRegionFree(p.x, p.y, p.z, d.width, d.height, d.depth);
    if (!region.free) {
        std::ostringstream oss;
        oss << "region not free at " << cellLabel(p.x, p.y, p.z) << ": " << region.issues.size() << " blocked cell(s)";
        if (!region.issues.empty()) {
            const CellIssue& first = region.issues.front();
            oss << ", first " << cellLabel(first.cell.x, first.cell.y, first.cell.z) << " " << first.reason;
        }
        return SimStatus::failure(SimErrorCode::RegionOccupied, oss.str());
    }

    if (structure.id == 0) {
        structure.id = m_nextId;
    }
    m_nextId = std::max(m_nextId, structure.id + 1);

    std::vector<GridKey>& cells = m_cellsById[structure.id];
    cells.reserve(static_cast<size_t>(d.cellCount()));
    for (int dx = 0; dx < d.width; ++dx) {
        for (int dy = 0; dy < d.height; ++dy) {
            for (int dz = 0; dz < d.depth; ++dz) {
                const GridKey key{p.x + dx, p.y + dy, p.z + dz};
                m_cellOwner[key] = structure.id;
                cells.push_back(key);
            }
        }
    }
    return SimStatus::success();
}

SimStatus GridIndex::remove(int id) {
    const auto it = m_cellsById.find(id);
    if (it == m_cellsById.end()) {
        return SimStatus::failure(SimErrorCode::NotFound, "structure " + std::to_string(id) + " is not on the grid");
    }
    for (const GridKey& key : it->second) {
        m_cellOwner.erase(key);
    }
    m_cellsById.erase(it);
    return SimStatus::success();
}

std::optional<int> GridIndex::occupantAt(int x, int y, int z) const {
    const auto it = m_cellOwner.find(GridKey{x, y, z});
    if (it == m_cellOwner.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t GridIndex::cellsOwnedBy(int id) const {
    const auto it = m_cellsById.find(id);
    return (it == m_cellsById.end()) ? 0u : it->second.size();
}

void GridIndex::clear() {
    m_cellOwner.clear();
    m_cellsById.clear();
    m_nextId = 1;
}

std::string GridIndex::validateIntegrity() const {
    std::size_t attributed = 0;
    for (const auto& entry : m_cellsById) {
        for (const GridKey& key : entry.second) {
            const auto it = m_cellOwner.find(key);
            if (it == m_cellOwner.end() || it->second != entry.first) {
                std::ostringstream oss;
                oss << "cell " << cellLabel(key.x, key.y, key.z) << " not owned by structure " << entry.first;
                return oss.str();
            }
            if (!inBounds(key.x, key.y, key.z)) {
                return "cell " + cellLabel(key.x, key.y, key.z) + " outside world";
            }
        }
        attributed += entry.second.size();
    }
    if (attributed != m_cellOwner.size()) {
        std::ostringstream oss;
        oss << "grid has " << m_cellOwner.size() << " occupied cells but " << attributed << " attributed";
        return oss.str();
    }
    return std::string();
}
