#include "spatial_index.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <unordered_set>

namespace {

int floorChunk(double v, int chunkSize) {
    const double q = std::floor(v / static_cast<double>(chunkSize));
    const double lim = static_cast<double>(std::numeric_limits<int>::max() / 2);
    return static_cast<int>(std::clamp(q, -lim, lim));
}

} // namespace

SpatialIndex::SpatialIndex(int chunkSize)
    : m_chunkSize(std::max(1, chunkSize)) {}

GridKey SpatialIndex::chunkOf(int x, int y, int z) const {
    return GridKey{floorDiv(x, m_chunkSize), floorDiv(y, m_chunkSize), floorDiv(z, m_chunkSize)};
}

void SpatialIndex::insert(const Structure& structure) {
    if (contains(structure.id)) {
        update(structure);
        return;
    }
    const sf::Vector3i& p = structure.position;
    const Dimensions& d = structure.dimensions;
    const GridKey lo = chunkOf(p.x, p.y, p.z);
    const GridKey hi = chunkOf(p.x + std::max(1, d.width) - 1,
                               p.y + std::max(1, d.height) - 1,
                               p.z + std::max(1, d.depth) - 1);

    std::vector<GridKey>& keys = m_chunksById[structure.id];
    for (int cx = lo.x; cx <= hi.x; ++cx) {
        for (int cy = lo.y; cy <= hi.y; ++cy) {
            for (int cz = lo.z; cz <= hi.z; ++cz) {
                const GridKey key{cx, cy, cz};
                m_chunks[key].push_back(structure.id);
                keys.push_back(key);
            }
        }
    }
    if (m_insertSeq.count(structure.id) == 0) {
        m_insertSeq[structure.id] = m_nextSeq++;
    }
}

bool SpatialIndex::remove(int id) {
    const auto it = m_chunksById.find(id);
    if (it == m_chunksById.end()) {
        return false;
    }
    for (const GridKey& key : it->second) {
        const auto chunkIt = m_chunks.find(key);
        if (chunkIt == m_chunks.end()) {
            continue;
        }
        std::vector<int>& ids = chunkIt->second;
        ids.erase(std::remove(ids.begin(), ids.end(), id), ids.end());
        if (ids.empty()) {
            m_chunks.erase(chunkIt);
        }
    }
    m_chunksById.erase(it);
    m_insertSeq.erase(id);
    return true;
}

void SpatialIndex::update(const Structure& structure) {
    // Moving a structure keeps its place in the tie-break order.
    const auto seqIt = m_insertSeq.find(structure.id);
    const bool known = seqIt != m_insertSeq.end();
    const std::uint64_t seq = known ? seqIt->second : 0;
    remove(structure.id);
    if (known) {
        m_insertSeq[structure.id] = seq;
    }
    insert(structure);
}

std::uint64_t SpatialIndex::sequenceOf(int id) const {
    const auto it = m_insertSeq.find(id);
    return (it == m_insertSeq.end()) ? std::numeric_limits<std::uint64_t>::max() : it->second;
}

std::vector<int> SpatialIndex::collectCandidates(const GridKey& lo, const GridKey& hi) const {
    std::vector<int> out;
    std::unordered_set<int> seen;
    auto take = [&](const std::vector<int>& ids) {
        for (int id : ids) {
            if (seen.insert(id).second) {
                out.push_back(id);
            }
        }
    };

    const double span = static_cast<double>(hi.x - lo.x + 1) *
                        static_cast<double>(hi.y - lo.y + 1) *
                        static_cast<double>(hi.z - lo.z + 1);
    if (span > static_cast<double>(m_chunks.size())) {
        // Fewer occupied chunks than keys in range: walk the occupied set instead.
        for (const auto& entry : m_chunks) {
            const GridKey& k = entry.first;
            if (k.x >= lo.x && k.x <= hi.x && k.y >= lo.y && k.y <= hi.y && k.z >= lo.z && k.z <= hi.z) {
                take(entry.second);
            }
        }
        return out;
    }

    for (int cx = lo.x; cx <= hi.x; ++cx) {
        for (int cy = lo.y; cy <= hi.y; ++cy) {
            for (int cz = lo.z; cz <= hi.z; ++cz) {
                const auto it = m_chunks.find(GridKey{cx, cy, cz});
                if (it != m_chunks.end()) {
                    take(it->second);
                }
            }
        }
    }
    return out;
}

std::vector<SpatialHit> SpatialIndex::queryRadius(double x, double y, double z, double radius,
                                                  const StructureMap& structures) const {
    std::vector<SpatialHit> hits;
    if (!std::isfinite(x) || !std::isfinite(y) || !std::isfinite(z) || !std::isfinite(radius) || radius < 0.0) {
        return hits;
    }

    const int reach = std::max(1, static_cast<int>(std::ceil(radius / static_cast<double>(m_chunkSize))));
    const int cx = floorChunk(x, m_chunkSize);
    const int cy = floorChunk(y, m_chunkSize);
    const int cz = floorChunk(z, m_chunkSize);
    const std::vector<int> candidates = collectCandidates(GridKey{cx - reach, cy - reach, cz - reach},
                                                          GridKey{cx + reach, cy + reach, cz + reach});

    const double r2 = radius * radius;
    for (int id : candidates) {
        const auto it = structures.find(id);
        if (it == structures.end()) {
            continue;
        }
        const sf::Vector3i& p = it->second.position;
        const double dx = static_cast<double>(p.x) - x;
        const double dy = static_cast<double>(p.y) - y;
        const double dz = static_cast<double>(p.z) - z;
        const double d2 = dx * dx + dy * dy + dz * dz;
        if (d2 <= r2) {
            hits.push_back(SpatialHit{id, std::sqrt(d2)});
        }
    }

    std::sort(hits.begin(), hits.end(), [this](const SpatialHit& a, const SpatialHit& b) {
        if (a.distance != b.distance) {
            return a.distance < b.distance;
        }
        return sequenceOf(a.id) < sequenceOf(b.id);
    });
    return hits;
}

std::vector<int> SpatialIndex::queryRegion(int x1, int y1, int z1, int x2, int y2, int z2,
                                           const StructureMap& structures) const {
    const int minX = std::min(x1, x2), maxX = std::max(x1, x2);
    const int minY = std::min(y1, y2), maxY = std::max(y1, y2);
    const int minZ = std::min(z1, z2), maxZ = std::max(z1, z2);

    std::vector<int> ids;
    for (int id : collectCandidates(chunkOf(minX, minY, minZ), chunkOf(maxX, maxY, maxZ))) {
        const auto it = structures.find(id);
        if (it == structures.end()) {
            continue;
        }
        const sf::Vector3i& p = it->second.position;
        if (p.x >= minX && p.x <= maxX && p.y >= minY && p.y <= maxY && p.z >= minZ && p.z <= maxZ) {
            ids.push_back(id);
        }
    }
    std::sort(ids.begin(), ids.end(), [this](int a, int b) { return sequenceOf(a) < sequenceOf(b); });
    return ids;
}

std::vector<GridKey> SpatialIndex::chunksOf(int id) const {
    const auto it = m_chunksById.find(id);
    if (it == m_chunksById.end()) {
        return {};
    }
    return it->second;
}

SpatialStats SpatialIndex::stats() const {
    SpatialStats s;
    s.chunkCount = m_chunks.size();
    s.structureCount = m_chunksById.size();
    std::size_t totalEntries = 0;
    for (const auto& entry : m_chunks) {
        s.largestChunk = std::max(s.largestChunk, entry.second.size());
        totalEntries += entry.second.size();
    }
    s.averagePerChunk = s.chunkCount > 0
        ? static_cast<double>(totalEntries) / static_cast<double>(s.chunkCount)
        : 0.0;
    return s;
}

void SpatialIndex::clear() {
    m_chunks.clear();
    m_chunksById.clear();
    m_insertSeq.clear();
    m_nextSeq = 0;
}
