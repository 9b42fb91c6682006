#pragma once

#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <vector>

#include "grid_key.h"
#include "structure.h"

struct SpatialHit {
    int id = 0;
    double distance = 0.0;
};

struct SpatialStats {
    std::size_t chunkCount = 0;
    std::size_t structureCount = 0;
    std::size_t largestChunk = 0;
    double averagePerChunk = 0.0;
};

// Chunked lookup of structure ids by footprint. Positions are always read from
// the caller's canonical StructureMap at query time.
class SpatialIndex {
public:
    explicit SpatialIndex(int chunkSize = 10);

    void insert(const Structure& structure);
    bool remove(int id);
    void update(const Structure& structure);

    // Sorted ascending by distance from each structure's position, ties by insertion order.
    std::vector<SpatialHit> queryRadius(double x, double y, double z, double radius,
                                        const StructureMap& structures) const;
    // Ids whose position lies inside the box (corner order irrelevant), in insertion order.
    std::vector<int> queryRegion(int x1, int y1, int z1, int x2, int y2, int z2,
                                 const StructureMap& structures) const;

    GridKey chunkOf(int x, int y, int z) const;
    std::vector<GridKey> chunksOf(int id) const;
    bool contains(int id) const { return m_chunksById.count(id) != 0; }
    int chunkSize() const { return m_chunkSize; }

    SpatialStats stats() const;
    void clear();

private:
    std::vector<int> collectCandidates(const GridKey& lo, const GridKey& hi) const;
    std::uint64_t sequenceOf(int id) const;

    int m_chunkSize = 10;
    std::uint64_t m_nextSeq = 0;
    std::unordered_map<GridKey, std::vector<int>, GridKeyHash> m_chunks;
    std::unordered_map<int, std::vector<GridKey>> m_chunksById;
    std::unordered_map<int, std::uint64_t> m_insertSeq;
};
