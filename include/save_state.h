#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "consumption_engine.h"
#include "resource.h"
#include "sim_status.h"
#include "structure.h"

constexpr int kSnapshotSchemaVersion = 1;

// Plain data handed across the persistence boundary. Effects, grid cells and
// chunks are derived state and are rebuilt from the structures on restore.
struct SettlementSnapshot {
    int schemaVersion = kSnapshotSchemaVersion;
    std::uint64_t tick = 0;
    Tier tier = Tier::SURVIVAL;
    int expansionCount = 0;
    double morale = 0.0;

    double capacity = 0.0;
    ResourceAmounts resources{};

    std::vector<Structure> structures;
    std::vector<Settler> settlers;
    WorkerAssignments assignments;
};

std::string serializeSnapshot(const SettlementSnapshot& snapshot);

// Rejects text whose schemaVersion is missing or differs from kSnapshotSchemaVersion.
SimStatus parseSnapshot(std::string_view text, SettlementSnapshot& out);
