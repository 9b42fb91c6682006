#pragma once

#include <cstdint>
#include <map>
#include <vector>

#include "building_catalog.h"
#include "effect_registry.h"
#include "resource.h"
#include "simulation_context.h"
#include "storage_ledger.h"
#include "structure.h"

struct StructureYield {
    int structureId = 0;
    double staffing = 0.0;   // 0..1
    double auraBonus = 1.0;
    double multiplier = 0.0; // after the hard cap
    ResourceAmounts yield{};
};

struct ProductionTickResult {
    std::uint64_t tick = 0;
    ResourceAmounts produced{};
    std::vector<StructureYield> perStructure;
    OverflowReport overflow;
};

class ProductionEngine {
public:
    ProductionEngine(const BuildingCatalog& catalog,
                     const EffectRegistry& effects,
                     StorageLedger& ledger,
                     const SimulationConfig::Production& config);

    ProductionTickResult runTick(const StructureMap& structures,
                                 const WorkerAssignments& assignments,
                                 double moraleMultiplier);

    // Ordinal the next runTick() will report.
    std::uint64_t nextTick() const { return m_tick; }
    void setNextTick(std::uint64_t tick) { m_tick = tick; }

private:
    const BuildingCatalog& m_catalog;
    const EffectRegistry& m_effects;
    StorageLedger& m_ledger;
    SimulationConfig::Production m_config;
    std::uint64_t m_tick = 0;
};
