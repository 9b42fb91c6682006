#pragma once

#include <SFML/System/Vector3.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "building_catalog.h"
#include "consumption_engine.h"
#include "effect_registry.h"
#include "grid_index.h"
#include "morale_engine.h"
#include "production_engine.h"
#include "save_state.h"
#include "sim_status.h"
#include "simulation_context.h"
#include "spatial_index.h"
#include "storage_ledger.h"
#include "structure.h"
#include "tier_gate.h"

struct PlacementResult {
    SimStatus status;
    int structureId = 0;
    std::vector<int> effectIds;
};

struct TickResult {
    std::uint64_t tick = 0;
    ProductionTickResult production;
    ConsumptionResult consumption;
    MoraleBreakdown morale;
    double nextMoraleMultiplier = 1.0;
    ResourceAmounts ledgerAfter{};
};

// Owns the canonical structure records, the settler roster and every engine.
// One tick runs production, then consumption, then morale.
class Settlement {
public:
    Settlement(SimulationContext& ctx, const BuildingCatalog& catalog);
    Settlement(const Settlement&) = delete;
    Settlement& operator=(const Settlement&) = delete;

    PlacementResult placeStructure(BuildingType type,
                                   const sf::Vector3i& position,
                                   StructureStatus status = StructureStatus::BLUEPRINT,
                                   bool payCost = false);
    SimStatus demolishStructure(int id);
    SimStatus advanceConstruction(int id, int ticks);
    SimStatus damageStructure(int id, double amount);
    SimStatus repairStructure(int id, double amount);

    int registerSettler();
    SimStatus removeSettler(int id);
    SimStatus assignWorker(int settlerId, int structureId);
    SimStatus unassignWorker(int settlerId);
    void recordExpansion(int count = 1);

    DepositResult deposit(Resource::Type type, double amount);
    double withdraw(Resource::Type type, double amount);

    TickResult tick();

    TierCheck checkAdvancement(Tier target) const;
    TierCheck requestAdvancement(Tier target);

    SettlementSnapshot snapshot() const;
    SimStatus restore(const SettlementSnapshot& snapshot);

    std::optional<Structure> structure(int id) const;
    const StructureMap& structures() const { return m_structures; }
    const WorkerAssignments& assignments() const { return m_assignments; }
    const GridIndex& grid() const { return m_grid; }
    const SpatialIndex& spatial() const { return m_spatial; }
    const EffectRegistry& effects() const { return m_effects; }
    const StorageLedger& ledger() const { return m_ledger; }
    const ConsumptionEngine& population() const { return m_consumption; }
    const MoraleEngine& morale() const { return m_morale; }
    const BuildingCatalog& catalog() const { return m_catalog; }

    Tier tier() const { return m_tier; }
    int expansionCount() const { return m_expansionCount; }
    int housingCapacity() const;
    std::uint64_t nextTick() const { return m_production.nextTick(); }

    std::string validateInvariants() const;
    std::uint64_t getLastDeterminismHash() const { return m_lastDeterminismHash; }

    void setDebugEnabled(bool enabled) { m_debugEnabled = enabled; }
    bool debugEnabled() const { return m_debugEnabled; }
    void printSummary(std::ostream& out) const;

private:
    Structure* findStructure(int id);
    void enterComplete(Structure& s);
    void leaveComplete(const Structure& s);
    void dropAssignmentsFor(int structureId);
    void dropSettlerAssignment(int settlerId);
    void recomputeCapacity();
    void computeDeterminismHash();

    SimulationContext* m_ctx = nullptr;
    BuildingCatalog m_catalog;

    StructureMap m_structures;
    GridIndex m_grid;
    SpatialIndex m_spatial;
    EffectRegistry m_effects;
    StorageLedger m_ledger;
    ProductionEngine m_production;
    ConsumptionEngine m_consumption;
    MoraleEngine m_morale;
    TierGate m_tierGate;

    WorkerAssignments m_assignments;
    std::map<int, int> m_workplaceOf; // settler id -> structure id

    Tier m_tier = Tier::SURVIVAL;
    int m_expansionCount = 0;
    bool m_debugEnabled = false;
    std::uint64_t m_lastDeterminismHash = 0;
};
