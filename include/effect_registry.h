#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <variant>
#include <vector>

#include "building_catalog.h"
#include "sim_status.h"
#include "simulation_context.h"
#include "spatial_index.h"
#include "structure.h"

struct ProductionAura {
    double radius = 0.0;
    double multiplier = 1.0;
};

struct DefenseZone {
    double radius = 0.0;
    double multiplier = 1.0;
};

struct TradeZone {
    double radius = 0.0;
    double multiplier = 1.0;
};

using EffectPayload = std::variant<ProductionAura, DefenseZone, TradeZone>;

struct Effect {
    int id = 0;
    int originId = 0;
    EffectPayload payload;

    EffectKind kind() const;
    double radius() const;
    double multiplier() const;
};

struct EffectRegistration {
    SimStatus status;
    std::vector<int> effectIds; // empty when the type declares no bonus
};

// Locational multipliers derived from COMPLETE structures. Effect positions are
// never stored; they are read from the owning structure at query time.
class EffectRegistry {
public:
    EffectRegistry(const SpatialIndex& spatial,
                   const BuildingCatalog& catalog,
                   const SimulationConfig::Effects& config);

    EffectRegistration registerEffects(const Structure& structure);
    std::size_t unregisterEffects(int structureId);

    double getProductionBonusAt(double x, double y, double z, const StructureMap& structures) const;
    double getDefenseBonusAt(double x, double y, double z, const StructureMap& structures) const;
    double getTradeBonusAt(double x, double y, double z, const StructureMap& structures) const;

    // Effects of other structures whose radius reaches this structure's position.
    std::vector<Effect> affectingEffects(int structureId, const StructureMap& structures) const;
    // Structures inside the effect's radius, its origin excluded, nearest first.
    std::vector<int> structuresAffectedBy(int effectId, const StructureMap& structures) const;

    std::optional<Effect> findEffect(int effectId) const;
    std::vector<Effect> effectsOf(int structureId) const;
    std::vector<Effect> allEffects() const;
    std::size_t effectCount() const;
    bool hasEffects(int structureId) const { return m_byOrigin.count(structureId) != 0; }

    void clear();

private:
    double bonusAt(EffectKind kind, double x, double y, double z, const StructureMap& structures) const;
    double compose(const std::vector<double>& multipliers) const;
    double maxRadiusOf(EffectKind kind) const;
    double maxRadius() const;

    const SpatialIndex& m_spatial;
    const BuildingCatalog& m_catalog;
    SimulationConfig::Effects m_config;
    int m_nextEffectId = 1;
    std::map<int, std::vector<Effect>> m_byOrigin;
};
