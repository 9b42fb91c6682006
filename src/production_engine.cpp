#include "production_engine.h"

#include <algorithm>
#include <cmath>
#include <iostream>

ProductionEngine::ProductionEngine(const BuildingCatalog& catalog,
                                   const EffectRegistry& effects,
                                   StorageLedger& ledger,
                                   const SimulationConfig::Production& config)
    : m_catalog(catalog), m_effects(effects), m_ledger(ledger), m_config(config) {}

ProductionTickResult ProductionEngine::runTick(const StructureMap& structures,
                                               const WorkerAssignments& assignments,
                                               double moraleMultiplier) {
    ProductionTickResult result;
    result.tick = m_tick++;
    result.produced = zeroAmounts();

    const double morale = std::isfinite(moraleMultiplier) ? std::max(0.0, moraleMultiplier) : 1.0;

    for (const auto& entry : structures) {
        const Structure& s = entry.second;
        if (!s.isComplete()) {
            continue;
        }
        const auto def = m_catalog.find(s.type);
        if (!def || !def->producesAnything()) {
            continue;
        }
        const auto workersIt = assignments.find(s.id);
        const int workers = (workersIt == assignments.end()) ? 0 : static_cast<int>(workersIt->second.size());
        if (workers <= 0) {
            continue;
        }

        StructureYield y;
        y.structureId = s.id;
        y.staffing = std::min(1.0, static_cast<double>(workers) / static_cast<double>(std::max(1, def->workSlots)));
        y.auraBonus = m_effects.getProductionBonusAt(s.position.x, s.position.y, s.position.z, structures);
        y.multiplier = std::min(y.staffing * morale * y.auraBonus, m_config.maxMultiplier);
        y.yield = zeroAmounts();
        for (Resource::Type type : Resource::kAllTypes) {
            const size_t i = static_cast<size_t>(Resource::index(type));
            y.yield[i] = def->production[i] * y.multiplier;
            result.produced[i] += y.yield[i];
        }
        result.perStructure.push_back(y);
    }

    for (Resource::Type type : Resource::kAllTypes) {
        const double amount = result.produced[static_cast<size_t>(Resource::index(type))];
        if (amount > 0.0) {
            const DepositResult deposit = m_ledger.deposit(type, amount);
            if (!deposit.status.ok()) {
                std::cerr << "[Production] tick " << result.tick << ": " << deposit.status.message << "\n";
            }
        }
    }
    result.overflow = m_ledger.resolveOverflow();
    return result;
}
