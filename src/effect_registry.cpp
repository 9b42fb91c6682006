#include "effect_registry.h"

#include <algorithm>

namespace {

EffectPayload payloadFor(const EffectSpec& spec) {
    switch (spec.kind) {
        case EffectKind::ProductionAura: return ProductionAura{spec.radius, spec.multiplier};
        case EffectKind::DefenseZone: return DefenseZone{spec.radius, spec.multiplier};
        case EffectKind::TradeZone: return TradeZone{spec.radius, spec.multiplier};
    }
    return ProductionAura{spec.radius, spec.multiplier};
}

} // namespace

EffectKind Effect::kind() const {
    if (std::holds_alternative<DefenseZone>(payload)) return EffectKind::DefenseZone;
    if (std::holds_alternative<TradeZone>(payload)) return EffectKind::TradeZone;
    return EffectKind::ProductionAura;
}

double Effect::radius() const {
    return std::visit([](const auto& e) { return e.radius; }, payload);
}

double Effect::multiplier() const {
    return std::visit([](const auto& e) { return e.multiplier; }, payload);
}

EffectRegistry::EffectRegistry(const SpatialIndex& spatial,
                               const BuildingCatalog& catalog,
                               const SimulationConfig::Effects& config)
    : m_spatial(spatial), m_catalog(catalog), m_config(config) {}

EffectRegistration EffectRegistry::registerEffects(const Structure& structure) {
    EffectRegistration out;
    if (!structure.isComplete()) {
        out.status = SimStatus::failure(SimErrorCode::InvalidState,
                                        "structure " + std::to_string(structure.id) + " is " +
                                            structureStatusName(structure.status) + ", effects need COMPLETE");
        return out;
    }
    const auto def = m_catalog.find(structure.type);
    if (!def) {
        out.status = SimStatus::failure(SimErrorCode::UnknownType,
                                        "no building definition for structure " + std::to_string(structure.id));
        return out;
    }

    unregisterEffects(structure.id);
    if (def->effects.empty()) {
        return out;
    }

    std::vector<Effect>& list = m_byOrigin[structure.id];
    for (const EffectSpec& spec : def->effects) {
        Effect e;
        e.id = m_nextEffectId++;
        e.originId = structure.id;
        e.payload = payloadFor(spec);
        list.push_back(e);
        out.effectIds.push_back(e.id);
    }
    return out;
}

std::size_t EffectRegistry::unregisterEffects(int structureId) {
    const auto it = m_byOrigin.find(structureId);
    if (it == m_byOrigin.end()) {
        return 0;
    }
    const std::size_t removed = it->second.size();
    m_byOrigin.erase(it);
    return removed;
}

double EffectRegistry::maxRadiusOf(EffectKind kind) const {
    double r = -1.0;
    for (const auto& entry : m_byOrigin) {
        for (const Effect& e : entry.second) {
            if (e.kind() == kind) {
                r = std::max(r, e.radius());
            }
        }
    }
    return r;
}

double EffectRegistry::maxRadius() const {
    double r = -1.0;
    for (const auto& entry : m_byOrigin) {
        for (const Effect& e : entry.second) {
            r = std::max(r, e.radius());
        }
    }
    return r;
}

double EffectRegistry::compose(const std::vector<double>& multipliers) const {
    if (multipliers.empty()) {
        return 1.0;
    }
    double result = 1.0;
    switch (m_config.composition) {
        case SimulationConfig::Effects::Composition::Max:
            result = *std::max_element(multipliers.begin(), multipliers.end());
            break;
        case SimulationConfig::Effects::Composition::Additive:
            for (double m : multipliers) {
                result += (m - 1.0);
            }
            break;
        case SimulationConfig::Effects::Composition::Multiplicative:
            for (double m : multipliers) {
                result *= m;
            }
            break;
    }
    return std::clamp(result, 0.0, m_config.maxCombinedMultiplier);
}

double EffectRegistry::bonusAt(EffectKind kind, double x, double y, double z,
                               const StructureMap& structures) const {
    const double reach = maxRadiusOf(kind);
    if (reach < 0.0) {
        return 1.0;
    }

    std::vector<double> applicable;
    for (const SpatialHit& hit : m_spatial.queryRadius(x, y, z, reach, structures)) {
        const auto it = m_byOrigin.find(hit.id);
        if (it == m_byOrigin.end()) {
            continue;
        }
        for (const Effect& e : it->second) {
            if (e.kind() == kind && hit.distance <= e.radius()) {
                applicable.push_back(e.multiplier());
            }
        }
    }
    return compose(applicable);
}

double EffectRegistry::getProductionBonusAt(double x, double y, double z, const StructureMap& structures) const {
    return bonusAt(EffectKind::ProductionAura, x, y, z, structures);
}

double EffectRegistry::getDefenseBonusAt(double x, double y, double z, const StructureMap& structures) const {
    return bonusAt(EffectKind::DefenseZone, x, y, z, structures);
}

double EffectRegistry::getTradeBonusAt(double x, double y, double z, const StructureMap& structures) const {
    return bonusAt(EffectKind::TradeZone, x, y, z, structures);
}

std::vector<Effect> EffectRegistry::affectingEffects(int structureId, const StructureMap& structures) const {
    std::vector<Effect> out;
    const auto target = structures.find(structureId);
    const double reach = maxRadius();
    if (target == structures.end() || reach < 0.0) {
        return out;
    }
    const sf::Vector3i& p = target->second.position;
    for (const SpatialHit& hit : m_spatial.queryRadius(p.x, p.y, p.z, reach, structures)) {
        if (hit.id == structureId) {
            continue;
        }
        const auto it = m_byOrigin.find(hit.id);
        if (it == m_byOrigin.end()) {
            continue;
        }
        for (const Effect& e : it->second) {
            if (hit.distance <= e.radius()) {
                out.push_back(e);
            }
        }
    }
    return out;
}

std::vector<int> EffectRegistry::structuresAffectedBy(int effectId, const StructureMap& structures) const {
    std::vector<int> out;
    const auto effect = findEffect(effectId);
    if (!effect) {
        return out;
    }
    const auto origin = structures.find(effect->originId);
    if (origin == structures.end()) {
        return out;
    }
    const sf::Vector3i& p = origin->second.position;
    for (const SpatialHit& hit : m_spatial.queryRadius(p.x, p.y, p.z, effect->radius(), structures)) {
        if (hit.id != effect->originId) {
            out.push_back(hit.id);
        }
    }
    return out;
}

std::optional<Effect> EffectRegistry::findEffect(int effectId) const {
    for (const auto& entry : m_byOrigin) {
        for (const Effect& e : entry.second) {
            if (e.id == effectId) {
                return e;
            }
        }
    }
    return std::nullopt;
}

std::vector<Effect> EffectRegistry::effectsOf(int structureId) const {
    const auto it = m_byOrigin.find(structureId);
    if (it == m_byOrigin.end()) {
        return {};
    }
    return it->second;
}

std::vector<Effect> EffectRegistry::allEffects() const {
    std::vector<Effect> out;
    for (const auto& entry : m_byOrigin) {
        out.insert(out.end(), entry.second.begin(), entry.second.end());
    }
    return out;
}

std::size_t EffectRegistry::effectCount() const {
    std::size_t n = 0;
    for (const auto& entry : m_byOrigin) {
        n += entry.second.size();
    }
    return n;
}

void EffectRegistry::clear() {
    m_byOrigin.clear();
    m_nextEffectId = 1;
}
