#include "settlement.h"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <set>
#include <sstream>

namespace {

constexpr double kEps = 1.0e-6;

std::uint64_t mixHash(std::uint64_t h, std::uint64_t v) {
    h ^= v + 0x9E3779B97F4A7C15ull + (h << 6) + (h >> 2);
    return h;
}

// Quantised to 1/scale; values past the int64 range hash by bit pattern.
std::uint64_t hashDouble(double v, double scale) {
    if (!std::isfinite(v)) {
        return 0xFFFFFFFFFFFFFFFFull;
    }
    const double q = std::round(v * scale);
    if (!std::isfinite(q) || std::abs(q) >= 9.0e18) {
        std::uint64_t bits = 0;
        std::memcpy(&bits, &v, sizeof(bits));
        return bits;
    }
    return static_cast<std::uint64_t>(static_cast<std::int64_t>(q));
}

std::uint64_t hashInt(int v) {
    return static_cast<std::uint64_t>(static_cast<std::int64_t>(v));
}

} // namespace

Settlement::Settlement(SimulationContext& ctx, const BuildingCatalog& catalog)
    : m_ctx(&ctx),
      m_catalog(catalog),
      m_grid(ctx.config.world.gridSize, ctx.config.world.gridHeight),
      m_spatial(ctx.config.world.chunkSize),
      m_effects(m_spatial, m_catalog, ctx.config.effects),
      m_ledger(ctx.config.storage.baseCapacity, ctx.config.storage.unitValues),
      m_production(m_catalog, m_effects, m_ledger, ctx.config.production),
      m_consumption(ctx.config),
      m_morale(ctx.config.morale),
      m_tier(ctx.config.tiers.startTier) {
    computeDeterminismHash();
}

Structure* Settlement::findStructure(int id) {
    const auto it = m_structures.find(id);
    return (it == m_structures.end()) ? nullptr : &it->second;
}

std::optional<Structure> Settlement::structure(int id) const {
    const auto it = m_structures.find(id);
    if (it == m_structures.end()) {
        return std::nullopt;
    }
    return it->second;
}

PlacementResult Settlement::placeStructure(BuildingType type,
                                           const sf::Vector3i& position,
                                           StructureStatus status,
                                           bool payCost) {
    PlacementResult out;
    const auto def = m_catalog.find(type);
    if (!def) {
        out.status = SimStatus::failure(SimErrorCode::UnknownType, "unknown building type");
        return out;
    }
    if (status == StructureStatus::DESTROYED || status == StructureStatus::DAMAGED) {
        out.status = SimStatus::failure(SimErrorCode::InvalidState,
                                        std::string("cannot place a structure as ") + structureStatusName(status));
        return out;
    }
    if (payCost && !m_ledger.canAfford(def->cost)) {
        std::ostringstream oss;
        oss << "cannot afford " << buildingTypeName(type) << ":";
        for (Resource::Type res : Resource::kAllTypes) {
            const size_t i = static_cast<size_t>(Resource::index(res));
            if (def->cost[i] > m_ledger.getAmount(res)) {
                oss << " " << Resource::name(res) << " " << m_ledger.getAmount(res) << "/" << def->cost[i];
            }
        }
        out.status = SimStatus::failure(SimErrorCode::InsufficientResources, oss.str());
        return out;
    }

    Structure s;
    s.type = type;
    s.position = position;
    s.dimensions = def->dimensions;
    s.status = status;
    s.maxHealth = def->maxHealth;
    s.health = def->maxHealth;
    s.constructionProgress = (status == StructureStatus::COMPLETE) ? def->constructionTime : 0;

    out.status = m_grid.place(s);
    if (!out.status.ok()) {
        return out;
    }
    if (payCost) {
        const SimStatus paid = m_ledger.withdrawAll(def->cost);
        if (!paid.ok()) {
            const SimStatus undo = m_grid.remove(s.id);
            if (!undo.ok()) {
                std::cerr << "[Settlement] " << undo.message << "\n";
            }
            out.status = paid;
            return out;
        }
    }

    out.structureId = s.id;
    Structure& stored = m_structures[s.id];
    stored = s;
    m_spatial.insert(stored);
    if (stored.isComplete()) {
        enterComplete(stored);
        for (const Effect& e : m_effects.effectsOf(stored.id)) {
            out.effectIds.push_back(e.id);
        }
    }
    if (m_debugEnabled) {
        std::cout << "[Settlement] placed " << buildingTypeName(type) << " #" << s.id << " at (" << position.x << ","
                  << position.y << "," << position.z << ") " << structureStatusName(status) << "\n";
    }
    return out;
}

void Settlement::enterComplete(Structure& s) {
    s.status = StructureStatus::COMPLETE;
    const EffectRegistration reg = m_effects.registerEffects(s);
    if (!reg.status.ok()) {
        std::cerr << "[Settlement] " << reg.status.message << "\n";
    }
    recomputeCapacity();
}

void Settlement::leaveComplete(const Structure& s) {
    m_effects.unregisterEffects(s.id);
    recomputeCapacity();
}

SimStatus Settlement::demolishStructure(int id) {
    Structure* s = findStructure(id);
    if (!s) {
        return SimStatus::failure(SimErrorCode::NotFound, "structure " + std::to_string(id) + " not found");
    }
    m_effects.unregisterEffects(id);
    dropAssignmentsFor(id);
    const SimStatus gridStatus = m_grid.remove(id);
    m_spatial.remove(id);
    m_structures.erase(id);
    recomputeCapacity();
    if (!gridStatus.ok()) {
        return gridStatus;
    }
    if (m_debugEnabled) {
        std::cout << "[Settlement] removed structure #" << id << "\n";
    }
    return SimStatus::success();
}

SimStatus Settlement::advanceConstruction(int id, int ticks) {
    Structure* s = findStructure(id);
    if (!s) {
        return SimStatus::failure(SimErrorCode::NotFound, "structure " + std::to_string(id) + " not found");
    }
    if (ticks <= 0) {
        return SimStatus::failure(SimErrorCode::InvalidAmount, "construction ticks must be positive");
    }
    if (s->status != StructureStatus::BLUEPRINT && s->status != StructureStatus::UNDER_CONSTRUCTION) {
        return SimStatus::failure(SimErrorCode::InvalidState,
                                  "structure " + std::to_string(id) + " is " + structureStatusName(s->status));
    }
    const auto def = m_catalog.find(s->type);
    if (!def) {
        return SimStatus::failure(SimErrorCode::UnknownType, "no definition for structure " + std::to_string(id));
    }
    s->constructionProgress += ticks;
    s->status = StructureStatus::UNDER_CONSTRUCTION;
    if (s->constructionProgress >= def->constructionTime) {
        s->constructionProgress = def->constructionTime;
        enterComplete(*s);
    }
    return SimStatus::success();
}

SimStatus Settlement::damageStructure(int id, double amount) {
    Structure* s = findStructure(id);
    if (!s) {
        return SimStatus::failure(SimErrorCode::NotFound, "structure " + std::to_string(id) + " not found");
    }
    if (!std::isfinite(amount) || amount < 0.0) {
        return SimStatus::failure(SimErrorCode::InvalidAmount, "damage must be a non-negative number");
    }
    s->health = std::max(0.0, s->health - amount);
    if (s->health <= 0.0) {
        s->status = StructureStatus::DESTROYED;
        if (m_debugEnabled) {
            std::cout << "[Settlement] structure #" << id << " destroyed\n";
        }
        return demolishStructure(id);
    }
    if (s->status == StructureStatus::COMPLETE && s->health < s->maxHealth) {
        s->status = StructureStatus::DAMAGED;
        leaveComplete(*s);
    }
    return SimStatus::success();
}

SimStatus Settlement::repairStructure(int id, double amount) {
    Structure* s = findStructure(id);
    if (!s) {
        return SimStatus::failure(SimErrorCode::NotFound, "structure " + std::to_string(id) + " not found");
    }
    if (!std::isfinite(amount) || amount < 0.0) {
        return SimStatus::failure(SimErrorCode::InvalidAmount, "repair must be a non-negative number");
    }
    if (s->status != StructureStatus::DAMAGED) {
        return SimStatus::failure(SimErrorCode::InvalidState,
                                  "structure " + std::to_string(id) + " is " + structureStatusName(s->status));
    }
    s->health = std::min(s->maxHealth, s->health + amount);
    if (s->health >= s->maxHealth) {
        enterComplete(*s);
    }
    return SimStatus::success();
}

int Settlement::registerSettler() {
    return m_consumption.registerSettler(false);
}

SimStatus Settlement::removeSettler(int id) {
    dropSettlerAssignment(id);
    return m_consumption.removeSettler(id);
}

SimStatus Settlement::assignWorker(int settlerId, int structureId) {
    const auto settler = m_consumption.settler(settlerId);
    if (!settler) {
        return SimStatus::failure(SimErrorCode::NotFound, "settler " + std::to_string(settlerId) + " not registered");
    }
    if (!settler->alive) {
        return SimStatus::failure(SimErrorCode::InvalidState, "settler " + std::to_string(settlerId) + " is dead");
    }
    const Structure* s = findStructure(structureId);
    if (!s) {
        return SimStatus::failure(SimErrorCode::NotFound, "structure " + std::to_string(structureId) + " not found");
    }
    const auto def = m_catalog.find(s->type);
    if (!def || def->workSlots <= 0) {
        return SimStatus::failure(SimErrorCode::InvalidState,
                                  std::string(buildingTypeName(s->type)) + " has no work slots");
    }
    const auto current = m_workplaceOf.find(settlerId);
    if (current != m_workplaceOf.end() && current->second == structureId) {
        return SimStatus::success();
    }
    const auto slots = m_assignments.find(structureId);
    if (slots != m_assignments.end() && static_cast<int>(slots->second.size()) >= def->workSlots) {
        return SimStatus::failure(SimErrorCode::InvalidState,
                                  "structure " + std::to_string(structureId) + " has no free work slot");
    }

    dropSettlerAssignment(settlerId);
    m_assignments[structureId].push_back(settlerId);
    m_workplaceOf[settlerId] = structureId;
    return m_consumption.setWorking(settlerId, true);
}

SimStatus Settlement::unassignWorker(int settlerId) {
    if (m_workplaceOf.count(settlerId) == 0) {
        return SimStatus::failure(SimErrorCode::NotFound, "settler " + std::to_string(settlerId) + " has no workplace");
    }
    dropSettlerAssignment(settlerId);
    return SimStatus::success();
}

void Settlement::dropSettlerAssignment(int settlerId) {
    const auto it = m_workplaceOf.find(settlerId);
    if (it == m_workplaceOf.end()) {
        return;
    }
    const auto slots = m_assignments.find(it->second);
    if (slots != m_assignments.end()) {
        std::vector<int>& ids = slots->second;
        ids.erase(std::remove(ids.begin(), ids.end(), settlerId), ids.end());
        if (ids.empty()) {
            m_assignments.erase(slots);
        }
    }
    m_workplaceOf.erase(it);
    if (m_consumption.settler(settlerId)) {
        const SimStatus st = m_consumption.setWorking(settlerId, false);
        if (!st.ok()) {
            std::cerr << "[Settlement] " << st.message << "\n";
        }
    }
}

void Settlement::dropAssignmentsFor(int structureId) {
    const auto it = m_assignments.find(structureId);
    if (it == m_assignments.end()) {
        return;
    }
    const std::vector<int> workers = it->second;
    for (int settlerId : workers) {
        dropSettlerAssignment(settlerId);
    }
}

void Settlement::recordExpansion(int count) {
    m_expansionCount = std::max(0, m_expansionCount + count);
}

DepositResult Settlement::deposit(Resource::Type type, double amount) {
    const DepositResult result = m_ledger.deposit(type, amount);
    if (result.status.ok() && result.overflow > 0.0) {
        m_ledger.resolveOverflow();
    }
    return result;
}

double Settlement::withdraw(Resource::Type type, double amount) {
    return m_ledger.withdraw(type, amount);
}

int Settlement::housingCapacity() const {
    int capacity = 0;
    for (const auto& entry : m_structures) {
        if (!entry.second.isComplete()) {
            continue;
        }
        if (const auto def = m_catalog.find(entry.second.type)) {
            capacity += def->housingCapacity;
        }
    }
    return capacity;
}

void Settlement::recomputeCapacity() {
    double capacity = m_ctx->config.storage.baseCapacity;
    for (const auto& entry : m_structures) {
        if (!entry.second.isComplete()) {
            continue;
        }
        if (const auto def = m_catalog.find(entry.second.type)) {
            capacity += def->storageTotal();
        }
    }
    m_ledger.setCapacity(capacity);
    m_ledger.resolveOverflow();
}

TickResult Settlement::tick() {
    TickResult result;

    result.production = m_production.runTick(m_structures, m_assignments, m_morale.getMoraleMultiplier());
    result.tick = result.production.tick;

    result.consumption = m_consumption.runTick(m_ledger.getAmount(Resource::Type::FOOD));
    const double eaten = m_ledger.withdraw(Resource::Type::FOOD, result.consumption.foodConsumed);
    if (std::abs(eaten - result.consumption.foodConsumed) > kEps) {
        std::cerr << "[Settlement] tick " << result.tick << ": withdrew " << eaten << " food, expected "
                  << result.consumption.foodConsumed << "\n";
    }
    for (int settlerId : result.consumption.deaths) {
        dropSettlerAssignment(settlerId);
    }

    const int alive = m_consumption.aliveCount();
    if (alive > 0) {
        m_consumption.updateHappiness(m_ledger.getAmount(Resource::Type::FOOD) / alive);
    }

    result.morale = m_morale.computeMorale(m_consumption.aliveSettlers(),
                                           m_ledger.getAmount(Resource::Type::FOOD),
                                           housingCapacity(),
                                           m_expansionCount);
    result.nextMoraleMultiplier = m_morale.getMoraleMultiplier();
    result.ledgerAfter = m_ledger.amounts();

    computeDeterminismHash();

    if (m_debugEnabled) {
        std::cout << std::fixed << std::setprecision(3)
                  << "[Settlement] tick " << result.tick
                  << " produced=" << totalOf(result.production.produced)
                  << " food=" << m_ledger.getAmount(Resource::Type::FOOD)
                  << " starving=" << (result.consumption.starvation ? 1 : 0)
                  << " morale=" << result.morale.composite
                  << " (" << MoraleEngine::describe(result.morale.composite) << ")\n";
        std::cout.unsetf(std::ios::floatfield);
    }
    return result;
}

TierCheck Settlement::checkAdvancement(Tier target) const {
    return m_tierGate.canAdvance(target, m_structures, toResourceMap(m_ledger.amounts()), m_tier);
}

TierCheck Settlement::requestAdvancement(Tier target) {
    TierCheck check = checkAdvancement(target);
    if (check.canAdvance) {
        ResourceAmounts cost = zeroAmounts();
        ResourceMap spent;
        if (const auto req = m_tierGate.requirementsFor(target)) {
            for (const auto& [key, amount] : req->resources) {
                if (const auto type = Resource::fromName(key)) {
                    cost[static_cast<size_t>(Resource::index(*type))] = amount;
                    spent[key] = amount;
                }
            }
        }
        const SimStatus paid = m_ledger.withdrawAll(cost);
        if (!paid.ok()) {
            check.canAdvance = false;
            check.reason = TierRejection::RequirementsUnmet;
            check.message = paid.message;
            std::cerr << "[Tier] " << tierName(target) << " not paid: " << paid.message << "\n";
            return check;
        }
        check.spent = spent;
        m_tier = target;
        std::cout << "[Tier] Advanced to " << tierName(target) << "\n";
        computeDeterminismHash();
    } else if (m_debugEnabled) {
        std::cout << "[Tier] " << tierRejectionName(check.reason) << ": " << check.message << "\n";
    }
    return check;
}

SettlementSnapshot Settlement::snapshot() const {
    SettlementSnapshot snap;
    snap.tick = m_production.nextTick();
    snap.tier = m_tier;
    snap.expansionCount = m_expansionCount;
    snap.morale = m_morale.getMorale();
    snap.capacity = m_ledger.getCapacity();
    snap.resources = m_ledger.amounts();
    for (const auto& entry : m_structures) {
        snap.structures.push_back(entry.second);
    }
    snap.settlers = m_consumption.settlers();
    snap.assignments = m_assignments;
    return snap;
}

SimStatus Settlement::restore(const SettlementSnapshot& snapshot) {
    if (snapshot.schemaVersion != kSnapshotSchemaVersion) {
        return SimStatus::failure(SimErrorCode::SchemaMismatch,
                                  "snapshot schemaVersion " + std::to_string(snapshot.schemaVersion) +
                                      " is not supported");
    }

    // Validate everything before touching live state.
    GridIndex staging(m_grid.gridSize(), m_grid.gridHeight());
    for (const Structure& s : snapshot.structures) {
        if (!m_catalog.find(s.type)) {
            return SimStatus::failure(SimErrorCode::UnknownType, "snapshot structure has unknown type");
        }
        if (s.id <= 0) {
            return SimStatus::failure(SimErrorCode::InvalidState, "snapshot structure ids must be positive");
        }
        if (s.status == StructureStatus::DESTROYED) {
            return SimStatus::failure(SimErrorCode::InvalidState,
                                      "snapshot holds destroyed structure " + std::to_string(s.id));
        }
        if (!std::isfinite(s.health) || !std::isfinite(s.maxHealth) || s.health <= 0.0 || s.health > s.maxHealth) {
            return SimStatus::failure(SimErrorCode::InvalidState,
                                      "snapshot structure " + std::to_string(s.id) + " has invalid health");
        }
        Structure copy = s;
        const SimStatus placed = staging.place(copy);
        if (!placed.ok()) {
            return placed;
        }
    }

    std::set<int> settlerIds;
    std::set<int> aliveIds;
    for (const Settler& s : snapshot.settlers) {
        if (s.id <= 0 || !settlerIds.insert(s.id).second) {
            return SimStatus::failure(SimErrorCode::InvalidState, "snapshot settler ids must be unique and positive");
        }
        if (!std::isfinite(s.happiness) || !std::isfinite(s.health)) {
            return SimStatus::failure(SimErrorCode::InvalidAmount,
                                      "snapshot settler " + std::to_string(s.id) + " has non-finite welfare");
        }
        if (s.alive) {
            aliveIds.insert(s.id);
        }
    }

    std::set<int> assigned;
    for (const auto& entry : snapshot.assignments) {
        if (!staging.contains(entry.first)) {
            return SimStatus::failure(SimErrorCode::NotFound,
                                      "assignment references missing structure " + std::to_string(entry.first));
        }
        for (int settlerId : entry.second) {
            if (aliveIds.count(settlerId) == 0 || !assigned.insert(settlerId).second) {
                return SimStatus::failure(SimErrorCode::InvalidState,
                                          "assignment for settler " + std::to_string(settlerId) + " is invalid");
            }
        }
    }

    for (Resource::Type type : Resource::kAllTypes) {
        const double v = snapshot.resources[static_cast<size_t>(Resource::index(type))];
        if (!std::isfinite(v) || v < 0.0) {
            return SimStatus::failure(SimErrorCode::InvalidAmount,
                                      std::string("snapshot amount invalid for ") + Resource::name(type));
        }
    }
    if (!std::isfinite(snapshot.capacity) || snapshot.capacity < 0.0) {
        return SimStatus::failure(SimErrorCode::InvalidAmount, "snapshot capacity invalid");
    }

    m_grid.clear();
    m_spatial.clear();
    m_effects.clear();
    m_structures.clear();
    m_consumption.clear();
    m_assignments.clear();
    m_workplaceOf.clear();
    m_morale.reset();

    for (const Structure& s : snapshot.structures) {
        Structure copy = s;
        const SimStatus placed = m_grid.place(copy);
        if (!placed.ok()) {
            return placed;
        }
        Structure& stored = m_structures[copy.id];
        stored = copy;
        m_spatial.insert(stored);
        if (stored.isComplete()) {
            const EffectRegistration reg = m_effects.registerEffects(stored);
            if (!reg.status.ok()) {
                return reg.status;
            }
        }
    }

    for (const Settler& s : snapshot.settlers) {
        Settler copy = s;
        copy.working = assigned.count(s.id) != 0;
        const SimStatus st = m_consumption.restoreSettler(copy);
        if (!st.ok()) {
            return st;
        }
    }
    m_assignments = snapshot.assignments;
    for (const auto& entry : m_assignments) {
        for (int settlerId : entry.second) {
            m_workplaceOf[settlerId] = entry.first;
        }
    }

    const SimStatus ledgerStatus = m_ledger.restore(snapshot.resources, snapshot.capacity);
    if (!ledgerStatus.ok()) {
        return ledgerStatus;
    }
    recomputeCapacity();
    if (std::abs(m_ledger.getCapacity() - snapshot.capacity) > kEps) {
        std::cerr << "[Settlement] snapshot capacity " << snapshot.capacity << " differs from structures' "
                  << m_ledger.getCapacity() << "; using the derived value\n";
    }

    m_production.setNextTick(snapshot.tick);
    m_tier = snapshot.tier;
    m_expansionCount = std::max(0, snapshot.expansionCount);
    m_morale.restore(snapshot.morale);
    computeDeterminismHash();
    return SimStatus::success();
}

void Settlement::computeDeterminismHash() {
    std::uint64_t h = 0xC0FFEE1234ABCDEFull;
    h = mixHash(h, m_production.nextTick());
    h = mixHash(h, static_cast<std::uint64_t>(m_tier));
    h = mixHash(h, hashInt(m_expansionCount));
    h = mixHash(h, static_cast<std::uint64_t>(m_structures.size()));
    for (const auto& entry : m_structures) {
        const Structure& s = entry.second;
        h = mixHash(h, hashInt(s.id));
        h = mixHash(h, static_cast<std::uint64_t>(s.type));
        h = mixHash(h, static_cast<std::uint64_t>(s.status));
        h = mixHash(h, hashInt(s.position.x));
        h = mixHash(h, hashInt(s.position.y));
        h = mixHash(h, hashInt(s.position.z));
        h = mixHash(h, hashDouble(s.health, 1.0e3));
    }
    for (Resource::Type type : Resource::kAllTypes) {
        h = mixHash(h, hashDouble(m_ledger.getAmount(type), 1.0e6));
    }
    h = mixHash(h, hashDouble(m_ledger.getCapacity(), 1.0e3));
    for (const Settler& s : m_consumption.settlers()) {
        h = mixHash(h, hashInt(s.id));
        h = mixHash(h, s.working ? 1u : 0u);
        h = mixHash(h, s.alive ? 1u : 0u);
        h = mixHash(h, hashDouble(s.happiness, 1.0e6));
        h = mixHash(h, hashDouble(s.health, 1.0e6));
    }
    h = mixHash(h, hashDouble(m_morale.getMorale(), 1.0e6));
    m_lastDeterminismHash = h;
}

std::string Settlement::validateInvariants() const {
    for (Resource::Type type : Resource::kAllTypes) {
        const double v = m_ledger.getAmount(type);
        if (!std::isfinite(v) || v < 0.0) {
            return std::string("ledger amount invalid for ") + Resource::name(type);
        }
    }
    if (m_ledger.getTotalStored() > m_ledger.getCapacity() + kEps) {
        std::ostringstream oss;
        oss << "ledger total " << m_ledger.getTotalStored() << " exceeds capacity " << m_ledger.getCapacity();
        return oss.str();
    }

    const std::string gridIssue = m_grid.validateIntegrity();
    if (!gridIssue.empty()) {
        return gridIssue;
    }
    std::size_t expectedCells = 0;
    for (const auto& entry : m_structures) {
        const Structure& s = entry.second;
        if (entry.first != s.id) {
            return "structure map key " + std::to_string(entry.first) + " holds id " + std::to_string(s.id);
        }
        if (!m_grid.contains(s.id) || !m_spatial.contains(s.id)) {
            return "structure " + std::to_string(s.id) + " missing from an index";
        }
        if (s.status == StructureStatus::DESTROYED) {
            return "destroyed structure " + std::to_string(s.id) + " still registered";
        }
        if (!(s.health > 0.0) || s.health > s.maxHealth + kEps) {
            return "structure " + std::to_string(s.id) + " health out of range";
        }
        if (!s.isComplete() && m_effects.hasEffects(s.id)) {
            return "structure " + std::to_string(s.id) + " has effects while not COMPLETE";
        }
        expectedCells += static_cast<std::size_t>(s.dimensions.cellCount());
    }
    if (expectedCells != m_grid.occupiedCellCount()) {
        std::ostringstream oss;
        oss << "grid occupies " << m_grid.occupiedCellCount() << " cells, structures cover " << expectedCells;
        return oss.str();
    }
    for (const Effect& e : m_effects.allEffects()) {
        const auto it = m_structures.find(e.originId);
        if (it == m_structures.end() || !it->second.isComplete()) {
            return "effect " + std::to_string(e.id) + " has no COMPLETE origin";
        }
    }

    const double morale = m_morale.getMorale();
    if (!std::isfinite(morale) || morale < -100.0 || morale > 100.0) {
        return "morale out of range";
    }
    const double multiplier = m_morale.getMoraleMultiplier();
    if (multiplier < 0.9 - kEps || multiplier > 1.1 + kEps) {
        return "morale multiplier out of range";
    }

    for (const Settler& s : m_consumption.settlers()) {
        if (s.happiness < 0.0 || s.happiness > 100.0 || s.health < 0.0 || s.health > 100.0) {
            return "settler " + std::to_string(s.id) + " welfare out of range";
        }
        if (!s.alive && s.working) {
            return "dead settler " + std::to_string(s.id) + " still working";
        }
    }
    for (const auto& entry : m_assignments) {
        if (m_structures.count(entry.first) == 0) {
            return "assignment to missing structure " + std::to_string(entry.first);
        }
        for (int settlerId : entry.second) {
            const auto settler = m_consumption.settler(settlerId);
            if (!settler || !settler->alive || !settler->working) {
                return "assignment of settler " + std::to_string(settlerId) + " is stale";
            }
        }
    }
    return std::string();
}

void Settlement::printSummary(std::ostream& out) const {
    std::map<StructureStatus, int> byStatus;
    for (const auto& entry : m_structures) {
        ++byStatus[entry.second.status];
    }
    const StorageStats stats = m_ledger.stats();

    out << "[Settlement] tier=" << tierName(m_tier)
        << " tick=" << m_production.nextTick()
        << " structures=" << m_structures.size();
    for (const auto& entry : byStatus) {
        out << " " << structureStatusName(entry.first) << "=" << entry.second;
    }
    out << "\n";
    out << "[Settlement] settlers alive=" << m_consumption.aliveCount()
        << " working=" << m_consumption.workingCount()
        << " housing=" << housingCapacity()
        << " expansions=" << m_expansionCount << "\n";
    out << std::fixed << std::setprecision(2);
    out << "[Settlement] storage " << stats.totalStored << "/" << stats.capacity << " :";
    for (Resource::Type type : Resource::kAllTypes) {
        out << " " << Resource::name(type) << "=" << m_ledger.getAmount(type);
    }
    out << "\n";
    out << "[Settlement] morale=" << m_morale.getMorale() << " (" << m_morale.describe() << ")"
        << " multiplier=" << m_morale.getMoraleMultiplier()
        << " effects=" << m_effects.effectCount() << "\n";
    out.unsetf(std::ios::floatfield);
}
