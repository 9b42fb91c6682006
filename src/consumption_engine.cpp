#include "consumption_engine.h"

#include <algorithm>
#include <cmath>

namespace {

constexpr double kBaseHappiness = 50.0;

double foodAdjustment(double foodPerSettler) {
    if (foodPerSettler > 50.0) return 5.0;
    if (foodPerSettler > 10.0) return 0.0;
    if (foodPerSettler > 1.0) return -3.0;
    return -10.0;
}

} // namespace

ConsumptionEngine::ConsumptionEngine(const SimulationConfig& config)
    : m_workingPerTick(config.consumptionPerTick(true)),
      m_idlePerTick(config.consumptionPerTick(false)),
      m_happinessPenalty(config.consumption.starvationHappinessPenalty),
      m_healthPenalty(config.consumption.starvationHealthPenalty),
      m_initialHappiness(config.consumption.initialHappiness),
      m_initialHealth(config.consumption.initialHealth) {}

int ConsumptionEngine::registerSettler(bool working) {
    Settler s;
    s.id = m_nextId++;
    s.working = working;
    s.happiness = m_initialHappiness;
    s.health = m_initialHealth;
    s.alive = true;
    m_settlers[s.id] = s;
    return s.id;
}

SimStatus ConsumptionEngine::restoreSettler(const Settler& settler) {
    if (settler.id <= 0) {
        return SimStatus::failure(SimErrorCode::InvalidState, "settler ids must be positive");
    }
    if (m_settlers.count(settler.id) != 0) {
        return SimStatus::failure(SimErrorCode::InvalidState,
                                  "settler " + std::to_string(settler.id) + " already registered");
    }
    if (!std::isfinite(settler.happiness) || !std::isfinite(settler.health)) {
        return SimStatus::failure(SimErrorCode::InvalidAmount,
                                  "settler " + std::to_string(settler.id) + " has non-finite welfare");
    }
    Settler s = settler;
    s.happiness = std::clamp(s.happiness, 0.0, 100.0);
    s.health = std::clamp(s.health, 0.0, 100.0);
    if (!s.alive) {
        s.working = false;
    }
    m_settlers[s.id] = s;
    m_nextId = std::max(m_nextId, s.id + 1);
    return SimStatus::success();
}

SimStatus ConsumptionEngine::removeSettler(int id) {
    if (m_settlers.erase(id) == 0) {
        return SimStatus::failure(SimErrorCode::NotFound, "settler " + std::to_string(id) + " not registered");
    }
    return SimStatus::success();
}

SimStatus ConsumptionEngine::setWorking(int id, bool working) {
    const auto it = m_settlers.find(id);
    if (it == m_settlers.end()) {
        return SimStatus::failure(SimErrorCode::NotFound, "settler " + std::to_string(id) + " not registered");
    }
    if (!it->second.alive && working) {
        return SimStatus::failure(SimErrorCode::InvalidState, "settler " + std::to_string(id) + " is dead");
    }
    it->second.working = working;
    return SimStatus::success();
}

std::optional<Settler> ConsumptionEngine::settler(int id) const {
    const auto it = m_settlers.find(id);
    if (it == m_settlers.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Settler> ConsumptionEngine::settlers() const {
    std::vector<Settler> out;
    out.reserve(m_settlers.size());
    for (const auto& entry : m_settlers) {
        out.push_back(entry.second);
    }
    return out;
}

std::vector<Settler> ConsumptionEngine::aliveSettlers() const {
    std::vector<Settler> out;
    for (const auto& entry : m_settlers) {
        if (entry.second.alive) {
            out.push_back(entry.second);
        }
    }
    return out;
}

int ConsumptionEngine::aliveCount() const {
    return static_cast<int>(std::count_if(m_settlers.begin(), m_settlers.end(),
                                          [](const auto& e) { return e.second.alive; }));
}

int ConsumptionEngine::workingCount() const {
    return static_cast<int>(std::count_if(m_settlers.begin(), m_settlers.end(),
                                          [](const auto& e) { return e.second.alive && e.second.working; }));
}

double ConsumptionEngine::foodDemandPerTick() const {
    double demand = 0.0;
    for (const auto& entry : m_settlers) {
        const Settler& s = entry.second;
        if (s.alive) {
            demand += s.working ? m_workingPerTick : m_idlePerTick;
        }
    }
    return demand;
}

ConsumptionResult ConsumptionEngine::runTick(double foodAvailable) {
    ConsumptionResult r;
    r.foodAvailable = (std::isfinite(foodAvailable) && foodAvailable > 0.0) ? foodAvailable : 0.0;
    r.foodDemand = foodDemandPerTick();
    r.aliveCount = aliveCount();
    r.workingCount = workingCount();
    r.idleCount = r.aliveCount - r.workingCount;

    r.foodConsumed = std::min(r.foodDemand, r.foodAvailable);
    r.foodRemaining = std::max(0.0, r.foodAvailable - r.foodDemand);
    r.starvation = r.foodDemand > r.foodAvailable;
    if (!r.starvation) {
        return r;
    }

    for (auto& entry : m_settlers) {
        Settler& s = entry.second;
        if (!s.alive) {
            continue;
        }
        s.happiness = std::clamp(s.happiness - m_happinessPenalty, 0.0, 100.0);
        s.health = std::clamp(s.health - m_healthPenalty, 0.0, 100.0);
        r.affectedSettlers.push_back(s.id);
        if (s.health <= 0.0) {
            s.alive = false;
            s.working = false;
            r.deaths.push_back(s.id);
        }
    }
    return r;
}

void ConsumptionEngine::updateHappiness(double foodPerSettler) {
    if (aliveCount() == 0) {
        return;
    }
    const double food = std::isnan(foodPerSettler) ? 0.0 : foodPerSettler;
    const double fed = foodAdjustment(food);
    for (auto& entry : m_settlers) {
        Settler& s = entry.second;
        if (!s.alive) {
            continue;
        }
        s.happiness = std::clamp(kBaseHappiness + fed + (s.working ? 2.0 : -1.0), 0.0, 100.0);
    }
}

void ConsumptionEngine::clear() {
    m_settlers.clear();
    m_nextId = 1;
}
