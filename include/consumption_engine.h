#pragma once

#include <map>
#include <optional>
#include <vector>

#include "sim_status.h"
#include "simulation_context.h"

struct Settler {
    int id = 0;
    bool working = false;
    double happiness = 50.0; // 0..100
    double health = 100.0;   // 0..100
    bool alive = true;

    // -100..100
    double morale() const { return (happiness - 50.0) * 2.0; }
};

struct ConsumptionResult {
    double foodAvailable = 0.0;
    double foodDemand = 0.0;
    double foodConsumed = 0.0;  // min(demand, available); the caller withdraws it
    double foodRemaining = 0.0; // never negative
    bool starvation = false;
    std::vector<int> affectedSettlers;
    std::vector<int> deaths;
    int aliveCount = 0;
    int workingCount = 0;
    int idleCount = 0;
};

// Settler roster plus per-tick upkeep. Starvation hits every living settler
// by the same fixed penalty; there is no random victim selection.
class ConsumptionEngine {
public:
    explicit ConsumptionEngine(const SimulationConfig& config);

    int registerSettler(bool working = false);
    SimStatus restoreSettler(const Settler& settler);
    SimStatus removeSettler(int id);
    SimStatus setWorking(int id, bool working);

    std::optional<Settler> settler(int id) const;
    std::vector<Settler> settlers() const;
    std::vector<Settler> aliveSettlers() const;
    int aliveCount() const;
    int workingCount() const;
    double foodDemandPerTick() const;

    ConsumptionResult runTick(double foodAvailable);

    // Recomputes every living settler's happiness from a 50 baseline using the
    // food stock per living settler and whether the settler is working.
    void updateHappiness(double foodPerSettler);

    void clear();

private:
    double m_workingPerTick = 0.0;
    double m_idlePerTick = 0.0;
    double m_happinessPenalty = 10.0;
    double m_healthPenalty = 0.5;
    double m_initialHappiness = 50.0;
    double m_initialHealth = 100.0;

    int m_nextId = 1;
    std::map<int, Settler> m_settlers;
};
