#pragma once

#include <deque>
#include <vector>

#include "consumption_engine.h"
#include "simulation_context.h"

struct MoraleBreakdown {
    int settlerCount = 0;
    double averageHappiness = 0.0;
    double housingOccupancy = 0.0; // percent
    double foodDays = 0.0;

    double happinessFactor = 0.0; // -50..50 each
    double housingFactor = 0.0;
    double foodFactor = 0.0;
    double expansionFactor = 0.0; // 0..50
    double composite = 0.0;       // -100..100
};

class MoraleEngine {
public:
    static constexpr double kHappinessWeight = 0.40;
    static constexpr double kHousingWeight = 0.30;
    static constexpr double kFoodWeight = 0.20;
    static constexpr double kExpansionWeight = 0.10;

    explicit MoraleEngine(const SimulationConfig::Morale& config);

    // Only living settlers count; with none, morale is 0.
    MoraleBreakdown computeMorale(const std::vector<Settler>& settlers,
                                  double foodAvailable,
                                  int housingCapacity,
                                  int expansionCount);

    static double happinessFactor(double averageHappiness);
    static double housingFactor(int settlerCount, int housingCapacity);
    double foodFactor(int settlerCount, double foodAvailable) const;
    static double expansionFactor(int expansionCount);

    double getMorale() const { return m_morale; }
    // 1 + morale/1000, so always within [0.9, 1.1].
    double getMoraleMultiplier() const;
    const char* describe() const { return describe(m_morale); }
    static const char* describe(double morale);

    const std::deque<MoraleBreakdown>& history() const { return m_history; }
    void restore(double morale);
    void reset();

private:
    SimulationConfig::Morale m_config;
    double m_morale = 0.0;
    std::deque<MoraleBreakdown> m_history;
};
