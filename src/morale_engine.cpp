#include "morale_engine.h"

#include <algorithm>
#include <cmath>

MoraleEngine::MoraleEngine(const SimulationConfig::Morale& config)
    : m_config(config) {}

double MoraleEngine::happinessFactor(double averageHappiness) {
    return std::clamp(averageHappiness, 0.0, 100.0) - 50.0;
}

double MoraleEngine::housingFactor(int settlerCount, int housingCapacity) {
    if (housingCapacity <= 0) {
        return -50.0;
    }
    const double occupancy = static_cast<double>(settlerCount) / static_cast<double>(housingCapacity) * 100.0;
    if (occupancy < 50.0) {
        return -50.0;
    }
    if (occupancy <= 85.0) {
        return (occupancy - 50.0) * (100.0 / 35.0) - 50.0;
    }
    // Overcrowding falls off linearly from the 85% peak.
    return std::max(-50.0, 50.0 - (occupancy - 85.0) * (75.0 / 15.0));
}

double MoraleEngine::foodFactor(int settlerCount, double foodAvailable) const {
    if (settlerCount <= 0) {
        return 50.0;
    }
    const double daily = static_cast<double>(settlerCount) * m_config.dailyFoodPerSettler *
                         static_cast<double>(m_config.minutesPerDay);
    if (daily <= 0.0) {
        return 50.0;
    }
    const double days = std::max(0.0, foodAvailable) / daily;
    if (days < 0.5) {
        return -50.0;
    }
    if (days <= 7.0) {
        return ((days - 0.5) / 6.5) * 100.0 - 50.0;
    }
    return 50.0;
}

double MoraleEngine::expansionFactor(int expansionCount) {
    return std::min(static_cast<double>(std::max(0, expansionCount)) * 10.0, 50.0);
}

MoraleBreakdown MoraleEngine::computeMorale(const std::vector<Settler>& settlers,
                                            double foodAvailable,
                                            int housingCapacity,
                                            int expansionCount) {
    MoraleBreakdown b;
    double happinessSum = 0.0;
    for (const Settler& s : settlers) {
        if (s.alive) {
            ++b.settlerCount;
            happinessSum += s.happiness;
        }
    }

    if (b.settlerCount == 0) {
        m_morale = 0.0;
    } else {
        const double food = std::isfinite(foodAvailable) ? foodAvailable : 0.0;
        b.averageHappiness = happinessSum / static_cast<double>(b.settlerCount);
        b.housingOccupancy = (housingCapacity > 0)
            ? static_cast<double>(b.settlerCount) / static_cast<double>(housingCapacity) * 100.0
            : 0.0;
        const double daily = static_cast<double>(b.settlerCount) * m_config.dailyFoodPerSettler *
                             static_cast<double>(m_config.minutesPerDay);
        b.foodDays = (daily > 0.0) ? std::max(0.0, food) / daily : 0.0;

        b.happinessFactor = happinessFactor(b.averageHappiness);
        b.housingFactor = housingFactor(b.settlerCount, housingCapacity);
        b.foodFactor = foodFactor(b.settlerCount, food);
        b.expansionFactor = expansionFactor(expansionCount);

        const double composite = kHappinessWeight * b.happinessFactor +
                                 kHousingWeight * b.housingFactor +
                                 kFoodWeight * b.foodFactor +
                                 kExpansionWeight * b.expansionFactor;
        m_morale = std::clamp(composite, -100.0, 100.0);
    }
    b.composite = m_morale;

    if (m_config.historyLength > 0) {
        m_history.push_back(b);
        while (m_history.size() > static_cast<size_t>(m_config.historyLength)) {
            m_history.pop_front();
        }
    }
    return b;
}

double MoraleEngine::getMoraleMultiplier() const {
    return 1.0 + m_morale / 1000.0;
}

const char* MoraleEngine::describe(double morale) {
    if (morale > 50.0) return "Excellent";
    if (morale > 25.0) return "Very Good";
    if (morale > 0.0) return "Good";
    if (morale > -25.0) return "Fair";
    if (morale > -50.0) return "Poor";
    return "Terrible";
}

void MoraleEngine::restore(double morale) {
    m_morale = std::isfinite(morale) ? std::clamp(morale, -100.0, 100.0) : 0.0;
}

void MoraleEngine::reset() {
    m_morale = 0.0;
    m_history.clear();
}
