#pragma once

#include <cstdint>
#include <random>
#include <string>

#include "resource.h"
#include "structure.h"

struct SimulationConfig {
    struct World {
        int gridSize = 100;   // x and z extent in cells
        int gridHeight = 50;  // y extent in cells
        int chunkSize = 10;
        int ticksPerMinute = 12;
        double tickSeconds = 5.0; // simulated seconds per tick, for reporting
    } world{};

    struct Storage {
        double baseCapacity = 1000.0;
        // Overflow dumps the lowest unit value first.
        ResourceAmounts unitValues{{20.0, 1.0, 2.0, 5.0, 8.0, 10.0}};
    } storage{};

    struct Consumption {
        double workingFoodPerMinute = 0.5;
        double idleFoodPerMinute = 0.1;
        double starvationHappinessPenalty = 10.0;
        double starvationHealthPenalty = 0.5;
        double initialHappiness = 50.0;
        double initialHealth = 100.0;
    } consumption{};

    struct Morale {
        double dailyFoodPerSettler = 0.5; // per minute, scaled by minutesPerDay
        int minutesPerDay = 1440;
        int historyLength = 100;
    } morale{};

    struct Production {
        double maxMultiplier = 2.0;
    } production{};

    struct Effects {
        enum class Composition {
            Max,
            Additive,
            Multiplicative
        };
        Composition composition = Composition::Max;
        double maxCombinedMultiplier = 2.0;
    } effects{};

    struct Tiers {
        Tier startTier = Tier::SURVIVAL;
    } tiers{};

    struct Buildings {
        std::string catalogPath; // empty = built-in table only
    } buildings{};

    double consumptionPerTick(bool working) const;
};

const char* effectCompositionName(SimulationConfig::Effects::Composition composition);

struct SimulationContext {
    std::uint64_t worldSeed = 0;
    std::mt19937_64 worldRng;
    SimulationConfig config;
    std::string configPath;
    std::string configHash;

    explicit SimulationContext(std::uint64_t seed, const std::string& runtimeConfigPath = "data/sim_config.toml");

    int randInt(int a, int b); // inclusive

    bool loadConfig(const std::string& path, std::string* errorMessage = nullptr);
    static std::string hashFileFNV1a(const std::string& path);
};
