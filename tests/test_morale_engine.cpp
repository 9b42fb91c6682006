#include <catch2/catch.hpp>

#include <random>
#include <string>
#include <vector>

#include "morale_engine.h"
#include "simulation_context.h"

namespace {

std::vector<Settler> settlersWithHappiness(int count, double happiness) {
    std::vector<Settler> out;
    for (int i = 0; i < count; ++i) {
        Settler s;
        s.id = i + 1;
        s.happiness = happiness;
        out.push_back(s);
    }
    return out;
}

} // namespace

TEST_CASE("MoraleEngine: happiness factor is centred on 50")
{
    CHECK(MoraleEngine::happinessFactor(50.0) == 0.0);
    CHECK(MoraleEngine::happinessFactor(100.0) == 50.0);
    CHECK(MoraleEngine::happinessFactor(0.0) == -50.0);
}

TEST_CASE("MoraleEngine: housing factor peaks at 85 percent occupancy")
{
    CHECK(MoraleEngine::housingFactor(4, 0) == -50.0);
    CHECK(MoraleEngine::housingFactor(4, 10) == -50.0);           // 40%
    CHECK(MoraleEngine::housingFactor(5, 10) == Approx(-50.0));   // 50%
    CHECK(MoraleEngine::housingFactor(17, 20) == Approx(50.0));   // 85%
    CHECK(MoraleEngine::housingFactor(20, 20) == Approx(-25.0));  // 100%
    CHECK(MoraleEngine::housingFactor(40, 20) == -50.0);          // 200%
}

TEST_CASE("MoraleEngine: food factor from days of supply")
{
    SimulationConfig::Morale config;
    MoraleEngine engine(config);
    const double daily = 0.5 * 1440.0; // one settler

    CHECK(engine.foodFactor(0, 0.0) == 50.0);
    CHECK(engine.foodFactor(1, 0.0) == -50.0);
    CHECK(engine.foodFactor(1, daily * 0.5) == Approx(-50.0));
    CHECK(engine.foodFactor(1, daily * 3.75) == Approx(0.0));
    CHECK(engine.foodFactor(1, daily * 7.0) == Approx(50.0));
    CHECK(engine.foodFactor(1, daily * 30.0) == 50.0);
}

TEST_CASE("MoraleEngine: expansion factor saturates")
{
    CHECK(MoraleEngine::expansionFactor(0) == 0.0);
    CHECK(MoraleEngine::expansionFactor(2) == 20.0);
    CHECK(MoraleEngine::expansionFactor(9) == 50.0);
}

TEST_CASE("MoraleEngine: composite uses the fixed weights")
{
    SimulationConfig::Morale config;
    MoraleEngine engine(config);

    // happiness 75 -> 25; 17 of 20 housed -> 50; plenty of food -> 50; 1 expansion -> 10
    const std::vector<Settler> settlers = settlersWithHappiness(17, 75.0);
    const MoraleBreakdown b = engine.computeMorale(settlers, 1.0e9, 20, 1);
    CHECK(b.settlerCount == 17);
    CHECK(b.happinessFactor == Approx(25.0));
    CHECK(b.housingFactor == Approx(50.0));
    CHECK(b.foodFactor == 50.0);
    CHECK(b.expansionFactor == 10.0);
    CHECK(b.composite == Approx(0.4 * 25.0 + 0.3 * 50.0 + 0.2 * 50.0 + 0.1 * 10.0));
    CHECK(engine.getMorale() == Approx(36.0));
    CHECK(engine.getMoraleMultiplier() == Approx(1.036));
    CHECK(std::string(engine.describe()) == "Very Good");
}

TEST_CASE("MoraleEngine: dead settlers are ignored and an empty roster is neutral")
{
    SimulationConfig::Morale config;
    MoraleEngine engine(config);
    std::vector<Settler> settlers = settlersWithHappiness(2, 0.0);
    settlers[0].alive = false;
    settlers[1].alive = false;

    const MoraleBreakdown b = engine.computeMorale(settlers, 0.0, 0, 0);
    CHECK(b.settlerCount == 0);
    CHECK(b.composite == 0.0);
    CHECK(engine.getMoraleMultiplier() == 1.0);
}

TEST_CASE("MoraleEngine: composite and multiplier stay in range")
{
    SimulationConfig::Morale config;
    config.historyLength = 5;
    MoraleEngine engine(config);
    std::mt19937 rng(99);
    std::uniform_real_distribution<double> happiness(0.0, 100.0);
    std::uniform_int_distribution<int> count(1, 30);
    std::uniform_int_distribution<int> housing(0, 40);
    std::uniform_real_distribution<double> food(0.0, 50000.0);
    std::uniform_int_distribution<int> expansions(0, 20);

    for (int i = 0; i < 200; ++i) {
        const MoraleBreakdown b = engine.computeMorale(settlersWithHappiness(count(rng), happiness(rng)),
                                                       food(rng), housing(rng), expansions(rng));
        CHECK(b.composite >= -100.0);
        CHECK(b.composite <= 100.0);
        CHECK(engine.getMoraleMultiplier() >= 0.9);
        CHECK(engine.getMoraleMultiplier() <= 1.1);
    }
    CHECK(engine.history().size() == 5);

    engine.restore(500.0);
    CHECK(engine.getMorale() == 100.0);
    engine.reset();
    CHECK(engine.getMorale() == 0.0);
    CHECK(engine.history().empty());
}
