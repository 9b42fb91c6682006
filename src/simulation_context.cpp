#include "simulation_context.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string_view>
#include <type_traits>

#include <toml++/toml.hpp>

namespace {

template <typename T>
void readTomlValue(const toml::table& root,
                   std::string_view section,
                   std::string_view key,
                   T& target) {
    const toml::node_view<const toml::node> view = root[section][key];
    if constexpr (std::is_same_v<T, int>) {
        if (const auto v = view.value<std::int64_t>()) {
            target = static_cast<int>(*v);
        }
    } else if constexpr (std::is_same_v<T, double>) {
        if (const auto v = view.value<double>()) {
            target = *v;
        } else if (const auto vi = view.value<std::int64_t>()) {
            target = static_cast<double>(*vi);
        }
    } else if constexpr (std::is_same_v<T, bool>) {
        if (const auto v = view.value<bool>()) {
            target = *v;
        }
    } else if constexpr (std::is_same_v<T, std::string>) {
        if (const auto v = view.value<std::string>()) {
            target = *v;
        }
    }
}

std::string toLowerAscii(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

SimulationConfig::Effects::Composition parseComposition(std::string value) {
    value = toLowerAscii(std::move(value));
    if (value == "additive" || value == "sum") {
        return SimulationConfig::Effects::Composition::Additive;
    }
    if (value == "multiplicative" || value == "product") {
        return SimulationConfig::Effects::Composition::Multiplicative;
    }
    return SimulationConfig::Effects::Composition::Max;
}

double nonNegative(double v, double fallback) {
    if (!std::isfinite(v) || v < 0.0) {
        return fallback;
    }
    return v;
}

} // namespace

double SimulationConfig::consumptionPerTick(bool working) const {
    const double perMinute = working ? consumption.workingFoodPerMinute : consumption.idleFoodPerMinute;
    return perMinute / static_cast<double>(std::max(1, world.ticksPerMinute));
}

const char* effectCompositionName(SimulationConfig::Effects::Composition composition) {
    switch (composition) {
        case SimulationConfig::Effects::Composition::Max: return "max";
        case SimulationConfig::Effects::Composition::Additive: return "additive";
        case SimulationConfig::Effects::Composition::Multiplicative: return "multiplicative";
    }
    return "max";
}

SimulationContext::SimulationContext(std::uint64_t seed, const std::string& runtimeConfigPath)
    : worldSeed(seed), worldRng(seed), config(), configPath(runtimeConfigPath), configHash("defaults") {
    if (!runtimeConfigPath.empty()) {
        std::string err;
        if (!loadConfig(runtimeConfigPath, &err)) {
            std::cerr << "[Config] " << err << " Using built-in defaults.\n";
        }
    }
}

int SimulationContext::randInt(int a, int b) {
    if (a > b) {
        std::swap(a, b);
    }
    std::uniform_int_distribution<int> dist(a, b);
    return dist(worldRng);
}

bool SimulationContext::loadConfig(const std::string& path, std::string* errorMessage) {
    config = SimulationConfig{};
    configPath = path;
    configHash = "defaults";

    if (path.empty()) {
        return true;
    }

    try {
        toml::table root = toml::parse_file(path);

        readTomlValue(root, "world", "gridSize", config.world.gridSize);
        readTomlValue(root, "world", "gridHeight", config.world.gridHeight);
        readTomlValue(root, "world", "chunkSize", config.world.chunkSize);
        readTomlValue(root, "world", "ticksPerMinute", config.world.ticksPerMinute);
        readTomlValue(root, "world", "tickSeconds", config.world.tickSeconds);

        readTomlValue(root, "storage", "baseCapacity", config.storage.baseCapacity);
        if (const toml::table* values = root["storage"]["unitValues"].as_table()) {
            for (Resource::Type type : Resource::kAllTypes) {
                double& slot = config.storage.unitValues[static_cast<size_t>(Resource::index(type))];
                if (const auto v = (*values)[Resource::name(type)].value<double>()) {
                    slot = *v;
                } else if (const auto vi = (*values)[Resource::name(type)].value<std::int64_t>()) {
                    slot = static_cast<double>(*vi);
                }
            }
        }

        readTomlValue(root, "consumption", "workingFoodPerMinute", config.consumption.workingFoodPerMinute);
        readTomlValue(root, "consumption", "idleFoodPerMinute", config.consumption.idleFoodPerMinute);
        readTomlValue(root, "consumption", "starvationHappinessPenalty", config.consumption.starvationHappinessPenalty);
        readTomlValue(root, "consumption", "starvationHealthPenalty", config.consumption.starvationHealthPenalty);
        readTomlValue(root, "consumption", "initialHappiness", config.consumption.initialHappiness);
        readTomlValue(root, "consumption", "initialHealth", config.consumption.initialHealth);

        readTomlValue(root, "morale", "dailyFoodPerSettler", config.morale.dailyFoodPerSettler);
        readTomlValue(root, "morale", "minutesPerDay", config.morale.minutesPerDay);
        readTomlValue(root, "morale", "historyLength", config.morale.historyLength);

        readTomlValue(root, "production", "maxMultiplier", config.production.maxMultiplier);

        if (const auto mode = root["effects"]["composition"].value<std::string>()) {
            config.effects.composition = parseComposition(*mode);
        }
        readTomlValue(root, "effects", "maxCombinedMultiplier", config.effects.maxCombinedMultiplier);

        if (const auto startTier = root["tiers"]["startTier"].value<std::string>()) {
            if (const auto tier = parseTier(*startTier)) {
                config.tiers.startTier = *tier;
            } else {
                std::cerr << "[Config] Unknown tiers.startTier '" << *startTier << "', keeping SURVIVAL.\n";
            }
        }

        readTomlValue(root, "buildings", "catalogPath", config.buildings.catalogPath);

        config.world.gridSize = std::max(1, config.world.gridSize);
        config.world.gridHeight = std::max(1, config.world.gridHeight);
        config.world.chunkSize = std::max(1, config.world.chunkSize);
        config.world.ticksPerMinute = std::max(1, config.world.ticksPerMinute);
        config.world.tickSeconds = nonNegative(config.world.tickSeconds, 5.0);
        config.storage.baseCapacity = nonNegative(config.storage.baseCapacity, 1000.0);
        config.consumption.workingFoodPerMinute = nonNegative(config.consumption.workingFoodPerMinute, 0.5);
        config.consumption.idleFoodPerMinute = nonNegative(config.consumption.idleFoodPerMinute, 0.1);
        config.consumption.starvationHappinessPenalty = nonNegative(config.consumption.starvationHappinessPenalty, 10.0);
        config.consumption.starvationHealthPenalty = nonNegative(config.consumption.starvationHealthPenalty, 0.5);
        config.consumption.initialHappiness = std::clamp(config.consumption.initialHappiness, 0.0, 100.0);
        config.consumption.initialHealth = std::clamp(config.consumption.initialHealth, 0.0, 100.0);
        config.morale.minutesPerDay = std::max(1, config.morale.minutesPerDay);
        config.morale.historyLength = std::max(0, config.morale.historyLength);
        config.production.maxMultiplier = nonNegative(config.production.maxMultiplier, 2.0);
        config.effects.maxCombinedMultiplier = std::max(1.0, nonNegative(config.effects.maxCombinedMultiplier, 2.0));

        configHash = hashFileFNV1a(path);
        return true;
    } catch (const toml::parse_error& err) {
        if (errorMessage) {
            std::ostringstream oss;
            oss << "Failed to parse config '" << path << "': " << err.description();
            *errorMessage = oss.str();
        }
    } catch (const std::exception& err) {
        if (errorMessage) {
            std::ostringstream oss;
            oss << "Failed to load config '" << path << "': " << err.what();
            *errorMessage = oss.str();
        }
    }

    config = SimulationConfig{};
    return false;
}

std::string SimulationContext::hashFileFNV1a(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return "missing";
    }
    std::uint64_t h = 1469598103934665603ull;
    constexpr std::uint64_t prime = 1099511628211ull;
    char buffer[4096];
    while (in.good()) {
        in.read(buffer, static_cast<std::streamsize>(sizeof(buffer)));
        const std::streamsize n = in.gcount();
        for (std::streamsize i = 0; i < n; ++i) {
            h ^= static_cast<std::uint8_t>(buffer[i]);
            h *= prime;
        }
    }
    std::ostringstream oss;
    oss << std::hex << h;
    return oss.str();
}
