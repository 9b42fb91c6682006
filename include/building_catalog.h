#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "resource.h"
#include "structure.h"

enum class EffectKind {
    ProductionAura = 0,
    DefenseZone,
    TradeZone
};

const char* effectKindName(EffectKind kind);
std::optional<EffectKind> parseEffectKind(const std::string& name);

struct EffectSpec {
    EffectKind kind = EffectKind::ProductionAura;
    double radius = 0.0;
    double multiplier = 1.0;
};

struct BuildingDefinition {
    BuildingType type = BuildingType::CAMPFIRE;
    std::string displayName;
    Tier tier = Tier::SURVIVAL;
    Dimensions dimensions{};

    ResourceAmounts cost{};
    ResourceAmounts production{}; // per tick, fully staffed
    ResourceAmounts storage{};    // capacity contributed while COMPLETE

    int workSlots = 0;
    int housingCapacity = 0;
    double maxHealth = 100.0;
    int constructionTime = 0; // ticks

    std::vector<EffectSpec> effects;

    bool producesAnything() const;
    double storageTotal() const;
};

// Static per-type configuration. Every accessor hands out an owned copy so a
// caller can never mutate the shared table.
class BuildingCatalog {
public:
    BuildingCatalog();

    bool loadFromFile(const std::string& path, std::string* errorMessage = nullptr);
    bool loadFromString(std::string_view text, std::string* errorMessage = nullptr);

    std::optional<BuildingDefinition> find(BuildingType type) const;
    std::vector<BuildingDefinition> all() const;
    const std::string& sourceLabel() const { return m_source; }

private:
    std::array<BuildingDefinition, kBuildingTypeCount> m_defs;
    std::string m_source = "built-in";
};

const std::vector<BuildingDefinition>& getDefaultBuildingDefinitions();
