#pragma once

#include <SFML/System/Vector3.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

enum class BuildingType {
    CAMPFIRE = 0,
    FARM,
    HOUSE,
    WAREHOUSE,
    LUMBER_MILL,
    MINE,
    TOWN_CENTER,
    MARKET,
    WATCHTOWER,
    CASTLE,
    Count
};

enum class StructureStatus {
    BLUEPRINT = 0,
    UNDER_CONSTRUCTION,
    COMPLETE,
    DAMAGED,
    DESTROYED
};

// Ordered; advancement moves exactly one step forward.
enum class Tier {
    SURVIVAL = 0,
    PERMANENT = 1,
    TOWN = 2,
    CASTLE = 3
};

constexpr int kBuildingTypeCount = static_cast<int>(BuildingType::Count);
constexpr int kTierCount = 4;

const char* buildingTypeName(BuildingType type);
std::optional<BuildingType> parseBuildingType(const std::string& name);
const char* structureStatusName(StructureStatus status);
std::optional<StructureStatus> parseStructureStatus(const std::string& name);
const char* tierName(Tier tier);
std::optional<Tier> parseTier(const std::string& name);

struct Dimensions {
    int width = 1;
    int height = 1;
    int depth = 1;

    int cellCount() const { return width * height * depth; }
};

struct Structure {
    int id = 0; // 0 = not yet assigned
    BuildingType type = BuildingType::CAMPFIRE;
    sf::Vector3i position{0, 0, 0};
    Dimensions dimensions{};
    StructureStatus status = StructureStatus::BLUEPRINT;
    double health = 1.0;
    double maxHealth = 1.0;
    int constructionProgress = 0; // ticks of work received

    bool isComplete() const { return status == StructureStatus::COMPLETE; }
};

// Canonical structure records, ordered by id so every iteration is deterministic.
using StructureMap = std::map<int, Structure>;

// structure id -> ids of the settlers working there
using WorkerAssignments = std::map<int, std::vector<int>>;
