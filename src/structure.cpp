#include "structure.h"

#include <algorithm>
#include <cctype>

namespace {

std::string toUpperAscii(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::toupper(ch));
    });
    return value;
}

} // namespace

const char* buildingTypeName(BuildingType type) {
    switch (type) {
        case BuildingType::CAMPFIRE: return "CAMPFIRE";
        case BuildingType::FARM: return "FARM";
        case BuildingType::HOUSE: return "HOUSE";
        case BuildingType::WAREHOUSE: return "WAREHOUSE";
        case BuildingType::LUMBER_MILL: return "LUMBER_MILL";
        case BuildingType::MINE: return "MINE";
        case BuildingType::TOWN_CENTER: return "TOWN_CENTER";
        case BuildingType::MARKET: return "MARKET";
        case BuildingType::WATCHTOWER: return "WATCHTOWER";
        case BuildingType::CASTLE: return "CASTLE";
        case BuildingType::Count: break;
    }
    return "UNKNOWN";
}

std::optional<BuildingType> parseBuildingType(const std::string& name) {
    const std::string upper = toUpperAscii(name);
    for (int i = 0; i < kBuildingTypeCount; ++i) {
        const BuildingType type = static_cast<BuildingType>(i);
        if (upper == buildingTypeName(type)) {
            return type;
        }
    }
    return std::nullopt;
}

const char* structureStatusName(StructureStatus status) {
    switch (status) {
        case StructureStatus::BLUEPRINT: return "BLUEPRINT";
        case StructureStatus::UNDER_CONSTRUCTION: return "UNDER_CONSTRUCTION";
        case StructureStatus::COMPLETE: return "COMPLETE";
        case StructureStatus::DAMAGED: return "DAMAGED";
        case StructureStatus::DESTROYED: return "DESTROYED";
    }
    return "UNKNOWN";
}

std::optional<StructureStatus> parseStructureStatus(const std::string& name) {
    const std::string upper = toUpperAscii(name);
    if (upper == "BLUEPRINT") return StructureStatus::BLUEPRINT;
    if (upper == "UNDER_CONSTRUCTION") return StructureStatus::UNDER_CONSTRUCTION;
    if (upper == "COMPLETE" || upper == "COMPLETED") return StructureStatus::COMPLETE;
    if (upper == "DAMAGED") return StructureStatus::DAMAGED;
    if (upper == "DESTROYED") return StructureStatus::DESTROYED;
    return std::nullopt;
}

const char* tierName(Tier tier) {
    switch (tier) {
        case Tier::SURVIVAL: return "SURVIVAL";
        case Tier::PERMANENT: return "PERMANENT";
        case Tier::TOWN: return "TOWN";
        case Tier::CASTLE: return "CASTLE";
    }
    return "UNKNOWN";
}

std::optional<Tier> parseTier(const std::string& name) {
    const std::string upper = toUpperAscii(name);
    for (int i = 0; i < kTierCount; ++i) {
        const Tier tier = static_cast<Tier>(i);
        if (upper == tierName(tier)) {
            return tier;
        }
    }
    return std::nullopt;
}
