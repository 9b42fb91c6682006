// resource.h
#pragma once

#include <array>
#include <map>
#include <optional>
#include <string>

class Resource {
public:
    enum class Type {
        FOOD = 0,
        WOOD = 1,
        STONE = 2,
        GOLD = 3,
        ESSENCE = 4,
        CRYSTAL = 5
    };

    static constexpr int kTypeCount = 6;
    static constexpr std::array<Type, kTypeCount> kAllTypes = {
        Type::FOOD,
        Type::WOOD,
        Type::STONE,
        Type::GOLD,
        Type::ESSENCE,
        Type::CRYSTAL
    };

    static int index(Type type) { return static_cast<int>(type); }

    // Lowercase key used in configuration and save files ("food", "wood", ...).
    static const char* name(Type type);
    static std::optional<Type> fromName(const std::string& name);
};

// Fixed-size per-type amounts, indexed with Resource::index().
using ResourceAmounts = std::array<double, Resource::kTypeCount>;

// Name-keyed view handed across the reporting boundary (tier checks, snapshots).
using ResourceMap = std::map<std::string, double>;

ResourceAmounts zeroAmounts();
double totalOf(const ResourceAmounts& amounts);
ResourceMap toResourceMap(const ResourceAmounts& amounts);
