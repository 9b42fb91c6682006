// resource.cpp
#include "resource.h"

#include <algorithm>
#include <cctype>

const char* Resource::name(Type type) {
    switch (type) {
        case Type::FOOD: return "food";
        case Type::WOOD: return "wood";
        case Type::STONE: return "stone";
        case Type::GOLD: return "gold";
        case Type::ESSENCE: return "essence";
        case Type::CRYSTAL: return "crystal";
    }
    return "unknown";
}

std::optional<Resource::Type> Resource::fromName(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    for (Type type : kAllTypes) {
        if (lower == Resource::name(type)) {
            return type;
        }
    }
    return std::nullopt;
}

ResourceAmounts zeroAmounts() {
    ResourceAmounts amounts{};
    amounts.fill(0.0);
    return amounts;
}

double totalOf(const ResourceAmounts& amounts) {
    double total = 0.0;
    for (double v : amounts) {
        total += v;
    }
    return total;
}

ResourceMap toResourceMap(const ResourceAmounts& amounts) {
    ResourceMap out;
    for (Resource::Type type : Resource::kAllTypes) {
        out[Resource::name(type)] = amounts[static_cast<size_t>(Resource::index(type))];
    }
    return out;
}
