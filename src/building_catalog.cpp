#include "building_catalog.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

#include <toml++/toml.hpp>

namespace {

ResourceAmounts amounts(double food, double wood, double stone) {
    ResourceAmounts out = zeroAmounts();
    out[static_cast<size_t>(Resource::index(Resource::Type::FOOD))] = food;
    out[static_cast<size_t>(Resource::index(Resource::Type::WOOD))] = wood;
    out[static_cast<size_t>(Resource::index(Resource::Type::STONE))] = stone;
    return out;
}

BuildingDefinition makeDef(BuildingType type,
                           const char* displayName,
                           Tier tier,
                           Dimensions dims,
                           ResourceAmounts cost,
                           ResourceAmounts production,
                           ResourceAmounts storage,
                           int workSlots,
                           int housing,
                           double maxHealth,
                           int constructionTime,
                           std::vector<EffectSpec> effects) {
    BuildingDefinition d;
    d.type = type;
    d.displayName = displayName;
    d.tier = tier;
    d.dimensions = dims;
    d.cost = cost;
    d.production = production;
    d.storage = storage;
    d.workSlots = workSlots;
    d.housingCapacity = housing;
    d.maxHealth = maxHealth;
    d.constructionTime = constructionTime;
    d.effects = std::move(effects);
    return d;
}

std::optional<double> numberOf(const toml::node& node) {
    if (const auto v = node.value<double>()) {
        return *v;
    }
    if (const auto vi = node.value<std::int64_t>()) {
        return static_cast<double>(*vi);
    }
    return std::nullopt;
}

bool fail(std::string* errorMessage, const std::string& msg) {
    if (errorMessage) {
        *errorMessage = msg;
    }
    return false;
}

// Overrides only the resources named in the table; missing keys keep their value.
bool readAmounts(const toml::table& entry,
                 std::string_view field,
                 const std::string& typeName,
                 ResourceAmounts& target,
                 std::string* errorMessage) {
    const toml::node* node = entry.get(field);
    if (!node) {
        return true;
    }
    const toml::table* tbl = node->as_table();
    if (!tbl) {
        return fail(errorMessage, "building " + typeName + ": '" + std::string(field) + "' must be a table");
    }
    for (auto&& [key, value] : *tbl) {
        const std::string resName(key.str());
        const auto res = Resource::fromName(resName);
        if (!res) {
            return fail(errorMessage, "building " + typeName + ": unknown resource '" + resName + "' in " + std::string(field));
        }
        const auto amount = numberOf(value);
        if (!amount || !std::isfinite(*amount) || *amount < 0.0) {
            return fail(errorMessage, "building " + typeName + ": invalid " + resName + " in " + std::string(field));
        }
        target[static_cast<size_t>(Resource::index(*res))] = *amount;
    }
    return true;
}

bool applyEntry(const toml::table& entry, BuildingDefinition& def, std::string* errorMessage) {
    const std::string typeName = buildingTypeName(def.type);

    if (const auto v = entry["displayName"].value<std::string>()) {
        def.displayName = *v;
    }
    if (const auto v = entry["tier"].value<std::string>()) {
        const auto tier = parseTier(*v);
        if (!tier) {
            return fail(errorMessage, "building " + typeName + ": unknown tier '" + *v + "'");
        }
        def.tier = *tier;
    }
    if (const toml::table* dims = entry["dimensions"].as_table()) {
        if (const auto v = (*dims)["width"].value<std::int64_t>()) def.dimensions.width = static_cast<int>(*v);
        if (const auto v = (*dims)["height"].value<std::int64_t>()) def.dimensions.height = static_cast<int>(*v);
        if (const auto v = (*dims)["depth"].value<std::int64_t>()) def.dimensions.depth = static_cast<int>(*v);
    }
    if (!readAmounts(entry, "cost", typeName, def.cost, errorMessage)) return false;
    if (!readAmounts(entry, "production", typeName, def.production, errorMessage)) return false;
    if (!readAmounts(entry, "storage", typeName, def.storage, errorMessage)) return false;

    if (const auto v = entry["workSlots"].value<std::int64_t>()) def.workSlots = static_cast<int>(*v);
    if (const auto v = entry["housingCapacity"].value<std::int64_t>()) def.housingCapacity = static_cast<int>(*v);
    if (const auto v = entry["constructionTime"].value<std::int64_t>()) def.constructionTime = static_cast<int>(*v);
    if (const toml::node* hp = entry.get("maxHealth")) {
        if (const auto v = numberOf(*hp)) def.maxHealth = *v;
    }

    if (const toml::array* effects = entry["effects"].as_array()) {
        def.effects.clear();
        for (const auto& node : *effects) {
            const toml::table* t = node.as_table();
            if (!t) {
                return fail(errorMessage, "building " + typeName + ": effects must be tables");
            }
            EffectSpec spec;
            std::optional<EffectKind> kind;
            if (const auto kindName = (*t)["kind"].value<std::string>()) {
                kind = parseEffectKind(*kindName);
            }
            if (!kind) {
                return fail(errorMessage, "building " + typeName + ": effect kind missing or unknown");
            }
            spec.kind = *kind;
            if (const toml::node* r = t->get("radius")) {
                if (const auto v = numberOf(*r)) spec.radius = *v;
            }
            if (const toml::node* m = t->get("multiplier")) {
                if (const auto v = numberOf(*m)) spec.multiplier = *v;
            }
            if (!std::isfinite(spec.radius) || spec.radius < 0.0 ||
                !std::isfinite(spec.multiplier) || spec.multiplier <= 0.0) {
                return fail(errorMessage, "building " + typeName + ": effect radius/multiplier out of range");
            }
            def.effects.push_back(spec);
        }
    }

    if (def.dimensions.width <= 0 || def.dimensions.height <= 0 || def.dimensions.depth <= 0) {
        std::ostringstream oss;
        oss << "building " << typeName << " has invalid dimensions: " << def.dimensions.width << "x"
            << def.dimensions.height << "x" << def.dimensions.depth;
        return fail(errorMessage, oss.str());
    }
    if (!std::isfinite(def.maxHealth) || def.maxHealth <= 0.0) {
        return fail(errorMessage, "building " + typeName + ": maxHealth must be positive");
    }
    if (def.workSlots < 0 || def.housingCapacity < 0 || def.constructionTime < 0) {
        return fail(errorMessage, "building " + typeName + ": negative workSlots/housingCapacity/constructionTime");
    }
    return true;
}

bool applyCatalog(const toml::table& root,
                  std::array<BuildingDefinition, kBuildingTypeCount>& defs,
                  std::string* errorMessage) {
    const toml::table* buildings = root["buildings"].as_table();
    if (!buildings) {
        return fail(errorMessage, "building catalog has no [buildings] table");
    }
    for (auto&& [key, value] : *buildings) {
        const std::string typeName(key.str());
        const auto type = parseBuildingType(typeName);
        if (!type) {
            return fail(errorMessage, "unknown building type '" + typeName + "'");
        }
        const toml::table* entry = value.as_table();
        if (!entry) {
            return fail(errorMessage, "building " + typeName + " must be a table");
        }
        if (!applyEntry(*entry, defs[static_cast<size_t>(*type)], errorMessage)) {
            return false;
        }
    }
    return true;
}

} // namespace

const char* effectKindName(EffectKind kind) {
    switch (kind) {
        case EffectKind::ProductionAura: return "production";
        case EffectKind::DefenseZone: return "defense";
        case EffectKind::TradeZone: return "trade";
    }
    return "unknown";
}

std::optional<EffectKind> parseEffectKind(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (lower == "production" || lower == "aura") return EffectKind::ProductionAura;
    if (lower == "defense") return EffectKind::DefenseZone;
    if (lower == "trade") return EffectKind::TradeZone;
    return std::nullopt;
}

bool BuildingDefinition::producesAnything() const {
    return std::any_of(production.begin(), production.end(), [](double v) { return v > 0.0; });
}

double BuildingDefinition::storageTotal() const {
    return totalOf(storage);
}

const std::vector<BuildingDefinition>& getDefaultBuildingDefinitions() {
    static const std::vector<BuildingDefinition> kDefinitions = {
        makeDef(BuildingType::CAMPFIRE, "Campfire", Tier::SURVIVAL, {1, 1, 1},
                amounts(0, 0, 0), amounts(0, 0, 0), amounts(0, 50, 0),
                1, 0, 100.0, 30, {}),
        makeDef(BuildingType::FARM, "Farm", Tier::SURVIVAL, {2, 1, 2},
                amounts(0, 10, 0), amounts(1.0, 0, 0), amounts(100, 0, 0),
                1, 0, 100.0, 40, {}),
        makeDef(BuildingType::HOUSE, "House", Tier::SURVIVAL, {1, 1, 1},
                amounts(5, 20, 0), amounts(0, 0, 0), amounts(0, 0, 0),
                0, 2, 120.0, 50, {}),
        makeDef(BuildingType::WAREHOUSE, "Warehouse", Tier::PERMANENT, {2, 1, 2},
                amounts(10, 30, 5), amounts(0, 0, 0), amounts(200, 200, 100),
                1, 0, 150.0, 60, {}),
        makeDef(BuildingType::LUMBER_MILL, "Lumber Mill", Tier::PERMANENT, {2, 1, 2},
                amounts(0, 15, 5), amounts(0, 1.0, 0), amounts(0, 100, 0),
                2, 0, 120.0, 50, {}),
        makeDef(BuildingType::MINE, "Mine", Tier::PERMANENT, {2, 1, 2},
                amounts(5, 25, 0), amounts(0, 0, 0.5), amounts(0, 0, 100),
                2, 0, 150.0, 60, {}),
        makeDef(BuildingType::TOWN_CENTER, "Town Center", Tier::TOWN, {3, 2, 3},
                amounts(50, 100, 100), amounts(0, 0, 0), amounts(300, 300, 200),
                2, 0, 200.0, 120, {{EffectKind::ProductionAura, 50.0, 1.05}}),
        makeDef(BuildingType::MARKET, "Market", Tier::TOWN, {2, 1, 2},
                amounts(20, 50, 50), amounts(0, 0, 0), amounts(150, 150, 150),
                1, 0, 140.0, 80, {{EffectKind::TradeZone, 30.0, 1.10}}),
        makeDef(BuildingType::WATCHTOWER, "Watchtower", Tier::TOWN, {1, 2, 1},
                amounts(10, 30, 80), amounts(0, 0, 0), amounts(0, 0, 0),
                2, 0, 180.0, 90, {{EffectKind::DefenseZone, 40.0, 1.20}}),
        makeDef(BuildingType::CASTLE, "Castle", Tier::CASTLE, {5, 3, 5},
                amounts(300, 500, 1000), amounts(0, 0, 0), amounts(1000, 1000, 1000),
                5, 0, 500.0, 300,
                {{EffectKind::ProductionAura, 80.0, 1.10}, {EffectKind::DefenseZone, 60.0, 1.30}}),
    };
    return kDefinitions;
}

BuildingCatalog::BuildingCatalog() {
    for (const BuildingDefinition& def : getDefaultBuildingDefinitions()) {
        m_defs[static_cast<size_t>(def.type)] = def;
    }
}

bool BuildingCatalog::loadFromFile(const std::string& path, std::string* errorMessage) {
    std::array<BuildingDefinition, kBuildingTypeCount> staged = m_defs;
    try {
        const toml::table root = toml::parse_file(path);
        if (!applyCatalog(root, staged, errorMessage)) {
            return false;
        }
    } catch (const toml::parse_error& err) {
        std::ostringstream oss;
        oss << "Failed to parse building catalog '" << path << "': " << err.description();
        return fail(errorMessage, oss.str());
    } catch (const std::exception& err) {
        std::ostringstream oss;
        oss << "Failed to load building catalog '" << path << "': " << err.what();
        return fail(errorMessage, oss.str());
    }
    m_defs = std::move(staged);
    m_source = path;
    return true;
}

bool BuildingCatalog::loadFromString(std::string_view text, std::string* errorMessage) {
    std::array<BuildingDefinition, kBuildingTypeCount> staged = m_defs;
    try {
        const toml::table root = toml::parse(text);
        if (!applyCatalog(root, staged, errorMessage)) {
            return false;
        }
    } catch (const toml::parse_error& err) {
        std::ostringstream oss;
        oss << "Failed to parse building catalog: " << err.description();
        return fail(errorMessage, oss.str());
    }
    m_defs = std::move(staged);
    m_source = "inline";
    return true;
}

std::optional<BuildingDefinition> BuildingCatalog::find(BuildingType type) const {
    const int idx = static_cast<int>(type);
    if (idx < 0 || idx >= kBuildingTypeCount) {
        return std::nullopt;
    }
    return m_defs[static_cast<size_t>(idx)];
}

std::vector<BuildingDefinition> BuildingCatalog::all() const {
    return std::vector<BuildingDefinition>(m_defs.begin(), m_defs.end());
}
