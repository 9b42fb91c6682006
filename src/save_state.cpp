#include "save_state.h"

#include <sstream>

#include <toml++/toml.hpp>

namespace {

std::optional<double> numberOf(const toml::node* node) {
    if (!node) {
        return std::nullopt;
    }
    if (const auto v = node->value<double>()) {
        return *v;
    }
    if (const auto vi = node->value<std::int64_t>()) {
        return static_cast<double>(*vi);
    }
    return std::nullopt;
}

std::optional<int> intOf(const toml::node* node) {
    if (!node) {
        return std::nullopt;
    }
    if (const auto v = node->value<std::int64_t>()) {
        return static_cast<int>(*v);
    }
    return std::nullopt;
}

bool readTriple(const toml::node* node, int& a, int& b, int& c) {
    const toml::array* arr = node ? node->as_array() : nullptr;
    if (!arr || arr->size() != 3) {
        return false;
    }
    const auto x = intOf(arr->get(0));
    const auto y = intOf(arr->get(1));
    const auto z = intOf(arr->get(2));
    if (!x || !y || !z) {
        return false;
    }
    a = *x;
    b = *y;
    c = *z;
    return true;
}

SimStatus malformed(const std::string& what) {
    return SimStatus::failure(SimErrorCode::ParseError, "snapshot " + what);
}

SimStatus readStructure(const toml::table& t, Structure& s) {
    const auto id = intOf(t.get("id"));
    if (!id || *id <= 0) {
        return malformed("structure without a positive id");
    }
    s.id = *id;
    const std::string label = "structure " + std::to_string(s.id);

    const auto typeName = t["type"].value<std::string>();
    const auto type = typeName ? parseBuildingType(*typeName) : std::optional<BuildingType>();
    if (!type) {
        return SimStatus::failure(SimErrorCode::UnknownType, label + " has unknown type");
    }
    s.type = *type;

    const auto statusName = t["status"].value<std::string>();
    const auto status = statusName ? parseStructureStatus(*statusName) : std::optional<StructureStatus>();
    if (!status) {
        return malformed(label + " has unknown status");
    }
    s.status = *status;

    if (!readTriple(t.get("position"), s.position.x, s.position.y, s.position.z)) {
        return malformed(label + " position must be [x, y, z] integers");
    }
    if (!readTriple(t.get("dimensions"), s.dimensions.width, s.dimensions.height, s.dimensions.depth)) {
        return malformed(label + " dimensions must be [w, h, d] integers");
    }

    const auto health = numberOf(t.get("health"));
    const auto maxHealth = numberOf(t.get("maxHealth"));
    if (!health || !maxHealth) {
        return malformed(label + " missing health");
    }
    s.health = *health;
    s.maxHealth = *maxHealth;
    s.constructionProgress = intOf(t.get("constructionProgress")).value_or(0);
    return SimStatus::success();
}

SimStatus readSettler(const toml::table& t, Settler& s) {
    const auto id = intOf(t.get("id"));
    if (!id || *id <= 0) {
        return malformed("settler without a positive id");
    }
    s.id = *id;
    const auto happiness = numberOf(t.get("happiness"));
    const auto health = numberOf(t.get("health"));
    const auto working = t["working"].value<bool>();
    const auto alive = t["alive"].value<bool>();
    if (!happiness || !health || !working || !alive) {
        return malformed("settler " + std::to_string(s.id) + " missing fields");
    }
    s.happiness = *happiness;
    s.health = *health;
    s.working = *working;
    s.alive = *alive;
    return SimStatus::success();
}

} // namespace

std::string serializeSnapshot(const SettlementSnapshot& snapshot) {
    toml::table root;
    root.insert("schemaVersion", snapshot.schemaVersion);
    root.insert("tick", static_cast<std::int64_t>(snapshot.tick));
    root.insert("tier", std::string(tierName(snapshot.tier)));
    root.insert("expansionCount", snapshot.expansionCount);
    root.insert("morale", snapshot.morale);

    toml::table amounts;
    for (Resource::Type type : Resource::kAllTypes) {
        amounts.insert(Resource::name(type), snapshot.resources[static_cast<size_t>(Resource::index(type))]);
    }
    toml::table ledger;
    ledger.insert("capacity", snapshot.capacity);
    ledger.insert("amounts", std::move(amounts));
    root.insert("ledger", std::move(ledger));

    toml::array structures;
    for (const Structure& s : snapshot.structures) {
        toml::table t;
        t.insert("id", s.id);
        t.insert("type", std::string(buildingTypeName(s.type)));
        t.insert("status", std::string(structureStatusName(s.status)));
        t.insert("position", toml::array{s.position.x, s.position.y, s.position.z});
        t.insert("dimensions", toml::array{s.dimensions.width, s.dimensions.height, s.dimensions.depth});
        t.insert("health", s.health);
        t.insert("maxHealth", s.maxHealth);
        t.insert("constructionProgress", s.constructionProgress);
        structures.push_back(std::move(t));
    }
    root.insert("structures", std::move(structures));

    toml::array settlers;
    for (const Settler& s : snapshot.settlers) {
        toml::table t;
        t.insert("id", s.id);
        t.insert("working", s.working);
        t.insert("happiness", s.happiness);
        t.insert("health", s.health);
        t.insert("alive", s.alive);
        settlers.push_back(std::move(t));
    }
    root.insert("settlers", std::move(settlers));

    toml::array assignments;
    for (const auto& entry : snapshot.assignments) {
        toml::array ids;
        for (int settlerId : entry.second) {
            ids.push_back(settlerId);
        }
        toml::table t;
        t.insert("structure", entry.first);
        t.insert("settlers", std::move(ids));
        assignments.push_back(std::move(t));
    }
    root.insert("assignments", std::move(assignments));

    std::ostringstream oss;
    oss << root << "\n";
    return oss.str();
}

SimStatus parseSnapshot(std::string_view text, SettlementSnapshot& out) {
    toml::table root;
    try {
        root = toml::parse(text);
    } catch (const toml::parse_error& err) {
        std::ostringstream oss;
        oss << "snapshot is not valid TOML: " << err.description();
        return SimStatus::failure(SimErrorCode::ParseError, oss.str());
    }

    const auto version = intOf(root.get("schemaVersion"));
    if (!version) {
        return SimStatus::failure(SimErrorCode::SchemaMismatch, "snapshot has no schemaVersion");
    }
    if (*version != kSnapshotSchemaVersion) {
        std::ostringstream oss;
        oss << "snapshot schemaVersion " << *version << " is not supported (expected " << kSnapshotSchemaVersion << ")";
        return SimStatus::failure(SimErrorCode::SchemaMismatch, oss.str());
    }

    SettlementSnapshot snap;
    snap.schemaVersion = *version;

    const auto tick = root["tick"].value<std::int64_t>();
    if (!tick || *tick < 0) {
        return malformed("tick missing or negative");
    }
    snap.tick = static_cast<std::uint64_t>(*tick);

    const auto tierText = root["tier"].value<std::string>();
    const auto tier = tierText ? parseTier(*tierText) : std::optional<Tier>();
    if (!tier) {
        return malformed("tier missing or unknown");
    }
    snap.tier = *tier;
    snap.expansionCount = intOf(root.get("expansionCount")).value_or(0);
    snap.morale = numberOf(root.get("morale")).value_or(0.0);

    const toml::table* ledger = root["ledger"].as_table();
    if (!ledger) {
        return malformed("has no [ledger]");
    }
    const auto capacity = numberOf(ledger->get("capacity"));
    if (!capacity) {
        return malformed("ledger capacity missing");
    }
    snap.capacity = *capacity;
    snap.resources = zeroAmounts();
    if (const toml::table* amounts = (*ledger)["amounts"].as_table()) {
        for (auto&& [key, value] : *amounts) {
            const auto type = Resource::fromName(std::string(key.str()));
            const auto amount = numberOf(&value);
            if (!type || !amount) {
                return malformed("ledger entry '" + std::string(key.str()) + "' invalid");
            }
            snap.resources[static_cast<size_t>(Resource::index(*type))] = *amount;
        }
    }

    if (const toml::array* structures = root["structures"].as_array()) {
        for (const auto& node : *structures) {
            const toml::table* t = node.as_table();
            if (!t) {
                return malformed("structure entries must be tables");
            }
            Structure s;
            const SimStatus st = readStructure(*t, s);
            if (!st.ok()) {
                return st;
            }
            snap.structures.push_back(s);
        }
    }

    if (const toml::array* settlers = root["settlers"].as_array()) {
        for (const auto& node : *settlers) {
            const toml::table* t = node.as_table();
            if (!t) {
                return malformed("settler entries must be tables");
            }
            Settler s;
            const SimStatus st = readSettler(*t, s);
            if (!st.ok()) {
                return st;
            }
            snap.settlers.push_back(s);
        }
    }

    if (const toml::array* assignments = root["assignments"].as_array()) {
        for (const auto& node : *assignments) {
            const toml::table* t = node.as_table();
            const auto structureId = t ? intOf(t->get("structure")) : std::optional<int>();
            const toml::array* ids = t ? (*t)["settlers"].as_array() : nullptr;
            if (!structureId || !ids) {
                return malformed("assignment entries need structure and settlers");
            }
            std::vector<int>& list = snap.assignments[*structureId];
            for (const auto& idNode : *ids) {
                const auto settlerId = idNode.value<std::int64_t>();
                if (!settlerId) {
                    return malformed("assignment settler ids must be integers");
                }
                list.push_back(static_cast<int>(*settlerId));
            }
        }
    }

    out = std::move(snap);
    return SimStatus::success();
}
