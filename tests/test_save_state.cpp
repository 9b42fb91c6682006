#include <catch2/catch.hpp>

#include <string>

#include "save_state.h"

namespace {

SettlementSnapshot sampleSnapshot() {
    SettlementSnapshot snap;
    snap.tick = 1234;
    snap.tier = Tier::PERMANENT;
    snap.expansionCount = 3;
    snap.morale = -12.5;
    snap.capacity = 1450.0;
    snap.resources = zeroAmounts();
    snap.resources[static_cast<size_t>(Resource::index(Resource::Type::FOOD))] = 40.25;
    snap.resources[static_cast<size_t>(Resource::index(Resource::Type::WOOD))] = 300.0;
    snap.resources[static_cast<size_t>(Resource::index(Resource::Type::CRYSTAL))] = 0.5;

    Structure farm;
    farm.id = 4;
    farm.type = BuildingType::FARM;
    farm.position = sf::Vector3i(10, 0, 12);
    farm.dimensions = Dimensions{2, 1, 2};
    farm.status = StructureStatus::COMPLETE;
    farm.health = 75.5;
    farm.maxHealth = 100.0;
    farm.constructionProgress = 40;
    snap.structures.push_back(farm);

    Structure blueprint;
    blueprint.id = 9;
    blueprint.type = BuildingType::TOWN_CENTER;
    blueprint.position = sf::Vector3i(30, 1, 30);
    blueprint.dimensions = Dimensions{3, 2, 3};
    blueprint.status = StructureStatus::UNDER_CONSTRUCTION;
    blueprint.health = 200.0;
    blueprint.maxHealth = 200.0;
    blueprint.constructionProgress = 17;
    snap.structures.push_back(blueprint);

    Settler worker;
    worker.id = 1;
    worker.working = true;
    worker.happiness = 62.5;
    worker.health = 99.5;
    snap.settlers.push_back(worker);

    Settler dead;
    dead.id = 2;
    dead.alive = false;
    dead.happiness = 0.0;
    dead.health = 0.0;
    snap.settlers.push_back(dead);

    snap.assignments[4] = {1};
    return snap;
}

} // namespace

TEST_CASE("Snapshot: text form restores every field")
{
    const SettlementSnapshot original = sampleSnapshot();
    const std::string text = serializeSnapshot(original);
    CHECK(text.find("schemaVersion") != std::string::npos);

    SettlementSnapshot parsed;
    const SimStatus st = parseSnapshot(text, parsed);
    INFO(st.message);
    REQUIRE(st.ok());

    CHECK(parsed.schemaVersion == kSnapshotSchemaVersion);
    CHECK(parsed.tick == 1234);
    CHECK(parsed.tier == Tier::PERMANENT);
    CHECK(parsed.expansionCount == 3);
    CHECK(parsed.morale == -12.5);
    CHECK(parsed.capacity == 1450.0);
    CHECK(parsed.resources == original.resources);

    REQUIRE(parsed.structures.size() == 2);
    const Structure& farm = parsed.structures[0];
    CHECK(farm.id == 4);
    CHECK(farm.type == BuildingType::FARM);
    CHECK(farm.position == sf::Vector3i(10, 0, 12));
    CHECK(farm.dimensions.depth == 2);
    CHECK(farm.status == StructureStatus::COMPLETE);
    CHECK(farm.health == 75.5);
    CHECK(farm.constructionProgress == 40);
    CHECK(parsed.structures[1].status == StructureStatus::UNDER_CONSTRUCTION);
    CHECK(parsed.structures[1].position == sf::Vector3i(30, 1, 30));

    REQUIRE(parsed.settlers.size() == 2);
    CHECK(parsed.settlers[0].working);
    CHECK(parsed.settlers[0].happiness == 62.5);
    CHECK_FALSE(parsed.settlers[1].alive);

    REQUIRE(parsed.assignments.count(4) == 1);
    CHECK(parsed.assignments.at(4) == std::vector<int>{1});
}

TEST_CASE("Snapshot: schema version is enforced")
{
    SettlementSnapshot out;
    CHECK(parseSnapshot("schemaVersion = 2\ntick = 0\ntier = \"SURVIVAL\"\n", out).code ==
          SimErrorCode::SchemaMismatch);
    CHECK(parseSnapshot("tick = 0\ntier = \"SURVIVAL\"\n", out).code == SimErrorCode::SchemaMismatch);
}

TEST_CASE("Snapshot: malformed text is rejected")
{
    SettlementSnapshot out;
    out.tick = 77;

    CHECK(parseSnapshot("schemaVersion = [", out).code == SimErrorCode::ParseError);
    CHECK(parseSnapshot("schemaVersion = 1\ntick = 0\ntier = \"SURVIVAL\"\n", out).code ==
          SimErrorCode::ParseError); // no [ledger]

    const std::string unknownType = R"(
        schemaVersion = 1
        tick = 5
        tier = "SURVIVAL"
        [ledger]
        capacity = 1000.0
        [[structures]]
        id = 1
        type = "SPACEPORT"
        status = "COMPLETE"
        position = [0, 0, 0]
        dimensions = [1, 1, 1]
        health = 10.0
        maxHealth = 10.0
    )";
    CHECK(parseSnapshot(unknownType, out).code == SimErrorCode::UnknownType);

    const std::string badPosition = R"(
        schemaVersion = 1
        tick = 5
        tier = "SURVIVAL"
        [ledger]
        capacity = 1000.0
        [[structures]]
        id = 1
        type = "FARM"
        status = "COMPLETE"
        position = [0, 0]
        dimensions = [2, 1, 2]
        health = 10.0
        maxHealth = 10.0
    )";
    CHECK(parseSnapshot(badPosition, out).code == SimErrorCode::ParseError);

    // Failed parses leave the output alone.
    CHECK(out.tick == 77);
}

TEST_CASE("Snapshot: legacy status spelling is accepted")
{
    const std::string text = R"(
        schemaVersion = 1
        tick = 0
        tier = "SURVIVAL"
        [ledger]
        capacity = 1000.0
        amounts = { food = 12 }
        [[structures]]
        id = 3
        type = "HOUSE"
        status = "completed"
        position = [4, 0, 4]
        dimensions = [1, 1, 1]
        health = 120
        maxHealth = 120
    )";
    SettlementSnapshot out;
    REQUIRE(parseSnapshot(text, out).ok());
    REQUIRE(out.structures.size() == 1);
    CHECK(out.structures[0].status == StructureStatus::COMPLETE);
    CHECK(out.resources[static_cast<size_t>(Resource::index(Resource::Type::FOOD))] == 12.0);
}
