#include <catch2/catch.hpp>

#include <string>

#include "tier_gate.h"

namespace {

ResourceMap stock(double food, double wood, double stone) {
    return ResourceMap{{"food", food}, {"wood", wood}, {"stone", stone}};
}

void addStructure(StructureMap& structures, int id, BuildingType type, StructureStatus status) {
    Structure s;
    s.id = id;
    s.type = type;
    s.status = status;
    structures[id] = s;
}

} // namespace

TEST_CASE("TierGate: tiers cannot be skipped or reversed")
{
    TierGate gate;
    StructureMap structures;
    addStructure(structures, 1, BuildingType::TOWN_CENTER, StructureStatus::COMPLETE);
    const ResourceMap rich = stock(1.0e6, 1.0e6, 1.0e6);

    const TierCheck skip = gate.canAdvance(Tier::TOWN, structures, rich, Tier::SURVIVAL);
    CHECK_FALSE(skip.canAdvance);
    CHECK(skip.reason == TierRejection::SkipTier);
    CHECK(std::string(tierRejectionName(skip.reason)) == "skip-tier");

    const TierCheck toCastle = gate.canAdvance(Tier::CASTLE, structures, rich, Tier::SURVIVAL);
    CHECK(toCastle.reason == TierRejection::SkipTier);

    CHECK(gate.canAdvance(Tier::PERMANENT, structures, rich, Tier::TOWN).reason == TierRejection::Backwards);
    CHECK(gate.canAdvance(Tier::TOWN, structures, rich, Tier::TOWN).reason == TierRejection::Backwards);
}

TEST_CASE("TierGate: every unmet requirement is listed")
{
    TierGate gate;
    StructureMap none;

    const TierCheck permanent = gate.canAdvance(Tier::PERMANENT, none, stock(0, 0, 0), Tier::SURVIVAL);
    CHECK_FALSE(permanent.canAdvance);
    CHECK(permanent.reason == TierRejection::RequirementsUnmet);
    CHECK(permanent.missing.size() == 2);

    const TierCheck town = gate.canAdvance(Tier::TOWN, none, stock(0, 0, 0), Tier::PERMANENT);
    CHECK(town.missing.size() == 4);
    CHECK(town.progress.size() == 4);

    // Resources alone do not open the gate.
    const TierCheck richButEmpty = gate.canAdvance(Tier::TOWN, none, stock(1000, 1000, 1000), Tier::PERMANENT);
    REQUIRE(richButEmpty.missing.size() == 1);
    CHECK(richButEmpty.missing[0].name == "TOWN_CENTER");
    CHECK(richButEmpty.missing[0].structure);
}

TEST_CASE("TierGate: only COMPLETE structures count")
{
    TierGate gate;
    StructureMap structures;
    addStructure(structures, 1, BuildingType::HOUSE, StructureStatus::UNDER_CONSTRUCTION);
    addStructure(structures, 2, BuildingType::HOUSE, StructureStatus::DAMAGED);

    const TierCheck blocked = gate.canAdvance(Tier::PERMANENT, structures, stock(0, 20, 0), Tier::SURVIVAL);
    CHECK_FALSE(blocked.canAdvance);
    REQUIRE(blocked.missing.size() == 1);
    CHECK(blocked.missing[0].name == "HOUSE");

    addStructure(structures, 3, BuildingType::HOUSE, StructureStatus::COMPLETE);
    const TierCheck open = gate.canAdvance(Tier::PERMANENT, structures, stock(0, 20, 0), Tier::SURVIVAL);
    CHECK(open.canAdvance);
    CHECK(open.reason == TierRejection::None);
    CHECK(open.missing.empty());
}

TEST_CASE("TierGate: resource maps must carry wood, food and stone")
{
    TierGate gate;
    StructureMap structures;
    addStructure(structures, 1, BuildingType::HOUSE, StructureStatus::COMPLETE);

    const ResourceMap noStone{{"food", 100.0}, {"wood", 100.0}};
    const TierCheck check = gate.canAdvance(Tier::PERMANENT, structures, noStone, Tier::SURVIVAL);
    CHECK_FALSE(check.canAdvance);
    CHECK(check.reason == TierRejection::MalformedResources);

    // Extra keys are fine.
    ResourceMap extra = stock(0, 20, 0);
    extra["gold"] = 3.0;
    CHECK(gate.canAdvance(Tier::PERMANENT, structures, extra, Tier::SURVIVAL).canAdvance);
}

TEST_CASE("TierGate: progression order")
{
    CHECK(TierGate::nextTier(Tier::SURVIVAL).value() == Tier::PERMANENT);
    CHECK(TierGate::nextTier(Tier::TOWN).value() == Tier::CASTLE);
    CHECK_FALSE(TierGate::nextTier(Tier::CASTLE).has_value());

    TierGate gate;
    const auto castle = gate.requirementsFor(Tier::CASTLE);
    REQUIRE(castle.has_value());
    CHECK(castle->resources.at("stone") == 1000.0);
    CHECK(castle->structures.at(BuildingType::CASTLE) == 1);
}
