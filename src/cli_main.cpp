#include <SFML/System/Clock.hpp>
#include <SFML/System/Vector3.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "building_catalog.h"
#include "save_state.h"
#include "settlement.h"
#include "simulation_context.h"

namespace {

constexpr int kPlacementAttempts = 64;

struct RunOptions {
    std::uint64_t seed = 1;
    std::string configPath = "data/sim_config.toml";
    std::string buildingsPath; // empty means "use config value"
    int ticks = 720;
    int checkpointEvery = 60;
    std::string savePath;
    bool quiet = false;
};

bool parseUInt64(const std::string& s, std::uint64_t& out) {
    try {
        size_t pos = 0;
        const auto v = std::stoull(s, &pos);
        if (pos != s.size()) return false;
        out = static_cast<std::uint64_t>(v);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parseInt(const std::string& s, int& out) {
    try {
        size_t pos = 0;
        const auto v = std::stoll(s, &pos);
        if (pos != s.size()) return false;
        if (v < static_cast<long long>(std::numeric_limits<int>::min()) ||
            v > static_cast<long long>(std::numeric_limits<int>::max())) {
            return false;
        }
        out = static_cast<int>(v);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

void printUsage(const char* argv0) {
    std::cout << "Usage: " << (argv0 ? argv0 : "settlesim_cli")
              << " [--seed N] [--config path] [--buildings path]\n"
              << "       [--ticks N] [--checkpointEvery N] [--save path] [--quiet]\n";
}

bool parseArgs(int argc, char** argv, RunOptions& opt) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i] ? std::string(argv[i]) : std::string();
        auto requireValue = [&](std::string& out) -> bool {
            if (i + 1 >= argc) return false;
            out = argv[++i] ? std::string(argv[i]) : std::string();
            return true;
        };

        if (arg == "--help" || arg == "-h") {
            printUsage((argc > 0) ? argv[0] : nullptr);
            return false;
        } else if (arg == "--seed") {
            std::string v;
            if (!requireValue(v) || !parseUInt64(v, opt.seed)) return false;
        } else if (arg.rfind("--seed=", 0) == 0) {
            if (!parseUInt64(arg.substr(7), opt.seed)) return false;
        } else if (arg == "--config") {
            if (!requireValue(opt.configPath)) return false;
        } else if (arg.rfind("--config=", 0) == 0) {
            opt.configPath = arg.substr(9);
        } else if (arg == "--buildings") {
            if (!requireValue(opt.buildingsPath)) return false;
        } else if (arg.rfind("--buildings=", 0) == 0) {
            opt.buildingsPath = arg.substr(12);
        } else if (arg == "--ticks") {
            std::string v;
            if (!requireValue(v) || !parseInt(v, opt.ticks)) return false;
        } else if (arg.rfind("--ticks=", 0) == 0) {
            if (!parseInt(arg.substr(8), opt.ticks)) return false;
        } else if (arg == "--checkpointEvery") {
            std::string v;
            if (!requireValue(v) || !parseInt(v, opt.checkpointEvery)) return false;
        } else if (arg.rfind("--checkpointEvery=", 0) == 0) {
            if (!parseInt(arg.substr(18), opt.checkpointEvery)) return false;
        } else if (arg == "--save") {
            if (!requireValue(opt.savePath)) return false;
        } else if (arg.rfind("--save=", 0) == 0) {
            opt.savePath = arg.substr(7);
        } else if (arg == "--quiet") {
            opt.quiet = true;
        } else {
            std::cerr << "Unknown flag: " << arg << "\n";
            return false;
        }
    }
    return true;
}

// Tries random spots around the settlement centre until one is free.
std::optional<int> placeNearCentre(Settlement& settlement,
                                   SimulationContext& ctx,
                                   BuildingType type,
                                   StructureStatus status,
                                   int spread) {
    const int centre = ctx.config.world.gridSize / 2;
    for (int attempt = 0; attempt < kPlacementAttempts; ++attempt) {
        const sf::Vector3i pos(centre + ctx.randInt(-spread, spread), 0, centre + ctx.randInt(-spread, spread));
        const PlacementResult placed = settlement.placeStructure(type, pos, status);
        if (placed.status.ok()) {
            return placed.structureId;
        }
        if (placed.status.code != SimErrorCode::RegionOccupied && placed.status.code != SimErrorCode::OutOfBounds) {
            std::cerr << "[Setup] " << buildingTypeName(type) << ": " << placed.status.message << "\n";
            return std::nullopt;
        }
    }
    std::cerr << "[Setup] no free spot for " << buildingTypeName(type) << "\n";
    return std::nullopt;
}

void printCheckpoint(const Settlement& settlement, const TickResult& result, double tickSeconds) {
    const StorageLedger& ledger = settlement.ledger();
    const double simMinutes = static_cast<double>(result.tick + 1) * tickSeconds / 60.0;
    std::cout << std::fixed << std::setprecision(2)
              << "tick=" << result.tick
              << " simMinutes=" << simMinutes
              << " tier=" << tierName(settlement.tier());
    for (Resource::Type type : Resource::kAllTypes) {
        std::cout << " " << Resource::name(type) << "=" << ledger.getAmount(type);
    }
    std::cout << " cap=" << ledger.getCapacity()
              << " alive=" << result.consumption.aliveCount
              << " morale=" << result.morale.composite
              << " hash=" << std::hex << settlement.getLastDeterminismHash() << std::dec
              << "\n";
    std::cout.unsetf(std::ios::floatfield);
}

bool writeSnapshot(const Settlement& settlement, const std::string& path) {
    const std::filesystem::path out(path);
    if (out.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(out.parent_path(), ec);
        if (ec) {
            std::cerr << "Could not create " << out.parent_path().string() << ": " << ec.message() << "\n";
            return false;
        }
    }
    std::ofstream file(out);
    if (!file) {
        std::cerr << "Could not open snapshot output: " << out.string() << "\n";
        return false;
    }
    file << serializeSnapshot(settlement.snapshot());
    return static_cast<bool>(file);
}

} // namespace

int main(int argc, char** argv) {
    RunOptions opt;
    if (!parseArgs(argc, argv, opt)) {
        printUsage((argc > 0) ? argv[0] : nullptr);
        return 2;
    }
    if (opt.ticks < 0) {
        std::cerr << "Invalid ticks=" << opt.ticks << "\n";
        return 2;
    }
    if (opt.checkpointEvery <= 0) {
        opt.checkpointEvery = 60;
    }

    SimulationContext ctx(opt.seed, opt.configPath);

    BuildingCatalog catalog;
    const std::string catalogPath = opt.buildingsPath.empty() ? ctx.config.buildings.catalogPath : opt.buildingsPath;
    if (!catalogPath.empty()) {
        std::string err;
        if (!catalog.loadFromFile(catalogPath, &err)) {
            if (!opt.buildingsPath.empty()) {
                std::cerr << "Error: " << err << "\n";
                return 1;
            }
            std::cerr << "[Buildings] " << err << "; using built-in definitions\n";
        }
    }

    Settlement settlement(ctx, catalog);

    std::cout << "settlesim_cli seed=" << opt.seed
              << " config=" << ctx.configPath
              << " hash=" << ctx.configHash
              << " buildings=" << catalog.sourceLabel()
              << " ticks=" << opt.ticks
              << "\n";

    // Starting camp.
    placeNearCentre(settlement, ctx, BuildingType::CAMPFIRE, StructureStatus::COMPLETE, 2);
    std::vector<int> producers;
    for (BuildingType type : {BuildingType::FARM, BuildingType::FARM, BuildingType::LUMBER_MILL, BuildingType::MINE}) {
        if (const auto id = placeNearCentre(settlement, ctx, type, StructureStatus::COMPLETE, 12)) {
            producers.push_back(*id);
        }
    }
    for (int i = 0; i < 3; ++i) {
        placeNearCentre(settlement, ctx, BuildingType::HOUSE, StructureStatus::COMPLETE, 10);
    }
    std::vector<int> pending;
    for (BuildingType type : {BuildingType::WAREHOUSE, BuildingType::TOWN_CENTER}) {
        if (const auto id = placeNearCentre(settlement, ctx, type, StructureStatus::BLUEPRINT, 15)) {
            pending.push_back(*id);
        }
    }

    const int settlerCount = 6;
    for (int i = 0; i < settlerCount; ++i) {
        const int settlerId = settlement.registerSettler();
        if (producers.empty()) {
            continue;
        }
        const int target = producers[static_cast<size_t>(i) % producers.size()];
        const SimStatus st = settlement.assignWorker(settlerId, target);
        if (!st.ok() && !opt.quiet) {
            std::cout << "[Setup] settler " << settlerId << " stays idle: " << st.message << "\n";
        }
    }
    for (const auto& [type, amount] : {std::make_pair(Resource::Type::FOOD, 40.0),
                                       std::make_pair(Resource::Type::WOOD, 20.0)}) {
        const DepositResult stocked = settlement.deposit(type, amount);
        if (!stocked.status.ok()) {
            std::cerr << "[Setup] " << stocked.status.message << "\n";
        }
    }
    settlement.recordExpansion();

    if (!opt.quiet) {
        settlement.printSummary(std::cout);
    }

    sf::Clock clock;
    int exitCode = 0;
    for (int t = 0; t < opt.ticks; ++t) {
        const TickResult result = settlement.tick();

        if (!pending.empty()) {
            const int id = pending.front();
            const SimStatus st = settlement.advanceConstruction(id, 1);
            const auto s = settlement.structure(id);
            if (!st.ok() || !s || s->isComplete()) {
                pending.erase(pending.begin());
                if (s && s->isComplete()) {
                    settlement.recordExpansion();
                }
            }
        }

        const bool checkpoint = ((t + 1) % opt.checkpointEvery) == 0 || t + 1 == opt.ticks;
        if (checkpoint) {
            if (const auto next = TierGate::nextTier(settlement.tier())) {
                const TierCheck check = settlement.requestAdvancement(*next);
                if (!check.canAdvance && !opt.quiet) {
                    std::cout << "[Tier] " << tierName(*next) << " blocked: " << check.missing.size()
                              << " requirement(s) unmet\n";
                }
            }
            printCheckpoint(settlement, result, ctx.config.world.tickSeconds);
        }

        const std::string invariantError = settlement.validateInvariants();
        if (!invariantError.empty()) {
            std::cerr << "Invariant failure at tick " << result.tick << ": " << invariantError << "\n";
            exitCode = 3;
            break;
        }
    }

    const float elapsed = clock.getElapsedTime().asSeconds();
    if (!opt.quiet) {
        settlement.printSummary(std::cout);
    }
    std::cout << "settlesim_cli done ticks=" << settlement.nextTick()
              << " elapsed=" << std::fixed << std::setprecision(3) << elapsed << "s"
              << " finalHash=" << std::hex << settlement.getLastDeterminismHash() << std::dec
              << "\n";

    if (!opt.savePath.empty()) {
        if (!writeSnapshot(settlement, opt.savePath)) {
            return 1;
        }
        std::cout << "Snapshot written to " << opt.savePath << "\n";
    }
    return exitCode;
}
