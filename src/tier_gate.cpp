#include "tier_gate.h"

#include <cmath>
#include <sstream>

const char* tierRejectionName(TierRejection reason) {
    switch (reason) {
        case TierRejection::None: return "none";
        case TierRejection::Backwards: return "backwards";
        case TierRejection::SkipTier: return "skip-tier";
        case TierRejection::MalformedResources: return "malformed-resources";
        case TierRejection::RequirementsUnmet: return "requirements-unmet";
    }
    return "unknown";
}

TierGate::TierGate() {
    TierRequirements permanent;
    permanent.tier = Tier::PERMANENT;
    permanent.structures = {{BuildingType::HOUSE, 1}};
    permanent.resources = {{"wood", 20.0}};

    TierRequirements town;
    town.tier = Tier::TOWN;
    town.structures = {{BuildingType::TOWN_CENTER, 1}};
    town.resources = {{"wood", 100.0}, {"food", 50.0}, {"stone", 100.0}};

    TierRequirements castle;
    castle.tier = Tier::CASTLE;
    castle.structures = {{BuildingType::CASTLE, 1}};
    castle.resources = {{"wood", 500.0}, {"food", 300.0}, {"stone", 1000.0}};

    m_requirements[static_cast<size_t>(Tier::PERMANENT)] = permanent;
    m_requirements[static_cast<size_t>(Tier::TOWN)] = town;
    m_requirements[static_cast<size_t>(Tier::CASTLE)] = castle;
}

const std::vector<std::string>& TierGate::recognizedResourceKeys() {
    static const std::vector<std::string> kKeys = {"wood", "food", "stone"};
    return kKeys;
}

std::optional<Tier> TierGate::nextTier(Tier current) {
    const int next = static_cast<int>(current) + 1;
    if (next >= kTierCount) {
        return std::nullopt;
    }
    return static_cast<Tier>(next);
}

std::optional<TierRequirements> TierGate::requirementsFor(Tier tier) const {
    const int idx = static_cast<int>(tier);
    if (idx < 0 || idx >= kTierCount) {
        return std::nullopt;
    }
    return m_requirements[static_cast<size_t>(idx)];
}

TierCheck TierGate::canAdvance(Tier target,
                               const StructureMap& structures,
                               const ResourceMap& resources,
                               Tier current) const {
    TierCheck check;
    check.current = current;
    check.target = target;

    const int from = static_cast<int>(current);
    const int to = static_cast<int>(target);
    if (to <= from) {
        check.reason = TierRejection::Backwards;
        check.message = std::string("cannot move from ") + tierName(current) + " to " + tierName(target);
        return check;
    }
    if (to > from + 1) {
        check.reason = TierRejection::SkipTier;
        check.message = std::string("cannot skip from ") + tierName(current) + " to " + tierName(target);
        return check;
    }
    for (const std::string& key : recognizedResourceKeys()) {
        const auto it = resources.find(key);
        if (it == resources.end() || !std::isfinite(it->second)) {
            check.reason = TierRejection::MalformedResources;
            check.message = "resource map missing '" + key + "'";
            return check;
        }
    }

    const std::optional<TierRequirements> req = requirementsFor(target);
    if (!req) {
        check.reason = TierRejection::MalformedResources;
        check.message = std::string("no requirements defined for ") + tierName(target);
        return check;
    }

    std::map<BuildingType, int> completeCounts;
    for (const auto& entry : structures) {
        if (entry.second.isComplete()) {
            ++completeCounts[entry.second.type];
        }
    }

    for (const auto& need : req->structures) {
        RequirementProgress p;
        p.name = buildingTypeName(need.first);
        p.structure = true;
        const auto it = completeCounts.find(need.first);
        p.available = (it == completeCounts.end()) ? 0.0 : static_cast<double>(it->second);
        p.required = static_cast<double>(need.second);
        p.met = p.available >= p.required;
        check.progress.push_back(p);
        if (!p.met) {
            check.missing.push_back(p);
        }
    }
    for (const auto& need : req->resources) {
        RequirementProgress p;
        p.name = need.first;
        const auto it = resources.find(need.first);
        p.available = (it == resources.end()) ? 0.0 : it->second;
        p.required = need.second;
        p.met = p.available >= p.required;
        check.progress.push_back(p);
        if (!p.met) {
            check.missing.push_back(p);
        }
    }

    if (!check.missing.empty()) {
        std::ostringstream oss;
        oss << tierName(target) << " blocked by " << check.missing.size() << " requirement(s):";
        for (const RequirementProgress& p : check.missing) {
            oss << " " << p.name << " " << p.available << "/" << p.required;
        }
        check.reason = TierRejection::RequirementsUnmet;
        check.message = oss.str();
        return check;
    }

    check.canAdvance = true;
    check.message = std::string("ready to advance to ") + tierName(target);
    return check;
}
