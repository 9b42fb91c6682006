#pragma once

#include <array>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "resource.h"
#include "structure.h"

enum class TierRejection {
    None = 0,
    Backwards,
    SkipTier,
    MalformedResources,
    RequirementsUnmet
};

const char* tierRejectionName(TierRejection reason);

struct TierRequirements {
    Tier tier = Tier::SURVIVAL;
    std::map<BuildingType, int> structures; // COMPLETE count required per type
    ResourceMap resources;                  // per resource key, spent when the advance happens
};

struct RequirementProgress {
    std::string name; // building type or resource key
    bool structure = false;
    double available = 0.0;
    double required = 0.0;
    bool met = false;
};

struct TierCheck {
    bool canAdvance = false;
    Tier current = Tier::SURVIVAL;
    Tier target = Tier::SURVIVAL;
    TierRejection reason = TierRejection::None;
    std::string message;
    std::vector<RequirementProgress> missing;  // every unmet requirement
    std::vector<RequirementProgress> progress; // every requirement, met or not
    ResourceMap spent;                         // filled by Settlement::requestAdvancement
};

class TierGate {
public:
    TierGate();

    // Never throws; a blocked advance is an ordinary result.
    TierCheck canAdvance(Tier target,
                         const StructureMap& structures,
                         const ResourceMap& resources,
                         Tier current) const;

    static std::optional<Tier> nextTier(Tier current);
    std::optional<TierRequirements> requirementsFor(Tier tier) const;
    static const std::vector<std::string>& recognizedResourceKeys();

private:
    std::array<std::optional<TierRequirements>, kTierCount> m_requirements;
};
