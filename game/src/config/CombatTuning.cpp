#include "config/CombatTuning.hpp"
#include "config/Config.hpp"

namespace Crimson::Combat {

ValidationResult CombatTuning::Validate() const {
    ValidationResult result;

    if (ultimateBasicGain < 0.0f) {
        result.AddError("combat.ultimate.basicGain", "Gain cannot be negative");
    }
    if (ultimateChargedGain < ultimateBasicGain) {
        result.AddWarning("combat.ultimate.chargedGain", "Charged hits gain less than basic hits");
    }
    if (ultimateMax <= 0.0f) {
        result.AddError("combat.ultimate.max", "Ultimate maximum must be positive");
    }
    if (poolCapacity < 0) {
        result.AddError("combat.pool.capacity", "Capacity cannot be negative");
    }
    if (warmupBasic > poolCapacity || warmupCharged > poolCapacity) {
        result.AddWarning("combat.pool", "Warmup count exceeds pool capacity and will be clamped");
    }
    if (bossHitRadius <= 0.0f || defaultHitRadius <= 0.0f) {
        result.AddError("combat.hit", "Default hit radii must be positive");
    }
    if (basicHitPadding < 0.0f || chargedHitPadding < 0.0f) {
        result.AddError("combat.hit", "Hit padding cannot be negative");
    }
    if (backstabThreshold < -1.0f || backstabThreshold > 1.0f) {
        result.AddError("combat.hit.backstabThreshold", "Threshold must be within [-1, 1]");
    }
    if (decayCheckInterval <= 0.0f) {
        result.AddError("combat.economy.decayCheckInterval", "Interval must be positive");
    }
    if (targetingMinDistance < 0.0f) {
        result.AddError("combat.targeting.minDistance", "Distance cannot be negative");
    }

    return result;
}

CombatTuning CombatTuning::FromConfig(const Config& config) {
    CombatTuning tuning;
    tuning.ultimateBasicGain = config.Get<float>("combat.ultimate.basicGain", tuning.ultimateBasicGain);
    tuning.ultimateChargedGain = config.Get<float>("combat.ultimate.chargedGain", tuning.ultimateChargedGain);
    tuning.ultimateMax = config.Get<float>("combat.ultimate.max", tuning.ultimateMax);

    tuning.poolCapacity = config.Get<int>("combat.pool.capacity", tuning.poolCapacity);
    tuning.warmupBasic = config.Get<int>("combat.pool.warmupBasic", tuning.warmupBasic);
    tuning.warmupCharged = config.Get<int>("combat.pool.warmupCharged", tuning.warmupCharged);

    tuning.bossHitRadius = config.Get<float>("combat.hit.bossRadius", tuning.bossHitRadius);
    tuning.defaultHitRadius = config.Get<float>("combat.hit.defaultRadius", tuning.defaultHitRadius);
    tuning.basicHitPadding = config.Get<float>("combat.hit.basicPadding", tuning.basicHitPadding);
    tuning.chargedHitPadding = config.Get<float>("combat.hit.chargedPadding", tuning.chargedHitPadding);
    tuning.backstabThreshold = config.Get<float>("combat.hit.backstabThreshold", tuning.backstabThreshold);

    tuning.decayCheckInterval = config.Get<float>("combat.economy.decayCheckInterval", tuning.decayCheckInterval);
    tuning.targetingMinDistance = config.Get<float>("combat.targeting.minDistance", tuning.targetingMinDistance);
    return tuning;
}

nlohmann::json CombatTuning::ToJson() const {
    nlohmann::json j;
    j["ultimate"]["basicGain"] = ultimateBasicGain;
    j["ultimate"]["chargedGain"] = ultimateChargedGain;
    j["ultimate"]["max"] = ultimateMax;
    j["pool"]["capacity"] = poolCapacity;
    j["pool"]["warmupBasic"] = warmupBasic;
    j["pool"]["warmupCharged"] = warmupCharged;
    j["hit"]["bossRadius"] = bossHitRadius;
    j["hit"]["defaultRadius"] = defaultHitRadius;
    j["hit"]["basicPadding"] = basicHitPadding;
    j["hit"]["chargedPadding"] = chargedHitPadding;
    j["hit"]["backstabThreshold"] = backstabThreshold;
    j["economy"]["decayCheckInterval"] = decayCheckInterval;
    j["targeting"]["minDistance"] = targetingMinDistance;
    return j;
}

} // namespace Crimson::Combat
