#pragma once

#include "config/ConfigValidation.hpp"
#include <nlohmann/json.hpp>

namespace Crimson {
class Config;
}

namespace Crimson::Combat {

/**
 * @brief Core-wide tuning shared by every kit ("combat.*" keys)
 */
struct CombatTuning {
    // Ultimate meter
    float ultimateBasicGain = 4.0f;
    float ultimateChargedGain = 10.0f;
    float ultimateMax = 100.0f;

    // Effect pooling
    int poolCapacity = 8;
    int warmupBasic = 6;
    int warmupCharged = 3;

    // Hit geometry
    float bossHitRadius = 2.5f;
    float defaultHitRadius = 0.8f;
    float basicHitPadding = 0.3f;
    float chargedHitPadding = 0.6f;
    float backstabThreshold = -0.25f;

    // Throttle for idle resource decay
    float decayCheckInterval = 1.0f;

    // Targeting preview
    float targetingMinDistance = 3.0f;

    [[nodiscard]] ValidationResult Validate() const;

    /**
     * @brief Read the "combat" section of the global configuration
     */
    [[nodiscard]] static CombatTuning FromConfig(const Config& config);

    [[nodiscard]] nlohmann::json ToJson() const;
};

} // namespace Crimson::Combat
