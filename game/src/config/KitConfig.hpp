#pragma once

#include "config/ConfigValidation.hpp"
#include "combat/CombatTypes.hpp"
#include <nlohmann/json.hpp>
#include <array>
#include <map>
#include <string>

namespace Crimson::Combat {

// ============================================================================
// Kit Identity
// ============================================================================

enum class KitId : uint8_t {
    Blood,          // Blood Mage, the default kit
    Frost,          // Frost Mage
    PoisonMelee,    // Shadow Assassin
    RangedBow       // Bow Ranger
};

const char* KitIdToString(KitId id);
bool KitIdFromString(const std::string& text, KitId& out);

// ============================================================================
// Tuning Blocks
// ============================================================================

/**
 * @brief Melee weapon stats used by the basic attack hit check
 */
struct WeaponTuning {
    float damage = 25.0f;
    float range = 2.75f;
    float staminaCost = 5.0f;
};

/**
 * @brief Attack timing shared by every kit
 */
struct AttackTiming {
    float duration = 0.28f;
    float comboWindow = 0.15f;
    int maxCombo = 3;
    float chargeDuration = 1.0f;        // Hold time to fully charge (and to release)
    float chargedStaminaCost = 10.0f;
    float chargedRecovery = 0.2f;
};

/**
 * @brief Projectile fired by a basic or charged attack
 */
struct ProjectileTuning {
    float damage = 20.0f;
    float speed = 20.0f;
    float radius = 0.25f;
    float lifetime = 1.5f;
    int chargeGain = 1;
};

/**
 * @brief Kit-intrinsic critical and backstab stats
 */
struct CritTuning {
    float critChance = 0.15f;
    float critMultiplier = 1.5f;
    float backstabMultiplier = 1.3f;
};

/**
 * @brief The kit's charge-stack resource
 */
struct ResourceTuning {
    std::string name = "blood";
    int cap = 8;
    float idleDecaySeconds = 8.0f;  // 0 disables decay
    bool perTarget = false;         // Stacks live on each enemy instead of the actor
    bool resetOnCap = false;        // Reaching the cap fires the cap callback and resets
};

/**
 * @brief Gating rules and tuning parameters of one ability slot
 *
 * Gate fields are interpreted by the ability controller. Everything the
 * ability itself does is described by named parameters in @c params.
 */
struct AbilitySlotConfig {
    std::string name;
    bool enabled = false;
    AbilityActivation activation = AbilityActivation::Instant;
    float cooldown = 0.0f;
    int requiredCharges = 0;
    bool consumesCharges = false;
    bool requiresUltimate = false;
    float windup = 0.0f;
    std::map<std::string, float> params;

    /**
     * @brief Named tuning parameter, or fallback if not configured
     */
    [[nodiscard]] float Param(const std::string& key, float fallback = 0.0f) const;
};

// ============================================================================
// Kit Configuration
// ============================================================================

/**
 * @brief Complete, strongly typed tuning data for one kit
 *
 * Defaults() returns the shipped balance values. JSON overrides are
 * layered on top with LoadKitConfig().
 */
struct KitConfig {
    KitId id = KitId::Blood;
    std::string displayName = "Blood Mage";
    WeaponTuning weapon;
    AttackTiming attack;
    ProjectileTuning basic;
    ProjectileTuning charged;
    CritTuning crit;
    ResourceTuning resource;
    std::map<std::string, float> passive;
    std::array<AbilitySlotConfig, kAbilitySlotCount> abilities;

    [[nodiscard]] AbilitySlotConfig& Ability(AbilitySlot slot) {
        return abilities[SlotIndex(slot)];
    }
    [[nodiscard]] const AbilitySlotConfig& Ability(AbilitySlot slot) const {
        return abilities[SlotIndex(slot)];
    }

    [[nodiscard]] float Passive(const std::string& key, float fallback = 0.0f) const;

    /**
     * @brief Check every numeric field for sane ranges
     */
    [[nodiscard]] ValidationResult Validate() const;

    [[nodiscard]] static KitConfig Defaults(KitId id);
};

/**
 * @brief Overlay a JSON kit object onto a configuration
 *
 * Missing fields keep their current value. Fields with the wrong type or an
 * out-of-range value are reported and left untouched.
 */
ValidationResult LoadKitConfig(const nlohmann::json& kitJson, KitConfig& config);

/**
 * @brief Defaults for @p id with the "kits.<id>" object of @p root applied
 */
KitConfig BuildKitConfig(KitId id, const nlohmann::json& root, ValidationResult& result);

/**
 * @brief Serialize a configuration to the same JSON shape LoadKitConfig reads
 */
nlohmann::json KitConfigToJson(const KitConfig& config);

} // namespace Crimson::Combat
