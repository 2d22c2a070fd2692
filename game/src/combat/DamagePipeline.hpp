#pragma once

#include "combat/CombatInterfaces.hpp"
#include "config/KitConfig.hpp"
#include "core/Random.hpp"

namespace Crimson::Combat {

class ResourceEconomy;
class StatusEffectTracker;

/**
 * @brief Additive bonuses from gear and talents, applied on top of kit stats
 */
struct DamageBonuses {
    float critChance = 0.0f;
    float critMultiplier = 0.0f;
    float backstabMultiplier = 0.0f;
    float lifesteal = 0.0f;         // Fraction of dealt damage healed
};

/**
 * @brief Input of one damage resolution
 */
struct DamageRequest {
    float baseDamage = 0.0f;
    bool applyCombo = false;            // Multiply by the combo multiplier
    bool consumeNextAttack = false;     // Read and reset the next-attack multiplier
    bool applyTimedBuffs = false;
    bool canCrit = true;
    bool canBackstab = true;
};

/**
 * @brief Output of one damage resolution
 */
struct DamageResult {
    int damage = 0;
    bool isCritical = false;
    bool isBackstab = false;
};

/**
 * @brief Turns a base damage into final damage plus crit/backstab flags
 *
 * Order of operations: combo, next-attack multiplier, timed buffs, crit,
 * backstab, vulnerability, then a single floor. Lifesteal healing is a side
 * effect and not part of the returned value.
 */
class DamagePipeline {
public:
    DamagePipeline(ResourceEconomy& economy,
                   StatusEffectTracker& status,
                   ITargetWorld& world,
                   IActorState& actor,
                   IRandomSource& random);

    DamagePipeline(const DamagePipeline&) = delete;
    DamagePipeline& operator=(const DamagePipeline&) = delete;

    /**
     * @brief Resolve final damage against @p target
     */
    DamageResult Resolve(const DamageRequest& request, TargetId target);

    /**
     * @brief 1 + (comboCount - 1) * 0.2, never below 1
     */
    [[nodiscard]] static float ComboMultiplier(int comboCount);

    /**
     * @brief Whether @p attacker stands behind a target facing @p facing
     *
     * Compared on the XZ plane: dot(facing, normalize(attacker - target)) < threshold.
     */
    [[nodiscard]] static bool IsBehind(const glm::vec3& targetPosition,
                                       const glm::vec3& facing,
                                       const glm::vec3& attacker,
                                       float threshold);

    void SetKitStats(const CritTuning& stats) { m_kitStats = stats; }
    [[nodiscard]] const CritTuning& GetKitStats() const { return m_kitStats; }

    void SetBonuses(const DamageBonuses& bonuses) { m_bonuses = bonuses; }
    [[nodiscard]] const DamageBonuses& GetBonuses() const { return m_bonuses; }

    void SetBackstabThreshold(float threshold) { m_backstabThreshold = threshold; }
    [[nodiscard]] float GetBackstabThreshold() const { return m_backstabThreshold; }

private:
    ResourceEconomy& m_economy;
    StatusEffectTracker& m_status;
    ITargetWorld& m_world;
    IActorState& m_actor;
    IRandomSource& m_random;

    CritTuning m_kitStats;
    DamageBonuses m_bonuses;
    float m_backstabThreshold = -0.25f;
};

} // namespace Crimson::Combat
