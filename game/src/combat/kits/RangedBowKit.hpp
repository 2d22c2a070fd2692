#pragma once

#include "combat/KitStrategy.hpp"

namespace Crimson::Combat {

/**
 * @brief Bow Ranger
 *
 * Arrow hits build trust. Judgment Arrow spends it, unlocking pierce,
 * an area burst and a vulnerability mark at rising thresholds.
 */
class RangedBowKit : public KitStrategy {
public:
    static constexpr const char* kZoneBuff = "zone";

    RangedBowKit(KitConfig config, KitContext context);

    [[nodiscard]] bool IsSlotBusy(AbilitySlot slot) const override;

    AbilityOutcome ExecuteAbilityE(const AbilityInvocation& invocation) override;
    AbilityOutcome ExecuteAbilityX(const AbilityInvocation& invocation) override;
    AbilityOutcome ExecuteAbilityC(const AbilityInvocation& invocation) override;
    AbilityOutcome ExecuteAbilityV(const AbilityInvocation& invocation) override;
    AbilityOutcome ExecuteAbilityF(const AbilityInvocation& invocation) override;

    void OnBasicAttack(int comboCount) override;
    void OnChargedRelease(float chargeTime) override;

    void OnBasicHit(TargetId target) override;
    void OnChargedHit(TargetId target) override;

    void Update(float deltaTime) override;

    [[nodiscard]] bool IsZoneActive() const { return m_zone.remaining > 0.0f; }
    [[nodiscard]] float GetZoneMultiplier() const;

private:
    struct DamageZone {
        glm::vec3 center{0.0f};
        float radius = 0.0f;
        float remaining = 0.0f;
    };

    struct MultiShot {
        int arrowsRemaining = 0;
        float timer = 0.0f;
    };

    /**
     * @brief Arrow with the zone multiplier baked in
     *
     * Only weapon shots pass @p spendsNextAttack; ability arrows leave the
     * next-attack multiplier for the following shot.
     */
    [[nodiscard]] EffectSpawnDesc MakeArrow(HitTier tier, const glm::vec3& direction,
                                            float damage, float speed, float lifetime,
                                            bool spendsNextAttack = false);

    void UpdateZone(float deltaTime);
    void UpdateMultiShot(float deltaTime);
    void SpawnMultiShotArrow();

    DamageZone m_zone;
    MultiShot m_multiShot;
};

} // namespace Crimson::Combat
