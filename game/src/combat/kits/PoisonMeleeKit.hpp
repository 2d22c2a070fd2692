#pragma once

#include "combat/KitStrategy.hpp"

namespace Crimson::Combat {

/**
 * @brief Shadow Assassin
 *
 * Close-range blade waves build poison charges. Poison Pierce converts
 * them into a poison DoT, Toxic Focus into a timed damage buff.
 */
class PoisonMeleeKit : public KitStrategy {
public:
    static constexpr const char* kShadowStepBuff = "shadowStep";
    static constexpr const char* kToxicFocusBuff = "toxicFocus";

    PoisonMeleeKit(KitConfig config, KitContext context);

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

private:
    /**
     * @brief Blade wave carrying the basic attack damage
     */
    [[nodiscard]] EffectSpawnDesc MakeBladeWave(HitTier tier, const glm::vec3& direction);

    EffectHandle m_pierce = kInvalidEffect;
    EffectHandle m_daggers = kInvalidEffect;
};

} // namespace Crimson::Combat
