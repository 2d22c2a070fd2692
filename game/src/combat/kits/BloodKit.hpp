#pragma once

#include "combat/KitStrategy.hpp"

namespace Crimson::Combat {

/**
 * @brief Blood Mage, the default kit
 *
 * Fire bolts build blood charges on the actor. Blood Crescend spends them
 * on a piercing wave, Crimson Orb grows in strength while it travels.
 */
class BloodKit : public KitStrategy {
public:
    BloodKit(KitConfig config, KitContext context);

    [[nodiscard]] bool IsSlotBusy(AbilitySlot slot) const override;

    AbilityOutcome ExecuteAbilityQ(const AbilityInvocation& invocation) override;
    AbilityOutcome ExecuteAbilityE(const AbilityInvocation& invocation) override;
    AbilityOutcome ExecuteAbilityX(const AbilityInvocation& invocation) override;
    AbilityOutcome ExecuteAbilityF(const AbilityInvocation& invocation) override;

    void Update(float deltaTime) override;

private:
    /**
     * @brief Damage scale of the orb after @p age seconds of growth
     */
    [[nodiscard]] float OrbDamageScale(float age) const;

    EffectHandle m_orb = kInvalidEffect;
    float m_orbAge = 0.0f;
};

} // namespace Crimson::Combat
