#pragma once

#include "combat/KitStrategy.hpp"
#include <vector>

namespace Crimson::Combat {

/**
 * @brief Frost Mage
 *
 * Frost stacks live on each enemy. Reaching the cap freezes the enemy and
 * clears its stacks; Frost Beam consumes them for damage and freeze time.
 */
class FrostKit : public KitStrategy {
public:
    FrostKit(KitConfig config, KitContext context);

    void OnBind() override;
    void OnUnbind() override;

    [[nodiscard]] bool IsSlotBusy(AbilitySlot slot) const override;

    AbilityOutcome ExecuteAbilityQ(const AbilityInvocation& invocation) override;
    AbilityOutcome ExecuteAbilityE(const AbilityInvocation& invocation) override;
    AbilityOutcome ExecuteAbilityX(const AbilityInvocation& invocation) override;
    AbilityOutcome ExecuteAbilityF(const AbilityInvocation& invocation) override;

    void Update(float deltaTime) override;

    [[nodiscard]] int GetPendingStalactiteCount() const { return static_cast<int>(m_stalactites.size()); }
    [[nodiscard]] bool IsBlizzardActive() const { return m_blizzard.remaining > 0.0f; }

private:
    struct Stalactite {
        glm::vec3 center{0.0f};
        float fallRemaining = 0.0f;
        float lingerRemaining = 0.0f;
        bool landed = false;
    };

    struct Blizzard {
        glm::vec3 center{0.0f};
        float remaining = 0.0f;
        float tickTimer = 0.0f;
    };

    void OnStacksCapped(TargetId target);
    void UpdateFrozenOrb(float deltaTime);
    void EmitShard(const glm::vec3& origin);
    void UpdateStalactites(float deltaTime);
    void UpdateBlizzard(float deltaTime);

    void StrikeBlizzard();

    EffectHandle m_frozenOrb = kInvalidEffect;
    float m_beamRemaining = 0.0f;
    float m_shardTimer = 0.0f;
    std::vector<Stalactite> m_stalactites;
    Blizzard m_blizzard;
};

} // namespace Crimson::Combat
