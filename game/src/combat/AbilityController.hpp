#pragma once

#include "combat/KitStrategy.hpp"
#include <array>
#include <memory>

namespace Crimson::Combat {

/**
 * @brief Per-actor combat state machine
 *
 * Interprets one frame of intent at a time: ability slot gating (cooldown,
 * charges, ultimate, channel conflicts), targeting and windup phases,
 * channels (life drain, whip lock, dash), the basic attack swing with its
 * combo counter and the charged attack. Ability effects are delegated to
 * the bound kit.
 *
 * Rejections are silent: the input layer decides how to give feedback.
 */
class AbilityController : public IAbilityHost {
public:
    static constexpr float kHitWindowStart = 0.35f;
    static constexpr float kHitWindowEnd = 0.65f;
    static constexpr float kMeleeMinDot = 0.22f;

    AbilityController(TargetRegistry& targets,
                      ResourceEconomy& economy,
                      StatusEffectTracker& status,
                      DamagePipeline& pipeline,
                      HitResolver& hits,
                      ProjectileManager& projectiles,
                      IActorState& actor,
                      IEffectSink& effects,
                      IRandomSource& random,
                      float targetingMinDistance = 3.0f);
    ~AbilityController() override;

    AbilityController(const AbilityController&) = delete;
    AbilityController& operator=(const AbilityController&) = delete;

    /**
     * @brief Replace the active kit; resets cooldowns and channels
     */
    void BindKit(const KitConfig& config);
    void UnbindKit();

    /**
     * @brief Advance every timer and interpret this frame's intent
     */
    void Update(float deltaTime, const CombatIntent& intent);

    /**
     * @brief Drop the current channel (e.g. the actor was stunned)
     */
    void CancelChannel();

    /**
     * @brief A target left the registry
     */
    void OnTargetRemoved(TargetId target);

    // =========================================================================
    // IAbilityHost
    // =========================================================================

    [[nodiscard]] ChannelState GetChannel() const override { return m_channel; }
    bool EnterWhip(float duration) override;
    bool StartDash(const glm::vec3& direction, float speed, float duration) override;
    bool BeginLifeDrain() override;
    bool PerformMeleeStrike(HitTier tier) override;
    void MarkSwingHit() override { m_swingHit = true; }

    // =========================================================================
    // State Queries
    // =========================================================================

    [[nodiscard]] KitStrategy* GetKit() { return m_kit.get(); }
    [[nodiscard]] const KitStrategy* GetKit() const { return m_kit.get(); }

    [[nodiscard]] float GetCooldown(AbilitySlot slot) const { return m_cooldowns[SlotIndex(slot)]; }
    void ResetCooldowns();

    [[nodiscard]] float GetChargeTimer() const { return m_chargeTimer; }
    [[nodiscard]] float GetComboTimer() const { return m_comboTimer; }
    [[nodiscard]] bool IsSwingHitDone() const { return m_swingHit; }

    [[nodiscard]] bool IsTargeting() const { return m_targeting.active; }
    [[nodiscard]] AbilitySlot GetTargetingSlot() const { return m_targeting.slot; }
    [[nodiscard]] const glm::vec3& GetTargetingPoint() const { return m_targeting.point; }

    [[nodiscard]] bool IsWindupPending() const { return m_windup.active; }
    [[nodiscard]] TargetId GetLifeDrainTarget() const { return m_drain.target; }
    [[nodiscard]] int GetLifeDrainTicks() const { return m_drain.ticks; }

private:
    struct TargetingState {
        bool active = false;
        AbilitySlot slot = AbilitySlot::Q;
        glm::vec3 point{0.0f};
    };

    struct WindupState {
        bool active = false;
        float remaining = 0.0f;
        AbilityInvocation invocation;
    };

    struct LifeDrainState {
        AbilitySlot slot = AbilitySlot::V;
        TargetId target = kInvalidTarget;
        float elapsed = 0.0f;
        float tickTimer = 0.0f;
        int ticks = 0;
        int secondsGranted = 0;
    };

    struct DashState {
        glm::vec3 direction{0.0f};
        float speed = 0.0f;
        float duration = 0.0f;
        float remaining = 0.0f;
    };

    // Channels
    void EnterChannel(ChannelState state);
    void ExitChannel();
    void NotifyChannel(const char* tag, ChannelState state);

    // Per-frame phases
    void UpdateCooldowns(float deltaTime);
    void UpdateWindup(float deltaTime);
    void UpdateTargeting(const CombatIntent& intent, std::array<bool, kAbilitySlotCount>& pressed,
                         bool& attackAvailable);
    void UpdateChannels(float deltaTime, std::array<bool, kAbilitySlotCount>& pressed);
    void UpdateLifeDrain(float deltaTime, std::array<bool, kAbilitySlotCount>& pressed);
    void UpdateDash(float deltaTime);
    void UpdateAttacks(float deltaTime, const CombatIntent& intent, bool attackAvailable);
    void UpdateCombo(float deltaTime);

    // Abilities
    bool CanActivate(AbilitySlot slot) const;
    void TryActivate(AbilitySlot slot, const CombatIntent& intent, bool confirmTargeting);
    void ResolveCast(const AbilityInvocation& invocation);
    void FinishCast(const AbilityInvocation& invocation, AbilityOutcome outcome);
    void EndLifeDrain(bool cancelled);
    [[nodiscard]] glm::vec3 ClampTargetPoint(const CombatIntent& intent) const;

    // Attacks
    void StartAttack();
    void ReleaseChargedAttack();

    TargetRegistry& m_targets;
    ResourceEconomy& m_economy;
    StatusEffectTracker& m_status;
    DamagePipeline& m_pipeline;
    HitResolver& m_hits;
    ProjectileManager& m_projectiles;
    IActorState& m_actor;
    IEffectSink& m_effects;
    IRandomSource& m_random;
    float m_targetingMinDistance;

    std::unique_ptr<KitStrategy> m_kit;
    std::array<float, kAbilitySlotCount> m_cooldowns{};
    AbilitySlot m_castingSlot = AbilitySlot::V;

    ChannelState m_channel = ChannelState::None;
    TargetingState m_targeting;
    WindupState m_windup;
    LifeDrainState m_drain;
    DashState m_dash;
    float m_whipRemaining = 0.0f;

    // Attack state
    float m_clock = 0.0f;
    float m_lastAttackTime = -1000.0f;
    float m_attackElapsed = 0.0f;
    float m_comboTimer = 0.0f;
    bool m_swingHit = false;
    float m_chargeTimer = 0.0f;
    float m_chargedRecovery = 0.0f;
};

} // namespace Crimson::Combat
