#pragma once

#include "combat/CombatInterfaces.hpp"
#include "combat/HitResolver.hpp"
#include "combat/Projectile.hpp"
#include "config/KitConfig.hpp"
#include "core/Random.hpp"
#include <functional>
#include <string>

namespace Crimson::Combat {

class TargetRegistry;
class ResourceEconomy;
class StatusEffectTracker;
class DamagePipeline;
class ProjectileManager;

// ============================================================================
// Ability Host
// ============================================================================

/**
 * @brief Actor-level channel services the ability controller offers to kits
 */
class IAbilityHost {
public:
    virtual ~IAbilityHost() = default;

    [[nodiscard]] virtual ChannelState GetChannel() const = 0;

    /**
     * @brief Lock the actor in the finisher pose for @p duration seconds
     */
    virtual bool EnterWhip(float duration) = 0;

    /**
     * @brief Move the actor along @p direction, easing out over @p duration
     */
    virtual bool StartDash(const glm::vec3& direction, float speed, float duration) = 0;

    /**
     * @brief Start the life drain channel on the nearest target in front
     * @return false if no target qualifies
     */
    virtual bool BeginLifeDrain() = 0;

    /**
     * @brief Run the weapon hit check immediately
     * @return true if a target was hit
     */
    virtual bool PerformMeleeStrike(HitTier tier) = 0;

    /**
     * @brief Count a kit effect's hit as the current swing's single hit
     */
    virtual void MarkSwingHit() = 0;
};

// ============================================================================
// Kit Context
// ============================================================================

/**
 * @brief Shared combat primitives handed to every kit
 */
struct KitContext {
    TargetRegistry& targets;
    ResourceEconomy& economy;
    StatusEffectTracker& status;
    DamagePipeline& pipeline;
    HitResolver& hits;
    ProjectileManager& projectiles;
    IActorState& actor;
    IEffectSink& effects;
    IRandomSource& random;
    IAbilityHost& host;
};

/**
 * @brief Arguments of one ability execution
 */
struct AbilityInvocation {
    AbilitySlot slot = AbilitySlot::Q;
    int chargesUsed = 0;            // Charges consumed by the controller for this cast
    float multiplier = 1.0f;        // Slot "multiplier" parameter
    bool hasTargetPoint = false;    // Set for targeted abilities
    glm::vec3 targetPoint{0.0f};
};

// ============================================================================
// Kit Strategy
// ============================================================================

/**
 * @brief A combat loadout: resource, attacks and six ability slots
 *
 * The ability controller gates every slot (cooldown, charges, ultimate,
 * channel conflicts) and then calls Execute(), which dispatches to the
 * per-slot entry point. Kits only describe effects; hit detection and damage
 * math stay in the shared primitives.
 *
 * Slot V defaults to the life drain channel and C to a timed actor shield,
 * which the base (blood) and frost kits share.
 */
class KitStrategy {
public:
    KitStrategy(KitConfig config, KitContext context);
    virtual ~KitStrategy() = default;

    KitStrategy(const KitStrategy&) = delete;
    KitStrategy& operator=(const KitStrategy&) = delete;

    /**
     * @brief Register the kit resource and its callbacks
     */
    virtual void OnBind();

    /**
     * @brief Undo OnBind side effects
     */
    virtual void OnUnbind();

    // Identity
    [[nodiscard]] KitId GetId() const { return m_config.id; }
    [[nodiscard]] const std::string& GetName() const { return m_config.displayName; }
    [[nodiscard]] const std::string& GetChargeResource() const { return m_config.resource.name; }
    [[nodiscard]] bool IsResourcePerTarget() const { return m_config.resource.perTarget; }
    [[nodiscard]] const KitConfig& GetConfig() const { return m_config; }
    [[nodiscard]] const AbilitySlotConfig& GetSlotRules(AbilitySlot slot) const {
        return m_config.Ability(slot);
    }

    /**
     * @brief Dispatch to the slot entry point
     */
    AbilityOutcome Execute(const AbilityInvocation& invocation);

    /**
     * @brief A slot whose previous cast is still running refuses new casts
     */
    [[nodiscard]] virtual bool IsSlotBusy(AbilitySlot slot) const;

    // Ability entry points
    virtual AbilityOutcome ExecuteAbilityQ(const AbilityInvocation& invocation);
    virtual AbilityOutcome ExecuteAbilityE(const AbilityInvocation& invocation);
    virtual AbilityOutcome ExecuteAbilityX(const AbilityInvocation& invocation);
    virtual AbilityOutcome ExecuteAbilityC(const AbilityInvocation& invocation);
    virtual AbilityOutcome ExecuteAbilityV(const AbilityInvocation& invocation);
    virtual AbilityOutcome ExecuteAbilityF(const AbilityInvocation& invocation);

    // Attacks
    /**
     * @brief A basic attack swing started
     */
    virtual void OnBasicAttack(int comboCount);

    /**
     * @brief A fully charged attack was released
     */
    virtual void OnChargedRelease(float chargeTime);

    /**
     * @brief Base damage of the weapon hit check
     */
    [[nodiscard]] virtual float GetMeleeDamage(HitTier tier) const;

    /**
     * @brief The weapon hit check connected
     */
    virtual void OnBasicHit(TargetId target);
    virtual void OnChargedHit(TargetId target);

    virtual void Update(float deltaTime);
    virtual void OnTargetRemoved(TargetId target);

protected:
    // Spawning helpers
    /**
     * @brief Projectile spec for a basic or charged cast from the weapon
     */
    [[nodiscard]] EffectSpawnDesc MakeAttackProjectile(HitTier tier, EffectKind kind,
                                                       const glm::vec3& direction) const;

    /**
     * @brief Base hit spec for an ability hit
     */
    [[nodiscard]] HitSpec MakeAbilityHit(float damage, const std::string& tag) const;

    /**
     * @brief Apply @p spec to every living target within @p radius of @p center
     * @return Number of targets hit
     */
    int StrikeArea(const glm::vec3& center, float radius, const HitSpec& spec, bool addHitRadius);

    /**
     * @brief Apply @p spec to every target within @p halfWidth of a planar segment
     */
    int StrikeLine(const glm::vec3& start, const glm::vec3& end, float halfWidth,
                   const HitSpec& spec, const std::function<void(TargetId, HitSpec&)>& prepare);

    void NotifyFired(const std::string& tag, const glm::vec3& position,
                     const glm::vec3& direction, int charges = 0, float radius = 0.0f);

    [[nodiscard]] glm::vec3 ActorForward() const;
    [[nodiscard]] glm::vec3 AimDirection(const AbilityInvocation& invocation) const;

    /**
     * @brief Timed actor shield shared by several kits
     */
    AbilityOutcome CastShield(AbilitySlot slot, ActorBuffKind kind, const std::string& tag);

    [[nodiscard]] float SlotParam(AbilitySlot slot, const std::string& key, float fallback = 0.0f) const {
        return m_config.Ability(slot).Param(key, fallback);
    }

    KitConfig m_config;
    KitContext m_ctx;

    float m_shieldRemaining = 0.0f;
};

} // namespace Crimson::Combat
