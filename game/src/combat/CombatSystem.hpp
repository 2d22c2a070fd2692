#pragma once

#include "combat/AbilityController.hpp"
#include "combat/DamagePipeline.hpp"
#include "combat/HitResolver.hpp"
#include "combat/ProjectileManager.hpp"
#include "combat/ResourceEconomy.hpp"
#include "combat/StatusEffectTracker.hpp"
#include "combat/TargetRegistry.hpp"
#include "config/CombatTuning.hpp"
#include "config/KitConfig.hpp"

namespace Crimson::Combat {

// ============================================================================
// Combat System
// ============================================================================

/**
 * @brief Combat core of one controlled actor
 *
 * Owns every combat primitive and wires them to the host collaborators.
 * The host feeds one CombatIntent per frame; everything else (damage
 * numbers, VFX hooks, stamina and health changes) flows back out through
 * the injected interfaces.
 */
class CombatSystem {
public:
    CombatSystem(ITargetWorld& world,
                 IActorState& actor,
                 IEffectSink& effects,
                 IEventEmitter& events,
                 IRandomSource& random,
                 const CombatTuning& tuning = {});
    ~CombatSystem();

    CombatSystem(const CombatSystem&) = delete;
    CombatSystem& operator=(const CombatSystem&) = delete;

    /**
     * @brief Bind a kit built from the "kits.<id>" section of the global config
     */
    bool Initialize(KitId kit);

    /**
     * @brief Bind an explicit kit configuration
     *
     * A configuration that fails validation is replaced by the kit's
     * defaults; the errors are logged.
     */
    bool Initialize(const KitConfig& kit);

    /**
     * @brief Unbind the kit and drop every effect and status record
     */
    void Shutdown();

    /**
     * @brief Advance one frame
     *
     * Order: abilities (and kit), projectiles, status effects, economy.
     */
    void Update(float deltaTime, const CombatIntent& intent);

    /**
     * @brief Swap the active kit, keeping the ultimate meter
     */
    bool SwitchKit(const KitConfig& kit);

    // -------------------------------------------------------------------------
    // Targets
    // -------------------------------------------------------------------------

    bool AddTarget(TargetId target);

    /**
     * @brief Unregister a target and purge its per-target state
     */
    bool RemoveTarget(TargetId target);

    // -------------------------------------------------------------------------
    // External Triggers
    // -------------------------------------------------------------------------

    void GrantNextAttackMultiplier(float multiplier) { m_economy.GrantNextAttackMultiplier(multiplier); }
    void SetBonuses(const DamageBonuses& bonuses) { m_pipeline.SetBonuses(bonuses); }
    void SetUltimateTestMode(bool enabled) { m_economy.SetUltimateTestMode(enabled); }

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    [[nodiscard]] bool IsInitialized() const { return m_initialized; }
    [[nodiscard]] const CombatTuning& GetTuning() const { return m_tuning; }

    [[nodiscard]] AbilityController& GetController() { return m_controller; }
    [[nodiscard]] const AbilityController& GetController() const { return m_controller; }
    [[nodiscard]] KitStrategy* GetKit() { return m_controller.GetKit(); }

    [[nodiscard]] ResourceEconomy& GetEconomy() { return m_economy; }
    [[nodiscard]] StatusEffectTracker& GetStatus() { return m_status; }
    [[nodiscard]] TargetRegistry& GetTargets() { return m_targets; }
    [[nodiscard]] DamagePipeline& GetPipeline() { return m_pipeline; }
    [[nodiscard]] ProjectileManager& GetProjectiles() { return m_projectiles; }

private:
    void OnTargetRemoved(TargetId target);
    void OnPoisonTick(TargetId target, int damage);
    void WarmupPools();

    static ProjectileManagerConfig MakeProjectileConfig(const CombatTuning& tuning);
    static UltimateConfig MakeUltimateConfig(const CombatTuning& tuning);

    ITargetWorld& m_world;
    IActorState& m_actor;
    IEffectSink& m_effects;
    IEventEmitter& m_events;
    IRandomSource& m_random;
    CombatTuning m_tuning;

    // Construction order matters: later members hold references to earlier ones
    TargetRegistry m_targets;
    ResourceEconomy m_economy;
    StatusEffectTracker m_status;
    DamagePipeline m_pipeline;
    HitResolver m_hits;
    ProjectileManager m_projectiles;
    AbilityController m_controller;

    bool m_initialized = false;
};

} // namespace Crimson::Combat
