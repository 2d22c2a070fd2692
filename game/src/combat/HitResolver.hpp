#pragma once

#include "combat/DamagePipeline.hpp"
#include <string>

namespace Crimson::Combat {

class TargetRegistry;
class ResourceEconomy;
class StatusEffectTracker;

/**
 * @brief Everything that happens to one target when something lands on it
 */
struct HitSpec {
    DamageRequest request;
    DamageKind kind = DamageKind::Normal;
    std::string tag;                    // VFX tag passed to the effect sink

    float stagger = 0.0f;
    float staggerBossBonus = 0.0f;      // Added to stagger against bosses

    bool grantsUltimate = true;
    HitTier ultimateTier = HitTier::Basic;

    std::string chargeResource;         // Empty = no charge gain
    int chargeGain = 0;

    float poisonDuration = 0.0f;
    int poisonPerTick = 0;

    float vulnerabilityDuration = 0.0f;
    float vulnerabilityMultiplier = 1.0f;

    bool isUltimate = false;
    bool showAsCritical = false;        // Presentation only
    int charges = 0;                    // Charges spent on the cast, for VFX
};

/**
 * @brief Outcome of applying a HitSpec to one target
 */
struct HitOutcome {
    bool applied = false;
    bool isBoss = false;
    DamageResult damage;
};

/**
 * @brief Applies resolved hits to targets
 *
 * Runs the damage pipeline, deals damage, applies status effects, grants
 * ultimate and kit charges, emits the damage number and notifies the VFX
 * collaborator. Shared by melee, projectile, area and channel hits.
 */
class HitResolver {
public:
    HitResolver(TargetRegistry& targets,
                DamagePipeline& pipeline,
                StatusEffectTracker& status,
                ResourceEconomy& economy,
                IEffectSink& effects,
                IEventEmitter& events);

    HitResolver(const HitResolver&) = delete;
    HitResolver& operator=(const HitResolver&) = delete;

    /**
     * @brief Apply @p spec to @p target at @p hitPosition
     * @return applied == false if the target is gone or dead
     */
    HitOutcome Apply(TargetId target, const HitSpec& spec, const glm::vec3& hitPosition);

    /**
     * @brief Emit a "damageNumber" event
     */
    void EmitDamageNumber(TargetId target, const glm::vec3& position,
                          const DamageResult& result, DamageKind kind);

    [[nodiscard]] static std::string AnchorId(TargetId target);

private:
    TargetRegistry& m_targets;
    DamagePipeline& m_pipeline;
    StatusEffectTracker& m_status;
    ResourceEconomy& m_economy;
    IEffectSink& m_effects;
    IEventEmitter& m_events;
};

} // namespace Crimson::Combat
