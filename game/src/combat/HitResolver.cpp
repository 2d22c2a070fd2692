#include "combat/HitResolver.hpp"
#include "combat/ResourceEconomy.hpp"
#include "combat/StatusEffectTracker.hpp"
#include "combat/TargetRegistry.hpp"
#include "core/Logger.hpp"

namespace Crimson::Combat {

HitResolver::HitResolver(TargetRegistry& targets,
                         DamagePipeline& pipeline,
                         StatusEffectTracker& status,
                         ResourceEconomy& economy,
                         IEffectSink& effects,
                         IEventEmitter& events)
    : m_targets(targets)
    , m_pipeline(pipeline)
    , m_status(status)
    , m_economy(economy)
    , m_effects(effects)
    , m_events(events) {
}

HitOutcome HitResolver::Apply(TargetId target, const HitSpec& spec, const glm::vec3& hitPosition) {
    HitOutcome outcome;
    if (!m_targets.IsTargetAlive(target)) {
        return outcome;
    }

    ITargetWorld& world = m_targets.World();
    outcome.isBoss = world.IsBoss(target);
    outcome.damage = m_pipeline.Resolve(spec.request, target);
    outcome.applied = true;

    if (outcome.damage.damage > 0) {
        world.TakeDamage(target, outcome.damage.damage);
    }

    const float stagger = spec.stagger + (outcome.isBoss ? spec.staggerBossBonus : 0.0f);
    if (stagger > 0.0f) {
        m_status.ApplyStagger(target, stagger);
    }
    if (spec.poisonDuration > 0.0f && spec.poisonPerTick > 0) {
        m_status.ApplyPoisonDoT(target, spec.poisonDuration, spec.poisonPerTick);
    }
    if (spec.vulnerabilityDuration > 0.0f) {
        m_status.ApplyVulnerability(target, spec.vulnerabilityDuration, spec.vulnerabilityMultiplier);
    }

    if (spec.grantsUltimate) {
        m_economy.AddUltimate(spec.ultimateTier);
    }
    if (!spec.chargeResource.empty() && spec.chargeGain > 0) {
        m_economy.AddCharge(spec.chargeResource, spec.chargeGain, target);
    }

    DamageResult shown = outcome.damage;
    shown.isCritical = shown.isCritical || spec.showAsCritical;
    EmitDamageNumber(target, hitPosition, shown, spec.isUltimate ? DamageKind::Ultimate : spec.kind);

    EffectPayload payload;
    payload.position = hitPosition;
    payload.target = target;
    payload.damage = outcome.damage.damage;
    payload.charges = spec.charges;
    payload.isCritical = shown.isCritical;
    payload.isBackstab = outcome.damage.isBackstab;
    payload.isBoss = outcome.isBoss;
    payload.isCharged = spec.ultimateTier == HitTier::Charged;
    payload.isUltimate = spec.isUltimate;
    m_effects.OnHit(spec.tag, payload);

    COMBAT_LOG_TRACE("Hit target {} for {} ({}{}{})", target, outcome.damage.damage, spec.tag,
                     outcome.damage.isCritical ? ", crit" : "",
                     outcome.damage.isBackstab ? ", backstab" : "");
    return outcome;
}

void HitResolver::EmitDamageNumber(TargetId target, const glm::vec3& position,
                                   const DamageResult& result, DamageKind kind) {
    nlohmann::json payload;
    payload["position"] = nlohmann::json::array({position.x, position.y, position.z});
    payload["damage"] = result.damage;
    payload["isCritical"] = result.isCritical;
    payload["isBackstab"] = result.isBackstab;
    payload["kind"] = DamageKindToString(kind);
    payload["anchorId"] = AnchorId(target);
    m_events.Emit("damageNumber", payload);
}

std::string HitResolver::AnchorId(TargetId target) {
    return "target-" + std::to_string(target);
}

} // namespace Crimson::Combat
