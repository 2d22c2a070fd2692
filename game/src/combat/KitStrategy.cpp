#include "combat/KitStrategy.hpp"
#include "combat/DamagePipeline.hpp"
#include "combat/ProjectileManager.hpp"
#include "combat/ResourceEconomy.hpp"
#include "combat/TargetRegistry.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <utility>

namespace Crimson::Combat {

KitStrategy::KitStrategy(KitConfig config, KitContext context)
    : m_config(std::move(config))
    , m_ctx(context) {
}

void KitStrategy::OnBind() {
    ChargePoolConfig pool;
    pool.cap = m_config.resource.cap;
    pool.idleDecaySeconds = m_config.resource.idleDecaySeconds;
    pool.perTarget = m_config.resource.perTarget;
    pool.resetOnCap = m_config.resource.resetOnCap;
    m_ctx.economy.RegisterCharge(m_config.resource.name, pool);
    m_ctx.pipeline.SetKitStats(m_config.crit);

    COMBAT_LOG_INFO("Kit '{}' bound (resource '{}', cap {})",
                    m_config.displayName, m_config.resource.name, m_config.resource.cap);
}

void KitStrategy::OnUnbind() {
    COMBAT_LOG_INFO("Kit '{}' unbound", m_config.displayName);
}

// ============================================================================
// Ability Dispatch
// ============================================================================

AbilityOutcome KitStrategy::Execute(const AbilityInvocation& invocation) {
    switch (invocation.slot) {
        case AbilitySlot::Q: return ExecuteAbilityQ(invocation);
        case AbilitySlot::E: return ExecuteAbilityE(invocation);
        case AbilitySlot::X: return ExecuteAbilityX(invocation);
        case AbilitySlot::C: return ExecuteAbilityC(invocation);
        case AbilitySlot::V: return ExecuteAbilityV(invocation);
        case AbilitySlot::F: return ExecuteAbilityF(invocation);
        default:             break;
    }
    return AbilityOutcome::Rejected;
}

bool KitStrategy::IsSlotBusy(AbilitySlot slot) const {
    return slot == AbilitySlot::C && m_shieldRemaining > 0.0f;
}

AbilityOutcome KitStrategy::ExecuteAbilityQ(const AbilityInvocation&) {
    return AbilityOutcome::Rejected;
}

AbilityOutcome KitStrategy::ExecuteAbilityE(const AbilityInvocation&) {
    return AbilityOutcome::Rejected;
}

AbilityOutcome KitStrategy::ExecuteAbilityX(const AbilityInvocation&) {
    return AbilityOutcome::Rejected;
}

AbilityOutcome KitStrategy::ExecuteAbilityC(const AbilityInvocation&) {
    return CastShield(AbilitySlot::C, ActorBuffKind::Shield, "shield");
}

AbilityOutcome KitStrategy::ExecuteAbilityV(const AbilityInvocation&) {
    return m_ctx.host.BeginLifeDrain() ? AbilityOutcome::Committed : AbilityOutcome::Rejected;
}

AbilityOutcome KitStrategy::ExecuteAbilityF(const AbilityInvocation&) {
    return AbilityOutcome::Rejected;
}

// ============================================================================
// Attacks
// ============================================================================

void KitStrategy::OnBasicAttack(int) {
    m_ctx.projectiles.Spawn(MakeAttackProjectile(HitTier::Basic, EffectKind::Bolt, ActorForward()));
}

void KitStrategy::OnChargedRelease(float) {
    const EffectSpawnDesc desc = MakeAttackProjectile(HitTier::Charged, EffectKind::Bolt, ActorForward());
    m_ctx.projectiles.Spawn(desc);
    NotifyFired(desc.tag, desc.origin, desc.direction);
}

float KitStrategy::GetMeleeDamage(HitTier tier) const {
    return tier == HitTier::Charged ? m_config.charged.damage : m_config.weapon.damage;
}

void KitStrategy::OnBasicHit(TargetId) {
}

void KitStrategy::OnChargedHit(TargetId) {
}

void KitStrategy::Update(float deltaTime) {
    m_shieldRemaining = std::max(0.0f, m_shieldRemaining - deltaTime);
}

void KitStrategy::OnTargetRemoved(TargetId) {
}

// ============================================================================
// Helpers
// ============================================================================

EffectSpawnDesc KitStrategy::MakeAttackProjectile(HitTier tier, EffectKind kind,
                                                  const glm::vec3& direction) const {
    const ProjectileTuning& tuning = tier == HitTier::Charged ? m_config.charged : m_config.basic;

    EffectSpawnDesc desc;
    desc.kind = kind;
    desc.tier = tier;
    desc.tag = std::string(tier == HitTier::Charged ? "charged_" : "basic_") + EffectKindToString(kind);
    desc.origin = m_ctx.actor.GetWeaponPosition();
    desc.direction = direction;
    desc.speed = tuning.speed;
    desc.maxLifetime = tuning.lifetime;

    desc.hit.request.baseDamage = tuning.damage;
    desc.hit.request.applyTimedBuffs = true;
    desc.hit.kind = tier == HitTier::Charged ? DamageKind::Heavy : DamageKind::Normal;
    desc.hit.tag = desc.tag;
    desc.hit.ultimateTier = tier;
    desc.hit.chargeResource = m_config.resource.name;
    desc.hit.chargeGain = tuning.chargeGain;
    return desc;
}

HitSpec KitStrategy::MakeAbilityHit(float damage, const std::string& tag) const {
    HitSpec spec;
    spec.request.baseDamage = damage;
    spec.request.applyTimedBuffs = true;
    spec.kind = DamageKind::Ability;
    spec.tag = tag;
    spec.grantsUltimate = false;
    return spec;
}

int KitStrategy::StrikeArea(const glm::vec3& center, float radius, const HitSpec& spec, bool addHitRadius) {
    ITargetWorld& world = m_ctx.targets.World();
    int hits = 0;
    m_ctx.targets.ForEachLiving([&](TargetId target) {
        const glm::vec3 position = world.GetWorldPosition(target);
        const float reach = radius + (addHitRadius ? m_ctx.targets.HitRadiusOf(target) : 0.0f);
        if (PlanarDistance(position, center) > reach) {
            return true;
        }
        if (m_ctx.hits.Apply(target, spec, position).applied) {
            ++hits;
        }
        return true;
    });
    return hits;
}

int KitStrategy::StrikeLine(const glm::vec3& start, const glm::vec3& end, float halfWidth,
                            const HitSpec& spec,
                            const std::function<void(TargetId, HitSpec&)>& prepare) {
    ITargetWorld& world = m_ctx.targets.World();
    int hits = 0;
    m_ctx.targets.ForEachLiving([&](TargetId target) {
        const glm::vec3 position = world.GetWorldPosition(target);
        const float reach = halfWidth + m_ctx.targets.HitRadiusOf(target);
        if (PlanarDistanceToSegment(position, start, end) > reach) {
            return true;
        }
        HitSpec perTarget = spec;
        if (prepare) {
            prepare(target, perTarget);
        }
        if (m_ctx.hits.Apply(target, perTarget, position).applied) {
            ++hits;
        }
        return true;
    });
    return hits;
}

void KitStrategy::NotifyFired(const std::string& tag, const glm::vec3& position,
                              const glm::vec3& direction, int charges, float radius) {
    EffectPayload payload;
    payload.position = position;
    payload.direction = direction;
    payload.charges = charges;
    payload.radius = radius;
    m_ctx.effects.OnAbilityFired(tag, payload);
}

glm::vec3 KitStrategy::ActorForward() const {
    return SafeNormalize(Flatten(m_ctx.actor.GetForward()), glm::vec3(0.0f, 0.0f, 1.0f));
}

glm::vec3 KitStrategy::AimDirection(const AbilityInvocation& invocation) const {
    if (!invocation.hasTargetPoint) {
        return ActorForward();
    }
    return SafeNormalize(Flatten(invocation.targetPoint - m_ctx.actor.GetPosition()), ActorForward());
}

AbilityOutcome KitStrategy::CastShield(AbilitySlot slot, ActorBuffKind kind, const std::string& tag) {
    const float duration = SlotParam(slot, "duration", 5.0f);
    m_ctx.actor.ApplyActorBuff(kind, duration, SlotParam(slot, "speedMultiplier", 1.0f));
    m_shieldRemaining = duration;
    NotifyFired(tag, m_ctx.actor.GetPosition(), ActorForward(), 0, 0.0f);
    return AbilityOutcome::Committed;
}

} // namespace Crimson::Combat
