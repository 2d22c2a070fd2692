#include "combat/kits/PoisonMeleeKit.hpp"
#include "combat/ProjectileManager.hpp"
#include "combat/ResourceEconomy.hpp"
#include "combat/TargetRegistry.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <utility>

namespace Crimson::Combat {

PoisonMeleeKit::PoisonMeleeKit(KitConfig config, KitContext context)
    : KitStrategy(std::move(config), context) {
}

bool PoisonMeleeKit::IsSlotBusy(AbilitySlot slot) const {
    switch (slot) {
        case AbilitySlot::E: return m_pierce != kInvalidEffect;
        case AbilitySlot::F: return m_daggers != kInvalidEffect;
        default:             return KitStrategy::IsSlotBusy(slot);
    }
}

// ============================================================================
// Attacks
// ============================================================================

EffectSpawnDesc PoisonMeleeKit::MakeBladeWave(HitTier tier, const glm::vec3& direction) {
    // Both tiers carry the basic blade damage; the charged tier only flies differently
    EffectSpawnDesc desc = MakeAttackProjectile(tier, EffectKind::Blade, direction);
    desc.hitPadding = m_config.basic.radius;
    desc.planarHitTest = false;
    desc.hit.request.baseDamage = m_config.basic.damage;
    desc.hit.request.applyCombo = true;
    desc.hit.request.consumeNextAttack = true;
    desc.hit.kind = DamageKind::Normal;
    desc.hit.ultimateTier = HitTier::Basic;
    desc.hit.chargeGain = m_config.basic.chargeGain;

    IAbilityHost& host = m_ctx.host;
    desc.onHit = [&host](TargetId, const HitOutcome&, const glm::vec3&) {
        host.MarkSwingHit();
    };
    return desc;
}

void PoisonMeleeKit::OnBasicAttack(int) {
    m_ctx.projectiles.Spawn(MakeBladeWave(HitTier::Basic, ActorForward()));
}

void PoisonMeleeKit::OnChargedRelease(float) {
    m_ctx.host.PerformMeleeStrike(HitTier::Charged);

    const glm::vec3 forward = ActorForward();
    const float spread = m_config.Passive("twinBladeSpread", 0.18f);
    for (const float angle : {-spread, spread}) {
        m_ctx.projectiles.Spawn(MakeBladeWave(HitTier::Charged, RotateAroundUp(forward, angle)));
    }
    NotifyFired("twin_slash", m_ctx.actor.GetWeaponPosition(), forward);
}

void PoisonMeleeKit::OnBasicHit(TargetId) {
    m_ctx.economy.AddCharge(m_config.resource.name, m_config.basic.chargeGain);
}

void PoisonMeleeKit::OnChargedHit(TargetId) {
    m_ctx.economy.AddCharge(m_config.resource.name, m_config.charged.chargeGain);
}

// ============================================================================
// E - Poison Pierce
// ============================================================================

AbilityOutcome PoisonMeleeKit::ExecuteAbilityE(const AbilityInvocation& invocation) {
    const AbilitySlot slot = AbilitySlot::E;
    const int charges = invocation.chargesUsed;
    const float n = static_cast<float>(charges);
    const float ratio = std::min(1.0f, n / static_cast<float>(std::max(m_config.resource.cap, 1)));

    EffectSpawnDesc desc;
    desc.kind = EffectKind::Blade;
    desc.tier = HitTier::Charged;
    desc.tag = "poison_pierce";
    desc.origin = m_ctx.actor.GetWeaponPosition();
    desc.direction = ActorForward();
    desc.speed = SlotParam(slot, "speed", 28.0f) + SlotParam(slot, "speedBonus", 12.0f) * ratio;
    desc.maxLifetime = SlotParam(slot, "lifetime", 0.4f) + SlotParam(slot, "lifetimeBonus", 0.15f) * ratio;
    desc.hitPadding = SlotParam(slot, "radius", 2.6f) + SlotParam(slot, "radiusBonus", 1.2f) * ratio;
    desc.planarHitTest = false;
    desc.pierce = true;

    desc.hit = MakeAbilityHit(std::floor(SlotParam(slot, "baseDamage", 40.0f) +
                                         SlotParam(slot, "damagePerCharge", 18.0f) * n), desc.tag);
    desc.hit.request.consumeNextAttack = true;
    desc.hit.stagger = SlotParam(slot, "stagger", 0.8f);
    desc.hit.grantsUltimate = true;
    desc.hit.ultimateTier = HitTier::Charged;
    desc.hit.poisonDuration = SlotParam(slot, "poisonSecondsPerCharge", 2.0f) * n;
    desc.hit.poisonPerTick = static_cast<int>(SlotParam(slot, "poisonTickBase", 4.0f) +
                                              SlotParam(slot, "poisonTickPerCharge", 3.0f) * n);
    desc.hit.charges = charges;

    m_pierce = m_ctx.projectiles.Spawn(desc);
    if (m_pierce == kInvalidEffect) {
        return AbilityOutcome::Rejected;
    }
    NotifyFired(desc.tag, desc.origin, desc.direction, charges, desc.hitPadding);
    return AbilityOutcome::Committed;
}

// ============================================================================
// V - Shadow Step
// ============================================================================

AbilityOutcome PoisonMeleeKit::ExecuteAbilityV(const AbilityInvocation&) {
    const AbilitySlot slot = AbilitySlot::V;
    const glm::vec3 position = m_ctx.actor.GetPosition();
    const glm::vec3 forward = ActorForward();

    const TargetId target = m_ctx.targets.FindNearest(position, forward,
                                                      SlotParam(slot, "range", 12.0f),
                                                      SlotParam(slot, "minDot", 0.3f), false);
    if (target == kInvalidTarget) {
        return AbilityOutcome::Rejected;
    }

    glm::vec3 behind = m_ctx.targets.World().GetWorldPosition(target) -
                       forward * SlotParam(slot, "behindOffset", 2.2f);
    behind.y = position.y;
    m_ctx.actor.Teleport(behind);
    m_ctx.economy.SetDamageBuff(kShadowStepBuff, SlotParam(slot, "buffMultiplier", 2.0f),
                                SlotParam(slot, "buffDuration", 3.0f));

    EffectPayload payload;
    payload.position = behind;
    payload.direction = forward;
    payload.target = target;
    m_ctx.effects.OnAbilityFired("shadow_step", payload);
    return AbilityOutcome::Committed;
}

// ============================================================================
// C - Vanish
// ============================================================================

AbilityOutcome PoisonMeleeKit::ExecuteAbilityC(const AbilityInvocation&) {
    return CastShield(AbilitySlot::C, ActorBuffKind::Vanish, "vanish");
}

// ============================================================================
// X - Toxic Focus
// ============================================================================

AbilityOutcome PoisonMeleeKit::ExecuteAbilityX(const AbilityInvocation& invocation) {
    if (invocation.chargesUsed <= 0) {
        return AbilityOutcome::Rejected;
    }
    const AbilitySlot slot = AbilitySlot::X;
    const float multiplier = 1.0f + SlotParam(slot, "multiplierPerCharge", 0.2f) *
                                    static_cast<float>(invocation.chargesUsed);
    m_ctx.economy.SetDamageBuff(kToxicFocusBuff, multiplier, SlotParam(slot, "duration", 8.0f));

    NotifyFired("toxic_focus", m_ctx.actor.GetPosition(), ActorForward(), invocation.chargesUsed);
    COMBAT_LOG_DEBUG("Toxic Focus x{:.2f} from {} charges", multiplier, invocation.chargesUsed);
    return AbilityOutcome::Committed;
}

// ============================================================================
// F - Twin Daggers
// ============================================================================

AbilityOutcome PoisonMeleeKit::ExecuteAbilityF(const AbilityInvocation&) {
    const AbilitySlot slot = AbilitySlot::F;
    const int consumed = m_ctx.economy.Consume(m_config.resource.name,
                                               static_cast<int>(SlotParam(slot, "maxCharges", 6.0f)));
    const float multiplier = 1.0f + SlotParam(slot, "multiplierPerCharge", 0.2f) * static_cast<float>(consumed);
    const float speed = std::max(SlotParam(slot, "speed", 22.0f), 0.001f);

    EffectSpawnDesc desc;
    desc.kind = EffectKind::Blade;
    desc.tier = HitTier::Charged;
    desc.tag = "twin_daggers";
    desc.origin = m_ctx.actor.GetWeaponPosition();
    desc.direction = ActorForward();
    desc.speed = speed;
    desc.maxLifetime = SlotParam(slot, "range", 14.0f) / speed;
    desc.hitPadding = SlotParam(slot, "hitPadding", 0.8f);
    desc.planarHitTest = false;
    desc.pierce = true;

    desc.hit = MakeAbilityHit(std::floor(SlotParam(slot, "damage", 180.0f) * multiplier), desc.tag);
    desc.hit.request.consumeNextAttack = true;
    desc.hit.kind = DamageKind::Ultimate;
    desc.hit.isUltimate = true;
    desc.hit.charges = consumed;

    m_daggers = m_ctx.projectiles.Spawn(desc);
    if (m_daggers == kInvalidEffect) {
        m_ctx.economy.RestoreCharge(m_config.resource.name, consumed);
        return AbilityOutcome::Rejected;
    }

    EffectPayload payload;
    payload.position = desc.origin;
    payload.direction = desc.direction;
    payload.charges = consumed;
    payload.isUltimate = true;
    m_ctx.effects.OnAbilityFired(desc.tag, payload);
    return AbilityOutcome::Committed;
}

void PoisonMeleeKit::Update(float deltaTime) {
    KitStrategy::Update(deltaTime);

    if (m_pierce != kInvalidEffect && !m_ctx.projectiles.IsAlive(m_pierce)) {
        m_pierce = kInvalidEffect;
    }
    if (m_daggers != kInvalidEffect && !m_ctx.projectiles.IsAlive(m_daggers)) {
        m_daggers = kInvalidEffect;
    }
}

} // namespace Crimson::Combat
