#include "combat/kits/BloodKit.hpp"
#include "combat/ProjectileManager.hpp"
#include "combat/ResourceEconomy.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <utility>

namespace Crimson::Combat {

BloodKit::BloodKit(KitConfig config, KitContext context)
    : KitStrategy(std::move(config), context) {
}

bool BloodKit::IsSlotBusy(AbilitySlot slot) const {
    if (slot == AbilitySlot::F) {
        return m_orb != kInvalidEffect;
    }
    return KitStrategy::IsSlotBusy(slot);
}

// ============================================================================
// Q - Crimson Eruption
// ============================================================================

AbilityOutcome BloodKit::ExecuteAbilityQ(const AbilityInvocation& invocation) {
    const glm::vec3 center = invocation.hasTargetPoint
        ? invocation.targetPoint
        : m_ctx.actor.GetPosition() + ActorForward() * 3.0f;
    const float radius = SlotParam(AbilitySlot::Q, "radius", 3.5f);

    HitSpec spec = MakeAbilityHit(SlotParam(AbilitySlot::Q, "damage", 50.0f), "crimson_eruption");
    spec.stagger = SlotParam(AbilitySlot::Q, "stagger", 0.8f);

    const int hits = StrikeArea(center, radius, spec, false);
    if (hits > 0) {
        m_ctx.economy.AddCharge(m_config.resource.name,
                                static_cast<int>(SlotParam(AbilitySlot::Q, "chargeGain", 2.0f)));
    }
    NotifyFired("crimson_eruption", center, ActorForward(), 0, radius);
    COMBAT_LOG_TRACE("Crimson Eruption hit {} targets", hits);
    return AbilityOutcome::Committed;
}

// ============================================================================
// E - Blood Crescend
// ============================================================================

AbilityOutcome BloodKit::ExecuteAbilityE(const AbilityInvocation& invocation) {
    const AbilitySlot slot = AbilitySlot::E;
    const int charges = invocation.chargesUsed;
    const float perCharge = static_cast<float>(charges);

    // The next-attack bonus is baked into the wave when it launches
    const float damage = std::floor((SlotParam(slot, "baseDamage", 85.0f) +
                                     SlotParam(slot, "damagePerCharge", 36.0f) * perCharge) *
                                    invocation.multiplier *
                                    m_ctx.economy.ConsumeNextAttackMultiplier());
    const float cap = static_cast<float>(std::max(m_config.resource.cap, 1));
    const float stackScale = 1.0f + 1.1f * std::pow(std::min(1.0f, perCharge / cap), 1.35f);

    EffectSpawnDesc desc;
    desc.kind = EffectKind::Blade;
    desc.tier = HitTier::Charged;
    desc.tag = "blood_crescend";
    desc.origin = m_ctx.actor.GetWeaponPosition();
    desc.direction = ActorForward();
    desc.speed = SlotParam(slot, "speed", 25.0f) + SlotParam(slot, "speedPerCharge", 1.45f) * perCharge;
    desc.maxLifetime = SlotParam(slot, "lifetime", 1.2f) +
                       SlotParam(slot, "lifetimePerCharge", 0.07f) * perCharge + 0.08f * stackScale;
    desc.radius = SlotParam(slot, "radius", 2.05f) +
                  SlotParam(slot, "radiusPerCharge", 0.34f) * perCharge + 0.5f * stackScale;
    desc.pierce = true;

    desc.hit = MakeAbilityHit(damage, desc.tag);
    desc.hit.stagger = SlotParam(slot, "stagger", 0.95f);
    desc.hit.showAsCritical = charges >= m_config.resource.cap;
    desc.hit.charges = charges;

    if (m_ctx.projectiles.Spawn(desc) == kInvalidEffect) {
        return AbilityOutcome::Rejected;
    }

    NotifyFired(desc.tag, desc.origin, desc.direction, charges, desc.radius);
    m_ctx.host.EnterWhip(SlotParam(slot, "whipDuration", 0.48f));
    return AbilityOutcome::Committed;
}

// ============================================================================
// X - Blood Nova
// ============================================================================

AbilityOutcome BloodKit::ExecuteAbilityX(const AbilityInvocation&) {
    const AbilitySlot slot = AbilitySlot::X;
    const glm::vec3 center = m_ctx.actor.GetPosition();
    const float radius = SlotParam(slot, "radius", 12.0f);

    HitSpec spec = MakeAbilityHit(SlotParam(slot, "damage", 35.0f), "blood_nova");
    spec.stagger = SlotParam(slot, "freeze", 2.4f);
    spec.staggerBossBonus = SlotParam(slot, "bossFreezeBonus", 0.8f);

    const int hits = StrikeArea(center, radius, spec, true);

    EffectPayload payload;
    payload.position = center;
    payload.radius = radius;
    payload.hits = hits;
    m_ctx.effects.OnAbilityFired("blood_nova", payload);

    // A nova that catches nothing costs no cooldown
    if (hits == 0) {
        return AbilityOutcome::Fizzled;
    }
    m_ctx.economy.AddCharge(m_config.resource.name, static_cast<int>(SlotParam(slot, "chargeGain", 1.0f)));
    return AbilityOutcome::Committed;
}

// ============================================================================
// F - Crimson Orb
// ============================================================================

AbilityOutcome BloodKit::ExecuteAbilityF(const AbilityInvocation&) {
    const AbilitySlot slot = AbilitySlot::F;
    const float damage = SlotParam(slot, "damage", 280.0f);

    EffectSpawnDesc desc;
    desc.kind = EffectKind::Orb;
    desc.tier = HitTier::Charged;
    desc.tag = "crimson_orb";
    desc.origin = m_ctx.actor.GetWeaponPosition();
    desc.direction = ActorForward();
    desc.speed = SlotParam(slot, "speed", 32.0f);
    desc.maxLifetime = SlotParam(slot, "lifetime", 2.4f);
    desc.radius = SlotParam(slot, "radius", 0.6f);
    desc.pierce = false;

    desc.hit = MakeAbilityHit(std::floor(damage * OrbDamageScale(0.0f)), desc.tag);
    desc.hit.kind = DamageKind::Ultimate;
    desc.hit.isUltimate = true;
    desc.hit.showAsCritical = true;

    m_orb = m_ctx.projectiles.Spawn(desc);
    if (m_orb == kInvalidEffect) {
        return AbilityOutcome::Rejected;
    }
    m_orbAge = 0.0f;

    EffectPayload payload;
    payload.position = desc.origin;
    payload.direction = desc.direction;
    payload.radius = desc.radius * SlotParam(slot, "startScale", 0.28f);
    payload.isUltimate = true;
    m_ctx.effects.OnAbilityFired(desc.tag, payload);
    return AbilityOutcome::Committed;
}

void BloodKit::Update(float deltaTime) {
    KitStrategy::Update(deltaTime);

    if (m_orb == kInvalidEffect) {
        return;
    }
    if (!m_ctx.projectiles.IsAlive(m_orb)) {
        m_orb = kInvalidEffect;
        return;
    }

    m_orbAge += deltaTime;
    const float base = SlotParam(AbilitySlot::F, "damage", 280.0f);
    m_ctx.projectiles.SetBaseDamage(m_orb, std::floor(base * OrbDamageScale(m_orbAge)));
}

float BloodKit::OrbDamageScale(float age) const {
    const AbilitySlot slot = AbilitySlot::F;
    const float growTime = std::max(SlotParam(slot, "growTime", 0.8f), 0.001f);
    const float t = std::clamp(age / growTime, 0.0f, 1.0f);
    const float eased = t * t * (3.0f - 2.0f * t);
    const float startScale = SlotParam(slot, "startScale", 0.28f);
    const float endScale = SlotParam(slot, "endScale", 4.5f);
    const float scale = startScale + (endScale - startScale) * eased;
    return std::clamp(scale, SlotParam(slot, "minDamageScale", 0.3f), SlotParam(slot, "maxDamageScale", 1.5f));
}

} // namespace Crimson::Combat
