#include "combat/kits/RangedBowKit.hpp"
#include "combat/ProjectileManager.hpp"
#include "combat/ResourceEconomy.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <utility>

namespace Crimson::Combat {

RangedBowKit::RangedBowKit(KitConfig config, KitContext context)
    : KitStrategy(std::move(config), context) {
}

bool RangedBowKit::IsSlotBusy(AbilitySlot slot) const {
    if (slot == AbilitySlot::X) {
        return m_multiShot.arrowsRemaining > 0;
    }
    return KitStrategy::IsSlotBusy(slot);
}

float RangedBowKit::GetZoneMultiplier() const {
    return m_ctx.economy.IsBuffActive(kZoneBuff) ? SlotParam(AbilitySlot::C, "multiplier", 2.0f) : 1.0f;
}

// ============================================================================
// Arrows
// ============================================================================

EffectSpawnDesc RangedBowKit::MakeArrow(HitTier tier, const glm::vec3& direction,
                                        float damage, float speed, float lifetime,
                                        bool spendsNextAttack) {
    EffectSpawnDesc desc = MakeAttackProjectile(tier, EffectKind::Arrow, direction);
    desc.speed = speed;
    desc.maxLifetime = lifetime;

    float multiplier = GetZoneMultiplier();
    if (spendsNextAttack) {
        multiplier *= m_ctx.economy.ConsumeNextAttackMultiplier();
    }
    desc.hit.request.baseDamage = std::floor(damage * multiplier);
    desc.hit.request.applyTimedBuffs = false;
    return desc;
}

void RangedBowKit::OnBasicAttack(int) {
    m_ctx.projectiles.Spawn(MakeArrow(HitTier::Basic, ActorForward(), m_config.basic.damage,
                                      m_config.basic.speed, m_config.basic.lifetime, true));
}

void RangedBowKit::OnChargedRelease(float) {
    const glm::vec3 forward = ActorForward();
    const int arrows = std::max(1, static_cast<int>(m_config.Passive("chargedArrows", 3.0f)));
    const float spread = m_config.Passive("chargedSpread", 0.12f);

    // One multiplier read for the whole volley
    EffectSpawnDesc desc = MakeArrow(HitTier::Charged, forward, m_config.charged.damage,
                                     m_config.charged.speed, m_config.charged.lifetime, true);
    const float half = static_cast<float>(arrows - 1) * 0.5f;
    for (int i = 0; i < arrows; ++i) {
        desc.direction = RotateAroundUp(forward, (static_cast<float>(i) - half) * spread);
        m_ctx.projectiles.Spawn(desc);
    }
    NotifyFired("charged_volley", desc.origin, forward, arrows);
}

void RangedBowKit::OnBasicHit(TargetId) {
    m_ctx.economy.AddCharge(m_config.resource.name, m_config.basic.chargeGain);
}

void RangedBowKit::OnChargedHit(TargetId) {
    m_ctx.economy.AddCharge(m_config.resource.name, m_config.charged.chargeGain);
}

// ============================================================================
// V - Recoil Shot
// ============================================================================

AbilityOutcome RangedBowKit::ExecuteAbilityV(const AbilityInvocation&) {
    const AbilitySlot slot = AbilitySlot::V;
    const glm::vec3 forward = ActorForward();

    EffectSpawnDesc desc = MakeArrow(HitTier::Charged, forward, SlotParam(slot, "damage", 55.0f),
                                     SlotParam(slot, "speed", 35.0f), SlotParam(slot, "lifetime", 0.6f));
    desc.tag = "recoil_shot";
    desc.hit.tag = desc.tag;
    desc.hit.kind = DamageKind::Ability;
    if (m_ctx.projectiles.Spawn(desc) == kInvalidEffect) {
        return AbilityOutcome::Rejected;
    }

    m_ctx.host.StartDash(-forward, SlotParam(slot, "dashSpeed", 28.0f), SlotParam(slot, "dashDuration", 0.22f));
    NotifyFired(desc.tag, desc.origin, forward);
    return AbilityOutcome::Committed;
}

// ============================================================================
// C - Hunter's Mark Zone
// ============================================================================

AbilityOutcome RangedBowKit::ExecuteAbilityC(const AbilityInvocation&) {
    const AbilitySlot slot = AbilitySlot::C;
    m_zone.center = m_ctx.actor.GetPosition();
    m_zone.radius = SlotParam(slot, "radius", 3.5f);
    m_zone.remaining = SlotParam(slot, "duration", 5.0f);
    UpdateZone(0.0f);

    NotifyFired("hunters_zone", m_zone.center, ActorForward(), 0, m_zone.radius);
    return AbilityOutcome::Committed;
}

void RangedBowKit::UpdateZone(float deltaTime) {
    if (m_zone.remaining <= 0.0f) {
        return;
    }
    m_zone.remaining -= deltaTime;
    if (m_zone.remaining <= 0.0f) {
        m_zone = DamageZone{};
        m_ctx.economy.ClearDamageBuff(kZoneBuff);
        EffectPayload payload;
        payload.position = m_ctx.actor.GetPosition();
        m_ctx.effects.OnExpire("hunters_zone", payload);
        return;
    }

    const bool inside = PlanarDistance(m_ctx.actor.GetPosition(), m_zone.center) <= m_zone.radius;
    if (inside) {
        m_ctx.economy.SetDamageBuff(kZoneBuff, SlotParam(AbilitySlot::C, "multiplier", 2.0f), m_zone.remaining);
    } else {
        m_ctx.economy.ClearDamageBuff(kZoneBuff);
    }
}

// ============================================================================
// X - Multi Shot
// ============================================================================

AbilityOutcome RangedBowKit::ExecuteAbilityX(const AbilityInvocation&) {
    m_multiShot.arrowsRemaining = std::max(1, static_cast<int>(SlotParam(AbilitySlot::X, "arrows", 6.0f)));
    m_multiShot.timer = 0.0f;

    // First arrow leaves on the cast frame
    SpawnMultiShotArrow();
    --m_multiShot.arrowsRemaining;
    m_multiShot.timer = SlotParam(AbilitySlot::X, "interval", 0.08f);
    return AbilityOutcome::Committed;
}

void RangedBowKit::SpawnMultiShotArrow() {
    const AbilitySlot slot = AbilitySlot::X;
    EffectSpawnDesc desc = MakeArrow(HitTier::Basic, ActorForward(), SlotParam(slot, "damage", 18.0f),
                                     SlotParam(slot, "speed", 32.0f), SlotParam(slot, "lifetime", 1.5f));
    desc.tag = "multi_shot";
    desc.hit.tag = desc.tag;
    desc.hit.kind = DamageKind::Ability;
    desc.hit.vulnerabilityDuration = SlotParam(slot, "vulnerabilityDuration", 6.0f);
    desc.hit.vulnerabilityMultiplier = SlotParam(slot, "vulnerabilityMultiplier", 1.5f);
    m_ctx.projectiles.Spawn(desc);
}

void RangedBowKit::UpdateMultiShot(float deltaTime) {
    if (m_multiShot.arrowsRemaining <= 0) {
        return;
    }
    const float interval = std::max(SlotParam(AbilitySlot::X, "interval", 0.08f), 0.001f);
    m_multiShot.timer -= deltaTime;
    while (m_multiShot.arrowsRemaining > 0 && m_multiShot.timer <= 0.0f) {
        SpawnMultiShotArrow();
        --m_multiShot.arrowsRemaining;
        m_multiShot.timer += interval;
    }
}

// ============================================================================
// E - Judgment Arrow
// ============================================================================

AbilityOutcome RangedBowKit::ExecuteAbilityE(const AbilityInvocation& invocation) {
    const AbilitySlot slot = AbilitySlot::E;
    const int stacks = invocation.chargesUsed;
    const float scale = 1.0f + SlotParam(slot, "multiplierPerCharge", 0.25f) * static_cast<float>(stacks);

    EffectSpawnDesc desc = MakeArrow(HitTier::Charged, ActorForward(), SlotParam(slot, "damage", 65.0f) * scale,
                                     SlotParam(slot, "speed", 30.0f), SlotParam(slot, "lifetime", 2.2f));
    desc.tag = "judgment_arrow";
    desc.hit.tag = desc.tag;
    desc.hit.kind = DamageKind::Ability;
    desc.hit.chargeGain = 0;
    desc.hit.charges = stacks;

    desc.pierce = stacks >= static_cast<int>(SlotParam(slot, "pierceAt", 4.0f));
    if (stacks >= static_cast<int>(SlotParam(slot, "burstAt", 6.0f))) {
        desc.burst.radius = SlotParam(slot, "burstRadius", 3.5f);
        desc.burst.damageScale = SlotParam(slot, "burstScale", 0.6f);
    }
    if (stacks >= static_cast<int>(SlotParam(slot, "markAt", 8.0f))) {
        desc.hit.vulnerabilityDuration = SlotParam(slot, "markDuration", 6.0f);
        desc.hit.vulnerabilityMultiplier = SlotParam(slot, "markMultiplier", 1.3f);
    }

    if (m_ctx.projectiles.Spawn(desc) == kInvalidEffect) {
        return AbilityOutcome::Rejected;
    }
    NotifyFired(desc.tag, desc.origin, desc.direction, stacks, desc.burst.radius);
    COMBAT_LOG_TRACE("Judgment Arrow with {} trust (pierce={}, burst={})",
                     stacks, desc.pierce, desc.burst.radius > 0.0f);
    return AbilityOutcome::Committed;
}

// ============================================================================
// F - Skyfall Arrow
// ============================================================================

AbilityOutcome RangedBowKit::ExecuteAbilityF(const AbilityInvocation&) {
    const AbilitySlot slot = AbilitySlot::F;
    EffectSpawnDesc desc = MakeArrow(HitTier::Charged, ActorForward(), SlotParam(slot, "damage", 200.0f),
                                     SlotParam(slot, "speed", 42.0f), SlotParam(slot, "lifetime", 3.0f));
    desc.tag = "skyfall_arrow";
    desc.hit.tag = desc.tag;
    desc.hit.kind = DamageKind::Ultimate;
    desc.hit.isUltimate = true;
    desc.hit.grantsUltimate = false;
    desc.hit.chargeGain = 0;
    desc.pierce = true;

    if (m_ctx.projectiles.Spawn(desc) == kInvalidEffect) {
        return AbilityOutcome::Rejected;
    }

    EffectPayload payload;
    payload.position = desc.origin;
    payload.direction = desc.direction;
    payload.isUltimate = true;
    m_ctx.effects.OnAbilityFired(desc.tag, payload);
    return AbilityOutcome::Committed;
}

void RangedBowKit::Update(float deltaTime) {
    KitStrategy::Update(deltaTime);
    UpdateZone(deltaTime);
    UpdateMultiShot(deltaTime);
}

} // namespace Crimson::Combat
