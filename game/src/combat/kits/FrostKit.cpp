#include "combat/kits/FrostKit.hpp"
#include "combat/ProjectileManager.hpp"
#include "combat/ResourceEconomy.hpp"
#include "combat/StatusEffectTracker.hpp"
#include "combat/TargetRegistry.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <utility>

namespace Crimson::Combat {

namespace {
constexpr float kTwoPi = 6.28318530718f;
}

FrostKit::FrostKit(KitConfig config, KitContext context)
    : KitStrategy(std::move(config), context) {
}

void FrostKit::OnBind() {
    KitStrategy::OnBind();
    m_ctx.economy.SetCapCallback(m_config.resource.name, [this](const std::string&, TargetId owner) {
        OnStacksCapped(owner);
    });
}

void FrostKit::OnUnbind() {
    m_ctx.economy.SetCapCallback(m_config.resource.name, nullptr);
    m_stalactites.clear();
    m_blizzard = Blizzard{};
    m_frozenOrb = kInvalidEffect;
    KitStrategy::OnUnbind();
}

void FrostKit::OnStacksCapped(TargetId target) {
    if (target == kInvalidTarget) {
        return;
    }
    float duration = m_config.Passive("capFreeze", 3.0f);
    const bool boss = m_ctx.targets.World().IsBoss(target);
    if (boss) {
        duration += m_config.Passive("capFreezeBossBonus", 1.0f);
    }
    m_ctx.status.ApplyStagger(target, duration);

    EffectPayload payload;
    payload.position = m_ctx.targets.World().GetWorldPosition(target);
    payload.target = target;
    payload.isBoss = boss;
    m_ctx.effects.OnAbilityFired("frost_freeze", payload);
    COMBAT_LOG_DEBUG("Target {} frozen for {:.2f}s at frost cap", target, duration);
}

bool FrostKit::IsSlotBusy(AbilitySlot slot) const {
    switch (slot) {
        case AbilitySlot::Q: return m_frozenOrb != kInvalidEffect;
        case AbilitySlot::E: return m_beamRemaining > 0.0f;
        case AbilitySlot::X: return !m_stalactites.empty();
        case AbilitySlot::F: return m_blizzard.remaining > 0.0f;
        default:             return KitStrategy::IsSlotBusy(slot);
    }
}

// ============================================================================
// Q - Frozen Orb
// ============================================================================

AbilityOutcome FrostKit::ExecuteAbilityQ(const AbilityInvocation& invocation) {
    const AbilitySlot slot = AbilitySlot::Q;

    EffectSpawnDesc desc;
    desc.kind = EffectKind::Orb;
    desc.tier = HitTier::Basic;
    desc.tag = "frozen_orb";
    desc.origin = m_ctx.actor.GetWeaponPosition();
    desc.direction = AimDirection(invocation);
    desc.speed = SlotParam(slot, "speed", 4.5f);
    desc.maxLifetime = SlotParam(slot, "lifetime", 4.0f);
    desc.hitPadding = SlotParam(slot, "hitPadding", 0.8f);
    desc.planarHitTest = false;
    desc.pierce = true;

    desc.hit = MakeAbilityHit(SlotParam(slot, "contactDamage", 120.0f), desc.tag);
    desc.hit.grantsUltimate = true;
    desc.hit.ultimateTier = HitTier::Charged;
    desc.hit.chargeResource = m_config.resource.name;
    desc.hit.chargeGain = static_cast<int>(SlotParam(slot, "contactCharges", 3.0f));

    m_frozenOrb = m_ctx.projectiles.Spawn(desc);
    if (m_frozenOrb == kInvalidEffect) {
        return AbilityOutcome::Rejected;
    }
    m_shardTimer = 0.0f;
    NotifyFired(desc.tag, desc.origin, desc.direction);
    return AbilityOutcome::Committed;
}

void FrostKit::UpdateFrozenOrb(float deltaTime) {
    if (m_frozenOrb == kInvalidEffect) {
        return;
    }
    const auto position = m_ctx.projectiles.GetPosition(m_frozenOrb);
    if (!position) {
        m_frozenOrb = kInvalidEffect;
        return;
    }

    m_shardTimer -= deltaTime;
    if (m_shardTimer <= 0.0f) {
        m_shardTimer = SlotParam(AbilitySlot::Q, "shardInterval", 0.14f);
        EmitShard(*position);
    }
}

void FrostKit::EmitShard(const glm::vec3& origin) {
    const AbilitySlot slot = AbilitySlot::Q;
    const float angle = m_ctx.random.NextRange(0.0f, kTwoPi);

    EffectSpawnDesc desc;
    desc.kind = EffectKind::Shard;
    desc.tier = HitTier::Basic;
    desc.tag = "frozen_orb_shard";
    desc.origin = origin;
    desc.direction = glm::vec3(std::cos(angle), 0.0f, std::sin(angle));
    desc.speed = SlotParam(slot, "shardSpeed", 16.0f);
    desc.maxLifetime = SlotParam(slot, "shardLifetime", 0.8f);

    desc.hit = MakeAbilityHit(SlotParam(slot, "shardDamage", 30.0f), desc.tag);
    desc.hit.chargeResource = m_config.resource.name;
    desc.hit.chargeGain = 1;

    m_ctx.projectiles.Spawn(desc);
}

// ============================================================================
// E - Frost Beam
// ============================================================================

AbilityOutcome FrostKit::ExecuteAbilityE(const AbilityInvocation& invocation) {
    const AbilitySlot slot = AbilitySlot::E;
    const glm::vec3 start = m_ctx.actor.GetWeaponPosition();
    const glm::vec3 direction = ActorForward();
    const glm::vec3 end = start + direction * SlotParam(slot, "length", 12.0f);

    const float baseDamage = SlotParam(slot, "baseDamage", 42.0f) +
                             SlotParam(slot, "damagePerCharge", 18.0f) * static_cast<float>(invocation.chargesUsed);
    const float perStack = SlotParam(slot, "damagePerStack", 12.0f);
    const float freezePerStack = SlotParam(slot, "freezePerStack", 0.5f);
    const float multiplier = invocation.multiplier;

    HitSpec spec = MakeAbilityHit(baseDamage, "frost_beam");
    spec.request.applyTimedBuffs = false;
    spec.kind = DamageKind::Heavy;
    spec.grantsUltimate = true;
    spec.ultimateTier = HitTier::Charged;
    spec.charges = invocation.chargesUsed;

    // Each target pays out its own stacks
    const int hits = StrikeLine(start, end, SlotParam(slot, "hitPadding", 0.5f), spec,
        [&](TargetId target, HitSpec& hit) {
            const int stacks = m_ctx.economy.ConsumeAll(m_config.resource.name, target);
            hit.request.baseDamage = std::floor((baseDamage + perStack * static_cast<float>(stacks)) * multiplier);
            if (stacks > 0) {
                hit.stagger = freezePerStack * static_cast<float>(stacks);
                hit.staggerBossBonus = SlotParam(slot, "bossFreezeBonus", 0.5f);
            }
        });

    EffectPayload payload;
    payload.position = start;
    payload.direction = direction;
    payload.charges = invocation.chargesUsed;
    payload.hits = hits;
    m_ctx.effects.OnAbilityFired("frost_beam", payload);

    m_beamRemaining = SlotParam(slot, "whipDuration", 0.6f);
    m_ctx.host.EnterWhip(m_beamRemaining);
    return AbilityOutcome::Committed;
}

// ============================================================================
// X - Stalactite
// ============================================================================

AbilityOutcome FrostKit::ExecuteAbilityX(const AbilityInvocation& invocation) {
    Stalactite drop;
    drop.center = invocation.hasTargetPoint
        ? invocation.targetPoint
        : m_ctx.actor.GetPosition() + ActorForward() * 3.0f;
    drop.fallRemaining = SlotParam(AbilitySlot::X, "fallTime", 0.35f);
    drop.lingerRemaining = SlotParam(AbilitySlot::X, "lingerTime", 0.8f);
    m_stalactites.push_back(drop);

    NotifyFired("stalactite", drop.center, glm::vec3(0.0f, -1.0f, 0.0f), 0,
                SlotParam(AbilitySlot::X, "radius", 4.0f));
    return AbilityOutcome::Committed;
}

void FrostKit::UpdateStalactites(float deltaTime) {
    const AbilitySlot slot = AbilitySlot::X;

    for (auto& drop : m_stalactites) {
        if (!drop.landed) {
            drop.fallRemaining -= deltaTime;
            if (drop.fallRemaining > 0.0f) {
                continue;
            }
            drop.landed = true;

            const float radius = SlotParam(slot, "radius", 4.0f);
            HitSpec spec = MakeAbilityHit(SlotParam(slot, "damage", 85.0f), "stalactite_impact");
            spec.stagger = SlotParam(slot, "freeze", 2.5f);
            spec.staggerBossBonus = SlotParam(slot, "bossFreezeBonus", 0.5f);
            spec.chargeResource = m_config.resource.name;
            spec.chargeGain = static_cast<int>(SlotParam(slot, "chargeGain", 3.0f));

            EffectPayload payload;
            payload.position = drop.center;
            payload.radius = radius;
            payload.hits = StrikeArea(drop.center, radius, spec, true);
            m_ctx.effects.OnHit("stalactite_impact", payload);
            continue;
        }

        drop.lingerRemaining -= deltaTime;
        if (drop.lingerRemaining <= 0.0f) {
            EffectPayload payload;
            payload.position = drop.center;
            m_ctx.effects.OnExpire("stalactite", payload);
        }
    }

    m_stalactites.erase(std::remove_if(m_stalactites.begin(), m_stalactites.end(),
        [](const Stalactite& drop) { return drop.landed && drop.lingerRemaining <= 0.0f; }),
        m_stalactites.end());
}

// ============================================================================
// F - Blizzard
// ============================================================================

AbilityOutcome FrostKit::ExecuteAbilityF(const AbilityInvocation& invocation) {
    const AbilitySlot slot = AbilitySlot::F;
    m_blizzard.center = invocation.hasTargetPoint ? invocation.targetPoint : m_ctx.actor.GetPosition();
    m_blizzard.remaining = SlotParam(slot, "duration", 3.5f);
    m_blizzard.tickTimer = 0.0f;

    EffectPayload payload;
    payload.position = m_blizzard.center;
    payload.radius = SlotParam(slot, "radius", 8.0f);
    payload.isUltimate = true;
    m_ctx.effects.OnAbilityFired("blizzard", payload);

    StrikeBlizzard();
    return AbilityOutcome::Committed;
}

void FrostKit::StrikeBlizzard() {
    const AbilitySlot slot = AbilitySlot::F;
    HitSpec spec = MakeAbilityHit(SlotParam(slot, "damage", 28.0f), "blizzard");
    spec.kind = DamageKind::Ultimate;
    spec.isUltimate = true;
    spec.chargeResource = m_config.resource.name;
    spec.chargeGain = static_cast<int>(SlotParam(slot, "chargeGain", 1.0f));
    StrikeArea(m_blizzard.center, SlotParam(slot, "radius", 8.0f), spec, true);
}

void FrostKit::UpdateBlizzard(float deltaTime) {
    if (m_blizzard.remaining <= 0.0f) {
        return;
    }
    const float interval = std::max(SlotParam(AbilitySlot::F, "tickInterval", 0.25f), 0.01f);

    const float step = std::min(deltaTime, m_blizzard.remaining);
    m_blizzard.remaining -= deltaTime;
    m_blizzard.tickTimer += step;
    while (m_blizzard.tickTimer >= interval) {
        m_blizzard.tickTimer -= interval;
        StrikeBlizzard();
    }

    if (m_blizzard.remaining <= 0.0f) {
        EffectPayload payload;
        payload.position = m_blizzard.center;
        m_blizzard = Blizzard{};
        m_ctx.effects.OnExpire("blizzard", payload);
    }
}

void FrostKit::Update(float deltaTime) {
    KitStrategy::Update(deltaTime);
    m_beamRemaining = std::max(0.0f, m_beamRemaining - deltaTime);
    UpdateFrozenOrb(deltaTime);
    UpdateStalactites(deltaTime);
    UpdateBlizzard(deltaTime);
}

} // namespace Crimson::Combat
