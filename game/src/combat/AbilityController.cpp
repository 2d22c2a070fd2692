#include "combat/AbilityController.hpp"
#include "combat/KitFactory.hpp"
#include "combat/ProjectileManager.hpp"
#include "combat/ResourceEconomy.hpp"
#include "combat/TargetRegistry.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>

namespace Crimson::Combat {

namespace {
// Timers that should land exactly on a tick boundary accumulate float error
constexpr float kTimeEpsilon = 1e-4f;
}

AbilityController::AbilityController(TargetRegistry& targets,
                                     ResourceEconomy& economy,
                                     StatusEffectTracker& status,
                                     DamagePipeline& pipeline,
                                     HitResolver& hits,
                                     ProjectileManager& projectiles,
                                     IActorState& actor,
                                     IEffectSink& effects,
                                     IRandomSource& random,
                                     float targetingMinDistance)
    : m_targets(targets)
    , m_economy(economy)
    , m_status(status)
    , m_pipeline(pipeline)
    , m_hits(hits)
    , m_projectiles(projectiles)
    , m_actor(actor)
    , m_effects(effects)
    , m_random(random)
    , m_targetingMinDistance(targetingMinDistance) {
}

AbilityController::~AbilityController() {
    UnbindKit();
}

// ============================================================================
// Kit Binding
// ============================================================================

void AbilityController::BindKit(const KitConfig& config) {
    UnbindKit();

    KitContext context{m_targets, m_economy, m_status, m_pipeline, m_hits,
                       m_projectiles, m_actor, m_effects, m_random, *this};
    m_kit = CreateKit(config, context);
    m_kit->OnBind();
}

void AbilityController::UnbindKit() {
    if (m_channel != ChannelState::None) {
        ExitChannel();
    }
    m_targeting = TargetingState{};
    m_windup = WindupState{};
    m_chargeTimer = 0.0f;
    ResetCooldowns();

    if (m_kit) {
        m_kit->OnUnbind();
        m_kit.reset();
    }
}

void AbilityController::ResetCooldowns() {
    m_cooldowns.fill(0.0f);
}

// ============================================================================
// Update
// ============================================================================

void AbilityController::Update(float deltaTime, const CombatIntent& intent) {
    if (!m_kit) {
        return;
    }
    m_clock += deltaTime;

    std::array<bool, kAbilitySlotCount> pressed = intent.abilities;
    bool attackAvailable = intent.attack;

    UpdateCooldowns(deltaTime);
    UpdateWindup(deltaTime);
    UpdateTargeting(intent, pressed, attackAvailable);
    UpdateChannels(deltaTime, pressed);

    for (AbilitySlot slot : kAllAbilitySlots) {
        if (pressed[SlotIndex(slot)]) {
            TryActivate(slot, intent, false);
        }
    }

    UpdateAttacks(deltaTime, intent, attackAvailable);
    UpdateCombo(deltaTime);
    m_kit->Update(deltaTime);
}

void AbilityController::UpdateCooldowns(float deltaTime) {
    for (float& cooldown : m_cooldowns) {
        cooldown = std::max(0.0f, cooldown - deltaTime);
    }
}

void AbilityController::UpdateWindup(float deltaTime) {
    if (!m_windup.active) {
        return;
    }
    m_windup.remaining -= deltaTime;
    if (m_windup.remaining > 0.0f) {
        return;
    }
    const AbilityInvocation invocation = m_windup.invocation;
    m_windup = WindupState{};
    ResolveCast(invocation);
}

void AbilityController::UpdateTargeting(const CombatIntent& intent,
                                        std::array<bool, kAbilitySlotCount>& pressed,
                                        bool& attackAvailable) {
    if (!m_targeting.active) {
        return;
    }
    m_targeting.point = ClampTargetPoint(intent);

    const AbilitySlot slot = m_targeting.slot;
    if (attackAvailable) {
        attackAvailable = false;
        m_targeting.active = false;
        TryActivate(slot, intent, true);
        return;
    }

    if (intent.chargedAttack || intent.cancel || pressed[SlotIndex(slot)]) {
        pressed[SlotIndex(slot)] = false;
        m_targeting.active = false;
        COMBAT_LOG_TRACE("Targeting for slot {} cancelled", AbilitySlotToString(slot));
        return;
    }

    // Another slot takes over; it is handled with the regular slot intents
    for (AbilitySlot other : kAllAbilitySlots) {
        if (pressed[SlotIndex(other)]) {
            m_targeting.active = false;
            return;
        }
    }
}

glm::vec3 AbilityController::ClampTargetPoint(const CombatIntent& intent) const {
    const glm::vec3 origin = m_actor.GetPosition();
    const glm::vec3 forward = SafeNormalize(Flatten(m_actor.GetForward()), glm::vec3(0.0f, 0.0f, 1.0f));
    if (!intent.hasAimPoint) {
        return m_targeting.active ? m_targeting.point : origin + forward * m_targetingMinDistance;
    }

    glm::vec3 offset = Flatten(intent.aimPoint - origin);
    const float distance = glm::length(offset);
    if (distance >= m_targetingMinDistance) {
        return glm::vec3(intent.aimPoint.x, origin.y, intent.aimPoint.z);
    }
    const glm::vec3 direction = SafeNormalize(offset, forward);
    return origin + direction * m_targetingMinDistance;
}

// ============================================================================
// Channels
// ============================================================================

void AbilityController::EnterChannel(ChannelState state) {
    if (m_channel == state) {
        return;
    }
    if (m_channel != ChannelState::None) {
        ExitChannel();
    }
    m_channel = state;
    NotifyChannel("channel_enter", state);
}

void AbilityController::ExitChannel() {
    const ChannelState previous = m_channel;
    switch (previous) {
        case ChannelState::None:
            return;
        case ChannelState::Attacking:
            m_attackElapsed = 0.0f;
            break;
        case ChannelState::Charging:
            m_chargeTimer = 0.0f;
            break;
        case ChannelState::ChargedAttacking:
            m_chargedRecovery = 0.0f;
            break;
        case ChannelState::Whip:
            m_whipRemaining = 0.0f;
            break;
        case ChannelState::LifeDrain:
            m_drain = LifeDrainState{};
            break;
        case ChannelState::Dashing:
            m_dash = DashState{};
            break;
    }
    m_channel = ChannelState::None;
    NotifyChannel("channel_exit", previous);
}

void AbilityController::NotifyChannel(const char* tag, ChannelState state) {
    EffectPayload payload;
    payload.position = m_actor.GetPosition();
    payload.direction = m_actor.GetForward();
    payload.target = state == ChannelState::LifeDrain ? m_drain.target : kInvalidTarget;
    m_effects.OnAbilityFired(tag, payload);
    COMBAT_LOG_TRACE("{} {}", tag, ChannelStateToString(state));
}

void AbilityController::CancelChannel() {
    if (m_channel == ChannelState::LifeDrain) {
        EndLifeDrain(false);
        return;
    }
    ExitChannel();
}

bool AbilityController::EnterWhip(float duration) {
    if (IsHardChannel(m_channel) && m_channel != ChannelState::Whip) {
        return false;
    }
    EnterChannel(ChannelState::Whip);
    m_whipRemaining = duration;
    return true;
}

bool AbilityController::StartDash(const glm::vec3& direction, float speed, float duration) {
    if (IsHardChannel(m_channel) || duration <= 0.0f) {
        return false;
    }
    EnterChannel(ChannelState::Dashing);
    m_dash.direction = SafeNormalize(Flatten(direction), glm::vec3(0.0f));
    m_dash.speed = speed;
    m_dash.duration = duration;
    m_dash.remaining = duration;
    return true;
}

void AbilityController::UpdateChannels(float deltaTime, std::array<bool, kAbilitySlotCount>& pressed) {
    switch (m_channel) {
        case ChannelState::LifeDrain:
            UpdateLifeDrain(deltaTime, pressed);
            break;
        case ChannelState::Whip:
            m_whipRemaining -= deltaTime;
            if (m_whipRemaining <= 0.0f) {
                ExitChannel();
            }
            break;
        case ChannelState::Dashing:
            UpdateDash(deltaTime);
            break;
        default:
            break;
    }
}

void AbilityController::UpdateDash(float deltaTime) {
    const float step = std::min(deltaTime, m_dash.remaining);
    // Ease out: speed falls linearly to zero over the dash
    const float t = m_dash.remaining / m_dash.duration;
    m_actor.ApplyDisplacement(m_dash.direction * (m_dash.speed * t * step));
    m_dash.remaining -= deltaTime;
    if (m_dash.remaining <= 0.0f) {
        ExitChannel();
    }
}

// ============================================================================
// Life Drain
// ============================================================================

bool AbilityController::BeginLifeDrain() {
    if (IsHardChannel(m_channel)) {
        return false;
    }
    const AbilitySlotConfig& rules = m_kit->GetSlotRules(m_castingSlot);
    const TargetId target = m_targets.FindNearest(m_actor.GetPosition(), m_actor.GetForward(),
                                                  rules.Param("range", 16.0f),
                                                  rules.Param("minDot", 0.4f), false);
    if (target == kInvalidTarget) {
        return false;
    }

    m_drain = LifeDrainState{};
    m_drain.slot = m_castingSlot;
    m_drain.target = target;
    EnterChannel(ChannelState::LifeDrain);
    COMBAT_LOG_DEBUG("Life drain started on target {}", target);
    return true;
}

void AbilityController::UpdateLifeDrain(float deltaTime, std::array<bool, kAbilitySlotCount>& pressed) {
    const AbilitySlot slot = m_drain.slot;
    if (pressed[SlotIndex(slot)]) {
        pressed[SlotIndex(slot)] = false;
        EndLifeDrain(true);
        return;
    }

    const AbilitySlotConfig& rules = m_kit->GetSlotRules(slot);
    const float duration = rules.Param("duration", 2.5f);
    const float interval = std::max(rules.Param("tickInterval", 0.25f), 0.01f);
    const float range = rules.Param("range", 16.0f);

    const TargetId target = m_drain.target;
    if (!m_targets.IsTargetAlive(target) ||
        glm::length(m_targets.World().GetWorldPosition(target) - m_actor.GetPosition()) > range) {
        EndLifeDrain(false);
        return;
    }

    const float step = std::min(deltaTime, std::max(0.0f, duration - m_drain.elapsed));
    m_drain.elapsed += deltaTime;
    m_drain.tickTimer += step;

    HitSpec spec;
    spec.request.baseDamage = rules.Param("damage", 8.0f);
    spec.request.canCrit = false;
    spec.request.canBackstab = false;
    spec.kind = DamageKind::Ability;
    spec.tag = "life_drain";
    spec.ultimateTier = HitTier::Basic;

    while (m_drain.tickTimer + kTimeEpsilon >= interval) {
        m_drain.tickTimer -= interval;
        const HitOutcome outcome = m_hits.Apply(target, spec, m_targets.World().GetWorldPosition(target));
        if (!outcome.applied) {
            EndLifeDrain(false);
            return;
        }
        ++m_drain.ticks;
        const int heal = static_cast<int>(std::floor(static_cast<float>(outcome.damage.damage) *
                                                     rules.Param("healRatio", 1.0f)));
        if (heal > 0) {
            m_actor.Heal(heal);
        }
    }

    // Bonus kit charge per full second of channel
    const int perSecond = static_cast<int>(rules.Param("chargePerSecond", 1.0f));
    while (m_drain.elapsed + kTimeEpsilon >= static_cast<float>(m_drain.secondsGranted + 1)) {
        ++m_drain.secondsGranted;
        if (!m_kit->IsResourcePerTarget() && perSecond > 0) {
            m_economy.AddCharge(m_kit->GetChargeResource(), perSecond);
        }
    }

    if (m_drain.elapsed + kTimeEpsilon >= duration) {
        EndLifeDrain(false);
    }
}

void AbilityController::EndLifeDrain(bool cancelled) {
    const AbilitySlot slot = m_drain.slot;
    const AbilitySlotConfig& rules = m_kit->GetSlotRules(slot);
    m_cooldowns[SlotIndex(slot)] = cancelled ? rules.Param("cancelCooldown", 2.5f) : rules.cooldown;
    COMBAT_LOG_DEBUG("Life drain ended after {} ticks ({})", m_drain.ticks, cancelled ? "cancelled" : "finished");
    ExitChannel();
}

void AbilityController::OnTargetRemoved(TargetId target) {
    if (m_channel == ChannelState::LifeDrain && m_drain.target == target) {
        EndLifeDrain(false);
    }
    if (m_kit) {
        m_kit->OnTargetRemoved(target);
    }
}

// ============================================================================
// Ability Slots
// ============================================================================

bool AbilityController::CanActivate(AbilitySlot slot) const {
    const AbilitySlotConfig& rules = m_kit->GetSlotRules(slot);
    if (!rules.enabled) {
        return false;
    }
    if (m_cooldowns[SlotIndex(slot)] > 0.0f) {
        return false;
    }
    if (IsHardChannel(m_channel) || m_windup.active) {
        return false;
    }
    if (m_kit->IsSlotBusy(slot)) {
        return false;
    }
    if (rules.requiresUltimate && !m_economy.CanUseUltimate()) {
        return false;
    }
    if (rules.requiredCharges > 0 && !m_kit->IsResourcePerTarget() &&
        !m_economy.HasCharges(m_kit->GetChargeResource(), rules.requiredCharges)) {
        return false;
    }
    return true;
}

void AbilityController::TryActivate(AbilitySlot slot, const CombatIntent& intent, bool confirmTargeting) {
    if (!CanActivate(slot)) {
        COMBAT_LOG_TRACE("Slot {} rejected", AbilitySlotToString(slot));
        return;
    }

    const AbilitySlotConfig& rules = m_kit->GetSlotRules(slot);
    if (rules.activation == AbilityActivation::Targeted && !confirmTargeting) {
        m_targeting.active = false;
        m_targeting.point = ClampTargetPoint(intent);
        m_targeting.slot = slot;
        m_targeting.active = true;
        return;
    }

    AbilityInvocation invocation;
    invocation.slot = slot;
    invocation.multiplier = rules.Param("multiplier", 1.0f);
    if (confirmTargeting) {
        invocation.hasTargetPoint = true;
        invocation.targetPoint = m_targeting.point;
    }
    if (rules.consumesCharges && !m_kit->IsResourcePerTarget()) {
        invocation.chargesUsed = m_economy.ConsumeAll(m_kit->GetChargeResource());
    }

    if (rules.activation == AbilityActivation::Windup && rules.windup > 0.0f) {
        m_windup.active = true;
        m_windup.remaining = rules.windup;
        m_windup.invocation = invocation;
        return;
    }
    ResolveCast(invocation);
}

void AbilityController::ResolveCast(const AbilityInvocation& invocation) {
    m_castingSlot = invocation.slot;
    const AbilityOutcome outcome = m_kit->Execute(invocation);
    FinishCast(invocation, outcome);
}

void AbilityController::FinishCast(const AbilityInvocation& invocation, AbilityOutcome outcome) {
    const AbilitySlot slot = invocation.slot;
    const AbilitySlotConfig& rules = m_kit->GetSlotRules(slot);

    switch (outcome) {
        case AbilityOutcome::Rejected:
            if (invocation.chargesUsed > 0) {
                m_economy.RestoreCharge(m_kit->GetChargeResource(), invocation.chargesUsed);
            }
            COMBAT_LOG_TRACE("Slot {} found nothing to do", AbilitySlotToString(slot));
            return;
        case AbilityOutcome::Fizzled:
            return;
        case AbilityOutcome::Committed:
            break;
    }

    // Channel cooldowns start when the channel ends
    if (rules.activation != AbilityActivation::Channel) {
        m_cooldowns[SlotIndex(slot)] = rules.cooldown;
    }
    if (rules.requiresUltimate) {
        m_economy.UseUltimate();
    }
    COMBAT_LOG_DEBUG("{} ({}) cast with {} charges", rules.name, AbilitySlotToString(slot), invocation.chargesUsed);
}

// ============================================================================
// Attacks
// ============================================================================

void AbilityController::UpdateAttacks(float deltaTime, const CombatIntent& intent, bool attackAvailable) {
    if (IsHardChannel(m_channel)) {
        return;
    }
    const AttackTiming& timing = m_kit->GetConfig().attack;

    if (m_channel == ChannelState::ChargedAttacking) {
        m_chargedRecovery -= deltaTime;
        if (m_chargedRecovery <= 0.0f) {
            ExitChannel();
        }
        return;
    }

    if (m_channel == ChannelState::Attacking) {
        const float duration = std::max(timing.duration, 0.001f);
        const float previous = m_attackElapsed / duration;
        m_attackElapsed += deltaTime;
        const float progress = m_attackElapsed / duration;
        // The weapon is extended through the middle of the swing
        if (!m_swingHit && progress >= kHitWindowStart && previous <= kHitWindowEnd) {
            PerformMeleeStrike(HitTier::Basic);
        }
        if (m_attackElapsed >= duration) {
            ExitChannel();
        }
        return;
    }

    if (intent.chargedAttackRelease) {
        ReleaseChargedAttack();
        return;
    }
    if (intent.chargedAttack) {
        EnterChannel(ChannelState::Charging);
        m_chargeTimer = std::min(timing.chargeDuration, m_chargeTimer + deltaTime);
        return;
    }
    if (m_channel == ChannelState::Charging) {
        // Let go without a release event
        ExitChannel();
        return;
    }
    if (attackAvailable) {
        StartAttack();
    }
}

void AbilityController::StartAttack() {
    const KitConfig& config = m_kit->GetConfig();
    if (!m_actor.TryConsumeResource(config.weapon.staminaCost)) {
        return;
    }

    const AttackTiming& timing = config.attack;
    const int combo = m_economy.GetComboCount();
    const float sinceLast = m_clock - m_lastAttackTime;
    if (sinceLast < timing.comboWindow + timing.duration && combo < timing.maxCombo && combo > 0) {
        m_economy.SetComboCount(combo + 1);
    } else {
        m_economy.SetComboCount(1);
    }

    m_lastAttackTime = m_clock;
    m_comboTimer = timing.comboWindow + timing.duration;
    m_swingHit = false;
    EnterChannel(ChannelState::Attacking);
    m_attackElapsed = 0.0f;

    m_kit->OnBasicAttack(m_economy.GetComboCount());
}

void AbilityController::ReleaseChargedAttack() {
    const AttackTiming& timing = m_kit->GetConfig().attack;
    const float charge = m_chargeTimer;

    if (m_channel == ChannelState::Charging) {
        ExitChannel();
    }
    m_chargeTimer = 0.0f;

    if (charge + kTimeEpsilon < timing.chargeDuration) {
        return;
    }
    if (!m_actor.TryConsumeResource(timing.chargedStaminaCost)) {
        return;
    }

    EnterChannel(ChannelState::ChargedAttacking);
    m_chargedRecovery = timing.chargedRecovery;
    m_kit->OnChargedRelease(charge);
}

bool AbilityController::PerformMeleeStrike(HitTier tier) {
    const KitConfig& config = m_kit->GetConfig();
    const TargetId target = m_targets.FindNearest(m_actor.GetWeaponPosition(), m_actor.GetForward(),
                                                  config.weapon.range, kMeleeMinDot, true);
    if (target == kInvalidTarget) {
        return false;
    }
    m_swingHit = true;

    HitSpec spec;
    spec.request.baseDamage = m_kit->GetMeleeDamage(tier);
    spec.request.applyCombo = true;
    spec.request.consumeNextAttack = true;
    spec.request.applyTimedBuffs = true;
    spec.kind = tier == HitTier::Charged ? DamageKind::Heavy : DamageKind::Normal;
    spec.tag = tier == HitTier::Charged ? "melee_charged" : "melee";
    spec.ultimateTier = tier;

    const HitOutcome outcome = m_hits.Apply(target, spec, m_targets.World().GetWorldPosition(target));
    if (!outcome.applied) {
        return false;
    }
    if (tier == HitTier::Charged) {
        m_kit->OnChargedHit(target);
    } else {
        m_kit->OnBasicHit(target);
    }
    return true;
}

void AbilityController::UpdateCombo(float deltaTime) {
    if (m_comboTimer <= 0.0f) {
        return;
    }
    m_comboTimer -= deltaTime;
    if (m_comboTimer <= 0.0f) {
        m_comboTimer = 0.0f;
        m_economy.SetComboCount(0);
    }
}

} // namespace Crimson::Combat
