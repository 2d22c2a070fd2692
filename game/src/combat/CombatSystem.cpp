#include "combat/CombatSystem.hpp"
#include "config/Config.hpp"
#include "core/Logger.hpp"
#include <algorithm>

namespace Crimson::Combat {

CombatSystem::CombatSystem(ITargetWorld& world,
                           IActorState& actor,
                           IEffectSink& effects,
                           IEventEmitter& events,
                           IRandomSource& random,
                           const CombatTuning& tuning)
    : m_world(world)
    , m_actor(actor)
    , m_effects(effects)
    , m_events(events)
    , m_random(random)
    , m_tuning(tuning)
    , m_targets(world, tuning.bossHitRadius, tuning.defaultHitRadius)
    , m_economy(MakeUltimateConfig(tuning), tuning.decayCheckInterval)
    , m_status()
    , m_pipeline(m_economy, m_status, world, actor, random)
    , m_hits(m_targets, m_pipeline, m_status, m_economy, effects, events)
    , m_projectiles(m_targets, m_hits, effects, MakeProjectileConfig(tuning))
    , m_controller(m_targets, m_economy, m_status, m_pipeline, m_hits, m_projectiles,
                   actor, effects, random, tuning.targetingMinDistance) {
    m_pipeline.SetBackstabThreshold(tuning.backstabThreshold);

    m_targets.SetOnRemoved([this](TargetId target) { OnTargetRemoved(target); });
    m_status.SetTargetValidator([this](TargetId target) { return m_targets.Contains(target); });
    m_status.SetOnPoisonTick([this](TargetId target, int damage) { OnPoisonTick(target, damage); });
}

CombatSystem::~CombatSystem() {
    Shutdown();
}

ProjectileManagerConfig CombatSystem::MakeProjectileConfig(const CombatTuning& tuning) {
    ProjectileManagerConfig config;
    config.poolCapacity = static_cast<size_t>(std::max(tuning.poolCapacity, 0));
    config.basicHitPadding = tuning.basicHitPadding;
    config.chargedHitPadding = tuning.chargedHitPadding;
    return config;
}

UltimateConfig CombatSystem::MakeUltimateConfig(const CombatTuning& tuning) {
    UltimateConfig config;
    config.basicGain = tuning.ultimateBasicGain;
    config.chargedGain = tuning.ultimateChargedGain;
    config.max = tuning.ultimateMax;
    return config;
}

// ============================================================================
// Lifecycle
// ============================================================================

bool CombatSystem::Initialize(KitId kit) {
    ValidationResult result;
    KitConfig config = BuildKitConfig(kit, Config::Instance().GetJson(), result);
    for (const auto& warning : result.warnings) {
        COMBAT_LOG_WARN("Kit config: {}", warning);
    }
    for (const auto& error : result.errors) {
        COMBAT_LOG_ERROR("Kit config: {}", error);
    }
    return Initialize(config);
}

bool CombatSystem::Initialize(const KitConfig& kit) {
    if (m_initialized) {
        return SwitchKit(kit);
    }

    const ValidationResult tuningCheck = m_tuning.Validate();
    for (const auto& error : tuningCheck.errors) {
        COMBAT_LOG_ERROR("Combat tuning: {}", error);
    }

    if (!SwitchKit(kit)) {
        return false;
    }
    WarmupPools();

    m_initialized = true;
    COMBAT_LOG_INFO("Combat system initialized with kit '{}'", kit.displayName);
    return true;
}

bool CombatSystem::SwitchKit(const KitConfig& kit) {
    const ValidationResult check = kit.Validate();
    if (!check.valid) {
        for (const auto& error : check.errors) {
            COMBAT_LOG_ERROR("Kit '{}': {}", KitIdToString(kit.id), error);
        }
        COMBAT_LOG_WARN("Falling back to default tuning for kit '{}'", KitIdToString(kit.id));
        m_controller.BindKit(KitConfig::Defaults(kit.id));
        return true;
    }
    m_controller.BindKit(kit);
    return true;
}

void CombatSystem::Shutdown() {
    if (!m_initialized) {
        return;
    }

    m_controller.UnbindKit();
    m_projectiles.Clear();
    m_status.Clear();
    m_economy.Reset();

    m_initialized = false;
    COMBAT_LOG_INFO("Combat system shut down");
}

void CombatSystem::WarmupPools() {
    const auto capacity = static_cast<size_t>(std::max(m_tuning.poolCapacity, 0));
    const auto basic = std::min(static_cast<size_t>(std::max(m_tuning.warmupBasic, 0)), capacity);
    const auto charged = std::min(static_cast<size_t>(std::max(m_tuning.warmupCharged, 0)), capacity);

    for (size_t i = 0; i < kEffectKindCount; ++i) {
        const auto kind = static_cast<EffectKind>(i);
        m_projectiles.Warmup(kind, HitTier::Basic, basic);
        m_projectiles.Warmup(kind, HitTier::Charged, charged);
    }
}

void CombatSystem::Update(float deltaTime, const CombatIntent& intent) {
    if (!m_initialized || deltaTime <= 0.0f) {
        return;
    }

    m_controller.Update(deltaTime, intent);
    m_projectiles.Update(deltaTime);
    m_status.Update(deltaTime);
    m_economy.Update(deltaTime);
}

// ============================================================================
// Targets
// ============================================================================

bool CombatSystem::AddTarget(TargetId target) {
    return m_targets.Add(target);
}

bool CombatSystem::RemoveTarget(TargetId target) {
    return m_targets.Remove(target);
}

void CombatSystem::OnTargetRemoved(TargetId target) {
    m_status.Forget(target);
    m_economy.ForgetOwner(target);
    m_projectiles.ForgetTarget(target);
    m_controller.OnTargetRemoved(target);
    COMBAT_LOG_DEBUG("Target {} removed", target);
}

void CombatSystem::OnPoisonTick(TargetId target, int damage) {
    if (damage <= 0 || !m_targets.IsTargetAlive(target)) {
        return;
    }
    m_world.TakeDamage(target, damage);

    DamageResult result;
    result.damage = damage;
    m_hits.EmitDamageNumber(target, m_world.GetWorldPosition(target), result, DamageKind::Poison);
}

} // namespace Crimson::Combat
