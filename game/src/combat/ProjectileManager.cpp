#include "combat/ProjectileManager.hpp"
#include "combat/TargetRegistry.hpp"
#include "core/Assert.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <exception>

namespace Crimson::Combat {

ProjectileManager::ProjectileManager(TargetRegistry& targets,
                                     HitResolver& hits,
                                     IEffectSink& effects,
                                     const ProjectileManagerConfig& config)
    : m_targets(targets)
    , m_hits(hits)
    , m_effects(effects)
    , m_config(config) {
}

// ============================================================================
// Lifecycle
// ============================================================================

EffectHandle ProjectileManager::Spawn(const EffectSpawnDesc& desc) {
    const float length = glm::length(desc.direction);
    if (!(length >= kDirectionEpsilon)) {
        PROJECTILE_LOG_ERROR("Refusing to spawn {} effect '{}' with a zero-length direction",
                         EffectKindToString(desc.kind), desc.tag);
        CRIMSON_ASSERT_MSG(false, "Effect spawned with zero-length direction");
        return kInvalidEffect;
    }

    auto& pool = m_pools[PoolIndex(desc.kind, desc.tier)];
    ProjectilePtr effect;
    if (!pool.empty()) {
        effect = std::move(pool.back());
        pool.pop_back();
    } else {
        effect = std::make_unique<Projectile>();
        ++m_allocations;
        PROJECTILE_LOG_DEBUG("Pool for '{}' empty, allocated effect #{}", desc.tag, m_allocations);
    }

    EffectSpawnDesc normalized = desc;
    normalized.direction = desc.direction / length;
    if (normalized.hitPadding < 0.0f) {
        normalized.hitPadding = desc.tier == HitTier::Charged ? m_config.chargedHitPadding
                                                              : m_config.basicHitPadding;
    }

    const EffectHandle handle = m_nextHandle++;
    effect->Initialize(handle, normalized);
    if (m_updating) {
        // Appended past the running scan, so the next update is its first tick
        effect->ClearFresh();
    }
    m_live.push_back(std::move(effect));
    return handle;
}

void ProjectileManager::Update(float deltaTime) {
    m_updating = true;
    const size_t count = m_live.size();
    for (size_t i = 0; i < count; ++i) {
        Projectile& effect = *m_live[i];
        if (effect.IsReleased()) {
            continue;
        }
        if (effect.IsFresh()) {
            effect.ClearFresh();
            continue;
        }
        try {
            StepEffect(effect, deltaTime);
        } catch (const std::exception& e) {
            PROJECTILE_LOG_ERROR("Disposing effect {} after error during update: {}",
                             effect.GetHandle(), e.what());
            effect.Release();
        }
    }
    m_updating = false;

    CollectReleased();
}

bool ProjectileManager::Dispose(EffectHandle handle) {
    Projectile* effect = Find(handle);
    if (!effect || effect->IsReleased()) {
        PROJECTILE_LOG_ERROR("Dispose of unknown or already disposed effect {}", handle);
        CRIMSON_ASSERT_MSG(false, "Dispose of unknown effect handle");
        return false;
    }
    effect->Release();
    if (!m_updating) {
        CollectReleased();
    }
    return true;
}

bool ProjectileManager::IsAlive(EffectHandle handle) const {
    const Projectile* effect = Find(handle);
    return effect && !effect->IsReleased();
}

std::optional<glm::vec3> ProjectileManager::GetPosition(EffectHandle handle) const {
    const Projectile* effect = Find(handle);
    if (!effect || effect->IsReleased()) {
        return std::nullopt;
    }
    return effect->GetPosition();
}

bool ProjectileManager::SetBaseDamage(EffectHandle handle, float damage) {
    Projectile* effect = Find(handle);
    if (!effect || effect->IsReleased()) {
        return false;
    }
    effect->GetDesc().hit.request.baseDamage = damage;
    return true;
}

void ProjectileManager::Warmup(EffectKind kind, HitTier tier, size_t count) {
    auto& pool = m_pools[PoolIndex(kind, tier)];
    const size_t target = std::min(count, m_config.poolCapacity);
    while (pool.size() < target) {
        pool.push_back(std::make_unique<Projectile>());
        ++m_allocations;
    }
}

void ProjectileManager::ForgetTarget(TargetId target) {
    for (auto& effect : m_live) {
        effect->ForgetTarget(target);
    }
}

void ProjectileManager::Clear() {
    for (auto& effect : m_live) {
        effect->Release();
    }
    if (!m_updating) {
        CollectReleased();
    }
}

size_t ProjectileManager::GetLiveCount() const {
    return static_cast<size_t>(std::count_if(m_live.begin(), m_live.end(),
        [](const ProjectilePtr& effect) { return !effect->IsReleased(); }));
}

size_t ProjectileManager::GetPooledCount(EffectKind kind, HitTier tier) const {
    return m_pools[PoolIndex(kind, tier)].size();
}

// ============================================================================
// Internals
// ============================================================================

size_t ProjectileManager::PoolIndex(EffectKind kind, HitTier tier) {
    return static_cast<size_t>(kind) * kTierCount + static_cast<size_t>(tier);
}

Projectile* ProjectileManager::Find(EffectHandle handle) {
    for (auto& effect : m_live) {
        if (effect->GetHandle() == handle) {
            return effect.get();
        }
    }
    return nullptr;
}

const Projectile* ProjectileManager::Find(EffectHandle handle) const {
    for (const auto& effect : m_live) {
        if (effect->GetHandle() == handle) {
            return effect.get();
        }
    }
    return nullptr;
}

void ProjectileManager::StepEffect(Projectile& effect, float deltaTime) {
    effect.Update(deltaTime);

    if (effect.GetDesc().hitsTargets) {
        HitTargets(effect);
    }

    if (!effect.IsReleased() && effect.IsExpired()) {
        NotifyExpired(effect);
        effect.Release();
    }
}

void ProjectileManager::HitTargets(Projectile& effect) {
    ITargetWorld& world = m_targets.World();

    m_targets.ForEachLiving([&](TargetId target) {
        if (effect.HasHit(target)) {
            return true;
        }
        const EffectSpawnDesc& desc = effect.GetDesc();
        const glm::vec3 targetPosition = world.GetWorldPosition(target);
        const float reach = m_targets.HitRadiusOf(target) + desc.hitPadding;
        if (!effect.Overlaps(targetPosition, reach)) {
            return true;
        }

        effect.MarkHit(target);

        HitSpec spec = desc.hit;
        if (desc.prepareHit) {
            desc.prepareHit(target, spec);
        }
        const HitOutcome outcome = m_hits.Apply(target, spec, targetPosition);
        if (outcome.applied) {
            if (desc.burst.radius > 0.0f) {
                ApplyBurst(effect, target, outcome, effect.GetPosition());
            }
            if (desc.onHit) {
                desc.onHit(target, outcome, targetPosition);
            }
        }

        if (!desc.pierce) {
            effect.Release();
            return false;
        }
        return true;
    });
}

void ProjectileManager::ApplyBurst(Projectile& effect, TargetId primary,
                                   const HitOutcome& outcome, const glm::vec3& center) {
    const EffectSpawnDesc& desc = effect.GetDesc();
    ITargetWorld& world = m_targets.World();

    HitSpec spec;
    spec.request.baseDamage = std::floor(static_cast<float>(outcome.damage.damage) * desc.burst.damageScale);
    spec.request.canCrit = false;
    spec.request.canBackstab = false;
    spec.kind = DamageKind::Ability;
    spec.grantsUltimate = false;
    spec.tag = desc.tag + "_burst";

    int hits = 0;
    m_targets.ForEachLiving([&](TargetId other) {
        if (other == primary) {
            return true;
        }
        const glm::vec3 position = world.GetWorldPosition(other);
        if (PlanarDistance(position, center) > desc.burst.radius) {
            return true;
        }
        if (m_hits.Apply(other, spec, position).applied) {
            ++hits;
        }
        return true;
    });

    EffectPayload payload;
    payload.position = center;
    payload.radius = desc.burst.radius;
    payload.hits = hits;
    m_effects.OnAbilityFired(spec.tag, payload);
}

void ProjectileManager::NotifyExpired(const Projectile& effect) {
    EffectPayload payload;
    payload.position = effect.GetPosition();
    payload.direction = effect.GetDesc().direction;
    payload.hits = static_cast<int>(effect.GetHitCount());
    payload.isCharged = effect.GetTier() == HitTier::Charged;
    payload.isUltimate = effect.GetDesc().hit.isUltimate;
    m_effects.OnExpire(effect.GetDesc().tag, payload);
}

void ProjectileManager::CollectReleased() {
    for (auto it = m_live.begin(); it != m_live.end();) {
        if ((*it)->IsReleased()) {
            ProjectilePtr effect = std::move(*it);
            it = m_live.erase(it);
            Recycle(std::move(effect));
        } else {
            ++it;
        }
    }
}

void ProjectileManager::Recycle(ProjectilePtr effect) {
    auto& pool = m_pools[PoolIndex(effect->GetKind(), effect->GetTier())];
    effect->Reset();
    if (pool.size() < m_config.poolCapacity) {
        pool.push_back(std::move(effect));
    }
    // Otherwise the instance is destroyed when it goes out of scope
}

} // namespace Crimson::Combat
