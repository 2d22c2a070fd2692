#pragma once

#include "combat/Projectile.hpp"
#include <array>
#include <memory>
#include <optional>
#include <vector>

namespace Crimson::Combat {

class TargetRegistry;

/**
 * @brief Pool sizing and hit padding
 */
struct ProjectileManagerConfig {
    size_t poolCapacity = 8;        // Free instances kept per (kind, tier)
    float basicHitPadding = 0.3f;
    float chargedHitPadding = 0.6f;
};

/**
 * @brief Pooled lifecycle of every spawned effect
 *
 * Spawn pops a free instance of the matching kind and tier, or allocates
 * one when that pool is empty. Update integrates, hit-tests against the
 * target registry and expires effects; finished instances go back to their
 * pool while it has room and are destroyed otherwise.
 */
class ProjectileManager {
public:
    ProjectileManager(TargetRegistry& targets,
                      HitResolver& hits,
                      IEffectSink& effects,
                      const ProjectileManagerConfig& config = {});
    ~ProjectileManager() = default;

    ProjectileManager(const ProjectileManager&) = delete;
    ProjectileManager& operator=(const ProjectileManager&) = delete;

    /**
     * @brief Spawn an effect
     * @return Handle, or kInvalidEffect for a zero-length direction
     */
    EffectHandle Spawn(const EffectSpawnDesc& desc);

    /**
     * @brief Advance every effect that was live when the frame started
     */
    void Update(float deltaTime);

    /**
     * @brief Force early removal (deferred to the end of a running update)
     * @return false for an unknown or already disposed handle
     */
    bool Dispose(EffectHandle handle);

    [[nodiscard]] bool IsAlive(EffectHandle handle) const;
    [[nodiscard]] std::optional<glm::vec3> GetPosition(EffectHandle handle) const;

    /**
     * @brief Change the base damage of a live effect (e.g. a growing orb)
     */
    bool SetBaseDamage(EffectHandle handle, float damage);

    /**
     * @brief Pre-allocate free instances so early casts do not allocate
     */
    void Warmup(EffectKind kind, HitTier tier, size_t count);

    /**
     * @brief Remove a target from every live already-hit set
     */
    void ForgetTarget(TargetId target);

    /**
     * @brief Dispose every live effect
     */
    void Clear();

    [[nodiscard]] size_t GetLiveCount() const;
    [[nodiscard]] size_t GetPooledCount(EffectKind kind, HitTier tier) const;
    [[nodiscard]] size_t GetAllocationCount() const { return m_allocations; }
    [[nodiscard]] const ProjectileManagerConfig& GetConfig() const { return m_config; }

private:
    using ProjectilePtr = std::unique_ptr<Projectile>;

    static constexpr size_t kTierCount = 2;

    [[nodiscard]] static size_t PoolIndex(EffectKind kind, HitTier tier);
    [[nodiscard]] Projectile* Find(EffectHandle handle);
    [[nodiscard]] const Projectile* Find(EffectHandle handle) const;

    void StepEffect(Projectile& effect, float deltaTime);
    void HitTargets(Projectile& effect);
    void ApplyBurst(Projectile& effect, TargetId primary, const HitOutcome& outcome,
                    const glm::vec3& center);
    void NotifyExpired(const Projectile& effect);
    void CollectReleased();
    void Recycle(ProjectilePtr effect);

    TargetRegistry& m_targets;
    HitResolver& m_hits;
    IEffectSink& m_effects;
    ProjectileManagerConfig m_config;

    std::vector<ProjectilePtr> m_live;
    std::array<std::vector<ProjectilePtr>, kEffectKindCount * kTierCount> m_pools;

    EffectHandle m_nextHandle = 1;
    size_t m_allocations = 0;
    bool m_updating = false;
};

} // namespace Crimson::Combat
