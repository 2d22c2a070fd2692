#pragma once

#include "combat/CombatInterfaces.hpp"
#include <functional>
#include <vector>

namespace Crimson::Combat {

/**
 * @brief Non-owning flat registry of the targets the core may hit
 *
 * Populated by the host spawner. Removal requested while a scan is running
 * is deferred until the outermost scan finishes, so scans never skip or
 * double-visit entries.
 */
class TargetRegistry {
public:
    using RemovedCallback = std::function<void(TargetId target)>;

    explicit TargetRegistry(ITargetWorld& world, float bossHitRadius = 2.5f, float defaultHitRadius = 0.8f);
    ~TargetRegistry() = default;

    TargetRegistry(const TargetRegistry&) = delete;
    TargetRegistry& operator=(const TargetRegistry&) = delete;

    /**
     * @brief Register a target
     * @return false for the invalid id or a duplicate
     */
    bool Add(TargetId target);

    /**
     * @brief Unregister a target (deferred while scanning)
     * @return false if the target is not registered
     */
    bool Remove(TargetId target);

    [[nodiscard]] bool Contains(TargetId target) const;
    [[nodiscard]] size_t Count() const { return m_targets.size(); }
    [[nodiscard]] bool IsScanning() const { return m_scanDepth > 0; }

    /**
     * @brief Invoke @p fn on every registered living target
     *
     * A std::exception escaping @p fn for one target is logged and the scan
     * continues with the next. Returning false from @p fn stops the scan.
     */
    void ForEachLiving(const std::function<bool(TargetId)>& fn);

    /**
     * @brief Nearest living target inside a forward cone
     * @param origin Point distances are measured from
     * @param forward Cone axis (need not be normalized)
     * @param range Maximum center distance
     * @param minDot Minimum dot(forward, toTarget)
     * @param addHitRadius Extend the range by the target's hit radius
     */
    [[nodiscard]] TargetId FindNearest(const glm::vec3& origin, const glm::vec3& forward,
                                       float range, float minDot, bool addHitRadius);

    /**
     * @brief Hit radius with the boss/default fallback applied
     */
    [[nodiscard]] float HitRadiusOf(TargetId target) const;

    /**
     * @brief Registered and alive according to the world
     */
    [[nodiscard]] bool IsTargetAlive(TargetId target) const;

    void SetOnRemoved(RemovedCallback callback) { m_onRemoved = std::move(callback); }

    [[nodiscard]] ITargetWorld& World() { return m_world; }
    [[nodiscard]] const ITargetWorld& World() const { return m_world; }

    void Clear();

private:
    void FinishRemoval(TargetId target);
    void FlushPendingRemovals();
    [[nodiscard]] bool IsPendingRemoval(TargetId target) const;

    ITargetWorld& m_world;
    std::vector<TargetId> m_targets;
    std::vector<TargetId> m_pendingRemoval;
    RemovedCallback m_onRemoved;
    float m_bossHitRadius;
    float m_defaultHitRadius;
    int m_scanDepth = 0;
};

} // namespace Crimson::Combat
