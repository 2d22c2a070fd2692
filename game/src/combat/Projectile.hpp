#pragma once

#include "combat/HitResolver.hpp"
#include <glm/glm.hpp>
#include <functional>
#include <string>
#include <unordered_set>

namespace Crimson::Combat {

// ============================================================================
// Spawn Description
// ============================================================================

/**
 * @brief Hit-test volume of an effect
 */
enum class EffectShape : uint8_t {
    Sphere,     // Distance from the effect position
    Segment     // Distance from the segment position .. position + direction * length
};

/**
 * @brief Secondary area burst resolved once around a primary hit
 */
struct AreaBurst {
    float radius = 0.0f;            // 0 disables the burst
    float damageScale = 0.6f;       // Fraction of the primary hit's damage
};

/**
 * @brief Everything needed to spawn a pooled effect
 */
struct EffectSpawnDesc {
    EffectKind kind = EffectKind::Bolt;
    HitTier tier = HitTier::Basic;
    std::string tag;

    glm::vec3 origin{0.0f};
    glm::vec3 direction{0.0f, 0.0f, 1.0f};
    float speed = 0.0f;
    float maxLifetime = 1.0f;
    bool pierce = false;

    EffectShape shape = EffectShape::Sphere;
    float length = 0.0f;            // Segment length
    float radius = 0.0f;            // Effect body radius, added to the hit distance
    float hitPadding = -1.0f;       // < 0 uses the tier default padding
    bool planarHitTest = true;      // Measure hits on the XZ plane
    bool hitsTargets = true;

    HitSpec hit;
    AreaBurst burst;

    /// Adjust the hit per target just before it is resolved
    std::function<void(TargetId, HitSpec&)> prepareHit;
    /// Observe a resolved hit
    std::function<void(TargetId, const HitOutcome&, const glm::vec3&)> onHit;
};

// ============================================================================
// Projectile
// ============================================================================

/**
 * @brief One pooled effect instance (bolt, blade, arrow, beam, orb, shard)
 *
 * Instances are recycled: Reset() clears every per-use field, including the
 * already-hit set, before the instance goes back to its pool.
 */
class Projectile {
public:
    Projectile() = default;
    ~Projectile() = default;

    Projectile(const Projectile&) = delete;
    Projectile& operator=(const Projectile&) = delete;

    /**
     * @brief Prepare the instance for a new flight
     * @param handle Fresh handle assigned by the manager
     * @param desc Spawn description (direction must be normalized)
     */
    void Initialize(EffectHandle handle, const EffectSpawnDesc& desc);

    /**
     * @brief Integrate position and age
     */
    void Update(float deltaTime);

    /**
     * @brief Clear per-use state before returning to a pool
     */
    void Reset();

    [[nodiscard]] bool IsExpired() const { return m_age >= m_desc.maxLifetime; }

    [[nodiscard]] bool HasHit(TargetId target) const;
    void MarkHit(TargetId target);
    void ForgetTarget(TargetId target) { m_hitTargets.erase(target); }
    [[nodiscard]] size_t GetHitCount() const { return m_hitTargets.size(); }

    void Release() { m_released = true; }
    [[nodiscard]] bool IsReleased() const { return m_released; }

    /// Effects spawned during the current frame are not ticked until the next one
    [[nodiscard]] bool IsFresh() const { return m_fresh; }
    void ClearFresh() { m_fresh = false; }

    /**
     * @brief Whether @p point lies within @p reach of the hit volume
     */
    [[nodiscard]] bool Overlaps(const glm::vec3& point, float reach) const;

    // Getters
    [[nodiscard]] EffectHandle GetHandle() const { return m_handle; }
    [[nodiscard]] EffectKind GetKind() const { return m_desc.kind; }
    [[nodiscard]] HitTier GetTier() const { return m_desc.tier; }
    [[nodiscard]] const glm::vec3& GetPosition() const { return m_position; }
    [[nodiscard]] const glm::vec3& GetVelocity() const { return m_velocity; }
    [[nodiscard]] float GetAge() const { return m_age; }
    [[nodiscard]] const EffectSpawnDesc& GetDesc() const { return m_desc; }
    [[nodiscard]] EffectSpawnDesc& GetDesc() { return m_desc; }

private:
    EffectHandle m_handle = kInvalidEffect;
    EffectSpawnDesc m_desc;

    glm::vec3 m_position{0.0f};
    glm::vec3 m_velocity{0.0f};
    float m_age = 0.0f;

    std::unordered_set<TargetId> m_hitTargets;
    bool m_released = false;
    bool m_fresh = false;
};

} // namespace Crimson::Combat
