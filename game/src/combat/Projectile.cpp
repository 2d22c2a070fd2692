#include "combat/Projectile.hpp"

namespace Crimson::Combat {

void Projectile::Initialize(EffectHandle handle, const EffectSpawnDesc& desc) {
    m_handle = handle;
    m_desc = desc;
    m_position = desc.origin;
    m_velocity = desc.direction * desc.speed;
    m_age = 0.0f;
    m_hitTargets.clear();
    m_released = false;
    m_fresh = true;
}

void Projectile::Update(float deltaTime) {
    m_position += m_velocity * deltaTime;
    m_age += deltaTime;
}

void Projectile::Reset() {
    m_handle = kInvalidEffect;
    m_desc = EffectSpawnDesc{};
    m_position = glm::vec3(0.0f);
    m_velocity = glm::vec3(0.0f);
    m_age = 0.0f;
    m_hitTargets.clear();
    m_released = false;
    m_fresh = false;
}

bool Projectile::HasHit(TargetId target) const {
    return m_hitTargets.find(target) != m_hitTargets.end();
}

void Projectile::MarkHit(TargetId target) {
    m_hitTargets.insert(target);
}

bool Projectile::Overlaps(const glm::vec3& point, float reach) const {
    const float bodyReach = reach + m_desc.radius;
    if (m_desc.shape == EffectShape::Segment) {
        const glm::vec3 end = m_position + m_desc.direction * m_desc.length;
        return PlanarDistanceToSegment(point, m_position, end) < bodyReach;
    }
    const float distance = m_desc.planarHitTest ? PlanarDistance(m_position, point)
                                                : glm::length(m_position - point);
    return distance < bodyReach;
}

} // namespace Crimson::Combat
