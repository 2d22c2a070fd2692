#include "combat/TargetRegistry.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <exception>
#include <limits>

namespace Crimson::Combat {

TargetRegistry::TargetRegistry(ITargetWorld& world, float bossHitRadius, float defaultHitRadius)
    : m_world(world)
    , m_bossHitRadius(bossHitRadius)
    , m_defaultHitRadius(defaultHitRadius) {
}

bool TargetRegistry::Add(TargetId target) {
    if (target == kInvalidTarget) {
        COMBAT_LOG_WARN("Refusing to register the invalid target id");
        return false;
    }
    if (Contains(target)) {
        // Re-adding a target whose removal is still pending cancels the removal
        auto pending = std::find(m_pendingRemoval.begin(), m_pendingRemoval.end(), target);
        if (pending != m_pendingRemoval.end()) {
            m_pendingRemoval.erase(pending);
            return true;
        }
        return false;
    }
    m_targets.push_back(target);
    return true;
}

bool TargetRegistry::Remove(TargetId target) {
    if (!Contains(target) || IsPendingRemoval(target)) {
        return false;
    }
    if (m_scanDepth > 0) {
        m_pendingRemoval.push_back(target);
        return true;
    }
    FinishRemoval(target);
    return true;
}

bool TargetRegistry::Contains(TargetId target) const {
    return std::find(m_targets.begin(), m_targets.end(), target) != m_targets.end();
}

void TargetRegistry::ForEachLiving(const std::function<bool(TargetId)>& fn) {
    ++m_scanDepth;
    // Targets added during the scan are not visited by it
    const size_t count = m_targets.size();
    for (size_t i = 0; i < count; ++i) {
        const TargetId target = m_targets[i];
        if (IsPendingRemoval(target)) {
            continue;
        }
        bool keepGoing = true;
        try {
            if (!m_world.IsAlive(target)) {
                continue;
            }
            keepGoing = fn(target);
        } catch (const std::exception& e) {
            COMBAT_LOG_WARN("Skipping target {} after error during scan: {}", target, e.what());
        }
        if (!keepGoing) {
            break;
        }
    }
    --m_scanDepth;

    if (m_scanDepth == 0) {
        FlushPendingRemovals();
    }
}

TargetId TargetRegistry::FindNearest(const glm::vec3& origin, const glm::vec3& forward,
                                     float range, float minDot, bool addHitRadius) {
    const glm::vec3 axis = SafeNormalize(forward, glm::vec3(0.0f, 0.0f, 1.0f));
    TargetId best = kInvalidTarget;
    float bestDistance = std::numeric_limits<float>::max();

    ForEachLiving([&](TargetId target) {
        const glm::vec3 toTarget = m_world.GetWorldPosition(target) - origin;
        const float distance = glm::length(toTarget);
        const float reach = range + (addHitRadius ? HitRadiusOf(target) : 0.0f);
        if (distance > reach) {
            return true;
        }
        const glm::vec3 direction = SafeNormalize(toTarget, axis);
        if (glm::dot(direction, axis) < minDot) {
            return true;
        }
        if (distance < bestDistance) {
            bestDistance = distance;
            best = target;
        }
        return true;
    });
    return best;
}

float TargetRegistry::HitRadiusOf(TargetId target) const {
    const float radius = m_world.GetHitRadius(target);
    if (radius > 0.0f) {
        return radius;
    }
    return m_world.IsBoss(target) ? m_bossHitRadius : m_defaultHitRadius;
}

bool TargetRegistry::IsTargetAlive(TargetId target) const {
    return Contains(target) && !IsPendingRemoval(target) && m_world.IsAlive(target);
}

void TargetRegistry::Clear() {
    if (m_scanDepth > 0) {
        for (TargetId target : m_targets) {
            if (!IsPendingRemoval(target)) {
                m_pendingRemoval.push_back(target);
            }
        }
        return;
    }
    const std::vector<TargetId> targets = m_targets;
    for (TargetId target : targets) {
        FinishRemoval(target);
    }
}

void TargetRegistry::FinishRemoval(TargetId target) {
    m_targets.erase(std::remove(m_targets.begin(), m_targets.end(), target), m_targets.end());
    if (m_onRemoved) {
        m_onRemoved(target);
    }
}

void TargetRegistry::FlushPendingRemovals() {
    while (!m_pendingRemoval.empty()) {
        const TargetId target = m_pendingRemoval.back();
        m_pendingRemoval.pop_back();
        FinishRemoval(target);
    }
}

bool TargetRegistry::IsPendingRemoval(TargetId target) const {
    return std::find(m_pendingRemoval.begin(), m_pendingRemoval.end(), target) != m_pendingRemoval.end();
}

} // namespace Crimson::Combat
