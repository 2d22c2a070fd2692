#include "combat/StatusEffectTracker.hpp"
#include "core/Assert.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>

namespace Crimson::Combat {

namespace {
// Absorbs float drift when accumulated frame steps land exactly on a tick
constexpr float kTickEpsilon = 1e-4f;
}

StatusEffectTracker::StatusEffectTracker(float poisonTickInterval)
    : m_poisonTickInterval(poisonTickInterval > 0.0f ? poisonTickInterval : kDefaultPoisonTickInterval) {
}

bool StatusEffectTracker::CheckTarget(TargetId target, const char* operation) const {
    if (target == kInvalidTarget || (m_validator && !m_validator(target))) {
        STATUS_LOG_ERROR("{} on unregistered target {}", operation, target);
        CRIMSON_ASSERT_MSG(false, "Status effect on unregistered target");
        return false;
    }
    return true;
}

bool StatusEffectTracker::ApplyStagger(TargetId target, float duration) {
    if (!CheckTarget(target, "ApplyStagger") || duration <= 0.0f) {
        return false;
    }
    m_pending.push_back({PendingKind::Stagger, target, duration, 1.0f, 0});
    return true;
}

bool StatusEffectTracker::ApplyPoisonDoT(TargetId target, float duration, int damagePerTick) {
    if (!CheckTarget(target, "ApplyPoisonDoT") || duration <= 0.0f || damagePerTick <= 0) {
        return false;
    }
    m_pending.push_back({PendingKind::Poison, target, duration, 1.0f, damagePerTick});
    return true;
}

bool StatusEffectTracker::ApplyVulnerability(TargetId target, float duration, float multiplier) {
    if (!CheckTarget(target, "ApplyVulnerability") || duration <= 0.0f) {
        return false;
    }
    m_pending.push_back({PendingKind::Vulnerability, target, duration, multiplier, 0});
    return true;
}

void StatusEffectTracker::CommitPending() {
    for (const PendingApplication& pending : m_pending) {
        StatusRecord& record = m_records[pending.target];
        switch (pending.kind) {
            case PendingKind::Stagger:
                record.stagger = std::max(record.stagger, pending.duration);
                break;
            case PendingKind::Poison:
                record.poisonDuration = pending.duration;
                record.poisonElapsed = 0.0f;
                record.poisonTicksFired = 0;
                record.poisonTotalTicks =
                    static_cast<int>(std::floor(pending.duration / m_poisonTickInterval + kTickEpsilon));
                record.poisonPerTick = pending.damagePerTick;
                break;
            case PendingKind::Vulnerability:
                record.vulnerabilityMultiplier = pending.multiplier;
                record.vulnerabilityRemaining = pending.duration;
                break;
        }
    }
    m_pending.clear();
}

void StatusEffectTracker::Update(float deltaTime) {
    CommitPending();
    m_pendingTicks.clear();

    for (auto it = m_records.begin(); it != m_records.end();) {
        StatusRecord& record = it->second;

        record.stagger = std::max(0.0f, record.stagger - deltaTime);

        if (record.HasPoison()) {
            record.poisonElapsed += deltaTime;
            while (record.HasPoison() &&
                   record.poisonElapsed + kTickEpsilon >=
                       static_cast<float>(record.poisonTicksFired + 1) * m_poisonTickInterval) {
                ++record.poisonTicksFired;
                m_pendingTicks.push_back({it->first, record.poisonPerTick});
            }
        }

        if (record.vulnerabilityRemaining > 0.0f) {
            record.vulnerabilityRemaining -= deltaTime;
            if (record.vulnerabilityRemaining <= 0.0f) {
                record.vulnerabilityRemaining = 0.0f;
                record.vulnerabilityMultiplier = 1.0f;
            }
        }

        if (record.IsIdle()) {
            STATUS_LOG_TRACE("Status record for target {} expired", it->first);
            it = m_records.erase(it);
        } else {
            ++it;
        }
    }

    if (m_onPoisonTick) {
        for (const PendingTick& tick : m_pendingTicks) {
            m_onPoisonTick(tick.target, tick.damage);
        }
    }
}

StatusSnapshot StatusEffectTracker::Query(TargetId target) const {
    StatusSnapshot snapshot;
    auto it = m_records.find(target);
    if (it == m_records.end()) {
        return snapshot;
    }
    const StatusRecord& record = it->second;
    snapshot.staggerRemaining = record.stagger;
    if (record.HasPoison()) {
        snapshot.poisonRemaining = std::max(0.0f, record.poisonDuration - record.poisonElapsed);
        snapshot.poisonNextTick = std::max(0.0f,
            static_cast<float>(record.poisonTicksFired + 1) * m_poisonTickInterval - record.poisonElapsed);
        snapshot.poisonDamagePerTick = record.poisonPerTick;
    }
    if (record.vulnerabilityRemaining > 0.0f) {
        snapshot.vulnerabilityMultiplier = record.vulnerabilityMultiplier;
        snapshot.vulnerabilityRemaining = record.vulnerabilityRemaining;
    }
    return snapshot;
}

float StatusEffectTracker::GetVulnerabilityMultiplier(TargetId target) const {
    return Query(target).vulnerabilityMultiplier;
}

bool StatusEffectTracker::IsStaggered(TargetId target) const {
    return Query(target).IsStaggered();
}

bool StatusEffectTracker::HasRecord(TargetId target) const {
    return m_records.find(target) != m_records.end();
}

void StatusEffectTracker::Forget(TargetId target) {
    m_records.erase(target);
    m_pending.erase(std::remove_if(m_pending.begin(), m_pending.end(),
                                   [target](const PendingApplication& pending) { return pending.target == target; }),
                    m_pending.end());
}

void StatusEffectTracker::Clear() {
    m_records.clear();
    m_pending.clear();
    m_pendingTicks.clear();
}

} // namespace Crimson::Combat
