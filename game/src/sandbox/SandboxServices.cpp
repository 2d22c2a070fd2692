#include "sandbox/SandboxServices.hpp"
#include "core/Logger.hpp"
#include <algorithm>

namespace Crimson::Sandbox {

// ============================================================================
// DummyWorld
// ============================================================================

TargetId DummyWorld::Spawn(const Dummy& dummy) {
    const TargetId id = m_nextId++;
    m_dummies[id] = dummy;
    return id;
}

void DummyWorld::Despawn(TargetId target) {
    m_dummies.erase(target);
}

glm::vec3 DummyWorld::GetWorldPosition(TargetId target) const {
    auto it = m_dummies.find(target);
    return it != m_dummies.end() ? it->second.position : glm::vec3(0.0f);
}

bool DummyWorld::IsAlive(TargetId target) const {
    auto it = m_dummies.find(target);
    return it != m_dummies.end() && it->second.health > 0.0f;
}

float DummyWorld::GetHealth(TargetId target) const {
    auto it = m_dummies.find(target);
    return it != m_dummies.end() ? it->second.health : 0.0f;
}

void DummyWorld::TakeDamage(TargetId target, int amount) {
    auto it = m_dummies.find(target);
    if (it == m_dummies.end()) {
        return;
    }
    it->second.health = std::max(0.0f, it->second.health - static_cast<float>(amount));
    m_damageTaken += amount;
}

float DummyWorld::GetHitRadius(TargetId target) const {
    auto it = m_dummies.find(target);
    return it != m_dummies.end() ? it->second.hitRadius : 0.0f;
}

glm::vec3 DummyWorld::GetFacingDirection(TargetId target) const {
    auto it = m_dummies.find(target);
    return it != m_dummies.end() ? it->second.facing : glm::vec3(0.0f, 0.0f, -1.0f);
}

bool DummyWorld::IsBoss(TargetId target) const {
    auto it = m_dummies.find(target);
    return it != m_dummies.end() && it->second.boss;
}

std::vector<TargetId> DummyWorld::GetDead() const {
    std::vector<TargetId> dead;
    for (const auto& [id, dummy] : m_dummies) {
        if (dummy.health <= 0.0f) {
            dead.push_back(id);
        }
    }
    return dead;
}

// ============================================================================
// DummyActor
// ============================================================================

void DummyActor::Update(float deltaTime) {
    m_stamina = std::min(kMaxStamina, m_stamina + kStaminaRegen * deltaTime);
}

glm::vec3 DummyActor::GetWeaponPosition() const {
    return m_position + m_forward * 0.6f + glm::vec3(0.0f, 1.2f, 0.0f);
}

bool DummyActor::TryConsumeResource(float amount) {
    if (m_stamina < amount) {
        return false;
    }
    m_stamina -= amount;
    return true;
}

void DummyActor::Heal(int amount) {
    m_healed += amount;
}

void DummyActor::ApplyActorBuff(Combat::ActorBuffKind kind, float duration, float magnitude) {
    COMBAT_LOG_DEBUG("Actor buff {} for {:.2f}s (x{:.2f})",
                     kind == Combat::ActorBuffKind::Shield ? "shield" : "vanish", duration, magnitude);
}

void DummyActor::FaceTowards(const glm::vec3& point) {
    const glm::vec3 offset = Combat::Flatten(point - m_position);
    m_forward = Combat::SafeNormalize(offset, m_forward);
}

// ============================================================================
// Logging Sinks
// ============================================================================

void LoggingEffectSink::OnAbilityFired(const std::string& tag, const Combat::EffectPayload& payload) {
    ++m_abilities;
    COMBAT_LOG_DEBUG("fx fired {} charges={} radius={:.2f}", tag, payload.charges, payload.radius);
}

void LoggingEffectSink::OnHit(const std::string& tag, const Combat::EffectPayload& payload) {
    COMBAT_LOG_TRACE("fx hit {} target={} damage={}", tag, payload.target, payload.damage);
}

void LoggingEffectSink::OnExpire(const std::string& tag, const Combat::EffectPayload& payload) {
    COMBAT_LOG_TRACE("fx expired {} hits={}", tag, payload.hits);
}

void LoggingEventEmitter::Emit(const std::string& eventName, const nlohmann::json& payload) {
    if (eventName != "damageNumber") {
        COMBAT_LOG_DEBUG("event {} {}", eventName, payload.dump());
        return;
    }
    const std::string kind = payload.value("kind", std::string("normal"));
    const int damage = payload.value("damage", 0);
    m_totals[kind] += damage;
    if (payload.value("isCritical", false)) {
        ++m_criticals;
    }
    COMBAT_LOG_INFO("{:>8} {:>5} -> {}{}", kind, damage, payload.value("anchorId", std::string("?")),
                    payload.value("isCritical", false) ? " (crit)" : "");
}

} // namespace Crimson::Sandbox
