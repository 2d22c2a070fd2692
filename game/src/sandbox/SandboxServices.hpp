#pragma once

#include "combat/CombatInterfaces.hpp"
#include <map>
#include <vector>

namespace Crimson::Sandbox {

using Combat::TargetId;

/**
 * @brief Training dummies standing in a field
 */
class DummyWorld : public Combat::ITargetWorld {
public:
    struct Dummy {
        glm::vec3 position{0.0f};
        glm::vec3 facing{0.0f, 0.0f, -1.0f};
        float health = 100.0f;
        float maxHealth = 100.0f;
        float hitRadius = 0.0f;     // <= 0 uses the core default
        bool boss = false;
    };

    TargetId Spawn(const Dummy& dummy);
    void Despawn(TargetId target);

    [[nodiscard]] glm::vec3 GetWorldPosition(TargetId target) const override;
    [[nodiscard]] bool IsAlive(TargetId target) const override;
    [[nodiscard]] float GetHealth(TargetId target) const override;
    void TakeDamage(TargetId target, int amount) override;
    [[nodiscard]] float GetHitRadius(TargetId target) const override;
    [[nodiscard]] glm::vec3 GetFacingDirection(TargetId target) const override;
    [[nodiscard]] bool IsBoss(TargetId target) const override;

    [[nodiscard]] std::vector<TargetId> GetDead() const;
    [[nodiscard]] const std::map<TargetId, Dummy>& GetDummies() const { return m_dummies; }
    [[nodiscard]] int GetDamageTaken() const { return m_damageTaken; }

private:
    std::map<TargetId, Dummy> m_dummies;
    TargetId m_nextId = 1;
    int m_damageTaken = 0;
};

/**
 * @brief The controlled actor: position, stamina with regen, health
 */
class DummyActor : public Combat::IActorState {
public:
    static constexpr float kMaxStamina = 100.0f;
    static constexpr float kStaminaRegen = 25.0f;

    void Update(float deltaTime);

    [[nodiscard]] glm::vec3 GetPosition() const override { return m_position; }
    [[nodiscard]] glm::vec3 GetForward() const override { return m_forward; }
    [[nodiscard]] glm::vec3 GetWeaponPosition() const override;

    bool TryConsumeResource(float amount) override;
    void Heal(int amount) override;
    void Teleport(const glm::vec3& position) override { m_position = position; }
    void ApplyDisplacement(const glm::vec3& offset) override { m_position += offset; }
    void ApplyActorBuff(Combat::ActorBuffKind kind, float duration, float magnitude) override;

    void FaceTowards(const glm::vec3& point);

    [[nodiscard]] float GetStamina() const { return m_stamina; }
    [[nodiscard]] int GetHealed() const { return m_healed; }

private:
    glm::vec3 m_position{0.0f};
    glm::vec3 m_forward{0.0f, 0.0f, 1.0f};
    float m_stamina = kMaxStamina;
    int m_healed = 0;
};

/**
 * @brief Logs every VFX notification at debug level
 */
class LoggingEffectSink : public Combat::IEffectSink {
public:
    void OnAbilityFired(const std::string& tag, const Combat::EffectPayload& payload) override;
    void OnHit(const std::string& tag, const Combat::EffectPayload& payload) override;
    void OnExpire(const std::string& tag, const Combat::EffectPayload& payload) override;

    [[nodiscard]] int GetAbilityCount() const { return m_abilities; }

private:
    int m_abilities = 0;
};

/**
 * @brief Logs damage numbers and keeps per-kind totals
 */
class LoggingEventEmitter : public Combat::IEventEmitter {
public:
    void Emit(const std::string& eventName, const nlohmann::json& payload) override;

    [[nodiscard]] const std::map<std::string, int>& GetTotals() const { return m_totals; }
    [[nodiscard]] int GetCriticalCount() const { return m_criticals; }

private:
    std::map<std::string, int> m_totals;
    int m_criticals = 0;
};

} // namespace Crimson::Sandbox
