#pragma once

#include "combat/CombatTypes.hpp"
#include <nlohmann/json.hpp>
#include <glm/glm.hpp>
#include <string>

namespace Crimson::Combat {

// ============================================================================
// Collaborator Interfaces
// ============================================================================
//
// The combat core never owns scene objects. Everything it needs from the
// world, the controlled actor and the presentation layer goes through these
// narrow interfaces, injected at construction.

/**
 * @brief World/target query collaborator
 */
class ITargetWorld {
public:
    virtual ~ITargetWorld() = default;

    [[nodiscard]] virtual glm::vec3 GetWorldPosition(TargetId target) const = 0;
    [[nodiscard]] virtual bool IsAlive(TargetId target) const = 0;
    [[nodiscard]] virtual float GetHealth(TargetId target) const = 0;
    virtual void TakeDamage(TargetId target, int amount) = 0;

    /**
     * @brief Collision radius of the target
     * @return Radius, or a value <= 0 to use the core's default radius
     */
    [[nodiscard]] virtual float GetHitRadius(TargetId target) const = 0;
    [[nodiscard]] virtual glm::vec3 GetFacingDirection(TargetId target) const = 0;
    [[nodiscard]] virtual bool IsBoss(TargetId target) const = 0;
};

/**
 * @brief Controlled actor collaborator (movement, stamina, health)
 */
class IActorState {
public:
    virtual ~IActorState() = default;

    [[nodiscard]] virtual glm::vec3 GetPosition() const = 0;
    [[nodiscard]] virtual glm::vec3 GetForward() const = 0;
    [[nodiscard]] virtual glm::vec3 GetWeaponPosition() const = 0;

    /**
     * @brief Spend stamina if affordable
     * @return false if the actor cannot pay (nothing is spent)
     */
    virtual bool TryConsumeResource(float amount) = 0;

    virtual void Heal(int amount) = 0;
    virtual void Teleport(const glm::vec3& position) = 0;
    virtual void ApplyDisplacement(const glm::vec3& offset) = 0;
    virtual void ApplyActorBuff(ActorBuffKind kind, float duration, float magnitude) = 0;
};

/**
 * @brief Rendering/VFX collaborator, fire-and-forget
 */
class IEffectSink {
public:
    virtual ~IEffectSink() = default;

    virtual void OnAbilityFired(const std::string& tag, const EffectPayload& payload) = 0;
    virtual void OnHit(const std::string& tag, const EffectPayload& payload) = 0;
    virtual void OnExpire(const std::string& tag, const EffectPayload& payload) = 0;
};

/**
 * @brief UI-facing event emitter ("damageNumber", ...)
 */
class IEventEmitter {
public:
    virtual ~IEventEmitter() = default;

    virtual void Emit(const std::string& eventName, const nlohmann::json& payload) = 0;
};

} // namespace Crimson::Combat
