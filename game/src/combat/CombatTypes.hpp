#pragma once

#include <glm/glm.hpp>
#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>

namespace Crimson::Combat {

// ============================================================================
// Identifiers
// ============================================================================

/// Stable identity of an enemy or boss, assigned by the host spawner.
using TargetId = uint32_t;
constexpr TargetId kInvalidTarget = 0;

/// Handle of a live pooled effect. Handles are never reused.
using EffectHandle = uint32_t;
constexpr EffectHandle kInvalidEffect = 0;

// ============================================================================
// Enumerations
// ============================================================================

/**
 * @brief Ability key slots, independent of the basic/charged attack
 */
enum class AbilitySlot : uint8_t {
    Q = 0,
    E,
    X,
    C,
    V,
    F,
    Count
};

constexpr size_t kAbilitySlotCount = static_cast<size_t>(AbilitySlot::Count);

constexpr size_t SlotIndex(AbilitySlot slot) {
    return static_cast<size_t>(slot);
}

constexpr std::array<AbilitySlot, kAbilitySlotCount> kAllAbilitySlots = {
    AbilitySlot::Q, AbilitySlot::E, AbilitySlot::X,
    AbilitySlot::C, AbilitySlot::V, AbilitySlot::F
};

const char* AbilitySlotToString(AbilitySlot slot);

/**
 * @brief Strength of the cast that produced a hit
 */
enum class HitTier : uint8_t {
    Basic,
    Charged
};

/**
 * @brief Visual/behavioral family of a pooled effect
 */
enum class EffectKind : uint8_t {
    Bolt,       // Fireball / ice bolt
    Blade,      // Thrown blade wave
    Arrow,      // Bow arrow
    Beam,       // Line segment sweep
    Orb,        // Slow travelling sphere
    Shard,      // Small fragments emitted by orbs
    Count
};

constexpr size_t kEffectKindCount = static_cast<size_t>(EffectKind::Count);

const char* EffectKindToString(EffectKind kind);

/**
 * @brief Presentation category of a damage number
 */
enum class DamageKind : uint8_t {
    Normal,
    Ability,
    Heavy,
    Poison,
    Ultimate
};

const char* DamageKindToString(DamageKind kind);

/**
 * @brief Mutually exclusive actor channel modes
 */
enum class ChannelState : uint8_t {
    None,
    Attacking,
    Charging,
    ChargedAttacking,
    Whip,           // Finisher lock after a signature strike
    LifeDrain,
    Dashing
};

const char* ChannelStateToString(ChannelState state);

/**
 * @brief Hard channels lock out ability slots and basic attacks
 */
constexpr bool IsHardChannel(ChannelState state) {
    return state == ChannelState::Whip ||
           state == ChannelState::LifeDrain ||
           state == ChannelState::Dashing;
}

/**
 * @brief How an ability slot goes from key press to effect
 */
enum class AbilityActivation : uint8_t {
    Instant,    // Executes on press
    Targeted,   // Ground-target preview, executes on confirm
    Windup,     // Executes automatically after a fixed delay
    Channel     // Enters a channel; cooldown starts when it ends
};

const char* AbilityActivationToString(AbilityActivation activation);
bool AbilityActivationFromString(const std::string& text, AbilityActivation& out);

/**
 * @brief Result of a kit ability entry point
 */
enum class AbilityOutcome : uint8_t {
    Rejected,       // Nothing happened; spent charges are refunded
    Committed,      // Effect fired; cooldown starts
    Fizzled         // Effect fired but found nothing; no cooldown
};

/**
 * @brief Buffs applied to the controlled actor by the actor-state collaborator
 */
enum class ActorBuffKind : uint8_t {
    Shield,
    Vanish
};

// ============================================================================
// Per-frame Intent
// ============================================================================

/**
 * @brief One frame's worth of input intent
 */
struct CombatIntent {
    bool attack = false;
    bool chargedAttack = false;         // Held
    bool chargedAttackRelease = false;  // Released this frame
    std::array<bool, kAbilitySlotCount> abilities{};
    bool cancel = false;

    bool hasAimPoint = false;
    glm::vec3 aimPoint{0.0f};

    [[nodiscard]] bool Pressed(AbilitySlot slot) const {
        return abilities[SlotIndex(slot)];
    }

    void Press(AbilitySlot slot) {
        abilities[SlotIndex(slot)] = true;
    }

    void Aim(const glm::vec3& point) {
        hasAimPoint = true;
        aimPoint = point;
    }
};

// ============================================================================
// Notification Payload
// ============================================================================

/**
 * @brief Data passed to the rendering/VFX collaborator
 */
struct EffectPayload {
    glm::vec3 position{0.0f};
    glm::vec3 direction{0.0f};
    TargetId target = kInvalidTarget;
    int damage = 0;
    int charges = 0;
    int hits = 0;
    float radius = 0.0f;
    bool isCritical = false;
    bool isBackstab = false;
    bool isBoss = false;
    bool isCharged = false;
    bool isUltimate = false;
};

// ============================================================================
// Planar Math Helpers
// ============================================================================

constexpr float kDirectionEpsilon = 1e-6f;

inline glm::vec3 Flatten(const glm::vec3& v) {
    return glm::vec3(v.x, 0.0f, v.z);
}

inline float PlanarDistance(const glm::vec3& a, const glm::vec3& b) {
    const float dx = a.x - b.x;
    const float dz = a.z - b.z;
    return std::sqrt(dx * dx + dz * dz);
}

/**
 * @brief Normalize, or return fallback for (near) zero vectors
 */
inline glm::vec3 SafeNormalize(const glm::vec3& v, const glm::vec3& fallback) {
    const float len = glm::length(v);
    if (len < kDirectionEpsilon) {
        return fallback;
    }
    return v / len;
}

/**
 * @brief Distance from point to segment [a, b] measured on the XZ plane
 */
float PlanarDistanceToSegment(const glm::vec3& point, const glm::vec3& a, const glm::vec3& b);

/**
 * @brief Rotate a direction around the vertical axis
 */
glm::vec3 RotateAroundUp(const glm::vec3& direction, float radians);

} // namespace Crimson::Combat
