#include "combat/CombatTypes.hpp"
#include <algorithm>

namespace Crimson::Combat {

const char* AbilitySlotToString(AbilitySlot slot) {
    switch (slot) {
        case AbilitySlot::Q: return "q";
        case AbilitySlot::E: return "e";
        case AbilitySlot::X: return "x";
        case AbilitySlot::C: return "c";
        case AbilitySlot::V: return "v";
        case AbilitySlot::F: return "f";
        default:             return "unknown";
    }
}

const char* EffectKindToString(EffectKind kind) {
    switch (kind) {
        case EffectKind::Bolt:  return "bolt";
        case EffectKind::Blade: return "blade";
        case EffectKind::Arrow: return "arrow";
        case EffectKind::Beam:  return "beam";
        case EffectKind::Orb:   return "orb";
        case EffectKind::Shard: return "shard";
        default:                return "unknown";
    }
}

const char* DamageKindToString(DamageKind kind) {
    switch (kind) {
        case DamageKind::Normal:   return "normal";
        case DamageKind::Ability:  return "ability";
        case DamageKind::Heavy:    return "heavy";
        case DamageKind::Poison:   return "poison";
        case DamageKind::Ultimate: return "ultimate";
    }
    return "normal";
}

const char* ChannelStateToString(ChannelState state) {
    switch (state) {
        case ChannelState::None:             return "none";
        case ChannelState::Attacking:        return "attacking";
        case ChannelState::Charging:         return "charging";
        case ChannelState::ChargedAttacking: return "charged_attacking";
        case ChannelState::Whip:             return "whip";
        case ChannelState::LifeDrain:        return "life_drain";
        case ChannelState::Dashing:          return "dashing";
    }
    return "none";
}

const char* AbilityActivationToString(AbilityActivation activation) {
    switch (activation) {
        case AbilityActivation::Instant:  return "instant";
        case AbilityActivation::Targeted: return "targeted";
        case AbilityActivation::Windup:   return "windup";
        case AbilityActivation::Channel:  return "channel";
    }
    return "instant";
}

bool AbilityActivationFromString(const std::string& text, AbilityActivation& out) {
    if (text == "instant")  { out = AbilityActivation::Instant;  return true; }
    if (text == "targeted") { out = AbilityActivation::Targeted; return true; }
    if (text == "windup")   { out = AbilityActivation::Windup;   return true; }
    if (text == "channel")  { out = AbilityActivation::Channel;  return true; }
    return false;
}

float PlanarDistanceToSegment(const glm::vec3& point, const glm::vec3& a, const glm::vec3& b) {
    const glm::vec2 p(point.x, point.z);
    const glm::vec2 s0(a.x, a.z);
    const glm::vec2 s1(b.x, b.z);
    const glm::vec2 seg = s1 - s0;
    const float lenSq = glm::dot(seg, seg);
    if (lenSq < kDirectionEpsilon) {
        return glm::length(p - s0);
    }
    const float t = std::clamp(glm::dot(p - s0, seg) / lenSq, 0.0f, 1.0f);
    return glm::length(p - (s0 + seg * t));
}

glm::vec3 RotateAroundUp(const glm::vec3& direction, float radians) {
    const float c = std::cos(radians);
    const float s = std::sin(radians);
    return glm::vec3(
        direction.x * c + direction.z * s,
        direction.y,
        -direction.x * s + direction.z * c
    );
}

} // namespace Crimson::Combat
