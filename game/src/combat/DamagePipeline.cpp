#include "combat/DamagePipeline.hpp"
#include "combat/ResourceEconomy.hpp"
#include "combat/StatusEffectTracker.hpp"
#include <algorithm>
#include <cmath>

namespace Crimson::Combat {

DamagePipeline::DamagePipeline(ResourceEconomy& economy,
                               StatusEffectTracker& status,
                               ITargetWorld& world,
                               IActorState& actor,
                               IRandomSource& random)
    : m_economy(economy)
    , m_status(status)
    , m_world(world)
    , m_actor(actor)
    , m_random(random) {
}

float DamagePipeline::ComboMultiplier(int comboCount) {
    return 1.0f + static_cast<float>(std::max(1, comboCount) - 1) * 0.2f;
}

bool DamagePipeline::IsBehind(const glm::vec3& targetPosition,
                              const glm::vec3& facing,
                              const glm::vec3& attacker,
                              float threshold) {
    const glm::vec3 flatFacing = Flatten(facing);
    const glm::vec3 toAttacker = Flatten(attacker - targetPosition);
    if (glm::length(flatFacing) < kDirectionEpsilon || glm::length(toAttacker) < kDirectionEpsilon) {
        return false;
    }
    return glm::dot(glm::normalize(flatFacing), glm::normalize(toAttacker)) < threshold;
}

DamageResult DamagePipeline::Resolve(const DamageRequest& request, TargetId target) {
    DamageResult result;
    double damage = request.baseDamage;

    if (request.applyCombo) {
        damage *= ComboMultiplier(m_economy.GetComboCount());
    }

    if (request.consumeNextAttack) {
        damage *= m_economy.ConsumeNextAttackMultiplier();
    }

    if (request.applyTimedBuffs) {
        damage *= m_economy.GetActiveBuffMultiplier();
    }

    if (request.canCrit) {
        const float chance = m_kitStats.critChance + m_bonuses.critChance;
        if (chance > 0.0f && m_random.NextFloat() < chance) {
            result.isCritical = true;
            damage *= m_kitStats.critMultiplier + m_bonuses.critMultiplier;
        }
    }

    if (request.canBackstab &&
        IsBehind(m_world.GetWorldPosition(target), m_world.GetFacingDirection(target),
                 m_actor.GetPosition(), m_backstabThreshold)) {
        result.isBackstab = true;
        damage *= m_kitStats.backstabMultiplier + m_bonuses.backstabMultiplier;
    }

    damage *= m_status.GetVulnerabilityMultiplier(target);

    // Small bias keeps exact products such as 20 * 1.2 from flooring to 23
    result.damage = std::max(0, static_cast<int>(std::floor(damage + 1e-6)));

    if (m_bonuses.lifesteal > 0.0f && result.damage > 0) {
        const int heal = std::max(1, static_cast<int>(std::floor(result.damage * m_bonuses.lifesteal)));
        m_actor.Heal(heal);
    }

    return result;
}

} // namespace Crimson::Combat
