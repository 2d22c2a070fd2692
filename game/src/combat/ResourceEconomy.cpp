#include "combat/ResourceEconomy.hpp"
#include "core/Assert.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>

namespace Crimson::Combat {

ResourceEconomy::ResourceEconomy(const UltimateConfig& ultimate, float decayCheckInterval)
    : m_ultimateConfig(ultimate)
    , m_decayCheckInterval(decayCheckInterval > 0.0f ? decayCheckInterval : 1.0f) {
}

// ============================================================================
// Charge Stacks
// ============================================================================

void ResourceEconomy::RegisterCharge(const std::string& name, const ChargePoolConfig& config) {
    ChargePool& pool = m_pools[name];
    pool.config = config;
    pool.config.cap = std::max(0, config.cap);
    for (auto& [owner, counter] : pool.counters) {
        counter.value = std::min(counter.value, pool.config.cap);
    }
}

bool ResourceEconomy::HasPool(const std::string& name) const {
    return FindPool(name) != nullptr;
}

void ResourceEconomy::SetCapCallback(const std::string& name, CapCallback callback) {
    ChargePool* pool = FindPool(name);
    if (!pool) {
        ECONOMY_LOG_ERROR("Cap callback for unregistered charge pool '{}'", name);
        CRIMSON_ASSERT_MSG(false, "Cap callback for unregistered charge pool");
        return;
    }
    pool->onCap = std::move(callback);
}

int ResourceEconomy::AddCharge(const std::string& name, int amount, TargetId owner) {
    ChargePool* pool = FindPool(name);
    if (!pool) {
        ECONOMY_LOG_ERROR("AddCharge on unregistered charge pool '{}'", name);
        CRIMSON_ASSERT_MSG(false, "AddCharge on unregistered charge pool");
        return 0;
    }
    if (pool->config.perTarget && owner == kInvalidTarget) {
        ECONOMY_LOG_ERROR("AddCharge on per-target pool '{}' without an owner", name);
        CRIMSON_ASSERT_MSG(false, "Per-target charge without owner");
        return 0;
    }

    ChargeCounter& counter = pool->counters[OwnerKey(*pool, owner)];
    counter.value = std::clamp(counter.value + amount, 0, pool->config.cap);
    if (amount > 0) {
        counter.lastGainTime = m_clock;
    }

    if (pool->config.resetOnCap && amount > 0 && counter.value >= pool->config.cap) {
        counter.value = 0;
        ECONOMY_LOG_DEBUG("Charge pool '{}' capped for owner {}", name, owner);
        if (pool->onCap) {
            // Copy: the callback may re-register the pool
            CapCallback callback = pool->onCap;
            callback(name, owner);
        }
        return 0;
    }
    return counter.value;
}

void ResourceEconomy::RestoreCharge(const std::string& name, int amount, TargetId owner) {
    ChargePool* pool = FindPool(name);
    if (!pool || amount <= 0) {
        return;
    }
    ChargeCounter& counter = pool->counters[OwnerKey(*pool, owner)];
    counter.value = std::min(counter.value + amount, pool->config.cap);
}

int ResourceEconomy::GetCharge(const std::string& name, TargetId owner) const {
    const ChargePool* pool = FindPool(name);
    if (!pool) {
        return 0;
    }
    auto it = pool->counters.find(OwnerKey(*pool, owner));
    return it != pool->counters.end() ? it->second.value : 0;
}

int ResourceEconomy::GetCap(const std::string& name) const {
    const ChargePool* pool = FindPool(name);
    return pool ? pool->config.cap : 0;
}

bool ResourceEconomy::HasCharges(const std::string& name, int required, TargetId owner) const {
    return GetCharge(name, owner) >= required;
}

int ResourceEconomy::ConsumeAll(const std::string& name, TargetId owner) {
    ChargePool* pool = FindPool(name);
    if (!pool) {
        return 0;
    }
    auto it = pool->counters.find(OwnerKey(*pool, owner));
    if (it == pool->counters.end()) {
        return 0;
    }
    const int value = it->second.value;
    it->second.value = 0;
    return value;
}

int ResourceEconomy::Consume(const std::string& name, int maxAmount, TargetId owner) {
    ChargePool* pool = FindPool(name);
    if (!pool || maxAmount <= 0) {
        return 0;
    }
    auto it = pool->counters.find(OwnerKey(*pool, owner));
    if (it == pool->counters.end()) {
        return 0;
    }
    const int taken = std::min(it->second.value, maxAmount);
    it->second.value -= taken;
    return taken;
}

void ResourceEconomy::ForgetOwner(TargetId owner) {
    for (auto& [name, pool] : m_pools) {
        if (pool.config.perTarget) {
            pool.counters.erase(owner);
        }
    }
}

// ============================================================================
// Ultimate
// ============================================================================

float ResourceEconomy::AddUltimate(HitTier tier) {
    const float gain = tier == HitTier::Charged ? m_ultimateConfig.chargedGain
                                                : m_ultimateConfig.basicGain;
    m_ultimate = std::min(m_ultimateConfig.max, m_ultimate + gain);
    return m_ultimate;
}

bool ResourceEconomy::CanUseUltimate() const {
    return m_ultimateTestMode || m_ultimate >= m_ultimateConfig.max;
}

bool ResourceEconomy::UseUltimate() {
    if (!CanUseUltimate()) {
        return false;
    }
    m_ultimate = 0.0f;
    return true;
}

// ============================================================================
// Combo / Multipliers
// ============================================================================

void ResourceEconomy::SetComboCount(int count) {
    m_comboCount = std::max(0, count);
}

void ResourceEconomy::GrantNextAttackMultiplier(float multiplier) {
    m_nextAttackMultiplier = std::max(m_nextAttackMultiplier, multiplier);
}

float ResourceEconomy::ConsumeNextAttackMultiplier() {
    const float multiplier = std::max(1.0f, m_nextAttackMultiplier);
    m_nextAttackMultiplier = 1.0f;
    return multiplier;
}

void ResourceEconomy::SetDamageBuff(const std::string& name, float multiplier, float duration) {
    if (duration <= 0.0f) {
        ClearDamageBuff(name);
        return;
    }
    DamageBuff& buff = m_buffs[name];
    buff.multiplier = multiplier;
    buff.remaining = duration;
}

void ResourceEconomy::ClearDamageBuff(const std::string& name) {
    m_buffs.erase(name);
}

bool ResourceEconomy::IsBuffActive(const std::string& name) const {
    return GetBuffRemaining(name) > 0.0f;
}

float ResourceEconomy::GetBuffRemaining(const std::string& name) const {
    auto it = m_buffs.find(name);
    return it != m_buffs.end() ? it->second.remaining : 0.0f;
}

float ResourceEconomy::GetActiveBuffMultiplier() const {
    float multiplier = 1.0f;
    for (const auto& [name, buff] : m_buffs) {
        if (buff.remaining > 0.0f) {
            multiplier *= buff.multiplier;
        }
    }
    return multiplier;
}

// ============================================================================
// Update
// ============================================================================

void ResourceEconomy::Update(float deltaTime) {
    m_clock += deltaTime;

    for (auto it = m_buffs.begin(); it != m_buffs.end();) {
        it->second.remaining -= deltaTime;
        if (it->second.remaining <= 0.0f) {
            it = m_buffs.erase(it);
        } else {
            ++it;
        }
    }

    m_decayAccumulator += deltaTime;
    if (m_decayAccumulator >= m_decayCheckInterval) {
        // Keep the remainder so checks stay on the interval grid
        m_decayAccumulator = std::fmod(m_decayAccumulator, m_decayCheckInterval);
        RunDecayCheck();
    }
}

void ResourceEconomy::Reset() {
    for (auto& [name, pool] : m_pools) {
        pool.counters.clear();
    }
    m_buffs.clear();
    m_ultimate = 0.0f;
    m_comboCount = 0;
    m_nextAttackMultiplier = 1.0f;
    m_decayAccumulator = 0.0f;
}

void ResourceEconomy::RunDecayCheck() {
    for (auto& [name, pool] : m_pools) {
        if (pool.config.idleDecaySeconds <= 0.0f) {
            continue;
        }
        for (auto it = pool.counters.begin(); it != pool.counters.end();) {
            ChargeCounter& counter = it->second;
            if (counter.value > 0 && m_clock - counter.lastGainTime >= pool.config.idleDecaySeconds) {
                ECONOMY_LOG_TRACE("Charge pool '{}' decayed {} stacks (owner {})",
                                 name, counter.value, it->first);
                counter.value = 0;
            }
            if (pool.config.perTarget && counter.value == 0) {
                it = pool.counters.erase(it);
            } else {
                ++it;
            }
        }
    }
}

ResourceEconomy::ChargePool* ResourceEconomy::FindPool(const std::string& name) {
    auto it = m_pools.find(name);
    return it != m_pools.end() ? &it->second : nullptr;
}

const ResourceEconomy::ChargePool* ResourceEconomy::FindPool(const std::string& name) const {
    auto it = m_pools.find(name);
    return it != m_pools.end() ? &it->second : nullptr;
}

TargetId ResourceEconomy::OwnerKey(const ChargePool& pool, TargetId owner) {
    return pool.config.perTarget ? owner : kInvalidTarget;
}

} // namespace Crimson::Combat
