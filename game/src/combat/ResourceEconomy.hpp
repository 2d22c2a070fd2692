#pragma once

#include "combat/CombatTypes.hpp"
#include <functional>
#include <string>
#include <unordered_map>

namespace Crimson::Combat {

/**
 * @brief Configuration of one named charge-stack pool
 */
struct ChargePoolConfig {
    int cap = 8;
    float idleDecaySeconds = 0.0f;  // 0 = never decays
    bool perTarget = false;         // One counter per owning target
    bool resetOnCap = false;        // Reaching cap fires the callback and resets to 0
};

/**
 * @brief Ultimate meter gains
 */
struct UltimateConfig {
    float basicGain = 4.0f;
    float chargedGain = 10.0f;
    float max = 100.0f;
};

/**
 * @brief Bounded resource counters of the controlled actor
 *
 * Tracks named charge stacks (blood, poison, trust, per-target frost),
 * the ultimate meter, the combo count, the one-shot next-attack multiplier
 * and timed damage buffs. Counters saturate at their caps; nothing here
 * ever throws.
 */
class ResourceEconomy {
public:
    using CapCallback = std::function<void(const std::string& name, TargetId owner)>;

    explicit ResourceEconomy(const UltimateConfig& ultimate = {}, float decayCheckInterval = 1.0f);
    ~ResourceEconomy() = default;

    ResourceEconomy(const ResourceEconomy&) = delete;
    ResourceEconomy& operator=(const ResourceEconomy&) = delete;

    // =========================================================================
    // Charge Stacks
    // =========================================================================

    /**
     * @brief Register (or reconfigure) a named charge pool
     */
    void RegisterCharge(const std::string& name, const ChargePoolConfig& config);
    [[nodiscard]] bool HasPool(const std::string& name) const;

    /**
     * @brief Callback fired when a resetOnCap pool reaches its cap
     */
    void SetCapCallback(const std::string& name, CapCallback callback);

    /**
     * @brief Add charges, clamped to [0, cap]
     * @param owner Target that owns the stacks (per-target pools) or that
     *              caused the gain (reported to the cap callback)
     * @return Counter value after the gain (0 if the cap reset it)
     */
    int AddCharge(const std::string& name, int amount, TargetId owner = kInvalidTarget);

    /**
     * @brief Put back charges taken by Consume without touching decay timers
     */
    void RestoreCharge(const std::string& name, int amount, TargetId owner = kInvalidTarget);

    [[nodiscard]] int GetCharge(const std::string& name, TargetId owner = kInvalidTarget) const;
    [[nodiscard]] int GetCap(const std::string& name) const;
    [[nodiscard]] bool HasCharges(const std::string& name, int required,
                                  TargetId owner = kInvalidTarget) const;

    /**
     * @brief Take every charge
     * @return The value before consumption; 0 is left behind
     */
    int ConsumeAll(const std::string& name, TargetId owner = kInvalidTarget);

    /**
     * @brief Take up to @p maxAmount charges
     * @return Number of charges actually taken
     */
    int Consume(const std::string& name, int maxAmount, TargetId owner = kInvalidTarget);

    /**
     * @brief Drop every per-target counter owned by a removed target
     */
    void ForgetOwner(TargetId owner);

    // =========================================================================
    // Ultimate
    // =========================================================================

    float AddUltimate(HitTier tier);
    [[nodiscard]] float GetUltimate() const { return m_ultimate; }
    [[nodiscard]] float GetUltimateMax() const { return m_ultimateConfig.max; }
    [[nodiscard]] bool CanUseUltimate() const;

    /**
     * @brief Spend the full meter
     * @return false if the meter is not full and test mode is off
     */
    bool UseUltimate();

    void SetUltimateTestMode(bool enabled) { m_ultimateTestMode = enabled; }
    [[nodiscard]] bool IsUltimateTestMode() const { return m_ultimateTestMode; }

    // =========================================================================
    // Combo / Multipliers
    // =========================================================================

    [[nodiscard]] int GetComboCount() const { return m_comboCount; }
    void SetComboCount(int count);

    /**
     * @brief Grant a one-shot multiplier for the next resolved attack
     */
    void GrantNextAttackMultiplier(float multiplier);
    [[nodiscard]] float PeekNextAttackMultiplier() const { return m_nextAttackMultiplier; }

    /**
     * @brief Read max(1, pending multiplier) and reset it to 1
     */
    float ConsumeNextAttackMultiplier();

    /**
     * @brief Start or refresh a named timed damage buff
     */
    void SetDamageBuff(const std::string& name, float multiplier, float duration);
    void ClearDamageBuff(const std::string& name);
    [[nodiscard]] bool IsBuffActive(const std::string& name) const;
    [[nodiscard]] float GetBuffRemaining(const std::string& name) const;

    /**
     * @brief Product of every buff whose remaining duration is > 0
     */
    [[nodiscard]] float GetActiveBuffMultiplier() const;

    // =========================================================================
    // Update
    // =========================================================================

    /**
     * @brief Advance buff timers and run the throttled idle-decay check
     */
    void Update(float deltaTime);

    void Reset();

private:
    struct ChargeCounter {
        int value = 0;
        float lastGainTime = 0.0f;
    };

    struct ChargePool {
        ChargePoolConfig config;
        std::unordered_map<TargetId, ChargeCounter> counters;
        CapCallback onCap;
    };

    struct DamageBuff {
        float multiplier = 1.0f;
        float remaining = 0.0f;
    };

    ChargePool* FindPool(const std::string& name);
    const ChargePool* FindPool(const std::string& name) const;
    static TargetId OwnerKey(const ChargePool& pool, TargetId owner);
    void RunDecayCheck();

    std::unordered_map<std::string, ChargePool> m_pools;
    std::unordered_map<std::string, DamageBuff> m_buffs;

    UltimateConfig m_ultimateConfig;
    float m_ultimate = 0.0f;
    bool m_ultimateTestMode = false;

    int m_comboCount = 0;
    float m_nextAttackMultiplier = 1.0f;

    float m_clock = 0.0f;
    float m_decayCheckInterval = 1.0f;
    float m_decayAccumulator = 0.0f;
};

} // namespace Crimson::Combat
