#pragma once

#include "combat/CombatTypes.hpp"
#include <functional>
#include <unordered_map>
#include <vector>

namespace Crimson::Combat {

/**
 * @brief Read-only view of one target's status record
 */
struct StatusSnapshot {
    float staggerRemaining = 0.0f;
    float poisonRemaining = 0.0f;
    float poisonNextTick = 0.0f;
    int poisonDamagePerTick = 0;
    float vulnerabilityMultiplier = 1.0f;
    float vulnerabilityRemaining = 0.0f;

    [[nodiscard]] bool IsStaggered() const { return staggerRemaining > 0.0f; }
    [[nodiscard]] bool IsPoisoned() const { return poisonRemaining > 0.0f; }
    [[nodiscard]] bool IsVulnerable() const { return vulnerabilityRemaining > 0.0f; }
};

/**
 * @brief Per-target status effects: stagger/freeze, poison DoT, vulnerability
 *
 * A target has no record while idle. Applying any effect creates one; the
 * record is removed once every field has decayed to zero.
 *
 * Applications are queued and committed at the start of the next Update(),
 * so hits resolved earlier in the same frame never see each other's effects.
 */
class StatusEffectTracker {
public:
    using PoisonTickCallback = std::function<void(TargetId target, int damage)>;
    using TargetValidator = std::function<bool(TargetId target)>;

    static constexpr float kDefaultPoisonTickInterval = 0.5f;

    explicit StatusEffectTracker(float poisonTickInterval = kDefaultPoisonTickInterval);
    ~StatusEffectTracker() = default;

    StatusEffectTracker(const StatusEffectTracker&) = delete;
    StatusEffectTracker& operator=(const StatusEffectTracker&) = delete;

    /**
     * @brief Predicate deciding which target identities are registered
     */
    void SetTargetValidator(TargetValidator validator) { m_validator = std::move(validator); }

    void SetOnPoisonTick(PoisonTickCallback callback) { m_onPoisonTick = std::move(callback); }

    /**
     * @brief Queue a stagger (or freeze) on a target
     *
     * On commit, remaining time becomes max(current, duration); never shortened.
     */
    bool ApplyStagger(TargetId target, float duration);

    /**
     * @brief Queue a (re)start of a poison DoT; ticks every poison interval
     */
    bool ApplyPoisonDoT(TargetId target, float duration, int damagePerTick);

    bool ApplyVulnerability(TargetId target, float duration, float multiplier);

    /**
     * @brief Commit queued applications, decay every record and fire due poison ticks
     *
     * Large steps fire every tick that fell inside them. Callbacks run after
     * the scan, so they may forget targets safely.
     */
    void Update(float deltaTime);

    /**
     * @brief Make queued applications visible without advancing time
     */
    void CommitPending();

    [[nodiscard]] StatusSnapshot Query(TargetId target) const;
    [[nodiscard]] float GetVulnerabilityMultiplier(TargetId target) const;
    [[nodiscard]] bool IsStaggered(TargetId target) const;

    [[nodiscard]] bool HasRecord(TargetId target) const;
    [[nodiscard]] size_t GetRecordCount() const { return m_records.size(); }
    [[nodiscard]] size_t GetPendingCount() const { return m_pending.size(); }
    [[nodiscard]] float GetPoisonTickInterval() const { return m_poisonTickInterval; }

    void Forget(TargetId target);
    void Clear();

private:
    struct StatusRecord {
        float stagger = 0.0f;

        float poisonDuration = 0.0f;
        float poisonElapsed = 0.0f;
        int poisonTicksFired = 0;
        int poisonTotalTicks = 0;
        int poisonPerTick = 0;

        float vulnerabilityMultiplier = 1.0f;
        float vulnerabilityRemaining = 0.0f;

        [[nodiscard]] bool HasPoison() const { return poisonTicksFired < poisonTotalTicks; }
        [[nodiscard]] bool IsIdle() const {
            return stagger <= 0.0f && !HasPoison() && vulnerabilityRemaining <= 0.0f;
        }
    };

    enum class PendingKind : uint8_t {
        Stagger,
        Poison,
        Vulnerability
    };

    struct PendingApplication {
        PendingKind kind;
        TargetId target;
        float duration;
        float multiplier;
        int damagePerTick;
    };

    struct PendingTick {
        TargetId target;
        int damage;
    };

    bool CheckTarget(TargetId target, const char* operation) const;

    std::unordered_map<TargetId, StatusRecord> m_records;
    std::vector<PendingApplication> m_pending;
    std::vector<PendingTick> m_pendingTicks;
    TargetValidator m_validator;
    PoisonTickCallback m_onPoisonTick;
    float m_poisonTickInterval;
};

} // namespace Crimson::Combat
