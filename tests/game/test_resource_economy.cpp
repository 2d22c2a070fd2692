/**
 * @file test_resource_economy.cpp
 * @brief Unit tests for charge stacks, the ultimate meter and damage buffs
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "combat/ResourceEconomy.hpp"

using namespace Crimson::Combat;
using ::testing::MockFunction;

namespace {

ChargePoolConfig Pool(int cap, float idleDecay = 0.0f, bool perTarget = false, bool resetOnCap = false) {
    ChargePoolConfig config;
    config.cap = cap;
    config.idleDecaySeconds = idleDecay;
    config.perTarget = perTarget;
    config.resetOnCap = resetOnCap;
    return config;
}

} // namespace

// =============================================================================
// Charge Stack Tests
// =============================================================================

class ChargeStackTest : public ::testing::Test {
protected:
    void SetUp() override {
        economy.RegisterCharge("blood", Pool(8, 8.0f));
    }

    ResourceEconomy economy;
};

TEST_F(ChargeStackTest, AddChargeSaturatesAtCap) {
    EXPECT_EQ(3, economy.AddCharge("blood", 3));
    EXPECT_EQ(8, economy.AddCharge("blood", 1000));
    EXPECT_EQ(8, economy.GetCharge("blood"));
    EXPECT_EQ(8, economy.GetCap("blood"));
}

TEST_F(ChargeStackTest, NegativeGainClampsAtZero) {
    economy.AddCharge("blood", 2);
    EXPECT_EQ(0, economy.AddCharge("blood", -5));
}

TEST_F(ChargeStackTest, ConsumeAllReturnsPreviousValueAndLeavesZero) {
    economy.AddCharge("blood", 5);

    EXPECT_EQ(5, economy.ConsumeAll("blood"));
    EXPECT_EQ(0, economy.GetCharge("blood"));
    EXPECT_EQ(0, economy.ConsumeAll("blood"));
}

TEST_F(ChargeStackTest, ConsumeTakesAtMostAvailable) {
    economy.AddCharge("blood", 4);

    EXPECT_EQ(3, economy.Consume("blood", 3));
    EXPECT_EQ(1, economy.Consume("blood", 3));
    EXPECT_EQ(0, economy.GetCharge("blood"));
}

TEST_F(ChargeStackTest, RestoreChargeRespectsCap) {
    economy.AddCharge("blood", 6);
    economy.RestoreCharge("blood", 5);
    EXPECT_EQ(8, economy.GetCharge("blood"));
}

TEST_F(ChargeStackTest, HasChargesComparesAgainstRequirement) {
    economy.AddCharge("blood", 2);
    EXPECT_TRUE(economy.HasCharges("blood", 2));
    EXPECT_FALSE(economy.HasCharges("blood", 3));
}

TEST_F(ChargeStackTest, UnknownPoolIsEmpty) {
    EXPECT_FALSE(economy.HasPool("trust"));
    EXPECT_EQ(0, economy.AddCharge("trust", 3));
    EXPECT_EQ(0, economy.GetCharge("trust"));
    EXPECT_EQ(0, economy.ConsumeAll("trust"));
}

TEST_F(ChargeStackTest, ReRegisteringWithSmallerCapClampsCounter) {
    economy.AddCharge("blood", 8);
    economy.RegisterCharge("blood", Pool(6));
    EXPECT_EQ(6, economy.GetCharge("blood"));
}

// =============================================================================
// Idle Decay Tests
// =============================================================================

TEST(ChargeDecayTest, IdleStacksResetAfterTimeout) {
    ResourceEconomy economy({}, 1.0f);
    economy.RegisterCharge("poison", Pool(6, 2.0f));
    economy.AddCharge("poison", 4);

    economy.Update(1.0f);
    EXPECT_EQ(4, economy.GetCharge("poison"));

    economy.Update(1.0f);
    EXPECT_EQ(0, economy.GetCharge("poison"));
}

TEST(ChargeDecayTest, GainRestartsIdleTimer) {
    ResourceEconomy economy({}, 1.0f);
    economy.RegisterCharge("poison", Pool(6, 2.0f));
    economy.AddCharge("poison", 1);

    economy.Update(1.0f);
    economy.AddCharge("poison", 1);
    economy.Update(1.0f);

    EXPECT_EQ(2, economy.GetCharge("poison"));
}

TEST(ChargeDecayTest, CheckIsThrottledToInterval) {
    ResourceEconomy economy({}, 1.0f);
    economy.RegisterCharge("trust", Pool(8, 0.25f));
    economy.AddCharge("trust", 3);

    // Idle timeout has passed but no check has run yet
    economy.Update(0.5f);
    EXPECT_EQ(3, economy.GetCharge("trust"));

    economy.Update(0.5f);
    EXPECT_EQ(0, economy.GetCharge("trust"));
}

TEST(ChargeDecayTest, UnevenStepsKeepTheCheckCadence) {
    ResourceEconomy economy({}, 1.0f);
    economy.RegisterCharge("trust", Pool(8, 2.0f));
    economy.AddCharge("trust", 3);

    // Checks land at 1.5 and 2.25; the leftover half step carries over
    economy.Update(0.75f);
    economy.Update(0.75f);
    EXPECT_EQ(3, economy.GetCharge("trust"));

    economy.Update(0.75f);
    EXPECT_EQ(0, economy.GetCharge("trust"));
}

TEST(ChargeDecayTest, ZeroTimeoutNeverDecays) {
    ResourceEconomy economy({}, 1.0f);
    economy.RegisterCharge("blood", Pool(8, 0.0f));
    economy.AddCharge("blood", 5);

    for (int i = 0; i < 30; ++i) {
        economy.Update(1.0f);
    }
    EXPECT_EQ(5, economy.GetCharge("blood"));
}

// =============================================================================
// Per-target Pool Tests
// =============================================================================

class PerTargetPoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        economy.RegisterCharge("frost", Pool(8, 10.0f, true, true));
    }

    ResourceEconomy economy;
};

TEST_F(PerTargetPoolTest, CountersAreIndependentPerOwner) {
    economy.AddCharge("frost", 3, 1);
    economy.AddCharge("frost", 5, 2);

    EXPECT_EQ(3, economy.GetCharge("frost", 1));
    EXPECT_EQ(5, economy.GetCharge("frost", 2));
    EXPECT_EQ(0, economy.GetCharge("frost", 3));
}

TEST_F(PerTargetPoolTest, ReachingCapFiresCallbackOnceAndResets) {
    MockFunction<void(const std::string&, TargetId)> onCap;
    EXPECT_CALL(onCap, Call("frost", 7u)).Times(1);
    economy.SetCapCallback("frost", onCap.AsStdFunction());

    EXPECT_EQ(0, economy.AddCharge("frost", 8, 7));
    EXPECT_EQ(0, economy.GetCharge("frost", 7));
}

TEST_F(PerTargetPoolTest, CallbackFiresOnTheGainThatReachesCap) {
    MockFunction<void(const std::string&, TargetId)> onCap;
    economy.SetCapCallback("frost", onCap.AsStdFunction());

    EXPECT_CALL(onCap, Call(::testing::_, ::testing::_)).Times(0);
    economy.AddCharge("frost", 5, 4);
    ::testing::Mock::VerifyAndClearExpectations(&onCap);

    EXPECT_CALL(onCap, Call("frost", 4u)).Times(1);
    economy.AddCharge("frost", 6, 4);
    EXPECT_EQ(0, economy.GetCharge("frost", 4));
}

TEST_F(PerTargetPoolTest, GainWithoutOwnerIsIgnored) {
    EXPECT_EQ(0, economy.AddCharge("frost", 3));
    EXPECT_EQ(0, economy.GetCharge("frost"));
}

TEST_F(PerTargetPoolTest, ForgetOwnerDropsCounter) {
    economy.AddCharge("frost", 3, 9);
    economy.ForgetOwner(9);
    EXPECT_EQ(0, economy.GetCharge("frost", 9));
}

// =============================================================================
// Ultimate Tests
// =============================================================================

TEST(UltimateTest, ChargedHitsGainMoreThanBasicHits) {
    ResourceEconomy economy(UltimateConfig{4.0f, 10.0f, 100.0f});

    EXPECT_FLOAT_EQ(4.0f, economy.AddUltimate(HitTier::Basic));
    EXPECT_FLOAT_EQ(14.0f, economy.AddUltimate(HitTier::Charged));
}

TEST(UltimateTest, MeterCapsAtMax) {
    ResourceEconomy economy(UltimateConfig{40.0f, 60.0f, 100.0f});
    economy.AddUltimate(HitTier::Charged);
    economy.AddUltimate(HitTier::Charged);
    EXPECT_FLOAT_EQ(100.0f, economy.GetUltimate());
}

TEST(UltimateTest, UseRequiresFullMeter) {
    ResourceEconomy economy(UltimateConfig{50.0f, 50.0f, 100.0f});
    economy.AddUltimate(HitTier::Basic);

    EXPECT_FALSE(economy.CanUseUltimate());
    EXPECT_FALSE(economy.UseUltimate());
    EXPECT_FLOAT_EQ(50.0f, economy.GetUltimate());

    economy.AddUltimate(HitTier::Basic);
    EXPECT_TRUE(economy.UseUltimate());
    EXPECT_FLOAT_EQ(0.0f, economy.GetUltimate());
}

TEST(UltimateTest, TestModeBypassesMeter) {
    ResourceEconomy economy;
    economy.SetUltimateTestMode(true);
    EXPECT_TRUE(economy.CanUseUltimate());
    EXPECT_TRUE(economy.UseUltimate());
}

// =============================================================================
// Multiplier and Buff Tests
// =============================================================================

TEST(NextAttackMultiplierTest, ConsumeReadsOnceThenResets) {
    ResourceEconomy economy;
    economy.GrantNextAttackMultiplier(1.5f);

    EXPECT_FLOAT_EQ(1.5f, economy.ConsumeNextAttackMultiplier());
    EXPECT_FLOAT_EQ(1.0f, economy.ConsumeNextAttackMultiplier());
}

TEST(NextAttackMultiplierTest, GrantsKeepTheStrongest) {
    ResourceEconomy economy;
    economy.GrantNextAttackMultiplier(2.0f);
    economy.GrantNextAttackMultiplier(1.25f);
    EXPECT_FLOAT_EQ(2.0f, economy.PeekNextAttackMultiplier());
}

TEST(NextAttackMultiplierTest, NeverBelowOne) {
    ResourceEconomy economy;
    economy.GrantNextAttackMultiplier(0.5f);
    EXPECT_FLOAT_EQ(1.0f, economy.ConsumeNextAttackMultiplier());
}

TEST(DamageBuffTest, ActiveBuffsStackMultiplicatively) {
    ResourceEconomy economy;
    economy.SetDamageBuff("shadowStep", 2.0f, 3.0f);
    economy.SetDamageBuff("toxicFocus", 1.4f, 8.0f);

    EXPECT_NEAR(2.8f, economy.GetActiveBuffMultiplier(), 1e-5f);
}

TEST(DamageBuffTest, BuffExpiresAfterDuration) {
    ResourceEconomy economy;
    economy.SetDamageBuff("shadowStep", 2.0f, 1.0f);

    economy.Update(0.5f);
    EXPECT_TRUE(economy.IsBuffActive("shadowStep"));

    economy.Update(0.6f);
    EXPECT_FALSE(economy.IsBuffActive("shadowStep"));
    EXPECT_FLOAT_EQ(1.0f, economy.GetActiveBuffMultiplier());
}

TEST(DamageBuffTest, RefreshReplacesRemainingTime) {
    ResourceEconomy economy;
    economy.SetDamageBuff("zone", 2.0f, 1.0f);
    economy.SetDamageBuff("zone", 2.0f, 4.0f);
    EXPECT_FLOAT_EQ(4.0f, economy.GetBuffRemaining("zone"));
}

TEST(ComboCountTest, NeverNegative) {
    ResourceEconomy economy;
    economy.SetComboCount(-3);
    EXPECT_EQ(0, economy.GetComboCount());
}

TEST(ResourceEconomyTest, ResetClearsEveryCounter) {
    ResourceEconomy economy;
    economy.RegisterCharge("blood", Pool(8));
    economy.AddCharge("blood", 4);
    economy.AddUltimate(HitTier::Charged);
    economy.SetComboCount(2);
    economy.GrantNextAttackMultiplier(2.0f);
    economy.SetDamageBuff("zone", 2.0f, 5.0f);

    economy.Reset();

    EXPECT_EQ(0, economy.GetCharge("blood"));
    EXPECT_TRUE(economy.HasPool("blood"));
    EXPECT_FLOAT_EQ(0.0f, economy.GetUltimate());
    EXPECT_EQ(0, economy.GetComboCount());
    EXPECT_FLOAT_EQ(1.0f, economy.PeekNextAttackMultiplier());
    EXPECT_FLOAT_EQ(1.0f, economy.GetActiveBuffMultiplier());
}
