/**
 * @file test_projectile_manager.cpp
 * @brief Unit tests for pooled effect spawning, hit testing and expiry
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "utils/TestFixtures.hpp"

#include <string>

using namespace Crimson::Combat;
using namespace Crimson::Test;

// =============================================================================
// Fixture
// =============================================================================

class ProjectileManagerTest : public CombatComponentsTest {
protected:
    static constexpr float kTick = 0.05f;

    static EffectSpawnDesc Bolt(const std::string& tag, bool pierce = false) {
        EffectSpawnDesc desc;
        desc.kind = EffectKind::Bolt;
        desc.tag = tag;
        desc.direction = glm::vec3(0.0f, 0.0f, 1.0f);
        desc.speed = 10.0f;
        desc.maxLifetime = 2.0f;
        desc.pierce = pierce;
        desc.hit.request.baseDamage = 20.0f;
        desc.hit.tag = tag;
        return desc;
    }

    /// A pierce orb that never moves
    static EffectSpawnDesc StillOrb(const std::string& tag) {
        EffectSpawnDesc desc = Bolt(tag, true);
        desc.kind = EffectKind::Orb;
        desc.speed = 0.0f;
        desc.maxLifetime = 5.0f;
        return desc;
    }

    void Tick(int frames = 1) {
        for (int i = 0; i < frames; ++i) {
            projectiles.Update(kTick);
        }
    }
};

// =============================================================================
// Spawn Tests
// =============================================================================

TEST_F(ProjectileManagerTest, SpawnReturnsDistinctHandles) {
    const EffectHandle first = projectiles.Spawn(Bolt("a"));
    const EffectHandle second = projectiles.Spawn(Bolt("b"));

    EXPECT_NE(kInvalidEffect, first);
    EXPECT_NE(first, second);
    EXPECT_TRUE(projectiles.IsAlive(first));
    EXPECT_EQ(2u, projectiles.GetLiveCount());
}

TEST_F(ProjectileManagerTest, ZeroDirectionIsRejected) {
    EffectSpawnDesc desc = Bolt("broken");
    desc.direction = glm::vec3(0.0f);

    EXPECT_EQ(kInvalidEffect, projectiles.Spawn(desc));
    EXPECT_EQ(0u, projectiles.GetLiveCount());
    EXPECT_EQ(0u, projectiles.GetAllocationCount());
}

TEST_F(ProjectileManagerTest, DirectionIsNormalized) {
    EffectSpawnDesc desc = Bolt("fast");
    desc.direction = glm::vec3(0.0f, 0.0f, 4.0f);
    const EffectHandle handle = projectiles.Spawn(desc);

    Tick(2);
    ASSERT_TRUE(projectiles.GetPosition(handle).has_value());
    EXPECT_VEC3_NEAR(glm::vec3(0.0f, 0.0f, 0.5f), *projectiles.GetPosition(handle), 1e-4f);
}

TEST_F(ProjectileManagerTest, FreshSpawnSkipsFirstUpdate) {
    const EffectHandle handle = projectiles.Spawn(Bolt("bolt"));

    Tick();
    EXPECT_VEC3_EQ(glm::vec3(0.0f), *projectiles.GetPosition(handle));

    Tick();
    EXPECT_VEC3_NEAR(glm::vec3(0.0f, 0.0f, 0.5f), *projectiles.GetPosition(handle), 1e-4f);
}

TEST_F(ProjectileManagerTest, SpawnDuringUpdateWaitsForNextFrame) {
    AddTarget(1, glm::vec3(0.0f, 0.0f, 2.0f));
    EffectHandle followUp = kInvalidEffect;

    EffectSpawnDesc desc = Bolt("bolt");
    desc.onHit = [&](TargetId, const HitOutcome&, const glm::vec3&) {
        followUp = projectiles.Spawn(Bolt("follow_up"));
    };
    projectiles.Spawn(desc);

    // Skip frame, then two steps until the bolt lands at z = 1
    Tick(3);
    ASSERT_NE(kInvalidEffect, followUp);
    EXPECT_VEC3_EQ(glm::vec3(0.0f), *projectiles.GetPosition(followUp));

    Tick();
    EXPECT_VEC3_NEAR(glm::vec3(0.0f, 0.0f, 0.5f), *projectiles.GetPosition(followUp), 1e-4f);
}

// =============================================================================
// Hit Tests
// =============================================================================

TEST_F(ProjectileManagerTest, NonPierceStopsAtFirstTarget) {
    AddTarget(1, glm::vec3(0.0f, 0.0f, 3.0f));
    AddTarget(2, glm::vec3(0.0f, 0.0f, 6.0f));
    const EffectHandle handle = projectiles.Spawn(Bolt("basic_bolt"));

    Tick(40);

    EXPECT_EQ(1, world.HitsOf(1));
    EXPECT_EQ(0, world.HitsOf(2));
    EXPECT_EQ(20, world.DamageOf(1));
    EXPECT_FALSE(projectiles.IsAlive(handle));
    EXPECT_EQ(1, RecordingEffectSink::Count(effects.hits, "basic_bolt"));
    EXPECT_TRUE(effects.expired.empty());
}

TEST_F(ProjectileManagerTest, PierceHitsEachTargetOnce) {
    AddTarget(1, glm::vec3(0.0f, 0.0f, 3.0f));
    AddTarget(2, glm::vec3(0.0f, 0.0f, 6.0f));
    projectiles.Spawn(Bolt("charged_bolt", true));

    Tick(60);

    EXPECT_EQ(1, world.HitsOf(1));
    EXPECT_EQ(1, world.HitsOf(2));
    ASSERT_EQ(1u, effects.expired.size());
    EXPECT_EQ("charged_bolt", effects.expired[0].tag);
    EXPECT_EQ(2, effects.expired[0].payload.hits);
}

TEST_F(ProjectileManagerTest, SameFrameHitsIgnoreEachOthersStatus) {
    AddTarget(1, glm::vec3(0.0f, 0.0f, 2.0f));
    EffectSpawnDesc desc = Bolt("multi_shot");
    desc.hit.vulnerabilityDuration = 6.0f;
    desc.hit.vulnerabilityMultiplier = 1.5f;
    projectiles.Spawn(desc);
    projectiles.Spawn(desc);

    Tick(40);

    // Both land in one frame, before the vulnerability commits
    EXPECT_EQ(2, world.HitsOf(1));
    EXPECT_EQ(40, world.DamageOf(1));
    EXPECT_FLOAT_EQ(1.0f, status.GetVulnerabilityMultiplier(1));

    status.Update(kTick);
    projectiles.Spawn(Bolt("basic_bolt"));
    Tick(40);

    EXPECT_EQ(70, world.DamageOf(1));
}

TEST_F(ProjectileManagerTest, HitEmitsDamageNumber) {
    AddTarget(7, glm::vec3(0.0f, 0.0f, 2.0f));
    projectiles.Spawn(Bolt("basic_bolt"));

    Tick(10);

    const auto numbers = events.DamageNumbers();
    ASSERT_EQ(1u, numbers.size());
    EXPECT_EQ(20, numbers[0]["damage"].get<int>());
    EXPECT_EQ("normal", numbers[0]["kind"].get<std::string>());
    EXPECT_EQ("target-7", numbers[0]["anchorId"].get<std::string>());
    EXPECT_FALSE(numbers[0]["isCritical"].get<bool>());
    EXPECT_EQ(3u, numbers[0]["position"].size());
}

TEST_F(ProjectileManagerTest, ChargedTierUsesWiderPadding) {
    AddTarget(1, glm::vec3(0.0f, 0.0f, 1.25f));

    projectiles.Spawn(StillOrb("basic_orb"));
    Tick(3);
    EXPECT_EQ(0, world.HitsOf(1));

    EffectSpawnDesc charged = StillOrb("charged_orb");
    charged.tier = HitTier::Charged;
    projectiles.Spawn(charged);
    Tick(3);
    EXPECT_EQ(1, world.HitsOf(1));
}

TEST_F(ProjectileManagerTest, BossHitRadiusExtendsReach) {
    AddTarget(1, glm::vec3(0.0f, 0.0f, 2.6f));
    AddTarget(2, glm::vec3(0.0f, 0.0f, -2.6f));
    world.Get(2).boss = true;

    projectiles.Spawn(StillOrb("orb"));
    Tick(3);

    EXPECT_EQ(0, world.HitsOf(1));
    EXPECT_EQ(1, world.HitsOf(2));
}

TEST_F(ProjectileManagerTest, PlanarHitTestIgnoresHeight) {
    AddTarget(1, glm::vec3(0.0f, 5.0f, 0.0f));

    EffectSpawnDesc volumetric = StillOrb("volumetric");
    volumetric.planarHitTest = false;
    projectiles.Spawn(volumetric);
    Tick(3);
    EXPECT_EQ(0, world.HitsOf(1));

    projectiles.Spawn(StillOrb("planar"));
    Tick(3);
    EXPECT_EQ(1, world.HitsOf(1));
}

TEST_F(ProjectileManagerTest, SegmentShapeSweepsItsLength) {
    AddTarget(1, glm::vec3(0.5f, 0.0f, 5.0f));
    AddTarget(2, glm::vec3(3.0f, 0.0f, 5.0f));

    EffectSpawnDesc beam = StillOrb("frost_beam");
    beam.kind = EffectKind::Beam;
    beam.shape = EffectShape::Segment;
    beam.length = 10.0f;
    projectiles.Spawn(beam);

    Tick(3);
    EXPECT_EQ(1, world.HitsOf(1));
    EXPECT_EQ(0, world.HitsOf(2));
}

TEST_F(ProjectileManagerTest, ForgottenTargetCanBeHitAgain) {
    AddTarget(1, glm::vec3(0.0f, 0.0f, 0.5f));
    projectiles.Spawn(StillOrb("orb"));

    Tick(4);
    EXPECT_EQ(1, world.HitsOf(1));

    projectiles.ForgetTarget(1);
    Tick();
    EXPECT_EQ(2, world.HitsOf(1));
}

TEST_F(ProjectileManagerTest, PrepareHitAdjustsPerTarget) {
    AddTarget(1, glm::vec3(0.0f, 0.0f, 0.5f));
    EffectSpawnDesc desc = StillOrb("orb");
    desc.prepareHit = [](TargetId, HitSpec& spec) { spec.request.baseDamage = 7.0f; };
    projectiles.Spawn(desc);

    Tick(2);
    EXPECT_EQ(7, world.DamageOf(1));
}

TEST_F(ProjectileManagerTest, SetBaseDamageAppliesToLaterHits) {
    AddTarget(1, glm::vec3(0.0f, 0.0f, 0.5f));
    const EffectHandle handle = projectiles.Spawn(StillOrb("crimson_orb"));

    EXPECT_TRUE(projectiles.SetBaseDamage(handle, 50.0f));
    Tick(2);
    EXPECT_EQ(50, world.DamageOf(1));
    EXPECT_FALSE(projectiles.SetBaseDamage(9999, 10.0f));
}

// =============================================================================
// Area Burst Tests
// =============================================================================

TEST_F(ProjectileManagerTest, BurstDamagesNeighboursOfThePrimaryHit) {
    AddTarget(1, glm::vec3(0.0f, 0.0f, 3.0f));
    AddTarget(2, glm::vec3(1.5f, 0.0f, 3.0f));
    AddTarget(3, glm::vec3(0.0f, 0.0f, 9.0f));

    EffectSpawnDesc desc = Bolt("judgment_arrow");
    desc.burst.radius = 2.0f;
    desc.burst.damageScale = 0.5f;
    projectiles.Spawn(desc);

    Tick(10);

    EXPECT_EQ(20, world.DamageOf(1));
    EXPECT_EQ(10, world.DamageOf(2));
    EXPECT_EQ(0, world.DamageOf(3));
    EXPECT_EQ(1, world.HitsOf(1));

    ASSERT_EQ(1, RecordingEffectSink::Count(effects.fired, "judgment_arrow_burst"));
    EXPECT_EQ(1, effects.fired[0].payload.hits);
    EXPECT_FLOAT_EQ(2.0f, effects.fired[0].payload.radius);
    EXPECT_EQ(2u, events.DamageNumbers("ability").size() + events.DamageNumbers("normal").size());
}

TEST_F(ProjectileManagerTest, BurstRadiusIsMeasuredOnTheGround) {
    AddTarget(1, glm::vec3(0.0f, 0.0f, 3.0f));
    // Within reach on XZ, out of reach in 3D
    AddTarget(2, glm::vec3(1.5f, 2.0f, 3.0f));

    EffectSpawnDesc desc = Bolt("judgment_arrow");
    desc.burst.radius = 2.0f;
    desc.burst.damageScale = 0.5f;
    projectiles.Spawn(desc);

    Tick(10);

    EXPECT_EQ(20, world.DamageOf(1));
    EXPECT_EQ(10, world.DamageOf(2));
}

// =============================================================================
// Expiry and Dispose Tests
// =============================================================================

TEST_F(ProjectileManagerTest, ExpiredEffectNotifiesOnce) {
    EffectSpawnDesc desc = Bolt("basic_bolt");
    desc.maxLifetime = 0.2f;
    const EffectHandle handle = projectiles.Spawn(desc);

    Tick(20);

    EXPECT_FALSE(projectiles.IsAlive(handle));
    ASSERT_EQ(1u, effects.expired.size());
    EXPECT_EQ("basic_bolt", effects.expired[0].tag);
    EXPECT_EQ(0, effects.expired[0].payload.hits);
}

TEST_F(ProjectileManagerTest, DisposeRemovesWithoutExpiry) {
    const EffectHandle handle = projectiles.Spawn(Bolt("bolt"));

    EXPECT_TRUE(projectiles.Dispose(handle));
    EXPECT_FALSE(projectiles.IsAlive(handle));
    EXPECT_FALSE(projectiles.GetPosition(handle).has_value());
    EXPECT_TRUE(effects.expired.empty());
}

TEST_F(ProjectileManagerTest, DisposeOfUnknownHandleFails) {
    EXPECT_FALSE(projectiles.Dispose(12345));

    const EffectHandle handle = projectiles.Spawn(Bolt("bolt"));
    EXPECT_TRUE(projectiles.Dispose(handle));
    EXPECT_FALSE(projectiles.Dispose(handle));
}

TEST_F(ProjectileManagerTest, DisposeDuringUpdateIsDeferred) {
    AddTarget(1, glm::vec3(0.0f, 0.0f, 0.5f));
    EffectHandle handle = kInvalidEffect;
    bool disposed = false;

    EffectSpawnDesc desc = StillOrb("orb");
    desc.onHit = [&](TargetId, const HitOutcome&, const glm::vec3&) {
        disposed = projectiles.Dispose(handle);
        EXPECT_FALSE(projectiles.IsAlive(handle));
    };
    handle = projectiles.Spawn(desc);

    Tick(2);
    EXPECT_TRUE(disposed);
    EXPECT_EQ(0u, projectiles.GetLiveCount());
    EXPECT_EQ(1u, projectiles.GetPooledCount(EffectKind::Orb, HitTier::Basic));
}

TEST_F(ProjectileManagerTest, ClearDisposesEverything) {
    projectiles.Spawn(Bolt("a"));
    projectiles.Spawn(StillOrb("b"));

    projectiles.Clear();
    EXPECT_EQ(0u, projectiles.GetLiveCount());
}

// =============================================================================
// Pooling Tests
// =============================================================================

TEST_F(ProjectileManagerTest, FinishedEffectsReturnToTheirPool) {
    const EffectHandle handle = projectiles.Spawn(Bolt("bolt"));
    projectiles.Dispose(handle);

    EXPECT_EQ(1u, projectiles.GetPooledCount(EffectKind::Bolt, HitTier::Basic));
    EXPECT_EQ(0u, projectiles.GetPooledCount(EffectKind::Bolt, HitTier::Charged));

    projectiles.Spawn(Bolt("again"));
    EXPECT_EQ(1u, projectiles.GetAllocationCount());
    EXPECT_EQ(0u, projectiles.GetPooledCount(EffectKind::Bolt, HitTier::Basic));
}

TEST_F(ProjectileManagerTest, SpawningPastPoolAllocatesExactlyOne) {
    const size_t capacity = projectiles.GetConfig().poolCapacity;
    projectiles.Warmup(EffectKind::Bolt, HitTier::Basic, capacity);
    ASSERT_EQ(capacity, projectiles.GetAllocationCount());

    for (size_t i = 0; i < capacity + 1; ++i) {
        projectiles.Spawn(Bolt("bolt"));
    }

    EXPECT_EQ(capacity + 1, projectiles.GetAllocationCount());
    EXPECT_EQ(0u, projectiles.GetPooledCount(EffectKind::Bolt, HitTier::Basic));
}

TEST_F(ProjectileManagerTest, PoolNeverGrowsPastCapacity) {
    const size_t capacity = projectiles.GetConfig().poolCapacity;
    for (size_t i = 0; i < capacity + 3; ++i) {
        projectiles.Spawn(Bolt("bolt"));
    }

    projectiles.Clear();
    EXPECT_EQ(capacity, projectiles.GetPooledCount(EffectKind::Bolt, HitTier::Basic));
}

TEST_F(ProjectileManagerTest, TiersUseSeparatePools) {
    projectiles.Warmup(EffectKind::Arrow, HitTier::Basic, 2);

    EffectSpawnDesc charged = Bolt("arrow");
    charged.kind = EffectKind::Arrow;
    charged.tier = HitTier::Charged;
    projectiles.Spawn(charged);

    EXPECT_EQ(3u, projectiles.GetAllocationCount());
    EXPECT_EQ(2u, projectiles.GetPooledCount(EffectKind::Arrow, HitTier::Basic));
}

TEST_F(ProjectileManagerTest, RecycledEffectStartsClean) {
    AddTarget(1, glm::vec3(0.0f, 0.0f, 0.5f));
    projectiles.Spawn(StillOrb("orb"));
    Tick(2);
    ASSERT_EQ(1, world.HitsOf(1));
    projectiles.Clear();

    // Same pooled instance; the previous already-hit set must not carry over
    projectiles.Spawn(StillOrb("orb"));
    Tick(2);
    EXPECT_EQ(2, world.HitsOf(1));
    EXPECT_EQ(1u, projectiles.GetAllocationCount());
}
