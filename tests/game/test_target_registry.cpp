/**
 * @file test_target_registry.cpp
 * @brief Unit tests for the non-owning target registry and its scans
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "combat/TargetRegistry.hpp"
#include "utils/TestHelpers.hpp"

#include <stdexcept>
#include <vector>

using namespace Crimson::Combat;
using namespace Crimson::Test;

// =============================================================================
// Fixture
// =============================================================================

class TargetRegistryTest : public ::testing::Test {
protected:
    TargetRegistryTest() : registry(world, 2.5f, 0.8f) {}

    FakeTargetWorld::Target& Add(TargetId id, const glm::vec3& position) {
        FakeTargetWorld::Target& target = world.Add(id, position);
        registry.Add(id);
        return target;
    }

    std::vector<TargetId> Scan() {
        std::vector<TargetId> visited;
        registry.ForEachLiving([&visited](TargetId target) {
            visited.push_back(target);
            return true;
        });
        return visited;
    }

    FakeTargetWorld world;
    TargetRegistry registry;
};

// =============================================================================
// Registration Tests
// =============================================================================

TEST_F(TargetRegistryTest, AddAndRemove) {
    Add(1, glm::vec3(0.0f));
    Add(2, glm::vec3(1.0f));

    EXPECT_EQ(2u, registry.Count());
    EXPECT_TRUE(registry.Contains(1));
    EXPECT_TRUE(registry.Remove(1));
    EXPECT_FALSE(registry.Contains(1));
    EXPECT_EQ(1u, registry.Count());
}

TEST_F(TargetRegistryTest, RejectsInvalidAndDuplicateIds) {
    EXPECT_FALSE(registry.Add(kInvalidTarget));
    EXPECT_TRUE(registry.Add(4));
    EXPECT_FALSE(registry.Add(4));
    EXPECT_FALSE(registry.Remove(5));
}

TEST_F(TargetRegistryTest, RemovedCallbackFires) {
    std::vector<TargetId> removed;
    registry.SetOnRemoved([&removed](TargetId target) { removed.push_back(target); });
    Add(1, glm::vec3(0.0f));
    Add(2, glm::vec3(0.0f));

    registry.Remove(2);
    registry.Clear();

    ASSERT_EQ(2u, removed.size());
    EXPECT_EQ(2u, removed[0]);
    EXPECT_EQ(1u, removed[1]);
    EXPECT_EQ(0u, registry.Count());
}

TEST_F(TargetRegistryTest, ScanSkipsDeadTargets) {
    Add(1, glm::vec3(0.0f));
    Add(2, glm::vec3(0.0f));
    world.Kill(1);

    EXPECT_THAT(Scan(), ::testing::ElementsAre(2u));
    EXPECT_FALSE(registry.IsTargetAlive(1));
    EXPECT_TRUE(registry.IsTargetAlive(2));
}

// =============================================================================
// Iteration Safety Tests
// =============================================================================

TEST_F(TargetRegistryTest, RemovalDuringScanIsDeferred) {
    Add(1, glm::vec3(0.0f));
    Add(2, glm::vec3(0.0f));
    Add(3, glm::vec3(0.0f));

    std::vector<TargetId> visited;
    registry.ForEachLiving([&](TargetId target) {
        visited.push_back(target);
        if (target == 1) {
            EXPECT_TRUE(registry.Remove(1));
            EXPECT_TRUE(registry.IsScanning());
            EXPECT_FALSE(registry.IsTargetAlive(1));
        }
        return true;
    });

    EXPECT_THAT(visited, ::testing::ElementsAre(1u, 2u, 3u));
    EXPECT_FALSE(registry.Contains(1));
    EXPECT_FALSE(registry.IsScanning());
}

TEST_F(TargetRegistryTest, TargetRemovedAheadOfScanIsNotVisited) {
    Add(1, glm::vec3(0.0f));
    Add(2, glm::vec3(0.0f));
    Add(3, glm::vec3(0.0f));

    std::vector<TargetId> visited;
    registry.ForEachLiving([&](TargetId target) {
        visited.push_back(target);
        if (target == 1) {
            registry.Remove(2);
        }
        return true;
    });

    EXPECT_THAT(visited, ::testing::ElementsAre(1u, 3u));
    EXPECT_EQ(2u, registry.Count());
}

TEST_F(TargetRegistryTest, TargetsAddedDuringScanWaitForNextScan) {
    Add(1, glm::vec3(0.0f));

    std::vector<TargetId> visited;
    registry.ForEachLiving([&](TargetId target) {
        visited.push_back(target);
        Add(9, glm::vec3(0.0f));
        return true;
    });

    EXPECT_THAT(visited, ::testing::ElementsAre(1u));
    EXPECT_THAT(Scan(), ::testing::ElementsAre(1u, 9u));
}

TEST_F(TargetRegistryTest, FailingTargetDoesNotAbortScan) {
    Add(1, glm::vec3(0.0f));
    Add(2, glm::vec3(0.0f));
    Add(3, glm::vec3(0.0f));

    std::vector<TargetId> visited;
    registry.ForEachLiving([&](TargetId target) {
        if (target == 2) {
            throw std::runtime_error("target vanished");
        }
        visited.push_back(target);
        return true;
    });

    EXPECT_THAT(visited, ::testing::ElementsAre(1u, 3u));
}

TEST_F(TargetRegistryTest, ReturningFalseStopsScan) {
    Add(1, glm::vec3(0.0f));
    Add(2, glm::vec3(0.0f));

    int visits = 0;
    registry.ForEachLiving([&visits](TargetId) {
        ++visits;
        return false;
    });
    EXPECT_EQ(1, visits);
}

// =============================================================================
// Query Tests
// =============================================================================

TEST_F(TargetRegistryTest, FindNearestPicksClosestInCone) {
    Add(1, glm::vec3(0.0f, 0.0f, 6.0f));
    Add(2, glm::vec3(0.5f, 0.0f, 3.0f));
    Add(3, glm::vec3(0.0f, 0.0f, -1.0f));   // Behind

    const TargetId nearest = registry.FindNearest(glm::vec3(0.0f), glm::vec3(0.0f, 0.0f, 1.0f), 10.0f, 0.4f, false);
    EXPECT_EQ(2u, nearest);
}

TEST_F(TargetRegistryTest, FindNearestRespectsRangeAndHitRadius) {
    Add(1, glm::vec3(0.0f, 0.0f, 3.5f));

    EXPECT_EQ(kInvalidTarget,
              registry.FindNearest(glm::vec3(0.0f), glm::vec3(0.0f, 0.0f, 1.0f), 3.0f, 0.2f, false));
    // Default radius 0.8 brings it into reach
    EXPECT_EQ(1u, registry.FindNearest(glm::vec3(0.0f), glm::vec3(0.0f, 0.0f, 1.0f), 3.0f, 0.2f, true));
}

TEST_F(TargetRegistryTest, FindNearestSkipsMalformedTargets) {
    Add(1, glm::vec3(0.0f, 0.0f, 1.0f)).throwOnQuery = true;
    Add(2, glm::vec3(0.0f, 0.0f, 2.0f));

    EXPECT_EQ(2u, registry.FindNearest(glm::vec3(0.0f), glm::vec3(0.0f, 0.0f, 1.0f), 5.0f, 0.2f, false));
}

TEST_F(TargetRegistryTest, HitRadiusFallsBackByTargetType) {
    Add(1, glm::vec3(0.0f));
    Add(2, glm::vec3(0.0f)).boss = true;
    Add(3, glm::vec3(0.0f)).hitRadius = 1.2f;

    EXPECT_FLOAT_EQ(0.8f, registry.HitRadiusOf(1));
    EXPECT_FLOAT_EQ(2.5f, registry.HitRadiusOf(2));
    EXPECT_FLOAT_EQ(1.2f, registry.HitRadiusOf(3));
}
