/**
 * @file TestFixtures.hpp
 * @brief Common test fixtures for the combat core tests
 */

#pragma once

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "combat/CombatSystem.hpp"
#include "mocks/MockCombatServices.hpp"
#include "utils/TestHelpers.hpp"

#include <memory>

namespace Crimson {
namespace Test {

using namespace Crimson::Combat;

// =============================================================================
// Component Fixture
// =============================================================================

/**
 * @brief Wires the combat primitives by hand, without a kit or controller
 *
 * Mirrors the construction order of CombatSystem so hit resolution,
 * projectiles and status effects can be exercised in isolation.
 */
class CombatComponentsTest : public ::testing::Test {
protected:
    CombatComponentsTest()
        : targets(world)
        , pipeline(economy, status, world, actor, random)
        , hits(targets, pipeline, status, economy, effects, events)
        , projectiles(targets, hits, effects) {
        status.SetTargetValidator([this](TargetId target) { return targets.Contains(target); });
        pipeline.SetKitStats(CritTuning{0.0f, 1.5f, 1.3f});
    }

    TargetId AddTarget(TargetId id, const glm::vec3& position) {
        world.Add(id, position);
        targets.Add(id);
        return id;
    }

    FakeTargetWorld world;
    FakeActor actor;
    RecordingEffectSink effects;
    RecordingEventEmitter events;
    ScriptedRandom random;

    TargetRegistry targets;
    ResourceEconomy economy;
    StatusEffectTracker status;
    DamagePipeline pipeline;
    HitResolver hits;
    ProjectileManager projectiles;
};

// =============================================================================
// Combat System Fixture
// =============================================================================

/**
 * @brief Full combat system against in-memory collaborators
 *
 * The actor stands at the origin facing +Z. Frames advance in fixed steps
 * so timing assertions land on known boundaries.
 */
class CombatSystemTest : public ::testing::Test {
protected:
    static constexpr float kStep = 0.01f;

    void SetUp() override {
        combat = std::make_unique<CombatSystem>(world, actor, effects, events, random);
    }

    void TearDown() override {
        combat.reset();
    }

    void Bind(KitId kit) {
        Bind(KitConfig::Defaults(kit));
    }

    void Bind(const KitConfig& config) {
        ASSERT_TRUE(combat->Initialize(config));
    }

    TargetId AddTarget(TargetId id, const glm::vec3& position) {
        world.Add(id, position);
        combat->AddTarget(id);
        return id;
    }

    void Step(const CombatIntent& intent = {}) {
        combat->Update(kStep, intent);
    }

    void Press(AbilitySlot slot) {
        CombatIntent intent;
        intent.Press(slot);
        Step(intent);
    }

    void Attack() {
        CombatIntent intent;
        intent.attack = true;
        Step(intent);
    }

    /**
     * @brief Advance whole frames covering @p seconds with an idle intent
     */
    void Run(float seconds, const CombatIntent& intent = {}) {
        const int frames = static_cast<int>(seconds / kStep + 0.5f);
        for (int i = 0; i < frames; ++i) {
            Step(intent);
        }
    }

    AbilityController& Controller() { return combat->GetController(); }
    ResourceEconomy& Economy() { return combat->GetEconomy(); }

    FakeTargetWorld world;
    FakeActor actor;
    RecordingEffectSink effects;
    RecordingEventEmitter events;
    ScriptedRandom random;
    std::unique_ptr<CombatSystem> combat;
};

} // namespace Test
} // namespace Crimson
