/**
 * @file test_config.cpp
 * @brief Unit tests for the configuration store, kit tuning and core tuning
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "config/CombatTuning.hpp"
#include "config/Config.hpp"
#include "config/KitConfig.hpp"

#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>

using namespace Crimson;
using namespace Crimson::Combat;
using json = nlohmann::json;

// =============================================================================
// Config Store Tests
// =============================================================================

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        Config::Instance().Clear();
        tempDir = std::filesystem::temp_directory_path() / "crimson_config_test";
        std::filesystem::create_directories(tempDir);
    }

    void TearDown() override {
        Config::Instance().Clear();
        std::error_code ec;
        std::filesystem::remove_all(tempDir, ec);
    }

    Config& config() { return Config::Instance(); }

    std::filesystem::path tempDir;
};

TEST_F(ConfigTest, ReadsNestedKeys) {
    ASSERT_TRUE(config().LoadFromString(R"({"combat": {"pool": {"capacity": 12}}})"));

    EXPECT_TRUE(config().Has("combat.pool.capacity"));
    EXPECT_EQ(12, config().Get<int>("combat.pool.capacity", 8));
    EXPECT_FALSE(config().Has("combat.pool.missing"));
    EXPECT_EQ(8, config().Get<int>("combat.pool.missing", 8));
}

TEST_F(ConfigTest, MistypedValueFallsBackToDefault) {
    ASSERT_TRUE(config().LoadFromString(R"({"combat": {"ultimate": {"max": "lots"}}})"));
    EXPECT_FLOAT_EQ(100.0f, config().Get<float>("combat.ultimate.max", 100.0f));
}

TEST_F(ConfigTest, RejectsMalformedText) {
    ASSERT_TRUE(config().LoadFromString(R"({"keep": 1})"));

    EXPECT_FALSE(config().LoadFromString("{not json"));
    EXPECT_FALSE(config().LoadFromString("[1, 2, 3]"));
    EXPECT_EQ(1, config().Get<int>("keep"));
}

TEST_F(ConfigTest, SetCreatesIntermediateObjects) {
    config().Set("combat.hit.bossRadius", 3.0f);
    config().Set("debug.spawn", glm::vec3(1.0f, 2.0f, 3.0f));

    EXPECT_FLOAT_EQ(3.0f, config().Get<float>("combat.hit.bossRadius"));
    const glm::vec3 spawn = config().Get<glm::vec3>("debug.spawn");
    EXPECT_FLOAT_EQ(2.0f, spawn.y);
    EXPECT_TRUE(config().GetSection("combat.hit").is_object());
    EXPECT_TRUE(config().GetSection("combat.nothing").is_null());
}

TEST_F(ConfigTest, MergeOverridesLeaves) {
    ASSERT_TRUE(config().LoadFromString(R"({"combat": {"pool": {"capacity": 8, "warmupBasic": 6}}})"));

    config().Merge(json{{"combat", {{"pool", {{"capacity", 16}}}}}});

    EXPECT_EQ(16, config().Get<int>("combat.pool.capacity"));
    EXPECT_EQ(6, config().Get<int>("combat.pool.warmupBasic"));
}

TEST_F(ConfigTest, SaveThenLoadFromDisk) {
    const auto path = tempDir / "combat.json";
    config().Set("combat.targeting.minDistance", 4.5f);
    ASSERT_TRUE(config().Save(path));

    config().Clear();
    EXPECT_FALSE(config().Has("combat.targeting.minDistance"));

    ASSERT_TRUE(config().Load(path));
    EXPECT_FLOAT_EQ(4.5f, config().Get<float>("combat.targeting.minDistance"));
    EXPECT_TRUE(config().Reload());
}

TEST_F(ConfigTest, MissingOrBrokenFileFailsToLoad) {
    EXPECT_FALSE(config().Load(tempDir / "absent.json"));

    const auto broken = tempDir / "broken.json";
    std::ofstream(broken) << "{\"combat\": ";
    EXPECT_FALSE(config().Load(broken));
}

TEST_F(ConfigTest, ReloadNeedsAPath) {
    EXPECT_FALSE(config().Reload());
    EXPECT_FALSE(config().Save());
}

// =============================================================================
// Validation Result Tests
// =============================================================================

TEST(ValidationResultTest, ErrorsInvalidateWarningsDoNot) {
    ValidationResult result;
    result.AddWarning("kit.passive.x", "Unknown parameter");
    EXPECT_TRUE(result.valid);

    result.AddError("resource.cap", "Cap must be at least 1");
    EXPECT_FALSE(result.valid);
    ASSERT_EQ(1u, result.errors.size());
    EXPECT_EQ("[resource.cap] Cap must be at least 1", result.errors[0]);
}

TEST(ValidationResultTest, MergeCarriesEverything) {
    ValidationResult outer;
    ValidationResult inner;
    inner.AddError("a", "bad");
    inner.AddWarning("b", "odd");

    outer.Merge(inner);

    EXPECT_FALSE(outer.valid);
    EXPECT_EQ(1u, outer.errors.size());
    EXPECT_EQ(1u, outer.warnings.size());
}

// =============================================================================
// Kit Config Tests
// =============================================================================

TEST(KitIdTest, StringConversions) {
    EXPECT_STREQ("blood", KitIdToString(KitId::Blood));
    EXPECT_STREQ("frost", KitIdToString(KitId::Frost));
    EXPECT_STREQ("poison", KitIdToString(KitId::PoisonMelee));
    EXPECT_STREQ("bow", KitIdToString(KitId::RangedBow));

    KitId id = KitId::Blood;
    EXPECT_TRUE(KitIdFromString("bow", id));
    EXPECT_EQ(KitId::RangedBow, id);
    EXPECT_FALSE(KitIdFromString("necromancer", id));
    EXPECT_EQ(KitId::RangedBow, id);
}

TEST(KitConfigTest, ShippedDefaultsAreValid) {
    for (KitId id : {KitId::Blood, KitId::Frost, KitId::PoisonMelee, KitId::RangedBow}) {
        const KitConfig config = KitConfig::Defaults(id);
        const ValidationResult result = config.Validate();

        EXPECT_EQ(id, config.id);
        EXPECT_TRUE(result.valid) << KitIdToString(id);
        EXPECT_TRUE(result.errors.empty()) << KitIdToString(id);
    }
}

TEST(KitConfigTest, DefaultsDescribeEachKit) {
    const KitConfig frost = KitConfig::Defaults(KitId::Frost);
    EXPECT_EQ("frost", frost.resource.name);
    EXPECT_TRUE(frost.resource.perTarget);
    EXPECT_TRUE(frost.resource.resetOnCap);
    EXPECT_EQ(AbilityActivation::Targeted, frost.Ability(AbilitySlot::X).activation);

    const KitConfig poison = KitConfig::Defaults(KitId::PoisonMelee);
    EXPECT_FALSE(poison.Ability(AbilitySlot::Q).enabled);
    EXPECT_EQ(1, poison.Ability(AbilitySlot::E).requiredCharges);

    const KitConfig bow = KitConfig::Defaults(KitId::RangedBow);
    EXPECT_EQ(8, bow.resource.cap);
    EXPECT_TRUE(bow.Ability(AbilitySlot::F).requiresUltimate);
}

TEST(KitConfigTest, ParamsAndPassivesFallBack) {
    const KitConfig frost = KitConfig::Defaults(KitId::Frost);

    EXPECT_FLOAT_EQ(3.0f, frost.Passive("capFreeze"));
    EXPECT_FLOAT_EQ(7.0f, frost.Passive("missing", 7.0f));
    EXPECT_FLOAT_EQ(12.0f, frost.Ability(AbilitySlot::E).Param("length"));
    EXPECT_FLOAT_EQ(-1.0f, frost.Ability(AbilitySlot::E).Param("missing", -1.0f));
}

TEST(KitConfigTest, ValidateFlagsBrokenRanges) {
    KitConfig config = KitConfig::Defaults(KitId::Blood);
    config.crit.critChance = 1.5f;
    config.resource.cap = 0;
    config.Ability(AbilitySlot::X).windup = 0.0f;

    const ValidationResult result = config.Validate();

    EXPECT_FALSE(result.valid);
    EXPECT_THAT(result.errors, ::testing::Contains(::testing::HasSubstr("crit.critChance")));
    EXPECT_THAT(result.errors, ::testing::Contains(::testing::HasSubstr("resource.cap")));
    EXPECT_THAT(result.warnings, ::testing::Contains(::testing::HasSubstr("abilities.x.windup")));
}

TEST(KitConfigTest, DisabledSlotsAreNotValidated) {
    KitConfig config = KitConfig::Defaults(KitId::PoisonMelee);
    config.Ability(AbilitySlot::Q).cooldown = -5.0f;

    EXPECT_TRUE(config.Validate().valid);
}

// =============================================================================
// Kit JSON Tests
// =============================================================================

TEST(LoadKitConfigTest, OverlaysPresentFields) {
    KitConfig config = KitConfig::Defaults(KitId::Blood);
    const json overrides = {
        {"displayName", "Blood Mage (test)"},
        {"weapon", {{"damage", 30.0}}},
        {"resource", {{"cap", 10}}},
        {"abilities", {{"q", {{"cooldown", 4.0}, {"params", {{"damage", 70.0}}}}}}}
    };

    const ValidationResult result = LoadKitConfig(overrides, config);

    EXPECT_TRUE(result.valid);
    EXPECT_TRUE(result.warnings.empty());
    EXPECT_EQ("Blood Mage (test)", config.displayName);
    EXPECT_FLOAT_EQ(30.0f, config.weapon.damage);
    EXPECT_FLOAT_EQ(2.75f, config.weapon.range);
    EXPECT_EQ(10, config.resource.cap);
    EXPECT_FLOAT_EQ(4.0f, config.Ability(AbilitySlot::Q).cooldown);
    EXPECT_FLOAT_EQ(70.0f, config.Ability(AbilitySlot::Q).Param("damage"));
    EXPECT_FLOAT_EQ(3.5f, config.Ability(AbilitySlot::Q).Param("radius"));
}

TEST(LoadKitConfigTest, WrongTypesAreReportedAndSkipped) {
    KitConfig config = KitConfig::Defaults(KitId::Blood);
    const json overrides = {
        {"weapon", {{"damage", "heavy"}}},
        {"attack", {{"maxCombo", 2.5}}},
        {"resource", {{"perTarget", 1}}}
    };

    const ValidationResult result = LoadKitConfig(overrides, config);

    EXPECT_FALSE(result.valid);
    EXPECT_EQ(3u, result.errors.size());
    EXPECT_FLOAT_EQ(25.0f, config.weapon.damage);
    EXPECT_EQ(3, config.attack.maxCombo);
    EXPECT_FALSE(config.resource.perTarget);
}

TEST(LoadKitConfigTest, NegativeAndOutOfRangeValuesAreRejected) {
    KitConfig config = KitConfig::Defaults(KitId::RangedBow);
    const json overrides = {
        {"basic", {{"speed", -1.0}}},
        {"crit", {{"critChance", 1.2}}},
        {"abilities", {{"e", {{"activation", "sometimes"}}}}}
    };

    const ValidationResult result = LoadKitConfig(overrides, config);

    EXPECT_FALSE(result.valid);
    EXPECT_FLOAT_EQ(30.0f, config.basic.speed);
    EXPECT_FLOAT_EQ(0.25f, config.crit.critChance);
    EXPECT_EQ(AbilityActivation::Instant, config.Ability(AbilitySlot::E).activation);
}

TEST(LoadKitConfigTest, UnknownParameterWarnsButApplies) {
    KitConfig config = KitConfig::Defaults(KitId::Frost);
    const json overrides = {{"abilities", {{"q", {{"params", {{"wobble", 2.0}}}}}}}};

    const ValidationResult result = LoadKitConfig(overrides, config);

    EXPECT_TRUE(result.valid);
    ASSERT_EQ(1u, result.warnings.size());
    EXPECT_THAT(result.warnings[0], ::testing::HasSubstr("abilities.q.params.wobble"));
    EXPECT_FLOAT_EQ(2.0f, config.Ability(AbilitySlot::Q).Param("wobble"));
}

TEST(LoadKitConfigTest, SemanticFailuresRestoreDefaults) {
    KitConfig config = KitConfig::Defaults(KitId::Blood);
    const json overrides = {
        {"attack", {{"maxCombo", 0}}},
        {"resource", {{"cap", 0}}}
    };

    const ValidationResult result = LoadKitConfig(overrides, config);

    EXPECT_FALSE(result.valid);
    EXPECT_EQ(3, config.attack.maxCombo);
    EXPECT_EQ(8, config.resource.cap);
}

TEST(LoadKitConfigTest, RequirementAboveCapWarns) {
    KitConfig config = KitConfig::Defaults(KitId::Blood);
    const json overrides = {{"abilities", {{"e", {{"requiredCharges", 9}}}}}};

    const ValidationResult result = LoadKitConfig(overrides, config);

    EXPECT_TRUE(result.valid);
    EXPECT_THAT(result.warnings, ::testing::Contains(::testing::HasSubstr("abilities.e.requiredCharges")));
}

TEST(LoadKitConfigTest, NonObjectIsAnError) {
    KitConfig config = KitConfig::Defaults(KitId::Blood);
    EXPECT_FALSE(LoadKitConfig(json::array({1, 2}), config).valid);
}

TEST(BuildKitConfigTest, AppliesMatchingKitSection) {
    const json root = {{"kits", {{"frost", {{"weapon", {{"damage", 40.0}}}}}}}};
    ValidationResult result;

    const KitConfig frost = BuildKitConfig(KitId::Frost, root, result);
    const KitConfig bow = BuildKitConfig(KitId::RangedBow, root, result);

    EXPECT_TRUE(result.valid);
    EXPECT_FLOAT_EQ(40.0f, frost.weapon.damage);
    EXPECT_FLOAT_EQ(20.0f, bow.weapon.damage);
}

TEST(BuildKitConfigTest, SerializedConfigLoadsBack) {
    KitConfig original = KitConfig::Defaults(KitId::PoisonMelee);
    original.displayName = "Tuned Assassin";
    original.Ability(AbilitySlot::E).params["baseDamage"] = 55.0f;
    original.Ability(AbilitySlot::V).cooldown = 9.0f;

    const json root = {{"kits", {{"poison", KitConfigToJson(original)}}}};
    ValidationResult result;
    const KitConfig loaded = BuildKitConfig(KitId::PoisonMelee, root, result);

    EXPECT_TRUE(result.valid);
    EXPECT_TRUE(result.warnings.empty());
    EXPECT_EQ("Tuned Assassin", loaded.displayName);
    EXPECT_FLOAT_EQ(55.0f, loaded.Ability(AbilitySlot::E).Param("baseDamage"));
    EXPECT_FLOAT_EQ(9.0f, loaded.Ability(AbilitySlot::V).cooldown);
    EXPECT_EQ("instant", KitConfigToJson(loaded)["abilities"]["e"]["activation"].get<std::string>());
}

// =============================================================================
// Combat Tuning Tests
// =============================================================================

class CombatTuningTest : public ::testing::Test {
protected:
    void SetUp() override { Config::Instance().Clear(); }
    void TearDown() override { Config::Instance().Clear(); }
};

TEST_F(CombatTuningTest, MissingKeysKeepDefaults) {
    const CombatTuning tuning = CombatTuning::FromConfig(Config::Instance());

    EXPECT_FLOAT_EQ(4.0f, tuning.ultimateBasicGain);
    EXPECT_EQ(8, tuning.poolCapacity);
    EXPECT_FLOAT_EQ(-0.25f, tuning.backstabThreshold);
    EXPECT_TRUE(tuning.Validate().valid);
}

TEST_F(CombatTuningTest, ReadsCombatSection) {
    ASSERT_TRUE(Config::Instance().LoadFromString(R"({
        "combat": {
            "ultimate": {"chargedGain": 20.0},
            "pool": {"capacity": 4},
            "hit": {"chargedPadding": 0.9}
        }
    })"));

    const CombatTuning tuning = CombatTuning::FromConfig(Config::Instance());

    EXPECT_FLOAT_EQ(20.0f, tuning.ultimateChargedGain);
    EXPECT_EQ(4, tuning.poolCapacity);
    EXPECT_FLOAT_EQ(0.9f, tuning.chargedHitPadding);
    // Warmup 6 no longer fits
    const ValidationResult result = tuning.Validate();
    EXPECT_TRUE(result.valid);
    EXPECT_THAT(result.warnings, ::testing::Contains(::testing::HasSubstr("combat.pool")));
}

TEST_F(CombatTuningTest, ValidateRejectsBrokenValues) {
    CombatTuning tuning;
    tuning.poolCapacity = -1;
    tuning.backstabThreshold = 2.0f;
    tuning.decayCheckInterval = 0.0f;

    const ValidationResult result = tuning.Validate();

    EXPECT_FALSE(result.valid);
    EXPECT_EQ(3u, result.errors.size());
}

TEST_F(CombatTuningTest, JsonUsesConfigKeyLayout) {
    CombatTuning tuning;
    tuning.targetingMinDistance = 5.0f;

    Config::Instance().Merge(json{{"combat", tuning.ToJson()}});

    EXPECT_FLOAT_EQ(5.0f, CombatTuning::FromConfig(Config::Instance()).targetingMinDistance);
    EXPECT_FLOAT_EQ(2.5f, tuning.ToJson()["hit"]["bossRadius"].get<float>());
}

// =============================================================================
// Shipped Configuration
// =============================================================================

TEST_F(CombatTuningTest, ShippedConfigLoadsCleanly) {
    const std::filesystem::path path = std::filesystem::path(CRIMSON_CONFIG_DIR) / "combat.json";
    ASSERT_TRUE(Config::Instance().Load(path));

    EXPECT_TRUE(CombatTuning::FromConfig(Config::Instance()).Validate().valid);

    for (KitId id : {KitId::Blood, KitId::Frost, KitId::PoisonMelee, KitId::RangedBow}) {
        ValidationResult result;
        const KitConfig config = BuildKitConfig(id, Config::Instance().GetJson(), result);
        EXPECT_TRUE(result.valid) << KitIdToString(id);
        EXPECT_TRUE(result.warnings.empty()) << KitIdToString(id);
        EXPECT_EQ(id, config.id);
    }
}
