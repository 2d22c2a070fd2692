#include "config/KitConfig.hpp"
#include <initializer_list>
#include <utility>

namespace Crimson::Combat {

using json = nlohmann::json;

// ============================================================================
// Helper Functions
// ============================================================================

namespace {

using ParamList = std::initializer_list<std::pair<const std::string, float>>;

AbilitySlotConfig MakeSlot(const std::string& name,
                           AbilityActivation activation,
                           float cooldown,
                           ParamList params) {
    AbilitySlotConfig slot;
    slot.name = name;
    slot.enabled = true;
    slot.activation = activation;
    slot.cooldown = cooldown;
    slot.params = std::map<std::string, float>(params);
    return slot;
}

AbilitySlotConfig MakeLifeDrain() {
    return MakeSlot("Life Drain", AbilityActivation::Channel, 12.0f, {
        {"duration", 2.5f},
        {"tickInterval", 0.25f},
        {"damage", 8.0f},
        {"healRatio", 1.0f},
        {"range", 16.0f},
        {"minDot", 0.4f},
        {"cancelCooldown", 2.5f},
        {"chargePerSecond", 1.0f},
    });
}

void ReadFloat(const json& j, const char* key, float& field, bool allowNegative,
               const std::string& path, ValidationResult& result) {
    if (!j.contains(key)) {
        return;
    }
    const auto& node = j[key];
    if (!node.is_number()) {
        result.AddError(path + "." + key, "Expected a number");
        return;
    }
    const float value = node.get<float>();
    if (!allowNegative && value < 0.0f) {
        result.AddError(path + "." + key, "Value cannot be negative");
        return;
    }
    field = value;
}

void ReadInt(const json& j, const char* key, int& field,
             const std::string& path, ValidationResult& result) {
    if (!j.contains(key)) {
        return;
    }
    const auto& node = j[key];
    if (!node.is_number_integer()) {
        result.AddError(path + "." + key, "Expected an integer");
        return;
    }
    const int value = node.get<int>();
    if (value < 0) {
        result.AddError(path + "." + key, "Value cannot be negative");
        return;
    }
    field = value;
}

void ReadBool(const json& j, const char* key, bool& field,
              const std::string& path, ValidationResult& result) {
    if (!j.contains(key)) {
        return;
    }
    const auto& node = j[key];
    if (!node.is_boolean()) {
        result.AddError(path + "." + key, "Expected a boolean");
        return;
    }
    field = node.get<bool>();
}

void ReadString(const json& j, const char* key, std::string& field,
                const std::string& path, ValidationResult& result) {
    if (!j.contains(key)) {
        return;
    }
    const auto& node = j[key];
    if (!node.is_string() || node.get<std::string>().empty()) {
        result.AddError(path + "." + key, "Expected a non-empty string");
        return;
    }
    field = node.get<std::string>();
}

void ReadParams(const json& j, std::map<std::string, float>& params,
                const std::string& path, ValidationResult& result) {
    if (!j.is_object()) {
        result.AddError(path, "Expected an object of named numbers");
        return;
    }
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!it.value().is_number()) {
            result.AddError(path + "." + it.key(), "Expected a number");
            continue;
        }
        const float value = it.value().get<float>();
        if (value < 0.0f) {
            result.AddError(path + "." + it.key(), "Value cannot be negative");
            continue;
        }
        if (params.find(it.key()) == params.end()) {
            result.AddWarning(path + "." + it.key(), "Unknown parameter");
        }
        params[it.key()] = value;
    }
}

void ParseProjectile(const json& j, ProjectileTuning& tuning,
                     const std::string& path, ValidationResult& result) {
    ReadFloat(j, "damage", tuning.damage, false, path, result);
    ReadFloat(j, "speed", tuning.speed, false, path, result);
    ReadFloat(j, "radius", tuning.radius, false, path, result);
    ReadFloat(j, "lifetime", tuning.lifetime, false, path, result);
    ReadInt(j, "chargeGain", tuning.chargeGain, path, result);
}

void ParseAbility(const json& j, AbilitySlotConfig& slot,
                  const std::string& path, ValidationResult& result) {
    ReadString(j, "name", slot.name, path, result);
    ReadBool(j, "enabled", slot.enabled, path, result);
    if (j.contains("activation")) {
        const auto& node = j["activation"];
        AbilityActivation activation;
        if (node.is_string() && AbilityActivationFromString(node.get<std::string>(), activation)) {
            slot.activation = activation;
        } else {
            result.AddError(path + ".activation",
                            "Expected one of instant, targeted, windup, channel");
        }
    }
    ReadFloat(j, "cooldown", slot.cooldown, false, path, result);
    ReadInt(j, "requiredCharges", slot.requiredCharges, path, result);
    ReadBool(j, "consumesCharges", slot.consumesCharges, path, result);
    ReadBool(j, "requiresUltimate", slot.requiresUltimate, path, result);
    ReadFloat(j, "windup", slot.windup, false, path, result);
    if (j.contains("params")) {
        ReadParams(j["params"], slot.params, path + ".params", result);
    }
}

json ProjectileToJson(const ProjectileTuning& tuning) {
    return json{
        {"damage", tuning.damage},
        {"speed", tuning.speed},
        {"radius", tuning.radius},
        {"lifetime", tuning.lifetime},
        {"chargeGain", tuning.chargeGain}
    };
}

void ValidateNonNegative(float value, const std::string& path, ValidationResult& result) {
    if (value < 0.0f) {
        result.AddError(path, "Value cannot be negative");
    }
}

// ----------------------------------------------------------------------------
// Shipped balance values
// ----------------------------------------------------------------------------

KitConfig BloodDefaults() {
    KitConfig config;
    config.id = KitId::Blood;
    config.displayName = "Blood Mage";
    config.weapon = {25.0f, 2.75f, 5.0f};
    config.attack.chargeDuration = 1.0f;
    config.basic = {20.0f, 20.0f, 0.25f, 1.5f, 1};
    config.charged = {55.0f, 20.0f, 0.72f, 2.4f, 2};
    config.crit = {0.15f, 1.5f, 1.3f};
    config.resource = {"blood", 8, 8.0f, false, false};

    config.Ability(AbilitySlot::Q) = MakeSlot("Crimson Eruption", AbilityActivation::Targeted, 8.0f, {
        {"radius", 3.5f},
        {"damage", 50.0f},
        {"stagger", 0.8f},
        {"chargeGain", 2.0f},
    });

    auto& crescend = config.Ability(AbilitySlot::E);
    crescend = MakeSlot("Blood Crescend", AbilityActivation::Instant, 0.0f, {
        {"baseDamage", 85.0f},
        {"damagePerCharge", 36.0f},
        {"multiplier", 1.0f},
        {"stagger", 0.95f},
        {"speed", 25.0f},
        {"speedPerCharge", 1.45f},
        {"lifetime", 1.2f},
        {"lifetimePerCharge", 0.07f},
        {"radius", 2.05f},
        {"radiusPerCharge", 0.34f},
        {"whipDuration", 0.48f},
    });
    crescend.requiredCharges = 1;
    crescend.consumesCharges = true;

    auto& nova = config.Ability(AbilitySlot::X);
    nova = MakeSlot("Blood Nova", AbilityActivation::Windup, 10.0f, {
        {"radius", 12.0f},
        {"damage", 35.0f},
        {"freeze", 2.4f},
        {"bossFreezeBonus", 0.8f},
        {"chargeGain", 1.0f},
    });
    nova.windup = 0.12f;

    config.Ability(AbilitySlot::C) = MakeSlot("Blood Shield", AbilityActivation::Instant, 0.0f, {
        {"duration", 6.0f},
    });

    config.Ability(AbilitySlot::V) = MakeLifeDrain();

    auto& orb = config.Ability(AbilitySlot::F);
    orb = MakeSlot("Crimson Orb", AbilityActivation::Instant, 0.0f, {
        {"damage", 280.0f},
        {"speed", 32.0f},
        {"lifetime", 2.4f},
        {"radius", 0.6f},
        {"growTime", 0.8f},
        {"startScale", 0.28f},
        {"endScale", 4.5f},
        {"minDamageScale", 0.3f},
        {"maxDamageScale", 1.5f},
    });
    orb.requiresUltimate = true;

    return config;
}

KitConfig FrostDefaults() {
    KitConfig config;
    config.id = KitId::Frost;
    config.displayName = "Frost Mage";
    config.weapon = {22.0f, 2.75f, 4.0f};
    config.attack.chargeDuration = 1.1f;
    config.basic = {18.0f, 22.0f, 0.22f, 1.6f, 1};
    config.charged = {50.0f, 18.0f, 0.65f, 2.6f, 2};
    config.crit = {0.15f, 1.5f, 1.3f};
    config.resource = {"frost", 8, 10.0f, true, true};
    config.passive = {
        {"capFreeze", 3.0f},
        {"capFreezeBossBonus", 1.0f},
    };

    config.Ability(AbilitySlot::Q) = MakeSlot("Frozen Orb", AbilityActivation::Instant, 9.0f, {
        {"speed", 4.5f},
        {"lifetime", 4.0f},
        {"contactDamage", 120.0f},
        {"contactCharges", 3.0f},
        {"hitPadding", 0.8f},
        {"shardInterval", 0.14f},
        {"shardDamage", 30.0f},
        {"shardSpeed", 16.0f},
        {"shardLifetime", 0.8f},
    });

    config.Ability(AbilitySlot::E) = MakeSlot("Frost Beam", AbilityActivation::Instant, 0.0f, {
        {"length", 12.0f},
        {"hitPadding", 0.5f},
        {"baseDamage", 42.0f},
        {"damagePerCharge", 18.0f},
        {"damagePerStack", 12.0f},
        {"multiplier", 1.0f},
        {"freezePerStack", 0.5f},
        {"bossFreezeBonus", 0.5f},
        {"whipDuration", 0.6f},
    });

    config.Ability(AbilitySlot::X) = MakeSlot("Stalactite", AbilityActivation::Targeted, 12.0f, {
        {"radius", 4.0f},
        {"damage", 85.0f},
        {"freeze", 2.5f},
        {"bossFreezeBonus", 0.5f},
        {"fallTime", 0.35f},
        {"lingerTime", 0.8f},
        {"chargeGain", 3.0f},
    });

    config.Ability(AbilitySlot::C) = MakeSlot("Ice Barrier", AbilityActivation::Instant, 0.0f, {
        {"duration", 5.0f},
    });

    config.Ability(AbilitySlot::V) = MakeLifeDrain();

    auto& blizzard = config.Ability(AbilitySlot::F);
    blizzard = MakeSlot("Blizzard", AbilityActivation::Targeted, 0.0f, {
        {"duration", 3.5f},
        {"radius", 8.0f},
        {"damage", 28.0f},
        {"tickInterval", 0.25f},
        {"chargeGain", 1.0f},
    });
    blizzard.requiresUltimate = true;

    return config;
}

KitConfig PoisonMeleeDefaults() {
    KitConfig config;
    config.id = KitId::PoisonMelee;
    config.displayName = "Shadow Assassin";
    config.weapon = {18.0f, 2.0f, 3.0f};
    config.attack.chargeDuration = 0.5f;
    config.basic = {22.0f, 30.0f, 1.1f, 0.2f, 1};
    config.charged = {42.0f, 32.0f, 1.1f, 0.24f, 2};
    config.crit = {0.30f, 1.75f, 1.5f};
    config.resource = {"poison", 6, 8.0f, false, false};
    config.passive = {
        {"twinBladeSpread", 0.18f},
    };

    auto& pierce = config.Ability(AbilitySlot::E);
    pierce = MakeSlot("Poison Pierce", AbilityActivation::Instant, 0.0f, {
        {"baseDamage", 40.0f},
        {"damagePerCharge", 18.0f},
        {"poisonSecondsPerCharge", 2.0f},
        {"poisonTickBase", 4.0f},
        {"poisonTickPerCharge", 3.0f},
        {"stagger", 0.8f},
        {"radius", 2.6f},
        {"radiusBonus", 1.2f},
        {"speed", 28.0f},
        {"speedBonus", 12.0f},
        {"lifetime", 0.4f},
        {"lifetimeBonus", 0.15f},
    });
    pierce.requiredCharges = 1;
    pierce.consumesCharges = true;

    config.Ability(AbilitySlot::V) = MakeSlot("Shadow Step", AbilityActivation::Instant, 12.0f, {
        {"range", 12.0f},
        {"minDot", 0.3f},
        {"behindOffset", 2.2f},
        {"buffMultiplier", 2.0f},
        {"buffDuration", 3.0f},
    });

    config.Ability(AbilitySlot::C) = MakeSlot("Vanish", AbilityActivation::Instant, 14.0f, {
        {"duration", 5.0f},
        {"speedMultiplier", 1.6f},
    });

    auto& focus = config.Ability(AbilitySlot::X);
    focus = MakeSlot("Toxic Focus", AbilityActivation::Instant, 20.0f, {
        {"multiplierPerCharge", 0.2f},
        {"duration", 8.0f},
    });
    focus.requiredCharges = 1;
    focus.consumesCharges = true;

    auto& daggers = config.Ability(AbilitySlot::F);
    daggers = MakeSlot("Twin Daggers", AbilityActivation::Instant, 0.0f, {
        {"damage", 180.0f},
        {"multiplierPerCharge", 0.2f},
        {"maxCharges", 6.0f},
        {"speed", 22.0f},
        {"range", 14.0f},
        {"hitPadding", 0.8f},
    });
    daggers.requiresUltimate = true;

    // Slot Q is not part of this kit
    config.Ability(AbilitySlot::Q).name = "Unused";

    return config;
}

KitConfig RangedBowDefaults() {
    KitConfig config;
    config.id = KitId::RangedBow;
    config.displayName = "Bow Ranger";
    config.weapon = {20.0f, 3.0f, 3.0f};
    config.attack.chargeDuration = 0.7f;
    config.basic = {22.0f, 30.0f, 0.3f, 2.0f, 1};
    config.charged = {18.0f, 28.0f, 0.3f, 1.8f, 2};
    config.crit = {0.25f, 1.65f, 1.5f};
    config.resource = {"trust", 8, 8.0f, false, false};
    config.passive = {
        {"chargedArrows", 3.0f},
        {"chargedSpread", 0.12f},
    };

    config.Ability(AbilitySlot::V) = MakeSlot("Recoil Shot", AbilityActivation::Instant, 6.0f, {
        {"damage", 55.0f},
        {"speed", 35.0f},
        {"lifetime", 0.6f},
        {"dashSpeed", 28.0f},
        {"dashDuration", 0.22f},
    });

    config.Ability(AbilitySlot::C) = MakeSlot("Hunter's Zone", AbilityActivation::Instant, 14.0f, {
        {"radius", 3.5f},
        {"duration", 5.0f},
        {"multiplier", 2.0f},
    });

    config.Ability(AbilitySlot::X) = MakeSlot("Multi Shot", AbilityActivation::Instant, 10.0f, {
        {"arrows", 6.0f},
        {"interval", 0.08f},
        {"damage", 18.0f},
        {"speed", 32.0f},
        {"lifetime", 1.5f},
        {"vulnerabilityMultiplier", 1.5f},
        {"vulnerabilityDuration", 6.0f},
    });

    auto& judgment = config.Ability(AbilitySlot::E);
    judgment = MakeSlot("Judgment Arrow", AbilityActivation::Instant, 1.0f, {
        {"damage", 65.0f},
        {"multiplierPerCharge", 0.25f},
        {"speed", 30.0f},
        {"lifetime", 2.2f},
        {"pierceAt", 4.0f},
        {"burstAt", 6.0f},
        {"burstRadius", 3.5f},
        {"burstScale", 0.6f},
        {"markAt", 8.0f},
        {"markMultiplier", 1.3f},
        {"markDuration", 6.0f},
    });
    judgment.requiredCharges = 1;
    judgment.consumesCharges = true;

    auto& skyfall = config.Ability(AbilitySlot::F);
    skyfall = MakeSlot("Skyfall Arrow", AbilityActivation::Instant, 0.0f, {
        {"damage", 200.0f},
        {"speed", 42.0f},
        {"lifetime", 3.0f},
    });
    skyfall.requiresUltimate = true;

    config.Ability(AbilitySlot::Q).name = "Unused";

    return config;
}

} // anonymous namespace

// ============================================================================
// Kit Identity
// ============================================================================

const char* KitIdToString(KitId id) {
    switch (id) {
        case KitId::Blood:       return "blood";
        case KitId::Frost:       return "frost";
        case KitId::PoisonMelee: return "poison";
        case KitId::RangedBow:   return "bow";
    }
    return "blood";
}

bool KitIdFromString(const std::string& text, KitId& out) {
    if (text == "blood")  { out = KitId::Blood;       return true; }
    if (text == "frost")  { out = KitId::Frost;       return true; }
    if (text == "poison") { out = KitId::PoisonMelee; return true; }
    if (text == "bow")    { out = KitId::RangedBow;   return true; }
    return false;
}

// ============================================================================
// AbilitySlotConfig / KitConfig
// ============================================================================

float AbilitySlotConfig::Param(const std::string& key, float fallback) const {
    auto it = params.find(key);
    return it != params.end() ? it->second : fallback;
}

float KitConfig::Passive(const std::string& key, float fallback) const {
    auto it = passive.find(key);
    return it != passive.end() ? it->second : fallback;
}

KitConfig KitConfig::Defaults(KitId id) {
    switch (id) {
        case KitId::Blood:       return BloodDefaults();
        case KitId::Frost:       return FrostDefaults();
        case KitId::PoisonMelee: return PoisonMeleeDefaults();
        case KitId::RangedBow:   return RangedBowDefaults();
    }
    return BloodDefaults();
}

ValidationResult KitConfig::Validate() const {
    ValidationResult result;

    ValidateNonNegative(weapon.damage, "weapon.damage", result);
    ValidateNonNegative(weapon.range, "weapon.range", result);
    ValidateNonNegative(weapon.staminaCost, "weapon.staminaCost", result);

    if (attack.duration <= 0.0f) {
        result.AddError("attack.duration", "Attack duration must be positive");
    }
    ValidateNonNegative(attack.comboWindow, "attack.comboWindow", result);
    if (attack.maxCombo < 1) {
        result.AddError("attack.maxCombo", "Max combo must be at least 1");
    }
    if (attack.chargeDuration <= 0.0f) {
        result.AddError("attack.chargeDuration", "Charge duration must be positive");
    }
    ValidateNonNegative(attack.chargedStaminaCost, "attack.chargedStaminaCost", result);
    ValidateNonNegative(attack.chargedRecovery, "attack.chargedRecovery", result);

    const std::pair<const char*, const ProjectileTuning*> projectiles[] = {
        {"basic", &basic}, {"charged", &charged}
    };
    for (const auto& [path, tuning] : projectiles) {
        const std::string prefix = path;
        ValidateNonNegative(tuning->damage, prefix + ".damage", result);
        ValidateNonNegative(tuning->speed, prefix + ".speed", result);
        ValidateNonNegative(tuning->radius, prefix + ".radius", result);
        if (tuning->lifetime <= 0.0f) {
            result.AddError(prefix + ".lifetime", "Lifetime must be positive");
        }
        if (tuning->chargeGain < 0) {
            result.AddError(prefix + ".chargeGain", "Value cannot be negative");
        }
    }

    if (crit.critChance < 0.0f || crit.critChance > 1.0f) {
        result.AddError("crit.critChance", "Chance must be within [0, 1]");
    }
    ValidateNonNegative(crit.critMultiplier, "crit.critMultiplier", result);
    ValidateNonNegative(crit.backstabMultiplier, "crit.backstabMultiplier", result);

    if (resource.name.empty()) {
        result.AddError("resource.name", "Resource name is required");
    }
    if (resource.cap < 1) {
        result.AddError("resource.cap", "Cap must be at least 1");
    }
    ValidateNonNegative(resource.idleDecaySeconds, "resource.idleDecaySeconds", result);

    for (const auto& [key, value] : passive) {
        ValidateNonNegative(value, "passive." + key, result);
    }

    for (AbilitySlot slot : kAllAbilitySlots) {
        const auto& ability = Ability(slot);
        const std::string path = std::string("abilities.") + AbilitySlotToString(slot);
        if (!ability.enabled) {
            continue;
        }
        ValidateNonNegative(ability.cooldown, path + ".cooldown", result);
        ValidateNonNegative(ability.windup, path + ".windup", result);
        if (ability.requiredCharges < 0) {
            result.AddError(path + ".requiredCharges", "Value cannot be negative");
        } else if (ability.requiredCharges > resource.cap) {
            result.AddWarning(path + ".requiredCharges", "Requirement exceeds resource cap");
        }
        if (ability.activation == AbilityActivation::Windup && ability.windup <= 0.0f) {
            result.AddWarning(path + ".windup", "Windup ability without a windup delay");
        }
        for (const auto& [key, value] : ability.params) {
            ValidateNonNegative(value, path + ".params." + key, result);
        }
    }

    return result;
}

// ============================================================================
// JSON
// ============================================================================

ValidationResult LoadKitConfig(const json& kitJson, KitConfig& config) {
    ValidationResult result;
    if (!kitJson.is_object()) {
        result.AddError("kit", "Kit configuration must be an object");
        return result;
    }

    ReadString(kitJson, "displayName", config.displayName, "kit", result);

    if (kitJson.contains("weapon")) {
        const auto& j = kitJson["weapon"];
        ReadFloat(j, "damage", config.weapon.damage, false, "weapon", result);
        ReadFloat(j, "range", config.weapon.range, false, "weapon", result);
        ReadFloat(j, "staminaCost", config.weapon.staminaCost, false, "weapon", result);
    }

    if (kitJson.contains("attack")) {
        const auto& j = kitJson["attack"];
        ReadFloat(j, "duration", config.attack.duration, false, "attack", result);
        ReadFloat(j, "comboWindow", config.attack.comboWindow, false, "attack", result);
        ReadInt(j, "maxCombo", config.attack.maxCombo, "attack", result);
        ReadFloat(j, "chargeDuration", config.attack.chargeDuration, false, "attack", result);
        ReadFloat(j, "chargedStaminaCost", config.attack.chargedStaminaCost, false, "attack", result);
        ReadFloat(j, "chargedRecovery", config.attack.chargedRecovery, false, "attack", result);
    }

    if (kitJson.contains("basic")) {
        ParseProjectile(kitJson["basic"], config.basic, "basic", result);
    }
    if (kitJson.contains("charged")) {
        ParseProjectile(kitJson["charged"], config.charged, "charged", result);
    }

    if (kitJson.contains("crit")) {
        const auto& j = kitJson["crit"];
        float chance = config.crit.critChance;
        ReadFloat(j, "critChance", chance, false, "crit", result);
        if (chance > 1.0f) {
            result.AddError("crit.critChance", "Chance must be within [0, 1]");
        } else {
            config.crit.critChance = chance;
        }
        ReadFloat(j, "critMultiplier", config.crit.critMultiplier, false, "crit", result);
        ReadFloat(j, "backstabMultiplier", config.crit.backstabMultiplier, false, "crit", result);
    }

    if (kitJson.contains("resource")) {
        const auto& j = kitJson["resource"];
        ReadString(j, "name", config.resource.name, "resource", result);
        ReadInt(j, "cap", config.resource.cap, "resource", result);
        ReadFloat(j, "idleDecaySeconds", config.resource.idleDecaySeconds, false, "resource", result);
        ReadBool(j, "perTarget", config.resource.perTarget, "resource", result);
        ReadBool(j, "resetOnCap", config.resource.resetOnCap, "resource", result);
    }

    if (kitJson.contains("passive")) {
        ReadParams(kitJson["passive"], config.passive, "passive", result);
    }

    if (kitJson.contains("abilities")) {
        const auto& abilities = kitJson["abilities"];
        for (AbilitySlot slot : kAllAbilitySlots) {
            const char* key = AbilitySlotToString(slot);
            if (abilities.contains(key)) {
                ParseAbility(abilities[key], config.Ability(slot),
                             std::string("abilities.") + key, result);
            }
        }
    }

    // Cross-field checks the per-field readers cannot see
    ValidationResult semantic = config.Validate();
    if (!semantic.valid) {
        const KitConfig defaults = KitConfig::Defaults(config.id);
        if (config.resource.cap < 1) config.resource.cap = defaults.resource.cap;
        if (config.attack.maxCombo < 1) config.attack.maxCombo = defaults.attack.maxCombo;
        if (config.attack.duration <= 0.0f) config.attack.duration = defaults.attack.duration;
        if (config.attack.chargeDuration <= 0.0f) config.attack.chargeDuration = defaults.attack.chargeDuration;
        if (config.basic.lifetime <= 0.0f) config.basic.lifetime = defaults.basic.lifetime;
        if (config.charged.lifetime <= 0.0f) config.charged.lifetime = defaults.charged.lifetime;
    }
    result.Merge(semantic);

    return result;
}

KitConfig BuildKitConfig(KitId id, const json& root, ValidationResult& result) {
    KitConfig config = KitConfig::Defaults(id);
    const char* key = KitIdToString(id);
    if (root.is_object() && root.contains("kits") && root["kits"].is_object() &&
        root["kits"].contains(key)) {
        result.Merge(LoadKitConfig(root["kits"][key], config));
    }
    return config;
}

json KitConfigToJson(const KitConfig& config) {
    json j;
    j["displayName"] = config.displayName;
    j["weapon"] = {
        {"damage", config.weapon.damage},
        {"range", config.weapon.range},
        {"staminaCost", config.weapon.staminaCost}
    };
    j["attack"] = {
        {"duration", config.attack.duration},
        {"comboWindow", config.attack.comboWindow},
        {"maxCombo", config.attack.maxCombo},
        {"chargeDuration", config.attack.chargeDuration},
        {"chargedStaminaCost", config.attack.chargedStaminaCost},
        {"chargedRecovery", config.attack.chargedRecovery}
    };
    j["basic"] = ProjectileToJson(config.basic);
    j["charged"] = ProjectileToJson(config.charged);
    j["crit"] = {
        {"critChance", config.crit.critChance},
        {"critMultiplier", config.crit.critMultiplier},
        {"backstabMultiplier", config.crit.backstabMultiplier}
    };
    j["resource"] = {
        {"name", config.resource.name},
        {"cap", config.resource.cap},
        {"idleDecaySeconds", config.resource.idleDecaySeconds},
        {"perTarget", config.resource.perTarget},
        {"resetOnCap", config.resource.resetOnCap}
    };
    j["passive"] = config.passive;

    json abilities = json::object();
    for (AbilitySlot slot : kAllAbilitySlots) {
        const auto& ability = config.Ability(slot);
        abilities[AbilitySlotToString(slot)] = {
            {"name", ability.name},
            {"enabled", ability.enabled},
            {"activation", AbilityActivationToString(ability.activation)},
            {"cooldown", ability.cooldown},
            {"requiredCharges", ability.requiredCharges},
            {"consumesCharges", ability.consumesCharges},
            {"requiresUltimate", ability.requiresUltimate},
            {"windup", ability.windup},
            {"params", ability.params}
        };
    }
    j["abilities"] = abilities;
    return j;
}

} // namespace Crimson::Combat
