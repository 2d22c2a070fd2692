#include "combat/CombatSystem.hpp"
#include "config/Config.hpp"
#include "core/Logger.hpp"
#include "core/Random.hpp"
#include "sandbox/SandboxServices.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

using namespace Crimson;
using namespace Crimson::Combat;

namespace {

constexpr float kFixedStep = 1.0f / 60.0f;
constexpr int kStepsPerSecond = 60;

/**
 * @brief Command line arguments
 */
struct CommandLineArgs {
    std::string configPath = "config/combat.json";
    std::string kit = "blood";
    float seconds = 20.0f;
    uint32_t seed = 1337u;
    std::string logFile;
    std::vector<std::string> traceChannels;
    bool verbose = false;
    bool showHelp = false;

    static CommandLineArgs Parse(int argc, char* argv[]) {
        CommandLineArgs args;

        for (int i = 1; i < argc; ++i) {
            std::string_view arg = argv[i];

            if (arg == "-h" || arg == "--help") {
                args.showHelp = true;
            } else if (arg == "-c" || arg == "--config") {
                if (i + 1 < argc) {
                    args.configPath = argv[++i];
                }
            } else if (arg == "-k" || arg == "--kit") {
                if (i + 1 < argc) {
                    args.kit = argv[++i];
                }
            } else if (arg == "-s" || arg == "--seconds") {
                if (i + 1 < argc) {
                    args.seconds = std::strtof(argv[++i], nullptr);
                }
            } else if (arg == "--seed") {
                if (i + 1 < argc) {
                    args.seed = static_cast<uint32_t>(std::strtoul(argv[++i], nullptr, 10));
                }
            } else if (arg == "--log-file") {
                if (i + 1 < argc) {
                    args.logFile = argv[++i];
                }
            } else if (arg == "--trace") {
                if (i + 1 < argc) {
                    args.traceChannels.emplace_back(argv[++i]);
                }
            } else if (arg == "-v" || arg == "--verbose") {
                args.verbose = true;
            }
        }

        return args;
    }

    static void PrintHelp() {
        std::cout << "crimson_sandbox - headless combat encounter\n\n";
        std::cout << "Usage: crimson_sandbox [options]\n\n";
        std::cout << "Options:\n";
        std::cout << "  -h, --help          Show this help message\n";
        std::cout << "  -c, --config PATH   Combat configuration file\n";
        std::cout << "  -k, --kit ID        blood, frost, poison or bow\n";
        std::cout << "  -s, --seconds N     Simulated seconds (default 20)\n";
        std::cout << "      --seed N        Random seed\n";
        std::cout << "  -v, --verbose       Log every effect notification\n";
        std::cout << "      --log-file PATH Also write a rotating log file\n";
        std::cout << "      --trace CHANNEL Trace one channel: combat, projectile, status, economy\n";
    }
};

/**
 * @brief True on the frame where (frame - offset) is a multiple of period
 */
bool Every(int frame, float period, float offset) {
    const int periodFrames = std::max(1, static_cast<int>(period * kStepsPerSecond));
    const int offsetFrames = static_cast<int>(offset * kStepsPerSecond);
    return frame >= offsetFrames && (frame - offsetFrames) % periodFrames == 0;
}

/**
 * @brief Scripted player: attacks, charges and cycles through the slots
 */
CombatIntent ScriptIntent(int frame, const CombatSystem& combat) {
    CombatIntent intent;

    // Confirm a pending ground target on the frame after it was opened
    if (combat.GetController().IsTargeting()) {
        intent.attack = true;
        return intent;
    }

    const int cycleFrame = frame % (6 * kStepsPerSecond);
    const bool charging = cycleFrame >= 2 * kStepsPerSecond && cycleFrame < 3 * kStepsPerSecond + 18;
    if (charging) {
        intent.chargedAttack = true;
    } else if (cycleFrame == 3 * kStepsPerSecond + 18) {
        intent.chargedAttackRelease = true;
    } else if (Every(frame, 0.4f, 0.0f)) {
        intent.attack = true;
    }

    if (Every(frame, 4.0f, 1.0f)) intent.Press(AbilitySlot::Q);
    if (Every(frame, 5.0f, 0.5f)) intent.Press(AbilitySlot::E);
    if (Every(frame, 7.0f, 1.5f)) intent.Press(AbilitySlot::X);
    if (Every(frame, 9.0f, 4.2f)) intent.Press(AbilitySlot::C);
    if (Every(frame, 11.0f, 5.0f)) intent.Press(AbilitySlot::V);
    if (Every(frame, 10.0f, 8.0f)) intent.Press(AbilitySlot::F);
    return intent;
}

Sandbox::DummyWorld::Dummy MakeDummy(IRandomSource& random, bool boss) {
    Sandbox::DummyWorld::Dummy dummy;
    const float angle = random.NextRange(-0.6f, 0.6f);
    const float distance = random.NextRange(2.5f, 9.0f);
    dummy.position = glm::vec3(std::sin(angle) * distance, 0.0f, std::cos(angle) * distance);
    dummy.facing = glm::vec3(0.0f, 0.0f, random.NextFloat() < 0.3f ? 1.0f : -1.0f);
    dummy.maxHealth = boss ? 2500.0f : 400.0f;
    dummy.health = dummy.maxHealth;
    dummy.boss = boss;
    return dummy;
}

TargetId NearestDummy(const Sandbox::DummyWorld& world, const glm::vec3& from) {
    TargetId best = kInvalidTarget;
    float bestDistance = std::numeric_limits<float>::max();
    for (const auto& [id, dummy] : world.GetDummies()) {
        const float distance = PlanarDistance(dummy.position, from);
        if (dummy.health > 0.0f && distance < bestDistance) {
            best = id;
            bestDistance = distance;
        }
    }
    return best;
}

} // namespace

/**
 * @brief Drive one scripted encounter against training dummies
 */
int main(int argc, char* argv[]) {
    auto args = CommandLineArgs::Parse(argc, argv);

    if (args.showHelp) {
        CommandLineArgs::PrintHelp();
        return EXIT_SUCCESS;
    }

    Logger::Initialize(args.logFile, true);
    Logger::SetLevel(args.verbose ? spdlog::level::debug : spdlog::level::info);
    for (const std::string& name : args.traceChannels) {
        if (const auto channel = LogChannelFromString(name)) {
            Logger::SetLevel(*channel, spdlog::level::trace);
        } else {
            CRIMSON_LOG_WARN("Unknown log channel '{}'", name);
        }
    }

    auto& config = Config::Instance();
    if (!config.Load(args.configPath)) {
        CRIMSON_LOG_WARN("Could not load '{}', running with built-in defaults", args.configPath);
    }

    KitId kitId = KitId::Blood;
    if (!KitIdFromString(args.kit, kitId)) {
        CRIMSON_LOG_ERROR("Unknown kit '{}'", args.kit);
        Logger::Shutdown();
        return EXIT_FAILURE;
    }

    MersenneRandom random(args.seed);
    Sandbox::DummyWorld world;
    Sandbox::DummyActor actor;
    Sandbox::LoggingEffectSink effects;
    Sandbox::LoggingEventEmitter events;

    CombatSystem combat(world, actor, effects, events, random, CombatTuning::FromConfig(config));
    if (!combat.Initialize(kitId)) {
        CRIMSON_LOG_ERROR("Failed to initialize the combat system");
        Logger::Shutdown();
        return EXIT_FAILURE;
    }
    combat.SetUltimateTestMode(true);

    for (int i = 0; i < 4; ++i) {
        combat.AddTarget(world.Spawn(MakeDummy(random, false)));
    }
    combat.AddTarget(world.Spawn(MakeDummy(random, true)));

    const int totalFrames = static_cast<int>(std::max(args.seconds, 0.0f) * kStepsPerSecond);
    int kills = 0;

    for (int frame = 0; frame < totalFrames; ++frame) {
        const TargetId focus = NearestDummy(world, actor.GetPosition());
        CombatIntent intent = ScriptIntent(frame, combat);
        if (focus != kInvalidTarget) {
            actor.FaceTowards(world.GetWorldPosition(focus));
            intent.Aim(world.GetWorldPosition(focus));
        }

        actor.Update(kFixedStep);
        combat.Update(kFixedStep, intent);

        for (TargetId dead : world.GetDead()) {
            const bool boss = world.IsBoss(dead);
            combat.RemoveTarget(dead);
            world.Despawn(dead);
            ++kills;
            combat.AddTarget(world.Spawn(MakeDummy(random, boss)));
        }
    }

    CRIMSON_LOG_INFO("==== {} after {:.1f}s ====", combat.GetKit()->GetName(), args.seconds);
    CRIMSON_LOG_INFO("Damage dealt: {} ({} critical numbers)", world.GetDamageTaken(), events.GetCriticalCount());
    for (const auto& [kind, total] : events.GetTotals()) {
        CRIMSON_LOG_INFO("  {:<8} {}", kind, total);
    }
    CRIMSON_LOG_INFO("Kills: {}  healed: {}  abilities: {}", kills, actor.GetHealed(), effects.GetAbilityCount());
    for (const auto& [id, dummy] : world.GetDummies()) {
        CRIMSON_LOG_INFO("  target-{} {:.0f}/{:.0f}{}", id, dummy.health, dummy.maxHealth, dummy.boss ? " (boss)" : "");
    }

    combat.Shutdown();
    Logger::Shutdown();
    return EXIT_SUCCESS;
}
