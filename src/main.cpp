// Headless skirmish runner: loads content, plays one encounter, prints the log and outcome.
#include <cstdint>
#include <exception>
#include <iostream>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "../engine/combat/CombatEncounter.h"
#include "../engine/core/Logger.h"
#include "../game/content/CombatDataLoader.h"
#include "../game/skirmish/AutoPilot.h"

namespace {

constexpr int kMaxRounds = 200;

void printUsage(const char* prog) {
    std::cout << "Usage: " << prog << " <scenario.json> [options]\n"
              << "  --data <dir>   content directory with rules/weapons/archetypes (default: data)\n"
              << "  --seed <n>     RNG seed (overrides the scenario seed)\n"
              << "  --verbose      mirror every combat event to the debug log\n";
}

std::vector<Neon::Combat::CombatActor> buildRoster(const std::vector<Neon::Combat::ActorDefinition>& defs) {
    std::vector<Neon::Combat::CombatActor> out;
    out.reserve(defs.size());
    for (const auto& d : defs) out.emplace_back(d);
    return out;
}

}  // namespace

int main(int argc, char* argv[]) {
    using namespace Neon;

    if (argc < 2 || std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help") {
        printUsage(argv[0]);
        return argc < 2 ? 1 : 0;
    }

    const std::string scenarioPath = argv[1];
    std::string dataDir = "data";
    std::optional<std::uint32_t> seedOverride;
    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--data" && i + 1 < argc) {
            dataDir = argv[++i];
        } else if (arg == "--seed" && i + 1 < argc) {
            try {
                seedOverride = static_cast<std::uint32_t>(std::stoul(argv[++i]));
            } catch (const std::exception&) {
                logError(std::string("Invalid seed: ") + argv[i]);
                return 1;
            }
        } else if (arg == "--verbose") {
            Logger::setMinLevel(LogLevel::Debug);
        } else {
            logError("Unknown argument: " + arg);
            printUsage(argv[0]);
            return 1;
        }
    }

    auto rules = Content::loadCombatRules(dataDir + "/rules.json");
    if (!rules) {
        logWarn("Using default combat rules");
        rules = Combat::CombatRules{};
    }
    auto weapons = Content::loadWeapons(dataDir + "/weapons.json");
    auto archetypes = Content::loadArchetypes(dataDir + "/archetypes.json");
    if (!weapons || !archetypes) {
        logError("Failed to load weapon or archetype tables from " + dataDir);
        return 1;
    }
    auto scenario = Content::loadScenario(scenarioPath, *weapons, *archetypes, *rules);
    if (!scenario) {
        logError("Failed to load scenario " + scenarioPath);
        return 1;
    }

    const std::uint32_t seed = seedOverride.value_or(scenario->seed.value_or(std::random_device{}()));
    std::mt19937 rng(seed);
    logInfo("Scenario '" + scenario->name + "' seed=" + std::to_string(seed));

    Combat::EncounterError error{};
    auto encounter = Combat::CombatEncounter::create(buildRoster(scenario->players), buildRoster(scenario->opponents),
                                                     rng, *rules, &error);
    if (!encounter) {
        logError("Scenario does not describe a valid encounter (both teams need at least one actor)");
        return 1;
    }

    Skirmish::AutoPilot pilot;
    while (encounter->combatActive()) {
        if (encounter->round() > kMaxRounds) {
            logWarn("Round limit reached; stopping with combat unresolved");
            break;
        }
        if (encounter->isPlayerTurn()) {
            pilot.playTurn(*encounter);
        } else {
            encounter->runOpponentTurns();
        }
    }

    for (const auto& line : encounter->log()) {
        std::cout << line << '\n';
    }
    std::cout << "\nOutcome: " << Combat::toString(encounter->outcome()) << " after " << encounter->round()
              << " round(s)\n";
    for (const auto& a : encounter->actors()) {
        std::cout << "  " << a.name() << " [" << Combat::toString(a.team()) << "] " << a.hp() << "/" << a.maxHp()
                  << " HP, morale " << a.morale() << (a.alive() ? "" : " (down)") << '\n';
    }
    return encounter->combatActive() ? 1 : 0;
}
