// JSON loaders for combat content: rules, weapons, stat archetypes and scenario rosters.
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "../../engine/combat/CombatActor.h"
#include "../../engine/combat/CombatRules.h"

namespace Neon::Content {

using Combat::ActorDefinition;
using Combat::CombatRules;
using Combat::Weapon;

// Stat block shared by every actor built from the same archetype.
struct Archetype {
    std::string id;
    Combat::Attributes attributes{};
    int maxHp{100};
    int armor{15};
    int morale{100};
};

using WeaponTable = std::unordered_map<std::string, Weapon>;
using ArchetypeTable = std::unordered_map<std::string, Archetype>;

struct Scenario {
    std::string name;
    std::optional<std::uint32_t> seed{};
    std::vector<ActorDefinition> players;
    std::vector<ActorDefinition> opponents;
};

// Missing keys keep the CombatRules defaults.
CombatRules parseCombatRules(const nlohmann::json& j, CombatRules base = {});
WeaponTable parseWeapons(const nlohmann::json& j);
ArchetypeTable parseArchetypes(const nlohmann::json& j);
// Rejects the whole scenario if any entry names an unknown archetype or weapon, the seed does not fit
// in 32 bits, or an actor sits off the rules' grid or on another actor's tile.
std::optional<Scenario> parseScenario(const nlohmann::json& j,
                                      const WeaponTable& weapons,
                                      const ArchetypeTable& archetypes,
                                      const CombatRules& rules);

// Also rejects rule sets that fail Combat::rulesAreValid.
std::optional<CombatRules> loadCombatRules(const std::string& path);
std::optional<WeaponTable> loadWeapons(const std::string& path);
std::optional<ArchetypeTable> loadArchetypes(const std::string& path);
std::optional<Scenario> loadScenario(const std::string& path,
                                     const WeaponTable& weapons,
                                     const ArchetypeTable& archetypes,
                                     const CombatRules& rules);

std::optional<Combat::WeaponClass> parseWeaponClassKey(const std::string& k);
std::optional<Combat::CoverKind> parseCoverKey(const std::string& k);

}  // namespace Neon::Content
