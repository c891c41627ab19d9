// Loaders for combat content JSON (see data/).
#include "CombatDataLoader.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <limits>

#include "../../engine/core/Logger.h"

namespace Neon::Content {

using nlohmann::json;

namespace {

std::optional<json> readJsonFile(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        logWarn("CombatDataLoader: missing file " + path);
        return std::nullopt;
    }
    std::ifstream in(path);
    if (!in.is_open()) {
        logWarn("CombatDataLoader: cannot open " + path);
        return std::nullopt;
    }
    json j;
    try {
        in >> j;
    } catch (const json::exception& e) {
        logWarn("CombatDataLoader: failed to parse " + path + " | " + e.what());
        return std::nullopt;
    }
    return j;
}

Combat::Attributes parseAttributes(const json& j, Combat::Attributes base) {
    base.body = j.value("body", base.body);
    base.reflexes = j.value("reflexes", base.reflexes);
    base.intelligence = j.value("intelligence", base.intelligence);
    base.tech = j.value("tech", base.tech);
    base.cool = j.value("cool", base.cool);
    return base;
}

std::optional<ActorDefinition> parseActorEntry(const json& j,
                                               Combat::Team team,
                                               const WeaponTable& weapons,
                                               const ArchetypeTable& archetypes,
                                               const CombatRules& rules) {
    const std::string archetypeId = j.value("archetype", std::string{});
    const std::string weaponId = j.value("weapon", std::string{});
    auto arch = archetypes.find(archetypeId);
    if (arch == archetypes.end()) {
        logWarn("CombatDataLoader: unknown archetype '" + archetypeId + "'");
        return std::nullopt;
    }
    auto weapon = weapons.find(weaponId);
    if (weapon == weapons.end()) {
        logWarn("CombatDataLoader: unknown weapon '" + weaponId + "'");
        return std::nullopt;
    }

    ActorDefinition def{};
    def.name = j.value("name", arch->second.id);
    def.team = team;
    def.position = GridPos{j.value("x", 0), j.value("y", 0)};
    def.attributes = arch->second.attributes;
    if (j.contains("attributes") && j["attributes"].is_object()) {
        def.attributes = parseAttributes(j["attributes"], def.attributes);
    }
    def.maxHp = arch->second.maxHp;
    def.armor = j.value("armor", arch->second.armor);
    def.morale = j.value("morale", arch->second.morale);
    def.maxAp = rules.maxActionPoints;
    def.weapon = weapon->second;
    if (j.contains("hp") && j["hp"].is_number_integer()) {
        def.startingHp = j["hp"].get<int>();
    }
    if (j.contains("cover") && j["cover"].is_string()) {
        def.cover = parseCoverKey(j["cover"].get<std::string>()).value_or(Combat::CoverKind::None);
    }
    return def;
}

bool parseRoster(const json& j,
                 const char* key,
                 Combat::Team team,
                 const WeaponTable& weapons,
                 const ArchetypeTable& archetypes,
                 const CombatRules& rules,
                 std::vector<ActorDefinition>& out) {
    if (!j.contains(key) || !j[key].is_array()) return true;
    for (const auto& entry : j[key]) {
        if (!entry.is_object()) continue;
        auto def = parseActorEntry(entry, team, weapons, archetypes, rules);
        if (!def) return false;
        out.push_back(std::move(*def));
    }
    return true;
}

bool positionsFit(const Scenario& s, const CombatRules& rules) {
    std::vector<GridPos> taken;
    for (const auto* roster : {&s.players, &s.opponents}) {
        for (const auto& def : *roster) {
            const GridPos& p = def.position;
            if (p.x < 0 || p.y < 0 || p.x >= rules.gridWidth || p.y >= rules.gridHeight) {
                logWarn("CombatDataLoader: '" + def.name + "' is placed off the grid at (" + std::to_string(p.x) +
                        ", " + std::to_string(p.y) + ")");
                return false;
            }
            if (std::find(taken.begin(), taken.end(), p) != taken.end()) {
                logWarn("CombatDataLoader: '" + def.name + "' shares tile (" + std::to_string(p.x) + ", " +
                        std::to_string(p.y) + ") with another actor");
                return false;
            }
            taken.push_back(p);
        }
    }
    return true;
}

}  // namespace

std::optional<Combat::WeaponClass> parseWeaponClassKey(const std::string& k) {
    if (k == "melee") return Combat::WeaponClass::Melee;
    if (k == "ranged") return Combat::WeaponClass::Ranged;
    if (k == "tech") return Combat::WeaponClass::Tech;
    return std::nullopt;
}

std::optional<Combat::CoverKind> parseCoverKey(const std::string& k) {
    if (k == "none") return Combat::CoverKind::None;
    if (k == "half") return Combat::CoverKind::Half;
    if (k == "full") return Combat::CoverKind::Full;
    return std::nullopt;
}

CombatRules parseCombatRules(const json& j, CombatRules base) {
    CombatRules r = base;
    if (j.contains("grid")) {
        const auto& g = j["grid"];
        r.gridWidth = g.value("width", r.gridWidth);
        r.gridHeight = g.value("height", r.gridHeight);
    }
    if (j.contains("actionPoints")) {
        const auto& ap = j["actionPoints"];
        r.maxActionPoints = ap.value("max", r.maxActionPoints);
        r.apMove = ap.value("move", r.apMove);
        r.apAttack = ap.value("attack", r.apAttack);
        r.apTakeCover = ap.value("takeCover", r.apTakeCover);
        r.apLeaveCover = ap.value("leaveCover", r.apLeaveCover);
    }
    r.baseMovementRange = j.value("baseMovementRange", r.baseMovementRange);
    if (j.contains("hit")) {
        const auto& h = j["hit"];
        r.dodgeCap = h.value("dodgeCap", r.dodgeCap);
        r.dodgePerReflex = h.value("dodgePerReflex", r.dodgePerReflex);
        r.critPerCool = h.value("critPerCool", r.critPerCool);
        r.coverHalfHitPenalty = h.value("coverHalf", r.coverHalfHitPenalty);
        r.coverFullHitPenalty = h.value("coverFull", r.coverFullHitPenalty);
        r.hitChanceMin = h.value("min", r.hitChanceMin);
        r.hitChanceMax = h.value("max", r.hitChanceMax);
    }
    if (j.contains("damage")) {
        const auto& d = j["damage"];
        r.damageVarianceMin = d.value("varianceMin", r.damageVarianceMin);
        r.damageVarianceMax = d.value("varianceMax", r.damageVarianceMax);
        r.meleeBonusPerBody = d.value("meleeBonusPerBody", r.meleeBonusPerBody);
        r.rangedBonusPerReflex = d.value("rangedBonusPerReflex", r.rangedBonusPerReflex);
        r.armorReductionMultiplier = d.value("armorReductionMultiplier", r.armorReductionMultiplier);
        r.coverHalfDamageMultiplier = d.value("coverHalfMultiplier", r.coverHalfDamageMultiplier);
        r.coverFullDamageMultiplier = d.value("coverFullMultiplier", r.coverFullDamageMultiplier);
        r.minDamagePerHit = d.value("minPerHit", r.minDamagePerHit);
    }
    if (j.contains("morale")) {
        const auto& m = j["morale"];
        r.heavyHitFraction = m.value("heavyHitFraction", r.heavyHitFraction);
        r.heavyHitMoraleLoss = m.value("heavyHitLoss", r.heavyHitMoraleLoss);
        r.solidHitFraction = m.value("solidHitFraction", r.solidHitFraction);
        r.solidHitMoraleLoss = m.value("solidHitLoss", r.solidHitMoraleLoss);
    }
    if (j.contains("escape")) {
        const auto& e = j["escape"];
        r.escapeMinRound = e.value("minRound", r.escapeMinRound);
        r.escapeLowHpPercent = e.value("lowHpPercent", r.escapeLowHpPercent);
        r.escapeOutnumberRatio = e.value("outnumberRatio", r.escapeOutnumberRatio);
        r.escapeBaseChance = e.value("baseChance", r.escapeBaseChance);
        r.escapePerReflex = e.value("perReflex", r.escapePerReflex);
        r.escapeChanceMin = e.value("chanceMin", r.escapeChanceMin);
        r.escapeChanceMax = e.value("chanceMax", r.escapeChanceMax);
        r.escapeSacrificeChance = e.value("sacrificeChance", r.escapeSacrificeChance);
        r.escapeMoralePenalty = e.value("moralePenalty", r.escapeMoralePenalty);
        r.escapeFailureDamageFraction = e.value("failureDamageFraction", r.escapeFailureDamageFraction);
    }
    return r;
}

WeaponTable parseWeapons(const json& j) {
    WeaponTable out;
    if (!j.is_object()) return out;
    for (const auto& kv : j.items()) {
        const auto& w = kv.value();
        if (!w.is_object()) continue;
        Weapon weapon{};
        weapon.id = kv.key();
        weapon.name = w.value("name", kv.key());
        weapon.damage = w.value("damage", weapon.damage);
        weapon.accuracy = w.value("accuracy", weapon.accuracy);
        weapon.range = w.value("range", weapon.range);
        weapon.armorPen = std::clamp(w.value("armorPen", weapon.armorPen), 0.0f, 1.0f);
        weapon.critMultiplier = w.value("critMultiplier", weapon.critMultiplier);
        const std::string type = w.value("type", std::string{"ranged"});
        auto cls = parseWeaponClassKey(type);
        if (!cls) logWarn("CombatDataLoader: weapon '" + kv.key() + "' has unknown type '" + type + "', using ranged");
        weapon.type = cls.value_or(Combat::WeaponClass::Ranged);
        out.emplace(kv.key(), weapon);
    }
    return out;
}

ArchetypeTable parseArchetypes(const json& j) {
    ArchetypeTable out;
    if (!j.is_object()) return out;
    for (const auto& kv : j.items()) {
        const auto& a = kv.value();
        if (!a.is_object()) continue;
        Archetype arch{};
        arch.id = kv.key();
        arch.attributes = parseAttributes(a, arch.attributes);
        arch.maxHp = a.value("maxHp", arch.maxHp);
        arch.armor = a.value("armor", arch.armor);
        arch.morale = a.value("morale", arch.morale);
        out.emplace(kv.key(), arch);
    }
    return out;
}

std::optional<Scenario> parseScenario(const json& j,
                                      const WeaponTable& weapons,
                                      const ArchetypeTable& archetypes,
                                      const CombatRules& rules) {
    Scenario s{};
    s.name = j.value("name", std::string{"skirmish"});
    if (j.contains("seed")) {
        const auto& seed = j["seed"];
        if (!seed.is_number_unsigned() || seed.get<std::uint64_t>() > std::numeric_limits<std::uint32_t>::max()) {
            logWarn("CombatDataLoader: seed must be an unsigned 32-bit integer, got " + seed.dump());
            return std::nullopt;
        }
        s.seed = seed.get<std::uint32_t>();
    }
    if (!parseRoster(j, "players", Combat::Team::Player, weapons, archetypes, rules, s.players)) return std::nullopt;
    if (!parseRoster(j, "opponents", Combat::Team::Opponent, weapons, archetypes, rules, s.opponents)) {
        return std::nullopt;
    }
    if (!positionsFit(s, rules)) return std::nullopt;
    return s;
}

std::optional<CombatRules> loadCombatRules(const std::string& path) {
    auto j = readJsonFile(path);
    if (!j) return std::nullopt;
    CombatRules rules;
    try {
        rules = parseCombatRules(*j);
    } catch (const json::exception& e) {
        logWarn("CombatDataLoader: bad rules in " + path + " | " + e.what());
        return std::nullopt;
    }
    std::string reason;
    if (!Combat::rulesAreValid(rules, &reason)) {
        logWarn("CombatDataLoader: invalid rules in " + path + " | " + reason);
        return std::nullopt;
    }
    return rules;
}

std::optional<WeaponTable> loadWeapons(const std::string& path) {
    auto j = readJsonFile(path);
    if (!j) return std::nullopt;
    try {
        return parseWeapons(*j);
    } catch (const json::exception& e) {
        logWarn("CombatDataLoader: bad weapon table in " + path + " | " + e.what());
        return std::nullopt;
    }
}

std::optional<ArchetypeTable> loadArchetypes(const std::string& path) {
    auto j = readJsonFile(path);
    if (!j) return std::nullopt;
    try {
        return parseArchetypes(*j);
    } catch (const json::exception& e) {
        logWarn("CombatDataLoader: bad archetype table in " + path + " | " + e.what());
        return std::nullopt;
    }
}

std::optional<Scenario> loadScenario(const std::string& path,
                                     const WeaponTable& weapons,
                                     const ArchetypeTable& archetypes,
                                     const CombatRules& rules) {
    auto j = readJsonFile(path);
    if (!j) return std::nullopt;
    try {
        return parseScenario(*j, weapons, archetypes, rules);
    } catch (const json::exception& e) {
        logWarn("CombatDataLoader: bad scenario in " + path + " | " + e.what());
        return std::nullopt;
    }
}

}  // namespace Neon::Content
