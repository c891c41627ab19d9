// Implementation of the encounter state machine.
#include "CombatEncounter.h"

#include <algorithm>
#include <cstdlib>
#include <utility>

#include "../core/Logger.h"

namespace Neon::Combat {

namespace {

std::string positionText(const GridPos& p) {
    return "(" + std::to_string(p.x) + ", " + std::to_string(p.y) + ")";
}

bool rosterMatches(const std::vector<CombatActor>& roster, Team team) {
    return std::all_of(roster.begin(), roster.end(), [team](const CombatActor& a) { return a.team() == team; });
}

}  // namespace

CombatEncounter::CombatEncounter(const CombatRules& rules, std::mt19937& rng)
    : rules_(rules), rng_(&rng), negotiator_(rules), ai_(rules) {}

std::optional<CombatEncounter> CombatEncounter::create(const std::vector<CombatActor>& playerTeam,
                                                       const std::vector<CombatActor>& opponentTeam,
                                                       std::mt19937& rng,
                                                       const CombatRules& rules,
                                                       EncounterError* error) {
    auto fail = [error](const std::string& why) -> std::optional<CombatEncounter> {
        if (error) *error = EncounterError::InvalidEncounter;
        logWarn("CombatEncounter: " + why);
        return std::nullopt;
    };
    if (error) *error = EncounterError::None;

    // Validated before any initiative roll so the turn order can never be empty.
    if (playerTeam.empty()) return fail("player roster is empty");
    if (opponentTeam.empty()) return fail("opponent roster is empty");
    if (!rosterMatches(playerTeam, Team::Player)) return fail("player roster contains a non-player actor");
    if (!rosterMatches(opponentTeam, Team::Opponent)) return fail("opponent roster contains a non-opponent actor");
    std::string rulesProblem;
    if (!rulesAreValid(rules, &rulesProblem)) return fail("invalid combat rules: " + rulesProblem);

    CombatEncounter enc(rules, rng);
    enc.actors_.reserve(playerTeam.size() + opponentTeam.size());
    for (const auto& a : playerTeam) {
        enc.playerIds_.push_back(static_cast<ActorId>(enc.actors_.size()));
        enc.actors_.push_back(a);
    }
    for (const auto& a : opponentTeam) {
        enc.opponentIds_.push_back(static_cast<ActorId>(enc.actors_.size()));
        enc.actors_.push_back(a);
    }

    if (!enc.scheduler_.build(enc.actors_, rng)) return fail("no living actors to order");

    enc.addLog("=== COMBAT START ===");
    for (const auto& roll : enc.scheduler_.rolls()) {
        enc.addLog(enc.actors_[roll.id].name() + " rolled initiative: " + std::to_string(roll.initiative));
    }

    enc.state_ = EncounterState::InProgress;
    enc.current_ = enc.scheduler_.current();
    auto& first = enc.actors_[enc.current_];
    first.startTurn();
    enc.addLog(">>> " + first.name() + "'s turn (" + toString(first.team()) + ") <<<");
    enc.checkVictory();
    return std::optional<CombatEncounter>(std::move(enc));
}

// --- Turn flow ---

void CombatEncounter::nextTurn() {
    if (!combatActive()) return;

    if (current_ != kInvalidActor) {
        actors_[current_].endTurn();
    }

    const ActorId next = scheduler_.advance(actors_, [this](int round) { evaluateRoundConditions(round); });
    // Publish before the next actor starts, so no caller can observe a stale flag this step.
    commitRoundConditions();

    if (next == kInvalidActor) {
        checkVictory();
        return;
    }
    current_ = next;
    auto& a = actors_[current_];
    a.startTurn();
    addLog(">>> " + a.name() + "'s turn (" + toString(a.team()) + ") <<<");
    checkVictory();
}

ActionResult CombatEncounter::submit(const ActionRequest& request) {
    if (!combatActive()) return reject("Combat is over.");
    if (!isPlayerTurn()) return reject("Not a player turn.");

    auto& a = actors_[current_];
    switch (request.kind) {
        case ActionKind::EndTurn:
            nextTurn();
            return ActionResult::Ok;

        case ActionKind::Move: {
            if (!a.canAfford(rules_.apMove)) return reject("Not enough AP!");
            const GridPos dest = a.position() + request.delta;
            const auto moves = getValidMoves(current_);
            if (std::find(moves.begin(), moves.end(), dest) == moves.end()) {
                return reject("Cannot move to " + positionText(dest) + " (max movement: " +
                              std::to_string(a.movementRange(rules_.baseMovementRange)) + ")");
            }
            if (!performMove(current_, dest)) return reject("Not enough AP!");
            break;
        }

        case ActionKind::Attack: {
            if (!a.canAfford(rules_.apAttack)) return reject("Not enough AP!");
            const auto targets = getValidTargets(current_);
            if (std::find(targets.begin(), targets.end(), request.target) == targets.end()) {
                return reject("Invalid target for " + a.name() + " (range: " + std::to_string(a.weapon().range) + ")");
            }
            if (!performAttack(current_, request.target)) return reject("Not enough AP!");
            break;
        }

        case ActionKind::TakeCover: {
            if (request.cover == CoverKind::None) return reject("No cover kind given.");
            if (a.cover() == request.cover) return reject(a.name() + " is already in " + toString(request.cover) + " cover.");
            if (!a.spendAp(rules_.apTakeCover)) return reject("Not enough AP!");
            a.takeCover(request.cover);
            addLog(a.name() + " takes " + toString(request.cover) + " cover.");
            break;
        }

        case ActionKind::LeaveCover: {
            if (!a.inCover()) return reject(a.name() + " is not in cover.");
            if (!a.spendAp(rules_.apLeaveCover)) return reject("Not enough AP!");
            a.leaveCover();
            addLog(a.name() + " leaves cover.");
            break;
        }
    }

    endTurnIfSpent();
    return ActionResult::Ok;
}

ActionResult CombatEncounter::takeOpponentAction() {
    if (!combatActive()) return ActionResult::NotAllowed;
    if (current_ == kInvalidActor || teamOf(current_) != Team::Opponent) return ActionResult::NotAllowed;

    const auto targets = getValidTargets(current_);
    const ActorId self = current_;
    const AiDecision decision = ai_.decide(self, actors_, targets, playerIds_,
                                           [this, self](const GridPos& p) { return isTileFree(p, self); });
    bool acted = false;
    switch (decision.action) {
        case AiAction::Attack:
            acted = performAttack(self, decision.target);
            break;
        case AiAction::Move:
            acted = performMove(self, decision.destination);
            break;
        case AiAction::Idle:
        default:
            break;
    }
    if (!acted) {
        addLog(actors_[self].name() + " holds position.");
        nextTurn();
        return ActionResult::Ok;
    }

    endTurnIfSpent();
    return ActionResult::Ok;
}

int CombatEncounter::runOpponentTurns() {
    // Each action spends AP or passes the turn; the cap only guards zero-cost rule sets.
    const int cap = static_cast<int>(actors_.size()) * (rules_.maxActionPoints + 2) * 4 + 16;
    int actions = 0;
    while (combatActive() && current_ != kInvalidActor && teamOf(current_) == Team::Opponent) {
        if (actions >= cap) {
            logWarn("CombatEncounter: opponent action cap reached; forcing turn end");
            nextTurn();
            break;
        }
        if (takeOpponentAction() != ActionResult::Ok) break;
        ++actions;
    }
    return actions;
}

EscapeResult CombatEncounter::attemptEscape(ActorId sacrifice) {
    EscapeResult out{};
    auto refuse = [this, &out](const std::string& why) {
        addLog(why);
        out.message = why;
        return out;
    };
    if (!combatActive()) return refuse("Combat is over.");
    if (!isPlayerTurn()) return refuse("Not a player turn.");
    if (!escapeAvailable_) return refuse("Escape not available yet!");
    if (escapeAttemptedThisRound()) return refuse("Escape already attempted this round.");
    if (sacrifice != kInvalidActor) {
        if (sacrifice >= actors_.size() || teamOf(sacrifice) != Team::Player || !actors_[sacrifice].alive()) {
            return refuse("Invalid sacrifice.");
        }
    }

    lastEscapeRound_ = round();
    const bool withSacrifice = sacrifice != kInvalidActor;
    if (withSacrifice) {
        addLog(actors_[sacrifice].name() + " stays behind to cover the retreat!");
    } else {
        const int chance = negotiator_.successChance(actors_[playerIds_.front()], false);
        addLog("Attempting solo escape... (" + std::to_string(chance) + "% chance)");
    }

    const int roll = EscapeNegotiator::rollPercent(*rng_);
    out.resolution = negotiator_.resolve(actors_, playerIds_, sacrifice, roll);
    out.status = ActionResult::Ok;
    out.escaped = out.resolution.success;

    if (out.escaped) {
        if (withSacrifice) {
            addLog(actors_[sacrifice].name() + " died buying time. Party escaped.");
        } else {
            addLog("Escape successful! Retreated from combat.");
        }
        out.message = "Escaped successfully!";
        state_ = EncounterState::Terminated;
        outcome_ = Outcome::Fled;
        addLog("=== FLED ===");
        return out;
    }

    if (withSacrifice) {
        addLog("Escape FAILED! " + actors_[sacrifice].name() + " died in vain!");
    } else {
        const auto& leader = actors_[playerIds_.front()];
        addLog("Escape FAILED! " + leader.name() + " took " + std::to_string(out.resolution.penaltyDamage) + " damage.");
        if (!leader.alive()) addLog(leader.name() + " is down!");
    }
    out.message = "Escape failed! Enemies caught you.";
    checkVictory();
    // The acting player may have been the one left behind.
    if (combatActive() && !actors_[current_].alive()) nextTurn();
    return out;
}

// --- Legality queries ---

bool CombatEncounter::inBounds(const GridPos& pos) const {
    return pos.x >= 0 && pos.x < rules_.gridWidth && pos.y >= 0 && pos.y < rules_.gridHeight;
}

bool CombatEncounter::isTileFree(const GridPos& pos, ActorId ignore) const {
    if (!inBounds(pos)) return false;
    for (std::size_t i = 0; i < actors_.size(); ++i) {
        if (static_cast<ActorId>(i) == ignore) continue;
        const auto& a = actors_[i];
        if (a.alive() && a.position() == pos) return false;
    }
    return true;
}

std::vector<GridPos> CombatEncounter::getValidMoves(ActorId id) const {
    std::vector<GridPos> out;
    if (id >= actors_.size() || !actors_[id].alive()) return out;
    const auto& a = actors_[id];
    const int range = a.movementRange(rules_.baseMovementRange);
    for (int dx = -range; dx <= range; ++dx) {
        for (int dy = -range; dy <= range; ++dy) {
            if (dx == 0 && dy == 0) continue;
            if (std::abs(dx) + std::abs(dy) > range) continue;
            const GridPos dest = a.position() + GridPos{dx, dy};
            if (isTileFree(dest, id)) out.push_back(dest);
        }
    }
    return out;
}

std::vector<ActorId> CombatEncounter::getValidTargets(ActorId id) const {
    std::vector<ActorId> out;
    if (id >= actors_.size() || !actors_[id].alive()) return out;
    const auto& a = actors_[id];
    const auto& hostiles = (teamOf(id) == Team::Player) ? opponentIds_ : playerIds_;
    for (ActorId t : hostiles) {
        const auto& other = actors_[t];
        if (!other.alive()) continue;
        if (gridDistance(a.position(), other.position()) <= a.weapon().range) out.push_back(t);
    }
    return out;
}

const CombatActor* CombatEncounter::currentActor() const {
    if (current_ == kInvalidActor) return nullptr;
    return &actors_[current_];
}

bool CombatEncounter::isPlayerTurn() const {
    return current_ != kInvalidActor && teamOf(current_) == Team::Player;
}

Team CombatEncounter::teamOf(ActorId id) const {
    return id < playerIds_.size() ? Team::Player : Team::Opponent;
}

// --- Internals ---

void CombatEncounter::addLog(std::string message) {
    logDebug("[combat] " + message);
    log_.push_back(std::move(message));
}

ActionResult CombatEncounter::reject(const std::string& reason) {
    addLog(reason);
    return ActionResult::NotAllowed;
}

bool CombatEncounter::performAttack(ActorId attacker, ActorId target) {
    auto& a = actors_[attacker];
    const auto& t = actors_[target];
    if (!a.spendAp(rules_.apAttack)) return false;

    const AttackOutcome result = ResolveAttack(a, t, *rng_, rules_);
    logDebug("[combat] " + a.name() + " -> " + t.name() + ": " + result.debug);
    if (!result.hit) {
        addLog(a.name() + " misses " + t.name() + "! (Needed " + std::to_string(result.hitChance) + "%, rolled " +
               std::to_string(result.hitRoll) + "%)");
        return true;
    }
    const std::string crit = result.damage.crit ? " CRITICAL!" : "";
    addLog(a.name() + " hits " + t.name() + " for " + std::to_string(result.damage.damage) + " damage" + crit + "!");
    applyDamageTo(target, result.damage.damage);
    return true;
}

bool CombatEncounter::performMove(ActorId mover, const GridPos& dest) {
    auto& a = actors_[mover];
    if (!a.spendAp(rules_.apMove)) return false;
    a.moveTo(dest);
    addLog(a.name() + " moved to " + positionText(dest));
    return true;
}

int CombatEncounter::applyDamageTo(ActorId id, int amount) {
    auto& a = actors_[id];
    const int dealt = a.applyDamage(amount, rules_);
    if (!a.alive()) addLog(a.name() + " is down!");
    // Same-step victory check: a wiped team never gets another turn.
    checkVictory();
    return dealt;
}

void CombatEncounter::evaluateRoundConditions(int round) {
    addLog("=== Round " + std::to_string(round) + " ===");
    pendingEscape_ = negotiator_.assess(round, actors_, playerIds_, opponentIds_);
}

void CombatEncounter::commitRoundConditions() {
    if (!pendingEscape_) return;
    escape_ = *pendingEscape_;
    pendingEscape_.reset();
    const bool wasAvailable = escapeAvailable_;
    escapeAvailable_ = escape_.available();
    if (escapeAvailable_ && !wasAvailable) {
        addLog("ESCAPE AVAILABLE - retreat may be attempted!");
    }
}

void CombatEncounter::checkVictory() {
    if (!combatActive()) return;
    if (allDead(playerIds_)) {
        state_ = EncounterState::Terminated;
        outcome_ = Outcome::Defeat;
        addLog("=== DEFEAT ===");
    } else if (allDead(opponentIds_)) {
        state_ = EncounterState::Terminated;
        outcome_ = Outcome::Victory;
        addLog("=== VICTORY ===");
    }
}

void CombatEncounter::endTurnIfSpent() {
    if (!combatActive() || current_ == kInvalidActor) return;
    if (actors_[current_].ap() == 0) nextTurn();
}

bool CombatEncounter::allDead(const std::vector<ActorId>& ids) const {
    return std::none_of(ids.begin(), ids.end(), [this](ActorId id) { return actors_[id].alive(); });
}

const char* toString(Outcome outcome) {
    switch (outcome) {
        case Outcome::Victory: return "victory";
        case Outcome::Defeat: return "defeat";
        case Outcome::Fled: return "fled";
        case Outcome::None:
        default: return "none";
    }
}

const char* toString(EncounterState state) {
    switch (state) {
        case EncounterState::Initializing: return "initializing";
        case EncounterState::InProgress: return "in-progress";
        case EncounterState::Terminated:
        default: return "terminated";
    }
}

}  // namespace Neon::Combat
