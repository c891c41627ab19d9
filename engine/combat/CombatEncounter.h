// Turn-based encounter state machine: rosters, turn order, actions, escape and outcome.
#pragma once

#include <optional>
#include <random>
#include <string>
#include <vector>

#include "CombatActor.h"
#include "CombatRules.h"
#include "DamageResolver.h"
#include "EscapeNegotiator.h"
#include "OpponentController.h"
#include "TurnScheduler.h"

namespace Neon::Combat {

enum class EncounterError { None, InvalidEncounter };

enum class EncounterState { Initializing, InProgress, Terminated };

enum class Outcome { None, Victory, Defeat, Fled };

enum class ActionResult { Ok, NotAllowed };

enum class ActionKind { Move, Attack, TakeCover, LeaveCover, EndTurn };

// A player-side action request. Build with the named helpers.
struct ActionRequest {
    ActionKind kind{ActionKind::EndTurn};
    GridPos delta{};
    ActorId target{kInvalidActor};
    CoverKind cover{CoverKind::None};

    static ActionRequest move(int dx, int dy) { return {ActionKind::Move, GridPos{dx, dy}, kInvalidActor, CoverKind::None}; }
    static ActionRequest attack(ActorId target) { return {ActionKind::Attack, {}, target, CoverKind::None}; }
    static ActionRequest takeCover(CoverKind kind) { return {ActionKind::TakeCover, {}, kInvalidActor, kind}; }
    static ActionRequest leaveCover() { return {ActionKind::LeaveCover, {}, kInvalidActor, CoverKind::None}; }
    static ActionRequest endTurn() { return {}; }
};

struct EscapeResult {
    ActionResult status{ActionResult::NotAllowed};
    bool escaped{false};
    EscapeResolution resolution{};
    std::string message;
};

class CombatEncounter {
public:
    // Fails with InvalidEncounter (and leaves `rng` untouched) if either roster is empty, an
    // actor's team does not match the roster it was passed in, or `rules` fails rulesAreValid.
    // `rng` must outlive the encounter.
    static std::optional<CombatEncounter> create(const std::vector<CombatActor>& playerTeam,
                                                 const std::vector<CombatActor>& opponentTeam,
                                                 std::mt19937& rng,
                                                 const CombatRules& rules = {},
                                                 EncounterError* error = nullptr);

    // --- Turn flow ---
    void nextTurn();
    ActionResult submit(const ActionRequest& request);
    ActionResult takeOpponentAction();
    int runOpponentTurns();
    EscapeResult attemptEscape(ActorId sacrifice = kInvalidActor);

    // --- Legality queries ---
    std::vector<GridPos> getValidMoves(ActorId id) const;
    std::vector<ActorId> getValidTargets(ActorId id) const;
    bool isTileFree(const GridPos& pos, ActorId ignore = kInvalidActor) const;
    bool inBounds(const GridPos& pos) const;

    // --- Presentation surface ---
    EncounterState state() const { return state_; }
    Outcome outcome() const { return outcome_; }
    bool combatActive() const { return state_ == EncounterState::InProgress; }
    int round() const { return scheduler_.round(); }
    bool escapeAvailable() const { return escapeAvailable_; }
    bool escapeAttemptedThisRound() const { return lastEscapeRound_ == round(); }
    const EscapeAssessment& escapeAssessment() const { return escape_; }

    ActorId currentActorId() const { return current_; }
    const CombatActor* currentActor() const;
    bool isPlayerTurn() const;
    Team teamOf(ActorId id) const;

    const CombatActor& actor(ActorId id) const { return actors_.at(id); }
    const std::vector<CombatActor>& actors() const { return actors_; }
    const std::vector<ActorId>& playerIds() const { return playerIds_; }
    const std::vector<ActorId>& opponentIds() const { return opponentIds_; }
    const std::vector<ActorId>& turnOrder() const { return scheduler_.order(); }
    const std::vector<std::string>& log() const { return log_; }
    const CombatRules& rules() const { return rules_; }

private:
    CombatEncounter(const CombatRules& rules, std::mt19937& rng);

    void addLog(std::string message);
    ActionResult reject(const std::string& reason);
    // Both return false, changing nothing, when the actor cannot pay the AP cost.
    bool performAttack(ActorId attacker, ActorId target);
    bool performMove(ActorId mover, const GridPos& dest);
    int applyDamageTo(ActorId id, int amount);
    void evaluateRoundConditions(int round);
    void commitRoundConditions();
    void checkVictory();
    void endTurnIfSpent();
    bool allDead(const std::vector<ActorId>& ids) const;

    CombatRules rules_;
    std::mt19937* rng_{nullptr};
    std::vector<CombatActor> actors_;
    std::vector<ActorId> playerIds_;
    std::vector<ActorId> opponentIds_;
    TurnScheduler scheduler_;
    EscapeNegotiator negotiator_;
    OpponentController ai_;

    ActorId current_{kInvalidActor};
    EncounterState state_{EncounterState::Initializing};
    Outcome outcome_{Outcome::None};

    std::optional<EscapeAssessment> pendingEscape_{};
    EscapeAssessment escape_{};
    bool escapeAvailable_{false};
    int lastEscapeRound_{0};

    std::vector<std::string> log_;
};

const char* toString(Outcome outcome);
const char* toString(EncounterState state);

}  // namespace Neon::Combat
