// Turn-phase state machine driving two rosters through combat.
#pragma once

#include <array>
#include <optional>
#include <string_view>

#include "../../engine/core/Error.h"
#include "../../engine/effects/Event.h"
#include "../config/GameConfig.h"
#include "../content/EntityProvider.h"
#include "../systems/EventEngine.h"
#include "../team/Roster.h"

namespace Arena::Game {

enum class Outcome { SideAWins, SideBWins, Draw };

std::string_view toString(Outcome outcome);

struct BattleResult {
    Outcome outcome{Outcome::Draw};
    int turns{0};
    Roster sideA;
    Roster sideB;
    Effects::EventLog log;
    ErrorCode error{ErrorCode::None};  // CascadeLimitExceeded keeps the partial log
};

class Battle {
public:
    // Copies both rosters; InvalidShopState while either roster's shop is open.
    static Result<Battle> create(const Roster& sideA, const Roster& sideB, const EntityProvider& provider,
                                 const GameConfig& config);

    // Runs exactly one phase. Hosts may stop calling between phases.
    ErrorCode advance();
    BattleResult run();

    bool finished() const { return finished_; }
    Effects::Phase phase() const { return phase_; }
    int turn() const { return turn_; }
    std::optional<Outcome> outcome() const { return outcome_; }
    ErrorCode error() const { return error_; }
    const Roster& side(Effects::Side side) const;
    const Effects::EventLog& log() const { return log_; }
    BattleResult result() const;

private:
    Battle(const Roster& sideA, const Roster& sideB, const EntityProvider& provider, const GameConfig& config);

    EngineContext context();
    void enqueueTeamEvent(EventEngine& engine, Effects::EventKind kind);
    void enqueueFrontEvent(EventEngine& engine, Effects::EventKind kind);
    std::optional<Outcome> classify() const;
    void finish();

    std::array<Roster, 2> rosters_;
    const EntityProvider* provider_{nullptr};
    GameConfig config_{};
    Effects::EventLog log_;
    FaintLedger fainted_;
    Effects::Phase phase_{Effects::Phase::StartOfBattle};
    int turn_{0};
    bool finished_{false};
    std::optional<Outcome> outcome_;
    ErrorCode error_{ErrorCode::None};
    std::array<std::optional<Effects::PetRef>, 2> attackers_{};
};

// create + run; a refused battle comes back as a Draw carrying the error.
BattleResult runBattle(const Roster& sideA, const Roster& sideB, const EntityProvider& provider,
                       const GameConfig& config);

}  // namespace Arena::Game
