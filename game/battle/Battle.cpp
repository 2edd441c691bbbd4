#include "Battle.h"

#include <string>

#include "../../engine/core/Logger.h"
#include "../systems/AttackResolver.h"

namespace Arena::Game {

using namespace Arena::Effects;

std::string_view toString(Outcome outcome) {
    switch (outcome) {
        case Outcome::SideAWins: return "SideAWins";
        case Outcome::SideBWins: return "SideBWins";
        case Outcome::Draw: return "Draw";
    }
    return "Unknown";
}

Battle::Battle(const Roster& sideA, const Roster& sideB, const EntityProvider& provider, const GameConfig& config)
    : rosters_{sideA, sideB}, provider_(&provider), config_(config) {}

Result<Battle> Battle::create(const Roster& sideA, const Roster& sideB, const EntityProvider& provider,
                              const GameConfig& config) {
    const auto shopOpen = [](const Roster& r) { return r.shop() && r.shop()->isOpen(); };
    if (shopOpen(sideA) || shopOpen(sideB)) {
        return Result<Battle>::failure(ErrorCode::InvalidShopState);
    }
    Battle battle(sideA, sideB, provider, config);
    // Nothing to fight with: decided before any phase runs.
    if (auto decided = battle.classify()) {
        battle.outcome_ = decided;
        battle.finish();
    }
    return Result<Battle>::success(std::move(battle));
}

const Roster& Battle::side(Side side) const { return rosters_[static_cast<std::size_t>(sideIndex(side))]; }

EngineContext Battle::context() {
    EngineContext ctx{};
    ctx.rosters = {&rosters_[0], &rosters_[1]};
    ctx.provider = provider_;
    ctx.config = &config_;
    ctx.log = &log_;
    ctx.turn = turn_;
    ctx.phase = phase_;
    return ctx;
}

void Battle::enqueueTeamEvent(EventEngine& engine, EventKind kind) {
    for (Side side : {Side::A, Side::B}) {
        Event e{};
        e.kind = kind;
        e.side = side;
        engine.enqueue(std::move(e));
    }
}

void Battle::enqueueFrontEvent(EventEngine& engine, EventKind kind) {
    for (Side side : {Side::A, Side::B}) {
        const Pet* front = rosters_[static_cast<std::size_t>(sideIndex(side))].front();
        if (!front) continue;
        Event e{};
        e.kind = kind;
        e.side = side;
        e.afflicted = PetRef{side, front->position, front->id};
        engine.enqueue(std::move(e));
    }
}

std::optional<Outcome> Battle::classify() const {
    const bool aAlive = rosters_[0].livingCount() > 0;
    const bool bAlive = rosters_[1].livingCount() > 0;
    if (!aAlive && !bAlive) return Outcome::Draw;
    if (!aAlive) return Outcome::SideBWins;
    if (!bAlive) return Outcome::SideAWins;
    return std::nullopt;
}

void Battle::finish() {
    finished_ = true;
    logInfo("Battle finished: " + std::string(toString(outcome_.value_or(Outcome::Draw))) + " after " +
            std::to_string(turn_) + " turn(s), " + std::to_string(log_.size()) + " events.");
}

ErrorCode Battle::advance() {
    if (finished_) return error_;

    EngineContext ctx = context();
    EventEngine engine(ctx, fainted_);
    bool retire = true;
    Phase next = phase_;

    switch (phase_) {
        case Phase::StartOfBattle:
            enqueueTeamEvent(engine, EventKind::StartOfBattle);
            next = Phase::TurnStart;
            break;
        case Phase::TurnStart:
            enqueueTeamEvent(engine, EventKind::StartTurn);
            next = Phase::BeforeAttack;
            break;
        case Phase::BeforeAttack:
            enqueueFrontEvent(engine, EventKind::BeforeAttack);
            next = Phase::Attack;
            break;
        case Phase::Attack:
            attackers_ = resolveAttack(ctx, engine);
            // Fainted pets stay in place until the cleanup phase.
            retire = false;
            next = Phase::Cleanup;
            break;
        case Phase::Cleanup:
            next = Phase::AfterAttack;
            break;
        case Phase::AfterAttack:
            for (const auto& attacker : attackers_) {
                if (!attacker) continue;
                const Pet* pet = ctx.find(*attacker);
                const auto& roster = rosters_[static_cast<std::size_t>(sideIndex(attacker->side))];
                if (!pet || !pet->alive() || !roster.locate(pet->id)) continue;
                Event e{};
                e.kind = EventKind::AfterAttack;
                e.side = attacker->side;
                e.afflicted = PetRef{attacker->side, pet->position, pet->id};
                engine.enqueue(std::move(e));
            }
            attackers_ = {};
            next = Phase::EndOfTurn;
            break;
        case Phase::EndOfTurn:
            enqueueTeamEvent(engine, EventKind::EndTurn);
            next = Phase::TurnStart;
            break;
        case Phase::EndOfBattle:
            enqueueTeamEvent(engine, EventKind::EndOfBattle);
            break;
        case Phase::Shop:
            return ErrorCode::InvalidShopState;
    }

    const ErrorCode err = engine.drain();
    engine.cleanup(retire);
    logDebug("Turn " + std::to_string(turn_) + " " + std::string(toString(phase_)) + ": " +
             std::to_string(engine.processed()) + " events.");

    if (err != ErrorCode::None) {
        error_ = err;
        outcome_ = Outcome::Draw;
        logError("Battle aborted in " + std::string(toString(phase_)) + ": " + std::string(toString(err)));
        finish();
        return err;
    }

    if (phase_ == Phase::EndOfBattle) {
        finish();
        return ErrorCode::None;
    }
    if (phase_ == Phase::StartOfBattle) {
        turn_ = 1;
    }
    if (phase_ == Phase::EndOfTurn) {
        outcome_ = classify();
        if (!outcome_ && turn_ >= config_.maxTurns) {
            logWarn("Turn ceiling of " + std::to_string(config_.maxTurns) + " reached; forcing a draw.");
            outcome_ = Outcome::Draw;
        }
        if (outcome_) {
            next = Phase::EndOfBattle;
        } else {
            ++turn_;
        }
    }
    phase_ = next;
    return ErrorCode::None;
}

BattleResult Battle::run() {
    while (!finished_) {
        if (advance() != ErrorCode::None) break;
    }
    return result();
}

BattleResult Battle::result() const {
    BattleResult out{};
    out.outcome = outcome_.value_or(Outcome::Draw);
    out.turns = turn_;
    out.sideA = rosters_[0];
    out.sideB = rosters_[1];
    out.log = log_;
    out.error = error_;
    return out;
}

BattleResult runBattle(const Roster& sideA, const Roster& sideB, const EntityProvider& provider,
                       const GameConfig& config) {
    auto battle = Battle::create(sideA, sideB, provider, config);
    if (!battle) {
        logWarn("Battle refused: " + std::string(toString(battle.error)));
        BattleResult refused{};
        refused.sideA = sideA;
        refused.sideB = sideB;
        refused.error = battle.error;
        return refused;
    }
    return battle->run();
}

}  // namespace Arena::Game
