// Battle phase machine: outcomes, determinism, faint bookkeeping and refusal rules.
#include <cassert>
#include <optional>
#include <set>
#include <utility>
#include <vector>

#include "../engine/core/Logger.h"
#include "../game/battle/Battle.h"
#include "../game/content/EntityProvider.h"
#include "../game/export/EventLogJson.h"
#include "../game/shop/TeamShopping.h"

using namespace Arena;
using namespace Arena::Effects;
using namespace Arena::Game;

namespace {

Roster roster(const EntityProvider& c, const GameConfig& cfg, std::vector<const char*> names, std::uint64_t seed) {
    std::vector<std::optional<Pet>> slots;
    for (const char* n : names) slots.push_back(*makePet(c, n, 1, cfg));
    return *Roster::fromSlots(std::move(slots), static_cast<std::size_t>(cfg.rosterCapacity), seed);
}

Catalog plainAnts() {
    Catalog c;
    PetDefinition ant{};
    ant.name = "Ant";
    ant.attack = 2;
    ant.health = 1;
    c.addPet(ant);
    return c;
}

Catalog pingPong() {
    Catalog c;
    PetDefinition echo{};
    echo.name = "Echo";
    echo.attack = 1;
    echo.health = 50;
    Effect e{};
    e.trigger = Trigger{EventKind::Hurt, TriggerScope::Self};
    e.target.kind = SelectorKind::Random;
    e.target.team = TargetTeam::Enemy;
    e.action = DealDamage{1};
    for (auto& level : echo.effects) level = {e};
    c.addPet(echo);
    return c;
}

}  // namespace

int main() {
    Logger::setMinLevel(LogLevel::Warning);
    const GameConfig cfg{};

    {
        // Mutual lethal hits: both faint, draw, one turn.
        const Catalog c = plainAnts();
        auto result = runBattle(roster(c, cfg, {"Ant"}, 1), roster(c, cfg, {"Ant"}, 1), c, cfg);
        assert(result.error == ErrorCode::None);
        assert(result.outcome == Outcome::Draw);
        assert(result.turns == 1);
        int attacks = 0;
        for (const auto& entry : result.log) {
            if (entry.event.kind != EventKind::Attack) continue;
            ++attacks;
            assert(entry.event.amount == 2);
        }
        assert(attacks == 2);
        assert(result.log.count(EventKind::Faint) == 2);
        assert(result.sideA.livingCount() == 0 && result.sideB.livingCount() == 0);
    }
    {
        // Same seed, byte-identical log.
        const Catalog c = defaultCatalog();
        const auto a = roster(c, cfg, {"Mosquito", "Ant", "Cricket", "Flamingo", "Sheep"}, 42);
        const auto b = roster(c, cfg, {"Hedgehog", "Mosquito", "Horse", "Blowfish", "Ant"}, 42);
        const auto first = runBattle(a, b, c, cfg);
        const auto second = runBattle(a, b, c, cfg);
        assert(first.error == ErrorCode::None);
        assert(first.outcome == second.outcome);
        assert(first.turns == second.turns);
        assert(eventLogToJson(first.log).dump() == eventLogToJson(second.log).dump());

        // Every pet faints at most once.
        std::set<std::pair<int, PetId>> seen;
        for (const auto& entry : first.log) {
            if (entry.event.kind != EventKind::Faint) continue;
            const auto& who = *entry.event.afflicted;
            assert(seen.insert({sideIndex(who.side), who.id}).second);
        }
        // Recorded stats never drop below zero.
        for (const auto& entry : first.log) {
            for (const auto& action : entry.actions) {
                assert(action.attack >= 0 && action.health >= 0);
            }
        }
        // Caller's rosters are untouched.
        assert(a.livingCount() == 5 && b.livingCount() == 5);
    }
    {
        // Start-of-battle damage can decide the fight before anyone attacks.
        const Catalog c = defaultCatalog();
        auto result = runBattle(roster(c, cfg, {"Mosquito"}, 3), roster(c, cfg, {"Ant"}, 3), c, cfg);
        assert(result.outcome == Outcome::SideAWins);
        assert(result.turns == 1);
        const LogEntry* faint = nullptr;
        for (const auto& entry : result.log) {
            if (entry.event.kind == EventKind::Faint) {
                faint = &entry;
                break;
            }
        }
        assert(faint && faint->event.phase == Phase::StartOfBattle && faint->event.turn == 0);
        assert(result.log.count(EventKind::Attack) == 0);
    }
    {
        // Cricket trades with Pig and leaves a Zombie Cricket behind in its slot.
        const Catalog c = defaultCatalog();
        auto result = runBattle(roster(c, cfg, {"Cricket"}, 5), roster(c, cfg, {"Pig"}, 5), c, cfg);
        assert(result.outcome == Outcome::SideAWins);
        assert(result.sideA.at(0) && result.sideA.at(0)->name() == "Zombie Cricket");
        assert(result.sideA.fainted().size() == 1);
        assert(result.sideA.fainted()[0].name() == "Cricket");
        assert(result.log.count(EventKind::Summoned) == 1);
    }
    {
        // Knockout goes to the survivor of the exchange.
        const Catalog c = defaultCatalog();
        auto result = runBattle(roster(c, cfg, {"Blowfish"}, 9), roster(c, cfg, {"Ant"}, 9), c, cfg);
        assert(result.outcome == Outcome::SideAWins);
        assert(result.log.count(EventKind::KnockOut) == 1);
    }
    {
        // Empty side: decided immediately with zero turns.
        const Catalog c = defaultCatalog();
        Roster empty(5, 1);
        auto result = runBattle(roster(c, cfg, {"Ant"}, 1), empty, c, cfg);
        assert(result.outcome == Outcome::SideAWins);
        assert(result.turns == 0);
        assert(result.log.empty());
    }
    {
        // Stepping one phase at a time.
        const Catalog c = plainAnts();
        auto battle = Battle::create(roster(c, cfg, {"Ant"}, 1), roster(c, cfg, {"Ant"}, 1), c, cfg);
        assert(battle.ok());
        assert(battle->phase() == Phase::StartOfBattle);
        assert(battle->advance() == ErrorCode::None);
        assert(battle->phase() == Phase::TurnStart && battle->turn() == 1);
        assert(battle->advance() == ErrorCode::None);
        assert(battle->advance() == ErrorCode::None);
        assert(battle->phase() == Phase::Attack);
        assert(battle->advance() == ErrorCode::None);
        // Fainted front pets stay in their slots until cleanup.
        assert(battle->side(Side::A).occupiedCount() == 1);
        assert(battle->advance() == ErrorCode::None);
        assert(battle->side(Side::A).occupiedCount() == 0);
        assert(!battle->finished());
        auto result = battle->run();
        assert(battle->finished());
        assert(result.outcome == Outcome::Draw);
        assert(result.log.count(EventKind::EndOfBattle) == 2);
    }
    {
        // Runaway effects abort with the partial log attached.
        const Catalog c = pingPong();
        GameConfig tight = cfg;
        tight.cascadeLimit = 20;
        auto result = runBattle(roster(c, tight, {"Echo"}, 4), roster(c, tight, {"Echo"}, 4), c, tight);
        assert(result.error == ErrorCode::CascadeLimitExceeded);
        assert(result.outcome == Outcome::Draw);
        assert(result.log.size() > 20);
    }
    {
        // Neither side can win within the turn ceiling.
        Catalog c;
        PetDefinition wall{};
        wall.name = "Wall";
        wall.attack = 1;
        wall.health = 50;
        c.addPet(wall);
        GameConfig shortGame = cfg;
        shortGame.maxTurns = 3;
        auto result = runBattle(roster(c, shortGame, {"Wall"}, 1), roster(c, shortGame, {"Wall"}, 1), c, shortGame);
        assert(result.error == ErrorCode::None);
        assert(result.outcome == Outcome::Draw);
        assert(result.turns == 3);
        assert(result.sideA.at(0)->stats.health() == 47);
    }
    {
        // No battle while a shop is open.
        const Catalog c = defaultCatalog();
        auto a = roster(c, cfg, {"Ant"}, 1);
        a.attachShop(*Shop::create(1, 11, cfg));
        TeamShopping shopping(a, c, cfg);
        assert(shopping.open() == ErrorCode::None);
        auto refused = Battle::create(a, roster(c, cfg, {"Ant"}, 1), c, cfg);
        assert(!refused.ok() && refused.error == ErrorCode::InvalidShopState);
        assert(shopping.close() == ErrorCode::None);
        assert(Battle::create(a, roster(c, cfg, {"Ant"}, 1), c, cfg).ok());
    }
    return 0;
}
