// Front-pet exchange with held-item damage modifiers.
#include <cassert>
#include <optional>
#include <string>
#include <vector>

#include "../engine/core/Logger.h"
#include "../game/content/EntityProvider.h"
#include "../game/systems/AttackResolver.h"
#include "../game/systems/EventEngine.h"
#include "../game/team/Roster.h"

using namespace Arena;
using namespace Arena::Effects;
using namespace Arena::Game;

namespace {

PetDefinition plain(const char* name, int attack, int health) {
    PetDefinition d{};
    d.name = name;
    d.attack = attack;
    d.health = health;
    return d;
}

Catalog combatCatalog() {
    Catalog c;
    c.addPet(plain("Brute", 5, 10));
    c.addPet(plain("Tank", 3, 30));
    c.addPet(plain("Weak", 1, 30));
    const Catalog base = defaultCatalog();
    for (const char* food : {"Melon", "Peanut", "Coconut", "Garlic", "Meat Bone"}) {
        c.addFood(*base.findFood(food));
    }
    return c;
}

struct Exchange {
    Exchange(const Catalog& c, const GameConfig& cfg, const char* a, const char* b)
        : sideA(*Roster::fromSlots({*makePet(c, a, 1, cfg)}, 5, 1)),
          sideB(*Roster::fromSlots({*makePet(c, b, 1, cfg)}, 5, 2)) {
        ctx.rosters = {&sideA, &sideB};
        ctx.provider = &c;
        ctx.config = &cfg;
        ctx.log = &log;
        ctx.phase = Phase::Attack;
    }

    // Runs one exchange plus its cascade, then cleanup without retiring.
    void fight() {
        EventEngine engine(ctx, fainted);
        resolveAttack(ctx, engine);
        assert(engine.drain() == ErrorCode::None);
        engine.cleanup(false);
    }

    Pet& a() { return *sideA.at(0); }
    Pet& b() { return *sideB.at(0); }

    Roster sideA;
    Roster sideB;
    EventLog log;
    FaintLedger fainted;
    EngineContext ctx;
};

std::size_t hurtOn(const EventLog& log, Side side) {
    std::size_t n = 0;
    for (const auto& entry : log) {
        if (entry.event.kind == EventKind::Hurt && entry.event.afflicted->side == side) ++n;
    }
    return n;
}

}  // namespace

int main() {
    Logger::setMinLevel(LogLevel::Warning);
    const Catalog catalog = combatCatalog();
    const GameConfig cfg{};

    {
        // Melon absorbs the whole hit once, then is gone.
        Exchange x(catalog, cfg, "Brute", "Tank");
        x.a().item = *makeFood(catalog, "Melon");
        x.fight();
        assert(x.a().stats.health() == 10);
        assert(x.b().stats.health() == 25);
        assert(hurtOn(x.log, Side::A) == 0);
        assert(hurtOn(x.log, Side::B) == 1);
        assert(!x.a().item);

        x.fight();
        assert(x.a().stats.health() == 7);
    }
    {
        // Peanut kills on any nonzero hit and is spent.
        Exchange x(catalog, cfg, "Brute", "Tank");
        x.a().item = *makeFood(catalog, "Peanut");
        x.fight();
        assert(!x.b().alive());
        assert(x.b().stats.health() == 0);
        assert(x.a().stats.health() == 7);
        assert(x.log.count(EventKind::Faint) == 1);
        assert(x.log.count(EventKind::KnockOut) == 1);
        assert(!x.a().item);
    }
    {
        // Coconut blocks all damage for one exchange.
        Exchange x(catalog, cfg, "Tank", "Brute");
        x.a().item = *makeFood(catalog, "Coconut");
        x.fight();
        assert(x.a().stats.health() == 30);
        assert(x.b().stats.health() == 7);
        assert(hurtOn(x.log, Side::A) == 0);
        assert(!x.a().item);
        x.fight();
        assert(x.a().stats.health() == 25);
    }
    {
        // Invulnerability beats a lethal hit.
        Exchange x(catalog, cfg, "Brute", "Tank");
        x.a().item = *makeFood(catalog, "Peanut");
        x.b().item = *makeFood(catalog, "Coconut");
        x.fight();
        assert(x.b().alive() && x.b().stats.health() == 30);
        assert(x.log.count(EventKind::Faint) == 0);
    }
    {
        // Garlic reduces every hit but never below one, and is never used up.
        Exchange x(catalog, cfg, "Brute", "Tank");
        x.a().item = *makeFood(catalog, "Garlic");
        x.fight();
        assert(x.a().stats.health() == 9);
        assert(x.a().item && x.a().item->name() == "Garlic");

        Exchange weak(catalog, cfg, "Brute", "Weak");
        weak.a().item = *makeFood(catalog, "Garlic");
        weak.fight();
        weak.fight();
        assert(weak.a().stats.health() == 8);
        assert(weak.a().item);
    }
    {
        // Meat Bone adds to outgoing damage only.
        Exchange x(catalog, cfg, "Brute", "Tank");
        x.a().item = *makeFood(catalog, "Meat Bone");
        x.fight();
        assert(x.b().stats.health() == 22);
        assert(x.a().stats.health() == 7);
        assert(x.a().item);
    }
    return 0;
}
