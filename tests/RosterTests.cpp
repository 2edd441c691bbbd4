// Roster construction, placement, summons and compaction.
#include <cassert>
#include <optional>
#include <vector>

#include "../engine/core/Logger.h"
#include "../game/content/EntityProvider.h"
#include "../game/team/Roster.h"

using namespace Arena;
using namespace Arena::Game;

namespace {
Pet pet(const Catalog& c, const char* name, const GameConfig& cfg) { return *makePet(c, name, 1, cfg); }
}  // namespace

int main() {
    Logger::setMinLevel(LogLevel::Warning);
    const Catalog catalog = defaultCatalog();
    const GameConfig cfg{};

    {
        std::vector<std::optional<Pet>> six(6, pet(catalog, "Ant", cfg));
        auto r = Roster::fromSlots(six, 5, 1);
        assert(!r.ok());
        assert(r.error == ErrorCode::RosterTooLarge);
    }
    {
        // Gaps close up and relative order is kept.
        std::vector<std::optional<Pet>> slots{std::nullopt, pet(catalog, "Ant", cfg), std::nullopt,
                                              pet(catalog, "Pig", cfg)};
        auto r = Roster::fromSlots(slots, 5, 1);
        assert(r.ok());
        assert(r->occupiedCount() == 2);
        assert(r->at(0)->name() == "Ant");
        assert(r->at(1)->name() == "Pig");
        assert(r->at(1)->position == 1);
        assert(r->at(0)->id != r->at(1)->id);
        assert(r->front()->name() == "Ant");
    }
    {
        Roster r(5, 3);
        assert(r.add(pet(catalog, "Ant", cfg), 0) == ErrorCode::None);
        assert(r.add(pet(catalog, "Pig", cfg), 0) == ErrorCode::None);
        // Insert at front shifts the Ant back.
        assert(r.at(0)->name() == "Pig");
        assert(r.at(1)->name() == "Ant");
        assert(r.add(pet(catalog, "Duck", cfg), 7) == ErrorCode::InvalidPosition);
        for (int i = 0; i < 3; ++i) assert(r.add(pet(catalog, "Fish", cfg), 4) == ErrorCode::None);
        assert(r.full());
        assert(r.add(pet(catalog, "Duck", cfg), 0) == ErrorCode::RosterTooLarge);
    }
    {
        Roster r(5, 3);
        r.add(pet(catalog, "Cricket", cfg), 0);
        r.add(pet(catalog, "Ant", cfg), 1);
        const auto cricketId = r.at(0)->id;
        r.at(0)->stats.setHealth(0);
        // Summon into a fainted occupant's slot replaces it.
        auto placed = r.summon(pet(catalog, "Zombie Cricket", cfg), 0);
        assert(placed && *placed == 0);
        assert(r.at(0)->name() == "Zombie Cricket");
        assert(r.at(1)->name() == "Ant");
        assert(r.fainted().size() == 1);
        assert(r.findById(cricketId) != nullptr);
        assert(!r.locate(cricketId));
    }
    {
        Roster r(3, 3);
        r.add(pet(catalog, "Sheep", cfg), 0);
        r.add(pet(catalog, "Ant", cfg), 1);
        // Living occupant: later pets shift back into the free slot.
        auto placed = r.summon(pet(catalog, "Ram", cfg), 0);
        assert(placed && *placed == 0);
        assert(r.at(1)->name() == "Sheep");
        assert(r.at(2)->name() == "Ant");
        assert(!r.summon(pet(catalog, "Ram", cfg), 0));
    }
    {
        Roster r(5, 3);
        r.add(pet(catalog, "Ant", cfg), 0);
        r.add(pet(catalog, "Pig", cfg), 1);
        r.add(pet(catalog, "Duck", cfg), 2);
        assert(r.move(0, 2) == ErrorCode::None);
        assert(r.at(0)->name() == "Pig");
        assert(r.at(2)->name() == "Ant");
        assert(r.move(4, 0) == ErrorCode::EmptySlot);
        assert(r.move(0, 9) == ErrorCode::InvalidPosition);

        r.at(1)->stats.setHealth(0);
        r.retireFainted();
        assert(r.occupiedCount() == 2);
        assert(r.at(1)->name() == "Ant");
        assert(r.fainted().front().name() == "Duck");

        assert(r.retireSold(0) == ErrorCode::None);
        assert(r.sold().size() == 1);
        assert(r.retireSold(4) == ErrorCode::EmptySlot);
    }
    {
        Roster a(5, 99);
        Roster b(5, 99);
        // Same seed, same stream.
        assert(a.rng().index(1000) == b.rng().index(1000));
    }
    {
        // A roster with no slots refuses every placement.
        Roster none(0, 3);
        assert(none.capacity() == 0);
        assert(none.add(pet(catalog, "Ant", cfg), 0) == ErrorCode::InvalidPosition);
        assert(!none.summon(pet(catalog, "Ant", cfg), 0));
        assert(!none.summon(pet(catalog, "Ant", cfg), 3));
        assert(none.front() == nullptr);
        assert(none.full());
    }
    return 0;
}
