// Shop economy: gating, funds, freeze/roll, merge, sell and food purchases.
#include <cassert>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "../engine/core/Logger.h"
#include "../game/content/EntityProvider.h"
#include "../game/shop/Shop.h"
#include "../game/shop/TeamShopping.h"
#include "../game/team/Roster.h"

using namespace Arena;
using namespace Arena::Effects;
using namespace Arena::Game;

namespace {

// Only Ants and one food so every draw is predictable.
Catalog antsAnd(const char* food) {
    const Catalog base = defaultCatalog();
    Catalog c;
    c.addPet(*base.findPet("Ant"));
    c.addFood(*base.findFood(food));
    return c;
}

Roster withShop(const GameConfig& cfg, int tier = 1, std::uint64_t seed = 7) {
    Roster r(static_cast<std::size_t>(cfg.rosterCapacity), seed);
    r.attachShop(*Shop::create(tier, seed, cfg));
    return r;
}

}  // namespace

int main() {
    Logger::setMinLevel(LogLevel::Warning);
    const GameConfig cfg{};

    {
        assert(Shop::create(0, 1, cfg).error == ErrorCode::InvalidTier);
        assert(Shop::create(7, 1, cfg).error == ErrorCode::InvalidTier);
        assert(Shop::create(6, 1, cfg).ok());
        assert(petSlotsForTier(1) == 3 && petSlotsForTier(3) == 4 && petSlotsForTier(6) == 5);
        assert(foodSlotsForTier(1) == 1 && foodSlotsForTier(2) == 2);
    }
    {
        // Closed shop rejects everything; open shop fails only on funds/position.
        const Catalog c = antsAnd("Apple");
        Roster r = withShop(cfg);
        TeamShopping shopping(r, c, cfg);
        assert(shopping.buy(0, 0) == ErrorCode::InvalidShopState);
        assert(shopping.roll() == ErrorCode::InvalidShopState);
        assert(shopping.sell(0) == ErrorCode::InvalidShopState);
        assert(shopping.freeze(0) == ErrorCode::InvalidShopState);
        assert(shopping.close() == ErrorCode::InvalidShopState);

        assert(shopping.open() == ErrorCode::None);
        assert(shopping.open() == ErrorCode::InvalidShopState);
        const Shop& shop = *r.shop();
        assert(shop.coins() == 10);
        assert(shop.items().size() == 4);
        assert(shopping.buy(0, 9) == ErrorCode::InvalidPosition);
        assert(shopping.buy(9, 0) == ErrorCode::InvalidPosition);
        assert(shopping.buy(0, 0) == ErrorCode::None);
        assert(shop.coins() == 7);
        assert(r.at(0) && r.at(0)->name() == "Ant");
        assert(r.at(0)->id != kInvalidPet);
    }
    {
        // Merging raises stats and experience, and consumes the shop slot.
        const Catalog c = antsAnd("Apple");
        Roster r = withShop(cfg);
        TeamShopping shopping(r, c, cfg);
        assert(shopping.open() == ErrorCode::None);
        const Shop& shop = *r.shop();
        assert(shopping.buy(0, 0) == ErrorCode::None);
        const auto before = shop.items().size();
        assert(shopping.buy(0, 0) == ErrorCode::None);
        assert(shop.items().size() == before - 1);
        const Pet* ant = r.at(0);
        assert(r.occupiedCount() == 1);
        assert(ant->level == 1 && ant->experience == 1);
        assert(ant->stats.attack() == 3 && ant->stats.health() == 2);

        assert(shopping.buy(0, 0) == ErrorCode::None);
        assert(ant->level == 2 && ant->experience == 2);
        assert(ant->stats.attack() == 4 && ant->stats.health() == 3);
        assert(shopping.log().count(EventKind::Levelup) == 1);
        assert(shop.coins() == 1);

        // Not enough coins: nothing changes.
        const auto itemsBefore = shop.items().size();
        assert(shopping.buy(0, 0) == ErrorCode::InsufficientFunds);
        assert(shop.items().size() == itemsBefore && shop.coins() == 1);

        // Refund is level times the per-level value.
        assert(shopping.sell(0) == ErrorCode::None);
        assert(shop.coins() == 3);
        assert(r.occupiedCount() == 0);
        assert(r.sold().size() == 1);
        assert(shopping.sell(0) == ErrorCode::EmptySlot);
        assert(shopping.sell(8) == ErrorCode::InvalidPosition);
    }
    {
        // A different pet or a max-level pet blocks the destination.
        const Catalog base = defaultCatalog();
        const Catalog c = antsAnd("Apple");
        Roster r = withShop(cfg);
        assert(r.add(*makePet(base, "Pig", 1, cfg), 0) == ErrorCode::None);
        assert(r.add(*makePet(base, "Ant", 3, cfg), 1) == ErrorCode::None);
        TeamShopping shopping(r, c, cfg);
        assert(shopping.open() == ErrorCode::None);
        assert(r.shop()->items()[0].name == "Ant");
        assert(shopping.buy(0, 0) == ErrorCode::InvalidPosition);
        assert(shopping.buy(0, 1) == ErrorCode::InvalidPosition);
        assert(r.shop()->coins() == 10);
    }
    {
        // Frozen slots survive rolls; unfrozen slots are redrawn.
        const Catalog c = defaultCatalog();
        Roster r = withShop(cfg, 3, 21);
        TeamShopping shopping(r, c, cfg);
        assert(shopping.open() == ErrorCode::None);
        const Shop& shop = *r.shop();
        assert(shop.items().size() == 6);
        assert(shopping.freeze(9) == ErrorCode::InvalidPosition);
        assert(shopping.freeze(1) == ErrorCode::None);
        assert(shop.frozenSlots() == std::set<std::size_t>{1});
        const std::string frozenName = shop.items()[1].name;
        const auto frozenStats = shop.items()[1].pet->stats;
        for (int i = 0; i < 5; ++i) {
            assert(shopping.roll() == ErrorCode::None);
            assert(shop.items()[1].frozen);
            assert(shop.items()[1].name == frozenName);
            assert(shop.items()[1].pet->stats == frozenStats);
        }
        assert(shop.rollCount() == 5);
        assert(shop.coins() == 5);
        assert(shopping.log().count(EventKind::Roll) == 5);
        assert(shopping.unfreeze(1) == ErrorCode::None);
        assert(shopping.roll() == ErrorCode::None);
        assert(!shop.items()[1].frozen);
        assert(shop.frozenSlots().empty());
        // Once unfrozen the slot is redrawn like any other.
        bool replaced = shop.items()[1].name != frozenName;
        while (!replaced && shop.coins() > 0) {
            assert(shopping.roll() == ErrorCode::None);
            replaced = shop.items()[1].name != frozenName;
        }
        assert(replaced);
    }
    {
        // Shop events carry the shop turn, which advances on each open.
        const Catalog c = antsAnd("Apple");
        Roster r = withShop(cfg);
        TeamShopping shopping(r, c, cfg);
        assert(r.shop()->turn() == 0);
        assert(shopping.open() == ErrorCode::None);
        assert(shopping.roll() == ErrorCode::None);
        assert(shopping.roll() == ErrorCode::None);
        assert(shopping.close() == ErrorCode::None);
        assert(shopping.open() == ErrorCode::None);
        assert(r.shop()->turn() == 2);
        assert(r.shop()->rollCount() == 2);
        const auto& entries = shopping.log().entries();
        assert(entries.size() == 5);
        for (std::size_t i = 0; i < 4; ++i) assert(entries[i].event.turn == 1);
        assert(entries[4].event.kind == EventKind::StartTurn && entries[4].event.turn == 2);
        assert(entries[4].event.phase == Phase::Shop);
    }
    {
        const Catalog c = antsAnd("Apple");
        GameConfig poor = cfg;
        poor.economy.startingCoins = 0;
        Roster r = withShop(poor);
        TeamShopping shopping(r, c, poor);
        assert(shopping.open() == ErrorCode::None);
        assert(shopping.roll() == ErrorCode::InsufficientFunds);
        assert(r.shop()->rollCount() == 0);
        assert(shopping.buy(0, 0) == ErrorCode::InsufficientFunds);
    }
    {
        // Eaten food applies at once; holdable food is kept.
        const Catalog c = antsAnd("Apple");
        Roster r = withShop(cfg);
        TeamShopping shopping(r, c, cfg);
        assert(shopping.open() == ErrorCode::None);
        const std::size_t apple = r.shop()->items().size() - 1;
        assert(r.shop()->items()[apple].kind == ShopItemKind::Food);
        assert(shopping.buy(apple, 0) == ErrorCode::EmptySlot);
        assert(shopping.buy(0, 0) == ErrorCode::None);
        assert(shopping.buy(r.shop()->items().size() - 1, 0) == ErrorCode::None);
        assert(r.at(0)->stats.attack() == 3 && r.at(0)->stats.health() == 2);
        assert(!r.at(0)->item);
        assert(shopping.log().count(EventKind::AteFood) == 1);
        assert(shopping.log().count(EventKind::BuyFood) == 1);
    }
    {
        const Catalog c = antsAnd("Honey");
        Roster r = withShop(cfg);
        TeamShopping shopping(r, c, cfg);
        assert(shopping.open() == ErrorCode::None);
        assert(shopping.buy(0, 0) == ErrorCode::None);
        assert(shopping.buy(r.shop()->items().size() - 1, 0) == ErrorCode::None);
        assert(r.at(0)->item && r.at(0)->item->name() == "Honey");
    }
    {
        // Sleeping Pill faints the eater in the shop.
        const Catalog c = antsAnd("Sleeping Pill");
        Roster r = withShop(cfg, 2);
        TeamShopping shopping(r, c, cfg);
        assert(shopping.open() == ErrorCode::None);
        assert(shopping.buy(0, 0) == ErrorCode::None);
        assert(shopping.buy(r.shop()->items().size() - 1, 0) == ErrorCode::None);
        assert(r.occupiedCount() == 0);
        assert(r.fainted().size() == 1);
        assert(shopping.log().count(EventKind::Faint) == 1);
    }
    {
        // Sell triggers: Pig pays out, Duck buffs the shop.
        const Catalog c = defaultCatalog();
        Roster r = withShop(cfg);
        assert(r.add(*makePet(c, "Pig", 1, cfg), 0) == ErrorCode::None);
        assert(r.add(*makePet(c, "Duck", 1, cfg), 1) == ErrorCode::None);
        TeamShopping shopping(r, c, cfg);
        assert(shopping.open() == ErrorCode::None);
        assert(shopping.sell(0) == ErrorCode::None);
        assert(r.shop()->coins() == 12);
        assert(r.at(0)->name() == "Duck");

        std::vector<int> healthBefore;
        for (const auto& item : r.shop()->items()) {
            if (item.pet) healthBefore.push_back(item.pet->stats.health());
        }
        assert(shopping.sell(0) == ErrorCode::None);
        std::size_t i = 0;
        for (const auto& item : r.shop()->items()) {
            if (item.pet) assert(item.pet->stats.health() == healthBefore[i++] + 1);
        }
        assert(r.shop()->coins() == 13);
    }
    {
        // Buying a friend triggers Horse; move reorders explicitly.
        const Catalog c = antsAnd("Apple");
        Catalog withHorse = c;
        withHorse.addPet(*defaultCatalog().findPet("Horse"));
        Roster r = withShop(cfg);
        assert(r.add(*makePet(withHorse, "Horse", 1, cfg), 0) == ErrorCode::None);
        TeamShopping shopping(r, c, cfg);
        assert(shopping.open() == ErrorCode::None);
        assert(shopping.buy(0, 3) == ErrorCode::None);
        // Placed pets close up behind the Horse.
        assert(r.at(1)->name() == "Ant");
        assert(r.at(1)->stats.attack() == 3);
        assert(shopping.move(1, 0) == ErrorCode::None);
        assert(r.at(0)->name() == "Ant");
        assert(shopping.move(4, 0) == ErrorCode::EmptySlot);
    }
    return 0;
}
