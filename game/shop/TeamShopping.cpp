#include "TeamShopping.h"

#include <algorithm>
#include <string>

#include "../../engine/core/Logger.h"

namespace Arena::Game {

using namespace Arena::Effects;

namespace {
Event shopEvent(EventKind kind, std::optional<PetRef> afflicted = std::nullopt, int amount = 0) {
    Event e{};
    e.kind = kind;
    e.side = Side::A;
    e.afflicted = afflicted;
    e.amount = amount;
    return e;
}
}  // namespace

int mergePets(Pet& target, const Pet& donor, const EconomyRules& rules) {
    target.stats.set(std::max(target.stats.attack(), donor.stats.attack()),
                     std::max(target.stats.health(), donor.stats.health()));
    return target.addExperience(donor.experience + 1, rules);
}

TeamShopping::TeamShopping(Roster& roster, const EntityProvider& provider, const GameConfig& config)
    : roster_(roster), provider_(provider), config_(config) {}

EngineContext TeamShopping::context() {
    EngineContext ctx{};
    ctx.rosters = {&roster_, nullptr};
    ctx.shop = roster_.shop() ? &*roster_.shop() : nullptr;
    ctx.provider = &provider_;
    ctx.config = &config_;
    ctx.log = &log_;
    ctx.phase = Phase::Shop;
    ctx.turn = ctx.shop ? ctx.shop->turn() : 0;
    return ctx;
}

Shop* TeamShopping::openShop() {
    auto& shop = roster_.shop();
    return shop && shop->isOpen() ? &*shop : nullptr;
}

ErrorCode TeamShopping::finishOperation(EventEngine& engine) {
    const ErrorCode err = engine.drain();
    engine.cleanup(true);
    if (err != ErrorCode::None) {
        logError("Shop cascade aborted: " + std::string(toString(err)));
    }
    return err;
}

ErrorCode TeamShopping::open() {
    auto& shop = roster_.shop();
    if (!shop) return ErrorCode::InvalidShopState;
    if (const ErrorCode err = shop->open(provider_); err != ErrorCode::None) return err;
    EngineContext ctx = context();
    EventEngine engine(ctx, fainted_);
    engine.enqueue(shopEvent(EventKind::StartTurn));
    return finishOperation(engine);
}

ErrorCode TeamShopping::close() {
    auto& shop = roster_.shop();
    if (!shop) return ErrorCode::InvalidShopState;
    if (!shop->isOpen()) return ErrorCode::InvalidShopState;
    // End-of-turn effects still see the open shop.
    EngineContext ctx = context();
    EventEngine engine(ctx, fainted_);
    engine.enqueue(shopEvent(EventKind::EndTurn));
    const ErrorCode err = finishOperation(engine);
    const ErrorCode closed = shop->close();
    return err != ErrorCode::None ? err : closed;
}

ErrorCode TeamShopping::roll() {
    auto& shop = roster_.shop();
    if (!shop) return ErrorCode::InvalidShopState;
    if (const ErrorCode err = shop->roll(provider_); err != ErrorCode::None) return err;
    EngineContext ctx = context();
    EventEngine engine(ctx, fainted_);
    engine.enqueue(shopEvent(EventKind::Roll));
    return finishOperation(engine);
}

ErrorCode TeamShopping::freeze(std::size_t slot) {
    auto& shop = roster_.shop();
    return shop ? shop->freeze(slot) : ErrorCode::InvalidShopState;
}

ErrorCode TeamShopping::unfreeze(std::size_t slot) {
    auto& shop = roster_.shop();
    return shop ? shop->unfreeze(slot) : ErrorCode::InvalidShopState;
}

ErrorCode TeamShopping::buy(std::size_t slot, int destination) {
    Shop* shop = openShop();
    if (!shop) return ErrorCode::InvalidShopState;
    if (slot >= shop->items().size()) return ErrorCode::InvalidPosition;
    if (shop->items()[slot].cost > shop->coins()) return ErrorCode::InsufficientFunds;
    if (destination < 0 || destination >= static_cast<int>(roster_.capacity())) return ErrorCode::InvalidPosition;
    return shop->items()[slot].kind == ShopItemKind::Pet ? buyPet(*shop, slot, destination)
                                                         : buyFood(*shop, slot, destination);
}

ErrorCode TeamShopping::buyPet(Shop& shop, std::size_t slot, int destination) {
    const ShopItem& offer = shop.items()[slot];
    Pet* occupant = roster_.at(destination);
    if (occupant && (occupant->name() != offer.name || occupant->level >= config_.economy.maxLevel)) {
        return ErrorCode::InvalidPosition;
    }

    if (!shop.spend(offer.cost)) return ErrorCode::InsufficientFunds;
    ShopItem bought = shop.take(slot);
    EngineContext ctx = context();
    EventEngine engine(ctx, fainted_);

    if (occupant) {
        const int levels = mergePets(*occupant, *bought.pet, config_.economy);
        const PetRef ref = ctx.refTo(Side::A, *occupant);
        engine.enqueue(shopEvent(EventKind::BuyPet, ref));
        if (levels > 0) {
            engine.enqueue(shopEvent(EventKind::Levelup, ref, levels));
            if (config_.economy.levelUpBonusPet) {
                shop.addBonusPet(provider_, shop.tier() + 1);
            }
        }
        return finishOperation(engine);
    }

    const ErrorCode placed = roster_.add(std::move(*bought.pet), destination);
    if (placed != ErrorCode::None) {
        // Unreachable after validation; the slot was empty.
        logError("Bought pet could not be placed: " + std::string(toString(placed)));
        return placed;
    }
    const PetId id = roster_.at(destination)->id;
    roster_.compact();
    const Pet* pet = roster_.findById(id);
    const PetRef ref = ctx.refTo(Side::A, *pet);
    engine.enqueue(shopEvent(EventKind::BuyPet, ref));
    engine.enqueue(shopEvent(EventKind::Summoned, ref));
    return finishOperation(engine);
}

ErrorCode TeamShopping::buyFood(Shop& shop, std::size_t slot, int destination) {
    Pet* target = roster_.at(destination);
    if (!target || !target->alive()) return ErrorCode::EmptySlot;

    if (!shop.spend(shop.items()[slot].cost)) return ErrorCode::InsufficientFunds;
    ShopItem bought = shop.take(slot);
    EngineContext ctx = context();
    EventEngine engine(ctx, fainted_);
    const PetRef ref = ctx.refTo(Side::A, *target);
    Item food = std::move(*bought.food);

    if (food.holdable) {
        target->item = std::move(food);
    } else if (food.effect) {
        Event ate = shopEvent(EventKind::AteFood, ref);
        ate.detail = food.name();
        const ErrorCode err = engine.dispatchWithEffect(std::move(ate), ref, *food.effect);
        if (err != ErrorCode::None) {
            engine.cleanup(true);
            return err;
        }
    }
    engine.enqueue(shopEvent(EventKind::BuyFood, ref));
    return finishOperation(engine);
}

ErrorCode TeamShopping::sell(int position) {
    Shop* shop = openShop();
    if (!shop) return ErrorCode::InvalidShopState;
    if (position < 0 || position >= static_cast<int>(roster_.capacity())) return ErrorCode::InvalidPosition;
    const Pet* pet = roster_.at(position);
    if (!pet) return ErrorCode::EmptySlot;

    const int refund = pet->level * config_.economy.sellValuePerLevel;
    const PetRef ref{Side::A, position, pet->id};
    if (const ErrorCode err = roster_.retireSold(position); err != ErrorCode::None) return err;
    shop->gainCoins(refund);
    roster_.compact();

    EngineContext ctx = context();
    EventEngine engine(ctx, fainted_);
    engine.enqueue(shopEvent(EventKind::Sell, ref, refund));
    return finishOperation(engine);
}

ErrorCode TeamShopping::move(int from, int to) {
    if (!openShop()) return ErrorCode::InvalidShopState;
    const ErrorCode err = roster_.move(from, to);
    if (err == ErrorCode::None) roster_.compact();
    return err;
}

}  // namespace Arena::Game
