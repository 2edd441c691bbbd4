#include "Shop.h"

#include <algorithm>

#include "../../engine/core/Logger.h"

namespace Arena::Game {

int petSlotsForTier(int tier) {
    if (tier < 3) return 3;
    if (tier < 5) return 4;
    return 5;
}

int foodSlotsForTier(int tier) { return tier < 2 ? 1 : 2; }

Shop::Shop(int tier, std::optional<std::uint64_t> seed, const GameConfig& config)
    : tier_(tier), rng_(seed), config_(config) {}

Result<Shop> Shop::create(int tier, std::optional<std::uint64_t> seed, const GameConfig& config) {
    if (tier < kMinShopTier || tier > kMaxShopTier) {
        return Result<Shop>::failure(ErrorCode::InvalidTier);
    }
    return Result<Shop>::success(Shop(tier, seed, config));
}

ErrorCode Shop::setTier(int tier) {
    if (tier < kMinShopTier || tier > kMaxShopTier) return ErrorCode::InvalidTier;
    tier_ = tier;
    return ErrorCode::None;
}

std::set<std::size_t> Shop::frozenSlots() const {
    std::set<std::size_t> out;
    for (std::size_t i = 0; i < items_.size(); ++i) {
        if (items_[i].frozen) out.insert(i);
    }
    return out;
}

ErrorCode Shop::open(const EntityProvider& provider) {
    if (state_ == ShopState::Open) return ErrorCode::InvalidShopState;
    state_ = ShopState::Open;
    ++turn_;
    coins_ = config_.economy.startingCoins;
    restock(provider);
    return ErrorCode::None;
}

ErrorCode Shop::close() {
    if (state_ == ShopState::Closed) return ErrorCode::InvalidShopState;
    state_ = ShopState::Closed;
    return ErrorCode::None;
}

ErrorCode Shop::roll(const EntityProvider& provider) {
    if (state_ != ShopState::Open) return ErrorCode::InvalidShopState;
    if (coins_ < config_.economy.rollCost) return ErrorCode::InsufficientFunds;
    coins_ -= config_.economy.rollCost;
    restock(provider);
    ++rollCount_;
    return ErrorCode::None;
}

ErrorCode Shop::setFrozen(std::size_t slot, bool frozen) {
    if (state_ != ShopState::Open) return ErrorCode::InvalidShopState;
    if (slot >= items_.size()) return ErrorCode::InvalidPosition;
    items_[slot].frozen = frozen;
    return ErrorCode::None;
}

ErrorCode Shop::freeze(std::size_t slot) { return setFrozen(slot, true); }

ErrorCode Shop::unfreeze(std::size_t slot) { return setFrozen(slot, false); }

ShopItem Shop::take(std::size_t slot) {
    ShopItem item = std::move(items_[slot]);
    items_.erase(items_.begin() + static_cast<std::ptrdiff_t>(slot));
    return item;
}

bool Shop::spend(int amount) {
    if (amount > coins_) return false;
    coins_ -= amount;
    return true;
}

void Shop::gainCoins(int amount) { coins_ = std::max(0, coins_ + amount); }

void Shop::buffPets(int attack, int health) {
    for (auto& item : items_) {
        if (item.pet) item.pet->stats.add(attack, health);
    }
}

void Shop::addBonusPet(const EntityProvider& provider, int tier) {
    const auto pool = provider.petNamesAtTier(std::min(tier, kMaxShopTier), config_.pack);
    auto item = drawPet(provider, pool);
    if (!item) return;
    // Bonus pets sit after the regular pet slots, before foods.
    auto firstFood = std::find_if(items_.begin(), items_.end(),
                                  [](const ShopItem& i) { return i.kind == ShopItemKind::Food; });
    items_.insert(firstFood, std::move(*item));
}

std::optional<ShopItem> Shop::drawPet(const EntityProvider& provider, const std::vector<std::string>& pool) {
    if (pool.empty()) return std::nullopt;
    const auto& name = pool[rng_.index(pool.size())];
    auto pet = makePet(provider, name, 1, config_);
    if (!pet) {
        logWarn("Shop pool names unknown pet " + name);
        return std::nullopt;
    }
    ShopItem item{};
    item.kind = ShopItemKind::Pet;
    item.name = name;
    item.cost = pet->definition->cost;
    item.pet = std::move(*pet);
    return item;
}

std::optional<ShopItem> Shop::drawFood(const EntityProvider& provider, const std::vector<std::string>& pool) {
    if (pool.empty()) return std::nullopt;
    const auto& name = pool[rng_.index(pool.size())];
    auto food = makeFood(provider, name);
    if (!food) {
        logWarn("Shop pool names unknown food " + name);
        return std::nullopt;
    }
    ShopItem item{};
    item.kind = ShopItemKind::Food;
    item.name = name;
    item.cost = food->definition->cost;
    item.food = std::move(*food);
    return item;
}

void Shop::restock(const EntityProvider& provider) {
    std::vector<ShopItem> oldPets;
    std::vector<ShopItem> oldFoods;
    for (auto& item : items_) {
        (item.kind == ShopItemKind::Pet ? oldPets : oldFoods).push_back(std::move(item));
    }

    const auto petPool = provider.petNames(tier_, config_.pack);
    const auto foodPool = provider.foodNames(tier_, config_.pack);

    // Frozen items keep their index; everything else in range is redrawn.
    auto refill = [&](std::vector<ShopItem>& old, std::size_t slots, bool pets) {
        std::vector<ShopItem> out;
        const std::size_t n = std::max(old.size(), slots);
        for (std::size_t i = 0; i < n; ++i) {
            if (i < old.size() && old[i].frozen) {
                out.push_back(std::move(old[i]));
            } else if (i < slots) {
                auto drawn = pets ? drawPet(provider, petPool) : drawFood(provider, foodPool);
                if (drawn) out.push_back(std::move(*drawn));
            }
        }
        return out;
    };

    auto pets = refill(oldPets, static_cast<std::size_t>(petSlotsForTier(tier_)), true);
    auto foods = refill(oldFoods, static_cast<std::size_t>(foodSlotsForTier(tier_)), false);
    items_ = std::move(pets);
    for (auto& f : foods) items_.push_back(std::move(f));
}

}  // namespace Arena::Game
