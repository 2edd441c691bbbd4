// Tier-scoped shop inventory with its own random stream.
#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "../../engine/core/Error.h"
#include "../../engine/core/Random.h"
#include "../config/GameConfig.h"
#include "../content/EntityProvider.h"
#include "../team/Pet.h"

namespace Arena::Game {

constexpr int kMinShopTier = 1;
constexpr int kMaxShopTier = 6;

enum class ShopState { Closed, Open };
enum class ShopItemKind { Pet, Food };

struct ShopItem {
    ShopItemKind kind{ShopItemKind::Pet};
    std::string name;
    int cost{3};
    bool frozen{false};
    std::optional<Pet> pet;
    std::optional<Item> food;
};

int petSlotsForTier(int tier);
int foodSlotsForTier(int tier);

class Shop {
public:
    // InvalidTier outside 1..6.
    static Result<Shop> create(int tier, std::optional<std::uint64_t> seed, const GameConfig& config);

    int tier() const { return tier_; }
    ErrorCode setTier(int tier);
    ShopState state() const { return state_; }
    bool isOpen() const { return state_ == ShopState::Open; }
    int coins() const { return coins_; }
    int rollCount() const { return rollCount_; }
    // Number of times the shop has been opened.
    int turn() const { return turn_; }
    const std::vector<ShopItem>& items() const { return items_; }
    std::set<std::size_t> frozenSlots() const;
    RandomStream& rng() { return rng_; }
    void reseed(std::optional<std::uint64_t> seed) { rng_.reseed(seed); }

    // Starts a new shop turn: resets coins and restocks non-frozen slots.
    ErrorCode open(const EntityProvider& provider);
    ErrorCode close();
    ErrorCode roll(const EntityProvider& provider);
    ErrorCode freeze(std::size_t slot);
    ErrorCode unfreeze(std::size_t slot);

    // Removes the item at slot; the caller has validated the index.
    ShopItem take(std::size_t slot);
    bool spend(int amount);
    void gainCoins(int amount);
    void buffPets(int attack, int health);
    // Offers a random pet of the given tier; used when a bought pet levels up.
    void addBonusPet(const EntityProvider& provider, int tier);

private:
    Shop(int tier, std::optional<std::uint64_t> seed, const GameConfig& config);

    void restock(const EntityProvider& provider);
    std::optional<ShopItem> drawPet(const EntityProvider& provider, const std::vector<std::string>& pool);
    std::optional<ShopItem> drawFood(const EntityProvider& provider, const std::vector<std::string>& pool);
    ErrorCode setFrozen(std::size_t slot, bool frozen);

    int tier_{1};
    ShopState state_{ShopState::Closed};
    int coins_{0};
    int rollCount_{0};
    int turn_{0};
    std::vector<ShopItem> items_;
    RandomStream rng_;
    GameConfig config_{};
};

}  // namespace Arena::Game
