// Ordered pet slots for one side, with fainted/sold history and an optional shop.
#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "../../engine/core/Error.h"
#include "../../engine/core/Random.h"
#include "../shop/Shop.h"
#include "Pet.h"

namespace Arena::Game {

constexpr std::size_t kDefaultRosterCapacity = 5;

class Roster {
public:
    explicit Roster(std::size_t capacity = kDefaultRosterCapacity, std::optional<std::uint64_t> seed = std::nullopt);

    // nullopt entries are empty slots; RosterTooLarge when more slots than capacity are given.
    static Result<Roster> fromSlots(std::vector<std::optional<Pet>> slots,
                                    std::size_t capacity = kDefaultRosterCapacity,
                                    std::optional<std::uint64_t> seed = std::nullopt);

    std::size_t capacity() const { return slots_.size(); }
    const std::vector<std::optional<Pet>>& slots() const { return slots_; }
    const std::vector<Pet>& fainted() const { return fainted_; }
    const std::vector<Pet>& sold() const { return sold_; }

    Pet* at(int position);
    const Pet* at(int position) const;
    // First living pet.
    Pet* front();
    const Pet* front() const;
    int livingCount() const;
    int occupiedCount() const;
    bool full() const { return occupiedCount() >= static_cast<int>(capacity()); }

    // Places a pet at position, shifting occupants back; InvalidPosition or RosterTooLarge on failure.
    ErrorCode add(Pet pet, int position);
    // Battle placement: replaces a fainted occupant or shifts living pets; nullopt when no room.
    std::optional<int> summon(Pet pet, int position);
    std::optional<Pet> remove(int position);
    // Removes the pet at position into the sold history.
    ErrorCode retireSold(int position);
    ErrorCode move(int from, int to);
    // Moves fainted pets out of their slots, then compacts.
    void retireFainted();
    // Living and fainted-but-unretired pets shift to a contiguous prefix.
    void compact();

    std::optional<int> locate(Effects::PetId id) const;
    // Searches slots, then fainted history, then sold history.
    Pet* findById(Effects::PetId id);
    const Pet* findById(Effects::PetId id) const;

    RandomStream& rng() { return rng_; }
    void reseed(std::optional<std::uint64_t> seed) { rng_.reseed(seed); }

    std::optional<Shop>& shop() { return shop_; }
    const std::optional<Shop>& shop() const { return shop_; }
    void attachShop(Shop shop) { shop_ = std::move(shop); }

private:
    std::optional<int> placeAt(Pet pet, int position);
    void syncPositions();

    std::vector<std::optional<Pet>> slots_;
    std::vector<Pet> fainted_;
    std::vector<Pet> sold_;
    RandomStream rng_;
    std::optional<Shop> shop_;
    Effects::PetId nextId_{1};
};

}  // namespace Arena::Game
