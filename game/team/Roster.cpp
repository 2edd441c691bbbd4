#include "Roster.h"

#include <algorithm>

namespace Arena::Game {

Roster::Roster(std::size_t capacity, std::optional<std::uint64_t> seed) : slots_(capacity), rng_(seed) {}

Result<Roster> Roster::fromSlots(std::vector<std::optional<Pet>> slots, std::size_t capacity,
                                 std::optional<std::uint64_t> seed) {
    if (slots.size() > capacity) {
        return Result<Roster>::failure(ErrorCode::RosterTooLarge);
    }
    Roster roster(capacity, seed);
    for (std::size_t i = 0; i < slots.size(); ++i) {
        if (!slots[i]) continue;
        slots[i]->id = roster.nextId_++;
        roster.slots_[i] = std::move(slots[i]);
    }
    roster.compact();
    return Result<Roster>::success(std::move(roster));
}

Pet* Roster::at(int position) {
    if (position < 0 || position >= static_cast<int>(slots_.size())) return nullptr;
    auto& slot = slots_[static_cast<std::size_t>(position)];
    return slot ? &*slot : nullptr;
}

const Pet* Roster::at(int position) const {
    return const_cast<Roster*>(this)->at(position);
}

Pet* Roster::front() {
    for (auto& slot : slots_) {
        if (slot && slot->alive()) return &*slot;
    }
    return nullptr;
}

const Pet* Roster::front() const { return const_cast<Roster*>(this)->front(); }

int Roster::livingCount() const {
    return static_cast<int>(
        std::count_if(slots_.begin(), slots_.end(), [](const std::optional<Pet>& s) { return s && s->alive(); }));
}

int Roster::occupiedCount() const {
    return static_cast<int>(
        std::count_if(slots_.begin(), slots_.end(), [](const std::optional<Pet>& s) { return s.has_value(); }));
}

std::optional<int> Roster::placeAt(Pet pet, int position) {
    const int cap = static_cast<int>(slots_.size());
    if (cap == 0) return std::nullopt;
    position = std::clamp(position, 0, cap - 1);

    auto freeAt = [&](int i) {
        const auto& s = slots_[static_cast<std::size_t>(i)];
        return !s || !s->alive();
    };

    // Prefer the nearest free slot at or behind the target, then the nearest one ahead of it.
    int free = -1;
    for (int i = position; i < cap && free < 0; ++i) {
        if (freeAt(i)) free = i;
    }
    for (int i = position - 1; i >= 0 && free < 0; --i) {
        if (freeAt(i)) free = i;
    }
    if (free < 0) return std::nullopt;

    auto& vacated = slots_[static_cast<std::size_t>(free)];
    if (vacated) {
        fainted_.push_back(std::move(*vacated));
    }
    slots_.erase(slots_.begin() + free);
    const int insertAt = free < position ? position - 1 : position;
    pet.id = nextId_++;
    slots_.insert(slots_.begin() + insertAt, std::optional<Pet>(std::move(pet)));
    syncPositions();
    return insertAt;
}

ErrorCode Roster::add(Pet pet, int position) {
    if (position < 0 || position >= static_cast<int>(slots_.size())) return ErrorCode::InvalidPosition;
    if (full()) return ErrorCode::RosterTooLarge;
    return placeAt(std::move(pet), position) ? ErrorCode::None : ErrorCode::RosterTooLarge;
}

std::optional<int> Roster::summon(Pet pet, int position) { return placeAt(std::move(pet), position); }

std::optional<Pet> Roster::remove(int position) {
    if (!at(position)) return std::nullopt;
    auto& slot = slots_[static_cast<std::size_t>(position)];
    std::optional<Pet> out = std::move(slot);
    slot.reset();
    out->position = -1;
    return out;
}

ErrorCode Roster::retireSold(int position) {
    if (position < 0 || position >= static_cast<int>(slots_.size())) return ErrorCode::InvalidPosition;
    auto pet = remove(position);
    if (!pet) return ErrorCode::EmptySlot;
    pet->position = position;
    sold_.push_back(std::move(*pet));
    return ErrorCode::None;
}

ErrorCode Roster::move(int from, int to) {
    const int cap = static_cast<int>(slots_.size());
    if (from < 0 || from >= cap || to < 0 || to >= cap) return ErrorCode::InvalidPosition;
    if (!at(from)) return ErrorCode::EmptySlot;
    auto moving = std::move(slots_[static_cast<std::size_t>(from)]);
    slots_.erase(slots_.begin() + from);
    slots_.insert(slots_.begin() + to, std::move(moving));
    syncPositions();
    return ErrorCode::None;
}

void Roster::retireFainted() {
    for (auto& slot : slots_) {
        if (slot && !slot->alive()) {
            fainted_.push_back(std::move(*slot));
            slot.reset();
        }
    }
    compact();
}

void Roster::compact() {
    std::stable_partition(slots_.begin(), slots_.end(), [](const std::optional<Pet>& s) { return s.has_value(); });
    syncPositions();
}

void Roster::syncPositions() {
    for (std::size_t i = 0; i < slots_.size(); ++i) {
        if (slots_[i]) slots_[i]->position = static_cast<int>(i);
    }
}

std::optional<int> Roster::locate(Effects::PetId id) const {
    for (std::size_t i = 0; i < slots_.size(); ++i) {
        if (slots_[i] && slots_[i]->id == id) return static_cast<int>(i);
    }
    return std::nullopt;
}

Pet* Roster::findById(Effects::PetId id) {
    if (auto pos = locate(id)) return at(*pos);
    for (auto& p : fainted_) {
        if (p.id == id) return &p;
    }
    for (auto& p : sold_) {
        if (p.id == id) return &p;
    }
    return nullptr;
}

const Pet* Roster::findById(Effects::PetId id) const { return const_cast<Roster*>(this)->findById(id); }

}  // namespace Arena::Game
