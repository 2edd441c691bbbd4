// Events dispatched by the effect engine and the log that records them.
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "PetId.h"

namespace Arena::Effects {

enum class EventKind {
    StartOfBattle,
    StartTurn,
    BeforeAttack,
    Attack,
    Hurt,
    Faint,
    KnockOut,
    Summoned,
    AfterAttack,
    EndTurn,
    EndOfBattle,
    Levelup,
    BuyPet,
    BuyFood,
    AteFood,
    Sell,
    Roll,
    DamageCalc  // consulted by the attack resolver, never queued
};

enum class Side { A, B };

inline Side opposite(Side s) { return s == Side::A ? Side::B : Side::A; }
inline int sideIndex(Side s) { return s == Side::A ? 0 : 1; }

enum class Phase {
    StartOfBattle,
    TurnStart,
    BeforeAttack,
    Attack,
    Cleanup,
    AfterAttack,
    EndOfTurn,
    EndOfBattle,
    Shop
};

// Non-owning reference to a pet: side plus id, with the slot it held when the reference was taken.
struct PetRef {
    Side side{Side::A};
    int position{0};
    PetId id{kInvalidPet};

    bool sameAs(const PetRef& o) const { return side == o.side && id == o.id; }
};

struct Event {
    EventKind kind{EventKind::StartTurn};
    int turn{0};
    Phase phase{Phase::Shop};
    Side side{Side::A};  // side whose effects resolve first
    std::optional<PetRef> source;
    std::optional<PetRef> afflicted;
    int amount{0};
    std::string detail;
};

struct ActionRecord {
    PetRef owner;
    std::string action;
    std::optional<PetRef> target;
    int attack{0};  // target stats after the action
    int health{0};
    int amount{0};
};

struct LogEntry {
    Event event;
    std::vector<ActionRecord> actions;
};

// Append-only record of a battle or shop session.
class EventLog {
public:
    void append(Event event);
    // Attaches to the most recent event; ignored when the log is empty.
    void record(ActionRecord action);
    void clear() { entries_.clear(); }

    const std::vector<LogEntry>& entries() const { return entries_; }
    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    std::size_t count(EventKind kind) const;

    std::vector<LogEntry>::const_iterator begin() const { return entries_.begin(); }
    std::vector<LogEntry>::const_iterator end() const { return entries_.end(); }

private:
    std::vector<LogEntry> entries_;
};

std::string_view toString(EventKind kind);
std::string_view toString(Side side);
std::string_view toString(Phase phase);
std::optional<EventKind> parseEventKey(const std::string& k);

}  // namespace Arena::Effects
