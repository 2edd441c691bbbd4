#include "Event.h"

#include <algorithm>
#include <utility>

namespace Arena::Effects {

void EventLog::append(Event event) {
    LogEntry entry;
    entry.event = std::move(event);
    entries_.push_back(std::move(entry));
}

void EventLog::record(ActionRecord action) {
    if (entries_.empty()) {
        return;
    }
    entries_.back().actions.push_back(std::move(action));
}

std::size_t EventLog::count(EventKind kind) const {
    return static_cast<std::size_t>(std::count_if(entries_.begin(), entries_.end(),
                                                  [kind](const LogEntry& e) { return e.event.kind == kind; }));
}

std::string_view toString(EventKind kind) {
    switch (kind) {
        case EventKind::StartOfBattle: return "StartOfBattle";
        case EventKind::StartTurn: return "StartTurn";
        case EventKind::BeforeAttack: return "BeforeAttack";
        case EventKind::Attack: return "Attack";
        case EventKind::Hurt: return "Hurt";
        case EventKind::Faint: return "Faint";
        case EventKind::KnockOut: return "KnockOut";
        case EventKind::Summoned: return "Summoned";
        case EventKind::AfterAttack: return "AfterAttack";
        case EventKind::EndTurn: return "EndTurn";
        case EventKind::EndOfBattle: return "EndOfBattle";
        case EventKind::Levelup: return "Levelup";
        case EventKind::BuyPet: return "BuyPet";
        case EventKind::BuyFood: return "BuyFood";
        case EventKind::AteFood: return "AteFood";
        case EventKind::Sell: return "Sell";
        case EventKind::Roll: return "Roll";
        case EventKind::DamageCalc: return "DamageCalc";
    }
    return "Unknown";
}

std::string_view toString(Side side) { return side == Side::A ? "A" : "B"; }

std::string_view toString(Phase phase) {
    switch (phase) {
        case Phase::StartOfBattle: return "StartOfBattle";
        case Phase::TurnStart: return "TurnStart";
        case Phase::BeforeAttack: return "BeforeAttack";
        case Phase::Attack: return "Attack";
        case Phase::Cleanup: return "Cleanup";
        case Phase::AfterAttack: return "AfterAttack";
        case Phase::EndOfTurn: return "EndOfTurn";
        case Phase::EndOfBattle: return "EndOfBattle";
        case Phase::Shop: return "Shop";
    }
    return "Unknown";
}

std::optional<EventKind> parseEventKey(const std::string& k) {
    static const std::pair<const char*, EventKind> kKeys[] = {
        {"StartOfBattle", EventKind::StartOfBattle}, {"StartTurn", EventKind::StartTurn},
        {"BeforeAttack", EventKind::BeforeAttack},   {"Attack", EventKind::Attack},
        {"Hurt", EventKind::Hurt},                   {"Faint", EventKind::Faint},
        {"KnockOut", EventKind::KnockOut},           {"Summoned", EventKind::Summoned},
        {"AfterAttack", EventKind::AfterAttack},     {"EndTurn", EventKind::EndTurn},
        {"EndOfBattle", EventKind::EndOfBattle},     {"Levelup", EventKind::Levelup},
        {"BuyPet", EventKind::BuyPet},               {"BuyFood", EventKind::BuyFood},
        {"AteFood", EventKind::AteFood},             {"Sell", EventKind::Sell},
        {"Roll", EventKind::Roll},                   {"DamageCalc", EventKind::DamageCalc},
    };
    for (const auto& [key, kind] : kKeys) {
        if (k == key) return kind;
    }
    return std::nullopt;
}

}  // namespace Arena::Effects
