#include "EventEngine.h"

#include <algorithm>
#include <string>
#include <tuple>

#include "../../engine/core/Logger.h"
#include "ActionExecutor.h"

namespace Arena::Game {

using namespace Arena::Effects;

EventEngine::EventEngine(EngineContext& ctx, FaintLedger& fainted) : ctx_(ctx), fainted_(fainted) {}

void EventEngine::enqueue(Event event) {
    event.turn = ctx_.turn;
    event.phase = ctx_.phase;
    queue_.push_back(std::move(event));
}

bool EventEngine::countEvent() {
    ++processed_;
    if (processed_ <= static_cast<std::size_t>(ctx_.config->cascadeLimit)) {
        return true;
    }
    logError("Cascade limit of " + std::to_string(ctx_.config->cascadeLimit) + " events exceeded in phase " +
             std::string(toString(ctx_.phase)) + " (turn " + std::to_string(ctx_.turn) + ").");
    queue_.clear();
    error_ = ErrorCode::CascadeLimitExceeded;
    return false;
}

ErrorCode EventEngine::drain() {
    while (!queue_.empty() && error_ == ErrorCode::None) {
        Event event = std::move(queue_.front());
        queue_.pop_front();
        if (!countEvent()) break;
        if (ctx_.log) ctx_.log->append(event);
        const auto matches = collect(event);
        for (const auto& m : matches) {
            run(event, m);
            if (error_ != ErrorCode::None) break;
        }
    }
    return error_;
}

ErrorCode EventEngine::dispatchWithEffect(Event cause, const PetRef& owner, const Effect& effect) {
    cause.turn = ctx_.turn;
    cause.phase = ctx_.phase;
    if (!countEvent()) return error_;
    if (ctx_.log) ctx_.log->append(cause);
    for (auto& e : executeAction(ctx_, cause, owner, effect)) enqueue(std::move(e));
    if (canProduceFaint(effect.action)) scanFaints(owner);
    // Pets subscribed to the meal itself react after the food.
    for (const auto& m : collect(cause)) {
        run(cause, m);
        if (error_ != ErrorCode::None) return error_;
    }
    return drain();
}

void EventEngine::markFaint(const PetRef& pet, const std::optional<PetRef>& source) {
    const Pet* p = ctx_.find(pet);
    if (!p || p->alive()) return;
    if (!fainted_.insert({sideIndex(pet.side), pet.id}).second) return;
    Event faint{};
    faint.kind = EventKind::Faint;
    faint.side = pet.side;
    faint.afflicted = PetRef{pet.side, p->position, p->id};
    faint.source = source;
    enqueue(std::move(faint));
}

void EventEngine::scanFaints(const std::optional<PetRef>& source) {
    for (Side side : {Side::A, Side::B}) {
        Roster* r = ctx_.roster(side);
        if (!r) continue;
        for (const auto& slot : r->slots()) {
            if (slot && !slot->alive()) markFaint(ctx_.refTo(side, *slot), source);
        }
    }
}

std::optional<PetId> EventEngine::nearestAhead(Side side, int position) const {
    Roster* r = ctx_.roster(side);
    if (!r) return std::nullopt;
    for (int i = position - 1; i >= 0; --i) {
        if (const Pet* p = r->at(i)) return p->id;
    }
    return std::nullopt;
}

bool EventEngine::responds(const Event& event, Side side, const Pet& pet, const Trigger& trigger,
                           bool inSlots) const {
    if (trigger.kind != event.kind || event.kind == EventKind::DamageCalc) return false;
    const auto& afflicted = event.afflicted;
    const bool isAfflicted = afflicted && afflicted->side == side && afflicted->id == pet.id;

    // Fainted pets answer only their own faint; sold pets only their own sale.
    if (!inSlots || !pet.alive()) {
        return trigger.scope == TriggerScope::Self && isAfflicted &&
               (event.kind == EventKind::Faint || event.kind == EventKind::Sell);
    }

    switch (trigger.scope) {
        case TriggerScope::Self:
            return isAfflicted;
        case TriggerScope::Friend:
            return afflicted && afflicted->side == side && afflicted->id != pet.id;
        case TriggerScope::Ahead: {
            if (!afflicted || afflicted->side != side) return false;
            const auto ahead = nearestAhead(side, pet.position);
            return ahead && *ahead == afflicted->id;
        }
        case TriggerScope::Enemy:
            return afflicted && afflicted->side != side;
        case TriggerScope::Team:
            return event.side == side;
        case TriggerScope::Any:
            return true;
    }
    return false;
}

void EventEngine::collectFrom(const Event& event, Side side, const Pet& pet, bool inSlots, int rank, int position,
                              std::vector<Match>& out) const {
    const PetRef owner{side, pet.position, pet.id};
    for (std::size_t i = 0; i < pet.effects.size(); ++i) {
        const auto& eff = pet.effects[i];
        if (eff.exhausted() || !responds(event, side, pet, eff.trigger, inSlots)) continue;
        out.push_back(Match{owner, false, i, eff, rank, position});
    }
    // Held item resolves after the pet's own effects.
    if (pet.item && pet.item->effect && !pet.item->effect->exhausted() &&
        responds(event, side, pet, pet.item->effect->trigger, inSlots)) {
        out.push_back(Match{owner, true, 0, *pet.item->effect, rank, position});
    }
}

std::vector<EventEngine::Match> EventEngine::collect(const Event& event) const {
    std::vector<Match> out;
    const Side sides[2] = {event.side, opposite(event.side)};
    for (int rank = 0; rank < 2; ++rank) {
        const Side side = sides[rank];
        Roster* r = ctx_.roster(side);
        if (!r) continue;
        for (const auto& slot : r->slots()) {
            if (slot) collectFrom(event, side, *slot, true, rank, slot->position, out);
        }
        // A pet already moved out of its slot still answers its own faint or sale.
        const bool retiredKind = event.kind == EventKind::Faint || event.kind == EventKind::Sell;
        if (retiredKind && event.afflicted && event.afflicted->side == side && !r->locate(event.afflicted->id)) {
            if (const Pet* p = r->findById(event.afflicted->id)) {
                collectFrom(event, side, *p, false, rank, event.afflicted->position, out);
            }
        }
    }
    // Side first, then slot; rosters may differ in capacity.
    std::stable_sort(out.begin(), out.end(), [](const Match& a, const Match& b) {
        return std::tie(a.rank, a.position) < std::tie(b.rank, b.position);
    });
    return out;
}

void EventEngine::run(const Event& cause, const Match& match) {
    Pet* pet = ctx_.find(match.owner);
    if (!pet) return;

    // Spend the use on the live effect; skip if it ran dry or was replaced since matching.
    Effect* live = nullptr;
    if (match.fromItem) {
        if (pet->item && pet->item->effect) live = &*pet->item->effect;
    } else if (match.index < pet->effects.size()) {
        live = &pet->effects[match.index];
    }
    if (!live || live->exhausted() || live->trigger.kind != match.effect.trigger.kind) return;
    if (live->uses) --*live->uses;

    const PetRef owner{match.owner.side, pet->position, pet->id};
    for (auto& e : executeAction(ctx_, cause, owner, match.effect)) enqueue(std::move(e));
    if (canProduceFaint(match.effect.action)) scanFaints(owner);
}

void EventEngine::cleanup(bool retireFainted) {
    for (Roster* r : ctx_.rosters) {
        if (!r) continue;
        for (int i = 0; i < static_cast<int>(r->capacity()); ++i) {
            Pet* pet = r->at(i);
            if (!pet) continue;
            pet->effects.erase(std::remove_if(pet->effects.begin(), pet->effects.end(),
                                              [](const Effect& e) { return e.exhausted() || e.temporary; }),
                               pet->effects.end());
            if (pet->item && pet->item->consumed()) pet->item.reset();
        }
        if (retireFainted) r->retireFainted();
    }
}

}  // namespace Arena::Game
