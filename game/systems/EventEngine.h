// Breadth-first trigger queue: matches events to effects, runs them, queues what they cause.
#pragma once

#include <cstddef>
#include <deque>
#include <optional>
#include <vector>

#include "../../engine/core/Error.h"
#include "../../engine/effects/EffectTypes.h"
#include "EngineContext.h"

namespace Arena::Game {

class EventEngine {
public:
    EventEngine(EngineContext& ctx, FaintLedger& fainted);

    // Stamps turn and phase from the context.
    void enqueue(Effects::Event event);
    // Processes the queue to exhaustion; CascadeLimitExceeded aborts and clears it.
    ErrorCode drain();
    // Logs cause and runs a single effect for owner directly (eaten food), then drains.
    ErrorCode dispatchWithEffect(Effects::Event cause, const Effects::PetRef& owner, const Effects::Effect& effect);

    // Queues a Faint for every pet at zero health not yet in the ledger.
    void scanFaints(const std::optional<Effects::PetRef>& source);
    // Queues a Faint for one pet if it is down and not yet in the ledger.
    void markFaint(const Effects::PetRef& pet, const std::optional<Effects::PetRef>& source);

    // Prunes spent and temporary effects, drops consumed items and optionally retires fainted pets.
    void cleanup(bool retireFainted);

    std::size_t processed() const { return processed_; }
    bool pending() const { return !queue_.empty(); }
    ErrorCode error() const { return error_; }

private:
    struct Match {
        Effects::PetRef owner;
        bool fromItem{false};
        std::size_t index{0};
        Effects::Effect effect;
        int rank{0};  // 0 for the event's side, 1 for the other
        int position{0};
    };

    std::vector<Match> collect(const Effects::Event& event) const;
    void collectFrom(const Effects::Event& event, Effects::Side side, const Pet& pet, bool inSlots, int rank,
                     int position, std::vector<Match>& out) const;
    bool responds(const Effects::Event& event, Effects::Side side, const Pet& pet, const Effects::Trigger& trigger,
                  bool inSlots) const;
    std::optional<Effects::PetId> nearestAhead(Effects::Side side, int position) const;
    void run(const Effects::Event& cause, const Match& match);
    bool countEvent();

    EngineContext& ctx_;
    FaintLedger& fainted_;
    std::deque<Effects::Event> queue_;
    std::size_t processed_{0};
    ErrorCode error_{ErrorCode::None};
};

}  // namespace Arena::Game
