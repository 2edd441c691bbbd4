#include "TargetResolver.h"

#include <algorithm>

namespace Arena::Game {

using namespace Arena::Effects;

int ownerPosition(const EngineContext& ctx, const PetRef& owner) {
    if (Roster* r = ctx.roster(owner.side)) {
        if (auto pos = r->locate(owner.id)) return *pos;
    }
    return owner.position;
}

namespace {
int statOf(const Pet& p, StatKey key) {
    return key == StatKey::Attack ? p.stats.attack() : p.stats.health();
}

std::optional<PetRef> livingRef(const EngineContext& ctx, const std::optional<PetRef>& ref) {
    if (!ref) return std::nullopt;
    Roster* r = ctx.roster(ref->side);
    if (!r) return std::nullopt;
    auto pos = r->locate(ref->id);
    if (!pos) return std::nullopt;
    const Pet* p = r->at(*pos);
    if (!p || !p->alive()) return std::nullopt;
    return PetRef{ref->side, *pos, p->id};
}
}  // namespace

std::vector<PetRef> resolveTargets(const EngineContext& ctx, const Event& cause, const PetRef& owner,
                                   const TargetSelector& selector) {
    std::vector<PetRef> out;
    const Side side = selector.team == TargetTeam::Friend ? owner.side : opposite(owner.side);
    Roster* roster = ctx.roster(side);
    if (!roster || selector.kind == SelectorKind::None) return out;

    const bool friendly = side == owner.side;
    std::vector<const Pet*> living;
    for (const auto& slot : roster->slots()) {
        if (!slot || !slot->alive()) continue;
        if (friendly && selector.excludeSelf && slot->id == owner.id) continue;
        living.push_back(&*slot);
    }
    auto ref = [&](const Pet& p) { return PetRef{side, p.position, p.id}; };
    const int origin = ownerPosition(ctx, owner);
    const int count = std::max(0, selector.count);

    switch (selector.kind) {
        case SelectorKind::None:
            break;
        case SelectorKind::Self:
            if (auto self = livingRef(ctx, owner)) out.push_back(*self);
            break;
        case SelectorKind::Ahead:
            for (int i = origin - 1; i >= 0 && static_cast<int>(out.size()) < count; --i) {
                const Pet* p = roster->at(i);
                if (p && p->alive() && p->id != owner.id) out.push_back(ref(*p));
            }
            break;
        case SelectorKind::Behind:
            for (int i = origin + 1; i < static_cast<int>(roster->capacity()) && static_cast<int>(out.size()) < count;
                 ++i) {
                const Pet* p = roster->at(i);
                if (p && p->alive() && p->id != owner.id) out.push_back(ref(*p));
            }
            break;
        case SelectorKind::All:
            for (const Pet* p : living) out.push_back(ref(*p));
            break;
        case SelectorKind::Random: {
            Roster* stream = ctx.roster(owner.side);
            if (!stream) break;
            auto pool = living;
            for (int n = 0; n < count && !pool.empty(); ++n) {
                const std::size_t pick = stream->rng().index(pool.size());
                out.push_back(ref(*pool[pick]));
                pool.erase(pool.begin() + static_cast<std::ptrdiff_t>(pick));
            }
            break;
        }
        case SelectorKind::Slot: {
            const Pet* p = roster->at(selector.slot);
            if (p && p->alive()) out.push_back(ref(*p));
            break;
        }
        case SelectorKind::Lowest:
        case SelectorKind::Highest: {
            const Pet* best = nullptr;
            for (const Pet* p : living) {
                if (!best) {
                    best = p;
                } else if (selector.kind == SelectorKind::Lowest ? statOf(*p, selector.stat) < statOf(*best, selector.stat)
                                                                  : statOf(*p, selector.stat) > statOf(*best, selector.stat)) {
                    best = p;
                }
            }
            if (best) out.push_back(ref(*best));
            break;
        }
        case SelectorKind::First:
            if (!living.empty()) out.push_back(ref(*living.front()));
            break;
        case SelectorKind::Last:
            if (!living.empty()) out.push_back(ref(*living.back()));
            break;
        case SelectorKind::TriggerAfflicted:
            if (auto t = livingRef(ctx, cause.afflicted)) out.push_back(*t);
            break;
        case SelectorKind::TriggerSource:
            if (auto t = livingRef(ctx, cause.source)) out.push_back(*t);
            break;
    }
    return out;
}

}  // namespace Arena::Game
