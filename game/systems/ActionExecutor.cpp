#include "ActionExecutor.h"

#include <algorithm>
#include <string>

#include "../../engine/core/Logger.h"
#include "TargetResolver.h"

namespace Arena::Game {

using namespace Arena::Effects;

namespace {

class ActionVisitor {
public:
    ActionVisitor(EngineContext& ctx, const Event& cause, const PetRef& owner, const Effect& effect,
                  std::vector<Event>& produced)
        : ctx_(ctx), cause_(cause), owner_(owner), effect_(effect), produced_(produced) {}

    void operator()(const BuffStats& a) {
        forEachTarget([&](Pet& pet, const PetRef& ref) {
            pet.stats.add(a.attack, a.health);
            record(ref, &pet, a.attack + a.health);
        });
    }

    void operator()(const DealDamage& a) {
        if (a.amount <= 0) return;
        forEachTarget([&](Pet& pet, const PetRef& ref) {
            const Gameplay::DamageModifier none{};
            const Gameplay::DamageModifier* mod = heldModifier(pet);
            const auto hit = Gameplay::computeHit(a.amount, none, mod ? *mod : none, ctx_.config->combat);
            if (mod && (mod->damageReduction > 0 || mod->invulnerable)) spendItemUse(pet);
            pet.stats.subtract(0, hit.damage);
            record(ref, &pet, hit.damage);
            if (hit.damage > 0) {
                produced_.push_back(makeEvent(EventKind::Hurt, ref, hit.damage));
            }
        });
    }

    void operator()(const SetStats& a) {
        forEachTarget([&](Pet& pet, const PetRef& ref) {
            if (a.attack) pet.stats.setAttack(*a.attack);
            if (a.health) pet.stats.setHealth(*a.health);
            record(ref, &pet, 0);
        });
    }

    void operator()(const SwapStats& a) {
        Pet* self = ctx_.find(owner_);
        forEachTarget([&](Pet& pet, const PetRef& ref) {
            if (a.invert) {
                pet.stats.invert();
            } else if (self && self != &pet) {
                self->stats.swap(pet.stats);
            }
            record(ref, &pet, 0);
        });
    }

    void operator()(const SummonPet& a) {
        const Side side = a.team == TargetTeam::Friend ? owner_.side : opposite(owner_.side);
        Roster* roster = ctx_.roster(side);
        if (!roster) return;
        const int position = side == owner_.side ? ownerPosition(ctx_, owner_) : 0;
        for (int n = 0; n < a.count; ++n) {
            auto pet = makePet(*ctx_.provider, a.name, a.level, *ctx_.config);
            if (!pet) {
                logWarn("Summon of unknown pet " + a.name + " skipped.");
                return;
            }
            if (a.attack) pet->stats.setAttack(*a.attack);
            if (a.health) pet->stats.setHealth(*a.health);
            auto placed = roster->summon(std::move(*pet), position);
            if (!placed) {
                logDebug("No room to summon " + a.name + ".");
                return;
            }
            Pet* summoned = roster->at(*placed);
            const PetRef ref = ctx_.refTo(side, *summoned);
            record(ref, summoned, 1);
            produced_.push_back(makeEvent(EventKind::Summoned, ref, 1));
        }
    }

    void operator()(const GrantItem& a) {
        forEachTarget([&](Pet& pet, const PetRef& ref) {
            auto food = makeFood(*ctx_.provider, a.name);
            if (!food) {
                logWarn("Grant of unknown food " + a.name + " skipped.");
                return;
            }
            pet.item = std::move(*food);
            record(ref, &pet, 0);
        });
    }

    void operator()(const GainExperience& a) {
        forEachTarget([&](Pet& pet, const PetRef& ref) {
            const int gained = pet.addExperience(a.amount, ctx_.config->economy);
            record(ref, &pet, a.amount);
            if (gained > 0) {
                produced_.push_back(makeEvent(EventKind::Levelup, ref, gained));
            }
        });
    }

    void operator()(const KillTarget&) {
        forEachTarget([&](Pet& pet, const PetRef& ref) {
            pet.stats.setHealth(pet.stats.limits().minimum);
            record(ref, &pet, 0);
        });
    }

    void operator()(const GainGold& a) {
        if (!ctx_.shop) return;
        ctx_.shop->gainCoins(a.amount);
        record(std::nullopt, nullptr, a.amount);
    }

    void operator()(const BuffShopPets& a) {
        if (!ctx_.shop) return;
        ctx_.shop->buffPets(a.attack, a.health);
        record(std::nullopt, nullptr, a.attack + a.health);
    }

    // Consulted by the attack resolver only.
    void operator()(const Gameplay::DamageModifier&) {}

private:
    template <typename Fn>
    void forEachTarget(Fn&& fn) {
        for (const auto& target : resolveTargets(ctx_, cause_, owner_, effect_.target)) {
            // Earlier hits in this action may have removed the target.
            Pet* pet = ctx_.find(target);
            if (!pet || !pet->alive()) continue;
            fn(*pet, PetRef{target.side, pet->position, pet->id});
        }
    }

    Event makeEvent(EventKind kind, const PetRef& afflicted, int amount) const {
        Event e{};
        e.kind = kind;
        e.side = afflicted.side;
        e.afflicted = afflicted;
        e.source = owner_;
        e.amount = amount;
        e.detail = std::string(actionName(effect_.action));
        return e;
    }

    void record(const std::optional<PetRef>& target, const Pet* pet, int amount) {
        if (!ctx_.log) return;
        ActionRecord r{};
        r.owner = owner_;
        r.action = std::string(actionName(effect_.action));
        r.target = target;
        if (pet) {
            r.attack = pet->stats.attack();
            r.health = pet->stats.health();
        }
        r.amount = amount;
        ctx_.log->record(std::move(r));
    }

    EngineContext& ctx_;
    const Event& cause_;
    const PetRef& owner_;
    const Effect& effect_;
    std::vector<Event>& produced_;
};

}  // namespace

std::vector<Event> executeAction(EngineContext& ctx, const Event& cause, const PetRef& owner, const Effect& effect) {
    std::vector<Event> produced;
    ActionVisitor visitor(ctx, cause, owner, effect, produced);
    std::visit(visitor, effect.action);
    return produced;
}

}  // namespace Arena::Game
