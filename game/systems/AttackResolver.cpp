#include "AttackResolver.h"

#include "../../engine/gameplay/Combat.h"

namespace Arena::Game {

using namespace Arena::Effects;

namespace {
void applyHit(Pet& pet, const Gameplay::HitResult& hit) {
    if (hit.lethal) {
        pet.stats.setHealth(pet.stats.limits().minimum);
    } else {
        pet.stats.subtract(0, hit.damage);
    }
}

Event exchangeEvent(EventKind kind, const PetRef& afflicted, const PetRef& source, int amount) {
    Event e{};
    e.kind = kind;
    e.side = afflicted.side;
    e.afflicted = afflicted;
    e.source = source;
    e.amount = amount;
    return e;
}
}  // namespace

std::array<std::optional<PetRef>, 2> resolveAttack(EngineContext& ctx, EventEngine& engine) {
    Roster* ra = ctx.roster(Side::A);
    Roster* rb = ctx.roster(Side::B);
    Pet* a = ra ? ra->front() : nullptr;
    Pet* b = rb ? rb->front() : nullptr;
    if (!a || !b) return {};

    const Gameplay::DamageModifier none{};
    const Gameplay::DamageModifier* modA = heldModifier(*a);
    const Gameplay::DamageModifier* modB = heldModifier(*b);
    const auto& rules = ctx.config->combat;

    // Both hits come from the snapshot taken before either lands.
    const auto hitOnB = Gameplay::computeHit(a->stats.attack(), modA ? *modA : none, modB ? *modB : none, rules);
    const auto hitOnA = Gameplay::computeHit(b->stats.attack(), modB ? *modB : none, modA ? *modA : none, rules);
    applyHit(*b, hitOnB);
    applyHit(*a, hitOnA);
    if (modA) spendItemUse(*a);
    if (modB) spendItemUse(*b);

    const PetRef refA = ctx.refTo(Side::A, *a);
    const PetRef refB = ctx.refTo(Side::B, *b);

    engine.enqueue(exchangeEvent(EventKind::Attack, refA, refB, hitOnB.damage));
    engine.enqueue(exchangeEvent(EventKind::Attack, refB, refA, hitOnA.damage));
    if (hitOnA.damage > 0) engine.enqueue(exchangeEvent(EventKind::Hurt, refA, refB, hitOnA.damage));
    if (hitOnB.damage > 0) engine.enqueue(exchangeEvent(EventKind::Hurt, refB, refA, hitOnB.damage));

    const bool aDown = !a->alive();
    const bool bDown = !b->alive();
    engine.markFaint(refA, refB);
    engine.markFaint(refB, refA);
    if (bDown && !aDown) engine.enqueue(exchangeEvent(EventKind::KnockOut, refA, refB, hitOnB.damage));
    if (aDown && !bDown) engine.enqueue(exchangeEvent(EventKind::KnockOut, refB, refA, hitOnA.damage));

    return {refA, refB};
}

}  // namespace Arena::Game
