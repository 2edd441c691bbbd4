#include "ContentLoader.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

#include "../../engine/core/Logger.h"

namespace Arena::Game {

using nlohmann::json;
using namespace Arena::Effects;

namespace {

std::optional<int> optionalInt(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    return j[key].get<int>();
}

std::optional<TargetSelector> parseTarget(const json& j) {
    TargetSelector t{};
    if (!j.is_object()) return t;
    auto kind = parseSelectorKey(j.value("kind", "Self"));
    auto team = parseTeamKey(j.value("team", "Friend"));
    auto stat = parseStatKey(j.value("stat", "health"));
    if (!kind || !team || !stat) return std::nullopt;
    t.kind = *kind;
    t.team = *team;
    t.stat = *stat;
    t.count = j.value("count", 1);
    t.slot = j.value("slot", 0);
    t.excludeSelf = j.value("excludeSelf", true);
    return t;
}

std::optional<Action> parseAction(const json& j) {
    const std::string type = j.value("type", "");
    if (type == "BuffStats") return BuffStats{j.value("attack", 0), j.value("health", 0)};
    if (type == "DealDamage") return DealDamage{j.value("amount", 0)};
    if (type == "SetStats") return SetStats{optionalInt(j, "attack"), optionalInt(j, "health")};
    if (type == "SwapStats") return SwapStats{j.value("invert", false)};
    if (type == "SummonPet") {
        SummonPet s{};
        s.name = j.value("name", "");
        s.level = j.value("level", 1);
        s.attack = optionalInt(j, "attack");
        s.health = optionalInt(j, "health");
        s.count = j.value("count", 1);
        auto team = parseTeamKey(j.value("team", "Friend"));
        if (!team || s.name.empty()) return std::nullopt;
        s.team = *team;
        return s;
    }
    if (type == "GrantItem") return GrantItem{j.value("name", "")};
    if (type == "GainExperience") return GainExperience{j.value("amount", 1)};
    if (type == "KillTarget") return KillTarget{};
    if (type == "GainGold") return GainGold{j.value("amount", 1)};
    if (type == "BuffShopPets") return BuffShopPets{j.value("attack", 0), j.value("health", 0)};
    if (type == "DamageModifier") {
        Gameplay::DamageModifier m{};
        m.attackBonus = j.value("attackBonus", 0);
        m.damageReduction = j.value("damageReduction", 0);
        m.allowZeroDamage = j.value("allowZeroDamage", false);
        m.lethal = j.value("lethal", false);
        m.invulnerable = j.value("invulnerable", false);
        return m;
    }
    return std::nullopt;
}

std::optional<Effect> parseEffect(const json& j, const std::string& owner) {
    if (!j.contains("trigger") || !j.contains("action")) {
        logWarn("Effect on " + owner + " is missing trigger or action; skipped.");
        return std::nullopt;
    }
    const auto& trig = j["trigger"];
    auto kind = parseEventKey(trig.value("event", ""));
    auto scope = parseScopeKey(trig.value("scope", "Self"));
    if (!kind || !scope) {
        logWarn("Unknown trigger on " + owner + "; skipped.");
        return std::nullopt;
    }
    std::optional<TargetSelector> target = TargetSelector{};
    if (j.contains("target")) target = parseTarget(j["target"]);
    if (!target) {
        logWarn("Unknown target selector on " + owner + "; skipped.");
        return std::nullopt;
    }
    auto action = parseAction(j["action"]);
    if (!action) {
        logWarn("Unknown action on " + owner + "; skipped.");
        return std::nullopt;
    }
    Effect e{};
    e.trigger = Trigger{*kind, *scope};
    e.target = *target;
    e.action = std::move(*action);
    e.uses = optionalInt(j, "uses");
    e.temporary = j.value("temporary", false);
    return e;
}

std::optional<PetDefinition> parsePet(const json& p) {
    PetDefinition d{};
    d.name = p.value("name", "");
    if (d.name.empty()) {
        logWarn("Pet record without a name; skipped.");
        return std::nullopt;
    }
    d.tier = p.value("tier", 1);
    d.pack = p.value("pack", "Turtle");
    d.cost = p.value("cost", 3);
    d.attack = p.value("attack", 1);
    d.health = p.value("health", 1);
    d.token = p.value("token", false);
    if (p.contains("levels") && p["levels"].is_array()) {
        const auto& levels = p["levels"];
        const std::size_t maxL = std::min<std::size_t>(levels.size(), kMaxPetLevel);
        for (std::size_t l = 0; l < maxL; ++l) {
            if (!levels[l].is_array()) continue;
            for (const auto& e : levels[l]) {
                if (auto eff = parseEffect(e, d.name)) d.effects[l].push_back(std::move(*eff));
            }
        }
    }
    return d;
}

std::optional<FoodDefinition> parseFood(const json& f) {
    FoodDefinition d{};
    d.name = f.value("name", "");
    if (d.name.empty()) {
        logWarn("Food record without a name; skipped.");
        return std::nullopt;
    }
    d.tier = f.value("tier", 1);
    d.pack = f.value("pack", "Turtle");
    d.cost = f.value("cost", 3);
    d.holdable = f.value("holdable", false);
    d.singleUse = f.value("singleUse", false);
    if (f.contains("effect")) d.effect = parseEffect(f["effect"], d.name);
    return d;
}

// A record with a mistyped field is dropped on its own; the rest of the file still loads.
template <typename Parse>
auto parseRecord(const json& record, const char* kind, Parse parse) -> decltype(parse(record)) {
    try {
        return parse(record);
    } catch (const json::exception& ex) {
        logWarn(std::string("Malformed ") + kind + " record skipped: " + ex.what());
        return std::nullopt;
    }
}

std::optional<Catalog> buildCatalog(const json& j) {
    Catalog c;
    if (j.contains("pets")) {
        for (const auto& p : j["pets"]) {
            if (auto def = parseRecord(p, "pet", parsePet)) c.addPet(std::move(*def));
        }
    }
    if (j.contains("foods")) {
        for (const auto& f : j["foods"]) {
            if (auto def = parseRecord(f, "food", parseFood)) c.addFood(std::move(*def));
        }
    }
    return c;
}

}  // namespace

std::optional<Catalog> parseCatalog(const std::string& text) {
    try {
        return buildCatalog(json::parse(text));
    } catch (const json::exception& ex) {
        logError(std::string("Content parse failed: ") + ex.what());
        return std::nullopt;
    }
}

std::optional<Catalog> loadCatalog(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        logWarn("Content file not found: " + path);
        return std::nullopt;
    }
    std::ifstream f(path);
    if (!f.is_open()) {
        logWarn("Content file could not be opened: " + path);
        return std::nullopt;
    }
    try {
        json j;
        f >> j;
        auto catalog = buildCatalog(j);
        if (catalog) {
            logInfo("Loaded " + std::to_string(catalog->petCount()) + " pets and " +
                    std::to_string(catalog->foodCount()) + " foods from " + path);
        }
        return catalog;
    } catch (const json::exception& ex) {
        logError("Content parse failed for " + path + ": " + ex.what());
        return std::nullopt;
    }
}

}  // namespace Arena::Game
