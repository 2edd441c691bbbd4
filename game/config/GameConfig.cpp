#include "GameConfig.h"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

namespace Arena::Game {

using nlohmann::json;

std::optional<LogLevel> parseLogLevelKey(const std::string& k) {
    if (k == "debug") return LogLevel::Debug;
    if (k == "info") return LogLevel::Info;
    if (k == "warn" || k == "warning") return LogLevel::Warning;
    if (k == "error") return LogLevel::Error;
    return std::nullopt;
}

namespace {
GameConfig fromJson(const json& j) {
    GameConfig cfg{};
    if (j.contains("statLimits")) {
        const auto& s = j["statLimits"];
        cfg.statLimits.minimum = s.value("min", cfg.statLimits.minimum);
        cfg.statLimits.maximum = s.value("max", cfg.statLimits.maximum);
    }
    cfg.cascadeLimit = j.value("cascadeLimit", cfg.cascadeLimit);
    cfg.maxTurns = j.value("maxTurns", cfg.maxTurns);
    cfg.rosterCapacity = j.value("rosterCapacity", cfg.rosterCapacity);
    cfg.pack = j.value("pack", cfg.pack);
    if (j.contains("logLevel")) {
        const std::string key = j["logLevel"].get<std::string>();
        if (auto level = parseLogLevelKey(key)) {
            cfg.logLevel = *level;
        } else {
            logWarn("Unknown logLevel '" + key + "'; keeping default.");
        }
    }
    if (j.contains("combat")) {
        const auto& c = j["combat"];
        cfg.combat.minDamage = c.value("minDamage", cfg.combat.minDamage);
        cfg.combat.maxDamage = c.value("maxDamage", cfg.combat.maxDamage);
    }
    if (j.contains("economy")) {
        const auto& e = j["economy"];
        cfg.economy.startingCoins = e.value("startingCoins", cfg.economy.startingCoins);
        cfg.economy.rollCost = e.value("rollCost", cfg.economy.rollCost);
        cfg.economy.sellValuePerLevel = e.value("sellValuePerLevel", cfg.economy.sellValuePerLevel);
        cfg.economy.mergeStatBonus = e.value("mergeStatBonus", cfg.economy.mergeStatBonus);
        cfg.economy.maxLevel = e.value("maxLevel", cfg.economy.maxLevel);
        cfg.economy.levelUpBonusPet = e.value("levelUpBonusPet", cfg.economy.levelUpBonusPet);
    }
    if (cfg.cascadeLimit < 1) {
        logWarn("cascadeLimit must be positive; using 1000.");
        cfg.cascadeLimit = 1000;
    }
    if (cfg.rosterCapacity < 1) {
        logWarn("rosterCapacity must be positive; using 5.");
        cfg.rosterCapacity = 5;
    }
    return cfg;
}
}  // namespace

std::optional<GameConfig> parseGameConfig(const std::string& text) {
    try {
        return fromJson(json::parse(text));
    } catch (const json::exception& ex) {
        logError(std::string("Config parse failed: ") + ex.what());
        return std::nullopt;
    }
}

std::optional<GameConfig> loadGameConfig(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        logWarn("Config file not found: " + path);
        return std::nullopt;
    }
    std::ifstream f(path);
    if (!f.is_open()) {
        logWarn("Config file could not be opened: " + path);
        return std::nullopt;
    }
    try {
        json j;
        f >> j;
        return fromJson(j);
    } catch (const json::exception& ex) {
        logError("Config parse failed for " + path + ": " + ex.what());
        return std::nullopt;
    }
}

}  // namespace Arena::Game
