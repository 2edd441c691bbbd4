// Rules and limits passed explicitly to rosters, shops and battles.
#pragma once

#include <optional>
#include <string>

#include "../../engine/core/Logger.h"
#include "../../engine/gameplay/Combat.h"
#include "../../engine/gameplay/StatValue.h"

namespace Arena::Game {

struct EconomyRules {
    int startingCoins{10};
    int rollCost{1};
    int sellValuePerLevel{1};
    int mergeStatBonus{1};  // added to both stats per experience point
    int maxLevel{3};
    bool levelUpBonusPet{true};
};

struct GameConfig {
    Gameplay::StatLimits statLimits{};
    int cascadeLimit{1000};  // events processed per phase
    int maxTurns{200};
    int rosterCapacity{5};
    std::string pack{"Turtle"};
    LogLevel logLevel{LogLevel::Info};
    Gameplay::DamageRules combat{};
    EconomyRules economy{};
};

std::optional<LogLevel> parseLogLevelKey(const std::string& k);
// Missing keys keep their defaults; nullopt on unreadable or malformed files.
std::optional<GameConfig> loadGameConfig(const std::string& path);
std::optional<GameConfig> parseGameConfig(const std::string& text);

}  // namespace Arena::Game
