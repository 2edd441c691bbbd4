#include <cstdint>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "../engine/core/Logger.h"
#include "../game/battle/Battle.h"
#include "../game/config/GameConfig.h"
#include "../game/content/ContentLoader.h"
#include "../game/export/EventLogJson.h"

using namespace Arena;
using namespace Arena::Game;

namespace {

struct Options {
    std::string contentPath;
    std::string configPath;
    std::string logPath;
    std::string teamA;
    std::string teamB;
    std::optional<std::uint64_t> seed;
    std::optional<LogLevel> logLevel;
};

void printUsage() {
    std::cout << "usage: petarena_sim --team-a Ant,Cricket --team-b Mosquito,Fish [options]\n"
              << "  --content <file>    pet/food catalog (default: built-in)\n"
              << "  --config <file>     game rules\n"
              << "  --seed <n>          seed for both rosters\n"
              << "  --log <file>        write the event log as JSON\n"
              << "  --log-level <lvl>   debug|info|warn|error\n";
}

std::vector<std::string> splitNames(const std::string& csv) {
    std::vector<std::string> out;
    std::stringstream ss(csv);
    std::string name;
    while (std::getline(ss, name, ',')) {
        if (!name.empty()) out.push_back(name);
    }
    return out;
}

std::optional<Options> parseArgs(int argc, char** argv) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) return std::nullopt;
            return std::string(argv[++i]);
        };
        std::optional<std::string> value;
        if (arg == "--help" || arg == "-h") return std::nullopt;
        if (!(value = next())) {
            logError("Missing value for " + arg);
            return std::nullopt;
        }
        if (arg == "--content") {
            opts.contentPath = *value;
        } else if (arg == "--config") {
            opts.configPath = *value;
        } else if (arg == "--log") {
            opts.logPath = *value;
        } else if (arg == "--team-a") {
            opts.teamA = *value;
        } else if (arg == "--team-b") {
            opts.teamB = *value;
        } else if (arg == "--seed") {
            try {
                opts.seed = std::stoull(*value);
            } catch (const std::exception&) {
                logError("Invalid seed: " + *value);
                return std::nullopt;
            }
        } else if (arg == "--log-level") {
            opts.logLevel = parseLogLevelKey(*value);
            if (!opts.logLevel) {
                logError("Unknown log level: " + *value);
                return std::nullopt;
            }
        } else {
            logError("Unknown option " + arg);
            return std::nullopt;
        }
    }
    if (opts.teamA.empty() || opts.teamB.empty()) {
        logError("Both --team-a and --team-b are required.");
        return std::nullopt;
    }
    return opts;
}

std::optional<Roster> buildRoster(const std::string& csv, const EntityProvider& provider, const GameConfig& config,
                                  std::optional<std::uint64_t> seed) {
    std::vector<std::optional<Pet>> slots;
    for (const auto& name : splitNames(csv)) {
        auto pet = makePet(provider, name, 1, config);
        if (!pet) {
            logError("Unknown pet: " + name);
            return std::nullopt;
        }
        slots.push_back(std::move(*pet));
    }
    auto roster = Roster::fromSlots(std::move(slots), static_cast<std::size_t>(config.rosterCapacity), seed);
    if (!roster) {
        logError("Team " + csv + " rejected: " + std::string(toString(roster.error)));
        return std::nullopt;
    }
    return std::move(*roster);
}

}  // namespace

int main(int argc, char** argv) {
    auto opts = parseArgs(argc, argv);
    if (!opts) {
        printUsage();
        return 1;
    }

    GameConfig config{};
    if (!opts->configPath.empty()) {
        auto loaded = loadGameConfig(opts->configPath);
        if (!loaded) return 1;
        config = *loaded;
    }
    Logger::setMinLevel(opts->logLevel.value_or(config.logLevel));

    Catalog catalog = defaultCatalog();
    if (!opts->contentPath.empty()) {
        auto loaded = loadCatalog(opts->contentPath);
        if (!loaded) return 1;
        catalog = std::move(*loaded);
    }

    auto teamA = buildRoster(opts->teamA, catalog, config, opts->seed);
    auto teamB = buildRoster(opts->teamB, catalog, config, opts->seed);
    if (!teamA || !teamB) return 1;

    const BattleResult result = runBattle(*teamA, *teamB, catalog, config);
    if (result.error != ErrorCode::None) {
        logError("Battle failed: " + std::string(toString(result.error)));
    }
    std::cout << toString(result.outcome) << " after " << result.turns << " turn(s)\n";
    for (const auto* side : {&result.sideA, &result.sideB}) {
        std::cout << (side == &result.sideA ? "A:" : "B:");
        for (const auto& slot : side->slots()) {
            if (slot) std::cout << ' ' << slot->name() << '(' << slot->stats.attack() << '/' << slot->stats.health() << ')';
        }
        std::cout << '\n';
    }

    if (!opts->logPath.empty() && !writeEventLog(result.log, opts->logPath)) {
        return 1;
    }
    return result.error == ErrorCode::None ? 0 : 2;
}
