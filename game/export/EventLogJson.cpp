#include "EventLogJson.h"

#include <fstream>

#include "../../engine/core/Logger.h"

namespace Arena::Game {

using nlohmann::json;
using namespace Arena::Effects;

namespace {
json refToJson(const std::optional<PetRef>& ref) {
    if (!ref) return nullptr;
    return json{{"side", std::string(toString(ref->side))}, {"position", ref->position}, {"id", ref->id}};
}
}  // namespace

json eventLogToJson(const EventLog& log) {
    json out = json::array();
    for (const auto& entry : log) {
        const auto& e = entry.event;
        json actions = json::array();
        for (const auto& a : entry.actions) {
            actions.push_back({{"owner", refToJson(a.owner)},
                               {"action", a.action},
                               {"target", refToJson(a.target)},
                               {"attack", a.attack},
                               {"health", a.health},
                               {"amount", a.amount}});
        }
        out.push_back({{"kind", std::string(toString(e.kind))},
                       {"turn", e.turn},
                       {"phase", std::string(toString(e.phase))},
                       {"side", std::string(toString(e.side))},
                       {"source", refToJson(e.source)},
                       {"afflicted", refToJson(e.afflicted)},
                       {"amount", e.amount},
                       {"detail", e.detail},
                       {"actions", std::move(actions)}});
    }
    return out;
}

bool writeEventLog(const EventLog& log, const std::string& path) {
    std::ofstream f(path);
    if (!f.is_open()) {
        logError("Could not open event log output: " + path);
        return false;
    }
    f << eventLogToJson(log).dump(2) << '\n';
    if (!f) {
        logError("Failed writing event log to " + path);
        return false;
    }
    logInfo("Wrote " + std::to_string(log.size()) + " events to " + path);
    return true;
}

}  // namespace Arena::Game
