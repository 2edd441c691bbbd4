// Serializes a recorded event log for external viewers.
#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "../../engine/effects/Event.h"

namespace Arena::Game {

nlohmann::json eventLogToJson(const Effects::EventLog& log);
bool writeEventLog(const Effects::EventLog& log, const std::string& path);

}  // namespace Arena::Game
