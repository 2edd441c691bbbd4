// JSON content loading for pet/food catalogs.
#pragma once

#include <optional>
#include <string>

#include "EntityProvider.h"

namespace Arena::Game {

// nullopt when the file is missing or malformed; bad records are skipped with a warning.
std::optional<Catalog> loadCatalog(const std::string& path);
std::optional<Catalog> parseCatalog(const std::string& text);

}  // namespace Arena::Game
