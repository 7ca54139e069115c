#pragma once

#include "dep_map.h"
#include "state_transform.h"

#include "nlohmann/json.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace tfx {

// Rule files. Lua scripts define a global DEPS or TRANSFORM table; transforms may
// also be JSON objects (".json" extension). Malformed input throws
// rule_table_error naming the file and entry.

dep_map dep_map_from_lua(std::string_view script, std::string const &chunk_name);
dep_map load_dep_map(std::filesystem::path const &path);

state_transform transform_from_lua(std::string_view script, std::string const &chunk_name);
state_transform transform_from_json(nlohmann::json const &j, std::string const &origin);
state_transform load_transform(std::filesystem::path const &path);

nlohmann::json transform_to_json(state_transform const &t);

}  // namespace tfx
