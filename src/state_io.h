#pragma once

#include "attr_value.h"
#include "diff.h"
#include "state.h"

#include "nlohmann/json.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace tfx {

// JSON (de)serialization of state and diff documents. Readers throw
// document_error naming the offending location, e.g. "/modules/0/path".

attr_value attr_from_json(nlohmann::json const &j, std::string const &where);
nlohmann::json attr_to_json(attr_value const &value);

state state_from_json(nlohmann::json const &j);
nlohmann::json state_to_json(state const &s);

diff diff_from_json(nlohmann::json const &j);
nlohmann::json diff_to_json(diff const &d);

// "-" or an empty path means stdin / stdout.
bool is_stdio_path(std::filesystem::path const &path);

std::string read_document_text(std::filesystem::path const &path);
nlohmann::json parse_document(std::string_view text, std::string const &origin);

state read_state(std::filesystem::path const &path);
void write_state(state const &s, std::filesystem::path const &path);

diff read_diff(std::filesystem::path const &path);
void write_diff(diff const &d, std::filesystem::path const &path);

// Writes pretty-printed JSON followed by a newline.
void write_document(nlohmann::json const &j, std::filesystem::path const &path);

}  // namespace tfx
