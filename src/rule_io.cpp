#include "rule_io.h"

#include "errors.h"
#include "sol_util.h"
#include "state_io.h"
#include "tui.h"

#include <stdexcept>
#include <utility>
#include <vector>

namespace tfx {

namespace {

sol::table required_global(sol::state &lua, char const *name, std::string const &origin) {
  sol::object const obj{ lua[name] };
  if (obj.get_type() != sol::type::table) {
    throw rule_table_error(origin + ": global " + name + " must be a table");
  }
  return obj.as<sol::table>();
}

std::string load_text(std::filesystem::path const &path) {
  try {
    return read_document_text(path);
  } catch (std::runtime_error const &e) { throw rule_table_error(e.what()); }
}

std::vector<dep_spec> specs_from_lua(sol::table const &specs, std::string const &context) {
  std::vector<dep_spec> out;
  std::size_t const n{ specs.size() };
  out.reserve(n);
  for (std::size_t i{ 1 }; i <= n; ++i) {
    std::string const spec_context{ context + "[" + std::to_string(i) + "]" };
    sol::object const entry{ specs[i] };
    if (entry.get_type() != sol::type::table) {
      throw rule_table_error(spec_context + ": spec must be a table");
    }
    auto const spec{ entry.as<sol::table>() };
    try {
      out.push_back(dep_spec{
          .attr = sol_util_get_required<std::string>(spec, "attr", spec_context),
          .src_type = sol_util_get_required<std::string>(spec, "src_type", spec_context),
          .src_attr = sol_util_get_required<std::string>(spec, "src_attr", spec_context),
      });
    } catch (std::runtime_error const &e) { throw rule_table_error(e.what()); }
  }
  return out;
}

}  // namespace

dep_map dep_map_from_lua(std::string_view script, std::string const &chunk_name) {
  auto lua{ sol_util_make_lua_state() };
  try {
    sol_util_run_script(*lua, script, chunk_name);
  } catch (std::runtime_error const &e) { throw rule_table_error(e.what()); }

  dep_map out;
  auto const deps{ required_global(*lua, "DEPS", chunk_name) };
  for (auto const &[key, value] : deps) {
    if (key.get_type() != sol::type::string) {
      throw rule_table_error(chunk_name + ": DEPS keys must be resource type strings");
    }
    auto const type{ key.as<std::string>() };
    std::string const context{ chunk_name + ": DEPS." + type };
    if (value.get_type() != sol::type::table) {
      throw rule_table_error(context + " must be a table of specs");
    }
    out.set(type, specs_from_lua(value.as<sol::table>(), context));
  }

  tui::debug("%s: %zu resource types", chunk_name.c_str(), out.entries().size());
  return out;
}

dep_map load_dep_map(std::filesystem::path const &path) {
  return dep_map_from_lua(load_text(path), path.string());
}

state_transform transform_from_lua(std::string_view script, std::string const &chunk_name) {
  auto lua{ sol_util_make_lua_state() };
  try {
    sol_util_run_script(*lua, script, chunk_name);
  } catch (std::runtime_error const &e) { throw rule_table_error(e.what()); }

  state_transform out;
  auto const table{ required_global(*lua, "TRANSFORM", chunk_name) };
  for (auto const &[key, value] : table) {
    if (key.get_type() != sol::type::string || value.get_type() != sol::type::string) {
      throw rule_table_error(chunk_name + ": TRANSFORM entries must map strings to strings");
    }
    out.set(key.as<std::string>(), value.as<std::string>());
  }
  return out;
}

state_transform transform_from_json(nlohmann::json const &j, std::string const &origin) {
  if (!j.is_object()) { throw rule_table_error(origin + ": transform must be a JSON object"); }

  state_transform out;
  for (auto const &[src, dst] : j.items()) {
    if (!dst.is_string()) {
      throw rule_table_error(origin + ": value for \"" + src + "\" must be a string");
    }
    out.set(src, dst.get<std::string>());
  }
  return out;
}

state_transform load_transform(std::filesystem::path const &path) {
  auto const text{ load_text(path) };
  state_transform out;
  if (path.extension() == ".json") {
    try {
      out = transform_from_json(parse_document(text, path.string()), path.string());
    } catch (document_error const &e) { throw rule_table_error(e.what()); }
  } else {
    out = transform_from_lua(text, path.string());
  }
  tui::debug("%s: %zu transform entries", path.string().c_str(), out.size());
  return out;
}

nlohmann::json transform_to_json(state_transform const &t) {
  nlohmann::json out = nlohmann::json::object();
  for (auto const &[src, dst] : t.entries()) { out[src] = dst; }
  return out;
}

}  // namespace tfx
