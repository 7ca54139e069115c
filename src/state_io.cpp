#include "state_io.h"

#include "errors.h"
#include "tui.h"
#include "util.h"

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <utility>

namespace tfx {

namespace {

constexpr char const *kSetTag{ "$set" };

using json = nlohmann::json;

[[noreturn]] void fail(std::string const &where, std::string const &what) {
  throw document_error(where + ": " + what);
}

json const &require(json const &obj, char const *key, std::string const &where) {
  auto const it{ obj.find(key) };
  if (it == obj.end()) { fail(where, std::string("missing \"") + key + "\""); }
  return *it;
}

json const *optional_field(json const &obj, char const *key) {
  auto const it{ obj.find(key) };
  return it == obj.end() || it->is_null() ? nullptr : &*it;
}

void require_object(json const &j, std::string const &where) {
  if (!j.is_object()) { fail(where, "expected object"); }
}

std::string get_string(json const &j, std::string const &where) {
  if (!j.is_string()) { fail(where, "expected string"); }
  return j.get<std::string>();
}

bool get_bool(json const *j, std::string const &where) {
  if (!j) { return false; }
  if (!j->is_boolean()) { fail(where, "expected boolean"); }
  return j->get<bool>();
}

std::vector<std::string> get_strings(json const &j, std::string const &where) {
  if (!j.is_array()) { fail(where, "expected array of strings"); }
  std::vector<std::string> out;
  out.reserve(j.size());
  for (std::size_t i{ 0 }; i < j.size(); ++i) {
    out.push_back(get_string(j[i], where + "/" + std::to_string(i)));
  }
  return out;
}

module_path get_module_path(json const &j, std::string const &where) {
  auto path{ get_strings(j, where) };
  if (path.empty() || path.front() != "root") {
    fail(where, "module path must start with \"root\"");
  }
  return path;
}

resource_record record_from_json(json const &j, std::string const &where) {
  require_object(j, where);

  resource_record r;
  r.type = get_string(require(j, "type", where), where + "/type");
  if (auto const *p{ optional_field(j, "provider") }) {
    r.provider = get_string(*p, where + "/provider");
  }
  if (auto const *deps{ optional_field(j, "depends_on") }) {
    r.dependencies = get_strings(*deps, where + "/depends_on");
  }

  if (auto const *primary{ optional_field(j, "primary") }) {
    std::string const pwhere{ where + "/primary" };
    require_object(*primary, pwhere);
    if (auto const *id{ optional_field(*primary, "id") }) {
      r.id = get_string(*id, pwhere + "/id");
    }
    if (auto const *attrs{ optional_field(*primary, "attributes") }) {
      auto value{ attr_from_json(*attrs, pwhere + "/attributes") };
      if (!value.is_map()) { fail(pwhere + "/attributes", "expected object"); }
      r.attributes = std::get<attr_map>(std::move(value.v));
    }
  }
  return r;
}

json record_to_json(resource_record const &r) {
  json primary{ { "id", r.id }, { "attributes", attr_to_json(attr_value{ r.attributes }) } };
  return json{ { "type", r.type },
               { "provider", r.provider },
               { "depends_on", r.dependencies },
               { "primary", std::move(primary) } };
}

attr_diff attr_diff_from_json(json const &j, std::string const &where) {
  require_object(j, where);
  attr_diff a;
  if (auto const *v{ optional_field(j, "old") }) { a.old_value = get_string(*v, where + "/old"); }
  if (auto const *v{ optional_field(j, "new") }) { a.new_value = get_string(*v, where + "/new"); }
  a.new_computed = get_bool(optional_field(j, "new_computed"), where + "/new_computed");
  a.new_removed = get_bool(optional_field(j, "new_removed"), where + "/new_removed");
  a.requires_new = get_bool(optional_field(j, "requires_new"), where + "/requires_new");
  a.sensitive = get_bool(optional_field(j, "sensitive"), where + "/sensitive");
  return a;
}

json attr_diff_to_json(attr_diff const &a) {
  return json{ { "old", a.old_value },
               { "new", a.new_value },
               { "new_computed", a.new_computed },
               { "new_removed", a.new_removed },
               { "requires_new", a.requires_new },
               { "sensitive", a.sensitive } };
}

instance_diff instance_diff_from_json(json const &j, std::string const &where) {
  require_object(j, where);
  instance_diff d;
  d.destroy = get_bool(optional_field(j, "destroy"), where + "/destroy");
  d.destroy_tainted = get_bool(optional_field(j, "destroy_tainted"), where + "/destroy_tainted");
  if (auto const *attrs{ optional_field(j, "attributes") }) {
    require_object(*attrs, where + "/attributes");
    for (auto const &[name, value] : attrs->items()) {
      d.attributes.emplace(name, attr_diff_from_json(value, where + "/attributes/" + name));
    }
  }
  return d;
}

json instance_diff_to_json(instance_diff const &d) {
  json attrs = json::object();
  for (auto const &[name, a] : d.attributes) { attrs[name] = attr_diff_to_json(a); }
  return json{ { "attributes", std::move(attrs) },
               { "destroy", d.destroy },
               { "destroy_tainted", d.destroy_tainted } };
}

}  // namespace

attr_value attr_from_json(json const &j, std::string const &where) {
  switch (j.type()) {
    case json::value_t::null: return attr_value{};
    case json::value_t::boolean: return attr_value{ j.get<bool>() };
    case json::value_t::number_integer: return attr_value{ j.get<std::int64_t>() };
    case json::value_t::number_unsigned: {
      auto const u{ j.get<std::uint64_t>() };
      if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        fail(where, "integer out of range");
      }
      return attr_value{ static_cast<std::int64_t>(u) };
    }
    case json::value_t::number_float: return attr_value{ j.get<double>() };
    case json::value_t::string: return attr_value{ j.get<std::string>() };
    case json::value_t::array: {
      attr_list list;
      list.reserve(j.size());
      for (std::size_t i{ 0 }; i < j.size(); ++i) {
        list.push_back(attr_from_json(j[i], where + "/" + std::to_string(i)));
      }
      return attr_value{ std::move(list) };
    }
    case json::value_t::object: {
      if (j.size() == 1 && j.contains(kSetTag)) {
        auto const &members{ j.at(kSetTag) };
        std::string const swhere{ where + "/" + kSetTag };
        if (!members.is_array()) { fail(swhere, "expected array"); }
        attr_set set;
        for (std::size_t i{ 0 }; i < members.size(); ++i) {
          set.insert(attr_from_json(members[i], swhere + "/" + std::to_string(i)));
        }
        return attr_value{ std::move(set) };
      }
      attr_map map;
      for (auto const &[key, value] : j.items()) {
        map.emplace(key, attr_from_json(value, where + "/" + key));
      }
      return attr_value{ std::move(map) };
    }
    default: break;
  }
  fail(where, "unsupported JSON value");
}

json attr_to_json(attr_value const &value) {
  return std::visit(match{
                        [](std::monostate) { return json(nullptr); },
                        [](bool b) { return json(b); },
                        [](std::int64_t i) { return json(i); },
                        [](double d) { return json(d); },
                        [](std::string const &s) { return json(s); },
                        [](attr_list const &l) {
                          json out = json::array();
                          for (auto const &e : l) { out.push_back(attr_to_json(e)); }
                          return out;
                        },
                        [](attr_set const &s) {
                          json members = json::array();
                          for (auto const &e : s.members()) {
                            members.push_back(attr_to_json(e));
                          }
                          return json{ { kSetTag, std::move(members) } };
                        },
                        [](attr_map const &m) {
                          json out = json::object();
                          for (auto const &[k, e] : m) { out[k] = attr_to_json(e); }
                          return out;
                        },
                    },
                    value.v);
}

state state_from_json(json const &j) {
  require_object(j, "");

  state s;
  if (auto const *v{ optional_field(j, "version") }) {
    if (!v->is_number_integer()) { fail("/version", "expected integer"); }
    s.version = v->get<int>();
  }
  if (auto const *v{ optional_field(j, "serial") }) {
    if (!v->is_number_integer()) { fail("/serial", "expected integer"); }
    s.serial = v->get<std::int64_t>();
  }
  if (auto const *v{ optional_field(j, "lineage") }) { s.lineage = get_string(*v, "/lineage"); }

  if (auto const *mods{ optional_field(j, "modules") }) {
    if (!mods->is_array()) { fail("/modules", "expected array"); }
    for (std::size_t i{ 0 }; i < mods->size(); ++i) {
      std::string const where{ "/modules/" + std::to_string(i) };
      auto const &mj{ (*mods)[i] };
      require_object(mj, where);

      auto const path{ get_module_path(require(mj, "path", where), where + "/path") };
      if (s.module_by_path(path)) { fail(where + "/path", "duplicate module path"); }
      auto &m{ s.add_module(path) };

      if (auto const *res{ optional_field(mj, "resources") }) {
        require_object(*res, where + "/resources");
        for (auto const &[key, rj] : res->items()) {
          std::string const rwhere{ where + "/resources/" + key };
          try {
            static_cast<void>(parse_state_key(key));
          } catch (key_parse_error const &e) { fail(rwhere, e.what()); }
          m.insert(key, record_from_json(rj, rwhere));
        }
      }
    }
  }

  if (!s.module_by_path(root_module_path())) { s.add_module(root_module_path()); }
  return s;
}

json state_to_json(state const &s) {
  json modules = json::array();
  for (auto const &m : s.modules) {
    json resources = json::object();
    for (auto const &[key, r] : m.resources) { resources[key] = record_to_json(r); }
    modules.push_back(json{ { "path", normalize_module_path(m.path) },
                            { "resources", std::move(resources) } });
  }
  return json{ { "version", s.version },
               { "serial", s.serial },
               { "lineage", s.lineage },
               { "modules", std::move(modules) } };
}

diff diff_from_json(json const &j) {
  require_object(j, "");

  diff d;
  if (auto const *mods{ optional_field(j, "modules") }) {
    if (!mods->is_array()) { fail("/modules", "expected array"); }
    for (std::size_t i{ 0 }; i < mods->size(); ++i) {
      std::string const where{ "/modules/" + std::to_string(i) };
      auto const &mj{ (*mods)[i] };
      require_object(mj, where);

      auto const path{ get_module_path(require(mj, "path", where), where + "/path") };
      if (d.module_by_path(path)) { fail(where + "/path", "duplicate module path"); }
      auto &m{ d.add_module(path) };

      if (auto const *res{ optional_field(mj, "resources") }) {
        require_object(*res, where + "/resources");
        for (auto const &[key, rj] : res->items()) {
          std::string const rwhere{ where + "/resources/" + key };
          try {
            static_cast<void>(parse_state_key(key));
          } catch (key_parse_error const &e) { fail(rwhere, e.what()); }
          m.resources.emplace(key, instance_diff_from_json(rj, rwhere));
        }
      }
    }
  }
  return d;
}

json diff_to_json(diff const &d) {
  json modules = json::array();
  for (auto const &m : d.modules) {
    json resources = json::object();
    for (auto const &[key, id] : m.resources) { resources[key] = instance_diff_to_json(id); }
    modules.push_back(json{ { "path", normalize_module_path(m.path) },
                            { "resources", std::move(resources) } });
  }
  return json{ { "modules", std::move(modules) } };
}

bool is_stdio_path(std::filesystem::path const &path) {
  return path.empty() || path == "-";
}

std::string read_document_text(std::filesystem::path const &path) {
  if (is_stdio_path(path)) { return util_read_stdin(); }
  auto const bytes{ util_load_file(path) };
  return std::string(bytes.begin(), bytes.end());
}

json parse_document(std::string_view text, std::string const &origin) {
  try {
    return json::parse(text.begin(), text.end());
  } catch (json::parse_error const &e) {
    throw document_error(origin + ": invalid JSON: " + e.what());
  }
}

state read_state(std::filesystem::path const &path) {
  auto const origin{ is_stdio_path(path) ? std::string("<stdin>") : path.string() };
  auto const doc{ parse_document(read_document_text(path), origin) };
  try {
    auto s{ state_from_json(doc) };
    tui::debug("%s: %zu modules, %zu resources",
               origin.c_str(),
               s.modules.size(),
               s.resource_count());
    return s;
  } catch (document_error const &e) { throw document_error(origin + e.what()); }
}

diff read_diff(std::filesystem::path const &path) {
  auto const origin{ is_stdio_path(path) ? std::string("<stdin>") : path.string() };
  auto const doc{ parse_document(read_document_text(path), origin) };
  try {
    return diff_from_json(doc);
  } catch (document_error const &e) { throw document_error(origin + e.what()); }
}

void write_document(json const &j, std::filesystem::path const &path) {
  auto const text{ j.dump(2) + "\n" };
  if (is_stdio_path(path)) {
    tui::print_stdout("%s", text.c_str());
  } else {
    util_write_file(path, text);
  }
}

void write_state(state const &s, std::filesystem::path const &path) {
  write_document(state_to_json(s), path);
}

void write_diff(diff const &d, std::filesystem::path const &path) {
  write_document(diff_to_json(d), path);
}

}  // namespace tfx
