#include "address.h"

#include "errors.h"

#include <algorithm>
#include <charconv>
#include <string>
#include <system_error>

namespace tfx {

namespace {

std::vector<std::string_view> split_dots(std::string_view s) {
  std::vector<std::string_view> parts;
  for (;;) {
    auto const pos{ s.find('.') };
    parts.push_back(s.substr(0, pos));
    if (pos == std::string_view::npos) { break; }
    s.remove_prefix(pos + 1);
  }
  return parts;
}

bool parse_index(std::string_view text, int &out) {
  if (text.empty()) { return false; }
  if (!std::all_of(text.begin(), text.end(), [](char c) { return c >= '0' && c <= '9'; })) {
    return false;
  }
  auto const [ptr, ec]{ std::from_chars(text.data(), text.data() + text.size(), out) };
  return ec == std::errc{} && ptr == text.data() + text.size();
}

bool has_any(std::string_view s, std::string_view chars) {
  return s.find_first_of(chars) != std::string_view::npos;
}

[[noreturn]] void bad_key(std::string_view key, char const *why) {
  throw key_parse_error("invalid resource state key \"" + std::string(key) + "\": " + why);
}

[[noreturn]] void bad_address(std::string_view addr, char const *why) {
  throw address_parse_error("invalid resource address \"" + std::string(addr) +
                            "\": " + why);
}

}  // namespace

std::string state_key::str() const {
  std::string out;
  if (mode == resource_mode::data) { out = "data."; }
  out += type;
  out += '.';
  out += name;
  if (index >= 0) {
    out += '.';
    out += std::to_string(index);
  }
  return out;
}

std::string resource_address::str() const {
  std::string out;
  auto const append{ [&out](std::string_view part) {
    if (!out.empty()) { out += '.'; }
    out += part;
  } };

  for (auto const &p : path) {
    append("module");
    append(p);
  }
  if (mode == resource_mode::data) { append("data"); }
  if (!type.empty()) { append(type); }
  if (!name.empty()) {
    append(name);
    if (index >= 0) { out += "[" + std::to_string(index) + "]"; }
  }
  return out;
}

module_path const &root_module_path() {
  static module_path const root{ "root" };
  return root;
}

bool is_root_module(module_path const &path) {
  return path.empty() || (path.size() == 1 && path[0] == "root");
}

module_path normalize_module_path(module_path path) {
  if (path.empty()) { return root_module_path(); }
  return path;
}

bool less_module_path(module_path const &a, module_path const &b) {
  bool const ar{ is_root_module(a) };
  bool const br{ is_root_module(b) };
  if (ar || br) { return ar && !br; }
  return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end());
}

std::string module_path_str(module_path const &path) {
  if (path.empty()) { return "root"; }
  std::string out;
  for (auto const &p : path) {
    if (!out.empty()) { out += '.'; }
    out += p;
  }
  return out;
}

state_key parse_state_key(std::string_view key) {
  auto parts{ split_dots(key) };

  state_key k;
  if (parts.size() > 1 && parts[0] == "data") {
    k.mode = resource_mode::data;
    parts.erase(parts.begin());
  }

  if (parts.size() < 2 || parts.size() > 3) { bad_key(key, "expected type.name[.index]"); }
  for (auto const part : parts) {
    if (part.empty()) { bad_key(key, "empty component"); }
  }
  if (has_any(parts[0], "[]") || has_any(parts[1], "[]")) {
    bad_key(key, "unexpected bracket");
  }

  if (parts[0] == "module") { bad_key(key, "type cannot be \"module\""); }

  k.type = parts[0];
  k.name = parts[1];
  if (parts.size() == 3) {
    if (!parse_index(parts[2], k.index)) { bad_key(key, "index must be a non-negative integer"); }
    if (parts[2].size() > 1 && parts[2][0] == '0') { bad_key(key, "index has leading zeros"); }
  }
  return k;
}

resource_address parse_address(std::string_view addr) {
  if (addr.empty()) { bad_address(addr, "empty address"); }

  auto const tokens{ split_dots(addr) };
  for (auto const t : tokens) {
    if (t.empty()) { bad_address(addr, "empty component"); }
  }

  resource_address a;
  std::size_t i{ 0 };
  while (i < tokens.size() && tokens[i] == "module") {
    if (i + 1 >= tokens.size()) { bad_address(addr, "module name missing"); }
    a.path.emplace_back(tokens[i + 1]);
    i += 2;
  }
  if (!a.path.empty() && a.path.front() == "root") { a.path.erase(a.path.begin()); }

  if (i < tokens.size() && tokens[i] == "data") {
    a.mode = resource_mode::data;
    if (++i == tokens.size()) { bad_address(addr, "data resource type missing"); }
  }

  std::size_t const rest{ tokens.size() - i };
  if (rest > 2) { bad_address(addr, "too many components"); }
  if (rest == 0) { return a; }

  if (has_any(tokens[i], "[]")) { bad_address(addr, "unexpected bracket in type"); }
  a.type = tokens[i];
  if (rest == 1) { return a; }

  std::string_view name{ tokens[i + 1] };
  if (auto const open{ name.find('[') }; open != std::string_view::npos) {
    if (name.back() != ']' || open == 0) { bad_address(addr, "malformed index"); }
    if (!parse_index(name.substr(open + 1, name.size() - open - 2), a.index)) {
      bad_address(addr, "index must be a non-negative integer");
    }
    name = name.substr(0, open);
  }
  if (has_any(name, "[]")) { bad_address(addr, "unexpected bracket in name"); }
  a.name = name;
  return a;
}

std::string canonical_address(std::string_view addr) { return parse_address(addr).str(); }

std::string to_address(module_path const &path, std::string_view key) {
  auto k{ parse_state_key(key) };

  resource_address a;
  auto const begin{ (!path.empty() && path.front() == "root") ? path.begin() + 1
                                                               : path.begin() };
  a.path.assign(begin, path.end());
  a.mode = k.mode;
  a.type = std::move(k.type);
  a.name = std::move(k.name);
  a.index = k.index;
  return a.str();
}

std::pair<module_path, std::string> to_key(std::string_view addr) {
  auto a{ parse_address(addr) };
  if (a.type.empty() || a.name.empty()) {
    throw incomplete_address_error("incomplete resource address \"" + std::string(addr) +
                                   "\"");
  }

  module_path path{ root_module_path() };
  path.insert(path.end(), a.path.begin(), a.path.end());

  state_key const k{ .mode = a.mode,
                     .type = std::move(a.type),
                     .name = std::move(a.name),
                     .index = a.index };
  return { std::move(path), k.str() };
}

}  // namespace tfx
