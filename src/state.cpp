#include "state.h"

#include "state_transform.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace tfx {

resource_record *module_state::find(std::string_view key) {
  auto const it{ resources.find(std::string(key)) };
  return it == resources.end() ? nullptr : &it->second;
}

resource_record const *module_state::find(std::string_view key) const {
  auto const it{ resources.find(std::string(key)) };
  return it == resources.end() ? nullptr : &it->second;
}

bool module_state::insert(std::string key, resource_record record) {
  return resources.emplace(std::move(key), std::move(record)).second;
}

bool module_state::remove(std::string_view key) {
  return resources.erase(std::string(key)) > 0;
}

module_state *state::module_by_path(module_path const &path) {
  auto const want{ normalize_module_path(path) };
  for (auto &m : modules) {
    if (normalize_module_path(m.path) == want) { return &m; }
  }
  return nullptr;
}

module_state const *state::module_by_path(module_path const &path) const {
  auto const want{ normalize_module_path(path) };
  for (auto const &m : modules) {
    if (normalize_module_path(m.path) == want) { return &m; }
  }
  return nullptr;
}

module_state &state::add_module(module_path const &path) {
  if (auto *m{ module_by_path(path) }) { return *m; }

  auto normalized{ normalize_module_path(path) };
  auto const pos{ std::upper_bound(modules.begin(),
                                   modules.end(),
                                   normalized,
                                   [](module_path const &p, module_state const &m) {
                                     return less_module_path(p, m.path);
                                   }) };
  return *modules.insert(pos, module_state{ .path = std::move(normalized), .resources = {} });
}

module_state &state::root_module() { return add_module(root_module_path()); }

module_state const *state::root_module() const { return module_by_path(root_module_path()); }

std::size_t state::resource_count() const {
  std::size_t n{ 0 };
  for (auto const &m : modules) { n += m.resources.size(); }
  return n;
}

state make_state() {
  state s;
  s.add_module(root_module_path());
  return s;
}

state &add_state(state &a, state const &b) {
  for (auto const &bm : b.modules) {
    auto &am{ a.add_module(bm.path) };
    for (auto const &[key, record] : bm.resources) { am.insert(key, record); }
  }
  return a;
}

state &sub_state(state &a, state const &b) {
  for (auto const &bm : b.modules) {
    if (auto *am{ a.module_by_path(bm.path) }) {
      for (auto const &[key, _] : bm.resources) { am->remove(key); }
    }
  }
  return a;
}

void clear_deps(state &s) {
  for (auto &m : s.modules) {
    for (auto &[_, r] : m.resources) { r.dependencies.clear(); }
  }
}

name_normalizer::name_normalizer()
    : re_{ "^[^0-9A-Za-z][^0-9A-Za-z-]*|[^0-9A-Za-z-]+", std::regex::ECMAScript } {}

std::string name_normalizer::make_name(std::string_view s) const {
  if (s.empty()) { throw std::invalid_argument("make_name: empty name"); }
  return std::regex_replace(std::string(s), re_, "_");
}

state_transform norm_state_keys(state const &s, name_normalizer const &normalizer) {
  state_transform st;
  for (auto const &m : s.modules) {
    for (auto const &[key, record] : m.resources) {
      auto sk{ parse_state_key(key) };
      if (sk.mode != resource_mode::managed) { continue; }

      auto norm{ normalizer.make_name(record.provider + "_" + record.id) };
      if (sk.name == norm) { continue; }

      sk.name = std::move(norm);
      st.set(to_address(m.path, key), to_address(m.path, sk.str()));
    }
  }
  return st;
}

}  // namespace tfx
