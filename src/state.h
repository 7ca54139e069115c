#pragma once

#include "address.h"
#include "attr_value.h"

#include <cstdint>
#include <map>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace tfx {

class state_transform;

// One tracked infrastructure object. Mode, name and index live in the state key
// the record is stored under.
struct resource_record {
  std::string type;
  std::string provider;
  std::string id;  // primary ID
  attr_map attributes;
  std::vector<std::string> dependencies;  // state keys in the same module

  bool operator==(resource_record const &) const = default;
};

struct module_state {
  module_path path;
  std::map<std::string, resource_record> resources;  // state key -> record

  resource_record *find(std::string_view key);
  resource_record const *find(std::string_view key) const;

  // Returns false if the key is already present
  bool insert(std::string key, resource_record record);
  bool remove(std::string_view key);

  // Drops every resource but keeps the module itself
  void clear_resources() { resources.clear(); }

  bool empty() const { return resources.empty(); }

  bool operator==(module_state const &) const = default;
};

struct state {
  static constexpr int kVersion{ 3 };
  static constexpr char const *kZeroLineage{ "00000000-0000-0000-0000-000000000000" };

  int version{ kVersion };
  std::int64_t serial{ 0 };
  std::string lineage{ kZeroLineage };
  std::vector<module_state> modules;  // ordered by less_module_path

  module_state *module_by_path(module_path const &path);
  module_state const *module_by_path(module_path const &path) const;

  // Lookup-or-create, keeping module order
  module_state &add_module(module_path const &path);

  module_state &root_module();
  module_state const *root_module() const;

  std::size_t resource_count() const;

  bool operator==(state const &) const = default;
};

// Empty state with a root module and the zero lineage.
state make_state();

// a += b; resources already present in a are kept.
state &add_state(state &a, state const &b);

// a -= b by state key.
state &sub_state(state &a, state const &b);

void clear_deps(state &s);

// Rewrites arbitrary text into a valid resource name. Holds its compiled
// expression so callers construct it once and pass it along.
class name_normalizer {
 public:
  name_normalizer();

  std::string make_name(std::string_view s) const;  // throws on empty input

 private:
  std::regex re_;
};

// Renames managed resources to make_name(provider + "_" + id). Returns an empty
// transform if every resource already has its normalized name.
state_transform norm_state_keys(state const &s, name_normalizer const &normalizer);

}  // namespace tfx
