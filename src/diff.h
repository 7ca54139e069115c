#pragma once

#include "address.h"

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace tfx {

struct attr_diff {
  std::string old_value;
  std::string new_value;
  bool new_computed{ false };
  bool new_removed{ false };
  bool requires_new{ false };
  bool sensitive{ false };

  bool operator==(attr_diff const &) const = default;
};

struct instance_diff {
  std::map<std::string, attr_diff> attributes;
  bool destroy{ false };
  bool destroy_tainted{ false };

  bool empty() const { return !destroy && !destroy_tainted && attributes.empty(); }
  bool requires_new() const;

  bool operator==(instance_diff const &) const = default;
};

enum class diff_change_type { none, create, update, destroy, destroy_create };

char const *diff_change_type_name(diff_change_type type);
diff_change_type change_type(instance_diff const &d);

struct module_diff {
  module_path path;
  std::map<std::string, instance_diff> resources;  // state key -> diff

  bool empty() const { return resources.empty(); }
  void clear_resources() { resources.clear(); }

  bool operator==(module_diff const &) const = default;
};

// Changeset keyed by the same addressing scheme as state
struct diff {
  std::vector<module_diff> modules;

  module_diff *module_by_path(module_path const &path);
  module_diff const *module_by_path(module_path const &path) const;
  module_diff &add_module(module_path const &path);

  bool empty() const;

  bool operator==(diff const &) const = default;
};

// Remove empty modules and sort the rest by path.
diff &normalize_diff(diff &d);

// Human-readable report of creates, destroys and attribute mismatches.
std::string explain_diff(diff const &d);

}  // namespace tfx
