#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tfx {

using module_path = std::vector<std::string>;

enum class resource_mode { managed, data };

// Module-local identity: "[data.]type.name[.index]"
struct state_key {
  resource_mode mode{ resource_mode::managed };
  std::string type;
  std::string name;
  int index{ -1 };  // -1 = no count

  std::string str() const;

  bool operator==(state_key const &) const = default;
};

// Canonical identity: "(module.<name>.)*[data.]type.name[[index]]", root unqualified
struct resource_address {
  module_path path;  // empty = root
  resource_mode mode{ resource_mode::managed };
  std::string type;
  std::string name;
  int index{ -1 };

  std::string str() const;

  bool operator==(resource_address const &) const = default;
};

module_path const &root_module_path();
bool is_root_module(module_path const &path);

// Maps an empty path to {"root"}, leaves others untouched
module_path normalize_module_path(module_path path);

// Root first, then component-wise lexicographic, shorter prefixes first
bool less_module_path(module_path const &a, module_path const &b);

std::string module_path_str(module_path const &path);  // "root" or "root.a.b"

state_key parse_state_key(std::string_view key);  // throws key_parse_error
resource_address parse_address(std::string_view addr);  // throws address_parse_error

// Parse and re-format; drops the "module.root." alias
std::string canonical_address(std::string_view addr);

// Decode a state key within a module into its canonical address string.
std::string to_address(module_path const &path, std::string_view key);

// Inverse of to_address. Throws incomplete_address_error if type or name is empty.
std::pair<module_path, std::string> to_key(std::string_view addr);

}  // namespace tfx
