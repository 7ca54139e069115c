#pragma once

#include <cstddef>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>

namespace tfx {

struct diff;
struct state;

// Resource address remapping. Keys and values are resource addresses; an empty
// value deletes the resource. Several sources may not share a destination, but a
// mapped source may land on the address of an unmapped resource, replacing it:
// {A: B} replaces an existing B with A, and resources that depended on B depend
// on A afterwards unless B is also mapped.
class state_transform {
 public:
  using map_t = std::map<std::string, std::string>;

  state_transform() = default;
  state_transform(std::initializer_list<map_t::value_type> entries);
  explicit state_transform(map_t entries);

  void set(std::string src, std::string dst);

  map_t const &entries() const { return entries_; }
  bool empty() const { return entries_.empty(); }
  std::size_t size() const { return entries_.size(); }

  // Moves, replaces and deletes resources, then rebuilds every surviving
  // dependency list (sorted, deduplicated, module-local, no self or dangling
  // edges). Throws address_parse_error, key_parse_error, incomplete_address_error
  // or address_collision_error; s is untouched when an exception escapes.
  void apply(state &s) const;

  // Same remapping over a diff keyed by the same addresses, without dependency
  // rewiring.
  void apply_to_diff(diff &d) const;

  // Reverse mapping, or nullopt if any entry deletes or two sources share a
  // destination.
  std::optional<state_transform> inverse() const;

  bool operator==(state_transform const &) const = default;

 private:
  map_t entries_;
};

}  // namespace tfx
