#pragma once

#include <cstddef>
#include <initializer_list>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace tfx {

struct state;

// The value of attr is obtained by interpolating "${src_type.<name>.src_attr}".
struct dep_spec {
  std::string attr;
  std::string src_type;
  std::string src_attr;

  bool operator==(dep_spec const &) const = default;
};

// What to do when a source attribute yields more than one value for a candidate
enum class ambiguous_source_policy {
  abort,      // throw ambiguous_source_error, state untouched
  skip_spec,  // drop that spec for the destination, warn, continue
};

// Dependency inference rules keyed by destination resource type
class dep_map {
 public:
  using map_t = std::map<std::string, std::vector<dep_spec>>;

  struct infer_stats {
    std::size_t resources{ 0 };  // destinations examined
    std::size_t added{ 0 };      // edges inferred (before dedup)
    std::size_t skipped{ 0 };    // specs skipped under skip_spec
  };

  dep_map() = default;
  dep_map(std::initializer_list<map_t::value_type> entries);

  // Merge another table. Throws rule_table_error if a type is defined in both.
  void add(dep_map const &other);
  void set(std::string type, std::vector<dep_spec> specs);

  std::vector<dep_spec> const *find(std::string_view type) const;
  map_t const &entries() const { return entries_; }
  bool empty() const { return entries_.empty(); }

  // Adds inferred edges to every resource whose type has rules; never removes
  // existing edges. Dependency lists of those resources end sorted and unique.
  // Nothing is written until every module has been processed.
  infer_stats infer(state &s,
                    ambiguous_source_policy policy = ambiguous_source_policy::abort) const;

 private:
  map_t entries_;
};

}  // namespace tfx
