#pragma once

#include <cstdint>
#include <initializer_list>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tfx {

struct attr_value;

using attr_list = std::vector<attr_value>;
using attr_map = std::map<std::string, attr_value>;

// Unordered collection kept sorted and deduplicated so iteration order is stable
class attr_set {
 public:
  attr_set() = default;
  attr_set(std::initializer_list<attr_value> values);
  explicit attr_set(std::vector<attr_value> values);

  void insert(attr_value value);

  std::vector<attr_value> const &members() const { return members_; }
  std::size_t size() const;
  bool empty() const;

 private:
  std::vector<attr_value> members_;
};

using attr_variant = std::variant<std::monostate,
                                  bool,
                                  std::int64_t,
                                  double,
                                  std::string,
                                  attr_list,
                                  attr_set,
                                  attr_map>;

struct attr_value {
  attr_variant v;

  attr_value() = default;
  attr_value(bool b) : v{ b } {}
  attr_value(int i) : v{ static_cast<std::int64_t>(i) } {}
  attr_value(std::int64_t i) : v{ i } {}
  attr_value(double d) : v{ d } {}
  attr_value(char const *s) : v{ std::string(s) } {}
  attr_value(std::string s) : v{ std::move(s) } {}
  attr_value(attr_list l) : v{ std::move(l) } {}
  attr_value(attr_set s) : v{ std::move(s) } {}
  attr_value(attr_map m) : v{ std::move(m) } {}

  bool is_null() const { return std::holds_alternative<std::monostate>(v); }
  bool is_list() const { return std::holds_alternative<attr_list>(v); }
  bool is_set() const { return std::holds_alternative<attr_set>(v); }
  bool is_map() const { return std::holds_alternative<attr_map>(v); }
};

// Total order: by alternative first, then by value (containers lexicographically)
int attr_compare(attr_value const &a, attr_value const &b);

bool operator==(attr_value const &a, attr_value const &b);
bool operator<(attr_value const &a, attr_value const &b);
bool operator==(attr_set const &a, attr_set const &b);

// String form of a scalar leaf; empty for null and containers
std::string attr_scalar_string(attr_value const &value);

// Collect every non-empty scalar reached by a dotted path. Lists and sets are
// traversed transparently (a numeric segment selects one list element), a map
// reached with no remaining segments contributes all its leaves, and missing keys
// contribute nothing. Throws attribute_path_error if the path continues past a
// scalar.
std::vector<std::string> attr_flatten(attr_map const &attrs, std::string_view path);

}  // namespace tfx
