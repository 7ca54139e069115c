#pragma once

#include <stdexcept>

namespace tfx {

// Malformed module-local state key, e.g. "aws_instance" or "a.b.c.d"
struct key_parse_error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Malformed resource address text
struct address_parse_error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Address names a module but no resource (empty type or name)
struct incomplete_address_error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Two explicitly mapped sources target the same destination
struct address_collision_error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Dependency source attribute yields more than one value for a candidate
struct ambiguous_source_error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Attribute path descends into a scalar
struct attribute_path_error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct rule_table_error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct document_error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

}  // namespace tfx
