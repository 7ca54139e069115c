#include "attr_value.h"

#include "errors.h"
#include "util.h"

#include <algorithm>
#include <charconv>
#include <string>

namespace tfx {

namespace {

template <typename T>
int three_way(T const &a, T const &b) {
  if (a < b) { return -1; }
  if (b < a) { return 1; }
  return 0;
}

int compare_sequences(std::vector<attr_value> const &a, std::vector<attr_value> const &b) {
  auto const n{ std::min(a.size(), b.size()) };
  for (std::size_t i{ 0 }; i < n; ++i) {
    if (int const c{ attr_compare(a[i], b[i]) }; c != 0) { return c; }
  }
  return three_way(a.size(), b.size());
}

int compare_maps(attr_map const &a, attr_map const &b) {
  auto ia{ a.begin() };
  auto ib{ b.begin() };
  for (; ia != a.end() && ib != b.end(); ++ia, ++ib) {
    if (int const c{ ia->first.compare(ib->first) }; c != 0) { return c < 0 ? -1 : 1; }
    if (int const c{ attr_compare(ia->second, ib->second) }; c != 0) { return c; }
  }
  return three_way(a.size(), b.size());
}

std::string format_double(double d) {
  char buf[64]{};
  auto const [ptr, ec]{ std::to_chars(buf, buf + sizeof buf, d) };
  if (ec != std::errc{}) { return std::to_string(d); }
  return std::string(buf, ptr);
}

std::pair<std::string_view, std::string_view> split_segment(std::string_view path) {
  auto const dot{ path.find('.') };
  if (dot == std::string_view::npos) { return { path, {} }; }
  return { path.substr(0, dot), path.substr(dot + 1) };
}

bool is_list_index(std::string_view seg, std::size_t &out) {
  if (seg.empty()) { return false; }
  auto const [ptr, ec]{ std::from_chars(seg.data(), seg.data() + seg.size(), out) };
  return ec == std::errc{} && ptr == seg.data() + seg.size();
}

void collect(attr_value const &value,
             std::string_view rest,
             std::string_view full,
             std::vector<std::string> &out) {
  std::visit(
      match{
          [](std::monostate) {},
          [&](attr_list const &list) {
            std::size_t idx{ 0 };
            auto const [seg, next]{ split_segment(rest) };
            if (is_list_index(seg, idx)) {
              if (idx < list.size()) { collect(list[idx], next, full, out); }
              return;
            }
            for (auto const &e : list) { collect(e, rest, full, out); }
          },
          [&](attr_set const &set) {
            for (auto const &e : set.members()) { collect(e, rest, full, out); }
          },
          [&](attr_map const &map) {
            if (rest.empty()) {
              for (auto const &[_, e] : map) { collect(e, rest, full, out); }
              return;
            }
            auto const [seg, next]{ split_segment(rest) };
            if (auto const it{ map.find(std::string(seg)) }; it != map.end()) {
              collect(it->second, next, full, out);
            }
          },
          [&](auto const &) {
            if (!rest.empty()) {
              throw attribute_path_error("attribute path \"" + std::string(full) +
                                         "\" continues past a scalar at \"" +
                                         std::string(rest) + "\"");
            }
            if (auto s{ attr_scalar_string(value) }; !s.empty()) {
              out.push_back(std::move(s));
            }
          },
      },
      value.v);
}

}  // namespace

attr_set::attr_set(std::initializer_list<attr_value> values) {
  for (auto const &v : values) { insert(v); }
}

attr_set::attr_set(std::vector<attr_value> values) : members_{ std::move(values) } {
  std::sort(members_.begin(), members_.end());
  members_.erase(std::unique(members_.begin(), members_.end()), members_.end());
}

void attr_set::insert(attr_value value) {
  auto const it{ std::lower_bound(members_.begin(), members_.end(), value) };
  if (it != members_.end() && *it == value) { return; }
  members_.insert(it, std::move(value));
}

std::size_t attr_set::size() const { return members_.size(); }

bool attr_set::empty() const { return members_.empty(); }

int attr_compare(attr_value const &a, attr_value const &b) {
  if (a.v.index() != b.v.index()) { return three_way(a.v.index(), b.v.index()); }

  return std::visit(
      match{
          [](std::monostate, std::monostate) { return 0; },
          [](bool x, bool y) { return three_way(x, y); },
          [](std::int64_t x, std::int64_t y) { return three_way(x, y); },
          [](double x, double y) { return three_way(x, y); },
          [](std::string const &x, std::string const &y) { return three_way(x, y); },
          [](attr_list const &x, attr_list const &y) { return compare_sequences(x, y); },
          [](attr_set const &x, attr_set const &y) {
            return compare_sequences(x.members(), y.members());
          },
          [](attr_map const &x, attr_map const &y) { return compare_maps(x, y); },
          [](auto const &, auto const &) { return 0; },  // unreachable, indices match
      },
      a.v,
      b.v);
}

bool operator==(attr_value const &a, attr_value const &b) { return attr_compare(a, b) == 0; }

bool operator<(attr_value const &a, attr_value const &b) { return attr_compare(a, b) < 0; }

bool operator==(attr_set const &a, attr_set const &b) {
  return compare_sequences(a.members(), b.members()) == 0;
}

std::string attr_scalar_string(attr_value const &value) {
  return std::visit(match{
                        [](bool b) -> std::string { return b ? "true" : "false"; },
                        [](std::int64_t i) { return std::to_string(i); },
                        [](double d) { return format_double(d); },
                        [](std::string const &s) { return s; },
                        [](auto const &) { return std::string{}; },
                    },
                    value.v);
}

std::vector<std::string> attr_flatten(attr_map const &attrs, std::string_view path) {
  if (path.empty()) { throw attribute_path_error("empty attribute path"); }

  std::vector<std::string> out;
  if (auto const it{ attrs.find(std::string(path)) }; it != attrs.end()) {
    collect(it->second, {}, path, out);  // literal flat key, e.g. "tags.Name"
    return out;
  }

  auto const [seg, next]{ split_segment(path) };
  if (auto const it{ attrs.find(std::string(seg)) }; it != attrs.end()) {
    collect(it->second, next, path, out);
  }
  return out;
}

}  // namespace tfx
