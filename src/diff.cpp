#include "diff.h"

#include <algorithm>
#include <cstdio>
#include <string>

namespace tfx {

namespace {

struct report_group {
  int order;
  char const *label;
};

report_group group_for(diff_change_type type) {
  switch (type) {
    case diff_change_type::create: return { 1, "MISSING RESOURCE" };
    case diff_change_type::destroy: return { 2, "EXTRA RESOURCE" };
    default: return { 3, "ATTRIBUTE MISMATCH" };
  }
}

std::string quote(std::string_view s) {
  std::string out{ "\"" };
  for (char const c : s) {
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\t': out += "\\t"; break;
      default: out += c; break;
    }
  }
  out += '"';
  return out;
}

}  // namespace

bool instance_diff::requires_new() const {
  return std::any_of(attributes.begin(), attributes.end(), [](auto const &kv) {
    return kv.second.requires_new;
  });
}

char const *diff_change_type_name(diff_change_type type) {
  switch (type) {
    case diff_change_type::none: return "none";
    case diff_change_type::create: return "create";
    case diff_change_type::update: return "update";
    case diff_change_type::destroy: return "destroy";
    case diff_change_type::destroy_create: return "destroy_create";
  }
  return "unknown";
}

diff_change_type change_type(instance_diff const &d) {
  if (d.empty()) { return diff_change_type::none; }
  bool const requires_new{ d.requires_new() };
  if (requires_new && (d.destroy || d.destroy_tainted)) {
    return diff_change_type::destroy_create;
  }
  if (d.destroy) { return diff_change_type::destroy; }
  if (requires_new) { return diff_change_type::create; }
  return diff_change_type::update;
}

module_diff *diff::module_by_path(module_path const &path) {
  auto const want{ normalize_module_path(path) };
  for (auto &m : modules) {
    if (normalize_module_path(m.path) == want) { return &m; }
  }
  return nullptr;
}

module_diff const *diff::module_by_path(module_path const &path) const {
  auto const want{ normalize_module_path(path) };
  for (auto const &m : modules) {
    if (normalize_module_path(m.path) == want) { return &m; }
  }
  return nullptr;
}

module_diff &diff::add_module(module_path const &path) {
  if (auto *m{ module_by_path(path) }) { return *m; }
  modules.push_back(module_diff{ .path = normalize_module_path(path), .resources = {} });
  return modules.back();
}

bool diff::empty() const {
  return std::all_of(modules.begin(), modules.end(), [](module_diff const &m) {
    return m.empty();
  });
}

diff &normalize_diff(diff &d) {
  std::erase_if(d.modules, [](module_diff const &m) { return m.empty(); });
  std::stable_sort(d.modules.begin(),
                   d.modules.end(),
                   [](module_diff const &a, module_diff const &b) {
                     return less_module_path(a.path, b.path);
                   });
  return d;
}

std::string explain_diff(diff const &d) {
  struct entry {
    std::string name;
    instance_diff const *diff;
    diff_change_type type;
  };

  std::vector<entry> entries;
  for (auto const &m : d.modules) {
    for (auto const &[key, id] : m.resources) {
      auto type{ change_type(id) };
      if (type == diff_change_type::none) { continue; }
      if (type == diff_change_type::destroy_create) { type = diff_change_type::update; }
      entries.push_back({ to_address(m.path, key), &id, type });
    }
  }

  std::sort(entries.begin(), entries.end(), [](entry const &a, entry const &b) {
    int const ao{ group_for(a.type).order };
    int const bo{ group_for(b.type).order };
    return ao < bo || (ao == bo && a.name < b.name);
  });

  std::string out;
  bool first{ true };
  diff_change_type current{ diff_change_type::none };
  for (auto const &e : entries) {
    if (first || e.type != current) {
      if (!first) { out += '\n'; }
      out += group_for(e.type).label;
      out += ":\n";
      current = e.type;
      first = false;
    } else if (current == diff_change_type::update) {
      out += '\n';
    }

    out += "- " + e.name + "\n";
    if (e.type != diff_change_type::update) { continue; }

    std::vector<std::string_view> keys;
    std::size_t width{ 0 };
    for (auto const &[name, attr] : e.diff->attributes) {
      if (attr.new_value == attr.old_value || (attr.new_computed && !attr.old_value.empty())) {
        continue;
      }
      keys.push_back(name);
      width = std::max(width, name.size());
    }

    for (auto const name : keys) {
      auto const &attr{ e.diff->attributes.at(std::string(name)) };
      std::string have{ quote(attr.old_value) };
      std::string want{ attr.new_computed ? quote("<computed>") : quote(attr.new_value) };
      if (attr.sensitive) {
        have = quote("<sensitive>");
        want = quote("<sensitive>, value mismatch");
      }
      std::string padded{ name };
      padded.resize(width, ' ');
      out += "  " + padded + " = " + have + " (expected: " + want + ")\n";
    }
  }

  if (!out.empty() && out.back() == '\n') { out.pop_back(); }
  return out;
}

}  // namespace tfx
