#include "dep_map.h"

#include "attr_value.h"
#include "errors.h"
#include "state.h"
#include "trace.h"
#include "tui.h"

#include <algorithm>
#include <utility>

namespace tfx {

namespace {

struct pending_edges {
  resource_record *record;
  std::vector<std::string> added;
};

}  // namespace

dep_map::dep_map(std::initializer_list<map_t::value_type> entries) : entries_{ entries } {}

void dep_map::add(dep_map const &other) {
  for (auto const &[type, _] : other.entries_) {
    if (entries_.contains(type)) {
      throw rule_table_error("duplicate resource type in dependency map: " + type);
    }
  }
  for (auto const &[type, specs] : other.entries_) { entries_.emplace(type, specs); }
}

void dep_map::set(std::string type, std::vector<dep_spec> specs) {
  entries_.insert_or_assign(std::move(type), std::move(specs));
}

std::vector<dep_spec> const *dep_map::find(std::string_view type) const {
  auto const it{ entries_.find(std::string(type)) };
  return it == entries_.end() ? nullptr : &it->second;
}

dep_map::infer_stats dep_map::infer(state &s, ambiguous_source_policy policy) const {
  infer_stats stats;
  std::vector<pending_edges> pending;

  for (auto &m : s.modules) {
    std::map<std::string_view, std::vector<std::string_view>> by_type;
    for (auto const &[key, record] : m.resources) { by_type[record.type].push_back(key); }

    for (auto const &[dst_type, dst_keys] : by_type) {
      auto const *specs{ find(dst_type) };
      if (!specs || specs->empty()) { continue; }

      for (auto const dst_key : dst_keys) {
        auto *dst{ m.find(dst_key) };
        ++stats.resources;
        pending_edges edges{ .record = dst, .added = {} };

        for (auto const &spec : *specs) {
          auto const values{ attr_flatten(dst->attributes, spec.attr) };
          if (values.empty()) { continue; }

          auto const srcs{ by_type.find(spec.src_type) };
          if (srcs == by_type.end()) { continue; }

          std::vector<std::string> matches;
          bool skip{ false };
          for (auto const src_key : srcs->second) {
            if (src_key == dst_key) { continue; }

            // One source value is expected, but the destination may list several
            // values that match several sources of the same type.
            auto const src_values{ attr_flatten(m.find(src_key)->attributes,
                                                spec.src_attr) };
            if (src_values.size() == 1) {
              if (std::find(values.begin(), values.end(), src_values[0]) != values.end()) {
                matches.emplace_back(src_key);
              }
            } else if (src_values.size() > 1) {
              std::string const what{ "multiple source values for " + spec.src_type + "." +
                                      spec.src_attr + " (" + std::string(src_key) + ")" };
              if (policy == ambiguous_source_policy::abort) {
                throw ambiguous_source_error(what);
              }
              tui::warn("%s: skipping rule %s -> %s",
                        std::string(dst_key).c_str(),
                        spec.attr.c_str(),
                        what.c_str());
              TFX_TRACE_INFERENCE_SPEC_SKIPPED(std::string(dst_key),
                                               spec.src_type,
                                               spec.src_attr,
                                               what);
              ++stats.skipped;
              skip = true;
              break;
            }
          }
          if (skip) { continue; }

          for (auto &match : matches) {
            TFX_TRACE_DEPENDENCY_INFERRED(std::string(dst_key), match, spec.attr);
            edges.added.push_back(std::move(match));
          }
        }

        stats.added += edges.added.size();
        pending.push_back(std::move(edges));
      }
    }
  }

  for (auto &edges : pending) {
    auto &deps{ edges.record->dependencies };
    deps.insert(deps.end(),
                std::make_move_iterator(edges.added.begin()),
                std::make_move_iterator(edges.added.end()));
    std::sort(deps.begin(), deps.end());
    deps.erase(std::unique(deps.begin(), deps.end()), deps.end());
  }

  tui::debug("infer: %zu resources examined, %zu edges inferred, %zu rules skipped",
             stats.resources,
             stats.added,
             stats.skipped);
  return stats;
}

}  // namespace tfx
