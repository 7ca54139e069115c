#include "state_transform.h"

#include "address.h"
#include "diff.h"
#include "errors.h"
#include "state.h"
#include "trace.h"
#include "tui.h"
#include "util.h"

#include <algorithm>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

namespace tfx {

namespace {

using handle = std::size_t;

// Outcome of the remap phase for one entry
struct kept {};
struct deleted {};
struct moved {
  std::string address;
};
struct superseded {
  handle by;
};
using disposition = std::variant<kept, moved, deleted, superseded>;

struct placement {
  module_path path;
  std::string key;
};

// One addressable item of a module: a resource record or an instance diff
struct entry {
  std::size_t module;
  std::string key;
  std::string address;
};

struct transform_plan {
  std::vector<disposition> dispositions;            // by handle
  std::vector<std::optional<placement>> placements;  // nullopt: deleted or superseded
  std::size_t moved_count{ 0 };
  std::size_t deleted_count{ 0 };
  std::size_t superseded_count{ 0 };
};

state_transform::map_t canonical_entries(state_transform::map_t const &entries) {
  state_transform::map_t out;
  for (auto const &[src, dst] : entries) {
    auto csrc{ canonical_address(src) };
    auto cdst{ dst.empty() ? std::string{} : canonical_address(dst) };
    if (auto const [it, inserted]{ out.emplace(csrc, std::move(cdst)) }; !inserted) {
      throw address_collision_error("transform maps \"" + it->first + "\" more than once");
    }
  }
  return out;
}

// A duplicate address means the input graph is corrupt.
void check_unique_addresses(std::vector<entry> const &entries) {
  std::unordered_set<std::string_view> seen;
  seen.reserve(entries.size());
  for (auto const &e : entries) {
    if (!seen.insert(e.address).second) {
      throw std::logic_error("tfx: address collision while indexing: " + e.address);
    }
  }
}

// Remap and resolve placement. Touches nothing but its own tables.
transform_plan make_plan(std::vector<entry> const &entries,
                         std::vector<module_path> const &module_paths,
                         state_transform::map_t const &mapping) {
  transform_plan plan;
  plan.dispositions.resize(entries.size());
  plan.placements.resize(entries.size());

  std::unordered_map<std::string, handle> final_addresses;
  final_addresses.reserve(entries.size());
  std::vector<bool> explicit_mapping(entries.size(), false);

  for (handle h{ 0 }; h < entries.size(); ++h) {
    auto const &e{ entries[h] };
    auto const it{ mapping.find(e.address) };

    if (it == mapping.end()) {  // kept unless a mapped entry already claimed the address
      if (auto const claimed{ final_addresses.find(e.address) };
          claimed != final_addresses.end()) {
        plan.dispositions[h] = superseded{ claimed->second };
      } else {
        final_addresses.emplace(e.address, h);
        plan.dispositions[h] = kept{};
      }
      continue;
    }

    if (it->second.empty()) {
      plan.dispositions[h] = deleted{};
      continue;
    }

    auto const &dst{ it->second };
    if (auto const occupant{ final_addresses.find(dst) }; occupant != final_addresses.end()) {
      if (explicit_mapping[occupant->second]) {
        throw address_collision_error("address collision for \"" + dst + "\": \"" +
                                      entries[occupant->second].address + "\" and \"" +
                                      e.address + "\" both map to it");
      }
      plan.dispositions[occupant->second] = superseded{ h };
      occupant->second = h;
    } else {
      final_addresses.emplace(dst, h);
    }
    explicit_mapping[h] = true;
    plan.dispositions[h] = moved{ dst };
  }

  for (handle h{ 0 }; h < entries.size(); ++h) {
    std::visit(match{
                   [&](kept) {
                     plan.placements[h] =
                         placement{ module_paths[entries[h].module], entries[h].key };
                   },
                   [&](moved const &m) {
                     auto [path, key]{ to_key(m.address) };
                     plan.placements[h] = placement{ std::move(path), std::move(key) };
                     ++plan.moved_count;
                   },
                   [&](deleted) { ++plan.deleted_count; },
                   [&](superseded) { ++plan.superseded_count; },
               },
               plan.dispositions[h]);
  }

  return plan;
}

void trace_plan(std::vector<entry> const &entries, transform_plan const &plan) {
  if (!tui::trace_enabled()) { return; }
  for (handle h{ 0 }; h < entries.size(); ++h) {
    std::visit(match{
                   [](kept) {},
                   [&](moved const &m) {
                     if (m.address != entries[h].address) {
                       TFX_TRACE_RESOURCE_MOVED(entries[h].address, m.address);
                     }
                   },
                   [&](deleted) { TFX_TRACE_RESOURCE_DELETED(entries[h].address); },
                   [&](superseded const &s) {
                     TFX_TRACE_RESOURCE_SUPERSEDED(entries[h].address,
                                                   entries[s.by].address);
                   },
               },
               plan.dispositions[h]);
  }
}

// Collect entries of every module of a state or diff, in module and key order.
template <typename document>
std::vector<entry> collect_entries(document const &doc,
                                   std::vector<module_path> &module_paths) {
  std::vector<entry> entries;
  for (std::size_t m{ 0 }; m < doc.modules.size(); ++m) {
    auto const &mod{ doc.modules[m] };
    module_paths.push_back(normalize_module_path(mod.path));
    for (auto const &[key, _] : mod.resources) {
      entries.push_back(entry{ .module = m, .key = key, .address = to_address(mod.path, key) });
    }
  }
  return entries;
}

// Move surviving items out of the document, clear every module, and install the
// items at their planned placement. Non-root modules left empty by the move are
// removed; modules that were already empty stay.
template <typename document, typename item>
void swap_in(document &doc,
             std::vector<entry> const &entries,
             transform_plan const &plan,
             std::vector<item> &staged) {
  std::vector<module_path> populated;
  for (auto const &mod : doc.modules) {
    if (!mod.empty()) { populated.push_back(normalize_module_path(mod.path)); }
  }

  staged.resize(entries.size());
  for (handle h{ 0 }; h < entries.size(); ++h) {
    if (!plan.placements[h]) { continue; }
    auto &mod{ doc.modules[entries[h].module] };
    staged[h] = std::move(mod.resources.at(entries[h].key));
  }

  for (auto &mod : doc.modules) { mod.clear_resources(); }

  for (handle h{ 0 }; h < entries.size(); ++h) {
    if (!plan.placements[h]) { continue; }
    auto const &p{ *plan.placements[h] };
    auto &mod{ doc.add_module(p.path) };
    if (!mod.resources.emplace(p.key, std::move(staged[h])).second) {
      throw std::logic_error("tfx: state key collision: " + p.key);
    }
  }

  std::erase_if(doc.modules, [&](auto const &mod) {
    auto const path{ normalize_module_path(mod.path) };
    return mod.empty() && !is_root_module(path) &&
           std::find(populated.begin(), populated.end(), path) != populated.end();
  });
}

}  // namespace

state_transform::state_transform(std::initializer_list<map_t::value_type> entries)
    : entries_{ entries } {}

state_transform::state_transform(map_t entries) : entries_{ std::move(entries) } {}

void state_transform::set(std::string src, std::string dst) {
  entries_.insert_or_assign(std::move(src), std::move(dst));
}

void state_transform::apply(state &s) const {
  auto const start{ std::chrono::steady_clock::now() };
  auto const mapping{ canonical_entries(entries_) };

  // Index
  std::vector<module_path> module_paths;
  auto const entries{ collect_entries(s, module_paths) };
  check_unique_addresses(entries);
  TFX_TRACE_TRANSFORM_INDEXED(static_cast<std::int64_t>(entries.size()),
                              static_cast<std::int64_t>(s.modules.size()));

  // Resolve each dependency key to a sibling entry; unknown keys stay dangling
  std::vector<std::vector<std::optional<handle>>> dep_refs(entries.size());
  {
    std::vector<std::unordered_map<std::string_view, handle>> by_key(s.modules.size());
    for (handle h{ 0 }; h < entries.size(); ++h) {
      by_key[entries[h].module].emplace(entries[h].key, h);
    }
    for (handle h{ 0 }; h < entries.size(); ++h) {
      auto const &keys{ by_key[entries[h].module] };
      auto const &record{ s.modules[entries[h].module].resources.at(entries[h].key) };
      dep_refs[h].reserve(record.dependencies.size());
      for (auto const &dep : record.dependencies) {
        auto const it{ keys.find(dep) };
        dep_refs[h].push_back(it == keys.end() ? std::nullopt
                                               : std::optional<handle>{ it->second });
        if (it == keys.end()) {
          TFX_TRACE_DEPENDENCY_DROPPED(entries[h].address, dep, "dangling");
        }
      }
    }
  }

  // Remap and resolve placement; every failure is raised before this returns
  auto const plan{ make_plan(entries, module_paths, mapping) };
  trace_plan(entries, plan);

  // Swap
  std::vector<resource_record> staged;
  swap_in(s, entries, plan, staged);

  // Rewire dependencies
  for (handle h{ 0 }; h < entries.size(); ++h) {
    if (!plan.placements[h]) { continue; }
    auto const &self{ *plan.placements[h] };

    std::vector<std::string> deps;
    deps.reserve(dep_refs[h].size());
    for (auto const &ref : dep_refs[h]) {
      if (!ref) { continue; }

      handle target{ *ref };
      if (auto const *sup{ std::get_if<superseded>(&plan.dispositions[target]) }) {
        target = sup->by;  // one level only
      }

      auto const &dst{ plan.placements[target] };
      if (!dst) {
        TFX_TRACE_DEPENDENCY_DROPPED(entries[h].address, entries[target].address, "removed");
        continue;
      }
      if (dst->path != self.path) {
        TFX_TRACE_DEPENDENCY_DROPPED(entries[h].address,
                                     entries[target].address,
                                     "cross-module");
        continue;
      }
      if (dst->key.empty() || dst->key == self.key) { continue; }
      deps.push_back(dst->key);
    }

    std::sort(deps.begin(), deps.end());
    deps.erase(std::unique(deps.begin(), deps.end()), deps.end());
    s.module_by_path(self.path)->find(self.key)->dependencies = std::move(deps);
  }

  auto const duration_ms{ std::chrono::duration_cast<std::chrono::milliseconds>(
                              std::chrono::steady_clock::now() - start)
                              .count() };
  TFX_TRACE_TRANSFORM_APPLIED(static_cast<std::int64_t>(plan.moved_count),
                              static_cast<std::int64_t>(plan.deleted_count),
                              static_cast<std::int64_t>(plan.superseded_count),
                              static_cast<std::int64_t>(duration_ms));
  tui::debug("transform: %zu moved, %zu deleted, %zu superseded",
             plan.moved_count,
             plan.deleted_count,
             plan.superseded_count);
}

void state_transform::apply_to_diff(diff &d) const {
  auto const mapping{ canonical_entries(entries_) };

  std::vector<module_path> module_paths;
  auto const entries{ collect_entries(d, module_paths) };
  check_unique_addresses(entries);

  auto const plan{ make_plan(entries, module_paths, mapping) };
  trace_plan(entries, plan);

  std::vector<instance_diff> staged;
  swap_in(d, entries, plan, staged);
  tui::debug("diff transform: %zu moved, %zu deleted, %zu superseded",
             plan.moved_count,
             plan.deleted_count,
             plan.superseded_count);
}

std::optional<state_transform> state_transform::inverse() const {
  map_t inv;
  for (auto const &[src, dst] : entries_) {
    if (dst.empty()) { return std::nullopt; }
    if (!inv.emplace(canonical_address(dst), src).second) { return std::nullopt; }
  }
  return state_transform{ std::move(inv) };
}

}  // namespace tfx
