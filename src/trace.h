#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace tfx {

namespace trace_events {

struct transform_indexed {
  std::int64_t resources;
  std::int64_t modules;
};

struct resource_moved {
  std::string from;
  std::string to;
};

struct resource_deleted {
  std::string address;
};

struct resource_superseded {
  std::string address;
  std::string by;
};

struct dependency_dropped {
  std::string resource;
  std::string dependency;
  std::string reason;
};

struct transform_applied {
  std::int64_t moved;
  std::int64_t deleted;
  std::int64_t superseded;
  std::int64_t duration_ms;
};

struct dependency_inferred {
  std::string resource;
  std::string dependency;
  std::string attr;
};

struct inference_spec_skipped {
  std::string resource;
  std::string src_type;
  std::string src_attr;
  std::string reason;
};

}  // namespace trace_events

using trace_event_t = std::variant<trace_events::transform_indexed,
                                   trace_events::resource_moved,
                                   trace_events::resource_deleted,
                                   trace_events::resource_superseded,
                                   trace_events::dependency_dropped,
                                   trace_events::transform_applied,
                                   trace_events::dependency_inferred,
                                   trace_events::inference_spec_skipped>;

std::string_view trace_event_name(trace_event_t const &event);
std::string trace_event_to_string(trace_event_t const &event);
std::string trace_event_to_json(trace_event_t const &event);

namespace tui {
extern bool g_trace_enabled;
void trace(trace_event_t event);

inline bool trace_enabled() { return g_trace_enabled; }
}  // namespace tui

}  // namespace tfx

#define TFX_TRACE_UNLIKELY [[unlikely]]

#define TFX_TRACE_EMIT(event_expr) \
  do { \
    if (::tfx::tui::g_trace_enabled) TFX_TRACE_UNLIKELY { \
        ::tfx::tui::trace event_expr; \
      } \
  } while (0)

#define TFX_TRACE_TRANSFORM_INDEXED(resources_value, modules_value) \
  TFX_TRACE_EMIT((::tfx::trace_events::transform_indexed{ \
      .resources = (resources_value), \
      .modules = (modules_value), \
  }))

#define TFX_TRACE_RESOURCE_MOVED(from_value, to_value) \
  TFX_TRACE_EMIT((::tfx::trace_events::resource_moved{ \
      .from = (from_value), \
      .to = (to_value), \
  }))

#define TFX_TRACE_RESOURCE_DELETED(address_value) \
  TFX_TRACE_EMIT((::tfx::trace_events::resource_deleted{ \
      .address = (address_value), \
  }))

#define TFX_TRACE_RESOURCE_SUPERSEDED(address_value, by_value) \
  TFX_TRACE_EMIT((::tfx::trace_events::resource_superseded{ \
      .address = (address_value), \
      .by = (by_value), \
  }))

#define TFX_TRACE_DEPENDENCY_DROPPED(resource_value, dependency_value, reason_value) \
  TFX_TRACE_EMIT((::tfx::trace_events::dependency_dropped{ \
      .resource = (resource_value), \
      .dependency = (dependency_value), \
      .reason = (reason_value), \
  }))

#define TFX_TRACE_TRANSFORM_APPLIED(moved_value, \
                                    deleted_value, \
                                    superseded_value, \
                                    duration_value) \
  TFX_TRACE_EMIT((::tfx::trace_events::transform_applied{ \
      .moved = (moved_value), \
      .deleted = (deleted_value), \
      .superseded = (superseded_value), \
      .duration_ms = (duration_value), \
  }))

#define TFX_TRACE_DEPENDENCY_INFERRED(resource_value, dependency_value, attr_value) \
  TFX_TRACE_EMIT((::tfx::trace_events::dependency_inferred{ \
      .resource = (resource_value), \
      .dependency = (dependency_value), \
      .attr = (attr_value), \
  }))

#define TFX_TRACE_INFERENCE_SPEC_SKIPPED(resource_value, \
                                         src_type_value, \
                                         src_attr_value, \
                                         reason_value) \
  TFX_TRACE_EMIT((::tfx::trace_events::inference_spec_skipped{ \
      .resource = (resource_value), \
      .src_type = (src_type_value), \
      .src_attr = (src_attr_value), \
      .reason = (reason_value), \
  }))
