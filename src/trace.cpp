#include "trace.h"

#include "util.h"

#include "nlohmann/json.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <sstream>
#include <string>

namespace tfx {

namespace {

std::tm make_utc_tm(std::time_t time) {
  std::tm result{};
  gmtime_r(&time, &result);
  return result;
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
  auto const seconds{ std::chrono::time_point_cast<std::chrono::seconds>(tp) };
  auto const millis{
    std::chrono::duration_cast<std::chrono::milliseconds>(tp - seconds).count()
  };

  std::time_t const timestamp{ std::chrono::system_clock::to_time_t(seconds) };
  std::tm const utc_tm{ make_utc_tm(timestamp) };

  char base[32]{};
  if (std::strftime(base, sizeof base, "%Y-%m-%dT%H:%M:%S", &utc_tm) == 0) { return {}; }

  char buffer[64]{};
  int const written{ std::snprintf(buffer,
                                   sizeof buffer,
                                   "%s.%03lldZ",
                                   base,
                                   static_cast<long long>(millis)) };
  if (written <= 0) { return {}; }

  return std::string{ buffer, static_cast<std::size_t>(written) };
}

}  // namespace

#define TRACE_NAME(type) \
  [](trace_events::type const &) -> std::string_view { return #type; }

std::string_view trace_event_name(trace_event_t const &event) {
  return std::visit(match{
                        TRACE_NAME(transform_indexed),
                        TRACE_NAME(resource_moved),
                        TRACE_NAME(resource_deleted),
                        TRACE_NAME(resource_superseded),
                        TRACE_NAME(dependency_dropped),
                        TRACE_NAME(transform_applied),
                        TRACE_NAME(dependency_inferred),
                        TRACE_NAME(inference_spec_skipped),
                    },
                    event);
}

#undef TRACE_NAME

std::string trace_event_to_string(trace_event_t const &event) {
  return std::visit(
      match{
          [](trace_events::transform_indexed const &value) {
            std::ostringstream oss;
            oss << "transform_indexed resources=" << value.resources
                << " modules=" << value.modules;
            return oss.str();
          },
          [](trace_events::resource_moved const &value) {
            std::ostringstream oss;
            oss << "resource_moved from=" << value.from << " to=" << value.to;
            return oss.str();
          },
          [](trace_events::resource_deleted const &value) {
            return "resource_deleted address=" + value.address;
          },
          [](trace_events::resource_superseded const &value) {
            std::ostringstream oss;
            oss << "resource_superseded address=" << value.address << " by=" << value.by;
            return oss.str();
          },
          [](trace_events::dependency_dropped const &value) {
            std::ostringstream oss;
            oss << "dependency_dropped resource=" << value.resource
                << " dependency=" << value.dependency << " reason=" << value.reason;
            return oss.str();
          },
          [](trace_events::transform_applied const &value) {
            std::ostringstream oss;
            oss << "transform_applied moved=" << value.moved << " deleted=" << value.deleted
                << " superseded=" << value.superseded
                << " duration_ms=" << value.duration_ms;
            return oss.str();
          },
          [](trace_events::dependency_inferred const &value) {
            std::ostringstream oss;
            oss << "dependency_inferred resource=" << value.resource
                << " dependency=" << value.dependency << " attr=" << value.attr;
            return oss.str();
          },
          [](trace_events::inference_spec_skipped const &value) {
            std::ostringstream oss;
            oss << "inference_spec_skipped resource=" << value.resource
                << " src=" << value.src_type << "." << value.src_attr
                << " reason=" << value.reason;
            return oss.str();
          },
      },
      event);
}

std::string trace_event_to_json(trace_event_t const &event) {
  nlohmann::ordered_json out;
  out["ts"] = format_timestamp(std::chrono::system_clock::now());
  out["event"] = std::string(trace_event_name(event));

  std::visit(match{
                 [&](trace_events::transform_indexed const &value) {
                   out["resources"] = value.resources;
                   out["modules"] = value.modules;
                 },
                 [&](trace_events::resource_moved const &value) {
                   out["from"] = value.from;
                   out["to"] = value.to;
                 },
                 [&](trace_events::resource_deleted const &value) {
                   out["address"] = value.address;
                 },
                 [&](trace_events::resource_superseded const &value) {
                   out["address"] = value.address;
                   out["by"] = value.by;
                 },
                 [&](trace_events::dependency_dropped const &value) {
                   out["resource"] = value.resource;
                   out["dependency"] = value.dependency;
                   out["reason"] = value.reason;
                 },
                 [&](trace_events::transform_applied const &value) {
                   out["moved"] = value.moved;
                   out["deleted"] = value.deleted;
                   out["superseded"] = value.superseded;
                   out["duration_ms"] = value.duration_ms;
                 },
                 [&](trace_events::dependency_inferred const &value) {
                   out["resource"] = value.resource;
                   out["dependency"] = value.dependency;
                   out["attr"] = value.attr;
                 },
                 [&](trace_events::inference_spec_skipped const &value) {
                   out["resource"] = value.resource;
                   out["src_type"] = value.src_type;
                   out["src_attr"] = value.src_attr;
                   out["reason"] = value.reason;
                 },
             },
             event);

  return out.dump();
}

}  // namespace tfx
