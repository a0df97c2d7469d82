#include "trace.h"

#include "util.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdio>
#include <ctime>
#include <string>

namespace blext {

namespace {

using fields_t = nlohmann::ordered_json;

// 2026-03-01T12:00:00.123Z
std::string utc_timestamp(std::chrono::system_clock::time_point now) {
  auto const secs{ std::chrono::floor<std::chrono::seconds>(now) };
  auto const ms{ std::chrono::duration_cast<std::chrono::milliseconds>(now - secs).count() };
  std::time_t const t{ std::chrono::system_clock::to_time_t(secs) };
  std::tm utc{};
  gmtime_r(&t, &utc);

  char buf[40]{};
  std::size_t const n{ std::strftime(buf, sizeof buf, "%Y-%m-%dT%H:%M:%S", &utc) };
  if (n == 0) { return {}; }
  std::snprintf(buf + n, sizeof buf - n, ".%03dZ", static_cast<int>(ms));
  return buf;
}

// Payload of each event in a fixed key order; shared by the text and JSON forms.
fields_t fields_of(trace_event_t const &event) {
  return std::visit(
      match{
          [](trace_events::index_query const &e) -> fields_t {
            return { { "package", e.package }, { "version", e.version }, { "memo_hit", e.memo_hit } };
          },
          [](trace_events::resolve_start const &e) -> fields_t {
            return { { "target", e.target }, { "requirement_count", e.requirement_count } };
          },
          [](trace_events::resolve_backtrack const &e) -> fields_t {
            return { { "target", e.target },
                     { "package", e.package },
                     { "rejected_version", e.rejected_version },
                     { "attempt", e.attempt } };
          },
          [](trace_events::resolve_complete const &e) -> fields_t {
            return { { "target", e.target },
                     { "package_count", e.package_count },
                     { "duration_ms", e.duration_ms } };
          },
          [](trace_events::wheel_selected const &e) -> fields_t {
            return { { "target", e.target },
                     { "package", e.package },
                     { "version", e.version },
                     { "filename", e.filename } };
          },
          [](trace_events::wheel_skipped const &e) -> fields_t {
            return { { "package", e.package }, { "filename", e.filename }, { "reason", e.reason } };
          },
          [](trace_events::download_start const &e) -> fields_t {
            return { { "filename", e.filename }, { "url", e.url } };
          },
          [](trace_events::download_retry const &e) -> fields_t {
            return { { "filename", e.filename }, { "attempt", e.attempt }, { "reason", e.reason } };
          },
          [](trace_events::download_complete const &e) -> fields_t {
            return { { "filename", e.filename },
                     { "bytes", e.bytes },
                     { "duration_ms", e.duration_ms } };
          },
          [](trace_events::cache_hit const &e) -> fields_t {
            return { { "key", e.key }, { "path", e.path }, { "fast_path", e.fast_path } };
          },
          [](trace_events::cache_miss const &e) -> fields_t { return { { "key", e.key } }; },
          [](trace_events::lock_acquired const &e) -> fields_t {
            return { { "key", e.key },
                     { "lock_path", e.lock_path },
                     { "wait_duration_ms", e.wait_duration_ms } };
          },
          [](trace_events::lock_released const &e) -> fields_t {
            return { { "key", e.key },
                     { "lock_path", e.lock_path },
                     { "hold_duration_ms", e.hold_duration_ms } };
          },
      },
      event);
}

}  // namespace

#define TRACE_NAME(type) \
  [](trace_events::type const &) -> std::string_view { return #type; }

std::string_view trace_event_name(trace_event_t const &event) {
  return std::visit(match{
                        TRACE_NAME(index_query),
                        TRACE_NAME(resolve_start),
                        TRACE_NAME(resolve_backtrack),
                        TRACE_NAME(resolve_complete),
                        TRACE_NAME(wheel_selected),
                        TRACE_NAME(wheel_skipped),
                        TRACE_NAME(download_start),
                        TRACE_NAME(download_retry),
                        TRACE_NAME(download_complete),
                        TRACE_NAME(cache_hit),
                        TRACE_NAME(cache_miss),
                        TRACE_NAME(lock_acquired),
                        TRACE_NAME(lock_released),
                    },
                    event);
}

#undef TRACE_NAME

std::string trace_event_to_string(trace_event_t const &event) {
  std::string text{ trace_event_name(event) };
  for (auto const &[key, value] : fields_of(event).items()) {
    if (value.is_string()) {
      auto const &s{ value.get_ref<std::string const &>() };
      if (s.empty()) { continue; }  // e.g. index_query without a version
      text += " " + key + "=" + s;
    } else {
      text += " " + key + "=" + value.dump();
    }
  }
  return text;
}

std::string trace_event_to_json(trace_event_t const &event) {
  fields_t line{ { "ts", utc_timestamp(std::chrono::system_clock::now()) },
                 { "event", std::string{ trace_event_name(event) } } };
  line.update(fields_of(event));
  return line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace blext
