#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace blext {

namespace trace_events {

struct index_query {
  std::string package;
  std::string version;  // empty for version listings
  bool memo_hit;
};

struct resolve_start {
  std::string target;
  std::int64_t requirement_count;
};

struct resolve_backtrack {
  std::string target;
  std::string package;
  std::string rejected_version;
  std::int64_t attempt;
};

struct resolve_complete {
  std::string target;
  std::int64_t package_count;
  std::int64_t duration_ms;
};

struct wheel_selected {
  std::string target;
  std::string package;
  std::string version;
  std::string filename;
};

struct wheel_skipped {
  std::string package;
  std::string filename;
  std::string reason;
};

struct download_start {
  std::string filename;
  std::string url;
};

struct download_retry {
  std::string filename;
  std::int64_t attempt;
  std::string reason;
};

struct download_complete {
  std::string filename;
  std::int64_t bytes;
  std::int64_t duration_ms;
};

struct cache_hit {
  std::string key;
  std::string path;
  bool fast_path;
};

struct cache_miss {
  std::string key;
};

struct lock_acquired {
  std::string key;
  std::string lock_path;
  std::int64_t wait_duration_ms;
};

struct lock_released {
  std::string key;
  std::string lock_path;
  std::int64_t hold_duration_ms;
};

}  // namespace trace_events

using trace_event_t = std::variant<trace_events::index_query,
                                   trace_events::resolve_start,
                                   trace_events::resolve_backtrack,
                                   trace_events::resolve_complete,
                                   trace_events::wheel_selected,
                                   trace_events::wheel_skipped,
                                   trace_events::download_start,
                                   trace_events::download_retry,
                                   trace_events::download_complete,
                                   trace_events::cache_hit,
                                   trace_events::cache_miss,
                                   trace_events::lock_acquired,
                                   trace_events::lock_released>;

std::string_view trace_event_name(trace_event_t const &event);
std::string trace_event_to_string(trace_event_t const &event);
std::string trace_event_to_json(trace_event_t const &event);

namespace tui {
extern bool g_trace_enabled;
void trace(trace_event_t event);

inline bool trace_enabled() { return g_trace_enabled; }
}  // namespace tui

}  // namespace blext

#define BLEXT_TRACE_UNLIKELY [[unlikely]]

#define BLEXT_TRACE_EMIT(event_expr) \
  do { \
    if (::blext::tui::g_trace_enabled) BLEXT_TRACE_UNLIKELY { \
        ::blext::tui::trace event_expr; \
      } \
  } while (0)

#define BLEXT_TRACE_INDEX_QUERY(package_value, version_value, memo_hit_value) \
  BLEXT_TRACE_EMIT((::blext::trace_events::index_query{ \
      .package = (package_value), \
      .version = (version_value), \
      .memo_hit = (memo_hit_value), \
  }))

#define BLEXT_TRACE_RESOLVE_START(target_value, requirement_count_value) \
  BLEXT_TRACE_EMIT((::blext::trace_events::resolve_start{ \
      .target = (target_value), \
      .requirement_count = static_cast<std::int64_t>(requirement_count_value), \
  }))

#define BLEXT_TRACE_RESOLVE_BACKTRACK(target_value, package_value, version_value, attempt_value) \
  BLEXT_TRACE_EMIT((::blext::trace_events::resolve_backtrack{ \
      .target = (target_value), \
      .package = (package_value), \
      .rejected_version = (version_value), \
      .attempt = static_cast<std::int64_t>(attempt_value), \
  }))

#define BLEXT_TRACE_RESOLVE_COMPLETE(target_value, package_count_value, duration_value) \
  BLEXT_TRACE_EMIT((::blext::trace_events::resolve_complete{ \
      .target = (target_value), \
      .package_count = static_cast<std::int64_t>(package_count_value), \
      .duration_ms = static_cast<std::int64_t>(duration_value), \
  }))

#define BLEXT_TRACE_WHEEL_SELECTED(target_value, package_value, version_value, filename_value) \
  BLEXT_TRACE_EMIT((::blext::trace_events::wheel_selected{ \
      .target = (target_value), \
      .package = (package_value), \
      .version = (version_value), \
      .filename = (filename_value), \
  }))

#define BLEXT_TRACE_WHEEL_SKIPPED(package_value, filename_value, reason_value) \
  BLEXT_TRACE_EMIT((::blext::trace_events::wheel_skipped{ \
      .package = (package_value), \
      .filename = (filename_value), \
      .reason = (reason_value), \
  }))

#define BLEXT_TRACE_DOWNLOAD_START(filename_value, url_value) \
  BLEXT_TRACE_EMIT((::blext::trace_events::download_start{ \
      .filename = (filename_value), \
      .url = (url_value), \
  }))

#define BLEXT_TRACE_DOWNLOAD_RETRY(filename_value, attempt_value, reason_value) \
  BLEXT_TRACE_EMIT((::blext::trace_events::download_retry{ \
      .filename = (filename_value), \
      .attempt = static_cast<std::int64_t>(attempt_value), \
      .reason = (reason_value), \
  }))

#define BLEXT_TRACE_DOWNLOAD_COMPLETE(filename_value, bytes_value, duration_value) \
  BLEXT_TRACE_EMIT((::blext::trace_events::download_complete{ \
      .filename = (filename_value), \
      .bytes = static_cast<std::int64_t>(bytes_value), \
      .duration_ms = static_cast<std::int64_t>(duration_value), \
  }))

#define BLEXT_TRACE_CACHE_HIT(key_value, path_value, fast_path_value) \
  BLEXT_TRACE_EMIT((::blext::trace_events::cache_hit{ \
      .key = (key_value), \
      .path = (path_value), \
      .fast_path = (fast_path_value), \
  }))

#define BLEXT_TRACE_CACHE_MISS(key_value) \
  BLEXT_TRACE_EMIT((::blext::trace_events::cache_miss{ \
      .key = (key_value), \
  }))

#define BLEXT_TRACE_LOCK_ACQUIRED(key_value, lock_path_value, wait_value) \
  BLEXT_TRACE_EMIT((::blext::trace_events::lock_acquired{ \
      .key = (key_value), \
      .lock_path = (lock_path_value), \
      .wait_duration_ms = static_cast<std::int64_t>(wait_value), \
  }))

#define BLEXT_TRACE_LOCK_RELEASED(key_value, lock_path_value, hold_value) \
  BLEXT_TRACE_EMIT((::blext::trace_events::lock_released{ \
      .key = (key_value), \
      .lock_path = (lock_path_value), \
      .hold_duration_ms = static_cast<std::int64_t>(hold_value), \
  }))
