#include "tui.h"

#include <chrono>
#include <condition_variable>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <variant>

bool blext::tui::g_trace_enabled{ false };

namespace {

using blext::tui::level;

constexpr std::chrono::milliseconds kDrainInterval{ 33 };

struct queued_line {
  std::chrono::system_clock::time_point when;
  level severity;
  std::variant<std::string, blext::trace_event_t> body;
};

char const *severity_tag(level value) {
  switch (value) {
    case level::TUI_TRACE: return "TRC";
    case level::TUI_DEBUG: return "DBG";
    case level::TUI_INFO: return "INF";
    case level::TUI_WARN: return "WRN";
    case level::TUI_ERROR: return "ERR";
  }
  return "???";
}

// "[14:03:07.412 WRN] "
std::string time_prefix(level severity, std::chrono::system_clock::time_point when) {
  auto const secs{ std::chrono::time_point_cast<std::chrono::seconds>(when) };
  auto const ms{ std::chrono::duration_cast<std::chrono::milliseconds>(when - secs).count() };
  std::time_t const t{ std::chrono::system_clock::to_time_t(when) };
  std::tm local{};
  localtime_r(&t, &local);

  char buf[32]{};
  int const n{ std::snprintf(buf,
                             sizeof buf,
                             "[%02d:%02d:%02d.%03d %s] ",
                             local.tm_hour,
                             local.tm_min,
                             local.tm_sec,
                             static_cast<int>(ms),
                             severity_tag(severity)) };
  return n > 0 ? std::string{ buf, static_cast<std::size_t>(n) } : std::string{};
}

// All output leaves through one writer thread so lines from resolver and download
// workers never interleave.
class logger {
 public:
  void push(queued_line line) {
    {
      std::lock_guard const lock{ mutex_ };
      queue_.push_back(std::move(line));
    }
    wake_.notify_one();
  }

  void start(std::optional<level> threshold, bool decorated) {
    threshold_ = threshold;
    decorated_ = decorated;
    stopping_ = false;
    thread_ = std::thread{ [this] { loop(); } };
  }

  void stop() {
    {
      std::lock_guard const lock{ mutex_ };
      stopping_ = true;
    }
    wake_.notify_all();
    thread_.join();
    thread_ = std::thread{};
    stopping_ = false;
    close_trace_file();
  }

  bool running() const { return thread_.joinable(); }

  bool wants(level severity) const { return !threshold_ || severity >= *threshold_; }

  void set_sink(std::function<void(std::string_view)> sink) {
    std::lock_guard const lock{ mutex_ };
    sink_ = std::move(sink);
  }

  void set_trace_targets(bool to_stderr, std::FILE *file) {
    close_trace_file();
    trace_stderr_ = to_stderr;
    trace_file_ = file;
  }

  bool tracing() const { return trace_stderr_ || trace_file_; }

  std::mutex stdout_mutex;
  bool initialized{ false };

 private:
  void loop() {
    std::unique_lock lock{ mutex_ };
    for (;;) {
      wake_.wait_for(lock, kDrainInterval, [this] { return stopping_ || !queue_.empty(); });
      std::deque<queued_line> batch;
      batch.swap(queue_);
      bool const last{ stopping_ };
      lock.unlock();
      write_batch(batch);
      lock.lock();
      if (last && queue_.empty()) { return; }
    }
  }

  void write_batch(std::deque<queued_line> &batch) {
    bool to_stderr{ false };
    for (auto &line : batch) {
      try {
        if (auto *text{ std::get_if<std::string>(&line.body) }) {
          emit(decorate(line.severity, line.when) + *text + "\n", to_stderr);
        } else {
          write_trace(std::get<blext::trace_event_t>(line.body), line.when, to_stderr);
        }
      } catch (std::exception const &e) {
        std::fprintf(stderr, "[log writer: %s]\n", e.what());
        to_stderr = true;
      }
    }
    if (to_stderr) { std::fflush(stderr); }
  }

  void write_trace(blext::trace_event_t const &event,
                   std::chrono::system_clock::time_point when,
                   bool &to_stderr) {
    if (trace_stderr_) {
      emit(decorate(level::TUI_TRACE, when) + blext::trace_event_to_string(event) + "\n",
           to_stderr);
    }
    if (!trace_file_) { return; }
    auto const json{ blext::trace_event_to_json(event) + "\n" };
    if (std::fwrite(json.data(), 1, json.size(), trace_file_) != json.size() ||
        std::fflush(trace_file_) != 0) {
      std::fprintf(stderr, "trace file write failed; trace file disabled\n");
      to_stderr = true;
      close_trace_file();
    }
  }

  std::string decorate(level severity, std::chrono::system_clock::time_point when) const {
    return decorated_ ? time_prefix(severity, when) : std::string{};
  }

  void emit(std::string const &text, bool &to_stderr) {
    if (sink_) {
      sink_(text);
      return;
    }
    std::fwrite(text.data(), 1, text.size(), stderr);
    to_stderr = true;
  }

  void close_trace_file() {
    if (trace_file_) { std::fclose(trace_file_); }
    trace_file_ = nullptr;
  }

  std::mutex mutex_;
  std::condition_variable wake_;
  std::deque<queued_line> queue_;
  std::thread thread_;
  bool stopping_{ false };
  std::function<void(std::string_view)> sink_;
  std::optional<level> threshold_;
  bool decorated_{ false };
  bool trace_stderr_{ false };
  std::FILE *trace_file_{ nullptr };
};

logger s_log;

void require_initialized(char const *fn) {
  if (!s_log.initialized) {
    throw std::logic_error{ std::string{ "blext::tui::" } + fn + " called before init" };
  }
}

void require_stopped(char const *fn) {
  require_initialized(fn);
  if (s_log.running()) {
    throw std::logic_error{ std::string{ "blext::tui::" } + fn + " called while running" };
  }
}

std::string vformat(char const *fmt, va_list args) {
  va_list retry;
  va_copy(retry, args);
  std::string out(256, '\0');
  int n{ std::vsnprintf(out.data(), out.size(), fmt, args) };
  if (n >= 0 && static_cast<std::size_t>(n) >= out.size()) {
    out.resize(static_cast<std::size_t>(n) + 1);
    n = std::vsnprintf(out.data(), out.size(), fmt, retry);
  }
  va_end(retry);
  out.resize(n > 0 ? static_cast<std::size_t>(n) : 0);
  return out;
}

void vlog(level severity, char const *fmt, va_list args) {
  if (!s_log.initialized || !fmt || !s_log.wants(severity)) { return; }
  auto text{ vformat(fmt, args) };
  if (text.empty()) { return; }
  s_log.push({ .when = std::chrono::system_clock::now(),
               .severity = severity,
               .body = std::move(text) });
}

}  // namespace

namespace blext::tui {

void init() {
  if (s_log.initialized) { throw std::logic_error{ "blext::tui::init called more than once" }; }
  s_log.initialized = true;
  g_trace_enabled = false;
}

void configure_trace_outputs(std::vector<trace_output_spec> outputs) {
  require_stopped("configure_trace_outputs");

  bool to_stderr{ false };
  std::optional<std::filesystem::path> file_path;
  for (auto const &spec : outputs) {
    if (spec.type == trace_output_type::std_err) {
      to_stderr = true;
    } else if (spec.file_path) {
      if (file_path) { throw std::logic_error{ "Only one trace file output supported" }; }
      file_path = spec.file_path;
    }
  }

  std::FILE *file{ nullptr };
  if (file_path) {
    file = std::fopen(file_path->string().c_str(), "w");
    if (!file) { throw std::runtime_error("Failed to open trace file: " + file_path->string()); }
  }
  s_log.set_trace_targets(to_stderr, file);
  g_trace_enabled = s_log.tracing();
}

void run(std::optional<level> threshold, bool decorated_logging) {
  require_stopped("run");
  s_log.start(threshold, decorated_logging);
}

void shutdown() {
  if (!s_log.running()) {
    throw std::logic_error{ "blext::tui::shutdown called while not running" };
  }
  s_log.stop();
  g_trace_enabled = false;
}

void set_output_handler(std::function<void(std::string_view)> handler) {
  require_stopped("set_output_handler");
  s_log.set_sink(std::move(handler));
}

void trace(trace_event_t event) {
  if (!g_trace_enabled) { return; }
  s_log.push({ .when = std::chrono::system_clock::now(),
               .severity = level::TUI_TRACE,
               .body = std::move(event) });
}

#define BLEXT_TUI_LOG_FN(name, severity) \
  void name(char const *fmt, ...) { \
    va_list args; \
    va_start(args, fmt); \
    vlog(severity, fmt, args); \
    va_end(args); \
  }

BLEXT_TUI_LOG_FN(debug, level::TUI_DEBUG)
BLEXT_TUI_LOG_FN(info, level::TUI_INFO)
BLEXT_TUI_LOG_FN(warn, level::TUI_WARN)
BLEXT_TUI_LOG_FN(error, level::TUI_ERROR)

#undef BLEXT_TUI_LOG_FN

void print_stdout(char const *fmt, ...) {
  if (!fmt) { return; }
  std::lock_guard const lock{ s_log.stdout_mutex };
  va_list args;
  va_start(args, fmt);
  int const written{ std::vprintf(fmt, args) };
  va_end(args);
  if (written > 0) { std::fflush(stdout); }
}

scope::scope(std::optional<level> threshold, bool decorated_logging) {
  if (!s_log.initialized) { return; }
  run(threshold, decorated_logging);
  active = true;
}

scope::~scope() {
  if (active) { shutdown(); }
}

}  // namespace blext::tui
