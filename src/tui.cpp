#include "tui.h"

#include "platform.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <variant>

bool stackctl::tui::g_trace_enabled{ false };

namespace {

using stackctl::tui::level;

constexpr std::chrono::milliseconds kFlushInterval{ 33 };

struct log_line {
  std::chrono::system_clock::time_point when;
  level severity;
  std::string text;
};

using pending_entry = std::variant<log_line, stackctl::trace_event_t>;
using output_handler_t = std::function<void(std::string_view)>;

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

// "[2024-05-01 12:00:00.123] [INF] "
std::string decoration(level severity, std::chrono::system_clock::time_point when) {
  auto const secs{ std::chrono::time_point_cast<std::chrono::seconds>(when) };
  auto const ms{ std::chrono::duration_cast<std::chrono::milliseconds>(when - secs) };

  std::time_t const t{ std::chrono::system_clock::to_time_t(when) };
  std::tm local{};
  localtime_r(&t, &local);

  char stamp[24]{};
  if (std::strftime(stamp, sizeof stamp, "%Y-%m-%d %H:%M:%S", &local) == 0) { return {}; }

  char out[64]{};
  int const n{ std::snprintf(out,
                             sizeof out,
                             "[%s.%03d] [%s] ",
                             stamp,
                             static_cast<int>(ms.count()),
                             severity_tag(severity)) };
  return n > 0 ? std::string(out, static_cast<size_t>(n)) : std::string{};
}

std::optional<std::string> vformat(char const *fmt, va_list args) {
  va_list retry;
  va_copy(retry, args);

  std::string text(256, '\0');
  int n{ std::vsnprintf(text.data(), text.size(), fmt, args) };
  if (n >= 0 && static_cast<size_t>(n) >= text.size()) {
    text.resize(static_cast<size_t>(n) + 1);
    n = std::vsnprintf(text.data(), text.size(), fmt, retry);
  }
  va_end(retry);

  if (n <= 0) { return std::nullopt; }
  text.resize(static_cast<size_t>(n));
  return text;
}

// Owns the queue between callers and the writer thread, plus the trace sinks.
class log_pump {
 public:
  bool initialized{ false };
  bool decorated{ false };
  std::optional<level> threshold;
  output_handler_t handler;

  bool trace_to_stderr{ false };
  std::FILE *trace_file{ nullptr };

  std::mutex stdout_mutex;

  void push(pending_entry entry) {
    {
      std::lock_guard<std::mutex> lock{ mutex_ };
      queue_.push_back(std::move(entry));
    }
    cv_.notify_one();
  }

  bool running() const { return writer_.joinable(); }

  void start() {
    stop_ = false;
    writer_ = std::thread{ [this] { writer_loop(); } };
  }

  void stop() {
    stop_ = true;
    cv_.notify_all();
    writer_.join();
    writer_ = std::thread{};
    stop_ = false;
  }

  void close_trace_file() {
    if (trace_file) {
      std::fclose(trace_file);
      trace_file = nullptr;
    }
  }

 private:
  void writer_loop() {
    std::unique_lock<std::mutex> lock{ mutex_ };
    for (;;) {
      std::deque<pending_entry> batch;
      batch.swap(queue_);
      bool const last{ stop_.load() };

      lock.unlock();
      drain(batch);
      if (last) { return; }
      lock.lock();

      cv_.wait_for(lock, kFlushInterval, [this] { return stop_.load() || !queue_.empty(); });
    }
  }

  void drain(std::deque<pending_entry> &batch) {
    bool touched_stderr{ false };
    auto const write{ [&](std::string const &text) {
      if (handler) {
        handler(text);
      } else {
        std::fwrite(text.data(), 1, text.size(), stderr);
        touched_stderr = true;
      }
    } };

    for (auto &entry : batch) {
      if (auto const *line{ std::get_if<log_line>(&entry) }) {
        std::string out{ decorated ? decoration(line->severity, line->when) : std::string{} };
        out += line->text;
        out += '\n';
        write(out);
        continue;
      }

      auto const &event{ std::get<stackctl::trace_event_t>(entry) };
      if (trace_to_stderr) {
        std::string out{ decorated ? decoration(level::TUI_TRACE,
                                                std::chrono::system_clock::now())
                                   : std::string{} };
        out += stackctl::trace_event_to_string(event);
        out += '\n';
        write(out);
      }
      if (trace_file) { append_trace_json(event, write); }
    }

    if (!handler && touched_stderr) { std::fflush(stderr); }
  }

  // A failing trace file is closed and reported once; logging carries on.
  template <typename writer>
  void append_trace_json(stackctl::trace_event_t const &event, writer const &write) {
    auto const json{ stackctl::trace_event_to_json(event) + "\n" };
    if (std::fwrite(json.data(), 1, json.size(), trace_file) == json.size() &&
        std::fflush(trace_file) == 0) {
      return;
    }
    close_trace_file();
    stackctl::tui::g_trace_enabled = trace_to_stderr;
    write("[stackctl] trace file write failed; file tracing disabled\n");
  }

  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<pending_entry> queue_;
  std::thread writer_;
  std::atomic_bool stop_{ false };
};

log_pump s_pump;

void submit(level severity, char const *fmt, va_list args) {
  if (!s_pump.initialized || fmt == nullptr) { return; }
  if (s_pump.threshold && severity < *s_pump.threshold) { return; }

  auto text{ vformat(fmt, args) };
  if (!text) { return; }
  s_pump.push(log_line{ .when = std::chrono::system_clock::now(),
                        .severity = severity,
                        .text = std::move(*text) });
}

void require_idle(char const *what) {
  if (!s_pump.initialized) {
    throw std::logic_error{ std::string{ "stackctl::tui::" } + what + " called before init" };
  }
  if (s_pump.running()) {
    throw std::logic_error{ std::string{ "stackctl::tui::" } + what + " called while running" };
  }
}

}  // namespace

namespace stackctl::tui {

void init() {
  if (s_pump.initialized) {
    throw std::logic_error{ "stackctl::tui::init called more than once" };
  }
  s_pump.initialized = true;
  s_pump.threshold.reset();
  s_pump.decorated = false;
  g_trace_enabled = false;
}

void configure_trace_outputs(std::vector<trace_output_spec> outputs) {
  require_idle("configure_trace_outputs");

  s_pump.close_trace_file();
  s_pump.trace_to_stderr = false;

  for (auto const &spec : outputs) {
    if (spec.type == trace_output_type::std_err) {
      s_pump.trace_to_stderr = true;
      continue;
    }
    if (!spec.file_path) { continue; }
    if (s_pump.trace_file) { throw std::logic_error{ "Only one trace file output supported" }; }
    s_pump.trace_file = std::fopen(spec.file_path->string().c_str(), "w");
    if (!s_pump.trace_file) {
      throw std::runtime_error{ "Failed to open trace file: " + spec.file_path->string() };
    }
  }

  g_trace_enabled = s_pump.trace_to_stderr || s_pump.trace_file != nullptr;
}

void set_output_handler(std::function<void(std::string_view)> handler) {
  require_idle("set_output_handler");
  s_pump.handler = std::move(handler);
}

void run(std::optional<level> threshold, bool decorated_logging) {
  if (!s_pump.initialized) { throw std::logic_error{ "stackctl::tui::run called before init" }; }
  if (s_pump.running()) {
    throw std::logic_error{ "stackctl::tui::run called while already running" };
  }
  s_pump.threshold = threshold;
  s_pump.decorated = decorated_logging;
  s_pump.start();
}

void shutdown() {
  if (!s_pump.running()) {
    throw std::logic_error{ "stackctl::tui::shutdown called while not running" };
  }
  s_pump.stop();
  g_trace_enabled = false;
  s_pump.trace_to_stderr = false;
  s_pump.close_trace_file();
}

bool is_tty() { return platform::is_tty(); }

void trace(trace_event_t event) {
  if (g_trace_enabled) { s_pump.push(std::move(event)); }
}

#define STACKCTL_TUI_SUBMIT(severity) \
  va_list args;                       \
  va_start(args, fmt);                \
  submit(severity, fmt, args);        \
  va_end(args)

void debug(char const *fmt, ...) { STACKCTL_TUI_SUBMIT(level::TUI_DEBUG); }
void info(char const *fmt, ...) { STACKCTL_TUI_SUBMIT(level::TUI_INFO); }
void warn(char const *fmt, ...) { STACKCTL_TUI_SUBMIT(level::TUI_WARN); }
void error(char const *fmt, ...) { STACKCTL_TUI_SUBMIT(level::TUI_ERROR); }

#undef STACKCTL_TUI_SUBMIT

void print_stdout(char const *fmt, ...) {
  if (!fmt) { return; }
  std::lock_guard<std::mutex> lock{ s_pump.stdout_mutex };

  va_list args;
  va_start(args, fmt);
  int const written{ std::vprintf(fmt, args) };
  va_end(args);

  if (written > 0) { std::fflush(stdout); }
}

scope::scope(std::optional<level> threshold, bool decorated_logging) {
  if (!s_pump.initialized) { return; }
  run(threshold, decorated_logging);
  active = true;
}

scope::~scope() {
  if (active) { shutdown(); }
}

}  // namespace stackctl::tui
