#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

struct LogOptions {
  bool verbose = false;
  std::string log_file;     // empty: console sinks only
  bool passthrough = true;  // false silences the default sinks (tests)
};

void init_logging(const LogOptions& options = LogOptions{});
void set_log_passthrough(bool enabled);
bool log_passthrough();

using LogListenerHandle = std::size_t;

// Component logger. Lines go to registered listeners first; when no listener
// consumes a line it is written to the process-wide spdlog sinks.
class Logger {
public:
  using Listener = std::function<bool(const std::string& channel,
                                      spdlog::level::level_enum level,
                                      const std::string& message)>;

  Logger() = default;
  explicit Logger(std::string component);

  const std::string& component() const { return component_; }

  LogListenerHandle add_listener(Listener listener);
  void remove_listener(LogListenerHandle handle);
  void clear_listeners();

  template<typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write("debug", spdlog::level::debug, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write("info", spdlog::level::info, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write("warn", spdlog::level::warn, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write("error", spdlog::level::err, fmt::format(fmt, std::forward<Args>(args)...));
  }

  // Plain user-facing output (shell tables, prompts), no timestamp prefix.
  template<typename... Args>
  void print(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write("print", spdlog::level::info, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void print_err(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write("print_err", spdlog::level::err, fmt::format(fmt, std::forward<Args>(args)...));
  }

private:
  void write(const char* channel, spdlog::level::level_enum level, const std::string& message);
  bool notify_listeners(const std::string& channel,
                        spdlog::level::level_enum level,
                        const std::string& message);

  std::string component_;
  std::mutex listener_mutex_;
  std::unordered_map<LogListenerHandle, Listener> listeners_;
  std::atomic<LogListenerHandle> next_listener_id_{1};
};

namespace detail {
void emit_default(const char* channel,
                  const std::string& component,
                  spdlog::level::level_enum level,
                  const std::string& message);
} // namespace detail

template<typename... Args>
inline void log_debug(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  if(logger) {
    logger->debug(fmt, std::forward<Args>(args)...);
  } else {
    detail::emit_default("debug", "", spdlog::level::debug, fmt::format(fmt, std::forward<Args>(args)...));
  }
}

template<typename... Args>
inline void log_info(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  if(logger) {
    logger->info(fmt, std::forward<Args>(args)...);
  } else {
    detail::emit_default("info", "", spdlog::level::info, fmt::format(fmt, std::forward<Args>(args)...));
  }
}

template<typename... Args>
inline void log_warn(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  if(logger) {
    logger->warn(fmt, std::forward<Args>(args)...);
  } else {
    detail::emit_default("warn", "", spdlog::level::warn, fmt::format(fmt, std::forward<Args>(args)...));
  }
}

template<typename... Args>
inline void log_error(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  if(logger) {
    logger->error(fmt, std::forward<Args>(args)...);
  } else {
    detail::emit_default("error", "", spdlog::level::err, fmt::format(fmt, std::forward<Args>(args)...));
  }
}

template<typename... Args>
inline void print_out(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  if(logger) {
    logger->print(fmt, std::forward<Args>(args)...);
  } else {
    detail::emit_default("print", "", spdlog::level::info, fmt::format(fmt, std::forward<Args>(args)...));
  }
}

template<typename... Args>
inline void print_err(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  if(logger) {
    logger->print_err(fmt, std::forward<Args>(args)...);
  } else {
    detail::emit_default("print_err", "", spdlog::level::err, fmt::format(fmt, std::forward<Args>(args)...));
  }
}
