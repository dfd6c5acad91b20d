#include "log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstring>
#include <exception>
#include <vector>

namespace {

struct DefaultSinks {
  std::shared_ptr<spdlog::logger> info;
  std::shared_ptr<spdlog::logger> error;
  std::shared_ptr<spdlog::logger> print;
  std::shared_ptr<spdlog::logger> print_err;
};

std::mutex g_sinks_mutex;
DefaultSinks g_sinks;
std::atomic<bool> g_passthrough{true};

constexpr const char* kTimestampPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

std::shared_ptr<spdlog::logger> make_logger(const std::string& name,
                                            std::vector<spdlog::sink_ptr> sinks) {
  auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
  spdlog::drop(name);
  spdlog::register_logger(logger);
  return logger;
}

void build_sinks_locked(const LogOptions& options) {
  auto out_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  out_sink->set_pattern(kTimestampPattern);
  auto err_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  err_sink->set_pattern(kTimestampPattern);
  auto plain_out = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  plain_out->set_pattern("%v");
  auto plain_err = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  plain_err->set_pattern("%v");

  std::vector<spdlog::sink_ptr> info_sinks{out_sink};
  std::vector<spdlog::sink_ptr> error_sinks{err_sink};
  if(!options.log_file.empty()) {
    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.log_file, false);
    file_sink->set_pattern(kTimestampPattern);
    info_sinks.push_back(file_sink);
    error_sinks.push_back(file_sink);
  }

  g_sinks.info = make_logger("lantern.info", info_sinks);
  g_sinks.error = make_logger("lantern.error", error_sinks);
  g_sinks.print = make_logger("lantern.print", {plain_out});
  g_sinks.print_err = make_logger("lantern.print_err", {plain_err});

  g_sinks.info->flush_on(spdlog::level::warn);
  g_sinks.error->flush_on(spdlog::level::err);
  g_sinks.print->flush_on(spdlog::level::info);
  g_sinks.print_err->flush_on(spdlog::level::err);
}

spdlog::logger* sink_for(const char* channel) {
  std::lock_guard<std::mutex> lock(g_sinks_mutex);
  if(!g_sinks.info) build_sinks_locked(LogOptions{});
  if(std::strcmp(channel, "print") == 0) return g_sinks.print.get();
  if(std::strcmp(channel, "print_err") == 0) return g_sinks.print_err.get();
  if(std::strcmp(channel, "error") == 0) return g_sinks.error.get();
  return g_sinks.info.get();
}

} // namespace

void init_logging(const LogOptions& options) {
  std::lock_guard<std::mutex> lock(g_sinks_mutex);
  build_sinks_locked(options);
  auto level = options.verbose ? spdlog::level::debug : spdlog::level::info;
  g_sinks.info->set_level(level);
  g_sinks.error->set_level(spdlog::level::info);
  g_sinks.print->set_level(spdlog::level::info);
  g_sinks.print_err->set_level(spdlog::level::info);
  spdlog::set_default_logger(g_sinks.info);
  spdlog::set_level(level);
  g_passthrough.store(options.passthrough, std::memory_order_release);
}

void set_log_passthrough(bool enabled) {
  g_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_passthrough.load(std::memory_order_acquire);
}

Logger::Logger(std::string component) : component_(std::move(component)) {}

LogListenerHandle Logger::add_listener(Listener listener) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listener_mutex_);
  const auto handle = next_listener_id_++;
  listeners_.emplace(handle, std::move(listener));
  return handle;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(handle);
}

void Logger::clear_listeners() {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.clear();
}

void Logger::write(const char* channel, spdlog::level::level_enum level, const std::string& message) {
  std::string channel_name = component_.empty() ? std::string(channel) : component_ + ":" + channel;
  if(notify_listeners(channel_name, level, message)) return;
  detail::emit_default(channel, component_, level, message);
}

bool Logger::notify_listeners(const std::string& channel,
                              spdlog::level::level_enum level,
                              const std::string& message) {
  std::vector<Listener> snapshot;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) snapshot.push_back(entry.second);
  }
  bool consumed = false;
  for(auto& listener : snapshot) {
    try {
      if(listener(channel, level, message)) consumed = true;
    } catch(const std::exception& e) {
      detail::emit_default("error", component_, spdlog::level::err,
                           fmt::format("log listener failed: {}", e.what()));
    }
  }
  return consumed;
}

namespace detail {

void emit_default(const char* channel,
                  const std::string& component,
                  spdlog::level::level_enum level,
                  const std::string& message) {
  auto* sink = sink_for(channel);
  if(!log_passthrough() || !sink) return;
  bool plain = std::strncmp(channel, "print", 5) == 0;
  if(component.empty() || plain) {
    sink->log(level, message);
  } else {
    sink->log(level, fmt::format("[{}] {}", component, message));
  }
}

} // namespace detail
