#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

// Output channels. print/print_err are unadorned lines for the user,
// the others carry a level tag.
enum class LogChannel { debug, info, warn, error, print, print_err };

const char* channel_name(LogChannel channel);
spdlog::level::level_enum channel_level(LogChannel channel);

void init_logging(bool verbose = false);

// When false nothing reaches the terminal sinks; listeners still see
// every message. Test runners turn it off to keep their output clean.
void set_log_passthrough(bool enabled);

using LogListenerHandle = std::size_t;

// Named message source. Listeners see every message first; when none of
// them claims it the message goes to the shared spdlog sinks.
class Logger {
public:
  using Listener = std::function<bool(void* user_data,
                                      const std::string& channel,
                                      spdlog::level::level_enum level,
                                      const std::string& message)>;

  Logger() = default;
  explicit Logger(std::string name) : name_(std::move(name)) {}

  LogListenerHandle add_listener(Listener listener, void* user_data = nullptr);
  void remove_listener(LogListenerHandle handle);

  void emit(LogChannel channel, const std::string& message);

  template<typename... Args>
  void write(LogChannel channel, spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit(channel, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::debug, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::error, fmt, std::forward<Args>(args)...);
  }

private:
  struct Subscription {
    LogListenerHandle handle = 0;
    void* user_data = nullptr;
    Listener callback;
  };

  bool notify(const std::string& qualified_channel, spdlog::level::level_enum level, const std::string& message);

  std::string name_;
  std::mutex subscriptions_mutex_;
  std::vector<Subscription> subscriptions_;
  LogListenerHandle next_handle_ = 1;
};

namespace detail {
// Straight to the shared sinks, for code that has no Logger.
void emit_unowned(LogChannel channel, const std::string& message);

template<typename... Args>
void route(Logger* logger, LogChannel channel, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  auto message = fmt::format(fmt, std::forward<Args>(args)...);
  if(logger) {
    logger->emit(channel, message);
  } else {
    emit_unowned(channel, message);
  }
}
} // namespace detail

// Free helpers accept a null logger so lower layers can stay optional
// about where their messages go.
template<typename... Args>
inline void log_debug(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::route(logger, LogChannel::debug, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_warn(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::route(logger, LogChannel::warn, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_error(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::route(logger, LogChannel::error, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void print_out(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::route(logger, LogChannel::print, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void print_err(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::route(logger, LogChannel::print_err, fmt, std::forward<Args>(args)...);
}
