#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <atomic>

namespace {

// One spdlog logger per destination. Diagnostics go to stderr so that
// redirecting stdout still shows problems; plain lines carry no tag.
struct Sinks {
  std::shared_ptr<spdlog::logger> status;
  std::shared_ptr<spdlog::logger> diagnostics;
  std::shared_ptr<spdlog::logger> plain_out;
  std::shared_ptr<spdlog::logger> plain_err;
};

std::atomic<bool> g_passthrough{true};

std::shared_ptr<spdlog::logger> make_sink_logger(const char* name, spdlog::sink_ptr sink, const char* pattern) {
  sink->set_pattern(pattern);
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  logger->set_level(spdlog::level::info);
  logger->flush_on(spdlog::level::debug);
  return logger;
}

Sinks& sinks() {
  static Sinks instance = []{
    Sinks s;
    s.status = make_sink_logger("cprm.status",
      std::make_shared<spdlog::sinks::stdout_color_sink_mt>(), "%^%v%$");
    s.diagnostics = make_sink_logger("cprm.diag",
      std::make_shared<spdlog::sinks::stderr_color_sink_mt>(), "%^%l: %v%$");
    s.plain_out = make_sink_logger("cprm.print",
      std::make_shared<spdlog::sinks::stdout_color_sink_mt>(), "%v");
    s.plain_err = make_sink_logger("cprm.print_err",
      std::make_shared<spdlog::sinks::stderr_color_sink_mt>(), "%v");
    s.diagnostics->set_level(spdlog::level::warn);
    return s;
  }();
  return instance;
}

spdlog::logger& sink_for(LogChannel channel) {
  auto& s = sinks();
  switch(channel) {
    case LogChannel::print:     return *s.plain_out;
    case LogChannel::print_err: return *s.plain_err;
    case LogChannel::warn:
    case LogChannel::error:     return *s.diagnostics;
    case LogChannel::debug:
    case LogChannel::info:      break;
  }
  return *s.status;
}

} // namespace

const char* channel_name(LogChannel channel) {
  switch(channel) {
    case LogChannel::debug:     return "debug";
    case LogChannel::info:      return "info";
    case LogChannel::warn:      return "warn";
    case LogChannel::error:     return "error";
    case LogChannel::print:     return "print";
    case LogChannel::print_err: return "print_err";
  }
  return "info";
}

spdlog::level::level_enum channel_level(LogChannel channel) {
  switch(channel) {
    case LogChannel::debug:     return spdlog::level::debug;
    case LogChannel::warn:      return spdlog::level::warn;
    case LogChannel::error:
    case LogChannel::print_err: return spdlog::level::err;
    case LogChannel::info:
    case LogChannel::print:     break;
  }
  return spdlog::level::info;
}

void set_log_passthrough(bool enabled) {
  g_passthrough.store(enabled, std::memory_order_release);
}

void init_logging(bool verbose) {
  auto& s = sinks();
  const auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  s.status->set_level(level);
  spdlog::set_default_logger(s.status);
  spdlog::set_level(level);
}

LogListenerHandle Logger::add_listener(Listener listener, void* user_data) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(subscriptions_mutex_);
  const auto handle = next_handle_++;
  subscriptions_.push_back({handle, user_data, std::move(listener)});
  return handle;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(subscriptions_mutex_);
  subscriptions_.erase(std::remove_if(subscriptions_.begin(), subscriptions_.end(),
                                      [handle](const Subscription& s){ return s.handle == handle; }),
                       subscriptions_.end());
}

bool Logger::notify(const std::string& qualified_channel,
                    spdlog::level::level_enum level,
                    const std::string& message) {
  std::vector<Subscription> current;
  {
    std::lock_guard<std::mutex> lock(subscriptions_mutex_);
    current = subscriptions_;
  }
  bool claimed = false;
  for(auto& subscription : current) {
    try {
      claimed = subscription.callback(subscription.user_data, qualified_channel, level, message) || claimed;
    } catch(const std::exception& e) {
      detail::emit_unowned(LogChannel::error, fmt::format("log listener failed: {}", e.what()));
    }
  }
  return claimed;
}

void Logger::emit(LogChannel channel, const std::string& message) {
  const auto level = channel_level(channel);
  const std::string qualified = name_.empty()
    ? std::string(channel_name(channel))
    : name_ + ":" + channel_name(channel);
  if(notify(qualified, level, message)) return;

  if(channel == LogChannel::debug && !name_.empty()) {
    detail::emit_unowned(channel, fmt::format("[{}] {}", name_, message));
  } else {
    detail::emit_unowned(channel, message);
  }
}

namespace detail {

void emit_unowned(LogChannel channel, const std::string& message) {
  if(!g_passthrough.load(std::memory_order_acquire)) return;
  sink_for(channel).log(channel_level(channel), message);
}

} // namespace detail
