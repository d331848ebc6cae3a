#pragma once

#include <asio.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

#include <unistd.h>

namespace ansi {
inline constexpr const char* kReset = "\033[0m";
inline constexpr const char* kBold = "\033[1m";
inline constexpr const char* kDim = "\033[2m";
inline constexpr const char* kRed = "\033[31m";
inline constexpr const char* kGreen = "\033[32m";
inline constexpr const char* kYellow = "\033[33m";
inline constexpr const char* kBlue = "\033[34m";
inline constexpr const char* kCyan = "\033[36m";

inline constexpr const char* kHideCursor = "\033[?25l";
inline constexpr const char* kShowCursor = "\033[?25h";
inline constexpr const char* kClearLine = "\033[2K";

std::string move_to(int row, int column = 1);
} // namespace ansi

struct TerminalSize {
  int columns = 80;
  int rows = 24;
};

// $COLUMNS/$LINES when set, then ioctl on `fd`, then 80x24.
TerminalSize query_terminal_size(int fd = STDOUT_FILENO);

// Set from a signal handler, polled by copy loops at block and buffer
// boundaries.
class CancellationToken {
public:
  void request_stop() noexcept { stopped_.store(true, std::memory_order_relaxed); }
  bool stop_requested() const noexcept { return stopped_.load(std::memory_order_relaxed); }
  void reset() noexcept { stopped_.store(false, std::memory_order_relaxed); }

private:
  static_assert(std::atomic<bool>::is_always_lock_free, "signal handlers need a lock-free flag");
  std::atomic<bool> stopped_{false};
};

inline constexpr int kInterruptExitStatus = 130;

// SIGINT: stop `token`, show the cursor, print the cancellation
// notice on `fd` and _exit(130). Only async-signal-safe calls are made;
// no lock is taken.
void install_interrupt_handler(CancellationToken& token, int fd = STDOUT_FILENO);

// Runs `on_resize` on a private io_context thread whenever SIGWINCH fires.
class ResizeWatcher {
public:
  explicit ResizeWatcher(std::function<void()> on_resize);
  ~ResizeWatcher();

  ResizeWatcher(const ResizeWatcher&) = delete;
  ResizeWatcher& operator=(const ResizeWatcher&) = delete;

  void start();
  void stop();

private:
  void arm();

  std::function<void()> on_resize_;
  asio::io_context io_;
  asio::signal_set signals_;
  std::thread thread_;
  bool running_ = false;
};
