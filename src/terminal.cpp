#include "terminal.hpp"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <cerrno>
#include <cstring>

#include <sys/ioctl.h>

#include "log.hpp"

namespace {

std::atomic<CancellationToken*> g_interrupt_token{nullptr};
volatile sig_atomic_t g_interrupt_fd = STDOUT_FILENO;
bool g_handler_installed = false;

constexpr char kInterruptNotice[] = "\033[?25h\n\033[33m\xE2\x9A\xA0 Operation cancelled by user\033[0m\n";

void write_all(int fd, const char* data, std::size_t size) {
  while(size > 0) {
    auto written = ::write(fd, data, size);
    if(written <= 0) return;
    data += written;
    size -= static_cast<std::size_t>(written);
  }
}

extern "C" void on_interrupt(int) {
  if(auto* token = g_interrupt_token.load(std::memory_order_relaxed)) {
    token->request_stop();
  }
  write_all(g_interrupt_fd, kInterruptNotice, sizeof(kInterruptNotice) - 1);
  ::_exit(kInterruptExitStatus);
}

int env_dimension(const char* name) {
  const char* raw = std::getenv(name);
  if(!raw || !*raw) return 0;
  char* end = nullptr;
  long value = std::strtol(raw, &end, 10);
  if(end == raw || *end != '\0' || value <= 0 || value > 10000) return 0;
  return static_cast<int>(value);
}

} // namespace

namespace ansi {
std::string move_to(int row, int column) {
  return fmt::format("\033[{};{}H", row, column);
}
} // namespace ansi

TerminalSize query_terminal_size(int fd) {
  TerminalSize size;
  int columns = env_dimension("COLUMNS");
  int rows = env_dimension("LINES");
  if(columns == 0 || rows == 0) {
    struct winsize ws;
    std::memset(&ws, 0, sizeof(ws));
    if(::ioctl(fd, TIOCGWINSZ, &ws) == 0) {
      if(columns == 0 && ws.ws_col > 0) columns = ws.ws_col;
      if(rows == 0 && ws.ws_row > 0) rows = ws.ws_row;
    }
  }
  if(columns > 0) size.columns = columns;
  if(rows > 0) size.rows = rows;
  return size;
}

void install_interrupt_handler(CancellationToken& token, int fd) {
  g_interrupt_token.store(&token, std::memory_order_relaxed);
  g_interrupt_fd = fd;
  if(g_handler_installed) return;

  struct sigaction action;
  std::memset(&action, 0, sizeof(action));
  action.sa_handler = on_interrupt;
  sigemptyset(&action.sa_mask);
  action.sa_flags = SA_RESTART;
  if(::sigaction(SIGINT, &action, nullptr) != 0) {
    log_warn(nullptr, "Unable to install SIGINT handler: {}", std::strerror(errno));
    return;
  }
  g_handler_installed = true;
}

ResizeWatcher::ResizeWatcher(std::function<void()> on_resize)
  : on_resize_(std::move(on_resize)),
    signals_(io_) {}

ResizeWatcher::~ResizeWatcher() {
  stop();
}

void ResizeWatcher::start() {
  if(running_) return;
  asio::error_code ec;
  signals_.add(SIGWINCH, ec);
  if(ec) {
    log_debug(nullptr, "SIGWINCH watcher unavailable: {}", ec.message());
    return;
  }
  running_ = true;
  arm();
  thread_ = std::thread([this]{ io_.run(); });
}

void ResizeWatcher::stop() {
  if(!running_) return;
  running_ = false;
  asio::error_code ec;
  signals_.cancel(ec);
  signals_.clear(ec);
  io_.stop();
  if(thread_.joinable()) thread_.join();
}

void ResizeWatcher::arm() {
  signals_.async_wait([this](const asio::error_code& ec, int){
    if(ec) return;
    if(on_resize_) {
      try {
        on_resize_();
      } catch(const std::exception& e) {
        log_warn(nullptr, "Redraw after resize failed: {}", e.what());
      }
    }
    arm();
  });
}
