#include "prompts.hpp"
#include "terminal.hpp"
#include "test_runner_utils.hpp"

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <string>
#include <vector>

#include <sys/wait.h>
#include <unistd.h>

namespace {

using cprm::test::TestContext;
using cprm::test::TestCase;

// Sets an environment variable for the lifetime of the guard.
class EnvGuard {
public:
  EnvGuard(const char* name, const char* value) : name_(name) {
    if(const char* old = std::getenv(name)) {
      had_value_ = true;
      old_value_ = old;
    }
    if(value) ::setenv(name, value, 1);
    else ::unsetenv(name);
  }
  ~EnvGuard() {
    if(had_value_) ::setenv(name_.c_str(), old_value_.c_str(), 1);
    else ::unsetenv(name_.c_str());
  }

private:
  std::string name_;
  bool had_value_ = false;
  std::string old_value_;
};

bool test_overwrite_answers(TestContext& ctx) {
  ctx.expect(parse_overwrite_answer("y") == OverwriteDecision::proceed, "y");
  ctx.expect(parse_overwrite_answer(" YES ") == OverwriteDecision::proceed, "YES with blanks");
  ctx.expect(parse_overwrite_answer("n") == OverwriteDecision::skip, "n");
  ctx.expect(parse_overwrite_answer("No") == OverwriteDecision::skip, "No");
  ctx.expect(parse_overwrite_answer("a") == OverwriteDecision::proceed_all, "a");
  ctx.expect(parse_overwrite_answer("ALL") == OverwriteDecision::proceed_all, "ALL");
  ctx.expect(parse_overwrite_answer("q") == OverwriteDecision::abort, "q");
  ctx.expect(parse_overwrite_answer("quit") == OverwriteDecision::abort, "quit");
  ctx.expect(!parse_overwrite_answer(""), "empty answer asks again");
  return ctx.expect(!parse_overwrite_answer("maybe"), "unknown answer asks again");
}

bool test_confirmation_answers(TestContext& ctx) {
  ctx.expect(parse_confirmation("y") == std::optional<bool>(true), "y");
  ctx.expect(parse_confirmation("Yes") == std::optional<bool>(true), "Yes");
  ctx.expect(parse_confirmation("n") == std::optional<bool>(false), "n");
  ctx.expect(parse_confirmation("") == std::optional<bool>(false), "empty defaults to no");
  ctx.expect(parse_confirmation("   ") == std::optional<bool>(false), "blank defaults to no");
  return ctx.expect(!parse_confirmation("sure"), "unknown answer asks again");
}

bool test_terminal_size_from_environment(TestContext& ctx) {
  {
    EnvGuard columns("COLUMNS", "132");
    EnvGuard lines("LINES", "50");
    auto size = query_terminal_size(-1);
    ctx.expect(size.columns == 132 && size.rows == 50, "environment wins");
  }
  {
    EnvGuard columns("COLUMNS", "wide");
    EnvGuard lines("LINES", nullptr);
    auto size = query_terminal_size(-1);
    ctx.expect(size.columns == 80 && size.rows == 24, "fallback when nothing usable is found");
  }
  return ctx.failures.empty();
}

bool test_cursor_addressing(TestContext& ctx) {
  ctx.expect(ansi::move_to(24) == "\033[24;1H", "column defaults to 1");
  return ctx.expect(ansi::move_to(3, 7) == "\033[3;7H", "row and column");
}

bool test_cancellation_token(TestContext& ctx) {
  CancellationToken token;
  ctx.expect(!token.stop_requested(), "starts clear");
  token.request_stop();
  ctx.expect(token.stop_requested(), "stop observed");
  token.reset();
  return ctx.expect(!token.stop_requested(), "reset clears it");
}

bool test_resize_triggers_redraw(TestContext& ctx) {
  std::atomic<int> redraws{0};
  ResizeWatcher watcher([&redraws]{ ++redraws; });
  watcher.start();
  std::raise(SIGWINCH);
  const bool seen = cprm::test::wait_for_condition([&]{ return redraws.load() > 0; },
                                                   std::chrono::milliseconds(2000));
  watcher.stop();
  ctx.expect(seen, "SIGWINCH reaches the callback");

  const int after_stop = redraws.load();
  std::raise(SIGWINCH);
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  return ctx.expect(redraws.load() == after_stop, "no callbacks after stop");
}

bool test_interrupt_exits_with_notice(TestContext& ctx) {
  int fds[2];
  if(::pipe(fds) != 0) return ctx.expect(false, "pipe created");
  const pid_t child = ::fork();
  if(child < 0) return ctx.expect(false, "fork succeeded");
  if(child == 0) {
    ::close(fds[0]);
    static CancellationToken token;
    install_interrupt_handler(token, fds[1]);
    ::raise(SIGINT);
    ::_exit(1);
  }
  ::close(fds[1]);
  std::string output;
  char buffer[256];
  for(;;) {
    auto got = ::read(fds[0], buffer, sizeof(buffer));
    if(got < 0 && errno == EINTR) continue;
    if(got <= 0) break;
    output.append(buffer, static_cast<std::size_t>(got));
  }
  ::close(fds[0]);
  int status = 0;
  while(::waitpid(child, &status, 0) < 0 && errno == EINTR) {}

  ctx.expect(WIFEXITED(status) && WEXITSTATUS(status) == kInterruptExitStatus, "exit status 130");
  ctx.expect(output.rfind("\033[?25h", 0) == 0, "cursor shown first");
  return ctx.expect(output.find("Operation cancelled by user") != std::string::npos, "notice written");
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"overwrite_answers", test_overwrite_answers},
    {"confirmation_answers", test_confirmation_answers},
    {"terminal_size_from_environment", test_terminal_size_from_environment},
    {"cursor_addressing", test_cursor_addressing},
    {"cancellation_token", test_cancellation_token},
    {"resize_triggers_redraw", test_resize_triggers_redraw},
    {"interrupt_exits_with_notice", test_interrupt_exits_with_notice}
  };
  return cprm::test::run_test_cases("terminal", tests, argc, argv);
}
