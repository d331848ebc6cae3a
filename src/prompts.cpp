#include "prompts.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <thread>

#include <readline/readline.h>

#include "progress_aggregator.hpp"
#include "terminal.hpp"

namespace {

std::string normalise(const std::string& raw) {
  auto begin = std::find_if_not(raw.begin(), raw.end(), [](unsigned char c){ return std::isspace(c); });
  auto end = std::find_if_not(raw.rbegin(), raw.rend(), [](unsigned char c){ return std::isspace(c); }).base();
  std::string out = begin < end ? std::string(begin, end) : std::string();
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  return out;
}

// readline needs non-printing sequences bracketed to measure the prompt.
std::string invisible(const char* escape) {
  return std::string("\001") + escape + "\002";
}

} // namespace

std::optional<OverwriteDecision> parse_overwrite_answer(const std::string& answer) {
  const auto value = normalise(answer);
  if(value == "y" || value == "yes") return OverwriteDecision::proceed;
  if(value == "n" || value == "no") return OverwriteDecision::skip;
  if(value == "a" || value == "all") return OverwriteDecision::proceed_all;
  if(value == "q" || value == "quit") return OverwriteDecision::abort;
  return std::nullopt;
}

std::optional<bool> parse_confirmation(const std::string& answer) {
  const auto value = normalise(answer);
  if(value == "y" || value == "yes") return true;
  if(value == "n" || value == "no" || value.empty()) return false;
  return std::nullopt;
}

std::optional<std::string> read_answer(const std::string& prompt) {
  char* line = ::readline(prompt.c_str());
  if(!line) return std::nullopt;
  std::string answer(line);
  std::free(line);
  return answer;
}

OverwriteDecision ReadlineOverwritePolicy::decide(const std::filesystem::path& destination) {
  if(!aggregator_) {
    return ask(destination, 0);
  }
  int row = 0;
  auto hold = aggregator_->hold_display(row);
  return ask(destination, row);
}

OverwriteDecision ReadlineOverwritePolicy::ask(const std::filesystem::path& destination, int row) {
  auto& out = std::cout;
  auto to_prompt_row = [&]{
    if(row > 0) out << ansi::move_to(row) << ansi::kClearLine;
  };
  const auto prompt = invisible(ansi::kYellow) + "Overwrite '" + destination.string() + "'? [y/n/a/q]: " +
                      invisible(ansi::kReset);

  to_prompt_row();
  out << ansi::kShowCursor << std::flush;
  for(;;) {
    to_prompt_row();
    out << std::flush;
    auto answer = read_answer(prompt);
    auto decision = answer ? parse_overwrite_answer(*answer) : std::optional<OverwriteDecision>(OverwriteDecision::abort);
    if(decision) {
      to_prompt_row();
      if(*decision != OverwriteDecision::abort) {
        out << ansi::kHideCursor;
      }
      out << std::flush;
      return *decision;
    }
    to_prompt_row();
    out << ansi::kRed << "Invalid option. Use: y (yes), n (no), a (all), q (quit)" << ansi::kReset;
    if(row == 0) out << "\n";
    out << std::flush;
    std::this_thread::sleep_for(std::chrono::milliseconds(1500));
  }
}

bool confirm_deletion(std::chrono::seconds countdown) {
  auto& out = std::cout;
  for(auto remaining = countdown.count(); remaining > 0; --remaining) {
    out << "\r" << ansi::kDim << "Wait " << remaining << "s before confirming..." << ansi::kReset << "  " << std::flush;
    std::this_thread::sleep_for(std::chrono::seconds(1));
  }
  if(countdown.count() > 0) {
    out << "\r" << std::string(40, ' ') << "\r" << std::flush;
  }

  const auto prompt = invisible(ansi::kBold) + "Continue? [y/N]: " + invisible(ansi::kReset);
  for(;;) {
    auto answer = read_answer(prompt);
    if(!answer) return false;
    auto confirmed = parse_confirmation(*answer);
    if(confirmed) return *confirmed;
    out << ansi::kRed << "Invalid option. Use: y (yes) or n (no)" << ansi::kReset << "\n" << std::flush;
  }
}
