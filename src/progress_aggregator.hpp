#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <mutex>
#include <string>

#include "speed_model.hpp"
#include "terminal.hpp"

struct ProgressSnapshot {
  std::uint64_t total_items = 0;
  std::uint64_t total_bytes = 0;
  std::uint64_t completed_items = 0;
  std::uint64_t completed_bytes = 0;
  std::uint64_t skipped_items = 0;
  double smoothed_speed = 0.0; // bytes per second
  std::string label;
  std::chrono::duration<double> elapsed{0.0};
  std::uint64_t sequence = 0;
};

struct ProgressSummary {
  std::uint64_t completed_items = 0;
  std::uint64_t completed_bytes = 0;
  std::uint64_t skipped_items = 0;
  double elapsed_seconds = 0.0;
  double mbps = 0.0;
  bool speed_recorded = false;
};

// Fraction done in [0, 1]: by bytes when there are any, else by items.
double progress_fraction(const ProgressSnapshot& snapshot);

// Fits a label into exactly 20 display columns: right-padded, or
// "..." followed by its last 17 characters.
std::string fit_progress_label(const std::string& label);

std::string render_progress_line(const ProgressSnapshot& snapshot, OperationKind kind, int columns);

// Shared progress state for one copy or remove job. update() and
// complete_item() may be called from any thread; terminal output happens
// outside the state lock and is skipped rather than waited for when another
// thread is already drawing.
class ProgressAggregator {
public:
  using Clock = std::chrono::steady_clock;

  static constexpr std::chrono::milliseconds kSampleInterval{100};
  static constexpr std::chrono::seconds kIdleReset{2};
  static constexpr double kSmoothing = 0.7;

  struct Options {
    OperationKind kind = OperationKind::copy;
    std::uint64_t total_items = 0;
    std::uint64_t total_bytes = 0;
    std::ostream* out = nullptr; // std::cout when null
    std::function<TerminalSize()> terminal_size;
    std::function<Clock::time_point()> now;
  };

  explicit ProgressAggregator(Options options);
  ~ProgressAggregator();

  ProgressAggregator(const ProgressAggregator&) = delete;
  ProgressAggregator& operator=(const ProgressAggregator&) = delete;

  void update(const std::string& label, std::uint64_t bytes_delta);
  void complete_item();
  void mark_skipped();

  // Re-renders at the current terminal size; counters are untouched.
  void redraw();

  ProgressSnapshot snapshot() const;

  // Clears the status line, prints the summary, restores the cursor and
  // hands the observed throughput to `speed_model` when the run was long
  // enough to measure.
  ProgressSummary finish(SpeedModel* speed_model = nullptr);

  // Blocks frame drawing while held so an interactive prompt can use the
  // row above the status line. Returns the row the prompt should use.
  std::unique_lock<std::mutex> hold_display(int& prompt_row);

  OperationKind kind() const { return options_.kind; }
  std::ostream& out() const { return *out_; }

private:
  ProgressSnapshot capture_locked() const;
  void render(const ProgressSnapshot& snapshot);
  TerminalSize terminal_size() const;
  Clock::time_point now() const;

  Options options_;
  std::ostream* out_;
  Clock::time_point started_at_;

  mutable std::mutex state_mutex_;
  std::uint64_t completed_items_ = 0;
  std::uint64_t completed_bytes_ = 0;
  std::uint64_t skipped_items_ = 0;
  std::string current_label_;
  std::uint64_t last_sample_bytes_ = 0;
  Clock::time_point last_sample_time_;
  Clock::time_point last_update_time_;
  double smoothed_speed_ = 0.0;
  std::uint64_t sequence_ = 0;

  std::mutex render_mutex_;
  std::uint64_t last_drawn_sequence_ = 0;
  bool display_started_ = false;
  bool finished_ = false;
};
