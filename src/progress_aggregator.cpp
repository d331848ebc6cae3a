#include "progress_aggregator.hpp"

#include <algorithm>
#include <iostream>
#include <vector>

#include "utils.hpp"

namespace {

constexpr std::size_t kLabelColumns = 20;
constexpr double kMiB = 1024.0 * 1024.0;

std::vector<std::string> split_code_points(const std::string& text) {
  std::vector<std::string> points;
  for(std::size_t i = 0; i < text.size();) {
    auto lead = static_cast<unsigned char>(text[i]);
    std::size_t width = 1;
    if(lead >= 0xF0) width = 4;
    else if(lead >= 0xE0) width = 3;
    else if(lead >= 0xC0) width = 2;
    width = std::min(width, text.size() - i);
    points.emplace_back(text.substr(i, width));
    i += width;
  }
  return points;
}

std::string repeat(const char* glyph, int count) {
  std::string out;
  for(int i = 0; i < count; ++i) out += glyph;
  return out;
}

const char* progress_icon(OperationKind kind) {
  return kind == OperationKind::copy ? "\xF0\x9F\x93\x8B" : "\xF0\x9F\x97\x91\xEF\xB8\x8F ";
}

const char* summary_icon(OperationKind kind) {
  return kind == OperationKind::copy ? "\xE2\x9C\x85" : "\xF0\x9F\x97\x91\xEF\xB8\x8F ";
}

} // namespace

double progress_fraction(const ProgressSnapshot& snapshot) {
  double fraction = 1.0;
  if(snapshot.total_bytes > 0) {
    fraction = static_cast<double>(snapshot.completed_bytes) / static_cast<double>(snapshot.total_bytes);
  } else if(snapshot.total_items > 0) {
    fraction = static_cast<double>(snapshot.completed_items) / static_cast<double>(snapshot.total_items);
  }
  return std::clamp(fraction, 0.0, 1.0);
}

std::string fit_progress_label(const std::string& label) {
  auto points = split_code_points(label);
  std::string out;
  if(points.size() > kLabelColumns) {
    out = "...";
    for(auto it = points.end() - static_cast<std::ptrdiff_t>(kLabelColumns - 3); it != points.end(); ++it) {
      out += *it;
    }
    return out;
  }
  out = label;
  out.append(kLabelColumns - points.size(), ' ');
  return out;
}

std::string render_progress_line(const ProgressSnapshot& snapshot, OperationKind kind, int columns) {
  const double fraction = progress_fraction(snapshot);
  const auto pct = fmt::format("{:5.1f}%", fraction * 100.0);
  const auto items = fmt::format("{}/{}", snapshot.completed_items, snapshot.total_items);
  const auto sizes = format_size(static_cast<double>(snapshot.completed_bytes)) + "/" +
                     format_size(static_cast<double>(snapshot.total_bytes));
  const auto speed = snapshot.smoothed_speed > 0.0 ? format_speed(snapshot.smoothed_speed) : std::string("---");
  const auto timing = format_time(snapshot.elapsed.count()) + " @ " + speed;
  const auto name = fit_progress_label(snapshot.label);

  // icon, space, pct, space, brackets, space, then the " | " separated fields
  const auto fixed_len = static_cast<int>(2 + 1 + 6 + 1 + 2 + 1 + items.size() + 3 + sizes.size() + 3 +
                                          timing.size() + 3 + kLabelColumns);
  const int bar_width = std::max(10, columns - fixed_len - 5);
  const int filled = static_cast<int>(bar_width * fraction);

  return fmt::format("{} {}{}{} [{}{}{}{}{}] {} | {} | {}{}{} | {}{}{}",
                     progress_icon(kind),
                     ansi::kBold, pct, ansi::kReset,
                     ansi::kGreen, repeat("\xE2\x96\x88", filled),
                     ansi::kDim, repeat("\xE2\x96\x91", bar_width - filled), ansi::kReset,
                     items, sizes,
                     ansi::kDim, timing, ansi::kReset,
                     ansi::kCyan, name, ansi::kReset);
}

ProgressAggregator::ProgressAggregator(Options options)
  : options_(std::move(options)),
    out_(options_.out ? options_.out : &std::cout) {
  started_at_ = now();
  last_sample_time_ = started_at_;
  last_update_time_ = started_at_;
}

ProgressAggregator::~ProgressAggregator() {
  std::lock_guard<std::mutex> lock(render_mutex_);
  if(display_started_ && !finished_) {
    *out_ << ansi::kShowCursor << std::flush;
  }
}

ProgressAggregator::Clock::time_point ProgressAggregator::now() const {
  return options_.now ? options_.now() : Clock::now();
}

TerminalSize ProgressAggregator::terminal_size() const {
  return options_.terminal_size ? options_.terminal_size() : query_terminal_size();
}

ProgressSnapshot ProgressAggregator::capture_locked() const {
  ProgressSnapshot snap;
  snap.total_items = options_.total_items;
  snap.total_bytes = options_.total_bytes;
  snap.completed_items = completed_items_;
  snap.completed_bytes = completed_bytes_;
  snap.skipped_items = skipped_items_;
  snap.smoothed_speed = smoothed_speed_;
  snap.label = current_label_;
  snap.sequence = sequence_;
  return snap;
}

void ProgressAggregator::update(const std::string& label, std::uint64_t bytes_delta) {
  ProgressSnapshot snap;
  {
    const auto t = now();
    std::lock_guard<std::mutex> lock(state_mutex_);
    current_label_ = label;
    completed_bytes_ += bytes_delta;

    if(t - last_update_time_ > kIdleReset) {
      // Likely blocked on a prompt; the gap says nothing about throughput.
      smoothed_speed_ = 0.0;
      last_sample_bytes_ = completed_bytes_;
      last_sample_time_ = t;
    } else if(t - last_sample_time_ >= kSampleInterval) {
      const double dt = std::chrono::duration<double>(t - last_sample_time_).count();
      const double instant = static_cast<double>(completed_bytes_ - last_sample_bytes_) / dt;
      smoothed_speed_ = kSmoothing * smoothed_speed_ + (1.0 - kSmoothing) * instant;
      last_sample_bytes_ = completed_bytes_;
      last_sample_time_ = t;
    }
    last_update_time_ = t;

    ++sequence_;
    snap = capture_locked();
    snap.elapsed = t - started_at_;
  }
  render(snap);
}

void ProgressAggregator::complete_item() {
  std::lock_guard<std::mutex> lock(state_mutex_);
  ++completed_items_;
}

void ProgressAggregator::mark_skipped() {
  std::lock_guard<std::mutex> lock(state_mutex_);
  ++skipped_items_;
}

void ProgressAggregator::redraw() {
  ProgressSnapshot snap;
  {
    const auto t = now();
    std::lock_guard<std::mutex> lock(state_mutex_);
    ++sequence_;
    snap = capture_locked();
    snap.elapsed = t - started_at_;
  }
  render(snap);
}

ProgressSnapshot ProgressAggregator::snapshot() const {
  const auto t = now();
  std::lock_guard<std::mutex> lock(state_mutex_);
  auto snap = capture_locked();
  snap.elapsed = t - started_at_;
  return snap;
}

void ProgressAggregator::render(const ProgressSnapshot& snapshot) {
  std::unique_lock<std::mutex> lock(render_mutex_, std::try_to_lock);
  if(!lock.owns_lock() || finished_) return;
  if(snapshot.sequence <= last_drawn_sequence_) return;
  last_drawn_sequence_ = snapshot.sequence;

  const auto size = terminal_size();
  auto& out = *out_;
  if(!display_started_) {
    display_started_ = true;
    out << ansi::kHideCursor << "\n";
  }
  out << ansi::move_to(size.rows) << ansi::kClearLine
      << render_progress_line(snapshot, options_.kind, size.columns)
      << ansi::move_to(std::max(1, size.rows - 1)) << std::flush;
}

std::unique_lock<std::mutex> ProgressAggregator::hold_display(int& prompt_row) {
  std::unique_lock<std::mutex> lock(render_mutex_);
  prompt_row = std::max(1, terminal_size().rows - 1);
  return lock;
}

ProgressSummary ProgressAggregator::finish(SpeedModel* speed_model) {
  const auto snap = snapshot();
  ProgressSummary summary;
  summary.completed_items = snap.completed_items;
  summary.completed_bytes = snap.completed_bytes;
  summary.skipped_items = snap.skipped_items;
  summary.elapsed_seconds = snap.elapsed.count();
  if(summary.elapsed_seconds > 0.0) {
    summary.mbps = static_cast<double>(snap.completed_bytes) / kMiB / summary.elapsed_seconds;
  }

  {
    std::lock_guard<std::mutex> lock(render_mutex_);
    if(finished_) return summary;
    finished_ = true;

    const auto size = terminal_size();
    auto& out = *out_;
    out << ansi::move_to(size.rows) << ansi::kClearLine
        << summary_icon(options_.kind) << " " << ansi::kGreen
        << (options_.kind == OperationKind::copy ? "Copied" : "Deleted") << ": "
        << snap.completed_items << " files ("
        << format_size(static_cast<double>(snap.completed_bytes)) << ")" << ansi::kReset;
    if(snap.skipped_items > 0) {
      out << " " << ansi::kYellow << "(Skipped: " << snap.skipped_items << ")" << ansi::kReset;
    }
    out << "\n" << ansi::kShowCursor << std::flush;
  }

  if(speed_model && summary.elapsed_seconds > 0.1 && snap.completed_bytes > 0 && snap.total_bytes > 0) {
    summary.speed_recorded = speed_model->record(options_.kind, summary.mbps);
  }
  return summary;
}
