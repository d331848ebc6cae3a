#include "benchmark.hpp"

#include <algorithm>
#include <cerrno>
#include <ctime>
#include <stdexcept>
#include <vector>

#include <fcntl.h>
#include <stdlib.h>

#include "block_copy_engine.hpp"
#include "file_copier.hpp"
#include "file_handle.hpp"
#include "terminal.hpp"
#include "utils.hpp"

namespace {

std::string local_timestamp() {
  std::time_t now = std::time(nullptr);
  std::tm local{};
  localtime_r(&now, &local);
  char buffer[32] = {0};
  std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &local);
  return buffer;
}

} // namespace

ScratchDirectory::ScratchDirectory(const std::filesystem::path& parent, const std::string& prefix) {
  auto base = parent.empty() ? std::filesystem::temp_directory_path() : parent;
  std::string pattern = (base / (prefix + "XXXXXX")).string();
  std::vector<char> buffer(pattern.begin(), pattern.end());
  buffer.push_back('\0');
  if(::mkdtemp(buffer.data()) == nullptr) {
    throw io_error(errno, "cannot create scratch directory in", base);
  }
  path_ = buffer.data();
}

ScratchDirectory::~ScratchDirectory() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
  if(ec) {
    log_debug(nullptr, "Unable to remove {}: {}", path_.string(), ec.message());
  }
}

Benchmark::Benchmark(ConfigStore& config, Options options, Logger* logger)
  : config_(config), options_(std::move(options)), logger_(logger) {
  const auto block_size = options_.block_size;
  trial_ = [block_size](std::size_t workers,
                        const std::filesystem::path& src,
                        const std::filesystem::path& dst) {
    return default_trial(workers, src, dst, block_size);
  };
}

Benchmark::Seconds Benchmark::default_trial(std::size_t workers,
                                            const std::filesystem::path& src,
                                            const std::filesystem::path& dst,
                                            std::uint64_t block_size) {
  const auto start = std::chrono::steady_clock::now();
  if(workers <= 1) {
    std::filesystem::copy_file(src, dst, std::filesystem::copy_options::overwrite_existing);
  } else {
    BlockCopyEngine::copy_blocks(src, dst, std::filesystem::file_size(src), workers, block_size, nullptr);
  }
  copy_metadata(src, dst);
  return std::chrono::steady_clock::now() - start;
}

std::size_t Benchmark::select_optimal(const std::vector<Entry>& entries) {
  const Entry* best = nullptr;
  for(const auto& entry : entries) {
    if(!best || entry.average_seconds < best->average_seconds) {
      best = &entry;
    }
  }
  return best ? best->workers : 0;
}

void Benchmark::write_payload(const std::filesystem::path& path) const {
  auto out = FileHandle::open(path, O_WRONLY | O_CREAT | O_TRUNC);
  std::vector<unsigned char> chunk(std::max<std::size_t>(1, options_.chunk_size));
  std::uint64_t remaining = options_.payload_size;
  while(remaining > 0) {
    const auto size = static_cast<std::size_t>(std::min<std::uint64_t>(chunk.size(), remaining));
    fill_random(chunk.data(), size);
    out.write_all(chunk.data(), size);
    remaining -= size;
  }
  out.close();
}

Benchmark::Result Benchmark::run() {
  if(options_.candidates.empty() || options_.trials == 0) {
    throw std::invalid_argument("benchmark needs at least one candidate and one trial");
  }
  const bool quiet = options_.quiet;
  const double payload_mib = static_cast<double>(options_.payload_size) / (1024.0 * 1024.0);

  if(!quiet) {
    print_out(logger_, "{}\xF0\x9F\x94\xAC Running benchmark to determine optimal parallel workers...{}\n",
              ansi::kBold, ansi::kReset);
  }

  ScratchDirectory scratch(options_.scratch_parent);
  const auto payload = scratch.path() / "benchmark_test.bin";
  if(!quiet) {
    print_out(logger_, "{}Creating {} test file...{}", ansi::kCyan,
              format_size(static_cast<double>(options_.payload_size)), ansi::kReset);
  }
  write_payload(payload);

  if(!quiet) {
    print_out(logger_, "\n{}Testing different worker counts:{}", ansi::kBold, ansi::kReset);
  }

  Result result;
  for(auto workers : options_.candidates) {
    const auto destination = scratch.path() / ("test_copy_" + std::to_string(workers) + ".bin");
    double total = 0.0;
    for(std::size_t trial = 0; trial < options_.trials; ++trial) {
      std::filesystem::remove(destination);
      total += trial_(workers, payload, destination).count();
    }
    Entry entry;
    entry.workers = workers;
    entry.average_seconds = total / static_cast<double>(options_.trials);
    result.entries.push_back(entry);
    log_debug(logger_, "benchmark: {} workers averaged {:.3f}s", workers, entry.average_seconds);

    if(!quiet) {
      const double mbps = entry.average_seconds > 0.0 ? payload_mib / entry.average_seconds : 0.0;
      print_out(logger_, "  {:2d} workers: {:.3f}s  ({:.1f} MB/s)", workers, entry.average_seconds, mbps);
    }
  }

  result.optimal_workers = select_optimal(result.entries);
  persist(result);

  if(!quiet) {
    print_out(logger_, "\n{}\xE2\x9C\x93 Optimal configuration: {} workers{}",
              ansi::kGreen, result.optimal_workers, ansi::kReset);
    if(result.saved) {
      print_out(logger_, "{}Configuration saved to: {}{}\n",
                ansi::kDim, config_.config_path().string(), ansi::kReset);
    }
  } else {
    print_out(logger_, "{}\xE2\x9C\x93 Optimal: {} workers{}{}", ansi::kGreen, result.optimal_workers,
              result.saved ? " (saved to config)" : "", ansi::kReset);
  }
  return result;
}

void Benchmark::persist(Result& result) {
  result.date = local_timestamp();
  nlohmann::json timings = nlohmann::json::object();
  for(const auto& entry : result.entries) {
    timings[std::to_string(entry.workers)] = fmt::format("{:.3f}s", entry.average_seconds);
  }

  std::string error;
  bool stored = config_.set("optimal_parallel_workers", static_cast<std::int64_t>(result.optimal_workers), error) &&
                config_.set("benchmark_date", result.date, error) &&
                config_.set("benchmark_results", timings, error);
  if(!stored) {
    log_warn(logger_, "Unable to store benchmark results: {}", error);
    return;
  }
  result.saved = config_.save();
  if(!result.saved) {
    log_warn(logger_, "Benchmark results were not saved to {}", config_.config_path().string());
  }
}
