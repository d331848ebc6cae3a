#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "config_store.hpp"
#include "log.hpp"

// mkdtemp-backed directory removed with everything in it on destruction.
class ScratchDirectory {
public:
  explicit ScratchDirectory(const std::filesystem::path& parent = std::filesystem::path(),
                            const std::string& prefix = "cprm-bench-");
  ~ScratchDirectory();

  ScratchDirectory(const ScratchDirectory&) = delete;
  ScratchDirectory& operator=(const ScratchDirectory&) = delete;

  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
};

// Times the block copy at several worker counts and stores the fastest as
// the default for `-P`.
class Benchmark {
public:
  using Seconds = std::chrono::duration<double>;
  using TrialFunction = std::function<Seconds(std::size_t workers,
                                              const std::filesystem::path& src,
                                              const std::filesystem::path& dst)>;

  struct Options {
    std::uint64_t payload_size = 100ull * 1024 * 1024;
    std::size_t chunk_size = 16 * 1024 * 1024;
    std::vector<std::size_t> candidates = {1, 2, 4, 6, 8};
    std::size_t trials = 3;
    std::uint64_t block_size = 32ull * 1024 * 1024;
    bool quiet = false;
    std::filesystem::path scratch_parent; // system temp directory when empty
  };

  struct Entry {
    std::size_t workers = 0;
    double average_seconds = 0.0;
  };

  struct Result {
    std::vector<Entry> entries; // candidate order
    std::size_t optimal_workers = 0;
    std::string date;
    bool saved = false;
  };

  Benchmark(ConfigStore& config, Options options, Logger* logger = nullptr);

  void set_trial_function(TrialFunction trial) { trial_ = std::move(trial); }

  Result run();

  // First entry with the strictly smallest average; 0 for an empty table.
  static std::size_t select_optimal(const std::vector<Entry>& entries);

  // Whole-file copy for one worker, the block engine otherwise.
  static Seconds default_trial(std::size_t workers,
                               const std::filesystem::path& src,
                               const std::filesystem::path& dst,
                               std::uint64_t block_size);

private:
  void write_payload(const std::filesystem::path& path) const;
  void persist(Result& result);

  ConfigStore& config_;
  Options options_;
  Logger* logger_;
  TrialFunction trial_;
};
