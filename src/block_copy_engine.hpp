#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>

#include "block_plan.hpp"
#include "file_copier.hpp"
#include "log.hpp"
#include "terminal.hpp"

class ProgressAggregator;

// Copies one large file as independent blocks on a bounded asio::thread_pool.
// Reads run in parallel; writes into the pre-sized destination are
// serialized by a single mutex.
class BlockCopyEngine {
public:
  static constexpr std::uint64_t kDefaultBlockSize = 32ull * 1024 * 1024;

  explicit BlockCopyEngine(FileCopier& copier, Logger* logger = nullptr);

  // Returns false when the overwrite policy skipped the file. Files shorter
  // than two blocks take the streaming path.
  bool copy_large(const std::filesystem::path& src,
                  const std::filesystem::path& dst,
                  ProgressAggregator* aggregator,
                  std::size_t worker_count,
                  std::uint64_t block_size = kDefaultBlockSize);

  // The parallel core without destination checks or metadata. The first
  // worker failure is rethrown after every dispatched block has finished and
  // the destination has been removed. `aggregator` may be null.
  static void copy_blocks(const std::filesystem::path& src,
                          const std::filesystem::path& dst,
                          std::uint64_t file_size,
                          std::size_t worker_count,
                          std::uint64_t block_size,
                          ProgressAggregator* aggregator,
                          const CancellationToken* token = nullptr,
                          Logger* logger = nullptr);

private:
  FileCopier& copier_;
  Logger* logger_;
};
