#include "block_copy_engine.hpp"

#include <asio.hpp>

#include <atomic>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <vector>

#include <fcntl.h>

#include "file_handle.hpp"
#include "progress_aggregator.hpp"
#include "utils.hpp"

BlockCopyEngine::BlockCopyEngine(FileCopier& copier, Logger* logger)
  : copier_(copier), logger_(logger) {}

bool BlockCopyEngine::copy_large(const std::filesystem::path& src,
                                 const std::filesystem::path& dst,
                                 ProgressAggregator* aggregator,
                                 std::size_t worker_count,
                                 std::uint64_t block_size) {
  auto target = copier_.prepare_destination(src, dst, aggregator);
  if(!target) return false;

  const auto file_size = std::filesystem::file_size(src);
  if(file_size == 0) {
    copier_.create_empty(*target);
    if(aggregator) aggregator->update(src.filename().string(), 0);
    return true;
  }
  if(block_size == 0 || file_size < 2 * block_size) {
    copier_.stream(src, *target, aggregator);
    return true;
  }

  const auto blocks = (file_size + block_size - 1) / block_size;
  print_out(logger_, "{}\xE2\x9A\xA1 Parallel mode: {} workers, {} blocks of {}{}",
            ansi::kCyan, worker_count, blocks, format_size(static_cast<double>(block_size)), ansi::kReset);

  copy_blocks(src, *target, file_size, worker_count, block_size, aggregator, copier_.token(), logger_);
  copy_metadata(src, *target);
  return true;
}

void BlockCopyEngine::copy_blocks(const std::filesystem::path& src,
                                  const std::filesystem::path& dst,
                                  std::uint64_t file_size,
                                  std::size_t worker_count,
                                  std::uint64_t block_size,
                                  ProgressAggregator* aggregator,
                                  const CancellationToken* token,
                                  Logger* logger) {
  if(worker_count == 0) {
    throw std::invalid_argument("worker count must be positive");
  }
  const auto plan = make_block_plan(file_size, block_size);
  const auto label = src.filename().string();

  // Only a destination this call truncated is removed on failure.
  auto presized = FileHandle::open(dst, O_WRONLY | O_CREAT | O_TRUNC);
  try {
    if(file_size > 0) {
      const char sentinel = 0;
      presized.write_all_at(&sentinel, 1, file_size - 1);
    }
    presized.close();

    std::mutex write_mutex;
    std::mutex error_mutex;
    std::exception_ptr first_error;
    std::atomic<bool> failed{false};

    auto record_failure = [&](std::exception_ptr error) {
      std::lock_guard<std::mutex> lock(error_mutex);
      if(!first_error) first_error = std::move(error);
      failed.store(true);
    };

    {
      asio::thread_pool pool(worker_count);
      for(const auto& block : plan) {
        asio::post(pool, [&, block]() {
          if(failed.load()) return;
          if(token && token->stop_requested()) {
            record_failure(std::make_exception_ptr(OperationCancelled()));
            return;
          }
          try {
            std::vector<char> data(static_cast<std::size_t>(block.length));
            {
              auto in = FileHandle::open(src, O_RDONLY);
              in.read_exact_at(data.data(), data.size(), block.offset);
            }
            {
              std::lock_guard<std::mutex> lock(write_mutex);
              auto out = FileHandle::open(dst, O_RDWR);
              out.write_all_at(data.data(), data.size(), block.offset);
              out.close();
            }
            if(aggregator) aggregator->update(label, block.length);
          } catch(const std::exception&) {
            record_failure(std::current_exception());
          }
        });
      }
      pool.join();
    }

    if(first_error) {
      std::rethrow_exception(first_error);
    }
  } catch(const std::exception& e) {
    log_debug(logger, "Block copy of {} failed: {}", src.string(), e.what());
    remove_partial(dst, logger);
    throw;
  }
}
