#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

#include "log.hpp"
#include "terminal.hpp"

class ProgressAggregator;

enum class OverwriteDecision { proceed, skip, proceed_all, abort };

// Asked once per existing destination, before any byte of it is written.
class OverwritePolicy {
public:
  virtual ~OverwritePolicy() = default;
  virtual OverwriteDecision decide(const std::filesystem::path& destination) = 0;
};

// Answers every question the same way.
class FixedOverwritePolicy : public OverwritePolicy {
public:
  explicit FixedOverwritePolicy(OverwriteDecision decision) : decision_(decision) {}
  OverwriteDecision decide(const std::filesystem::path&) override { return decision_; }

private:
  OverwriteDecision decision_;
};

// The user chose to stop the whole job at an overwrite prompt.
class OperationAborted : public std::runtime_error {
public:
  OperationAborted() : std::runtime_error("Operation cancelled by user") {}
};

// A CancellationToken was observed between buffers or blocks.
class OperationCancelled : public std::runtime_error {
public:
  OperationCancelled() : std::runtime_error("operation cancelled") {}
};

// Copies permission bits and access/modification times.
void copy_metadata(const std::filesystem::path& src, const std::filesystem::path& dst);

// Best-effort unlink of a half-written destination; failures are logged at
// debug level only so the caller can rethrow the error that caused it.
void remove_partial(const std::filesystem::path& dst, Logger* logger = nullptr) noexcept;

// The sequential copy path plus the destination checks every copy shares.
class FileCopier {
public:
  static constexpr std::size_t kDefaultBufferSize = 16 * 1024 * 1024;

  FileCopier(OverwritePolicy* policy,
             const CancellationToken* token = nullptr,
             std::size_t buffer_size = kDefaultBufferSize,
             Logger* logger = nullptr);

  // Resolves a directory destination to `dst / src.filename()`, consults the
  // overwrite policy when the target exists and creates parent directories.
  // Returns nullopt when the user declined; the aggregator counts the skip.
  // Throws OperationAborted when the user quits.
  std::optional<std::filesystem::path> prepare_destination(const std::filesystem::path& src,
                                                           const std::filesystem::path& dst,
                                                           ProgressAggregator* aggregator);

  // Full streaming copy with the shared checks. False means skipped.
  bool copy(const std::filesystem::path& src,
            const std::filesystem::path& dst,
            ProgressAggregator* aggregator);

  // Streams `src` into an already resolved destination and copies metadata.
  // A failure or cancellation removes the partial destination first.
  void stream(const std::filesystem::path& src,
              const std::filesystem::path& resolved_dst,
              ProgressAggregator* aggregator);

  void create_empty(const std::filesystem::path& resolved_dst);

  const CancellationToken* token() const { return token_; }
  std::size_t buffer_size() const { return buffer_size_; }
  Logger* logger() const { return logger_; }

private:
  OverwritePolicy* policy_;
  const CancellationToken* token_;
  std::size_t buffer_size_;
  Logger* logger_;
  bool suppress_prompts_ = false;
};
