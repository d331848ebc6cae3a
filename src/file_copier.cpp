#include "file_copier.hpp"

#include <cerrno>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>

#include "file_handle.hpp"
#include "progress_aggregator.hpp"

void copy_metadata(const std::filesystem::path& src, const std::filesystem::path& dst) {
  struct stat st;
  if(::stat(src.c_str(), &st) != 0) {
    throw io_error(errno, "cannot stat", src);
  }
  if(::chmod(dst.c_str(), st.st_mode & 07777) != 0) {
    throw io_error(errno, "cannot set permissions on", dst);
  }
  struct timespec times[2] = {st.st_atim, st.st_mtim};
  if(::utimensat(AT_FDCWD, dst.c_str(), times, 0) != 0) {
    throw io_error(errno, "cannot set times on", dst);
  }
}

void remove_partial(const std::filesystem::path& dst, Logger* logger) noexcept {
  std::error_code ec;
  std::filesystem::remove(dst, ec);
  if(ec) {
    log_debug(logger, "Could not remove partial file {}: {}", dst.string(), ec.message());
  }
}

FileCopier::FileCopier(OverwritePolicy* policy,
                       const CancellationToken* token,
                       std::size_t buffer_size,
                       Logger* logger)
  : policy_(policy),
    token_(token),
    buffer_size_(buffer_size > 0 ? buffer_size : kDefaultBufferSize),
    logger_(logger) {}

std::optional<std::filesystem::path> FileCopier::prepare_destination(const std::filesystem::path& src,
                                                                     const std::filesystem::path& dst,
                                                                     ProgressAggregator* aggregator) {
  auto target = dst;
  if(std::filesystem::is_directory(target)) {
    target /= src.filename();
  }

  std::error_code ec;
  if(std::filesystem::equivalent(src, target, ec)) {
    throw std::system_error(std::make_error_code(std::errc::invalid_argument),
                            "'" + src.string() + "' and '" + target.string() + "' are the same file");
  }
  ec.clear();
  if(std::filesystem::exists(target, ec) && !suppress_prompts_ && policy_) {
    switch(policy_->decide(target)) {
      case OverwriteDecision::proceed:
        break;
      case OverwriteDecision::proceed_all:
        suppress_prompts_ = true;
        break;
      case OverwriteDecision::skip:
        log_debug(logger_, "Skipping existing {}", target.string());
        if(aggregator) aggregator->mark_skipped();
        return std::nullopt;
      case OverwriteDecision::abort:
        throw OperationAborted();
    }
  }

  if(target.has_parent_path()) {
    std::filesystem::create_directories(target.parent_path());
  }
  return target;
}

void FileCopier::create_empty(const std::filesystem::path& resolved_dst) {
  auto out = FileHandle::open(resolved_dst, O_WRONLY | O_CREAT | O_TRUNC);
  out.close();
}

bool FileCopier::copy(const std::filesystem::path& src,
                      const std::filesystem::path& dst,
                      ProgressAggregator* aggregator) {
  auto target = prepare_destination(src, dst, aggregator);
  if(!target) return false;

  if(std::filesystem::file_size(src) == 0) {
    create_empty(*target);
    if(aggregator) aggregator->update(src.filename().string(), 0);
    return true;
  }
  stream(src, *target, aggregator);
  return true;
}

void FileCopier::stream(const std::filesystem::path& src,
                        const std::filesystem::path& resolved_dst,
                        ProgressAggregator* aggregator) {
  const auto label = src.filename().string();
  auto in = FileHandle::open(src, O_RDONLY);
  // Opened outside the cleanup scope: an open failure leaves an existing
  // destination alone.
  auto out = FileHandle::open(resolved_dst, O_WRONLY | O_CREAT | O_TRUNC);
  try {
    std::vector<char> buffer(buffer_size_);
    for(;;) {
      if(token_ && token_->stop_requested()) {
        throw OperationCancelled();
      }
      auto got = in.read_some(buffer.data(), buffer.size());
      if(got == 0) break;
      out.write_all(buffer.data(), got);
      if(aggregator) aggregator->update(label, got);
    }
    out.close();
  } catch(const std::exception&) {
    remove_partial(resolved_dst, logger_);
    throw;
  }
  copy_metadata(src, resolved_dst);
}
