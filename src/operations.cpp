#include "operations.hpp"

#include <algorithm>
#include <cerrno>
#include <iostream>
#include <memory>
#include <optional>

#include <spawn.h>
#include <sys/wait.h>

#include "block_copy_engine.hpp"
#include "file_handle.hpp"
#include "progress_aggregator.hpp"
#include "prompts.hpp"
#include "utils.hpp"

extern char** environ;

namespace {

constexpr std::size_t kPreviewCount = 10;

std::uint64_t total_size(const std::vector<SourceFile>& files) {
  std::uint64_t total = 0;
  for(const auto& file : files) total += file.size;
  return total;
}

std::string display_path(const std::filesystem::path& path) {
  std::error_code ec;
  auto shown = std::filesystem::proximate(path, ec);
  return ec ? path.string() : shown.string();
}

void print_preview(Logger* logger, const std::vector<SourceFile>& files) {
  print_out(logger, "{}Files (showing first {}):{}", ansi::kBold, kPreviewCount, ansi::kReset);
  const auto shown = std::min(files.size(), kPreviewCount);
  for(std::size_t i = 0; i < shown; ++i) {
    print_out(logger, "  {}\xE2\x86\x92{} {} {}({}){}", ansi::kDim, ansi::kReset,
              display_path(files[i].path), ansi::kDim,
              format_size(static_cast<double>(files[i].size)), ansi::kReset);
  }
  if(files.size() > kPreviewCount) {
    print_out(logger, "  {}... and {} more files{}", ansi::kDim, files.size() - kPreviewCount, ansi::kReset);
  }
}

std::uint64_t config_bytes(const ConfigStore& config, const char* key, std::uint64_t fallback) {
  auto value = config.get<std::int64_t>(key);
  return value > 0 ? static_cast<std::uint64_t>(value) : fallback;
}

ProgressAggregator::Options aggregator_options(OperationKind kind,
                                               const std::vector<SourceFile>& files,
                                               const JobContext& context) {
  ProgressAggregator::Options options;
  options.kind = kind;
  options.total_items = files.size();
  options.total_bytes = total_size(files);
  options.out = context.out;
  options.terminal_size = context.terminal_size;
  return options;
}

// Directory source that `file` was found under, if any.
const std::filesystem::path* owning_directory(const std::filesystem::path& file,
                                              const std::vector<std::filesystem::path>& directories) {
  for(const auto& directory : directories) {
    if(is_path_within(file.lexically_normal(), directory.lexically_normal())) {
      return &directory;
    }
  }
  return nullptr;
}

} // namespace

std::filesystem::path directory_name(const std::filesystem::path& directory) {
  auto normal = directory.lexically_normal();
  if(!normal.has_filename()) normal = normal.parent_path();
  auto name = normal.filename();
  return name == "." ? std::filesystem::path() : name;
}

std::vector<SourceFile> enumerate_sources(const std::vector<std::string>& paths,
                                          bool recursive,
                                          Logger* logger) {
  std::vector<SourceFile> files;
  for(const auto& raw : paths) {
    const std::filesystem::path path(raw);
    std::error_code ec;
    auto status = std::filesystem::status(path, ec);
    if(ec || !std::filesystem::exists(status)) {
      log_error(logger, "'{}' does not exist", raw);
      continue;
    }

    if(!std::filesystem::is_directory(status)) {
      auto size = std::filesystem::file_size(path, ec);
      if(ec) {
        log_warn(logger, "Cannot access '{}': {}", raw, ec.message());
        continue;
      }
      files.push_back({path, size});
      continue;
    }

    if(!recursive) {
      log_error(logger, "'{}' is a directory. Use -r for recursive", raw);
      continue;
    }

    std::filesystem::recursive_directory_iterator it(
      path, std::filesystem::directory_options::skip_permission_denied, ec);
    if(ec) {
      log_warn(logger, "Cannot access '{}': {}", raw, ec.message());
      continue;
    }
    const std::filesystem::recursive_directory_iterator end;
    while(it != end) {
      std::error_code entry_ec;
      if(!it->is_directory(entry_ec)) {
        auto size = it->file_size(entry_ec);
        if(entry_ec) {
          // Listed anyway so the failure shows up when it is copied.
          log_warn(logger, "Cannot access '{}': {}", it->path().string(), entry_ec.message());
          size = 0;
        }
        files.push_back({it->path(), size});
      }
      it.increment(ec);
      if(ec) {
        log_warn(logger, "Cannot read below '{}': {}", raw, ec.message());
        break;
      }
    }
  }
  return files;
}

int run_system_copy(const CopyRequest& request, Logger* logger) {
  print_out(logger, "{}System directory detected, using /bin/cp...{}", ansi::kDim, ansi::kReset);

  std::vector<std::string> args = {"/bin/cp"};
  if(request.recursive) args.emplace_back("-r");
  args.insert(args.end(), request.sources.begin(), request.sources.end());
  args.push_back(request.destination);

  std::vector<char*> argv;
  argv.reserve(args.size() + 1);
  for(auto& arg : args) argv.push_back(arg.data());
  argv.push_back(nullptr);

  pid_t pid = 0;
  int rc = ::posix_spawn(&pid, "/bin/cp", nullptr, nullptr, argv.data(), environ);
  if(rc != 0) {
    throw io_error(rc, "cannot run", "/bin/cp");
  }
  int status = 0;
  while(::waitpid(pid, &status, 0) < 0) {
    if(errno != EINTR) {
      throw io_error(errno, "cannot wait for", "/bin/cp");
    }
  }
  if(WIFEXITED(status)) return WEXITSTATUS(status);
  if(WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return 1;
}

int run_copy(const CopyRequest& request, JobContext& context) {
  Logger* logger = context.logger;
  if(request.sources.empty()) {
    log_error(logger, "No source files specified");
    return 1;
  }

  const std::filesystem::path destination(request.destination);
  if(is_system_directory(destination)) {
    return run_system_copy(request, logger);
  }

  if(request.sources.size() > 1 && !std::filesystem::is_directory(destination)) {
    std::error_code ec;
    if(std::filesystem::exists(destination, ec)) {
      log_error(logger, "Destination must be a directory for multiple sources");
      return 1;
    }
    if(!request.dry_run) {
      std::filesystem::create_directories(destination);
    }
  }

  const auto files = enumerate_sources(request.sources, request.recursive, logger);
  if(files.empty()) {
    log_error(logger, "No files to copy");
    return 1;
  }
  const auto bytes = total_size(files);

  if(request.dry_run) {
    print_out(logger, "{}\xF0\x9F\x94\x8D Dry-run mode - No files will be copied{}\n", ansi::kCyan, ansi::kReset);
    print_out(logger, "{}Summary:{}", ansi::kBold, ansi::kReset);
    print_out(logger, "  Files to copy: {}{}{}", ansi::kGreen, files.size(), ansi::kReset);
    print_out(logger, "  Total size: {}{}{}", ansi::kGreen, format_size(static_cast<double>(bytes)), ansi::kReset);
    print_out(logger, "  Estimated time: {}~{}{}", ansi::kYellow,
              SpeedModel::format_estimate(context.speed.estimate(bytes, OperationKind::copy)), ansi::kReset);
    print_out(logger, "  Destination: {}{}{}\n", ansi::kBlue, request.destination, ansi::kReset);
    print_preview(logger, files);
    return 0;
  }

  const auto buffer_size = config_bytes(context.config, "buffer_size", FileCopier::kDefaultBufferSize);
  const auto block_size = config_bytes(context.config, "block_size", BlockCopyEngine::kDefaultBlockSize);
  const auto threshold = config_bytes(context.config, "parallel_threshold", 64ull * 1024 * 1024);

  std::vector<std::filesystem::path> directory_sources;
  if(request.recursive) {
    for(const auto& source : request.sources) {
      if(std::filesystem::is_directory(source)) directory_sources.emplace_back(source);
    }
  }

  print_out(logger, "{}Copying {} files ({})...{}", ansi::kBlue, files.size(),
            format_size(static_cast<double>(bytes)), ansi::kReset);

  ProgressAggregator aggregator(aggregator_options(OperationKind::copy, files, context));
  ResizeWatcher resize_watcher([&aggregator]{ aggregator.redraw(); });
  if(context.watch_resize) resize_watcher.start();

  std::unique_ptr<ReadlineOverwritePolicy> interactive;
  OverwritePolicy* policy = context.overwrite;
  if(!policy) {
    interactive = std::make_unique<ReadlineOverwritePolicy>(&aggregator);
    policy = interactive.get();
  }
  FileCopier copier(policy, context.token, static_cast<std::size_t>(buffer_size), logger);
  BlockCopyEngine engine(copier, logger);

  for(const auto& file : files) {
    std::filesystem::path target = destination;
    if(const auto* directory = owning_directory(file.path, directory_sources)) {
      target = destination / directory_name(*directory) /
               file.path.lexically_normal().lexically_relative(directory->lexically_normal());
    }
    try {
      bool copied = false;
      if(request.parallel > 0 && file.size > threshold) {
        copied = engine.copy_large(file.path, target, &aggregator, request.parallel, block_size);
      } else {
        copied = copier.copy(file.path, target, &aggregator);
      }
      if(copied) aggregator.complete_item();
    } catch(const OperationAborted& e) {
      resize_watcher.stop();
      print_out(logger, "\n{}\xE2\x9A\xA0 {}{}", ansi::kYellow, e.what(), ansi::kReset);
      return 0;
    } catch(const OperationCancelled&) {
      resize_watcher.stop();
      print_out(logger, "\n{}\xE2\x9A\xA0 Operation cancelled by user{}", ansi::kYellow, ansi::kReset);
      return kInterruptExitStatus;
    } catch(const std::system_error& e) {
      log_warn(logger, "Could not copy '{}': {}", file.path.string(), e.what());
    }
  }

  resize_watcher.stop();
  aggregator.finish(&context.speed);
  return 0;
}

int run_remove(const RemoveRequest& request, JobContext& context) {
  Logger* logger = context.logger;
  if(request.targets.empty()) {
    log_error(logger, "No files specified for deletion");
    return 1;
  }

  const auto files = enumerate_sources(request.targets, request.recursive, logger);
  std::vector<std::filesystem::path> directories;
  if(request.recursive) {
    for(const auto& target : request.targets) {
      if(std::filesystem::is_directory(target)) directories.emplace_back(target);
    }
  }
  if(files.empty() && directories.empty()) {
    log_error(logger, "No files to delete");
    return 1;
  }
  const auto bytes = total_size(files);

  if(request.dry_run) {
    print_out(logger, "{}\xF0\x9F\x94\x8D Dry-run mode - No files will be deleted{}\n", ansi::kCyan, ansi::kReset);
    print_out(logger, "{}Summary:{}", ansi::kBold, ansi::kReset);
    print_out(logger, "  Files to delete: {}{}{}", ansi::kRed, files.size(), ansi::kReset);
    print_out(logger, "  Total size: {}{}{}", ansi::kRed, format_size(static_cast<double>(bytes)), ansi::kReset);
    print_out(logger, "  Estimated time: {}~{}{}\n", ansi::kYellow,
              SpeedModel::format_estimate(context.speed.estimate(bytes, OperationKind::remove)), ansi::kReset);
    print_preview(logger, files);
    if(!directories.empty()) {
      print_out(logger, "\n{}Directories:{}", ansi::kBold, ansi::kReset);
      for(const auto& directory : directories) {
        print_out(logger, "  {}\xE2\x86\x92{} {}/", ansi::kDim, ansi::kReset, display_path(directory));
      }
    }
    return 0;
  }

  if(!request.force) {
    print_out(logger, "{}Will delete {} files ({}){}", ansi::kYellow, files.size(),
              format_size(static_cast<double>(bytes)), ansi::kReset);
    const bool confirmed = context.confirm ? context.confirm() : confirm_deletion();
    if(!confirmed) {
      print_out(logger, "{}Operation cancelled{}", ansi::kDim, ansi::kReset);
      return 0;
    }
  }

  print_out(logger, "{}Deleting {} files...{}", ansi::kBlue, files.size(), ansi::kReset);

  ProgressAggregator aggregator(aggregator_options(OperationKind::remove, files, context));
  ResizeWatcher resize_watcher([&aggregator]{ aggregator.redraw(); });
  if(context.watch_resize) resize_watcher.start();

  for(const auto& file : files) {
    if(context.token && context.token->stop_requested()) {
      resize_watcher.stop();
      print_out(logger, "\n{}\xE2\x9A\xA0 Operation cancelled by user{}", ansi::kYellow, ansi::kReset);
      return kInterruptExitStatus;
    }
    try {
      aggregator.update(file.path.filename().string(), file.size);
      std::filesystem::remove(file.path);
      aggregator.complete_item();
    } catch(const std::system_error& e) {
      log_warn(logger, "Could not delete '{}': {}", file.path.string(), e.what());
    }
  }

  for(const auto& directory : directories) {
    try {
      std::filesystem::remove_all(directory);
    } catch(const std::system_error& e) {
      log_warn(logger, "Could not delete directory '{}': {}", directory.string(), e.what());
    }
  }

  resize_watcher.stop();
  aggregator.finish(&context.speed);
  return 0;
}
