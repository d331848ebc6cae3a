#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <iosfwd>
#include <string>
#include <vector>

#include "config_store.hpp"
#include "file_copier.hpp"
#include "log.hpp"
#include "speed_model.hpp"
#include "terminal.hpp"

struct CopyRequest {
  std::vector<std::string> sources;
  std::string destination;
  bool recursive = false;
  bool dry_run = false;
  std::size_t parallel = 0; // 0 disables the block engine
};

struct RemoveRequest {
  std::vector<std::string> targets;
  bool recursive = false;
  bool force = false;
  bool dry_run = false;
};

struct SourceFile {
  std::filesystem::path path;
  std::uint64_t size = 0;
};

// Everything a job needs from the process. The optional hooks replace the
// interactive pieces; tests fill them in.
struct JobContext {
  ConfigStore& config;
  SpeedModel& speed;
  Logger* logger = nullptr;
  const CancellationToken* token = nullptr;
  OverwritePolicy* overwrite = nullptr;   // readline prompt when null
  std::function<bool()> confirm;          // countdown + readline when empty
  std::ostream* out = nullptr;            // progress output, std::cout when null
  std::function<TerminalSize()> terminal_size;
  bool watch_resize = true;
};

// Regular files named directly, plus with `recursive` every regular file
// below the named directories. Missing paths and directories without
// `recursive` are reported and left out.
std::vector<SourceFile> enumerate_sources(const std::vector<std::string>& paths,
                                          bool recursive,
                                          Logger* logger);

// Name a directory source is recreated under inside the destination.
std::filesystem::path directory_name(const std::filesystem::path& directory);

// Exit status of the job: 0 done (per-file failures are warnings),
// 1 nothing to do or invalid destination.
int run_copy(const CopyRequest& request, JobContext& context);
int run_remove(const RemoveRequest& request, JobContext& context);

// Hands the whole request to /bin/cp and returns its exit status.
int run_system_copy(const CopyRequest& request, Logger* logger);
