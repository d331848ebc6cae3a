#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "operations.hpp"

#ifndef CPRM_VERSION
#define CPRM_VERSION "0.0.0"
#endif

// Option types: "bool" flags, "string" values, and "optional_int" which may
// carry an attached value (-P, -P8, -P=8, --parallel, --parallel=8).
inline const nlohmann::json GLOBAL_OPTION_SPECIFICATION = nlohmann::json::array({
  {{"key","help"},    {"short","h"}, {"long","help"},    {"type","bool"},   {"description","show help and exit"}},
  {{"key","version"}, {"short",""},  {"long","version"}, {"type","bool"},   {"description","print the version and exit"}},
  {{"key","config"},  {"short",""},  {"long","config"},  {"type","string"}, {"description","use PATH instead of the default config file"}},
  {{"key","verbose"}, {"short","v"}, {"long","verbose"}, {"type","bool"},   {"description","enable debug logging"}}
});

inline const nlohmann::json COMMAND_SPECIFICATION = nlohmann::json::array({
  {{"name","copy"}, {"aliases",{"cp"}}, {"usage","<sources...> <destination>"},
   {"summary","Copy files and directories with a progress bar"},
   {"options", nlohmann::json::array({
     {{"key","recursive"}, {"short","rR"}, {"long","recursive"}, {"type","bool"},         {"description","copy directories recursively"}},
     {{"key","dry_run"},   {"short","n"},  {"long","dry-run"},   {"type","bool"},         {"description","show what would be copied and the estimated time"}},
     {{"key","parallel"},  {"short","P"},  {"long","parallel"},  {"type","optional_int"}, {"description","copy files above the threshold in parallel blocks with N workers (default: benchmark result)"}}
   })}},
  {{"name","remove"}, {"aliases",{"rm"}}, {"usage","<targets...>"},
   {"summary","Remove files and directories with a progress bar"},
   {"options", nlohmann::json::array({
     {{"key","recursive"}, {"short","rR"}, {"long","recursive"}, {"type","bool"}, {"description","remove directories and their contents"}},
     {{"key","force"},     {"short","f"},  {"long","force"},     {"type","bool"}, {"description","skip the countdown and confirmation"}},
     {{"key","dry_run"},   {"short","n"},  {"long","dry-run"},   {"type","bool"}, {"description","show what would be deleted and the estimated time"}}
   })}},
  {{"name","benchmark"}, {"aliases",nlohmann::json::array()}, {"usage",""},
   {"summary","Measure the best worker count for -P and save it"},
   {"options", nlohmann::json::array({
     {{"key","quiet"}, {"short","q"}, {"long","quiet"}, {"type","bool"}, {"description","only print the result"}}
   })}}
});

class UsageError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

enum class CommandKind { none, copy, remove, benchmark };

struct ParsedCommand {
  CommandKind kind = CommandKind::none;
  bool help = false;
  bool version = false;
  bool verbose = false;
  bool quiet = false;
  std::filesystem::path config_path;

  CopyRequest copy;
  RemoveRequest remove;

  // -P given without a value; the worker count comes from the config.
  bool parallel_from_config = false;
};

class CommandLineParser {
public:
  explicit CommandLineParser(std::string process_name = "cprm",
                             nlohmann::json command_spec = COMMAND_SPECIFICATION,
                             nlohmann::json global_spec = GLOBAL_OPTION_SPECIFICATION);

  // Throws UsageError for anything the user has to fix.
  ParsedCommand parse(int argc, char* argv[]) const;
  ParsedCommand parse(const std::vector<std::string>& args) const;

  void usage(CommandKind kind = CommandKind::none) const;

  static constexpr std::size_t kMaxWorkers = 256;

private:
  struct OptionSpec {
    std::string key;
    std::string short_names;
    std::string long_name;
    std::string type;
    std::string description;
  };

  struct CommandSpec {
    std::string name;
    std::vector<std::string> aliases;
    std::string usage;
    std::string summary;
    std::vector<OptionSpec> options;
  };

  static std::vector<OptionSpec> build_option_specs(const nlohmann::json& spec);
  static std::vector<CommandSpec> build_command_specs(const nlohmann::json& spec);
  static CommandKind kind_for(const std::string& name);

  const CommandSpec* find_command(const std::string& token) const;
  const OptionSpec* find_long(const CommandSpec* command, const std::string& name) const;
  const OptionSpec* find_short(const CommandSpec* command, char name) const;
  static std::size_t parse_workers(const std::string& text);
  static void print_options(const std::vector<OptionSpec>& options);

  std::string process_name_;
  std::vector<CommandSpec> commands_;
  std::vector<OptionSpec> globals_;
};
