#include "command_line_parser.hpp"

#include <algorithm>
#include <cctype>

#include "log.hpp"

CommandLineParser::CommandLineParser(std::string process_name,
                                     nlohmann::json command_spec,
                                     nlohmann::json global_spec)
  : process_name_(std::move(process_name)),
    commands_(build_command_specs(command_spec)),
    globals_(build_option_specs(global_spec)) {}

std::vector<CommandLineParser::OptionSpec> CommandLineParser::build_option_specs(const nlohmann::json& spec) {
  std::vector<OptionSpec> result;
  for(const auto& entry : spec) {
    OptionSpec out;
    out.key = entry.at("key").get<std::string>();
    out.short_names = entry.value("short", "");
    out.long_name = entry.value("long", "");
    out.type = entry.at("type").get<std::string>();
    out.description = entry.value("description", "");
    if(out.type != "bool" && out.type != "string" && out.type != "optional_int") {
      throw std::runtime_error("Option specification for '" + out.key + "' has unknown type '" + out.type + "'");
    }
    result.push_back(std::move(out));
  }
  return result;
}

std::vector<CommandLineParser::CommandSpec> CommandLineParser::build_command_specs(const nlohmann::json& spec) {
  std::vector<CommandSpec> result;
  for(const auto& entry : spec) {
    CommandSpec out;
    out.name = entry.at("name").get<std::string>();
    if(kind_for(out.name) == CommandKind::none) {
      throw std::runtime_error("Command specification references unknown command '" + out.name + "'");
    }
    if(entry.contains("aliases")) {
      out.aliases = entry.at("aliases").get<std::vector<std::string>>();
    }
    out.usage = entry.value("usage", "");
    out.summary = entry.value("summary", "");
    out.options = build_option_specs(entry.value("options", nlohmann::json::array()));
    result.push_back(std::move(out));
  }
  return result;
}

CommandKind CommandLineParser::kind_for(const std::string& name) {
  if(name == "copy") return CommandKind::copy;
  if(name == "remove") return CommandKind::remove;
  if(name == "benchmark") return CommandKind::benchmark;
  return CommandKind::none;
}

const CommandLineParser::CommandSpec* CommandLineParser::find_command(const std::string& token) const {
  for(const auto& command : commands_) {
    if(command.name == token) return &command;
    if(std::find(command.aliases.begin(), command.aliases.end(), token) != command.aliases.end()) {
      return &command;
    }
  }
  return nullptr;
}

const CommandLineParser::OptionSpec* CommandLineParser::find_long(const CommandSpec* command,
                                                                  const std::string& name) const {
  if(command) {
    for(const auto& option : command->options) {
      if(option.long_name == name) return &option;
    }
  }
  for(const auto& option : globals_) {
    if(option.long_name == name) return &option;
  }
  return nullptr;
}

const CommandLineParser::OptionSpec* CommandLineParser::find_short(const CommandSpec* command, char name) const {
  if(command) {
    for(const auto& option : command->options) {
      if(option.short_names.find(name) != std::string::npos) return &option;
    }
  }
  for(const auto& option : globals_) {
    if(option.short_names.find(name) != std::string::npos) return &option;
  }
  return nullptr;
}

std::size_t CommandLineParser::parse_workers(const std::string& text) {
  const bool digits = !text.empty() && text.size() <= 4 &&
    std::all_of(text.begin(), text.end(), [](unsigned char c){ return std::isdigit(c); });
  if(!digits) {
    throw UsageError("Invalid worker count '" + text + "'");
  }
  auto value = static_cast<std::size_t>(std::stoul(text));
  if(value > kMaxWorkers) {
    throw UsageError("Worker count " + text + " exceeds " + std::to_string(kMaxWorkers));
  }
  return value;
}

ParsedCommand CommandLineParser::parse(int argc, char* argv[]) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) {
    args.assign(argv + 1, argv + argc);
  }
  return parse(args);
}

ParsedCommand CommandLineParser::parse(const std::vector<std::string>& args) const {
  nlohmann::json values = nlohmann::json::object();
  std::vector<std::string> positionals;
  const CommandSpec* command = nullptr;
  bool only_positionals = false;

  auto apply = [&](const OptionSpec& option,
                   std::optional<std::string> attached,
                   std::size_t& i,
                   const std::string& shown) {
    if(option.type == "bool") {
      if(attached) throw UsageError("Option " + shown + " does not take a value");
      values[option.key] = true;
    } else if(option.type == "string") {
      if(!attached) {
        if(i + 1 >= args.size()) throw UsageError("Missing value for option " + shown);
        attached = args[++i];
      }
      values[option.key] = *attached;
    } else {
      values[option.key] = attached ? nlohmann::json(parse_workers(*attached)) : nlohmann::json(nullptr);
    }
  };

  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];

    if(only_positionals || token.size() < 2 || token[0] != '-') {
      if(!command) {
        command = find_command(token);
        if(!command) throw UsageError("Unknown command '" + token + "'");
        continue;
      }
      positionals.push_back(token);
      continue;
    }

    if(token == "--") {
      only_positionals = true;
      continue;
    }

    if(token.rfind("--", 0) == 0) {
      std::string name = token.substr(2);
      std::optional<std::string> attached;
      auto eq = name.find('=');
      if(eq != std::string::npos) {
        attached = name.substr(eq + 1);
        name.resize(eq);
      }
      const auto* option = find_long(command, name);
      if(!option) throw UsageError("Unknown option --" + name);
      apply(*option, attached, i, "--" + name);
      continue;
    }

    // Bundled short flags: -rf, -rP4, -P=8
    for(std::size_t c = 1; c < token.size(); ++c) {
      const auto* option = find_short(command, token[c]);
      const std::string shown = std::string("-") + token[c];
      if(!option) throw UsageError("Unknown option " + shown);
      if(option->type == "bool") {
        values[option->key] = true;
        continue;
      }
      std::string rest = token.substr(c + 1);
      std::optional<std::string> attached;
      if(!rest.empty()) {
        attached = (rest[0] == '=') ? rest.substr(1) : rest;
      }
      apply(*option, attached, i, shown);
      break;
    }
  }

  ParsedCommand parsed;
  parsed.help = values.value("help", false);
  parsed.version = values.value("version", false);
  parsed.verbose = values.value("verbose", false);
  if(values.contains("config")) {
    parsed.config_path = values.at("config").get<std::string>();
  }

  if(!command) {
    if(!parsed.help && !parsed.version) {
      throw UsageError("No command given");
    }
    return parsed;
  }
  parsed.kind = kind_for(command->name);
  if(parsed.help || parsed.version) return parsed;

  switch(parsed.kind) {
    case CommandKind::copy: {
      if(positionals.size() < 2) {
        throw UsageError("copy needs at least one source and a destination");
      }
      parsed.copy.destination = positionals.back();
      parsed.copy.sources.assign(positionals.begin(), positionals.end() - 1);
      parsed.copy.recursive = values.value("recursive", false);
      parsed.copy.dry_run = values.value("dry_run", false);
      if(values.contains("parallel")) {
        if(values.at("parallel").is_null()) {
          parsed.parallel_from_config = true;
        } else {
          parsed.copy.parallel = values.at("parallel").get<std::size_t>();
        }
      }
      break;
    }
    case CommandKind::remove:
      if(positionals.empty()) {
        throw UsageError("remove needs at least one target");
      }
      parsed.remove.targets = positionals;
      parsed.remove.recursive = values.value("recursive", false);
      parsed.remove.force = values.value("force", false);
      parsed.remove.dry_run = values.value("dry_run", false);
      break;
    case CommandKind::benchmark:
      if(!positionals.empty()) {
        throw UsageError("benchmark takes no arguments");
      }
      parsed.quiet = values.value("quiet", false);
      break;
    case CommandKind::none:
      break;
  }
  return parsed;
}

void CommandLineParser::print_options(const std::vector<OptionSpec>& options) {
  for(const auto& option : options) {
    std::string flags;
    for(char name : option.short_names) {
      flags += std::string("-") + name + ", ";
    }
    if(!option.long_name.empty()) flags += "--" + option.long_name;
    if(option.type == "string") flags += " PATH";
    if(option.type == "optional_int") flags += "[=N]";
    print_out(nullptr, "  {:<26} {}", flags, option.description);
  }
}

void CommandLineParser::usage(CommandKind kind) const {
  const CommandSpec* selected = nullptr;
  for(const auto& command : commands_) {
    if(kind_for(command.name) == kind) selected = &command;
  }

  if(!selected) {
    print_out(nullptr, "{} - copy and remove files with a progress bar", process_name_);
    print_out(nullptr, "Usage:");
    print_out(nullptr, "  {} [--config PATH] [-v] <command> [options] [arguments]", process_name_);
    print_out(nullptr, "");
    print_out(nullptr, "Commands:");
    for(const auto& command : commands_) {
      std::string names = command.name;
      for(const auto& alias : command.aliases) names += ", " + alias;
      print_out(nullptr, "  {:<26} {}", names, command.summary);
    }
    print_out(nullptr, "");
    print_out(nullptr, "Global options:");
    print_options(globals_);
    print_out(nullptr, "");
    print_out(nullptr, "Exit status: 0 success, 1 usage or validation error, 130 interrupted.");
    return;
  }

  print_out(nullptr, "{} {} - {}", process_name_, selected->name, selected->summary);
  print_out(nullptr, "Usage:");
  print_out(nullptr, "  {} {} [options] {}", process_name_, selected->name, selected->usage);
  print_out(nullptr, "");
  print_out(nullptr, "Options:");
  print_options(selected->options);
  print_options(globals_);
  print_out(nullptr, "");
}
