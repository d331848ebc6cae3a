#include <cpptrace/cpptrace.hpp>

#include <cstdint>
#include <exception>

#include "benchmark.hpp"
#include "command_line_parser.hpp"
#include "config_store.hpp"
#include "log.hpp"
#include "operations.hpp"
#include "speed_model.hpp"
#include "terminal.hpp"

namespace {

constexpr std::size_t kFallbackWorkers = 4;

std::size_t configured_workers(const ConfigStore& config) {
  auto workers = config.get<std::int64_t>("optimal_parallel_workers");
  if(workers <= 0 || workers > static_cast<std::int64_t>(CommandLineParser::kMaxWorkers)) {
    return kFallbackWorkers;
  }
  return static_cast<std::size_t>(workers);
}

} // namespace

int main(int argc, char** argv){
  try {
    init_logging(false);
    Logger logger("cprm");

    CommandLineParser parser("cprm");
    ParsedCommand command;
    try {
      command = parser.parse(argc, argv);
    } catch(const UsageError& e) {
      print_err(nullptr, "{}Error: {}{}", ansi::kRed, e.what(), ansi::kReset);
      parser.usage();
      return 1;
    }
    if(command.version) {
      print_out(nullptr, "cprm {}", CPRM_VERSION);
      return 0;
    }
    if(command.help) {
      parser.usage(command.kind);
      return 0;
    }

    ConfigStore config;
    config.set_logger(&logger);
    if(!command.config_path.empty()) {
      config.set_config_path(command.config_path);
    }
    config.load();
    init_logging(command.verbose || config.get<bool>("verbose"));
    logger.debug("Using config {}", config.config_path().string());

    CancellationToken token;
    install_interrupt_handler(token);

    SpeedModel speed(config, &logger);
    JobContext context{config, speed};
    context.logger = &logger;
    context.token = &token;

    switch(command.kind) {
      case CommandKind::copy: {
        auto request = command.copy;
        if(command.parallel_from_config) {
          request.parallel = configured_workers(config);
        }
        return run_copy(request, context);
      }
      case CommandKind::remove:
        return run_remove(command.remove, context);
      case CommandKind::benchmark: {
        Benchmark::Options options;
        options.quiet = command.quiet;
        auto block_size = config.get<std::int64_t>("block_size");
        if(block_size > 0) options.block_size = static_cast<std::uint64_t>(block_size);
        Benchmark benchmark(config, options, &logger);
        benchmark.run();
        return 0;
      }
      case CommandKind::none:
        break;
    }
    parser.usage();
    return 1;
  } catch(std::exception& e) {
    init_logging(false);
    Logger logger("cprm-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
