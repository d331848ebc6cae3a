#include "benchmark.hpp"
#include "config_store.hpp"
#include "test_runner_utils.hpp"

#include <map>
#include <stdexcept>
#include <vector>

namespace {

using cprm::test::TestContext;
using cprm::test::TestCase;

std::size_t entries_in(const std::filesystem::path& dir) {
  std::size_t count = 0;
  for(auto it = std::filesystem::directory_iterator(dir); it != std::filesystem::directory_iterator(); ++it) {
    ++count;
  }
  return count;
}

Benchmark::Options small_options(const std::filesystem::path& scratch_parent) {
  Benchmark::Options options;
  options.payload_size = 96 * 1024;
  options.chunk_size = 16 * 1024;
  options.block_size = 8 * 1024;
  options.trials = 2;
  options.scratch_parent = scratch_parent;
  return options;
}

bool test_select_optimal(TestContext& ctx) {
  ctx.expect(Benchmark::select_optimal({}) == 0, "empty table has no optimum");
  std::vector<Benchmark::Entry> tie = {{1, 2.0}, {2, 1.5}, {4, 1.5}, {8, 1.7}};
  ctx.expect(Benchmark::select_optimal(tie) == 2, "ties keep the smaller worker count");
  std::vector<Benchmark::Entry> clear = {{1, 2.0}, {2, 1.2}, {4, 0.9}, {6, 1.0}, {8, 1.1}};
  return ctx.expect(Benchmark::select_optimal(clear) == 4, "fastest average wins");
}

bool test_fixed_timings_are_persisted(TestContext& ctx) {
  cprm::test::ScratchDir scratch("cprm-bench-test");
  ConfigStore config;
  config.set_config_path(scratch / "config" / "config.json");

  const std::map<std::size_t, double> timings = {{1, 2.0}, {2, 1.2}, {4, 0.9}, {6, 1.0}, {8, 1.1}};
  std::map<std::size_t, int> calls;
  auto options = small_options(scratch.path());
  options.quiet = true;
  Benchmark benchmark(config, options, &ctx.logger);
  benchmark.set_trial_function([&](std::size_t workers, const std::filesystem::path& src,
                                   const std::filesystem::path&) {
    ++calls[workers];
    if(std::filesystem::file_size(src) != 96 * 1024) throw std::runtime_error("payload has the wrong size");
    return Benchmark::Seconds(timings.at(workers));
  });

  auto result = benchmark.run();
  ctx.expect(result.optimal_workers == 4, "4 workers chosen");
  ctx.expect(result.saved, "result saved");
  ctx.expect(result.entries.size() == 5 && result.entries.front().workers == 1, "entries in candidate order");
  ctx.expect(calls.size() == 5 && calls[6] == 2, "each candidate timed once per trial");
  ctx.expect(ctx.logs.contains("Optimal: 4 workers (saved to config)"), "quiet summary printed");

  ConfigStore reloaded;
  reloaded.set_config_path(scratch / "config" / "config.json");
  ctx.expect(reloaded.load(), "config written");
  ctx.expect(reloaded.get<std::int64_t>("optimal_parallel_workers") == 4, "optimal workers stored");
  ctx.expect(reloaded.get<std::string>("benchmark_date").size() == 19, "date stored as YYYY-MM-DD HH:MM:SS");
  auto stored = reloaded.get<nlohmann::json>("benchmark_results");
  ctx.expect(stored.value("4", "") == "0.900s", "timings stored per worker count");
  return ctx.expect(stored.size() == 5, "every candidate stored");
}

bool test_failed_trial_cleans_up(TestContext& ctx) {
  cprm::test::ScratchDir scratch("cprm-bench-test");
  ConfigStore config;
  config.set_config_path(scratch / "config.json");

  Benchmark benchmark(config, small_options(scratch.path()), &ctx.logger);
  benchmark.set_trial_function([](std::size_t workers, const std::filesystem::path&,
                                  const std::filesystem::path&) -> Benchmark::Seconds {
    if(workers == 4) throw std::runtime_error("disk full");
    return Benchmark::Seconds(1.0);
  });

  bool threw = false;
  try {
    benchmark.run();
  } catch(const std::runtime_error& e) {
    threw = std::string(e.what()) == "disk full";
  }
  ctx.expect(threw, "trial failure propagates");
  ctx.expect(entries_in(scratch.path()) == 0, "scratch directory removed");
  ctx.expect(!std::filesystem::exists(scratch / "config.json"), "nothing saved");
  return ctx.expect(config.get<std::int64_t>("optimal_parallel_workers") == 4, "previous optimum kept");
}

bool test_real_small_run(TestContext& ctx) {
  cprm::test::ScratchDir scratch("cprm-bench-test");
  ConfigStore config;
  config.set_config_path(scratch / "config.json");

  auto options = small_options(scratch.path());
  options.candidates = {1, 2, 4};
  options.trials = 1;
  Benchmark benchmark(config, options, &ctx.logger);
  auto result = benchmark.run();

  ctx.expect(result.entries.size() == 3, "three candidates measured");
  ctx.expect(result.optimal_workers == 1 || result.optimal_workers == 2 || result.optimal_workers == 4,
             "optimum is one of the candidates");
  ctx.expect(ctx.logs.contains("Running benchmark"), "banner printed");
  ctx.expect(ctx.logs.contains("Creating 96.0KB test file"), "payload size printed");
  ctx.expect(ctx.logs.contains(" 2 workers: "), "per-candidate line printed");
  ctx.expect(ctx.logs.contains("Configuration saved to: "), "save location printed");
  return ctx.expect(entries_in(scratch.path()) == 1, "only the config file remains");
}

bool test_save_failure_is_reported(TestContext& ctx) {
  cprm::test::ScratchDir scratch("cprm-bench-test");
  cprm::test::write_file(scratch / "blocker", "file");
  ConfigStore config;
  config.set_logger(&ctx.logger);
  config.set_config_path(scratch / "blocker" / "config.json");

  auto options = small_options(scratch.path());
  options.quiet = true;
  Benchmark benchmark(config, options, &ctx.logger);
  benchmark.set_trial_function([](std::size_t workers, const std::filesystem::path&,
                                  const std::filesystem::path&) {
    return Benchmark::Seconds(1.0 / static_cast<double>(workers));
  });
  auto result = benchmark.run();
  ctx.expect(result.optimal_workers == 8, "fastest candidate still reported");
  ctx.expect(!result.saved, "save failure reported");
  ctx.expect(ctx.logs.contains("Benchmark results were not saved"), "warning logged");
  return ctx.expect(config.get<std::int64_t>("optimal_parallel_workers") == 8, "in-memory value updated");
}

bool test_invalid_options(TestContext& ctx) {
  ConfigStore config;
  Benchmark::Options options;
  options.candidates.clear();
  Benchmark benchmark(config, options, &ctx.logger);
  bool threw = false;
  try {
    benchmark.run();
  } catch(const std::invalid_argument&) {
    threw = true;
  }
  return ctx.expect(threw, "no candidates rejected before any file is written");
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"select_optimal", test_select_optimal},
    {"fixed_timings_are_persisted", test_fixed_timings_are_persisted},
    {"failed_trial_cleans_up", test_failed_trial_cleans_up},
    {"real_small_run", test_real_small_run},
    {"save_failure_is_reported", test_save_failure_is_reported},
    {"invalid_options", test_invalid_options}
  };
  return cprm::test::run_test_cases("benchmark", tests, argc, argv);
}
