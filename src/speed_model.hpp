#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "config_store.hpp"
#include "log.hpp"

enum class OperationKind { copy, remove };

const char* operation_tag(OperationKind kind);

struct TimeEstimate {
  std::chrono::duration<double> duration{0.0};
  bool under_one_second = false;
};

// Learned throughput per operation kind, persisted in the ConfigStore so
// estimates improve across runs.
class SpeedModel {
public:
  static constexpr std::size_t kMaxSamples = 10;
  static constexpr double kDefaultCopyMbps = 100.0;
  static constexpr double kDefaultDeleteMbps = 200.0;

  explicit SpeedModel(ConfigStore& config, Logger* logger = nullptr);

  TimeEstimate estimate(std::uint64_t total_bytes, OperationKind kind) const;

  // Mean of the stored samples, or the kind's default when there are none.
  double average_mbps(OperationKind kind) const;
  std::vector<double> samples(OperationKind kind) const;

  // Appends, trims to the newest kMaxSamples and saves. Store failures are
  // logged and reported as false; nothing escapes.
  bool record(OperationKind kind, double mbps) noexcept;

  static const char* config_key(OperationKind kind);
  static std::string format_estimate(const TimeEstimate& estimate);

private:
  ConfigStore& config_;
  Logger* logger_ = nullptr;
};
