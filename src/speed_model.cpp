#include "speed_model.hpp"

#include <cmath>
#include <numeric>

#include "utils.hpp"

const char* operation_tag(OperationKind kind) {
  return kind == OperationKind::copy ? "cp" : "rm";
}

SpeedModel::SpeedModel(ConfigStore& config, Logger* logger)
  : config_(config), logger_(logger) {}

const char* SpeedModel::config_key(OperationKind kind) {
  return kind == OperationKind::copy ? "copy_speeds_mbps" : "delete_speeds_mbps";
}

std::vector<double> SpeedModel::samples(OperationKind kind) const {
  std::vector<double> out;
  const char* key = config_key(kind);
  if(!config_.has(key)) return out;
  auto stored = config_.get<nlohmann::json>(key);
  if(!stored.is_array()) return out;
  for(const auto& value : stored) {
    if(!value.is_number()) continue;
    double mbps = value.get<double>();
    if(std::isfinite(mbps) && mbps > 0.0) out.push_back(mbps);
  }
  return out;
}

double SpeedModel::average_mbps(OperationKind kind) const {
  auto history = samples(kind);
  if(history.empty()) {
    return kind == OperationKind::copy ? kDefaultCopyMbps : kDefaultDeleteMbps;
  }
  return std::accumulate(history.begin(), history.end(), 0.0) / static_cast<double>(history.size());
}

TimeEstimate SpeedModel::estimate(std::uint64_t total_bytes, OperationKind kind) const {
  TimeEstimate result;
  if(total_bytes == 0) {
    result.under_one_second = true;
    return result;
  }
  const double bytes_per_second = average_mbps(kind) * 1024.0 * 1024.0;
  result.duration = std::chrono::duration<double>(static_cast<double>(total_bytes) / bytes_per_second);
  return result;
}

bool SpeedModel::record(OperationKind kind, double mbps) noexcept {
  if(!std::isfinite(mbps) || mbps <= 0.0) return false;
  try {
    auto history = samples(kind);
    history.push_back(mbps);
    if(history.size() > kMaxSamples) {
      history.erase(history.begin(), history.end() - static_cast<std::ptrdiff_t>(kMaxSamples));
    }
    std::string error;
    if(!config_.set(config_key(kind), nlohmann::json(history), error)) {
      log_warn(logger_, "Unable to store speed sample: {}", error);
      return false;
    }
    if(!config_.save()) {
      log_debug(logger_, "Speed sample kept in memory only");
      return false;
    }
    log_debug(logger_, "Recorded {} speed {:.1f} MB/s", operation_tag(kind), mbps);
    return true;
  } catch(const std::exception& e) {
    log_warn(logger_, "Unable to record speed sample: {}", e.what());
    return false;
  }
}

std::string SpeedModel::format_estimate(const TimeEstimate& estimate) {
  if(estimate.under_one_second) return "< 1s";
  return format_time(estimate.duration.count());
}
