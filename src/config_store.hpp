#pragma once

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include <unistd.h>

#include <nlohmann/json.hpp>

#include "log.hpp"

inline const nlohmann::json CONFIG_SPECIFICATION = nlohmann::json::array({
  {{"key","copy_speeds_mbps"},         {"type","json"},   {"default",nlohmann::json::array()},  {"description","Recent observed copy throughput samples (MB/s)"}},
  {{"key","delete_speeds_mbps"},       {"type","json"},   {"default",nlohmann::json::array()},  {"description","Recent observed delete throughput samples (MB/s)"}},
  {{"key","optimal_parallel_workers"}, {"type","int"},    {"default",4},                        {"description","Worker count used by -P without a value"}},
  {{"key","benchmark_date"},           {"type","string"}, {"default",""},                       {"description","Local time of the last benchmark run"}},
  {{"key","benchmark_results"},        {"type","json"},   {"default",nlohmann::json::object()}, {"description","Average seconds per worker count from the last benchmark"}},
  {{"key","buffer_size"},              {"type","int"},    {"default",16 * 1024 * 1024},         {"description","Streaming copy buffer in bytes"}},
  {{"key","block_size"},               {"type","int"},    {"default",32 * 1024 * 1024},         {"description","Parallel copy block size in bytes"}},
  {{"key","parallel_threshold"},       {"type","int"},    {"default",64 * 1024 * 1024},         {"description","Files larger than this use the block engine when -P is given"}},
  {{"key","verbose"},                  {"type","bool"},   {"default",false},                    {"description","Enable debug logging"}}
});

// Process-wide persisted configuration. Loaded once at start-up and saved
// explicitly; every failure is reported through the return value and a
// warning, never as an exception.
class ConfigStore {
public:
  ConfigStore();
  explicit ConfigStore(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const;

  bool has(const std::string& key) const;

  bool set(const std::string& key, const nlohmann::json& value, std::string& error);

  bool save() const;
  bool load();
  bool save_to_file(const std::filesystem::path& path) const;
  bool load_from_file(const std::filesystem::path& path);

  std::filesystem::path config_path() const;
  void set_config_path(const std::filesystem::path& path);
  static std::filesystem::path default_config_path();

  nlohmann::json get_json(bool persistent_only = true) const;

  void set_logger(Logger* logger) { logger_ = logger; }

private:
  struct KeySpec {
    std::string key;
    std::string type;
    nlohmann::json default_value;
    std::string description;
    bool persistent = true;
  };

  static std::vector<KeySpec> build_key_specs(const nlohmann::json& specification);
  const KeySpec* find_spec(const std::string& key) const;

  void apply_defaults();
  void merge_from_json(const nlohmann::json& doc);
  bool convert_and_store(const KeySpec& spec, const nlohmann::json& value, std::string& error);

  nlohmann::json values_;
  std::vector<KeySpec> key_specs_;
  std::filesystem::path config_path_override_;
  Logger* logger_ = nullptr;
};

// ---- implementation -------------------------------------------------------

inline std::vector<ConfigStore::KeySpec> ConfigStore::build_key_specs(const nlohmann::json& specification) {
  std::vector<KeySpec> result;
  for(const auto& entry : specification) {
    KeySpec spec;
    spec.key = entry.at("key").get<std::string>();
    spec.type = entry.at("type").get<std::string>();
    spec.default_value = entry.at("default");
    spec.description = entry.value("description", "");
    spec.persistent = entry.value("persistent", true);
    result.push_back(std::move(spec));
  }
  return result;
}

inline ConfigStore::ConfigStore()
  : ConfigStore(CONFIG_SPECIFICATION) {}

inline ConfigStore::ConfigStore(const nlohmann::json& specification)
  : key_specs_(build_key_specs(specification)) {
  apply_defaults();
}

inline void ConfigStore::apply_defaults() {
  values_ = nlohmann::json::object();
  for(const auto& spec : key_specs_) {
    values_[spec.key] = spec.default_value;
  }
}

inline const ConfigStore::KeySpec* ConfigStore::find_spec(const std::string& key) const {
  for(const auto& spec : key_specs_) {
    if(spec.key == key) return &spec;
  }
  return nullptr;
}

inline bool ConfigStore::has(const std::string& key) const {
  return values_.contains(key);
}

inline void ConfigStore::set_config_path(const std::filesystem::path& path) {
  config_path_override_ = path;
}

inline std::filesystem::path ConfigStore::default_config_path() {
  if(const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
    return std::filesystem::path(xdg) / "cprm" / "config.json";
  }
  if(const char* home = std::getenv("HOME"); home && *home) {
    return std::filesystem::path(home) / ".config" / "cprm" / "config.json";
  }
  return std::filesystem::current_path() / ".config" / "cprm" / "config.json";
}

inline std::filesystem::path ConfigStore::config_path() const {
  if(!config_path_override_.empty()) {
    return config_path_override_;
  }
  return default_config_path();
}

inline bool ConfigStore::load() {
  return load_from_file(config_path());
}

inline bool ConfigStore::save() const {
  return save_to_file(config_path());
}

inline bool ConfigStore::load_from_file(const std::filesystem::path& path) {
  if(path.empty()) return false;
  std::error_code ec;
  if(!std::filesystem::exists(path, ec)) return false;
  std::ifstream in(path);
  if(!in) {
    log_warn(logger_, "Unable to read {}", path.string());
    return false;
  }
  try {
    nlohmann::json doc;
    in >> doc;
    merge_from_json(doc);
    return true;
  } catch(const std::exception& e) {
    log_warn(logger_, "Ignoring unreadable config {}: {}", path.string(), e.what());
    return false;
  }
}

inline bool ConfigStore::save_to_file(const std::filesystem::path& path) const {
  if(path.empty()) return false;
  std::error_code ec;
  if(path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if(ec) {
      log_warn(logger_, "Unable to create {}: {}", path.parent_path().string(), ec.message());
      return false;
    }
  }
  // Written beside the target and renamed over it, so a crash mid-write
  // keeps the previous record.
  auto staging = path;
  staging += ".tmp." + std::to_string(::getpid());
  try {
    std::ofstream out(staging, std::ios::trunc);
    if(!out) {
      log_warn(logger_, "Unable to write {}", staging.string());
      return false;
    }
    out << get_json(true).dump(2);
    out.close();
    if(!out) {
      log_warn(logger_, "Unable to write {}", staging.string());
      std::filesystem::remove(staging, ec);
      return false;
    }
  } catch(const std::exception& e) {
    log_warn(logger_, "Unable to serialise config: {}", e.what());
    std::filesystem::remove(staging, ec);
    return false;
  }
  std::filesystem::rename(staging, path, ec);
  if(ec) {
    log_warn(logger_, "Unable to replace {}: {}", path.string(), ec.message());
    std::filesystem::remove(staging, ec);
    return false;
  }
  return true;
}

inline void ConfigStore::merge_from_json(const nlohmann::json& doc) {
  if(!doc.is_object()) return;
  for(const auto& item : doc.items()) {
    const auto* spec = find_spec(item.key());
    if(!spec) continue;
    std::string error;
    if(!convert_and_store(*spec, item.value(), error) && !error.empty()) {
      log_warn(logger_, "Ignoring invalid config value '{}': {}", item.key(), error);
    }
  }
}

inline nlohmann::json ConfigStore::get_json(bool persistent_only) const {
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& spec : key_specs_) {
    if(persistent_only && !spec.persistent) continue;
    if(values_.contains(spec.key)) {
      doc[spec.key] = values_.at(spec.key);
    }
  }
  return doc;
}

inline bool ConfigStore::convert_and_store(const KeySpec& spec,
                                           const nlohmann::json& value,
                                           std::string& error) {
  if(spec.type == "bool") {
    if(value.is_boolean()) {
      values_[spec.key] = value.get<bool>();
      return true;
    }
    if(value.is_number_integer()) {
      values_[spec.key] = (value.get<std::int64_t>() != 0);
      return true;
    }
    error = "expected boolean";
    return false;
  }
  if(spec.type == "int") {
    if(value.is_number_integer()) {
      values_[spec.key] = value.get<std::int64_t>();
      return true;
    }
    error = "expected integer";
    return false;
  }
  if(spec.type == "string") {
    if(value.is_string()) {
      values_[spec.key] = value.get<std::string>();
      return true;
    }
    error = "expected string";
    return false;
  }
  if(spec.type == "json") {
    if(value.type() != spec.default_value.type()) {
      error = std::string("expected ") + spec.default_value.type_name();
      return false;
    }
    values_[spec.key] = value;
    return true;
  }
  error = "unknown type";
  return false;
}

inline bool ConfigStore::set(const std::string& key,
                             const nlohmann::json& value,
                             std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown config key";
    return false;
  }
  error.clear();
  return convert_and_store(*spec, value, error);
}

template<typename T>
inline T ConfigStore::get(const std::string& key) const {
  if(!has(key)) {
    throw std::runtime_error("Unknown config key: " + key);
  }
  return values_.at(key).get<T>();
}
