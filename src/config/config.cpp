#include "config/config.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <boost/log/trivial.hpp>
#include <yaml-cpp/yaml.h>
#include "common/storage_error.hpp"

namespace chunkvault {
namespace config {

namespace {

template <typename T>
T get_value(const YAML::Node& node, const std::string& key, const T& default_value) {
  if (!node[key]) {
    return default_value;
  }
  try {
    return node[key].as<T>();
  } catch (const YAML::Exception& e) {
    std::stringstream err;
    err << "failed to parse config key '" << key << "': " << e.what();
    throw InvalidConfiguration(err.str());
  }
}

bool parse_bool(const std::string& value) {
  std::string lower = value;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lower == "true" || lower == "1" || lower == "yes" || lower == "on";
}

} // namespace

EngineConfig load_config(const std::string& path) {
  BOOST_LOG_TRIVIAL(info) << "Config: Loading configuration from " << path;

  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw InvalidConfiguration("cannot load " + path + ": " + e.what());
  }

  EngineConfig config;
  if (const YAML::Node storage = root["storage"]) {
    config.primary_root = get_value<std::string>(storage, "primary_root", config.primary_root);
    config.backup_root = get_value<std::string>(storage, "backup_root", config.backup_root);
    config.backup_enabled = get_value<bool>(storage, "backup_enabled", config.backup_enabled);
    config.chunk_size = get_value<std::int64_t>(storage, "chunk_size", config.chunk_size);
    config.records_root = get_value<std::string>(storage, "records_root", config.records_root);
    config.verify_checksum_on_read =
        get_value<bool>(storage, "verify_checksum_on_read", config.verify_checksum_on_read);
  }
  if (const YAML::Node logging = root["logging"]) {
    config.log_file = get_value<std::string>(logging, "file", config.log_file);
    config.log_level = get_value<std::string>(logging, "level", config.log_level);
  }
  return config;
}

void apply_env_overrides(EngineConfig& config) {
  if (const char* env = std::getenv("CHUNKVAULT_STORAGE_PATH")) {
    config.primary_root = env;
  }
  if (const char* env = std::getenv("CHUNKVAULT_BACKUP_PATH")) {
    config.backup_root = env;
  }
  if (const char* env = std::getenv("CHUNKVAULT_ENABLE_BACKUP")) {
    config.backup_enabled = parse_bool(env);
  }
  if (const char* env = std::getenv("CHUNKVAULT_RECORDS_PATH")) {
    config.records_root = env;
  }
  if (const char* env = std::getenv("CHUNKVAULT_CHUNK_SIZE")) {
    try {
      std::size_t consumed = 0;
      config.chunk_size = std::stoll(env, &consumed);
      if (consumed != std::string(env).size()) {
        throw InvalidConfiguration(std::string("CHUNKVAULT_CHUNK_SIZE is not an integer: ") + env);
      }
    } catch (const std::logic_error&) {
      throw InvalidConfiguration(std::string("CHUNKVAULT_CHUNK_SIZE is not an integer: ") + env);
    }
  }
}

void validate(const EngineConfig& config) {
  if (config.chunk_size <= 0) {
    throw InvalidConfiguration("chunk_size must be a positive integer, got " + std::to_string(config.chunk_size));
  }
  if (config.primary_root.empty()) {
    throw InvalidConfiguration("primary_root must not be empty");
  }
  if (config.records_root.empty()) {
    throw InvalidConfiguration("records_root must not be empty");
  }
  if (config.backup_enabled && config.backup_root.empty()) {
    throw InvalidConfiguration("backup_enabled requires backup_root");
  }
}

} // namespace config
} // namespace chunkvault
