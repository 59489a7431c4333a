#ifndef CHUNKVAULT_CONFIG_CONFIG_HPP
#define CHUNKVAULT_CONFIG_CONFIG_HPP

#include <cstdint>
#include <string>

namespace chunkvault {
namespace config {

namespace defaults {
constexpr std::int64_t CHUNK_SIZE = 1024 * 1024;  // 1 MiB
constexpr const char* PRIMARY_ROOT = "storage";
constexpr const char* RECORDS_ROOT = "records";
constexpr const char* LOG_FILE = "chunkvault.log";
constexpr const char* LOG_LEVEL = "info";
}

struct EngineConfig {
  // Root of the per-owner chunk namespaces
  std::string primary_root = defaults::PRIMARY_ROOT;
  // Root of the backup tier, empty when there is none
  std::string backup_root;
  bool backup_enabled = false;
  std::int64_t chunk_size = defaults::CHUNK_SIZE;
  std::string records_root = defaults::RECORDS_ROOT;
  // Re-hash reconstructed files and compare against the recorded checksum
  bool verify_checksum_on_read = true;

  std::string log_file = defaults::LOG_FILE;
  std::string log_level = defaults::LOG_LEVEL;
};

// Parses a YAML file. Missing keys keep their defaults. Throws InvalidConfiguration
// for unreadable files or values of the wrong type.
EngineConfig load_config(const std::string& path);

// CHUNKVAULT_STORAGE_PATH, CHUNKVAULT_BACKUP_PATH, CHUNKVAULT_ENABLE_BACKUP,
// CHUNKVAULT_CHUNK_SIZE, CHUNKVAULT_RECORDS_PATH
void apply_env_overrides(EngineConfig& config);

// Throws InvalidConfiguration on the first unusable setting
void validate(const EngineConfig& config);

} // namespace config
} // namespace chunkvault

#endif // CHUNKVAULT_CONFIG_CONFIG_HPP
