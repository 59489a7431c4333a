#ifndef CHUNKVAULT_STORE_FILE_RECORD_HPP
#define CHUNKVAULT_STORE_FILE_RECORD_HPP

#include <cstdint>
#include <string>
#include "codec/chunk_codec.hpp"

namespace chunkvault {
namespace store {

// Metadata of one chunked file. Checksum, manifest and sizes never change after creation;
// synced and backup_locator are only touched by backup mirroring.
struct FileRecord {
  std::string id;
  std::string owner;
  std::string original_name;
  // Sanitized, unique name of the whole-file snapshot in the backup tier
  std::string stored_name;
  codec::ChunkManifest manifest;
  std::uint64_t chunk_size = 0;
  std::uint64_t size = 0;
  std::string checksum;
  bool synced = false;
  std::string backup_locator;
  // ISO-8601 UTC
  std::string created_at;

  std::size_t chunk_count() const { return manifest.size(); }
};

// 32 hex chars from the CSPRNG
std::string generate_file_id();
// "<16 hex>_<sanitized original name>"
std::string make_stored_name(const std::string& original_name);
std::string current_timestamp();

} // namespace store
} // namespace chunkvault

#endif // CHUNKVAULT_STORE_FILE_RECORD_HPP
