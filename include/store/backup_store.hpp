#ifndef CHUNKVAULT_STORE_BACKUP_STORE_HPP
#define CHUNKVAULT_STORE_BACKUP_STORE_HPP

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "codec/chunk_codec.hpp"

namespace chunkvault {
namespace store {

struct BackupUsage {
  std::uintmax_t total_bytes = 0;
  std::size_t file_count = 0;
  std::size_t chunk_count = 0;
};

// Writes restored chunk bytes into the primary tier
using ChunkWriter = std::function<void(const codec::ChunkId&, const std::string&)>;

/*
 * Secondary tier, one owner per instance:
 *   {root}/user_{owner}/files/{name}              whole-file snapshots
 *   {root}/user_{owner}/chunks/{group}/{id}.chunk chunk mirrors per file
 *   {root}/user_{owner}/metadata/{name}.yaml      snapshot sidecars
 *
 * No method throws for I/O problems: failures are logged and reported through the
 * return value. Callers check is_enabled() first; a disabled tier is a valid mode.
 */
class BackupStore {
public:

  // ---- CONSTRUCTOR ----
  // An empty root or enabled == false yields a disabled store.
  // Throws std::invalid_argument for an owner that is not a safe path component.
  BackupStore(const std::filesystem::path& root, const std::string& owner, bool enabled = true);


  // ---- STATUS ----
  bool is_enabled() const;


  // ---- MIRRORING ----
  // Snapshot + sidecar. Returns the locator, or std::nullopt on any failure.
  std::optional<std::string> mirror_file(const std::string& bytes, const std::string& name,
                                         const std::map<std::string, std::string>& metadata);
  // Copies every chunk into the group directory. False if any chunk could not be fetched or written.
  bool mirror_chunks(const std::vector<codec::ChunkId>& ids, const codec::ChunkReader& fetch_from_primary,
                     const std::string& file_group_key);


  // ---- RECOVERY ----
  // Returns the ids actually restored, in request order. Ids absent from the backup are skipped.
  std::vector<codec::ChunkId> restore_chunks(const std::vector<codec::ChunkId>& ids,
                                             const std::string& file_group_key,
                                             const ChunkWriter& write_to_primary) const;
  std::optional<std::string> fetch_file(const std::string& name) const;
  std::optional<std::map<std::string, std::string>> fetch_metadata(const std::string& name) const;
  bool has_chunk(const codec::ChunkId& id, const std::string& file_group_key) const;


  // ---- CLEANUP ----
  // Idempotent. Return false only for I/O errors, never for missing targets.
  bool delete_file(const std::string& name);
  bool delete_chunks(const std::string& file_group_key);


  // ---- DIAGNOSTICS ----
  std::vector<std::string> list_files() const;
  BackupUsage usage() const;


  // ---- GETTERS ----
  const std::filesystem::path& owner_path() const { return owner_path_; }

private:
  // ---- PARAMETERS ----
  std::filesystem::path root_;
  std::string owner_;
  bool configured_;
  std::filesystem::path owner_path_;
  std::filesystem::path files_path_;
  std::filesystem::path chunks_path_;
  std::filesystem::path metadata_path_;


  // ---- PATH SUPPORT ----
  std::filesystem::path group_path(const std::string& file_group_key) const;
  std::filesystem::path chunk_path(const codec::ChunkId& id, const std::string& file_group_key) const;
  std::filesystem::path sidecar_path(const std::string& name) const;
  // Creates the owner's directory tree, false on failure
  bool ensure_layout();
};

} // namespace store
} // namespace chunkvault

#endif // CHUNKVAULT_STORE_BACKUP_STORE_HPP
