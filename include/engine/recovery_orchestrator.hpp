#ifndef CHUNKVAULT_ENGINE_RECOVERY_ORCHESTRATOR_HPP
#define CHUNKVAULT_ENGINE_RECOVERY_ORCHESTRATOR_HPP

#include <atomic>
#include <istream>
#include <string>
#include <vector>
#include "codec/cancellation.hpp"
#include "codec/chunk_codec.hpp"
#include "config/config.hpp"
#include "engine/file_lock_registry.hpp"
#include "store/backup_store.hpp"
#include "store/file_record.hpp"
#include "store/primary_store.hpp"
#include "store/record_store.hpp"

namespace chunkvault {
namespace engine {

enum class SyncStatus {
  SYNCED,
  DISABLED,
  FAILED
};

const char* sync_status_to_string(SyncStatus status);

// Outcome of an upload or a manual sync. A backup problem never fails the call,
// it shows up as status + warning.
struct StoreResult {
  store::FileRecord record;
  SyncStatus sync_status = SyncStatus::DISABLED;
  std::string warning;
};

struct VerifyReport {
  std::vector<codec::ChunkId> missing_primary;
  bool backup_enabled = false;
  std::vector<codec::ChunkId> missing_backup;
  bool snapshot_present = false;
  // Snapshot bytes hash to the recorded checksum
  bool snapshot_intact = false;
};

struct UsageReport {
  std::size_t file_count = 0;
  store::PrimaryUsage primary;
  bool backup_enabled = false;
  store::BackupUsage backup;
};

/*
 * Drives the write, read and delete paths over both tiers. Keeps no per-file state
 * between calls: every operation starts from the FileRecord and fresh store queries.
 * All operations on one file are serialized; different files and owners run in parallel.
 */
class RecoveryOrchestrator {
public:
  // ---- CONSTRUCTOR ----
  // Throws InvalidConfiguration for an invalid config
  RecoveryOrchestrator(const config::EngineConfig& config, store::RecordStore& records);


  // ---- STARTUP ----
  // Creates the tier roots and the record store. Idempotent; must run before any operation.
  void initialize();


  // ---- FILE OPERATIONS ----
  // Split + persist all chunks (all or nothing), record, then best-effort mirror.
  // Throws PrimaryWriteFailed after rolling back partially written chunks.
  StoreResult upload(const std::string& owner, const std::string& original_name, std::istream& input);
  // Restores missing chunks from the backup before reconstructing. Throws
  // IrrecoverableDataLoss, ChunkNotFound, IntegrityError, OperationCancelled or FileRecordNotFound.
  std::string download(const std::string& owner, const std::string& file_id,
                       const codec::CancellationToken* cancel = nullptr);
  // Releases the chunks on both tiers, then the record. Backup cleanup failures are only logged.
  void remove(const std::string& owner, const std::string& file_id);
  // Re-mirrors an existing file. Throws BackupUnavailable when the backup tier is off.
  StoreResult sync(const std::string& owner, const std::string& file_id);


  // ---- DIAGNOSTICS ----
  VerifyReport verify(const std::string& owner, const std::string& file_id);
  std::vector<store::FileRecord> list(const std::string& owner) const;
  UsageReport usage(const std::string& owner) const;


  // ---- GETTERS ----
  const config::EngineConfig& config() const { return config_; }
  const FileLockRegistry& locks() const { return locks_; }

private:
  // ---- PARAMETERS ----
  config::EngineConfig config_;
  store::RecordStore& records_;
  codec::ChunkCodec codec_;
  FileLockRegistry locks_;
  std::atomic<bool> initialized_{false};


  // ---- HELPERS ----
  void require_initialized() const;
  store::PrimaryStore primary_for(const std::string& owner) const;
  store::BackupStore backup_for(const std::string& owner) const;
  // Record of `owner`, FileRecordNotFound if absent or owned by someone else
  store::FileRecord load_record(const std::string& owner, const std::string& file_id) const;
  // Pulls missing chunks back from the backup, throws IrrecoverableDataLoss for what remains
  void ensure_primary_complete(const store::FileRecord& record, store::PrimaryStore& primary,
                               store::BackupStore& backup) const;
  // Snapshot + chunk mirror. Updates record.synced/backup_locator on success.
  SyncStatus mirror(store::FileRecord& record, store::PrimaryStore& primary,
                    store::BackupStore& backup, std::string& warning);
};

} // namespace engine
} // namespace chunkvault

#endif // CHUNKVAULT_ENGINE_RECOVERY_ORCHESTRATOR_HPP
