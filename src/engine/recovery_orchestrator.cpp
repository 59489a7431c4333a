#include "engine/recovery_orchestrator.hpp"
#include <algorithm>
#include <filesystem>
#include <iterator>
#include <map>
#include <set>
#include <stdexcept>
#include <system_error>
#include <boost/log/trivial.hpp>
#include "codec/digest.hpp"
#include "common/storage_error.hpp"
#include "store/path_utils.hpp"

namespace chunkvault {
namespace engine {

namespace {

const config::EngineConfig& checked(const config::EngineConfig& config) {
  config::validate(config);
  return config;
}

codec::ChunkReader reader_for(const store::PrimaryStore& primary) {
  return [&primary](const codec::ChunkId& id) { return primary.retrieve(id); };
}

} // namespace

const char* sync_status_to_string(SyncStatus status) {
  switch (status) {
    case SyncStatus::SYNCED: return "synced";
    case SyncStatus::DISABLED: return "disabled";
    case SyncStatus::FAILED: return "failed";
    default: return "unknown";
  }
}

//==============================================
// CONSTRUCTOR
//==============================================

RecoveryOrchestrator::RecoveryOrchestrator(const config::EngineConfig& config, store::RecordStore& records)
  : config_(checked(config))
  , records_(records)
  , codec_(config_.chunk_size) {
  BOOST_LOG_TRIVIAL(info) << "Orchestrator: Created with chunk size " << codec_.chunk_size()
                          << ", backup " << (config_.backup_enabled ? "enabled" : "disabled");
}


//==============================================
// STARTUP
//==============================================

void RecoveryOrchestrator::initialize() {
  BOOST_LOG_TRIVIAL(info) << "Orchestrator: Initializing storage tiers";

  std::error_code ec;
  std::filesystem::create_directories(config_.primary_root, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Orchestrator: Cannot create primary root " << config_.primary_root
                             << ": " << ec.message();
    throw StorageError("Orchestrator: Cannot create primary root " + config_.primary_root + ": " + ec.message());
  }

  if (config_.backup_enabled) {
    std::filesystem::create_directories(config_.backup_root, ec);
    if (ec) {
      // Backup problems never block the primary tier
      BOOST_LOG_TRIVIAL(warning) << "Orchestrator: Backup root " << config_.backup_root
                                 << " unavailable: " << ec.message();
    }
  }

  records_.initialize();
  initialized_ = true;
  BOOST_LOG_TRIVIAL(info) << "Orchestrator: Initialization complete";
}


//==============================================
// FILE OPERATIONS
//==============================================

StoreResult RecoveryOrchestrator::upload(const std::string& owner, const std::string& original_name,
                                         std::istream& input) {
  require_initialized();
  BOOST_LOG_TRIVIAL(info) << "Orchestrator: Uploading " << original_name << " for owner " << owner;

  store::PrimaryStore primary = primary_for(owner);
  store::FileRecord record;
  record.id = store::generate_file_id();
  record.owner = owner;
  record.original_name = original_name;
  record.stored_name = store::make_stored_name(original_name);
  record.chunk_size = codec_.chunk_size();

  auto guard = locks_.lock(owner, record.id);

  // Chunks are persisted while splitting; on any failure everything written so far goes
  std::vector<codec::ChunkId> persisted;
  try {
    codec::SplitResult split = codec_.split(input, [&](const codec::ChunkId& id, const std::string& bytes) {
      primary.persist(id, bytes);
      persisted.push_back(id);
    });

    record.manifest = std::move(split.manifest);
    record.size = split.total_size;
    record.checksum = std::move(split.checksum);
    record.created_at = store::current_timestamp();
    records_.put(record);
  } catch (const PrimaryWriteFailed& e) {
    BOOST_LOG_TRIVIAL(error) << "Orchestrator: Upload of " << original_name << " failed, rolling back "
                             << persisted.size() << " chunks: " << e.what();
    primary.remove(persisted);
    throw;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Orchestrator: Upload of " << original_name << " aborted, rolling back "
                             << persisted.size() << " chunks: " << e.what();
    primary.remove(persisted);
    throw PrimaryWriteFailed(std::string("upload of ") + original_name + " aborted: " + e.what());
  }

  StoreResult result;
  store::BackupStore backup = backup_for(owner);
  if (!config_.backup_enabled) {
    result.sync_status = SyncStatus::DISABLED;
  } else if (!backup.is_enabled()) {
    result.sync_status = SyncStatus::DISABLED;
    result.warning = BackupUnavailable("backup root " + config_.backup_root + " is not reachable").what();
    BOOST_LOG_TRIVIAL(warning) << "Orchestrator: " << result.warning;
  } else {
    result.sync_status = mirror(record, primary, backup, result.warning);
  }

  BOOST_LOG_TRIVIAL(info) << "Orchestrator: Uploaded " << original_name << " as " << record.id << " ("
                          << record.size << " bytes, " << record.chunk_count() << " chunks, backup "
                          << sync_status_to_string(result.sync_status) << ")";
  result.record = std::move(record);
  return result;
}

std::string RecoveryOrchestrator::download(const std::string& owner, const std::string& file_id,
                                           const codec::CancellationToken* cancel) {
  require_initialized();
  BOOST_LOG_TRIVIAL(info) << "Orchestrator: Downloading " << file_id << " for owner " << owner;

  store::PrimaryStore primary = primary_for(owner);
  auto guard = locks_.lock(owner, file_id);
  store::FileRecord record = load_record(owner, file_id);

  store::BackupStore backup = backup_for(owner);
  ensure_primary_complete(record, primary, backup);

  std::string bytes = codec_.reconstruct(record.manifest, reader_for(primary), cancel);

  if (bytes.size() != record.size) {
    BOOST_LOG_TRIVIAL(error) << "Orchestrator: File " << file_id << " reconstructed to " << bytes.size()
                             << " bytes, expected " << record.size;
    throw IntegrityError("size mismatch for file " + file_id);
  }
  if (config_.verify_checksum_on_read) {
    const std::string checksum = codec::Sha256Digest::hex_of(bytes);
    if (checksum != record.checksum) {
      BOOST_LOG_TRIVIAL(error) << "Orchestrator: Checksum mismatch for " << file_id << ": got " << checksum
                               << ", recorded " << record.checksum;
      throw IntegrityError("checksum mismatch for file " + file_id);
    }
  }

  BOOST_LOG_TRIVIAL(info) << "Orchestrator: Downloaded " << file_id << " (" << bytes.size() << " bytes)";
  return bytes;
}

void RecoveryOrchestrator::remove(const std::string& owner, const std::string& file_id) {
  require_initialized();
  BOOST_LOG_TRIVIAL(info) << "Orchestrator: Deleting " << file_id << " for owner " << owner;

  store::PrimaryStore primary = primary_for(owner);
  auto guard = locks_.lock(owner, file_id);
  store::FileRecord record = load_record(owner, file_id);

  primary.remove(record.manifest);

  if (record.synced) {
    store::BackupStore backup = backup_for(owner);
    if (!backup.is_enabled()) {
      BOOST_LOG_TRIVIAL(warning) << "Orchestrator: Backup tier unavailable, mirrors of " << file_id
                                 << " left in place";
    } else {
      if (!backup.delete_file(record.stored_name)) {
        BOOST_LOG_TRIVIAL(warning) << "Orchestrator: Failed to delete snapshot " << record.stored_name;
      }
      if (!backup.delete_chunks(record.id)) {
        BOOST_LOG_TRIVIAL(warning) << "Orchestrator: Failed to delete chunk mirrors of " << file_id;
      }
    }
  }

  records_.remove(record.id);
  BOOST_LOG_TRIVIAL(info) << "Orchestrator: Deleted " << file_id;
}

StoreResult RecoveryOrchestrator::sync(const std::string& owner, const std::string& file_id) {
  require_initialized();
  BOOST_LOG_TRIVIAL(info) << "Orchestrator: Syncing " << file_id << " for owner " << owner;

  store::PrimaryStore primary = primary_for(owner);
  store::BackupStore backup = backup_for(owner);
  if (!backup.is_enabled()) {
    throw BackupUnavailable("backup tier is disabled or unreachable");
  }

  auto guard = locks_.lock(owner, file_id);
  store::FileRecord record = load_record(owner, file_id);
  ensure_primary_complete(record, primary, backup);

  StoreResult result;
  result.sync_status = mirror(record, primary, backup, result.warning);
  result.record = std::move(record);
  return result;
}


//==============================================
// DIAGNOSTICS
//==============================================

VerifyReport RecoveryOrchestrator::verify(const std::string& owner, const std::string& file_id) {
  require_initialized();

  store::PrimaryStore primary = primary_for(owner);
  auto guard = locks_.lock(owner, file_id);
  store::FileRecord record = load_record(owner, file_id);

  VerifyReport report;
  report.missing_primary = primary.exists_batch(record.manifest);

  store::BackupStore backup = backup_for(owner);
  report.backup_enabled = backup.is_enabled();
  if (report.backup_enabled) {
    report.missing_backup = codec::ChunkCodec::verify_presence(
        record.manifest, [&](const codec::ChunkId& id) { return backup.has_chunk(id, record.id); });
    if (auto snapshot = backup.fetch_file(record.stored_name)) {
      report.snapshot_present = true;
      report.snapshot_intact = codec::Sha256Digest::hex_of(*snapshot) == record.checksum;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "Orchestrator: Verified " << file_id << ": " << report.missing_primary.size()
                          << " missing in primary, " << report.missing_backup.size() << " missing in backup";
  return report;
}

std::vector<store::FileRecord> RecoveryOrchestrator::list(const std::string& owner) const {
  require_initialized();
  store::require_safe_component(owner, "owner identifier");
  return records_.list(owner);
}

UsageReport RecoveryOrchestrator::usage(const std::string& owner) const {
  require_initialized();

  UsageReport report;
  report.primary = primary_for(owner).usage();
  report.file_count = records_.list(owner).size();

  store::BackupStore backup = backup_for(owner);
  report.backup_enabled = backup.is_enabled();
  if (report.backup_enabled) {
    report.backup = backup.usage();
  }
  return report;
}


//==============================================
// HELPERS
//==============================================

void RecoveryOrchestrator::require_initialized() const {
  if (!initialized_) {
    throw std::logic_error("Orchestrator: initialize() must be called before any operation");
  }
}

store::PrimaryStore RecoveryOrchestrator::primary_for(const std::string& owner) const {
  return store::PrimaryStore(config_.primary_root, owner);
}

store::BackupStore RecoveryOrchestrator::backup_for(const std::string& owner) const {
  return store::BackupStore(config_.backup_root, owner, config_.backup_enabled);
}

store::FileRecord RecoveryOrchestrator::load_record(const std::string& owner, const std::string& file_id) const {
  auto record = records_.get(file_id);
  if (!record || record->owner != owner) {
    BOOST_LOG_TRIVIAL(warning) << "Orchestrator: No record " << file_id << " for owner " << owner;
    throw FileRecordNotFound(file_id);
  }
  return *record;
}

void RecoveryOrchestrator::ensure_primary_complete(const store::FileRecord& record, store::PrimaryStore& primary,
                                                   store::BackupStore& backup) const {
  std::vector<codec::ChunkId> missing = primary.exists_batch(record.manifest);
  if (missing.empty()) {
    return;
  }

  BOOST_LOG_TRIVIAL(warning) << "Orchestrator: " << missing.size() << " chunks of " << record.id
                             << " missing from primary";

  std::vector<codec::ChunkId> still_missing = missing;
  if (backup.is_enabled()) {
    std::vector<codec::ChunkId> restored = backup.restore_chunks(
        missing, record.id,
        [&primary](const codec::ChunkId& id, const std::string& bytes) { primary.persist(id, bytes); });

    const std::set<codec::ChunkId> restored_set(restored.begin(), restored.end());
    still_missing.clear();
    std::copy_if(missing.begin(), missing.end(), std::back_inserter(still_missing),
                 [&restored_set](const codec::ChunkId& id) { return restored_set.count(id) == 0; });

    BOOST_LOG_TRIVIAL(info) << "Orchestrator: Restored " << restored.size() << " chunks of " << record.id
                            << " from backup";
  }

  if (!still_missing.empty()) {
    BOOST_LOG_TRIVIAL(error) << "Orchestrator: " << still_missing.size() << " chunks of " << record.id
                             << " are lost on both tiers";
    throw IrrecoverableDataLoss(record.id, still_missing);
  }
}

SyncStatus RecoveryOrchestrator::mirror(store::FileRecord& record, store::PrimaryStore& primary,
                                        store::BackupStore& backup, std::string& warning) {
  const bool was_synced = record.synced;

  const std::map<std::string, std::string> metadata = {
    {"file_id", record.id},
    {"owner", record.owner},
    {"original_name", record.original_name},
    {"stored_name", record.stored_name},
    {"file_size", std::to_string(record.size)},
    {"chunk_size", std::to_string(record.chunk_size)},
    {"chunk_count", std::to_string(record.chunk_count())},
    {"checksum", record.checksum},
    {"upload_date", record.created_at},
    {"sync_date", store::current_timestamp()}
  };

  std::optional<std::string> locator;
  bool chunks_mirrored = false;
  try {
    std::string bytes = codec_.reconstruct(record.manifest, reader_for(primary));
    locator = backup.mirror_file(bytes, record.stored_name, metadata);
    if (locator) {
      chunks_mirrored = backup.mirror_chunks(record.manifest, reader_for(primary), record.id);
    }
  } catch (const std::exception& e) {
    // The file is already committed on the primary tier, a backup problem stays a warning
    warning = e.what();
  }

  if (!locator || !chunks_mirrored) {
    if (warning.empty()) {
      warning = locator ? "chunk mirror incomplete" : "snapshot mirror failed";
    }
    BOOST_LOG_TRIVIAL(warning) << "Orchestrator: Backup of " << record.id << " failed: " << warning;
    if (!was_synced) {
      // Drop the partial mirror so no unreferenced copy outlives the file
      backup.delete_file(record.stored_name);
      backup.delete_chunks(record.id);
    }
    return SyncStatus::FAILED;
  }

  record.synced = true;
  record.backup_locator = *locator;
  try {
    records_.put(record);
  } catch (const std::exception& e) {
    warning = std::string("mirrored but record not updated: ") + e.what();
    BOOST_LOG_TRIVIAL(error) << "Orchestrator: " << warning;
    record.synced = was_synced;
    if (!was_synced) {
      record.backup_locator.clear();
      backup.delete_file(record.stored_name);
      backup.delete_chunks(record.id);
    }
    return SyncStatus::FAILED;
  }

  BOOST_LOG_TRIVIAL(info) << "Orchestrator: Mirrored " << record.id << " to " << record.backup_locator;
  return SyncStatus::SYNCED;
}

} // namespace engine
} // namespace chunkvault
