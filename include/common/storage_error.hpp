#ifndef CHUNKVAULT_STORAGE_ERROR_HPP
#define CHUNKVAULT_STORAGE_ERROR_HPP

#include <stdexcept>
#include <string>
#include <vector>

namespace chunkvault {

class StorageError : public std::runtime_error {
public:
  explicit StorageError(const std::string& message)
    : std::runtime_error(message) {}
};

// Non-positive chunk size or otherwise unusable settings. Never retried.
class InvalidConfiguration : public StorageError {
public:
  explicit InvalidConfiguration(const std::string& message)
    : StorageError("Invalid configuration: " + message) {}
};

class PrimaryWriteFailed : public StorageError {
public:
  explicit PrimaryWriteFailed(const std::string& message)
    : StorageError("Primary write failed: " + message) {}
};

class ChunkNotFound : public StorageError {
public:
  explicit ChunkNotFound(const std::string& chunk_id)
    : StorageError("Chunk not found: " + chunk_id)
    , chunk_id_(chunk_id) {}

  const std::string& chunk_id() const { return chunk_id_; }

private:
  std::string chunk_id_;
};

// Chunks absent from both tiers. Carries the exact identifiers for diagnosis.
class IrrecoverableDataLoss : public StorageError {
public:
  IrrecoverableDataLoss(const std::string& file_id, const std::vector<std::string>& chunk_ids)
    : StorageError(build_message(file_id, chunk_ids))
    , file_id_(file_id)
    , chunk_ids_(chunk_ids) {}

  const std::string& file_id() const { return file_id_; }
  const std::vector<std::string>& chunk_ids() const { return chunk_ids_; }

private:
  std::string file_id_;
  std::vector<std::string> chunk_ids_;

  static std::string build_message(const std::string& file_id,
                                   const std::vector<std::string>& chunk_ids) {
    std::string message = "Irrecoverable data loss for file " + file_id + ", missing chunks:";
    for (const auto& id : chunk_ids) {
      message += " " + id;
    }
    return message;
  }
};

class BackupUnavailable : public StorageError {
public:
  explicit BackupUnavailable(const std::string& message)
    : StorageError("Backup unavailable: " + message) {}
};

class FileRecordNotFound : public StorageError {
public:
  explicit FileRecordNotFound(const std::string& file_id)
    : StorageError("File record not found: " + file_id)
    , file_id_(file_id) {}

  const std::string& file_id() const { return file_id_; }

private:
  std::string file_id_;
};

class IntegrityError : public StorageError {
public:
  explicit IntegrityError(const std::string& message)
    : StorageError("Integrity check failed: " + message) {}
};

class OperationCancelled : public StorageError {
public:
  explicit OperationCancelled(const std::string& message)
    : StorageError("Operation cancelled: " + message) {}
};

// Chunk identifiers are unique; writing one twice means the caller is broken.
class DuplicateChunk : public std::logic_error {
public:
  explicit DuplicateChunk(const std::string& chunk_id)
    : std::logic_error("Duplicate chunk identifier: " + chunk_id) {}
};

} // namespace chunkvault

#endif // CHUNKVAULT_STORAGE_ERROR_HPP
