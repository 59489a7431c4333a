#ifndef CHUNKVAULT_STORE_RECORD_STORE_HPP
#define CHUNKVAULT_STORE_RECORD_STORE_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "store/file_record.hpp"

namespace chunkvault {
namespace store {

// Key-value persistence of FileRecords keyed by record id. Querying beyond
// list-by-owner belongs to whatever relational store sits behind this.
class RecordStore {
public:
  virtual ~RecordStore() = default;

  // Idempotent, called once at startup
  virtual void initialize() = 0;
  // Inserts or replaces the record with the same id
  virtual void put(const FileRecord& record) = 0;
  virtual std::optional<FileRecord> get(const std::string& file_id) const = 0;
  // False if there was nothing to remove
  virtual bool remove(const std::string& file_id) = 0;
  // Records of one owner, oldest first
  virtual std::vector<FileRecord> list(const std::string& owner) const = 0;
};

// One YAML document per record: {directory}/{id}.yaml
class YamlRecordStore : public RecordStore {
public:
  explicit YamlRecordStore(const std::filesystem::path& directory);

  void initialize() override;
  void put(const FileRecord& record) override;
  std::optional<FileRecord> get(const std::string& file_id) const override;
  bool remove(const std::string& file_id) override;
  std::vector<FileRecord> list(const std::string& owner) const override;

private:
  std::filesystem::path directory_;

  std::filesystem::path record_path(const std::string& file_id) const;
  FileRecord load(const std::filesystem::path& path) const;
};

} // namespace store
} // namespace chunkvault

#endif // CHUNKVAULT_STORE_RECORD_STORE_HPP
