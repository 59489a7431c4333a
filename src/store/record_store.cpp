#include "store/record_store.hpp"
#include <algorithm>
#include <fstream>
#include <system_error>
#include <boost/log/trivial.hpp>
#include <yaml-cpp/yaml.h>
#include "common/storage_error.hpp"
#include "store/path_utils.hpp"

namespace chunkvault {
namespace store {

namespace {

constexpr const char* RECORD_EXTENSION = ".yaml";

std::string encode(const FileRecord& record) {
  YAML::Emitter out;
  out << YAML::BeginMap;
  out << YAML::Key << "id" << YAML::Value << record.id;
  out << YAML::Key << "owner" << YAML::Value << record.owner;
  out << YAML::Key << "original_name" << YAML::Value << record.original_name;
  out << YAML::Key << "stored_name" << YAML::Value << record.stored_name;
  out << YAML::Key << "size" << YAML::Value << record.size;
  out << YAML::Key << "chunk_size" << YAML::Value << record.chunk_size;
  out << YAML::Key << "checksum" << YAML::Value << record.checksum;
  out << YAML::Key << "synced" << YAML::Value << record.synced;
  out << YAML::Key << "backup_locator" << YAML::Value << record.backup_locator;
  out << YAML::Key << "created_at" << YAML::Value << record.created_at;
  out << YAML::Key << "manifest" << YAML::Value << YAML::BeginSeq;
  for (const auto& id : record.manifest) {
    out << id;
  }
  out << YAML::EndSeq;
  out << YAML::EndMap;
  return std::string(out.c_str()) + "\n";
}

FileRecord decode(const YAML::Node& node) {
  FileRecord record;
  record.id = node["id"].as<std::string>();
  record.owner = node["owner"].as<std::string>();
  record.original_name = node["original_name"].as<std::string>();
  record.stored_name = node["stored_name"].as<std::string>();
  record.size = node["size"].as<std::uint64_t>();
  record.chunk_size = node["chunk_size"].as<std::uint64_t>();
  record.checksum = node["checksum"].as<std::string>();
  record.synced = node["synced"].as<bool>();
  record.backup_locator = node["backup_locator"] ? node["backup_locator"].as<std::string>() : "";
  record.created_at = node["created_at"] ? node["created_at"].as<std::string>() : "";
  if (node["manifest"]) {
    record.manifest = node["manifest"].as<std::vector<std::string>>();
  }
  return record;
}

} // namespace

YamlRecordStore::YamlRecordStore(const std::filesystem::path& directory)
  : directory_(directory) {}

void YamlRecordStore::initialize() {
  BOOST_LOG_TRIVIAL(info) << "Record store: Initializing at " << directory_.string();
  std::error_code ec;
  std::filesystem::create_directories(directory_, ec);
  if (ec) {
    throw StorageError("Record store: Cannot create " + directory_.string() + ": " + ec.message());
  }
}

void YamlRecordStore::put(const FileRecord& record) {
  BOOST_LOG_TRIVIAL(debug) << "Record store: Writing record " << record.id;

  std::filesystem::path path = record_path(record.id);
  std::filesystem::path partial_path = path;
  partial_path += ".part";

  {
    std::ofstream file(partial_path, std::ios::trunc);
    if (!file) {
      throw StorageError("Record store: Cannot create " + partial_path.string());
    }
    file << encode(record);
    file.close();
    if (!file) {
      throw StorageError("Record store: Short write for record " + record.id);
    }
  }

  std::error_code ec;
  std::filesystem::rename(partial_path, path, ec);
  if (ec) {
    throw StorageError("Record store: Cannot commit record " + record.id + ": " + ec.message());
  }
}

std::optional<FileRecord> YamlRecordStore::get(const std::string& file_id) const {
  if (!is_safe_component(file_id)) {
    return std::nullopt;
  }
  std::filesystem::path path = record_path(file_id);
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return std::nullopt;
  }
  return load(path);
}

bool YamlRecordStore::remove(const std::string& file_id) {
  if (!is_safe_component(file_id)) {
    return false;
  }
  std::error_code ec;
  bool removed = std::filesystem::remove(record_path(file_id), ec);
  if (ec) {
    throw StorageError("Record store: Cannot remove record " + file_id + ": " + ec.message());
  }
  BOOST_LOG_TRIVIAL(debug) << "Record store: Record " << file_id << (removed ? " removed" : " was absent");
  return removed;
}

std::vector<FileRecord> YamlRecordStore::list(const std::string& owner) const {
  std::vector<FileRecord> records;
  std::error_code ec;
  if (!std::filesystem::is_directory(directory_, ec)) {
    return records;
  }

  for (std::filesystem::directory_iterator it(directory_, ec), end; !ec && it != end; it.increment(ec)) {
    if (it->path().extension() != RECORD_EXTENSION) {
      continue;
    }
    try {
      FileRecord record = load(it->path());
      if (record.owner == owner) {
        records.push_back(std::move(record));
      }
    } catch (const StorageError& e) {
      BOOST_LOG_TRIVIAL(warning) << "Record store: Skipping unreadable record: " << e.what();
    }
  }

  std::sort(records.begin(), records.end(), [](const FileRecord& a, const FileRecord& b) {
    return a.created_at < b.created_at;
  });
  return records;
}

std::filesystem::path YamlRecordStore::record_path(const std::string& file_id) const {
  require_safe_component(file_id, "file record id");
  return directory_ / (file_id + RECORD_EXTENSION);
}

FileRecord YamlRecordStore::load(const std::filesystem::path& path) const {
  try {
    return decode(YAML::LoadFile(path.string()));
  } catch (const YAML::Exception& e) {
    throw StorageError("Record store: Corrupt record " + path.string() + ": " + e.what());
  }
}

} // namespace store
} // namespace chunkvault
