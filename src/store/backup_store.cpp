#include "store/backup_store.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <boost/log/trivial.hpp>
#include <yaml-cpp/yaml.h>
#include "store/path_utils.hpp"

namespace chunkvault {
namespace store {

namespace {

constexpr const char* CHUNK_EXTENSION = ".chunk";
constexpr const char* SIDECAR_EXTENSION = ".yaml";
constexpr const char* LOCATOR_SCHEME = "local://";

// Sanitized names never start with a dot, so a dot-leading name is always an in-flight write
std::filesystem::path partial_path_for(const std::filesystem::path& path) {
  return path.parent_path() / ("." + path.filename().string() + ".tmp");
}

bool is_partial(const std::filesystem::path& path) {
  const std::string name = path.filename().string();
  return !name.empty() && name[0] == '.';
}

void write_file(const std::filesystem::path& path, const std::string& bytes) {
  const std::filesystem::path partial_path = partial_path_for(path);

  std::ofstream file(partial_path, std::ios::binary | std::ios::trunc);
  if (!file) {
    throw std::runtime_error("cannot create " + partial_path.string());
  }
  file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  file.close();
  if (!file) {
    std::error_code ec;
    std::filesystem::remove(partial_path, ec);
    throw std::runtime_error("short write to " + partial_path.string());
  }

  // rename replaces an existing mirror, which is byte-identical for immutable chunks
  std::filesystem::rename(partial_path, path);
}

std::string read_file(const std::filesystem::path& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw std::runtime_error("cannot open " + path.string());
  }
  std::ostringstream output;
  output << file.rdbuf();
  if (file.bad()) {
    throw std::runtime_error("failed reading " + path.string());
  }
  return output.str();
}

} // namespace

//==============================================
// CONSTRUCTOR
//==============================================

BackupStore::BackupStore(const std::filesystem::path& root, const std::string& owner, bool enabled)
  : root_(root)
  , owner_(owner)
  , configured_(enabled && !root.empty()) {
  require_safe_component(owner, "owner identifier");
  owner_path_ = root_ / ("user_" + owner_);
  files_path_ = owner_path_ / "files";
  chunks_path_ = owner_path_ / "chunks";
  metadata_path_ = owner_path_ / "metadata";
  BOOST_LOG_TRIVIAL(debug) << "Backup store: Opened namespace " << owner_path_.string()
                           << (configured_ ? "" : " (not configured)");
}


//==============================================
// STATUS
//==============================================

bool BackupStore::is_enabled() const {
  if (!configured_) {
    return false;
  }
  std::error_code ec;
  return std::filesystem::is_directory(root_, ec);
}


//==============================================
// MIRRORING
//==============================================

std::optional<std::string> BackupStore::mirror_file(const std::string& bytes, const std::string& name,
                                                    const std::map<std::string, std::string>& metadata) {
  BOOST_LOG_TRIVIAL(info) << "Backup store: Mirroring file " << name << " (" << bytes.size() << " bytes)";

  if (!is_enabled()) {
    BOOST_LOG_TRIVIAL(warning) << "Backup store: Tier disabled, file " << name << " not mirrored";
    return std::nullopt;
  }
  if (!is_safe_component(name)) {
    BOOST_LOG_TRIVIAL(error) << "Backup store: Refusing unsafe snapshot name: " << name;
    return std::nullopt;
  }

  try {
    if (!ensure_layout()) {
      return std::nullopt;
    }
    write_file(files_path_ / name, bytes);

    if (!metadata.empty()) {
      YAML::Emitter out;
      out << YAML::BeginMap;
      for (const auto& [key, value] : metadata) {
        out << YAML::Key << key << YAML::Value << value;
      }
      out << YAML::EndMap;
      write_file(sidecar_path(name), std::string(out.c_str()) + "\n");
    }
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Backup store: Failed to mirror file " << name << ": " << e.what();
    return std::nullopt;
  }

  std::string locator = LOCATOR_SCHEME + (files_path_ / name).generic_string();
  BOOST_LOG_TRIVIAL(info) << "Backup store: Mirrored file to " << locator;
  return locator;
}

bool BackupStore::mirror_chunks(const std::vector<codec::ChunkId>& ids, const codec::ChunkReader& fetch_from_primary,
                                const std::string& file_group_key) {
  BOOST_LOG_TRIVIAL(info) << "Backup store: Mirroring " << ids.size() << " chunks into group " << file_group_key;

  if (!is_enabled()) {
    BOOST_LOG_TRIVIAL(warning) << "Backup store: Tier disabled, chunks not mirrored";
    return false;
  }
  if (!is_safe_component(file_group_key)) {
    BOOST_LOG_TRIVIAL(error) << "Backup store: Refusing unsafe group key: " << file_group_key;
    return false;
  }

  if (!ensure_layout()) {
    return false;
  }
  std::error_code ec;
  std::filesystem::create_directories(group_path(file_group_key), ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Backup store: Cannot create group " << file_group_key << ": " << ec.message();
    return false;
  }

  bool complete = true;
  std::size_t mirrored = 0;
  for (const auto& id : ids) {
    try {
      write_file(chunk_path(id, file_group_key), fetch_from_primary(id));
      ++mirrored;
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(warning) << "Backup store: Failed to mirror chunk " << id << ": " << e.what();
      complete = false;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "Backup store: Mirrored " << mirrored << " of " << ids.size()
                          << " chunks into group " << file_group_key;
  return complete;
}


//==============================================
// RECOVERY
//==============================================

std::vector<codec::ChunkId> BackupStore::restore_chunks(const std::vector<codec::ChunkId>& ids,
                                                        const std::string& file_group_key,
                                                        const ChunkWriter& write_to_primary) const {
  BOOST_LOG_TRIVIAL(info) << "Backup store: Restoring " << ids.size() << " chunks from group " << file_group_key;

  std::vector<codec::ChunkId> restored;
  if (!is_enabled() || !is_safe_component(file_group_key)) {
    return restored;
  }

  for (const auto& id : ids) {
    if (!has_chunk(id, file_group_key)) {
      BOOST_LOG_TRIVIAL(warning) << "Backup store: Chunk " << id << " absent from backup";
      continue;
    }
    try {
      write_to_primary(id, read_file(chunk_path(id, file_group_key)));
      restored.push_back(id);
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Backup store: Failed to restore chunk " << id << ": " << e.what();
    }
  }

  BOOST_LOG_TRIVIAL(info) << "Backup store: Restored " << restored.size() << " of " << ids.size() << " chunks";
  return restored;
}

std::optional<std::string> BackupStore::fetch_file(const std::string& name) const {
  if (!is_enabled() || !is_safe_component(name)) {
    return std::nullopt;
  }
  std::error_code ec;
  if (!std::filesystem::is_regular_file(files_path_ / name, ec)) {
    return std::nullopt;
  }
  try {
    return read_file(files_path_ / name);
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Backup store: Failed to read snapshot " << name << ": " << e.what();
    return std::nullopt;
  }
}

std::optional<std::map<std::string, std::string>> BackupStore::fetch_metadata(const std::string& name) const {
  if (!is_enabled() || !is_safe_component(name)) {
    return std::nullopt;
  }
  std::error_code ec;
  if (!std::filesystem::is_regular_file(sidecar_path(name), ec)) {
    return std::nullopt;
  }
  try {
    YAML::Node node = YAML::LoadFile(sidecar_path(name).string());
    std::map<std::string, std::string> metadata;
    for (const auto& entry : node) {
      metadata[entry.first.as<std::string>()] = entry.second.as<std::string>();
    }
    return metadata;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Backup store: Failed to read sidecar for " << name << ": " << e.what();
    return std::nullopt;
  }
}

bool BackupStore::has_chunk(const codec::ChunkId& id, const std::string& file_group_key) const {
  if (!codec::ChunkCodec::is_valid_chunk_id(id) || !is_safe_component(file_group_key)) {
    return false;
  }
  std::error_code ec;
  return std::filesystem::is_regular_file(chunk_path(id, file_group_key), ec);
}


//==============================================
// CLEANUP
//==============================================

bool BackupStore::delete_file(const std::string& name) {
  BOOST_LOG_TRIVIAL(info) << "Backup store: Deleting snapshot " << name;

  if (!is_safe_component(name)) {
    BOOST_LOG_TRIVIAL(warning) << "Backup store: Ignoring unsafe snapshot name: " << name;
    return false;
  }

  std::error_code file_ec;
  std::error_code sidecar_ec;
  std::filesystem::remove(files_path_ / name, file_ec);
  std::filesystem::remove(sidecar_path(name), sidecar_ec);
  if (file_ec || sidecar_ec) {
    BOOST_LOG_TRIVIAL(error) << "Backup store: Failed to delete snapshot " << name << ": "
                             << (file_ec ? file_ec.message() : sidecar_ec.message());
    return false;
  }
  return true;
}

bool BackupStore::delete_chunks(const std::string& file_group_key) {
  BOOST_LOG_TRIVIAL(info) << "Backup store: Deleting chunk group " << file_group_key;

  if (!is_safe_component(file_group_key)) {
    BOOST_LOG_TRIVIAL(warning) << "Backup store: Ignoring unsafe group key: " << file_group_key;
    return false;
  }

  std::error_code ec;
  std::filesystem::remove_all(group_path(file_group_key), ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Backup store: Failed to delete group " << file_group_key << ": " << ec.message();
    return false;
  }
  return true;
}


//==============================================
// DIAGNOSTICS
//==============================================

std::vector<std::string> BackupStore::list_files() const {
  std::vector<std::string> names;
  std::error_code ec;
  if (!is_enabled() || !std::filesystem::is_directory(files_path_, ec)) {
    return names;
  }

  for (std::filesystem::directory_iterator it(files_path_, ec), end; !ec && it != end; it.increment(ec)) {
    if (it->is_regular_file(ec) && !is_partial(it->path())) {
      names.push_back(it->path().filename().string());
    }
  }
  std::sort(names.begin(), names.end());
  return names;
}

BackupUsage BackupStore::usage() const {
  BackupUsage usage;
  std::error_code ec;

  if (std::filesystem::is_directory(files_path_, ec)) {
    for (std::filesystem::directory_iterator it(files_path_, ec), end; !ec && it != end; it.increment(ec)) {
      std::error_code size_ec;
      if (it->is_regular_file(size_ec) && !is_partial(it->path())) {
        const auto size = it->file_size(size_ec);
        if (!size_ec) {
          usage.total_bytes += size;
          ++usage.file_count;
        }
      }
    }
  }

  ec.clear();
  if (std::filesystem::is_directory(chunks_path_, ec)) {
    for (std::filesystem::recursive_directory_iterator it(chunks_path_, ec), end; !ec && it != end;
         it.increment(ec)) {
      std::error_code size_ec;
      if (it->is_regular_file(size_ec) && it->path().extension() == CHUNK_EXTENSION &&
          !is_partial(it->path())) {
        const auto size = it->file_size(size_ec);
        if (!size_ec) {
          usage.total_bytes += size;
          ++usage.chunk_count;
        }
      }
    }
  }
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "Backup store: Usage scan incomplete: " << ec.message();
  }

  return usage;
}


//==============================================
// PATH SUPPORT
//==============================================

std::filesystem::path BackupStore::group_path(const std::string& file_group_key) const {
  return chunks_path_ / file_group_key;
}

std::filesystem::path BackupStore::chunk_path(const codec::ChunkId& id, const std::string& file_group_key) const {
  if (!codec::ChunkCodec::is_valid_chunk_id(id)) {
    throw std::invalid_argument("Backup store: Malformed chunk id: " + id);
  }
  return group_path(file_group_key) / (id + CHUNK_EXTENSION);
}

std::filesystem::path BackupStore::sidecar_path(const std::string& name) const {
  return metadata_path_ / (name + SIDECAR_EXTENSION);
}

bool BackupStore::ensure_layout() {
  std::error_code ec;
  for (const auto& dir : {files_path_, chunks_path_, metadata_path_}) {
    std::filesystem::create_directories(dir, ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "Backup store: Cannot create " << dir.string() << ": " << ec.message();
      return false;
    }
  }
  return true;
}

} // namespace store
} // namespace chunkvault
