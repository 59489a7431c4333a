#include "store/primary_store.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <boost/log/trivial.hpp>
#include "store/path_utils.hpp"

namespace chunkvault {
namespace store {

namespace {
constexpr const char* CHUNK_EXTENSION = ".chunk";
constexpr const char* PARTIAL_SUFFIX = ".part";
constexpr std::size_t SHARD_PREFIX_LENGTH = 2;
}

//==============================================
// CONSTRUCTOR
//==============================================

PrimaryStore::PrimaryStore(const std::filesystem::path& root, const std::string& owner)
  : owner_(owner) {
  require_safe_component(owner, "owner identifier");
  namespace_path_ = root / ("user_" + owner);
  BOOST_LOG_TRIVIAL(debug) << "Primary store: Opened namespace " << namespace_path_.string();
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

void PrimaryStore::persist(const codec::ChunkId& id, const std::string& bytes) {
  BOOST_LOG_TRIVIAL(debug) << "Primary store: Persisting chunk " << id << " (" << bytes.size() << " bytes)";

  std::filesystem::path file_path = resolve_chunk_path(id);
  if (std::filesystem::exists(file_path)) {
    BOOST_LOG_TRIVIAL(error) << "Primary store: Refusing to overwrite chunk " << id;
    throw DuplicateChunk(id);
  }

  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Primary store: Failed to create directory "
                             << file_path.parent_path().string() << ": " << ec.message();
    throw PrimaryWriteFailed("cannot create " + file_path.parent_path().string() + ": " + ec.message());
  }

  // Write beside the final name, then rename, so a crash never leaves a truncated chunk
  std::filesystem::path partial_path = file_path;
  partial_path += PARTIAL_SUFFIX;
  {
    std::ofstream file(partial_path, std::ios::binary | std::ios::trunc);
    if (!file) {
      throw PrimaryWriteFailed("cannot create " + partial_path.string());
    }
    file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    file.flush();
    if (!file) {
      file.close();
      std::filesystem::remove(partial_path, ec);
      BOOST_LOG_TRIVIAL(error) << "Primary store: Short write for chunk " << id;
      throw PrimaryWriteFailed("short write for chunk " + id);
    }
  }

  std::filesystem::rename(partial_path, file_path, ec);
  if (ec) {
    std::error_code cleanup_ec;
    std::filesystem::remove(partial_path, cleanup_ec);
    BOOST_LOG_TRIVIAL(error) << "Primary store: Failed to commit chunk " << id << ": " << ec.message();
    throw PrimaryWriteFailed("cannot commit chunk " + id + ": " + ec.message());
  }

  BOOST_LOG_TRIVIAL(debug) << "Primary store: Stored chunk " << id;
}

void PrimaryStore::retrieve(const codec::ChunkId& id, std::ostream& output) const {
  BOOST_LOG_TRIVIAL(debug) << "Primary store: Retrieving chunk " << id;

  if (!codec::ChunkCodec::is_valid_chunk_id(id)) {
    throw ChunkNotFound(id);
  }
  std::filesystem::path file_path = resolve_chunk_path(id);

  std::ifstream file(file_path, std::ios::binary);
  if (!file) {
    BOOST_LOG_TRIVIAL(debug) << "Primary store: Chunk not found: " << file_path.string();
    throw ChunkNotFound(id);
  }

  char buffer[4096];
  std::size_t total_bytes = 0;

  // Read file in blocks to keep memory flat for large chunk sizes
  while (file.read(buffer, sizeof(buffer))) {
    output.write(buffer, file.gcount());
    total_bytes += static_cast<std::size_t>(file.gcount());
  }

  // Handle final partial block if any
  if (file.gcount() > 0) {
    output.write(buffer, file.gcount());
    total_bytes += static_cast<std::size_t>(file.gcount());
  }

  if (file.bad() || !output.good()) {
    throw StorageError("Primary store: Failed to stream chunk " + id);
  }

  BOOST_LOG_TRIVIAL(debug) << "Primary store: Streamed " << total_bytes << " bytes for chunk " << id;
}

std::string PrimaryStore::retrieve(const codec::ChunkId& id) const {
  std::ostringstream output;
  retrieve(id, output);
  return output.str();
}

std::size_t PrimaryStore::remove(const std::vector<codec::ChunkId>& ids) {
  BOOST_LOG_TRIVIAL(info) << "Primary store: Removing " << ids.size() << " chunks for owner " << owner_;

  std::size_t removed = 0;
  for (const auto& id : ids) {
    if (!codec::ChunkCodec::is_valid_chunk_id(id)) {
      BOOST_LOG_TRIVIAL(warning) << "Primary store: Skipping malformed chunk id: " << id;
      continue;
    }

    std::filesystem::path file_path = resolve_chunk_path(id);
    std::error_code ec;
    if (std::filesystem::remove(file_path, ec)) {
      ++removed;
    } else if (ec) {
      BOOST_LOG_TRIVIAL(warning) << "Primary store: Failed to remove chunk " << id << ": " << ec.message();
    }
  }

  BOOST_LOG_TRIVIAL(info) << "Primary store: Removed " << removed << " of " << ids.size() << " chunks";
  return removed;
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool PrimaryStore::exists(const codec::ChunkId& id) const {
  if (!codec::ChunkCodec::is_valid_chunk_id(id)) {
    return false;
  }
  std::error_code ec;
  bool found = std::filesystem::is_regular_file(resolve_chunk_path(id), ec);
  BOOST_LOG_TRIVIAL(trace) << "Primary store: Chunk " << id << (found ? " exists" : " not found");
  return found;
}

std::vector<codec::ChunkId> PrimaryStore::exists_batch(const std::vector<codec::ChunkId>& ids) const {
  auto missing = codec::ChunkCodec::verify_presence(
      ids, [this](const codec::ChunkId& id) { return exists(id); });
  BOOST_LOG_TRIVIAL(debug) << "Primary store: " << missing.size() << " of " << ids.size()
                           << " chunks missing for owner " << owner_;
  return missing;
}

std::uintmax_t PrimaryStore::chunk_size_on_disk(const codec::ChunkId& id) const {
  if (!exists(id)) {
    throw ChunkNotFound(id);
  }
  return std::filesystem::file_size(resolve_chunk_path(id));
}


//==============================================
// DIAGNOSTICS
//==============================================

PrimaryUsage PrimaryStore::usage() const {
  BOOST_LOG_TRIVIAL(debug) << "Primary store: Scanning usage under " << namespace_path_.string();

  PrimaryUsage usage;
  std::error_code ec;
  if (!std::filesystem::is_directory(namespace_path_, ec)) {
    return usage;
  }

  for (std::filesystem::recursive_directory_iterator it(namespace_path_, ec), end; !ec && it != end;
       it.increment(ec)) {
    if (it->is_regular_file(ec) && it->path().extension() == CHUNK_EXTENSION) {
      std::error_code size_ec;
      const auto size = it->file_size(size_ec);
      if (!size_ec) {
        usage.total_bytes += size;
        ++usage.chunk_count;
      }
    }
  }
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "Primary store: Usage scan incomplete: " << ec.message();
  }

  BOOST_LOG_TRIVIAL(debug) << "Primary store: " << usage.chunk_count << " chunks, "
                           << usage.total_bytes << " bytes";
  return usage;
}


//==============================================
// PATH SUPPORT
//==============================================

std::filesystem::path PrimaryStore::resolve_chunk_path(const codec::ChunkId& id) const {
  if (!codec::ChunkCodec::is_valid_chunk_id(id)) {
    throw std::invalid_argument("Primary store: Malformed chunk id: " + id);
  }
  return namespace_path_ / id.substr(0, SHARD_PREFIX_LENGTH) / (id + CHUNK_EXTENSION);
}

} // namespace store
} // namespace chunkvault
