#ifndef CHUNKVAULT_STORE_PRIMARY_STORE_HPP
#define CHUNKVAULT_STORE_PRIMARY_STORE_HPP

#include <cstdint>
#include <filesystem>
#include <ostream>
#include <string>
#include <vector>
#include "codec/chunk_codec.hpp"
#include "common/storage_error.hpp"

namespace chunkvault {
namespace store {

struct PrimaryUsage {
  std::uintmax_t total_bytes = 0;
  std::size_t chunk_count = 0;
};

// Chunk files of one owner on the fast local tier:
// {root}/user_{owner}/{id[0:2]}/{id}.chunk
class PrimaryStore {
public:

  // ---- CONSTRUCTOR ----
  // Throws std::invalid_argument for an owner that is not a safe path component
  PrimaryStore(const std::filesystem::path& root, const std::string& owner);


  // ---- CORE STORAGE OPERATIONS ----
  // Writes a new chunk. Throws DuplicateChunk if the id is already present,
  // PrimaryWriteFailed on I/O errors.
  void persist(const codec::ChunkId& id, const std::string& bytes);
  // Streams chunk bytes into output, throws ChunkNotFound if absent
  void retrieve(const codec::ChunkId& id, std::ostream& output) const;
  std::string retrieve(const codec::ChunkId& id) const;
  // Idempotent: absent ids are skipped. Returns the number of chunk files removed.
  // Shard directories are never pruned.
  std::size_t remove(const std::vector<codec::ChunkId>& ids);


  // ---- QUERY OPERATIONS ----
  bool exists(const codec::ChunkId& id) const;
  // Order-preserving subset of ids not present
  std::vector<codec::ChunkId> exists_batch(const std::vector<codec::ChunkId>& ids) const;
  std::uintmax_t chunk_size_on_disk(const codec::ChunkId& id) const;


  // ---- DIAGNOSTICS ----
  // Walks the whole owner namespace. Not for hot paths.
  PrimaryUsage usage() const;


  // ---- GETTERS ----
  const std::string& owner() const { return owner_; }
  const std::filesystem::path& namespace_path() const { return namespace_path_; }

private:
  // ---- PARAMETERS ----
  std::string owner_;
  // Root of this owner's chunk files
  std::filesystem::path namespace_path_;


  // ---- PATH SUPPORT ----
  // {namespace}/{id[0:2]}/{id}.chunk, throws std::invalid_argument for malformed ids
  std::filesystem::path resolve_chunk_path(const codec::ChunkId& id) const;
};

} // namespace store
} // namespace chunkvault

#endif // CHUNKVAULT_STORE_PRIMARY_STORE_HPP
