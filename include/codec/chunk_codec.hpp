#ifndef CHUNKVAULT_CODEC_CHUNK_CODEC_HPP
#define CHUNKVAULT_CODEC_CHUNK_CODEC_HPP

#include <cstdint>
#include <functional>
#include <istream>
#include <string>
#include <vector>
#include "codec/cancellation.hpp"

namespace chunkvault {
namespace codec {

using ChunkId = std::string;
// Concatenation order of a file's chunks. Never reordered.
using ChunkManifest = std::vector<ChunkId>;

// Receives every chunk in split order. Throwing aborts the split.
using ChunkSink = std::function<void(const ChunkId&, const std::string&)>;
// Resolves a chunk to its bytes, throws ChunkNotFound when it cannot.
using ChunkReader = std::function<std::string(const ChunkId&)>;
using ExistsCheck = std::function<bool(const ChunkId&)>;

struct SplitResult {
  ChunkManifest manifest;
  std::uintmax_t total_size = 0;
  // SHA-256 of the whole input, lowercase hex
  std::string checksum;
};

class ChunkCodec {
public:
  // ---- CONSTRUCTOR ----
  // Throws InvalidConfiguration unless chunk_size > 0
  explicit ChunkCodec(std::int64_t chunk_size);


  // ---- CORE CODEC OPERATIONS ----
  // Reads `input` from its current position to exhaustion in chunk_size windows
  SplitResult split(std::istream& input, const ChunkSink& sink = nullptr) const;
  // Concatenates the chunks in manifest order. Output is only returned when every chunk resolved.
  std::string reconstruct(const ChunkManifest& manifest, const ChunkReader& reader,
                          const CancellationToken* cancel = nullptr) const;
  // Order-preserving subset of `manifest` failing `exists`
  static ChunkManifest verify_presence(const ChunkManifest& manifest, const ExistsCheck& exists);


  // ---- IDENTIFIERS ----
  // 128 random bits in hex followed by "_<ordinal>"
  static ChunkId generate_chunk_id(std::size_t ordinal);
  // Accepts identifiers of the generate_chunk_id shape only
  static bool is_valid_chunk_id(const ChunkId& id);


  // ---- GETTERS ----
  std::size_t chunk_size() const { return chunk_size_; }

private:
  // ---- PARAMETERS ----
  std::size_t chunk_size_;
};

} // namespace codec
} // namespace chunkvault

#endif // CHUNKVAULT_CODEC_CHUNK_CODEC_HPP
