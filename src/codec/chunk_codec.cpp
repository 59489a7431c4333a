#include "codec/chunk_codec.hpp"
#include <algorithm>
#include <cctype>
#include <vector>
#include <boost/log/trivial.hpp>
#include "codec/digest.hpp"
#include "common/storage_error.hpp"

namespace chunkvault {
namespace codec {

namespace {
constexpr std::size_t CHUNK_ID_RANDOM_BYTES = 16;
constexpr std::size_t CHUNK_ID_HEX_LENGTH = CHUNK_ID_RANDOM_BYTES * 2;
constexpr std::size_t READ_BLOCK_SIZE = 64 * 1024;
}

//==============================================
// CONSTRUCTOR
//==============================================

ChunkCodec::ChunkCodec(std::int64_t chunk_size) {
  if (chunk_size <= 0) {
    BOOST_LOG_TRIVIAL(error) << "Chunk codec: Rejected chunk size " << chunk_size;
    throw InvalidConfiguration("chunk size must be a positive integer, got " + std::to_string(chunk_size));
  }
  chunk_size_ = static_cast<std::size_t>(chunk_size);
}


//==============================================
// CORE CODEC OPERATIONS
//==============================================

SplitResult ChunkCodec::split(std::istream& input, const ChunkSink& sink) const {
  BOOST_LOG_TRIVIAL(debug) << "Chunk codec: Splitting stream with chunk size " << chunk_size_;

  if (!input.good()) {
    BOOST_LOG_TRIVIAL(error) << "Chunk codec: Invalid input stream provided";
    throw StorageError("Chunk codec: Invalid input stream");
  }

  SplitResult result;
  Sha256Digest digest;
  std::vector<char> block(std::min(chunk_size_, READ_BLOCK_SIZE));

  while (true) {
    // Grows with the bytes read, never preallocated to chunk_size
    std::string window;
    while (window.size() < chunk_size_) {
      const std::size_t wanted = std::min(block.size(), chunk_size_ - window.size());
      input.read(block.data(), static_cast<std::streamsize>(wanted));
      const auto got = static_cast<std::size_t>(input.gcount());
      window.append(block.data(), got);
      if (got < wanted) {
        break;
      }
    }
    if (window.empty()) {
      break;
    }

    // Digest runs over the original byte order so it does not depend on chunk size
    digest.update(window);
    result.total_size += window.size();

    ChunkId id = generate_chunk_id(result.manifest.size());
    if (sink) {
      sink(id, window);
    }
    result.manifest.push_back(std::move(id));

    // Final partial window
    if (window.size() < chunk_size_) {
      break;
    }
  }

  if (input.bad()) {
    BOOST_LOG_TRIVIAL(error) << "Chunk codec: Stream failed after " << result.total_size << " bytes";
    throw StorageError("Chunk codec: Failed to read input stream");
  }

  result.checksum = digest.final_hex();
  BOOST_LOG_TRIVIAL(info) << "Chunk codec: Split " << result.total_size << " bytes into "
                          << result.manifest.size() << " chunks, checksum " << result.checksum;
  return result;
}

std::string ChunkCodec::reconstruct(const ChunkManifest& manifest, const ChunkReader& reader,
                                    const CancellationToken* cancel) const {
  BOOST_LOG_TRIVIAL(debug) << "Chunk codec: Reconstructing from " << manifest.size() << " chunks";

  std::string output;
  for (const auto& id : manifest) {
    if (cancel && cancel->is_cancelled()) {
      BOOST_LOG_TRIVIAL(info) << "Chunk codec: Reconstruction cancelled before chunk " << id;
      throw OperationCancelled("reconstruction abandoned at chunk " + id);
    }
    // Reader signals a missing chunk with ChunkNotFound, which propagates untouched
    output += reader(id);
  }

  BOOST_LOG_TRIVIAL(debug) << "Chunk codec: Reconstructed " << output.size() << " bytes";
  return output;
}

ChunkManifest ChunkCodec::verify_presence(const ChunkManifest& manifest, const ExistsCheck& exists) {
  ChunkManifest missing;
  for (const auto& id : manifest) {
    if (!exists(id)) {
      missing.push_back(id);
    }
  }
  return missing;
}


//==============================================
// IDENTIFIERS
//==============================================

ChunkId ChunkCodec::generate_chunk_id(std::size_t ordinal) {
  return random_hex(CHUNK_ID_RANDOM_BYTES) + "_" + std::to_string(ordinal);
}

bool ChunkCodec::is_valid_chunk_id(const ChunkId& id) {
  if (id.size() < CHUNK_ID_HEX_LENGTH + 2 || id[CHUNK_ID_HEX_LENGTH] != '_') {
    return false;
  }
  for (std::size_t i = 0; i < CHUNK_ID_HEX_LENGTH; ++i) {
    const char c = id[i];
    if (!std::isxdigit(static_cast<unsigned char>(c)) || std::isupper(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  for (std::size_t i = CHUNK_ID_HEX_LENGTH + 1; i < id.size(); ++i) {
    if (!std::isdigit(static_cast<unsigned char>(id[i]))) {
      return false;
    }
  }
  return true;
}

} // namespace codec
} // namespace chunkvault
