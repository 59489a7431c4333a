#ifndef CHUNKVAULT_CODEC_DIGEST_HPP
#define CHUNKVAULT_CODEC_DIGEST_HPP

#include <cstddef>
#include <memory>
#include <string>

namespace chunkvault::codec {

// Forward declaration for OpenSSL digest context
struct DigestContext;

// Incremental SHA-256 over OpenSSL EVP.
class Sha256Digest {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Sha256Digest();
  ~Sha256Digest();

  Sha256Digest(const Sha256Digest&) = delete;
  Sha256Digest& operator=(const Sha256Digest&) = delete;


  // ---- HASHING ----
  void update(const char* data, std::size_t length);
  void update(const std::string& data) { update(data.data(), data.size()); }
  // Finalizes the digest and returns it as lowercase hex. The object cannot be updated afterwards.
  std::string final_hex();

  // One-shot helper
  static std::string hex_of(const std::string& data);

private:
  // ---- PARAMETERS ----
  std::unique_ptr<DigestContext> context_;
  bool finalized_ = false;
};

// Returns `num_bytes` bytes from the OpenSSL CSPRNG encoded as lowercase hex
std::string random_hex(std::size_t num_bytes);

} // namespace chunkvault::codec

#endif // CHUNKVAULT_CODEC_DIGEST_HPP
