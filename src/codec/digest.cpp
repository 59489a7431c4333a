#include "codec/digest.hpp"
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <boost/log/trivial.hpp>

namespace chunkvault::codec {

//=================================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//=================================================

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw std::runtime_error("Digest: Failed to create hash context");
    }
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  EVP_MD_CTX* get() { return ctx; }
};

namespace {

std::string to_hex(const unsigned char* data, std::size_t length) {
  std::stringstream ss;
  for (std::size_t i = 0; i < length; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(data[i]);
  }
  return ss.str();
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Sha256Digest::Sha256Digest() : context_(std::make_unique<DigestContext>()) {
  if (!EVP_DigestInit_ex(context_->get(), EVP_sha256(), nullptr)) {
    throw std::runtime_error("Digest: Failed to initialize hash context");
  }
}

Sha256Digest::~Sha256Digest() = default;


//==============================================
// HASHING
//==============================================

void Sha256Digest::update(const char* data, std::size_t length) {
  if (finalized_) {
    throw std::logic_error("Digest: update after finalization");
  }
  if (length == 0) {
    return;
  }
  if (!EVP_DigestUpdate(context_->get(), data, length)) {
    throw std::runtime_error("Digest: Failed to update hash");
  }
}

std::string Sha256Digest::final_hex() {
  if (finalized_) {
    throw std::logic_error("Digest: digest already finalized");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;
  if (!EVP_DigestFinal_ex(context_->get(), hash, &hash_len)) {
    throw std::runtime_error("Digest: Failed to finalize hash");
  }
  finalized_ = true;
  return to_hex(hash, hash_len);
}

std::string Sha256Digest::hex_of(const std::string& data) {
  Sha256Digest digest;
  digest.update(data);
  return digest.final_hex();
}


//==============================================
// RANDOM IDENTIFIERS
//==============================================

std::string random_hex(std::size_t num_bytes) {
  std::vector<unsigned char> bytes(num_bytes);
  if (num_bytes > 0 && RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    BOOST_LOG_TRIVIAL(error) << "Digest: RAND_bytes failed for " << num_bytes << " bytes";
    throw std::runtime_error("Digest: Failed to generate random bytes");
  }
  return to_hex(bytes.data(), bytes.size());
}

} // namespace chunkvault::codec
