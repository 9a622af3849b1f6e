#include "utils/digest.hpp"
#include <iomanip>
#include <sstream>
#include <openssl/evp.h>

namespace gridstore {
namespace utils {

//=================================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//=================================================

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw DigestError("Digest: Failed to create hash context");
    }
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  EVP_MD_CTX* get() { return ctx; }
};

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Digest::Digest(Algorithm algorithm) : context_(std::make_unique<DigestContext>()) {
  const EVP_MD* md = algorithm == Algorithm::Md5 ? EVP_md5() : EVP_sha256();
  if (!EVP_DigestInit_ex(context_->get(), md, nullptr)) {
    throw DigestError("Digest: Failed to initialize hash context");
  }
}

Digest::~Digest() = default;
Digest::Digest(Digest&&) noexcept = default;
Digest& Digest::operator=(Digest&&) noexcept = default;

//==============================================
// HASHING
//==============================================

void Digest::update(const void* data, std::size_t size) {
  if (finalized_) {
    throw DigestError("Digest: Update after finalize");
  }
  if (size == 0) {
    return;
  }
  if (!EVP_DigestUpdate(context_->get(), data, size)) {
    throw DigestError("Digest: Failed to update hash");
  }
}

std::string Digest::finalize() {
  if (finalized_) {
    throw DigestError("Digest: Already finalized");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;

  if (!EVP_DigestFinal_ex(context_->get(), hash, &hash_len)) {
    throw DigestError("Digest: Failed to finalize hash");
  }
  finalized_ = true;

  // Convert the raw hash bytes to a hexadecimal string
  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }
  return ss.str();
}

std::string Digest::hex(Algorithm algorithm, const std::string& data) {
  Digest digest(algorithm);
  digest.update(data);
  return digest.finalize();
}

} // namespace utils
} // namespace gridstore
