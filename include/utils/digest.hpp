#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

namespace gridstore {
namespace utils {

// Forward declaration for OpenSSL digest context
struct DigestContext;

// Incremental message digest over OpenSSL EVP
class Digest {
public:
  enum class Algorithm {
    Md5,
    Sha256
  };

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit Digest(Algorithm algorithm);
  ~Digest();
  Digest(Digest&&) noexcept;
  Digest& operator=(Digest&&) noexcept;
  Digest(const Digest&) = delete;
  Digest& operator=(const Digest&) = delete;


  // ---- HASHING ----
  // Feeds bytes into the digest, throws DigestError after finalize()
  void update(const void* data, std::size_t size);
  void update(const std::string& data) { update(data.data(), data.size()); }
  // Returns the lowercase hex digest; no further updates are accepted
  std::string finalize();

  // One-shot hex digest of data
  static std::string hex(Algorithm algorithm, const std::string& data);

private:
  std::unique_ptr<DigestContext> context_;
  bool finalized_ = false;
};

class DigestError : public std::runtime_error {
public:
  explicit DigestError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace utils
} // namespace gridstore
