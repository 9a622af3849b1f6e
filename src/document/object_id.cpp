#include "document/object_id.hpp"
#include <atomic>
#include <cstring>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <boost/endian/conversion.hpp>
#include <boost/functional/hash.hpp>
#include <boost/log/trivial.hpp>
#include <openssl/rand.h>

namespace gridstore {
namespace document {

namespace {

using InstanceUnique = std::array<uint8_t, ObjectId::INSTANCE_UNIQUE_SIZE>;

// Random bytes drawn once per process
const InstanceUnique& instance_unique() {
  static const InstanceUnique unique = [] {
    InstanceUnique bytes{};
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
      BOOST_LOG_TRIVIAL(error) << "ObjectId: Failed to draw process-unique bytes";
      throw std::runtime_error("ObjectId: Failed to generate random bytes");
    }
    return bytes;
  }();
  return unique;
}

// Starts in the lower half of the 24-bit range, so a process issues over
// 2^23 ids before the counter wraps
uint32_t counter_seed() {
  uint32_t seed = 0;
  if (RAND_bytes(reinterpret_cast<unsigned char*>(&seed), sizeof(seed)) != 1) {
    throw std::runtime_error("ObjectId: Failed to seed counter");
  }
  return seed & 0x7FFFFFu;
}

std::atomic<uint32_t>& counter() {
  static std::atomic<uint32_t> value{counter_seed()};
  return value;
}

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ObjectId::ObjectId() : bytes_{} {}

ObjectId::ObjectId(const Bytes& bytes) : bytes_(bytes) {}


//==============================================
// GENERATION AND PARSING
//==============================================

ObjectId ObjectId::generate() {
  Bytes bytes{};

  uint32_t seconds = boost::endian::native_to_big(static_cast<uint32_t>(std::time(nullptr)));
  std::memcpy(bytes.data(), &seconds, TIMESTAMP_SIZE);

  const auto& unique = instance_unique();
  std::memcpy(bytes.data() + TIMESTAMP_SIZE, unique.data(), INSTANCE_UNIQUE_SIZE);

  uint32_t increment = counter().fetch_add(1, std::memory_order_relaxed);
  bytes[9] = static_cast<uint8_t>(increment >> 16);
  bytes[10] = static_cast<uint8_t>(increment >> 8);
  bytes[11] = static_cast<uint8_t>(increment);

  return ObjectId(bytes);
}

bool ObjectId::is_valid_hex(const std::string& hex) {
  if (hex.size() != SIZE * 2) {
    return false;
  }
  for (char c : hex) {
    if (hex_value(c) < 0) {
      return false;
    }
  }
  return true;
}

ObjectId ObjectId::from_hex(const std::string& hex) {
  if (!is_valid_hex(hex)) {
    throw std::invalid_argument("ObjectId: Invalid hex string: " + hex);
  }

  Bytes bytes{};
  for (std::size_t i = 0; i < SIZE; ++i) {
    bytes[i] = static_cast<uint8_t>((hex_value(hex[2 * i]) << 4) | hex_value(hex[2 * i + 1]));
  }
  return ObjectId(bytes);
}


//==============================================
// GETTERS
//==============================================

std::time_t ObjectId::timestamp() const {
  uint32_t seconds = 0;
  std::memcpy(&seconds, bytes_.data(), TIMESTAMP_SIZE);
  return static_cast<std::time_t>(boost::endian::big_to_native(seconds));
}

std::string ObjectId::to_hex() const {
  std::stringstream ss;
  for (uint8_t byte : bytes_) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  }
  return ss.str();
}

bool ObjectId::is_null() const {
  for (uint8_t byte : bytes_) {
    if (byte != 0) {
      return false;
    }
  }
  return true;
}

std::ostream& operator<<(std::ostream& os, const ObjectId& id) {
  return os << "ObjectId(" << id.to_hex() << ")";
}

} // namespace document
} // namespace gridstore

std::size_t std::hash<gridstore::document::ObjectId>::operator()(
    const gridstore::document::ObjectId& id) const noexcept {
  return boost::hash_range(id.bytes().begin(), id.bytes().end());
}
