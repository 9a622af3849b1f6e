#ifndef GRIDSTORE_DOCUMENT_OBJECT_ID_HPP
#define GRIDSTORE_DOCUMENT_OBJECT_ID_HPP

#include <array>
#include <cstdint>
#include <cstddef>
#include <ctime>
#include <functional>
#include <ostream>
#include <string>

namespace gridstore {
namespace document {

// 12-byte identifier: 4-byte big-endian timestamp, 5 bytes unique to the
// process, 3-byte big-endian counter.
class ObjectId {
public:
  static constexpr std::size_t SIZE = 12;
  static constexpr std::size_t TIMESTAMP_SIZE = 4;
  static constexpr std::size_t INSTANCE_UNIQUE_SIZE = 5;
  static constexpr std::size_t INCREMENT_SIZE = 3;

  using Bytes = std::array<uint8_t, SIZE>;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // All-zero id
  ObjectId();
  explicit ObjectId(const Bytes& bytes);


  // ---- GENERATION AND PARSING ----
  // Generates a fresh id from the clock, the process-unique bytes and the counter
  static ObjectId generate();
  // Parses 24 hex characters, throws std::invalid_argument otherwise
  static ObjectId from_hex(const std::string& hex);
  static bool is_valid_hex(const std::string& hex);


  // ---- GETTERS ----
  const Bytes& bytes() const { return bytes_; }
  std::time_t timestamp() const;
  std::string to_hex() const;
  bool is_null() const;


  // ---- COMPARISON ----
  bool operator==(const ObjectId& other) const { return bytes_ == other.bytes_; }
  bool operator!=(const ObjectId& other) const { return bytes_ != other.bytes_; }
  bool operator<(const ObjectId& other) const { return bytes_ < other.bytes_; }
  bool operator>(const ObjectId& other) const { return other < *this; }
  bool operator<=(const ObjectId& other) const { return !(other < *this); }
  bool operator>=(const ObjectId& other) const { return !(*this < other); }

private:
  // ---- PARAMETERS ----
  Bytes bytes_;
};

std::ostream& operator<<(std::ostream& os, const ObjectId& id);

} // namespace document
} // namespace gridstore

namespace std {
template <>
struct hash<gridstore::document::ObjectId> {
  std::size_t operator()(const gridstore::document::ObjectId& id) const noexcept;
};
} // namespace std

#endif // GRIDSTORE_DOCUMENT_OBJECT_ID_HPP
