#ifndef GRIDSTORE_DOCUMENT_CODEC_HPP
#define GRIDSTORE_DOCUMENT_CODEC_HPP

#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <boost/endian/conversion.hpp>
#include "document/document.hpp"

namespace gridstore {
namespace document {

class CodecError : public std::runtime_error {
public:
  explicit CodecError(const std::string& message) : std::runtime_error(message) {}
};

// Binary document encoding used for persisted documents.
//
// Layout (all integers big-endian):
//   header   : magic "GSD" + format version byte
//   document : u32 field count, then per field u32 name length, name bytes, value
//   value    : u8 ValueType tag followed by its payload
//     Null      -
//     Bool      u8
//     Int64     u64
//     Double    u64 holding the IEEE-754 bit pattern
//     String    u32 length + bytes
//     Binary    u32 length + bytes
//     Date      u64 milliseconds since epoch (two's complement)
//     ObjectId  12 raw bytes
//     Document  nested document (no header)
//     Array     u32 element count + values
class Codec {
public:
  static constexpr uint8_t FORMAT_VERSION = 1;
  static constexpr std::size_t MAX_NESTING_DEPTH = 100;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Codec() = default;


  // ---- SERIALIZATION AND DESERIALIZATION ----
  // Writes header and document, returns the number of bytes written
  std::size_t serialize(const Document& doc, std::ostream& output) const;
  // Reads one header and document, throws CodecError on malformed input
  Document deserialize(std::istream& input) const;

  // In-memory conveniences
  std::string encode(const Document& doc) const;
  Document decode(const std::string& bytes) const;

private:
  // ---- VALUE ENCODING ----
  std::size_t write_document(std::ostream& output, const Document& doc, std::size_t depth) const;
  std::size_t write_value(std::ostream& output, const Value& value, std::size_t depth) const;
  Document read_document(std::istream& input, std::size_t depth) const;
  Value read_value(std::istream& input, std::size_t depth) const;

  std::size_t write_length_prefixed(std::ostream& output, const void* data, std::size_t size) const;
  std::string read_length_prefixed(std::istream& input) const;


  // ---- STREAM OPERATIONS ----
  // Writes bytes to an output stream
  void write_bytes(std::ostream& output, const void* data, std::size_t size) const;
  // Reads bytes from an input stream
  void read_bytes(std::istream& input, void* data, std::size_t size) const;


  // ---- HOST TO NETWORK BYTE ORDER CONVERSION ----
  static uint32_t to_network_order(uint32_t host_value) {
    return boost::endian::native_to_big(host_value);
  }
  static uint64_t to_network_order(uint64_t host_value) {
    return boost::endian::native_to_big(host_value);
  }


  // ---- NETWORK TO HOST BYTE ORDER CONVERSION ----
  static uint32_t from_network_order(uint32_t network_value) {
    return boost::endian::big_to_native(network_value);
  }
  static uint64_t from_network_order(uint64_t network_value) {
    return boost::endian::big_to_native(network_value);
  }
};

} // namespace document
} // namespace gridstore

#endif // GRIDSTORE_DOCUMENT_CODEC_HPP
