#include "document/codec.hpp"
#include <array>
#include <cstring>
#include <sstream>
#include <vector>
#include <boost/log/trivial.hpp>

namespace gridstore {
namespace document {

namespace {

constexpr std::array<char, 3> MAGIC = {'G', 'S', 'D'};
// Upper bound on any single length prefix, guards against corrupt sizes
constexpr uint32_t MAX_LENGTH = 64u * 1024u * 1024u;

} // namespace

//==============================================
// SERIALIZATION AND DESERIALIZATION
//==============================================

std::size_t Codec::serialize(const Document& doc, std::ostream& output) const {
  if (!output.good()) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Invalid output stream state";
    throw CodecError("Codec: Invalid output stream");
  }

  std::size_t total_bytes = 0;

  write_bytes(output, MAGIC.data(), MAGIC.size());
  write_bytes(output, &FORMAT_VERSION, sizeof(FORMAT_VERSION));
  total_bytes += MAGIC.size() + sizeof(FORMAT_VERSION);

  total_bytes += write_document(output, doc, 0);

  BOOST_LOG_TRIVIAL(trace) << "Codec: Serialized document with " << doc.size()
                           << " fields, total bytes written: " << total_bytes;
  return total_bytes;
}

Document Codec::deserialize(std::istream& input) const {
  if (!input.good()) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Invalid input stream state";
    throw CodecError("Codec: Invalid input stream");
  }

  std::array<char, 3> magic{};
  read_bytes(input, magic.data(), magic.size());
  if (magic != MAGIC) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Bad magic in document header";
    throw CodecError("Codec: Not a document stream");
  }

  uint8_t version = 0;
  read_bytes(input, &version, sizeof(version));
  if (version != FORMAT_VERSION) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Unsupported format version: " << static_cast<int>(version);
    throw CodecError("Codec: Unsupported format version " + std::to_string(version));
  }

  return read_document(input, 0);
}

std::string Codec::encode(const Document& doc) const {
  std::stringstream output;
  serialize(doc, output);
  return output.str();
}

Document Codec::decode(const std::string& bytes) const {
  std::stringstream input(bytes);
  Document doc = deserialize(input);
  if (input.peek() != std::char_traits<char>::eof()) {
    throw CodecError("Codec: Trailing bytes after document");
  }
  return doc;
}


//==============================================
// VALUE ENCODING
//==============================================

std::size_t Codec::write_document(std::ostream& output, const Document& doc, std::size_t depth) const {
  if (depth > MAX_NESTING_DEPTH) {
    throw CodecError("Codec: Document nesting too deep");
  }

  uint32_t field_count = to_network_order(static_cast<uint32_t>(doc.size()));
  write_bytes(output, &field_count, sizeof(field_count));
  std::size_t total_bytes = sizeof(field_count);

  for (const auto& field : doc) {
    total_bytes += write_length_prefixed(output, field.name.data(), field.name.size());
    total_bytes += write_value(output, field.value, depth);
  }
  return total_bytes;
}

std::size_t Codec::write_value(std::ostream& output, const Value& value, std::size_t depth) const {
  uint8_t tag = static_cast<uint8_t>(value.type());
  write_bytes(output, &tag, sizeof(tag));
  std::size_t total_bytes = sizeof(tag);

  switch (value.type()) {
    case ValueType::Null:
      break;
    case ValueType::Bool: {
      uint8_t flag = value.as_bool() ? 1 : 0;
      write_bytes(output, &flag, sizeof(flag));
      total_bytes += sizeof(flag);
      break;
    }
    case ValueType::Int64: {
      uint64_t raw = to_network_order(static_cast<uint64_t>(value.as_int64()));
      write_bytes(output, &raw, sizeof(raw));
      total_bytes += sizeof(raw);
      break;
    }
    case ValueType::Double: {
      double number = value.as_double();
      uint64_t bits = 0;
      std::memcpy(&bits, &number, sizeof(bits));
      bits = to_network_order(bits);
      write_bytes(output, &bits, sizeof(bits));
      total_bytes += sizeof(bits);
      break;
    }
    case ValueType::String: {
      const auto& text = value.as_string();
      total_bytes += write_length_prefixed(output, text.data(), text.size());
      break;
    }
    case ValueType::Binary: {
      const auto& bytes = value.as_binary();
      total_bytes += write_length_prefixed(output, bytes.data(), bytes.size());
      break;
    }
    case ValueType::Date: {
      uint64_t millis = to_network_order(static_cast<uint64_t>(value.as_date().time_since_epoch().count()));
      write_bytes(output, &millis, sizeof(millis));
      total_bytes += sizeof(millis);
      break;
    }
    case ValueType::ObjectId: {
      const auto& bytes = value.as_object_id().bytes();
      write_bytes(output, bytes.data(), bytes.size());
      total_bytes += bytes.size();
      break;
    }
    case ValueType::Document:
      total_bytes += write_document(output, value.as_document(), depth + 1);
      break;
    case ValueType::Array: {
      const auto& elements = value.as_array();
      uint32_t count = to_network_order(static_cast<uint32_t>(elements.size()));
      write_bytes(output, &count, sizeof(count));
      total_bytes += sizeof(count);
      for (const auto& element : elements) {
        total_bytes += write_value(output, element, depth + 1);
      }
      break;
    }
    default:
      throw CodecError("Codec: Cannot encode value type " + std::to_string(tag));
  }
  return total_bytes;
}

Document Codec::read_document(std::istream& input, std::size_t depth) const {
  if (depth > MAX_NESTING_DEPTH) {
    throw CodecError("Codec: Document nesting too deep");
  }

  uint32_t field_count = 0;
  read_bytes(input, &field_count, sizeof(field_count));
  field_count = from_network_order(field_count);

  Document doc;
  for (uint32_t i = 0; i < field_count; ++i) {
    std::string name = read_length_prefixed(input);
    doc.set(name, read_value(input, depth));
  }
  return doc;
}

Value Codec::read_value(std::istream& input, std::size_t depth) const {
  uint8_t tag = 0;
  read_bytes(input, &tag, sizeof(tag));

  switch (static_cast<ValueType>(tag)) {
    case ValueType::Null:
      return Value();
    case ValueType::Bool: {
      uint8_t flag = 0;
      read_bytes(input, &flag, sizeof(flag));
      return Value(flag != 0);
    }
    case ValueType::Int64: {
      uint64_t raw = 0;
      read_bytes(input, &raw, sizeof(raw));
      return Value(static_cast<int64_t>(from_network_order(raw)));
    }
    case ValueType::Double: {
      uint64_t bits = 0;
      read_bytes(input, &bits, sizeof(bits));
      bits = from_network_order(bits);
      double number = 0;
      std::memcpy(&number, &bits, sizeof(number));
      return Value(number);
    }
    case ValueType::String:
      return Value(read_length_prefixed(input));
    case ValueType::Binary: {
      std::string raw = read_length_prefixed(input);
      return Value(Binary(raw.begin(), raw.end()));
    }
    case ValueType::Date: {
      uint64_t millis = 0;
      read_bytes(input, &millis, sizeof(millis));
      auto count = static_cast<int64_t>(from_network_order(millis));
      return Value(Date(std::chrono::milliseconds(count)));
    }
    case ValueType::ObjectId: {
      ObjectId::Bytes bytes{};
      read_bytes(input, bytes.data(), bytes.size());
      return Value(ObjectId(bytes));
    }
    case ValueType::Document:
      return Value(read_document(input, depth + 1));
    case ValueType::Array: {
      uint32_t count = 0;
      read_bytes(input, &count, sizeof(count));
      count = from_network_order(count);
      if (count > MAX_LENGTH) {
        throw CodecError("Codec: Array length out of range");
      }
      Array elements;
      elements.reserve(count);
      for (uint32_t i = 0; i < count; ++i) {
        elements.push_back(read_value(input, depth + 1));
      }
      return Value(std::move(elements));
    }
    default:
      BOOST_LOG_TRIVIAL(error) << "Codec: Unknown value tag: " << static_cast<int>(tag);
      throw CodecError("Codec: Unknown value tag " + std::to_string(tag));
  }
}

std::size_t Codec::write_length_prefixed(std::ostream& output, const void* data, std::size_t size) const {
  if (size > MAX_LENGTH) {
    throw CodecError("Codec: Value of " + std::to_string(size) + " bytes exceeds limit");
  }
  uint32_t length = to_network_order(static_cast<uint32_t>(size));
  write_bytes(output, &length, sizeof(length));
  if (size > 0) {
    write_bytes(output, data, size);
  }
  return sizeof(length) + size;
}

std::string Codec::read_length_prefixed(std::istream& input) const {
  uint32_t length = 0;
  read_bytes(input, &length, sizeof(length));
  length = from_network_order(length);
  if (length > MAX_LENGTH) {
    throw CodecError("Codec: Length prefix out of range: " + std::to_string(length));
  }

  std::string bytes(length, '\0');
  if (length > 0) {
    read_bytes(input, &bytes[0], length);
  }
  return bytes;
}


//==============================================
// STREAM OPERATIONS
//==============================================

void Codec::write_bytes(std::ostream& output, const void* data, std::size_t size) const {
  if (!output.write(static_cast<const char*>(data), static_cast<std::streamsize>(size))) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Failed to write " << size << " bytes to output stream";
    throw CodecError("Codec: Failed to write to output stream");
  }
}

void Codec::read_bytes(std::istream& input, void* data, std::size_t size) const {
  if (!input.read(static_cast<char*>(data), static_cast<std::streamsize>(size))) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Failed to read " << size << " bytes from input stream";
    throw CodecError("Codec: Failed to read from input stream");
  }
}

} // namespace document
} // namespace gridstore
