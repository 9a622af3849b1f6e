#include "gridfs/file_record.hpp"
#include <cmath>
#include "gridfs/grid_error.hpp"

namespace gridstore {
namespace gridfs {

namespace {

const document::Value& require(const document::Document& doc, const char* name, document::ValueType type) {
  const document::Value* value = doc.get(name);
  if (value == nullptr) {
    throw IOFailure(std::string("Malformed record: missing field ") + name);
  }
  if (value->type() != type) {
    throw IOFailure(std::string("Malformed record: field ") + name + " holds "
                    + document::value_type_to_string(value->type()) + ", expected "
                    + document::value_type_to_string(type));
  }
  return *value;
}

// Accepts integral doubles written by other tools
int64_t require_integer(const document::Document& doc, const char* name) {
  const document::Value* value = doc.get(name);
  if (value == nullptr || !value->is_number()) {
    throw IOFailure(std::string("Malformed record: field ") + name + " is not a number");
  }
  if (value->type() == document::ValueType::Int64) {
    return value->as_int64();
  }

  // [-2^63, 2^63) is exactly representable at both ends
  constexpr double LOWER = -9223372036854775808.0;
  constexpr double UPPER = 9223372036854775808.0;
  double number = value->as_double();
  if (!std::isfinite(number) || number < LOWER || number >= UPPER || std::trunc(number) != number) {
    throw IOFailure(std::string("Malformed record: field ") + name + " is not an integer");
  }
  return static_cast<int64_t>(number);
}

std::optional<std::string> optional_string(const document::Document& doc, const char* name) {
  const document::Value* value = doc.get(name);
  if (value == nullptr || value->is_null()) {
    return std::nullopt;
  }
  if (value->type() != document::ValueType::String) {
    throw IOFailure(std::string("Malformed record: field ") + name + " is not a string");
  }
  return value->as_string();
}

} // namespace

//==============================================
// FILE RECORD
//==============================================

int64_t FileRecord::expected_chunks() const {
  if (length <= 0 || chunk_size <= 0) {
    return 0;
  }
  return (length + chunk_size - 1) / chunk_size;
}

document::Document FileRecord::to_document() const {
  document::Document doc{
    {fields::ID, id},
    {fields::FILENAME, filename},
    {fields::LENGTH, length},
    {fields::CHUNK_SIZE, chunk_size},
    {fields::UPLOAD_DATE, upload_date}
  };
  if (content_type) {
    doc.set(fields::CONTENT_TYPE, *content_type);
  }
  if (md5) {
    doc.set(fields::MD5, *md5);
  }
  if (metadata) {
    doc.set(fields::METADATA, *metadata);
  }
  return doc;
}

FileRecord FileRecord::from_document(const document::Document& doc) {
  FileRecord record;
  record.id = require(doc, fields::ID, document::ValueType::ObjectId).as_object_id();
  record.filename = require(doc, fields::FILENAME, document::ValueType::String).as_string();
  record.content_type = optional_string(doc, fields::CONTENT_TYPE);
  record.length = require_integer(doc, fields::LENGTH);
  record.chunk_size = require_integer(doc, fields::CHUNK_SIZE);
  record.upload_date = require(doc, fields::UPLOAD_DATE, document::ValueType::Date).as_date();
  record.md5 = optional_string(doc, fields::MD5);

  const document::Value* metadata = doc.get(fields::METADATA);
  if (metadata != nullptr && !metadata->is_null()) {
    if (metadata->type() != document::ValueType::Document) {
      throw IOFailure("Malformed record: field metadata is not a document", record.id);
    }
    record.metadata = metadata->as_document();
  }
  return record;
}

bool FileRecord::operator==(const FileRecord& other) const {
  return id == other.id && filename == other.filename && content_type == other.content_type
      && length == other.length && chunk_size == other.chunk_size && upload_date == other.upload_date
      && md5 == other.md5 && metadata == other.metadata;
}


//==============================================
// CHUNK RECORD
//==============================================

document::Document ChunkRecord::to_document() const {
  return document::Document{
    {fields::ID, id},
    {fields::FILES_ID, files_id},
    {fields::N, n},
    {fields::DATA, data}
  };
}

ChunkRecord ChunkRecord::from_document(const document::Document& doc) {
  ChunkRecord chunk;
  chunk.id = require(doc, fields::ID, document::ValueType::ObjectId).as_object_id();
  chunk.files_id = require(doc, fields::FILES_ID, document::ValueType::ObjectId).as_object_id();
  chunk.n = require_integer(doc, fields::N);
  chunk.data = require(doc, fields::DATA, document::ValueType::Binary).as_binary();
  return chunk;
}

} // namespace gridfs
} // namespace gridstore
