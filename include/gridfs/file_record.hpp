#ifndef GRIDSTORE_GRIDFS_FILE_RECORD_HPP
#define GRIDSTORE_GRIDFS_FILE_RECORD_HPP

#include <cstdint>
#include <optional>
#include <string>
#include "document/document.hpp"
#include "document/object_id.hpp"
#include "document/value.hpp"

namespace gridstore {
namespace gridfs {

// Field names shared by the files and chunks collections
namespace fields {
constexpr const char* ID = "_id";
constexpr const char* FILENAME = "filename";
constexpr const char* CONTENT_TYPE = "contentType";
constexpr const char* LENGTH = "length";
constexpr const char* CHUNK_SIZE = "chunkSize";
constexpr const char* UPLOAD_DATE = "uploadDate";
constexpr const char* MD5 = "md5";
constexpr const char* METADATA = "metadata";
constexpr const char* FILES_ID = "files_id";
constexpr const char* N = "n";
constexpr const char* DATA = "data";
} // namespace fields

// Metadata document of one stored file
struct FileRecord {
  document::ObjectId id;
  std::string filename;
  std::optional<std::string> content_type;
  int64_t length = 0;
  int64_t chunk_size = 0;
  document::Date upload_date;
  std::optional<std::string> md5;
  std::optional<document::Document> metadata;

  // Number of chunks the content occupies
  int64_t expected_chunks() const;

  document::Document to_document() const;
  // Throws IOFailure naming the offending field when doc is not a file record
  static FileRecord from_document(const document::Document& doc);

  bool operator==(const FileRecord& other) const;
  bool operator!=(const FileRecord& other) const { return !(*this == other); }
};

struct ChunkRecord {
  document::ObjectId id;
  document::ObjectId files_id;
  int64_t n = 0;
  document::Binary data;

  document::Document to_document() const;
  static ChunkRecord from_document(const document::Document& doc);
};

} // namespace gridfs
} // namespace gridstore

#endif // GRIDSTORE_GRIDFS_FILE_RECORD_HPP
