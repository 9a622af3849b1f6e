#ifndef GRIDSTORE_GRIDFS_GRID_ERROR_HPP
#define GRIDSTORE_GRIDFS_GRID_ERROR_HPP

#include <optional>
#include <stdexcept>
#include <string>
#include "document/object_id.hpp"

namespace gridstore {
namespace gridfs {

enum class ErrorKind {
  IO_FAILURE,
  NOT_FOUND,
  CORRUPT_STREAM,
  DUPLICATE_ID,
  ORPHAN_CHUNKS,
  PARTIAL_DELETE
};

inline const char* error_kind_to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::IO_FAILURE: return "I/O failure";
    case ErrorKind::NOT_FOUND: return "Not found";
    case ErrorKind::CORRUPT_STREAM: return "Corrupt stream";
    case ErrorKind::DUPLICATE_ID: return "Duplicate id";
    case ErrorKind::ORPHAN_CHUNKS: return "Orphan chunks";
    case ErrorKind::PARTIAL_DELETE: return "Partial delete";
    default: return "Undefined error";
  }
}

class GridError : public std::runtime_error {
public:
  GridError(ErrorKind kind, const std::string& message,
            std::optional<document::ObjectId> file_id = std::nullopt)
    : std::runtime_error(std::string(error_kind_to_string(kind)) + ": " + message)
    , kind_(kind)
    , file_id_(file_id) {}

  ErrorKind kind() const { return kind_; }
  // File the failure concerns, when known
  const std::optional<document::ObjectId>& file_id() const { return file_id_; }

private:
  ErrorKind kind_;
  std::optional<document::ObjectId> file_id_;
};

// Storage failure while reading or writing chunks or records
class IOFailure : public GridError {
public:
  explicit IOFailure(const std::string& message, std::optional<document::ObjectId> file_id = std::nullopt)
    : GridError(ErrorKind::IO_FAILURE, message, file_id) {}
};

// No record, or no chunks for a record that has content
class NotFound : public GridError {
public:
  explicit NotFound(const std::string& message, std::optional<document::ObjectId> file_id = std::nullopt)
    : GridError(ErrorKind::NOT_FOUND, message, file_id) {}
};

// Chunk sequence with a gap, missing tail or mis-sized chunk
class CorruptStream : public GridError {
public:
  CorruptStream(const std::string& message, const document::ObjectId& file_id)
    : GridError(ErrorKind::CORRUPT_STREAM, message, file_id) {}
};

class DuplicateId : public GridError {
public:
  DuplicateId(const std::string& message, const document::ObjectId& file_id)
    : GridError(ErrorKind::DUPLICATE_ID, message, file_id) {}
};

// Chunks were committed but the file record was not
class OrphanChunks : public GridError {
public:
  OrphanChunks(const std::string& message, const document::ObjectId& file_id)
    : GridError(ErrorKind::ORPHAN_CHUNKS, message, file_id) {}
};

// One half of a chunk/record removal pair failed
class PartialDelete : public GridError {
public:
  enum class Phase {
    CHUNKS,
    METADATA
  };

  PartialDelete(const std::string& message, const document::ObjectId& file_id, Phase phase)
    : GridError(ErrorKind::PARTIAL_DELETE, message, file_id)
    , phase_(phase) {}

  Phase phase() const { return phase_; }

private:
  Phase phase_;
};

} // namespace gridfs
} // namespace gridstore

#endif // GRIDSTORE_GRIDFS_GRID_ERROR_HPP
