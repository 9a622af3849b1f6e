#ifndef GRIDSTORE_GRIDFS_CHUNK_WRITER_HPP
#define GRIDSTORE_GRIDFS_CHUNK_WRITER_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include "document/object_id.hpp"
#include "gridfs/byte_source.hpp"
#include "storage/collection.hpp"

namespace gridstore {
namespace gridfs {

// Largest chunk payload; keeps every chunk document well inside the
// codec's per-value limit
constexpr std::size_t MAX_CHUNK_SIZE = 16 * 1024 * 1024;

struct WriteResult {
  document::ObjectId file_id;
  int64_t length = 0;
  int64_t chunk_count = 0;
  // Lowercase hex MD5 of the content, absent when disabled
  std::optional<std::string> md5;
};

// Splits a byte source into fixed-size chunk documents. Every chunk but the
// last holds exactly chunk_size bytes; chunks are inserted in increasing n
// and are visible in the collection before write() returns.
class ChunkWriter {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Throws std::invalid_argument for a null collection or a chunk size of
  // zero or above MAX_CHUNK_SIZE
  ChunkWriter(std::shared_ptr<storage::Collection> chunks, std::size_t chunk_size, bool compute_md5 = true);


  // ---- WRITING ----
  // Writes source under a freshly generated file id
  WriteResult write(const ByteSource& source) const;
  // Writes source under file_id. Throws DuplicateId if chunks for file_id
  // already exist. On any storage or source failure the chunks written so
  // far are removed on a best-effort basis and IOFailure is thrown.
  WriteResult write(const document::ObjectId& file_id, const ByteSource& source) const;


  // ---- GETTERS ----
  std::size_t chunk_size() const { return chunk_size_; }
  bool computes_md5() const { return compute_md5_; }

private:
  // ---- PARAMETERS ----
  std::shared_ptr<storage::Collection> chunks_;
  std::size_t chunk_size_;
  bool compute_md5_;


  // ---- CHUNK OPERATIONS ----
  void insert_chunk(const document::ObjectId& file_id, int64_t n, Buffer data) const;
  // Removes chunks 0..written-1 of file_id, logs when that fails
  void discard_chunks(const document::ObjectId& file_id, int64_t written) const;
};

} // namespace gridfs
} // namespace gridstore

#endif // GRIDSTORE_GRIDFS_CHUNK_WRITER_HPP
