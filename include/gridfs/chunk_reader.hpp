#ifndef GRIDSTORE_GRIDFS_CHUNK_READER_HPP
#define GRIDSTORE_GRIDFS_CHUNK_READER_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include "document/object_id.hpp"
#include "gridfs/byte_source.hpp"
#include "gridfs/file_record.hpp"
#include "storage/collection.hpp"

namespace gridstore {
namespace gridfs {

// What the reader knows about a file before reading its chunks
struct ChunkLayout {
  std::optional<int64_t> chunk_count;
  std::optional<int64_t> chunk_size;
  std::optional<int64_t> length;
};

// Lazy, ordered, non-restartable sequence of a file's chunk payloads. Holds
// a collection cursor until the sequence ends, fails, is cancelled or the
// stream is destroyed.
class DownloadStream {
public:
  DownloadStream(const document::ObjectId& file_id, std::unique_ptr<storage::DocumentCursor> cursor,
                 ChunkLayout layout);
  ~DownloadStream() { cancel(); }

  DownloadStream(DownloadStream&&) = default;
  DownloadStream& operator=(DownloadStream&&) = default;
  DownloadStream(const DownloadStream&) = delete;
  DownloadStream& operator=(const DownloadStream&) = delete;

  // Moves the next chunk payload into buffer, false once the file is
  // complete. Throws CorruptStream on a gap, a mis-sized chunk or missing
  // trailing chunks, IOFailure on storage errors. The cursor is released
  // before either is thrown.
  bool next(Buffer& buffer);

  // Stops reading and releases the cursor; next() returns false afterwards
  void cancel();

  bool is_open() const { return cursor_ != nullptr; }
  const document::ObjectId& file_id() const { return file_id_; }
  int64_t chunks_read() const { return chunks_read_; }
  int64_t bytes_read() const { return bytes_read_; }

private:
  friend class ChunkReader;

  document::ObjectId file_id_;
  std::unique_ptr<storage::DocumentCursor> cursor_;
  ChunkLayout layout_;
  // First chunk, fetched eagerly to detect missing content
  std::optional<ChunkRecord> peeked_;
  int64_t chunks_read_{0};
  int64_t bytes_read_{0};
  bool short_chunk_seen_{false};

  std::optional<ChunkRecord> fetch();
  void validate(const ChunkRecord& chunk);
  void finish();
  [[noreturn]] void fail_corrupt(const std::string& message);
};

// Opens download streams over the chunks collection
class ChunkReader {
public:
  // Throws std::invalid_argument for a null collection
  explicit ChunkReader(std::shared_ptr<storage::Collection> chunks);

  // Streams file_id's chunks in n order. Throws NotFound when no chunk
  // exists for file_id.
  DownloadStream read(const document::ObjectId& file_id) const;
  // Streams a file of known shape; chunk sizes and count are verified
  // against it. Throws NotFound when chunks are expected but none exist.
  DownloadStream read(const document::ObjectId& file_id, int64_t expected_chunks, int64_t chunk_size) const;
  // Streams the file record describes, also verifying the total length
  DownloadStream read(const FileRecord& record) const;

private:
  std::shared_ptr<storage::Collection> chunks_;

  DownloadStream open(const document::ObjectId& file_id, ChunkLayout layout) const;
};

} // namespace gridfs
} // namespace gridstore

#endif // GRIDSTORE_GRIDFS_CHUNK_READER_HPP
