#include "gridfs/chunk_reader.hpp"
#include <sstream>
#include <stdexcept>
#include <boost/log/trivial.hpp>
#include "gridfs/grid_error.hpp"

namespace gridstore {
namespace gridfs {

//==============================================
// DOWNLOAD STREAM
//==============================================

DownloadStream::DownloadStream(const document::ObjectId& file_id,
                               std::unique_ptr<storage::DocumentCursor> cursor,
                               ChunkLayout layout)
  : file_id_(file_id)
  , cursor_(std::move(cursor))
  , layout_(layout) {}

bool DownloadStream::next(Buffer& buffer) {
  if (!cursor_) {
    return false;
  }

  std::optional<ChunkRecord> chunk;
  if (peeked_) {
    chunk = std::move(peeked_);
    peeked_.reset();
  } else {
    chunk = fetch();
  }

  if (!chunk) {
    finish();
    return false;
  }

  validate(*chunk);
  buffer = std::move(chunk->data);
  ++chunks_read_;
  bytes_read_ += static_cast<int64_t>(buffer.size());
  return true;
}

void DownloadStream::cancel() {
  peeked_.reset();
  if (cursor_) {
    cursor_->close();
    cursor_.reset();
  }
}

std::optional<ChunkRecord> DownloadStream::fetch() {
  document::Document doc;
  try {
    if (!cursor_->next(doc)) {
      return std::nullopt;
    }
    return ChunkRecord::from_document(doc);
  } catch (const storage::StorageError& e) {
    BOOST_LOG_TRIVIAL(error) << "Download stream: Failed to read chunk " << chunks_read_
                             << " of file " << file_id_ << ": " << e.what();
    cancel();
    throw IOFailure(std::string("failed to read chunk: ") + e.what(), file_id_);
  } catch (const IOFailure& e) {
    BOOST_LOG_TRIVIAL(error) << "Download stream: Malformed chunk of file " << file_id_ << ": " << e.what();
    cancel();
    throw;
  }
}

void DownloadStream::validate(const ChunkRecord& chunk) {
  if (chunk.n != chunks_read_) {
    std::stringstream ss;
    ss << "expected chunk " << chunks_read_ << " but found chunk " << chunk.n;
    fail_corrupt(ss.str());
  }
  if (layout_.chunk_count && chunk.n >= *layout_.chunk_count) {
    fail_corrupt("unexpected chunk " + std::to_string(chunk.n) + " beyond the "
                 + std::to_string(*layout_.chunk_count) + " the file holds");
  }

  auto size = static_cast<int64_t>(chunk.data.size());
  if (size == 0) {
    fail_corrupt("chunk " + std::to_string(chunk.n) + " is empty");
  }
  if (short_chunk_seen_) {
    fail_corrupt("chunk " + std::to_string(chunk.n) + " follows a short chunk");
  }

  // Without a known chunk size the first chunk sets it
  if (!layout_.chunk_size) {
    layout_.chunk_size = size;
  }
  int64_t chunk_size = *layout_.chunk_size;
  if (size > chunk_size) {
    fail_corrupt("chunk " + std::to_string(chunk.n) + " holds " + std::to_string(size)
                 + " bytes, more than the chunk size " + std::to_string(chunk_size));
  }

  bool is_last = layout_.chunk_count && chunk.n == *layout_.chunk_count - 1;
  if (size < chunk_size) {
    if (layout_.chunk_count && !is_last) {
      fail_corrupt("chunk " + std::to_string(chunk.n) + " is short but not the last chunk");
    }
    short_chunk_seen_ = true;
  }
  if (is_last && layout_.length) {
    int64_t expected = *layout_.length - chunk.n * chunk_size;
    if (size != expected) {
      fail_corrupt("last chunk holds " + std::to_string(size) + " bytes, expected " + std::to_string(expected));
    }
  }
}

void DownloadStream::finish() {
  if (layout_.chunk_count && chunks_read_ < *layout_.chunk_count) {
    fail_corrupt("missing chunks " + std::to_string(chunks_read_) + " to "
                 + std::to_string(*layout_.chunk_count - 1));
  }
  BOOST_LOG_TRIVIAL(trace) << "Download stream: Read " << chunks_read_ << " chunks (" << bytes_read_
                           << " bytes) of file " << file_id_;
  cancel();
}

void DownloadStream::fail_corrupt(const std::string& message) {
  BOOST_LOG_TRIVIAL(error) << "Download stream: Corrupt file " << file_id_ << ": " << message;
  cancel();
  throw CorruptStream(message, file_id_);
}


//==============================================
// CHUNK READER
//==============================================

ChunkReader::ChunkReader(std::shared_ptr<storage::Collection> chunks) : chunks_(std::move(chunks)) {
  if (!chunks_) {
    throw std::invalid_argument("Chunk reader: Chunks collection is null");
  }
}

DownloadStream ChunkReader::read(const document::ObjectId& file_id) const {
  return open(file_id, ChunkLayout{});
}

DownloadStream ChunkReader::read(const document::ObjectId& file_id, int64_t expected_chunks, int64_t chunk_size) const {
  if (expected_chunks < 0 || chunk_size <= 0) {
    throw std::invalid_argument("Chunk reader: Invalid chunk layout");
  }
  return open(file_id, ChunkLayout{expected_chunks, chunk_size, std::nullopt});
}

DownloadStream ChunkReader::read(const FileRecord& record) const {
  if (record.length < 0 || record.chunk_size <= 0) {
    throw CorruptStream("record has an invalid length or chunk size", record.id);
  }
  return open(record.id, ChunkLayout{record.expected_chunks(), record.chunk_size, record.length});
}

DownloadStream ChunkReader::open(const document::ObjectId& file_id, ChunkLayout layout) const {
  // Empty files own no chunks
  if (layout.chunk_count && *layout.chunk_count == 0) {
    return DownloadStream(file_id, nullptr, layout);
  }

  document::Query query(document::where(fields::FILES_ID).is(file_id));
  query.sort_by(fields::N);

  std::unique_ptr<storage::DocumentCursor> cursor;
  try {
    cursor = chunks_->find(query);
  } catch (const storage::StorageError& e) {
    BOOST_LOG_TRIVIAL(error) << "Chunk reader: Failed to query chunks of file " << file_id << ": " << e.what();
    throw IOFailure(std::string("failed to query chunks: ") + e.what(), file_id);
  }

  DownloadStream stream(file_id, std::move(cursor), layout);
  stream.peeked_ = stream.fetch();
  if (!stream.peeked_) {
    stream.cancel();
    BOOST_LOG_TRIVIAL(warning) << "Chunk reader: No chunks found for file " << file_id;
    throw NotFound("no chunks for file " + file_id.to_hex(), file_id);
  }

  BOOST_LOG_TRIVIAL(debug) << "Chunk reader: Opened download stream for file " << file_id;
  return stream;
}

} // namespace gridfs
} // namespace gridstore
