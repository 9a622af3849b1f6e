#include "gridfs/chunk_writer.hpp"
#include <algorithm>
#include <stdexcept>
#include <boost/log/trivial.hpp>
#include "gridfs/file_record.hpp"
#include "gridfs/grid_error.hpp"
#include "utils/digest.hpp"

namespace gridstore {
namespace gridfs {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ChunkWriter::ChunkWriter(std::shared_ptr<storage::Collection> chunks, std::size_t chunk_size, bool compute_md5)
  : chunks_(std::move(chunks))
  , chunk_size_(chunk_size)
  , compute_md5_(compute_md5) {
  if (!chunks_) {
    throw std::invalid_argument("Chunk writer: Chunks collection is null");
  }
  if (chunk_size_ == 0) {
    throw std::invalid_argument("Chunk writer: Chunk size must be positive");
  }
  if (chunk_size_ > MAX_CHUNK_SIZE) {
    throw std::invalid_argument("Chunk writer: Chunk size " + std::to_string(chunk_size_) + " exceeds "
                                + std::to_string(MAX_CHUNK_SIZE) + " bytes");
  }
}


//==============================================
// WRITING
//==============================================

WriteResult ChunkWriter::write(const ByteSource& source) const {
  return write(document::ObjectId::generate(), source);
}

WriteResult ChunkWriter::write(const document::ObjectId& file_id, const ByteSource& source) const {
  try {
    if (chunks_->count(document::where(fields::FILES_ID).is(file_id)) > 0) {
      throw DuplicateId("chunks already exist for file " + file_id.to_hex(), file_id);
    }
  } catch (const storage::StorageError& e) {
    throw IOFailure(std::string("failed to check existing chunks: ") + e.what(), file_id);
  }

  BOOST_LOG_TRIVIAL(debug) << "Chunk writer: Writing file " << file_id << " in chunks of " << chunk_size_ << " bytes";

  std::optional<utils::Digest> digest;
  if (compute_md5_) {
    digest.emplace(utils::Digest::Algorithm::Md5);
  }

  WriteResult result;
  result.file_id = file_id;

  Buffer pending;
  pending.reserve(chunk_size_);
  Buffer input;

  try {
    while (source(input)) {
      if (digest && !input.empty()) {
        digest->update(input.data(), input.size());
      }
      result.length += static_cast<int64_t>(input.size());

      // Fill the pending chunk, flushing each time it reaches chunk_size_
      std::size_t offset = 0;
      while (offset < input.size()) {
        std::size_t take = std::min(chunk_size_ - pending.size(), input.size() - offset);
        pending.insert(pending.end(), input.begin() + offset, input.begin() + offset + take);
        offset += take;

        if (pending.size() == chunk_size_) {
          insert_chunk(file_id, result.chunk_count, std::move(pending));
          ++result.chunk_count;
          pending = Buffer();
          pending.reserve(chunk_size_);
        }
      }
    }

    if (!pending.empty()) {
      insert_chunk(file_id, result.chunk_count, std::move(pending));
      ++result.chunk_count;
    }

    if (digest) {
      result.md5 = digest->finalize();
    }
  } catch (const storage::StorageError& e) {
    BOOST_LOG_TRIVIAL(error) << "Chunk writer: Failed to store chunk " << result.chunk_count
                             << " of file " << file_id << ": " << e.what();
    discard_chunks(file_id, result.chunk_count);
    throw IOFailure("failed to store chunk " + std::to_string(result.chunk_count) + ": " + e.what(), file_id);
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Chunk writer: Source failed for file " << file_id << ": " << e.what();
    discard_chunks(file_id, result.chunk_count);
    throw IOFailure(std::string("source failed: ") + e.what(), file_id);
  }

  BOOST_LOG_TRIVIAL(debug) << "Chunk writer: Wrote " << result.chunk_count << " chunks ("
                           << result.length << " bytes) for file " << file_id;
  return result;
}


//==============================================
// CHUNK OPERATIONS
//==============================================

void ChunkWriter::insert_chunk(const document::ObjectId& file_id, int64_t n, Buffer data) const {
  ChunkRecord chunk;
  chunk.id = document::ObjectId::generate();
  chunk.files_id = file_id;
  chunk.n = n;
  chunk.data = std::move(data);

  chunks_->insert_one(chunk.to_document());
  BOOST_LOG_TRIVIAL(trace) << "Chunk writer: Stored chunk " << n << " of file " << file_id;
}

void ChunkWriter::discard_chunks(const document::ObjectId& file_id, int64_t written) const {
  if (written == 0) {
    return;
  }

  document::Filter filter = document::where(fields::FILES_ID).is(file_id);
  filter.and_(document::where(fields::N).lt(written));

  try {
    std::size_t removed = chunks_->delete_many(filter);
    BOOST_LOG_TRIVIAL(info) << "Chunk writer: Removed " << removed << " partial chunks of file " << file_id;
  } catch (const storage::StorageError& e) {
    BOOST_LOG_TRIVIAL(error) << "Chunk writer: Failed to remove partial chunks of file " << file_id
                             << ", orphans remain: " << e.what();
  }
}

} // namespace gridfs
} // namespace gridstore
