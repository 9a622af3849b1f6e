#ifndef GRIDSTORE_GRIDFS_GRID_STORE_HPP
#define GRIDSTORE_GRIDFS_GRID_STORE_HPP

#include <cstddef>
#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/post.hpp>
#include "document/document.hpp"
#include "document/filter.hpp"
#include "document/query.hpp"
#include "gridfs/byte_source.hpp"
#include "gridfs/chunk_reader.hpp"
#include "gridfs/chunk_writer.hpp"
#include "gridfs/file_catalog.hpp"
#include "gridfs/file_record.hpp"
#include "storage/collection.hpp"

namespace gridstore {
namespace gridfs {

constexpr std::size_t DEFAULT_CHUNK_SIZE = 255 * 1024;
constexpr const char* DEFAULT_BUCKET = "fs";

struct GridStoreConfig {
  std::shared_ptr<storage::Database> database;
  std::string bucket_name = DEFAULT_BUCKET;
  std::size_t chunk_size = DEFAULT_CHUNK_SIZE;
  bool compute_md5 = true;
  // Runs the asynchronous operations; not owned by the store
  boost::asio::any_io_executor executor;
};

// Lifecycle of one store() call
enum class UploadState {
  UPLOADING,
  CHUNKS_PERSISTED,
  METADATA_PERSISTED,
  FAILED
};

const char* upload_state_to_string(UploadState state);

// A stored file: its record plus access to its content
class GridResource {
public:
  GridResource(FileRecord record, std::shared_ptr<const ChunkReader> reader);

  const FileRecord& record() const { return record_; }
  const document::ObjectId& id() const { return record_.id; }
  const std::string& filename() const { return record_.filename; }
  const std::optional<std::string>& content_type() const { return record_.content_type; }
  int64_t length() const { return record_.length; }
  const std::optional<document::Document>& metadata() const { return record_.metadata; }

  // Opens a fresh stream over the content on every call
  DownloadStream download_stream() const;
  // Reads the whole content into memory
  Buffer read_all() const;

private:
  FileRecord record_;
  std::shared_ptr<const ChunkReader> reader_;
};

// Chunked file storage over the "<bucket>.files" and "<bucket>.chunks"
// collections of a database. Storing and deleting are not atomic across the
// two collections; failures between the halves surface as OrphanChunks and
// PartialDelete carrying the affected file id. The store must outlive the
// futures it returns.
class GridStore {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Creates the collections' indexes. Throws std::invalid_argument for an
  // incomplete config, IOFailure when the indexes cannot be created.
  explicit GridStore(GridStoreConfig config);


  // ---- FILE OPERATIONS ----
  // Writes source as chunks, then the file record. Yields the new file id.
  std::future<document::ObjectId> store(ByteSource source, std::string filename,
                                        std::optional<std::string> content_type = std::nullopt,
                                        std::optional<document::Document> metadata = std::nullopt);

  FileCursor find(const document::Query& query) const;
  FileCursor find(const document::Filter& filter) const { return find(document::Query(filter)); }

  std::future<std::optional<FileRecord>> find_one(const document::Query& query) const;
  std::future<std::optional<FileRecord>> find_one(const document::Filter& filter) const {
    return find_one(document::Query(filter));
  }

  // Fails with NotFound when the record is gone or its content has no chunks
  std::future<GridResource> get_resource(const FileRecord& record) const;
  // Resource for the newest upload of filename. Ties on uploadDate go to the
  // higher id, which is best-effort across processes.
  std::future<GridResource> get_resource(const std::string& filename) const;

  // Removes the chunks and then the record of every matching file
  std::future<void> remove(const document::Filter& filter) const;


  // ---- GETTERS ----
  const std::string& bucket_name() const { return config_.bucket_name; }
  std::size_t chunk_size() const { return config_.chunk_size; }
  const std::shared_ptr<storage::Collection>& files() const { return files_; }
  const std::shared_ptr<storage::Collection>& chunks() const { return chunks_; }

private:
  // ---- PARAMETERS ----
  GridStoreConfig config_;
  std::shared_ptr<storage::Collection> files_;
  std::shared_ptr<storage::Collection> chunks_;
  ChunkWriter writer_;
  std::shared_ptr<const ChunkReader> reader_;
  FileCatalog catalog_;


  // ---- OPERATION BODIES ----
  document::ObjectId store_now(const ByteSource& source, const std::string& filename,
                               const std::optional<std::string>& content_type,
                               const std::optional<document::Document>& metadata) const;
  GridResource resource_for(const FileRecord& record) const;
  void remove_now(const document::Filter& filter) const;
  void ensure_indexes() const;

  // Runs fn on the executor and returns its result through a future
  template <typename Fn>
  auto submit(Fn fn) const -> std::future<decltype(fn())> {
    using Result = decltype(fn());
    auto task = std::make_shared<std::packaged_task<Result()>>(std::move(fn));
    std::future<Result> result = task->get_future();
    boost::asio::post(config_.executor, [task]() { (*task)(); });
    return result;
  }
};

} // namespace gridfs
} // namespace gridstore

#endif // GRIDSTORE_GRIDFS_GRID_STORE_HPP
