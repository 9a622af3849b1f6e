#include "gridfs/grid_store.hpp"
#include <stdexcept>
#include <vector>
#include <boost/log/trivial.hpp>
#include "gridfs/grid_criteria.hpp"
#include "gridfs/grid_error.hpp"

namespace gridstore {
namespace gridfs {

namespace {

const GridStoreConfig& validated(const GridStoreConfig& config) {
  if (!config.database) {
    throw std::invalid_argument("Grid store: Database is null");
  }
  if (config.bucket_name.empty()) {
    throw std::invalid_argument("Grid store: Bucket name is empty");
  }
  if (config.chunk_size == 0) {
    throw std::invalid_argument("Grid store: Chunk size must be positive");
  }
  if (config.chunk_size > MAX_CHUNK_SIZE) {
    throw std::invalid_argument("Grid store: Chunk size exceeds " + std::to_string(MAX_CHUNK_SIZE) + " bytes");
  }
  if (!config.executor) {
    throw std::invalid_argument("Grid store: Executor is not set");
  }
  return config;
}

std::shared_ptr<storage::Collection> open_collection(const GridStoreConfig& config, const std::string& suffix) {
  std::string name = config.bucket_name + "." + suffix;
  try {
    return config.database->collection(name);
  } catch (const storage::StorageError& e) {
    BOOST_LOG_TRIVIAL(error) << "Grid store: Failed to open collection " << name << ": " << e.what();
    throw IOFailure("failed to open collection " + name + ": " + e.what());
  }
}

void log_transition(const document::ObjectId& file_id, UploadState from, UploadState to) {
  BOOST_LOG_TRIVIAL(debug) << "Grid store: Upload " << file_id << " "
                           << upload_state_to_string(from) << " -> " << upload_state_to_string(to);
}

} // namespace

const char* upload_state_to_string(UploadState state) {
  switch (state) {
    case UploadState::UPLOADING: return "Uploading";
    case UploadState::CHUNKS_PERSISTED: return "ChunksPersisted";
    case UploadState::METADATA_PERSISTED: return "MetadataPersisted";
    case UploadState::FAILED: return "Failed";
    default: return "Undefined state";
  }
}


//==============================================
// GRID RESOURCE
//==============================================

GridResource::GridResource(FileRecord record, std::shared_ptr<const ChunkReader> reader)
  : record_(std::move(record))
  , reader_(std::move(reader)) {}

DownloadStream GridResource::download_stream() const {
  return reader_->read(record_);
}

Buffer GridResource::read_all() const {
  Buffer content;
  content.reserve(static_cast<std::size_t>(record_.length));

  DownloadStream stream = download_stream();
  Buffer chunk;
  while (stream.next(chunk)) {
    content.insert(content.end(), chunk.begin(), chunk.end());
  }
  return content;
}


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

GridStore::GridStore(GridStoreConfig config)
  : config_(validated(config))
  , files_(open_collection(config_, "files"))
  , chunks_(open_collection(config_, "chunks"))
  , writer_(chunks_, config_.chunk_size, config_.compute_md5)
  , reader_(std::make_shared<const ChunkReader>(chunks_))
  , catalog_(files_) {
  ensure_indexes();
  BOOST_LOG_TRIVIAL(info) << "Grid store: Bucket " << config_.bucket_name << " ready (chunk size "
                          << config_.chunk_size << " bytes)";
}

void GridStore::ensure_indexes() const {
  try {
    chunks_->create_index(storage::IndexSpec{"files_id_1_n_1", {fields::FILES_ID, fields::N}, true});
  } catch (const storage::StorageError& e) {
    BOOST_LOG_TRIVIAL(error) << "Grid store: Failed to create chunk index: " << e.what();
    throw IOFailure(std::string("failed to create chunks index: ") + e.what());
  }
  catalog_.ensure_indexes();
}


//==============================================
// FILE OPERATIONS
//==============================================

std::future<document::ObjectId> GridStore::store(ByteSource source, std::string filename,
                                                 std::optional<std::string> content_type,
                                                 std::optional<document::Document> metadata) {
  return submit([this, source = std::move(source), filename = std::move(filename),
                 content_type = std::move(content_type), metadata = std::move(metadata)]() {
    return store_now(source, filename, content_type, metadata);
  });
}

FileCursor GridStore::find(const document::Query& query) const {
  return catalog_.find(query);
}

std::future<std::optional<FileRecord>> GridStore::find_one(const document::Query& query) const {
  return submit([this, query]() { return catalog_.find_one(query); });
}

std::future<GridResource> GridStore::get_resource(const FileRecord& record) const {
  return submit([this, record]() { return resource_for(record); });
}

std::future<GridResource> GridStore::get_resource(const std::string& filename) const {
  return submit([this, filename]() {
    // Uploads in the same millisecond fall back to the id, which only
    // orders ids generated by one process
    document::Query newest(where_filename().is(filename));
    newest.sort_by(fields::UPLOAD_DATE, document::SortOrder::Descending)
          .sort_by(fields::ID, document::SortOrder::Descending);

    std::optional<FileRecord> record = catalog_.find_one(newest);
    if (!record) {
      BOOST_LOG_TRIVIAL(warning) << "Grid store: No file named " << filename;
      throw NotFound("no file named " + filename);
    }
    return resource_for(*record);
  });
}

std::future<void> GridStore::remove(const document::Filter& filter) const {
  return submit([this, filter]() { remove_now(filter); });
}


//==============================================
// OPERATION BODIES
//==============================================

document::ObjectId GridStore::store_now(const ByteSource& source, const std::string& filename,
                                        const std::optional<std::string>& content_type,
                                        const std::optional<document::Document>& metadata) const {
  const document::ObjectId file_id = document::ObjectId::generate();
  BOOST_LOG_TRIVIAL(info) << "Grid store: Storing " << filename << " as " << file_id;

  WriteResult written;
  try {
    written = writer_.write(file_id, source);
  } catch (const GridError&) {
    log_transition(file_id, UploadState::UPLOADING, UploadState::FAILED);
    throw;
  }
  log_transition(file_id, UploadState::UPLOADING, UploadState::CHUNKS_PERSISTED);

  FileRecord record;
  record.id = file_id;
  record.filename = filename;
  record.content_type = content_type;
  record.length = written.length;
  record.chunk_size = static_cast<int64_t>(writer_.chunk_size());
  record.upload_date = document::now_date();
  record.md5 = written.md5;
  record.metadata = metadata;

  try {
    catalog_.insert(record);
  } catch (const GridError& e) {
    log_transition(file_id, UploadState::CHUNKS_PERSISTED, UploadState::FAILED);
    BOOST_LOG_TRIVIAL(error) << "Grid store: " << written.chunk_count << " chunks of " << file_id
                             << " have no file record: " << e.what();
    throw OrphanChunks(std::string("file record not written: ") + e.what(), file_id);
  }
  log_transition(file_id, UploadState::CHUNKS_PERSISTED, UploadState::METADATA_PERSISTED);

  BOOST_LOG_TRIVIAL(info) << "Grid store: Stored " << filename << " (" << written.length << " bytes, "
                          << written.chunk_count << " chunks) as " << file_id;
  return file_id;
}

GridResource GridStore::resource_for(const FileRecord& record) const {
  if (!catalog_.find_by_id(record.id)) {
    BOOST_LOG_TRIVIAL(warning) << "Grid store: File record " << record.id << " no longer exists";
    throw NotFound("no file record " + record.id.to_hex(), record.id);
  }

  if (record.length > 0) {
    std::size_t chunk_count = 0;
    try {
      chunk_count = chunks_->count(document::where(fields::FILES_ID).is(record.id));
    } catch (const storage::StorageError& e) {
      throw IOFailure(std::string("failed to count chunks: ") + e.what(), record.id);
    }
    if (chunk_count == 0) {
      BOOST_LOG_TRIVIAL(warning) << "Grid store: File " << record.id << " has no chunks";
      throw NotFound("no chunks for file " + record.id.to_hex(), record.id);
    }
  }

  return GridResource(record, reader_);
}

void GridStore::remove_now(const document::Filter& filter) const {
  std::vector<document::ObjectId> ids;
  {
    FileCursor cursor = catalog_.find(filter);
    FileRecord record;
    while (cursor.next(record)) {
      ids.push_back(record.id);
    }
  }

  BOOST_LOG_TRIVIAL(info) << "Grid store: Deleting " << ids.size() << " files matching " << filter;

  for (const auto& id : ids) {
    try {
      std::size_t removed = chunks_->delete_many(document::where(fields::FILES_ID).is(id));
      BOOST_LOG_TRIVIAL(debug) << "Grid store: Removed " << removed << " chunks of " << id;
    } catch (const storage::StorageError& e) {
      BOOST_LOG_TRIVIAL(error) << "Grid store: Chunk removal failed for " << id << ": " << e.what();
      throw PartialDelete(std::string("chunk removal failed: ") + e.what(), id, PartialDelete::Phase::CHUNKS);
    }

    try {
      catalog_.remove(by_id(id));
    } catch (const GridError& e) {
      BOOST_LOG_TRIVIAL(error) << "Grid store: Chunks of " << id << " removed but its record remains: " << e.what();
      throw PartialDelete(std::string("file record removal failed: ") + e.what(), id,
                          PartialDelete::Phase::METADATA);
    }
  }
}

} // namespace gridfs
} // namespace gridstore
