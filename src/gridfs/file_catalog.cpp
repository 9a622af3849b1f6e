#include "gridfs/file_catalog.hpp"
#include <stdexcept>
#include <boost/log/trivial.hpp>
#include "gridfs/grid_error.hpp"

namespace gridstore {
namespace gridfs {

//==============================================
// FILE CURSOR
//==============================================

FileCursor::FileCursor(std::unique_ptr<storage::DocumentCursor> cursor) : cursor_(std::move(cursor)) {}

bool FileCursor::next(FileRecord& record) {
  if (!cursor_) {
    return false;
  }

  document::Document doc;
  try {
    if (!cursor_->next(doc)) {
      close();
      return false;
    }
    record = FileRecord::from_document(doc);
    return true;
  } catch (const storage::StorageError& e) {
    BOOST_LOG_TRIVIAL(error) << "File cursor: Failed to read file record: " << e.what();
    close();
    throw IOFailure(std::string("failed to read file record: ") + e.what());
  } catch (const IOFailure& e) {
    BOOST_LOG_TRIVIAL(error) << "File cursor: " << e.what();
    close();
    throw;
  }
}

void FileCursor::close() {
  if (cursor_) {
    cursor_->close();
    cursor_.reset();
  }
}


//==============================================
// FILE CATALOG
//==============================================

FileCatalog::FileCatalog(std::shared_ptr<storage::Collection> files) : files_(std::move(files)) {
  if (!files_) {
    throw std::invalid_argument("File catalog: Files collection is null");
  }
}

document::ObjectId FileCatalog::insert(const FileRecord& record) const {
  try {
    files_->insert_one(record.to_document());
  } catch (const storage::DuplicateKeyError& e) {
    BOOST_LOG_TRIVIAL(error) << "File catalog: Duplicate file id " << record.id << ": " << e.what();
    throw DuplicateId(std::string("file record already exists: ") + e.what(), record.id);
  } catch (const storage::StorageError& e) {
    BOOST_LOG_TRIVIAL(error) << "File catalog: Failed to insert file " << record.id << ": " << e.what();
    throw IOFailure(std::string("failed to insert file record: ") + e.what(), record.id);
  }

  BOOST_LOG_TRIVIAL(debug) << "File catalog: Inserted file " << record.id << " (" << record.filename << ")";
  return record.id;
}

FileCursor FileCatalog::find(const document::Query& query) const {
  try {
    return FileCursor(files_->find(query));
  } catch (const storage::StorageError& e) {
    BOOST_LOG_TRIVIAL(error) << "File catalog: Query " << query.filter() << " failed: " << e.what();
    throw IOFailure(std::string("failed to query file records: ") + e.what());
  }
}

std::optional<FileRecord> FileCatalog::find_one(const document::Query& query) const {
  document::Query first = query;
  if (!first.has_sort()) {
    first.sort_by(fields::ID);
  }
  first.limit(1);

  FileCursor cursor = find(first);
  FileRecord record;
  if (cursor.next(record)) {
    return record;
  }
  return std::nullopt;
}

std::optional<FileRecord> FileCatalog::find_by_id(const document::ObjectId& id) const {
  return find_one(document::where(fields::ID).is(id));
}

std::size_t FileCatalog::remove(const document::Filter& filter) const {
  try {
    std::size_t removed = files_->delete_many(filter);
    BOOST_LOG_TRIVIAL(debug) << "File catalog: Removed " << removed << " file records matching " << filter;
    return removed;
  } catch (const storage::StorageError& e) {
    BOOST_LOG_TRIVIAL(error) << "File catalog: Failed to remove " << filter << ": " << e.what();
    throw IOFailure(std::string("failed to remove file records: ") + e.what());
  }
}

void FileCatalog::ensure_indexes() const {
  try {
    files_->create_index(storage::IndexSpec{"filename_1_uploadDate_1", {fields::FILENAME, fields::UPLOAD_DATE}, false});
  } catch (const storage::StorageError& e) {
    BOOST_LOG_TRIVIAL(error) << "File catalog: Failed to create index: " << e.what();
    throw IOFailure(std::string("failed to create files index: ") + e.what());
  }
}

} // namespace gridfs
} // namespace gridstore
