#ifndef GRIDSTORE_GRIDFS_FILE_CATALOG_HPP
#define GRIDSTORE_GRIDFS_FILE_CATALOG_HPP

#include <cstddef>
#include <memory>
#include <optional>
#include "document/filter.hpp"
#include "document/query.hpp"
#include "gridfs/file_record.hpp"
#include "storage/collection.hpp"

namespace gridstore {
namespace gridfs {

// Lazy, non-restartable sequence of file records
class FileCursor {
public:
  explicit FileCursor(std::unique_ptr<storage::DocumentCursor> cursor);
  ~FileCursor() { close(); }

  FileCursor(FileCursor&&) = default;
  FileCursor& operator=(FileCursor&&) = default;
  FileCursor(const FileCursor&) = delete;
  FileCursor& operator=(const FileCursor&) = delete;

  // Moves the next record into record, false when exhausted. Throws
  // IOFailure on storage errors or malformed records.
  bool next(FileRecord& record);
  void close();
  bool is_open() const { return cursor_ != nullptr; }

private:
  std::unique_ptr<storage::DocumentCursor> cursor_;
};

// The files collection: one record per stored file
class FileCatalog {
public:
  // Throws std::invalid_argument for a null collection
  explicit FileCatalog(std::shared_ptr<storage::Collection> files);

  // Throws DuplicateId if a record with the same id exists
  document::ObjectId insert(const FileRecord& record) const;

  FileCursor find(const document::Query& query) const;
  FileCursor find(const document::Filter& filter) const { return find(document::Query(filter)); }

  // First match; the lowest id wins unless query names a sort order
  std::optional<FileRecord> find_one(const document::Query& query) const;
  std::optional<FileRecord> find_one(const document::Filter& filter) const {
    return find_one(document::Query(filter));
  }
  std::optional<FileRecord> find_by_id(const document::ObjectId& id) const;

  // Returns the number of records removed
  std::size_t remove(const document::Filter& filter) const;

  // Index on filename and uploadDate
  void ensure_indexes() const;

private:
  std::shared_ptr<storage::Collection> files_;
};

} // namespace gridfs
} // namespace gridstore

#endif // GRIDSTORE_GRIDFS_FILE_CATALOG_HPP
