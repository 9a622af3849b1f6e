#ifndef GRIDSTORE_STORAGE_COLLECTION_HPP
#define GRIDSTORE_STORAGE_COLLECTION_HPP

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "document/document.hpp"
#include "document/filter.hpp"
#include "document/query.hpp"
#include "storage/cursor.hpp"
#include "storage/storage_error.hpp"

namespace gridstore {
namespace storage {

// Index over one or more field paths. Unique indexes reject inserts whose
// key (missing fields count as null) is already present.
struct IndexSpec {
  std::string name;
  std::vector<std::string> fields;
  bool unique = false;
};

// Boundary to the document database: named collection of documents keyed
// by a unique "_id". Implementations are safe for concurrent use and
// guarantee per-document atomicity only. Storage failures raise
// StorageError.
class Collection {
public:
  virtual ~Collection() = default;

  virtual const std::string& name() const = 0;

  // Inserts doc, assigning an ObjectId "_id" when it has none.
  // Returns the "_id"; throws DuplicateKeyError on a key collision.
  virtual document::Value insert_one(const document::Document& doc) = 0;

  // Runs query and returns a cursor over the matching documents
  virtual std::unique_ptr<DocumentCursor> find(const document::Query& query) = 0;

  // First document of query's result order, std::nullopt when none match
  virtual std::optional<document::Document> find_one(const document::Query& query);

  // Removes every matching document, returns how many were removed
  virtual std::size_t delete_many(const document::Filter& filter) = 0;

  virtual std::size_t count(const document::Filter& filter) = 0;

  // Creating an index that already exists with the same spec is a no-op
  virtual void create_index(const IndexSpec& spec) = 0;
  virtual std::vector<IndexSpec> list_indexes() const = 0;

  // Cursors handed out by find() and not closed yet
  virtual std::size_t open_cursors() const = 0;

protected:
  // Copy of doc with an ObjectId "_id" placed first when doc has none
  static document::Document ensure_id(const document::Document& doc);
};

// Hands out named collections; the same name always yields the same instance
class Database {
public:
  virtual ~Database() = default;

  virtual std::shared_ptr<Collection> collection(const std::string& name) = 0;
  virtual std::vector<std::string> list_collections() const = 0;
  virtual void drop_collection(const std::string& name) = 0;
};

} // namespace storage
} // namespace gridstore

#endif // GRIDSTORE_STORAGE_COLLECTION_HPP
