#ifndef GRIDSTORE_STORAGE_MEMORY_COLLECTION_HPP
#define GRIDSTORE_STORAGE_MEMORY_COLLECTION_HPP

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "storage/collection.hpp"
#include "storage/index_table.hpp"

namespace gridstore {
namespace storage {

// Process-local collection. find() captures the matching documents when
// it runs; later writes are not visible to an open cursor.
class MemoryCollection : public Collection {
public:
  explicit MemoryCollection(std::string name);

  const std::string& name() const override { return name_; }
  document::Value insert_one(const document::Document& doc) override;
  std::unique_ptr<DocumentCursor> find(const document::Query& query) override;
  std::size_t delete_many(const document::Filter& filter) override;
  std::size_t count(const document::Filter& filter) override;
  void create_index(const IndexSpec& spec) override;
  std::vector<IndexSpec> list_indexes() const override;
  std::size_t open_cursors() const override { return cursors_.open_cursors(); }

  // Removes every document, keeps indexes
  void clear();

private:
  std::string name_;
  mutable std::mutex mutex_;
  std::vector<document::Document> documents_;
  IndexTable indexes_;
  CursorTracker cursors_;
};

class MemoryDatabase : public Database {
public:
  MemoryDatabase() = default;

  std::shared_ptr<Collection> collection(const std::string& name) override;
  std::vector<std::string> list_collections() const override;
  void drop_collection(const std::string& name) override;

private:
  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<MemoryCollection>> collections_;
};

} // namespace storage
} // namespace gridstore

#endif // GRIDSTORE_STORAGE_MEMORY_COLLECTION_HPP
