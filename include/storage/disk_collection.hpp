#ifndef GRIDSTORE_STORAGE_DISK_COLLECTION_HPP
#define GRIDSTORE_STORAGE_DISK_COLLECTION_HPP

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "document/codec.hpp"
#include "storage/collection.hpp"
#include "storage/index_table.hpp"

namespace gridstore {
namespace storage {

// Collection persisted as one codec-encoded file per document. Files are
// content-addressed by the SHA-256 of the encoded "_id":
// {base_path}/{hash[0:2]}/{hash[2:4]}/{hash[4:6]}/{remaining_hash}
// Unique index keys are rebuilt from the files when the collection opens.
class DiskCollection : public Collection {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  DiskCollection(std::string name, const std::filesystem::path& base_path);


  // ---- COLLECTION OPERATIONS ----
  const std::string& name() const override { return name_; }
  document::Value insert_one(const document::Document& doc) override;
  std::unique_ptr<DocumentCursor> find(const document::Query& query) override;
  std::size_t delete_many(const document::Filter& filter) override;
  std::size_t count(const document::Filter& filter) override;
  void create_index(const IndexSpec& spec) override;
  std::vector<IndexSpec> list_indexes() const override;
  std::size_t open_cursors() const override { return cursors_.open_cursors(); }


  // ---- MAINTENANCE ----
  // Removes all stored documents and resets the directory
  void clear();
  const std::filesystem::path& base_path() const { return base_path_; }

private:
  // ---- PARAMETERS ----
  std::string name_;
  // Root path for all documents of this collection
  std::filesystem::path base_path_;
  mutable std::mutex mutex_;
  IndexTable indexes_;
  CursorTracker cursors_;
  document::Codec codec_;


  // ---- CAS STORAGE SUPPORT ----
  // Path of the document with the given "_id"
  std::filesystem::path resolve_id_path(const document::Value& id) const;
  std::filesystem::path get_path_for_hash(const std::string& hash) const;


  // ---- FILE OPERATIONS ----
  void write_document(const std::filesystem::path& path, const document::Document& doc) const;
  document::Document read_document(const std::filesystem::path& path) const;
  // Visits every stored document with its path
  template <typename Visitor>
  void for_each_document(Visitor&& visit) const;
  // Visits the stored documents filter matches
  template <typename Visitor>
  void for_each_match(const document::Filter& filter, Visitor&& visit) const;
  void remove_file(const std::filesystem::path& path) const;
  void check_directory_exists(const std::filesystem::path& path) const;
  void rebuild_indexes();
};

// Database keeping each collection in a subdirectory of one root
class DiskDatabase : public Database {
public:
  explicit DiskDatabase(const std::filesystem::path& root);

  std::shared_ptr<Collection> collection(const std::string& name) override;
  std::vector<std::string> list_collections() const override;
  void drop_collection(const std::string& name) override;

  const std::filesystem::path& root() const { return root_; }

private:
  std::filesystem::path root_;
  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<DiskCollection>> collections_;
};

} // namespace storage
} // namespace gridstore

#endif // GRIDSTORE_STORAGE_DISK_COLLECTION_HPP
