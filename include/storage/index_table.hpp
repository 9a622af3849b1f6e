#ifndef GRIDSTORE_STORAGE_INDEX_TABLE_HPP
#define GRIDSTORE_STORAGE_INDEX_TABLE_HPP

#include <set>
#include <string>
#include <vector>
#include "document/codec.hpp"
#include "document/document.hpp"
#include "storage/collection.hpp"

namespace gridstore {
namespace storage {

// Index bookkeeping shared by the collection implementations. Keeps the key
// sets of unique indexes; non-unique indexes are recorded only. Not
// synchronized: callers hold their collection lock.
class IndexTable {
public:
  static constexpr const char* ID_INDEX = "_id_";

  // Starts with the unique "_id_" index
  IndexTable();

  // Registers spec and indexes the documents for_each_doc visits.
  // Returns false if an identical index exists. Throws StorageError when a
  // different index already uses the name, DuplicateKeyError (leaving the
  // table unchanged) when existing documents violate a unique spec.
  template <typename ForEach>
  bool add_index(const IndexSpec& spec, ForEach&& for_each_doc) {
    if (!register_spec(spec)) {
      return false;
    }
    Entry& entry = entries_.back();
    try {
      for_each_doc([this, &entry](const document::Document& doc) { insert_into(entry, doc); });
    } catch (...) {
      entries_.pop_back();
      throw;
    }
    return true;
  }

  // Throws DuplicateKeyError if doc collides with a unique index
  void check(const document::Document& doc) const;
  // Records doc's keys; call after check() succeeded
  void insert(const document::Document& doc);
  void erase(const document::Document& doc);
  // Forgets every key, keeps the specs
  void clear_keys();

  std::vector<IndexSpec> specs() const;

private:
  struct Entry {
    IndexSpec spec;
    std::set<std::string> keys;
  };

  std::vector<Entry> entries_;
  document::Codec codec_;

  bool register_spec(const IndexSpec& spec);
  void insert_into(Entry& entry, const document::Document& doc);
  std::string key_for(const IndexSpec& spec, const document::Document& doc) const;
};

} // namespace storage
} // namespace gridstore

#endif // GRIDSTORE_STORAGE_INDEX_TABLE_HPP
