#include "storage/index_table.hpp"
#include <sstream>
#include <boost/log/trivial.hpp>

namespace gridstore {
namespace storage {

IndexTable::IndexTable() {
  entries_.push_back(Entry{IndexSpec{ID_INDEX, {"_id"}, true}, {}});
}

bool IndexTable::register_spec(const IndexSpec& spec) {
  if (spec.fields.empty()) {
    throw StorageError("Index " + spec.name + " has no fields");
  }

  for (const auto& entry : entries_) {
    bool same_shape = entry.spec.fields == spec.fields && entry.spec.unique == spec.unique;
    if (entry.spec.name == spec.name) {
      if (same_shape) {
        return false;
      }
      throw StorageError("Index " + spec.name + " already exists with different options");
    }
    if (same_shape) {
      return false;
    }
  }

  entries_.push_back(Entry{spec, {}});
  return true;
}

std::string IndexTable::key_for(const IndexSpec& spec, const document::Document& doc) const {
  document::Document key;
  for (const auto& field : spec.fields) {
    const document::Value* value = doc.find_path(field);
    key.set(field, value ? *value : document::Value());
  }
  return codec_.encode(key);
}

void IndexTable::check(const document::Document& doc) const {
  for (const auto& entry : entries_) {
    if (!entry.spec.unique) {
      continue;
    }
    if (entry.keys.count(key_for(entry.spec, doc)) > 0) {
      std::stringstream ss;
      for (const auto& field : entry.spec.fields) {
        const document::Value* value = doc.find_path(field);
        ss << field << "=" << (value ? *value : document::Value()) << " ";
      }
      BOOST_LOG_TRIVIAL(debug) << "Index table: Duplicate key on " << entry.spec.name << ": " << ss.str();
      throw DuplicateKeyError(entry.spec.name, ss.str());
    }
  }
}

void IndexTable::insert_into(Entry& entry, const document::Document& doc) {
  if (!entry.spec.unique) {
    return;
  }
  auto inserted = entry.keys.insert(key_for(entry.spec, doc));
  if (!inserted.second) {
    throw DuplicateKeyError(entry.spec.name, "existing documents violate the unique constraint");
  }
}

void IndexTable::insert(const document::Document& doc) {
  for (auto& entry : entries_) {
    if (entry.spec.unique) {
      entry.keys.insert(key_for(entry.spec, doc));
    }
  }
}

void IndexTable::erase(const document::Document& doc) {
  for (auto& entry : entries_) {
    if (entry.spec.unique) {
      entry.keys.erase(key_for(entry.spec, doc));
    }
  }
}

void IndexTable::clear_keys() {
  for (auto& entry : entries_) {
    entry.keys.clear();
  }
}

std::vector<IndexSpec> IndexTable::specs() const {
  std::vector<IndexSpec> result;
  result.reserve(entries_.size());
  for (const auto& entry : entries_) {
    result.push_back(entry.spec);
  }
  return result;
}

} // namespace storage
} // namespace gridstore
