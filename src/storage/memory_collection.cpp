#include "storage/memory_collection.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>

namespace gridstore {
namespace storage {

//==============================================
// MEMORY COLLECTION
//==============================================

MemoryCollection::MemoryCollection(std::string name) : name_(std::move(name)) {
  BOOST_LOG_TRIVIAL(debug) << "Memory collection: Created collection " << name_;
}

document::Value MemoryCollection::insert_one(const document::Document& doc) {
  document::Document stored = ensure_id(doc);

  std::lock_guard<std::mutex> lock(mutex_);
  indexes_.check(stored);
  indexes_.insert(stored);
  document::Value id = *stored.get("_id");
  documents_.push_back(std::move(stored));

  BOOST_LOG_TRIVIAL(trace) << "Memory collection: Inserted " << id << " into " << name_;
  return id;
}

std::unique_ptr<DocumentCursor> MemoryCollection::find(const document::Query& query) {
  std::vector<document::Document> matches;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& doc : documents_) {
      if (query.filter().matches(doc)) {
        matches.push_back(doc);
      }
    }
  }
  query.apply(matches);

  BOOST_LOG_TRIVIAL(trace) << "Memory collection: Query " << query.filter() << " on " << name_
                           << " matched " << matches.size() << " documents";
  return std::make_unique<MaterializedCursor>(std::move(matches), cursors_.acquire());
}

std::size_t MemoryCollection::delete_many(const document::Filter& filter) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto first_removed = std::stable_partition(documents_.begin(), documents_.end(),
      [&filter](const document::Document& doc) { return !filter.matches(doc); });

  for (auto it = first_removed; it != documents_.end(); ++it) {
    indexes_.erase(*it);
  }
  auto removed = static_cast<std::size_t>(std::distance(first_removed, documents_.end()));
  documents_.erase(first_removed, documents_.end());

  BOOST_LOG_TRIVIAL(trace) << "Memory collection: Removed " << removed << " documents from " << name_;
  return removed;
}

std::size_t MemoryCollection::count(const document::Filter& filter) {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<std::size_t>(std::count_if(documents_.begin(), documents_.end(),
      [&filter](const document::Document& doc) { return filter.matches(doc); }));
}

void MemoryCollection::create_index(const IndexSpec& spec) {
  std::lock_guard<std::mutex> lock(mutex_);
  bool created = indexes_.add_index(spec, [this](const auto& visit) {
    for (const auto& doc : documents_) {
      visit(doc);
    }
  });
  if (created) {
    BOOST_LOG_TRIVIAL(debug) << "Memory collection: Created index " << spec.name << " on " << name_;
  }
}

std::vector<IndexSpec> MemoryCollection::list_indexes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return indexes_.specs();
}

void MemoryCollection::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  documents_.clear();
  indexes_.clear_keys();
}


//==============================================
// MEMORY DATABASE
//==============================================

std::shared_ptr<Collection> MemoryDatabase::collection(const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = collections_.find(name);
  if (it == collections_.end()) {
    it = collections_.emplace(name, std::make_shared<MemoryCollection>(name)).first;
  }
  return it->second;
}

std::vector<std::string> MemoryDatabase::list_collections() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> names;
  for (const auto& entry : collections_) {
    names.push_back(entry.first);
  }
  return names;
}

void MemoryDatabase::drop_collection(const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = collections_.find(name);
  if (it != collections_.end()) {
    it->second->clear();
    collections_.erase(it);
  }
}

} // namespace storage
} // namespace gridstore
