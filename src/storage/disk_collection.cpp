#include "storage/disk_collection.hpp"
#include <algorithm>
#include <fstream>
#include <boost/log/trivial.hpp>
#include "utils/digest.hpp"

namespace gridstore {
namespace storage {

namespace {

const char* const TEMP_EXTENSION = ".tmp";

// Loads documents lazily from the paths a query matched
class DiskCursor : public DocumentCursor {
public:
  DiskCursor(std::vector<std::filesystem::path> paths, CursorLease lease)
    : paths_(std::move(paths))
    , lease_(std::move(lease)) {}

  ~DiskCursor() override { close(); }

  bool next(document::Document& doc) override {
    while (is_open() && position_ < paths_.size()) {
      const auto& path = paths_[position_++];
      std::ifstream file(path, std::ios::binary);
      if (!file) {
        // Removed after the query ran
        BOOST_LOG_TRIVIAL(debug) << "Disk collection: Skipping vanished document: " << path.string();
        continue;
      }
      try {
        doc = codec_.deserialize(file);
        return true;
      } catch (const document::CodecError& e) {
        BOOST_LOG_TRIVIAL(error) << "Disk collection: Corrupt document " << path.string() << ": " << e.what();
        throw StorageError("Disk collection: Corrupt document " + path.string() + ": " + e.what());
      }
    }
    close();
    return false;
  }

  void close() override {
    paths_.clear();
    lease_.release();
  }

  bool is_open() const override { return lease_.held(); }

private:
  std::vector<std::filesystem::path> paths_;
  std::size_t position_{0};
  document::Codec codec_;
  CursorLease lease_;
};

struct Match {
  std::vector<document::Value> sort_values;
  std::filesystem::path path;
};

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

DiskCollection::DiskCollection(std::string name, const std::filesystem::path& base_path)
  : name_(std::move(name))
  , base_path_(base_path) {
  BOOST_LOG_TRIVIAL(info) << "Disk collection: Opening " << name_ << " at: " << base_path_.string();
  try {
    check_directory_exists(base_path_);
  } catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Disk collection: Failed to create directory: " << e.what();
    throw StorageError("Disk collection: Failed to create directory " + base_path_.string() + ": " + e.what());
  }
  rebuild_indexes();
  BOOST_LOG_TRIVIAL(debug) << "Disk collection: Directory created/verified at: " << base_path_.string();
}


//==============================================
// COLLECTION OPERATIONS
//==============================================

document::Value DiskCollection::insert_one(const document::Document& doc) {
  document::Document stored = ensure_id(doc);
  const document::Value id = *stored.get("_id");

  std::lock_guard<std::mutex> lock(mutex_);
  indexes_.check(stored);

  std::filesystem::path file_path = resolve_id_path(id);
  if (std::filesystem::exists(file_path)) {
    throw DuplicateKeyError(IndexTable::ID_INDEX, "document file already exists");
  }

  write_document(file_path, stored);
  indexes_.insert(stored);

  BOOST_LOG_TRIVIAL(trace) << "Disk collection: Inserted " << id << " into " << name_;
  return id;
}

std::unique_ptr<DocumentCursor> DiskCollection::find(const document::Query& query) {
  std::vector<Match> matches;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for_each_match(query.filter(), [&](const std::filesystem::path& path, const document::Document& doc) {
      matches.push_back(Match{query.sort_values(doc), path});
    });
  }

  if (query.has_sort()) {
    std::stable_sort(matches.begin(), matches.end(), [&query](const Match& lhs, const Match& rhs) {
      return query.less_values(lhs.sort_values, rhs.sort_values);
    });
  }

  std::size_t first = std::min(query.skip_count(), matches.size());
  std::size_t last = matches.size();
  if (query.limit_count() > 0) {
    last = std::min(last, first + query.limit_count());
  }

  std::vector<std::filesystem::path> paths;
  paths.reserve(last - first);
  for (std::size_t i = first; i < last; ++i) {
    paths.push_back(std::move(matches[i].path));
  }

  BOOST_LOG_TRIVIAL(trace) << "Disk collection: Query " << query.filter() << " on " << name_
                           << " matched " << paths.size() << " documents";
  return std::make_unique<DiskCursor>(std::move(paths), cursors_.acquire());
}

std::size_t DiskCollection::delete_many(const document::Filter& filter) {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<std::pair<std::filesystem::path, document::Document>> doomed;
  for_each_match(filter, [&](const std::filesystem::path& path, const document::Document& doc) {
    doomed.emplace_back(path, doc);
  });

  for (const auto& entry : doomed) {
    remove_file(entry.first);
    indexes_.erase(entry.second);
  }

  BOOST_LOG_TRIVIAL(trace) << "Disk collection: Removed " << doomed.size() << " documents from " << name_;
  return doomed.size();
}

std::size_t DiskCollection::count(const document::Filter& filter) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t matched = 0;
  for_each_match(filter, [&](const std::filesystem::path&, const document::Document&) { ++matched; });
  return matched;
}

void DiskCollection::create_index(const IndexSpec& spec) {
  std::lock_guard<std::mutex> lock(mutex_);
  bool created = indexes_.add_index(spec, [this](const auto& visit) {
    for_each_document([&visit](const std::filesystem::path&, const document::Document& doc) { visit(doc); });
  });
  if (created) {
    BOOST_LOG_TRIVIAL(debug) << "Disk collection: Created index " << spec.name << " on " << name_;
  }
}

std::vector<IndexSpec> DiskCollection::list_indexes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return indexes_.specs();
}


//==============================================
// MAINTENANCE
//==============================================

void DiskCollection::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  BOOST_LOG_TRIVIAL(info) << "Disk collection: Clearing " << name_ << " at: " << base_path_.string();
  try {
    std::filesystem::remove_all(base_path_);
    check_directory_exists(base_path_);
  } catch (const std::filesystem::filesystem_error& e) {
    throw StorageError("Disk collection: Failed to clear " + name_ + ": " + e.what());
  }
  indexes_.clear_keys();
}


//==============================================
// CAS STORAGE SUPPORT
//==============================================

std::filesystem::path DiskCollection::resolve_id_path(const document::Value& id) const {
  std::string hash = utils::Digest::hex(utils::Digest::Algorithm::Sha256,
                                        codec_.encode(document::Document{{"_id", id}}));
  return get_path_for_hash(hash);
}

std::filesystem::path DiskCollection::get_path_for_hash(const std::string& hash) const {
  std::filesystem::path path = base_path_;

  for (size_t i = 0; i < 6; i += 2) {
    path /= hash.substr(i, 2);
  }

  path /= hash.substr(6);
  return path;
}


//==============================================
// FILE OPERATIONS
//==============================================

void DiskCollection::write_document(const std::filesystem::path& path, const document::Document& doc) const {
  std::filesystem::path temp_path = path;
  temp_path += TEMP_EXTENSION;

  try {
    check_directory_exists(path.parent_path());

    // Write beside the target and rename so readers never see a partial file
    {
      std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
      if (!file) {
        throw StorageError("Disk collection: Failed to create file: " + temp_path.string());
      }
      codec_.serialize(doc, file);
      file.flush();
      if (!file) {
        throw StorageError("Disk collection: Failed to write file: " + temp_path.string());
      }
    }
    std::filesystem::rename(temp_path, path);
  } catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Disk collection: Failed to persist document: " << e.what();
    std::error_code ignored;
    std::filesystem::remove(temp_path, ignored);
    throw StorageError(std::string("Disk collection: Failed to persist document: ") + e.what());
  } catch (const document::CodecError& e) {
    std::error_code ignored;
    std::filesystem::remove(temp_path, ignored);
    throw StorageError(std::string("Disk collection: Failed to encode document: ") + e.what());
  }
}

document::Document DiskCollection::read_document(const std::filesystem::path& path) const {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw StorageError("Disk collection: Failed to open file: " + path.string());
  }
  try {
    return codec_.deserialize(file);
  } catch (const document::CodecError& e) {
    BOOST_LOG_TRIVIAL(error) << "Disk collection: Corrupt document " << path.string() << ": " << e.what();
    throw StorageError("Disk collection: Corrupt document " + path.string() + ": " + e.what());
  }
}

template <typename Visitor>
void DiskCollection::for_each_document(Visitor&& visit) const {
  try {
    for (const auto& entry : std::filesystem::recursive_directory_iterator(base_path_)) {
      if (!entry.is_regular_file() || entry.path().extension() == TEMP_EXTENSION) {
        continue;
      }
      visit(entry.path(), read_document(entry.path()));
    }
  } catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Disk collection: Failed to scan " << base_path_.string() << ": " << e.what();
    throw StorageError("Disk collection: Failed to scan " + name_ + ": " + e.what());
  }
}

template <typename Visitor>
void DiskCollection::for_each_match(const document::Filter& filter, Visitor&& visit) const {
  // An exact "_id" lookup reads the one file it can live in. Numbers are
  // scanned since 1 and 1.0 match each other but hash to different paths.
  const document::Value* id = filter.equality_on("_id");
  if (id != nullptr && (id->type() == document::ValueType::ObjectId || id->type() == document::ValueType::String)) {
    std::filesystem::path path = resolve_id_path(*id);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
      return;
    }
    document::Document doc = read_document(path);
    if (filter.matches(doc)) {
      visit(path, doc);
    }
    return;
  }

  for_each_document([&](const std::filesystem::path& path, const document::Document& doc) {
    if (filter.matches(doc)) {
      visit(path, doc);
    }
  });
}

void DiskCollection::remove_file(const std::filesystem::path& file_path) const {
  try {
    if (!std::filesystem::remove(file_path)) {
      BOOST_LOG_TRIVIAL(error) << "Disk collection: File not found: " << file_path.string();
      throw StorageError("Disk collection: File not found: " + file_path.string());
    }

    // Clean up empty parent directories up to base_path_
    auto current = file_path.parent_path();
    while (current != base_path_ && std::filesystem::is_empty(current)) {
      std::filesystem::remove(current);
      current = current.parent_path();
    }
  } catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Disk collection: Failed to delete file: " << e.what();
    throw StorageError(std::string("Disk collection: Failed to delete file: ") + e.what());
  }
}

void DiskCollection::check_directory_exists(const std::filesystem::path& path) const {
  if (!std::filesystem::exists(path)) {
    std::filesystem::create_directories(path);
  }
}

void DiskCollection::rebuild_indexes() {
  std::lock_guard<std::mutex> lock(mutex_);
  indexes_.clear_keys();
  std::size_t loaded = 0;
  for_each_document([&](const std::filesystem::path&, const document::Document& doc) {
    indexes_.check(doc);
    indexes_.insert(doc);
    ++loaded;
  });
  BOOST_LOG_TRIVIAL(debug) << "Disk collection: Indexed " << loaded << " existing documents in " << name_;
}


//==============================================
// DISK DATABASE
//==============================================

DiskDatabase::DiskDatabase(const std::filesystem::path& root) : root_(root) {
  BOOST_LOG_TRIVIAL(info) << "Disk database: Using root: " << root_.string();
  try {
    std::filesystem::create_directories(root_);
  } catch (const std::filesystem::filesystem_error& e) {
    throw StorageError("Disk database: Failed to create root " + root_.string() + ": " + e.what());
  }
}

std::shared_ptr<Collection> DiskDatabase::collection(const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = collections_.find(name);
  if (it == collections_.end()) {
    it = collections_.emplace(name, std::make_shared<DiskCollection>(name, root_ / name)).first;
  }
  return it->second;
}

std::vector<std::string> DiskDatabase::list_collections() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> names;
  try {
    for (const auto& entry : std::filesystem::directory_iterator(root_)) {
      if (entry.is_directory()) {
        names.push_back(entry.path().filename().string());
      }
    }
  } catch (const std::filesystem::filesystem_error& e) {
    throw StorageError(std::string("Disk database: Failed to list collections: ") + e.what());
  }
  std::sort(names.begin(), names.end());
  return names;
}

void DiskDatabase::drop_collection(const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = collections_.find(name);
  if (it != collections_.end()) {
    it->second->clear();
    collections_.erase(it);
  }
  try {
    std::filesystem::remove_all(root_ / name);
  } catch (const std::filesystem::filesystem_error& e) {
    throw StorageError("Disk database: Failed to drop " + name + ": " + e.what());
  }
}

} // namespace storage
} // namespace gridstore
