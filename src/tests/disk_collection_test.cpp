#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <vector>
#include "storage/disk_collection.hpp"
#include "test_utils.hpp"

using namespace gridstore;
using namespace gridstore::document;
using namespace gridstore::storage;

class DiskCollectionTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  std::unique_ptr<DiskCollection> collection;

  void SetUp() override {
    test::init_logging();
    test_dir = std::filesystem::temp_directory_path() /
      ("disk_collection_test_" + std::to_string(std::chrono::system_clock::now().time_since_epoch().count()));
    collection = std::make_unique<DiskCollection>("fs.files", test_dir);
    ASSERT_TRUE(std::filesystem::exists(test_dir));
  }

  void TearDown() override {
    if (collection) {
      collection->clear();
      collection.reset();
    }
    if (std::filesystem::exists(test_dir)) {
      std::filesystem::remove_all(test_dir);
    }
  }

  void reopen() {
    collection.reset();
    collection = std::make_unique<DiskCollection>("fs.files", test_dir);
  }

  std::size_t files_on_disk() const {
    std::size_t count = 0;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(test_dir)) {
      if (entry.is_regular_file()) {
        ++count;
      }
    }
    return count;
  }

  std::vector<Document> drain(DocumentCursor& cursor) {
    std::vector<Document> docs;
    Document doc;
    while (cursor.next(doc)) {
      docs.push_back(doc);
    }
    return docs;
  }
};

TEST_F(DiskCollectionTest, BasicOperations) {
  Value id = collection->insert_one(Document{{"filename", "a.txt"}, {"length", 5}});
  EXPECT_EQ(files_on_disk(), 1u);

  auto found = collection->find_one(query(where("_id").is(id)));
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->get("filename")->as_string(), "a.txt");
  EXPECT_EQ(found->get("length")->as_int64(), 5);

  EXPECT_EQ(collection->delete_many(where("_id").is(id)), 1u);
  EXPECT_FALSE(collection->find_one(query(where("_id").is(id))).has_value());
  EXPECT_EQ(files_on_disk(), 0u);
}

TEST_F(DiskCollectionTest, DocumentsLiveAtHashedPaths) {
  collection->insert_one(Document{{"_id", "known"}});

  for (const auto& entry : std::filesystem::recursive_directory_iterator(test_dir)) {
    if (!entry.is_regular_file()) {
      continue;
    }
    auto relative = std::filesystem::relative(entry.path(), test_dir);
    std::vector<std::string> parts;
    for (const auto& part : relative) {
      parts.push_back(part.string());
    }
    // ab/cd/ef/<remaining 58 hex characters of the SHA-256>
    ASSERT_EQ(parts.size(), 4u);
    EXPECT_EQ(parts[0].size(), 2u);
    EXPECT_EQ(parts[1].size(), 2u);
    EXPECT_EQ(parts[2].size(), 2u);
    EXPECT_EQ(parts[3].size(), 58u);
  }
}

TEST_F(DiskCollectionTest, DeleteCleansEmptyDirectories) {
  Value id = collection->insert_one(Document{{"a", 1}});
  collection->delete_many(where("_id").is(id));

  EXPECT_TRUE(std::filesystem::exists(test_dir));
  EXPECT_TRUE(std::filesystem::is_empty(test_dir));
}

TEST_F(DiskCollectionTest, RejectsDuplicateIds) {
  collection->insert_one(Document{{"_id", 1}, {"v", "first"}});
  EXPECT_THROW(collection->insert_one(Document{{"_id", 1}, {"v", "second"}}), DuplicateKeyError);

  auto found = collection->find_one(query(where("_id").is(1)));
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->get("v")->as_string(), "first");
}

TEST_F(DiskCollectionTest, SurvivesReopen) {
  ObjectId file = ObjectId::generate();
  for (int n = 0; n < 3; ++n) {
    collection->insert_one(Document{{"files_id", file}, {"n", n}});
  }

  reopen();
  EXPECT_EQ(collection->count(where("files_id").is(file)), 3u);

  Query ordered = query(where("files_id").is(file));
  ordered.sort_by("n");
  auto cursor = collection->find(ordered);
  auto docs = drain(*cursor);
  ASSERT_EQ(docs.size(), 3u);
  for (int n = 0; n < 3; ++n) {
    EXPECT_EQ(docs[n].get("n")->as_int64(), n);
  }
}

TEST_F(DiskCollectionTest, IndexesRebuiltFromFiles) {
  ObjectId file = ObjectId::generate();
  collection->insert_one(Document{{"files_id", file}, {"n", 0}});

  reopen();
  collection->create_index(IndexSpec{"files_id_1_n_1", {"files_id", "n"}, true});
  EXPECT_THROW(collection->insert_one(Document{{"files_id", file}, {"n", 0}}), DuplicateKeyError);
  EXPECT_NO_THROW(collection->insert_one(Document{{"files_id", file}, {"n", 1}}));
}

TEST_F(DiskCollectionTest, CursorSkipsDocumentsDeletedAfterQuery) {
  collection->insert_one(Document{{"n", 0}});
  collection->insert_one(Document{{"n", 1}});

  Query ordered;
  ordered.sort_by("n");
  auto cursor = collection->find(ordered);
  EXPECT_EQ(collection->open_cursors(), 1u);

  collection->delete_many(where("n").is(0));
  auto docs = drain(*cursor);
  ASSERT_EQ(docs.size(), 1u);
  EXPECT_EQ(docs[0].get("n")->as_int64(), 1);
  EXPECT_EQ(collection->open_cursors(), 0u);
}

TEST_F(DiskCollectionTest, CancelledCursorReleasesLease) {
  for (int n = 0; n < 5; ++n) {
    collection->insert_one(Document{{"n", n}});
  }
  auto cursor = collection->find(Query());
  Document doc;
  ASSERT_TRUE(cursor->next(doc));
  cursor->close();
  EXPECT_EQ(collection->open_cursors(), 0u);
}

TEST_F(DiskCollectionTest, CorruptFileSurfacesAsStorageError) {
  collection->insert_one(Document{{"a", 1}});
  for (const auto& entry : std::filesystem::recursive_directory_iterator(test_dir)) {
    if (entry.is_regular_file()) {
      std::ofstream file(entry.path(), std::ios::binary | std::ios::trunc);
      file << "garbage";
    }
  }
  EXPECT_THROW(collection->count(Filter()), StorageError);
}

TEST_F(DiskCollectionTest, IdLookupsReadOnlyTheirOwnFile) {
  ObjectId kept = ObjectId::generate();
  collection->insert_one(Document{{"_id", kept}, {"v", "kept"}});
  collection->insert_one(Document{{"v", "other"}});

  // Corrupt every document except the one looked up
  for (const auto& entry : std::filesystem::recursive_directory_iterator(test_dir)) {
    if (!entry.is_regular_file()) {
      continue;
    }
    Document doc;
    {
      std::ifstream input(entry.path(), std::ios::binary);
      doc = Codec().deserialize(input);
    }
    if (doc.get("_id")->type() != ValueType::ObjectId || doc.get("_id")->as_object_id() != kept) {
      std::ofstream file(entry.path(), std::ios::binary | std::ios::trunc);
      file << "garbage";
    }
  }

  auto found = collection->find_one(query(where("_id").is(kept)));
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->get("v")->as_string(), "kept");
  EXPECT_EQ(collection->count(where("_id").is(kept)), 1u);
  EXPECT_EQ(collection->count(where("_id").is(ObjectId::generate())), 0u);
  EXPECT_EQ(collection->count(where("_id").is("absent")), 0u);

  // Scans still read everything
  EXPECT_THROW(collection->count(Filter()), StorageError);

  EXPECT_EQ(collection->delete_many(where("_id").is(kept)), 1u);
  EXPECT_EQ(collection->count(where("_id").is(kept)), 0u);
}

TEST_F(DiskCollectionTest, NumericIdsMatchAcrossTypes) {
  collection->insert_one(Document{{"_id", 1}, {"v", "int"}});
  auto found = collection->find_one(query(where("_id").is(1.0)));
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->get("v")->as_string(), "int");
}

TEST_F(DiskCollectionTest, ClearRemovesEverything) {
  collection->insert_one(Document{{"a", 1}});
  collection->insert_one(Document{{"a", 2}});
  collection->clear();
  EXPECT_EQ(collection->count(Filter()), 0u);
  EXPECT_EQ(files_on_disk(), 0u);
}

TEST(DiskDatabaseTest, CollectionsAreSubdirectories) {
  auto root = std::filesystem::temp_directory_path() /
    ("disk_database_test_" + std::to_string(std::chrono::system_clock::now().time_since_epoch().count()));
  {
    DiskDatabase database(root);
    database.collection("fs.files")->insert_one(Document{{"a", 1}});
    database.collection("fs.chunks");
    EXPECT_EQ(database.list_collections(), (std::vector<std::string>{"fs.chunks", "fs.files"}));

    database.drop_collection("fs.chunks");
    EXPECT_EQ(database.list_collections(), (std::vector<std::string>{"fs.files"}));
  }
  {
    DiskDatabase reopened(root);
    EXPECT_EQ(reopened.collection("fs.files")->count(Filter()), 1u);
  }
  std::filesystem::remove_all(root);
}
