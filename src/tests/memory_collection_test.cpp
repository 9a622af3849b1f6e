#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include <vector>
#include "storage/memory_collection.hpp"
#include "test_utils.hpp"

using namespace gridstore;
using namespace gridstore::document;
using namespace gridstore::storage;

class MemoryCollectionTest : public ::testing::Test {
protected:
  MemoryCollection collection{"fs.chunks"};

  void SetUp() override {
    test::init_logging();
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

TEST_F(MemoryCollectionTest, InsertAssignsObjectIdFirst) {
  Value id = collection.insert_one(Document{{"name", "a"}});
  ASSERT_EQ(id.type(), ValueType::ObjectId);

  auto found = collection.find_one(query(where("_id").is(id)));
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->begin()->name, "_id");
  EXPECT_EQ(found->get("name")->as_string(), "a");
}

TEST_F(MemoryCollectionTest, KeepsCallerSuppliedId) {
  Value id = collection.insert_one(Document{{"_id", "custom"}, {"v", 1}});
  EXPECT_EQ(id.as_string(), "custom");
  EXPECT_THROW(collection.insert_one(Document{{"_id", "custom"}}), DuplicateKeyError);
  EXPECT_EQ(collection.count(Filter()), 1u);
}

TEST_F(MemoryCollectionTest, UniqueCompoundIndex) {
  ObjectId file = ObjectId::generate();
  collection.create_index(IndexSpec{"files_id_1_n_1", {"files_id", "n"}, true});

  collection.insert_one(Document{{"files_id", file}, {"n", 0}});
  collection.insert_one(Document{{"files_id", file}, {"n", 1}});
  collection.insert_one(Document{{"files_id", ObjectId::generate()}, {"n", 0}});

  try {
    collection.insert_one(Document{{"files_id", file}, {"n", 1}});
    FAIL() << "Duplicate (files_id, n) should be rejected";
  } catch (const DuplicateKeyError& e) {
    EXPECT_EQ(e.index_name(), "files_id_1_n_1");
  }
  EXPECT_EQ(collection.count(Filter()), 3u);
}

TEST_F(MemoryCollectionTest, DeletedKeysCanBeReused) {
  collection.create_index(IndexSpec{"name_1", {"name"}, true});
  collection.insert_one(Document{{"name", "a"}});
  EXPECT_EQ(collection.delete_many(where("name").is("a")), 1u);
  EXPECT_NO_THROW(collection.insert_one(Document{{"name", "a"}}));
}

TEST_F(MemoryCollectionTest, UniqueIndexOverViolatingDataIsRejected) {
  collection.insert_one(Document{{"name", "a"}});
  collection.insert_one(Document{{"name", "a"}});

  EXPECT_THROW(collection.create_index(IndexSpec{"name_1", {"name"}, true}), DuplicateKeyError);
  // The failed index is not registered
  EXPECT_EQ(collection.list_indexes().size(), 1u);
}

TEST_F(MemoryCollectionTest, CreateIndexIsIdempotent) {
  IndexSpec spec{"filename_1_uploadDate_1", {"filename", "uploadDate"}, false};
  collection.create_index(spec);
  collection.create_index(spec);

  auto indexes = collection.list_indexes();
  ASSERT_EQ(indexes.size(), 2u);
  EXPECT_EQ(indexes[0].name, "_id_");
  EXPECT_EQ(indexes[1].name, "filename_1_uploadDate_1");
}

TEST_F(MemoryCollectionTest, FindSortsSkipsAndLimits) {
  for (int n : {3, 0, 2, 1}) {
    collection.insert_one(Document{{"n", n}, {"even", n % 2 == 0}});
  }

  Query ordered = query(Filter());
  ordered.sort_by("n");
  auto all = collection.find(ordered);
  auto docs = drain(*all);
  ASSERT_EQ(docs.size(), 4u);
  for (int i = 0; i < 4; ++i) {
    EXPECT_EQ(docs[i].get("n")->as_int64(), i);
  }

  Query page = query(where("even").is(true));
  page.sort_by("n", SortOrder::Descending).limit(1);
  auto cursor = collection.find(page);
  docs = drain(*cursor);
  ASSERT_EQ(docs.size(), 1u);
  EXPECT_EQ(docs[0].get("n")->as_int64(), 2);
}

TEST_F(MemoryCollectionTest, CursorsAreTrackedUntilClosed) {
  collection.insert_one(Document{{"n", 0}});
  collection.insert_one(Document{{"n", 1}});
  EXPECT_EQ(collection.open_cursors(), 0u);

  auto first = collection.find(Query());
  auto second = collection.find(Query());
  EXPECT_EQ(collection.open_cursors(), 2u);

  Document doc;
  ASSERT_TRUE(first->next(doc));
  first->close();
  EXPECT_FALSE(first->is_open());
  EXPECT_FALSE(first->next(doc));
  EXPECT_EQ(collection.open_cursors(), 1u);

  second.reset();
  EXPECT_EQ(collection.open_cursors(), 0u);
}

TEST_F(MemoryCollectionTest, ExhaustedCursorReleasesItself) {
  collection.insert_one(Document{{"n", 0}});
  auto cursor = collection.find(Query());
  drain(*cursor);
  EXPECT_EQ(collection.open_cursors(), 0u);
}

TEST_F(MemoryCollectionTest, CursorSeesSnapshotOfQueryTime) {
  collection.insert_one(Document{{"n", 0}});
  auto cursor = collection.find(Query());
  collection.insert_one(Document{{"n", 1}});
  collection.delete_many(where("n").is(0));

  auto docs = drain(*cursor);
  ASSERT_EQ(docs.size(), 1u);
  EXPECT_EQ(docs[0].get("n")->as_int64(), 0);
}

TEST_F(MemoryCollectionTest, ConcurrentInserts) {
  const int threads = 4;
  const int per_thread = 100;
  collection.create_index(IndexSpec{"owner_1_n_1", {"owner", "n"}, true});

  std::vector<std::thread> workers;
  for (int t = 0; t < threads; ++t) {
    workers.emplace_back([this, t, per_thread]() {
      for (int n = 0; n < per_thread; ++n) {
        collection.insert_one(Document{{"owner", t}, {"n", n}});
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }

  EXPECT_EQ(collection.count(Filter()), static_cast<std::size_t>(threads * per_thread));
  EXPECT_EQ(collection.count(where("owner").is(2)), static_cast<std::size_t>(per_thread));
}

TEST(MemoryDatabaseTest, SameNameYieldsSameCollection) {
  MemoryDatabase database;
  auto files = database.collection("fs.files");
  EXPECT_EQ(files, database.collection("fs.files"));
  database.collection("fs.chunks");

  EXPECT_EQ(database.list_collections(), (std::vector<std::string>{"fs.chunks", "fs.files"}));

  files->insert_one(Document{{"a", 1}});
  database.drop_collection("fs.files");
  EXPECT_EQ(files->count(Filter()), 0u);
  EXPECT_EQ(database.collection("fs.files")->count(Filter()), 0u);
}
