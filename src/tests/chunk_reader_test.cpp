#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <memory>
#include "gridfs/chunk_reader.hpp"
#include "gridfs/chunk_writer.hpp"
#include "gridfs/grid_error.hpp"
#include "test_utils.hpp"

using namespace gridstore;
using namespace gridstore::document;
using namespace gridstore::gridfs;
using ::testing::_;
using ::testing::NiceMock;

class ChunkReaderTest : public ::testing::Test {
protected:
  std::shared_ptr<NiceMock<test::MockCollection>> chunks =
    std::make_shared<NiceMock<test::MockCollection>>("fs.chunks");
  ChunkReader reader{chunks};

  void SetUp() override {
    test::init_logging();
  }

  ObjectId write(const std::string& content, std::size_t chunk_size) {
    ChunkWriter writer(chunks, chunk_size);
    return writer.write(from_strings({content})).file_id;
  }

  void insert_chunk(const ObjectId& file_id, int64_t n, const std::string& data) {
    ChunkRecord chunk{ObjectId::generate(), file_id, n, Binary(data.begin(), data.end())};
    chunks->real().insert_one(chunk.to_document());
  }

  void remove_chunk(const ObjectId& file_id, int64_t n) {
    Filter filter = where(fields::FILES_ID).is(file_id);
    filter.and_(where(fields::N).is(n));
    chunks->real().delete_many(filter);
  }
};

TEST_F(ChunkReaderTest, YieldsChunksInOrder) {
  ObjectId file_id = ObjectId::generate();
  // Inserted out of order
  insert_chunk(file_id, 2, "ij");
  insert_chunk(file_id, 0, "abcd");
  insert_chunk(file_id, 1, "efgh");

  DownloadStream stream = reader.read(file_id);
  Buffer chunk;
  ASSERT_TRUE(stream.next(chunk));
  EXPECT_EQ(test::to_string(chunk), "abcd");
  ASSERT_TRUE(stream.next(chunk));
  EXPECT_EQ(test::to_string(chunk), "efgh");
  ASSERT_TRUE(stream.next(chunk));
  EXPECT_EQ(test::to_string(chunk), "ij");
  EXPECT_FALSE(stream.next(chunk));
  EXPECT_FALSE(stream.is_open());
  EXPECT_EQ(stream.bytes_read(), 10);
}

TEST_F(ChunkReaderTest, RoundTripsArbitraryContent) {
  std::string content;
  for (int i = 0; i < 1000; ++i) {
    content.push_back(static_cast<char>(i % 251));
  }
  for (std::size_t chunk_size : {1u, 7u, 255u, 1000u, 4096u}) {
    ObjectId file_id = write(content, chunk_size);
    DownloadStream stream = reader.read(file_id);
    EXPECT_EQ(test::collect(stream), content) << "chunk size " << chunk_size;
  }
}

TEST_F(ChunkReaderTest, MissingChunksAreNotFound) {
  ObjectId file_id = ObjectId::generate();
  try {
    reader.read(file_id);
    FAIL() << "Expected NotFound";
  } catch (const NotFound& e) {
    EXPECT_EQ(e.kind(), ErrorKind::NOT_FOUND);
    EXPECT_EQ(*e.file_id(), file_id);
  }
  EXPECT_THROW(reader.read(file_id, 2, 4), NotFound);
  EXPECT_EQ(chunks->open_cursors(), 0u);
}

TEST_F(ChunkReaderTest, ZeroExpectedChunksNeedsNoStorage) {
  EXPECT_CALL(*chunks, find(_)).Times(0);
  DownloadStream stream = reader.read(ObjectId::generate(), 0, 4);
  Buffer chunk;
  EXPECT_FALSE(stream.next(chunk));
}

TEST_F(ChunkReaderTest, GapIsCorruptStream) {
  ObjectId file_id = write("abcdefghij", 4);
  remove_chunk(file_id, 1);

  DownloadStream stream = reader.read(file_id);
  Buffer chunk;
  ASSERT_TRUE(stream.next(chunk));
  try {
    stream.next(chunk);
    FAIL() << "Expected CorruptStream";
  } catch (const CorruptStream& e) {
    EXPECT_EQ(e.kind(), ErrorKind::CORRUPT_STREAM);
    EXPECT_EQ(*e.file_id(), file_id);
  }
  EXPECT_FALSE(stream.is_open());
  EXPECT_EQ(chunks->open_cursors(), 0u);
}

TEST_F(ChunkReaderTest, MissingTrailingChunksAreCorrupt) {
  ObjectId file_id = write("abcdefghij", 4);
  remove_chunk(file_id, 2);

  // Without the layout the truncation cannot be seen
  DownloadStream unchecked = reader.read(file_id);
  EXPECT_EQ(test::collect(unchecked), "abcdefgh");

  DownloadStream checked = reader.read(file_id, 3, 4);
  EXPECT_THROW(test::collect(checked), CorruptStream);
}

TEST_F(ChunkReaderTest, MissizedChunkIsCorrupt) {
  ObjectId file_id = ObjectId::generate();
  insert_chunk(file_id, 0, "abc");
  insert_chunk(file_id, 1, "defg");

  DownloadStream inferred = reader.read(file_id);
  EXPECT_THROW(test::collect(inferred), CorruptStream);

  DownloadStream declared = reader.read(file_id, 2, 4);
  EXPECT_THROW(test::collect(declared), CorruptStream);
}

TEST_F(ChunkReaderTest, RecordLengthIsVerified) {
  ObjectId file_id = write("abcdefghij", 4);

  FileRecord record;
  record.id = file_id;
  record.chunk_size = 4;
  record.length = 11;
  DownloadStream stream = reader.read(record);
  EXPECT_THROW(test::collect(stream), CorruptStream);

  record.length = 10;
  DownloadStream valid = reader.read(record);
  EXPECT_EQ(test::collect(valid), "abcdefghij");
}

TEST_F(ChunkReaderTest, EarlyCancelReleasesCursor) {
  ObjectId file_id = write(std::string(100, 'z'), 10);
  EXPECT_EQ(chunks->open_cursors(), 0u);

  DownloadStream stream = reader.read(file_id);
  EXPECT_EQ(chunks->open_cursors(), 1u);

  Buffer chunk;
  ASSERT_TRUE(stream.next(chunk));
  stream.cancel();
  EXPECT_EQ(chunks->open_cursors(), 0u);
  EXPECT_FALSE(stream.next(chunk));
}

TEST_F(ChunkReaderTest, DestroyingStreamReleasesCursor) {
  ObjectId file_id = write(std::string(100, 'z'), 10);
  {
    DownloadStream stream = reader.read(file_id);
    Buffer chunk;
    stream.next(chunk);
    EXPECT_EQ(chunks->open_cursors(), 1u);
  }
  EXPECT_EQ(chunks->open_cursors(), 0u);
}

TEST_F(ChunkReaderTest, StorageFailureIsIOFailure) {
  ON_CALL(*chunks, find(_)).WillByDefault([](const Query&) -> std::unique_ptr<storage::DocumentCursor> {
    throw storage::StorageError("connection lost");
  });
  EXPECT_THROW(reader.read(ObjectId::generate()), IOFailure);
}
