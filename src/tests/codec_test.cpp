#include <gtest/gtest.h>
#include <limits>
#include <sstream>
#include "document/codec.hpp"
#include "test_utils.hpp"

using namespace gridstore::document;

class CodecTest : public ::testing::Test {
protected:
  Codec codec;

  void SetUp() override {
    gridstore::test::init_logging();
  }

  std::string generate_random_data(size_t size) {
    static const char charset[] = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";
    std::string result(size, 0);
    for (size_t i = 0; i < size; ++i) {
      result[i] = charset[rand() % (sizeof(charset) - 1)];
    }
    return result;
  }

  // Helper to verify serialization and deserialization
  void verify_serialize_deserialize(const Document& input) {
    std::stringstream stream;
    std::size_t written = 0;
    ASSERT_NO_THROW(written = codec.serialize(input, stream)) << "Serialization failed";
    EXPECT_EQ(written, stream.str().size()) << "Reported size does not match bytes written";

    Document output;
    ASSERT_NO_THROW(output = codec.deserialize(stream)) << "Deserialization failed";
    EXPECT_EQ(output, input);
  }
};

TEST_F(CodecTest, EveryValueType) {
  Document doc{
    {"null", nullptr},
    {"bool", true},
    {"int", int64_t{-1234567890123}},
    {"double", 3.14159},
    {"string", "hello"},
    {"binary", Binary{0x00, 0xff, 0x10}},
    {"date", now_date()},
    {"id", ObjectId::generate()},
    {"doc", Document{{"nested", 1}}},
    {"array", Array{Value(1), Value("two"), Value(Document{{"three", 3.0}})}}
  };
  verify_serialize_deserialize(doc);
}

TEST_F(CodecTest, EmptyDocument) {
  verify_serialize_deserialize(Document{});
}

TEST_F(CodecTest, NumericEdgeValues) {
  Document doc{
    {"min", std::numeric_limits<int64_t>::min()},
    {"max", std::numeric_limits<int64_t>::max()},
    {"negative_zero", -0.0},
    {"tiny", std::numeric_limits<double>::denorm_min()}
  };
  verify_serialize_deserialize(doc);
}

TEST_F(CodecTest, LargeBinaryPayload) {
  std::string data = generate_random_data(1024 * 1024);
  verify_serialize_deserialize(Document{{"data", Binary(data.begin(), data.end())}});
}

TEST_F(CodecTest, KeepsFieldOrder) {
  Document doc{{"z", 1}, {"a", 2}, {"m", 3}};
  Document decoded = codec.decode(codec.encode(doc));

  std::vector<std::string> names;
  for (const auto& field : decoded) {
    names.push_back(field.name);
  }
  EXPECT_EQ(names, (std::vector<std::string>{"z", "a", "m"}));
}

TEST_F(CodecTest, MultipleDocumentsInOneStream) {
  std::stringstream stream;
  codec.serialize(Document{{"n", 0}}, stream);
  codec.serialize(Document{{"n", 1}}, stream);

  EXPECT_EQ(codec.deserialize(stream).get("n")->as_int64(), 0);
  EXPECT_EQ(codec.deserialize(stream).get("n")->as_int64(), 1);
}

TEST_F(CodecTest, RejectsBadHeader) {
  EXPECT_THROW(codec.decode("XYZ\x01"), CodecError);

  std::string bytes = codec.encode(Document{{"a", 1}});
  bytes[3] = 0x7f;
  EXPECT_THROW(codec.decode(bytes), CodecError);
}

TEST_F(CodecTest, RejectsTruncatedInput) {
  std::string bytes = codec.encode(Document{{"name", "a fairly long string value"}});
  for (std::size_t cut : {std::size_t{2}, std::size_t{6}, bytes.size() / 2, bytes.size() - 1}) {
    EXPECT_THROW(codec.decode(bytes.substr(0, cut)), CodecError) << "cut at " << cut;
  }
}

TEST_F(CodecTest, RejectsTrailingBytes) {
  std::string bytes = codec.encode(Document{{"a", 1}});
  EXPECT_THROW(codec.decode(bytes + "x"), CodecError);
}

TEST_F(CodecTest, RejectsUnknownValueTag) {
  std::string bytes = codec.encode(Document{{"a", nullptr}});
  // Header(4) + field count(4) + name length(4) + name(1) puts the tag last
  bytes.back() = 0x42;
  EXPECT_THROW(codec.decode(bytes), CodecError);
}

TEST_F(CodecTest, RejectsExcessiveNesting) {
  Document doc{{"leaf", 1}};
  for (std::size_t i = 0; i <= Codec::MAX_NESTING_DEPTH + 1; ++i) {
    doc = Document{{"child", doc}};
  }
  std::stringstream stream;
  EXPECT_THROW(codec.serialize(doc, stream), CodecError);
}

TEST_F(CodecTest, ErrorHandling) {
  std::stringstream bad_stream;
  bad_stream.setstate(std::ios::badbit);
  EXPECT_THROW(codec.serialize(Document{}, bad_stream), CodecError);
  EXPECT_THROW(codec.deserialize(bad_stream), CodecError);
}
