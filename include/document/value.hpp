#ifndef GRIDSTORE_DOCUMENT_VALUE_HPP
#define GRIDSTORE_DOCUMENT_VALUE_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <ostream>
#include <string>
#include <variant>
#include <vector>
#include "document/object_id.hpp"

namespace gridstore {
namespace document {

class Document;
class Value;

using Binary = std::vector<uint8_t>;
using Array = std::vector<Value>;
// Milliseconds since the Unix epoch
using Date = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;

// Current time truncated to milliseconds
Date now_date();

// Type tag, also used as the wire tag by the codec
enum class ValueType : uint8_t {
  Null = 0,
  Bool = 1,
  Int64 = 2,
  Double = 3,
  String = 4,
  Binary = 5,
  Date = 6,
  ObjectId = 7,
  Document = 8,
  Array = 9
};

const char* value_type_to_string(ValueType type);

// Immutable dynamically typed field value. Nested documents and arrays are
// shared between copies.
class Value {
public:
  // ---- CONSTRUCTORS ----
  Value();
  Value(std::nullptr_t);
  Value(bool value);
  Value(int value);
  Value(int64_t value);
  Value(double value);
  Value(const char* value);
  Value(std::string value);
  Value(Binary value);
  Value(Date value);
  Value(ObjectId value);
  Value(Document value);
  Value(Array value);


  // ---- TYPE QUERIES ----
  ValueType type() const { return static_cast<ValueType>(storage_.index()); }
  bool is_null() const { return type() == ValueType::Null; }
  bool is_number() const { return type() == ValueType::Int64 || type() == ValueType::Double; }


  // ---- ACCESSORS ----
  // Each throws std::invalid_argument when the value holds another type
  bool as_bool() const;
  int64_t as_int64() const;
  double as_double() const;
  const std::string& as_string() const;
  const Binary& as_binary() const;
  Date as_date() const;
  const ObjectId& as_object_id() const;
  const Document& as_document() const;
  const Array& as_array() const;

  // Int64 or Double widened to double
  double number() const;


  // ---- COMPARISON ----
  bool operator==(const Value& other) const;
  bool operator!=(const Value& other) const { return !(*this == other); }

private:
  // ---- PARAMETERS ----
  // Alternative order must follow ValueType
  using Storage = std::variant<std::monostate, bool, int64_t, double, std::string, Binary, Date,
                               ObjectId, std::shared_ptr<const Document>, std::shared_ptr<const Array>>;
  Storage storage_;

  [[noreturn]] void type_mismatch(ValueType expected) const;
};

// Canonical ordering rank: null < numbers < string < document < array <
// binary < object id < bool < date
int canonical_rank(ValueType type);

// Total order over values. Values of different canonical rank order by rank;
// numbers compare numerically across Int64 and Double.
int compare_values(const Value& lhs, const Value& rhs);

// True when both values fall in the same canonical rank, so a range
// comparison between them is meaningful
bool comparable(const Value& lhs, const Value& rhs);

std::ostream& operator<<(std::ostream& os, const Value& value);

} // namespace document
} // namespace gridstore

#endif // GRIDSTORE_DOCUMENT_VALUE_HPP
