#include "document/value.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include "document/document.hpp"

namespace gridstore {
namespace document {

Date now_date() {
  return std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
}

const char* value_type_to_string(ValueType type) {
  switch (type) {
    case ValueType::Null: return "null";
    case ValueType::Bool: return "bool";
    case ValueType::Int64: return "int64";
    case ValueType::Double: return "double";
    case ValueType::String: return "string";
    case ValueType::Binary: return "binary";
    case ValueType::Date: return "date";
    case ValueType::ObjectId: return "objectId";
    case ValueType::Document: return "document";
    case ValueType::Array: return "array";
    default: return "unknown";
  }
}

//==============================================
// CONSTRUCTORS
//==============================================

Value::Value() : storage_(std::monostate{}) {}
Value::Value(std::nullptr_t) : storage_(std::monostate{}) {}
Value::Value(bool value) : storage_(value) {}
Value::Value(int value) : storage_(static_cast<int64_t>(value)) {}
Value::Value(int64_t value) : storage_(value) {}
Value::Value(double value) : storage_(value) {}
Value::Value(const char* value) : storage_(std::string(value)) {}
Value::Value(std::string value) : storage_(std::move(value)) {}
Value::Value(Binary value) : storage_(std::move(value)) {}
Value::Value(Date value) : storage_(value) {}
Value::Value(ObjectId value) : storage_(value) {}

Value::Value(Document value)
  : storage_(std::shared_ptr<const Document>(std::make_shared<Document>(std::move(value)))) {}

Value::Value(Array value)
  : storage_(std::shared_ptr<const Array>(std::make_shared<Array>(std::move(value)))) {}


//==============================================
// ACCESSORS
//==============================================

void Value::type_mismatch(ValueType expected) const {
  throw std::invalid_argument(std::string("Value: Expected ") + value_type_to_string(expected) +
                              " but found " + value_type_to_string(type()));
}

bool Value::as_bool() const {
  if (type() != ValueType::Bool) type_mismatch(ValueType::Bool);
  return std::get<bool>(storage_);
}

int64_t Value::as_int64() const {
  if (type() != ValueType::Int64) type_mismatch(ValueType::Int64);
  return std::get<int64_t>(storage_);
}

double Value::as_double() const {
  if (type() != ValueType::Double) type_mismatch(ValueType::Double);
  return std::get<double>(storage_);
}

const std::string& Value::as_string() const {
  if (type() != ValueType::String) type_mismatch(ValueType::String);
  return std::get<std::string>(storage_);
}

const Binary& Value::as_binary() const {
  if (type() != ValueType::Binary) type_mismatch(ValueType::Binary);
  return std::get<Binary>(storage_);
}

Date Value::as_date() const {
  if (type() != ValueType::Date) type_mismatch(ValueType::Date);
  return std::get<Date>(storage_);
}

const ObjectId& Value::as_object_id() const {
  if (type() != ValueType::ObjectId) type_mismatch(ValueType::ObjectId);
  return std::get<ObjectId>(storage_);
}

const Document& Value::as_document() const {
  if (type() != ValueType::Document) type_mismatch(ValueType::Document);
  return *std::get<std::shared_ptr<const Document>>(storage_);
}

const Array& Value::as_array() const {
  if (type() != ValueType::Array) type_mismatch(ValueType::Array);
  return *std::get<std::shared_ptr<const Array>>(storage_);
}

double Value::number() const {
  if (type() == ValueType::Int64) {
    return static_cast<double>(std::get<int64_t>(storage_));
  }
  return as_double();
}


//==============================================
// COMPARISON
//==============================================

bool Value::operator==(const Value& other) const {
  if (is_number() && other.is_number()) {
    return compare_values(*this, other) == 0;
  }
  if (type() != other.type()) {
    return false;
  }
  switch (type()) {
    case ValueType::Document:
      return as_document() == other.as_document();
    case ValueType::Array:
      return as_array() == other.as_array();
    default:
      return storage_ == other.storage_;
  }
}

int canonical_rank(ValueType type) {
  switch (type) {
    case ValueType::Null: return 0;
    case ValueType::Int64:
    case ValueType::Double: return 1;
    case ValueType::String: return 2;
    case ValueType::Document: return 3;
    case ValueType::Array: return 4;
    case ValueType::Binary: return 5;
    case ValueType::ObjectId: return 6;
    case ValueType::Bool: return 7;
    case ValueType::Date: return 8;
    default: return 9;
  }
}

namespace {

template <typename T>
int three_way(const T& lhs, const T& rhs) {
  if (lhs < rhs) return -1;
  if (rhs < lhs) return 1;
  return 0;
}

int compare_numbers(const Value& lhs, const Value& rhs) {
  if (lhs.type() == ValueType::Int64 && rhs.type() == ValueType::Int64) {
    return three_way(lhs.as_int64(), rhs.as_int64());
  }
  return three_way(lhs.number(), rhs.number());
}

int compare_documents(const Document& lhs, const Document& rhs) {
  auto left = lhs.begin();
  auto right = rhs.begin();
  for (; left != lhs.end() && right != rhs.end(); ++left, ++right) {
    if (int c = three_way(left->name, right->name)) return c;
    if (int c = compare_values(left->value, right->value)) return c;
  }
  return three_way(lhs.size(), rhs.size());
}

int compare_arrays(const Array& lhs, const Array& rhs) {
  std::size_t common = std::min(lhs.size(), rhs.size());
  for (std::size_t i = 0; i < common; ++i) {
    if (int c = compare_values(lhs[i], rhs[i])) return c;
  }
  return three_way(lhs.size(), rhs.size());
}

} // namespace

int compare_values(const Value& lhs, const Value& rhs) {
  int lhs_rank = canonical_rank(lhs.type());
  int rhs_rank = canonical_rank(rhs.type());
  if (lhs_rank != rhs_rank) {
    return three_way(lhs_rank, rhs_rank);
  }

  switch (lhs.type()) {
    case ValueType::Null:
      return 0;
    case ValueType::Int64:
    case ValueType::Double:
      return compare_numbers(lhs, rhs);
    case ValueType::String:
      return three_way(lhs.as_string(), rhs.as_string());
    case ValueType::Document:
      return compare_documents(lhs.as_document(), rhs.as_document());
    case ValueType::Array:
      return compare_arrays(lhs.as_array(), rhs.as_array());
    case ValueType::Binary: {
      // Shorter payloads sort first, as in BSON
      const auto& left = lhs.as_binary();
      const auto& right = rhs.as_binary();
      if (left.size() != right.size()) return three_way(left.size(), right.size());
      return three_way(left, right);
    }
    case ValueType::ObjectId:
      return three_way(lhs.as_object_id(), rhs.as_object_id());
    case ValueType::Bool:
      return three_way(lhs.as_bool(), rhs.as_bool());
    case ValueType::Date:
      return three_way(lhs.as_date(), rhs.as_date());
    default:
      return 0;
  }
}

bool comparable(const Value& lhs, const Value& rhs) {
  return canonical_rank(lhs.type()) == canonical_rank(rhs.type());
}

std::ostream& operator<<(std::ostream& os, const Value& value) {
  switch (value.type()) {
    case ValueType::Null:
      return os << "null";
    case ValueType::Bool:
      return os << (value.as_bool() ? "true" : "false");
    case ValueType::Int64:
      return os << value.as_int64();
    case ValueType::Double:
      return os << value.as_double();
    case ValueType::String:
      return os << std::quoted(value.as_string());
    case ValueType::Binary:
      return os << "Binary(" << value.as_binary().size() << " bytes)";
    case ValueType::Date:
      return os << "Date(" << value.as_date().time_since_epoch().count() << ")";
    case ValueType::ObjectId:
      return os << value.as_object_id();
    case ValueType::Document:
      return os << value.as_document();
    case ValueType::Array: {
      os << "[";
      bool first = true;
      for (const auto& element : value.as_array()) {
        if (!first) os << ", ";
        os << element;
        first = false;
      }
      return os << "]";
    }
    default:
      return os << "?";
  }
}

} // namespace document
} // namespace gridstore
