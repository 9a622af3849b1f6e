#ifndef GRIDSTORE_DOCUMENT_DOCUMENT_HPP
#define GRIDSTORE_DOCUMENT_DOCUMENT_HPP

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>
#include "document/value.hpp"

namespace gridstore {
namespace document {

struct Field {
  std::string name;
  Value value;

  bool operator==(const Field& other) const { return name == other.name && value == other.value; }
  bool operator!=(const Field& other) const { return !(*this == other); }
};

// Ordered, schema-less key/value document. Field names are unique; setting
// an existing name replaces its value in place.
class Document {
public:
  using const_iterator = std::vector<Field>::const_iterator;

  // ---- CONSTRUCTORS ----
  Document() = default;
  Document(std::initializer_list<std::pair<std::string, Value>> fields);


  // ---- MODIFIERS ----
  // Sets a top-level field, keeping its position if it already exists
  Document& set(const std::string& name, Value value);
  // Removes a top-level field, returns false if absent
  bool erase(const std::string& name);


  // ---- LOOKUP ----
  bool has(const std::string& name) const { return get(name) != nullptr; }
  // Top-level lookup, nullptr when absent
  const Value* get(const std::string& name) const;
  // Dotted path lookup through nested documents ("metadata.owner.name")
  const Value* find_path(const std::string& path) const;
  // Typed convenience lookups, std::nullopt when absent or of another type
  std::optional<std::string> get_string(const std::string& name) const;
  std::optional<int64_t> get_int64(const std::string& name) const;


  // ---- ITERATION ----
  const_iterator begin() const { return fields_.begin(); }
  const_iterator end() const { return fields_.end(); }
  std::size_t size() const { return fields_.size(); }
  bool empty() const { return fields_.empty(); }


  // ---- COMPARISON ----
  // Field order is significant
  bool operator==(const Document& other) const { return fields_ == other.fields_; }
  bool operator!=(const Document& other) const { return !(*this == other); }

private:
  // ---- PARAMETERS ----
  std::vector<Field> fields_;
};

std::ostream& operator<<(std::ostream& os, const Document& doc);

} // namespace document
} // namespace gridstore

#endif // GRIDSTORE_DOCUMENT_DOCUMENT_HPP
