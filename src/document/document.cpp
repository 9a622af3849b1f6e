#include "document/document.hpp"
#include <algorithm>

namespace gridstore {
namespace document {

Document::Document(std::initializer_list<std::pair<std::string, Value>> fields) {
  for (const auto& field : fields) {
    set(field.first, field.second);
  }
}

Document& Document::set(const std::string& name, Value value) {
  auto it = std::find_if(fields_.begin(), fields_.end(),
                         [&name](const Field& field) { return field.name == name; });
  if (it != fields_.end()) {
    it->value = std::move(value);
  } else {
    fields_.push_back(Field{name, std::move(value)});
  }
  return *this;
}

bool Document::erase(const std::string& name) {
  auto it = std::find_if(fields_.begin(), fields_.end(),
                         [&name](const Field& field) { return field.name == name; });
  if (it == fields_.end()) {
    return false;
  }
  fields_.erase(it);
  return true;
}

const Value* Document::get(const std::string& name) const {
  for (const auto& field : fields_) {
    if (field.name == name) {
      return &field.value;
    }
  }
  return nullptr;
}

const Value* Document::find_path(const std::string& path) const {
  const Document* current = this;
  std::size_t start = 0;

  while (true) {
    std::size_t dot = path.find('.', start);
    const Value* value = current->get(path.substr(start, dot - start));
    if (!value || dot == std::string::npos) {
      return value;
    }
    if (value->type() != ValueType::Document) {
      return nullptr;
    }
    current = &value->as_document();
    start = dot + 1;
  }
}

std::optional<std::string> Document::get_string(const std::string& name) const {
  const Value* value = get(name);
  if (!value || value->type() != ValueType::String) {
    return std::nullopt;
  }
  return value->as_string();
}

std::optional<int64_t> Document::get_int64(const std::string& name) const {
  const Value* value = get(name);
  if (!value || value->type() != ValueType::Int64) {
    return std::nullopt;
  }
  return value->as_int64();
}

std::ostream& operator<<(std::ostream& os, const Document& doc) {
  os << "{";
  bool first = true;
  for (const auto& field : doc) {
    if (!first) os << ", ";
    os << field.name << ": " << field.value;
    first = false;
  }
  return os << "}";
}

} // namespace document
} // namespace gridstore
