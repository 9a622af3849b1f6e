#include "document/filter.hpp"

namespace gridstore {
namespace document {

const char* operator_to_string(Operator op) {
  switch (op) {
    case Operator::Eq: return "$eq";
    case Operator::Ne: return "$ne";
    case Operator::Gt: return "$gt";
    case Operator::Gte: return "$gte";
    case Operator::Lt: return "$lt";
    case Operator::Lte: return "$lte";
    case Operator::In: return "$in";
    case Operator::Nin: return "$nin";
    case Operator::Exists: return "$exists";
    default: return "$unknown";
  }
}

namespace {

bool equals_or_contains(const Value* field, const Value& operand) {
  // A missing field equals null
  if (!field) {
    return operand.is_null();
  }
  if (*field == operand) {
    return true;
  }
  // Equality against an array field matches any element
  if (field->type() == ValueType::Array) {
    for (const auto& element : field->as_array()) {
      if (element == operand) {
        return true;
      }
    }
  }
  return false;
}

bool range_satisfied(Operator op, const Value& field, const Value& operand) {
  if (!comparable(field, operand)) {
    return false;
  }
  int c = compare_values(field, operand);
  switch (op) {
    case Operator::Gt: return c > 0;
    case Operator::Gte: return c >= 0;
    case Operator::Lt: return c < 0;
    case Operator::Lte: return c <= 0;
    default: return false;
  }
}

bool range_matches(Operator op, const Value* field, const Value& operand) {
  if (!field) {
    return false;
  }
  if (range_satisfied(op, *field, operand)) {
    return true;
  }
  if (field->type() == ValueType::Array) {
    for (const auto& element : field->as_array()) {
      if (range_satisfied(op, element, operand)) {
        return true;
      }
    }
  }
  return false;
}

bool in_matches(const Value* field, const Value& operand) {
  for (const auto& candidate : operand.as_array()) {
    if (equals_or_contains(field, candidate)) {
      return true;
    }
  }
  return false;
}

} // namespace

bool Predicate::matches(const Document& doc) const {
  const Value* field = doc.find_path(path);

  switch (op) {
    case Operator::Eq:
      return equals_or_contains(field, operand);
    case Operator::Ne:
      return !equals_or_contains(field, operand);
    case Operator::Gt:
    case Operator::Gte:
    case Operator::Lt:
    case Operator::Lte:
      return range_matches(op, field, operand);
    case Operator::In:
      return in_matches(field, operand);
    case Operator::Nin:
      return !in_matches(field, operand);
    case Operator::Exists:
      return (field != nullptr) == operand.as_bool();
    default:
      return false;
  }
}

Filter::Filter(Predicate predicate) {
  predicates_.push_back(std::move(predicate));
}

Filter& Filter::and_(const Filter& other) {
  predicates_.insert(predicates_.end(), other.predicates_.begin(), other.predicates_.end());
  return *this;
}

bool Filter::matches(const Document& doc) const {
  for (const auto& predicate : predicates_) {
    if (!predicate.matches(doc)) {
      return false;
    }
  }
  return true;
}

const Value* Filter::equality_on(const std::string& path) const {
  if (predicates_.size() != 1) {
    return nullptr;
  }
  const auto& predicate = predicates_.front();
  if (predicate.path != path || predicate.op != Operator::Eq) {
    return nullptr;
  }
  return &predicate.operand;
}

std::ostream& operator<<(std::ostream& os, const Filter& filter) {
  os << "{";
  bool first = true;
  for (const auto& predicate : filter.predicates()) {
    if (!first) os << ", ";
    os << predicate.path << ": {" << operator_to_string(predicate.op) << ": " << predicate.operand << "}";
    first = false;
  }
  return os << "}";
}

} // namespace document
} // namespace gridstore
