#ifndef GRIDSTORE_DOCUMENT_FILTER_HPP
#define GRIDSTORE_DOCUMENT_FILTER_HPP

#include <ostream>
#include <string>
#include <vector>
#include "document/document.hpp"
#include "document/value.hpp"

namespace gridstore {
namespace document {

enum class Operator {
  Eq,
  Ne,
  Gt,
  Gte,
  Lt,
  Lte,
  In,
  Nin,
  Exists
};

const char* operator_to_string(Operator op);

// Single predicate over a dotted field path
struct Predicate {
  std::string path;
  Operator op;
  Value operand;

  bool matches(const Document& doc) const;
};

// Conjunction of predicates. An empty filter matches every document.
class Filter {
public:
  Filter() = default;
  explicit Filter(Predicate predicate);

  // Appends all predicates of other to this filter
  Filter& and_(const Filter& other);

  bool matches(const Document& doc) const;
  bool empty() const { return predicates_.empty(); }
  const std::vector<Predicate>& predicates() const { return predicates_; }

  // Returns the operand when this filter is exactly one equality predicate
  // on path, nullptr otherwise. Lets collections short-cut id lookups.
  const Value* equality_on(const std::string& path) const;

private:
  std::vector<Predicate> predicates_;
};

// Builder for a predicate on one path: where("metadata.key").is("value")
class Criteria {
public:
  explicit Criteria(std::string path) : path_(std::move(path)) {}

  Filter is(Value value) const { return make(Operator::Eq, std::move(value)); }
  Filter ne(Value value) const { return make(Operator::Ne, std::move(value)); }
  Filter gt(Value value) const { return make(Operator::Gt, std::move(value)); }
  Filter gte(Value value) const { return make(Operator::Gte, std::move(value)); }
  Filter lt(Value value) const { return make(Operator::Lt, std::move(value)); }
  Filter lte(Value value) const { return make(Operator::Lte, std::move(value)); }
  Filter in(Array values) const { return make(Operator::In, Value(std::move(values))); }
  Filter nin(Array values) const { return make(Operator::Nin, Value(std::move(values))); }
  Filter exists(bool present = true) const { return make(Operator::Exists, Value(present)); }

  const std::string& path() const { return path_; }

private:
  std::string path_;

  Filter make(Operator op, Value operand) const { return Filter(Predicate{path_, op, std::move(operand)}); }
};

inline Criteria where(const std::string& path) {
  return Criteria(path);
}

std::ostream& operator<<(std::ostream& os, const Filter& filter);

} // namespace document
} // namespace gridstore

#endif // GRIDSTORE_DOCUMENT_FILTER_HPP
