#ifndef GRIDSTORE_DOCUMENT_QUERY_HPP
#define GRIDSTORE_DOCUMENT_QUERY_HPP

#include <cstddef>
#include <string>
#include <vector>
#include "document/filter.hpp"

namespace gridstore {
namespace document {

enum class SortOrder {
  Ascending = 1,
  Descending = -1
};

struct SortKey {
  std::string path;
  SortOrder order;
};

// Filter plus sort, skip and limit. A limit of zero means unlimited.
class Query {
public:
  Query() = default;
  explicit Query(Filter filter) : filter_(std::move(filter)) {}

  // ---- BUILDERS ----
  Query& sort_by(const std::string& path, SortOrder order = SortOrder::Ascending);
  Query& skip(std::size_t count) { skip_ = count; return *this; }
  Query& limit(std::size_t count) { limit_ = count; return *this; }


  // ---- GETTERS ----
  const Filter& filter() const { return filter_; }
  const std::vector<SortKey>& sort_keys() const { return sort_keys_; }
  bool has_sort() const { return !sort_keys_.empty(); }
  std::size_t skip_count() const { return skip_; }
  std::size_t limit_count() const { return limit_; }


  // ---- EVALUATION ----
  // Values of the sort key paths in key order, null for missing fields
  std::vector<Value> sort_values(const Document& doc) const;
  // Strict weak ordering over values produced by sort_values()
  bool less_values(const std::vector<Value>& lhs, const std::vector<Value>& rhs) const;
  // Strict weak ordering under the sort keys; missing fields sort as null
  bool less(const Document& lhs, const Document& rhs) const;
  // Stable-sorts already filtered documents, then applies skip and limit
  void apply(std::vector<Document>& documents) const;

private:
  Filter filter_;
  std::vector<SortKey> sort_keys_;
  std::size_t skip_{0};
  std::size_t limit_{0};
};

inline Query query(Filter filter) {
  return Query(std::move(filter));
}

} // namespace document
} // namespace gridstore

#endif // GRIDSTORE_DOCUMENT_QUERY_HPP
