#include "document/query.hpp"
#include <algorithm>

namespace gridstore {
namespace document {

Query& Query::sort_by(const std::string& path, SortOrder order) {
  sort_keys_.push_back(SortKey{path, order});
  return *this;
}

std::vector<Value> Query::sort_values(const Document& doc) const {
  std::vector<Value> values;
  values.reserve(sort_keys_.size());
  for (const auto& key : sort_keys_) {
    const Value* value = doc.find_path(key.path);
    values.push_back(value ? *value : Value());
  }
  return values;
}

bool Query::less_values(const std::vector<Value>& lhs, const std::vector<Value>& rhs) const {
  for (std::size_t i = 0; i < sort_keys_.size() && i < lhs.size() && i < rhs.size(); ++i) {
    int c = compare_values(lhs[i], rhs[i]);
    if (c != 0) {
      return sort_keys_[i].order == SortOrder::Ascending ? c < 0 : c > 0;
    }
  }
  return false;
}

bool Query::less(const Document& lhs, const Document& rhs) const {
  return less_values(sort_values(lhs), sort_values(rhs));
}

void Query::apply(std::vector<Document>& documents) const {
  if (has_sort()) {
    std::stable_sort(documents.begin(), documents.end(),
                     [this](const Document& lhs, const Document& rhs) { return less(lhs, rhs); });
  }

  if (skip_ > 0) {
    auto first = documents.begin() + static_cast<std::ptrdiff_t>(std::min(skip_, documents.size()));
    documents.erase(documents.begin(), first);
  }

  if (limit_ > 0 && documents.size() > limit_) {
    documents.resize(limit_);
  }
}

} // namespace document
} // namespace gridstore
