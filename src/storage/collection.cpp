#include "storage/collection.hpp"

namespace gridstore {
namespace storage {

std::optional<document::Document> Collection::find_one(const document::Query& query) {
  document::Query first = query;
  first.limit(1);

  auto cursor = find(first);
  document::Document doc;
  if (!cursor->next(doc)) {
    return std::nullopt;
  }
  cursor->close();
  return doc;
}

document::Document Collection::ensure_id(const document::Document& doc) {
  if (doc.has("_id")) {
    return doc;
  }

  document::Document with_id;
  with_id.set("_id", document::ObjectId::generate());
  for (const auto& field : doc) {
    with_id.set(field.name, field.value);
  }
  return with_id;
}

} // namespace storage
} // namespace gridstore
