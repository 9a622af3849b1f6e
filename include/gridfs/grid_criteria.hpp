#ifndef GRIDSTORE_GRIDFS_GRID_CRITERIA_HPP
#define GRIDSTORE_GRIDFS_GRID_CRITERIA_HPP

#include <string>
#include "document/filter.hpp"
#include "document/object_id.hpp"
#include "gridfs/file_record.hpp"

namespace gridstore {
namespace gridfs {

// Criteria over file record fields: where_metadata("key").is("value")
inline document::Criteria where_metadata(const std::string& key) {
  return document::Criteria(std::string(fields::METADATA) + "." + key);
}

inline document::Criteria where_filename() {
  return document::Criteria(fields::FILENAME);
}

inline document::Criteria where_content_type() {
  return document::Criteria(fields::CONTENT_TYPE);
}

inline document::Filter by_id(const document::ObjectId& id) {
  return document::where(fields::ID).is(id);
}

} // namespace gridfs
} // namespace gridstore

#endif // GRIDSTORE_GRIDFS_GRID_CRITERIA_HPP
