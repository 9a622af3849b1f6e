#ifndef GRIDSTORE_STORAGE_ERROR_HPP
#define GRIDSTORE_STORAGE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace gridstore {
namespace storage {

class StorageError : public std::runtime_error {
public:
  explicit StorageError(const std::string& message) : std::runtime_error(message) {}
};

// Insert rejected by the _id key or a unique index
class DuplicateKeyError : public StorageError {
public:
  DuplicateKeyError(const std::string& index_name, const std::string& message)
    : StorageError("Duplicate key on index " + index_name + ": " + message)
    , index_name_(index_name) {}

  const std::string& index_name() const { return index_name_; }

private:
  std::string index_name_;
};

} // namespace storage
} // namespace gridstore

#endif // GRIDSTORE_STORAGE_ERROR_HPP
