#ifndef GRIDSTORE_STORAGE_CURSOR_HPP
#define GRIDSTORE_STORAGE_CURSOR_HPP

#include <atomic>
#include <cstddef>
#include <memory>
#include <vector>
#include "document/document.hpp"

namespace gridstore {
namespace storage {

// Forward-only cursor over query results. Closing releases the resources
// held on the collection side; destruction closes.
class DocumentCursor {
public:
  virtual ~DocumentCursor() = default;

  // Moves the next document into doc, false when exhausted or closed.
  // An exhausted cursor closes itself.
  virtual bool next(document::Document& doc) = 0;
  virtual void close() = 0;
  virtual bool is_open() const = 0;
};

class CursorLease;

// Counts the cursors a collection has handed out and not yet closed
class CursorTracker {
public:
  CursorTracker() : open_(std::make_shared<std::atomic<std::size_t>>(0)) {}

  CursorLease acquire();
  std::size_t open_cursors() const { return open_->load(); }

private:
  std::shared_ptr<std::atomic<std::size_t>> open_;
};

// Holds one slot of a CursorTracker until released or destroyed
class CursorLease {
public:
  CursorLease() = default;
  explicit CursorLease(std::shared_ptr<std::atomic<std::size_t>> counter);
  ~CursorLease() { release(); }

  CursorLease(CursorLease&& other) noexcept : counter_(std::move(other.counter_)) {}
  CursorLease& operator=(CursorLease&& other) noexcept;
  CursorLease(const CursorLease&) = delete;
  CursorLease& operator=(const CursorLease&) = delete;

  void release();
  bool held() const { return counter_ != nullptr; }

private:
  std::shared_ptr<std::atomic<std::size_t>> counter_;
};

// Cursor over a result set captured when the query ran
class MaterializedCursor : public DocumentCursor {
public:
  MaterializedCursor(std::vector<document::Document> documents, CursorLease lease);
  ~MaterializedCursor() override { close(); }

  bool next(document::Document& doc) override;
  void close() override;
  bool is_open() const override { return lease_.held(); }

private:
  std::vector<document::Document> documents_;
  std::size_t position_{0};
  CursorLease lease_;
};

} // namespace storage
} // namespace gridstore

#endif // GRIDSTORE_STORAGE_CURSOR_HPP
