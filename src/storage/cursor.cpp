#include "storage/cursor.hpp"

namespace gridstore {
namespace storage {

CursorLease CursorTracker::acquire() {
  return CursorLease(open_);
}

CursorLease::CursorLease(std::shared_ptr<std::atomic<std::size_t>> counter)
  : counter_(std::move(counter)) {
  if (counter_) {
    counter_->fetch_add(1);
  }
}

CursorLease& CursorLease::operator=(CursorLease&& other) noexcept {
  if (this != &other) {
    release();
    counter_ = std::move(other.counter_);
  }
  return *this;
}

void CursorLease::release() {
  if (counter_) {
    counter_->fetch_sub(1);
    counter_.reset();
  }
}

MaterializedCursor::MaterializedCursor(std::vector<document::Document> documents, CursorLease lease)
  : documents_(std::move(documents))
  , lease_(std::move(lease)) {}

bool MaterializedCursor::next(document::Document& doc) {
  if (!is_open()) {
    return false;
  }
  if (position_ >= documents_.size()) {
    // Exhausted cursors give their slot back
    close();
    return false;
  }
  doc = std::move(documents_[position_++]);
  return true;
}

void MaterializedCursor::close() {
  documents_.clear();
  documents_.shrink_to_fit();
  lease_.release();
}

} // namespace storage
} // namespace gridstore
