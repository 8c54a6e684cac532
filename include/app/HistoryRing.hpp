#pragma once
#include <cstddef>
#include <vector>

namespace harbor::app {

// Fixed-capacity ring for chart history; pushing into a full ring evicts the
// oldest element. Not synchronized.
template <typename T>
class HistoryRing {
public:
  explicit HistoryRing(size_t capacity) : buf_(capacity > 0 ? capacity : 1) {}

  void push(T value) {
    buf_[head_] = std::move(value);
    head_ = (head_ + 1) % buf_.size();
    if (size_ < buf_.size()) ++size_;
  }

  size_t size() const { return size_; }
  size_t capacity() const { return buf_.size(); }
  bool empty() const { return size_ == 0; }

  // Oldest first
  std::vector<T> items() const {
    std::vector<T> out;
    out.reserve(size_);
    size_t start = (head_ + buf_.size() - size_) % buf_.size();
    for (size_t i = 0; i < size_; ++i) out.push_back(buf_[(start + i) % buf_.size()]);
    return out;
  }

  const T& newest() const { return buf_[(head_ + buf_.size() - 1) % buf_.size()]; }

  void clear() { head_ = 0; size_ = 0; }

private:
  std::vector<T> buf_;
  size_t head_{0};
  size_t size_{0};
};

} // namespace harbor::app
