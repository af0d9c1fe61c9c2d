#pragma once
#include <cstdint>
#include <mutex>

namespace fuelhud {

// Single-writer, many-reader latest-value slot.
// Readers poll with their own cursor and copy only when the sequence advanced.
template <class T>
class LatestBuffer {
public:
  void publish(const T& v) {
    std::lock_guard<std::mutex> lock(mu_);
    data_ = v;
    ++seq_;
  }

  bool try_consume_latest(std::uint64_t& cursor, T& out) const {
    std::lock_guard<std::mutex> lock(mu_);
    if (seq_ == cursor) return false;
    out = data_;
    cursor = seq_;
    return true;
  }

  T latest() const {
    std::lock_guard<std::mutex> lock(mu_);
    return data_;
  }

private:
  mutable std::mutex mu_;
  T data_{};
  std::uint64_t seq_{0};
};

} // namespace fuelhud
