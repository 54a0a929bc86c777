#pragma once
#include <atomic>
#include <cstdint>
#include <hcr/snapshot.hpp>

namespace hcr {

// Latest-only snapshot slot. Readers keep a cursor and only copy when the
// sequence has moved, so a renderer never sees a half-written frame.
template <class T>
class LatestBuffer {
public:
  void publish(const T& v) {
    data_ = v;
    seq_.fetch_add(1, std::memory_order_release);
  }

  bool try_consume_latest(std::uint64_t& cursor, T& out) const {
    const auto s = seq_.load(std::memory_order_acquire);
    if (s == cursor) return false;
    out = data_;
    cursor = s;
    return true;
  }

  std::uint64_t sequence() const { return seq_.load(std::memory_order_acquire); }

private:
  T data_{};
  std::atomic<std::uint64_t> seq_{0};
};

using SnapshotBuffer = LatestBuffer<FrameSnapshot>;

} // namespace hcr
