// Copyright (c) 2024 liudegui. MIT License.
//
// sqlreq::IdentityAllocator -- hands out the cache keys connections use
// to remember prepared statements.
//
// Design:
//   - Interface with a single Next(); tests can supply their own instance
//   - AtomicIdentityAllocator: lock-free, strictly increasing, never
//     reuses a value
//   - Every allocator takes a process-unique serial at construction; a
//     QueryKey pairs it with the id, so two allocators never share a key
//   - DefaultIdentityAllocator(): the process-wide instance

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>

namespace sqlreq {

/// Prepared-statement cache key: the allocator serial and its id.
struct QueryKey {
  uint64_t allocator = 0;
  uint64_t id = 0;

  bool operator==(const QueryKey& other) const {
    return allocator == other.allocator && id == other.id;
  }
  bool operator!=(const QueryKey& other) const { return !(*this == other); }
};

struct QueryKeyHash {
  size_t operator()(const QueryKey& k) const noexcept {
    size_t h = std::hash<uint64_t>()(k.id);
    return h ^ (std::hash<uint64_t>()(k.allocator) + 0x9e3779b97f4a7c15ULL +
                (h << 6) + (h >> 2));
  }
};

namespace detail {

inline uint64_t NextAllocatorSerial() {
  static std::atomic<uint64_t> serial{1};
  return serial.fetch_add(1, std::memory_order_relaxed);
}

}  // namespace detail

class IdentityAllocator {
 public:
  IdentityAllocator() : serial_(detail::NextAllocatorSerial()) {}
  virtual ~IdentityAllocator() = default;

  IdentityAllocator(const IdentityAllocator&) = delete;
  IdentityAllocator& operator=(const IdentityAllocator&) = delete;

  virtual uint64_t Next() = 0;

  /// Distinct for every allocator created in this process.
  uint64_t Serial() const { return serial_; }

 private:
  const uint64_t serial_;
};

class AtomicIdentityAllocator final : public IdentityAllocator {
 public:
  explicit AtomicIdentityAllocator(uint64_t first = 1) : next_(first) {}

  uint64_t Next() override {
    return next_.fetch_add(1, std::memory_order_relaxed);
  }

  /// The value the next call to Next() returns.
  uint64_t Peek() const { return next_.load(std::memory_order_relaxed); }

 private:
  std::atomic<uint64_t> next_;
};

inline IdentityAllocator& DefaultIdentityAllocator() {
  static AtomicIdentityAllocator allocator;
  return allocator;
}

}  // namespace sqlreq
