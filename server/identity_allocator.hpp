// identity_allocator.hpp
#pragma once
#include <atomic>
#include <cstdint>

// Hands out message ids shared by every channel of a store: 1, 2, 3, ...
class IdentityAllocator {
public:
    uint64_t next() { return counter_.fetch_add(1, std::memory_order_relaxed) + 1; }
    uint64_t last_issued() const { return counter_.load(std::memory_order_relaxed); }

private:
    std::atomic<uint64_t> counter_{0};
};
