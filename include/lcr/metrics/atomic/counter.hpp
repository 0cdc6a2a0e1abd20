#pragma once

#include <atomic>
#include <type_traits>
#include <cstdint>


namespace lcr {
namespace metrics {
namespace atomic {

// ---------------------------------------------------------------------------
// counter - A monotonically increasing counter (Cumulative metric)
// ---------------------------------------------------------------------------
//
// Safe to update from any thread. Relaxed ordering: counters are facts for
// observation, never used to synchronize other memory.
// ---------------------------------------------------------------------------
template<typename T = uint64_t>
struct alignas(64) counter {
    // Constructor
    counter() = default;
    explicit counter(T initial) noexcept : value_(initial) {}
    // Disable copy/move semantics
    counter(const counter&) = delete;
    counter& operator=(const counter&) = delete;
    counter(counter&&) noexcept = delete;
    counter& operator=(counter&&) noexcept = delete;

    // Specialized copy method (snapshot support)
    void copy_to(counter& other) const noexcept {
        other.value_.store(value_.load(std::memory_order_relaxed), std::memory_order_relaxed);
    }

    // Accessor
    inline T load() const noexcept { return value_.load(std::memory_order_relaxed); }
    // Mutators
    inline void inc(T n = 1) noexcept { value_.fetch_add(n, std::memory_order_relaxed); }
    // Return-after-update mutator
    inline T add(T n) noexcept { return value_.fetch_add(n, std::memory_order_relaxed) + n; }

    // Reset counter to zero
    inline void reset() noexcept { value_.store(0, std::memory_order_relaxed); }

private:
    std::atomic<T> value_{0};
};
// Fixed-width specialization for hot path
using counter32 = counter<uint32_t>;
static_assert(std::is_standard_layout_v<counter32>, "counter32 must be standard layout");
using counter64 = counter<uint64_t>;
static_assert(std::is_standard_layout_v<counter64>, "counter64 must be standard layout");

} // namespace atomic
} // namespace metrics
} // namespace lcr
