#pragma once

#include <atomic>
#include <type_traits>
#include <cstdint>


namespace lcr {
namespace metrics {
namespace atomic {

// ---------------------------------------------------------------------------
// gauge - A metric that can go up and down (Instantaneous state)
// ---------------------------------------------------------------------------
//
// Tracks the high-water mark alongside the current value.
// ---------------------------------------------------------------------------
template<typename T = int64_t>
struct alignas(64) gauge {
    // Constructor
    gauge() = default;

    // Disable copy/move semantics
    gauge(const gauge&) = delete;
    gauge& operator=(const gauge&) = delete;
    gauge(gauge&&) noexcept = delete;
    gauge& operator=(gauge&&) noexcept = delete;

    // Specialized copy method
    void copy_to(gauge& other) const noexcept {
        other.value_.store(value_.load(std::memory_order_relaxed), std::memory_order_relaxed);
        other.peak_.store(peak_.load(std::memory_order_relaxed), std::memory_order_relaxed);
    }

    // Accessors
    inline T load() const noexcept { return value_.load(std::memory_order_relaxed); }
    inline T peak() const noexcept { return peak_.load(std::memory_order_relaxed); }

    // Mutators
    inline void store(T v) noexcept {
        value_.store(v, std::memory_order_relaxed);
        raise_peak_(v);
    }
    inline void inc(T n = 1) noexcept {
        raise_peak_(value_.fetch_add(n, std::memory_order_relaxed) + n);
    }
    inline void dec(T n = 1) noexcept { value_.fetch_sub(n, std::memory_order_relaxed); }

    // Reset gauge and peak to zero
    inline void reset() noexcept {
        value_.store(0, std::memory_order_relaxed);
        peak_.store(0, std::memory_order_relaxed);
    }

private:
    std::atomic<T> value_{0};
    std::atomic<T> peak_{0};

    inline void raise_peak_(T v) noexcept {
        T current = peak_.load(std::memory_order_relaxed);
        while (v > current &&
               !peak_.compare_exchange_weak(current, v, std::memory_order_relaxed, std::memory_order_relaxed)) {
        }
    }
};
// Fixed-width specialization for hot path
using gauge32 = gauge<uint32_t>;
static_assert(std::is_standard_layout_v<gauge32>, "gauge32 must be standard layout");
using gauge64 = gauge<uint64_t>;
static_assert(std::is_standard_layout_v<gauge64>, "gauge64 must be standard layout");

} // namespace atomic
} // namespace metrics
} // namespace lcr
