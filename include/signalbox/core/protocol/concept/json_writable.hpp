// ============================================================================
// JSON Writable Concepts
// ----------------------------------------------------------------------------
//
// Contract for allocation-free JSON serialization of outbound messages.
//
// Two categories are supported:
//
// -----------------------------------------------------------------------------
// 1. StaticJsonWritable
// -----------------------------------------------------------------------------
//
// Maximum serialized size known at compile time, independent of the object
// (e.g. color_change: fixed keys, bounded color, fixed-width clock).
//
// Requirements:
//   • static constexpr max_json_size() noexcept
//   • std::size_t write_json(char*) const noexcept
//
// -----------------------------------------------------------------------------
// 2. DynamicJsonWritable
// -----------------------------------------------------------------------------
//
// Maximum serialized size depends on runtime data (e.g. an identity string)
// but is still computed up front and bounded.
//
// Requirements:
//   • std::size_t max_json_size() const noexcept
//   • std::size_t write_json(char*) const noexcept
//
// -----------------------------------------------------------------------------
// 3. JsonWritable
// -----------------------------------------------------------------------------
//
// Either of the above. serialize() below works for both.
//
// ============================================================================

#pragma once

#include <concepts>
#include <cstddef>
#include <string>

namespace signalbox::core::protocol {


template<typename T>
concept StaticJsonWritable =
    requires(const T& t, char* buffer) {
        // Compile-time maximum serialized size
        { T::max_json_size() } noexcept -> std::convertible_to<std::size_t>;

        // Allocation-free JSON writer
        { t.write_json(buffer) } noexcept -> std::same_as<std::size_t>;
    }
    &&
    requires {
        // Forces constant-evaluated context
        requires (T::max_json_size() > 0);
    };


template<typename T>
concept DynamicJsonWritable =
    (!StaticJsonWritable<T>)
    &&
    requires(const T& t, char* buffer) {
        // Runtime-computed maximum serialized size
        { t.max_json_size() } noexcept -> std::convertible_to<std::size_t>;

        // Allocation-free JSON writer
        { t.write_json(buffer) } noexcept -> std::same_as<std::size_t>;
    };


template<typename T>
concept JsonWritable = StaticJsonWritable<T> || DynamicJsonWritable<T>;


// Allocating serialization helper: one allocation sized by max_json_size()
template<JsonWritable T>
[[nodiscard]]
inline std::string serialize(const T& msg) {
    std::string out(msg.max_json_size(), '\0');
    out.resize(msg.write_json(out.data()));
    return out;
}

} // namespace signalbox::core::protocol
