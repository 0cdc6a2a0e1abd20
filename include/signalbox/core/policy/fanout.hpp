#pragma once

#include <cstdint>
#include <concepts>

namespace signalbox::core::policy {

/*
===============================================================================
 Fan-out Failure Policy
===============================================================================

This policy defines what a failed outbound send means for membership.

A failed send is always:
- isolated (the remaining recipients of the same fan-out are still served)
- counted (telemetry)
- logged

The policy only decides whether repeated failures may *remove* a connection
without the transport ever reporting its closure.

The policy is:

- Compile-time defined
- Zero runtime polymorphism
- Zero dynamic configuration
- Deterministic per Coordinator type

-------------------------------------------------------------------------------
 Modes
-------------------------------------------------------------------------------

1) Retain (default)
   - Membership is transport-driven only
   - A connection stays registered until its session reports closure and
     disconnect() is called

2) Prune<Threshold>
   - A connection whose sends fail Threshold times in a row is removed
     through the regular disconnect path (promotion + user_update included)
   - Any successful send resets the streak
   - Removal is applied after the fan-out completes, never during it

-------------------------------------------------------------------------------
 Example
-------------------------------------------------------------------------------

using StrictCoordinator = Coordinator<MySession, fanout::Prune<3>>;

===============================================================================
*/


// ============================================================================
// Fan-out Policy Concept
// ============================================================================
//
// A valid FanoutPolicy must expose:
//
//   static constexpr bool prune;
//   static constexpr std::uint32_t threshold;
//
// If prune == false, threshold is ignored.
//
// ============================================================================

template<typename P>
concept FanoutPolicy =
requires {
    { P::prune } -> std::same_as<const bool&>;
    { P::threshold } -> std::convertible_to<std::uint32_t>;
};


namespace fanout {

// ============================================================================
// Retain
// ============================================================================

struct Retain {

    static constexpr bool prune = false;

    // Unused placeholder (required for concept satisfaction)
    static constexpr std::uint32_t threshold{0};
};


// ============================================================================
// Prune
// ============================================================================
//
// Template Parameters:
//   Threshold -> consecutive failed sends that trigger removal
//
// Example:
//   Prune<1> -> drop a connection on its first failed send
//
// ============================================================================

template<std::uint32_t Threshold = 3>
requires (Threshold > 0)
struct Prune {

    static constexpr bool prune = true;

    static constexpr std::uint32_t threshold = Threshold;
};

} // namespace fanout

static_assert(FanoutPolicy<fanout::Retain>);
static_assert(FanoutPolicy<fanout::Prune<>>);

} // namespace signalbox::core::policy
