#pragma once

#include "signalbox/core/color.hpp"

namespace signalbox::core {
namespace protocol {
namespace schema {

// ----------------------------------------------------------------------------
// color_change request (inbound)
// ----------------------------------------------------------------------------
//
// {"type":"color_change","color":"yellow"}
//
// color is Color::Unknown when the field held an unrecognised spelling;
// the Coordinator rejects it.
//
struct ColorRequest {
    Color color{Color::Unknown};
};

} // namespace schema
} // namespace protocol
} // namespace signalbox::core
