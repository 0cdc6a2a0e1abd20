#pragma once

// -----------------------------------------------------------------------------
// Telemetry level configuration
// -----------------------------------------------------------------------------

#if defined(SIGNALBOX_ENABLE_TELEMETRY_L1)
    #define SB_TL1(expr) expr
#else
    #define SB_TL1(expr) ((void)0)
#endif

