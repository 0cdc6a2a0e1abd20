#pragma once

/*
===============================================================================
signalbox - Public API Entry Point
===============================================================================

Only symbols declared in the signalbox::core namespace are part of the
public API contract.
===============================================================================
*/

#include <signalbox/core.hpp>
