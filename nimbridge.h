#pragma once

// ============================================================================
// nimbridge Core Header
// ============================================================================
// Include this in all .cpp files to get access to:
// - Global debug level
// - Common logging facilities
// - Standard library headers used throughout the codebase
// ============================================================================

#include <string>
#include <iostream>
#include <vector>
#include <map>
#include <memory>
#include <chrono>
#include <cstdint>

#include "logger.h"
#include "debug.h"

// Debug level (0=off, 1-9=increasing verbosity) - used by dprintf() macro
// Defined in main.cpp (tests define it in test_stubs.cpp)
extern int g_debug_level;

// ============================================================================
// Common Utilities
// ============================================================================

namespace nimbridge {
    // Get current Unix timestamp in seconds
    inline int64_t get_current_timestamp() {
        return std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }

    // Get current Unix timestamp in milliseconds (used for completion ids)
    inline int64_t get_current_timestamp_ms() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }
}
