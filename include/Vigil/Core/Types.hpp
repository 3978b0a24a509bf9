/**
 * @file Types.hpp
 * @brief Core type definitions for the Vigil connection-health monitor
 * @author Vigil Networking Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Vigil Networking. All rights reserved.
 *
 * This file contains fundamental type definitions, constants, and aliases
 * used throughout the Vigil codebase. All components should include
 * this header for consistent type usage.
 */

#pragma once

#ifndef VIGIL_CORE_TYPES_HPP
#define VIGIL_CORE_TYPES_HPP

#include <cstdint>
#include <cstddef>
#include <string>
#include <memory>
#include <functional>
#include <chrono>

namespace Vigil {

// ============================================================================
// Version Information
// ============================================================================

/// Major version number
constexpr uint32_t VERSION_MAJOR = 1;

/// Minor version number
constexpr uint32_t VERSION_MINOR = 0;

/// Patch version number
constexpr uint32_t VERSION_PATCH = 0;

/// Full version string
constexpr const char* VERSION_STRING = "1.0.0";

// ============================================================================
// Time Types
// ============================================================================

/// Wall clock used for absolute activity timestamps
using Clock = std::chrono::system_clock;

/// Monotonic clock used for scheduling
using SteadyClock = std::chrono::steady_clock;

/// Duration in milliseconds
using Milliseconds = std::chrono::milliseconds;

/// Absolute timestamp in milliseconds since the Unix epoch
using TimestampMs = int64_t;

/**
 * @brief Source of absolute timestamps
 *
 * Returns milliseconds since the Unix epoch. Injected into components
 * that compare timestamps so tests can drive time explicitly.
 */
using TimeSource = std::function<TimestampMs()>;

/**
 * @brief Current wall-clock time in milliseconds since the Unix epoch
 */
[[nodiscard]] inline TimestampMs currentTimeMs() noexcept {
    return std::chrono::duration_cast<Milliseconds>(
        Clock::now().time_since_epoch()).count();
}

/**
 * @brief Default time source backed by the system clock
 */
[[nodiscard]] inline TimeSource systemTimeSource() {
    return [] { return currentTimeMs(); };
}

// ============================================================================
// Callback Types
// ============================================================================

/// Zero-argument notification (warning, timeout)
using Notification = std::function<void()>;

} // namespace Vigil

#endif // VIGIL_CORE_TYPES_HPP
