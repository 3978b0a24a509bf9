/**
 * @file KeepAliveData.hpp
 * @brief Keep-alive timings shared between a connection and its monitor
 * @author Vigil Networking Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Vigil Networking. All rights reserved.
 */

#pragma once

#ifndef VIGIL_CORE_KEEP_ALIVE_DATA_HPP
#define VIGIL_CORE_KEEP_ALIVE_DATA_HPP

#include <Vigil/Core/Types.hpp>
#include <Vigil/Core/ErrorCodes.hpp>
#include <string>

namespace Vigil::Network {

/**
 * @brief Last-activity timestamp plus the three inactivity thresholds
 *
 * Plain value holder. It is shared (via std::shared_ptr) between the
 * caller and a HeartbeatMonitor, which rewrites lastActivity on every
 * beat() under its own lock. Writers outside the monitor must
 * coordinate with it; the object itself is not synchronized.
 *
 * Invariant: 0 < checkInterval, 0 < warningThreshold < timeoutThreshold.
 */
class KeepAliveData {
public:
    KeepAliveData() = default;

    KeepAliveData(TimestampMs lastActivity,
                  Milliseconds timeoutThreshold,
                  Milliseconds warningThreshold,
                  Milliseconds checkInterval);

    /**
     * @brief Derive all thresholds from a single keep-alive timeout
     *
     * warning = timeout * 2 / 3, checkInterval = (timeout - warning) / 3,
     * lastActivity = now.
     */
    [[nodiscard]] static KeepAliveData fromTimeout(Milliseconds timeout,
                                                   TimestampMs now = currentTimeMs());

    [[nodiscard]] TimestampMs getLastActivity() const noexcept { return m_lastActivity; }
    void setLastActivity(TimestampMs timestamp) noexcept { m_lastActivity = timestamp; }

    [[nodiscard]] Milliseconds getTimeoutThreshold() const noexcept { return m_timeoutThreshold; }
    void setTimeoutThreshold(Milliseconds threshold) noexcept { m_timeoutThreshold = threshold; }

    [[nodiscard]] Milliseconds getWarningThreshold() const noexcept { return m_warningThreshold; }
    void setWarningThreshold(Milliseconds threshold) noexcept { m_warningThreshold = threshold; }

    [[nodiscard]] Milliseconds getCheckInterval() const noexcept { return m_checkInterval; }
    void setCheckInterval(Milliseconds interval) noexcept { m_checkInterval = interval; }

    /**
     * @brief Check the timing invariant
     * @return Success, or InvalidArgument when a threshold is out of order
     */
    [[nodiscard]] Result<void> validate() const noexcept;

    /// e.g. "interval=100ms warning=300ms timeout=600ms"
    [[nodiscard]] std::string describe() const;

private:
    TimestampMs m_lastActivity = 0;
    Milliseconds m_timeoutThreshold{0};
    Milliseconds m_warningThreshold{0};
    Milliseconds m_checkInterval{0};
};

} // namespace Vigil::Network

#endif // VIGIL_CORE_KEEP_ALIVE_DATA_HPP
