/**
 * @file HeartbeatMonitor.hpp
 * @brief Inactivity monitor for persistent connections
 * @author Vigil Networking Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Vigil Networking. All rights reserved.
 *
 * This module detects silently dead connections: a connection whose peer
 * stopped sending anything without closing it. The owner reports every
 * sign of life with beat(); a background check compares the time since
 * the last beat against the warning and timeout thresholds.
 */

#pragma once

#ifndef VIGIL_CORE_HEARTBEAT_MONITOR_HPP
#define VIGIL_CORE_HEARTBEAT_MONITOR_HPP

#include <Vigil/Core/Types.hpp>
#include <Vigil/Core/ErrorCodes.hpp>
#include <Vigil/Core/Connection.hpp>
#include <Vigil/Core/KeepAliveData.hpp>
#include <Vigil/Core/Scheduler.hpp>
#include <memory>
#include <cstdint>

namespace Vigil::Network {

/**
 * @brief Snapshot of monitor state
 */
struct HeartbeatMonitorStatus {
    /// Between a successful start() and the next stop()
    bool isRunning = false;

    /// Warning fired and not yet cleared by a healthy check
    bool hasBeenWarned = false;

    /// Timeout fired and not yet cleared by a healthy check
    bool timedOut = false;

    /// Checks that reached the threshold logic (connection was Connected)
    uint64_t checksEvaluated = 0;

    /// Checks skipped because the connection was not Connected
    uint64_t checksSkipped = 0;

    uint64_t warningsFired = 0;
    uint64_t timeoutsFired = 0;
};

/**
 * @brief Connection inactivity monitor
 *
 * Every checkInterval the monitor looks at how long the connection has
 * been silent:
 * - silent >= timeoutThreshold: timeout callback, once per episode
 * - silent >= warningThreshold: warning callback, once per episode
 * - otherwise: healthy, both episodes end and may fire again later
 *
 * Checks only run while the connection reports Connected.
 *
 * Thread safety:
 * - start(), stop() and beat() may be called from any thread, including
 *   from inside a callback.
 * - Callbacks run on the scheduler's thread with no internal lock held.
 * - Connection::getState() is called with the internal lock held and
 *   must not call back into the monitor.
 *
 * @example
 * ```cpp
 * auto keepAlive = std::make_shared<KeepAliveData>(
 *     KeepAliveData::fromTimeout(Milliseconds{20000}));
 *
 * HeartbeatMonitor monitor;
 * monitor.setOnWarning([] { showSlowConnectionBanner(); });
 * monitor.setOnTimeout([&] { transport.reconnect(); });
 *
 * if (monitor.start(keepAlive, connection).isSuccess()) {
 *     // call monitor.beat() whenever anything arrives on the connection
 * }
 * ```
 */
class HeartbeatMonitor {
public:
    /**
     * @brief Monitor using the default thread scheduler and system clock
     */
    HeartbeatMonitor();

    /**
     * @brief Monitor with injected scheduler and time source
     * @param scheduler Executes the periodic check
     * @param timeSource Returns the current time in ms since the epoch
     */
    explicit HeartbeatMonitor(std::shared_ptr<PeriodicScheduler> scheduler,
                              TimeSource timeSource = systemTimeSource());

    /**
     * @brief Destructor - stops the monitor if running
     */
    ~HeartbeatMonitor();

    // Non-copyable
    HeartbeatMonitor(const HeartbeatMonitor&) = delete;
    HeartbeatMonitor& operator=(const HeartbeatMonitor&) = delete;

    /**
     * @brief Movable
     *
     * A moved-from monitor is inert: start() returns InvalidState, the
     * queries report a stopped monitor with no callbacks or keep-alive
     * data, and every other call is a no-op. Assigning a live monitor to
     * it makes it usable again.
     */
    HeartbeatMonitor(HeartbeatMonitor&&) noexcept;
    HeartbeatMonitor& operator=(HeartbeatMonitor&&) noexcept;

    /**
     * @brief Start monitoring a connection
     * @param keepAliveData Timings; shared so beat() updates are visible to the owner
     * @param connection Connection whose state gates each check
     * @return Success, InvalidArgument if either pointer is null or the
     *         timings are out of order, InvalidState on a moved-from
     *         monitor, or a scheduler error
     *
     * A monitor that was started before is stopped first, so there is never
     * more than one active schedule. Warning and timeout state is cleared.
     * The first check runs one checkInterval after start.
     */
    Result<void> start(std::shared_ptr<KeepAliveData> keepAliveData,
                       std::shared_ptr<Connection> connection);

    /**
     * @brief Stop monitoring
     *
     * Safe to call multiple times. No check runs after stop() returns
     * (unless stop() was called from a callback, in which case the
     * current check finishes without further effect). Warning/timeout
     * state and the keep-alive data are kept until the next start().
     */
    void stop() noexcept;

    /**
     * @brief Record activity on the connection
     *
     * Sets lastActivity to now. No-op if no keep-alive data is set.
     */
    void beat() noexcept;

    [[nodiscard]] bool isRunning() const noexcept;
    [[nodiscard]] bool hasBeenWarned() const noexcept;
    [[nodiscard]] bool hasTimedOut() const noexcept;
    [[nodiscard]] HeartbeatMonitorStatus getStatus() const noexcept;

    [[nodiscard]] Notification getOnWarning() const;
    void setOnWarning(Notification onWarning);

    [[nodiscard]] Notification getOnTimeout() const;
    void setOnTimeout(Notification onTimeout);

    [[nodiscard]] std::shared_ptr<KeepAliveData> getKeepAliveData() const;

    /**
     * @brief Replace the keep-alive data without rescheduling
     *
     * The check interval of a running schedule is not changed and the
     * warning/timeout state is not reset.
     */
    void setKeepAliveData(std::shared_ptr<KeepAliveData> keepAliveData);

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace Vigil::Network

#endif // VIGIL_CORE_HEARTBEAT_MONITOR_HPP
