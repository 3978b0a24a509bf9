/**
 * @file HeartbeatMonitor.cpp
 * @brief Connection inactivity monitor implementation
 * @author Vigil Networking Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Vigil Networking. All rights reserved.
 */

#include <Vigil/Core/HeartbeatMonitor.hpp>
#include <Vigil/Core/Logger.hpp>
#include <mutex>

namespace Vigil::Network {

// ============================================================================
// HeartbeatMonitor Implementation
// ============================================================================

class HeartbeatMonitor::Impl {
public:
    Impl(std::shared_ptr<PeriodicScheduler> scheduler, TimeSource timeSource)
        : m_scheduler(std::move(scheduler))
        , m_timeSource(std::move(timeSource))
    {
        if (!m_scheduler) {
            m_scheduler = defaultScheduler();
        }
        if (!m_timeSource) {
            m_timeSource = systemTimeSource();
        }
    }

    ~Impl() {
        stop();
    }

    Result<void> start(std::shared_ptr<KeepAliveData> keepAliveData,
                       std::shared_ptr<Connection> connection) {
        if (!keepAliveData) {
            VIGIL_LOG_ERROR("Heartbeat monitor start rejected: keep-alive data is null");
            return ErrorCode::InvalidArgument;
        }

        if (!connection) {
            VIGIL_LOG_ERROR("Heartbeat monitor start rejected: connection is null");
            return ErrorCode::InvalidArgument;
        }

        auto valid = keepAliveData->validate();
        if (valid.isFailure()) {
            VIGIL_LOG_ERROR_F("Heartbeat monitor start rejected: invalid timings (%s)",
                              keepAliveData->describe().c_str());
            return valid.error();
        }

        bool startedBefore = false;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            startedBefore = (m_keepAliveData != nullptr);
        }
        if (startedBefore) {
            stop();
        }

        std::unique_ptr<ScheduledTask> superseded;
        std::string timings = keepAliveData->describe();
        {
            std::lock_guard<std::mutex> lock(m_mutex);

            // A concurrent start() may have slipped in after stop()
            superseded = std::move(m_task);

            m_keepAliveData = std::move(keepAliveData);
            m_timedOut = false;
            m_hasBeenWarned = false;
            m_running = true;
            uint64_t session = ++m_session;

            auto task = m_scheduler->schedule(
                m_keepAliveData->getCheckInterval(),
                [this, session, connection]() {
                    check(session, *connection);
                });

            if (task.isFailure()) {
                m_running = false;
                VIGIL_LOG_ERROR_F("Heartbeat monitor failed to schedule checks: %s",
                                  std::string(getErrorMessage(task.error())).c_str());
                return task.error();
            }

            m_task = std::move(task).value();
        }

        if (superseded) {
            superseded->cancel();
        }

        VIGIL_LOG_INFO_F("Heartbeat monitor started (%s)", timings.c_str());
        return Result<void>::Success();
    }

    void stop() noexcept {
        std::unique_ptr<ScheduledTask> task;
        bool wasRunning = false;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            wasRunning = m_running;
            m_running = false;
            task = std::move(m_task);
        }

        // Outside the lock: a check waiting on m_mutex must finish before
        // its worker can be joined
        if (task) {
            task->cancel();
        }

        if (wasRunning) {
            VIGIL_LOG_INFO("Heartbeat monitor stopped");
        }
    }

    void beat() noexcept {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_keepAliveData) {
            m_keepAliveData->setLastActivity(m_timeSource());
        }
    }

    bool isRunning() const noexcept {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_running;
    }

    bool hasBeenWarned() const noexcept {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_hasBeenWarned;
    }

    bool hasTimedOut() const noexcept {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_timedOut;
    }

    HeartbeatMonitorStatus getStatus() const noexcept {
        std::lock_guard<std::mutex> lock(m_mutex);

        HeartbeatMonitorStatus status;
        status.isRunning = m_running;
        status.hasBeenWarned = m_hasBeenWarned;
        status.timedOut = m_timedOut;
        status.checksEvaluated = m_checksEvaluated;
        status.checksSkipped = m_checksSkipped;
        status.warningsFired = m_warningsFired;
        status.timeoutsFired = m_timeoutsFired;
        return status;
    }

    Notification getOnWarning() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_onWarning;
    }

    void setOnWarning(Notification onWarning) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_onWarning = std::move(onWarning);
    }

    Notification getOnTimeout() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_onTimeout;
    }

    void setOnTimeout(Notification onTimeout) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_onTimeout = std::move(onTimeout);
    }

    std::shared_ptr<KeepAliveData> getKeepAliveData() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_keepAliveData;
    }

    void setKeepAliveData(std::shared_ptr<KeepAliveData> keepAliveData) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_keepAliveData = std::move(keepAliveData);
    }

private:
    enum class Transition {
        None,
        Warned,
        TimedOut
    };

    void check(uint64_t session, const Connection& connection) {
        Notification notification;
        Transition transition = Transition::None;
        int64_t elapsed = 0;
        int64_t threshold = 0;

        {
            std::lock_guard<std::mutex> lock(m_mutex);

            // Stopped, or superseded by a newer start()
            if (!m_running || session != m_session || !m_keepAliveData) {
                return;
            }

            ConnectionState state = connection.getState();
            if (state != ConnectionState::Connected) {
                ++m_checksSkipped;
                VIGIL_LOG_TRACE_F("Heartbeat check skipped: connection is %s",
                                  connectionStateToString(state));
                return;
            }

            ++m_checksEvaluated;
            elapsed = m_timeSource() - m_keepAliveData->getLastActivity();

            if (elapsed >= m_keepAliveData->getTimeoutThreshold().count()) {
                if (!m_timedOut) {
                    m_timedOut = true;
                    ++m_timeoutsFired;
                    transition = Transition::TimedOut;
                    threshold = m_keepAliveData->getTimeoutThreshold().count();
                    notification = m_onTimeout;
                }
            } else if (elapsed >= m_keepAliveData->getWarningThreshold().count()) {
                if (!m_hasBeenWarned) {
                    m_hasBeenWarned = true;
                    ++m_warningsFired;
                    transition = Transition::Warned;
                    threshold = m_keepAliveData->getWarningThreshold().count();
                    notification = m_onWarning;
                }
            } else {
                m_hasBeenWarned = false;
                m_timedOut = false;
            }
        }

        switch (transition) {
            case Transition::Warned:
                VIGIL_LOG_WARNING_F("Connection silent for %lld ms (warning threshold %lld ms)",
                                    static_cast<long long>(elapsed),
                                    static_cast<long long>(threshold));
                break;
            case Transition::TimedOut:
                VIGIL_LOG_ERROR_F("Connection silent for %lld ms (timeout threshold %lld ms)",
                                  static_cast<long long>(elapsed),
                                  static_cast<long long>(threshold));
                break;
            case Transition::None:
                break;
        }

        if (!notification) {
            return;
        }

        try {
            notification();
        } catch (const std::exception& e) {
            VIGIL_LOG_ERROR_F("Heartbeat %s callback threw: %s",
                              transition == Transition::TimedOut ? "timeout" : "warning",
                              e.what());
        }
    }

    std::shared_ptr<PeriodicScheduler> m_scheduler;
    TimeSource m_timeSource;

    mutable std::mutex m_mutex;
    std::unique_ptr<ScheduledTask> m_task;
    std::shared_ptr<KeepAliveData> m_keepAliveData;
    uint64_t m_session = 0;

    bool m_running = false;
    bool m_hasBeenWarned = false;
    bool m_timedOut = false;

    uint64_t m_checksEvaluated = 0;
    uint64_t m_checksSkipped = 0;
    uint64_t m_warningsFired = 0;
    uint64_t m_timeoutsFired = 0;

    Notification m_onWarning;
    Notification m_onTimeout;
};

// ============================================================================
// HeartbeatMonitor Public API
// ============================================================================

HeartbeatMonitor::HeartbeatMonitor()
    : m_impl(std::make_unique<Impl>(defaultScheduler(), systemTimeSource()))
{
}

HeartbeatMonitor::HeartbeatMonitor(std::shared_ptr<PeriodicScheduler> scheduler,
                                   TimeSource timeSource)
    : m_impl(std::make_unique<Impl>(std::move(scheduler), std::move(timeSource)))
{
}

HeartbeatMonitor::~HeartbeatMonitor() = default;

HeartbeatMonitor::HeartbeatMonitor(HeartbeatMonitor&&) noexcept = default;
HeartbeatMonitor& HeartbeatMonitor::operator=(HeartbeatMonitor&&) noexcept = default;

Result<void> HeartbeatMonitor::start(std::shared_ptr<KeepAliveData> keepAliveData,
                                     std::shared_ptr<Connection> connection) {
    if (!m_impl) {
        VIGIL_LOG_ERROR("Heartbeat monitor start rejected: monitor was moved from");
        return ErrorCode::InvalidState;
    }
    return m_impl->start(std::move(keepAliveData), std::move(connection));
}

void HeartbeatMonitor::stop() noexcept {
    if (m_impl) {
        m_impl->stop();
    }
}

void HeartbeatMonitor::beat() noexcept {
    if (m_impl) {
        m_impl->beat();
    }
}

bool HeartbeatMonitor::isRunning() const noexcept {
    return m_impl && m_impl->isRunning();
}

bool HeartbeatMonitor::hasBeenWarned() const noexcept {
    return m_impl && m_impl->hasBeenWarned();
}

bool HeartbeatMonitor::hasTimedOut() const noexcept {
    return m_impl && m_impl->hasTimedOut();
}

HeartbeatMonitorStatus HeartbeatMonitor::getStatus() const noexcept {
    if (!m_impl) {
        return HeartbeatMonitorStatus{};
    }
    return m_impl->getStatus();
}

Notification HeartbeatMonitor::getOnWarning() const {
    return m_impl ? m_impl->getOnWarning() : Notification{};
}

void HeartbeatMonitor::setOnWarning(Notification onWarning) {
    if (m_impl) {
        m_impl->setOnWarning(std::move(onWarning));
    }
}

Notification HeartbeatMonitor::getOnTimeout() const {
    return m_impl ? m_impl->getOnTimeout() : Notification{};
}

void HeartbeatMonitor::setOnTimeout(Notification onTimeout) {
    if (m_impl) {
        m_impl->setOnTimeout(std::move(onTimeout));
    }
}

std::shared_ptr<KeepAliveData> HeartbeatMonitor::getKeepAliveData() const {
    return m_impl ? m_impl->getKeepAliveData() : nullptr;
}

void HeartbeatMonitor::setKeepAliveData(std::shared_ptr<KeepAliveData> keepAliveData) {
    if (m_impl) {
        m_impl->setKeepAliveData(std::move(keepAliveData));
    }
}

} // namespace Vigil::Network
