/**
 * @file Scheduler.hpp
 * @brief Cancellable periodic task execution
 * @author Vigil Networking Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Vigil Networking. All rights reserved.
 *
 * A PeriodicScheduler hands out ScheduledTask handles. Each handle owns
 * the execution resource behind one recurring task; cancelling (or
 * destroying) the handle stops the task and releases that resource.
 */

#pragma once

#ifndef VIGIL_CORE_SCHEDULER_HPP
#define VIGIL_CORE_SCHEDULER_HPP

#include <Vigil/Core/Types.hpp>
#include <Vigil/Core/ErrorCodes.hpp>
#include <functional>
#include <memory>

namespace Vigil::Network {

/**
 * @brief Handle to one recurring task
 */
class ScheduledTask {
public:
    virtual ~ScheduledTask() = default;

    /**
     * @brief Stop the task and release its execution resource
     *
     * Idempotent. Once cancel() returns, no new run of the task starts.
     * A run already in progress on another thread is waited for; a call
     * made from inside the task itself returns immediately and the task
     * finishes its current run without being rescheduled.
     *
     * In the self-cancel case the execution resource outlives cancel().
     * Implementations must still release it later; ThreadScheduler joins
     * such workers on its next schedule() or in its destructor.
     */
    virtual void cancel() noexcept = 0;

    [[nodiscard]] virtual bool isCancelled() const noexcept = 0;
};

/**
 * @brief Factory for recurring tasks
 */
class PeriodicScheduler {
public:
    using Task = std::function<void()>;

    virtual ~PeriodicScheduler() = default;

    /**
     * @brief Run @p task every @p period, first run after one period
     * @return Task handle, or InvalidArgument for a non-positive period
     *         or an empty task, or ThreadCreationFailed
     */
    [[nodiscard]] virtual Result<std::unique_ptr<ScheduledTask>> schedule(
        Milliseconds period, Task task) = 0;
};

/**
 * @brief Scheduler backed by one worker thread per task
 *
 * Runs are paced at a fixed rate against the steady clock. If a run
 * overruns its period, the next run starts immediately and the schedule
 * is re-anchored rather than bursting to catch up.
 */
class ThreadScheduler final : public PeriodicScheduler {
public:
    ThreadScheduler();

    /**
     * @brief Joins every worker whose task cancelled itself
     *
     * Handles still alive keep their own worker and join it on cancel().
     */
    ~ThreadScheduler() override;

    // Non-copyable
    ThreadScheduler(const ThreadScheduler&) = delete;
    ThreadScheduler& operator=(const ThreadScheduler&) = delete;

    /**
     * @brief Start a worker thread for @p task
     *
     * Also joins workers that cancelled themselves and have since exited.
     */
    [[nodiscard]] Result<std::unique_ptr<ScheduledTask>> schedule(
        Milliseconds period, Task task) override;

private:
    class Worker;
    struct Orphans;

    void reapFinished();

    std::shared_ptr<Orphans> m_orphans;
};

/**
 * @brief Process-wide ThreadScheduler used when none is injected
 */
[[nodiscard]] std::shared_ptr<PeriodicScheduler> defaultScheduler();

} // namespace Vigil::Network

#endif // VIGIL_CORE_SCHEDULER_HPP
