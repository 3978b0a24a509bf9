/**
 * @file ThreadScheduler.cpp
 * @brief Thread-backed periodic task execution
 * @author Vigil Networking Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Vigil Networking. All rights reserved.
 */

#include <Vigil/Core/Scheduler.hpp>
#include <Vigil/Core/Logger.hpp>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <system_error>
#include <utility>
#include <vector>

namespace Vigil::Network {

namespace {

/**
 * State shared between a worker handle and its thread. The thread keeps
 * its own reference so an orphaned worker never touches freed memory.
 */
struct TaskState {
    std::mutex mutex;
    std::condition_variable cv;
    bool cancelled = false;
    bool finished = false;
};

/// A worker thread whose task cancelled itself
struct Orphan {
    std::thread thread;
    std::shared_ptr<TaskState> state;
};

void releaseThread(std::thread& thread) noexcept {
    try {
        if (thread.get_id() == std::this_thread::get_id()) {
            thread.detach();
        } else {
            thread.join();
        }
    } catch (const std::system_error& e) {
        VIGIL_LOG_ERROR_F("Failed to release scheduler thread: %s", e.what());
    }
}

} // namespace

// ============================================================================
// Orphan bookkeeping
// ============================================================================

struct ThreadScheduler::Orphans {
    std::mutex mutex;
    std::vector<Orphan> threads;
    bool closed = false;
};

// ============================================================================
// Worker
// ============================================================================

class ThreadScheduler::Worker final : public ScheduledTask {
public:
    Worker(Milliseconds period, PeriodicScheduler::Task task, std::weak_ptr<Orphans> orphans)
        : m_state(std::make_shared<TaskState>())
        , m_orphans(std::move(orphans))
    {
        auto state = m_state;
        m_thread = std::thread([state, period, task = std::move(task)]() {
            runLoop(state, period, task);

            std::lock_guard<std::mutex> lock(state->mutex);
            state->finished = true;
        });
    }

    ~Worker() override {
        cancel();
    }

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    void cancel() noexcept override {
        {
            std::lock_guard<std::mutex> lock(m_state->mutex);
            m_state->cancelled = true;
        }

        // Wake up worker if it's waiting
        m_state->cv.notify_all();

        if (!m_thread.joinable()) {
            return;
        }

        if (m_thread.get_id() == std::this_thread::get_id()) {
            // Cancelled from inside the task: the thread exits once the
            // current run returns and is joined by the scheduler later
            adopt();
            return;
        }

        releaseThread(m_thread);
    }

    bool isCancelled() const noexcept override {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        return m_state->cancelled;
    }

private:
    static void runLoop(const std::shared_ptr<TaskState>& state,
                        Milliseconds period,
                        const PeriodicScheduler::Task& task) {
        auto next = SteadyClock::now() + period;

        while (true) {
            {
                std::unique_lock<std::mutex> lock(state->mutex);
                if (state->cv.wait_until(lock, next, [&state] { return state->cancelled; })) {
                    break;
                }
            }

            try {
                task();
            } catch (const std::exception& e) {
                VIGIL_LOG_ERROR_F("Scheduled task threw: %s", e.what());
            }

            next += period;
            auto now = SteadyClock::now();
            if (next < now) {
                next = now;
            }
        }
    }

    void adopt() noexcept {
        if (auto orphans = m_orphans.lock()) {
            try {
                std::lock_guard<std::mutex> lock(orphans->mutex);
                if (!orphans->closed) {
                    orphans->threads.push_back(Orphan{std::move(m_thread), m_state});
                    return;
                }
            } catch (const std::exception& e) {
                VIGIL_LOG_ERROR_F("Failed to hand scheduler thread over: %s", e.what());
            }
        }

        // Scheduler already gone; nothing is left to join the thread
        releaseThread(m_thread);
    }

    std::shared_ptr<TaskState> m_state;
    std::weak_ptr<Orphans> m_orphans;
    std::thread m_thread;
};

// ============================================================================
// ThreadScheduler
// ============================================================================

ThreadScheduler::ThreadScheduler()
    : m_orphans(std::make_shared<Orphans>())
{
}

ThreadScheduler::~ThreadScheduler() {
    std::vector<Orphan> threads;
    {
        std::lock_guard<std::mutex> lock(m_orphans->mutex);
        m_orphans->closed = true;
        threads.swap(m_orphans->threads);
    }

    // The last reference may be dropped by an orphan itself, which
    // releaseThread() detaches
    for (auto& orphan : threads) {
        releaseThread(orphan.thread);
    }
}

Result<std::unique_ptr<ScheduledTask>> ThreadScheduler::schedule(Milliseconds period, Task task) {
    if (period.count() <= 0 || !task) {
        return ErrorCode::InvalidArgument;
    }

    reapFinished();

    try {
        return std::unique_ptr<ScheduledTask>(
            std::make_unique<Worker>(period, std::move(task), m_orphans));
    } catch (const std::system_error& e) {
        VIGIL_LOG_ERROR_F("Failed to start scheduler thread: %s", e.what());
        return ErrorCode::ThreadCreationFailed;
    }
}

void ThreadScheduler::reapFinished() {
    std::vector<Orphan> finished;
    {
        std::lock_guard<std::mutex> lock(m_orphans->mutex);
        auto& threads = m_orphans->threads;
        finished.reserve(threads.size());
        for (auto it = threads.begin(); it != threads.end();) {
            bool done = false;
            {
                std::lock_guard<std::mutex> stateLock(it->state->mutex);
                done = it->state->finished;
            }
            if (done) {
                finished.push_back(std::move(*it));
                it = threads.erase(it);
            } else {
                ++it;
            }
        }
    }

    // Only threads past their last run are joined here, so this never blocks
    // on a task that is still executing
    for (auto& orphan : finished) {
        releaseThread(orphan.thread);
    }
}

std::shared_ptr<PeriodicScheduler> defaultScheduler() {
    static std::shared_ptr<PeriodicScheduler> instance = std::make_shared<ThreadScheduler>();
    return instance;
}

} // namespace Vigil::Network
