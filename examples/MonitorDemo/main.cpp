/**
 * @file main.cpp
 * @brief Heartbeat monitor demo
 *
 * Simulates a connection whose peer answers for a while and then goes
 * silent. The monitor reports the slow connection, then the timeout,
 * and the demo "reconnects" by restarting the monitor.
 *
 * Usage: monitor_demo [config.json]
 *
 * Copyright (c) 2025 Vigil Networking. All rights reserved.
 */

#include <Vigil/Core/HeartbeatMonitor.hpp>
#include <Vigil/Core/Config.hpp>
#include <Vigil/Core/Logger.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <thread>

using namespace Vigil;
using namespace Vigil::Network;

namespace {

class SimulatedConnection final : public Connection {
public:
    ConnectionState getState() const override { return m_state.load(); }
    void setState(ConnectionState state) { m_state.store(state); }

private:
    std::atomic<ConnectionState> m_state{ConnectionState::Connecting};
};

Config::MonitorConfig defaultConfig() {
    Config::MonitorConfig config;
    config.keepAlive = KeepAliveData::fromTimeout(Milliseconds{1500});
    config.logging.level = Core::LogLevel::Debug;
    return config;
}

} // namespace

int main(int argc, char* argv[]) {
    Config::MonitorConfig config = defaultConfig();

    if (argc > 1) {
        Config::KeepAliveConfigLoader loader;
        auto loaded = loader.load(argv[1]);
        if (loaded.isFailure()) {
            std::cerr << "Failed to load " << argv[1] << ": "
                      << getErrorMessage(loaded.error()) << std::endl;
            return 1;
        }
        config = std::move(loaded).value();
    }

    Config::initializeLogging(config.logging);
    VIGIL_LOG_INFO_F("Vigil monitor demo %s", VERSION_STRING);
    VIGIL_LOG_INFO_F("Keep-alive timings: %s", config.keepAlive.describe().c_str());

    auto connection = std::make_shared<SimulatedConnection>();
    auto keepAlive = std::make_shared<KeepAliveData>(config.keepAlive);

    std::mutex mutex;
    std::condition_variable timedOut;
    bool timeoutSeen = false;

    HeartbeatMonitor monitor;
    monitor.setOnWarning([] {
        std::cout << "Connection is slow" << std::endl;
    });
    monitor.setOnTimeout([&] {
        std::cout << "Connection timed out" << std::endl;
        connection->setState(ConnectionState::Reconnecting);
        {
            std::lock_guard<std::mutex> lock(mutex);
            timeoutSeen = true;
        }
        timedOut.notify_all();
    });

    connection->setState(ConnectionState::Connected);
    keepAlive->setLastActivity(currentTimeMs());

    auto started = monitor.start(keepAlive, connection);
    if (started.isFailure()) {
        std::cerr << "Failed to start monitor: " << getErrorMessage(started.error()) << std::endl;
        return 1;
    }

    // Peer answers for a couple of thresholds' worth of time
    auto chattyUntil = SteadyClock::now() + config.keepAlive.getTimeoutThreshold() * 2;
    while (SteadyClock::now() < chattyUntil) {
        monitor.beat();
        std::this_thread::sleep_for(config.keepAlive.getCheckInterval());
    }
    std::cout << "Peer went silent" << std::endl;

    {
        std::unique_lock<std::mutex> lock(mutex);
        timedOut.wait_for(lock, config.keepAlive.getTimeoutThreshold() * 3,
                          [&] { return timeoutSeen; });
    }

    auto status = monitor.getStatus();
    std::cout << "Checks: " << status.checksEvaluated
              << " evaluated, " << status.checksSkipped << " skipped; "
              << status.warningsFired << " warning(s), "
              << status.timeoutsFired << " timeout(s)" << std::endl;

    // Reconnect and monitor the fresh connection
    monitor.stop();
    connection->setState(ConnectionState::Connected);
    keepAlive->setLastActivity(currentTimeMs());
    started = monitor.start(keepAlive, connection);
    if (started.isFailure()) {
        std::cerr << "Failed to restart monitor: " << getErrorMessage(started.error()) << std::endl;
        return 1;
    }
    std::cout << "Reconnected, warned=" << std::boolalpha << monitor.hasBeenWarned() << std::endl;

    monitor.stop();
    Core::Logger::Instance().Shutdown();
    return timeoutSeen ? 0 : 2;
}
