/**
 * @file Connection.hpp
 * @brief Minimal view of a monitored connection
 * @author Vigil Networking Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Vigil Networking. All rights reserved.
 */

#pragma once

#ifndef VIGIL_CORE_CONNECTION_HPP
#define VIGIL_CORE_CONNECTION_HPP

#include <cstdint>

namespace Vigil::Network {

/**
 * @brief Lifecycle state of a persistent connection
 */
enum class ConnectionState : uint8_t {
    Connecting = 0,
    Connected = 1,
    Reconnecting = 2,
    Disconnected = 3
};

/**
 * @brief Convert connection state to string
 */
[[nodiscard]] constexpr const char* connectionStateToString(ConnectionState state) noexcept {
    switch (state) {
        case ConnectionState::Connecting:   return "Connecting";
        case ConnectionState::Connected:    return "Connected";
        case ConnectionState::Reconnecting: return "Reconnecting";
        case ConnectionState::Disconnected: return "Disconnected";
        default:                            return "Unknown";
    }
}

/**
 * @brief Connection as seen by the heartbeat monitor
 *
 * The transport owns the real connection; the monitor only asks for its
 * state once per tick. Implementations must make getState() safe to call
 * from the monitor's background thread.
 */
class Connection {
public:
    virtual ~Connection() = default;

    [[nodiscard]] virtual ConnectionState getState() const = 0;
};

} // namespace Vigil::Network

#endif // VIGIL_CORE_CONNECTION_HPP
