/**
 * @file KeepAliveData.cpp
 * @brief Keep-alive timing holder
 * @author Vigil Networking Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Vigil Networking. All rights reserved.
 */

#include <Vigil/Core/KeepAliveData.hpp>
#include <sstream>

namespace Vigil::Network {

KeepAliveData::KeepAliveData(TimestampMs lastActivity,
                             Milliseconds timeoutThreshold,
                             Milliseconds warningThreshold,
                             Milliseconds checkInterval)
    : m_lastActivity(lastActivity)
    , m_timeoutThreshold(timeoutThreshold)
    , m_warningThreshold(warningThreshold)
    , m_checkInterval(checkInterval)
{
}

KeepAliveData KeepAliveData::fromTimeout(Milliseconds timeout, TimestampMs now) {
    // timeout * 2 / 3 without the intermediate overflow
    const int64_t t = timeout.count();
    Milliseconds warning{t / 3 * 2 + (t % 3) * 2 / 3};
    Milliseconds interval{(timeout.count() - warning.count()) / 3};
    return KeepAliveData(now, timeout, warning, interval);
}

Result<void> KeepAliveData::validate() const noexcept {
    if (m_checkInterval.count() <= 0) {
        return ErrorCode::InvalidArgument;
    }
    if (m_warningThreshold.count() <= 0) {
        return ErrorCode::InvalidArgument;
    }
    if (m_warningThreshold >= m_timeoutThreshold) {
        return ErrorCode::InvalidArgument;
    }
    return Result<void>::Success();
}

std::string KeepAliveData::describe() const {
    std::ostringstream oss;
    oss << "interval=" << m_checkInterval.count() << "ms"
        << " warning=" << m_warningThreshold.count() << "ms"
        << " timeout=" << m_timeoutThreshold.count() << "ms";
    return oss.str();
}

} // namespace Vigil::Network
