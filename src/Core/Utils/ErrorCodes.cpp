/**
 * @file ErrorCodes.cpp
 * @brief Human-readable descriptions for Vigil error codes
 * @author Vigil Networking Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Vigil Networking. All rights reserved.
 */

#include <Vigil/Core/ErrorCodes.hpp>

namespace Vigil {

std::string_view getErrorMessage(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success:              return "Success";

        case ErrorCode::ThreadCreationFailed: return "Thread creation failed";

        case ErrorCode::ConfigInvalid:        return "Invalid configuration value";
        case ErrorCode::ConfigFileNotFound:   return "Configuration file not found";

        case ErrorCode::FileReadError:        return "File read error";
        case ErrorCode::FileTooLarge:         return "File too large";

        case ErrorCode::JsonParseFailed:      return "JSON parse error";
        case ErrorCode::MissingField:         return "Missing required field";
        case ErrorCode::InvalidFieldType:     return "Invalid field type";

        case ErrorCode::InternalError:        return "Internal error";
        case ErrorCode::InvalidState:         return "Invalid state";
        case ErrorCode::InvalidArgument:      return "Invalid argument";
    }
    return "Unknown error";
}

std::string_view getCategoryName(ErrorCategory category) noexcept {
    switch (category) {
        case ErrorCategory::None:     return "None";
        case ErrorCategory::System:   return "System";
        case ErrorCategory::Config:   return "Config";
        case ErrorCategory::IO:       return "IO";
        case ErrorCategory::Parse:    return "Parse";
        case ErrorCategory::Internal: return "Internal";
    }
    return "Unknown";
}

} // namespace Vigil
