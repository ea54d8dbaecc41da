#include <rtvoice/core/error.hpp>
#include <unordered_map>

namespace rtvoice::core {

namespace {
    const std::unordered_map<ErrorCode, const char*> ERROR_MESSAGES = {
        // System errors
        {ErrorCode::Success, "Success"},
        {ErrorCode::Unknown, "Unknown error"},
        {ErrorCode::InvalidArgument, "Invalid argument"},
        {ErrorCode::InvalidState, "Invalid state"},
        {ErrorCode::NotImplemented, "Not implemented"},
        {ErrorCode::NotSupported, "Not supported"},
        {ErrorCode::Cancelled, "Operation cancelled"},

        // Network errors
        {ErrorCode::NetworkError, "Network error"},
        {ErrorCode::ConnectionFailed, "Connection failed"},
        {ErrorCode::ConnectionClosed, "Connection closed"},
        {ErrorCode::ConnectionTimeout, "Connection timeout"},
        {ErrorCode::InvalidAddress, "Invalid address"},

        // Signaling / protocol errors
        {ErrorCode::SignalingFailed, "Signaling failed"},
        {ErrorCode::AuthenticationFailed, "Authentication failed"},
        {ErrorCode::ProtocolError, "Protocol error"},
        {ErrorCode::WebRtcError, "WebRTC error"},

        // Media errors
        {ErrorCode::MediaError, "Media error"},
        {ErrorCode::DeviceNotFound, "Device not found"},
        {ErrorCode::InvalidFormat, "Invalid format"},

        // Resource errors
        {ErrorCode::ResourceNotFound, "Resource not found"},
        {ErrorCode::FileNotFound, "File not found"},
        {ErrorCode::FileAccessDenied, "File access denied"},
        {ErrorCode::InvalidData, "Invalid data"}
    };

    const std::unordered_map<ErrorCode, std::error_condition> ERROR_CONDITIONS = {
        {ErrorCode::Cancelled, std::errc::operation_canceled},
        {ErrorCode::NetworkError, std::errc::network_unreachable},
        {ErrorCode::ConnectionFailed, std::errc::connection_refused},
        {ErrorCode::ConnectionClosed, std::errc::connection_reset},
        {ErrorCode::ConnectionTimeout, std::errc::timed_out},
        {ErrorCode::AuthenticationFailed, std::errc::permission_denied},
        {ErrorCode::DeviceNotFound, std::errc::no_such_device},
        {ErrorCode::FileNotFound, std::errc::no_such_file_or_directory},
        {ErrorCode::FileAccessDenied, std::errc::permission_denied},
        {ErrorCode::InvalidData, std::errc::invalid_argument}
    };
}

std::string ErrorCategory::message(int ev) const {
    auto code = static_cast<ErrorCode>(ev);
    auto it = ERROR_MESSAGES.find(code);
    return it != ERROR_MESSAGES.end() ? it->second : "Unknown error";
}

std::error_condition ErrorCategory::default_error_condition(int ev) const noexcept {
    auto code = static_cast<ErrorCode>(ev);
    auto it = ERROR_CONDITIONS.find(code);
    return it != ERROR_CONDITIONS.end() ? it->second : std::error_condition(ev, *this);
}

} // namespace rtvoice::core
