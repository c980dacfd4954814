#include "zapwire/Error.hpp"

namespace zapwire {

namespace {

std::string format_message(ErrorCode code, const std::string& message) {
    std::string formatted = "[";
    formatted.append(error_code_name(code));
    formatted.append("] ");
    formatted.append(message);
    return formatted;
}

}  // namespace

std::string_view error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::ProtocolVersionMismatch:
            return "ProtocolVersionMismatch";
        case ErrorCode::KeyExchangeFailed:
            return "KeyExchangeFailed";
        case ErrorCode::AuthFailure:
            return "AuthFailure";
        case ErrorCode::FrameTooLarge:
            return "FrameTooLarge";
        case ErrorCode::TransferIncomplete:
            return "TransferIncomplete";
        case ErrorCode::RelayError:
            return "RelayError";
        case ErrorCode::IOError:
            return "IOError";
        case ErrorCode::ProtocolViolation:
            return "ProtocolViolation";
        case ErrorCode::PeerAborted:
            return "PeerAborted";
    }
    return "Unknown";
}

Error::Error(ErrorCode code, const std::string& message)
    : std::runtime_error(format_message(code, message)),
      code_(code) {}

}  // namespace zapwire
