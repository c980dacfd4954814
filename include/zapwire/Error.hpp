#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace zapwire {

enum class ErrorCode {
    ProtocolVersionMismatch,
    KeyExchangeFailed,
    AuthFailure,
    FrameTooLarge,
    TransferIncomplete,
    RelayError,
    IOError,
    ProtocolViolation,
    PeerAborted,
};

std::string_view error_code_name(ErrorCode code) noexcept;

// Every code is terminal for the session that raised it.
class Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& message);

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

}  // namespace zapwire
