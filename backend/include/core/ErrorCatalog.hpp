#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace ipscout::errors {

// 2100-2199: request encoding
// 2200-2299: response decoding / classification (per datagram, always recovered)
// 2300-2399: discovery socket
// 2400-2499: control channel
// 2500-2599: registry persistence
// 2600-2699: scan scheduling
// 2700-2799: registry lookups

inline constexpr int E2100_INVALID_ADDRESS = 2100;
inline constexpr int E2200_MALFORMED_FRAME = 2200;
inline constexpr int E2210_INCOMPLETE_ATTRIBUTES = 2210;
inline constexpr int E2300_SOCKET_ERROR = 2300;
inline constexpr int E2400_CONTROL_REJECTED = 2400;
inline constexpr int E2500_PERSISTENCE_FAILURE = 2500;
inline constexpr int E2600_SCAN_IN_PROGRESS = 2600;
inline constexpr int E2700_NOT_FOUND = 2700;

inline constexpr const char* MSG_E2100_INVALID_ADDRESS = "Error 2100: Invalid address";
inline constexpr const char* MSG_E2200_MALFORMED_FRAME = "Error 2200: Malformed frame";
inline constexpr const char* MSG_E2210_INCOMPLETE_ATTRIBUTES = "Error 2210: Incomplete attributes";
inline constexpr const char* MSG_E2300_SOCKET_ERROR = "Error 2300: Discovery socket error";
inline constexpr const char* MSG_E2400_CONTROL_REJECTED = "Error 2400: Control message rejected";
inline constexpr const char* MSG_E2500_PERSISTENCE_FAILURE = "Error 2500: Registry snapshot could not be written";
inline constexpr const char* MSG_E2600_SCAN_IN_PROGRESS = "Error 2600: Scan already in progress";
inline constexpr const char* MSG_E2700_NOT_FOUND = "Error 2700: Device not found";

// Catalogued detail strings.
inline constexpr const char* D2100_MAC_LENGTH = "hardware address must be 6 bytes";
inline constexpr const char* D2100_IP_LENGTH = "IPv4 address must be 4 bytes";
inline constexpr const char* D2100_MAC_SYNTAX = "hardware address must be six hex octets";
inline constexpr const char* D2100_IP_SYNTAX = "not a dotted-quad IPv4 address";
inline constexpr const char* D2200_TOO_SHORT = "frame shorter than preamble";
inline constexpr const char* D2200_BAD_PROTOCOL_ID = "unexpected protocol id";
inline constexpr const char* D2200_TLV_OVERRUN = "TLV length runs past frame end";
inline constexpr const char* D2210_MISSING_MAC = "missing hardware address";
inline constexpr const char* D2210_MISSING_IP = "missing IPv4 address";
inline constexpr const char* D2400_INVALID_REQUEST = "invalid request";
inline constexpr const char* D2400_RPC_MISSING_ID = "rpc request missing id";
inline constexpr const char* D2400_RPC_MISSING_METHOD = "rpc request missing method";
inline constexpr const char* D2400_RPC_UNKNOWN_METHOD = "unknown rpc method";
inline constexpr const char* D2400_MISSING_MAC = "missing params.mac";
inline constexpr const char* D2400_BAD_INTERVAL = "interval_s must be between 1 and 604800";
inline constexpr const char* D2500_ENCODE_FAILED = "failed to encode snapshot";
inline constexpr const char* D2500_OPEN_FAILED = "failed to open snapshot file";
inline constexpr const char* D2500_WRITE_FAILED = "failed to write snapshot file";
inline constexpr const char* D2500_RENAME_FAILED = "failed to replace snapshot file";

enum class ErrorKind {
    InvalidAddress,
    MalformedFrame,
    IncompleteAttributes,
    SocketError,
    PersistenceFailure,
    ScanAlreadyInProgress,
    NotFound,
    InvalidArgument,
};

inline int code_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidAddress: return E2100_INVALID_ADDRESS;
        case ErrorKind::MalformedFrame: return E2200_MALFORMED_FRAME;
        case ErrorKind::IncompleteAttributes: return E2210_INCOMPLETE_ATTRIBUTES;
        case ErrorKind::SocketError: return E2300_SOCKET_ERROR;
        case ErrorKind::PersistenceFailure: return E2500_PERSISTENCE_FAILURE;
        case ErrorKind::ScanAlreadyInProgress: return E2600_SCAN_IN_PROGRESS;
        case ErrorKind::NotFound: return E2700_NOT_FOUND;
        case ErrorKind::InvalidArgument: return E2400_CONTROL_REJECTED;
    }
    return E2400_CONTROL_REJECTED;
}

inline const char* prefix_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidAddress: return MSG_E2100_INVALID_ADDRESS;
        case ErrorKind::MalformedFrame: return MSG_E2200_MALFORMED_FRAME;
        case ErrorKind::IncompleteAttributes: return MSG_E2210_INCOMPLETE_ATTRIBUTES;
        case ErrorKind::SocketError: return MSG_E2300_SOCKET_ERROR;
        case ErrorKind::PersistenceFailure: return MSG_E2500_PERSISTENCE_FAILURE;
        case ErrorKind::ScanAlreadyInProgress: return MSG_E2600_SCAN_IN_PROGRESS;
        case ErrorKind::NotFound: return MSG_E2700_NOT_FOUND;
        case ErrorKind::InvalidArgument: return MSG_E2400_CONTROL_REJECTED;
    }
    return MSG_E2400_CONTROL_REJECTED;
}

inline std::string code_string(int code) {
    return std::to_string(code);
}

inline std::string format_message(ErrorKind kind, std::string_view detail) {
    std::string out(prefix_for(kind));
    if (!detail.empty()) {
        out.append(": ");
        out.append(detail.data(), detail.size());
    }
    return out;
}

} // namespace ipscout::errors

namespace ipscout {

using errors::ErrorKind;

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, std::string_view detail)
    : std::runtime_error(errors::format_message(kind, detail)), kind_(kind), detail_(detail) {}

    ErrorKind kind() const { return kind_; }
    int code() const { return errors::code_for(kind_); }
    const std::string& detail() const { return detail_; }

private:
    ErrorKind kind_;
    std::string detail_;
};

} // namespace ipscout
