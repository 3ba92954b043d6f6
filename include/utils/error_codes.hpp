#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace vertree {

// Error categories with distinct ranges
enum class ErrorCategory : uint16_t {
    None = 0,
    Network = 1000,
    Protocol = 3000,
    MPC = 4000,
    Data = 5000,
    System = 6000
};

// Structured error codes
enum class ErrorCode : uint32_t {
    // Success
    Success = 0,

    // Network errors (1000-1999), the ConnectivityError family
    NetworkConnectionFailed = 1001,
    NetworkTimeout = 1002,
    NetworkInvalidResponse = 1003,
    NetworkPeerUnreachable = 1004,
    NetworkBindFailed = 1005,

    // Protocol errors (3000-3999)
    ProtocolInvalidMessage = 3001,
    ProtocolSequenceError = 3002,
    ProtocolStateError = 3003,
    ProtocolUnknownSession = 3004,
    ProtocolPartyNotRegistered = 3005,

    // MPC errors (4000-4999)
    MPCInsufficientParticipants = 4001,
    MPCComputationFailed = 4002,

    // Data errors (5000-5999)
    DataSchemaMismatch = 5001,
    DataFormatError = 5002,

    // System errors (6000-6999)
    SystemInvalidConfiguration = 6001,
    SystemInvalidState = 6002
};

// Result type for operations that can fail
template<typename T>
class Result {
public:
    Result(T value) noexcept : value_(std::move(value)), code_(ErrorCode::Success) {}
    Result(ErrorCode code) noexcept : code_(code) {}
    Result(ErrorCode code, std::string_view message)
        : code_(code), message_(message) {}

    bool isSuccess() const noexcept { return code_ == ErrorCode::Success; }
    bool isError() const noexcept { return code_ != ErrorCode::Success; }

    const T& value() const { return value_; }
    T& value() { return value_; }
    T&& moveValue() noexcept { return std::move(value_); }

    ErrorCode error() const noexcept { return code_; }
    std::string_view message() const noexcept { return message_; }

    operator bool() const noexcept { return isSuccess(); }

private:
    T value_;
    ErrorCode code_;
    std::string message_;
};

// Specialization for void results
template<>
class Result<void> {
public:
    Result() noexcept : code_(ErrorCode::Success) {}
    Result(ErrorCode code) noexcept : code_(code) {}
    Result(ErrorCode code, std::string_view message)
        : code_(code), message_(message) {}

    bool isSuccess() const noexcept { return code_ == ErrorCode::Success; }
    bool isError() const noexcept { return code_ != ErrorCode::Success; }

    ErrorCode error() const noexcept { return code_; }
    std::string_view message() const noexcept { return message_; }

    operator bool() const noexcept { return isSuccess(); }

private:
    ErrorCode code_;
    std::string message_;
};

// Thrown by the dataset and record loaders, which have no caller to hand a
// Result back to until the whole file is read.
class DataFormatError : public std::runtime_error {
public:
    explicit DataFormatError(const std::string& message)
        : std::runtime_error(message) {}

    ErrorCode code() const noexcept { return ErrorCode::DataFormatError; }
};

// Helper function to get error category
inline ErrorCategory getErrorCategory(ErrorCode code) noexcept {
    uint32_t value = static_cast<uint32_t>(code);
    if (value == 0) return ErrorCategory::None;
    if (value >= 1000 && value < 2000) return ErrorCategory::Network;
    if (value >= 3000 && value < 4000) return ErrorCategory::Protocol;
    if (value >= 4000 && value < 5000) return ErrorCategory::MPC;
    if (value >= 5000 && value < 6000) return ErrorCategory::Data;
    if (value >= 6000 && value < 7000) return ErrorCategory::System;
    return ErrorCategory::None;
}

// Convert error code to string
inline std::string_view errorToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success: return "Success";

        // Network errors
        case ErrorCode::NetworkConnectionFailed: return "Network connection failed";
        case ErrorCode::NetworkTimeout: return "Network timeout";
        case ErrorCode::NetworkInvalidResponse: return "Invalid network response";
        case ErrorCode::NetworkPeerUnreachable: return "Peer unreachable";
        case ErrorCode::NetworkBindFailed: return "Failed to bind to address";

        // Protocol errors
        case ErrorCode::ProtocolInvalidMessage: return "Invalid protocol message";
        case ErrorCode::ProtocolSequenceError: return "Message out of protocol sequence";
        case ErrorCode::ProtocolStateError: return "Protocol state contract violated";
        case ErrorCode::ProtocolUnknownSession: return "Unknown session";
        case ErrorCode::ProtocolPartyNotRegistered: return "Party not registered";

        // MPC errors
        case ErrorCode::MPCInsufficientParticipants: return "Insufficient participants";
        case ErrorCode::MPCComputationFailed: return "Computation failed";

        // Data errors
        case ErrorCode::DataSchemaMismatch: return "Schema mismatch";
        case ErrorCode::DataFormatError: return "Malformed input data";

        // System errors
        case ErrorCode::SystemInvalidConfiguration: return "Invalid configuration";
        case ErrorCode::SystemInvalidState: return "Invalid node state";

        default: return "Unknown error";
    }
}

// "<description>: <detail>" for log lines and Error messages
inline std::string describeError(ErrorCode code, std::string_view detail) {
    std::string text(errorToString(code));
    if (!detail.empty()) {
        text += ": ";
        text += detail;
    }
    return text;
}

} // namespace vertree
