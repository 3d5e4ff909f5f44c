// Copyright (c) 2025 Faultline Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <variant>

namespace faultline {

using TimePoint = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;
using NodeId = std::string;
using NetworkId = std::string;

// Error types
enum class ErrorCode {
    Success = 0,
    InvalidArgument,
    NotFound,
    NetworkError,
    Timeout,
    InternalError,
    OperationCancelled,
    InvalidState,
    WriteError,
    NotSupported,
    // Scenario taxonomy
    ResolutionError,
    NetworkUnresolved,
    NodeBusy,
    BenchmarkBusy,
    InjectionError,
    PartitionVerificationFailed,
    ProbeError,
    RestorationError,
    RecoveryTimeout,
    OrchestratorUnavailable,
    StoreError,
    Unknown
};

// Convert error code to string
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::NetworkError: return "Network error";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::OperationCancelled: return "Operation cancelled";
        case ErrorCode::InvalidState: return "Invalid state";
        case ErrorCode::WriteError: return "Write error";
        case ErrorCode::NotSupported: return "Not supported";
        case ErrorCode::ResolutionError: return "Target resolution failed";
        case ErrorCode::NetworkUnresolved: return "Network could not be resolved";
        case ErrorCode::NodeBusy: return "Node is held by another scenario";
        case ErrorCode::BenchmarkBusy: return "A benchmark run is already in progress";
        case ErrorCode::InjectionError: return "Failure injection failed";
        case ErrorCode::PartitionVerificationFailed: return "Partition verification failed";
        case ErrorCode::ProbeError: return "Probe failed";
        case ErrorCode::RestorationError: return "Restoration failed";
        case ErrorCode::RecoveryTimeout: return "Recovery ceiling reached";
        case ErrorCode::OrchestratorUnavailable: return "Orchestrator unavailable";
        case ErrorCode::StoreError: return "Store error";
        case ErrorCode::Unknown: return "Unknown error";
    }
    return "Unknown error";
}

// Stable identifier used in API payloads ("errorKind")
constexpr const char* errorKindName(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::NetworkError: return "NetworkError";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::InternalError: return "InternalError";
        case ErrorCode::OperationCancelled: return "OperationCancelled";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::WriteError: return "WriteError";
        case ErrorCode::NotSupported: return "NotSupported";
        case ErrorCode::ResolutionError: return "ResolutionError";
        case ErrorCode::NetworkUnresolved: return "NetworkUnresolved";
        case ErrorCode::NodeBusy: return "NodeBusy";
        case ErrorCode::BenchmarkBusy: return "BenchmarkBusy";
        case ErrorCode::InjectionError: return "InjectionError";
        case ErrorCode::PartitionVerificationFailed: return "PartitionVerificationFailed";
        case ErrorCode::ProbeError: return "ProbeError";
        case ErrorCode::RestorationError: return "RestorationError";
        case ErrorCode::RecoveryTimeout: return "RecoveryTimeout";
        case ErrorCode::OrchestratorUnavailable: return "OrchestratorUnavailable";
        case ErrorCode::StoreError: return "StoreError";
        case ErrorCode::Unknown: return "Unknown";
    }
    return "Unknown";
}

// Error struct for detailed error information
struct Error {
    ErrorCode code;
    std::string message;

    Error() : code(ErrorCode::Success), message("") {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}

    bool operator==(ErrorCode c) const { return code == c; }
    bool operator!=(ErrorCode c) const { return code != c; }

    friend bool operator==(ErrorCode c, const Error& error) { return error.code == c; }
    friend bool operator!=(ErrorCode c, const Error& error) { return error.code != c; }
};

// Simple Result type for operations that can fail
template <typename T> class Result {
public:
    Result(T&& value) : data_(std::move(value)) {}
    Result(const T& value) : data_(value) {}
    Result(ErrorCode error) : data_(Error{error}) {}
    Result(Error error) : data_(std::move(error)) {}

    bool has_value() const noexcept { return std::holds_alternative<T>(data_); }

    explicit operator bool() const noexcept { return has_value(); }

    const T& value() const& {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(data_);
    }

    T& value() & {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(std::move(data_));
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return std::get<Error>(data_);
    }

private:
    std::variant<T, Error> data_;
};

// Specialization for void
template <> class Result<void> {
public:
    Result() : error_() {}
    Result(ErrorCode error) : error_(Error{error}) {}
    Result(Error error) : error_(std::move(error)) {}

    bool has_value() const noexcept { return error_.code == ErrorCode::Success; }

    explicit operator bool() const noexcept { return has_value(); }

    void value() const {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return error_;
    }

private:
    Error error_{ErrorCode::Success, ""};
};

} // namespace faultline

// fmt library support for ErrorCode (for spdlog)
#if defined(SPDLOG_FMT_EXTERNAL) || defined(FMT_VERSION)
#include <fmt/format.h>
template <> struct fmt::formatter<faultline::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(faultline::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", faultline::errorToString(error));
    }
};
#endif
