// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace agentlink
{

/// @brief Error codes for categorizing failures across the orchestration layer.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    IoError,
    ConfigError,
    SpawnFailure,
    ProcessFailure,
    StreamParseError,
    ResumeInvalidated,
    CompactionFailure,
    PersistenceFailure,
    SessionBusy,
    SessionNotFound,
    TimeoutError,
};

/// @brief Returns a short, stable name for an error code (used in logs and events).
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "unknown";
        case ErrorCode::InvalidArgument: return "invalid-argument";
        case ErrorCode::IoError: return "io-error";
        case ErrorCode::ConfigError: return "config-error";
        case ErrorCode::SpawnFailure: return "spawn-failure";
        case ErrorCode::ProcessFailure: return "process-failure";
        case ErrorCode::StreamParseError: return "stream-parse-error";
        case ErrorCode::ResumeInvalidated: return "resume-invalidated";
        case ErrorCode::CompactionFailure: return "compaction-failure";
        case ErrorCode::PersistenceFailure: return "persistence-failure";
        case ErrorCode::SessionBusy: return "session-busy";
        case ErrorCode::SessionNotFound: return "session-not-found";
        case ErrorCode::TimeoutError: return "timeout";
    }
    return "unknown";
}

/// @brief Represents an error with a code and descriptive message.
struct Error
{
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
};

/// @brief Result type for operations that return a value or an error.
/// @tparam T The success value type.
template <typename T>
using Result = std::expected<T, Error>;

/// @brief Result type for operations that return no value on success.
using VoidResult = std::expected<void, Error>;

/// @brief Creates an unexpected Error value for use with std::expected.
/// @param code The error code.
/// @param message A descriptive error message.
/// @return An unexpected Error.
[[nodiscard]] inline auto makeError(ErrorCode code, std::string message) -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error { code, std::move(message) });
}

} // namespace agentlink

template <>
struct std::formatter<agentlink::Error>: std::formatter<std::string>
{
    auto format(const agentlink::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", agentlink::errorCodeName(error.code), error.message), ctx);
    }
};
