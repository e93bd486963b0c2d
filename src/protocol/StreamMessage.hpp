// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace agentlink
{

/// @brief Token usage counters as reported by a `result` message.
struct TokenUsage
{
    uint64_t input = 0;
    uint64_t output = 0;
    uint64_t cacheCreate = 0;
    uint64_t cacheRead = 0;

    [[nodiscard]] auto total() const -> uint64_t { return input + output + cacheCreate + cacheRead; }

    auto operator+=(const TokenUsage& other) -> TokenUsage&
    {
        input += other.input;
        output += other.output;
        cacheCreate += other.cacheCreate;
        cacheRead += other.cacheRead;
        return *this;
    }

    auto operator==(const TokenUsage&) const -> bool = default;
};

/// @brief Serializes usage in the agent's wire naming (input_tokens, ...).
[[nodiscard]] auto tokenUsageToJson(const TokenUsage& usage) -> nlohmann::json;

/// @brief Reads usage from the agent's wire naming; missing counters are zero.
[[nodiscard]] auto tokenUsageFromJson(const nlohmann::json& obj) -> TokenUsage;

/// @brief Discriminant of a stream-json line.
enum class MessageType : std::uint8_t
{
    System,
    Assistant,
    User,
    ToolUse,
    ToolResult,
    Result,
    Error,
    Unknown,
};

[[nodiscard]] constexpr auto messageTypeToString(MessageType type) -> std::string_view
{
    switch (type)
    {
        case MessageType::System: return "system";
        case MessageType::Assistant: return "assistant";
        case MessageType::User: return "user";
        case MessageType::ToolUse: return "tool_use";
        case MessageType::ToolResult: return "tool_result";
        case MessageType::Result: return "result";
        case MessageType::Error: return "error";
        case MessageType::Unknown: return "unknown";
    }
    return "unknown";
}

[[nodiscard]] constexpr auto messageTypeFromString(std::string_view str) -> MessageType
{
    if (str == "system")
        return MessageType::System;
    if (str == "assistant")
        return MessageType::Assistant;
    if (str == "user")
        return MessageType::User;
    if (str == "tool_use")
        return MessageType::ToolUse;
    if (str == "tool_result")
        return MessageType::ToolResult;
    if (str == "result")
        return MessageType::Result;
    if (str == "error")
        return MessageType::Error;
    return MessageType::Unknown;
}

/// @brief One decoded line of the agent's stream-json output.
struct StreamMessage
{
    MessageType type = MessageType::Unknown;
    std::string subtype;

    /// @brief The complete decoded JSON object, as emitted by the agent.
    nlohmann::json raw;

    /// @brief Usage record (present on `result` messages that report one).
    std::optional<TokenUsage> usage;

    /// @brief Error flag (`is_error` on `result`, always true for `error`).
    bool isError = false;

    /// @brief Conversation id reported by the agent (resume token candidate).
    std::optional<std::string> resumeId;

    /// @brief Tool use this message belongs to (tool results and sub-agent messages).
    std::optional<std::string> parentToolUseId;

    /// @brief Tool use ids introduced by this message (standalone tool_use or assistant content blocks).
    std::vector<std::string> toolUseIds;

    /// @brief Returns all human-readable error text carried by the message (result/errors/error/message).
    [[nodiscard]] auto errorText() const -> std::string;

    /// @brief Returns the plain text content of the message, concatenating text blocks.
    [[nodiscard]] auto text() const -> std::string;
};

/// @brief Decodes a JSON value into a StreamMessage.
/// @return The message, or StreamParseError if the value is not an object with a string `type`.
[[nodiscard]] auto decodeStreamMessage(nlohmann::json value) -> Result<StreamMessage>;

} // namespace agentlink
