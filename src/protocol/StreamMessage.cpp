// SPDX-License-Identifier: Apache-2.0
#include "StreamMessage.hpp"

#include <core/JsonUtils.hpp>

#include <format>

namespace agentlink
{

namespace
{

    auto appendLine(std::string& out, std::string_view line)
    {
        if (line.empty())
            return;
        if (!out.empty())
            out += '\n';
        out += line;
    }

    /// Concatenates the text of a content value (plain string or array of content blocks).
    auto contentText(const nlohmann::json& content) -> std::string
    {
        if (content.is_string())
            return content.get<std::string>();

        auto text = std::string {};
        if (!content.is_array())
            return text;

        for (const auto& block: content)
        {
            if (block.is_string())
                text += block.get<std::string>();
            else if (block.is_object() && json::getStringOr(block, "type", "") == "text")
                text += json::getStringOr(block, "text", "");
        }
        return text;
    }

    /// Content blocks of an assistant/user message (`message.content`), if it is an array.
    auto contentBlocks(const nlohmann::json& raw) -> const nlohmann::json*
    {
        if (!raw.contains("message") || !raw["message"].is_object())
            return nullptr;
        auto const& message = raw["message"];
        if (!message.contains("content") || !message["content"].is_array())
            return nullptr;
        return &message["content"];
    }

} // namespace

auto tokenUsageToJson(const TokenUsage& usage) -> nlohmann::json
{
    return nlohmann::json {
        { "input_tokens", usage.input },
        { "output_tokens", usage.output },
        { "cache_creation_input_tokens", usage.cacheCreate },
        { "cache_read_input_tokens", usage.cacheRead },
    };
}

auto tokenUsageFromJson(const nlohmann::json& obj) -> TokenUsage
{
    return TokenUsage {
        .input = json::getUint64Or(obj, "input_tokens", 0),
        .output = json::getUint64Or(obj, "output_tokens", 0),
        .cacheCreate = json::getUint64Or(obj, "cache_creation_input_tokens", 0),
        .cacheRead = json::getUint64Or(obj, "cache_read_input_tokens", 0),
    };
}

auto StreamMessage::errorText() const -> std::string
{
    auto text = std::string {};
    if (!raw.is_object())
        return text;

    if (type == MessageType::Result)
        appendLine(text, json::getStringOr(raw, "result", ""));
    appendLine(text, json::getStringOr(raw, "error", ""));
    for (const auto& error: json::getStringArray(raw, "errors"))
        appendLine(text, error);
    if (type == MessageType::Error)
        appendLine(text, json::getStringOr(raw, "message", ""));
    return text;
}

auto StreamMessage::text() const -> std::string
{
    if (!raw.is_object())
        return {};

    switch (type)
    {
        case MessageType::Assistant:
        case MessageType::User:
            if (raw.contains("message") && raw["message"].is_object() && raw["message"].contains("content"))
                return contentText(raw["message"]["content"]);
            if (raw.contains("content"))
                return contentText(raw["content"]);
            return {};
        case MessageType::Result: return json::getStringOr(raw, "result", "");
        case MessageType::Error: return json::getStringOr(raw, "message", "");
        case MessageType::ToolResult:
            if (raw.contains("content"))
                return contentText(raw["content"]);
            return {};
        case MessageType::System:
        case MessageType::ToolUse:
        case MessageType::Unknown: break;
    }
    return json::getStringOr(raw, "content", "");
}

auto decodeStreamMessage(nlohmann::json value) -> Result<StreamMessage>
{
    if (!value.is_object())
        return makeError(ErrorCode::StreamParseError, "Stream line is not a JSON object");

    auto const typeName = json::getOptionalString(value, "type");
    if (!typeName)
        return makeError(ErrorCode::StreamParseError, "Stream object has no string 'type' field");

    auto message = StreamMessage {};
    message.type = messageTypeFromString(*typeName);
    message.subtype = json::getStringOr(value, "subtype", "");
    message.resumeId = json::getOptionalString(value, "session_id");
    message.parentToolUseId = json::getOptionalString(value, "parent_tool_use_id");

    switch (message.type)
    {
        case MessageType::Result:
            message.isError = json::getBoolOr(value, "is_error", false);
            if (value.contains("usage") && value["usage"].is_object())
                message.usage = tokenUsageFromJson(value["usage"]);
            break;
        case MessageType::Error: message.isError = true; break;
        case MessageType::ToolUse:
            if (auto id = json::getOptionalString(value, "id"))
                message.toolUseIds.push_back(std::move(*id));
            break;
        case MessageType::ToolResult:
            if (auto id = json::getOptionalString(value, "tool_use_id"))
                message.parentToolUseId = std::move(id);
            message.isError = json::getBoolOr(value, "is_error", false);
            break;
        case MessageType::Assistant:
        case MessageType::User:
            if (auto const* blocks = contentBlocks(value))
            {
                for (const auto& block: *blocks)
                {
                    if (!block.is_object())
                        continue;
                    auto const blockType = json::getStringOr(block, "type", "");
                    if (blockType == "tool_use")
                    {
                        if (auto id = json::getOptionalString(block, "id"))
                            message.toolUseIds.push_back(std::move(*id));
                    }
                    else if (blockType == "tool_result" && !message.parentToolUseId)
                    {
                        message.parentToolUseId = json::getOptionalString(block, "tool_use_id");
                    }
                }
            }
            break;
        case MessageType::System:
        case MessageType::Unknown: break;
    }

    message.raw = std::move(value);
    return message;
}

} // namespace agentlink
