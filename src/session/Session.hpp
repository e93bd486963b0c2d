// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Time.hpp>
#include <protocol/StreamMessage.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace agentlink
{

/// @brief What a session is currently doing.
enum class SessionStatus : std::uint8_t
{
    Idle,
    Streaming,
    Compacting,
    Error,
};

[[nodiscard]] constexpr auto sessionStatusToString(SessionStatus status) -> std::string_view
{
    switch (status)
    {
        case SessionStatus::Idle: return "idle";
        case SessionStatus::Streaming: return "streaming";
        case SessionStatus::Compacting: return "compacting";
        case SessionStatus::Error: return "error";
    }
    return "idle";
}

/// @brief Compaction bookkeeping for one session.
struct CompactionState
{
    bool wasCompacted = false;
    std::optional<TimePoint> lastCompactionAt;
    int attempts = 0;

    /// @brief Force threshold crossed: compaction must run before the next user send.
    bool required = false;

    /// @brief A compaction request is pending (deferred by cooldown or awaiting retry).
    bool requested = false;

    /// @brief Earliest time a scheduled retry may run after a failed round.
    std::optional<TimePoint> retryAt;

    std::optional<TimePoint> lastAttemptAt;

    /// @brief The next reported usage replaces the running total instead of adding to it.
    bool replaceUsageOnNextResult = false;

    auto operator==(const CompactionState&) const -> bool = default;
};

using MessageId = uint64_t;

/// @brief An observed protocol message, addressed by a stable per-session id.
struct MessageRecord
{
    MessageId id = 0;

    /// @brief Record this message belongs to (tool use that a result answers, or that spawned a sub-agent).
    std::optional<MessageId> parentId;

    StreamMessage message;
};

/// @brief One conversation.
struct Session
{
    std::string id;
    std::optional<std::string> externalResumeId;
    std::string workingDirectory;
    TokenUsage tokenUsage;
    CompactionState compaction;
    SessionStatus status = SessionStatus::Idle;

    /// @brief Append-only message arena.
    std::vector<MessageRecord> messages;
    MessageId nextMessageId = 1;

    /// @brief Resume ids that were invalidated; none of these may ever be installed again.
    std::set<std::string> invalidatedResumeIds;

    /// @brief Time of the last successful save (informational).
    std::optional<TimePoint> savedAt;

    /// @brief Tool use id to the record that introduced it. Derived from messages, not persisted.
    std::map<std::string, MessageId> toolUseIndex;

    /// @brief Appends a message, resolving its parent link once against earlier records.
    /// @return The id assigned to the new record.
    auto appendMessage(StreamMessage message) -> MessageId;

    /// @brief Looks up a record by id.
    [[nodiscard]] auto findMessage(MessageId id) const -> const MessageRecord*;
};

/// @brief Creates a fresh, empty session with a newly generated id.
[[nodiscard]] auto makeSession(std::string workingDirectory) -> Session;

/// @brief Generates a new local session id (time-ordered, random suffix).
[[nodiscard]] auto generateSessionId() -> std::string;

/// @brief Serializes a session into its durable record form.
[[nodiscard]] auto sessionToJson(const Session& session) -> nlohmann::json;

/// @brief Restores a session from its durable record form.
/// @return The session, or PersistenceFailure if required fields are missing.
[[nodiscard]] auto sessionFromJson(const nlohmann::json& record) -> Result<Session>;

} // namespace agentlink
