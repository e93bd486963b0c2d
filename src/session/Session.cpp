// SPDX-License-Identifier: Apache-2.0
#include "Session.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <algorithm>
#include <format>
#include <random>

namespace agentlink
{

namespace
{

    constexpr auto RecordVersion = 1;

    auto optionalTimeToJson(const std::optional<TimePoint>& tp) -> nlohmann::json
    {
        if (!tp)
            return nullptr;
        return toEpochMillis(*tp);
    }

    auto optionalTimeFromJson(const nlohmann::json& obj, std::string_view key) -> std::optional<TimePoint>
    {
        auto keyStr = std::string(key);
        if (!obj.contains(keyStr) || !obj[keyStr].is_number_integer())
            return std::nullopt;
        return fromEpochMillis(obj[keyStr].get<int64_t>());
    }

    auto usageRecordToJson(const TokenUsage& usage) -> nlohmann::json
    {
        return nlohmann::json {
            { "input", usage.input },
            { "output", usage.output },
            { "cacheCreate", usage.cacheCreate },
            { "cacheRead", usage.cacheRead },
        };
    }

    auto usageRecordFromJson(const nlohmann::json& obj) -> TokenUsage
    {
        return TokenUsage {
            .input = json::getUint64Or(obj, "input", 0),
            .output = json::getUint64Or(obj, "output", 0),
            .cacheCreate = json::getUint64Or(obj, "cacheCreate", 0),
            .cacheRead = json::getUint64Or(obj, "cacheRead", 0),
        };
    }

    auto compactionToJson(const CompactionState& state) -> nlohmann::json
    {
        return nlohmann::json {
            { "wasCompacted", state.wasCompacted },
            { "lastCompactionAt", optionalTimeToJson(state.lastCompactionAt) },
            { "attempts", state.attempts },
            { "required", state.required },
            { "requested", state.requested },
            { "retryAt", optionalTimeToJson(state.retryAt) },
            { "lastAttemptAt", optionalTimeToJson(state.lastAttemptAt) },
            { "replaceUsageOnNextResult", state.replaceUsageOnNextResult },
        };
    }

    auto compactionFromJson(const nlohmann::json& obj) -> CompactionState
    {
        return CompactionState {
            .wasCompacted = json::getBoolOr(obj, "wasCompacted", false),
            .lastCompactionAt = optionalTimeFromJson(obj, "lastCompactionAt"),
            .attempts = json::getIntOr(obj, "attempts", 0),
            .required = json::getBoolOr(obj, "required", false),
            .requested = json::getBoolOr(obj, "requested", false),
            .retryAt = optionalTimeFromJson(obj, "retryAt"),
            .lastAttemptAt = optionalTimeFromJson(obj, "lastAttemptAt"),
            .replaceUsageOnNextResult = json::getBoolOr(obj, "replaceUsageOnNextResult", false),
        };
    }

} // namespace

auto Session::appendMessage(StreamMessage message) -> MessageId
{
    auto record = MessageRecord {
        .id = nextMessageId++,
        .parentId = std::nullopt,
        .message = std::move(message),
    };

    if (record.message.parentToolUseId)
    {
        auto const it = toolUseIndex.find(*record.message.parentToolUseId);
        if (it != toolUseIndex.end())
            record.parentId = it->second;
    }

    for (const auto& toolUseId: record.message.toolUseIds)
        toolUseIndex[toolUseId] = record.id;

    messages.push_back(std::move(record));
    return messages.back().id;
}

auto Session::findMessage(MessageId id) const -> const MessageRecord*
{
    // Ids are assigned in increasing order, so the arena is sorted by id.
    auto const it = std::ranges::lower_bound(messages, id, {}, &MessageRecord::id);
    if (it == messages.end() || it->id != id)
        return nullptr;
    return &*it;
}

auto generateSessionId() -> std::string
{
    thread_local auto generator = std::mt19937_64 { std::random_device {}() };
    auto distribution = std::uniform_int_distribution<uint32_t> {};
    return std::format("{:x}-{:08x}", toEpochMillis(Clock::now()), distribution(generator));
}

auto makeSession(std::string workingDirectory) -> Session
{
    auto session = Session {};
    session.id = generateSessionId();
    session.workingDirectory = std::move(workingDirectory);
    return session;
}

auto sessionToJson(const Session& session) -> nlohmann::json
{
    auto messages = nlohmann::json::array();
    for (const auto& record: session.messages)
    {
        auto entry = nlohmann::json::object();
        entry["id"] = record.id;
        if (record.parentId)
            entry["parentId"] = *record.parentId;
        entry["raw"] = record.message.raw;
        messages.push_back(std::move(entry));
    }

    auto invalidated = nlohmann::json::array();
    for (const auto& id: session.invalidatedResumeIds)
        invalidated.push_back(id);

    auto record = nlohmann::json::object();
    record["version"] = RecordVersion;
    record["id"] = session.id;
    record["externalResumeId"] =
        session.externalResumeId ? nlohmann::json(*session.externalResumeId) : nlohmann::json(nullptr);
    record["workingDirectory"] = session.workingDirectory;
    record["tokenUsage"] = usageRecordToJson(session.tokenUsage);
    record["compactionState"] = compactionToJson(session.compaction);
    record["savedAt"] = optionalTimeToJson(session.savedAt);
    record["invalidatedResumeIds"] = std::move(invalidated);
    record["nextMessageId"] = session.nextMessageId;
    record["messages"] = std::move(messages);
    return record;
}

auto sessionFromJson(const nlohmann::json& record) -> Result<Session>
{
    if (!record.is_object())
        return makeError(ErrorCode::PersistenceFailure, "Session record is not a JSON object");

    auto id = json::getOptionalString(record, "id");
    if (!id || id->empty())
        return makeError(ErrorCode::PersistenceFailure, "Session record has no id");

    auto session = Session {};
    session.id = std::move(*id);
    session.externalResumeId = json::getOptionalString(record, "externalResumeId");
    session.workingDirectory = json::getStringOr(record, "workingDirectory", "");
    if (record.contains("tokenUsage") && record["tokenUsage"].is_object())
        session.tokenUsage = usageRecordFromJson(record["tokenUsage"]);
    if (record.contains("compactionState") && record["compactionState"].is_object())
        session.compaction = compactionFromJson(record["compactionState"]);
    session.savedAt = optionalTimeFromJson(record, "savedAt");
    session.status = SessionStatus::Idle;

    for (auto& invalidated: json::getStringArray(record, "invalidatedResumeIds"))
        session.invalidatedResumeIds.insert(std::move(invalidated));

    // A resume id that was invalidated must never come back, even from a stale record.
    if (session.externalResumeId && session.invalidatedResumeIds.contains(*session.externalResumeId))
        session.externalResumeId.reset();

    if (record.contains("messages") && record["messages"].is_array())
    {
        for (const auto& entry: record["messages"])
        {
            if (!entry.is_object() || !entry.contains("raw"))
                continue;

            auto message = decodeStreamMessage(entry["raw"]);
            if (!message)
            {
                log::warning("Skipping stored message in session {}: {}", session.id, message.error().message);
                continue;
            }

            auto recordEntry = MessageRecord {
                .id = json::getUint64Or(entry, "id", 0),
                .parentId = std::nullopt,
                .message = std::move(*message),
            };
            if (entry.contains("parentId") && entry["parentId"].is_number_unsigned())
                recordEntry.parentId = entry["parentId"].get<MessageId>();

            // Keep the arena strictly increasing; renumber anything out of order.
            if (!session.messages.empty() && recordEntry.id <= session.messages.back().id)
                recordEntry.id = session.messages.back().id + 1;
            if (recordEntry.id == 0)
                recordEntry.id = 1;

            for (const auto& toolUseId: recordEntry.message.toolUseIds)
                session.toolUseIndex[toolUseId] = recordEntry.id;
            session.messages.push_back(std::move(recordEntry));
        }
    }

    auto const minimumNextId = session.messages.empty() ? MessageId { 1 } : session.messages.back().id + 1;
    session.nextMessageId = std::max(json::getUint64Or(record, "nextMessageId", 1), minimumNextId);

    return session;
}

} // namespace agentlink
