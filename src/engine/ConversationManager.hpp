// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Channel.hpp>
#include <core/Error.hpp>
#include <core/Time.hpp>
#include <engine/CompactionCoordinator.hpp>
#include <engine/ResumptionEngine.hpp>
#include <engine/TokenAccountant.hpp>
#include <process/AgentRunner.hpp>
#include <session/Session.hpp>
#include <session/SessionStore.hpp>
#include <session/SessionWriter.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace agentlink
{

/// @brief Kinds of events delivered to the UI.
enum class CoreEventKind : std::uint8_t
{
    Message,
    TokenUpdate,
    CompactionStart,
    CompactionComplete,
    CompactionExhausted,
    ResumeInvalidated,
    ProcessError,
    StatusChanged,
};

[[nodiscard]] constexpr auto coreEventKindToString(CoreEventKind kind) -> std::string_view
{
    switch (kind)
    {
        case CoreEventKind::Message: return "message";
        case CoreEventKind::TokenUpdate: return "token-update";
        case CoreEventKind::CompactionStart: return "compaction-start";
        case CoreEventKind::CompactionComplete: return "compaction-complete";
        case CoreEventKind::CompactionExhausted: return "compaction-exhausted";
        case CoreEventKind::ResumeInvalidated: return "resume-invalidated";
        case CoreEventKind::ProcessError: return "process-error";
        case CoreEventKind::StatusChanged: return "status-changed";
    }
    return "message";
}

/// @brief One notification for the UI. Which fields are set depends on the kind.
struct CoreEvent
{
    CoreEventKind kind = CoreEventKind::Message;
    std::string sessionId;

    /// @brief The appended record (Message).
    std::optional<MessageRecord> message;

    /// @brief Usage after the change (TokenUpdate, CompactionComplete).
    TokenUsage tokenUsage;

    /// @brief Fraction of the context window in use (TokenUpdate, CompactionComplete).
    double percentage = 0.0;

    /// @brief New status (StatusChanged).
    SessionStatus status = SessionStatus::Idle;

    /// @brief Cause of a ProcessError or CompactionExhausted event.
    std::optional<Error> error;

    /// @brief Free-form detail, e.g. the invalidated resume id.
    std::string detail;
};

struct ConversationManagerConfig
{
    TokenConfig tokens;
    CompactionConfig compaction;
    ResumeConfig resume;
    SessionWriterConfig writer;

    /// @brief Re-send the prompt once when a round was killed for stalling.
    bool retryOnStall = true;

    /// @brief Interval of the background tick that runs deferred compactions.
    std::chrono::milliseconds maintenanceInterval { 1000 };

    /// @brief Minimum time between publishing the intermediate state of a streaming session.
    /// Results and resume id changes are published and persisted right away.
    std::chrono::milliseconds publishInterval { 250 };
};

/// @brief Command surface used by the UI.
///
/// Every send and compaction runs as an operation on its own thread, holding the exclusive
/// lease of its session until it finishes. Session changes are published to the registry
/// and queued for durable writes. Progress is reported through events().
class ConversationManager
{
  public:
    ConversationManager(const SessionStore& store,
                        AgentRunner& runner,
                        ConversationManagerConfig config = {},
                        NowFunction now = systemNow());
    ~ConversationManager();

    ConversationManager(const ConversationManager&) = delete;
    ConversationManager& operator=(const ConversationManager&) = delete;

    /// @brief Creates an empty session bound to @p workingDirectory.
    /// @return The new session id.
    [[nodiscard]] auto createSession(std::string workingDirectory) -> Result<std::string>;

    /// @brief Loads session @p id from the store if needed.
    /// @return The session's current published state.
    [[nodiscard]] auto selectSession(std::string_view id) -> Result<Session>;

    /// @brief Starts sending @p text to session @p id. Returns once the operation is started.
    /// @return SessionBusy while another send or a compaction owns the session.
    [[nodiscard]] auto send(std::string_view id, std::string text) -> VoidResult;

    /// @brief Stops the send running for session @p id: its subprocess is killed, or not
    /// started if it is still being spawned or between rounds. A running compaction round
    /// is not interrupted.
    [[nodiscard]] auto stop(std::string_view id) -> VoidResult;

    /// @brief Ids of all known sessions, stored and in memory, sorted.
    [[nodiscard]] auto listSessions() const -> std::vector<std::string>;

    /// @brief Published state of a loaded session.
    [[nodiscard]] auto snapshot(std::string_view id) const -> std::optional<Session>;

    /// @brief Fraction of the context window used by @p session.
    [[nodiscard]] auto percentage(const Session& session) const -> double;

    [[nodiscard]] auto events() -> Channel<CoreEvent>&;

    /// @brief Number of session snapshots handed to the writer since construction.
    [[nodiscard]] auto queuedWrites() const -> size_t;

    /// @brief Starts due deferred or retry compactions of idle sessions.
    void runMaintenance();

    /// @brief Blocks until no operation is running.
    void waitForOperations();

    /// @brief Kills live subprocesses, joins all operations and flushes pending writes.
    void shutdown();

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace agentlink
