// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <process/AgentRunner.hpp>
#include <process/ProcessSupervisor.hpp>
#include <session/Session.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>

namespace agentlink
{

/// @brief Configuration for ResumptionEngine.
struct ResumeConfig
{
    /// @brief Exit code the agent uses when a resume id is unknown.
    int resumeNotFoundExitCode = 1;

    /// @brief Text identifying the "no such conversation" condition on stderr, on a plain-text
    /// stdout line or in a result error. Seeing it after a resumed round invalidates the id.
    std::string resumeNotFoundMarker = "No conversation found";

    /// @brief Accept resumeNotFoundExitCode only together with the marker, for agents that use
    /// the same exit code for other failures.
    bool requireMarker = false;

    /// @brief Number of recent messages replayed into a fresh start after invalidation (0 disables).
    size_t contextReplayMessages = 10;

    /// @brief Characters kept per replayed message.
    size_t contextReplayChars = 200;

    /// @brief System prompt passed with every send.
    std::optional<std::string> systemPrompt;
};

/// @brief How a finished round is interpreted.
enum class ExitClassification : std::uint8_t
{
    Success,
    /// The resume id was rejected as unknown.
    ResumeNotFound,
    /// The round was stopped on request.
    Cancelled,
    Failure,
};

/// @brief States of one send operation.
enum class SendState : std::uint8_t
{
    Idle,
    Spawning,
    Streaming,
    Completed,
    ResumeInvalidated,
    Failed,
};

[[nodiscard]] constexpr auto sendStateToString(SendState state) -> std::string_view
{
    switch (state)
    {
        case SendState::Idle: return "idle";
        case SendState::Spawning: return "spawning";
        case SendState::Streaming: return "streaming";
        case SendState::Completed: return "completed";
        case SendState::ResumeInvalidated: return "resume-invalidated";
        case SendState::Failed: return "failed";
    }
    return "idle";
}

/// @brief Callbacks of a send operation, all invoked on the sending thread.
struct SendHooks
{
    std::function<void(SendState state)> onStateChange;

    /// @brief A record was appended to the session (the user's prompt or an agent message).
    std::function<void(Session& session, const MessageRecord& record)> onMessage;

    /// @brief The resume id was invalidated; a fresh start follows.
    std::function<void(Session& session, const std::string& invalidatedId)> onResumeInvalidated;

    /// @brief The resume id changed and must be persisted.
    std::function<void(Session& session)> onCommit;

    /// @brief Stops the send: the running round is killed and no further round is started.
    std::stop_token stopToken;
};

/// @brief Result of a send operation.
struct SendOutcome
{
    SendState state = SendState::Idle;
    bool resumeInvalidated = false;
    bool cancelled = false;
    bool stalled = false;
    std::optional<Error> error;
    std::optional<RoundResult> round;

    [[nodiscard]] auto succeeded() const -> bool { return state == SendState::Completed; }
};

/// @brief Decides between resuming and starting fresh, and drives a send through its states:
/// Idle, Spawning, Streaming, then Completed, Failed, or ResumeInvalidated followed by
/// exactly one fresh Spawning round.
class ResumptionEngine
{
  public:
    explicit ResumptionEngine(ResumeConfig config = {});

    /// @brief Plans the next round: resume with the session's resume id if it has a valid one,
    /// otherwise start fresh.
    [[nodiscard]] auto prepareSend(const Session& session, std::string prompt) const -> SpawnPlan;

    [[nodiscard]] auto classify(const SpawnPlan& plan, const RoundResult& round) const -> ExitClassification;

    /// @brief Clears the session's resume id and records it as never to be used again.
    /// @return The invalidated id (empty if the session had none).
    auto invalidate(Session& session) const -> std::string;

    /// @brief Installs a resume id reported by the agent unless it was invalidated before.
    /// @return Whether the session's resume id changed.
    auto installResumeId(Session& session, const std::string& resumeId) const -> bool;

    /// @brief Prefixes @p prompt with a bounded replay of @p history.
    [[nodiscard]] auto buildFreshPrompt(std::span<const MessageRecord> history, std::string_view prompt) const
        -> std::string;

    /// @brief Runs one user-initiated send to completion.
    ///
    /// The prompt is appended to the session as a user message unless @p recordPrompt is false,
    /// which is used when a prompt already in the history is sent again.
    auto send(Session& session,
              const std::string& prompt,
              AgentRunner& runner,
              const SendHooks& hooks,
              bool recordPrompt = true) const -> SendOutcome;

    [[nodiscard]] auto config() const -> const ResumeConfig& { return _config; }

  private:
    ResumeConfig _config;
};

/// @brief Describes a failed round as an Error.
[[nodiscard]] auto describeRoundFailure(const RoundResult& round) -> Error;

} // namespace agentlink
