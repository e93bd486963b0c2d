// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Time.hpp>
#include <engine/ResumptionEngine.hpp>
#include <engine/TokenAccountant.hpp>
#include <process/AgentRunner.hpp>
#include <session/Session.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace agentlink
{

struct CompactionConfig
{
    /// @brief Minimum time between compaction attempts.
    std::chrono::seconds cooldown { 300 };

    /// @brief Consecutive failed attempts after which compaction stops automatically.
    int maxAttempts = 2;

    /// @brief Prompt sent to the agent to summarize the conversation.
    std::string prompt = "/compact";

    /// @brief Upper bound for one compaction round.
    std::chrono::milliseconds timeout { 600000 };
};

enum class CompactionOutcomeKind : std::uint8_t
{
    /// The round succeeded and the session now carries the post-compaction state.
    Completed,
    /// The request is kept and runs once the cooldown has elapsed.
    Deferred,
    /// The round failed; a retry is scheduled.
    Failed,
    /// The attempt cap is reached; the session continues without compaction.
    Exhausted,
    /// Nothing to compact (no request pending, or no conversation to resume).
    NotNeeded,
};

[[nodiscard]] constexpr auto compactionOutcomeKindToString(CompactionOutcomeKind kind) -> std::string_view
{
    switch (kind)
    {
        case CompactionOutcomeKind::Completed: return "completed";
        case CompactionOutcomeKind::Deferred: return "deferred";
        case CompactionOutcomeKind::Failed: return "failed";
        case CompactionOutcomeKind::Exhausted: return "exhausted";
        case CompactionOutcomeKind::NotNeeded: return "not-needed";
    }
    return "not-needed";
}

struct CompactionOutcome
{
    CompactionOutcomeKind kind = CompactionOutcomeKind::NotNeeded;

    /// @brief When a deferred or failed compaction becomes due again.
    std::optional<TimePoint> retryAt;

    std::optional<Error> error;

    /// @brief Usage reported by a successful round.
    std::optional<TokenUsage> baseline;

    /// @brief Whether a compaction round was actually run.
    bool ran = false;
};

struct CompactionHooks
{
    /// @brief A compaction round is about to be spawned.
    std::function<void(Session& session)> onStart;

    /// @brief The round reported that the session's resume id is unknown.
    std::function<void(Session& session, const std::string& invalidatedId)> onResumeInvalidated;
};

/// @brief Runs compaction rounds for sessions whose token usage crossed a threshold.
///
/// A compaction round resumes the conversation with the compaction prompt. On success
/// the session's resume id, token usage and compaction state are replaced in one step;
/// on failure the session is restored to its state before the round.
class CompactionCoordinator
{
  public:
    CompactionCoordinator(AgentRunner& runner,
                          const TokenAccountant& accountant,
                          const ResumptionEngine& resumption,
                          CompactionConfig config = {},
                          NowFunction now = systemNow());

    /// @brief Records a compaction request for @p session and runs it if it is allowed now.
    /// @param force Bypasses the cooldown and any scheduled retry time, but not the attempt cap.
    auto requestCompaction(Session& session, bool force, const CompactionHooks& hooks = {}) -> CompactionOutcome;

    /// @brief Whether a pending request may run now without forcing.
    [[nodiscard]] auto dueForCompaction(const Session& session) const -> bool;

    [[nodiscard]] auto isExhausted(const Session& session) const -> bool;

    /// @brief Time until the cooldown and any scheduled retry have elapsed (zero if none).
    [[nodiscard]] auto cooldownRemaining(const Session& session) const -> Clock::duration;

    [[nodiscard]] auto config() const -> const CompactionConfig& { return _config; }

  private:
    [[nodiscard]] auto earliestStart(const Session& session) const -> std::optional<TimePoint>;

    AgentRunner& _runner;
    const TokenAccountant& _accountant;
    const ResumptionEngine& _resumption;
    CompactionConfig _config;
    NowFunction _now;
};

} // namespace agentlink
