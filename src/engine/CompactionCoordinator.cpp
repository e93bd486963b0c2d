// SPDX-License-Identifier: Apache-2.0
#include "CompactionCoordinator.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <format>

namespace agentlink
{

CompactionCoordinator::CompactionCoordinator(AgentRunner& runner,
                                             const TokenAccountant& accountant,
                                             const ResumptionEngine& resumption,
                                             CompactionConfig config,
                                             NowFunction now):
    _runner(runner), _accountant(accountant), _resumption(resumption), _config(std::move(config)), _now(std::move(now))
{
}

auto CompactionCoordinator::earliestStart(const Session& session) const -> std::optional<TimePoint>
{
    auto const& state = session.compaction;
    auto earliest = std::optional<TimePoint> {};
    if (state.lastCompactionAt)
        earliest = *state.lastCompactionAt + _config.cooldown;
    if (state.retryAt)
        earliest = earliest ? std::max(*earliest, *state.retryAt) : *state.retryAt;
    return earliest;
}

auto CompactionCoordinator::isExhausted(const Session& session) const -> bool
{
    return session.compaction.attempts >= _config.maxAttempts;
}

auto CompactionCoordinator::cooldownRemaining(const Session& session) const -> Clock::duration
{
    auto const earliest = earliestStart(session);
    if (!earliest)
        return Clock::duration::zero();
    return std::max(Clock::duration::zero(), *earliest - _now());
}

auto CompactionCoordinator::dueForCompaction(const Session& session) const -> bool
{
    auto const& state = session.compaction;
    if (!state.requested && !state.required)
        return false;
    if (isExhausted(session) || !session.externalResumeId)
        return false;
    auto const earliest = earliestStart(session);
    return !earliest || _now() >= *earliest;
}

auto CompactionCoordinator::requestCompaction(Session& session, bool force, const CompactionHooks& hooks)
    -> CompactionOutcome
{
    auto& state = session.compaction;
    if (isExhausted(session))
    {
        log::debug("Session {}: compaction attempts exhausted ({})", session.id, state.attempts);
        state.requested = false;
        state.required = false;
        return CompactionOutcome { .kind = CompactionOutcomeKind::Exhausted };
    }
    state.requested = true;

    auto plan = _resumption.prepareSend(session, _config.prompt);
    if (!plan.resumeId)
    {
        log::debug("Session {}: nothing to compact without a resumable conversation", session.id);
        state.requested = false;
        state.required = false;
        return CompactionOutcome { .kind = CompactionOutcomeKind::NotNeeded };
    }

    if (!force)
    {
        if (auto const earliest = earliestStart(session); earliest && _now() < *earliest)
        {
            log::debug("Session {}: compaction deferred until the cooldown elapses", session.id);
            return CompactionOutcome { .kind = CompactionOutcomeKind::Deferred, .retryAt = earliest };
        }
    }

    plan.compaction = true;
    plan.timeout = _config.timeout;

    auto const before = session;
    state.lastAttemptAt = _now();
    log::info("Session {}: starting compaction (attempt {} of {})",
              session.id,
              state.attempts + 1,
              _config.maxAttempts);
    if (hooks.onStart)
        hooks.onStart(session);

    auto const observer = RoundObserver {
        .onSpawned = {},
        .onMessage = [&](StreamMessage message) {
            log::trace("Session {}: compaction {} message", session.id, messageTypeToString(message.type));
        },
    };

    auto outcome = CompactionOutcome { .ran = true };
    auto round = _runner.run(session.id, plan, observer);
    auto failure = std::optional<Error> {};

    if (!round)
    {
        failure = round.error();
    }
    else
    {
        switch (_resumption.classify(plan, *round))
        {
            case ExitClassification::ResumeNotFound: {
                session = before;
                auto const invalidated = _resumption.invalidate(session);
                session.compaction.requested = false;
                session.compaction.required = false;
                session.compaction.retryAt.reset();
                if (hooks.onResumeInvalidated)
                    hooks.onResumeInvalidated(session, invalidated);
                outcome.kind = CompactionOutcomeKind::NotNeeded;
                outcome.error = Error { ErrorCode::ResumeInvalidated,
                                        std::format("Resume id {} is unknown to the agent", invalidated) };
                return outcome;
            }

            case ExitClassification::Success: {
                auto const& result = round->finalResult;
                if (!result || !result->usage)
                    failure = Error { ErrorCode::CompactionFailure, "The compaction round reported no usage" };
                else if (!round->resumeId || session.invalidatedResumeIds.contains(*round->resumeId))
                    failure = Error { ErrorCode::CompactionFailure, "The compaction round reported no usable resume id" };
                else
                    outcome.baseline = result->usage;
                break;
            }

            case ExitClassification::Cancelled:
                failure = Error { ErrorCode::ProcessFailure, "The compaction round was stopped" };
                break;

            case ExitClassification::Failure: failure = describeRoundFailure(*round); break;
        }
    }

    if (failure)
    {
        session = before;
        auto& restored = session.compaction;
        restored.lastAttemptAt = _now();
        ++restored.attempts;
        outcome.error = Error { ErrorCode::CompactionFailure, failure->message };

        if (isExhausted(session))
        {
            log::warning("Session {}: compaction failed {} times, continuing without compaction: {}",
                         session.id,
                         restored.attempts,
                         failure->message);
            restored.requested = false;
            restored.required = false;
            restored.retryAt.reset();
            outcome.kind = CompactionOutcomeKind::Exhausted;
            return outcome;
        }

        restored.retryAt = _now() + _config.cooldown;
        log::warning("Session {}: compaction failed, retrying after cooldown: {}", session.id, failure->message);
        outcome.kind = CompactionOutcomeKind::Failed;
        outcome.retryAt = restored.retryAt;
        return outcome;
    }

    session.externalResumeId = *round->resumeId;
    state.wasCompacted = true;
    state.lastCompactionAt = _now();
    state.attempts = 0;
    state.requested = false;
    state.required = false;
    state.retryAt.reset();
    state.replaceUsageOnNextResult = true;
    _accountant.onResult(session, *outcome.baseline);

    log::info("Session {}: compaction complete, usage reset to {} tokens", session.id, session.tokenUsage.total());
    outcome.kind = CompactionOutcomeKind::Completed;
    return outcome;
}

} // namespace agentlink
