// SPDX-License-Identifier: Apache-2.0
#include <engine/CompactionCoordinator.hpp>

#include <tests/TestHelpers.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace agentlink;
using namespace agentlink::test;
using namespace std::chrono_literals;

namespace
{

    struct ManualClock
    {
        TimePoint now = fromEpochMillis(1'700'000'000'000);

        auto function() -> NowFunction
        {
            return [this] { return now; };
        }
    };

    auto failingRound() -> ScriptedRound
    {
        auto round = ScriptedRound {};
        round.exit.exitCode = 2;
        round.exit.stderrTail = "API error\n";
        return round;
    }

    struct Fixture
    {
        ManualClock clock;
        FakeAgentRunner runner;
        TokenAccountant accountant { TokenConfig { .maxTokens = 1000 } };
        ResumptionEngine resumption;
        CompactionCoordinator coordinator { runner, accountant, resumption, CompactionConfig {}, clock.function() };
        Session session = makeSession("/work");

        Fixture()
        {
            session.externalResumeId = "abc";
            session.tokenUsage = TokenUsage { .input = 970 };
            session.compaction.requested = true;
        }
    };

} // namespace

TEST_CASE("CompactionCoordinator replaces usage with the post-compaction baseline", "[compaction]")
{
    auto f = Fixture {};
    f.session.appendMessage(*decodeStreamMessage(assistantLine("hi", "abc")));
    f.runner.enqueue(successfulRound("compacted", 15, 5));

    auto started = 0;
    auto const outcome = f.coordinator.requestCompaction(f.session, false, { .onStart = [&](Session&) { ++started; } });

    CHECK(outcome.kind == CompactionOutcomeKind::Completed);
    CHECK(outcome.ran);
    CHECK(started == 1);
    CHECK(f.session.externalResumeId == "compacted");
    CHECK(f.session.tokenUsage.total() == 20);
    CHECK(f.session.compaction.wasCompacted);
    CHECK(f.session.compaction.lastCompactionAt == f.clock.now);
    CHECK(f.session.compaction.attempts == 0);
    CHECK(!f.session.compaction.requested);
    CHECK(!f.session.compaction.replaceUsageOnNextResult);

    // Compaction rounds do not add to the visible history.
    CHECK(f.session.messages.size() == 1);

    auto const plan = f.runner.plans().front();
    CHECK(plan.compaction);
    CHECK(plan.prompt == "/compact");
    CHECK(plan.resumeId == "abc");
    CHECK(plan.timeout == std::chrono::milliseconds(600000));

    SECTION("the following result accumulates onto the baseline")
    {
        f.accountant.onResult(f.session, TokenUsage { .input = 30, .output = 10 });
        CHECK(f.session.tokenUsage.total() == 60);
    }
}

TEST_CASE("CompactionCoordinator defers automatic compaction during the cooldown", "[compaction]")
{
    auto f = Fixture {};
    f.session.compaction.lastCompactionAt = f.clock.now - 100s;

    auto const deferred = f.coordinator.requestCompaction(f.session, false, {});
    CHECK(deferred.kind == CompactionOutcomeKind::Deferred);
    CHECK(!deferred.ran);
    CHECK(deferred.retryAt == f.clock.now + 200s);
    CHECK(f.session.compaction.requested);
    CHECK(!f.coordinator.dueForCompaction(f.session));
    CHECK(f.coordinator.cooldownRemaining(f.session) == 200s);
    CHECK(f.runner.plans().empty());

    SECTION("it becomes due once the cooldown has elapsed")
    {
        f.clock.now += 200s;
        CHECK(f.coordinator.dueForCompaction(f.session));
        CHECK(f.coordinator.cooldownRemaining(f.session) == Clock::duration::zero());
    }

    SECTION("forced compaction ignores the cooldown")
    {
        f.runner.enqueue(successfulRound("compacted", 15, 5));
        CHECK(f.coordinator.requestCompaction(f.session, true, {}).kind == CompactionOutcomeKind::Completed);
    }
}

TEST_CASE("CompactionCoordinator retries after a failure and gives up at the cap", "[compaction]")
{
    auto f = Fixture {};
    auto const originalUsage = f.session.tokenUsage;
    f.runner.enqueue(failingRound());

    auto const first = f.coordinator.requestCompaction(f.session, false, {});
    CHECK(first.kind == CompactionOutcomeKind::Failed);
    REQUIRE(first.error);
    CHECK(first.error->code == ErrorCode::CompactionFailure);
    CHECK(first.retryAt == f.clock.now + 300s);

    // The session is left as it was before the attempt.
    CHECK(f.session.externalResumeId == "abc");
    CHECK(f.session.tokenUsage == originalUsage);
    CHECK(f.session.compaction.attempts == 1);
    CHECK(f.session.compaction.requested);
    CHECK(f.session.compaction.lastAttemptAt == f.clock.now);
    CHECK(!f.coordinator.dueForCompaction(f.session));

    f.clock.now += 300s;
    REQUIRE(f.coordinator.dueForCompaction(f.session));
    f.runner.enqueue(failingRound());

    auto const second = f.coordinator.requestCompaction(f.session, false, {});
    CHECK(second.kind == CompactionOutcomeKind::Exhausted);
    CHECK(second.ran);
    CHECK(f.coordinator.isExhausted(f.session));
    CHECK(!f.session.compaction.requested);
    CHECK(!f.session.compaction.required);
    CHECK(!f.coordinator.dueForCompaction(f.session));

    SECTION("no further rounds run, even when forced")
    {
        auto const third = f.coordinator.requestCompaction(f.session, true, {});
        CHECK(third.kind == CompactionOutcomeKind::Exhausted);
        CHECK(!third.ran);
        CHECK(f.runner.plans().size() == 2);
    }
}

TEST_CASE("CompactionCoordinator counts a round without usage as failed", "[compaction]")
{
    auto f = Fixture {};
    f.runner.enqueue(ScriptedRound { .lines = { systemLine("compacted"), assistantLine("ok", "compacted") } });

    auto const outcome = f.coordinator.requestCompaction(f.session, false, {});
    CHECK(outcome.kind == CompactionOutcomeKind::Failed);
    CHECK(f.session.externalResumeId == "abc");
    CHECK(f.session.compaction.attempts == 1);
}

TEST_CASE("CompactionCoordinator drops the request when the conversation is gone", "[compaction]")
{
    auto f = Fixture {};

    SECTION("unknown resume id")
    {
        f.runner.enqueue(resumeNotFoundRound());
        auto invalidated = std::string {};
        auto const outcome = f.coordinator.requestCompaction(
            f.session, false, { .onResumeInvalidated = [&](Session&, const std::string& id) { invalidated = id; } });

        CHECK(outcome.kind == CompactionOutcomeKind::NotNeeded);
        REQUIRE(outcome.error);
        CHECK(outcome.error->code == ErrorCode::ResumeInvalidated);
        CHECK(invalidated == "abc");
        CHECK(!f.session.externalResumeId);
        CHECK(f.session.invalidatedResumeIds.contains("abc"));
        CHECK(!f.session.compaction.requested);
        CHECK(f.session.compaction.attempts == 0);
    }

    SECTION("no resume id")
    {
        f.session.externalResumeId.reset();
        auto const outcome = f.coordinator.requestCompaction(f.session, true, {});
        CHECK(outcome.kind == CompactionOutcomeKind::NotNeeded);
        CHECK(!outcome.ran);
        CHECK(!f.session.compaction.requested);
        CHECK(f.runner.plans().empty());
    }
}
