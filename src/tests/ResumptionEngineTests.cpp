// SPDX-License-Identifier: Apache-2.0
#include <engine/ResumptionEngine.hpp>

#include <tests/TestHelpers.hpp>

#include <catch2/catch_test_macros.hpp>

#include <stop_token>
#include <vector>

using namespace agentlink;
using namespace agentlink::test;

namespace
{

    auto userMessage(std::string_view text) -> StreamMessage
    {
        return *decodeStreamMessage(nlohmann::json {
            { "type", "user" },
            { "message", { { "role", "user" }, { "content", std::string(text) } } },
        });
    }

    auto sessionWithHistory(std::optional<std::string> resumeId) -> Session
    {
        auto session = makeSession("/work");
        session.externalResumeId = std::move(resumeId);
        session.appendMessage(userMessage("What does main do?"));
        session.appendMessage(*decodeStreamMessage(assistantLine("It parses the\n  command line.", "stale")));
        return session;
    }

    auto roundWith(ExitStatus exit, std::optional<StreamMessage> finalResult = std::nullopt) -> RoundResult
    {
        auto round = RoundResult {};
        round.exit = std::move(exit);
        round.finalResult = std::move(finalResult);
        return round;
    }

} // namespace

TEST_CASE("ResumptionEngine passes the resume id only while it is valid", "[resume]")
{
    auto const engine = ResumptionEngine(ResumeConfig { .systemPrompt = "be brief" });
    auto session = sessionWithHistory("abc");

    auto plan = engine.prepareSend(session, "next");
    CHECK(plan.resumeId == "abc");
    CHECK(plan.prompt == "next");
    CHECK(plan.workingDirectory == "/work");
    CHECK(plan.systemPrompt == "be brief");

    CHECK(engine.invalidate(session) == "abc");
    CHECK(!session.externalResumeId);
    CHECK(session.invalidatedResumeIds.contains("abc"));
    CHECK(!engine.prepareSend(session, "next").resumeId);

    CHECK(!engine.installResumeId(session, "abc"));
    CHECK(!session.externalResumeId);
    CHECK(engine.installResumeId(session, "def"));
    CHECK(!engine.installResumeId(session, "def"));
    CHECK(!engine.installResumeId(session, ""));
    CHECK(session.externalResumeId == "def");

    CHECK(engine.invalidate(session) == "def");
    CHECK(engine.invalidate(session).empty());
}

TEST_CASE("ResumptionEngine classifies round exits", "[resume]")
{
    auto const engine = ResumptionEngine();
    auto resumed = SpawnPlan { .prompt = "hi", .resumeId = "abc" };
    auto fresh = SpawnPlan { .prompt = "hi" };

    SECTION("clean exit")
    {
        CHECK(engine.classify(resumed, roundWith(ExitStatus { .exitCode = 0 })) == ExitClassification::Success);
    }

    SECTION("unknown conversation reported on stderr")
    {
        auto const round = roundWith(
            ExitStatus { .exitCode = 1, .stderrTail = "Error: No conversation found with session ID: abc\n" });
        CHECK(engine.classify(resumed, round) == ExitClassification::ResumeNotFound);
        CHECK(engine.classify(fresh, round) == ExitClassification::Failure);
    }

    SECTION("unknown conversation reported in the result message")
    {
        auto const result = *decodeStreamMessage(nlohmann::json {
            { "type", "result" },
            { "is_error", true },
            { "result", "No conversation found with session ID: abc" },
        });
        CHECK(engine.classify(resumed, roundWith(ExitStatus { .exitCode = 0 }, result))
              == ExitClassification::ResumeNotFound);
    }

    SECTION("unknown conversation signalled by the exit code alone")
    {
        auto const round = roundWith(ExitStatus { .exitCode = 1 });
        CHECK(engine.classify(resumed, round) == ExitClassification::ResumeNotFound);
        CHECK(engine.classify(fresh, round) == ExitClassification::Failure);
    }

    SECTION("unknown conversation reported on a plain stdout line")
    {
        auto round = roundWith(ExitStatus { .exitCode = 0 });
        round.unparsedOutput = "No conversation found with session ID: abc\n";
        CHECK(engine.classify(resumed, round) == ExitClassification::ResumeNotFound);
        CHECK(engine.classify(fresh, round) == ExitClassification::Success);
    }

    SECTION("exit code shared with other failures")
    {
        auto const strict = ResumptionEngine(ResumeConfig { .requireMarker = true });
        auto const rateLimited = roundWith(ExitStatus { .exitCode = 1, .stderrTail = "rate limited\n" });
        CHECK(strict.classify(resumed, rateLimited) == ExitClassification::Failure);

        auto const unknown =
            roundWith(ExitStatus { .exitCode = 1, .stderrTail = "No conversation found with session ID: abc\n" });
        CHECK(strict.classify(resumed, unknown) == ExitClassification::ResumeNotFound);

        // Without a marker to look for, the exit code has to do.
        auto const codeOnly = ResumptionEngine(ResumeConfig { .resumeNotFoundMarker = "", .requireMarker = true });
        CHECK(codeOnly.classify(resumed, rateLimited) == ExitClassification::ResumeNotFound);
    }

    SECTION("other non-zero exits")
    {
        auto const round = roundWith(ExitStatus { .exitCode = 2, .stderrTail = "rate limited\n" });
        CHECK(engine.classify(resumed, round) == ExitClassification::Failure);
        CHECK(describeRoundFailure(round).code == ErrorCode::ProcessFailure);
        CHECK(describeRoundFailure(round).message == "The agent exited with code 2: rate limited");

        auto const signalled = roundWith(ExitStatus { .exitCode = 1, .signal = 1 });
        CHECK(engine.classify(resumed, signalled) == ExitClassification::Failure);
    }

    SECTION("stop request")
    {
        auto const round = roundWith(ExitStatus { .exitCode = -1, .signal = 15, .killed = true });
        CHECK(engine.classify(resumed, round) == ExitClassification::Cancelled);
    }

    SECTION("stall and timeout are failures")
    {
        auto const stalled = roundWith(ExitStatus { .exitCode = -1, .signal = 9, .killed = true, .stalled = true });
        CHECK(engine.classify(resumed, stalled) == ExitClassification::Failure);
        CHECK(describeRoundFailure(stalled).code == ErrorCode::ProcessFailure);

        auto const timedOut =
            roundWith(ExitStatus { .exitCode = -1, .signal = 9, .killed = true, .timedOut = true });
        CHECK(engine.classify(resumed, timedOut) == ExitClassification::Failure);
        CHECK(describeRoundFailure(timedOut).code == ErrorCode::TimeoutError);
    }
}

TEST_CASE("ResumptionEngine replays recent context into a fresh prompt", "[resume]")
{
    auto const session = sessionWithHistory(std::nullopt);

    SECTION("default replay")
    {
        auto const engine = ResumptionEngine();
        CHECK(engine.buildFreshPrompt(session.messages, "And the tests?")
              == "[Context from the previous conversation, which could not be resumed]\n"
                 "User: What does main do?\n"
                 "Assistant: It parses the command line.\n"
                 "[End of context]\n\n"
                 "And the tests?");
    }

    SECTION("only the most recent messages, truncated")
    {
        auto const engine = ResumptionEngine(ResumeConfig { .contextReplayMessages = 1, .contextReplayChars = 8 });
        CHECK(engine.buildFreshPrompt(session.messages, "And the tests?")
              == "[Context from the previous conversation, which could not be resumed]\n"
                 "Assistant: It parse...\n"
                 "[End of context]\n\n"
                 "And the tests?");
    }

    SECTION("replay disabled or nothing to replay")
    {
        auto const disabled = ResumptionEngine(ResumeConfig { .contextReplayMessages = 0 });
        CHECK(disabled.buildFreshPrompt(session.messages, "x") == "x");
        CHECK(ResumptionEngine().buildFreshPrompt({}, "x") == "x");
    }
}

TEST_CASE("ResumptionEngine send installs the reported resume id", "[resume]")
{
    auto const engine = ResumptionEngine();
    auto runner = FakeAgentRunner {};
    runner.enqueue(successfulRound("abc", 100, 50));

    auto session = makeSession("/work");
    auto states = std::vector<SendState> {};
    auto commits = 0;
    auto const hooks = SendHooks {
        .onStateChange = [&](SendState state) { states.push_back(state); },
        .onCommit = [&](Session&) { ++commits; },
    };

    auto const outcome = engine.send(session, "hello", runner, hooks);

    CHECK(outcome.succeeded());
    CHECK(!outcome.resumeInvalidated);
    CHECK(session.externalResumeId == "abc");
    CHECK(commits == 1);
    CHECK(states == std::vector { SendState::Spawning, SendState::Streaming, SendState::Completed });

    // The local prompt plus the three agent messages.
    REQUIRE(session.messages.size() == 4);
    CHECK(session.messages[0].message.type == MessageType::User);
    CHECK(session.messages[0].message.text() == "hello");
    CHECK(runner.plans().front().resumeId == std::nullopt);
}

TEST_CASE("ResumptionEngine send recovers from an unknown resume id exactly once", "[resume]")
{
    auto const engine = ResumptionEngine();
    auto runner = FakeAgentRunner {};
    runner.enqueue(resumeNotFoundRound());
    runner.enqueue(successfulRound("fresh", 100, 50));

    auto session = sessionWithHistory("stale");
    auto invalidatedIds = std::vector<std::string> {};
    auto const hooks = SendHooks {
        .onResumeInvalidated = [&](Session&, const std::string& id) { invalidatedIds.push_back(id); },
    };

    auto const outcome = engine.send(session, "And the tests?", runner, hooks);

    CHECK(outcome.succeeded());
    CHECK(outcome.resumeInvalidated);
    CHECK(invalidatedIds == std::vector<std::string> { "stale" });
    CHECK(session.externalResumeId == "fresh");
    CHECK(session.invalidatedResumeIds.contains("stale"));

    auto const plans = runner.plans();
    REQUIRE(plans.size() == 2);
    CHECK(plans[0].resumeId == "stale");
    CHECK(plans[0].prompt == "And the tests?");
    CHECK(!plans[1].resumeId);
    CHECK(plans[1].prompt.starts_with("[Context from the previous conversation"));
    CHECK(plans[1].prompt.contains("User: What does main do?"));
    CHECK(plans[1].prompt.ends_with("\n\nAnd the tests?"));

    // History is kept as it was: two old messages, the prompt and the fresh round.
    CHECK(session.messages.size() == 6);

    SECTION("the next send resumes the new conversation")
    {
        runner.enqueue(successfulRound("fresh", 10, 10));
        CHECK(engine.send(session, "thanks", runner, {}).succeeded());
        CHECK(runner.plans().back().resumeId == "fresh");
    }
}

TEST_CASE("ResumptionEngine send never reinstalls an invalidated id", "[resume]")
{
    auto const engine = ResumptionEngine();
    auto runner = FakeAgentRunner {};
    runner.enqueue(resumeNotFoundRound());
    runner.enqueue(successfulRound("stale", 10, 10));

    auto session = sessionWithHistory("stale");
    auto const outcome = engine.send(session, "again", runner, {});

    CHECK(outcome.succeeded());
    CHECK(!session.externalResumeId);
    CHECK(!engine.prepareSend(session, "x").resumeId);
}

TEST_CASE("ResumptionEngine send reports failures", "[resume]")
{
    auto const engine = ResumptionEngine();
    auto runner = FakeAgentRunner {};
    auto session = makeSession("/work");

    SECTION("spawn failure")
    {
        runner.enqueue(ScriptedRound { .spawnError = Error { ErrorCode::SpawnFailure, "not found" } });
        auto const outcome = engine.send(session, "hello", runner, {});
        CHECK(outcome.state == SendState::Failed);
        REQUIRE(outcome.error);
        CHECK(outcome.error->code == ErrorCode::SpawnFailure);
        CHECK(!session.externalResumeId);
    }

    SECTION("non-zero exit")
    {
        auto round = ScriptedRound {};
        round.exit.exitCode = 2;
        round.exit.stderrTail = "boom\n";
        runner.enqueue(round);

        auto const outcome = engine.send(session, "hello", runner, {});
        CHECK(outcome.state == SendState::Failed);
        REQUIRE(outcome.error);
        CHECK(outcome.error->code == ErrorCode::ProcessFailure);
        CHECK(!outcome.cancelled);
    }

    SECTION("stall")
    {
        auto round = ScriptedRound {};
        round.exit = ExitStatus { .exitCode = -1, .signal = 9, .killed = true, .stalled = true };
        runner.enqueue(round);

        auto const outcome = engine.send(session, "hello", runner, {});
        CHECK(outcome.stalled);
        CHECK(outcome.state == SendState::Failed);
    }

    SECTION("a second unknown resume id in a row is a failure")
    {
        session.externalResumeId = "stale";
        runner.enqueue(resumeNotFoundRound());
        auto second = resumeNotFoundRound();
        second.lines.push_back(resultLine("other", 1, 1, true));
        runner.enqueue(second);

        auto const outcome = engine.send(session, "hello", runner, {});
        CHECK(outcome.state == SendState::Failed);
        CHECK(outcome.resumeInvalidated);
        CHECK(runner.plans().size() == 2);
    }
}

TEST_CASE("ResumptionEngine send stops between the invalidated and the fresh round", "[resume]")
{
    auto const engine = ResumptionEngine();
    auto runner = FakeAgentRunner {};
    runner.enqueue(resumeNotFoundRound());
    runner.enqueue(successfulRound("fresh", 100, 50));

    auto session = sessionWithHistory("stale");
    auto stopSource = std::stop_source {};
    auto const hooks = SendHooks {
        .onResumeInvalidated = [&](Session&, const std::string&) { stopSource.request_stop(); },
        .stopToken = stopSource.get_token(),
    };

    auto const outcome = engine.send(session, "And the tests?", runner, hooks);

    CHECK(outcome.cancelled);
    CHECK(outcome.resumeInvalidated);
    CHECK(!outcome.error);
    CHECK(runner.plans().size() == 1);
    CHECK(!session.externalResumeId);
}

TEST_CASE("ResumptionEngine send can repeat a prompt without recording it again", "[resume]")
{
    auto const engine = ResumptionEngine();
    auto runner = FakeAgentRunner {};
    runner.enqueue(successfulRound("abc", 10, 5));

    auto session = sessionWithHistory(std::nullopt);
    auto const before = session.messages.size();

    CHECK(engine.send(session, "What does main do?", runner, {}, false).succeeded());
    CHECK(session.messages.size() == before + 3);
    CHECK(runner.plans().front().prompt == "What does main do?");
}
