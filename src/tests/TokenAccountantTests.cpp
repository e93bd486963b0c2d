// SPDX-License-Identifier: Apache-2.0
#include <engine/TokenAccountant.hpp>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

using namespace agentlink;
using Catch::Matchers::WithinAbs;

TEST_CASE("TokenAccountant accumulates usage and resets after compaction", "[tokens]")
{
    auto const accountant = TokenAccountant(TokenConfig { .maxTokens = 1000 });
    auto session = makeSession("/work");

    accountant.onResult(session, TokenUsage { .input = 100, .output = 50 });
    CHECK(session.tokenUsage.total() == 150);

    accountant.onResult(session, TokenUsage { .input = 100, .output = 20 });
    CHECK(session.tokenUsage.total() == 270);
    CHECK_THAT(accountant.percentage(session), WithinAbs(0.27, 1e-9));

    SECTION("a baseline after compaction replaces the total")
    {
        session.compaction.replaceUsageOnNextResult = true;
        accountant.onResult(session, TokenUsage { .input = 15, .output = 5 });
        CHECK(session.tokenUsage.total() == 20);
        CHECK(!session.compaction.replaceUsageOnNextResult);

        accountant.onResult(session, TokenUsage { .input = 10, .output = 10 });
        CHECK(session.tokenUsage.total() == 40);
    }
}

TEST_CASE("TokenAccountant flags compaction at the thresholds", "[tokens]")
{
    auto const accountant =
        TokenAccountant(TokenConfig { .maxTokens = 1000, .autoThreshold = 0.5, .forceThreshold = 0.8 });
    auto session = makeSession("/work");

    CHECK(accountant.onResult(session, TokenUsage { .input = 499 }) == ThresholdLevel::Below);
    CHECK(!session.compaction.requested);
    CHECK(!session.compaction.required);

    CHECK(accountant.onResult(session, TokenUsage { .input = 1 }) == ThresholdLevel::Auto);
    CHECK(session.compaction.requested);
    CHECK(!session.compaction.required);

    CHECK(accountant.onResult(session, TokenUsage { .output = 300 }) == ThresholdLevel::Force);
    CHECK(session.compaction.requested);
    CHECK(session.compaction.required);
}

TEST_CASE("TokenAccountant counts cache tokens towards the total", "[tokens]")
{
    auto const accountant = TokenAccountant(TokenConfig { .maxTokens = 100 });
    auto session = makeSession("/work");

    accountant.onResult(session, TokenUsage { .input = 10, .output = 10, .cacheCreate = 30, .cacheRead = 50 });
    CHECK(accountant.evaluate(session) == ThresholdLevel::Force);
    CHECK_THAT(accountant.percentage(session), WithinAbs(1.0, 1e-9));
}
