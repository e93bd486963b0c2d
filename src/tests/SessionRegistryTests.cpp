// SPDX-License-Identifier: Apache-2.0
#include <session/SessionRegistry.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace agentlink;

TEST_CASE("SessionRegistry grants one lease per session", "[registry]")
{
    auto registry = SessionRegistry {};
    auto const session = makeSession("/work");
    REQUIRE(registry.insert(session).has_value());

    auto lease = registry.acquire(session.id, "send");
    REQUIRE(lease.has_value());
    CHECK(registry.owner(session.id) == "send");

    auto second = registry.acquire(session.id, "compaction");
    REQUIRE(!second);
    CHECK(second.error().code == ErrorCode::SessionBusy);

    lease->release();
    CHECK(!registry.owner(session.id));
    CHECK(registry.acquire(session.id, "compaction").has_value());
}

TEST_CASE("SessionRegistry releases the lease when it goes out of scope", "[registry]")
{
    auto registry = SessionRegistry {};
    auto const session = makeSession("/work");
    REQUIRE(registry.insert(session).has_value());

    {
        auto lease = registry.acquire(session.id, "send");
        REQUIRE(lease.has_value());
        auto moved = std::move(*lease);
        CHECK(registry.owner(session.id) == "send");
    }
    CHECK(!registry.owner(session.id));
}

TEST_CASE("SessionRegistry readers see only published changes", "[registry]")
{
    auto registry = SessionRegistry {};
    auto const session = makeSession("/work");
    REQUIRE(registry.insert(session).has_value());

    auto lease = registry.acquire(session.id, "send");
    REQUIRE(lease.has_value());
    lease->session().externalResumeId = "resume-1";
    CHECK(!registry.snapshot(session.id)->externalResumeId);

    lease->publish();
    CHECK(registry.snapshot(session.id)->externalResumeId == "resume-1");

    lease->session().externalResumeId = "resume-2";
    lease->release();
    CHECK(registry.snapshot(session.id)->externalResumeId == "resume-1");
}

TEST_CASE("SessionRegistry rejects unknown and duplicate sessions", "[registry]")
{
    auto registry = SessionRegistry {};
    auto const session = makeSession("/work");
    REQUIRE(registry.insert(session).has_value());

    CHECK(registry.insert(session).error().code == ErrorCode::InvalidArgument);
    CHECK(registry.acquire("unknown", "send").error().code == ErrorCode::SessionNotFound);
    CHECK(!registry.snapshot("unknown"));
    CHECK(registry.contains(session.id));
    CHECK(registry.ids() == std::vector<std::string> { session.id });
}
