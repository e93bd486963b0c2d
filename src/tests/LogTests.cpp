// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>

#include <tests/TestHelpers.hpp>

#include <catch2/catch_test_macros.hpp>

#include <fstream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

using namespace agentlink;

namespace
{

    /// Captures log output for the lifetime of the object and restores the defaults afterwards.
    class LogCapture
    {
      public:
        explicit LogCapture(log::Level level)
        {
            log::setLevel(level);
            log::setCallback([this](log::Level lvl, std::string_view message) {
                entries.emplace_back(lvl, std::string(message));
            });
        }

        ~LogCapture()
        {
            log::setCallback({});
            log::setLevel(log::Level::Info);
            (void) log::setLogFile({});
        }

        LogCapture(const LogCapture&) = delete;
        LogCapture& operator=(const LogCapture&) = delete;

        std::vector<std::pair<log::Level, std::string>> entries;
    };

    auto readFile(const std::filesystem::path& path) -> std::string
    {
        auto file = std::ifstream(path);
        auto ss = std::stringstream {};
        ss << file.rdbuf();
        return ss.str();
    }

} // namespace

TEST_CASE("levelFromString maps names and falls back to info", "[log]")
{
    CHECK(log::levelFromString("error") == log::Level::Error);
    CHECK(log::levelFromString("warn") == log::Level::Warning);
    CHECK(log::levelFromString("warning") == log::Level::Warning);
    CHECK(log::levelFromString("debug") == log::Level::Debug);
    CHECK(log::levelFromString("trace") == log::Level::Trace);
    CHECK(log::levelFromString("verbose") == log::Level::Info);
}

TEST_CASE("levelName has a fixed width", "[log]")
{
    CHECK(log::levelName(log::Level::Error) == "ERROR");
    CHECK(log::levelName(log::Level::Warning) == "WARN ");
    CHECK(log::levelName(log::Level::Trace).size() == 5);
}

TEST_CASE("Messages below the configured level are dropped", "[log]")
{
    auto capture = LogCapture { log::Level::Warning };

    log::error("lost {} records", 2);
    log::warning("slow write");
    log::info("not shown");
    log::debug("not shown either");

    REQUIRE(capture.entries.size() == 2);
    CHECK(capture.entries[0] == std::pair { log::Level::Error, std::string("lost 2 records") });
    CHECK(capture.entries[1].first == log::Level::Warning);
}

TEST_CASE("setLogFile appends tagged lines alongside the callback", "[log]")
{
    auto const dir = test::TempDirectory {};
    auto const path = dir.path() / "agentlink.log";
    auto capture = LogCapture { log::Level::Debug };

    REQUIRE(log::setLogFile(path.string()).has_value());
    log::debug("session {} saved", "s1");
    REQUIRE(log::setLogFile({}).has_value());
    log::debug("after close");

    CHECK(capture.entries.size() == 2);

    auto const content = readFile(path);
    CHECK(content.find("[DEBUG] [t") != std::string::npos);
    CHECK(content.find("session s1 saved") != std::string::npos);
    CHECK(content.find("after close") == std::string::npos);
}

TEST_CASE("setLogFile reports an unwritable path", "[log]")
{
    auto const dir = test::TempDirectory {};
    auto const result = log::setLogFile((dir.path() / "missing" / "agentlink.log").string());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::IoError);
}
