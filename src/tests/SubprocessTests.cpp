// SPDX-License-Identifier: Apache-2.0
#include <process/Subprocess.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace agentlink;

namespace
{

    /// Whether every occurrence of @p c in @p line is preceded by a caret.
    auto allEscaped(std::string_view line, char c) -> bool
    {
        for (auto i = size_t { 0 }; i < line.size(); ++i)
        {
            if (line[i] == c && (i == 0 || line[i - 1] != '^'))
                return false;
        }
        return true;
    }

} // namespace

TEST_CASE("quoteWindowsArgument follows the MSVC quoting rules", "[subprocess]")
{
    CHECK(quoteWindowsArgument("plain") == "plain");
    CHECK(quoteWindowsArgument("plain", true) == "\"plain\"");
    CHECK(quoteWindowsArgument("") == "\"\"");
    CHECK(quoteWindowsArgument("two words") == "\"two words\"");
    CHECK(quoteWindowsArgument(R"(say "hi")") == R"("say \"hi\"")");
    CHECK(quoteWindowsArgument(R"(C:\dir with space\)") == R"("C:\dir with space\\")");
    CHECK(quoteWindowsArgument(R"(a\\"b)") == R"("a\\\\\"b")");
}

TEST_CASE("escapeForCmd prefixes metacharacters with carets", "[subprocess]")
{
    CHECK(escapeForCmd("abc") == "abc");
    CHECK(escapeForCmd("a&b") == "a^&b");
    CHECK(escapeForCmd("%PATH%") == "^%PATH^%");
    CHECK(escapeForCmd("a&b", 2) == "a^^^&b");
    CHECK(escapeForCmd("\"|<>", 1) == "^\"^|^<^>");
}

TEST_CASE("isBatchFile recognizes cmd and bat files", "[subprocess]")
{
    CHECK(isBatchFile(R"(C:\npm\claude.cmd)"));
    CHECK(isBatchFile(R"(C:\tools\RUN.BAT)"));
    CHECK(!isBatchFile(R"(C:\tools\claude.exe)"));
    CHECK(!isBatchFile("/usr/bin/claude"));
}

TEST_CASE("buildWindowsCommandLine quotes arguments of regular executables", "[subprocess]")
{
    auto const config = SubprocessConfig {
        .program = R"(C:\agent\claude.exe)",
        .args = { "-p", "hello world" },
    };
    CHECK(buildWindowsCommandLine(config) == R"(C:\agent\claude.exe -p "hello world")");
}

TEST_CASE("buildWindowsCommandLine keeps prompt text away from cmd.exe", "[subprocess]")
{
    auto const config = SubprocessConfig {
        .program = R"(C:\npm\claude.cmd)",
        .args = { "-p", R"(x" & calc & " | more %USERNAME% <in >out)" },
    };

    auto const line = buildWindowsCommandLine(config);
    REQUIRE(line.starts_with("cmd.exe /d /s /c \""));
    REQUIRE(line.ends_with("\""));

    auto const inner = std::string_view(line).substr(18, line.size() - 19);
    CHECK(inner.starts_with(R"(C:\npm\claude.cmd ^^^"-p^^^" )"));
    for (char const c: std::string_view { "\"&|<>%" })
        CHECK(allEscaped(inner, c));
}
