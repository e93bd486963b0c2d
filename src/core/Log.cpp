// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <atomic>
#include <chrono>
#include <fstream>
#include <mutex>
#include <print>

namespace agentlink::log
{

namespace
{

    auto globalLevel = std::atomic<Level> { Level::Info };
    auto globalCallback = LogCallback {};
    auto globalFile = std::ofstream {};
    auto globalMutex = std::mutex {};
    auto nextThreadIndex = std::atomic<unsigned> { 0 };

    /// Small stable number per thread, easier to follow in a log than native thread ids.
    auto threadIndex() -> unsigned
    {
        thread_local auto const index = nextThreadIndex++;
        return index;
    }

} // namespace

void setCallback(LogCallback callback)
{
    auto lock = std::lock_guard(globalMutex);
    globalCallback = std::move(callback);
}

void setLevel(Level level)
{
    globalLevel = level;
}

auto getLevel() -> Level
{
    return globalLevel;
}

auto levelName(Level level) -> std::string_view
{
    switch (level)
    {
        case Level::Error: return "ERROR";
        case Level::Warning: return "WARN ";
        case Level::Info: return "INFO ";
        case Level::Debug: return "DEBUG";
        case Level::Trace: return "TRACE";
    }
    return "?????";
}

auto levelFromString(std::string_view name) -> Level
{
    if (name == "error")
        return Level::Error;
    if (name == "warning" || name == "warn")
        return Level::Warning;
    if (name == "debug")
        return Level::Debug;
    if (name == "trace")
        return Level::Trace;
    return Level::Info;
}

auto setLogFile(std::string_view path) -> VoidResult
{
    auto lock = std::lock_guard(globalMutex);
    if (globalFile.is_open())
        globalFile.close();
    if (path.empty())
        return {};

    globalFile.open(std::string(path), std::ios::app);
    if (!globalFile.is_open())
        return makeError(ErrorCode::IoError, std::format("Cannot open log file {}", path));
    return {};
}

void write(Level level, std::string_view message)
{
    if (level > globalLevel.load())
        return;

    auto const thread = threadIndex();
    auto lock = std::lock_guard(globalMutex);

    if (globalFile.is_open())
    {
        auto const now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
        std::println(globalFile, "{:%F %T} [{}] [t{}] {}", now, levelName(level), thread, message);
        globalFile.flush();
    }

    if (globalCallback)
    {
        globalCallback(level, message);
        return;
    }

    std::println(stderr, "[{}] {}", levelName(level), message);
}

} // namespace agentlink::log
