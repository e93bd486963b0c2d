// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <core/Log.hpp>
#include <engine/ConversationManager.hpp>
#include <process/AgentRunner.hpp>
#include <process/ExecutableLocator.hpp>
#include <process/ProcessSupervisor.hpp>
#include <session/SessionStore.hpp>

#include <filesystem>
#include <format>
#include <iostream>
#include <mutex>
#include <print>
#include <string>
#include <thread>

namespace agentlink
{

namespace
{

    auto trim(std::string_view text) -> std::string_view
    {
        while (!text.empty() && (text.front() == ' ' || text.front() == '\t'))
            text.remove_prefix(1);
        while (!text.empty() && (text.back() == ' ' || text.back() == '\t' || text.back() == '\r'))
            text.remove_suffix(1);
        return text;
    }

    auto levelPrefix(log::Level level) -> std::string_view
    {
        switch (level)
        {
            case log::Level::Error: return "\033[31mError:\033[0m ";
            case log::Level::Warning: return "\033[33mWarning:\033[0m ";
            case log::Level::Info: return "\033[34mInfo:\033[0m ";
            case log::Level::Debug: return "\033[90mDebug:\033[0m ";
            case log::Level::Trace: return "\033[90mTrace:\033[0m ";
        }
        return "";
    }

    /// Tool names of the tool_use blocks of an assistant message.
    auto toolNames(const StreamMessage& message) -> std::vector<std::string>
    {
        auto names = std::vector<std::string> {};
        if (!message.raw.contains("message") || !message.raw["message"].is_object())
            return names;
        auto const& content = message.raw["message"].value("content", nlohmann::json::array());
        if (!content.is_array())
            return names;
        for (const auto& block: content)
        {
            if (block.is_object() && block.value("type", "") == "tool_use")
                names.push_back(block.value("name", "tool"));
        }
        return names;
    }

} // namespace

struct App::Impl
{
    AppConfig config;
    std::unique_ptr<SessionStore> store;
    std::unique_ptr<ExecutableLocator> locator;
    std::unique_ptr<ProcessSupervisor> supervisor;
    std::unique_ptr<ProcessAgentRunner> runner;
    std::unique_ptr<ConversationManager> manager;

    std::mutex outputMutex;
    std::mutex currentMutex;
    std::string currentSession;

    explicit Impl(AppConfig cfg): config(std::move(cfg)) {}

    template <typename... Args>
    void print(std::format_string<Args...> fmt, Args&&... args)
    {
        auto lock = std::lock_guard(outputMutex);
        std::println(fmt, std::forward<Args>(args)...);
    }

    auto current() -> std::string
    {
        auto lock = std::lock_guard(currentMutex);
        return currentSession;
    }

    void setCurrent(std::string id)
    {
        auto lock = std::lock_guard(currentMutex);
        currentSession = std::move(id);
    }

    void printMessage(const CoreEvent& event)
    {
        if (!event.message)
            return;
        auto const& message = event.message->message;
        switch (message.type)
        {
            case MessageType::Assistant: {
                if (auto const text = message.text(); !text.empty())
                    print("\033[1massistant:\033[0m {}", text);
                for (const auto& name: toolNames(message))
                    print("\033[90m[tool: {}]\033[0m", name);
                break;
            }
            case MessageType::Result:
                if (message.isError)
                    print("\033[31m[round failed: {}]\033[0m", message.errorText());
                break;
            case MessageType::Error: print("\033[31m[agent error: {}]\033[0m", message.errorText()); break;
            case MessageType::System:
            case MessageType::User:
            case MessageType::ToolUse:
            case MessageType::ToolResult:
            case MessageType::Unknown: break;
        }
    }

    void printEvent(const CoreEvent& event)
    {
        switch (event.kind)
        {
            case CoreEventKind::Message: printMessage(event); break;
            case CoreEventKind::TokenUpdate:
                print("\033[90m[{} tokens, {:.1f}% of context]\033[0m",
                      event.tokenUsage.total(),
                      event.percentage * 100.0);
                break;
            case CoreEventKind::CompactionStart: print("\033[90m[compacting conversation...]\033[0m"); break;
            case CoreEventKind::CompactionComplete:
                print("\033[90m[compacted: {} tokens, {:.1f}% of context]\033[0m",
                      event.tokenUsage.total(),
                      event.percentage * 100.0);
                break;
            case CoreEventKind::CompactionExhausted:
                print("\033[33m[compaction gave up: {}]\033[0m", event.detail);
                break;
            case CoreEventKind::ResumeInvalidated:
                print("\033[90m[previous conversation unavailable, starting fresh]\033[0m");
                break;
            case CoreEventKind::ProcessError:
                if (event.error && event.error->code == ErrorCode::SpawnFailure)
                    print("\033[31m[cannot start the agent: {}]\033[0m", event.error->message);
                else if (event.error)
                    print("\033[31m[{}]\033[0m", event.error->message);
                break;
            case CoreEventKind::StatusChanged:
                log::debug("Session {} is {}", event.sessionId, sessionStatusToString(event.status));
                break;
        }
    }

    void printStatus()
    {
        auto const id = current();
        if (id.empty())
        {
            print("No session selected");
            return;
        }
        auto const session = manager->snapshot(id);
        if (!session)
        {
            print("Session {} is not loaded", id);
            return;
        }
        print("Session {} ({})", session->id, sessionStatusToString(session->status));
        print("  directory:   {}", session->workingDirectory);
        print("  resume id:   {}", session->externalResumeId.value_or("(none)"));
        print("  messages:    {}", session->messages.size());
        print("  tokens:      {} ({:.1f}% of context)",
              session->tokenUsage.total(),
              manager->percentage(*session) * 100.0);
        print("  compacted:   {} (failed attempts: {})",
              session->compaction.wasCompacted ? "yes" : "no",
              session->compaction.attempts);
    }

    auto defaultWorkingDirectory() const -> std::string
    {
        if (!config.workingDirectory.empty())
            return std::filesystem::absolute(config.workingDirectory).string();
        auto ec = std::error_code {};
        auto cwd = std::filesystem::current_path(ec);
        return ec ? std::string(".") : cwd.string();
    }

    void createSession(std::string_view directory)
    {
        auto const dir = directory.empty() ? defaultWorkingDirectory()
                                           : std::filesystem::absolute(std::filesystem::path(directory)).string();
        auto created = manager->createSession(dir);
        if (!created)
        {
            print("Cannot create session: {}", created.error().message);
            return;
        }
        setCurrent(*created);
        print("Session {} in {}", *created, dir);
    }

    void selectSession(std::string_view id)
    {
        auto selected = manager->selectSession(id);
        if (!selected)
        {
            print("{}", selected.error().message);
            return;
        }
        setCurrent(selected->id);
        print("Session {} in {} ({} messages)",
              selected->id,
              selected->workingDirectory,
              selected->messages.size());
    }

    void sendText(std::string text)
    {
        if (current().empty())
            createSession({});
        if (current().empty())
            return;

        if (auto sent = manager->send(current(), std::move(text)); !sent)
        {
            if (sent.error().code == ErrorCode::SessionBusy)
                print("The session is busy, wait for the current reply or /stop it");
            else
                print("Cannot send: {}", sent.error().message);
        }
    }

    /// @return false when the loop should end.
    auto handleCommand(std::string_view line) -> bool
    {
        auto const space = line.find(' ');
        auto const command = line.substr(0, space);
        auto const argument = space == std::string_view::npos ? std::string_view {} : trim(line.substr(space + 1));

        if (command == "/quit" || command == "/exit")
            return false;

        if (command == "/new")
            createSession(argument);
        else if (command == "/select")
        {
            if (argument.empty())
                print("Usage: /select <session id>");
            else
                selectSession(argument);
        }
        else if (command == "/list")
        {
            auto const id = current();
            for (const auto& sessionId: manager->listSessions())
                print("{} {}", sessionId == id ? "*" : " ", sessionId);
        }
        else if (command == "/stop")
        {
            if (auto const id = current(); !id.empty())
            {
                if (auto stopped = manager->stop(id); !stopped)
                    print("{}", stopped.error().message);
            }
        }
        else if (command == "/status")
            printStatus();
        else if (command == "/help")
            print("Commands: /new [dir], /select <id>, /list, /stop, /status, /quit");
        else
            print("Unknown command {} (try /help)", command);
        return true;
    }
};

App::App(AppConfig config): _impl(std::make_unique<Impl>(std::move(config)))
{
    log::setCallback([this](log::Level level, std::string_view message) {
        auto lock = std::lock_guard(_impl->outputMutex);
        std::println(std::cerr, "{}{}", levelPrefix(level), message);
    });
}

App::~App()
{
    if (_impl->manager)
        _impl->manager->shutdown();
    log::setCallback({});
}

auto App::initialize() -> VoidResult
{
    auto const directory = sessionDirectory(_impl->config);
    _impl->store = std::make_unique<SessionStore>(directory);
    log::debug("Session records in {}", directory);

    _impl->locator = std::make_unique<ExecutableLocator>(makeLocatorContext(_impl->config));
    if (auto resolved = _impl->locator->resolve(); resolved)
        log::info("Using agent CLI {} ({})", resolved->program, resolved->strategy);
    else
        log::warning("{}", resolved.error().message);

    _impl->supervisor = std::make_unique<ProcessSupervisor>(*_impl->locator, makeSupervisorConfig(_impl->config));
    _impl->runner = std::make_unique<ProcessAgentRunner>(*_impl->supervisor);
    _impl->manager =
        std::make_unique<ConversationManager>(*_impl->store, *_impl->runner, makeManagerConfig(_impl->config));

    if (!_impl->config.initialSession.empty())
    {
        auto selected = _impl->manager->selectSession(_impl->config.initialSession);
        if (!selected)
            return std::unexpected(selected.error());
        _impl->setCurrent(selected->id);
    }

    // Auto-create config file with resolved settings if none exists
    auto const configPath = defaultConfigPath();
    if (!std::filesystem::exists(configPath))
    {
        auto saveResult = saveConfigToFile(configPath, _impl->config);
        if (saveResult)
            log::info("Config file created at {}", configPath);
        else
            log::warning("Failed to save config file: {}", saveResult.error().message);
    }

    return {};
}

auto App::run() -> int
{
    auto& impl = *_impl;
    auto printer = std::jthread([&impl] {
        while (auto event = impl.manager->events().pop())
            impl.printEvent(*event);
    });

    if (auto const id = impl.current(); !id.empty())
        impl.print("Session {}. Type /help for commands.", id);
    else
        impl.print("Type a message to start a session, /help for commands.");

    auto line = std::string {};
    while (std::getline(std::cin, line))
    {
        auto const text = trim(line);
        if (text.empty())
            continue;
        if (text.front() == '/')
        {
            if (!impl.handleCommand(text))
                break;
            continue;
        }
        impl.sendText(std::string(text));
    }

    impl.manager->shutdown();
    printer.join();
    return 0;
}

} // namespace agentlink
