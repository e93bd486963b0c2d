// SPDX-License-Identifier: Apache-2.0
#include "Subprocess.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <format>
#include <mutex>
#include <string_view>
#include <thread>

#ifdef _WIN32
    #define WIN32_LEAN_AND_MEAN
    #include <windows.h>
#else
    #include <sys/wait.h>

    #include <fcntl.h>
    #include <poll.h>
    #include <signal.h>
    #include <spawn.h>
    #include <unistd.h>

extern char** environ;
#endif

namespace agentlink
{

namespace
{

    constexpr auto ReadBufferSize = size_t { 16 * 1024 };
    constexpr auto FinalWait = std::chrono::milliseconds { 1000 };
    constexpr auto WaitPollInterval = std::chrono::milliseconds { 10 };

#ifdef _WIN32
    /// Builds a CreateProcess environment block (inherited variables plus overrides).
    auto buildEnvironmentBlock(const std::map<std::string, std::string>& overrides) -> std::string
    {
        auto variables = std::map<std::string, std::string> {};
        if (auto* const strings = GetEnvironmentStringsA())
        {
            for (auto const* entry = strings; *entry; entry += std::strlen(entry) + 1)
            {
                auto const text = std::string_view { entry };
                auto const eq = text.find('=', 1);
                if (eq == std::string_view::npos)
                    continue;
                variables.emplace(std::string(text.substr(0, eq)), std::string(text.substr(eq + 1)));
            }
            FreeEnvironmentStringsA(strings);
        }
        for (const auto& [key, value]: overrides)
            variables.insert_or_assign(key, value);

        auto block = std::string {};
        for (const auto& [key, value]: variables)
        {
            block += std::format("{}={}", key, value);
            block += '\0';
        }
        block += '\0';
        return block;
    }

    void closeHandle(HANDLE& handle)
    {
        if (handle && handle != INVALID_HANDLE_VALUE)
            CloseHandle(handle);
        handle = nullptr;
    }
#else
    auto makePipe(std::array<int, 2>& fds) -> bool
    {
    #ifdef __linux__
        return ::pipe2(fds.data(), O_CLOEXEC) == 0;
    #else
        if (::pipe(fds.data()) != 0)
            return false;
        ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
        ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
        return true;
    #endif
    }

    void closeFd(int& fd)
    {
        if (fd >= 0)
            ::close(fd);
        fd = -1;
    }

    auto decodeStatus(int status) -> ExitInfo
    {
        if (WIFEXITED(status))
            return ExitInfo { .exitCode = WEXITSTATUS(status), .signal = std::nullopt };
        if (WIFSIGNALED(status))
            return ExitInfo { .exitCode = 128 + WTERMSIG(status), .signal = WTERMSIG(status) };
        return ExitInfo {};
    }

    auto buildEnvironment(const std::map<std::string, std::string>& overrides) -> std::vector<std::string>
    {
        auto envStrings = std::vector<std::string> {};
        if (environ)
        {
            for (auto** e = environ; *e; ++e)
            {
                auto const entry = std::string_view { *e };
                auto const key = entry.substr(0, entry.find('='));
                if (!overrides.contains(std::string(key)))
                    envStrings.emplace_back(entry);
            }
        }
        for (const auto& [key, value]: overrides)
            envStrings.push_back(std::format("{}={}", key, value));
        return envStrings;
    }

    /// Reads once from @p fd into @p target; closes the descriptor on end of file or error.
    void drain(int& fd, std::string& target, bool& closed)
    {
        auto buffer = std::array<char, ReadBufferSize> {};
        auto const n = ::read(fd, buffer.data(), buffer.size());
        if (n > 0)
        {
            target.append(buffer.data(), static_cast<size_t>(n));
            return;
        }
        if (n < 0 && (errno == EINTR || errno == EAGAIN))
            return;
        closeFd(fd);
        closed = true;
    }
#endif

} // namespace

struct Subprocess::Impl
{
#ifdef _WIN32
    HANDLE process = nullptr;
    HANDLE outRead = nullptr;
    HANDLE errRead = nullptr;
    DWORD processId = 0;
#else
    pid_t pid = -1;
    int outFd = -1;
    int errFd = -1;
#endif

    std::mutex waitMutex;
    std::optional<ExitInfo> exit;

    /// Non-blocking reap. Requires waitMutex to be held.
    auto pollExit() -> std::optional<ExitInfo>
    {
        if (exit)
            return exit;
#ifdef _WIN32
        if (!process || WaitForSingleObject(process, 0) != WAIT_OBJECT_0)
            return std::nullopt;
        auto code = DWORD { 0 };
        if (!GetExitCodeProcess(process, &code))
            exit = ExitInfo {};
        else
            exit = ExitInfo { .exitCode = static_cast<int>(code), .signal = std::nullopt };
#else
        if (pid <= 0)
            return std::nullopt;
        auto status = 0;
        auto const rc = ::waitpid(pid, &status, WNOHANG);
        if (rc == pid)
            exit = decodeStatus(status);
        else if (rc < 0 && errno == ECHILD)
        {
            log::warning("Child process {} was reaped elsewhere", pid);
            exit = ExitInfo {};
        }
#endif
        return exit;
    }
};

auto quoteWindowsArgument(std::string_view arg, bool always) -> std::string
{
    if (!always && !arg.empty() && arg.find_first_of(" \t\n\v\"") == std::string_view::npos)
        return std::string(arg);

    auto out = std::string { "\"" };
    auto backslashes = size_t { 0 };
    for (char const c: arg)
    {
        if (c == '\\')
        {
            ++backslashes;
            continue;
        }
        if (c == '"')
            out.append(backslashes * 2 + 1, '\\');
        else
            out.append(backslashes, '\\');
        out += c;
        backslashes = 0;
    }
    out.append(backslashes * 2, '\\');
    out += '"';
    return out;
}

auto escapeForCmd(std::string_view text, int levels) -> std::string
{
    constexpr auto metaCharacters = std::string_view { "()[]%!^\"`<>&|;, *?" };

    auto out = std::string(text);
    for (auto level = 0; level < levels; ++level)
    {
        auto escaped = std::string {};
        escaped.reserve(out.size() * 2);
        for (char const c: out)
        {
            if (metaCharacters.contains(c))
                escaped += '^';
            escaped += c;
        }
        out = std::move(escaped);
    }
    return out;
}

auto isBatchFile(std::string_view program) -> bool
{
    auto lowered = std::string(program);
    std::ranges::transform(lowered, lowered.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered.ends_with(".cmd") || lowered.ends_with(".bat");
}

auto buildWindowsCommandLine(const SubprocessConfig& config) -> std::string
{
    if (!isBatchFile(config.program))
    {
        auto cmdLine = quoteWindowsArgument(config.program);
        for (const auto& arg: config.args)
            cmdLine += " " + quoteWindowsArgument(arg);
        return cmdLine;
    }

    // The batch file re-parses its arguments when it expands %*, hence two levels of escaping.
    auto cmdLine = escapeForCmd(config.program, 1);
    for (const auto& arg: config.args)
        cmdLine += " " + escapeForCmd(quoteWindowsArgument(arg, true), 2);
    return std::format("cmd.exe /d /s /c \"{}\"", cmdLine);
}

Subprocess::Subprocess(PrivateTag): _impl(std::make_unique<Impl>())
{
}

Subprocess::~Subprocess()
{
    if (!tryWait())
    {
        log::debug("Stopping child process {} on destruction", pid());
        stop(std::chrono::milliseconds { 2000 });
    }

#ifdef _WIN32
    closeHandle(_impl->outRead);
    closeHandle(_impl->errRead);
    closeHandle(_impl->process);
#else
    closeFd(_impl->outFd);
    closeFd(_impl->errFd);
#endif
}

auto Subprocess::spawn(const SubprocessConfig& config) -> Result<std::unique_ptr<Subprocess>>
{
    if (config.program.empty())
        return makeError(ErrorCode::SpawnFailure, "No program to spawn");

    auto process = std::make_unique<Subprocess>(PrivateTag {});
    auto& impl = *process->_impl;

#ifdef _WIN32
    SECURITY_ATTRIBUTES sa {};
    sa.nLength = sizeof(sa);
    sa.bInheritHandle = TRUE;

    HANDLE outRead = nullptr, outWrite = nullptr, errRead = nullptr, errWrite = nullptr;
    if (!CreatePipe(&outRead, &outWrite, &sa, 0))
        return makeError(ErrorCode::SpawnFailure, "Failed to create stdout pipe");
    if (!CreatePipe(&errRead, &errWrite, &sa, 0))
    {
        closeHandle(outRead);
        closeHandle(outWrite);
        return makeError(ErrorCode::SpawnFailure, "Failed to create stderr pipe");
    }
    SetHandleInformation(outRead, HANDLE_FLAG_INHERIT, 0);
    SetHandleInformation(errRead, HANDLE_FLAG_INHERIT, 0);

    HANDLE nullInput =
        CreateFileA("NUL", GENERIC_READ, FILE_SHARE_READ | FILE_SHARE_WRITE, &sa, OPEN_EXISTING, 0, nullptr);

    auto cmdLine = buildWindowsCommandLine(config);
    auto envBlock = config.env.empty() ? std::string {} : buildEnvironmentBlock(config.env);

    STARTUPINFOA si {};
    si.cb = sizeof(si);
    si.hStdInput = nullInput;
    si.hStdOutput = outWrite;
    si.hStdError = errWrite;
    si.dwFlags |= STARTF_USESTDHANDLES;

    PROCESS_INFORMATION pi {};
    auto const created = CreateProcessA(nullptr,
                                        cmdLine.data(),
                                        nullptr,
                                        nullptr,
                                        TRUE,
                                        CREATE_NEW_PROCESS_GROUP | CREATE_NO_WINDOW,
                                        envBlock.empty() ? nullptr : envBlock.data(),
                                        config.workingDirectory ? config.workingDirectory->c_str() : nullptr,
                                        &si,
                                        &pi);
    auto const lastError = GetLastError();

    closeHandle(nullInput);
    closeHandle(outWrite);
    closeHandle(errWrite);

    if (!created)
    {
        closeHandle(outRead);
        closeHandle(errRead);
        return makeError(ErrorCode::SpawnFailure,
                         std::format("Failed to start process '{}' (error {})", config.program, lastError));
    }

    CloseHandle(pi.hThread);
    impl.process = pi.hProcess;
    impl.processId = pi.dwProcessId;
    impl.outRead = outRead;
    impl.errRead = errRead;
#else
    auto outPipe = std::array<int, 2> { -1, -1 };
    auto errPipe = std::array<int, 2> { -1, -1 };

    if (!makePipe(outPipe))
        return makeError(ErrorCode::SpawnFailure, std::format("Failed to create stdout pipe: {}", strerror(errno)));
    if (!makePipe(errPipe))
    {
        auto const error = errno;
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        return makeError(ErrorCode::SpawnFailure, std::format("Failed to create stderr pipe: {}", strerror(error)));
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_adddup2(&actions, outPipe[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, errPipe[1], STDERR_FILENO);
    if (config.workingDirectory)
        posix_spawn_file_actions_addchdir_np(&actions, config.workingDirectory->c_str());

    // Own process group, so that a group signal reaches every descendant.
    posix_spawnattr_t attributes;
    posix_spawnattr_init(&attributes);
    auto signalMask = sigset_t {};
    sigemptyset(&signalMask);
    auto defaultSignals = sigset_t {};
    sigemptyset(&defaultSignals);
    sigaddset(&defaultSignals, SIGPIPE);
    sigaddset(&defaultSignals, SIGTERM);
    sigaddset(&defaultSignals, SIGINT);
    posix_spawnattr_setflags(&attributes, POSIX_SPAWN_SETPGROUP | POSIX_SPAWN_SETSIGMASK | POSIX_SPAWN_SETSIGDEF);
    posix_spawnattr_setpgroup(&attributes, 0);
    posix_spawnattr_setsigmask(&attributes, &signalMask);
    posix_spawnattr_setsigdefault(&attributes, &defaultSignals);

    auto argv = std::vector<char*> {};
    auto programCopy = config.program;
    argv.push_back(programCopy.data());
    auto argCopies = std::vector<std::string>(config.args);
    for (auto& arg: argCopies)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    auto envStrings = buildEnvironment(config.env);
    auto envp = std::vector<char*> {};
    for (auto& s: envStrings)
        envp.push_back(s.data());
    envp.push_back(nullptr);

    pid_t pid = -1;
    auto const status =
        posix_spawnp(&pid, config.program.c_str(), &actions, &attributes, argv.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);
    posix_spawnattr_destroy(&attributes);

    closeFd(outPipe[1]);
    closeFd(errPipe[1]);

    if (status != 0)
    {
        closeFd(outPipe[0]);
        closeFd(errPipe[0]);
        return makeError(ErrorCode::SpawnFailure,
                         std::format("Failed to spawn process '{}': {}", config.program, strerror(status)));
    }

    impl.pid = pid;
    impl.outFd = outPipe[0];
    impl.errFd = errPipe[0];
#endif

    log::debug("Started {} (pid {})", config.program, process->pid());
    return process;
}

auto Subprocess::pid() const -> int64_t
{
#ifdef _WIN32
    return static_cast<int64_t>(_impl->processId);
#else
    return static_cast<int64_t>(_impl->pid);
#endif
}

auto Subprocess::read(std::chrono::milliseconds timeout) -> Result<ReadChunk>
{
    auto chunk = ReadChunk {};

#ifdef _WIN32
    chunk.outputClosed = _impl->outRead == nullptr;
    chunk.errorsClosed = _impl->errRead == nullptr;

    auto const readAvailable = [](HANDLE& handle, std::string& target, bool& closed) {
        if (!handle)
            return;
        auto available = DWORD { 0 };
        if (!PeekNamedPipe(handle, nullptr, 0, nullptr, &available, nullptr))
        {
            closeHandle(handle);
            closed = true;
            return;
        }
        if (available == 0)
            return;
        auto buffer = std::array<char, ReadBufferSize> {};
        auto bytesRead = DWORD { 0 };
        auto const toRead = std::min<DWORD>(available, static_cast<DWORD>(buffer.size()));
        if (!ReadFile(handle, buffer.data(), toRead, &bytesRead, nullptr) || bytesRead == 0)
        {
            closeHandle(handle);
            closed = true;
            return;
        }
        target.append(buffer.data(), bytesRead);
    };

    auto const deadline = std::chrono::steady_clock::now() + timeout;
    while (true)
    {
        readAvailable(_impl->outRead, chunk.output, chunk.outputClosed);
        readAvailable(_impl->errRead, chunk.errors, chunk.errorsClosed);
        if (!chunk.output.empty() || !chunk.errors.empty() || (chunk.outputClosed && chunk.errorsClosed))
            return chunk;
        if (std::chrono::steady_clock::now() >= deadline)
            return chunk;
        std::this_thread::sleep_for(WaitPollInterval);
    }
#else
    chunk.outputClosed = _impl->outFd < 0;
    chunk.errorsClosed = _impl->errFd < 0;

    auto fds = std::array<pollfd, 2> {};
    auto count = nfds_t { 0 };
    auto outIndex = -1;
    auto errIndex = -1;
    if (_impl->outFd >= 0)
    {
        outIndex = static_cast<int>(count);
        fds[count++] = pollfd { .fd = _impl->outFd, .events = POLLIN, .revents = 0 };
    }
    if (_impl->errFd >= 0)
    {
        errIndex = static_cast<int>(count);
        fds[count++] = pollfd { .fd = _impl->errFd, .events = POLLIN, .revents = 0 };
    }
    if (count == 0)
        return chunk;

    auto const rc = ::poll(fds.data(), count, static_cast<int>(timeout.count()));
    if (rc < 0)
    {
        if (errno == EINTR)
            return chunk;
        return makeError(ErrorCode::IoError, std::format("poll() on child pipes failed: {}", strerror(errno)));
    }
    if (rc == 0)
        return chunk;

    constexpr auto readable = POLLIN | POLLHUP | POLLERR;
    if (outIndex >= 0 && (fds[static_cast<size_t>(outIndex)].revents & readable))
        drain(_impl->outFd, chunk.output, chunk.outputClosed);
    if (errIndex >= 0 && (fds[static_cast<size_t>(errIndex)].revents & readable))
        drain(_impl->errFd, chunk.errors, chunk.errorsClosed);
    return chunk;
#endif
}

auto Subprocess::tryWait() -> std::optional<ExitInfo>
{
    auto lock = std::lock_guard(_impl->waitMutex);
    return _impl->pollExit();
}

auto Subprocess::waitFor(std::chrono::milliseconds timeout) -> std::optional<ExitInfo>
{
    auto const deadline = std::chrono::steady_clock::now() + timeout;
    while (true)
    {
        if (auto exit = tryWait())
            return exit;
        if (std::chrono::steady_clock::now() >= deadline)
            return std::nullopt;
        std::this_thread::sleep_for(WaitPollInterval);
    }
}

void Subprocess::terminate()
{
    auto lock = std::lock_guard(_impl->waitMutex);
    if (_impl->pollExit())
        return;
#ifdef _WIN32
    if (!GenerateConsoleCtrlEvent(CTRL_BREAK_EVENT, _impl->processId))
        log::debug("CTRL_BREAK_EVENT to process {} failed (error {})", _impl->processId, GetLastError());
#else
    if (::kill(-_impl->pid, SIGTERM) != 0)
        ::kill(_impl->pid, SIGTERM);
#endif
}

void Subprocess::forceKill()
{
    auto lock = std::lock_guard(_impl->waitMutex);
#ifdef _WIN32
    if (!_impl->pollExit() && _impl->process)
        TerminateProcess(_impl->process, 1);
#else
    // The group may outlive its leader while descendants still hold the pipes open.
    if (_impl->pid > 0 && ::kill(-_impl->pid, SIGKILL) != 0 && !_impl->pollExit())
        ::kill(_impl->pid, SIGKILL);
#endif
}

auto Subprocess::stop(std::chrono::milliseconds grace) -> ExitInfo
{
    if (auto exit = tryWait())
        return *exit;

    terminate();
    if (auto exit = waitFor(grace))
        return *exit;

    log::warning("Process {} did not exit within {}, killing it", pid(), grace);
    forceKill();
    if (auto exit = waitFor(FinalWait))
        return *exit;

    log::error("Process {} did not exit after a forceful kill", pid());
#ifdef _WIN32
    return ExitInfo {};
#else
    return ExitInfo { .exitCode = 128 + SIGKILL, .signal = SIGKILL };
#endif
}

} // namespace agentlink
