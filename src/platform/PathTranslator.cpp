// SPDX-License-Identifier: Apache-2.0
#include "PathTranslator.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <cctype>
#include <format>

namespace agentlink
{

namespace
{

    auto toForwardSlashes(std::string_view path) -> std::string
    {
        auto result = std::string(path);
        std::ranges::replace(result, '\\', '/');
        return result;
    }

    auto toBackslashes(std::string_view path) -> std::string
    {
        auto result = std::string(path);
        std::ranges::replace(result, '/', '\\');
        return result;
    }

    auto iequals(std::string_view a, std::string_view b) -> bool
    {
        return std::ranges::equal(a, b, [](char x, char y) {
            return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
        });
    }

    auto isDriveLetter(char c) -> bool
    {
        return std::isalpha(static_cast<unsigned char>(c)) != 0;
    }

    /// Mount root without trailing slashes ("/" becomes "").
    auto normalizedMountRoot(std::string_view mountRoot) -> std::string
    {
        auto root = toForwardSlashes(mountRoot);
        while (!root.empty() && root.back() == '/')
            root.pop_back();
        return root;
    }

    auto stripTrailingSlashes(std::string path) -> std::string
    {
        while (path.size() > 1 && path.back() == '/')
            path.pop_back();
        return path;
    }

} // namespace

PathTranslator::PathTranslator(PathTranslatorConfig config): _config(std::move(config))
{
}

auto PathTranslator::toSubprocessPath(std::string_view hostPath) const -> std::string
{
    if (_config.mode == PathNamespace::Host || hostPath.empty())
        return std::string(hostPath);

    // UNC: \\server\share\rest
    if (hostPath.starts_with("\\\\") || hostPath.starts_with("//"))
    {
        auto const unc = toForwardSlashes(hostPath.substr(2));
        auto const serverEnd = unc.find('/');
        auto const server = std::string_view(unc).substr(0, serverEnd);

        if (!iequals(server, "wsl$") && !iequals(server, "wsl.localhost"))
        {
            log::debug("Cannot map UNC path into subprocess namespace: {}", hostPath);
            return std::string(hostPath);
        }

        if (serverEnd == std::string::npos)
            return "/";

        // Skip the distribution name.
        auto const distroEnd = unc.find('/', serverEnd + 1);
        if (distroEnd == std::string::npos)
            return "/";

        return stripTrailingSlashes(unc.substr(distroEnd));
    }

    // Drive letter: C:\rest or C:/rest or C:
    if (hostPath.size() >= 2 && isDriveLetter(hostPath[0]) && hostPath[1] == ':')
    {
        auto const rest = hostPath.substr(2);
        if (!rest.empty() && rest[0] != '\\' && rest[0] != '/')
        {
            log::debug("Cannot map drive-relative path into subprocess namespace: {}", hostPath);
            return std::string(hostPath);
        }

        auto const drive =
            static_cast<char>(std::tolower(static_cast<unsigned char>(hostPath[0])));
        auto result = normalizedMountRoot(_config.mountRoot) + "/" + drive;
        auto const tail = stripTrailingSlashes(toForwardSlashes(rest));
        if (tail != "/" && !tail.empty())
            result += tail;
        return result;
    }

    return toForwardSlashes(hostPath);
}

auto PathTranslator::toHostPath(std::string_view subprocessPath) const -> std::string
{
    if (_config.mode == PathNamespace::Host || subprocessPath.empty())
        return std::string(subprocessPath);

    auto const root = normalizedMountRoot(_config.mountRoot);
    auto const prefix = root + "/";

    // <mountRoot>/<drive>[/rest]
    if (subprocessPath.starts_with(prefix) && subprocessPath.size() > prefix.size()
        && isDriveLetter(subprocessPath[prefix.size()]))
    {
        auto const afterDrive = subprocessPath.substr(prefix.size() + 1);
        if (afterDrive.empty() || afterDrive[0] == '/')
        {
            auto const drive =
                static_cast<char>(std::toupper(static_cast<unsigned char>(subprocessPath[prefix.size()])));
            auto const tail = stripTrailingSlashes(std::string(afterDrive));
            if (tail.empty() || tail == "/")
                return std::format("{}:\\", drive);
            return std::format("{}:{}", drive, toBackslashes(tail));
        }
    }

    if (subprocessPath.starts_with('/') && !_config.distribution.empty())
        return std::format("\\\\wsl.localhost\\{}{}", _config.distribution, toBackslashes(subprocessPath));

    return std::string(subprocessPath);
}

} // namespace agentlink
