// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace agentlink
{

/// @brief Filesystem namespace the agent subprocess executes in, relative to the host.
enum class PathNamespace : std::uint8_t
{
    /// Subprocess sees the same paths as the host.
    Host,
    /// Subprocess runs inside WSL; Windows drives appear under the mount root.
    Wsl,
};

[[nodiscard]] constexpr auto pathNamespaceToString(PathNamespace ns) -> std::string_view
{
    switch (ns)
    {
        case PathNamespace::Host: return "host";
        case PathNamespace::Wsl: return "wsl";
    }
    return "host";
}

/// @brief Configuration for PathTranslator.
struct PathTranslatorConfig
{
    PathNamespace mode = PathNamespace::Host;

    /// @brief Directory under which Windows drive letters are mounted inside WSL.
    std::string mountRoot = "/mnt";

    /// @brief WSL distribution name, used to map Linux-only paths back to \\wsl.localhost\<distro>.
    std::string distribution;
};

/// @brief Converts paths between the host namespace and the subprocess namespace.
///
/// The mapping is best-effort. In Wsl mode a backslash is always treated as a directory
/// separator on the way in, so a Linux path component that legitimately contains a
/// backslash cannot be round-tripped: toHostPath() turns the component into two, and
/// toSubprocessPath() of the result does not restore the original name. Paths that cannot
/// be mapped (drive-relative paths such as "C:foo", UNC shares other than the WSL
/// provider) are returned unchanged so that the subprocess reports an ordinary
/// filesystem error.
class PathTranslator
{
  public:
    explicit PathTranslator(PathTranslatorConfig config = {});

    /// @brief Maps a host path to the path the subprocess must use.
    [[nodiscard]] auto toSubprocessPath(std::string_view hostPath) const -> std::string;

    /// @brief Maps a path reported by the subprocess back to a host path.
    [[nodiscard]] auto toHostPath(std::string_view subprocessPath) const -> std::string;

    [[nodiscard]] auto mode() const -> PathNamespace { return _config.mode; }
    [[nodiscard]] auto config() const -> const PathTranslatorConfig& { return _config; }

  private:
    PathTranslatorConfig _config;
};

} // namespace agentlink
