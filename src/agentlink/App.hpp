// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <agentlink/Config.hpp>
#include <core/Error.hpp>

#include <memory>

namespace agentlink
{

/// @brief Console front end that wires the orchestration components together.
class App
{
  public:
    /// @brief Constructs the application with the given configuration.
    /// @param config The application configuration.
    explicit App(AppConfig config);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Opens the session store, locates the agent CLI and starts the conversation manager.
    /// @return Success or an error.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Runs the interactive loop until /quit or end of input.
    /// @return Exit code (0 for success).
    [[nodiscard]] auto run() -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace agentlink
