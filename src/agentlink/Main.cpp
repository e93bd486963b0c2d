// SPDX-License-Identifier: Apache-2.0
#include <agentlink/App.hpp>
#include <agentlink/Config.hpp>
#include <core/Log.hpp>

#include <CLI/CLI.hpp>

#include <format>

int main(int argc, char** argv)
{
    auto app = CLI::App { "agentlink - console front end for a command-line coding agent" };

    auto configPath = std::string {};
    auto directory = std::string {};
    auto session = std::string {};
    auto cliPath = std::string {};
    auto model = std::string {};
    auto verbose = false;

    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("-d,--directory", directory, "Working directory of new sessions");
    app.add_option("-s,--session", session, "Session to resume on startup");
    app.add_option("--cli", cliPath, "Path to the agent executable");
    app.add_option("--model", model, "Model requested from the agent");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    CLI11_PARSE(app, argc, argv);

    agentlink::log::setLevel(verbose ? agentlink::log::Level::Debug : agentlink::log::Level::Warning);

    auto configResult =
        configPath.empty() ? agentlink::loadConfig() : agentlink::loadConfigFromFile(configPath);

    if (!configResult)
    {
        agentlink::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;

    if (!verbose)
        agentlink::log::setLevel(agentlink::log::levelFromString(config.logging.level));
    if (!config.logging.file.empty())
    {
        if (auto logFile = agentlink::log::setLogFile(config.logging.file); !logFile)
            agentlink::log::warning("{}", logFile.error().message);
    }

    // Apply CLI overrides
    if (!directory.empty())
        config.workingDirectory = directory;
    if (!session.empty())
        config.initialSession = session;
    if (!cliPath.empty())
        config.cli.executable = cliPath;
    if (!model.empty())
        config.cli.flags.model = model;

    auto application = agentlink::App(std::move(config));
    auto initResult = application.initialize();
    if (!initResult)
    {
        agentlink::log::error("Initialization failed: {}", initResult.error().message);
        return 1;
    }

    return application.run();
}
