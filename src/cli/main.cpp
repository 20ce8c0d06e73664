//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "commands.hpp"
#include "config.hpp"
#include "setup_logging.hpp"

#include <iecmms/sdk/client.hpp>
#include <iecmms/sdk/errors.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <signal.h>  // NOLINT
#include <string>
#include <utility>
#include <vector>

namespace
{

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
volatile sig_atomic_t g_running = 1;

extern "C" void signalHandler(const int sig)
{
    switch (sig)
    {
    case SIGINT:
    case SIGTERM:
        g_running = 0;
        break;
    default:
        break;
    }
}

void setupSignalHandlers()
{
    struct sigaction sigbreak
    {};
    sigbreak.sa_handler = &signalHandler;
    ::sigaction(SIGINT, &sigbreak, nullptr);
    ::sigaction(SIGTERM, &sigbreak, nullptr);
}

struct CommandLine final
{
    std::string              config_file;
    std::string              command;
    std::vector<std::string> args;
};

/// Splits the arguments into the options, the command and its arguments.
///
/// `SPDLOG_LEVEL=` and `SPDLOG_FLUSH_LEVEL=` arguments are consumed by the logging setup.
///
cetl::optional<CommandLine> parseCommandLine(const int argc, const char** const argv)
{
    CommandLine command_line;
    if (const auto* const env_config = std::getenv("IECMMS_CONFIG"))
    {
        command_line.config_file = env_config;
    }

    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (arg.find("SPDLOG_") == 0)
        {
            continue;
        }
        if (command_line.command.empty() && (arg == "--config"))
        {
            if (++i == argc)
            {
                return cetl::nullopt;
            }
            command_line.config_file = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            continue;
        }
        if (command_line.command.empty())
        {
            command_line.command = arg;
        }
        else
        {
            command_line.args.push_back(arg);
        }
    }
    if (command_line.command.empty())
    {
        return cetl::nullopt;
    }
    return command_line;
}

iecmms::sdk::ClientOptions makeClientOptions(const iecmms::cli::Config& config)
{
    iecmms::sdk::ClientOptions options;
    if (const auto endpoint = config.getEndpoint())
    {
        options.endpoint = endpoint.value();
    }
    if (const auto* const env_endpoint = std::getenv("IECMMS_ENDPOINT"))
    {
        options.endpoint = env_endpoint;
    }
    if (const auto timeout_ms = config.getAssociationTimeoutMs())
    {
        options.association_timeout = std::chrono::milliseconds{timeout_ms.value()};
    }
    if (const auto timeout_ms = config.getRequestTimeoutMs())
    {
        options.request_timeout = std::chrono::milliseconds{timeout_ms.value()};
    }
    if (const auto max_pending = config.getMaxPendingRequests())
    {
        if (max_pending.value() > 0)
        {
            options.max_pending_requests = static_cast<std::size_t>(max_pending.value());
        }
    }
    if (const auto password = config.getPassword())
    {
        options.password = password.value();
    }
    return options;
}

}  // namespace

int main(const int argc, const char** const argv)
{
    using iecmms::sdk::Client;

    setupSignalHandlers();

    const auto command_line = parseCommandLine(argc, argv);
    if (!command_line || !iecmms::cli::isValidCommand(command_line->command, command_line->args))
    {
        iecmms::cli::printUsage(std::cerr);
        return EXIT_FAILURE;
    }

    iecmms::cli::Config::Ptr config;
    try
    {
        config = command_line->config_file.empty() ? iecmms::cli::Config::makeEmpty()
                                                   : iecmms::cli::Config::make(command_line->config_file);

    } catch (const std::exception& ex)
    {
        std::cerr << "Failed to load configuration: " << ex.what() << "\n";
        return EXIT_FAILURE;
    }
    iecmms::cli::setupLogging(argc, argv, *config);

    spdlog::info("IECMMS client started (ver='{}.{}').", VERSION_MAJOR, VERSION_MINOR);
    int result = EXIT_SUCCESS;
    try
    {
        const auto options = makeClientOptions(*config);
        if (options.endpoint.empty())
        {
            std::cerr << "No endpoint configured (see `[connection].endpoint` or IECMMS_ENDPOINT).\n";
            return EXIT_FAILURE;
        }

        const auto client = Client::make(options);
        if (!client)
        {
            spdlog::critical("Failed to create client.");
            std::cerr << "Failed to create client.\n";
            return EXIT_FAILURE;
        }

        const auto connect_result = client->connect();
        if (const auto* const failure = cetl::get_if<Client::Connect::Failure>(&connect_result))
        {
            spdlog::error("Failed to connect to '{}': {}", options.endpoint, iecmms::sdk::describe(*failure));
            std::cerr << "Failed to connect to '" << options.endpoint << "': " << iecmms::sdk::describe(*failure)
                      << "\n";
            return EXIT_FAILURE;
        }

        const iecmms::cli::CommandContext context{*client, options.request_timeout, std::cout, std::cerr};
        result = iecmms::cli::runCommand(context, command_line->command, command_line->args);

        if (g_running == 0)
        {
            spdlog::debug("Received termination signal.");
            client->abort();
        }
        else if (client->state() == Client::State::Associated)
        {
            const auto release_result = client->release();
            if (const auto* const failure = cetl::get_if<Client::Release::Failure>(&release_result))
            {
                spdlog::warn("Failed to release association: {}", iecmms::sdk::describe(*failure));
                client->abort();
            }
        }

    } catch (const std::exception& ex)
    {
        spdlog::critical("Unhandled exception: {}", ex.what());
        result = EXIT_FAILURE;
    }
    spdlog::info("IECMMS client terminated.");

    return result;
}
