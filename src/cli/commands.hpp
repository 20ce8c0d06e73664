//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef IECMMS_CLI_COMMANDS_HPP_INCLUDED
#define IECMMS_CLI_COMMANDS_HPP_INCLUDED

#include <iecmms/sdk/client.hpp>
#include <iecmms/sdk/typed_value.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <chrono>
#include <ostream>
#include <string>
#include <vector>

namespace iecmms
{
namespace cli
{

/// Parses a command line value for an attribute of the given type.
///
/// Booleans accept `true`/`false`/`1`/`0`, bit strings a sequence of `0`/`1` characters,
/// octet strings hex digits, and UTC times the number of seconds since the epoch.
/// Structures and arrays are not supported.
///
cetl::optional<sdk::TypedValue> parseValueText(const std::string& text, const sdk::TypeDescriptor& type);

/// Prints the usage of all commands.
///
void printUsage(std::ostream& out);

struct CommandContext final
{
    sdk::Client&              client;
    std::chrono::milliseconds request_timeout;
    std::ostream&             out;
    std::ostream&             err;

};  // CommandContext

/// Checks whether the command exists and got enough arguments.
///
bool isValidCommand(const std::string& command, const std::vector<std::string>& args);

/// Runs one command against an associated client.
///
/// @return Process exit code.
///
int runCommand(const CommandContext& context, const std::string& command, const std::vector<std::string>& args);

}  // namespace cli
}  // namespace iecmms

#endif  // IECMMS_CLI_COMMANDS_HPP_INCLUDED
