//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef IECMMS_COMMON_HELPERS_HPP_INCLUDED
#define IECMMS_COMMON_HELPERS_HPP_INCLUDED

#include <spdlog/spdlog.h>

#include <cstddef>
#include <exception>
#include <string>
#include <utility>
#include <vector>

namespace iecmms
{
namespace common
{

/// @brief Wraps the given action into a try/catch block, and performs it without throwing the given exception type.
///
/// @return `true` if the action was performed successfully, `false` if an exception was thrown.
///         Always `true` if exceptions are disabled.
///
template <typename Exception = std::exception, typename Action>
bool performWithoutThrowing(Action&& action) noexcept
{
#if defined(__cpp_exceptions)
    try
    {
#endif
        std::forward<Action>(action)();
        return true;

#if defined(__cpp_exceptions)
    } catch (const Exception& ex)
    {
        spdlog::critical("Unexpected C++ exception is caught: {}", ex.what());
        return false;
    }
#endif
}

/// Splits a string at every occurrence of the delimiter (empty segments are kept).
///
inline std::vector<std::string> splitString(const std::string& str, const char delimiter)
{
    std::vector<std::string> parts;
    std::size_t              begin = 0;
    for (;;)
    {
        const auto end = str.find(delimiter, begin);
        parts.push_back(str.substr(begin, end - begin));
        if (end == std::string::npos)
        {
            break;
        }
        begin = end + 1;
    }
    return parts;
}

inline std::string joinStrings(const std::vector<std::string>& parts, const char delimiter)
{
    std::string result;
    for (const auto& part : parts)
    {
        if (!result.empty() || (&part != &parts.front()))
        {
            result += delimiter;
        }
        result += part;
    }
    return result;
}

}  // namespace common
}  // namespace iecmms

#endif  // IECMMS_COMMON_HELPERS_HPP_INCLUDED
