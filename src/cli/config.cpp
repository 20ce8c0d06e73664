//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "config.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <toml.hpp>

#include <cstdint>
#include <exception>
#include <memory>
#include <string>
#include <utility>

namespace iecmms
{
namespace cli
{
namespace
{

class ConfigImpl final : public Config
{
public:
    using TomlConf  = toml::ordered_type_config;
    using TomlValue = toml::basic_value<TomlConf>;

    explicit ConfigImpl(TomlValue&& root)
        : root_{std::move(root)}
    {
    }

    // Config

    auto getEndpoint() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("connection", "endpoint");
    }

    auto getAssociationTimeoutMs() const -> cetl::optional<std::int64_t> override
    {
        return findImpl<std::int64_t>("connection", "association_timeout_ms");
    }

    auto getRequestTimeoutMs() const -> cetl::optional<std::int64_t> override
    {
        return findImpl<std::int64_t>("connection", "request_timeout_ms");
    }

    auto getMaxPendingRequests() const -> cetl::optional<std::int64_t> override
    {
        return findImpl<std::int64_t>("connection", "max_pending_requests");
    }

    auto getPassword() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("connection", "password");
    }

    auto getLoggingFile() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("logging", "file");
    }

    auto getLoggingLevel() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("logging", "level");
    }

    auto getLoggingFlushLevel() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("logging", "flush_level");
    }

private:
    template <typename T, typename... Keys>
    cetl::optional<T> findImpl(Keys&&... keys) const
    {
        if (!root_.is_table())
        {
            return cetl::nullopt;
        }
        try
        {
            return cetl::make_optional(toml::find<T>(root_, std::forward<Keys>(keys)...));

        } catch (const std::exception&)
        {
            // Missing key or a value of another type.
            return cetl::nullopt;
        }
    }

    TomlValue root_;

};  // ConfigImpl

}  // namespace

Config::Ptr Config::make(std::string file_path)
{
    auto root = toml::parse<ConfigImpl::TomlConf>(file_path);
    return std::make_shared<ConfigImpl>(std::move(root));
}

Config::Ptr Config::makeEmpty()
{
    return std::make_shared<ConfigImpl>(ConfigImpl::TomlValue{});
}

}  // namespace cli
}  // namespace iecmms
